/*
 * Gooseberry
 * This file was part of Strawberry Music Player and Clementine.
 * Copyright 2012, David Sansome <me@davidsansome.com>
 * Copyright 2018-2021, Jonas Kvinge <jonas@jkvinge.net>
 *
 * Gooseberry is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Gooseberry is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Gooseberry.  If not, see <http://www.gnu.org/licenses/>.
 *
 */

#include "config.h"

#include <sqlite3.h>

#include <QObject>
#include <QThread>
#include <QMutex>
#include <QIODevice>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QRegularExpression>
#include <QStandardPaths>
#include <QSqlDatabase>
#include <QSqlError>
#include <QScopeGuard>

#include "logging.h"
#include "taskmanager.h"
#include "database.h"
#include "sqlquery.h"
#include "scopedtransaction.h"

using namespace Qt::Literals::StringLiterals;

const int Database::kSchemaVersion = 1;

namespace {
constexpr char kDatabaseFilename[] = "gooseberry.db";
constexpr char kMemoryDatabaseName[] = ":memory:";
}  // namespace

int Database::sNextConnectionId = 1;
QMutex Database::sNextConnectionIdMutex;

Database::Database(SharedPtr<TaskManager> task_manager, QObject *parent, const QString &database_name)
    : QObject(parent),
      task_manager_(task_manager),
      injected_database_name_(database_name),
      startup_schema_version_(-1),
      original_thread_(nullptr) {

  setObjectName(QLatin1String(QObject::metaObject()->className()));

  original_thread_ = thread();

  {
    QMutexLocker l(&sNextConnectionIdMutex);
    connection_id_ = sNextConnectionId++;
  }

  if (injected_database_name_.isEmpty()) {
    directory_ = QDir::toNativeSeparators(QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation));
  }
  else if (injected_database_name_ != QLatin1String(kMemoryDatabaseName)) {
    directory_ = QFileInfo(injected_database_name_).absolutePath();
  }

  QMutexLocker l(&mutex_);
  Connect();

}

Database::~Database() {

  QMutexLocker l(&connect_mutex_);

  const QString connection_prefix = QStringLiteral("%1_thread_").arg(connection_id_);
  const QStringList connection_names = QSqlDatabase::connectionNames();
  for (const QString &connection_name : connection_names) {
    if (connection_name.startsWith(connection_prefix)) {
      qLog(Error) << "Connection" << connection_name << "is still open!";
    }
  }

}

void Database::ExitAsync() {
  QMetaObject::invokeMethod(this, &Database::Exit, Qt::QueuedConnection);
}

void Database::Exit() {

  Q_ASSERT(QThread::currentThread() == thread());
  Close();
  moveToThread(original_thread_);
  Q_EMIT ExitFinished();

}

QString Database::database_filename() const {

  if (injected_database_name_.isEmpty()) {
    return directory_ + u'/' + QLatin1String(kDatabaseFilename);
  }

  return injected_database_name_;

}

QSqlDatabase Database::Connect() {

  QMutexLocker l(&connect_mutex_);

  if (!directory_.isEmpty() && !QFile::exists(directory_)) {
    QDir dir;
    if (!dir.mkpath(directory_)) {
      qLog(Error) << "Failed to create directory" << directory_;
    }
  }

  const QString connection_id = QStringLiteral("%1_thread_%2").arg(connection_id_).arg(reinterpret_cast<quint64>(QThread::currentThread()));

  // Try to find an existing connection for this thread
  QSqlDatabase db;
  if (QSqlDatabase::connectionNames().contains(connection_id)) {
    db = QSqlDatabase::database(connection_id);
  }
  else {
    db = QSqlDatabase::addDatabase(u"QSQLITE"_s, connection_id);
  }
  if (db.isOpen()) {
    return db;
  }
  db.setConnectOptions(u"QSQLITE_BUSY_TIMEOUT=30000"_s);
  db.setDatabaseName(database_filename());

  if (!db.open()) {
    qLog(Error) << "Failed to open database" << db.databaseName() << db.lastError().text();
    Q_EMIT Error(u"Database: "_s + db.lastError().text());
    return db;
  }

  if (db.tables().count() == 0) {
    qLog(Info) << "Creating initial database schema";
    UpdateDatabaseSchema(0, db);
  }

  if (startup_schema_version_ == -1) {
    UpdateMainSchema(&db);
  }

  return db;

}

void Database::Close() {

  QMutexLocker l(&connect_mutex_);

  const QString connection_id = QStringLiteral("%1_thread_%2").arg(connection_id_).arg(reinterpret_cast<quint64>(QThread::currentThread()));

  if (QSqlDatabase::connectionNames().contains(connection_id)) {
    {
      QSqlDatabase db = QSqlDatabase::database(connection_id);
      if (db.isOpen()) {
        db.close();
      }
    }
    QSqlDatabase::removeDatabase(connection_id);
  }

}

int Database::SchemaVersion(QSqlDatabase *db) {

  int schema_version = 0;
  {
    SqlQuery q(*db);
    q.prepare(u"SELECT version FROM schema_version"_s);
    if (q.Exec() && q.next()) {
      schema_version = q.value(0).toInt();
    }
    // The query has to go out of scope to release its locks before the schema is touched.
  }
  return schema_version;

}

void Database::UpdateMainSchema(QSqlDatabase *db) {

  const int schema_version = SchemaVersion(db);
  startup_schema_version_ = schema_version;

  if (schema_version > kSchemaVersion) {
    qLog(Warning) << "The database schema (version" << schema_version << ") is newer than I was expecting";
    return;
  }

  for (int v = schema_version + 1; v <= kSchemaVersion; ++v) {
    UpdateDatabaseSchema(v, *db);
  }

}

void Database::UpdateDatabaseSchema(const int version, QSqlDatabase &db) {

  QString filename;
  if (version == 0) {
    filename = u":/schema/schema.sql"_s;
  }
  else {
    filename = QStringLiteral(":/schema/schema-%1.sql").arg(version);
    qLog(Debug) << "Applying database schema update" << version << "from" << filename;
  }

  ExecSchemaCommandsFromFile(db, filename);

}

void Database::ExecSchemaCommandsFromFile(QSqlDatabase &db, const QString &filename) {

  QFile schema_file(filename);
  if (!schema_file.open(QIODevice::ReadOnly)) {
    qFatal("Couldn't open schema file %s for reading: %s", filename.toUtf8().constData(), schema_file.errorString().toUtf8().constData());
  }
  QString schema = QString::fromUtf8(schema_file.readAll());
  schema_file.close();
  if (schema.contains("\r\n"_L1)) {
    schema = schema.replace("\r\n"_L1, "\n"_L1);
  }

  ExecSchemaCommands(db, schema);

}

void Database::ExecSchemaCommands(QSqlDatabase &db, const QString &schema, const bool in_transaction) {

  // Statements are separated by a semicolon followed by an empty line
  static const QRegularExpression regex_split_commands(u"; *\n\n"_s);
  const QStringList commands = schema.split(regex_split_commands, Qt::SkipEmptyParts);

  if (in_transaction) {
    ExecCommands(db, commands);
  }
  else {
    ScopedTransaction transaction(&db);
    ExecCommands(db, commands);
    transaction.Commit();
  }

}

void Database::ExecCommands(QSqlDatabase &db, const QStringList &commands) {

  for (const QString &command : commands) {
    if (command.trimmed().isEmpty()) continue;
    SqlQuery query(db);
    query.prepare(command);
    if (!query.Exec()) {
      ReportErrors(query);
      qFatal("Unable to update the tracker database");
    }
  }

}

void Database::ReportErrors(const SqlQuery &query) {

  const QSqlError sql_error = query.lastError();
  if (sql_error.isValid()) {
    qLog(Error) << "Unable to execute SQL query:" << sql_error;
    qLog(Error) << "Failed SQL query:" << query.LastQuery();
    Q_EMIT Error(tr("Unable to execute SQL query: %1").arg(sql_error.text()));
    Q_EMIT Error(tr("Failed SQL query: %1").arg(query.LastQuery()));
  }

}

bool Database::IntegrityCheck(const QSqlDatabase &db) {

  qLog(Debug) << "Starting database integrity check";
  const int task_id = task_manager_->StartTask(tr("Integrity check"));

  bool ok = false;
  // Ask for 10 error messages at most.
  SqlQuery q(db);
  q.prepare(u"PRAGMA integrity_check(10)"_s);
  if (q.Exec()) {
    bool error_reported = false;
    while (q.next()) {
      const QString message = q.value(0).toString();

      // If no errors are found, a single row with the value "ok" is returned
      if (message == "ok"_L1) {
        ok = true;
        break;
      }
      if (!error_reported) { Q_EMIT Error(tr("Database corruption detected.")); }
      Q_EMIT Error(u"Database: "_s + message);
      error_reported = true;
    }
  }
  else {
    ReportErrors(q);
  }

  task_manager_->SetTaskFinished(task_id);

  return ok;

}

void Database::DoBackup() {

  QSqlDatabase db(Connect());

  if (!db.isOpen() || db.databaseName() == QLatin1String(kMemoryDatabaseName)) {
    Q_EMIT BackupFinished(false);
    return;
  }

  // Make sure the database is not corrupt before overwriting the previous backup
  QMutexLocker l(&mutex_);

  bool success = IntegrityCheck(db) && SchemaVersion(&db) == kSchemaVersion;
  if (success) {
    success = BackupFile(db.databaseName());
  }

  Q_EMIT BackupFinished(success);

}

bool Database::OpenDatabase(const QString &filename, sqlite3 **connection) {

  const QByteArray filename_data = filename.toUtf8();
  const int ret = sqlite3_open(filename_data.constData(), connection);
  if (ret != SQLITE_OK) {
    if (*connection) {
      qLog(Error) << "Failed to open database for backup:" << filename << sqlite3_errmsg(*connection);
    }
    else {
      qLog(Error) << "Failed to open database for backup:" << filename;
    }
    return false;
  }

  return true;

}

bool Database::BackupFile(const QString &filename) {

  qLog(Debug) << "Starting database backup";
  const QString dest_filename = QStringLiteral("%1.bak").arg(filename);
  const int task_id = task_manager_->StartTask(tr("Backing up database"));

  sqlite3 *source_connection = nullptr;
  sqlite3 *dest_connection = nullptr;

  const QScopeGuard db_backup_finish = qScopeGuard([this, task_id, &source_connection, &dest_connection]() {
    if (source_connection) {
      sqlite3_close(source_connection);
    }
    if (dest_connection) {
      sqlite3_close(dest_connection);
    }
    task_manager_->SetTaskFinished(task_id);
  });

  if (!OpenDatabase(filename, &source_connection) || !OpenDatabase(dest_filename, &dest_connection)) {
    return false;
  }

  sqlite3_backup *backup = sqlite3_backup_init(dest_connection, "main", source_connection, "main");
  if (!backup) {
    qLog(Error) << "Failed to start database backup:" << sqlite3_errmsg(dest_connection);
    return false;
  }

  int ret = SQLITE_OK;
  do {
    ret = sqlite3_backup_step(backup, 16);
    const int page_count = sqlite3_backup_pagecount(backup);
    task_manager_->SetTaskProgress(task_id, static_cast<quint64>(page_count - sqlite3_backup_remaining(backup)), static_cast<quint64>(page_count));
  }
  while (ret == SQLITE_OK);

  sqlite3_backup_finish(backup);

  if (ret != SQLITE_DONE) {
    qLog(Error) << "Database backup failed";
    return false;
  }

  qLog(Info) << "Database backed up to" << dest_filename;

  return true;

}
