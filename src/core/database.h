/*
 * Gooseberry
 * This file was part of Strawberry Music Player and Clementine.
 * Copyright 2010, David Sansome <me@davidsansome.com>
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

#ifndef DATABASE_H
#define DATABASE_H

#include "config.h"

#include <sqlite3.h>

#include <QtGlobal>
#include <QObject>
#include <QMutex>
#include <QSqlDatabase>
#include <QString>
#include <QStringList>
#include <QRecursiveMutex>

#include "includes/shared_ptr.h"
#include "sqlquery.h"

class QThread;
class TaskManager;

// Owns the SQLite database file.
// Every thread gets its own connection, writers serialize on Mutex().
class Database : public QObject {
  Q_OBJECT

 public:
  explicit Database(SharedPtr<TaskManager> task_manager, QObject *parent = nullptr, const QString &database_name = QString());
  ~Database() override;

  static const int kSchemaVersion;

  void ExitAsync();
  QSqlDatabase Connect();
  void Close();
  void ReportErrors(const SqlQuery &query);

  QRecursiveMutex *Mutex() { return &mutex_; }

  void ExecSchemaCommands(QSqlDatabase &db, const QString &schema, const bool in_transaction = false);

  QString database_filename() const;
  int startup_schema_version() const { return startup_schema_version_; }
  int current_schema_version() const { return kSchemaVersion; }

 Q_SIGNALS:
  void ExitFinished();
  void Error(const QString &error);
  void BackupFinished(const bool success);

 private Q_SLOTS:
  void Exit();

 public Q_SLOTS:
  void DoBackup();

 private:
  static int SchemaVersion(QSqlDatabase *db);
  void UpdateMainSchema(QSqlDatabase *db);
  void UpdateDatabaseSchema(const int version, QSqlDatabase &db);
  void ExecSchemaCommandsFromFile(QSqlDatabase &db, const QString &filename);
  void ExecCommands(QSqlDatabase &db, const QStringList &commands);

  bool IntegrityCheck(const QSqlDatabase &db);
  bool BackupFile(const QString &filename);
  static bool OpenDatabase(const QString &filename, sqlite3 **connection);

  SharedPtr<TaskManager> task_manager_;

  QString directory_;
  QMutex connect_mutex_;
  QRecursiveMutex mutex_;

  // Makes the QSqlDatabase connection name unique to the object as well as the thread
  int connection_id_;

  static QMutex sNextConnectionIdMutex;
  static int sNextConnectionId;

  // Set by the command line or by tests
  QString injected_database_name_;

  int startup_schema_version_;

  QThread *original_thread_;
};

#endif  // DATABASE_H
