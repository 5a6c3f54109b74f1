/*
 * Gooseberry
 * Copyright 2026, Gooseberry developers
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

#include <optional>

#include <QObject>
#include <QThread>
#include <QMutex>
#include <QSet>
#include <QVariant>
#include <QVariantMap>
#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QUrl>
#include <QDateTime>
#include <QSqlDatabase>

#include "core/logging.h"
#include "core/database.h"
#include "core/sqlquery.h"
#include "core/sqlrow.h"
#include "core/scopedtransaction.h"
#include "mediatrackerbackend.h"

using namespace Qt::Literals::StringLiterals;

namespace {

constexpr char kPrefixCondition[] = "substr(content_path, 1, :prefix_length) = :prefix";

QString OrphanedDirectoriesQuery() {
  return u"SELECT ROWID FROM tracker_directories WHERE collection_id = :collection_id AND status = :orphaned AND "_s + QLatin1String(kPrefixCondition);
}

QString UntrackedSourcesQuery() {
  return u"SELECT ROWID FROM media_sources WHERE collection_id = :collection_id AND "_s + QLatin1String(kPrefixCondition) + u" AND ROWID NOT IN (SELECT source_id FROM tracker_sources)"_s;
}

}  // namespace

MediaTrackerBackend::MediaTrackerBackend(QObject *parent)
    : QObject(parent),
      original_thread_(nullptr) {

  original_thread_ = thread();

}

void MediaTrackerBackend::Init(SharedPtr<Database> db) {

  setObjectName(QLatin1String(QObject::metaObject()->className()));

  db_ = db;

}

void MediaTrackerBackend::Close() {

  if (db_) {
    QMutexLocker l(db_->Mutex());
    db_->Close();
  }

}

void MediaTrackerBackend::ExitAsync() {
  QMetaObject::invokeMethod(this, &MediaTrackerBackend::Exit, Qt::QueuedConnection);
}

void MediaTrackerBackend::Exit() {

  Q_ASSERT(QThread::currentThread() == thread());

  Close();
  moveToThread(original_thread_);
  Q_EMIT ExitFinished();

}

QUrl MediaTrackerBackend::NormalizeRootUrl(const QUrl &root_url) {

  QUrl url = root_url.adjusted(QUrl::NormalizePathSegments | QUrl::StripTrailingSlash);
  url.setPath(url.path() + u'/');
  return url;

}

void MediaTrackerBackend::BindPrefix(SqlQuery *query, const QString &path_prefix) {

  query->BindValue(u":prefix_length"_s, path_prefix.length());
  query->BindStringValue(u":prefix"_s, path_prefix);

}

bool MediaTrackerBackend::AddCollection(const QUrl &root_url, const QString &title, Collection *collection) {

  QMutexLocker l(db_->Mutex());
  QSqlDatabase db(db_->Connect());

  Collection new_collection;
  new_collection.uid = Track::CreateUid();
  new_collection.title = title;
  new_collection.root_url = NormalizeRootUrl(root_url);

  SqlQuery q(db);
  q.prepare(u"INSERT INTO collections (uid, title, root_url, scan_generation) VALUES (:uid, :title, :root_url, 0)"_s);
  q.BindValue(u":uid"_s, new_collection.uid);
  q.BindStringValue(u":title"_s, new_collection.title);
  q.BindUrlValue(u":root_url"_s, new_collection.root_url);
  if (!q.Exec()) {
    db_->ReportErrors(q);
    return false;
  }

  new_collection.id = q.lastInsertId().toInt();
  *collection = new_collection;

  qLog(Debug) << "Added collection" << new_collection.id << new_collection.root_url;

  return true;

}

bool MediaTrackerBackend::LoadCollection(const QString &where, const QString &placeholder, const QVariant &value, Collection *collection) {

  QMutexLocker l(db_->Mutex());
  QSqlDatabase db(db_->Connect());

  *collection = Collection();

  SqlQuery q(db);
  q.prepare(u"SELECT ROWID, uid, title, root_url FROM collections WHERE "_s + where);
  q.BindValue(placeholder, value);
  if (!q.Exec()) {
    db_->ReportErrors(q);
    return false;
  }

  if (q.next()) {
    collection->id = q.value(0).toInt();
    collection->uid = q.value(1).toString();
    collection->title = q.value(2).toString();
    collection->root_url = QUrl(q.value(3).toString());
  }

  return true;

}

bool MediaTrackerBackend::LoadCollectionById(const int collection_id, Collection *collection) {

  return LoadCollection(u"ROWID = :id"_s, u":id"_s, collection_id, collection);

}

bool MediaTrackerBackend::LoadCollectionByUrl(const QUrl &root_url, Collection *collection) {

  return LoadCollection(u"root_url = :root_url"_s, u":root_url"_s, NormalizeRootUrl(root_url).toString(QUrl::FullyEncoded), collection);

}

bool MediaTrackerBackend::LoadCollections(CollectionList *collections) {

  QMutexLocker l(db_->Mutex());
  QSqlDatabase db(db_->Connect());

  collections->clear();

  SqlQuery q(db);
  q.prepare(u"SELECT ROWID, uid, title, root_url FROM collections ORDER BY ROWID"_s);
  if (!q.Exec()) {
    db_->ReportErrors(q);
    return false;
  }

  while (q.next()) {
    Collection collection;
    collection.id = q.value(0).toInt();
    collection.uid = q.value(1).toString();
    collection.title = q.value(2).toString();
    collection.root_url = QUrl(q.value(3).toString());
    collections->append(collection);
  }

  return true;

}

bool MediaTrackerBackend::BeginScan(const int collection_id, qint64 *scan_generation) {

  QMutexLocker l(db_->Mutex());
  QSqlDatabase db(db_->Connect());
  ScopedTransaction t(&db);

  {
    SqlQuery q(db);
    q.prepare(u"UPDATE collections SET scan_generation = scan_generation + 1 WHERE ROWID = :id"_s);
    q.BindValue(u":id"_s, collection_id);
    if (!q.Exec()) {
      db_->ReportErrors(q);
      return false;
    }
  }

  SqlQuery q(db);
  q.prepare(u"SELECT scan_generation FROM collections WHERE ROWID = :id"_s);
  q.BindValue(u":id"_s, collection_id);
  if (!q.Exec()) {
    db_->ReportErrors(q);
    return false;
  }
  if (!q.next()) {
    qLog(Error) << "No collection with id" << collection_id;
    return false;
  }
  *scan_generation = q.value(0).toLongLong();
  q.finish();

  return t.Commit();

}

bool MediaTrackerBackend::UpdateDirectoryDigests(const int collection_id, const qint64 scan_generation, const TrackedDirectoryList &directories, DirectoriesStatus *statuses) {

  QMutexLocker l(db_->Mutex());
  QSqlDatabase db(db_->Connect());
  ScopedTransaction t(&db);

  const qint64 now = QDateTime::currentSecsSinceEpoch();
  DirectoriesStatus batch_statuses;

  for (const TrackedDirectory &directory : directories) {

    std::optional<TrackedDigest> prior;
    int directory_id = -1;
    {
      SqlQuery q(db);
      q.prepare(u"SELECT ROWID, digest, status FROM tracker_directories WHERE collection_id = :collection_id AND content_path = :content_path"_s);
      q.BindValue(u":collection_id"_s, collection_id);
      q.BindStringValue(u":content_path"_s, directory.content_path);
      if (!q.Exec()) {
        db_->ReportErrors(q);
        return false;
      }
      if (q.next()) {
        directory_id = q.value(0).toInt();
        const std::optional<DirTrackingStatus> status = DirTrackingStatusFromInt(q.value(2).toInt());
        prior = TrackedDigest(q.value(1).toByteArray(), status.value_or(DirTrackingStatus::Outdated));
      }
    }

    // Unreadable, keep the record as it is so it is not taken for orphaned.
    if (directory.digest.isNull()) {
      if (directory_id != -1) {
        SqlQuery q(db);
        q.prepare(u"UPDATE tracker_directories SET scan_generation = :scan_generation WHERE ROWID = :id"_s);
        q.BindValue(u":scan_generation"_s, scan_generation);
        q.BindValue(u":id"_s, directory_id);
        if (!q.Exec()) {
          db_->ReportErrors(q);
          return false;
        }
      }
      continue;
    }

    const DirTrackingStatus status = Classify(prior, directory.digest);
    batch_statuses.add(status);

    SqlQuery q(db);
    if (directory_id == -1) {
      q.prepare(u"INSERT INTO tracker_directories (collection_id, content_path, digest, status, scan_generation, updated_at) VALUES (:collection_id, :content_path, :digest, :status, :scan_generation, :updated_at)"_s);
      q.BindValue(u":collection_id"_s, collection_id);
      q.BindStringValue(u":content_path"_s, directory.content_path);
      q.BindValue(u":updated_at"_s, now);
    }
    else if (prior->status != status || prior->digest != directory.digest) {
      q.prepare(u"UPDATE tracker_directories SET digest = :digest, status = :status, scan_generation = :scan_generation, updated_at = :updated_at WHERE ROWID = :id"_s);
      q.BindValue(u":updated_at"_s, now);
      q.BindValue(u":id"_s, directory_id);
    }
    else {
      q.prepare(u"UPDATE tracker_directories SET digest = :digest, status = :status, scan_generation = :scan_generation WHERE ROWID = :id"_s);
      q.BindValue(u":id"_s, directory_id);
    }
    q.BindBlobValue(u":digest"_s, directory.digest);
    q.BindValue(u":status"_s, static_cast<int>(status));
    q.BindValue(u":scan_generation"_s, scan_generation);
    if (!q.Exec()) {
      db_->ReportErrors(q);
      return false;
    }

  }

  if (!t.Commit()) return false;

  if (statuses) {
    statuses->current += batch_statuses.current;
    statuses->outdated += batch_statuses.outdated;
    statuses->added += batch_statuses.added;
    statuses->modified += batch_statuses.modified;
    statuses->orphaned += batch_statuses.orphaned;
  }

  return true;

}

bool MediaTrackerBackend::LoadUnvisitedDirectories(const int collection_id, const QString &path_prefix, const qint64 scan_generation, QStringList *content_paths) {

  QMutexLocker l(db_->Mutex());
  QSqlDatabase db(db_->Connect());

  content_paths->clear();

  SqlQuery q(db);
  q.prepare(u"SELECT content_path FROM tracker_directories WHERE collection_id = :collection_id AND scan_generation < :scan_generation AND "_s + QLatin1String(kPrefixCondition) + u" ORDER BY content_path"_s);
  q.BindValue(u":collection_id"_s, collection_id);
  q.BindValue(u":scan_generation"_s, scan_generation);
  BindPrefix(&q, path_prefix);
  if (!q.Exec()) {
    db_->ReportErrors(q);
    return false;
  }

  while (q.next()) {
    content_paths->append(q.value(0).toString());
  }

  return true;

}

bool MediaTrackerBackend::MarkDirectoriesOrphaned(const int collection_id, const QStringList &content_paths, int *count) {

  QMutexLocker l(db_->Mutex());
  QSqlDatabase db(db_->Connect());
  ScopedTransaction t(&db);

  const qint64 now = QDateTime::currentSecsSinceEpoch();
  int orphaned = 0;

  for (const QString &content_path : content_paths) {
    // Gone from disk, only the updated_at of directories that were not already orphaned changes.
    SqlQuery q(db);
    q.prepare(u"UPDATE tracker_directories SET status = :orphaned, updated_at = CASE WHEN status = :orphaned THEN updated_at ELSE :updated_at END WHERE collection_id = :collection_id AND content_path = :content_path"_s);
    q.BindValue(u":orphaned"_s, static_cast<int>(DirTrackingStatus::Orphaned));
    q.BindValue(u":updated_at"_s, now);
    q.BindValue(u":collection_id"_s, collection_id);
    q.BindStringValue(u":content_path"_s, content_path);
    if (!q.Exec()) {
      db_->ReportErrors(q);
      return false;
    }
    orphaned += q.numRowsAffected();
  }

  if (!t.Commit()) return false;

  if (count) *count = orphaned;

  return true;

}

bool MediaTrackerBackend::LoadDirectory(const int collection_id, const QString &content_path, TrackedDirectory *directory) {

  QMutexLocker l(db_->Mutex());
  QSqlDatabase db(db_->Connect());

  *directory = TrackedDirectory();

  SqlQuery q(db);
  q.prepare(u"SELECT ROWID, content_path, digest, status FROM tracker_directories WHERE collection_id = :collection_id AND content_path = :content_path"_s);
  q.BindValue(u":collection_id"_s, collection_id);
  q.BindStringValue(u":content_path"_s, content_path);
  if (!q.Exec()) {
    db_->ReportErrors(q);
    return false;
  }

  if (q.next()) {
    directory->id = q.value(0).toInt();
    directory->content_path = q.value(1).toString();
    directory->digest = q.value(2).toByteArray();
    directory->status = DirTrackingStatusFromInt(q.value(3).toInt()).value_or(DirTrackingStatus::Outdated);
  }

  return true;

}

bool MediaTrackerBackend::LoadPendingDirectories(const int collection_id, const QString &path_prefix, const int offset, const int limit, TrackedDirectoryList *directories) {

  QMutexLocker l(db_->Mutex());
  QSqlDatabase db(db_->Connect());

  directories->clear();

  SqlQuery q(db);
  q.prepare(u"SELECT ROWID, content_path, digest, status FROM tracker_directories WHERE collection_id = :collection_id AND status IN (:added, :modified) AND "_s + QLatin1String(kPrefixCondition) + u" ORDER BY updated_at, content_path LIMIT :limit OFFSET :offset"_s);
  q.BindValue(u":collection_id"_s, collection_id);
  q.BindValue(u":added"_s, static_cast<int>(DirTrackingStatus::Added));
  q.BindValue(u":modified"_s, static_cast<int>(DirTrackingStatus::Modified));
  BindPrefix(&q, path_prefix);
  q.BindValue(u":limit"_s, limit);
  q.BindValue(u":offset"_s, offset);
  if (!q.Exec()) {
    db_->ReportErrors(q);
    return false;
  }

  while (q.next()) {
    TrackedDirectory directory;
    directory.id = q.value(0).toInt();
    directory.content_path = q.value(1).toString();
    directory.digest = q.value(2).toByteArray();
    directory.status = DirTrackingStatusFromInt(q.value(3).toInt()).value_or(DirTrackingStatus::Outdated);
    directories->append(directory);
  }

  return true;

}

bool MediaTrackerBackend::AggregateDirectoriesStatus(const int collection_id, const QString &path_prefix, DirectoriesStatus *status) {

  QMutexLocker l(db_->Mutex());
  QSqlDatabase db(db_->Connect());

  *status = DirectoriesStatus();

  SqlQuery q(db);
  q.prepare(u"SELECT status, COUNT(*) FROM tracker_directories WHERE collection_id = :collection_id AND "_s + QLatin1String(kPrefixCondition) + u" GROUP BY status"_s);
  q.BindValue(u":collection_id"_s, collection_id);
  BindPrefix(&q, path_prefix);
  if (!q.Exec()) {
    db_->ReportErrors(q);
    return false;
  }

  while (q.next()) {
    const std::optional<DirTrackingStatus> directory_status = DirTrackingStatusFromInt(q.value(0).toInt());
    if (!directory_status.has_value()) {
      qLog(Warning) << "Unknown directory status" << q.value(0).toInt();
      continue;
    }
    status->add(*directory_status, q.value(1).toInt());
  }

  return true;

}

bool MediaTrackerBackend::CountDirectoriesWithPrefix(const int collection_id, const QString &path_prefix, int *count) {

  QMutexLocker l(db_->Mutex());
  QSqlDatabase db(db_->Connect());

  SqlQuery q(db);
  q.prepare(u"SELECT COUNT(*) FROM tracker_directories WHERE collection_id = :collection_id AND "_s + QLatin1String(kPrefixCondition));
  q.BindValue(u":collection_id"_s, collection_id);
  BindPrefix(&q, path_prefix);
  if (!q.Exec() || !q.next()) {
    db_->ReportErrors(q);
    return false;
  }

  *count = q.value(0).toInt();

  return true;

}

bool MediaTrackerBackend::UntrackDirectories(const int collection_id, const QString &path_prefix, const std::optional<DirTrackingStatus> status, int *count) {

  QMutexLocker l(db_->Mutex());
  QSqlDatabase db(db_->Connect());
  ScopedTransaction t(&db);

  QString where = u"collection_id = :collection_id AND "_s + QLatin1String(kPrefixCondition);
  if (status.has_value()) {
    where += u" AND status = :status"_s;
  }

  {
    SqlQuery q(db);
    q.prepare(u"DELETE FROM tracker_sources WHERE directory_id IN (SELECT ROWID FROM tracker_directories WHERE "_s + where + u")"_s);
    q.BindValue(u":collection_id"_s, collection_id);
    BindPrefix(&q, path_prefix);
    if (status.has_value()) q.BindValue(u":status"_s, static_cast<int>(*status));
    if (!q.Exec()) {
      db_->ReportErrors(q);
      return false;
    }
  }

  SqlQuery q(db);
  q.prepare(u"DELETE FROM tracker_directories WHERE "_s + where);
  q.BindValue(u":collection_id"_s, collection_id);
  BindPrefix(&q, path_prefix);
  if (status.has_value()) q.BindValue(u":status"_s, static_cast<int>(*status));
  if (!q.Exec()) {
    db_->ReportErrors(q);
    return false;
  }
  const int untracked = q.numRowsAffected();

  if (!t.Commit()) return false;

  if (count) *count = untracked;

  return true;

}

bool MediaTrackerBackend::LoadMediaSourceByPath(const int collection_id, const QString &content_path, MediaSource *media_source) {

  QMutexLocker l(db_->Mutex());
  QSqlDatabase db(db_->Connect());

  *media_source = MediaSource();

  SqlQuery q(db);
  q.prepare(u"SELECT ROWID AS source_id, "_s + MediaSource::kColumnSpec + u" FROM media_sources WHERE collection_id = :collection_id AND content_path = :content_path"_s);
  q.BindValue(u":collection_id"_s, collection_id);
  q.BindStringValue(u":content_path"_s, content_path);
  if (!q.Exec()) {
    db_->ReportErrors(q);
    return false;
  }

  if (q.next()) {
    media_source->InitFromQuery(q);
  }

  return true;

}

bool MediaTrackerBackend::LoadMediaSources(const int collection_id, const QString &path_prefix, MediaSourceList *media_sources) {

  QMutexLocker l(db_->Mutex());
  QSqlDatabase db(db_->Connect());

  media_sources->clear();

  SqlQuery q(db);
  q.prepare(u"SELECT ROWID AS source_id, "_s + MediaSource::kColumnSpec + u" FROM media_sources WHERE collection_id = :collection_id AND "_s + QLatin1String(kPrefixCondition) + u" ORDER BY content_path"_s);
  q.BindValue(u":collection_id"_s, collection_id);
  BindPrefix(&q, path_prefix);
  if (!q.Exec()) {
    db_->ReportErrors(q);
    return false;
  }

  while (q.next()) {
    MediaSource media_source;
    media_source.InitFromQuery(q);
    media_sources->append(media_source);
  }

  return true;

}

bool MediaTrackerBackend::CountMediaSourcesWithPrefix(const int collection_id, const QString &path_prefix, int *count) {

  QMutexLocker l(db_->Mutex());
  QSqlDatabase db(db_->Connect());

  SqlQuery q(db);
  q.prepare(u"SELECT COUNT(*) FROM media_sources WHERE collection_id = :collection_id AND "_s + QLatin1String(kPrefixCondition));
  q.BindValue(u":collection_id"_s, collection_id);
  BindPrefix(&q, path_prefix);
  if (!q.Exec() || !q.next()) {
    db_->ReportErrors(q);
    return false;
  }

  *count = q.value(0).toInt();

  return true;

}

bool MediaTrackerBackend::LoadUntrackedMediaSources(const int collection_id, const QString &path_prefix, MediaSourceList *media_sources) {

  QMutexLocker l(db_->Mutex());
  QSqlDatabase db(db_->Connect());

  media_sources->clear();

  SqlQuery q(db);
  q.prepare(u"SELECT ROWID AS source_id, "_s + MediaSource::kColumnSpec + u" FROM media_sources WHERE ROWID IN ("_s + UntrackedSourcesQuery() + u") ORDER BY content_path"_s);
  q.BindValue(u":collection_id"_s, collection_id);
  BindPrefix(&q, path_prefix);
  if (!q.Exec()) {
    db_->ReportErrors(q);
    return false;
  }

  while (q.next()) {
    MediaSource media_source;
    media_source.InitFromQuery(q);
    media_sources->append(media_source);
  }

  return true;

}

bool MediaTrackerBackend::PurgeOrphanedMediaSources(const int collection_id, const QString &path_prefix, PurgeOutcome *outcome) {

  QMutexLocker l(db_->Mutex());
  QSqlDatabase db(db_->Connect());
  ScopedTransaction t(&db);

  const QString orphaned_sources = u"SELECT source_id FROM tracker_sources WHERE directory_id IN ("_s + OrphanedDirectoriesQuery() + u")"_s;

  // Tracks first, they are found through their sources.
  const QStringList statements = QStringList() << u"DELETE FROM tracks WHERE media_source_id IN ("_s + orphaned_sources + u")"_s
                                               << u"DELETE FROM media_sources WHERE ROWID IN ("_s + orphaned_sources + u")"_s
                                               << u"DELETE FROM tracker_sources WHERE directory_id IN ("_s + OrphanedDirectoriesQuery() + u")"_s
                                               << u"DELETE FROM tracker_directories WHERE ROWID IN ("_s + OrphanedDirectoriesQuery() + u")"_s;

  QList<int> affected;
  for (const QString &statement : statements) {
    SqlQuery q(db);
    q.prepare(statement);
    q.BindValue(u":collection_id"_s, collection_id);
    q.BindValue(u":orphaned"_s, static_cast<int>(DirTrackingStatus::Orphaned));
    BindPrefix(&q, path_prefix);
    if (!q.Exec()) {
      db_->ReportErrors(q);
      return false;
    }
    affected << q.numRowsAffected();
  }

  if (!t.Commit()) return false;

  outcome->purged_tracks += affected.value(0);
  outcome->purged_sources += affected.value(1);
  outcome->untracked += affected.value(3);

  return true;

}

bool MediaTrackerBackend::PurgeUntrackedMediaSources(const int collection_id, const QString &path_prefix, PurgeOutcome *outcome) {

  QMutexLocker l(db_->Mutex());
  QSqlDatabase db(db_->Connect());
  ScopedTransaction t(&db);

  const QStringList statements = QStringList() << u"DELETE FROM tracks WHERE media_source_id IN ("_s + UntrackedSourcesQuery() + u")"_s
                                               << u"DELETE FROM media_sources WHERE ROWID IN ("_s + UntrackedSourcesQuery() + u")"_s;

  QList<int> affected;
  for (const QString &statement : statements) {
    SqlQuery q(db);
    q.prepare(statement);
    q.BindValue(u":collection_id"_s, collection_id);
    BindPrefix(&q, path_prefix);
    if (!q.Exec()) {
      db_->ReportErrors(q);
      return false;
    }
    affected << q.numRowsAffected();
  }

  if (!t.Commit()) return false;

  outcome->purged_tracks += affected.value(0);
  outcome->purged_sources += affected.value(1);

  return true;

}

bool MediaTrackerBackend::LoadTracksWhere(const QString &where, const QVariantMap &values, const QString &order_by, TrackList *tracks) {

  QMutexLocker l(db_->Mutex());
  QSqlDatabase db(db_->Connect());

  tracks->clear();

  SqlQuery q(db);
  q.prepare(u"SELECT "_s + Track::JoinedColumnSpec() + u" FROM tracks JOIN media_sources ON tracks.media_source_id = media_sources.ROWID WHERE "_s + where + u" ORDER BY media_sources.content_path"_s);
  for (QVariantMap::const_iterator it = values.constBegin(); it != values.constEnd(); ++it) {
    q.BindValue(it.key(), it.value());
  }
  if (!q.Exec()) {
    db_->ReportErrors(q);
    return false;
  }

  while (q.next()) {
    Track track;
    track.InitFromQuery(q);
    tracks->append(track);
  }

  return true;

}

bool MediaTrackerBackend::LoadTrackBySourceId(const int media_source_id, Track *track) {

  TrackList tracks;
  if (!LoadTracksWhere(u"media_sources.ROWID = :id"_s, QVariantMap({ { u":id"_s, media_source_id } }), u"media_sources.content_path"_s, &tracks)) {
    return false;
  }

  *track = tracks.value(0);

  return true;

}

bool MediaTrackerBackend::LoadTrackByUid(const QString &uid, Track *track) {

  TrackList tracks;
  if (!LoadTracksWhere(u"tracks.uid = :uid"_s, QVariantMap({ { u":uid"_s, uid } }), u"media_sources.content_path"_s, &tracks)) {
    return false;
  }

  *track = tracks.value(0);

  return true;

}

bool MediaTrackerBackend::LoadTracks(const int collection_id, const QString &path_prefix, TrackList *tracks) {

  return LoadTracksWhere(u"media_sources.collection_id = :collection_id AND substr(media_sources.content_path, 1, :prefix_length) = :prefix"_s,
                         QVariantMap({ { u":collection_id"_s, collection_id }, { u":prefix_length"_s, path_prefix.length() }, { u":prefix"_s, path_prefix.isNull() ? u""_s : path_prefix } }),
                         u"media_sources.content_path"_s,
                         tracks);

}

bool MediaTrackerBackend::LoadUntrackedTracks(const int collection_id, const QString &path_prefix, TrackList *tracks) {

  return LoadTracksWhere(u"media_sources.collection_id = :collection_id AND substr(media_sources.content_path, 1, :prefix_length) = :prefix AND media_sources.ROWID NOT IN (SELECT source_id FROM tracker_sources)"_s,
                         QVariantMap({ { u":collection_id"_s, collection_id }, { u":prefix_length"_s, path_prefix.length() }, { u":prefix"_s, path_prefix.isNull() ? u""_s : path_prefix } }),
                         u"media_sources.collected_at DESC, media_sources.content_path"_s,
                         tracks);

}

bool MediaTrackerBackend::LoadTrackedTracksByDigest(const int collection_id, const QByteArray &digest, TrackList *tracks) {

  return LoadTracksWhere(u"media_sources.collection_id = :collection_id AND media_sources.digest = :digest AND media_sources.ROWID IN (SELECT source_id FROM tracker_sources)"_s,
                         QVariantMap({ { u":collection_id"_s, collection_id }, { u":digest"_s, digest } }),
                         u"media_sources.content_path"_s,
                         tracks);

}

bool MediaTrackerBackend::UpdateTrack(const Track &track, Track *updated_track) {

  QMutexLocker l(db_->Mutex());
  QSqlDatabase db(db_->Connect());
  ScopedTransaction t(&db);

  Track new_track(track);
  new_track.set_revision(track.revision() + 1);
  new_track.set_updated_at(QDateTime::currentSecsSinceEpoch());

  SqlQuery q(db);
  q.prepare(u"UPDATE tracks SET "_s + Track::kUpdateSpec + u" WHERE ROWID = :id AND revision = :previous_revision"_s);
  new_track.BindToQuery(&q);
  q.BindValue(u":id"_s, track.id());
  q.BindValue(u":previous_revision"_s, track.revision());
  if (!q.Exec()) {
    db_->ReportErrors(q);
    return false;
  }
  if (q.numRowsAffected() != 1) {
    qLog(Warning) << "Track" << track.uid() << "was changed concurrently, revision" << track.revision() << "is outdated";
    return false;
  }

  if (!t.Commit()) return false;

  *updated_track = new_track;

  return true;

}

bool MediaTrackerBackend::StoreMediaSource(QSqlDatabase &db, MediaSource *media_source) {

  SqlQuery q(db);
  if (media_source->id == -1) {
    q.prepare(u"INSERT INTO media_sources ("_s + MediaSource::kColumnSpec + u") VALUES ("_s + MediaSource::kBindSpec + u")"_s);
  }
  else {
    q.prepare(u"UPDATE media_sources SET "_s + MediaSource::kUpdateSpec + u" WHERE ROWID = :id"_s);
    q.BindValue(u":id"_s, media_source->id);
  }
  media_source->BindToQuery(&q);
  if (!q.Exec()) {
    db_->ReportErrors(q);
    return false;
  }

  if (media_source->id == -1) {
    media_source->id = q.lastInsertId().toInt();
  }

  return true;

}

bool MediaTrackerBackend::CommitImportedDirectory(const ImportedDirectory &imported_directory, bool *confirmed) {

  QMutexLocker l(db_->Mutex());
  QSqlDatabase db(db_->Connect());
  ScopedTransaction t(&db);

  int directory_id = -1;
  {
    SqlQuery q(db);
    q.prepare(u"SELECT ROWID FROM tracker_directories WHERE collection_id = :collection_id AND content_path = :content_path"_s);
    q.BindValue(u":collection_id"_s, imported_directory.collection_id);
    q.BindStringValue(u":content_path"_s, imported_directory.content_path);
    if (!q.Exec()) {
      db_->ReportErrors(q);
      return false;
    }
    if (q.next()) {
      directory_id = q.value(0).toInt();
    }
  }

  QSet<int> source_ids;
  for (const int source_id : imported_directory.unchanged_source_ids) {
    source_ids << source_id;
  }

  for (const Track &created_track : imported_directory.created_tracks) {
    Track track(created_track);
    if (!StoreMediaSource(db, &track.media_source())) {
      return false;
    }
    SqlQuery q(db);
    q.prepare(u"INSERT INTO tracks ("_s + Track::kColumnSpec + u") VALUES ("_s + Track::kBindSpec + u")"_s);
    track.BindToQuery(&q);
    if (!q.Exec()) {
      db_->ReportErrors(q);
      return false;
    }
    source_ids << track.media_source().id;
  }

  for (const Track &updated_track : imported_directory.updated_tracks) {
    Track track(updated_track);
    if (!StoreMediaSource(db, &track.media_source())) {
      return false;
    }
    SqlQuery q(db);
    q.prepare(u"UPDATE tracks SET "_s + Track::kUpdateSpec + u" WHERE ROWID = :id"_s);
    track.BindToQuery(&q);
    q.BindValue(u":id"_s, track.id());
    if (!q.Exec()) {
      db_->ReportErrors(q);
      return false;
    }
    source_ids << track.media_source().id;
  }

  bool directory_confirmed = false;

  if (directory_id != -1) {
    {
      SqlQuery q(db);
      q.prepare(u"DELETE FROM tracker_sources WHERE directory_id = :directory_id"_s);
      q.BindValue(u":directory_id"_s, directory_id);
      if (!q.Exec()) {
        db_->ReportErrors(q);
        return false;
      }
    }
    for (const int source_id : std::as_const(source_ids)) {
      SqlQuery q(db);
      q.prepare(u"INSERT OR REPLACE INTO tracker_sources (directory_id, source_id) VALUES (:directory_id, :source_id)"_s);
      q.BindValue(u":directory_id"_s, directory_id);
      q.BindValue(u":source_id"_s, source_id);
      if (!q.Exec()) {
        db_->ReportErrors(q);
        return false;
      }
    }

    SqlQuery q(db);
    q.prepare(u"UPDATE tracker_directories SET status = :status, updated_at = :updated_at WHERE ROWID = :id AND digest = :digest"_s);
    q.BindValue(u":status"_s, static_cast<int>(imported_directory.status));
    q.BindValue(u":updated_at"_s, QDateTime::currentSecsSinceEpoch());
    q.BindValue(u":id"_s, directory_id);
    q.BindBlobValue(u":digest"_s, imported_directory.digest);
    if (!q.Exec()) {
      db_->ReportErrors(q);
      return false;
    }
    directory_confirmed = q.numRowsAffected() > 0;
  }
  else {
    qLog(Warning) << "Directory" << imported_directory.content_path << "is no longer tracked";
  }

  if (!t.Commit()) return false;

  if (confirmed) *confirmed = directory_confirmed;

  return true;

}

bool MediaTrackerBackend::RelocateContentPaths(const int collection_id, const QString &old_prefix, const QString &new_prefix, RelocateOutcome *outcome) {

  QMutexLocker l(db_->Mutex());
  QSqlDatabase db(db_->Connect());
  ScopedTransaction t(&db);

  QList<int> affected;
  const QStringList tables = QStringList() << u"media_sources"_s << u"tracker_directories"_s;
  for (const QString &table : tables) {
    SqlQuery q(db);
    q.prepare(QStringLiteral("UPDATE %1 SET content_path = :new_prefix || substr(content_path, :prefix_length + 1) WHERE collection_id = :collection_id AND %2").arg(table, QLatin1String(kPrefixCondition)));
    q.BindStringValue(u":new_prefix"_s, new_prefix);
    q.BindValue(u":collection_id"_s, collection_id);
    BindPrefix(&q, old_prefix);
    if (!q.Exec()) {
      db_->ReportErrors(q);
      return false;
    }
    affected << q.numRowsAffected();
  }

  if (!t.Commit()) return false;

  outcome->relocated_sources = affected.value(0);
  outcome->relocated_directories = affected.value(1);

  return true;

}

bool MediaTrackerBackend::RelinkTrack(const Track &track, const Track &successor, Track *relinked_track) {

  QMutexLocker l(db_->Mutex());
  QSqlDatabase db(db_->Connect());
  ScopedTransaction t(&db);

  // Frees the source of the successor for the relinked track.
  {
    SqlQuery q(db);
    q.prepare(u"DELETE FROM tracks WHERE ROWID = :id AND revision = :revision"_s);
    q.BindValue(u":id"_s, successor.id());
    q.BindValue(u":revision"_s, successor.revision());
    if (!q.Exec()) {
      db_->ReportErrors(q);
      return false;
    }
    if (q.numRowsAffected() != 1) {
      qLog(Warning) << "Track" << successor.uid() << "was changed concurrently, revision" << successor.revision() << "is outdated";
      return false;
    }
  }

  Track new_track(successor);
  new_track.set_id(track.id());
  new_track.set_uid(track.uid());
  new_track.set_revision(track.revision() + 1);
  new_track.set_updated_at(QDateTime::currentSecsSinceEpoch());
  new_track.media_source().collected_at = track.media_source().collected_at;
  new_track.media_source().synchronized_rev = new_track.revision();

  if (!StoreMediaSource(db, &new_track.media_source())) {
    return false;
  }

  {
    SqlQuery q(db);
    q.prepare(u"UPDATE tracks SET "_s + Track::kUpdateSpec + u" WHERE ROWID = :id AND revision = :previous_revision"_s);
    new_track.BindToQuery(&q);
    q.BindValue(u":id"_s, track.id());
    q.BindValue(u":previous_revision"_s, track.revision());
    if (!q.Exec()) {
      db_->ReportErrors(q);
      return false;
    }
    if (q.numRowsAffected() != 1) {
      qLog(Warning) << "Track" << track.uid() << "was changed concurrently, revision" << track.revision() << "is outdated";
      return false;
    }
  }

  const QStringList statements = QStringList() << u"DELETE FROM tracker_sources WHERE source_id = :source_id"_s
                                               << u"DELETE FROM media_sources WHERE ROWID = :source_id"_s;
  for (const QString &statement : statements) {
    SqlQuery q(db);
    q.prepare(statement);
    q.BindValue(u":source_id"_s, track.media_source().id);
    if (!q.Exec()) {
      db_->ReportErrors(q);
      return false;
    }
  }

  if (!t.Commit()) return false;

  *relinked_track = new_track;

  return true;

}
