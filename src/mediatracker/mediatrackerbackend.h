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

#ifndef MEDIATRACKERBACKEND_H
#define MEDIATRACKERBACKEND_H

#include "config.h"

#include <optional>

#include <QtGlobal>
#include <QObject>
#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QUrl>
#include <QVariant>
#include <QVariantMap>

#include "includes/shared_ptr.h"
#include "mediatrackerbackendinterfaces.h"

class QThread;
class QSqlDatabase;
class Database;
class SqlQuery;

// SQLite implementation of the media tracker storage.
// Writers are serialized on the database mutex, so only one operation mutates a collection at a time.
class MediaTrackerBackend : public QObject, public MediaTrackerBackendInterface {
  Q_OBJECT

 public:
  explicit MediaTrackerBackend(QObject *parent = nullptr);

  void Init(SharedPtr<Database> db);
  void Close();

  void ExitAsync();

  SharedPtr<Database> db() const { return db_; }

  // CollectionAccess
  bool AddCollection(const QUrl &root_url, const QString &title, Collection *collection) override;
  bool LoadCollectionById(const int collection_id, Collection *collection) override;
  bool LoadCollectionByUrl(const QUrl &root_url, Collection *collection) override;
  bool LoadCollections(CollectionList *collections) override;

  // DirectoryTrackingAccess
  bool BeginScan(const int collection_id, qint64 *scan_generation) override;
  bool UpdateDirectoryDigests(const int collection_id, const qint64 scan_generation, const TrackedDirectoryList &directories, DirectoriesStatus *statuses) override;
  bool LoadUnvisitedDirectories(const int collection_id, const QString &path_prefix, const qint64 scan_generation, QStringList *content_paths) override;
  bool MarkDirectoriesOrphaned(const int collection_id, const QStringList &content_paths, int *count) override;
  bool LoadDirectory(const int collection_id, const QString &content_path, TrackedDirectory *directory) override;
  bool LoadPendingDirectories(const int collection_id, const QString &path_prefix, const int offset, const int limit, TrackedDirectoryList *directories) override;
  bool AggregateDirectoriesStatus(const int collection_id, const QString &path_prefix, DirectoriesStatus *status) override;
  bool CountDirectoriesWithPrefix(const int collection_id, const QString &path_prefix, int *count) override;
  bool UntrackDirectories(const int collection_id, const QString &path_prefix, const std::optional<DirTrackingStatus> status, int *count) override;

  // MediaSourceAccess
  bool LoadMediaSourceByPath(const int collection_id, const QString &content_path, MediaSource *media_source) override;
  bool LoadMediaSources(const int collection_id, const QString &path_prefix, MediaSourceList *media_sources) override;
  bool CountMediaSourcesWithPrefix(const int collection_id, const QString &path_prefix, int *count) override;
  bool LoadUntrackedMediaSources(const int collection_id, const QString &path_prefix, MediaSourceList *media_sources) override;
  bool PurgeOrphanedMediaSources(const int collection_id, const QString &path_prefix, PurgeOutcome *outcome) override;
  bool PurgeUntrackedMediaSources(const int collection_id, const QString &path_prefix, PurgeOutcome *outcome) override;

  // TrackAccess
  bool LoadTrackBySourceId(const int media_source_id, Track *track) override;
  bool LoadTrackByUid(const QString &uid, Track *track) override;
  bool LoadTracks(const int collection_id, const QString &path_prefix, TrackList *tracks) override;
  bool LoadUntrackedTracks(const int collection_id, const QString &path_prefix, TrackList *tracks) override;
  bool LoadTrackedTracksByDigest(const int collection_id, const QByteArray &digest, TrackList *tracks) override;
  bool UpdateTrack(const Track &track, Track *updated_track) override;

  bool CommitImportedDirectory(const ImportedDirectory &imported_directory, bool *confirmed) override;
  bool RelocateContentPaths(const int collection_id, const QString &old_prefix, const QString &new_prefix, RelocateOutcome *outcome) override;
  bool RelinkTrack(const Track &track, const Track &successor, Track *relinked_track) override;

  static QUrl NormalizeRootUrl(const QUrl &root_url);

 Q_SIGNALS:
  void ExitFinished();

 private Q_SLOTS:
  void Exit();

 private:
  static void BindPrefix(SqlQuery *query, const QString &path_prefix);
  bool LoadCollection(const QString &where, const QString &placeholder, const QVariant &value, Collection *collection);
  bool StoreMediaSource(QSqlDatabase &db, MediaSource *media_source);
  bool LoadTracksWhere(const QString &where, const QVariantMap &values, const QString &order_by, TrackList *tracks);

  SharedPtr<Database> db_;
  QThread *original_thread_;
};

#endif  // MEDIATRACKERBACKEND_H
