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

#ifndef MEDIATRACKERBACKENDINTERFACES_H
#define MEDIATRACKERBACKENDINTERFACES_H

#include "config.h"

#include <optional>

#include <QtGlobal>
#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QUrl>

#include "media/collection.h"
#include "media/mediasource.h"
#include "media/track.h"
#include "dirtrackingstatus.h"
#include "trackeddirectory.h"
#include "mediatrackeroutcomes.h"
#include "importeddirectory.h"

// Storage contract of the media tracker, split by capability.
// All methods return false on a storage failure, "not found" is reported through an invalid result.
// Path prefixes are content paths, the empty prefix matches the whole collection.

class CollectionAccess {
 public:
  virtual ~CollectionAccess() = default;

  virtual bool AddCollection(const QUrl &root_url, const QString &title, Collection *collection) = 0;
  virtual bool LoadCollectionById(const int collection_id, Collection *collection) = 0;
  virtual bool LoadCollectionByUrl(const QUrl &root_url, Collection *collection) = 0;
  virtual bool LoadCollections(CollectionList *collections) = 0;
};

class DirectoryTrackingAccess {
 public:
  virtual ~DirectoryTrackingAccess() = default;

  // Starts a new scan pass and returns its generation.
  virtual bool BeginScan(const int collection_id, qint64 *scan_generation) = 0;

  // Classifies and stores the digests observed by a scan pass.
  // Directories with a null digest could not be read, they are only marked as visited.
  virtual bool UpdateDirectoryDigests(const int collection_id, const qint64 scan_generation, const TrackedDirectoryList &directories, DirectoriesStatus *statuses) = 0;

  // Tracked directories under the prefix that were not visited by the scan pass.
  virtual bool LoadUnvisitedDirectories(const int collection_id, const QString &path_prefix, const qint64 scan_generation, QStringList *content_paths) = 0;
  virtual bool MarkDirectoriesOrphaned(const int collection_id, const QStringList &content_paths, int *count) = 0;

  virtual bool LoadDirectory(const int collection_id, const QString &content_path, TrackedDirectory *directory) = 0;
  // Added or Modified directories, least recently updated first.
  virtual bool LoadPendingDirectories(const int collection_id, const QString &path_prefix, const int offset, const int limit, TrackedDirectoryList *directories) = 0;
  virtual bool AggregateDirectoriesStatus(const int collection_id, const QString &path_prefix, DirectoriesStatus *status) = 0;
  virtual bool CountDirectoriesWithPrefix(const int collection_id, const QString &path_prefix, int *count) = 0;

  virtual bool UntrackDirectories(const int collection_id, const QString &path_prefix, const std::optional<DirTrackingStatus> status, int *count) = 0;
};

class MediaSourceAccess {
 public:
  virtual ~MediaSourceAccess() = default;

  virtual bool LoadMediaSourceByPath(const int collection_id, const QString &content_path, MediaSource *media_source) = 0;
  virtual bool LoadMediaSources(const int collection_id, const QString &path_prefix, MediaSourceList *media_sources) = 0;
  virtual bool CountMediaSourcesWithPrefix(const int collection_id, const QString &path_prefix, int *count) = 0;

  // Sources that are not linked to any tracked directory.
  virtual bool LoadUntrackedMediaSources(const int collection_id, const QString &path_prefix, MediaSourceList *media_sources) = 0;

  // Deletes the sources of orphaned directories under the prefix with their tracks, then the directories.
  virtual bool PurgeOrphanedMediaSources(const int collection_id, const QString &path_prefix, PurgeOutcome *outcome) = 0;
  // Deletes the sources under the prefix that are not linked to any tracked directory, with their tracks.
  virtual bool PurgeUntrackedMediaSources(const int collection_id, const QString &path_prefix, PurgeOutcome *outcome) = 0;
};

class TrackAccess {
 public:
  virtual ~TrackAccess() = default;

  virtual bool LoadTrackBySourceId(const int media_source_id, Track *track) = 0;
  virtual bool LoadTrackByUid(const QString &uid, Track *track) = 0;
  virtual bool LoadTracks(const int collection_id, const QString &path_prefix, TrackList *tracks) = 0;
  // Tracks whose source is not linked to any tracked directory, most recently collected first.
  virtual bool LoadUntrackedTracks(const int collection_id, const QString &path_prefix, TrackList *tracks) = 0;
  // Tracks whose source is tracked and has the given content digest.
  virtual bool LoadTrackedTracksByDigest(const int collection_id, const QByteArray &digest, TrackList *tracks) = 0;

  // Stores a local edit. Fails without changes if the stored revision differs from track.revision().
  virtual bool UpdateTrack(const Track &track, Track *updated_track) = 0;
};

class MediaTrackerBackendInterface : public CollectionAccess, public DirectoryTrackingAccess, public MediaSourceAccess, public TrackAccess {
 public:
  ~MediaTrackerBackendInterface() override = default;

  // Stores created and updated tracks with their sources, links all sources to the directory
  // and sets the directory status if its digest did not change in the meantime.
  virtual bool CommitImportedDirectory(const ImportedDirectory &imported_directory, bool *confirmed) = 0;

  // Rewrites the prefix of sources and tracking records in one transaction.
  virtual bool RelocateContentPaths(const int collection_id, const QString &old_prefix, const QString &new_prefix, RelocateOutcome *outcome) = 0;

  // Moves a track onto the source of its successor, keeping its id and uid.
  // The successor track and the previous source of the track are deleted.
  // Fails without changes if either revision is outdated.
  virtual bool RelinkTrack(const Track &track, const Track &successor, Track *relinked_track) = 0;
};

#endif  // MEDIATRACKERBACKENDINTERFACES_H
