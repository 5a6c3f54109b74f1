/*
 * Gooseberry
 * This file was part of Strawberry Music Player and Clementine.
 * Copyright 2010, David Sansome <me@davidsansome.com>
 * Copyright 2018-2025, Jonas Kvinge <jonas@jkvinge.net>
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

#ifndef MEDIATRACKER_H
#define MEDIATRACKER_H

#include "config.h"

#include <optional>

#include <QtGlobal>
#include <QObject>
#include <QString>
#include <QUrl>

#include "includes/shared_ptr.h"
#include "includes/scoped_ptr.h"
#include "media/collection.h"
#include "mediatrackerresult.h"
#include "mediatrackeroutcomes.h"
#include "dirtrackingstatus.h"
#include "syncmode.h"
#include "abortflag.h"
#include "directoryscanner.h"
#include "importorchestrator.h"

class QThread;
class TaskManager;
class TrackImporterBase;
class MediaTrackerBackendInterface;
class UntrackOrchestrator;
class PurgeOrchestrator;
class RelocateOrchestrator;
class UntrackedFileFinder;
class RelinkOrchestrator;

// Runs the synchronization operations of the media tracker.
// The *Async() functions queue the operation on the thread of this object and report the result with a signal,
// one operation runs at a time and Abort() cancels the running one.
class MediaTracker : public QObject {
  Q_OBJECT

 public:
  explicit MediaTracker(SharedPtr<TaskManager> task_manager, SharedPtr<MediaTrackerBackendInterface> backend, SharedPtr<TrackImporterBase> importer, QObject *parent = nullptr);
  ~MediaTracker() override;

  void ReloadSettings();

  SyncMode sync_mode() const { return sync_mode_; }
  int max_depth() const { return max_depth_; }
  int scan_batch_size() const;

  // Thread safe
  void Abort();

  void ExitAsync();

  void ScanAsync(const int collection_id, const ScanParams &params);
  void ImportAsync(const int collection_id, const ImportParams &params);
  void UntrackAsync(const int collection_id, const QUrl &root_url, const std::optional<DirTrackingStatus> status = std::nullopt);
  void PurgeOrphanedAsync(const int collection_id, const QUrl &root_url = QUrl());
  void PurgeUntrackedAsync(const int collection_id, const QUrl &root_url = QUrl());
  void RelocateAsync(const int collection_id, const QUrl &old_prefix_url, const QUrl &new_prefix_url);
  void QueryStatusAsync(const int collection_id, const QUrl &root_url = QUrl());
  void FindUntrackedFilesAsync(const int collection_id, const ScanParams &params);
  void RelinkAsync(const int collection_id, const QUrl &root_url = QUrl());

  MediaTrackerResult Scan(const int collection_id, const ScanParams &params, ScanOutcome *outcome);
  MediaTrackerResult Import(const int collection_id, const ImportParams &params, ImportOutcome *outcome);
  MediaTrackerResult Untrack(const int collection_id, const QUrl &root_url, const std::optional<DirTrackingStatus> status, UntrackOutcome *outcome);
  MediaTrackerResult PurgeOrphaned(const int collection_id, const QUrl &root_url, PurgeOutcome *outcome);
  MediaTrackerResult PurgeUntracked(const int collection_id, const QUrl &root_url, PurgeOutcome *outcome);
  MediaTrackerResult Relocate(const int collection_id, const QUrl &old_prefix_url, const QUrl &new_prefix_url, RelocateOutcome *outcome);
  MediaTrackerResult QueryStatus(const int collection_id, const QUrl &root_url, QUrl *resolved_root_url, DirectoriesStatus *status);
  MediaTrackerResult FindUntrackedFiles(const int collection_id, const ScanParams &params, FindUntrackedOutcome *outcome);
  MediaTrackerResult Relink(const int collection_id, const QUrl &root_url, RelinkOutcome *outcome);

 Q_SIGNALS:
  void ExitFinished();
  void Error(const QString &error);

  void ScanProgressUpdated(const ScanProgress &progress);
  void ImportProgressUpdated(const ImportProgress &progress);
  void FindUntrackedProgressUpdated(const ScanProgress &progress);
  void RelinkProgressUpdated(const RelinkProgress &progress);

  void ScanFinished(const ScanOutcome &outcome);
  void ImportFinished(const ImportOutcome &outcome);
  void UntrackFinished(const UntrackOutcome &outcome);
  void PurgeFinished(const PurgeOutcome &outcome);
  void RelocateFinished(const RelocateOutcome &outcome);
  void StatusQueried(const QUrl &root_url, const DirectoriesStatus &status);
  void FindUntrackedFinished(const FindUntrackedOutcome &outcome);
  void RelinkFinished(const RelinkOutcome &outcome);

 private Q_SLOTS:
  void Exit();
  void ScanProgressed(const ScanProgress &progress);
  void ImportProgressed(const ImportProgress &progress);

 private:
  MediaTrackerResult LoadCollection(const int collection_id, Collection *collection);
  void ReportError(const QString &operation, const MediaTrackerResult &result);

 private:
  SharedPtr<TaskManager> task_manager_;
  SharedPtr<MediaTrackerBackendInterface> backend_;
  SharedPtr<TrackImporterBase> importer_;

  ScopedPtr<DirectoryScanner> scanner_;
  ScopedPtr<ImportOrchestrator> import_orchestrator_;
  ScopedPtr<UntrackOrchestrator> untrack_orchestrator_;
  ScopedPtr<PurgeOrchestrator> purge_orchestrator_;
  ScopedPtr<RelocateOrchestrator> relocate_orchestrator_;
  ScopedPtr<UntrackedFileFinder> untracked_file_finder_;
  ScopedPtr<RelinkOrchestrator> relink_orchestrator_;

  QThread *original_thread_;

  AbortFlag abort_flag_;
  int task_id_;

  SyncMode sync_mode_;
  int max_depth_;

  Q_DISABLE_COPY(MediaTracker)
};

#endif  // MEDIATRACKER_H
