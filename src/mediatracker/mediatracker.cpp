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

#include "config.h"

#include <optional>

#include <QtGlobal>
#include <QObject>
#include <QThread>
#include <QString>
#include <QUrl>

#include "core/logging.h"
#include "core/taskmanager.h"
#include "core/settings.h"
#include "constants/mediatrackersettings.h"
#include "media/vfscontentpathresolver.h"
#include "trackimporter/trackimporterbase.h"
#include "mediatracker.h"
#include "mediatrackerbackendinterfaces.h"
#include "untrackorchestrator.h"
#include "purgeorchestrator.h"
#include "relocateorchestrator.h"
#include "untrackedfilefinder.h"
#include "relinkorchestrator.h"

using namespace Qt::Literals::StringLiterals;

MediaTracker::MediaTracker(SharedPtr<TaskManager> task_manager, SharedPtr<MediaTrackerBackendInterface> backend, SharedPtr<TrackImporterBase> importer, QObject *parent)
    : QObject(parent),
      task_manager_(task_manager),
      backend_(backend),
      importer_(importer),
      scanner_(new DirectoryScanner(&*backend_, this)),
      import_orchestrator_(new ImportOrchestrator(&*backend_, &*importer_, this)),
      untrack_orchestrator_(new UntrackOrchestrator(&*backend_)),
      purge_orchestrator_(new PurgeOrchestrator(&*backend_)),
      relocate_orchestrator_(new RelocateOrchestrator(&*backend_)),
      untracked_file_finder_(new UntrackedFileFinder(&*backend_, this)),
      relink_orchestrator_(new RelinkOrchestrator(&*backend_, this)),
      original_thread_(nullptr),
      task_id_(-1),
      sync_mode_(SyncMode::Modified),
      max_depth_(MediaTrackerSettings::kMaxDepthDefault) {

  setObjectName(QLatin1String(metaObject()->className()));

  original_thread_ = thread();

  QObject::connect(&*scanner_, &DirectoryScanner::Progress, this, &MediaTracker::ScanProgressed);
  QObject::connect(&*import_orchestrator_, &ImportOrchestrator::Progress, this, &MediaTracker::ImportProgressed);
  QObject::connect(&*untracked_file_finder_, &UntrackedFileFinder::Progress, this, &MediaTracker::FindUntrackedProgressUpdated);
  QObject::connect(&*relink_orchestrator_, &RelinkOrchestrator::Progress, this, &MediaTracker::RelinkProgressUpdated);

  ReloadSettings();

}

MediaTracker::~MediaTracker() = default;

void MediaTracker::ReloadSettings() {

  Settings s;
  s.beginGroup(QLatin1String(MediaTrackerSettings::kSettingsGroup));
  scanner_->set_batch_size(s.value(QLatin1String(MediaTrackerSettings::kScanBatchSize), MediaTrackerSettings::kScanBatchSizeDefault).toInt());
  max_depth_ = qMax(-1, s.value(QLatin1String(MediaTrackerSettings::kMaxDepth), MediaTrackerSettings::kMaxDepthDefault).toInt());
  const QString sync_mode = s.value(QLatin1String(MediaTrackerSettings::kSyncMode), QLatin1String(MediaTrackerSettings::kSyncModeDefault)).toString();
  s.endGroup();

  const std::optional<SyncMode> parsed_sync_mode = SyncModeFromString(sync_mode);
  if (parsed_sync_mode.has_value()) {
    sync_mode_ = *parsed_sync_mode;
  }
  else {
    qLog(Warning) << "Unknown sync mode" << sync_mode << "in settings, using" << SyncModeToString(sync_mode_);
  }

}

int MediaTracker::scan_batch_size() const {
  return scanner_->batch_size();
}

void MediaTracker::Abort() {

  qLog(Debug) << "Abort requested";
  abort_flag_.Abort();

}

void MediaTracker::ExitAsync() {
  QMetaObject::invokeMethod(this, &MediaTracker::Exit, Qt::QueuedConnection);
}

void MediaTracker::Exit() {

  Q_ASSERT(QThread::currentThread() == thread());

  moveToThread(original_thread_);
  Q_EMIT ExitFinished();

}

void MediaTracker::ReportError(const QString &operation, const MediaTrackerResult &result) {

  qLog(Error) << operation << "failed:" << result.error_string();
  Q_EMIT Error(tr("%1 failed: %2").arg(operation, result.error_string()));

}

MediaTrackerResult MediaTracker::LoadCollection(const int collection_id, Collection *collection) {

  if (!backend_->LoadCollectionById(collection_id, collection)) {
    return MediaTrackerResult(MediaTrackerResult::ErrorCode::StorageError, u"Could not load collection %1"_s.arg(collection_id));
  }
  if (!collection->is_valid()) {
    return MediaTrackerResult(MediaTrackerResult::ErrorCode::InvalidInput, u"No collection with id %1"_s.arg(collection_id));
  }

  return MediaTrackerResult();

}

void MediaTracker::ScanAsync(const int collection_id, const ScanParams &params) {

  QMetaObject::invokeMethod(this, [this, collection_id, params]() {
    ScanOutcome outcome;
    const MediaTrackerResult result = Scan(collection_id, params, &outcome);
    if (result.success()) {
      Q_EMIT ScanFinished(outcome);
    }
    else {
      ReportError(tr("Scan"), result);
    }
  }, Qt::QueuedConnection);

}

void MediaTracker::ImportAsync(const int collection_id, const ImportParams &params) {

  QMetaObject::invokeMethod(this, [this, collection_id, params]() {
    ImportOutcome outcome;
    const MediaTrackerResult result = Import(collection_id, params, &outcome);
    if (result.success()) {
      Q_EMIT ImportFinished(outcome);
    }
    else {
      ReportError(tr("Import"), result);
    }
  }, Qt::QueuedConnection);

}

void MediaTracker::UntrackAsync(const int collection_id, const QUrl &root_url, const std::optional<DirTrackingStatus> status) {

  QMetaObject::invokeMethod(this, [this, collection_id, root_url, status]() {
    UntrackOutcome outcome;
    const MediaTrackerResult result = Untrack(collection_id, root_url, status, &outcome);
    if (result.success()) {
      Q_EMIT UntrackFinished(outcome);
    }
    else {
      ReportError(tr("Untrack"), result);
    }
  }, Qt::QueuedConnection);

}

void MediaTracker::PurgeOrphanedAsync(const int collection_id, const QUrl &root_url) {

  QMetaObject::invokeMethod(this, [this, collection_id, root_url]() {
    PurgeOutcome outcome;
    const MediaTrackerResult result = PurgeOrphaned(collection_id, root_url, &outcome);
    if (result.success()) {
      Q_EMIT PurgeFinished(outcome);
    }
    else {
      ReportError(tr("Purge"), result);
    }
  }, Qt::QueuedConnection);

}

void MediaTracker::PurgeUntrackedAsync(const int collection_id, const QUrl &root_url) {

  QMetaObject::invokeMethod(this, [this, collection_id, root_url]() {
    PurgeOutcome outcome;
    const MediaTrackerResult result = PurgeUntracked(collection_id, root_url, &outcome);
    if (result.success()) {
      Q_EMIT PurgeFinished(outcome);
    }
    else {
      ReportError(tr("Purge"), result);
    }
  }, Qt::QueuedConnection);

}

void MediaTracker::RelocateAsync(const int collection_id, const QUrl &old_prefix_url, const QUrl &new_prefix_url) {

  QMetaObject::invokeMethod(this, [this, collection_id, old_prefix_url, new_prefix_url]() {
    RelocateOutcome outcome;
    const MediaTrackerResult result = Relocate(collection_id, old_prefix_url, new_prefix_url, &outcome);
    if (result.success()) {
      Q_EMIT RelocateFinished(outcome);
    }
    else {
      ReportError(tr("Relocate"), result);
    }
  }, Qt::QueuedConnection);

}

void MediaTracker::FindUntrackedFilesAsync(const int collection_id, const ScanParams &params) {

  QMetaObject::invokeMethod(this, [this, collection_id, params]() {
    FindUntrackedOutcome outcome;
    const MediaTrackerResult result = FindUntrackedFiles(collection_id, params, &outcome);
    if (result.success()) {
      Q_EMIT FindUntrackedFinished(outcome);
    }
    else {
      ReportError(tr("Finding untracked files"), result);
    }
  }, Qt::QueuedConnection);

}

void MediaTracker::RelinkAsync(const int collection_id, const QUrl &root_url) {

  QMetaObject::invokeMethod(this, [this, collection_id, root_url]() {
    RelinkOutcome outcome;
    const MediaTrackerResult result = Relink(collection_id, root_url, &outcome);
    if (result.success()) {
      Q_EMIT RelinkFinished(outcome);
    }
    else {
      ReportError(tr("Relink"), result);
    }
  }, Qt::QueuedConnection);

}

void MediaTracker::QueryStatusAsync(const int collection_id, const QUrl &root_url) {

  QMetaObject::invokeMethod(this, [this, collection_id, root_url]() {
    QUrl resolved_root_url;
    DirectoriesStatus status;
    const MediaTrackerResult result = QueryStatus(collection_id, root_url, &resolved_root_url, &status);
    if (result.success()) {
      Q_EMIT StatusQueried(resolved_root_url, status);
    }
    else {
      ReportError(tr("Status query"), result);
    }
  }, Qt::QueuedConnection);

}

MediaTrackerResult MediaTracker::Scan(const int collection_id, const ScanParams &params, ScanOutcome *outcome) {

  AbortFlag::ScopedOperation operation(&abort_flag_);

  Collection collection;
  const MediaTrackerResult result = LoadCollection(collection_id, &collection);
  if (!result.success()) return result;

  TaskManager::ScopedTask task(task_manager_->StartTask(tr("Scanning %1").arg(collection.title)), &*task_manager_);
  task_id_ = task.task_id();
  const MediaTrackerResult scan_result = scanner_->Scan(collection, params, abort_flag_, outcome);
  task_id_ = -1;

  return scan_result;

}

MediaTrackerResult MediaTracker::Import(const int collection_id, const ImportParams &params, ImportOutcome *outcome) {

  AbortFlag::ScopedOperation operation(&abort_flag_);

  Collection collection;
  const MediaTrackerResult result = LoadCollection(collection_id, &collection);
  if (!result.success()) return result;

  TaskManager::ScopedTask task(task_manager_->StartTask(tr("Importing %1").arg(collection.title)), &*task_manager_);
  task_id_ = task.task_id();
  const MediaTrackerResult import_result = import_orchestrator_->Import(collection, params, abort_flag_, outcome);
  task_id_ = -1;

  return import_result;

}

MediaTrackerResult MediaTracker::Untrack(const int collection_id, const QUrl &root_url, const std::optional<DirTrackingStatus> status, UntrackOutcome *outcome) {

  AbortFlag::ScopedOperation operation(&abort_flag_);

  Collection collection;
  const MediaTrackerResult result = LoadCollection(collection_id, &collection);
  if (!result.success()) return result;

  return untrack_orchestrator_->Untrack(collection, root_url, status, outcome);

}

MediaTrackerResult MediaTracker::PurgeOrphaned(const int collection_id, const QUrl &root_url, PurgeOutcome *outcome) {

  AbortFlag::ScopedOperation operation(&abort_flag_);

  Collection collection;
  const MediaTrackerResult result = LoadCollection(collection_id, &collection);
  if (!result.success()) return result;

  return purge_orchestrator_->PurgeOrphaned(collection, root_url, outcome);

}

MediaTrackerResult MediaTracker::PurgeUntracked(const int collection_id, const QUrl &root_url, PurgeOutcome *outcome) {

  AbortFlag::ScopedOperation operation(&abort_flag_);

  Collection collection;
  const MediaTrackerResult result = LoadCollection(collection_id, &collection);
  if (!result.success()) return result;

  return purge_orchestrator_->PurgeUntracked(collection, root_url, outcome);

}

MediaTrackerResult MediaTracker::Relocate(const int collection_id, const QUrl &old_prefix_url, const QUrl &new_prefix_url, RelocateOutcome *outcome) {

  AbortFlag::ScopedOperation operation(&abort_flag_);

  Collection collection;
  const MediaTrackerResult result = LoadCollection(collection_id, &collection);
  if (!result.success()) return result;

  return relocate_orchestrator_->Relocate(collection, old_prefix_url, new_prefix_url, outcome);

}

MediaTrackerResult MediaTracker::FindUntrackedFiles(const int collection_id, const ScanParams &params, FindUntrackedOutcome *outcome) {

  AbortFlag::ScopedOperation operation(&abort_flag_);

  Collection collection;
  const MediaTrackerResult result = LoadCollection(collection_id, &collection);
  if (!result.success()) return result;

  TaskManager::ScopedTask task(task_manager_->StartTask(tr("Finding untracked files in %1").arg(collection.title)), &*task_manager_);
  return untracked_file_finder_->Find(collection, params, abort_flag_, outcome);

}

MediaTrackerResult MediaTracker::Relink(const int collection_id, const QUrl &root_url, RelinkOutcome *outcome) {

  AbortFlag::ScopedOperation operation(&abort_flag_);

  Collection collection;
  const MediaTrackerResult result = LoadCollection(collection_id, &collection);
  if (!result.success()) return result;

  TaskManager::ScopedTask task(task_manager_->StartTask(tr("Relinking moved tracks in %1").arg(collection.title)), &*task_manager_);
  return relink_orchestrator_->Relink(collection, root_url, abort_flag_, outcome);

}

MediaTrackerResult MediaTracker::QueryStatus(const int collection_id, const QUrl &root_url, QUrl *resolved_root_url, DirectoriesStatus *status) {

  Collection collection;
  const MediaTrackerResult result = LoadCollection(collection_id, &collection);
  if (!result.success()) return result;

  const VfsContentPathResolver resolver(collection.root_url);
  QString root_path;
  const MediaTrackerResult resolve_result = resolver.UrlToDirectoryPath(root_url.isEmpty() ? collection.root_url : root_url, &root_path);
  if (!resolve_result.success()) return resolve_result;

  if (!backend_->AggregateDirectoriesStatus(collection.id, root_path, status)) {
    return MediaTrackerResult(MediaTrackerResult::ErrorCode::StorageError, u"Could not query the status of %1"_s.arg(root_path));
  }

  if (resolved_root_url) *resolved_root_url = resolver.PathToUrl(root_path);

  return MediaTrackerResult();

}

void MediaTracker::ScanProgressed(const ScanProgress &progress) {

  if (task_id_ != -1) {
    task_manager_->SetTaskProgress(task_id_, static_cast<quint64>(progress.directories_finished));
  }

  Q_EMIT ScanProgressUpdated(progress);

}

void MediaTracker::ImportProgressed(const ImportProgress &progress) {

  if (task_id_ != -1) {
    task_manager_->SetTaskProgress(task_id_, static_cast<quint64>(progress.tracks.total()));
  }

  Q_EMIT ImportProgressUpdated(progress);

}
