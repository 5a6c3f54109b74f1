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
#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QUrl>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QFileInfoList>
#include <QDateTime>
#include <QMimeDatabase>
#include <QMimeType>

#include "core/logging.h"
#include "media/track.h"
#include "media/mediasource.h"
#include "media/vfscontentpathresolver.h"
#include "trackimporter/trackimporterbase.h"
#include "trackimporter/trackimporterresult.h"
#include "importorchestrator.h"
#include "importeddirectory.h"
#include "directorydigest.h"
#include "abortflag.h"
#include "mediatrackerbackendinterfaces.h"

using namespace Qt::Literals::StringLiterals;

ImportOrchestrator::ImportOrchestrator(MediaTrackerBackendInterface *backend, TrackImporterBase *importer, QObject *parent)
    : QObject(parent),
      backend_(backend),
      importer_(importer) {}

MediaTrackerResult ImportOrchestrator::Import(const Collection &collection, const ImportParams &params, const AbortFlag &abort_flag, ImportOutcome *outcome) {

  if (!collection.is_valid()) {
    return MediaTrackerResult(MediaTrackerResult::ErrorCode::InvalidInput, u"Invalid collection"_s);
  }

  const VfsContentPathResolver resolver(collection.root_url);
  if (!resolver.is_valid()) {
    return MediaTrackerResult(MediaTrackerResult::ErrorCode::UnsupportedPath, u"Unsupported collection root %1"_s.arg(collection.root_url.toString()));
  }

  QString root_path;
  const QUrl root_url = params.root_url.isEmpty() ? collection.root_url : params.root_url;
  const MediaTrackerResult resolve_result = resolver.UrlToDirectoryPath(root_url, &root_path);
  if (!resolve_result.success()) {
    return resolve_result;
  }

  *outcome = ImportOutcome();
  outcome->root_url = resolver.PathToUrl(root_path);

  qLog(Debug) << "Importing" << outcome->root_url << "with sync mode" << SyncModeToString(params.sync_mode);

  timer_.start();

  // Directories that are still pending after they were handled are skipped by the next query.
  int pending_left = 0;
  while (true) {
    if (abort_flag.abort_requested()) {
      outcome->completion = Completion::Aborted;
      break;
    }

    TrackedDirectoryList directories;
    if (!backend_->LoadPendingDirectories(collection.id, root_path, pending_left, 1, &directories)) {
      return MediaTrackerResult(MediaTrackerResult::ErrorCode::StorageError, u"Could not load pending directories"_s);
    }
    if (directories.isEmpty()) break;

    const TrackedDirectory &directory = directories.first();
    const DirectoryResult result = ImportDirectory(resolver, collection, directory, params, abort_flag, outcome);
    if (result == DirectoryResult::StorageError) {
      return MediaTrackerResult(MediaTrackerResult::ErrorCode::StorageError, u"Could not update %1"_s.arg(directory.content_path));
    }
    if (result == DirectoryResult::Aborted) {
      outcome->completion = Completion::Aborted;
      break;
    }

    TrackedDirectory stored;
    if (!backend_->LoadDirectory(collection.id, directory.content_path, &stored)) {
      return MediaTrackerResult(MediaTrackerResult::ErrorCode::StorageError, u"Could not load %1"_s.arg(directory.content_path));
    }
    if (stored.id != -1 && IsPending(stored.status)) {
      ++pending_left;
    }
  }

  qLog(Debug) << "Import finished in" << timer_.elapsed() << "ms" << *outcome;

  return MediaTrackerResult();

}

ImportOrchestrator::DirectoryResult ImportOrchestrator::ImportDirectory(const VfsContentPathResolver &resolver, const Collection &collection, const TrackedDirectory &directory, const ImportParams &params, const AbortFlag &abort_flag, ImportOutcome *outcome) {

  const QString local_path = resolver.PathToLocalFile(directory.content_path);

  const QFileInfo dir_info(local_path);
  if (!dir_info.exists() || !dir_info.isDir()) {
    qLog(Info) << "Directory" << local_path << "is gone, untracking it";
    int untracked = 0;
    if (!backend_->UntrackDirectories(collection.id, directory.content_path, std::nullopt, &untracked)) {
      return DirectoryResult::StorageError;
    }
    outcome->directories.untracked += untracked;
    EmitProgress(*outcome, ImportTracksSummary());
    return DirectoryResult::Committed;
  }

  qLog(Debug) << "Importing directory" << local_path << DirTrackingStatusToString(directory.status);

  ImportedDirectory imported;
  imported.collection_id = collection.id;
  imported.content_path = directory.content_path;
  imported.digest = directory.digest;

  ImportTracksSummary tracks;
  ImportIssueList issues;
  bool complete = true;

  const QFileInfoList entries = QDir(local_path).entryInfoList(QDir::Files | QDir::NoDotAndDotDot, QDir::Name);
  for (const QFileInfo &fileinfo : entries) {
    if (abort_flag.abort_requested()) {
      // Nothing of this directory is stored.
      return DirectoryResult::Aborted;
    }

    bool storage_error = false;
    if (!ImportFile(fileinfo, directory.content_path + fileinfo.fileName(), collection, params, &imported, &tracks, &issues, &storage_error)) {
      complete = false;
    }
    if (storage_error) {
      return DirectoryResult::StorageError;
    }

    EmitProgress(*outcome, tracks);
  }

  imported.status = complete ? DirTrackingStatus::Current : DirTrackingStatus::Outdated;

  bool confirmed = false;
  if (!backend_->CommitImportedDirectory(imported, &confirmed)) {
    qLog(Error) << "Could not store the import of" << local_path;
    ++outcome->directories.skipped;
    outcome->issues << issues;
    outcome->issues << ImportIssue(directory.content_path, QStringList() << QObject::tr("Could not store the imported tracks"));
    EmitProgress(*outcome, ImportTracksSummary());
    return DirectoryResult::Committed;
  }

  outcome->tracks += tracks;
  outcome->issues << issues;
  if (confirmed) {
    ++outcome->directories.confirmed;
  }
  else {
    // Changed on disk since it was scanned, the next scan picks it up again.
    qLog(Info) << "Directory" << local_path << "changed during the import";
    ++outcome->directories.skipped;
  }

  EmitProgress(*outcome, ImportTracksSummary());

  return DirectoryResult::Committed;

}

bool ImportOrchestrator::ImportFile(const QFileInfo &fileinfo, const QString &content_path, const Collection &collection, const ImportParams &params, ImportedDirectory *imported, ImportTracksSummary *tracks, ImportIssueList *issue_list, bool *storage_error) {

  QFile file(fileinfo.filePath());
  if (!file.open(QIODevice::ReadOnly)) {
    qLog(Error) << "Could not open" << fileinfo.filePath() << file.errorString();
    ++tracks->failed;
    *issue_list << ImportIssue(content_path, QStringList() << file.errorString());
    return false;
  }
  const QByteArray data = file.readAll();
  file.close();

  const QByteArray digest = DirectoryDigest::FileDigest(data);

  MediaSource existing_source;
  Track existing_track;
  if (!backend_->LoadMediaSourceByPath(collection.id, content_path, &existing_source)) {
    *storage_error = true;
    return false;
  }
  if (existing_source.is_valid()) {
    if (!backend_->LoadTrackBySourceId(existing_source.id, &existing_track)) {
      *storage_error = true;
      return false;
    }
    // Whatever happens to the file, its source is still in this directory.
    imported->unchanged_source_ids << existing_source.id;
  }

  const std::optional<qint64> track_revision = existing_track.is_valid() ? std::optional<qint64>(existing_track.revision()) : std::nullopt;
  const ImportDecision decision = DecideImport(params.sync_mode, existing_source.is_valid() ? &existing_source : nullptr, track_revision, digest);

  if (decision == ImportDecision::SkipUnchanged) {
    ++tracks->unchanged;
    return true;
  }
  if (decision == ImportDecision::SkipUnsynchronized) {
    qLog(Debug) << "Keeping local changes of" << content_path;
    ++tracks->skipped;
    return false;
  }

  Track track;
  QStringList issues;
  const TrackImporterResult result = importer_->Import(data, content_path, existing_track.is_valid() ? &existing_track : nullptr, params.import_config, &track, &issues);
  if (!result.success()) {
    if (result.error_code == TrackImporterResult::ErrorCode::Unsupported) {
      ++tracks->not_imported;
      if (!issues.isEmpty()) *issue_list << ImportIssue(content_path, issues);
      return true;
    }
    qLog(Error) << "Could not import" << content_path << result.error_string();
    ++tracks->failed;
    issues << result.error_string();
    *issue_list << ImportIssue(content_path, issues);
    return false;
  }

  const qint64 now = QDateTime::currentSecsSinceEpoch();

  MediaSource &media_source = track.media_source();
  media_source.id = existing_source.id;
  media_source.collection_id = collection.id;
  media_source.content_path = content_path;
  media_source.digest = digest;
  if (media_source.content_type.isEmpty()) {
    media_source.content_type = QMimeDatabase().mimeTypeForFile(fileinfo).name();
  }
  media_source.collected_at = existing_source.is_valid() ? existing_source.collected_at : now;
  media_source.synchronized_at = now;

  if (existing_track.is_valid()) {
    track.set_id(existing_track.id());
    track.set_uid(existing_track.uid());
    track.set_revision(existing_track.revision() + 1);
  }
  else {
    track.set_id(-1);
    track.set_uid(Track::CreateUid());
    track.set_revision(1);
  }
  media_source.synchronized_rev = track.revision();
  track.set_updated_at(now);

  QString error;
  if (!track.Validate(&error)) {
    qLog(Warning) << "Rejected" << content_path << error;
    if (existing_track.is_valid()) {
      ++tracks->not_updated;
    }
    else {
      ++tracks->not_created;
    }
    issues << error;
    *issue_list << ImportIssue(content_path, issues);
    return false;
  }

  if (!issues.isEmpty()) {
    *issue_list << ImportIssue(content_path, issues);
  }

  if (existing_track.is_valid()) {
    imported->updated_tracks << track;
    ++tracks->updated;
  }
  else {
    imported->created_tracks << track;
    ++tracks->created;
  }

  return true;

}

void ImportOrchestrator::EmitProgress(const ImportOutcome &outcome, const ImportTracksSummary &directory_tracks) {

  ImportProgress progress;
  progress.elapsed_msec = timer_.elapsed();
  progress.tracks = outcome.tracks;
  progress.tracks += directory_tracks;
  progress.directories = outcome.directories;

  Q_EMIT Progress(progress);

}
