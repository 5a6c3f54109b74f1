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

#ifndef IMPORTORCHESTRATOR_H
#define IMPORTORCHESTRATOR_H

#include "config.h"

#include <QtGlobal>
#include <QObject>
#include <QElapsedTimer>
#include <QString>
#include <QUrl>

#include "media/collection.h"
#include "trackimporter/importtrackconfig.h"
#include "mediatrackerresult.h"
#include "mediatrackeroutcomes.h"
#include "trackeddirectory.h"
#include "syncmode.h"

class QFileInfo;
class MediaTrackerBackendInterface;
class TrackImporterBase;
class VfsContentPathResolver;
class AbortFlag;
struct ImportedDirectory;

struct ImportParams {
  ImportParams() : sync_mode(SyncMode::Modified) {}

  // Empty means the collection root
  QUrl root_url;
  SyncMode sync_mode;
  ImportTrackConfig import_config;
};

Q_DECLARE_METATYPE(ImportParams)

// Imports the files of every pending directory under a root, one directory per transaction.
class ImportOrchestrator : public QObject {
  Q_OBJECT

 public:
  explicit ImportOrchestrator(MediaTrackerBackendInterface *backend, TrackImporterBase *importer, QObject *parent = nullptr);

  MediaTrackerResult Import(const Collection &collection, const ImportParams &params, const AbortFlag &abort_flag, ImportOutcome *outcome);

 Q_SIGNALS:
  void Progress(const ImportProgress &progress);

 private:
  enum class DirectoryResult {
    Committed,
    Aborted,
    StorageError
  };

  DirectoryResult ImportDirectory(const VfsContentPathResolver &resolver, const Collection &collection, const TrackedDirectory &directory, const ImportParams &params, const AbortFlag &abort_flag, ImportOutcome *outcome);

  // Imports one file into imported, returns false if the directory can't become current.
  bool ImportFile(const QFileInfo &fileinfo, const QString &content_path, const Collection &collection, const ImportParams &params, ImportedDirectory *imported, ImportTracksSummary *tracks, ImportIssueList *issue_list, bool *storage_error);

  void EmitProgress(const ImportOutcome &outcome, const ImportTracksSummary &directory_tracks);

 private:
  MediaTrackerBackendInterface *backend_;
  TrackImporterBase *importer_;
  QElapsedTimer timer_;

  Q_DISABLE_COPY(ImportOrchestrator)
};

#endif  // IMPORTORCHESTRATOR_H
