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

#ifndef DIRECTORYSCANNER_H
#define DIRECTORYSCANNER_H

#include "config.h"

#include <QtGlobal>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QUrl>

#include "media/collection.h"
#include "mediatrackerresult.h"
#include "mediatrackeroutcomes.h"
#include "trackeddirectory.h"

class MediaTrackerBackendInterface;
class AbortFlag;

struct ScanParams {
  ScanParams() : max_depth(-1) {}

  // Empty means the collection root
  QUrl root_url;
  // Levels below the root that are visited, -1 for unlimited
  int max_depth;
};

Q_DECLARE_METATYPE(ScanParams)

// Walks a directory tree, digests every directory and updates the tracking records.
class DirectoryScanner : public QObject {
  Q_OBJECT

 public:
  explicit DirectoryScanner(MediaTrackerBackendInterface *backend, QObject *parent = nullptr);

  static const int kDefaultBatchSize;

  void set_batch_size(const int batch_size) { batch_size_ = qMax(1, batch_size); }
  int batch_size() const { return batch_size_; }

  // Directories committed before a failure or an abort stay committed.
  MediaTrackerResult Scan(const Collection &collection, const ScanParams &params, const AbortFlag &abort_flag, ScanOutcome *outcome);

 Q_SIGNALS:
  void Progress(const ScanProgress &progress);

 private:
  bool FlushBatch(const int collection_id, const qint64 scan_generation, TrackedDirectoryList *batch, ScanOutcome *outcome);
  bool MarkUnvisitedOrphaned(const int collection_id, const QString &root_path, const qint64 scan_generation, const int max_depth, const QStringList &unreadable_paths, ScanOutcome *outcome);

 private:
  MediaTrackerBackendInterface *backend_;
  int batch_size_;

  Q_DISABLE_COPY(DirectoryScanner)
};

#endif  // DIRECTORYSCANNER_H
