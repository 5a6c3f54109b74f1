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

#include <algorithm>

#include <QtGlobal>
#include <QObject>
#include <QList>
#include <QSet>
#include <QString>
#include <QStringList>
#include <QUrl>
#include <QFileInfo>
#include <QElapsedTimer>

#include "core/logging.h"
#include "utilities/strutils.h"
#include "media/vfscontentpathresolver.h"
#include "directoryscanner.h"
#include "directorydigest.h"
#include "abortflag.h"
#include "mediatrackerbackendinterfaces.h"

using namespace Qt::Literals::StringLiterals;

const int DirectoryScanner::kDefaultBatchSize = 16;

namespace {

struct PendingDirectory {
  PendingDirectory() : depth(0) {}
  PendingDirectory(const QString &_path, const int _depth) : path(_path), depth(_depth) {}
  QString path;
  int depth;
};

}  // namespace

DirectoryScanner::DirectoryScanner(MediaTrackerBackendInterface *backend, QObject *parent)
    : QObject(parent),
      backend_(backend),
      batch_size_(kDefaultBatchSize) {}

MediaTrackerResult DirectoryScanner::Scan(const Collection &collection, const ScanParams &params, const AbortFlag &abort_flag, ScanOutcome *outcome) {

  if (!collection.is_valid()) {
    return MediaTrackerResult(MediaTrackerResult::ErrorCode::InvalidInput, u"Invalid collection"_s);
  }
  if (params.max_depth < -1) {
    return MediaTrackerResult(MediaTrackerResult::ErrorCode::InvalidInput, u"Invalid maximum depth %1"_s.arg(params.max_depth));
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

  *outcome = ScanOutcome();
  outcome->root_url = resolver.PathToUrl(root_path);

  const QFileInfo root_info(resolver.PathToLocalFile(root_path));
  if (!root_info.exists() || !root_info.isDir() || !root_info.isReadable()) {
    qLog(Error) << "Cannot read" << root_info.filePath();
    return MediaTrackerResult(MediaTrackerResult::ErrorCode::IoError, u"Cannot read directory %1"_s.arg(root_info.filePath()));
  }

  qint64 scan_generation = 0;
  if (!backend_->BeginScan(collection.id, &scan_generation)) {
    return MediaTrackerResult(MediaTrackerResult::ErrorCode::StorageError, u"Could not start scan"_s);
  }

  qLog(Debug) << "Scanning" << outcome->root_url << "generation" << scan_generation;

  QElapsedTimer timer;
  timer.start();

  ScanProgress progress;
  TrackedDirectoryList batch;
  QSet<QString> visited;
  QStringList unreadable_paths;
  QList<PendingDirectory> stack;
  stack << PendingDirectory(root_info.absoluteFilePath(), 0);

  QString canonical_root_path = QFileInfo(resolver.PathToLocalFile(QString())).canonicalFilePath();
  if (!canonical_root_path.endsWith(u'/')) canonical_root_path.append(u'/');

  while (!stack.isEmpty()) {
    if (abort_flag.abort_requested()) {
      outcome->completion = Completion::Aborted;
      break;
    }

    const PendingDirectory pending = stack.takeLast();
    const QFileInfo pending_info(pending.path);

    // Do not scan symlinked directories that are already in the collection, the real directory is tracked under its own path.
    if (pending.depth > 0 && pending_info.isSymLink()) {
      const QString real_path = pending_info.canonicalFilePath();
      if (real_path.isEmpty() || (real_path + u'/').startsWith(canonical_root_path)) {
        qLog(Debug) << "Skipping symlinked directory" << pending.path;
        continue;
      }
    }

    // Symbolic links to outside directories can make the same directory appear twice, or loop.
    const QString canonical_path = pending_info.canonicalFilePath();
    if (canonical_path.isEmpty() || visited.contains(canonical_path)) {
      qLog(Debug) << "Skipping" << pending.path << "already visited";
      continue;
    }
    visited << canonical_path;

    QString content_path;
    const MediaTrackerResult path_result = resolver.UrlToDirectoryPath(QUrl::fromLocalFile(pending.path), &content_path);
    if (!path_result.success()) {
      qLog(Warning) << "Skipping" << pending.path << path_result.error_string();
      ++outcome->directories.skipped;
      continue;
    }

    DirectoryDigest::Listing listing;
    QString error;
    if (DirectoryDigest::Calculate(pending.path, &listing, &error)) {
      batch << TrackedDirectory(content_path, listing.digest);
      if (params.max_depth == -1 || pending.depth < params.max_depth) {
        // Reversed so that the first subdirectory is visited next.
        for (qint64 i = listing.subdirectories.count() - 1; i >= 0; --i) {
          stack << PendingDirectory(listing.subdirectories.at(i), pending.depth + 1);
        }
      }
    }
    else {
      // Kept as it is, the next scan tries again.
      qLog(Warning) << "Skipping" << error;
      ++outcome->directories.skipped;
      unreadable_paths << content_path;
      batch << TrackedDirectory(content_path, QByteArray());
    }

    ++progress.directories_finished;
    progress.entries_finished += listing.entries;

    if (batch.count() >= batch_size_ && !FlushBatch(collection.id, scan_generation, &batch, outcome)) {
      return MediaTrackerResult(MediaTrackerResult::ErrorCode::StorageError, u"Could not store directory digests"_s);
    }

    progress.elapsed_msec = timer.elapsed();
    Q_EMIT Progress(progress);
  }

  if (!FlushBatch(collection.id, scan_generation, &batch, outcome)) {
    return MediaTrackerResult(MediaTrackerResult::ErrorCode::StorageError, u"Could not store directory digests"_s);
  }

  // An aborted scan did not visit everything, missing directories are only known after a complete pass.
  if (outcome->completion == Completion::Finished && !MarkUnvisitedOrphaned(collection.id, root_path, scan_generation, params.max_depth, unreadable_paths, outcome)) {
    return MediaTrackerResult(MediaTrackerResult::ErrorCode::StorageError, u"Could not mark orphaned directories"_s);
  }

  qLog(Debug) << "Scanned" << progress.directories_finished << "directories in" << timer.elapsed() << "ms" << *outcome;

  return MediaTrackerResult();

}

bool DirectoryScanner::FlushBatch(const int collection_id, const qint64 scan_generation, TrackedDirectoryList *batch, ScanOutcome *outcome) {

  if (batch->isEmpty()) return true;

  if (!backend_->UpdateDirectoryDigests(collection_id, scan_generation, *batch, &outcome->directories)) {
    qLog(Error) << "Could not store" << batch->count() << "directory digests";
    return false;
  }

  batch->clear();

  return true;

}

bool DirectoryScanner::MarkUnvisitedOrphaned(const int collection_id, const QString &root_path, const qint64 scan_generation, const int max_depth, const QStringList &unreadable_paths, ScanOutcome *outcome) {

  QStringList unvisited;
  if (!backend_->LoadUnvisitedDirectories(collection_id, root_path, scan_generation, &unvisited)) {
    return false;
  }

  // Directories below the depth limit or below an unreadable directory were not looked at.
  const int root_depth = Utilities::ContentPathDepth(root_path);
  QStringList gone;
  for (const QString &content_path : std::as_const(unvisited)) {
    if (max_depth != -1 && Utilities::ContentPathDepth(content_path) - root_depth > max_depth) continue;
    if (std::any_of(unreadable_paths.begin(), unreadable_paths.end(), [&content_path](const QString &unreadable_path) { return content_path.startsWith(unreadable_path); })) continue;
    gone << content_path;
  }
  unvisited = gone;

  if (unvisited.isEmpty()) return true;

  int orphaned = 0;
  if (!backend_->MarkDirectoriesOrphaned(collection_id, unvisited, &orphaned)) {
    return false;
  }

  qLog(Debug) << orphaned << "directories are gone from" << root_path;
  outcome->directories.orphaned += unvisited.count();

  return true;

}
