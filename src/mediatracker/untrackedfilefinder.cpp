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

#include <QtGlobal>
#include <QObject>
#include <QList>
#include <QSet>
#include <QString>
#include <QStringList>
#include <QUrl>
#include <QDir>
#include <QFileInfo>
#include <QElapsedTimer>

#include "core/logging.h"
#include "media/vfscontentpathresolver.h"
#include "untrackedfilefinder.h"
#include "abortflag.h"
#include "mediatrackerbackendinterfaces.h"

using namespace Qt::Literals::StringLiterals;

namespace {

struct PendingDirectory {
  PendingDirectory() : depth(0) {}
  PendingDirectory(const QString &_path, const int _depth) : path(_path), depth(_depth) {}
  QString path;
  int depth;
};

}  // namespace

UntrackedFileFinder::UntrackedFileFinder(MediaSourceAccess *backend, QObject *parent)
    : QObject(parent),
      backend_(backend) {}

MediaTrackerResult UntrackedFileFinder::Find(const Collection &collection, const ScanParams &params, const AbortFlag &abort_flag, FindUntrackedOutcome *outcome) {

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
  const MediaTrackerResult resolve_result = resolver.UrlToDirectoryPath(params.root_url.isEmpty() ? collection.root_url : params.root_url, &root_path);
  if (!resolve_result.success()) {
    return resolve_result;
  }

  *outcome = FindUntrackedOutcome();
  outcome->root_url = resolver.PathToUrl(root_path);

  const QFileInfo root_info(resolver.PathToLocalFile(root_path));
  if (!root_info.exists() || !root_info.isDir() || !root_info.isReadable()) {
    qLog(Error) << "Cannot read" << root_info.filePath();
    return MediaTrackerResult(MediaTrackerResult::ErrorCode::IoError, u"Cannot read directory %1"_s.arg(root_info.filePath()));
  }

  MediaSourceList media_sources;
  if (!backend_->LoadMediaSources(collection.id, root_path, &media_sources)) {
    return MediaTrackerResult(MediaTrackerResult::ErrorCode::StorageError, u"Could not load media sources"_s);
  }
  QSet<QString> known_paths;
  for (const MediaSource &media_source : std::as_const(media_sources)) {
    known_paths << media_source.content_path;
  }

  QString canonical_root_path = QFileInfo(resolver.PathToLocalFile(QString())).canonicalFilePath();
  if (!canonical_root_path.endsWith(u'/')) canonical_root_path.append(u'/');

  QElapsedTimer timer;
  timer.start();

  ScanProgress progress;
  QSet<QString> visited;
  QList<PendingDirectory> stack;
  stack << PendingDirectory(root_info.absoluteFilePath(), 0);

  while (!stack.isEmpty()) {
    if (abort_flag.abort_requested()) {
      outcome->completion = Completion::Aborted;
      break;
    }

    const PendingDirectory pending = stack.takeLast();
    const QFileInfo pending_info(pending.path);

    // Same rules as the scanner, symlinked directories inside the collection are found under their real path.
    if (pending.depth > 0 && pending_info.isSymLink()) {
      const QString real_path = pending_info.canonicalFilePath();
      if (real_path.isEmpty() || (real_path + u'/').startsWith(canonical_root_path)) continue;
    }
    const QString canonical_path = pending_info.canonicalFilePath();
    if (canonical_path.isEmpty() || visited.contains(canonical_path)) continue;
    visited << canonical_path;

    QString content_path;
    if (!resolver.UrlToDirectoryPath(QUrl::fromLocalFile(pending.path), &content_path).success()) {
      qLog(Warning) << "Skipping" << pending.path;
      continue;
    }

    const QDir dir(pending.path);
    if (!dir.isReadable()) {
      qLog(Warning) << "Skipping unreadable directory" << pending.path;
      continue;
    }

    const QFileInfoList entries = dir.entryInfoList(QDir::Dirs | QDir::Files | QDir::NoDotAndDotDot, QDir::Name);
    QStringList subdirectories;
    for (const QFileInfo &entry : entries) {
      if (entry.isDir()) {
        subdirectories << entry.absoluteFilePath();
        continue;
      }
      const QString file_content_path = content_path + entry.fileName();
      if (!known_paths.contains(file_content_path)) {
        outcome->content_paths << file_content_path;
      }
    }

    if (params.max_depth == -1 || pending.depth < params.max_depth) {
      for (qint64 i = subdirectories.count() - 1; i >= 0; --i) {
        stack << PendingDirectory(subdirectories.at(i), pending.depth + 1);
      }
    }

    ++progress.directories_finished;
    progress.entries_finished += static_cast<int>(entries.count());
    progress.elapsed_msec = timer.elapsed();
    Q_EMIT Progress(progress);
  }

  outcome->content_paths.sort();

  qLog(Info) << "Found" << outcome->content_paths.count() << "untracked files under" << outcome->root_url << "in" << timer.elapsed() << "ms";

  return MediaTrackerResult();

}
