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

#include <QString>
#include <QUrl>
#include <QDir>

#include "core/logging.h"
#include "vfscontentpathresolver.h"

using namespace Qt::Literals::StringLiterals;

MediaTrackerResult ContentPathResolver::UrlToDirectoryPath(const QUrl &url, QString *content_path) const {

  const MediaTrackerResult result = UrlToPath(url, content_path);
  if (result.success() && !content_path->isEmpty() && !content_path->endsWith(u'/')) {
    content_path->append(u'/');
  }

  return result;

}

VfsContentPathResolver::VfsContentPathResolver(const QUrl &root_url) {

  if (!root_url.isValid() || !root_url.isLocalFile()) {
    qLog(Error) << "Unsupported collection root" << root_url;
    return;
  }

  QString root_path = QDir::cleanPath(root_url.adjusted(QUrl::NormalizePathSegments).toLocalFile());
  if (root_path.isEmpty() || QDir::isRelativePath(root_path)) {
    qLog(Error) << "Collection root is not an absolute path" << root_url;
    return;
  }
  if (!root_path.endsWith(u'/')) {
    root_path.append(u'/');
  }

  root_path_ = root_path;

}

QUrl VfsContentPathResolver::root_url() const {

  return QUrl::fromLocalFile(root_path_);

}

QString VfsContentPathResolver::PathToLocalFile(const QString &content_path) const {

  return root_path_ + content_path;

}

QUrl VfsContentPathResolver::PathToUrl(const QString &content_path) const {

  return QUrl::fromLocalFile(PathToLocalFile(content_path));

}

MediaTrackerResult VfsContentPathResolver::UrlToPath(const QUrl &url, QString *content_path) const {

  if (!is_valid()) {
    return MediaTrackerResult(MediaTrackerResult::ErrorCode::InvalidInput, u"Invalid collection root"_s);
  }

  if (!url.isValid() || url.scheme() != "file"_L1) {
    return MediaTrackerResult(MediaTrackerResult::ErrorCode::UnsupportedPath, u"Unsupported URL %1"_s.arg(url.toString()));
  }

  QString path = url.adjusted(QUrl::NormalizePathSegments).toLocalFile();
  const bool is_directory = path.endsWith(u'/');
  path = QDir::cleanPath(path);
  if (!path.endsWith(u'/') && (is_directory || path + u'/' == root_path_)) {
    path.append(u'/');
  }

  if (!path.startsWith(root_path_)) {
    return MediaTrackerResult(MediaTrackerResult::ErrorCode::InvalidInput, u"%1 is outside of %2"_s.arg(url.toString(), root_path_));
  }

  *content_path = path.mid(root_path_.length());

  return MediaTrackerResult();

}
