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

#ifndef VFSCONTENTPATHRESOLVER_H
#define VFSCONTENTPATHRESOLVER_H

#include "config.h"

#include <QString>
#include <QUrl>

#include "contentpathresolver.h"

// Resolves content paths against a file:// root directory.
class VfsContentPathResolver : public ContentPathResolver {
 public:
  explicit VfsContentPathResolver(const QUrl &root_url);

  bool is_valid() const { return !root_path_.isEmpty(); }
  QString root_path() const { return root_path_; }
  QUrl root_url() const;

  QUrl PathToUrl(const QString &content_path) const override;
  MediaTrackerResult UrlToPath(const QUrl &url, QString *content_path) const override;

  QString PathToLocalFile(const QString &content_path) const;

 private:
  // Absolute local path, always ending with a slash
  QString root_path_;
};

#endif  // VFSCONTENTPATHRESOLVER_H
