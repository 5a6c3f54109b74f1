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

#ifndef CONTENTPATHRESOLVER_H
#define CONTENTPATHRESOLVER_H

#include "config.h"

#include <QString>
#include <QUrl>

#include "mediatracker/mediatrackerresult.h"

// Maps content paths stored in the database to locations and back.
// Directory paths end with a slash, the collection root is the empty path.
class ContentPathResolver {
 public:
  virtual ~ContentPathResolver() = default;

  virtual QUrl PathToUrl(const QString &content_path) const = 0;
  virtual MediaTrackerResult UrlToPath(const QUrl &url, QString *content_path) const = 0;

  // Like UrlToPath() but the result always denotes a directory.
  MediaTrackerResult UrlToDirectoryPath(const QUrl &url, QString *content_path) const;
};

#endif  // CONTENTPATHRESOLVER_H
