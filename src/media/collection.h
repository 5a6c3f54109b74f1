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

#ifndef COLLECTION_H
#define COLLECTION_H

#include "config.h"

#include <QMetaType>
#include <QList>
#include <QString>
#include <QUrl>

// A music collection rooted at a directory.
// All content paths of the collection are relative to root_url.
struct Collection {
  Collection() : id(-1) {}

  bool is_valid() const { return id != -1; }

  int id;
  QString uid;
  QString title;
  QUrl root_url;
};

Q_DECLARE_METATYPE(Collection)

using CollectionList = QList<Collection>;

Q_DECLARE_METATYPE(CollectionList)

#endif  // COLLECTION_H
