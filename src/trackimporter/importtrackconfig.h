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

#ifndef IMPORTTRACKCONFIG_H
#define IMPORTTRACKCONFIG_H

#include "config.h"

#include <QMetaType>

struct ImportTrackConfig {
  ImportTrackConfig() : read_embedded_artwork(true), genres_as_tags(false) {}

  // Look for an embedded front cover
  bool read_embedded_artwork;
  // Also store every genre as a tag, multiple genres are separated by ';'
  bool genres_as_tags;
};

Q_DECLARE_METATYPE(ImportTrackConfig)

#endif  // IMPORTTRACKCONFIG_H
