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

#ifndef IMPORTEDDIRECTORY_H
#define IMPORTEDDIRECTORY_H

#include "config.h"

#include <QList>
#include <QByteArray>
#include <QString>

#include "media/track.h"
#include "dirtrackingstatus.h"

// Everything the importer wants to store for one directory, committed as one unit of work.
struct ImportedDirectory {
  ImportedDirectory() : collection_id(-1), status(DirTrackingStatus::Current) {}

  int collection_id;
  QString content_path;

  // Directory digest read before the files were imported.
  // The new status is only stored if the tracked digest still matches.
  QByteArray digest;
  DirTrackingStatus status;

  TrackList created_tracks;
  TrackList updated_tracks;

  // Sources that were found in the directory and left alone
  QList<int> unchanged_source_ids;
};

#endif  // IMPORTEDDIRECTORY_H
