/*
 * Gooseberry
 * This file was part of Strawberry Music Player.
 * Copyright 2013, David Sansome <me@davidsansome.com>
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

#ifndef TRACKIMPORTERBASE_H
#define TRACKIMPORTERBASE_H

#include "config.h"

#include <QtGlobal>
#include <QByteArray>
#include <QString>
#include <QStringList>

#include "media/track.h"

#include "trackimporterresult.h"
#include "importtrackconfig.h"

// Turns the bytes of a media file into track metadata.
class TrackImporterBase {
 public:
  explicit TrackImporterBase();
  virtual ~TrackImporterBase();

  // existing is the track currently stored for the file, or nullptr.
  // On success track holds the imported metadata and media source properties,
  // identity and revision are left to the caller.
  // Non-fatal problems are appended to issues.
  virtual TrackImporterResult Import(const QByteArray &data, const QString &content_path, const Track *existing, const ImportTrackConfig &config, Track *track, QStringList *issues) const = 0;

 protected:
  static int ParseLeadingNumber(const QString &text);
  static QStringList SplitGenres(const QString &genre);

  Q_DISABLE_COPY(TrackImporterBase)
};

#endif  // TRACKIMPORTERBASE_H
