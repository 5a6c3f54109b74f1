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

#ifndef TRACKIMPORTERTAGLIB_H
#define TRACKIMPORTERTAGLIB_H

#include "config.h"

#include <QByteArray>
#include <QString>
#include <QStringList>

#include <taglib/tstring.h>
#include <taglib/fileref.h>
#include <taglib/tpropertymap.h>

#include "media/track.h"

#include "trackimporterbase.h"

#undef TStringToQString
#undef QStringToTString

// Reads tags and audio properties with TagLib, from memory.
class TrackImporterTagLib : public TrackImporterBase {
 public:
  explicit TrackImporterTagLib();
  ~TrackImporterTagLib() override;

  static inline QString TagLibStringToQString(const TagLib::String &s) {
    return QString::fromUtf8((s).toCString(true));
  }

  static bool IsSupportedFile(const QString &content_path);

  TrackImporterResult Import(const QByteArray &data, const QString &content_path, const Track *existing, const ImportTrackConfig &config, Track *track, QStringList *issues) const override;

 private:
  static void ReadProperties(const TagLib::PropertyMap &properties, Track *track, QStringList *issues);
  static void ReadAudioProperties(TagLib::FileRef *fileref, Track *track);
  static bool HasEmbeddedArtwork(TagLib::FileRef *fileref);
  static QString PropertyValue(const TagLib::PropertyMap &properties, const char *key);

  Q_DISABLE_COPY(TrackImporterTagLib)
};

#endif  // TRACKIMPORTERTAGLIB_H
