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

#include "config.h"

#include <QString>
#include <QStringList>

#include "trackimporterbase.h"

TrackImporterBase::TrackImporterBase() = default;
TrackImporterBase::~TrackImporterBase() = default;

int TrackImporterBase::ParseLeadingNumber(const QString &text) {

  // "3/12" means the third of twelve.
  const QString number = text.section(u'/', 0, 0).trimmed();
  bool ok = false;
  const int value = number.toInt(&ok);
  return ok && value > 0 ? value : -1;

}

QStringList TrackImporterBase::SplitGenres(const QString &genre) {

  QStringList genres;
  const QStringList parts = genre.split(u';', Qt::SkipEmptyParts);
  for (const QString &part : parts) {
    const QString trimmed = part.trimmed();
    if (!trimmed.isEmpty() && !genres.contains(trimmed)) {
      genres << trimmed;
    }
  }

  return genres;

}
