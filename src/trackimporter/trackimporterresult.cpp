/*
 * Gooseberry
 * This file was part of Strawberry Music Player.
 * Copyright 2024, Jonas Kvinge <jonas@jkvinge.net>
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

#include <QObject>

#include "trackimporterresult.h"

QString TrackImporterResult::error_string() const {

  QString text;
  switch (error_code) {
    case ErrorCode::Success:
      return QObject::tr("Success");
    case ErrorCode::Unsupported:
      text = QObject::tr("File is unsupported");
      break;
    case ErrorCode::FileOpenError:
      text = QObject::tr("File could not be opened");
      break;
    case ErrorCode::FileParseError:
      text = QObject::tr("Could not parse file");
      break;
  }

  if (!error_text.isEmpty()) {
    text += QLatin1String(": ") + error_text;
  }

  return text;

}
