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

#include <QObject>

#include "mediatrackerresult.h"

QString MediaTrackerResult::error_string() const {

  QString message;
  switch (error_code) {
    case ErrorCode::Success:
      return QObject::tr("Success");
    case ErrorCode::InvalidInput:
      message = QObject::tr("Invalid input");
      break;
    case ErrorCode::UnsupportedPath:
      message = QObject::tr("Unsupported path");
      break;
    case ErrorCode::IoError:
      message = QObject::tr("File system error");
      break;
    case ErrorCode::StorageError:
      message = QObject::tr("Database error");
      break;
  }

  if (message.isEmpty()) message = QObject::tr("Unknown error");
  if (!error_text.isEmpty()) message += QLatin1String(": ") + error_text;

  return message;

}
