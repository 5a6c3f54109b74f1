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

#ifndef TRACKEDDIRECTORY_H
#define TRACKEDDIRECTORY_H

#include "config.h"

#include <QMetaType>
#include <QList>
#include <QByteArray>
#include <QString>

#include "dirtrackingstatus.h"

struct TrackedDirectory {
  TrackedDirectory() : id(-1), status(DirTrackingStatus::Current) {}
  TrackedDirectory(const QString &_content_path, const QByteArray &_digest, const DirTrackingStatus _status = DirTrackingStatus::Current)
      : id(-1), content_path(_content_path), digest(_digest), status(_status) {}

  int id;
  QString content_path;
  QByteArray digest;
  DirTrackingStatus status;
};

Q_DECLARE_METATYPE(TrackedDirectory)

using TrackedDirectoryList = QList<TrackedDirectory>;

Q_DECLARE_METATYPE(TrackedDirectoryList)

#endif  // TRACKEDDIRECTORY_H
