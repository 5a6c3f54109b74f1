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

#ifndef DIRTRACKINGSTATUS_H
#define DIRTRACKINGSTATUS_H

#include "config.h"

#include <optional>

#include <QMetaType>
#include <QByteArray>
#include <QString>

// Change detection state of a tracked directory.
// The values are stored in the database, don't change them.
enum class DirTrackingStatus {
  Current = 0,
  Outdated = 1,
  Added = 2,
  Modified = 3,
  Orphaned = 4
};

// Digest and status stored for a directory by a previous scan.
struct TrackedDigest {
  TrackedDigest() : status(DirTrackingStatus::Current) {}
  TrackedDigest(const QByteArray &_digest, const DirTrackingStatus _status) : digest(_digest), status(_status) {}
  QByteArray digest;
  DirTrackingStatus status;
};

// Outdated, Added or Modified.
bool IsStale(const DirTrackingStatus status);

// Added or Modified, the directory has import work scheduled.
bool IsPending(const DirTrackingStatus status);

QString DirTrackingStatusToString(const DirTrackingStatus status);
std::optional<DirTrackingStatus> DirTrackingStatusFromString(const QString &text);
std::optional<DirTrackingStatus> DirTrackingStatusFromInt(const int value);

// Computes the next status of a directory from its stored record, if any,
// and the digest observed on disk, or nothing if the directory is gone.
// With no record and nothing on disk there is nothing to track, the result is Orphaned and is never stored.
DirTrackingStatus Classify(const std::optional<TrackedDigest> &prior, const std::optional<QByteArray> &observed_digest);

Q_DECLARE_METATYPE(DirTrackingStatus)

#endif  // DIRTRACKINGSTATUS_H
