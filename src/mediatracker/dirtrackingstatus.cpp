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

#include "config.h"

#include <optional>

#include <QByteArray>
#include <QString>

#include "dirtrackingstatus.h"

using namespace Qt::Literals::StringLiterals;

bool IsStale(const DirTrackingStatus status) {

  switch (status) {
    case DirTrackingStatus::Outdated:
    case DirTrackingStatus::Added:
    case DirTrackingStatus::Modified:
      return true;
    case DirTrackingStatus::Current:
    case DirTrackingStatus::Orphaned:
      break;
  }

  return false;

}

bool IsPending(const DirTrackingStatus status) {

  return status == DirTrackingStatus::Added || status == DirTrackingStatus::Modified;

}

QString DirTrackingStatusToString(const DirTrackingStatus status) {

  switch (status) {
    case DirTrackingStatus::Current:
      return u"current"_s;
    case DirTrackingStatus::Outdated:
      return u"outdated"_s;
    case DirTrackingStatus::Added:
      return u"added"_s;
    case DirTrackingStatus::Modified:
      return u"modified"_s;
    case DirTrackingStatus::Orphaned:
      return u"orphaned"_s;
  }

  return QString();

}

std::optional<DirTrackingStatus> DirTrackingStatusFromString(const QString &text) {

  const QString status = text.trimmed().toLower();
  if (status == "current"_L1) return DirTrackingStatus::Current;
  if (status == "outdated"_L1) return DirTrackingStatus::Outdated;
  if (status == "added"_L1) return DirTrackingStatus::Added;
  if (status == "modified"_L1) return DirTrackingStatus::Modified;
  if (status == "orphaned"_L1) return DirTrackingStatus::Orphaned;

  return std::nullopt;

}

std::optional<DirTrackingStatus> DirTrackingStatusFromInt(const int value) {

  if (value < static_cast<int>(DirTrackingStatus::Current) || value > static_cast<int>(DirTrackingStatus::Orphaned)) {
    return std::nullopt;
  }

  return static_cast<DirTrackingStatus>(value);

}

DirTrackingStatus Classify(const std::optional<TrackedDigest> &prior, const std::optional<QByteArray> &observed_digest) {

  if (!observed_digest.has_value()) {
    return DirTrackingStatus::Orphaned;
  }

  if (!prior.has_value()) {
    return DirTrackingStatus::Added;
  }

  // Reappeared after it was gone, its old sources can't be trusted.
  if (prior->status == DirTrackingStatus::Orphaned) {
    return DirTrackingStatus::Added;
  }

  if (prior->digest != *observed_digest) {
    return DirTrackingStatus::Modified;
  }

  switch (prior->status) {
    case DirTrackingStatus::Added:
    case DirTrackingStatus::Modified:
      // Import work from an earlier scan is still outstanding.
      return prior->status;
    case DirTrackingStatus::Outdated:
      // The last import left work behind, schedule the directory again.
      return DirTrackingStatus::Modified;
    case DirTrackingStatus::Current:
    case DirTrackingStatus::Orphaned:
      break;
  }

  return DirTrackingStatus::Current;

}
