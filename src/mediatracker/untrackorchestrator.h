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

#ifndef UNTRACKORCHESTRATOR_H
#define UNTRACKORCHESTRATOR_H

#include "config.h"

#include <optional>

#include <QUrl>

#include "media/collection.h"
#include "mediatrackerresult.h"
#include "mediatrackeroutcomes.h"
#include "dirtrackingstatus.h"

class DirectoryTrackingAccess;

// Forgets the tracking records under a root. Media sources and tracks are kept.
class UntrackOrchestrator {
 public:
  explicit UntrackOrchestrator(DirectoryTrackingAccess *backend);

  MediaTrackerResult Untrack(const Collection &collection, const QUrl &root_url, const std::optional<DirTrackingStatus> status, UntrackOutcome *outcome);

 private:
  DirectoryTrackingAccess *backend_;

  Q_DISABLE_COPY(UntrackOrchestrator)
};

#endif  // UNTRACKORCHESTRATOR_H
