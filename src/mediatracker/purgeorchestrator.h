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

#ifndef PURGEORCHESTRATOR_H
#define PURGEORCHESTRATOR_H

#include "config.h"

#include <QString>
#include <QUrl>

#include "media/collection.h"
#include "mediatrackerresult.h"
#include "mediatrackeroutcomes.h"

class MediaSourceAccess;

// Deletes media sources and their tracks that are no longer backed by a tracked directory.
class PurgeOrchestrator {
 public:
  explicit PurgeOrchestrator(MediaSourceAccess *backend);

  // Sources found in directories that a scan marked as orphaned, the directories are untracked as well.
  MediaTrackerResult PurgeOrphaned(const Collection &collection, const QUrl &root_url, PurgeOutcome *outcome);

  // Sources that are not linked to any tracked directory, typically after an untrack.
  MediaTrackerResult PurgeUntracked(const Collection &collection, const QUrl &root_url, PurgeOutcome *outcome);

 private:
  MediaTrackerResult ResolveRoot(const Collection &collection, const QUrl &root_url, QString *root_path, PurgeOutcome *outcome) const;

  MediaSourceAccess *backend_;

  Q_DISABLE_COPY(PurgeOrchestrator)
};

#endif  // PURGEORCHESTRATOR_H
