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

#ifndef RELOCATEORCHESTRATOR_H
#define RELOCATEORCHESTRATOR_H

#include "config.h"

#include <QUrl>

#include "media/collection.h"
#include "mediatrackerresult.h"
#include "mediatrackeroutcomes.h"

class MediaTrackerBackendInterface;

// Moves the content paths of a subtree to another prefix of the same collection.
// Digests, track identities and revisions are kept.
class RelocateOrchestrator {
 public:
  explicit RelocateOrchestrator(MediaTrackerBackendInterface *backend);

  MediaTrackerResult Relocate(const Collection &collection, const QUrl &old_prefix_url, const QUrl &new_prefix_url, RelocateOutcome *outcome);

 private:
  MediaTrackerBackendInterface *backend_;

  Q_DISABLE_COPY(RelocateOrchestrator)
};

#endif  // RELOCATEORCHESTRATOR_H
