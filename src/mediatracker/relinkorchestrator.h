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

#ifndef RELINKORCHESTRATOR_H
#define RELINKORCHESTRATOR_H

#include "config.h"

#include <QObject>
#include <QUrl>

#include "media/collection.h"
#include "mediatrackerresult.h"
#include "mediatrackeroutcomes.h"

class MediaTrackerBackendInterface;
class AbortFlag;

// Finds tracks whose file was moved and moves them onto the source at the new location.
// A track is lost when its source is no longer tracked, its successor is the only tracked source with the same content digest.
// The lost track keeps its uid, the track that was created for the new location is deleted.
class RelinkOrchestrator : public QObject {
  Q_OBJECT

 public:
  explicit RelinkOrchestrator(MediaTrackerBackendInterface *backend, QObject *parent = nullptr);

  // Relinks the lost tracks under root_url, relinks committed before an abort stay committed.
  MediaTrackerResult Relink(const Collection &collection, const QUrl &root_url, const AbortFlag &abort_flag, RelinkOutcome *outcome);

 Q_SIGNALS:
  void Progress(const RelinkProgress &progress);

 private:
  MediaTrackerBackendInterface *backend_;

  Q_DISABLE_COPY(RelinkOrchestrator)
};

#endif  // RELINKORCHESTRATOR_H
