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

#ifndef UNTRACKEDFILEFINDER_H
#define UNTRACKEDFILEFINDER_H

#include "config.h"

#include <QObject>

#include "media/collection.h"
#include "mediatrackerresult.h"
#include "mediatrackeroutcomes.h"
#include "directoryscanner.h"

class MediaSourceAccess;
class AbortFlag;

// Walks a directory tree and reports the files that have no media source.
// Nothing is stored.
class UntrackedFileFinder : public QObject {
  Q_OBJECT

 public:
  explicit UntrackedFileFinder(MediaSourceAccess *backend, QObject *parent = nullptr);

  MediaTrackerResult Find(const Collection &collection, const ScanParams &params, const AbortFlag &abort_flag, FindUntrackedOutcome *outcome);

 Q_SIGNALS:
  void Progress(const ScanProgress &progress);

 private:
  MediaSourceAccess *backend_;

  Q_DISABLE_COPY(UntrackedFileFinder)
};

#endif  // UNTRACKEDFILEFINDER_H
