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

#include <QDebug>

#include "mediatrackeroutcomes.h"

int DirectoriesStatus::count(const DirTrackingStatus status) const {

  switch (status) {
    case DirTrackingStatus::Current:
      return current;
    case DirTrackingStatus::Outdated:
      return outdated;
    case DirTrackingStatus::Added:
      return added;
    case DirTrackingStatus::Modified:
      return modified;
    case DirTrackingStatus::Orphaned:
      return orphaned;
  }

  return 0;

}

void DirectoriesStatus::add(const DirTrackingStatus status, const int n) {

  switch (status) {
    case DirTrackingStatus::Current:
      current += n;
      break;
    case DirTrackingStatus::Outdated:
      outdated += n;
      break;
    case DirTrackingStatus::Added:
      added += n;
      break;
    case DirTrackingStatus::Modified:
      modified += n;
      break;
    case DirTrackingStatus::Orphaned:
      orphaned += n;
      break;
  }

}

bool DirectoriesStatus::operator==(const DirectoriesStatus &other) const {

  return current == other.current && outdated == other.outdated && added == other.added && modified == other.modified && orphaned == other.orphaned;

}

ImportTracksSummary &ImportTracksSummary::operator+=(const ImportTracksSummary &other) {

  created += other.created;
  updated += other.updated;
  unchanged += other.unchanged;
  skipped += other.skipped;
  failed += other.failed;
  not_imported += other.not_imported;
  not_created += other.not_created;
  not_updated += other.not_updated;

  return *this;

}

QDebug operator<<(QDebug dbg, const Completion completion) {

  QDebugStateSaver saver(dbg);
  dbg.nospace() << (completion == Completion::Finished ? "Finished" : "Aborted");

  return dbg;

}

QDebug operator<<(QDebug dbg, const DirectoriesStatus &status) {

  QDebugStateSaver saver(dbg);
  dbg.nospace() << "current=" << status.current
                << " outdated=" << status.outdated
                << " added=" << status.added
                << " modified=" << status.modified
                << " orphaned=" << status.orphaned;

  return dbg;

}

QDebug operator<<(QDebug dbg, const ScanOutcome &outcome) {

  QDebugStateSaver saver(dbg);
  dbg.nospace() << outcome.root_url.toString() << " " << outcome.completion << " "
                << static_cast<const DirectoriesStatus&>(outcome.directories)
                << " skipped=" << outcome.directories.skipped;

  return dbg;

}

QDebug operator<<(QDebug dbg, const ImportOutcome &outcome) {

  QDebugStateSaver saver(dbg);
  dbg.nospace() << outcome.root_url.toString() << " " << outcome.completion
                << " created=" << outcome.tracks.created
                << " updated=" << outcome.tracks.updated
                << " unchanged=" << outcome.tracks.unchanged
                << " skipped=" << outcome.tracks.skipped
                << " failed=" << outcome.tracks.failed
                << " not_imported=" << outcome.tracks.not_imported
                << " not_created=" << outcome.tracks.not_created
                << " not_updated=" << outcome.tracks.not_updated
                << " confirmed_directories=" << outcome.directories.confirmed
                << " skipped_directories=" << outcome.directories.skipped
                << " untracked_directories=" << outcome.directories.untracked;

  return dbg;

}

QDebug operator<<(QDebug dbg, const RelinkOutcome &outcome) {

  QDebugStateSaver saver(dbg);
  dbg.nospace() << outcome.root_url.toString() << " " << outcome.completion
                << " relinked=" << outcome.relinked.count()
                << " skipped=" << outcome.skipped;

  return dbg;

}
