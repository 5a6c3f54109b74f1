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

#ifndef MEDIATRACKEROUTCOMES_H
#define MEDIATRACKEROUTCOMES_H

#include "config.h"

#include <QtGlobal>
#include <QMetaType>
#include <QList>
#include <QString>
#include <QStringList>
#include <QUrl>
#include <QDebug>

#include "dirtrackingstatus.h"

enum class Completion {
  Finished,
  Aborted
};

Q_DECLARE_METATYPE(Completion)

// Directory counts per tracking status.
struct DirectoriesStatus {
  DirectoriesStatus() : current(0), outdated(0), added(0), modified(0), orphaned(0) {}

  int count(const DirTrackingStatus status) const;
  void add(const DirTrackingStatus status, const int n = 1);
  int total() const { return current + outdated + added + modified + orphaned; }
  int pending() const { return added + modified; }

  bool operator==(const DirectoriesStatus &other) const;

  int current;
  int outdated;
  int added;
  int modified;
  int orphaned;
};

Q_DECLARE_METATYPE(DirectoriesStatus)

struct ScanDirectoriesSummary : public DirectoriesStatus {
  ScanDirectoriesSummary() : skipped(0) {}

  // Directories that could not be read
  int skipped;
};

struct ScanOutcome {
  ScanOutcome() : completion(Completion::Finished) {}

  QUrl root_url;
  Completion completion;
  ScanDirectoriesSummary directories;
};

Q_DECLARE_METATYPE(ScanOutcome)

struct ScanProgress {
  ScanProgress() : elapsed_msec(0), directories_finished(0), entries_finished(0) {}

  qint64 elapsed_msec;
  int directories_finished;
  int entries_finished;
};

Q_DECLARE_METATYPE(ScanProgress)

struct ImportTracksSummary {
  ImportTracksSummary() : created(0), updated(0), unchanged(0), skipped(0), failed(0), not_imported(0), not_created(0), not_updated(0) {}

  ImportTracksSummary &operator+=(const ImportTracksSummary &other);
  int total() const { return created + updated + unchanged + skipped + failed + not_imported + not_created + not_updated; }

  int created;
  int updated;
  int unchanged;
  // Local edits were protected
  int skipped;
  int failed;
  // Declined by the importer
  int not_imported;
  // Rejected by validation
  int not_created;
  int not_updated;
};

struct ImportDirectoriesSummary {
  ImportDirectoriesSummary() : confirmed(0), skipped(0), untracked(0) {}

  int confirmed;
  int skipped;
  int untracked;
};

struct ImportIssue {
  ImportIssue() = default;
  ImportIssue(const QString &_content_path, const QStringList &_messages) : content_path(_content_path), messages(_messages) {}

  QString content_path;
  QStringList messages;
};

using ImportIssueList = QList<ImportIssue>;

struct ImportOutcome {
  ImportOutcome() : completion(Completion::Finished) {}

  QUrl root_url;
  Completion completion;
  ImportTracksSummary tracks;
  ImportDirectoriesSummary directories;
  ImportIssueList issues;
};

Q_DECLARE_METATYPE(ImportOutcome)

struct ImportProgress {
  ImportProgress() : elapsed_msec(0) {}

  qint64 elapsed_msec;
  ImportTracksSummary tracks;
  ImportDirectoriesSummary directories;
};

Q_DECLARE_METATYPE(ImportProgress)

struct UntrackOutcome {
  UntrackOutcome() : untracked(0) {}

  QUrl root_url;
  int untracked;
};

Q_DECLARE_METATYPE(UntrackOutcome)

struct PurgeOutcome {
  PurgeOutcome() : purged_sources(0), purged_tracks(0), untracked(0) {}

  QUrl root_url;
  int purged_sources;
  int purged_tracks;
  // Tracking records removed together with the sources
  int untracked;
};

Q_DECLARE_METATYPE(PurgeOutcome)

struct RelocateOutcome {
  RelocateOutcome() : relocated_sources(0), relocated_directories(0) {}

  int relocated() const { return relocated_sources + relocated_directories; }

  QUrl old_prefix_url;
  QUrl new_prefix_url;
  int relocated_sources;
  int relocated_directories;
};

Q_DECLARE_METATYPE(RelocateOutcome)

// Files under the root that have no media source.
struct FindUntrackedOutcome {
  FindUntrackedOutcome() : completion(Completion::Finished) {}

  QUrl root_url;
  Completion completion;
  // Content paths, sorted
  QStringList content_paths;
};

Q_DECLARE_METATYPE(FindUntrackedOutcome)

struct RelinkedMediaSource {
  RelinkedMediaSource() {}
  RelinkedMediaSource(const QString &_old_content_path, const QString &_new_content_path) : old_content_path(_old_content_path), new_content_path(_new_content_path) {}

  QString old_content_path;
  QString new_content_path;
};

using RelinkedMediaSourceList = QList<RelinkedMediaSource>;

struct RelinkProgress {
  RelinkProgress() : total(0), relinked(0), skipped(0) {}

  int finished() const { return relinked + skipped; }
  int remaining() const { return total - finished(); }

  int total;
  int relinked;
  int skipped;
};

Q_DECLARE_METATYPE(RelinkProgress)

struct RelinkOutcome {
  RelinkOutcome() : completion(Completion::Finished), skipped(0) {}

  QUrl root_url;
  Completion completion;
  RelinkedMediaSourceList relinked;
  // Tracks without a unique successor
  int skipped;
};

Q_DECLARE_METATYPE(RelinkOutcome)

QDebug operator<<(QDebug dbg, const Completion completion);
QDebug operator<<(QDebug dbg, const DirectoriesStatus &status);
QDebug operator<<(QDebug dbg, const ScanOutcome &outcome);
QDebug operator<<(QDebug dbg, const ImportOutcome &outcome);
QDebug operator<<(QDebug dbg, const RelinkOutcome &outcome);

#endif  // MEDIATRACKEROUTCOMES_H
