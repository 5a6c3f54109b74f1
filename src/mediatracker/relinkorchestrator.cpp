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

#include <QObject>
#include <QHash>
#include <QByteArray>
#include <QString>
#include <QUrl>

#include "core/logging.h"
#include "media/track.h"
#include "media/vfscontentpathresolver.h"
#include "relinkorchestrator.h"
#include "abortflag.h"
#include "mediatrackerbackendinterfaces.h"

using namespace Qt::Literals::StringLiterals;

RelinkOrchestrator::RelinkOrchestrator(MediaTrackerBackendInterface *backend, QObject *parent)
    : QObject(parent),
      backend_(backend) {}

MediaTrackerResult RelinkOrchestrator::Relink(const Collection &collection, const QUrl &root_url, const AbortFlag &abort_flag, RelinkOutcome *outcome) {

  if (!collection.is_valid()) {
    return MediaTrackerResult(MediaTrackerResult::ErrorCode::InvalidInput, u"Invalid collection"_s);
  }

  const VfsContentPathResolver resolver(collection.root_url);
  QString root_path;
  const MediaTrackerResult resolve_result = resolver.UrlToDirectoryPath(root_url.isEmpty() ? collection.root_url : root_url, &root_path);
  if (!resolve_result.success()) {
    return resolve_result;
  }

  *outcome = RelinkOutcome();
  outcome->root_url = resolver.PathToUrl(root_path);

  TrackList lost_tracks;
  if (!backend_->LoadUntrackedTracks(collection.id, root_path, &lost_tracks)) {
    return MediaTrackerResult(MediaTrackerResult::ErrorCode::StorageError, u"Could not load untracked tracks"_s);
  }

  // Lost tracks with the same content can't be told apart.
  QHash<QByteArray, int> digest_counts;
  for (const Track &lost_track : std::as_const(lost_tracks)) {
    ++digest_counts[lost_track.media_source().digest];
  }

  RelinkProgress progress;
  progress.total = static_cast<int>(lost_tracks.count());

  for (const Track &lost_track : std::as_const(lost_tracks)) {
    if (abort_flag.abort_requested()) {
      outcome->completion = Completion::Aborted;
      break;
    }

    Q_EMIT Progress(progress);

    const QString &old_content_path = lost_track.media_source().content_path;

    TrackList candidates;
    if (!lost_track.media_source().digest.isEmpty() && digest_counts.value(lost_track.media_source().digest) == 1 && !backend_->LoadTrackedTracksByDigest(collection.id, lost_track.media_source().digest, &candidates)) {
      return MediaTrackerResult(MediaTrackerResult::ErrorCode::StorageError, u"Could not load successors of %1"_s.arg(old_content_path));
    }

    if (candidates.count() != 1) {
      if (candidates.isEmpty()) {
        qLog(Warning) << "No successor found for" << old_content_path;
      }
      else {
        qLog(Warning) << "Found" << candidates.count() << "potential successors for" << old_content_path;
      }
      ++progress.skipped;
      ++outcome->skipped;
      continue;
    }

    const Track &successor = candidates.first();
    Track relinked_track;
    if (!backend_->RelinkTrack(lost_track, successor, &relinked_track)) {
      return MediaTrackerResult(MediaTrackerResult::ErrorCode::StorageError, u"Could not relink %1"_s.arg(old_content_path));
    }

    qLog(Info) << "Relinked" << old_content_path << "to" << relinked_track.media_source().content_path;
    outcome->relinked << RelinkedMediaSource(old_content_path, relinked_track.media_source().content_path);
    ++progress.relinked;
  }

  Q_EMIT Progress(progress);

  qLog(Debug) << "Relink finished" << *outcome;

  return MediaTrackerResult();

}
