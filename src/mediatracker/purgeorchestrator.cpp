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

#include <QString>
#include <QUrl>

#include "core/logging.h"
#include "media/vfscontentpathresolver.h"
#include "purgeorchestrator.h"
#include "mediatrackerbackendinterfaces.h"

using namespace Qt::Literals::StringLiterals;

PurgeOrchestrator::PurgeOrchestrator(MediaSourceAccess *backend) : backend_(backend) {}

MediaTrackerResult PurgeOrchestrator::ResolveRoot(const Collection &collection, const QUrl &root_url, QString *root_path, PurgeOutcome *outcome) const {

  if (!collection.is_valid()) {
    return MediaTrackerResult(MediaTrackerResult::ErrorCode::InvalidInput, u"Invalid collection"_s);
  }

  const VfsContentPathResolver resolver(collection.root_url);
  const MediaTrackerResult result = resolver.UrlToDirectoryPath(root_url.isEmpty() ? collection.root_url : root_url, root_path);
  if (!result.success()) {
    return result;
  }

  *outcome = PurgeOutcome();
  outcome->root_url = resolver.PathToUrl(*root_path);

  return MediaTrackerResult();

}

MediaTrackerResult PurgeOrchestrator::PurgeOrphaned(const Collection &collection, const QUrl &root_url, PurgeOutcome *outcome) {

  QString root_path;
  const MediaTrackerResult result = ResolveRoot(collection, root_url, &root_path, outcome);
  if (!result.success()) return result;

  if (!backend_->PurgeOrphanedMediaSources(collection.id, root_path, outcome)) {
    return MediaTrackerResult(MediaTrackerResult::ErrorCode::StorageError, u"Could not purge orphaned media sources"_s);
  }

  qLog(Info) << "Purged" << outcome->purged_sources << "orphaned media sources and" << outcome->purged_tracks << "tracks under" << outcome->root_url;

  return MediaTrackerResult();

}

MediaTrackerResult PurgeOrchestrator::PurgeUntracked(const Collection &collection, const QUrl &root_url, PurgeOutcome *outcome) {

  QString root_path;
  const MediaTrackerResult result = ResolveRoot(collection, root_url, &root_path, outcome);
  if (!result.success()) return result;

  if (!backend_->PurgeUntrackedMediaSources(collection.id, root_path, outcome)) {
    return MediaTrackerResult(MediaTrackerResult::ErrorCode::StorageError, u"Could not purge untracked media sources"_s);
  }

  qLog(Info) << "Purged" << outcome->purged_sources << "untracked media sources and" << outcome->purged_tracks << "tracks under" << outcome->root_url;

  return MediaTrackerResult();

}
