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

#include <QString>
#include <QUrl>

#include "core/logging.h"
#include "media/vfscontentpathresolver.h"
#include "untrackorchestrator.h"
#include "mediatrackerbackendinterfaces.h"

using namespace Qt::Literals::StringLiterals;

UntrackOrchestrator::UntrackOrchestrator(DirectoryTrackingAccess *backend) : backend_(backend) {}

MediaTrackerResult UntrackOrchestrator::Untrack(const Collection &collection, const QUrl &root_url, const std::optional<DirTrackingStatus> status, UntrackOutcome *outcome) {

  if (!collection.is_valid()) {
    return MediaTrackerResult(MediaTrackerResult::ErrorCode::InvalidInput, u"Invalid collection"_s);
  }

  const VfsContentPathResolver resolver(collection.root_url);
  QString root_path;
  const MediaTrackerResult resolve_result = resolver.UrlToDirectoryPath(root_url.isEmpty() ? collection.root_url : root_url, &root_path);
  if (!resolve_result.success()) {
    return resolve_result;
  }

  *outcome = UntrackOutcome();
  outcome->root_url = resolver.PathToUrl(root_path);

  if (!backend_->UntrackDirectories(collection.id, root_path, status, &outcome->untracked)) {
    return MediaTrackerResult(MediaTrackerResult::ErrorCode::StorageError, u"Could not untrack %1"_s.arg(outcome->root_url.toString()));
  }

  if (status.has_value()) {
    qLog(Debug) << "Untracked" << outcome->untracked << DirTrackingStatusToString(*status) << "directories under" << outcome->root_url;
  }
  else {
    qLog(Debug) << "Untracked" << outcome->untracked << "directories under" << outcome->root_url;
  }

  return MediaTrackerResult();

}
