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
#include "relocateorchestrator.h"
#include "mediatrackerbackendinterfaces.h"

using namespace Qt::Literals::StringLiterals;

RelocateOrchestrator::RelocateOrchestrator(MediaTrackerBackendInterface *backend) : backend_(backend) {}

MediaTrackerResult RelocateOrchestrator::Relocate(const Collection &collection, const QUrl &old_prefix_url, const QUrl &new_prefix_url, RelocateOutcome *outcome) {

  if (!collection.is_valid()) {
    return MediaTrackerResult(MediaTrackerResult::ErrorCode::InvalidInput, u"Invalid collection"_s);
  }

  const VfsContentPathResolver resolver(collection.root_url);

  QString old_prefix;
  MediaTrackerResult result = resolver.UrlToDirectoryPath(old_prefix_url, &old_prefix);
  if (!result.success()) return result;

  QString new_prefix;
  result = resolver.UrlToDirectoryPath(new_prefix_url, &new_prefix);
  if (!result.success()) return result;

  // The collection root itself is moved by changing the collection.
  if (old_prefix.isEmpty() || new_prefix.isEmpty()) {
    return MediaTrackerResult(MediaTrackerResult::ErrorCode::InvalidInput, u"The collection root can't be relocated"_s);
  }
  if (old_prefix.startsWith(new_prefix) || new_prefix.startsWith(old_prefix)) {
    return MediaTrackerResult(MediaTrackerResult::ErrorCode::InvalidInput, u"%1 and %2 overlap"_s.arg(old_prefix, new_prefix));
  }

  int existing_sources = 0;
  int existing_directories = 0;
  if (!backend_->CountMediaSourcesWithPrefix(collection.id, new_prefix, &existing_sources) || !backend_->CountDirectoriesWithPrefix(collection.id, new_prefix, &existing_directories)) {
    return MediaTrackerResult(MediaTrackerResult::ErrorCode::StorageError, u"Could not check %1"_s.arg(new_prefix));
  }
  if (existing_sources > 0 || existing_directories > 0) {
    return MediaTrackerResult(MediaTrackerResult::ErrorCode::InvalidInput, u"%1 is already in use"_s.arg(new_prefix));
  }

  *outcome = RelocateOutcome();
  outcome->old_prefix_url = resolver.PathToUrl(old_prefix);
  outcome->new_prefix_url = resolver.PathToUrl(new_prefix);

  if (!backend_->RelocateContentPaths(collection.id, old_prefix, new_prefix, outcome)) {
    return MediaTrackerResult(MediaTrackerResult::ErrorCode::StorageError, u"Could not relocate %1"_s.arg(old_prefix));
  }

  qLog(Info) << "Relocated" << outcome->relocated_sources << "media sources and" << outcome->relocated_directories << "directories from" << old_prefix << "to" << new_prefix;

  return MediaTrackerResult();

}
