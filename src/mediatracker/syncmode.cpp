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

#include <QByteArray>
#include <QString>

#include "media/mediasource.h"
#include "syncmode.h"

using namespace Qt::Literals::StringLiterals;

QString SyncModeToString(const SyncMode sync_mode) {

  switch (sync_mode) {
    case SyncMode::Once:
      return u"once"_s;
    case SyncMode::Modified:
      return u"modified"_s;
    case SyncMode::ModifiedResync:
      return u"modified-resync"_s;
    case SyncMode::Always:
      return u"always"_s;
  }

  return QString();

}

std::optional<SyncMode> SyncModeFromString(const QString &text) {

  const QString sync_mode = text.trimmed().toLower().replace(u'_', u'-');
  if (sync_mode == "once"_L1) return SyncMode::Once;
  if (sync_mode == "modified"_L1) return SyncMode::Modified;
  if (sync_mode == "modified-resync"_L1) return SyncMode::ModifiedResync;
  if (sync_mode == "always"_L1) return SyncMode::Always;

  return std::nullopt;

}

ImportDecision DecideImport(const SyncMode sync_mode, const MediaSource *existing_source, const std::optional<qint64> track_revision, const QByteArray &file_digest) {

  if (!existing_source) {
    return ImportDecision::Import;
  }

  switch (sync_mode) {
    case SyncMode::Once:
      return ImportDecision::SkipUnchanged;
    case SyncMode::Modified:
      if (existing_source->digest == file_digest) {
        return ImportDecision::SkipUnchanged;
      }
      // A track revision ahead of the last import means somebody edited the track.
      if (track_revision.has_value() && existing_source->synchronized_rev.has_value() && *track_revision != *existing_source->synchronized_rev) {
        return ImportDecision::SkipUnsynchronized;
      }
      return ImportDecision::Import;
    case SyncMode::ModifiedResync:
      if (existing_source->digest == file_digest) {
        return ImportDecision::SkipUnchanged;
      }
      return ImportDecision::Import;
    case SyncMode::Always:
      return ImportDecision::Import;
  }

  return ImportDecision::Import;

}
