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

#ifndef SYNCMODE_H
#define SYNCMODE_H

#include "config.h"

#include <optional>

#include <QMetaType>
#include <QByteArray>
#include <QString>

struct MediaSource;

// Controls when a changed file is imported again.
enum class SyncMode {
  // Only files without a media source
  Once,
  // Changed files whose track has no local edits
  Modified,
  // Changed files, local edits are overwritten
  ModifiedResync,
  // Every file of a pending directory
  Always
};

Q_DECLARE_METATYPE(SyncMode)

enum class ImportDecision {
  Import,
  SkipUnchanged,
  SkipUnsynchronized
};

QString SyncModeToString(const SyncMode sync_mode);
std::optional<SyncMode> SyncModeFromString(const QString &text);

// existing_source is null when the file has never been imported.
// track_revision is the current revision of the source's track, if there is one.
ImportDecision DecideImport(const SyncMode sync_mode, const MediaSource *existing_source, const std::optional<qint64> track_revision, const QByteArray &file_digest);

#endif  // SYNCMODE_H
