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

#ifndef MEDIATRACKERSETTINGS_H
#define MEDIATRACKERSETTINGS_H

namespace MediaTrackerSettings {

constexpr char kSettingsGroup[] = "MediaTracker";

constexpr char kDatabase[] = "database";
constexpr char kScanBatchSize[] = "scan_batch_size";
constexpr char kMaxDepth[] = "max_depth";
constexpr char kSyncMode[] = "sync_mode";

constexpr int kScanBatchSizeDefault = 16;
constexpr int kMaxDepthDefault = -1;
constexpr char kSyncModeDefault[] = "modified";

}  // namespace

#endif  // MEDIATRACKERSETTINGS_H
