/*
 * Gooseberry
 * This file was part of Strawberry Music Player and Clementine.
 * Copyright 2010, David Sansome <me@davidsansome.com>
 * Copyright 2018-2021, Jonas Kvinge <jonas@jkvinge.net>
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

#include "metatypes.h"

#include <QMetaType>
#include <QList>
#include <QUrl>

#include "media/collection.h"
#include "media/mediasource.h"
#include "media/track.h"
#include "trackimporter/importtrackconfig.h"
#include "mediatracker/dirtrackingstatus.h"
#include "mediatracker/trackeddirectory.h"
#include "mediatracker/mediatrackeroutcomes.h"
#include "mediatracker/syncmode.h"
#include "mediatracker/directoryscanner.h"
#include "mediatracker/importorchestrator.h"

void RegisterMetaTypes() {

  qRegisterMetaType<const char*>("const char*");
  qRegisterMetaType<QList<int>>("QList<int>");
  qRegisterMetaType<QList<QUrl>>("QList<QUrl>");
  qRegisterMetaType<Collection>("Collection");
  qRegisterMetaType<CollectionList>("CollectionList");
  qRegisterMetaType<MediaSource>("MediaSource");
  qRegisterMetaType<MediaSourceList>("MediaSourceList");
  qRegisterMetaType<Track>("Track");
  qRegisterMetaType<TrackList>("TrackList");
  qRegisterMetaType<TrackedDirectory>("TrackedDirectory");
  qRegisterMetaType<TrackedDirectoryList>("TrackedDirectoryList");
  qRegisterMetaType<DirTrackingStatus>("DirTrackingStatus");
  qRegisterMetaType<SyncMode>("SyncMode");
  qRegisterMetaType<ImportTrackConfig>("ImportTrackConfig");
  qRegisterMetaType<Completion>("Completion");
  qRegisterMetaType<DirectoriesStatus>("DirectoriesStatus");
  qRegisterMetaType<ScanParams>("ScanParams");
  qRegisterMetaType<ScanOutcome>("ScanOutcome");
  qRegisterMetaType<ScanProgress>("ScanProgress");
  qRegisterMetaType<ImportParams>("ImportParams");
  qRegisterMetaType<ImportOutcome>("ImportOutcome");
  qRegisterMetaType<ImportProgress>("ImportProgress");
  qRegisterMetaType<UntrackOutcome>("UntrackOutcome");
  qRegisterMetaType<PurgeOutcome>("PurgeOutcome");
  qRegisterMetaType<RelocateOutcome>("RelocateOutcome");
  qRegisterMetaType<FindUntrackedOutcome>("FindUntrackedOutcome");
  qRegisterMetaType<RelinkOutcome>("RelinkOutcome");
  qRegisterMetaType<RelinkProgress>("RelinkProgress");

}
