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

#include <memory>
#include <optional>

#include "gtest_include.h"
#include "gmock_include.h"

#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QUrl>
#include <QFileInfo>
#include <QSignalSpy>

#include "includes/scoped_ptr.h"
#include "includes/shared_ptr.h"
#include "core/memorydatabase.h"
#include "media/collection.h"
#include "media/mediasource.h"
#include "media/track.h"
#include "mediatracker/abortflag.h"
#include "mediatracker/mediatrackerbackend.h"
#include "mediatracker/directoryscanner.h"
#include "mediatracker/importorchestrator.h"
#include "mediatracker/untrackorchestrator.h"
#include "mediatracker/purgeorchestrator.h"
#include "mediatracker/relocateorchestrator.h"
#include "mediatracker/untrackedfilefinder.h"
#include "mediatracker/relinkorchestrator.h"
#include "mock_trackimporter.h"
#include "test_utils.h"

using namespace Qt::Literals::StringLiterals;
using std::make_unique;
using std::make_shared;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;

// clazy:excludeall=non-pod-global-static,returning-void-expression

namespace {

class MaintenanceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_TRUE(tree_.is_valid());
    ASSERT_TRUE(tree_.WriteFile(u"a/x.mp3"_s, "Song X"));
    ASSERT_TRUE(tree_.WriteFile(u"b/y.mp3"_s, "Song Y"));

    database_ = make_shared<MemoryDatabase>(nullptr);
    backend_ = make_unique<MediaTrackerBackend>();
    backend_->Init(database_);
    ASSERT_TRUE(backend_->AddCollection(tree_.url(), u"Test"_s, &collection_));

    ON_CALL(importer_, Import(_, _, _, _, _, _)).WillByDefault(Invoke(&FakeImport));

    scanner_ = make_unique<DirectoryScanner>(&*backend_);
    import_orchestrator_ = make_unique<ImportOrchestrator>(&*backend_, &importer_);
    untrack_orchestrator_ = make_unique<UntrackOrchestrator>(&*backend_);
    purge_orchestrator_ = make_unique<PurgeOrchestrator>(&*backend_);
    relocate_orchestrator_ = make_unique<RelocateOrchestrator>(&*backend_);
    untracked_file_finder_ = make_unique<UntrackedFileFinder>(&*backend_);
    relink_orchestrator_ = make_unique<RelinkOrchestrator>(&*backend_);

    ScanAndImport();
    ASSERT_EQ(2, TrackCount());
  }

  void TearDown() override {
    backend_->Close();
  }

  ImportOutcome ScanAndImport() {
    ScanOutcome scan_outcome;
    EXPECT_TRUE(scanner_->Scan(collection_, ScanParams(), abort_flag_, &scan_outcome).success());
    ImportOutcome import_outcome;
    EXPECT_TRUE(import_orchestrator_->Import(collection_, ImportParams(), abort_flag_, &import_outcome).success());
    return import_outcome;
  }

  int TrackCount() {
    TrackList tracks;
    EXPECT_TRUE(backend_->LoadTracks(collection_.id, QString(), &tracks));
    return static_cast<int>(tracks.count());
  }

  Track LoadTrack(const QString &content_path) {
    MediaSource media_source;
    EXPECT_TRUE(backend_->LoadMediaSourceByPath(collection_.id, content_path, &media_source));
    Track track;
    if (media_source.is_valid()) {
      EXPECT_TRUE(backend_->LoadTrackBySourceId(media_source.id, &track));
    }
    return track;
  }

  // Moves a file and lets the tracker see the move.
  void MoveFile(const QString &old_relative_path, const QString &new_relative_path) {
    ASSERT_TRUE(tree_.MakeDirectory(QFileInfo(new_relative_path).path()));
    ASSERT_TRUE(tree_.Rename(old_relative_path, new_relative_path));
    ScanAndImport();
  }

  RelinkOutcome Relink() {
    RelinkOutcome outcome;
    const MediaTrackerResult result = relink_orchestrator_->Relink(collection_, QUrl(), abort_flag_, &outcome);
    EXPECT_TRUE(result.success()) << result.error_string();
    return outcome;
  }

  TrackedDirectory LoadDirectory(const QString &content_path) {
    TrackedDirectory directory;
    EXPECT_TRUE(backend_->LoadDirectory(collection_.id, content_path, &directory));
    return directory;
  }

  TestDirectoryTree tree_;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  SharedPtr<Database> database_;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  ScopedPtr<MediaTrackerBackend> backend_;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  NiceMock<MockTrackImporter> importer_;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  ScopedPtr<DirectoryScanner> scanner_;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  ScopedPtr<ImportOrchestrator> import_orchestrator_;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  ScopedPtr<UntrackOrchestrator> untrack_orchestrator_;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  ScopedPtr<PurgeOrchestrator> purge_orchestrator_;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  ScopedPtr<RelocateOrchestrator> relocate_orchestrator_;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  ScopedPtr<UntrackedFileFinder> untracked_file_finder_;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  ScopedPtr<RelinkOrchestrator> relink_orchestrator_;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  Collection collection_;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  AbortFlag abort_flag_;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
};

TEST_F(MaintenanceTest, UntrackKeepsTracks) {

  UntrackOutcome outcome;
  const MediaTrackerResult result = untrack_orchestrator_->Untrack(collection_, tree_.url(u"a"_s), std::nullopt, &outcome);
  ASSERT_TRUE(result.success()) << result.error_string();
  EXPECT_EQ(QUrl::fromLocalFile(tree_.path(u"a/"_s)), outcome.root_url);
  EXPECT_EQ(1, outcome.untracked);

  EXPECT_EQ(-1, LoadDirectory(u"a/"_s).id);
  EXPECT_NE(-1, LoadDirectory(u"b/"_s).id);
  EXPECT_EQ(2, TrackCount());

  MediaSourceList untracked;
  ASSERT_TRUE(backend_->LoadUntrackedMediaSources(collection_.id, QString(), &untracked));
  ASSERT_EQ(1, untracked.count());
  EXPECT_EQ(u"a/x.mp3"_s, untracked.first().content_path);

}

TEST_F(MaintenanceTest, UntrackByStatus) {

  UntrackOutcome outcome;
  ASSERT_TRUE(untrack_orchestrator_->Untrack(collection_, QUrl(), DirTrackingStatus::Added, &outcome).success());
  EXPECT_EQ(0, outcome.untracked);

  ASSERT_TRUE(untrack_orchestrator_->Untrack(collection_, QUrl(), DirTrackingStatus::Current, &outcome).success());
  EXPECT_EQ(3, outcome.untracked);
  EXPECT_EQ(tree_.url(), outcome.root_url);

}

TEST_F(MaintenanceTest, UntrackedDirectoryIsAddedAgain) {

  UntrackOutcome untrack_outcome;
  ASSERT_TRUE(untrack_orchestrator_->Untrack(collection_, tree_.url(u"a"_s), std::nullopt, &untrack_outcome).success());

  const Track before = LoadTrack(u"a/x.mp3"_s);

  // The source is found again, the track keeps its identity.
  const ImportOutcome outcome = ScanAndImport();
  EXPECT_EQ(1, outcome.tracks.unchanged);
  EXPECT_EQ(DirTrackingStatus::Current, LoadDirectory(u"a/"_s).status);
  EXPECT_EQ(before.uid(), LoadTrack(u"a/x.mp3"_s).uid());

  MediaSourceList untracked;
  ASSERT_TRUE(backend_->LoadUntrackedMediaSources(collection_.id, QString(), &untracked));
  EXPECT_TRUE(untracked.isEmpty());

}

TEST_F(MaintenanceTest, PurgeUntracked) {

  PurgeOutcome outcome;
  ASSERT_TRUE(purge_orchestrator_->PurgeUntracked(collection_, QUrl(), &outcome).success());
  EXPECT_EQ(0, outcome.purged_sources);
  EXPECT_EQ(0, outcome.purged_tracks);

  UntrackOutcome untrack_outcome;
  ASSERT_TRUE(untrack_orchestrator_->Untrack(collection_, tree_.url(u"a"_s), std::nullopt, &untrack_outcome).success());

  // Outside of the untracked directory
  ASSERT_TRUE(purge_orchestrator_->PurgeUntracked(collection_, tree_.url(u"b"_s), &outcome).success());
  EXPECT_EQ(0, outcome.purged_sources);

  ASSERT_TRUE(purge_orchestrator_->PurgeUntracked(collection_, QUrl(), &outcome).success());
  EXPECT_EQ(tree_.url(), outcome.root_url);
  EXPECT_EQ(1, outcome.purged_sources);
  EXPECT_EQ(1, outcome.purged_tracks);

  EXPECT_EQ(1, TrackCount());
  EXPECT_FALSE(LoadTrack(u"a/x.mp3"_s).is_valid());
  EXPECT_TRUE(LoadTrack(u"b/y.mp3"_s).is_valid());

}

TEST_F(MaintenanceTest, PurgeOrphaned) {

  ASSERT_TRUE(tree_.Remove(u"b"_s));
  ScanOutcome scan_outcome;
  ASSERT_TRUE(scanner_->Scan(collection_, ScanParams(), abort_flag_, &scan_outcome).success());
  ASSERT_EQ(1, scan_outcome.directories.orphaned);

  PurgeOutcome outcome;
  ASSERT_TRUE(purge_orchestrator_->PurgeOrphaned(collection_, tree_.url(u"a"_s), &outcome).success());
  EXPECT_EQ(0, outcome.purged_sources);
  EXPECT_EQ(0, outcome.untracked);

  ASSERT_TRUE(purge_orchestrator_->PurgeOrphaned(collection_, QUrl(), &outcome).success());
  EXPECT_EQ(1, outcome.purged_sources);
  EXPECT_EQ(1, outcome.purged_tracks);
  EXPECT_EQ(1, outcome.untracked);

  EXPECT_EQ(-1, LoadDirectory(u"b/"_s).id);
  EXPECT_EQ(1, TrackCount());
  EXPECT_TRUE(LoadTrack(u"a/x.mp3"_s).is_valid());

  // Nothing left to purge
  ASSERT_TRUE(purge_orchestrator_->PurgeOrphaned(collection_, QUrl(), &outcome).success());
  EXPECT_EQ(0, outcome.purged_sources);

}

TEST_F(MaintenanceTest, Relocate) {

  const Track before = LoadTrack(u"a/x.mp3"_s);
  const TrackedDirectory directory_before = LoadDirectory(u"a/"_s);

  ASSERT_TRUE(tree_.Rename(u"a"_s, u"c"_s));

  RelocateOutcome outcome;
  const MediaTrackerResult result = relocate_orchestrator_->Relocate(collection_, tree_.url(u"a"_s), tree_.url(u"c"_s), &outcome);
  ASSERT_TRUE(result.success()) << result.error_string();
  EXPECT_EQ(1, outcome.relocated_sources);
  EXPECT_EQ(1, outcome.relocated_directories);
  EXPECT_EQ(2, outcome.relocated());
  EXPECT_EQ(QUrl::fromLocalFile(tree_.path(u"a/"_s)), outcome.old_prefix_url);
  EXPECT_EQ(QUrl::fromLocalFile(tree_.path(u"c/"_s)), outcome.new_prefix_url);

  EXPECT_FALSE(LoadTrack(u"a/x.mp3"_s).is_valid());
  const Track after = LoadTrack(u"c/x.mp3"_s);
  ASSERT_TRUE(after.is_valid());
  EXPECT_EQ(before.uid(), after.uid());
  EXPECT_EQ(before.revision(), after.revision());
  EXPECT_EQ(before.media_source().digest, after.media_source().digest);

  EXPECT_EQ(-1, LoadDirectory(u"a/"_s).id);
  const TrackedDirectory directory_after = LoadDirectory(u"c/"_s);
  EXPECT_EQ(directory_before.digest, directory_after.digest);
  EXPECT_EQ(DirTrackingStatus::Current, directory_after.status);

  // Only the parent listing changed, no file is imported again.
  EXPECT_CALL(importer_, Import(_, _, _, _, _, _)).Times(0);
  const ImportOutcome import_outcome = ScanAndImport();
  EXPECT_EQ(0, import_outcome.tracks.total());
  EXPECT_EQ(DirTrackingStatus::Current, LoadDirectory(u"c/"_s).status);

}

TEST_F(MaintenanceTest, RelocateNestedDirectories) {

  ASSERT_TRUE(tree_.WriteFile(u"a/deep/z.mp3"_s, "Song Z"));
  ScanAndImport();
  ASSERT_EQ(3, TrackCount());

  RelocateOutcome outcome;
  ASSERT_TRUE(relocate_orchestrator_->Relocate(collection_, tree_.url(u"a"_s), tree_.url(u"moved/a"_s), &outcome).success());
  EXPECT_EQ(2, outcome.relocated_sources);
  EXPECT_EQ(2, outcome.relocated_directories);

  EXPECT_TRUE(LoadTrack(u"moved/a/deep/z.mp3"_s).is_valid());
  EXPECT_NE(-1, LoadDirectory(u"moved/a/deep/"_s).id);
  EXPECT_TRUE(LoadTrack(u"b/y.mp3"_s).is_valid());

}

TEST_F(MaintenanceTest, RelocateRejectsInvalidPrefixes) {

  RelocateOutcome outcome;

  // In use
  EXPECT_EQ(MediaTrackerResult::ErrorCode::InvalidInput, relocate_orchestrator_->Relocate(collection_, tree_.url(u"a"_s), tree_.url(u"b"_s), &outcome).error_code);
  // Overlapping
  EXPECT_EQ(MediaTrackerResult::ErrorCode::InvalidInput, relocate_orchestrator_->Relocate(collection_, tree_.url(u"a"_s), tree_.url(u"a/sub"_s), &outcome).error_code);
  EXPECT_EQ(MediaTrackerResult::ErrorCode::InvalidInput, relocate_orchestrator_->Relocate(collection_, tree_.url(u"a/sub"_s), tree_.url(u"a"_s), &outcome).error_code);
  // Collection root
  EXPECT_EQ(MediaTrackerResult::ErrorCode::InvalidInput, relocate_orchestrator_->Relocate(collection_, tree_.url(), tree_.url(u"c"_s), &outcome).error_code);
  // Outside of the collection
  EXPECT_EQ(MediaTrackerResult::ErrorCode::InvalidInput, relocate_orchestrator_->Relocate(collection_, tree_.url(u"a"_s), QUrl(u"file:///somewhere/else"_s), &outcome).error_code);

  // Nothing changed
  EXPECT_TRUE(LoadTrack(u"a/x.mp3"_s).is_valid());
  EXPECT_TRUE(LoadTrack(u"b/y.mp3"_s).is_valid());

}

TEST_F(MaintenanceTest, FindUntrackedFiles) {

  ASSERT_TRUE(tree_.WriteFile(u"a/new.mp3"_s, "New"));
  ASSERT_TRUE(tree_.WriteFile(u"c/z.mp3"_s, "Song Z"));
  ASSERT_TRUE(tree_.WriteFile(u"c/d/w.mp3"_s, "Song W"));

  QSignalSpy spy(&*untracked_file_finder_, &UntrackedFileFinder::Progress);

  FindUntrackedOutcome outcome;
  MediaTrackerResult result = untracked_file_finder_->Find(collection_, ScanParams(), abort_flag_, &outcome);
  ASSERT_TRUE(result.success()) << result.error_string();
  EXPECT_EQ(Completion::Finished, outcome.completion);
  EXPECT_EQ(tree_.url(), outcome.root_url);
  EXPECT_EQ(QStringList() << u"a/new.mp3"_s << u"c/d/w.mp3"_s << u"c/z.mp3"_s, outcome.content_paths);
  // Root, a, b, c and c/d
  EXPECT_EQ(5, spy.count());

  // Nothing is stored
  EXPECT_EQ(2, TrackCount());
  EXPECT_EQ(-1, LoadDirectory(u"c/"_s).id);

  ScanParams params;
  params.root_url = tree_.url(u"c"_s);
  params.max_depth = 0;
  result = untracked_file_finder_->Find(collection_, params, abort_flag_, &outcome);
  ASSERT_TRUE(result.success()) << result.error_string();
  EXPECT_EQ(QStringList() << u"c/z.mp3"_s, outcome.content_paths);

  params.root_url = tree_.url(u"b"_s);
  params.max_depth = -1;
  ASSERT_TRUE(untracked_file_finder_->Find(collection_, params, abort_flag_, &outcome).success());
  EXPECT_TRUE(outcome.content_paths.isEmpty());

}

TEST_F(MaintenanceTest, FindUntrackedFilesAborted) {

  ASSERT_TRUE(tree_.WriteFile(u"c/z.mp3"_s, "Song Z"));
  abort_flag_.Abort();

  FindUntrackedOutcome outcome;
  ASSERT_TRUE(untracked_file_finder_->Find(collection_, ScanParams(), abort_flag_, &outcome).success());
  EXPECT_EQ(Completion::Aborted, outcome.completion);
  EXPECT_TRUE(outcome.content_paths.isEmpty());

}

TEST_F(MaintenanceTest, FindUntrackedFilesInvalidRequests) {

  FindUntrackedOutcome outcome;
  EXPECT_EQ(MediaTrackerResult::ErrorCode::InvalidInput, untracked_file_finder_->Find(Collection(), ScanParams(), abort_flag_, &outcome).error_code);

  ScanParams params;
  params.max_depth = -2;
  EXPECT_EQ(MediaTrackerResult::ErrorCode::InvalidInput, untracked_file_finder_->Find(collection_, params, abort_flag_, &outcome).error_code);

  params.max_depth = -1;
  params.root_url = tree_.url(u"missing"_s);
  EXPECT_EQ(MediaTrackerResult::ErrorCode::IoError, untracked_file_finder_->Find(collection_, params, abort_flag_, &outcome).error_code);

}

TEST_F(MaintenanceTest, RelinkMovedTrack) {

  const Track before = LoadTrack(u"a/x.mp3"_s);
  ASSERT_TRUE(before.is_valid());

  MoveFile(u"a/x.mp3"_s, u"c/x.mp3"_s);

  // The old track lost its source, the import created a new one for the new location
  TrackList lost_tracks;
  ASSERT_TRUE(backend_->LoadUntrackedTracks(collection_.id, QString(), &lost_tracks));
  ASSERT_EQ(1, lost_tracks.count());
  EXPECT_EQ(before.uid(), lost_tracks.first().uid());
  const Track duplicate = LoadTrack(u"c/x.mp3"_s);
  ASSERT_TRUE(duplicate.is_valid());
  EXPECT_NE(before.uid(), duplicate.uid());
  EXPECT_EQ(3, TrackCount());

  QSignalSpy spy(&*relink_orchestrator_, &RelinkOrchestrator::Progress);

  const RelinkOutcome outcome = Relink();
  EXPECT_EQ(Completion::Finished, outcome.completion);
  EXPECT_EQ(0, outcome.skipped);
  ASSERT_EQ(1, outcome.relinked.count());
  EXPECT_EQ(u"a/x.mp3"_s, outcome.relinked.first().old_content_path);
  EXPECT_EQ(u"c/x.mp3"_s, outcome.relinked.first().new_content_path);

  ASSERT_GE(spy.count(), 2);
  const RelinkProgress progress = spy.last()[0].value<RelinkProgress>();
  EXPECT_EQ(1, progress.total);
  EXPECT_EQ(1, progress.relinked);
  EXPECT_EQ(0, progress.remaining());

  const Track after = LoadTrack(u"c/x.mp3"_s);
  ASSERT_TRUE(after.is_valid());
  EXPECT_EQ(before.id(), after.id());
  EXPECT_EQ(before.uid(), after.uid());
  EXPECT_EQ(before.revision() + 1, after.revision());
  EXPECT_EQ(u"Song X"_s, after.title());
  EXPECT_EQ(before.media_source().collected_at, after.media_source().collected_at);
  EXPECT_FALSE(after.has_unsynchronized_changes());

  Track removed;
  ASSERT_TRUE(backend_->LoadTrackByUid(duplicate.uid(), &removed));
  EXPECT_FALSE(removed.is_valid());

  MediaSource old_source;
  ASSERT_TRUE(backend_->LoadMediaSourceByPath(collection_.id, u"a/x.mp3"_s, &old_source));
  EXPECT_FALSE(old_source.is_valid());
  EXPECT_EQ(2, TrackCount());

  // Nothing left to relink
  const RelinkOutcome again = Relink();
  EXPECT_TRUE(again.relinked.isEmpty());
  EXPECT_EQ(0, again.skipped);

}

TEST_F(MaintenanceTest, RelinkWithoutSuccessor) {

  ASSERT_TRUE(tree_.Remove(u"a/x.mp3"_s));
  ScanAndImport();

  const RelinkOutcome outcome = Relink();
  EXPECT_TRUE(outcome.relinked.isEmpty());
  EXPECT_EQ(1, outcome.skipped);

  // Still there, purge-untracked deletes it
  EXPECT_TRUE(LoadTrack(u"a/x.mp3"_s).is_valid());
  EXPECT_EQ(2, TrackCount());

}

TEST_F(MaintenanceTest, RelinkAmbiguousSuccessors) {

  const Track before = LoadTrack(u"a/x.mp3"_s);

  ASSERT_TRUE(tree_.WriteFile(u"d/x.mp3"_s, "Song X"));
  MoveFile(u"a/x.mp3"_s, u"c/x.mp3"_s);
  EXPECT_EQ(4, TrackCount());

  const RelinkOutcome outcome = Relink();
  EXPECT_TRUE(outcome.relinked.isEmpty());
  EXPECT_EQ(1, outcome.skipped);

  Track lost;
  ASSERT_TRUE(backend_->LoadTrackByUid(before.uid(), &lost));
  EXPECT_EQ(u"a/x.mp3"_s, lost.media_source().content_path);
  EXPECT_EQ(4, TrackCount());

}

TEST_F(MaintenanceTest, RelinkAborted) {

  MoveFile(u"a/x.mp3"_s, u"c/x.mp3"_s);
  abort_flag_.Abort();

  const RelinkOutcome outcome = Relink();
  EXPECT_EQ(Completion::Aborted, outcome.completion);
  EXPECT_TRUE(outcome.relinked.isEmpty());
  EXPECT_EQ(3, TrackCount());

}

TEST_F(MaintenanceTest, InvalidCollection) {

  UntrackOutcome untrack_outcome;
  EXPECT_EQ(MediaTrackerResult::ErrorCode::InvalidInput, untrack_orchestrator_->Untrack(Collection(), QUrl(), std::nullopt, &untrack_outcome).error_code);

  PurgeOutcome purge_outcome;
  EXPECT_EQ(MediaTrackerResult::ErrorCode::InvalidInput, purge_orchestrator_->PurgeOrphaned(Collection(), QUrl(), &purge_outcome).error_code);
  EXPECT_EQ(MediaTrackerResult::ErrorCode::InvalidInput, purge_orchestrator_->PurgeUntracked(Collection(), QUrl(), &purge_outcome).error_code);

  RelinkOutcome relink_outcome;
  EXPECT_EQ(MediaTrackerResult::ErrorCode::InvalidInput, relink_orchestrator_->Relink(Collection(), QUrl(), abort_flag_, &relink_outcome).error_code);

}

}  // namespace
