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

#include <QObject>
#include <QSignalSpy>
#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QUrl>
#include <QDateTime>

#include "includes/scoped_ptr.h"
#include "includes/shared_ptr.h"
#include "core/memorydatabase.h"
#include "media/collection.h"
#include "media/mediasource.h"
#include "media/track.h"
#include "mediatracker/abortflag.h"
#include "mediatracker/mediatrackerbackend.h"
#include "mediatracker/directoryscanner.h"
#include "mediatracker/directorydigest.h"
#include "mediatracker/importorchestrator.h"
#include "mock_trackimporter.h"
#include "test_utils.h"

using namespace Qt::Literals::StringLiterals;
using std::make_unique;
using std::make_shared;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;

// clazy:excludeall=non-pod-global-static,returning-void-expression

namespace {

class ImportOrchestratorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_TRUE(tree_.is_valid());
    ASSERT_TRUE(tree_.WriteFile(u"a/x.mp3"_s, "Song X"));

    database_ = make_shared<MemoryDatabase>(nullptr);
    backend_ = make_unique<MediaTrackerBackend>();
    backend_->Init(database_);
    ASSERT_TRUE(backend_->AddCollection(tree_.url(), u"Test"_s, &collection_));

    scanner_ = make_unique<DirectoryScanner>(&*backend_);
    orchestrator_ = make_unique<ImportOrchestrator>(&*backend_, &importer_);

    ON_CALL(importer_, Import(_, _, _, _, _, _)).WillByDefault(Invoke(&FakeImport));
  }

  void TearDown() override {
    backend_->Close();
  }

  ScanOutcome Scan() {
    ScanOutcome outcome;
    const MediaTrackerResult result = scanner_->Scan(collection_, ScanParams(), abort_flag_, &outcome);
    EXPECT_TRUE(result.success()) << result.error_string();
    return outcome;
  }

  ImportOutcome Import(const SyncMode sync_mode = SyncMode::Modified, const QUrl &root_url = QUrl()) {
    ImportParams params;
    params.root_url = root_url;
    params.sync_mode = sync_mode;
    ImportOutcome outcome;
    const MediaTrackerResult result = orchestrator_->Import(collection_, params, abort_flag_, &outcome);
    EXPECT_TRUE(result.success()) << result.error_string();
    return outcome;
  }

  // Scan and import the initial tree.
  void ScanAndImport() {
    Scan();
    const ImportOutcome outcome = Import();
    ASSERT_EQ(1, outcome.tracks.created);
    ASSERT_TRUE(::testing::Mock::VerifyAndClearExpectations(&importer_));
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

  DirTrackingStatus StatusOf(const QString &content_path) {
    TrackedDirectory directory;
    EXPECT_TRUE(backend_->LoadDirectory(collection_.id, content_path, &directory));
    EXPECT_NE(-1, directory.id) << content_path;
    return directory.status;
  }

  TestDirectoryTree tree_;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  SharedPtr<Database> database_;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  ScopedPtr<MediaTrackerBackend> backend_;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  NiceMock<MockTrackImporter> importer_;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  ScopedPtr<DirectoryScanner> scanner_;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  ScopedPtr<ImportOrchestrator> orchestrator_;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  Collection collection_;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  AbortFlag abort_flag_;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
};

TEST_F(ImportOrchestratorTest, FirstImport) {

  const ScanOutcome scan_outcome = Scan();
  EXPECT_EQ(2, scan_outcome.directories.added);

  EXPECT_CALL(importer_, Import(QByteArray("Song X"), u"a/x.mp3"_s, ::testing::IsNull(), _, _, _));

  const ImportOutcome outcome = Import();
  EXPECT_EQ(Completion::Finished, outcome.completion);
  EXPECT_EQ(tree_.url(), outcome.root_url);
  EXPECT_EQ(1, outcome.tracks.created);
  EXPECT_EQ(1, outcome.tracks.total());
  EXPECT_EQ(2, outcome.directories.confirmed);
  EXPECT_EQ(0, outcome.directories.skipped);
  EXPECT_TRUE(outcome.issues.isEmpty());

  EXPECT_EQ(DirTrackingStatus::Current, StatusOf(QString()));
  EXPECT_EQ(DirTrackingStatus::Current, StatusOf(u"a/"_s));

  const Track track = LoadTrack(u"a/x.mp3"_s);
  ASSERT_TRUE(track.is_valid());
  EXPECT_FALSE(track.uid().isEmpty());
  EXPECT_EQ(1, track.revision());
  EXPECT_EQ(u"Song X"_s, track.title());
  EXPECT_EQ(DirectoryDigest::FileDigest("Song X"), track.media_source().digest);
  EXPECT_EQ(std::optional<qint64>(1), track.media_source().synchronized_rev);
  EXPECT_FALSE(track.media_source().content_type.isEmpty());
  EXPECT_FALSE(track.has_unsynchronized_changes());

}

TEST_F(ImportOrchestratorTest, NothingToDoAfterRescan) {

  ScanAndImport();

  const ScanOutcome scan_outcome = Scan();
  EXPECT_EQ(2, scan_outcome.directories.current);

  EXPECT_CALL(importer_, Import(_, _, _, _, _, _)).Times(0);

  const ImportOutcome outcome = Import();
  EXPECT_EQ(0, outcome.tracks.total());
  EXPECT_EQ(0, outcome.directories.confirmed);

}

TEST_F(ImportOrchestratorTest, TouchedFileIsUnchanged) {

  ScanAndImport();
  const Track before = LoadTrack(u"a/x.mp3"_s);

  ASSERT_TRUE(tree_.SetModificationTime(u"a/x.mp3"_s, QDateTime::fromSecsSinceEpoch(1600000000)));
  const ScanOutcome scan_outcome = Scan();
  EXPECT_EQ(1, scan_outcome.directories.modified);

  EXPECT_CALL(importer_, Import(_, _, _, _, _, _)).Times(0);

  const ImportOutcome outcome = Import();
  EXPECT_EQ(1, outcome.tracks.unchanged);
  EXPECT_EQ(1, outcome.tracks.total());
  EXPECT_EQ(1, outcome.directories.confirmed);
  EXPECT_EQ(DirTrackingStatus::Current, StatusOf(u"a/"_s));

  const Track after = LoadTrack(u"a/x.mp3"_s);
  EXPECT_EQ(before.uid(), after.uid());
  EXPECT_EQ(1, after.revision());

}

TEST_F(ImportOrchestratorTest, ModifiedFileIsUpdated) {

  ScanAndImport();
  const Track before = LoadTrack(u"a/x.mp3"_s);

  ASSERT_TRUE(tree_.WriteFile(u"a/x.mp3"_s, "Song X, remastered"));
  const ScanOutcome scan_outcome = Scan();
  EXPECT_EQ(1, scan_outcome.directories.modified);
  EXPECT_EQ(DirTrackingStatus::Modified, StatusOf(u"a/"_s));

  EXPECT_CALL(importer_, Import(QByteArray("Song X, remastered"), u"a/x.mp3"_s, ::testing::NotNull(), _, _, _));

  const ImportOutcome outcome = Import(SyncMode::Modified);
  EXPECT_EQ(1, outcome.tracks.updated);
  EXPECT_EQ(1, outcome.tracks.total());
  EXPECT_EQ(DirTrackingStatus::Current, StatusOf(u"a/"_s));

  const Track after = LoadTrack(u"a/x.mp3"_s);
  EXPECT_EQ(before.uid(), after.uid());
  EXPECT_EQ(before.id(), after.id());
  EXPECT_EQ(2, after.revision());
  EXPECT_EQ(u"Song X, remastered"_s, after.title());
  EXPECT_EQ(std::optional<qint64>(2), after.media_source().synchronized_rev);
  EXPECT_EQ(before.media_source().collected_at, after.media_source().collected_at);

}

TEST_F(ImportOrchestratorTest, SyncModeOnce) {

  ScanAndImport();

  ASSERT_TRUE(tree_.WriteFile(u"a/x.mp3"_s, "Song X, remastered"));
  Scan();

  EXPECT_CALL(importer_, Import(_, _, _, _, _, _)).Times(0);

  const ImportOutcome outcome = Import(SyncMode::Once);
  EXPECT_EQ(1, outcome.tracks.unchanged);
  EXPECT_EQ(DirTrackingStatus::Current, StatusOf(u"a/"_s));
  EXPECT_EQ(1, LoadTrack(u"a/x.mp3"_s).revision());

}

TEST_F(ImportOrchestratorTest, SyncModeAlways) {

  ScanAndImport();

  ASSERT_TRUE(tree_.SetModificationTime(u"a/x.mp3"_s, QDateTime::fromSecsSinceEpoch(1600000000)));
  Scan();

  EXPECT_CALL(importer_, Import(_, u"a/x.mp3"_s, _, _, _, _));

  const ImportOutcome outcome = Import(SyncMode::Always);
  EXPECT_EQ(1, outcome.tracks.updated);
  EXPECT_EQ(2, LoadTrack(u"a/x.mp3"_s).revision());

}

TEST_F(ImportOrchestratorTest, LocalEditsAreProtected) {

  ScanAndImport();

  Track track = LoadTrack(u"a/x.mp3"_s);
  track.set_title(u"My title"_s);
  Track edited_track;
  ASSERT_TRUE(backend_->UpdateTrack(track, &edited_track));
  ASSERT_EQ(2, edited_track.revision());

  ASSERT_TRUE(tree_.WriteFile(u"a/x.mp3"_s, "Song X, remastered"));
  Scan();

  EXPECT_CALL(importer_, Import(_, _, _, _, _, _)).Times(0);

  ImportOutcome outcome = Import(SyncMode::Modified);
  EXPECT_EQ(1, outcome.tracks.skipped);
  EXPECT_EQ(DirTrackingStatus::Outdated, StatusOf(u"a/"_s));
  EXPECT_EQ(u"My title"_s, LoadTrack(u"a/x.mp3"_s).title());

  ASSERT_TRUE(::testing::Mock::VerifyAndClearExpectations(&importer_));

  // The outdated directory is scheduled again
  const ScanOutcome scan_outcome = Scan();
  EXPECT_EQ(1, scan_outcome.directories.modified);

  outcome = Import(SyncMode::ModifiedResync);
  EXPECT_EQ(1, outcome.tracks.updated);
  EXPECT_EQ(DirTrackingStatus::Current, StatusOf(u"a/"_s));

  const Track resynced_track = LoadTrack(u"a/x.mp3"_s);
  EXPECT_EQ(3, resynced_track.revision());
  EXPECT_EQ(u"Song X, remastered"_s, resynced_track.title());
  EXPECT_FALSE(resynced_track.has_unsynchronized_changes());

}

TEST_F(ImportOrchestratorTest, FailedFile) {

  ASSERT_TRUE(tree_.WriteFile(u"a/y.mp3"_s, "bad data"));
  Scan();

  const ImportOutcome outcome = Import();
  EXPECT_EQ(1, outcome.tracks.created);
  EXPECT_EQ(1, outcome.tracks.failed);
  EXPECT_EQ(DirTrackingStatus::Outdated, StatusOf(u"a/"_s));

  ASSERT_EQ(1, outcome.issues.count());
  EXPECT_EQ(u"a/y.mp3"_s, outcome.issues.first().content_path);
  EXPECT_FALSE(outcome.issues.first().messages.isEmpty());

  EXPECT_FALSE(LoadTrack(u"a/y.mp3"_s).is_valid());
  EXPECT_TRUE(LoadTrack(u"a/x.mp3"_s).is_valid());

  // Fixed, imported by the next pass
  ASSERT_TRUE(tree_.WriteFile(u"a/y.mp3"_s, "Song Y"));
  Scan();
  const ImportOutcome retry_outcome = Import();
  EXPECT_EQ(1, retry_outcome.tracks.created);
  EXPECT_EQ(1, retry_outcome.tracks.unchanged);
  EXPECT_EQ(DirTrackingStatus::Current, StatusOf(u"a/"_s));

}

TEST_F(ImportOrchestratorTest, UnsupportedFile) {

  ASSERT_TRUE(tree_.WriteFile(u"a/cover.txt"_s, "not music"));
  Scan();

  EXPECT_CALL(importer_, Import(_, u"a/cover.txt"_s, _, _, _, _)).WillOnce(Return(TrackImporterResult(TrackImporterResult::ErrorCode::Unsupported)));
  EXPECT_CALL(importer_, Import(_, u"a/x.mp3"_s, _, _, _, _));

  const ImportOutcome outcome = Import();
  EXPECT_EQ(1, outcome.tracks.not_imported);
  EXPECT_EQ(1, outcome.tracks.created);
  EXPECT_TRUE(outcome.issues.isEmpty());
  EXPECT_EQ(DirTrackingStatus::Current, StatusOf(u"a/"_s));

  MediaSource media_source;
  ASSERT_TRUE(backend_->LoadMediaSourceByPath(collection_.id, u"a/cover.txt"_s, &media_source));
  EXPECT_FALSE(media_source.is_valid());

}

TEST_F(ImportOrchestratorTest, InvalidTrackIsNotCreated) {

  Scan();

  EXPECT_CALL(importer_, Import(_, _, _, _, _, _)).WillOnce(Invoke([](const QByteArray&, const QString&, const Track*, const ImportTrackConfig&, Track *track, QStringList*) {
    track->set_year(10000);
    return TrackImporterResult(TrackImporterResult::ErrorCode::Success);
  }));

  const ImportOutcome outcome = Import();
  EXPECT_EQ(1, outcome.tracks.not_created);
  EXPECT_EQ(0, outcome.tracks.created);
  EXPECT_EQ(DirTrackingStatus::Outdated, StatusOf(u"a/"_s));
  ASSERT_EQ(1, outcome.issues.count());
  EXPECT_EQ(u"a/x.mp3"_s, outcome.issues.first().content_path);
  EXPECT_FALSE(LoadTrack(u"a/x.mp3"_s).is_valid());

}

TEST_F(ImportOrchestratorTest, ImporterIssuesAreReported) {

  Scan();

  EXPECT_CALL(importer_, Import(_, _, _, _, _, _)).WillOnce(Invoke([](const QByteArray &data, const QString &content_path, const Track *existing, const ImportTrackConfig &config, Track *track, QStringList *issues) {
    *issues << u"Unknown frame"_s;
    return FakeImport(data, content_path, existing, config, track, issues);
  }));

  const ImportOutcome outcome = Import();
  EXPECT_EQ(1, outcome.tracks.created);
  ASSERT_EQ(1, outcome.issues.count());
  EXPECT_EQ(QStringList() << u"Unknown frame"_s, outcome.issues.first().messages);
  EXPECT_EQ(DirTrackingStatus::Current, StatusOf(u"a/"_s));

}

TEST_F(ImportOrchestratorTest, ImportConfigIsPassed) {

  Scan();

  ImportParams params;
  params.import_config.genres_as_tags = true;
  params.import_config.read_embedded_artwork = false;

  EXPECT_CALL(importer_, Import(_, _, _, ::testing::AllOf(::testing::Field(&ImportTrackConfig::genres_as_tags, true), ::testing::Field(&ImportTrackConfig::read_embedded_artwork, false)), _, _));

  ImportOutcome outcome;
  ASSERT_TRUE(orchestrator_->Import(collection_, params, abort_flag_, &outcome).success());
  EXPECT_EQ(1, outcome.tracks.created);

}

TEST_F(ImportOrchestratorTest, RemovedDirectoryIsUntracked) {

  Scan();
  ASSERT_TRUE(tree_.Remove(u"a"_s));

  EXPECT_CALL(importer_, Import(_, _, _, _, _, _)).Times(0);

  const ImportOutcome outcome = Import();
  EXPECT_EQ(1, outcome.directories.untracked);
  EXPECT_EQ(1, outcome.directories.confirmed);

  TrackedDirectory directory;
  ASSERT_TRUE(backend_->LoadDirectory(collection_.id, u"a/"_s, &directory));
  EXPECT_EQ(-1, directory.id);

}

TEST_F(ImportOrchestratorTest, Subtree) {

  ASSERT_TRUE(tree_.WriteFile(u"b/z.mp3"_s, "Song Z"));
  Scan();

  EXPECT_CALL(importer_, Import(_, u"a/x.mp3"_s, _, _, _, _));

  const ImportOutcome outcome = Import(SyncMode::Modified, tree_.url(u"a"_s));
  EXPECT_EQ(QUrl::fromLocalFile(tree_.path(u"a/"_s)), outcome.root_url);
  EXPECT_EQ(1, outcome.tracks.created);
  EXPECT_EQ(1, outcome.directories.confirmed);

  EXPECT_EQ(DirTrackingStatus::Current, StatusOf(u"a/"_s));
  EXPECT_EQ(DirTrackingStatus::Added, StatusOf(u"b/"_s));
  EXPECT_EQ(DirTrackingStatus::Added, StatusOf(QString()));

}

TEST_F(ImportOrchestratorTest, ChangedDuringImport) {

  Scan();

  // The directory changes after the importer read the file.
  EXPECT_CALL(importer_, Import(_, _, _, _, _, _)).WillOnce(Invoke([this](const QByteArray &data, const QString &content_path, const Track *existing, const ImportTrackConfig &config, Track *track, QStringList *issues) {
    EXPECT_TRUE(tree_.WriteFile(u"a/new.mp3"_s, "New"));
    ScanParams params;
    params.root_url = tree_.url(u"a"_s);
    ScanOutcome scan_outcome;
    EXPECT_TRUE(scanner_->Scan(collection_, params, abort_flag_, &scan_outcome).success());
    return FakeImport(data, content_path, existing, config, track, issues);
  }));

  const ImportOutcome outcome = Import();
  EXPECT_EQ(1, outcome.tracks.created);
  EXPECT_EQ(1, outcome.directories.skipped);
  EXPECT_EQ(1, outcome.directories.confirmed);
  EXPECT_EQ(DirTrackingStatus::Modified, StatusOf(u"a/"_s));
  EXPECT_TRUE(LoadTrack(u"a/x.mp3"_s).is_valid());

}

TEST_F(ImportOrchestratorTest, Progress) {

  Scan();

  QSignalSpy spy(&*orchestrator_, &ImportOrchestrator::Progress);
  Import();

  ASSERT_GE(spy.count(), 2);
  const ImportProgress progress = spy.last()[0].value<ImportProgress>();
  EXPECT_EQ(1, progress.tracks.created);
  EXPECT_EQ(2, progress.directories.confirmed);

}

TEST_F(ImportOrchestratorTest, Aborted) {

  Scan();
  abort_flag_.Abort();

  EXPECT_CALL(importer_, Import(_, _, _, _, _, _)).Times(0);

  const ImportOutcome outcome = Import();
  EXPECT_EQ(Completion::Aborted, outcome.completion);
  EXPECT_EQ(0, outcome.tracks.total());
  EXPECT_EQ(DirTrackingStatus::Added, StatusOf(u"a/"_s));

}

TEST_F(ImportOrchestratorTest, AbortedInsideDirectory) {

  ASSERT_TRUE(tree_.WriteFile(u"a/y.mp3"_s, "Song Y"));
  Scan();

  const QMetaObject::Connection connection = QObject::connect(&*orchestrator_, &ImportOrchestrator::Progress, &*orchestrator_, [this](const ImportProgress &progress) {
    if (progress.tracks.created > 0) abort_flag_.Abort();
  });

  EXPECT_CALL(importer_, Import(QByteArray("Song X"), u"a/x.mp3"_s, _, _, _, _));

  const ImportOutcome aborted = Import();
  EXPECT_EQ(Completion::Aborted, aborted.completion);
  EXPECT_EQ(0, aborted.tracks.total());
  EXPECT_EQ(DirTrackingStatus::Added, StatusOf(u"a/"_s));

  MediaSourceList media_sources;
  ASSERT_TRUE(backend_->LoadMediaSources(collection_.id, u"a/"_s, &media_sources));
  EXPECT_TRUE(media_sources.isEmpty());
  TrackList tracks;
  ASSERT_TRUE(backend_->LoadTracks(collection_.id, QString(), &tracks));
  EXPECT_TRUE(tracks.isEmpty());

  ASSERT_TRUE(::testing::Mock::VerifyAndClearExpectations(&importer_));
  QObject::disconnect(connection);
  abort_flag_.Reset();

  EXPECT_CALL(importer_, Import(QByteArray("Song X"), u"a/x.mp3"_s, ::testing::IsNull(), _, _, _)).Times(1);
  EXPECT_CALL(importer_, Import(QByteArray("Song Y"), u"a/y.mp3"_s, ::testing::IsNull(), _, _, _)).Times(1);

  const ImportOutcome outcome = Import();
  EXPECT_EQ(Completion::Finished, outcome.completion);
  EXPECT_EQ(2, outcome.tracks.created);
  EXPECT_EQ(DirTrackingStatus::Current, StatusOf(u"a/"_s));

  ASSERT_TRUE(backend_->LoadMediaSources(collection_.id, u"a/"_s, &media_sources));
  EXPECT_EQ(2, media_sources.count());
  ASSERT_TRUE(backend_->LoadTracks(collection_.id, QString(), &tracks));
  EXPECT_EQ(2, tracks.count());

}

TEST_F(ImportOrchestratorTest, InvalidRoot) {

  ImportParams params;
  params.root_url = QUrl(u"file:///somewhere/else"_s);
  ImportOutcome outcome;
  EXPECT_EQ(MediaTrackerResult::ErrorCode::InvalidInput, orchestrator_->Import(collection_, params, abort_flag_, &outcome).error_code);

  params.root_url = QUrl(u"http://example.com/"_s);
  EXPECT_EQ(MediaTrackerResult::ErrorCode::UnsupportedPath, orchestrator_->Import(collection_, params, abort_flag_, &outcome).error_code);

}

}  // namespace
