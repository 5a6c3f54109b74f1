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

#include "gtest_include.h"

#include <QFile>
#include <QSignalSpy>
#include <QByteArray>
#include <QString>
#include <QUrl>
#include <QDateTime>

#include "includes/scoped_ptr.h"
#include "includes/shared_ptr.h"
#include "core/memorydatabase.h"
#include "media/collection.h"
#include "mediatracker/abortflag.h"
#include "mediatracker/mediatrackerbackend.h"
#include "mediatracker/directoryscanner.h"
#include "mediatracker/importeddirectory.h"
#include "test_utils.h"

using namespace Qt::Literals::StringLiterals;
using std::make_unique;
using std::make_shared;

// clazy:excludeall=non-pod-global-static,returning-void-expression

namespace {

class DirectoryScannerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_TRUE(tree_.is_valid());
    ASSERT_TRUE(tree_.WriteFile(u"x.mp3"_s, "x"));
    ASSERT_TRUE(tree_.WriteFile(u"d1/a.mp3"_s, "a"));
    ASSERT_TRUE(tree_.WriteFile(u"d2/b.mp3"_s, "b"));
    ASSERT_TRUE(tree_.MakeDirectory(u"d2/sub"_s));

    database_ = make_shared<MemoryDatabase>(nullptr);
    backend_ = make_unique<MediaTrackerBackend>();
    backend_->Init(database_);
    ASSERT_TRUE(backend_->AddCollection(tree_.url(), u"Test"_s, &collection_));

    scanner_ = make_unique<DirectoryScanner>(&*backend_);
  }

  void TearDown() override {
    backend_->Close();
  }

  ScanOutcome Scan(const QUrl &root_url = QUrl(), const int max_depth = -1) {
    ScanParams params;
    params.root_url = root_url;
    params.max_depth = max_depth;
    ScanOutcome outcome;
    const MediaTrackerResult result = scanner_->Scan(collection_, params, abort_flag_, &outcome);
    EXPECT_TRUE(result.success()) << result.error_string();
    return outcome;
  }

  // Stands in for an import that finds nothing to do.
  void MarkPendingCurrent() {
    TrackedDirectoryList directories;
    ASSERT_TRUE(backend_->LoadPendingDirectories(collection_.id, QString(), 0, 100, &directories));
    for (const TrackedDirectory &directory : std::as_const(directories)) {
      ImportedDirectory imported;
      imported.collection_id = collection_.id;
      imported.content_path = directory.content_path;
      imported.digest = directory.digest;
      imported.status = DirTrackingStatus::Current;
      bool confirmed = false;
      ASSERT_TRUE(backend_->CommitImportedDirectory(imported, &confirmed));
      ASSERT_TRUE(confirmed);
    }
  }

  DirTrackingStatus StatusOf(const QString &content_path) {
    TrackedDirectory directory;
    EXPECT_TRUE(backend_->LoadDirectory(collection_.id, content_path, &directory));
    EXPECT_NE(-1, directory.id) << content_path;
    return directory.status;
  }

  bool IsTracked(const QString &content_path) {
    TrackedDirectory directory;
    EXPECT_TRUE(backend_->LoadDirectory(collection_.id, content_path, &directory));
    return directory.id != -1;
  }

  TestDirectoryTree tree_;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  SharedPtr<Database> database_;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  ScopedPtr<MediaTrackerBackend> backend_;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  ScopedPtr<DirectoryScanner> scanner_;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  Collection collection_;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  AbortFlag abort_flag_;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
};

TEST_F(DirectoryScannerTest, FirstScan) {

  const ScanOutcome outcome = Scan();

  EXPECT_EQ(Completion::Finished, outcome.completion);
  EXPECT_EQ(tree_.url(), outcome.root_url);
  EXPECT_EQ(4, outcome.directories.added);
  EXPECT_EQ(4, outcome.directories.total());
  EXPECT_EQ(0, outcome.directories.skipped);

  EXPECT_EQ(DirTrackingStatus::Added, StatusOf(QString()));
  EXPECT_EQ(DirTrackingStatus::Added, StatusOf(u"d1/"_s));
  EXPECT_EQ(DirTrackingStatus::Added, StatusOf(u"d2/"_s));
  EXPECT_EQ(DirTrackingStatus::Added, StatusOf(u"d2/sub/"_s));

}

TEST_F(DirectoryScannerTest, RescanWithoutChanges) {

  Scan();

  // Nothing was imported yet, the work is still pending.
  ScanOutcome outcome = Scan();
  EXPECT_EQ(4, outcome.directories.added);

  MarkPendingCurrent();

  outcome = Scan();
  EXPECT_EQ(4, outcome.directories.current);
  EXPECT_EQ(4, outcome.directories.total());

}

TEST_F(DirectoryScannerTest, ModifiedFile) {

  Scan();
  MarkPendingCurrent();

  ASSERT_TRUE(tree_.WriteFile(u"d1/a.mp3"_s, "a longer file"));

  const ScanOutcome outcome = Scan();
  EXPECT_EQ(1, outcome.directories.modified);
  EXPECT_EQ(3, outcome.directories.current);
  EXPECT_EQ(DirTrackingStatus::Modified, StatusOf(u"d1/"_s));
  EXPECT_EQ(DirTrackingStatus::Current, StatusOf(QString()));

}

TEST_F(DirectoryScannerTest, TouchedFile) {

  Scan();
  MarkPendingCurrent();

  ASSERT_TRUE(tree_.SetModificationTime(u"x.mp3"_s, QDateTime::fromSecsSinceEpoch(1600000000)));

  const ScanOutcome outcome = Scan();
  EXPECT_EQ(1, outcome.directories.modified);
  EXPECT_EQ(DirTrackingStatus::Modified, StatusOf(QString()));
  EXPECT_EQ(DirTrackingStatus::Current, StatusOf(u"d1/"_s));

}

TEST_F(DirectoryScannerTest, NewDirectory) {

  Scan();
  MarkPendingCurrent();

  ASSERT_TRUE(tree_.WriteFile(u"d3/c.mp3"_s, "c"));

  const ScanOutcome outcome = Scan();
  EXPECT_EQ(1, outcome.directories.added);
  EXPECT_EQ(DirTrackingStatus::Added, StatusOf(u"d3/"_s));
  // The root listing changed as well
  EXPECT_EQ(DirTrackingStatus::Modified, StatusOf(QString()));

}

TEST_F(DirectoryScannerTest, RemovedDirectory) {

  Scan();
  MarkPendingCurrent();

  ASSERT_TRUE(tree_.Remove(u"d2"_s));

  ScanOutcome outcome = Scan();
  EXPECT_EQ(2, outcome.directories.orphaned);
  EXPECT_EQ(DirTrackingStatus::Orphaned, StatusOf(u"d2/"_s));
  EXPECT_EQ(DirTrackingStatus::Orphaned, StatusOf(u"d2/sub/"_s));
  EXPECT_EQ(DirTrackingStatus::Current, StatusOf(u"d1/"_s));

  // Recreated
  ASSERT_TRUE(tree_.MakeDirectory(u"d2"_s));
  outcome = Scan();
  EXPECT_EQ(DirTrackingStatus::Added, StatusOf(u"d2/"_s));
  EXPECT_EQ(DirTrackingStatus::Orphaned, StatusOf(u"d2/sub/"_s));

}

TEST_F(DirectoryScannerTest, MaxDepth) {

  ScanOutcome outcome = Scan(QUrl(), 0);
  EXPECT_EQ(1, outcome.directories.added);
  EXPECT_EQ(1, outcome.directories.total());
  EXPECT_FALSE(IsTracked(u"d1/"_s));

  outcome = Scan(QUrl(), 1);
  EXPECT_EQ(3, outcome.directories.total());
  EXPECT_FALSE(IsTracked(u"d2/sub/"_s));

}

TEST_F(DirectoryScannerTest, MaxDepthDoesNotOrphanDeeperDirectories) {

  Scan();

  const ScanOutcome outcome = Scan(QUrl(), 1);
  EXPECT_EQ(0, outcome.directories.orphaned);
  EXPECT_EQ(DirTrackingStatus::Added, StatusOf(u"d2/sub/"_s));

}

TEST_F(DirectoryScannerTest, Subtree) {

  Scan();
  MarkPendingCurrent();

  ASSERT_TRUE(tree_.Remove(u"d1"_s));
  ASSERT_TRUE(tree_.WriteFile(u"d2/b.mp3"_s, "changed"));

  const ScanOutcome outcome = Scan(tree_.url(u"d2"_s));
  EXPECT_EQ(QUrl::fromLocalFile(tree_.path(u"d2/"_s)), outcome.root_url);
  EXPECT_EQ(2, outcome.directories.total());
  EXPECT_EQ(1, outcome.directories.current);
  EXPECT_EQ(1, outcome.directories.modified);

  // Outside of the subtree, not looked at
  EXPECT_EQ(DirTrackingStatus::Current, StatusOf(u"d1/"_s));

}

TEST_F(DirectoryScannerTest, SymbolicLinkLoop) {

  ASSERT_TRUE(QFile::link(tree_.path(), tree_.path(u"d1/loop"_s)));

  const ScanOutcome outcome = Scan();
  EXPECT_EQ(Completion::Finished, outcome.completion);
  EXPECT_EQ(4, outcome.directories.total());
  EXPECT_FALSE(IsTracked(u"d1/loop/"_s));

}

TEST_F(DirectoryScannerTest, SymbolicLinkInsideCollectionIsNotFollowed) {

  Scan();
  MarkPendingCurrent();

  // Sorts before the real directory.
  ASSERT_TRUE(QFile::link(tree_.path(u"d1"_s), tree_.path(u"alias"_s)));

  const ScanOutcome outcome = Scan();
  EXPECT_EQ(Completion::Finished, outcome.completion);
  EXPECT_EQ(0, outcome.directories.orphaned);
  EXPECT_EQ(1, outcome.directories.modified);
  EXPECT_EQ(DirTrackingStatus::Current, StatusOf(u"d1/"_s));
  EXPECT_FALSE(IsTracked(u"alias/"_s));

  const ScanOutcome rescan = Scan();
  EXPECT_EQ(0, rescan.directories.orphaned);
  EXPECT_EQ(DirTrackingStatus::Current, StatusOf(u"d1/"_s));

}

TEST_F(DirectoryScannerTest, SymbolicLinkOutsideCollectionIsFollowed) {

  TestDirectoryTree outside;
  ASSERT_TRUE(outside.is_valid());
  ASSERT_TRUE(outside.WriteFile(u"c.mp3"_s, "c"));
  ASSERT_TRUE(QFile::link(outside.path(), tree_.path(u"external"_s)));

  const ScanOutcome outcome = Scan();
  EXPECT_EQ(5, outcome.directories.total());
  EXPECT_EQ(DirTrackingStatus::Added, StatusOf(u"external/"_s));

}

TEST_F(DirectoryScannerTest, SmallBatches) {

  scanner_->set_batch_size(1);
  EXPECT_EQ(1, scanner_->batch_size());

  Scan();
  MarkPendingCurrent();
  ASSERT_TRUE(tree_.Remove(u"d2/sub"_s));

  const ScanOutcome outcome = Scan();
  EXPECT_EQ(1, outcome.directories.orphaned);
  EXPECT_EQ(1, outcome.directories.modified);
  EXPECT_EQ(2, outcome.directories.current);

}

TEST_F(DirectoryScannerTest, Progress) {

  QSignalSpy spy(&*scanner_, &DirectoryScanner::Progress);
  Scan();

  ASSERT_EQ(4, spy.count());
  const ScanProgress progress = spy.last()[0].value<ScanProgress>();
  EXPECT_EQ(4, progress.directories_finished);
  EXPECT_EQ(6, progress.entries_finished);

}

TEST_F(DirectoryScannerTest, Aborted) {

  abort_flag_.Abort();

  const ScanOutcome outcome = Scan();
  EXPECT_EQ(Completion::Aborted, outcome.completion);
  EXPECT_EQ(0, outcome.directories.total());
  EXPECT_FALSE(IsTracked(QString()));

}

TEST_F(DirectoryScannerTest, AbortedScanDoesNotOrphan) {

  Scan();
  ASSERT_TRUE(tree_.Remove(u"d2"_s));

  abort_flag_.Abort();
  const ScanOutcome outcome = Scan();
  EXPECT_EQ(Completion::Aborted, outcome.completion);
  EXPECT_EQ(DirTrackingStatus::Added, StatusOf(u"d2/"_s));

}

TEST_F(DirectoryScannerTest, InvalidRequests) {

  ScanOutcome outcome;
  ScanParams params;

  params.root_url = QUrl(u"file:///somewhere/else"_s);
  EXPECT_EQ(MediaTrackerResult::ErrorCode::InvalidInput, scanner_->Scan(collection_, params, abort_flag_, &outcome).error_code);

  params.root_url = tree_.url(u"missing"_s);
  EXPECT_EQ(MediaTrackerResult::ErrorCode::IoError, scanner_->Scan(collection_, params, abort_flag_, &outcome).error_code);

  params.root_url = QUrl();
  params.max_depth = -2;
  EXPECT_EQ(MediaTrackerResult::ErrorCode::InvalidInput, scanner_->Scan(collection_, params, abort_flag_, &outcome).error_code);

  EXPECT_EQ(MediaTrackerResult::ErrorCode::InvalidInput, scanner_->Scan(Collection(), ScanParams(), abort_flag_, &outcome).error_code);

}

}  // namespace
