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

#include <optional>

#include "gtest_include.h"

#include <QByteArray>
#include <QString>

#include "media/mediasource.h"
#include "mediatracker/syncmode.h"

using namespace Qt::Literals::StringLiterals;

namespace {

class SyncModeTest : public ::testing::Test {
 protected:
  void SetUp() override {
    source_.id = 1;
    source_.digest = QByteArrayLiteral("old");
    source_.synchronized_rev = 3;
  }

  MediaSource source_;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
};

TEST_F(SyncModeTest, NewFileIsAlwaysImported) {

  for (const SyncMode sync_mode : {SyncMode::Once, SyncMode::Modified, SyncMode::ModifiedResync, SyncMode::Always}) {
    EXPECT_EQ(ImportDecision::Import, DecideImport(sync_mode, nullptr, std::nullopt, QByteArrayLiteral("new"))) << SyncModeToString(sync_mode).toStdString();
  }

}

TEST_F(SyncModeTest, Once) {

  EXPECT_EQ(ImportDecision::SkipUnchanged, DecideImport(SyncMode::Once, &source_, 3, QByteArrayLiteral("old")));
  EXPECT_EQ(ImportDecision::SkipUnchanged, DecideImport(SyncMode::Once, &source_, 3, QByteArrayLiteral("new")));

}

TEST_F(SyncModeTest, Modified) {

  EXPECT_EQ(ImportDecision::SkipUnchanged, DecideImport(SyncMode::Modified, &source_, 3, QByteArrayLiteral("old")));
  EXPECT_EQ(ImportDecision::Import, DecideImport(SyncMode::Modified, &source_, 3, QByteArrayLiteral("new")));

  // Edited after the last import
  EXPECT_EQ(ImportDecision::SkipUnsynchronized, DecideImport(SyncMode::Modified, &source_, 4, QByteArrayLiteral("new")));
  EXPECT_EQ(ImportDecision::SkipUnchanged, DecideImport(SyncMode::Modified, &source_, 4, QByteArrayLiteral("old")));

  // Source without a track
  EXPECT_EQ(ImportDecision::Import, DecideImport(SyncMode::Modified, &source_, std::nullopt, QByteArrayLiteral("new")));

}

TEST_F(SyncModeTest, ModifiedResync) {

  EXPECT_EQ(ImportDecision::SkipUnchanged, DecideImport(SyncMode::ModifiedResync, &source_, 4, QByteArrayLiteral("old")));
  EXPECT_EQ(ImportDecision::Import, DecideImport(SyncMode::ModifiedResync, &source_, 4, QByteArrayLiteral("new")));

}

TEST_F(SyncModeTest, Always) {

  EXPECT_EQ(ImportDecision::Import, DecideImport(SyncMode::Always, &source_, 3, QByteArrayLiteral("old")));
  EXPECT_EQ(ImportDecision::Import, DecideImport(SyncMode::Always, &source_, 4, QByteArrayLiteral("old")));

}

TEST_F(SyncModeTest, NeverImportedSourceHasNoLocalEdits) {

  source_.synchronized_rev.reset();
  EXPECT_EQ(ImportDecision::Import, DecideImport(SyncMode::Modified, &source_, 7, QByteArrayLiteral("new")));

}

TEST(SyncModeStringTest, Conversion) {

  for (const SyncMode sync_mode : {SyncMode::Once, SyncMode::Modified, SyncMode::ModifiedResync, SyncMode::Always}) {
    EXPECT_EQ(sync_mode, SyncModeFromString(SyncModeToString(sync_mode)));
  }

  EXPECT_EQ(SyncMode::ModifiedResync, SyncModeFromString(u"MODIFIED_RESYNC"_s));
  EXPECT_EQ(SyncMode::Always, SyncModeFromString(u" always"_s));
  EXPECT_FALSE(SyncModeFromString(u"sometimes"_s).has_value());
  EXPECT_FALSE(SyncModeFromString(QString()).has_value());

}

}  // namespace
