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

#include "gtest_include.h"

#include <QFuture>
#include <QtConcurrentRun>

#include "includes/mutex_protected.h"
#include "mediatracker/abortflag.h"

// clazy:excludeall=non-pod-global-static,returning-void-expression

namespace {

TEST(MutexProtectedTest, Value) {

  mutex_protected<int> value(0);
  EXPECT_EQ(0, value.value());
  EXPECT_TRUE(value == 0);

  value = 5;
  EXPECT_EQ(5, value.value());
  EXPECT_TRUE(value != 0);

  EXPECT_EQ(5, value.exchange(7));
  EXPECT_EQ(7, value.value());

}

TEST(AbortFlagTest, AbortAndReset) {

  AbortFlag abort_flag;
  EXPECT_FALSE(abort_flag.abort_requested());

  abort_flag.Abort();
  EXPECT_TRUE(abort_flag.abort_requested());
  abort_flag.Abort();
  EXPECT_TRUE(abort_flag.abort_requested());

  abort_flag.Reset();
  EXPECT_FALSE(abort_flag.abort_requested());

}

TEST(AbortFlagTest, AbortFromAnotherThread) {

  AbortFlag abort_flag;
  mutex_protected<bool> started(false);

  QFuture<int> future = QtConcurrent::run([&abort_flag, &started]() {
    int iterations = 0;
    started = true;
    while (!abort_flag.abort_requested()) {
      ++iterations;
    }
    return iterations;
  });

  while (!started.value()) {}
  abort_flag.Abort();

  future.waitForFinished();
  EXPECT_GE(future.result(), 0);
  EXPECT_TRUE(abort_flag.abort_requested());

}

}  // namespace
