/**
 * Copyright (c) 2024 Peking University and Peking University
 * Changsha Institute for Computing and Digital Economy
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as
 * published by the Free Software Foundation, either version 3 of the
 * License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#include "CacheResyncer.h"

#include <gtest/gtest.h>

#include "SharedTestImpl/GlobalDefs.h"

TEST(CacheResyncer, CallsResyncPeriodically) {
  absl::Mutex mtx;
  int count = 0;

  Nrt::CacheResyncer resyncer(
      [&] {
        absl::MutexLock lock(&mtx);
        count++;
      },
      absl::Milliseconds(10));
  resyncer.Start();

  mtx.Lock();
  bool reached = mtx.AwaitWithTimeout(
      absl::Condition(+[](int* arg) -> bool { return *arg >= 3; }, &count),
      absl::Seconds(10));
  mtx.Unlock();
  EXPECT_TRUE(reached);

  resyncer.Stop();

  int count_after_stop;
  {
    absl::MutexLock lock(&mtx);
    count_after_stop = count;
  }
  absl::SleepFor(absl::Milliseconds(50));

  absl::MutexLock lock(&mtx);
  EXPECT_EQ(count, count_after_stop);
}

TEST(CacheResyncer, StopsPromptly) {
  std::atomic_int count{0};

  Nrt::CacheResyncer resyncer([&] { count++; }, absl::Hours(1));
  resyncer.Start();

  absl::Time start = absl::Now();
  resyncer.Stop();
  EXPECT_LT(absl::Now() - start, absl::Seconds(5));
  EXPECT_EQ(count.load(), 0);

  // Stopping twice is fine.
  resyncer.Stop();
}

TEST(CacheResyncer, StopsOnDestruction) {
  std::atomic_int count{0};
  {
    Nrt::CacheResyncer resyncer([&] { count++; }, absl::Hours(1));
    resyncer.Start();
  }
  EXPECT_EQ(count.load(), 0);
}
