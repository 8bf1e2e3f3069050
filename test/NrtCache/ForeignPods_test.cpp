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

#include "ForeignPods.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "SharedTestImpl/FakeClients.h"
#include "SharedTestImpl/GlobalDefs.h"

using Nrt::ForeignPodsDetectMode;
using Nrt::ForeignPodsDetector;
using TestUtil::kGiB;
using TestUtil::MakeGuaranteedPod;
using TestUtil::MakePod;
using ::testing::_;

namespace {

const std::vector<std::string> kProfiles{"topo-aware-scheduler",
                                         "topo-aware-scheduler-2"};

}  // namespace

TEST(ForeignPods, IsForeignPod) {
  TestUtil::MockNrtCache cache;
  ForeignPodsDetector detector(ForeignPodsDetectMode::kAll, kProfiles, &cache);

  EXPECT_FALSE(detector.IsForeignPod(
      MakePod("default", "ours", "n1", 1000, kGiB, "topo-aware-scheduler")));
  EXPECT_FALSE(detector.IsForeignPod(
      MakePod("default", "ours2", "n1", 1000, kGiB, "topo-aware-scheduler-2")));
  EXPECT_TRUE(detector.IsForeignPod(
      MakePod("default", "theirs", "n1", 1000, kGiB, "default-scheduler")));

  // Not bound yet.
  EXPECT_FALSE(detector.IsForeignPod(
      MakePod("default", "unbound", "", 1000, kGiB, "default-scheduler")));
}

TEST(ForeignPods, OnlyExclusiveResources) {
  TestUtil::MockNrtCache cache;
  ForeignPodsDetector detector(ForeignPodsDetectMode::kOnlyExclusiveResources,
                               kProfiles, &cache);

  EXPECT_FALSE(detector.IsForeignPod(
      MakePod("default", "burstable", "n1", 2000, kGiB, "default-scheduler")));
  EXPECT_TRUE(detector.IsForeignPod(MakeGuaranteedPod(
      "default", "pinned", "n1", 2000, kGiB, "default-scheduler")));
}

TEST(ForeignPods, NoneDisablesDetection) {
  TestUtil::MockNrtCache cache;
  EXPECT_CALL(cache, NodeHasForeignPods(_, _)).Times(0);

  ForeignPodsDetector detector(ForeignPodsDetectMode::kNone, kProfiles, &cache);
  auto pod =
      MakePod("default", "theirs", "n1", 1000, kGiB, "default-scheduler");

  EXPECT_FALSE(detector.IsForeignPod(pod));
  detector.OnPodAdd(pod);
  detector.OnPodUpdate(pod, pod);
  detector.OnPodDelete(pod);
}

TEST(ForeignPods, EventsMarkNodes) {
  TestUtil::MockNrtCache cache;
  ForeignPodsDetector detector(ForeignPodsDetectMode::kAll, kProfiles, &cache);

  auto theirs =
      MakePod("default", "theirs", "n1", 1000, kGiB, "default-scheduler");
  auto moved = theirs;
  moved.set_node_name("n2");
  auto ours = MakePod("default", "ours", "n3", 1000, kGiB);

  EXPECT_CALL(cache, NodeHasForeignPods("n1", _)).Times(2);
  EXPECT_CALL(cache, NodeHasForeignPods("n2", _)).Times(1);
  EXPECT_CALL(cache, NodeHasForeignPods("n3", _)).Times(0);

  detector.OnPodAdd(theirs);
  detector.OnPodUpdate(theirs, moved);
  detector.OnPodDelete(theirs);

  detector.OnPodAdd(ours);
  detector.OnPodDelete(ours);
}
