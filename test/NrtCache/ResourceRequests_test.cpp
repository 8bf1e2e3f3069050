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

#include "ResourceRequests.h"

#include <gtest/gtest.h>

#include "SharedTestImpl/GlobalDefs.h"

using TestUtil::kGiB;
using TestUtil::MakeGuaranteedPod;
using TestUtil::MakePod;

TEST(ResourceRequests, ContainerRequestsDefaultToLimits) {
  topo::api::Container container;
  (*container.mutable_requests())[kResourceCpu] = 500;
  (*container.mutable_limits())[kResourceCpu] = 1000;
  (*container.mutable_limits())[kResourceMemory] = kGiB;

  ResourceList requests = Nrt::ContainerRequests(container);
  EXPECT_EQ(requests,
            (ResourceList{{kResourceCpu, 500}, {kResourceMemory, kGiB}}));
}

TEST(ResourceRequests, EffectivePodRequests) {
  auto pod = MakePod("default", "app", "n1", 1000, kGiB);

  auto* sidecar = pod.add_containers();
  (*sidecar->mutable_requests())[kResourceCpu] = 500;
  (*sidecar->mutable_requests())[kResourceMemory] = kGiB;

  // Init containers run one at a time, before the app containers.
  auto* init_big_cpu = pod.add_init_containers();
  (*init_big_cpu->mutable_requests())[kResourceCpu] = 4000;
  auto* init_device = pod.add_init_containers();
  (*init_device->mutable_requests())["vendor.com/fpga"] = 1;

  (*pod.mutable_overhead())[kResourceCpu] = 100;
  (*pod.mutable_overhead())[kResourceMemory] = 1024;

  ResourceList requests = Nrt::PodEffectiveRequests(pod);
  EXPECT_EQ(requests, (ResourceList{{kResourceCpu, 4100},
                                    {kResourceMemory, 2 * kGiB + 1024},
                                    {"vendor.com/fpga", 1}}));
}

TEST(ResourceRequests, GuaranteedQos) {
  EXPECT_TRUE(Nrt::IsGuaranteedQos(
      MakeGuaranteedPod("default", "g", "n1", 2000, kGiB)));
  EXPECT_FALSE(Nrt::IsGuaranteedQos(MakePod("default", "b", "n1", 2000, kGiB)));

  auto pod = MakeGuaranteedPod("default", "g", "n1", 2000, kGiB);
  (*pod.mutable_containers(0)->mutable_requests())[kResourceCpu] = 1000;
  EXPECT_FALSE(Nrt::IsGuaranteedQos(pod));

  pod = MakeGuaranteedPod("default", "g", "n1", 2000, kGiB);
  auto* init = pod.add_init_containers();
  (*init->mutable_requests())[kResourceCpu] = 100;
  EXPECT_FALSE(Nrt::IsGuaranteedQos(pod));
}

TEST(ResourceRequests, ExclusiveForPod) {
  // Guaranteed with whole cpus.
  EXPECT_TRUE(Nrt::AreExclusiveForPod(
      MakeGuaranteedPod("default", "g", "n1", 2000, kGiB)));
  // Guaranteed with a fraction of cpu.
  EXPECT_FALSE(Nrt::AreExclusiveForPod(
      MakeGuaranteedPod("default", "g", "n1", 1500, kGiB)));
  // Whole cpus, but burstable.
  EXPECT_FALSE(
      Nrt::AreExclusiveForPod(MakePod("default", "b", "n1", 2000, kGiB)));

  // Any device makes it exclusive.
  auto pod = MakePod("default", "d", "n1", 500, kGiB);
  (*pod.mutable_containers(0)->mutable_requests())["nvidia.com/gpu"] = 1;
  EXPECT_TRUE(Nrt::AreExclusiveForPod(pod));

  pod = MakePod("default", "d", "n1", 500, kGiB);
  auto* init = pod.add_init_containers();
  (*init->mutable_limits())["vendor.com/nic"] = 1;
  EXPECT_TRUE(Nrt::AreExclusiveForPod(pod));

  // Hugepages are native.
  pod = MakePod("default", "h", "n1", 500, kGiB);
  (*pod.mutable_containers(0)->mutable_requests())["hugepages-2Mi"] = 4096;
  EXPECT_FALSE(Nrt::AreExclusiveForPod(pod));
}
