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

#include "Passthrough.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "SharedTestImpl/FakeClients.h"
#include "SharedTestImpl/GlobalDefs.h"

using TestUtil::kGiB;
using TestUtil::MakeNrt;
using TestUtil::MakePod;

TEST(Passthrough, FetchesOnEveryRead) {
  TestUtil::FakeNrtClient client;
  client.Publish(MakeNrt("n1"));

  Nrt::Passthrough cache(&client);
  auto pod = MakePod("default", "a", "n1", 1000, kGiB);

  auto [nrt, ok] = cache.GetCachedNrtCopy("n1", pod);
  EXPECT_TRUE(ok);
  ASSERT_TRUE(nrt.has_value());
  EXPECT_EQ(nrt->name(), "n1");

  // Reservations are not tracked.
  cache.ReserveNodeResources("n1", pod);
  cache.NodeMaybeOverReserved("n1", pod);
  cache.NodeHasForeignPods("n1", pod);

  auto published = MakeNrt("n1");
  published.mutable_zones(0)->mutable_resources(0)->set_available(1000);
  client.Publish(published);

  std::tie(nrt, ok) = cache.GetCachedNrtCopy("n1", pod);
  EXPECT_TRUE(ok);
  ASSERT_TRUE(nrt.has_value());
  EXPECT_EQ(TestUtil::ZoneAvailable(*nrt, "node-0", kResourceCpu), 1000);
  EXPECT_EQ(TestUtil::ZoneAvailable(*nrt, "node-1", kResourceCpu), 8000);

  EXPECT_EQ(client.GetCalls(), 2);
}

TEST(Passthrough, FetchFailure) {
  TestUtil::MockNrtClient client;
  EXPECT_CALL(client, GetNodeResourceTopology("n1"))
      .WillOnce(::testing::Return(std::unexpected(
          FormatRichErr(topo::api::ERR_GET_FAILED, "timeout"))));

  Nrt::Passthrough cache(&client);
  auto [nrt, ok] =
      cache.GetCachedNrtCopy("n1", MakePod("default", "a", "n1", 1000, kGiB));
  EXPECT_TRUE(ok);
  EXPECT_FALSE(nrt.has_value());
}
