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

#include "NrtStore.h"

#include <gtest/gtest.h>

#include "SharedTestImpl/GlobalDefs.h"

using Nrt::NrtStore;

TEST(NrtStore, GetAndContains) {
  topo::api::NodeResourceTopologyList list;
  *list.add_items() = TestUtil::MakeNrt("n1");
  *list.add_items() = TestUtil::MakeNrt("n2");

  NrtStore store(list);
  EXPECT_EQ(store.Size(), 2);
  EXPECT_TRUE(store.Contains("n1"));
  EXPECT_FALSE(store.Contains("n3"));

  auto nrt = store.GetNrtCopyByNodeName("n2");
  ASSERT_TRUE(nrt.has_value());
  EXPECT_EQ(nrt->name(), "n2");

  EXPECT_FALSE(store.GetNrtCopyByNodeName("n3").has_value());
}

TEST(NrtStore, ReturnsDeepCopies) {
  topo::api::NodeResourceTopologyList list;
  *list.add_items() = TestUtil::MakeNrt("n1");
  NrtStore store(list);

  auto nrt = store.GetNrtCopyByNodeName("n1");
  ASSERT_TRUE(nrt.has_value());
  nrt->mutable_zones(0)->mutable_resources(0)->set_available(0);

  auto again = store.GetNrtCopyByNodeName("n1");
  ASSERT_TRUE(again.has_value());
  EXPECT_EQ(TestUtil::ZoneAvailable(*again, "node-0", kResourceCpu), 8000);
}

TEST(NrtStore, Update) {
  NrtStore store(topo::api::NodeResourceTopologyList{});
  EXPECT_FALSE(store.Contains("n1"));

  auto nrt = TestUtil::MakeNrt("n1");
  store.Update(nrt);
  EXPECT_TRUE(store.Contains("n1"));

  // Later changes of the caller's object don't leak into the store.
  nrt.mutable_zones(1)->mutable_resources(0)->set_available(1000);
  auto stored = store.GetNrtCopyByNodeName("n1");
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(TestUtil::ZoneAvailable(*stored, "node-1", kResourceCpu), 8000);

  store.Update(nrt);
  stored = store.GetNrtCopyByNodeName("n1");
  EXPECT_EQ(TestUtil::ZoneAvailable(*stored, "node-1", kResourceCpu), 1000);
  EXPECT_EQ(store.Size(), 1);
}
