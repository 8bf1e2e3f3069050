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

#include "topo/PodFingerprint.h"

#include <gtest/gtest.h>

#include <algorithm>

#include "SharedTestImpl/GlobalDefs.h"

using util::PodFingerprint;

TEST(PodFingerprint, OrderIndependent) {
  PodFingerprint pfp_a;
  pfp_a.Add("default", "nginx");
  pfp_a.Add("kube-system", "coredns");
  pfp_a.Add("default", "redis");

  PodFingerprint pfp_b;
  pfp_b.Add("default", "redis");
  pfp_b.Add("default", "nginx");
  pfp_b.Add("kube-system", "coredns");

  EXPECT_EQ(pfp_a.Sum(), pfp_b.Sum());
  EXPECT_EQ(pfp_a.Sign(), pfp_b.Sign());
}

TEST(PodFingerprint, DifferentSets) {
  PodFingerprint pfp_a;
  pfp_a.Add("default", "nginx");

  PodFingerprint pfp_b;
  pfp_b.Add("default", "nginx");
  pfp_b.Add("default", "redis");

  PodFingerprint pfp_c;
  pfp_c.Add("other", "nginx");

  EXPECT_NE(pfp_a.Sign(), pfp_b.Sign());
  EXPECT_NE(pfp_a.Sign(), pfp_c.Sign());
}

TEST(PodFingerprint, SignFormat) {
  PodFingerprint pfp;
  pfp.Add("default", "nginx");

  std::string sign = pfp.Sign();
  GTEST_LOG_(INFO) << "Signature: " << sign;

  ASSERT_EQ(sign.size(), 4 + 4 + 16);
  EXPECT_EQ(sign.substr(0, 8), "pfp0v001");
  EXPECT_TRUE(std::all_of(sign.begin() + 8, sign.end(), [](char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
  }));
}

TEST(PodFingerprint, EmptySet) {
  PodFingerprint pfp_a;
  PodFingerprint pfp_b(16);

  EXPECT_EQ(pfp_a.Size(), 0);
  EXPECT_EQ(pfp_a.Sign(), pfp_b.Sign());
  EXPECT_TRUE(pfp_a.Check(pfp_b.Sign()).has_value());
}

TEST(PodFingerprint, Check) {
  PodFingerprint pfp;
  pfp.Add("default", "nginx");
  pfp.Add("default", "redis");

  EXPECT_TRUE(pfp.Check(pfp.Sign()).has_value());

  PodFingerprint other;
  other.Add("default", "nginx");
  auto result = pfp.Check(other.Sign());
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), topo::api::ERR_FINGERPRINT_MISMATCH);
}

TEST(PodFingerprint, CheckMalformed) {
  PodFingerprint pfp;
  pfp.Add("default", "nginx");

  for (std::string_view bad :
       {"", "pfp0", "pfp0v001", "abcdv0010123456789abcdef"}) {
    auto result = pfp.Check(bad);
    ASSERT_FALSE(result.has_value()) << bad;
    EXPECT_EQ(result.error(), topo::api::ERR_FINGERPRINT_MALFORMED) << bad;
  }
}

TEST(PodFingerprint, CheckIncompatibleVersion) {
  PodFingerprint pfp;
  pfp.Add("default", "nginx");

  std::string sign = pfp.Sign();
  sign.replace(4, 4, "v002");

  auto result = pfp.Check(sign);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), topo::api::ERR_FINGERPRINT_INCOMPATIBLE_VERSION);
}

TEST(PodFingerprint, TracingRecordsStatus) {
  util::PodFingerprintStatus status;
  status.node_name = "n1";

  util::TracingPodFingerprint tracing(2, &status);
  tracing.Add("default", "nginx");
  tracing.Add("default", "redis");

  PodFingerprint plain;
  plain.Add("default", "redis");
  plain.Add("default", "nginx");

  EXPECT_EQ(tracing.Sign(), plain.Sign());
  EXPECT_TRUE(tracing.Check(plain.Sign()).has_value());

  EXPECT_EQ(status.pods,
            (std::vector<std::string>{"default/nginx", "default/redis"}));
  EXPECT_EQ(status.fingerprint_expected, plain.Sign());
  EXPECT_EQ(status.fingerprint_computed, plain.Sign());

  std::string repr = status.Repr();
  GTEST_LOG_(INFO) << repr;
  EXPECT_NE(repr.find("node=n1"), std::string::npos);
  EXPECT_NE(repr.find("default/redis"), std::string::npos);
}
