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

#include <absl/strings/match.h>
#include <absl/strings/str_join.h>
#include <openssl/evp.h>

#include <algorithm>
#include <array>

namespace util {

namespace {

using Sha256Digest = std::array<unsigned char, EVP_MAX_MD_SIZE>;

// First 8 bytes of the SHA-256 digest of data, little endian.
uint64_t Sha256Prefix64(const void* data, size_t size) {
  Sha256Digest md{};
  unsigned int md_len = 0;
  // EVP_Digest only fails on allocation failure. The zeroed digest is
  // returned in that case, which can only yield a mismatch.
  if (EVP_Digest(data, size, md.data(), &md_len, EVP_sha256(), nullptr) != 1)
    return 0;

  uint64_t value = 0;
  for (int i = 7; i >= 0; --i) value = (value << 8) | md[i];
  return value;
}

}  // namespace

void PodFingerprint::Add(std::string_view namespace_name,
                         std::string_view name) {
  std::string pod_id;
  pod_id.reserve(namespace_name.size() + name.size() + 1);
  pod_id.append(namespace_name).append("/").append(name);
  hashes_.push_back(Sha256Prefix64(pod_id.data(), pod_id.size()));
}

uint64_t PodFingerprint::Sum() const {
  std::vector<uint64_t> sorted(hashes_);
  std::sort(sorted.begin(), sorted.end());

  std::vector<unsigned char> buf;
  buf.reserve(sorted.size() * sizeof(uint64_t));
  for (uint64_t h : sorted) {
    for (size_t i = 0; i < sizeof(uint64_t); ++i)
      buf.push_back(static_cast<unsigned char>((h >> (8 * i)) & 0xff));
  }

  return Sha256Prefix64(buf.data(), buf.size());
}

std::string PodFingerprint::Sign() const {
  return fmt::format("{}{}{:016x}", kPodFingerprintPrefix,
                     kPodFingerprintVersion, Sum());
}

TopoExpected<void> PodFingerprint::Check(std::string_view expected) const {
  const size_t header_len =
      kPodFingerprintPrefix.size() + kPodFingerprintVersion.size();
  if (expected.size() <= header_len ||
      !absl::StartsWith(
          absl::string_view(expected.data(), expected.size()),
          absl::string_view(kPodFingerprintPrefix.data(),
                            kPodFingerprintPrefix.size())))
    return std::unexpected(topo::api::ERR_FINGERPRINT_MALFORMED);

  if (expected.substr(kPodFingerprintPrefix.size(),
                      kPodFingerprintVersion.size()) != kPodFingerprintVersion)
    return std::unexpected(topo::api::ERR_FINGERPRINT_INCOMPATIBLE_VERSION);

  if (expected != Sign())
    return std::unexpected(topo::api::ERR_FINGERPRINT_MISMATCH);

  return {};
}

std::string PodFingerprintStatus::Repr() const {
  return fmt::format("node={} pods=[{}] expected={} computed={}", node_name,
                     absl::StrJoin(pods, ","), fingerprint_expected,
                     fingerprint_computed);
}

void TracingPodFingerprint::Add(std::string_view namespace_name,
                                std::string_view name) {
  fp_.Add(namespace_name, name);
  if (status_)
    status_->pods.push_back(fmt::format("{}/{}", namespace_name, name));
}

std::string TracingPodFingerprint::Sign() const {
  std::string sign = fp_.Sign();
  if (status_) status_->fingerprint_computed = sign;
  return sign;
}

TopoExpected<void> TracingPodFingerprint::Check(
    std::string_view expected) const {
  if (status_) {
    status_->fingerprint_expected = expected;
    status_->fingerprint_computed = fp_.Sign();
  }
  return fp_.Check(expected);
}

}  // namespace util
