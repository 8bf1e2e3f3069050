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

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "topo/PublicHeader.h"

namespace util {

// Signature layout: prefix + version + 16 lowercase hex digits.
inline constexpr std::string_view kPodFingerprintPrefix = "pfp0";
inline constexpr std::string_view kPodFingerprintVersion = "v001";

// Where the node agent publishes the fingerprint in a NodeResourceTopology
// object, and which pods it covers.
inline const char* const kPodFingerprintAttribute =
    "nodeTopologyPodsFingerprint";
inline const char* const kPodFingerprintAttributeMethod =
    "nodeTopologyPodsFingerprintMethod";
inline const char* const kPodFingerprintAnnotation =
    "topology.node.k8s.io/fingerprint";

inline const char* const kPodFingerprintMethodAll = "all";
inline const char* const kPodFingerprintMethodWithExclusiveResources =
    "with-exclusive-resources";

/**
 * An order-independent digest over a set of pod identifiers.
 * Two fingerprints fed with the same (namespace, name) set produce the same
 * signature, whatever the insertion order is.
 */
class PodFingerprint {
 public:
  PodFingerprint() = default;
  explicit PodFingerprint(size_t size_hint) { hashes_.reserve(size_hint); }

  void Add(std::string_view namespace_name, std::string_view name);

  size_t Size() const { return hashes_.size(); }

  uint64_t Sum() const;

  std::string Sign() const;

  /**
   * @return void if expected is the signature of this pod set.
   * ERR_FINGERPRINT_MALFORMED if expected can't be parsed,
   * ERR_FINGERPRINT_INCOMPATIBLE_VERSION if it was produced by another
   * version of the algorithm, ERR_FINGERPRINT_MISMATCH otherwise.
   */
  TopoExpected<void> Check(std::string_view expected) const;

 private:
  std::vector<uint64_t> hashes_;
};

struct PodFingerprintStatus {
  std::string node_name;
  std::vector<std::string> pods;
  std::string fingerprint_expected;
  std::string fingerprint_computed;

  std::string Repr() const;
};

/**
 * Same as PodFingerprint, but records every step into a
 * PodFingerprintStatus, so that a failed check can be debugged.
 */
class TracingPodFingerprint {
 public:
  TracingPodFingerprint(size_t size_hint, PodFingerprintStatus* status)
      : fp_(size_hint), status_(status) {}

  void Add(std::string_view namespace_name, std::string_view name);

  std::string Sign() const;

  TopoExpected<void> Check(std::string_view expected) const;

 private:
  PodFingerprint fp_;
  PodFingerprintStatus* status_;
};

}  // namespace util
