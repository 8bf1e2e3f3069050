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

#include "NrtCachePublicDefs.h"
// Precompiled header comes first!

namespace Nrt {

enum class FingerprintVerdict : uint8_t {
  // The published object reflects exactly the pods running on the node.
  kMatch = 0,
  // The published object is older than the pod set of the node.
  kMismatch,
  // The published object carries no fingerprint, so it can't be validated.
  kMissingDigest,
};

std::string_view FingerprintVerdictToStr(FingerprintVerdict verdict);

struct FingerprintScope {
  // Empty if nrt carries no fingerprint.
  std::string expected;
  bool only_exclusive_resources{false};
};

/**
 * Extract the published fingerprint of nrt, and the pod subset it covers
 * under the given method.
 */
FingerprintScope PodFingerprintForNodeTopology(const NodeResourceTopology& nrt,
                                               ResyncMethod method);

/**
 * Compute the fingerprint of pods and check it against expected.
 * @return ERR_FINGERPRINT_MISMATCH, ERR_FINGERPRINT_MALFORMED or
 * ERR_FINGERPRINT_INCOMPATIBLE_VERSION on failure.
 */
TopoExpected<void> CheckPodFingerprintForNode(const std::vector<PodData>& pods,
                                              const NodeName& node_name,
                                              std::string_view expected,
                                              bool only_exclusive_resources,
                                              std::string_view log_id);

/**
 * Reconcile the published object of a node with the pods running on it.
 * A mismatch is an expected outcome and not an error. Only a published
 * fingerprint which can't be understood is.
 */
TopoExpected<FingerprintVerdict> ReconcilePodFingerprint(
    const NodeResourceTopology& nrt, const std::vector<PodData>& pods,
    ResyncMethod method, std::string_view log_id);

}  // namespace Nrt
