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

#include "PodFingerprintCheck.h"

namespace Nrt {

namespace {

const topo::api::AttributeInfo* FindAttribute(
    const google::protobuf::RepeatedPtrField<topo::api::AttributeInfo>& attrs,
    std::string_view name) {
  for (const auto& attr : attrs)
    if (attr.name() == name) return &attr;
  return nullptr;
}

}  // namespace

std::string_view FingerprintVerdictToStr(FingerprintVerdict verdict) {
  switch (verdict) {
  case FingerprintVerdict::kMatch:
    return "Match";
  case FingerprintVerdict::kMismatch:
    return "Mismatch";
  case FingerprintVerdict::kMissingDigest:
    return "MissingDigest";
  }
  return "Unknown";
}

FingerprintScope PodFingerprintForNodeTopology(const NodeResourceTopology& nrt,
                                               ResyncMethod method) {
  FingerprintScope scope;

  if (method == ResyncMethod::kOnlyExclusiveResources) {
    scope.only_exclusive_resources = true;
  } else if (method == ResyncMethod::kAutodetect) {
    const auto* attr =
        FindAttribute(nrt.attributes(), util::kPodFingerprintAttributeMethod);
    if (attr != nullptr)
      scope.only_exclusive_resources =
          attr->value() == util::kPodFingerprintMethodWithExclusiveResources;
  }

  const auto* attr =
      FindAttribute(nrt.attributes(), util::kPodFingerprintAttribute);
  if (attr != nullptr) {
    scope.expected = attr->value();
    return scope;
  }

  auto it = nrt.annotations().find(util::kPodFingerprintAnnotation);
  if (it != nrt.annotations().end()) scope.expected = it->second;

  return scope;
}

TopoExpected<void> CheckPodFingerprintForNode(const std::vector<PodData>& pods,
                                              const NodeName& node_name,
                                              std::string_view expected,
                                              bool only_exclusive_resources,
                                              std::string_view log_id) {
  util::PodFingerprintStatus status;
  status.node_name = node_name;

  util::TracingPodFingerprint pfp(pods.size(), &status);
  for (const auto& pod : pods) {
    if (only_exclusive_resources && !pod.has_exclusive_resources) continue;
    pfp.Add(pod.namespace_name, pod.name);
  }

  auto result = pfp.Check(expected);
  TOPO_TRACE(
      "[{}] podset fingerprint check on node {}: expected {}, computed {}, "
      "only exclusive resources: {}",
      log_id, node_name, status.fingerprint_expected,
      status.fingerprint_computed, only_exclusive_resources);
  TOPO_TRACE("[{}] podset fingerprint status: {}", log_id, status.Repr());

  return result;
}

TopoExpected<FingerprintVerdict> ReconcilePodFingerprint(
    const NodeResourceTopology& nrt, const std::vector<PodData>& pods,
    ResyncMethod method, std::string_view log_id) {
  FingerprintScope scope = PodFingerprintForNodeTopology(nrt, method);
  if (scope.expected.empty()) return FingerprintVerdict::kMissingDigest;

  TOPO_TRACE(
      "[{}] trying to resync NodeTopology of node {}, fingerprint {}, only "
      "exclusive resources: {}",
      log_id, nrt.name(), scope.expected, scope.only_exclusive_resources);

  auto result = CheckPodFingerprintForNode(pods, nrt.name(), scope.expected,
                                           scope.only_exclusive_resources,
                                           log_id);
  if (result) return FingerprintVerdict::kMatch;
  if (result.error() == topo::api::ERR_FINGERPRINT_MISMATCH)
    return FingerprintVerdict::kMismatch;

  return std::unexpected(result.error());
}

}  // namespace Nrt
