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

#include "OverReserve.h"

#include "PodFingerprintCheck.h"

namespace Nrt {

namespace {

ResyncMethod GetCacheResyncMethod(std::optional<ResyncMethod> resync_method) {
  if (resync_method.has_value()) return resync_method.value();

  TOPO_INFO("Cache resync method missing, fallback to {}",
            ResyncMethodToStr(ResyncMethod::kAutodetect));
  return ResyncMethod::kAutodetect;
}

}  // namespace

TopoExpectedRich<std::unique_ptr<OverReserve>> OverReserve::Create(
    std::optional<ResyncMethod> resync_method, NrtClientInterface* client,
    PodListerInterface* pod_lister, PodFilterFunc is_pod_relevant,
    PodExclusivityFunc are_exclusive) {
  if (client == nullptr || pod_lister == nullptr || !is_pod_relevant ||
      !are_exclusive)
    return std::unexpected(FormatRichErr(topo::api::ERR_INVALID_PARAM,
                                         "received null references"));

  ResyncMethod method = GetCacheResyncMethod(resync_method);

  auto nrt_list = client->ListNodeResourceTopologies();
  if (!nrt_list) {
    TOPO_ERROR("Failed to list NodeTopology objects: {}", nrt_list.error());
    return std::unexpected(nrt_list.error());
  }

  TOPO_INFO("Initializing OverReserve cache with {} objects, method {}",
            nrt_list->items_size(), ResyncMethodToStr(method));

  return std::unique_ptr<OverReserve>(new OverReserve(
      method, client, pod_lister, std::move(is_pod_relevant),
      std::move(are_exclusive), nrt_list.value()));
}

OverReserve::OverReserve(ResyncMethod resync_method,
                         NrtClientInterface* client,
                         PodListerInterface* pod_lister,
                         PodFilterFunc is_pod_relevant,
                         PodExclusivityFunc are_exclusive,
                         const NodeResourceTopologyList& nrt_list)
    : m_client_(client),
      m_pod_lister_(pod_lister),
      m_resync_method_(resync_method),
      m_is_pod_relevant_(std::move(is_pod_relevant)),
      m_are_exclusive_(std::move(are_exclusive)),
      m_nrts_(nrt_list) {}

std::pair<std::optional<NodeResourceTopology>, bool>
OverReserve::GetCachedNrtCopy(const NodeName& node_name, const Pod& pod) {
  LockGuard lock_guard(&m_mtx_);
  if (m_nodes_with_foreign_pods_.IsSet(node_name)) return {std::nullopt, false};

  std::optional<NodeResourceTopology> nrt =
      m_nrts_.GetNrtCopyByNodeName(node_name);
  if (!nrt.has_value()) return {std::nullopt, true};

  auto it = m_assumed_resources_.find(node_name);
  if (it == m_assumed_resources_.end()) return {std::move(nrt), true};

  PodKey log_id = util::PodLogId(pod);
  TOPO_TRACE("[{}] NRT of node {} vanilla: {}", log_id, node_name,
             util::ReadableNrtResources(nrt.value()));

  it->second.UpdateNrt(&nrt.value(), log_id);

  TOPO_TRACE("[{}] NRT of node {} updated: {}", log_id, node_name,
             util::ReadableNrtResources(nrt.value()));
  return {std::move(nrt), true};
}

void OverReserve::NodeMaybeOverReserved(const NodeName& node_name,
                                        const Pod& pod) {
  LockGuard lock_guard(&m_mtx_);
  int count = m_nodes_maybe_over_reserved_.Incr(node_name);
  TOPO_DEBUG("[{}] mark node {} discarded, count {}", util::PodLogId(pod),
             node_name, count);
}

void OverReserve::NodeHasForeignPods(const NodeName& node_name,
                                     const Pod& pod) {
  PodKey log_id = util::PodLogId(pod);

  LockGuard lock_guard(&m_mtx_);
  if (!m_nrts_.Contains(node_name)) {
    TOPO_TRACE("[{}] ignoring foreign pods on node {}: NRT info missing",
               log_id, node_name);
    return;
  }

  int count = m_nodes_with_foreign_pods_.Incr(node_name);
  TOPO_DEBUG("[{}] node {} marked with foreign pods, count {}", log_id,
             node_name, count);
}

void OverReserve::ReserveNodeResources(const NodeName& node_name,
                                       const Pod& pod) {
  PodKey log_id = util::PodLogId(pod);

  LockGuard lock_guard(&m_mtx_);
  ResourceStore& node_assumed_resources = m_assumed_resources_[node_name];
  node_assumed_resources.AddPod(pod);
  TOPO_TRACE("[{}] post reserve on node {}, assumed resources: {}", log_id,
             node_name, node_assumed_resources.Dump());

  m_nodes_maybe_over_reserved_.Delete(node_name);
  TOPO_TRACE("[{}] reset discard counter of node {}", log_id, node_name);
}

void OverReserve::UnreserveNodeResources(const NodeName& node_name,
                                         const Pod& pod) {
  PodKey log_id = util::PodLogId(pod);

  LockGuard lock_guard(&m_mtx_);
  auto it = m_assumed_resources_.find(node_name);
  if (it == m_assumed_resources_.end()) {
    // Should not happen. Nothing to recover anyway.
    TOPO_INFO("[{}] no resources tracked on node {}", log_id, node_name);
    return;
  }

  it->second.DeletePod(pod);
  TOPO_TRACE("[{}] post release on node {}, assumed resources: {}", log_id,
             node_name, it->second.Dump());

  if (it->second.Empty()) m_assumed_resources_.erase(it);
}

std::vector<NodeName> OverReserve::NodesMaybeOverReserved(
    std::string_view log_id) {
  LockGuard lock_guard(&m_mtx_);

  Counter nodes = m_nodes_with_foreign_pods_.Clone();
  size_t foreign_count = nodes.Len();

  for (const auto& node_name : m_nodes_maybe_over_reserved_.Keys())
    nodes.Incr(node_name);

  if (nodes.Len() > 0)
    TOPO_DEBUG("[{}] found dirty nodes: foreign {}, discarded {}, total {}",
               log_id, foreign_count, nodes.Len() - foreign_count,
               nodes.Len());

  return nodes.Keys();
}

void OverReserve::Resync() {
  std::string log_id = util::TimeLogId("resync");

  std::vector<NodeName> node_names = NodesMaybeOverReserved(log_id);
  if (node_names.empty()) {
    TOPO_TRACE("[{}] no dirty nodes detected", log_id);
    return;
  }

  auto node_to_pods = MakeNodeToPodDataMap_(log_id);
  if (!node_to_pods) {
    TOPO_ERROR(
        "[{}] cannot find the mapping between running pods and nodes: {}",
        log_id, node_to_pods.error());
    return;
  }

  TOPO_TRACE("[{}] resync NodeTopology cache starting", log_id);

  std::vector<NodeResourceTopology> nrt_updates;
  for (const auto& node_name : node_names) {
    auto nrt_candidate = m_client_->GetNodeResourceTopology(node_name);
    if (!nrt_candidate) {
      if (nrt_candidate.error().code() == topo::api::ERR_NON_EXISTENT)
        TOPO_INFO("[{}] missing NodeTopology of node {}", log_id, node_name);
      else
        TOPO_INFO("[{}] failed to get NodeTopology of node {}: {}", log_id,
                  node_name, nrt_candidate.error());
      continue;
    }

    auto pods_it = node_to_pods->find(node_name);
    if (pods_it == node_to_pods->end()) {
      // Should never happen.
      TOPO_INFO("[{}] cannot find any pod for node {}", log_id, node_name);
      continue;
    }

    auto verdict = ReconcilePodFingerprint(nrt_candidate.value(),
                                           pods_it->second, m_resync_method_,
                                           log_id);
    if (!verdict) {
      TOPO_WARN("[{}] checking NodeTopology podset fingerprint of node {}: {}",
                log_id, node_name, TopoErrStr(verdict.error()));
      continue;
    }

    if (verdict.value() == FingerprintVerdict::kMissingDigest) {
      TOPO_INFO("[{}] missing NodeTopology podset fingerprint data of node {}",
                log_id, node_name);
      continue;
    }

    if (verdict.value() == FingerprintVerdict::kMismatch) {
      TOPO_DEBUG("[{}] NodeTopology podset fingerprint mismatch on node {}",
                 log_id, node_name);
      continue;
    }

    TOPO_DEBUG("[{}] overriding cached info of node {}", log_id, node_name);
    nrt_updates.emplace_back(std::move(nrt_candidate.value()));
  }

  FlushNodes(nrt_updates, log_id);
  TOPO_TRACE("[{}] resync NodeTopology cache complete", log_id);
}

void OverReserve::FlushNodes(const std::vector<NodeResourceTopology>& nrts,
                             std::string_view log_id) {
  LockGuard lock_guard(&m_mtx_);
  for (const auto& nrt : nrts) {
    TOPO_DEBUG("[{}] flushing node {}", log_id, nrt.name());
    m_nrts_.Update(nrt);
    m_assumed_resources_.erase(nrt.name());
    m_nodes_maybe_over_reserved_.Delete(nrt.name());
    m_nodes_with_foreign_pods_.Delete(nrt.name());
  }
}

TopoExpectedRich<absl::flat_hash_map<NodeName, std::vector<PodData>>>
OverReserve::MakeNodeToPodDataMap_(std::string_view log_id) {
  auto pods = m_pod_lister_->ListPods();
  if (!pods) return std::unexpected(pods.error());

  absl::flat_hash_map<NodeName, std::vector<PodData>> node_to_pods;
  for (const auto& pod : pods.value()) {
    if (!m_is_pod_relevant_(pod, log_id)) continue;

    node_to_pods[pod.node_name()].emplace_back(PodData{
        .namespace_name = pod.namespace_name(),
        .name = pod.name(),
        .has_exclusive_resources = m_are_exclusive_(pod),
    });
  }

  return node_to_pods;
}

}  // namespace Nrt
