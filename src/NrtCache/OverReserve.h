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

#include "Counter.h"
#include "NrtCache.h"
#include "NrtStore.h"
#include "ResourceRequests.h"
#include "ResourceStore.h"

namespace Nrt {

/**
 * A cache which trusts the published NodeResourceTopology objects only as
 * long as the scheduler did not change the nodes they describe.
 *
 * Resources reserved by the scheduler are subtracted, pessimistically, from
 * every NUMA zone of the node until the node agent publishes an object whose
 * podset fingerprint matches the pods actually running on the node. Nodes
 * which may be stale are tracked as dirty and reconciled by Resync().
 */
class OverReserve final : public NrtCacheInterface {
 public:
  using Mutex = absl::Mutex;
  using LockGuard = absl::MutexLock;

  /**
   * @param resync_method falls back to ResyncMethod::kAutodetect if absent.
   * @return ERR_INVALID_PARAM if a collaborator is missing, or the error of
   * the initial listing.
   */
  static TopoExpectedRich<std::unique_ptr<OverReserve>> Create(
      std::optional<ResyncMethod> resync_method, NrtClientInterface* client,
      PodListerInterface* pod_lister, PodFilterFunc is_pod_relevant,
      PodExclusivityFunc are_exclusive = AreExclusiveForPod);

  std::pair<std::optional<NodeResourceTopology>, bool> GetCachedNrtCopy(
      const NodeName& node_name, const Pod& pod) override;

  void NodeMaybeOverReserved(const NodeName& node_name,
                             const Pod& pod) override;

  void NodeHasForeignPods(const NodeName& node_name, const Pod& pod) override;

  void ReserveNodeResources(const NodeName& node_name,
                            const Pod& pod) override;

  void UnreserveNodeResources(const NodeName& node_name,
                              const Pod& pod) override;

  void PostBind(const NodeName& node_name, const Pod& pod) override {}

  /**
   * The nodes which have been filtered out or which run foreign pods since
   * their last flush, without duplicates and in no particular order.
   * Nodes filtered out because they are really full are listed as well: we
   * can't tell them apart from over-reserved ones.
   */
  std::vector<NodeName> NodesMaybeOverReserved(std::string_view log_id);

  /**
   * One step of the resync loop: every dirty node whose freshly published
   * object matches its running pods is flushed. The other ones stay dirty
   * and are retried on the next call.
   * Calls must be serialized by the caller.
   */
  void Resync();

  // Trust nrts again and drop everything tracked on their nodes.
  void FlushNodes(const std::vector<NodeResourceTopology>& nrts,
                  std::string_view log_id);

  ResyncMethod GetResyncMethod() const { return m_resync_method_; }

  // Only for tests.
  const NrtStore& Store() const ABSL_NO_THREAD_SAFETY_ANALYSIS {
    return m_nrts_;
  }

  // Only for tests.
  bool HasAssumedResources(const NodeName& node_name) {
    LockGuard lock_guard(&m_mtx_);
    return m_assumed_resources_.contains(node_name);
  }

 private:
  OverReserve(ResyncMethod resync_method, NrtClientInterface* client,
              PodListerInterface* pod_lister, PodFilterFunc is_pod_relevant,
              PodExclusivityFunc are_exclusive,
              const NodeResourceTopologyList& nrt_list);

  // node name -> the relevant pods running on it
  TopoExpectedRich<absl::flat_hash_map<NodeName, std::vector<PodData>>>
  MakeNodeToPodDataMap_(std::string_view log_id);

  NrtClientInterface* m_client_;
  PodListerInterface* m_pod_lister_;
  const ResyncMethod m_resync_method_;
  PodFilterFunc m_is_pod_relevant_;
  PodExclusivityFunc m_are_exclusive_;

  Mutex m_mtx_;

  NrtStore m_nrts_ ABSL_GUARDED_BY(m_mtx_);

  // node name -> resources reserved there since the last flush.
  // A node has an entry only while something is reserved on it.
  absl::flat_hash_map<NodeName, ResourceStore> m_assumed_resources_
      ABSL_GUARDED_BY(m_mtx_);

  // How many times a node was filtered out since its last flush.
  Counter m_nodes_maybe_over_reserved_ ABSL_GUARDED_BY(m_mtx_);
  Counter m_nodes_with_foreign_pods_ ABSL_GUARDED_BY(m_mtx_);
};

}  // namespace Nrt
