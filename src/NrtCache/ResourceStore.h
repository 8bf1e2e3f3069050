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

/**
 * The resources reserved on a single node by the pods the scheduler placed
 * there, which the node agent has not reported yet.
 * Not thread-safe: the owner must serialize access.
 */
class ResourceStore {
 public:
  ResourceStore() = default;

  // @return false if the pod was already tracked. Its requests are replaced.
  bool AddPod(const Pod& pod);

  // @return false if the pod was not tracked.
  bool DeletePod(const Pod& pod);

  bool Empty() const { return m_pod_requests_.empty(); }

  size_t Size() const { return m_pod_requests_.size(); }

  /**
   * Subtract the requests of every tracked pod from every NUMA zone of nrt.
   * We don't know which zone the pod will land on, so each of them is
   * charged. Availability is clamped at 0.
   */
  void UpdateNrt(NodeResourceTopology* nrt, std::string_view log_id) const;

  std::string Dump() const;

 private:
  // pod key -> effective requests
  absl::btree_map<PodKey, ResourceList> m_pod_requests_;
};

}  // namespace Nrt
