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
 * The view of the NodeResourceTopology objects the scheduler filters and
 * scores nodes with. All methods are thread-safe.
 */
class NrtCacheInterface {
 public:
  virtual ~NrtCacheInterface() = default;

  /**
   * @return the object of the node, adjusted with the resources the
   * scheduler reserved there and not reported yet, or std::nullopt if no
   * object is known. The second member is false if the cached data of the
   * node can't be trusted at all, e.g. foreign pods are running there.
   */
  virtual std::pair<std::optional<NodeResourceTopology>, bool>
  GetCachedNrtCopy(const NodeName& node_name, const Pod& pod) = 0;

  // The node was filtered out for pod, possibly because of over-reservation.
  virtual void NodeMaybeOverReserved(const NodeName& node_name,
                                     const Pod& pod) = 0;

  // pod was placed on the node by another scheduler.
  virtual void NodeHasForeignPods(const NodeName& node_name,
                                  const Pod& pod) = 0;

  virtual void ReserveNodeResources(const NodeName& node_name,
                                    const Pod& pod) = 0;

  virtual void UnreserveNodeResources(const NodeName& node_name,
                                      const Pod& pod) = 0;

  virtual void PostBind(const NodeName& node_name, const Pod& pod) = 0;
};

}  // namespace Nrt
