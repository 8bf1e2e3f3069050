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

#include "NrtCache.h"

namespace Nrt {

// No caching at all: every read fetches the published object.
class Passthrough final : public NrtCacheInterface {
 public:
  explicit Passthrough(NrtClientInterface* client) : m_client_(client) {}

  std::pair<std::optional<NodeResourceTopology>, bool> GetCachedNrtCopy(
      const NodeName& node_name, const Pod& pod) override;

  void NodeMaybeOverReserved(const NodeName& node_name,
                             const Pod& pod) override {}
  void NodeHasForeignPods(const NodeName& node_name, const Pod& pod) override {
  }
  void ReserveNodeResources(const NodeName& node_name,
                            const Pod& pod) override {}
  void UnreserveNodeResources(const NodeName& node_name,
                              const Pod& pod) override {}
  void PostBind(const NodeName& node_name, const Pod& pod) override {}

 private:
  NrtClientInterface* m_client_;
};

}  // namespace Nrt
