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

#include "Passthrough.h"

namespace Nrt {

std::pair<std::optional<NodeResourceTopology>, bool>
Passthrough::GetCachedNrtCopy(const NodeName& node_name, const Pod& pod) {
  TOPO_TRACE("[{}] Passthrough fetching NRT of node {}", util::PodLogId(pod),
             node_name);

  auto nrt = m_client_->GetNodeResourceTopology(node_name);
  if (!nrt) {
    TOPO_DEBUG("[{}] failed to get NodeTopology of node {}: {}",
               util::PodLogId(pod), node_name, nrt.error());
    return {std::nullopt, true};
  }

  return {std::move(nrt.value()), true};
}

}  // namespace Nrt
