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

#include "NrtStore.h"

namespace Nrt {

NrtStore::NrtStore(const NodeResourceTopologyList& nrt_list) {
  for (const auto& nrt : nrt_list.items()) m_data_[nrt.name()] = nrt;
  TOPO_TRACE("NrtStore created with {} objects", m_data_.size());
}

std::optional<NodeResourceTopology> NrtStore::GetNrtCopyByNodeName(
    const NodeName& node_name) const {
  auto it = m_data_.find(node_name);
  if (it == m_data_.end()) {
    TOPO_TRACE("missing cached NodeTopology for node {}", node_name);
    return std::nullopt;
  }
  return it->second;
}

bool NrtStore::Contains(const NodeName& node_name) const {
  return m_data_.contains(node_name);
}

void NrtStore::Update(const NodeResourceTopology& nrt) {
  m_data_[nrt.name()] = nrt;
  TOPO_TRACE("updated cached NodeTopology for node {}", nrt.name());
}

}  // namespace Nrt
