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

#include "Counter.h"

namespace Nrt {

int Counter::Incr(const NodeName& node_name) { return ++m_counts_[node_name]; }

void Counter::Delete(const NodeName& node_name) { m_counts_.erase(node_name); }

bool Counter::IsSet(const NodeName& node_name) const {
  return m_counts_.contains(node_name);
}

std::vector<NodeName> Counter::Keys() const {
  std::vector<NodeName> keys;
  keys.reserve(m_counts_.size());
  for (const auto& [node_name, _] : m_counts_) keys.emplace_back(node_name);
  return keys;
}

}  // namespace Nrt
