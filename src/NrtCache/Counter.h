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
 * Counts how many times each node was marked. A node is "set" while its
 * count is non-zero. Not thread-safe.
 */
class Counter {
 public:
  Counter() = default;

  // @return the count after the increment.
  int Incr(const NodeName& node_name);

  void Delete(const NodeName& node_name);

  bool IsSet(const NodeName& node_name) const;

  // In no particular order.
  std::vector<NodeName> Keys() const;

  size_t Len() const { return m_counts_.size(); }

  Counter Clone() const { return *this; }

 private:
  absl::flat_hash_map<NodeName, int> m_counts_;
};

}  // namespace Nrt
