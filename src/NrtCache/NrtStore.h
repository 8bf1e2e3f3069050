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
 * The last trusted NodeResourceTopology object of each node.
 * Objects go in and out by copy, so callers may freely modify what they get.
 * Not thread-safe: the owner must serialize access.
 */
class NrtStore {
 public:
  explicit NrtStore(const NodeResourceTopologyList& nrt_list);

  std::optional<NodeResourceTopology> GetNrtCopyByNodeName(
      const NodeName& node_name) const;

  bool Contains(const NodeName& node_name) const;

  // Insert or replace the object of nrt.name().
  void Update(const NodeResourceTopology& nrt);

  size_t Size() const { return m_data_.size(); }

 private:
  absl::flat_hash_map<NodeName, NodeResourceTopology> m_data_;
};

}  // namespace Nrt
