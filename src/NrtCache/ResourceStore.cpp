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

#include "ResourceStore.h"

#include "ResourceRequests.h"

namespace Nrt {

bool ResourceStore::AddPod(const Pod& pod) {
  PodKey key = util::PodLogId(pod);
  bool inserted =
      m_pod_requests_.insert_or_assign(key, PodEffectiveRequests(pod)).second;
  if (!inserted)
    TOPO_TRACE("pod {} already tracked, updating its requests", key);
  return inserted;
}

bool ResourceStore::DeletePod(const Pod& pod) {
  return m_pod_requests_.erase(util::PodLogId(pod)) > 0;
}

void ResourceStore::UpdateNrt(NodeResourceTopology* nrt,
                              std::string_view log_id) const {
  for (const auto& [key, requests] : m_pod_requests_) {
    for (auto& zone : *nrt->mutable_zones()) {
      if (zone.type() != kZoneTypeNode) continue;

      for (auto& res : *zone.mutable_resources()) {
        auto it = requests.find(res.name());
        if (it == requests.end()) continue;

        int64_t qty = it->second;
        if (res.available() < qty) {
          TOPO_DEBUG(
              "[{}] cannot decrement {} of zone {} on node {}: available {}, "
              "requested {} by {}",
              log_id, res.name(), zone.name(), nrt->name(), res.available(),
              qty, key);
          res.set_available(0);
          continue;
        }
        res.set_available(res.available() - qty);
      }
    }
  }
}

std::string ResourceStore::Dump() const {
  std::vector<std::string> entries;
  entries.reserve(m_pod_requests_.size());
  for (const auto& [key, requests] : m_pod_requests_)
    entries.emplace_back(
        fmt::format("{}: {}", key, util::ReadableResourceList(requests)));
  return absl::StrJoin(entries, "; ");
}

}  // namespace Nrt
