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

#include "topo/PublicHeader.h"

#include <absl/strings/match.h>

ResourceList& operator+=(ResourceList& lhs, const ResourceList& rhs) {
  for (const auto& [name, qty] : rhs) lhs[name] += qty;
  return lhs;
}

void SetMaxResourceList(ResourceList* lhs, const ResourceList& rhs) {
  for (const auto& [name, qty] : rhs) {
    auto it = lhs->find(name);
    if (it == lhs->end())
      lhs->emplace(name, qty);
    else if (it->second < qty)
      it->second = qty;
  }
}

bool IsHugePageResourceName(std::string_view name) {
  return absl::StartsWith(absl::string_view(name.data(), name.size()),
                          kResourceHugePagesPrefix);
}

bool IsNativeResourceName(std::string_view name) {
  const absl::string_view sv(name.data(), name.size());
  return !absl::StrContains(sv, '/') ||
         absl::StartsWith(sv, kResourceDefaultNamespacePrefix);
}

bool IsIntegralCpu(int64_t milli_cpu) {
  return milli_cpu > 0 && milli_cpu % 1000 == 0;
}
