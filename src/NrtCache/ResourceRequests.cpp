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

#include "ResourceRequests.h"

namespace Nrt {

namespace {

// Limit and request of a resource agree, a missing request counts as equal.
bool RequestMatchesLimit(const topo::api::Container& container,
                         const std::string& resource) {
  auto limit_it = container.limits().find(resource);
  if (limit_it == container.limits().end() || limit_it->second <= 0)
    return false;

  auto req_it = container.requests().find(resource);
  if (req_it == container.requests().end()) return true;
  return req_it->second == limit_it->second;
}

bool IsGuaranteedContainer(const topo::api::Container& container) {
  return RequestMatchesLimit(container, kResourceCpu) &&
         RequestMatchesLimit(container, kResourceMemory);
}

}  // namespace

ResourceList ContainerRequests(const topo::api::Container& container) {
  ResourceList requests(container.requests().begin(),
                        container.requests().end());
  for (const auto& [name, qty] : container.limits())
    requests.try_emplace(name, qty);
  return requests;
}

ResourceList PodEffectiveRequests(const Pod& pod) {
  ResourceList requests;
  for (const auto& container : pod.containers())
    requests += ContainerRequests(container);

  for (const auto& container : pod.init_containers())
    SetMaxResourceList(&requests, ContainerRequests(container));

  requests += ResourceList(pod.overhead().begin(), pod.overhead().end());
  return requests;
}

bool IsGuaranteedQos(const Pod& pod) {
  if (pod.containers().empty()) return false;

  for (const auto& container : pod.containers())
    if (!IsGuaranteedContainer(container)) return false;
  for (const auto& container : pod.init_containers())
    if (!IsGuaranteedContainer(container)) return false;

  return true;
}

bool AreExclusiveForContainer(const topo::api::Container& container,
                              bool guaranteed) {
  ResourceList requests = ContainerRequests(container);
  for (const auto& [name, qty] : requests) {
    if (qty <= 0) continue;
    if (!IsNativeResourceName(name)) return true;
    if (guaranteed && name == kResourceCpu && IsIntegralCpu(qty)) return true;
  }
  return false;
}

bool AreExclusiveForPod(const Pod& pod) {
  bool guaranteed = IsGuaranteedQos(pod);

  for (const auto& container : pod.init_containers())
    if (AreExclusiveForContainer(container, guaranteed)) return true;
  for (const auto& container : pod.containers())
    if (AreExclusiveForContainer(container, guaranteed)) return true;

  return false;
}

}  // namespace Nrt
