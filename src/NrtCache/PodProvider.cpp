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

#include "PodProvider.h"

namespace Nrt {

bool IsPodRelevantAlways(const Pod& /*pod*/, std::string_view /*log_id*/) {
  return true;
}

bool IsPodRelevantShared(const Pod& pod, std::string_view log_id) {
  if (pod.phase() != topo::api::POD_RUNNING) {
    TOPO_TRACE("[{}] listed pod {} not running, ignored", log_id,
               util::PodLogId(pod));
    return false;
  }

  return true;
}

bool IsPodRelevantDedicated(const Pod& pod, std::string_view log_id) {
  if (pod.phase() == topo::api::POD_PENDING) {
    TOPO_DEBUG("[{}] listed pod {} in Pending phase, ignored", log_id,
               util::PodLogId(pod));
    return false;
  }

  if (pod.node_name().empty()) {
    TOPO_DEBUG("[{}] listed pod {} unbound, ignored", log_id,
               util::PodLogId(pod));
    return false;
  }

  return true;
}

PodFilterFunc PodFilterForInformerMode(InformerMode mode) {
  if (mode == InformerMode::kShared) return IsPodRelevantShared;
  return IsPodRelevantDedicated;
}

}  // namespace Nrt
