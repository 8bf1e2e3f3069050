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

#include "ForeignPods.h"

namespace Nrt {

ForeignPodsDetector::ForeignPodsDetector(
    ForeignPodsDetectMode mode,
    const std::vector<std::string>& scheduler_profile_names,
    NrtCacheInterface* cache, PodExclusivityFunc are_exclusive)
    : m_mode_(mode),
      m_scheduler_profile_names_(scheduler_profile_names.begin(),
                                 scheduler_profile_names.end()),
      m_cache_(cache),
      m_are_exclusive_(std::move(are_exclusive)) {
  TOPO_INFO("Foreign pods detection: {}, scheduler profiles: [{}]",
            ForeignPodsDetectModeToStr(mode),
            absl::StrJoin(scheduler_profile_names, ","));
}

bool ForeignPodsDetector::IsForeignPod(const Pod& pod) const {
  if (m_mode_ == ForeignPodsDetectMode::kNone) return false;
  if (pod.node_name().empty()) return false;
  if (m_scheduler_profile_names_.contains(pod.scheduler_name())) return false;

  if (m_mode_ == ForeignPodsDetectMode::kOnlyExclusiveResources)
    return m_are_exclusive_(pod);
  return true;
}

void ForeignPodsDetector::OnPodAdd(const Pod& pod) { TrackPod_(pod, "add"); }

void ForeignPodsDetector::OnPodUpdate(const Pod& /*old_pod*/,
                                      const Pod& new_pod) {
  TrackPod_(new_pod, "update");
}

void ForeignPodsDetector::OnPodDelete(const Pod& pod) {
  TrackPod_(pod, "delete");
}

void ForeignPodsDetector::TrackPod_(const Pod& pod, std::string_view event) {
  if (!IsForeignPod(pod)) return;

  m_cache_->NodeHasForeignPods(pod.node_name(), pod);
  TOPO_TRACE("[{}] detected foreign pod on node {} ({})", util::PodLogId(pod),
             pod.node_name(), event);
}

}  // namespace Nrt
