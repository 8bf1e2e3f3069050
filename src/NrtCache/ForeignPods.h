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

#include "NrtCache.h"
#include "ResourceRequests.h"

namespace Nrt {

/**
 * Watches pod events and marks the nodes running pods which were not placed
 * by one of our scheduler profiles. Their resources never went through our
 * reservations, so the cached view of these nodes can't be trusted.
 */
class ForeignPodsDetector {
 public:
  ForeignPodsDetector(ForeignPodsDetectMode mode,
                      const std::vector<std::string>& scheduler_profile_names,
                      NrtCacheInterface* cache,
                      PodExclusivityFunc are_exclusive = AreExclusiveForPod);

  bool IsForeignPod(const Pod& pod) const;

  void OnPodAdd(const Pod& pod);
  void OnPodUpdate(const Pod& old_pod, const Pod& new_pod);
  void OnPodDelete(const Pod& pod);

  ForeignPodsDetectMode Mode() const { return m_mode_; }

 private:
  void TrackPod_(const Pod& pod, std::string_view event);

  ForeignPodsDetectMode m_mode_;
  absl::flat_hash_set<std::string> m_scheduler_profile_names_;
  NrtCacheInterface* m_cache_;
  PodExclusivityFunc m_are_exclusive_;
};

}  // namespace Nrt
