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

#include "CacheResyncer.h"
#include "ForeignPods.h"
#include "NrtCache.h"

namespace Nrt {

struct NrtCacheBundle {
  std::unique_ptr<NrtCacheInterface> cache;

  // Both are null unless caching is enabled. The resyncer is not started.
  std::unique_ptr<ForeignPodsDetector> foreign_pods_detector;
  std::unique_ptr<CacheResyncer> resyncer;
};

/**
 * Build the cache described by config. A non-positive resync period disables
 * caching, and every read goes to client.
 * client and pod_lister must outlive the bundle.
 */
TopoExpectedRich<NrtCacheBundle> MakeNrtCache(const Config& config,
                                              NrtClientInterface* client,
                                              PodListerInterface* pod_lister);

}  // namespace Nrt
