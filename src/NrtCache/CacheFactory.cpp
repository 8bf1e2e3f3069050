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

#include "CacheFactory.h"

#include "OverReserve.h"
#include "Passthrough.h"
#include "PodProvider.h"

namespace Nrt {

TopoExpectedRich<NrtCacheBundle> MakeNrtCache(const Config& config,
                                              NrtClientInterface* client,
                                              PodListerInterface* pod_lister) {
  const auto& cache_conf = config.CacheConf;
  NrtCacheBundle bundle;

  if (cache_conf.ResyncPeriodSeconds <= 0) {
    if (client == nullptr)
      return std::unexpected(FormatRichErr(topo::api::ERR_INVALID_PARAM,
                                           "received null references"));

    TOPO_INFO("NodeTopology cache disabled, using Passthrough");
    bundle.cache = std::make_unique<Passthrough>(client);
    return bundle;
  }

  auto over_reserve = OverReserve::Create(
      cache_conf.Method, client, pod_lister,
      PodFilterForInformerMode(cache_conf.Informer));
  if (!over_reserve) return std::unexpected(over_reserve.error());

  OverReserve* ov = over_reserve.value().get();
  TOPO_INFO("NodeTopology cache enabled, informer mode {}, resync every {}s",
            InformerModeToStr(cache_conf.Informer),
            cache_conf.ResyncPeriodSeconds);

  bundle.cache = std::move(over_reserve.value());
  bundle.foreign_pods_detector = std::make_unique<ForeignPodsDetector>(
      cache_conf.ForeignPodsDetect, config.SchedulerProfileNames,
      bundle.cache.get());
  bundle.resyncer = std::make_unique<CacheResyncer>(
      [ov] { ov->Resync(); }, absl::Seconds(cache_conf.ResyncPeriodSeconds));

  return bundle;
}

}  // namespace Nrt
