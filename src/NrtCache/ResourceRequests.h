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

// Requests of a container. A resource which only sets a limit requests as
// much as its limit.
ResourceList ContainerRequests(const topo::api::Container& container);

/**
 * The amount of resources a pod holds on its node: for each resource, the
 * larger of the sum over the app containers and the max over the init
 * containers, plus the pod overhead.
 */
ResourceList PodEffectiveRequests(const Pod& pod);

// Every container sets cpu and memory limits, and requests exactly that.
bool IsGuaranteedQos(const Pod& pod);

bool AreExclusiveForContainer(const topo::api::Container& container,
                              bool guaranteed);

/**
 * A pod gets exclusive resources if it is Guaranteed and asks for whole
 * cpus in some container, or if it asks for any device.
 */
bool AreExclusiveForPod(const Pod& pod);

}  // namespace Nrt
