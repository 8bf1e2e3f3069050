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

bool IsPodRelevantAlways(const Pod& pod, std::string_view log_id);

// The shared informer hands out every pod it sees, keep the running ones.
bool IsPodRelevantShared(const Pod& pod, std::string_view log_id);

// Pending and unbound pods don't run on any node yet.
bool IsPodRelevantDedicated(const Pod& pod, std::string_view log_id);

PodFilterFunc PodFilterForInformerMode(InformerMode mode);

}  // namespace Nrt
