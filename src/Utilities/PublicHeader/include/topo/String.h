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

#include <absl/strings/str_join.h>
#include <spdlog/fmt/fmt.h>
#include <yaml-cpp/yaml.h>

#include <concepts>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "topo/PublicHeader.h"

namespace util {

template <typename T = std::string, typename YamlNode, typename DefaultType>
  requires requires(const YamlNode &node) {
    { node.template as<T>() };
  } && std::convertible_to<DefaultType, T>
T YamlValueOr(const YamlNode &node, const DefaultType &default_value) {
  return node ? node.template as<T>() : default_value;
}

std::string ReadableMemory(uint64_t memory_bytes);

// Accepts plain byte counts and the K/M/G suffixes, e.g. "50M".
std::optional<uint64_t> ParseMemory(const std::string &mem);

// e.g. "cpu=2000,memory=1G,vendor.com/gpu=1"
std::string ReadableResourceList(const ResourceList &resources);

// Render the resources of every zone of a NodeResourceTopology object.
std::string ReadableNrtResources(const topo::api::NodeResourceTopology &nrt);

void SetCurrentThreadName(const std::string &name);

/* ---------------- Log IDs ---------------- */

PodKey PodLogId(const topo::api::Pod &pod);

// A log ID for flows not bound to a single pod.
std::string TimeLogId(std::string_view prefix);

}  // namespace util
