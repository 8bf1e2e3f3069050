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

#include "topo/String.h"

#include <absl/strings/ascii.h>
#include <absl/time/clock.h>
#include <pthread.h>

#include <charconv>
#include <limits>
#include <vector>

#include "topo/Logger.h"

namespace util {

std::string ReadableMemory(uint64_t memory_bytes) {
  if (memory_bytes < 1024)
    return fmt::format("{}B", memory_bytes);
  else if (memory_bytes < 1024 * 1024)
    return fmt::format("{}K", memory_bytes / 1024);
  else if (memory_bytes < 1024 * 1024 * 1024)
    return fmt::format("{}M", memory_bytes / 1024 / 1024);
  else
    return fmt::format("{}G", memory_bytes / 1024 / 1024 / 1024);
}

std::optional<uint64_t> ParseMemory(const std::string &mem) {
  absl::string_view str = absl::StripAsciiWhitespace(mem);
  if (str.empty()) return std::nullopt;

  uint64_t multiplier = 1;
  switch (absl::ascii_toupper(str.back())) {
  case 'K':
    multiplier = 1024;
    break;
  case 'M':
    multiplier = 1024 * 1024;
    break;
  case 'G':
    multiplier = 1024 * 1024 * 1024;
    break;
  default:
    break;
  }
  if (multiplier != 1) str.remove_suffix(1);

  uint64_t value = 0;
  auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
  if (ec != std::errc() || ptr != str.data() + str.size()) return std::nullopt;

  if (value > std::numeric_limits<uint64_t>::max() / multiplier)
    return std::nullopt;

  return value * multiplier;
}

std::string ReadableResourceList(const ResourceList &resources) {
  std::vector<std::string> res_str_vec;
  res_str_vec.reserve(resources.size());
  for (const auto &[name, qty] : resources) {
    if (name == kResourceMemory || IsHugePageResourceName(name))
      res_str_vec.push_back(fmt::format(
          "{}={}", name, ReadableMemory(static_cast<uint64_t>(qty))));
    else
      res_str_vec.push_back(fmt::format("{}={}", name, qty));
  }
  return absl::StrJoin(res_str_vec, ",");
}

std::string ReadableNrtResources(const topo::api::NodeResourceTopology &nrt) {
  std::vector<std::string> zone_str_vec;
  zone_str_vec.reserve(nrt.zones_size());
  for (const auto &zone : nrt.zones()) {
    std::vector<std::string> res_str_vec;
    for (const auto &res : zone.resources())
      res_str_vec.push_back(fmt::format("{}={}/{}", res.name(), res.available(),
                                        res.allocatable()));
    zone_str_vec.push_back(
        fmt::format("{}:[{}]", zone.name(), absl::StrJoin(res_str_vec, ",")));
  }
  return fmt::format("{}={{{}}}", nrt.name(), absl::StrJoin(zone_str_vec, " "));
}

void SetCurrentThreadName(const std::string &name) {
  // The thread name is not allowed to exceed 16 characters including '\0'.
  if (name.size() >= 16) {
    TOPO_ERROR("Thread name cannot exceed 16 character!");
    return;
  }

  pthread_setname_np(pthread_self(), name.c_str());
}

PodKey PodLogId(const topo::api::Pod &pod) {
  return fmt::format("{}/{}", pod.namespace_name(), pod.name());
}

std::string TimeLogId(std::string_view prefix) {
  return fmt::format("{}{}", prefix, absl::ToUnixMillis(absl::Now()));
}

}  // namespace util
