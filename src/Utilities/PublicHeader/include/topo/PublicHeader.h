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

#include <spdlog/fmt/fmt.h>

#include <array>
#include <cstdint>
#include <expected>
#include <map>
#include <string>
#include <string_view>

#include "protos/Topology.pb.h"

#if !defined(TOPO_VERSION_STRING)
#  define TOPO_VERSION_STRING "Unknown"
#endif

using TopoErrCode = topo::api::ErrCode;

using TopoRichError = topo::api::RichError;

template <typename T>
using TopoExpected = std::expected<T, TopoErrCode>;

template <typename T>
using TopoExpectedRich = std::expected<T, TopoRichError>;

constexpr const char* kLogPattern =
    "[%^%L%$ %C-%m-%d %H:%M:%S.%e %s:%#][%n] %v";

inline const char* const kDefaultConfigPath = "/etc/topo/config.yaml";
inline const char* const kDefaultTopoCacheLogPath =
    "/var/log/topo/topocache.log";
inline const char* const kDefaultSchedulerProfileName = "topo-aware-scheduler";

inline constexpr uint64_t kDefaultTopoCacheMaxLogFileSize =
    1024 * 1024 * 50;  // 50 MB
inline constexpr uint64_t kDefaultTopoCacheMaxLogFileNum = 3;

inline constexpr int64_t kDefaultResyncPeriodSeconds = 5;

namespace Internal {
// clang-format off
constexpr std::array<std::string_view, topo::api::ErrCode_ARRAYSIZE>
    kTopoErrStrArr = {
        // 0 - 4
        "Success",
        "Generic failure",
        "Invalid parameter",
        "The object doesn't exist",
        "Failed to list objects",

        // 5 - 9
        "Failed to get object",
        "The operation was cancelled",
        "Malformed podset fingerprint",
        "Incompatible podset fingerprint version",
        "Podset fingerprint mismatch",
    };
// clang-format on
}  // namespace Internal

inline std::string_view TopoErrStr(TopoErrCode err) {
  return Internal::kTopoErrStrArr[static_cast<uint16_t>(err)];
}

template <typename... Args>
inline TopoRichError FormatRichErr(TopoErrCode code,
                                   std::string_view format_str,
                                   Args&&... args) {
  TopoRichError rich_err;

  rich_err.set_code(code);
  rich_err.set_description(
      fmt::format(fmt::runtime(format_str), std::forward<Args>(args)...));

  return rich_err;
}

/* ----------- Public definitions for all components */

using NodeName = std::string;

// "namespace/name", by which a pod is uniquely identified.
using PodKey = std::string;

inline const char* const kResourceCpu = "cpu";
inline const char* const kResourceMemory = "memory";
inline const char* const kResourceEphemeralStorage = "ephemeral-storage";
inline const char* const kResourcePods = "pods";
inline const char* const kResourceHugePagesPrefix = "hugepages-";
inline const char* const kResourceDefaultNamespacePrefix = "kubernetes.io/";

// Zone type of a NUMA cell in a NodeResourceTopology object.
inline const char* const kZoneTypeNode = "Node";

// Resource name -> quantity in canonical units. Ordered, so that dumps are
// stable.
using ResourceList = std::map<std::string, int64_t>;

ResourceList& operator+=(ResourceList& lhs, const ResourceList& rhs);

// Element-wise maximum, in place.
void SetMaxResourceList(ResourceList* lhs, const ResourceList& rhs);

bool IsHugePageResourceName(std::string_view name);

// Native resources are the ones without a domain prefix, or prefixed with
// "kubernetes.io/". Everything else is an extended (device) resource.
bool IsNativeResourceName(std::string_view name);

// cpu quantities are in millicores.
bool IsIntegralCpu(int64_t milli_cpu);
