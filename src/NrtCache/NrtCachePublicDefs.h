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

#include "NrtCachePreCompiledHeader.h"
// Precompiled header comes first!

namespace Nrt {

using topo::api::NodeResourceTopology;
using topo::api::NodeResourceTopologyList;
using topo::api::Pod;

// Which pods are covered by the fingerprint a node agent publishes.
enum class ResyncMethod : uint8_t {
  // Read the scope from the NodeResourceTopology object itself.
  kAutodetect = 0,
  kAll,
  kOnlyExclusiveResources,
};

enum class ForeignPodsDetectMode : uint8_t {
  kNone = 0,
  kAll,
  kOnlyExclusiveResources,
};

// How the pod lister is fed. A shared informer only sees the pods the
// scheduler already filtered, a dedicated one sees every pod of the cluster.
enum class InformerMode : uint8_t {
  kShared = 0,
  kDedicated,
};

std::string_view ResyncMethodToStr(ResyncMethod method);
std::string_view ForeignPodsDetectModeToStr(ForeignPodsDetectMode mode);
std::string_view InformerModeToStr(InformerMode mode);

std::optional<ResyncMethod> StrToResyncMethod(std::string_view str);
std::optional<ForeignPodsDetectMode> StrToForeignPodsDetectMode(
    std::string_view str);
std::optional<InformerMode> StrToInformerMode(std::string_view str);

struct Config {
  std::string TopoCacheDebugLevel{"info"};
  std::string TopoCacheLogFile{kDefaultTopoCacheLogPath};
  uint64_t MaxLogFileSize{kDefaultTopoCacheMaxLogFileSize};
  uint64_t MaxLogFileNum{kDefaultTopoCacheMaxLogFileNum};

  // Pods whose schedulerName is listed here are scheduled by us and never
  // considered foreign.
  std::vector<std::string> SchedulerProfileNames{kDefaultSchedulerProfileName};

  struct NodeResourceTopologyCache {
    // <= 0 disables caching.
    int64_t ResyncPeriodSeconds{kDefaultResyncPeriodSeconds};
    // Absent if the configuration doesn't set it.
    std::optional<ResyncMethod> Method;
    ForeignPodsDetectMode ForeignPodsDetect{ForeignPodsDetectMode::kAll};
    InformerMode Informer{InformerMode::kDedicated};
  };
  NodeResourceTopologyCache CacheConf;
};

TopoExpectedRich<Config> ParseConfig(const YAML::Node& config);

/**
 * Parse the file at path and install the logger it describes.
 * @return ERR_NON_EXISTENT if the file can't be opened, ERR_INVALID_PARAM if
 * it is malformed or the log file can't be created.
 */
TopoExpectedRich<Config> LoadConfigFile(const std::string& path);

// Install the async file logger with the level, path and rotation settings of
// config. The parent directory of the log file is created if needed.
TopoExpectedRich<void> InitLoggerFromConfig(const Config& config);

// A pod as seen by the fingerprint check.
struct PodData {
  std::string namespace_name;
  std::string name;
  bool has_exclusive_resources{false};
};

/**
 * Access to the NodeResourceTopology objects published by the node agents.
 * Implementations enforce their own timeouts.
 */
class NrtClientInterface {
 public:
  virtual ~NrtClientInterface() = default;

  virtual TopoExpectedRich<NodeResourceTopologyList>
  ListNodeResourceTopologies() = 0;

  /**
   * @return ERR_NON_EXISTENT if no object is published for the node.
   */
  virtual TopoExpectedRich<NodeResourceTopology> GetNodeResourceTopology(
      const NodeName& node_name) = 0;
};

class PodListerInterface {
 public:
  virtual ~PodListerInterface() = default;

  virtual TopoExpectedRich<std::vector<Pod>> ListPods() = 0;
};

// Whether a listed pod takes part in the fingerprint computation.
using PodFilterFunc =
    std::function<bool(const Pod& pod, std::string_view log_id)>;

// Whether a pod requests resources which are exclusively assigned to it.
using PodExclusivityFunc = std::function<bool(const Pod& pod)>;

}  // namespace Nrt
