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

#include "NrtCachePublicDefs.h"

#include <filesystem>

namespace Nrt {

TopoExpectedRich<Config> ParseConfig(const YAML::Node& config) {
  using util::YamlValueOr;
  Config conf;

  try {
    conf.TopoCacheDebugLevel =
        YamlValueOr(config["TopoCacheDebugLevel"], "info");
    if (!StrToLogLevel(conf.TopoCacheDebugLevel).has_value())
      return std::unexpected(
          FormatRichErr(topo::api::ERR_INVALID_PARAM,
                        "Illegal debug-level format: {}",
                        conf.TopoCacheDebugLevel));

    conf.TopoCacheLogFile =
        YamlValueOr(config["TopoCacheLogFile"], kDefaultTopoCacheLogPath);

    if (config["MaxLogFileSize"]) {
      auto file_size = util::ParseMemory(
          config["MaxLogFileSize"].as<std::string>());
      if (!file_size.has_value())
        return std::unexpected(
            FormatRichErr(topo::api::ERR_INVALID_PARAM,
                          "Illegal MaxLogFileSize: {}",
                          config["MaxLogFileSize"].as<std::string>()));
      conf.MaxLogFileSize = file_size.value();
    }

    conf.MaxLogFileNum = YamlValueOr<uint64_t>(config["MaxLogFileNum"],
                                               kDefaultTopoCacheMaxLogFileNum);

    if (config["SchedulerProfileNames"]) {
      conf.SchedulerProfileNames =
          config["SchedulerProfileNames"].as<std::vector<std::string>>();
    }

    if (config["NodeResourceTopologyCache"]) {
      const auto& cache_config = config["NodeResourceTopologyCache"];
      auto& cache_conf = conf.CacheConf;

      cache_conf.ResyncPeriodSeconds = YamlValueOr<int64_t>(
          cache_config["ResyncPeriodSeconds"], kDefaultResyncPeriodSeconds);

      if (cache_config["ResyncMethod"]) {
        std::string method = cache_config["ResyncMethod"].as<std::string>();
        cache_conf.Method = StrToResyncMethod(method);
        if (!cache_conf.Method.has_value())
          return std::unexpected(FormatRichErr(
              topo::api::ERR_INVALID_PARAM, "Unknown ResyncMethod: {}",
              method));
      }

      if (cache_config["ForeignPodsDetect"]) {
        std::string mode = cache_config["ForeignPodsDetect"].as<std::string>();
        auto detect_mode = StrToForeignPodsDetectMode(mode);
        if (!detect_mode.has_value())
          return std::unexpected(FormatRichErr(
              topo::api::ERR_INVALID_PARAM, "Unknown ForeignPodsDetect: {}",
              mode));
        cache_conf.ForeignPodsDetect = detect_mode.value();
      }

      if (cache_config["InformerMode"]) {
        std::string mode = cache_config["InformerMode"].as<std::string>();
        auto informer_mode = StrToInformerMode(mode);
        if (!informer_mode.has_value())
          return std::unexpected(FormatRichErr(
              topo::api::ERR_INVALID_PARAM, "Unknown InformerMode: {}", mode));
        cache_conf.Informer = informer_mode.value();
      }
    }
  } catch (YAML::Exception& e) {
    return std::unexpected(FormatRichErr(
        topo::api::ERR_INVALID_PARAM, "Error when parsing config: {}",
        e.what()));
  }

  return conf;
}

TopoExpectedRich<Config> LoadConfigFile(const std::string& path) {
  YAML::Node config;
  try {
    config = YAML::LoadFile(path);
  } catch (YAML::BadFile& e) {
    return std::unexpected(FormatRichErr(
        topo::api::ERR_NON_EXISTENT, "Can't open config file {}: {}", path,
        e.what()));
  } catch (YAML::Exception& e) {
    return std::unexpected(FormatRichErr(topo::api::ERR_INVALID_PARAM,
                                         "Malformed config file {}: {}", path,
                                         e.what()));
  }

  auto conf = ParseConfig(config);
  if (!conf) return std::unexpected(conf.error());

  auto logger = InitLoggerFromConfig(conf.value());
  if (!logger) return std::unexpected(logger.error());

  return conf;
}

TopoExpectedRich<void> InitLoggerFromConfig(const Config& config) {
  auto level = StrToLogLevel(config.TopoCacheDebugLevel);
  if (!level.has_value())
    return std::unexpected(FormatRichErr(topo::api::ERR_INVALID_PARAM,
                                         "Illegal debug-level format: {}",
                                         config.TopoCacheDebugLevel));

  std::filesystem::path log_path(config.TopoCacheLogFile);
  if (log_path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(log_path.parent_path(), ec);
    if (ec)
      return std::unexpected(FormatRichErr(
          topo::api::ERR_INVALID_PARAM, "Can't create log folder {}: {}",
          log_path.parent_path().string(), ec.message()));
  }

  try {
    InitLogger(level.value(), config.TopoCacheLogFile, false,
               config.MaxLogFileSize, config.MaxLogFileNum);
  } catch (spdlog::spdlog_ex& e) {
    return std::unexpected(FormatRichErr(topo::api::ERR_INVALID_PARAM,
                                         "Can't open log file {}: {}",
                                         config.TopoCacheLogFile, e.what()));
  }

  TOPO_INFO("TopoCache logger initialized, level {}, file {}",
            config.TopoCacheDebugLevel, config.TopoCacheLogFile);
  return {};
}

}  // namespace Nrt
