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

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#define TOPO_LOG_LEVEL_TRACE 0
#define TOPO_LOG_LEVEL_DEBUG 1
#define TOPO_LOG_LEVEL_INFO 2
#define TOPO_LOG_LEVEL_WARN 3
#define TOPO_LOG_LEVEL_ERROR 4
#define TOPO_LOG_LEVEL_CRITICAL 5
#define TOPO_LOG_LEVEL_OFF 6

#if !defined(TOPO_LOG_LEVEL)
#  if defined(NDEBUG)
#    define TOPO_LOG_LEVEL TOPO_LOG_LEVEL_INFO
#  else
#    define TOPO_LOG_LEVEL TOPO_LOG_LEVEL_TRACE
#  endif
#endif

#define SPDLOG_ACTIVE_LEVEL TOPO_LOG_LEVEL

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>
#include <spdlog/spdlog.h>

// Must be after the static log level definition
#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "PublicHeader.h"

#define TOPO_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define TOPO_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define TOPO_INFO(...) SPDLOG_INFO(__VA_ARGS__)
#define TOPO_WARN(...) SPDLOG_WARN(__VA_ARGS__)
#define TOPO_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
#define TOPO_CRITICAL(...) SPDLOG_CRITICAL(__VA_ARGS__)

struct LoggerSinks {
  std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> file_sink;
  std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink;
};

std::optional<spdlog::level::level_enum> StrToLogLevel(
    const std::string& level);

void InitLogger(spdlog::level::level_enum level,
                const std::string& log_file_path, bool enable_console,
                uint64_t max_file_size = kDefaultTopoCacheMaxLogFileSize,
                uint64_t max_file_num = kDefaultTopoCacheMaxLogFileNum);

// Custom type formatting
namespace fmt {

template <>
struct formatter<topo::api::ErrCode> : formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const topo::api::ErrCode& v, FormatContext& ctx) const {
    return formatter<std::string_view>::format(
        topo::api::ErrCode_Name(v), ctx);
  }
};

template <>
struct formatter<topo::api::RichError> {
  template <typename ParseContext>
  constexpr auto parse(ParseContext& ctx) {
    return ctx.begin();
  };

  template <typename FormatContext>
  auto format(const topo::api::RichError& v, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "{}: {}",
                          topo::api::ErrCode_Name(v.code()), v.description());
  }
};

}  // namespace fmt
