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

namespace Nrt {

std::string_view ResyncMethodToStr(ResyncMethod method) {
  switch (method) {
  case ResyncMethod::kAutodetect:
    return "Autodetect";
  case ResyncMethod::kAll:
    return "All";
  case ResyncMethod::kOnlyExclusiveResources:
    return "OnlyExclusiveResources";
  }
  return "Unknown";
}

std::string_view ForeignPodsDetectModeToStr(ForeignPodsDetectMode mode) {
  switch (mode) {
  case ForeignPodsDetectMode::kNone:
    return "None";
  case ForeignPodsDetectMode::kAll:
    return "All";
  case ForeignPodsDetectMode::kOnlyExclusiveResources:
    return "OnlyExclusiveResources";
  }
  return "Unknown";
}

std::string_view InformerModeToStr(InformerMode mode) {
  switch (mode) {
  case InformerMode::kShared:
    return "Shared";
  case InformerMode::kDedicated:
    return "Dedicated";
  }
  return "Unknown";
}

std::optional<ResyncMethod> StrToResyncMethod(std::string_view str) {
  if (str == "Autodetect") return ResyncMethod::kAutodetect;
  if (str == "All") return ResyncMethod::kAll;
  if (str == "OnlyExclusiveResources")
    return ResyncMethod::kOnlyExclusiveResources;
  return std::nullopt;
}

std::optional<ForeignPodsDetectMode> StrToForeignPodsDetectMode(
    std::string_view str) {
  if (str == "None") return ForeignPodsDetectMode::kNone;
  if (str == "All") return ForeignPodsDetectMode::kAll;
  if (str == "OnlyExclusiveResources")
    return ForeignPodsDetectMode::kOnlyExclusiveResources;
  return std::nullopt;
}

std::optional<InformerMode> StrToInformerMode(std::string_view str) {
  if (str == "Shared") return InformerMode::kShared;
  if (str == "Dedicated") return InformerMode::kDedicated;
  return std::nullopt;
}

}  // namespace Nrt
