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

// Calls the resync step every period on its own thread, so that calls are
// never concurrent.
class CacheResyncer {
 public:
  CacheResyncer(std::function<void()> resync, absl::Duration period);

  // Stops the thread if it is running.
  ~CacheResyncer();

  CacheResyncer(const CacheResyncer&) = delete;
  CacheResyncer& operator=(const CacheResyncer&) = delete;

  void Start();

  // Returns once the running resync step, if any, is done.
  void Stop();

 private:
  void ResyncThread_();

  std::function<void()> m_resync_;
  absl::Duration m_period_;

  util::mutex m_stop_mtx_;
  bool m_stop_ ABSL_GUARDED_BY(m_stop_mtx_){false};

  std::thread m_resync_thread_;
};

}  // namespace Nrt
