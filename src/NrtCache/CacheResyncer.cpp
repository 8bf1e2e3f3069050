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

#include "CacheResyncer.h"

namespace Nrt {

CacheResyncer::CacheResyncer(std::function<void()> resync,
                             absl::Duration period)
    : m_resync_(std::move(resync)), m_period_(period) {}

CacheResyncer::~CacheResyncer() { Stop(); }

void CacheResyncer::Start() {
  if (m_resync_thread_.joinable()) return;

  {
    util::lock_guard guard(m_stop_mtx_);
    m_stop_ = false;
  }

  TOPO_INFO("Starting NodeTopology cache resync, period {}",
            absl::FormatDuration(m_period_));
  m_resync_thread_ = std::thread([this] { ResyncThread_(); });
}

void CacheResyncer::Stop() {
  {
    util::lock_guard guard(m_stop_mtx_);
    m_stop_ = true;
  }

  if (m_resync_thread_.joinable()) {
    m_resync_thread_.join();
    TOPO_TRACE("NodeTopology cache resync thread exited");
  }
}

void CacheResyncer::ResyncThread_() {
  util::SetCurrentThreadName("NrtResyncThr");

  absl::Condition cond(+[](bool* stop) { return *stop; }, &m_stop_);

  while (true) {
    bool stop = m_stop_mtx_.LockWhenWithTimeout(cond, m_period_);
    m_stop_mtx_.Unlock();
    if (stop) break;

    m_resync_();
  }
}

}  // namespace Nrt
