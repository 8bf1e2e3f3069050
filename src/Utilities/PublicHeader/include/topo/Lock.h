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

#include <absl/synchronization/mutex.h>

namespace util {

class ABSL_SCOPED_LOCKABLE AbslMutexLockGuard {
 private:
  absl::Mutex& m;

 public:
  explicit AbslMutexLockGuard(absl::Mutex& m_) ABSL_EXCLUSIVE_LOCK_FUNCTION(m_)
      : m(m_) {
    m.Lock();
  }

  ~AbslMutexLockGuard() ABSL_UNLOCK_FUNCTION() { m.Unlock(); }

  AbslMutexLockGuard(AbslMutexLockGuard const&) = delete;
  AbslMutexLockGuard& operator=(AbslMutexLockGuard const&) = delete;
};

using mutex = absl::Mutex;
using lock_guard = AbslMutexLockGuard;

}  // namespace util
