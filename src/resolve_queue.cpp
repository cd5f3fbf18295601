/**
* This file is part of mlatlib.
*
* Copyright (C) 2024 The mlatlib developers
* Author: mlatlib contributors
*
* mlatlib is free software: you can redistribute it and/or modify
* it under the terms of the GNU General Public License as published by
* the Free Software Foundation, either version 3 of the License, or
* (at your option) any later version.
*
* mlatlib is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
* GNU General Public License for more details.
*
* You should have received a copy of the GNU General Public License
* along with mlatlib. If not, see <http://www.gnu.org/licenses/>.
*/

#include <chrono>

#include "mlat_track/resolve_queue.hpp"

namespace mlat_track
{
    double SystemClock::now() const
    {
        return std::chrono::duration<double>(
            std::chrono::steady_clock::now().time_since_epoch()).count();
    }

    double SystemClock::wall_time() const
    {
        return std::chrono::duration<double>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    uint64_t ResolveQueue::schedule(double deadline, const std::string &key)
    {
        uint64_t handle = next_handle_++;
        queue_.emplace(QueueKey(deadline, handle), key);
        return handle;
    }

    bool ResolveQueue::pop_due(double now, std::string &key, uint64_t *handle)
    {
        if (queue_.empty()) return false;
        std::map<QueueKey, std::string>::iterator it = queue_.begin();
        if (it->first.first > now) return false;

        key = it->second;
        if (handle) *handle = it->first.second;
        queue_.erase(it);
        return true;
    }

    bool ResolveQueue::next_deadline(double &deadline) const
    {
        if (queue_.empty()) return false;
        deadline = queue_.begin()->first.first;
        return true;
    }
}   // namespace mlat_track
