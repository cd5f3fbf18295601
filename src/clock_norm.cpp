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

#include <algorithm>
#include <glog/logging.h>

#include "mlat_track/clock_norm.hpp"

namespace mlat_track
{
    void ClockDomainNormalizer::set_clock(uint32_t rcv_id, uint32_t domain, double offset,
                                          double variance)
    {
        ClockInfo info;
        info.domain = domain;
        info.offset = offset;
        info.variance = variance;
        clocks_[rcv_id] = info;
    }

    bool ClockDomainNormalizer::remove_clock(uint32_t rcv_id)
    {
        return clocks_.erase(rcv_id) > 0;
    }

    void ClockDomainNormalizer::normalize(const TimestampMap &timestamp_map,
                                          std::vector<NormComponent> &components)
    {
        components.clear();
        std::map<uint32_t, NormComponent> by_domain;

        for (const auto &kv : timestamp_map)
        {
            std::map<uint32_t, ClockInfo>::const_iterator it = clocks_.find(kv.first);
            if (it == clocks_.end())
            {
                VLOG(2) << "receiver " << kv.first << " has no clock domain, skipped";
                continue;
            }
            NormTimestamps norm;
            norm.receiver = kv.second.receiver;
            norm.variance = it->second.variance;
            for (double t : kv.second.timestamps)
                norm.timestamps.push_back(t-it->second.offset);
            std::sort(norm.timestamps.begin(), norm.timestamps.end());
            by_domain[it->second.domain][kv.first] = norm;
        }

        for (auto &kv : by_domain)
            components.push_back(kv.second);
    }
}   // namespace mlat_track
