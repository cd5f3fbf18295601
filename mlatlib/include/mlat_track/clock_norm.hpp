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

#ifndef MLAT_CLOCK_NORM_HPP_
#define MLAT_CLOCK_NORM_HPP_

#include <map>
#include <vector>
#include <memory>
#include <cstdint>

#include "mlat_constant.hpp"

namespace mlat_track
{
    /* converts raw receiver timestamps into independent components of
       mutually comparable timestamps */
    class ClockNormalizer
    {
    public:
        virtual ~ClockNormalizer() = default;
        virtual void normalize(const TimestampMap &timestamp_map,
                               std::vector<NormComponent> &components) = 0;
    };
    typedef std::shared_ptr<ClockNormalizer> ClockNormalizerPtr;

    /* receivers disciplined to known common timebases (e.g. GPS) */
    class ClockDomainNormalizer : public ClockNormalizer
    {
    public:
        /* assign receiver clock to a domain with offset (s) and variance (s^2) */
        void set_clock(uint32_t rcv_id, uint32_t domain, double offset, double variance);
        bool remove_clock(uint32_t rcv_id);
        size_t size() const { return clocks_.size(); }

        void normalize(const TimestampMap &timestamp_map,
                       std::vector<NormComponent> &components) override;

    private:
        struct ClockInfo
        {
            uint32_t    domain;                     /* clock domain id */
            double      offset;                     /* clock offset to domain time (s) */
            double      variance;                   /* timestamp variance (s^2) */
        };
        std::map<uint32_t, ClockInfo> clocks_;
    };
}   // namespace mlat_track

#endif
