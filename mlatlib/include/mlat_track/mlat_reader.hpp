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
*
* This file provides readers of the receiver and observation text files
* replayed by mlat_replay.
*/

#ifndef MLAT_READER_HPP_
#define MLAT_READER_HPP_

#include <vector>
#include <string>
#include <cstdint>

#include "mlat_constant.hpp"
#include "mlat_registry.hpp"
#include "clock_norm.hpp"

namespace mlat_track
{
    struct ObsRecord                                /* one received message copy */
    {
        double      arrival;                        /* arrival time at the server (s) */
        uint32_t    rcv_id;                         /* receiver id */
        double      timestamp;                      /* raw receiver timestamp (s) */
        std::string message;                        /* raw message bytes */
    };

    /* Read receivers file ---------------------------------------------------------------------
    * line format: id user lat_deg lon_deg height_m clock_domain offset_s variance_s2
    * args   : const std::string& file      I   receivers file
    *          ReceiverRegistry& registry   IO  receiver registry
    *          ClockDomainNormalizer& clock_norm IO clock domains of the receivers
    * return : bool - true if success, false otherwise
    * notes  : empty lines and lines starting with '#' are skipped
    *---------------------------------------------------------------------------------------*/
    bool readrcv(const std::string& file, ReceiverRegistry& registry,
                 ClockDomainNormalizer& clock_norm);

    /* Read observation file -------------------------------------------------------------------
    * line format: arrival_s receiver_id timestamp_s hex_message
    * args   : const std::string& file      I   observation file
    *          std::vector<ObsRecord>& obs  O   observations sorted by arrival time
    * return : bool - true if success, false otherwise
    *---------------------------------------------------------------------------------------*/
    bool readobs(const std::string& file, std::vector<ObsRecord>& obs);

    /* Sort observations by arrival time (stable) */
    size_t sortobs(std::vector<ObsRecord>& obs);
}   // namespace mlat_track

#endif
