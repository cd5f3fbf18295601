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

#ifndef MLAT_REGISTRY_HPP_
#define MLAT_REGISTRY_HPP_

#include <map>
#include <vector>
#include <string>
#include <memory>
#include <cstdint>

#include "mlat_constant.hpp"

namespace mlat_track
{
    /* aircraft track smoother, updated with every accepted result */
    class TrackFilter
    {
    public:
        virtual ~TrackFilter() = default;
        virtual void update(double first_seen, const std::vector<ClusterEntry> &cluster,
                            const AltitudeAid &altitude, const MlatSolution &solution,
                            int distinct) = 0;
    };
    typedef std::shared_ptr<TrackFilter> TrackFilterPtr;

    struct Aircraft
    {
        uint32_t    icao = 0;                       /* ICAO address */
        bool        has_altitude = false;
        double      altitude = 0.0;                 /* last reported pressure altitude (ft) */
        double      last_altitude_time = 0.0;       /* monotonic time of that report (s) */
        bool        has_squawk = false;
        uint16_t    squawk = 0;
        bool        has_callsign = false;
        std::string callsign;
        bool        has_result = false;             /* last_result present */
        AcceptedResult last_result;                 /* last accepted result */
        TrackFilterPtr kalman;                      /* track smoother (may be null) */
    };
    typedef std::shared_ptr<Aircraft> AircraftPtr;

    class AircraftTracker
    {
    public:
        /* register an aircraft, returns the existing entry when already known */
        AircraftPtr add(uint32_t icao);
        AircraftPtr find(uint32_t icao) const;
        bool remove(uint32_t icao);
        size_t size() const { return aircraft_.size(); }
        const std::map<uint32_t, AircraftPtr> &aircraft() const { return aircraft_; }

    private:
        std::map<uint32_t, AircraftPtr> aircraft_;
    };

    class ReceiverRegistry
    {
    public:
        /* add receiver -------------------------------------------------------------
        * register a receiver and compute its distance to every known receiver
        * args   : uint32_t id              I   receiver id
        *          std::string user         I   operator identity
        *          Eigen::Vector3d pos      I   receiver position (ecef) (m)
        * return : new receiver (NULL: id already registered)
        *---------------------------------------------------------------------------*/
        ReceiverPtr add(uint32_t id, const std::string &user, const Eigen::Vector3d &pos);
        ReceiverPtr find(uint32_t id) const;
        bool remove(uint32_t id);
        size_t size() const { return receivers_.size(); }

    private:
        std::map<uint32_t, ReceiverPtr> receivers_;
    };
}   // namespace mlat_track

#endif
