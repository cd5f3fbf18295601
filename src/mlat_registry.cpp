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

#include <glog/logging.h>

#include "mlat_track/mlat_registry.hpp"

namespace mlat_track
{
    AircraftPtr AircraftTracker::add(uint32_t icao)
    {
        std::map<uint32_t, AircraftPtr>::iterator it = aircraft_.find(icao);
        if (it != aircraft_.end()) return it->second;

        AircraftPtr ac(new Aircraft());
        ac->icao = icao;
        aircraft_.emplace(icao, ac);
        return ac;
    }

    AircraftPtr AircraftTracker::find(uint32_t icao) const
    {
        std::map<uint32_t, AircraftPtr>::const_iterator it = aircraft_.find(icao);
        return it == aircraft_.end() ? nullptr : it->second;
    }

    bool AircraftTracker::remove(uint32_t icao)
    {
        return aircraft_.erase(icao) > 0;
    }

    ReceiverPtr ReceiverRegistry::add(uint32_t id, const std::string &user,
                                      const Eigen::Vector3d &pos)
    {
        if (receivers_.count(id))
        {
            LOG(WARNING) << "receiver " << id << " already registered";
            return nullptr;
        }

        ReceiverPtr rcv(new Receiver());
        rcv->id = id;
        rcv->user = user;
        rcv->pos = pos;
        for (auto &kv : receivers_)
        {
            double d = (kv.second->pos-pos).norm();
            rcv->distance[kv.first] = d;
            kv.second->distance[id] = d;
        }
        rcv->distance[id] = 0.0;
        receivers_.emplace(id, rcv);
        return rcv;
    }

    ReceiverPtr ReceiverRegistry::find(uint32_t id) const
    {
        std::map<uint32_t, ReceiverPtr>::const_iterator it = receivers_.find(id);
        return it == receivers_.end() ? nullptr : it->second;
    }

    bool ReceiverRegistry::remove(uint32_t id)
    {
        std::map<uint32_t, ReceiverPtr>::iterator it = receivers_.find(id);
        if (it == receivers_.end()) return false;

        for (auto &kv : receivers_)
            kv.second->distance.erase(id);
        receivers_.erase(it);
        return true;
    }
}   // namespace mlat_track
