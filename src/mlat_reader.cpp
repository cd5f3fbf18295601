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

#include <fstream>
#include <sstream>
#include <algorithm>
#include <glog/logging.h>

#include "mlat_track/mlat_common.hpp"
#include "mlat_track/mlat_reader.hpp"

namespace mlat_track
{
    /* strip comment and blank lines (false: nothing left) */
    static bool dataline(std::string &line)
    {
        size_t p = line.find('#');
        if (p != std::string::npos) line.erase(p);
        return line.find_first_not_of(" \t\r\n") != std::string::npos;
    }

    bool readrcv(const std::string& file, ReceiverRegistry& registry,
                 ClockDomainNormalizer& clock_norm)
    {
        std::ifstream fp(file);
        if (!fp.is_open())
        {
            LOG(ERROR) << "receivers file open error: " << file;
            return false;
        }

        std::string line;
        int lineno = 0, nrcv = 0;
        while (std::getline(fp, line))
        {
            ++lineno;
            if (!dataline(line)) continue;

            std::istringstream ss(line);
            uint32_t id, domain;
            std::string user;
            double lat, lon, height, offset, variance;
            if (!(ss >> id >> user >> lat >> lon >> height >> domain >> offset >> variance))
            {
                LOG(ERROR) << file << ":" << lineno << ": bad receiver line: " << line;
                return false;
            }
            if (!registry.add(id, user, geo2ecef(Eigen::Vector3d(lat, lon, height))))
            {
                LOG(ERROR) << file << ":" << lineno << ": duplicate receiver " << id;
                return false;
            }
            clock_norm.set_clock(id, domain, offset, variance);
            ++nrcv;
        }
        LOG(INFO) << "read " << nrcv << " receivers from " << file;
        return true;
    }

    bool readobs(const std::string& file, std::vector<ObsRecord>& obs)
    {
        std::ifstream fp(file);
        if (!fp.is_open())
        {
            LOG(ERROR) << "observation file open error: " << file;
            return false;
        }

        obs.clear();
        std::string line;
        int lineno = 0;
        while (std::getline(fp, line))
        {
            ++lineno;
            if (!dataline(line)) continue;

            std::istringstream ss(line);
            ObsRecord rec;
            std::string hex;
            if (!(ss >> rec.arrival >> rec.rcv_id >> rec.timestamp >> hex) ||
                hex2bytes(hex, rec.message))
            {
                LOG(ERROR) << file << ":" << lineno << ": bad observation line: " << line;
                return false;
            }
            obs.push_back(rec);
        }
        sortobs(obs);
        LOG(INFO) << "read " << obs.size() << " observations from " << file;
        return true;
    }

    size_t sortobs(std::vector<ObsRecord>& obs)
    {
        std::stable_sort(obs.begin(), obs.end(),
                         [](const ObsRecord &a, const ObsRecord &b) { return a.arrival < b.arrival; });
        return obs.size();
    }
}   // namespace mlat_track
