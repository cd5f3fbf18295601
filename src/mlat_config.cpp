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

#include <cstdlib>
#include <fstream>
#include <glog/logging.h>

#include "mlat_track/mlat_config.hpp"

namespace mlat_track
{
    static std::string trim(const std::string &s)
    {
        const char *ws = " \t\r\n";
        size_t begin = s.find_first_not_of(ws);
        if (begin == std::string::npos) return std::string();
        return s.substr(begin, s.find_last_not_of(ws)-begin+1);
    }

    static bool str2num(const std::string &s, double &value)
    {
        if (s.empty()) return false;
        char *end = nullptr;
        value = strtod(s.c_str(), &end);
        return end && *end == '\0';
    }

    bool readconfig(const std::string &file, MlatConfig &cfg)
    {
        std::ifstream fp(file);
        if (!fp.is_open())
        {
            LOG(ERROR) << "config file open error: " << file;
            return false;
        }

        std::string line;
        int lineno = 0;
        while (std::getline(fp, line))
        {
            ++lineno;
            size_t p = line.find('#');
            if (p != std::string::npos) line.erase(p);
            line = trim(line);
            if (line.empty()) continue;

            size_t eq = line.find('=');
            if (eq == std::string::npos)
            {
                LOG(ERROR) << file << ":" << lineno << ": missing '=': " << line;
                return false;
            }
            std::string key = trim(line.substr(0, eq));
            std::string value = trim(line.substr(eq+1));

            if (key == "mlat_delay")
            {
                double delay;
                if (!str2num(value, delay) || delay <= 0.0)
                {
                    LOG(ERROR) << file << ":" << lineno << ": invalid mlat_delay: " << value;
                    return false;
                }
                cfg.mlat_delay = delay;
            }
            else if (key == "blacklist_file")    cfg.blacklist_file = value;
            else if (key == "pseudorange_file")  cfg.pseudorange_file = value;
            else if (key == "receivers_file")    cfg.receivers_file = value;
            else if (key == "observations_file") cfg.observations_file = value;
            else if (key == "results_file")      cfg.results_file = value;
            else
            {
                LOG(WARNING) << file << ":" << lineno << ": unknown key ignored: " << key;
            }
        }
        return true;
    }
}   // namespace mlat_track
