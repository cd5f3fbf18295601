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
#include <glog/logging.h>

#include "mlat_track/blacklist.hpp"

namespace mlat_track
{
    size_t Blacklist::reload()
    {
        std::set<std::string> entries;
        std::ifstream file(file_);
        std::string line;

        // one identity on the first line
        if (file.is_open() && std::getline(file, line))
        {
            const char *ws = " \t\r\n\f\v";
            size_t begin = line.find_first_not_of(ws);
            if (begin != std::string::npos)
            {
                size_t end = line.find_last_not_of(ws);
                entries.insert(line.substr(begin, end-begin+1));
            }
        }
        else if (!file.is_open())
        {
            VLOG(1) << "no blacklist file " << file_;
        }

        LOG(INFO) << "Read " << entries.size() << " blacklist entries";
        entries_.swap(entries);
        return entries_.size();
    }
}   // namespace mlat_track
