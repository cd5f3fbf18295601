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

#ifndef MLAT_BLACKLIST_HPP_
#define MLAT_BLACKLIST_HPP_

#include <set>
#include <string>

namespace mlat_track
{
    /* operator identities whose receivers are excluded from multilateration */
    class Blacklist
    {
    public:
        explicit Blacklist(const std::string &file) : file_(file) {}

        /* re-read the blacklist file, returns the number of entries */
        size_t reload();
        bool contains(const std::string &user) const { return entries_.count(user) > 0; }
        const std::set<std::string> &entries() const { return entries_; }
        const std::string &file() const { return file_; }
        size_t size() const { return entries_.size(); }

    private:
        std::string file_;
        std::set<std::string> entries_;
    };
}   // namespace mlat_track

#endif
