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

#ifndef MLAT_CONFIG_HPP_
#define MLAT_CONFIG_HPP_

#include <string>

#include "mlat_constant.hpp"

namespace mlat_track
{
    struct MlatConfig
    {
        double      mlat_delay;                     /* resolution delay after first copy (s) */
        std::string blacklist_file;                 /* operator blacklist file */
        std::string pseudorange_file;               /* pseudorange log ("":off) */
        std::string receivers_file;                 /* receivers file (replay) */
        std::string observations_file;              /* observations file (replay) */
        std::string results_file;                   /* results output file (replay, "":off) */

        MlatConfig()
            : mlat_delay(MLAT_DELAY), blacklist_file("mlat-blacklist.txt") {}
    };

    /* read configuration ----------------------------------------------------------
    * read "key = value" lines, '#' starts a comment
    * args   : std::string file         I   configuration file
    *          MlatConfig cfg           IO  configuration (unset keys keep defaults)
    * return : status (true:ok, false:file or value error)
    *-----------------------------------------------------------------------------*/
    bool readconfig(const std::string &file, MlatConfig &cfg);
}   // namespace mlat_track

#endif
