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

#ifndef MLAT_CLUSTER_HPP_
#define MLAT_CLUSTER_HPP_

#include <vector>

#include "mlat_constant.hpp"

namespace mlat_track
{
    /* distance between two receivers (m), cached pair distance when registered */
    double receiver_distance(const Receiver &a, const Receiver &b);

    /* upper bound of the arrival time difference between two receivers
       separated by distance (m), including slop (s) */
    double max_propagation_delay(double distance);

    /* cluster timestamps ----------------------------------------------------------
    * partition one component of comparable timestamps into clusters that are
    * consistent with a single transmission
    * args   : NormComponent component  I   normalized timestamps of one component
    *          int    min_receivers     I   min distinct receivers of a kept cluster
    *          std::vector<Cluster> clusters O  clusters found (appended)
    * return : number of clusters appended
    * notes  : each cluster holds at most one timestamp per receiver, every pair
    *          satisfies max_propagation_delay(), entries in ascending time
    *-----------------------------------------------------------------------------*/
    int cluster_timestamps(const NormComponent &component, int min_receivers,
                           std::vector<Cluster> &clusters);
}   // namespace mlat_track

#endif
