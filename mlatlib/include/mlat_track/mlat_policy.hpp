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

#ifndef MLAT_POLICY_HPP_
#define MLAT_POLICY_HPP_

#include <vector>

#include "mlat_constant.hpp"
#include "mlat_registry.hpp"
#include "mlat_solver.hpp"

namespace mlat_track
{
    /* prior result of an aircraft at time now (valid=false: none or expired) */
    PriorResult recall_prior(const Aircraft &ac, double now);

    /* altitude accuracy model -----------------------------------------------------
    * args   : Aircraft ac           I   aircraft state
    *          double now           I   monotonic time (s)
    *          AltitudeAid altitude O   altitude aid (metres)
    * return : minimum number of distinct receivers for a solution (3 or 4)
    *-----------------------------------------------------------------------------*/
    int altitude_model(const Aircraft &ac, double now, AltitudeAid &altitude);

    /* true if nrcv receivers cannot improve on a recent prior */
    bool rate_limited(const PriorResult &prior, int nrcv);

    /* select result ---------------------------------------------------------------
    * pick the best cluster, solve it and gate the solution against the prior
    * args   : std::vector<Cluster> clusters    IO  candidate clusters (consumed)
    *          PriorResult prior        I   prior result
    *          AltitudeAid altitude     I   altitude aid
    *          double mlat_delay        I   resolution delay (s)
    *          MlatSolver solver        I   geometric solver
    *          Cluster accepted         O   accepted cluster
    *          MlatSolution solution    O   accepted solution
    *          double var_est           O   variance estimate (m^2)
    * return : status (true:accepted, false:nothing accepted)
    *-----------------------------------------------------------------------------*/
    bool select_result(std::vector<Cluster> &clusters, const PriorResult &prior,
                       const AltitudeAid &altitude, double mlat_delay, MlatSolver &solver,
                       Cluster &accepted, MlatSolution &solution, double &var_est);
}   // namespace mlat_track

#endif
