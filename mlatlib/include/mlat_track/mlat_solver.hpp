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

#ifndef MLAT_SOLVER_HPP_
#define MLAT_SOLVER_HPP_

#include <vector>
#include <memory>

#include "mlat_constant.hpp"

namespace mlat_track
{
    /* geometric position solver of one cluster */
    class MlatSolver
    {
    public:
        virtual ~MlatSolver() = default;
        /* solve ----------------------------------------------------------------------
        * args   : std::vector<ClusterEntry> cluster  I  cluster (ascending timestamps)
        *          AltitudeAid altitude     I   altitude aid (valid=false: none)
        *          Eigen::Vector3d seed     I   initial position (ecef) (m)
        *          MlatSolution solution    O   position and covariance
        * return : status (true:estimate, false:no estimate)
        *---------------------------------------------------------------------------*/
        virtual bool solve(const std::vector<ClusterEntry> &cluster, const AltitudeAid &altitude,
                           const Eigen::Vector3d &seed, MlatSolution &solution) = 0;
    };
    typedef std::shared_ptr<MlatSolver> MlatSolverPtr;

    /* iterative weighted least squares over pseudoranges, unknowns x,y,z and
       the common range offset. a seed within SOLVER_SEED_DIST of a receiver
       is lifted to the aided or nominal altitude first */
    class PseudorangeSolver : public MlatSolver
    {
    public:
        bool solve(const std::vector<ClusterEntry> &cluster, const AltitudeAid &altitude,
                   const Eigen::Vector3d &seed, MlatSolution &solution) override;
    };
}   // namespace mlat_track

#endif
