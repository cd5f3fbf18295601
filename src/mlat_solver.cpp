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

#include <cmath>
#include <algorithm>
#include <glog/logging.h>

#include "mlat_track/mlat_common.hpp"
#include "mlat_track/mlat_solver.hpp"

namespace mlat_track
{
    /* validate solution against receivers and altitude limits -------------------*/
    static bool valid_solution(const std::vector<ClusterEntry> &cluster, const Eigen::Vector3d &pos)
    {
        for (const ClusterEntry &e : cluster)
        {
            if ((pos-e.receiver->pos).norm() > SOLVER_MAX_RANGE)
            {
                VLOG(2) << "solution too far from receiver " << e.receiver->id;
                return false;
            }
        }
        double h = ecef2geo(pos)(2);
        if (h < SOLVER_MIN_ALT || h > SOLVER_MAX_ALT)
        {
            VLOG(2) << "solution altitude out of range: " << h << " m";
            return false;
        }
        return true;
    }

    static bool near_receiver(const std::vector<ClusterEntry> &cluster, const Eigen::Vector3d &pos)
    {
        for (const ClusterEntry &e : cluster)
            if ((pos-e.receiver->pos).norm() < SOLVER_SEED_DIST) return true;
        return false;
    }

    bool PseudorangeSolver::solve(const std::vector<ClusterEntry> &cluster,
                                  const AltitudeAid &altitude, const Eigen::Vector3d &seed,
                                  MlatSolution &solution)
    {
        const int NX = 4;
        const int n = static_cast<int>(cluster.size());
        const int nm = n+(altitude.valid ? 1 : 0);

        if (n < 2 || nm < NX)
        {
            VLOG(2) << "insufficient measurements nm=" << nm;
            return false;
        }

        // pseudoranges relative to the earliest arrival
        const double t0 = cluster[0].timestamp;
        Eigen::VectorXd psr(n);
        for (int i = 0; i < n; ++i)
            psr(i) = (cluster[i].timestamp-t0)*CAIR;

        // a seed on top of a receiver has no line of sight to it; lift it to
        // the aided altitude, or a nominal cruise altitude without aiding
        Eigen::Vector4d x;
        x.head<3>() = seed;
        if (seed.norm() > 1000.0 && (altitude.valid || near_receiver(cluster, seed)))
        {
            Eigen::Vector3d lla = ecef2geo(seed);
            lla(2) = altitude.valid ? altitude.altitude : SOLVER_SEED_ALT;
            x.head<3>() = geo2ecef(lla);
        }
        double offset = 0.0;
        for (int i = 0; i < n; ++i)
            offset += psr(i)-(x.head<3>()-cluster[i].receiver->pos).norm();
        x(3) = offset/n;

        Eigen::MatrixXd H(nm, NX);
        Eigen::VectorXd v(nm), dx;
        Eigen::MatrixXd Q;
        int info;

        for (int iter = 0; iter < SOLVER_MAXITR; ++iter)
        {
            int nv = 0;
            for (int i = 0; i < n; ++i)
            {
                Eigen::Vector3d e = cluster[i].receiver->pos-x.head<3>();
                double r = e.norm();
                if (r <= 0.0) return false;
                e /= r;

                double sig = sqrt(std::max(cluster[i].variance, SOLVER_MIN_VAR))*CAIR;
                v(nv) = (psr(i)-(r+x(3)))/sig;
                H.row(nv) << -e(0)/sig, -e(1)/sig, -e(2)/sig, 1.0/sig;
                ++nv;
            }
            if (altitude.valid)
            {
                Eigen::Vector3d lla = ecef2geo(x.head<3>());
                Eigen::Vector3d up = geo_up(lla);
                double sig = std::max(altitude.error, 1.0);
                v(nv) = (altitude.altitude-lla(2))/sig;
                H.row(nv) << up(0)/sig, up(1)/sig, up(2)/sig, 0.0;
                ++nv;
            }

            if ((info = lsq(H, v, dx, Q)))
            {
                VLOG(2) << "lsq error info=" << info;
                return false;
            }
            x += dx;

            if (dx.norm() < 1E-4)
            {
                if (!valid_solution(cluster, x.head<3>())) return false;
                solution.ecef = x.head<3>();
                solution.ecef_cov = Q.topLeftCorner<3, 3>();
                solution.has_cov = solution.ecef_cov.allFinite();
                VLOG(2) << "converged after " << iter+1 << " iterations";
                return true;
            }
        }
        VLOG(2) << "no convergence after " << SOLVER_MAXITR << " iterations";
        return false;
    }
}   // namespace mlat_track
