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

#include <algorithm>
#include <glog/logging.h>

#include "mlat_track/mlat_policy.hpp"

namespace mlat_track
{
    PriorResult recall_prior(const Aircraft &ac, double now)
    {
        PriorResult prior;
        if (!ac.has_result) return prior;

        double elapsed = now-ac.last_result.time;
        if (elapsed > MAX_RESULT_AGE) return prior;

        prior.valid = true;
        prior.pos = ac.last_result.pos;
        prior.var = ac.last_result.var;
        prior.distinct = ac.last_result.distinct;
        prior.elapsed = elapsed;
        return prior;
    }

    int altitude_model(const Aircraft &ac, double now, AltitudeAid &altitude)
    {
        altitude = AltitudeAid();
        if (!ac.has_altitude) return MIN_RCV_NOALT;

        altitude.valid = true;
        altitude.altitude = ac.altitude*FTOM;
        altitude.error = (ALT_ERR_BASE+ALT_ERR_RATE*(now-ac.last_altitude_time))*FTOM;
        return altitude.error < ALT_ERR_MAX*FTOM ? MIN_RCV_ALT : MIN_RCV_NOALT;
    }

    bool rate_limited(const PriorResult &prior, int nrcv)
    {
        if (!prior.valid) return false;
        if (prior.elapsed < RATELIMIT_FEWER && nrcv < prior.distinct) return true;
        if (prior.elapsed < RATELIMIT_SAME && nrcv == prior.distinct) return true;
        return false;
    }

    bool select_result(std::vector<Cluster> &clusters, const PriorResult &prior,
                       const AltitudeAid &altitude, double mlat_delay, MlatSolver &solver,
                       Cluster &accepted, MlatSolution &solution, double &var_est)
    {
        std::stable_sort(clusters.begin(), clusters.end(),
                         [](const Cluster &a, const Cluster &b) { return a.distinct < b.distinct; });

        while (!clusters.empty())
        {
            Cluster cluster = clusters.back();
            clusters.pop_back();

            // hysteresis: don't replace a recent result with a worse receiver set
            if (prior.valid && prior.elapsed < ACCEPT_FEWER_AGE && cluster.distinct < prior.distinct)
            {
                VLOG(1) << "fewer distinct receivers than recent result, stop";
                return false;
            }
            if (prior.valid && prior.elapsed < mlat_delay-ACCEPT_SAME_MARGIN &&
                cluster.distinct == prior.distinct)
            {
                VLOG(1) << "same distinct receivers as very recent result, stop";
                return false;
            }

            Eigen::Vector3d seed = prior.valid ? prior.pos : cluster.entries.front().receiver->pos;
            MlatSolution sol;
            if (!solver.solve(cluster.entries, altitude, seed, sol))
            {
                VLOG(1) << "no solution for cluster of " << cluster.distinct;
                continue;
            }

            double var = sol.has_cov ? sol.ecef_cov.trace() : MAX_VAR_EST;
            if (var > MAX_VAR_EST)
            {
                VLOG(1) << "solution too inaccurate, var_est=" << var;
                continue;
            }
            if (prior.valid && prior.elapsed < ACCEPT_WORSE_AGE && var > prior.var*ACCEPT_WORSE_FACT)
            {
                VLOG(1) << "less accurate than recent result, var_est=" << var;
                continue;
            }

            accepted = cluster;
            solution = sol;
            var_est = var;
            return true;
        }
        return false;
    }
}   // namespace mlat_track
