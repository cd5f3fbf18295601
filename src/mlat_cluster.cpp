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

#include "mlat_track/mlat_cluster.hpp"

namespace mlat_track
{
    double receiver_distance(const Receiver &a, const Receiver &b)
    {
        std::map<uint32_t, double>::const_iterator it = a.distance.find(b.id);
        if (it != a.distance.end()) return it->second;
        return (a.pos-b.pos).norm();
    }

    double max_propagation_delay(double distance)
    {
        return (distance*CLUSTER_SLOP_FACT+CLUSTER_SLOP_OFFSET)/CAIR;
    }

    /* check candidate against all members (0:reject, 1:accept, 2:accept, not distinct) */
    static int check_candidate(const std::vector<ClusterEntry> &members, const ClusterEntry &cand)
    {
        bool distinct = true;
        for (const ClusterEntry &m : members)
        {
            if (m.receiver == cand.receiver || m.receiver->id == cand.receiver->id) return 0;
            double d = receiver_distance(*m.receiver, *cand.receiver);
            if (fabs(m.timestamp-cand.timestamp) > max_propagation_delay(d)) return 0;
            if (d < DISTINCT_RANGE) distinct = false;
        }
        return distinct ? 1 : 2;
    }

    int cluster_timestamps(const NormComponent &component, int min_receivers,
                           std::vector<Cluster> &clusters)
    {
        std::vector<ClusterEntry> flat;
        for (const auto &kv : component)
        {
            for (double t : kv.second.timestamps)
            {
                ClusterEntry e;
                e.receiver = kv.second.receiver;
                e.timestamp = t;
                e.variance = kv.second.variance;
                flat.push_back(e);
            }
        }
        if (flat.empty()) return 0;

        std::stable_sort(flat.begin(), flat.end(),
                         [](const ClusterEntry &a, const ClusterEntry &b)
                         { return a.timestamp < b.timestamp; });

        // coarse grouping on gaps
        std::vector<std::vector<ClusterEntry>> groups(1);
        groups.back().push_back(flat[0]);
        for (size_t i = 1; i < flat.size(); ++i)
        {
            if (flat[i].timestamp-flat[i-1].timestamp > CLUSTER_GAP)
                groups.emplace_back();
            groups.back().push_back(flat[i]);
        }

        int nc = 0;
        for (std::vector<ClusterEntry> &group : groups)
        {
            while (group.size() >= 3)
            {
                Cluster cluster;
                cluster.entries.push_back(group.back());
                cluster.distinct = 1;
                group.pop_back();
                double last_ts = cluster.entries.back().timestamp;

                for (int i = static_cast<int>(group.size())-1; i >= 0; --i)
                {
                    const ClusterEntry cand = group[i];
                    if (last_ts-cand.timestamp > CLUSTER_GAP) break;

                    int stat = check_candidate(cluster.entries, cand);
                    if (!stat) continue;
                    if (stat == 1) ++cluster.distinct;
                    cluster.entries.push_back(cand);
                    last_ts = cand.timestamp;
                    group.erase(group.begin()+i);
                }

                if (cluster.distinct >= min_receivers)
                {
                    std::reverse(cluster.entries.begin(), cluster.entries.end());
                    VLOG(2) << "cluster with " << cluster.entries.size() << " entries, "
                            << cluster.distinct << " distinct";
                    clusters.push_back(cluster);
                    ++nc;
                }
            }
        }
        return nc;
    }
}   // namespace mlat_track
