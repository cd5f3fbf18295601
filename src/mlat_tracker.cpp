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

#include <sstream>
#include <iomanip>
#include <glog/logging.h>

#include "mlat_track/mlat_common.hpp"
#include "mlat_track/modes_message.hpp"
#include "mlat_track/mlat_cluster.hpp"
#include "mlat_track/mlat_policy.hpp"
#include "mlat_track/mlat_tracker.hpp"

namespace mlat_track
{
    MlatTracker::MlatTracker(const MlatConfig &config, AircraftTracker &tracker,
                             ClockNormalizer &clock_norm, MlatSolver &solver,
                             const MlatClock &clock)
        : config_(config), tracker_(tracker), clock_norm_(clock_norm), solver_(solver),
          clock_(clock), blacklist_(config.blacklist_file)
    {
        blacklist_.reload();
        if (!config_.pseudorange_file.empty())
            pseudorange_log_.open(config_.pseudorange_file);
    }

    void MlatTracker::receiver_mlat(const ReceiverPtr &receiver, double timestamp,
                                    const std::string &message)
    {
        MessageGroupPtr &group = pending_[message];
        if (!group)
        {
            group.reset(new MessageGroup());
            group->message = message;
            group->first_seen = clock_.wall_time();
            group->handle = queue_.schedule(clock_.now()+config_.mlat_delay, message);
        }
        ObsCopy copy;
        copy.receiver = receiver;
        copy.timestamp = timestamp;
        group->copies.push_back(copy);
    }

    int MlatTracker::run_pending()
    {
        int nres = 0;
        std::string key;
        while (queue_.pop_due(clock_.now(), key))
        {
            std::unordered_map<std::string, MessageGroupPtr>::iterator it = pending_.find(key);
            if (it == pending_.end())
            {
                LOG(ERROR) << "resolution fired for unknown message " << bytes2hex(key);
                continue;
            }
            MessageGroupPtr group = it->second;
            pending_.erase(it);
            resolve(group);
            ++nres;
        }
        return nres;
    }

    int run_until(MlatTracker &tracker, ManualClock &clock, double t)
    {
        int nres = 0;
        double deadline;
        while (tracker.next_deadline(deadline) && deadline <= t)
        {
            clock.set(deadline);
            nres += tracker.run_pending();
        }
        clock.set(t);
        return nres;
    }

    void MlatTracker::add_output_handler(const OutputHandler &handler)
    {
        output_handlers_.push_back(handler);
    }

    bool MlatTracker::reopen_pseudoranges()
    {
        if (config_.pseudorange_file.empty()) return false;
        if (pseudorange_log_.file().empty()) return pseudorange_log_.open(config_.pseudorange_file);
        return pseudorange_log_.reopen();
    }

    void MlatTracker::handle_reload()
    {
        read_blacklist();
        if (!config_.pseudorange_file.empty())
            reopen_pseudoranges();
    }

    void MlatTracker::resolve(const MessageGroupPtr &group)
    {
        // quorum floor
        if (group->copies.size() < MIN_COPIES) return;

        DecodedMessage decoded;
        if (!decode_modes(group->message, decoded))
        {
            VLOG(2) << "undecodable message " << bytes2hex(group->message);
            return;
        }

        AircraftPtr ac = tracker_.find(decoded.address);
        if (!ac)
        {
            VLOG(2) << "no aircraft " << std::hex << decoded.address;
            return;
        }

        const double now = clock_.now();

        // refresh aircraft state from the message
        if (decoded.has_altitude)
        {
            ac->has_altitude = true;
            ac->altitude = decoded.altitude;
            ac->last_altitude_time = now;
        }
        if (decoded.has_squawk)
        {
            ac->has_squawk = true;
            ac->squawk = decoded.squawk;
        }
        if (decoded.has_callsign)
        {
            ac->has_callsign = true;
            ac->callsign = decoded.callsign;
        }

        PriorResult prior = recall_prior(*ac, now);
        AltitudeAid altitude;
        const int min_receivers = altitude_model(*ac, now, altitude);

        TimestampMap timestamp_map;
        for (const ObsCopy &copy : group->copies)
        {
            if (blacklist_.contains(copy.receiver->user)) continue;
            RcvTimestamps &entry = timestamp_map[copy.receiver->id];
            entry.receiver = copy.receiver;
            entry.timestamps.push_back(copy.timestamp);
        }

        const int nrcv = static_cast<int>(timestamp_map.size());
        if (nrcv < min_receivers) return;

        if (rate_limited(prior, nrcv))
        {
            VLOG(1) << "rate limited " << std::hex << decoded.address << std::dec
                    << " receivers=" << nrcv << " prior distinct=" << prior.distinct;
            return;
        }

        std::vector<NormComponent> components;
        clock_norm_.normalize(timestamp_map, components);

        std::vector<Cluster> clusters;
        for (const NormComponent &component : components)
        {
            if (static_cast<int>(component.size()) >= min_receivers)
                cluster_timestamps(component, min_receivers, clusters);
        }
        if (clusters.empty()) return;

        Cluster cluster;
        MlatSolution solution;
        double var_est = 0.0;
        if (!select_result(clusters, prior, altitude, config_.mlat_delay, solver_,
                           cluster, solution, var_est))
            return;

        // commit
        ac->has_result = true;
        ac->last_result.pos = solution.ecef;
        ac->last_result.var = var_est;
        ac->last_result.distinct = cluster.distinct;
        ac->last_result.time = now;

        if (ac->kalman)
            ac->kalman->update(group->first_seen, cluster.entries, altitude, solution,
                               cluster.distinct);

        if (min_receivers > MIN_RCV_ALT)
        {
            std::ostringstream alt, alterr;
            if (altitude.valid)
            {
                alt << std::fixed << std::setprecision(0) << altitude.altitude*MTOF;
                alterr << std::fixed << std::setprecision(0) << altitude.error*MTOF;
            }
            else
            {
                alt << "missing";
                alterr << "missing";
            }
            LOG(INFO) << std::hex << std::setw(6) << std::setfill('0') << decoded.address << std::dec
                      << " solved altitude=" << std::fixed << std::setprecision(0)
                      << ecef2geo(solution.ecef)(2)*MTOF << "ft from alt=" << alt.str()
                      << " err=" << alterr.str();
        }

        std::vector<ReceiverPtr> receivers;
        for (const ClusterEntry &e : cluster.entries)
            receivers.push_back(e.receiver);
        for (const OutputHandler &handler : output_handlers_)
            handler(group->first_seen, decoded.address, solution, receivers, cluster.distinct,
                    ac->kalman);

        if (pseudorange_log_.is_open())
            pseudorange_log_.write(format_pseudorange_record(decoded.address, group->first_seen,
                                                             solution, cluster.distinct,
                                                             cluster.entries, altitude));
    }
}   // namespace mlat_track
