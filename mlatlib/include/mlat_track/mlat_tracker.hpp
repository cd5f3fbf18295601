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

#ifndef MLAT_TRACKER_HPP_
#define MLAT_TRACKER_HPP_

#include <vector>
#include <string>
#include <functional>
#include <unordered_map>

#include "mlat_constant.hpp"
#include "mlat_config.hpp"
#include "mlat_registry.hpp"
#include "clock_norm.hpp"
#include "mlat_solver.hpp"
#include "resolve_queue.hpp"
#include "blacklist.hpp"
#include "pseudorange_log.hpp"

namespace mlat_track
{
    /* called with every accepted result */
    typedef std::function<void(double first_seen, uint32_t address, const MlatSolution &solution,
                               const std::vector<ReceiverPtr> &receivers, int distinct,
                               const TrackFilterPtr &kalman)> OutputHandler;

    /* correlates copies of the same message from many receivers and resolves
       them into positions after a fixed delay */
    class MlatTracker
    {
    public:
        MlatTracker(const MlatConfig &config, AircraftTracker &tracker,
                    ClockNormalizer &clock_norm, MlatSolver &solver, const MlatClock &clock);

        /* receiver mlat ---------------------------------------------------------------
        * record one receiver's copy of a message, the first copy of a message
        * schedules its resolution after the configured delay
        * args   : ReceiverPtr receiver     I   receiver
        *          double timestamp         I   raw receiver timestamp (s)
        *          std::string message      I   raw message bytes
        *---------------------------------------------------------------------------*/
        void receiver_mlat(const ReceiverPtr &receiver, double timestamp, const std::string &message);

        /* resolve all groups due at the current time, returns the number resolved */
        int run_pending();
        /* earliest pending resolution time (false: nothing pending) */
        bool next_deadline(double &deadline) const { return queue_.next_deadline(deadline); }
        size_t pending_size() const { return pending_.size(); }

        void add_output_handler(const OutputHandler &handler);

        size_t read_blacklist() { return blacklist_.reload(); }
        bool reopen_pseudoranges();
        /* re-read blacklist and reopen the pseudorange log */
        void handle_reload();

        const Blacklist &blacklist() const { return blacklist_; }
        PseudorangeLog &pseudorange_log() { return pseudorange_log_; }

    private:
        void resolve(const MessageGroupPtr &group);

        MlatConfig config_;
        AircraftTracker &tracker_;
        ClockNormalizer &clock_norm_;
        MlatSolver &solver_;
        const MlatClock &clock_;

        std::unordered_map<std::string, MessageGroupPtr> pending_;
        ResolveQueue queue_;
        Blacklist blacklist_;
        std::vector<OutputHandler> output_handlers_;
        PseudorangeLog pseudorange_log_;
    };

    /* run until -----------------------------------------------------------------
    * advance a manual clock to time t, resolving every group due up to t at its
    * own deadline
    * args   : MlatTracker &tracker     IO  tracker driven by clock
    *          ManualClock &clock       IO  clock of the tracker
    *          double t                 I   target time (s)
    * return : number of groups resolved
    *---------------------------------------------------------------------------*/
    int run_until(MlatTracker &tracker, ManualClock &clock, double t);
}   // namespace mlat_track

#endif
