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

#ifndef MLAT_PSEUDORANGE_LOG_HPP_
#define MLAT_PSEUDORANGE_LOG_HPP_

#include <deque>
#include <string>
#include <vector>
#include <thread>
#include <mutex>
#include <fstream>
#include <condition_variable>
#include <cstdint>

#include "mlat_constant.hpp"

namespace mlat_track
{
    /* format pseudorange record ---------------------------------------------------
    * build the json line of one accepted result (without trailing newline)
    * args   : uint32_t icao            I   aircraft address
    *          double first_seen        I   wall clock time of the first copy (s)
    *          MlatSolution solution    I   accepted solution
    *          int    distinct          I   distinct receivers
    *          std::vector<ClusterEntry> cluster  I  accepted cluster
    *          AltitudeAid altitude     I   altitude aid (omitted when not valid)
    * return : json record
    *-----------------------------------------------------------------------------*/
    std::string format_pseudorange_record(uint32_t icao, double first_seen,
                                          const MlatSolution &solution, int distinct,
                                          const std::vector<ClusterEntry> &cluster,
                                          const AltitudeAid &altitude);

    /* append-only line log written by a background thread */
    class PseudorangeLog
    {
    public:
        PseudorangeLog();
        ~PseudorangeLog();
        PseudorangeLog(const PseudorangeLog&) = delete;
        PseudorangeLog &operator=(const PseudorangeLog&) = delete;

        /* open file in append mode (false: failed, log disabled) */
        bool open(const std::string &file);
        /* close and reopen the same file, for log rotation */
        bool reopen();
        void close();
        bool is_open() const { return enabled_; }
        const std::string &file() const { return file_; }

        /* queue one line, dropped when the log is disabled */
        void write(const std::string &line);
        /* wait until all queued lines are written */
        void flush();

    private:
        void writer_loop();

        std::string file_;
        bool enabled_;
        std::ofstream out_;
        std::mutex file_mutex_;                     /* guards out_ */

        std::deque<std::string> queue_;
        size_t in_flight_;
        bool stop_;
        std::mutex mutex_;                          /* guards queue_, in_flight_, stop_ */
        std::condition_variable cv_;
        std::condition_variable idle_cv_;
        std::thread writer_;
    };
}   // namespace mlat_track

#endif
