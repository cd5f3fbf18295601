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
#include <cstdio>
#include <sstream>
#include <iomanip>
#include <glog/logging.h>

#include "mlat_track/pseudorange_log.hpp"

namespace mlat_track
{
    static void put_fixed(std::ostringstream &ss, double value, int decimals)
    {
        double scale = pow(10.0, decimals);
        double rounded = std::round(value*scale)/scale;
        if (rounded == 0.0) rounded = 0.0;          // no negative zero
        ss << std::fixed << std::setprecision(decimals > 0 ? decimals : 1) << rounded;
    }

    std::string format_pseudorange_record(uint32_t icao, double first_seen,
                                          const MlatSolution &solution, int distinct,
                                          const std::vector<ClusterEntry> &cluster,
                                          const AltitudeAid &altitude)
    {
        char icao_str[8];
        snprintf(icao_str, sizeof(icao_str), "%06x", icao&0xFFFFFF);

        std::ostringstream ss;
        ss << "{\"icao\": \"" << icao_str << "\", \"time\": ";
        put_fixed(ss, first_seen, 3);

        ss << ", \"ecef\": [";
        for (int i = 0; i < 3; ++i)
        {
            if (i) ss << ", ";
            put_fixed(ss, solution.ecef(i), 0);
        }
        ss << "], \"ecef_cov\": ";
        if (solution.has_cov)
        {
            ss << "[";
            for (int i = 0; i < 9; ++i)
            {
                if (i) ss << ", ";
                put_fixed(ss, solution.ecef_cov(i/3, i%3), 0);
            }
            ss << "]";
        }
        else
        {
            ss << "null";
        }

        ss << ", \"distinct\": " << distinct << ", \"cluster\": [";
        const double t0 = cluster.empty() ? 0.0 : cluster.front().timestamp;
        for (size_t i = 0; i < cluster.size(); ++i)
        {
            const ClusterEntry &e = cluster[i];
            if (i) ss << ", ";
            ss << "[";
            put_fixed(ss, e.receiver->pos(0), 0); ss << ", ";
            put_fixed(ss, e.receiver->pos(1), 0); ss << ", ";
            put_fixed(ss, e.receiver->pos(2), 0); ss << ", ";
            put_fixed(ss, (e.timestamp-t0)*1E6, 1); ss << ", ";
            put_fixed(ss, e.variance*1E12, 2);
            ss << "]";
        }
        ss << "]";

        if (altitude.valid)
        {
            ss << ", \"altitude\": ";
            put_fixed(ss, altitude.altitude, 0);
            ss << ", \"altitude_error\": ";
            put_fixed(ss, altitude.error, 0);
        }
        ss << "}";
        return ss.str();
    }

    PseudorangeLog::PseudorangeLog()
        : enabled_(false), in_flight_(0), stop_(false)
    {
        writer_ = std::thread(&PseudorangeLog::writer_loop, this);
    }

    PseudorangeLog::~PseudorangeLog()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_ = true;
        }
        cv_.notify_all();
        if (writer_.joinable()) writer_.join();
        close();
    }

    bool PseudorangeLog::open(const std::string &file)
    {
        std::lock_guard<std::mutex> lock(file_mutex_);
        if (out_.is_open()) out_.close();
        file_ = file;
        out_.clear();
        out_.open(file_, std::ios::out | std::ios::app);
        enabled_ = out_.is_open();
        if (!enabled_)
            LOG(ERROR) << "failed to open pseudorange file " << file_ << ", pseudorange log disabled";
        return enabled_;
    }

    bool PseudorangeLog::reopen()
    {
        if (file_.empty()) return false;
        flush();
        return open(file_);
    }

    void PseudorangeLog::close()
    {
        flush();
        std::lock_guard<std::mutex> lock(file_mutex_);
        if (out_.is_open()) out_.close();
        enabled_ = false;
    }

    void PseudorangeLog::write(const std::string &line)
    {
        if (!enabled_) return;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.push_back(line);
        }
        cv_.notify_one();
    }

    void PseudorangeLog::flush()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        idle_cv_.wait(lock, [this] { return (queue_.empty() && in_flight_ == 0) || stop_; });
    }

    void PseudorangeLog::writer_loop()
    {
        std::deque<std::string> batch;
        while (true)
        {
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return !queue_.empty() || stop_; });
                if (queue_.empty() && stop_) break;
                batch.swap(queue_);
                in_flight_ = batch.size();
            }

            {
                std::lock_guard<std::mutex> lock(file_mutex_);
                if (out_.is_open())
                {
                    for (const std::string &line : batch)
                        out_ << line << '\n';
                    out_.flush();
                    if (!out_)
                        LOG(ERROR) << "write to pseudorange file " << file_ << " failed";
                }
            }
            batch.clear();

            {
                std::lock_guard<std::mutex> lock(mutex_);
                in_flight_ = 0;
            }
            idle_cv_.notify_all();
        }
        idle_cv_.notify_all();
    }
}   // namespace mlat_track
