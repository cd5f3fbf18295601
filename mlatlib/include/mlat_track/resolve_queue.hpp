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

#ifndef MLAT_RESOLVE_QUEUE_HPP_
#define MLAT_RESOLVE_QUEUE_HPP_

#include <map>
#include <string>
#include <utility>
#include <cstdint>

namespace mlat_track
{
    /* time source of the correlation engine */
    class MlatClock
    {
    public:
        virtual ~MlatClock() = default;
        virtual double now() const = 0;             /* monotonic time (s) */
        virtual double wall_time() const = 0;       /* wall clock time, unix epoch (s) */
    };

    class SystemClock : public MlatClock
    {
    public:
        double now() const override;
        double wall_time() const override;
    };

    /* clock driven by hand, monotonic and wall time coincide */
    class ManualClock : public MlatClock
    {
    public:
        explicit ManualClock(double t = 0.0) : t_(t) {}
        double now() const override { return t_; }
        double wall_time() const override { return t_; }
        void set(double t) { t_ = t; }
        void advance(double dt) { t_ += dt; }

    private:
        double t_;
    };

    /* one-shot deadlines keyed by message, fired in deadline then schedule order */
    class ResolveQueue
    {
    public:
        ResolveQueue() : next_handle_(1) {}

        /* schedule key at deadline (s), returns the handle */
        uint64_t schedule(double deadline, const std::string &key);

        /* pop the earliest entry due at now (true:popped) */
        bool pop_due(double now, std::string &key, uint64_t *handle = nullptr);

        /* earliest pending deadline (false:queue empty) */
        bool next_deadline(double &deadline) const;

        size_t size() const { return queue_.size(); }
        bool empty() const { return queue_.empty(); }

    private:
        typedef std::pair<double, uint64_t> QueueKey;   /* deadline, handle */
        std::map<QueueKey, std::string> queue_;
        uint64_t next_handle_;
    };
}   // namespace mlat_track

#endif
