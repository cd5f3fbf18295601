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

#ifndef MLAT_CONSTANT_HPP_
#define MLAT_CONSTANT_HPP_

#include <vector>
#include <map>
#include <string>
#include <memory>
#include <cstdint>
#include <cmath>
#include <eigen3/Eigen/Dense>

namespace mlat_track
{
    #define LIGHT_SPEED     2.99792458E8        /* speed of light in vacuum (m/s) */
    #define CAIR            (LIGHT_SPEED/1.0003) /* propagation speed at 1090MHz in air (m/s) */
    #define FTOM            0.3048              /* feet to metres */
    #define MTOF            (1.0/FTOM)          /* metres to feet */

    #ifndef R2D
    #define R2D             (180.0/M_PI)        /* rad to deg */
    #endif
    #ifndef D2R
    #define D2R             (M_PI/180.0)        /* deg to rad */
    #endif

    #define RE_WGS84        6378137.0           /* earth semimajor axis (WGS84) (m) */
    #define FE_WGS84        (1.0/298.257223563) /* earth flattening (WGS84) */

    // resolution pipeline
    #define MLAT_DELAY          2.5             /* default resolution delay after first copy (s) */
    #define MIN_COPIES          3               /* copies needed before any resolution attempt */
    #define MAX_RESULT_AGE      120.0           /* older accepted results are forgotten (s) */
    #define ALT_ERR_BASE        250.0           /* altitude error when reported (ft) */
    #define ALT_ERR_RATE        70.0            /* altitude error growth (ft/s) */
    #define ALT_ERR_MAX         1000.0          /* max altitude error for 3-receiver solutions (ft) */
    #define MIN_RCV_ALT         3               /* receivers needed with altitude aiding */
    #define MIN_RCV_NOALT       4               /* receivers needed without altitude aiding */

    // rate limiting / hysteresis
    #define RATELIMIT_FEWER     15.0            /* fewer receivers than last result throttled until (s) */
    #define RATELIMIT_SAME      2.0             /* same receiver count throttled until (s) */
    #define ACCEPT_FEWER_AGE    10.0            /* fewer distinct receivers accepted after (s) */
    #define ACCEPT_SAME_MARGIN  0.5             /* same distinct count accepted after delay-margin (s) */
    #define ACCEPT_WORSE_AGE    2.0             /* less accurate results rejected until (s) */
    #define ACCEPT_WORSE_FACT   1.1             /* tolerated variance growth against a recent result */
    #define MAX_VAR_EST         100E6           /* variance of a ~10km position error (m^2) */

    // clustering
    #define CLUSTER_GAP         2E-3            /* coarse grouping gap and cluster cutoff (s) */
    #define CLUSTER_SLOP_FACT   1.05            /* range slop factor for the feasibility test */
    #define CLUSTER_SLOP_OFFSET 1E3             /* range slop offset for the feasibility test (m) */
    #define DISTINCT_RANGE      1E3             /* receivers closer than this count once (m) */

    // reference solver
    #define SOLVER_MAXITR       10              /* max least squares iterations */
    #define SOLVER_MIN_VAR      1E-14           /* floor of timestamp variance (s^2) */
    #define SOLVER_MAX_RANGE    500E3           /* max receiver to transmitter range (m) */
    #define SOLVER_MIN_ALT      (-1500.0*FTOM)  /* min solved altitude (m) */
    #define SOLVER_MAX_ALT      (75000.0*FTOM)  /* max solved altitude (m) */
    #define SOLVER_SEED_DIST    100.0           /* seeds closer to a receiver are lifted (m) */
    #define SOLVER_SEED_ALT     (30000.0*FTOM)  /* lifted seed altitude without altitude aid (m) */

    struct Receiver
    {
        uint32_t        id;                         /* receiver id */
        std::string     user;                       /* operator identity (blacklist key) */
        Eigen::Vector3d pos;                        /* receiver position (ecef) (m) */
        std::map<uint32_t, double> distance;        /* distance to paired receivers (m) */
    };
    typedef std::shared_ptr<Receiver> ReceiverPtr;

    struct ObsCopy                                  /* one receiver's copy of a message */
    {
        ReceiverPtr receiver;
        double      timestamp;                      /* raw receiver timestamp (s) */
    };

    struct MessageGroup
    {
        std::string message;                        /* raw message bytes (correlation key) */
        double      first_seen;                     /* wall clock time of the first copy (s) */
        std::vector<ObsCopy> copies;                /* copies in arrival order */
        uint64_t    handle;                         /* pending resolution handle */
    };
    typedef std::shared_ptr<MessageGroup> MessageGroupPtr;

    struct RcvTimestamps
    {
        ReceiverPtr receiver;
        std::vector<double> timestamps;             /* raw receiver timestamps (s) */
    };
    typedef std::map<uint32_t, RcvTimestamps> TimestampMap;     /* key: receiver id */

    struct NormTimestamps
    {
        ReceiverPtr receiver;
        double      variance;                       /* timestamp variance (s^2) */
        std::vector<double> timestamps;             /* comparable timestamps, ascending (s) */
    };
    typedef std::map<uint32_t, NormTimestamps> NormComponent;   /* key: receiver id */

    struct ClusterEntry
    {
        ReceiverPtr receiver;
        double      timestamp;                      /* normalized timestamp (s) */
        double      variance;                       /* timestamp variance (s^2) */
    };

    struct Cluster
    {
        int         distinct;                       /* number of distinct receivers */
        std::vector<ClusterEntry> entries;          /* ascending timestamps */
    };

    struct DecodedMessage
    {
        uint32_t    df = 0;                         /* downlink format */
        uint32_t    address = 0;                    /* ICAO address */
        bool        has_altitude = false;
        int32_t     altitude = 0;                   /* pressure altitude (ft) */
        bool        has_squawk = false;
        uint16_t    squawk = 0;                     /* mode A code, one octal digit per 3 bits */
        bool        has_callsign = false;
        std::string callsign;
    };

    struct AltitudeAid
    {
        bool        valid = false;
        double      altitude = 0.0;                 /* geodetic altitude (m) */
        double      error = 0.0;                    /* altitude error (m) */
    };

    struct MlatSolution
    {
        Eigen::Vector3d ecef = Eigen::Vector3d::Zero();         /* position (ecef) (m) */
        bool            has_cov = false;
        Eigen::Matrix3d ecef_cov = Eigen::Matrix3d::Zero();     /* position covariance (m^2) */
    };

    struct AcceptedResult
    {
        Eigen::Vector3d pos;                        /* accepted position (ecef) (m) */
        double      var;                            /* variance estimate (m^2) */
        int         distinct;                       /* distinct receivers used */
        double      time;                           /* monotonic acceptance time (s) */
    };

    struct PriorResult                              /* prior result as seen by one resolution */
    {
        bool        valid = false;                  /* false: no usable prior, unconstrained */
        Eigen::Vector3d pos = Eigen::Vector3d::Zero();
        double      var = 0.0;
        int         distinct = 0;
        double      elapsed = 0.0;                  /* time since the prior was accepted (s) */
    };
}   // namespace mlat_track

#endif
