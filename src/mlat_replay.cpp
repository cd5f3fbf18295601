/**
 * mlat_replay.cpp: replay of recorded Mode S message copies through the
 * multilateration tracker
 * 
 * Reads a configuration file, a receivers file and an observation file and
 * prints every accepted position.
 */

#include "mlat_track/mlat_config.hpp"
#include "mlat_track/mlat_constant.hpp"
#include "mlat_track/mlat_common.hpp"
#include "mlat_track/mlat_reader.hpp"
#include "mlat_track/mlat_registry.hpp"
#include "mlat_track/mlat_solver.hpp"
#include "mlat_track/mlat_tracker.hpp"
#include "mlat_track/modes_message.hpp"
#include "mlat_track/clock_norm.hpp"
#include "mlat_track/resolve_queue.hpp"
#include <cmath>
#include <csignal>
#include <iostream>
#include <fstream>
#include <vector>
#include <iomanip>
#include <sstream>
#include <glog/logging.h>

using namespace mlat_track;

static volatile std::sig_atomic_t reload_requested = 0;
static std::ofstream sol_file;

static void on_sighup(int)
{
    reload_requested = 1;
}

static void print_solution(double first_seen, uint32_t address, const MlatSolution &solution,
                           const std::vector<ReceiverPtr> &receivers, int distinct, int count)
{
    Eigen::Vector3d lla = ecef2geo(solution.ecef);

    std::ostringstream ss;
    ss << std::setw(6) << count << " "
       << std::fixed << std::setprecision(3) << first_seen << " "
       << std::hex << std::setw(6) << std::setfill('0') << address << std::dec << std::setfill(' ') << " "
       << std::setprecision(6) << std::setw(11) << lla(0) << " " << std::setw(11) << lla(1) << " "
       << std::setprecision(1) << std::setw(8) << lla(2) << " "
       << std::setw(2) << distinct << " ";
    if (solution.has_cov)
        ss << std::setprecision(0) << std::setw(8) << sqrt(solution.ecef_cov.trace()) << " ";
    else
        ss << std::setw(8) << "-" << " ";
    for (size_t i = 0; i < receivers.size(); ++i)
        ss << (i ? "," : "") << receivers[i]->id;

    std::cout << ss.str() << std::endl;
    if (sol_file.is_open()) sol_file << ss.str() << std::endl;
}

int main(int argc, char* argv[])
{
    // Initialize Google Logging
    google::InitGoogleLogging(argv[0]);

    if (argc < 2)
    {
        std::cerr << "usage: " << argv[0] << " <config file>" << std::endl;
        return 1;
    }

    MlatConfig cfg;
    if (!readconfig(argv[1], cfg)) return 1;

    std::cout << "=== Mode S multilateration replay ===" << std::endl;
    std::cout << "receivers file:    " << cfg.receivers_file << std::endl;
    std::cout << "observations file: " << cfg.observations_file << std::endl;

    ReceiverRegistry receivers;
    ClockDomainNormalizer clock_norm;
    if (!readrcv(cfg.receivers_file, receivers, clock_norm)) return 1;

    std::vector<ObsRecord> obs;
    if (!readobs(cfg.observations_file, obs)) return 1;

    if (!cfg.results_file.empty())
    {
        sol_file.open(cfg.results_file);
        if (sol_file.is_open())
            sol_file << "# n | time | icao | lat(deg) | lon(deg) | h(m) | distinct | sigma(m) | receivers" << std::endl;
        else
            LOG(WARNING) << "could not open results file " << cfg.results_file;
    }

    AircraftTracker aircraft;
    PseudorangeSolver solver;
    ManualClock clock(obs.empty() ? 0.0 : obs.front().arrival);
    MlatTracker mlat(cfg, aircraft, clock_norm, solver, clock);

    int nsol = 0;
    mlat.add_output_handler([&nsol](double first_seen, uint32_t address, const MlatSolution &solution,
                                    const std::vector<ReceiverPtr> &rcvs, int distinct,
                                    const TrackFilterPtr &)
    {
        print_solution(first_seen, address, solution, rcvs, distinct, ++nsol);
    });

    std::signal(SIGHUP, on_sighup);

    size_t nskip = 0;
    for (const ObsRecord &rec : obs)
    {
        run_until(mlat, clock, rec.arrival);
        if (reload_requested)
        {
            reload_requested = 0;
            mlat.handle_reload();
        }

        ReceiverPtr rcv = receivers.find(rec.rcv_id);
        if (!rcv)
        {
            LOG(WARNING) << "observation from unknown receiver " << rec.rcv_id;
            ++nskip;
            continue;
        }

        // aircraft are registered on first sight of an explicit address (DF11/17/18)
        DecodedMessage decoded;
        if (decode_modes(rec.message, decoded) &&
            (decoded.df == 11 || decoded.df == 17 || decoded.df == 18) &&
            !aircraft.find(decoded.address))
        {
            aircraft.add(decoded.address);
            VLOG(1) << "new aircraft " << std::hex << decoded.address;
        }
        mlat.receiver_mlat(rcv, rec.timestamp, rec.message);
    }

    // resolve what is left
    double deadline;
    while (mlat.next_deadline(deadline))
    {
        clock.set(deadline);
        mlat.run_pending();
    }
    mlat.pseudorange_log().flush();

    std::cout << "observations: " << obs.size() << " (skipped " << nskip << "), aircraft: "
              << aircraft.size() << ", positions: " << nsol << std::endl;
    LOG(INFO) << "replay done, " << nsol << " positions";
    return 0;
}
