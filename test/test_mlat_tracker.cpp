#include <cstdio>
#include <sys/stat.h>
#include <unistd.h>
#include <gtest/gtest.h>

#include "mlat_track/mlat_tracker.hpp"
#include "test_helpers.hpp"

using namespace mlat_track;
using namespace mlat_test;

static const uint32_t KLM_ICAO = 0x4840D6;

class TrackerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        add_test_receivers(registry, rcvs);
        tx = test_transmitter();
        cfg.blacklist_file = ::testing::TempDir()+"mlat_tracker_blacklist.txt";
        std::remove(cfg.blacklist_file.c_str());
        ac = aircraft.add(KLM_ICAO);
        filter = std::make_shared<RecordingFilter>();
        ac->kalman = filter;
        ASSERT_EQ(hex2bytes("8D4840D6202CC371C32CE0576098", ident), 0);
    }

    std::unique_ptr<MlatTracker> make_tracker()
    {
        return make_tracker(normalizer, solver);
    }

    std::unique_ptr<MlatTracker> make_tracker(ClockNormalizer &norm, MlatSolver &slv)
    {
        std::unique_ptr<MlatTracker> tracker(
            new MlatTracker(cfg, aircraft, norm, slv, clock));
        tracker->add_output_handler(
            [this](double first_seen, uint32_t address, const MlatSolution &solution,
                   const std::vector<ReceiverPtr> &receivers, int distinct, const TrackFilterPtr &kalman)
            {
                Output out;
                out.first_seen = first_seen;
                out.address = address;
                out.nrcv = receivers.size();
                out.distinct = distinct;
                out.has_filter = static_cast<bool>(kalman);
                out.resolved_at = clock.now();
                out.ecef = solution.ecef;
                outputs.push_back(out);
            });
        return tracker;
    }

    /* feed one transmission at t0 to the first n receivers */
    void feed(MlatTracker &tracker, const std::string &message, size_t n, double t0)
    {
        for (size_t i = 0; i < n; ++i)
            tracker.receiver_mlat(rcvs[i], arrival(tx, rcvs[i], t0), message);
    }

    struct Output
    {
        double first_seen;
        uint32_t address;
        size_t nrcv;
        int distinct;
        bool has_filter;
        double resolved_at;
        Eigen::Vector3d ecef;
    };

    MlatConfig cfg;
    ReceiverRegistry registry;
    std::vector<ReceiverPtr> rcvs;
    Eigen::Vector3d tx;
    AircraftTracker aircraft;
    AircraftPtr ac;
    std::shared_ptr<RecordingFilter> filter;
    FakeNormalizer normalizer;
    RecordingSolver solver;
    ManualClock clock{1000.0};
    std::string ident;
    std::vector<Output> outputs;
};

TEST_F(TrackerTest, ResolvesAfterDelay)
{
    std::unique_ptr<MlatTracker> tracker = make_tracker();
    feed(*tracker, ident, 4, 50.0);
    EXPECT_EQ(tracker->pending_size(), 1u);

    double deadline;
    ASSERT_TRUE(tracker->next_deadline(deadline));
    EXPECT_DOUBLE_EQ(deadline, 1002.5);

    clock.set(1002.4);
    EXPECT_EQ(tracker->run_pending(), 0);
    EXPECT_TRUE(outputs.empty());

    clock.set(1002.5);
    EXPECT_EQ(tracker->run_pending(), 1);
    EXPECT_EQ(tracker->pending_size(), 0u);

    ASSERT_EQ(solver.clusters.size(), 1u);
    EXPECT_EQ(solver.clusters[0].size(), 4u);
    EXPECT_FALSE(solver.altitudes[0].valid);

    ASSERT_EQ(outputs.size(), 1u);
    EXPECT_DOUBLE_EQ(outputs[0].first_seen, 1000.0);
    EXPECT_EQ(outputs[0].address, KLM_ICAO);
    EXPECT_EQ(outputs[0].nrcv, 4u);
    EXPECT_EQ(outputs[0].distinct, 4);
    EXPECT_TRUE(outputs[0].has_filter);

    EXPECT_EQ(filter->updates, 1);
    EXPECT_EQ(filter->last_distinct, 4);
    ASSERT_TRUE(ac->has_result);
    EXPECT_EQ(ac->last_result.distinct, 4);
    EXPECT_DOUBLE_EQ(ac->last_result.time, 1002.5);
    EXPECT_TRUE(ac->has_callsign);
    EXPECT_EQ(ac->callsign, "KLM1023");
}

TEST_F(TrackerTest, CopiesAfterFirstShareOneGroup)
{
    std::unique_ptr<MlatTracker> tracker = make_tracker();
    tracker->receiver_mlat(rcvs[0], arrival(tx, rcvs[0], 50.0), ident);
    clock.advance(1.0);
    for (size_t i = 1; i < 4; ++i)
        tracker->receiver_mlat(rcvs[i], arrival(tx, rcvs[i], 50.0), ident);
    EXPECT_EQ(tracker->pending_size(), 1u);

    // deadline counted from the first copy, never renewed
    clock.set(1002.5);
    EXPECT_EQ(tracker->run_pending(), 1);
    ASSERT_EQ(solver.clusters.size(), 1u);
    EXPECT_EQ(solver.clusters[0].size(), 4u);

    // the same bytes after resolution start a new group
    tracker->receiver_mlat(rcvs[0], arrival(tx, rcvs[0], 60.0), ident);
    EXPECT_EQ(tracker->pending_size(), 1u);
}

TEST_F(TrackerTest, TooFewCopies)
{
    std::unique_ptr<MlatTracker> tracker = make_tracker();
    feed(*tracker, ident, 2, 50.0);
    clock.advance(3.0);
    EXPECT_EQ(tracker->run_pending(), 1);
    EXPECT_EQ(tracker->pending_size(), 0u);
    EXPECT_TRUE(outputs.empty());
    EXPECT_EQ(normalizer.calls, 0);
    // not decoded either
    EXPECT_FALSE(ac->has_callsign);
}

TEST_F(TrackerTest, UnknownAircraftIgnored)
{
    std::string other;
    ASSERT_EQ(hex2bytes("5DABCDEF000000", other), 0);
    std::unique_ptr<MlatTracker> tracker = make_tracker();
    feed(*tracker, other, 4, 50.0);
    clock.advance(3.0);
    tracker->run_pending();
    EXPECT_TRUE(outputs.empty());
    EXPECT_EQ(normalizer.calls, 0);
}

TEST_F(TrackerTest, StateRefreshWithoutPosition)
{
    // squawk reply, no altitude known: four receivers needed, three present
    std::string squawk;
    ASSERT_EQ(hex2bytes("29001B3AF47E76", squawk), 0);
    AircraftPtr other = aircraft.add(0x7C1474);

    std::unique_ptr<MlatTracker> tracker = make_tracker();
    feed(*tracker, squawk, 3, 50.0);
    clock.advance(3.0);
    tracker->run_pending();

    EXPECT_TRUE(outputs.empty());
    EXPECT_EQ(normalizer.calls, 0);
    ASSERT_TRUE(other->has_squawk);
    EXPECT_EQ(other->squawk, 03751);
    EXPECT_FALSE(other->has_result);
}

TEST_F(TrackerTest, AltitudeAllowsThreeReceivers)
{
    // DF4 altitude reply from 7C1B28, 10000 ft
    std::string altreply;
    ASSERT_EQ(hex2bytes("200006A2DE8B1C", altreply), 0);
    AircraftPtr other = aircraft.add(0x7C1B28);

    std::unique_ptr<MlatTracker> tracker = make_tracker();
    feed(*tracker, altreply, 3, 50.0);
    clock.advance(3.0);
    tracker->run_pending();

    ASSERT_TRUE(other->has_altitude);
    EXPECT_DOUBLE_EQ(other->altitude, 10000.0);
    EXPECT_DOUBLE_EQ(other->last_altitude_time, clock.now());
    ASSERT_EQ(solver.altitudes.size(), 1u);
    EXPECT_TRUE(solver.altitudes[0].valid);
    EXPECT_NEAR(solver.altitudes[0].altitude, 3048.0, 1E-9);
    ASSERT_EQ(outputs.size(), 1u);
    EXPECT_EQ(outputs[0].distinct, 3);
}

TEST_F(TrackerTest, BlacklistedReceiversExcluded)
{
    write_file(cfg.blacklist_file, "dave\n");
    std::unique_ptr<MlatTracker> tracker = make_tracker();
    EXPECT_TRUE(tracker->blacklist().contains("dave"));

    feed(*tracker, ident, 4, 50.0);
    clock.advance(3.0);
    tracker->run_pending();
    EXPECT_TRUE(outputs.empty());
    EXPECT_EQ(normalizer.calls, 0);

    // with a fifth receiver the quorum is met again, without dave
    feed(*tracker, ident, 5, 60.0);
    clock.advance(3.0);
    tracker->run_pending();
    ASSERT_EQ(solver.clusters.size(), 1u);
    for (const ClusterEntry &e : solver.clusters[0])
        EXPECT_NE(e.receiver->user, "dave");
}

TEST_F(TrackerTest, RateLimitedAfterRecentResult)
{
    std::unique_ptr<MlatTracker> tracker = make_tracker();
    feed(*tracker, ident, 5, 50.0);
    clock.advance(3.0);
    tracker->run_pending();
    ASSERT_EQ(outputs.size(), 1u);
    EXPECT_EQ(outputs[0].distinct, 5);

    // four receivers five seconds later: throttled before normalization
    clock.advance(2.5);
    feed(*tracker, ident, 4, 55.0);
    clock.advance(2.5);
    tracker->run_pending();
    EXPECT_EQ(outputs.size(), 1u);
    EXPECT_EQ(normalizer.calls, 1);

    // twenty seconds after the result fewer receivers are accepted
    clock.set(1023.0);
    feed(*tracker, ident, 4, 70.0);
    clock.advance(2.5);
    tracker->run_pending();
    ASSERT_EQ(outputs.size(), 2u);
    EXPECT_EQ(outputs[1].distinct, 4);
    // the prior seeds the solver
    EXPECT_TRUE(solver.seeds.back().isApprox(solver.position));
}

TEST_F(TrackerTest, ReloadRereadsBlacklist)
{
    std::unique_ptr<MlatTracker> tracker = make_tracker();
    EXPECT_EQ(tracker->blacklist().size(), 0u);
    write_file(cfg.blacklist_file, "erin\n");
    tracker->handle_reload();
    EXPECT_TRUE(tracker->blacklist().contains("erin"));
    tracker->handle_reload();
    EXPECT_EQ(tracker->blacklist().size(), 1u);
}

TEST_F(TrackerTest, PseudorangeLogged)
{
    cfg.pseudorange_file = ::testing::TempDir()+"mlat_tracker_pseudoranges.json";
    std::remove(cfg.pseudorange_file.c_str());
    std::unique_ptr<MlatTracker> tracker = make_tracker();
    ASSERT_TRUE(tracker->pseudorange_log().is_open());

    feed(*tracker, ident, 4, 50.0);
    clock.advance(3.0);
    tracker->run_pending();
    tracker->pseudorange_log().flush();

    std::vector<std::string> lines = read_lines(cfg.pseudorange_file);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("\"icao\": \"4840d6\""), std::string::npos);
    EXPECT_NE(lines[0].find("\"time\": 1000.000"), std::string::npos);
    EXPECT_NE(lines[0].find("\"distinct\": 4"), std::string::npos);

    EXPECT_TRUE(tracker->reopen_pseudoranges());
}

TEST_F(TrackerTest, SmallComponentsNeverClustered)
{
    // erin runs on a clock of its own
    ClockDomainNormalizer domains;
    for (size_t i = 0; i < 4; ++i) domains.set_clock(rcvs[i]->id, 0, 0.0, 1E-14);
    domains.set_clock(rcvs[4]->id, 1, 0.0, 1E-14);

    std::unique_ptr<MlatTracker> tracker = make_tracker(domains, solver);
    feed(*tracker, ident, 5, 50.0);
    clock.advance(3.0);
    tracker->run_pending();

    ASSERT_EQ(solver.clusters.size(), 1u);
    EXPECT_EQ(solver.clusters[0].size(), 4u);
    for (const ClusterEntry &e : solver.clusters[0])
        EXPECT_NE(e.receiver->id, rcvs[4]->id);
    ASSERT_EQ(outputs.size(), 1u);
    EXPECT_EQ(outputs[0].distinct, 4);

    // three and two receivers per domain: nothing reaches the solver
    domains.set_clock(rcvs[3]->id, 1, 0.0, 1E-14);
    clock.advance(20.0);
    feed(*tracker, ident, 5, 80.0);
    clock.advance(3.0);
    tracker->run_pending();
    EXPECT_EQ(solver.clusters.size(), 1u);
    EXPECT_EQ(outputs.size(), 1u);
}

TEST_F(TrackerTest, FirstFixWithPseudorangeSolver)
{
    ClockDomainNormalizer domains;
    for (const ReceiverPtr &r : rcvs) domains.set_clock(r->id, 0, 0.0, 1E-14);
    PseudorangeSolver pseudorange;

    std::unique_ptr<MlatTracker> tracker = make_tracker(domains, pseudorange);
    ASSERT_FALSE(ac->has_result);
    feed(*tracker, ident, 4, 50.0);
    clock.advance(3.0);
    EXPECT_EQ(tracker->run_pending(), 1);

    ASSERT_EQ(outputs.size(), 1u);
    EXPECT_EQ(outputs[0].distinct, 4);
    EXPECT_LT((outputs[0].ecef-tx).norm(), 10.0);
    ASSERT_TRUE(ac->has_result);
    EXPECT_LT((ac->last_result.pos-tx).norm(), 10.0);
    EXPECT_LE(ac->last_result.var, MAX_VAR_EST);
    EXPECT_EQ(filter->updates, 1);
}

TEST_F(TrackerTest, RunUntilResolvesAtEachDeadline)
{
    std::unique_ptr<MlatTracker> tracker = make_tracker();
    feed(*tracker, ident, 5, 50.0);

    // the next transmission arrives two minutes later
    EXPECT_EQ(run_until(*tracker, clock, 1119.0), 1);
    EXPECT_DOUBLE_EQ(clock.now(), 1119.0);
    ASSERT_EQ(outputs.size(), 1u);
    EXPECT_DOUBLE_EQ(outputs[0].resolved_at, 1002.5);
    EXPECT_DOUBLE_EQ(ac->last_result.time, 1002.5);

    // fewer receivers long after the first result are not rate limited
    feed(*tracker, ident, 4, 169.0);
    EXPECT_EQ(run_until(*tracker, clock, 1200.0), 1);
    ASSERT_EQ(outputs.size(), 2u);
    EXPECT_DOUBLE_EQ(outputs[1].resolved_at, 1121.5);
    EXPECT_EQ(outputs[1].distinct, 4);
    EXPECT_EQ(tracker->pending_size(), 0u);
}

TEST_F(TrackerTest, RunUntilStopsAtTarget)
{
    std::unique_ptr<MlatTracker> tracker = make_tracker();
    feed(*tracker, ident, 4, 50.0);
    EXPECT_EQ(run_until(*tracker, clock, 1002.0), 0);
    EXPECT_DOUBLE_EQ(clock.now(), 1002.0);
    EXPECT_EQ(tracker->pending_size(), 1u);
    EXPECT_EQ(run_until(*tracker, clock, 1002.5), 1);
    EXPECT_EQ(outputs.size(), 1u);
}

TEST_F(TrackerTest, ReopenRetriesConfiguredPath)
{
    std::string dir = ::testing::TempDir()+"mlat_tracker_prdir";
    cfg.pseudorange_file = dir+"/pseudoranges.json";
    std::remove(cfg.pseudorange_file.c_str());
    rmdir(dir.c_str());

    std::unique_ptr<MlatTracker> tracker = make_tracker();
    EXPECT_FALSE(tracker->pseudorange_log().is_open());
    EXPECT_EQ(tracker->pseudorange_log().file(), cfg.pseudorange_file);
    EXPECT_FALSE(tracker->reopen_pseudoranges());
    EXPECT_FALSE(tracker->pseudorange_log().is_open());

    ASSERT_EQ(mkdir(dir.c_str(), 0755), 0);
    EXPECT_TRUE(tracker->reopen_pseudoranges());
    EXPECT_TRUE(tracker->pseudorange_log().is_open());

    tracker.reset();
    std::remove(cfg.pseudorange_file.c_str());
    rmdir(dir.c_str());
}
