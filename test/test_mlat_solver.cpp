#include <gtest/gtest.h>

#include "mlat_track/mlat_solver.hpp"
#include "test_helpers.hpp"

using namespace mlat_track;
using namespace mlat_test;

class SolverTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        add_test_receivers(registry, rcvs);
        tx = test_transmitter();
    }

    std::vector<ClusterEntry> cluster_of(size_t n)
    {
        std::vector<ClusterEntry> cluster;
        for (size_t i = 0; i < n; ++i)
        {
            ClusterEntry e;
            e.receiver = rcvs[i];
            e.timestamp = arrival(tx, rcvs[i], 500.0);
            e.variance = 1E-14;
            cluster.push_back(e);
        }
        std::sort(cluster.begin(), cluster.end(),
                  [](const ClusterEntry &a, const ClusterEntry &b) { return a.timestamp < b.timestamp; });
        return cluster;
    }

    ReceiverRegistry registry;
    std::vector<ReceiverPtr> rcvs;
    Eigen::Vector3d tx;
    PseudorangeSolver solver;
};

TEST_F(SolverTest, FiveReceiversNoAltitude)
{
    // first fix: seeded at the earliest receiver of the cluster
    std::vector<ClusterEntry> cluster = cluster_of(5);
    MlatSolution sol;
    ASSERT_TRUE(solver.solve(cluster, AltitudeAid(), cluster.front().receiver->pos, sol));
    EXPECT_LT((sol.ecef-tx).norm(), 10.0);
    EXPECT_TRUE(sol.has_cov);
    EXPECT_GT(sol.ecef_cov.trace(), 0.0);
}

TEST_F(SolverTest, FourReceiversSeededAtEachReceiver)
{
    std::vector<ClusterEntry> cluster = cluster_of(4);
    for (const ClusterEntry &e : cluster)
    {
        MlatSolution sol;
        ASSERT_TRUE(solver.solve(cluster, AltitudeAid(), e.receiver->pos, sol)) << "receiver " << e.receiver->id;
        EXPECT_LT((sol.ecef-tx).norm(), 10.0);
    }
}

TEST_F(SolverTest, SeedNearTruthNoAltitude)
{
    MlatSolution sol;
    Eigen::Vector3d seed = tx+Eigen::Vector3d(2000.0, -1500.0, 1000.0);
    ASSERT_TRUE(solver.solve(cluster_of(5), AltitudeAid(), seed, sol));
    EXPECT_LT((sol.ecef-tx).norm(), 10.0);
}

TEST_F(SolverTest, ThreeReceiversWithAltitude)
{
    AltitudeAid alt;
    alt.valid = true;
    alt.altitude = 9000.0;
    alt.error = 50.0;

    MlatSolution sol;
    ASSERT_TRUE(solver.solve(cluster_of(3), alt, rcvs[0]->pos, sol));
    EXPECT_LT((sol.ecef-tx).norm(), 10.0);
    EXPECT_NEAR(ecef2geo(sol.ecef)(2), 9000.0, 5.0);
}

TEST_F(SolverTest, TooFewMeasurements)
{
    MlatSolution sol;
    EXPECT_FALSE(solver.solve(cluster_of(3), AltitudeAid(), rcvs[0]->pos, sol));
    EXPECT_FALSE(solver.solve(std::vector<ClusterEntry>(), AltitudeAid(), rcvs[0]->pos, sol));
}

TEST_F(SolverTest, RejectsImplausibleAltitude)
{
    // consistent with a transmitter far above the ceiling
    tx = geo2ecef(Eigen::Vector3d(52.05, 0.05, 40000.0));
    MlatSolution sol;
    EXPECT_FALSE(solver.solve(cluster_of(5), AltitudeAid(), tx, sol));
}
