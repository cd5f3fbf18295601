#include <gtest/gtest.h>

#include "mlat_track/mlat_common.hpp"

using namespace mlat_track;

TEST(MlatCommon, GeodeticRoundTrip)
{
    Eigen::Vector3d lla(52.05, 0.05, 9000.0);
    Eigen::Vector3d back = ecef2geo(geo2ecef(lla));
    EXPECT_NEAR(back(0), lla(0), 1E-9);
    EXPECT_NEAR(back(1), lla(1), 1E-9);
    EXPECT_NEAR(back(2), lla(2), 1E-3);

    Eigen::Vector3d equator = geo2ecef(Eigen::Vector3d(0.0, 0.0, 0.0));
    EXPECT_NEAR(equator(0), RE_WGS84, 1E-6);
    EXPECT_NEAR(equator(1), 0.0, 1E-6);
    EXPECT_NEAR(equator(2), 0.0, 1E-6);
}

TEST(MlatCommon, GeoUpIsNormalToSurface)
{
    Eigen::Vector3d lla(45.0, 10.0, 0.0);
    Eigen::Vector3d up = geo_up(lla);
    EXPECT_NEAR(up.norm(), 1.0, 1E-12);

    Eigen::Vector3d above = lla;
    above(2) = 100.0;
    Eigen::Vector3d d = geo2ecef(above)-geo2ecef(lla);
    EXPECT_NEAR(d.dot(up), 100.0, 1E-6);
}

TEST(MlatCommon, LeastSquaresSolvesOverdetermined)
{
    Eigen::MatrixXd H(3, 2);
    H << 1.0, 0.0,
         0.0, 1.0,
         1.0, 1.0;
    Eigen::VectorXd v(3);
    v << 1.0, 2.0, 3.0;
    Eigen::VectorXd x;
    Eigen::MatrixXd Q;
    ASSERT_EQ(lsq(H, v, x, Q), 0);
    EXPECT_NEAR(x(0), 1.0, 1E-12);
    EXPECT_NEAR(x(1), 2.0, 1E-12);
    EXPECT_EQ(Q.rows(), 2);

    // fewer measurements than parameters
    Eigen::MatrixXd H1(1, 2);
    H1 << 1.0, 1.0;
    Eigen::VectorXd v1(1);
    v1 << 1.0;
    EXPECT_NE(lsq(H1, v1, x, Q), 0);
}

TEST(MlatCommon, BitsAndParity)
{
    std::string raw;
    ASSERT_EQ(hex2bytes("8D4840D6202CC371C32CE0576098", raw), 0);
    const uint8_t *buff = reinterpret_cast<const uint8_t*>(raw.data());

    EXPECT_EQ(getbitu(buff, 0, 5), 17u);
    EXPECT_EQ(getbitu(buff, 8, 24), 0x4840D6u);
    // extended squitter parity carries no address overlay
    EXPECT_EQ(crc24_modes(buff, 11), getbitu(buff, 88, 24));
}

TEST(MlatCommon, HexConversion)
{
    std::string raw;
    EXPECT_EQ(hex2bytes("00ff7A", raw), 0);
    EXPECT_EQ(raw.size(), 3u);
    EXPECT_EQ(bytes2hex(raw), "00FF7A");
    EXPECT_NE(hex2bytes("abc", raw), 0);
    EXPECT_NE(hex2bytes("zz", raw), 0);
}
