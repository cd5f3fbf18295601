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
*
* As many of the utility functions are adapted from RTKLIB, 
* the license for those part of code is claimed as follows:
* 
* The RTKLIB software package is distributed under the following BSD 2-clause
* license (http://opensource.org/licenses/BSD-2-Clause) and additional two
* exclusive clauses. Users are permitted to develop, produce or sell their own
* non-commercial or commercial products utilizing, linking or including RTKLIB as
* long as they comply with the license.
* 
*         Copyright (c) 2007-2020, T. Takasu, All rights reserved.
*/

#include <cmath>
#include <eigen3/Eigen/Dense>
#include <eigen3/Eigen/Cholesky>

#include "mlat_track/mlat_common.hpp"

namespace mlat_track
{
    int lsq(const Eigen::MatrixXd &H, const Eigen::VectorXd &v, Eigen::VectorXd &x,
            Eigen::MatrixXd &Q)
    {
        const int n = static_cast<int>(H.cols());
        if (H.rows() < n || v.size() != H.rows()) return -1;

        // normal equation: (H'*H) * x = H' * v
        Eigen::MatrixXd N = H.transpose() * H;
        Eigen::VectorXd b = H.transpose() * v;

        Eigen::LLT<Eigen::MatrixXd> llt(N);
        if (llt.info() != Eigen::Success)
            return -1;
        x = llt.solve(b);
        Q = llt.solve(Eigen::MatrixXd::Identity(n, n));
        if (!x.allFinite() || !Q.allFinite())
            return -2;
        return 0;
    }

    Eigen::Vector3d geo2ecef(const Eigen::Vector3d &lla)
    {
        const double lat = lla(0)*D2R, lon = lla(1)*D2R;
        const double sinp = sin(lat), cosp = cos(lat), sinl = sin(lon), cosl = cos(lon);
        const double e2 = FE_WGS84*(2.0-FE_WGS84);
        const double v = RE_WGS84/sqrt(1.0-e2*sinp*sinp);

        Eigen::Vector3d xyz;
        xyz(0) = (v+lla(2))*cosp*cosl;
        xyz(1) = (v+lla(2))*cosp*sinl;
        xyz(2) = (v*(1.0-e2)+lla(2))*sinp;
        return xyz;
    }

    Eigen::Vector3d ecef2geo(const Eigen::Vector3d &xyz)
    {
        const double e2 = FE_WGS84*(2.0-FE_WGS84);
        const double r2 = xyz(0)*xyz(0)+xyz(1)*xyz(1);
        double z, zk, v = RE_WGS84, sinp;

        for (z = xyz(2), zk = 0.0; fabs(z-zk) >= 1E-4;)
        {
            zk = z;
            sinp = z/sqrt(r2+z*z);
            v = RE_WGS84/sqrt(1.0-e2*sinp*sinp);
            z = xyz(2)+v*e2*sinp;
        }
        Eigen::Vector3d lla;
        lla(0) = (r2 > 1E-12 ? atan(z/sqrt(r2)) : (xyz(2) > 0.0 ? M_PI/2.0 : -M_PI/2.0))*R2D;
        lla(1) = (r2 > 1E-12 ? atan2(xyz(1), xyz(0)) : 0.0)*R2D;
        lla(2) = sqrt(r2+z*z)-v;
        return lla;
    }

    Eigen::Vector3d geo_up(const Eigen::Vector3d &lla)
    {
        const double lat = lla(0)*D2R, lon = lla(1)*D2R;
        return Eigen::Vector3d(cos(lat)*cos(lon), cos(lat)*sin(lon), sin(lat));
    }

    uint32_t getbitu(const uint8_t *buff, int pos, int len)
    {
        uint32_t bits = 0;
        for (int i = pos; i < pos+len; ++i)
            bits = (bits<<1)+((buff[i/8]>>(7-i%8))&1u);
        return bits;
    }

    uint32_t crc24_modes(const uint8_t *buff, int len)
    {
        uint32_t crc = 0;
        for (int i = 0; i < len; ++i)
        {
            crc ^= static_cast<uint32_t>(buff[i])<<16;
            for (int j = 0; j < 8; ++j)
            {
                crc <<= 1;
                if (crc&0x1000000) crc ^= 0x1FFF409;
            }
        }
        return crc&0xFFFFFF;
    }

    static int hexval(char c)
    {
        if (c >= '0' && c <= '9') return c-'0';
        if (c >= 'a' && c <= 'f') return c-'a'+10;
        if (c >= 'A' && c <= 'F') return c-'A'+10;
        return -1;
    }

    int hex2bytes(const std::string &hex, std::string &bytes)
    {
        bytes.clear();
        if (hex.size()%2) return -1;
        for (size_t i = 0; i < hex.size(); i += 2)
        {
            int hi = hexval(hex[i]), lo = hexval(hex[i+1]);
            if (hi < 0 || lo < 0) return -1;
            bytes.push_back(static_cast<char>((hi<<4)|lo));
        }
        return 0;
    }

    std::string bytes2hex(const std::string &bytes)
    {
        static const char digits[] = "0123456789ABCDEF";
        std::string hex;
        hex.reserve(bytes.size()*2);
        for (char c : bytes)
        {
            uint8_t b = static_cast<uint8_t>(c);
            hex.push_back(digits[b>>4]);
            hex.push_back(digits[b&0xF]);
        }
        return hex;
    }
}   // namespace mlat_track
