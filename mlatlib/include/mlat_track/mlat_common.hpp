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

#ifndef MLAT_COMMON_HPP_
#define MLAT_COMMON_HPP_

#include <string>
#include <cstdint>
#include <eigen3/Eigen/Dense>

#include "mlat_constant.hpp"

namespace mlat_track
{
    /* least square estimation -----------------------------------------------------
    * least square estimation by solving normal equation (x=(H'*H)^-1*H'*v)
    * args   : Eigen::MatrixXd H    I   (weighted) design matrix (m x n)
    *          Eigen::VectorXd v    I   (weighted) residuals (m x 1)
    *          Eigen::VectorXd x    O   estimated parameters (n x 1)
    *          Eigen::MatrixXd Q    O   estimated parameters covariance matrix (n x n)
    * return : status (0:ok,0>:error)
    * notes  : for weighted least square, replace H and v by w*H and w*v (w=W^(1/2))
    *-----------------------------------------------------------------------------*/
    int lsq(const Eigen::MatrixXd &H, const Eigen::VectorXd &v, Eigen::VectorXd &x,
            Eigen::MatrixXd &Q);

    /* transform geodetic to ecef position -----------------------------------------
    * args   : Eigen::Vector3d lla  I   geodetic position {lat,lon,h} (deg,deg,m)
    * return : ecef position {x,y,z} (m)
    *-----------------------------------------------------------------------------*/
    Eigen::Vector3d geo2ecef(const Eigen::Vector3d &lla);

    /* transform ecef to geodetic position -----------------------------------------
    * args   : Eigen::Vector3d xyz  I   ecef position {x,y,z} (m)
    * return : geodetic position {lat,lon,h} (deg,deg,m)
    * notes  : WGS84, ellipsoidal height
    *-----------------------------------------------------------------------------*/
    Eigen::Vector3d ecef2geo(const Eigen::Vector3d &xyz);

    /* local up unit vector at a geodetic position (ecef) */
    Eigen::Vector3d geo_up(const Eigen::Vector3d &lla);

    /* extract unsigned bits -------------------------------------------------------
    * extract unsigned bits from byte data (msb first)
    * args   : uint8_t *buff    I   byte data
    *          int    pos       I   bit position from start of data (bits)
    *          int    len       I   bit length (bits) (len<=32)
    * return : extracted unsigned bits
    *-----------------------------------------------------------------------------*/
    uint32_t getbitu(const uint8_t *buff, int pos, int len);

    /* mode s parity ---------------------------------------------------------------
    * crc-24 with the mode s generator polynomial (0x1FFF409)
    * args   : uint8_t *buff    I   data
    *          int    len       I   data length (bytes)
    * return : crc-24 parity
    *-----------------------------------------------------------------------------*/
    uint32_t crc24_modes(const uint8_t *buff, int len);

    /* convert hex string to raw bytes (0:ok, -1:bad hex) */
    int hex2bytes(const std::string &hex, std::string &bytes);

    /* convert raw bytes to upper case hex string */
    std::string bytes2hex(const std::string &bytes);
}   // namespace mlat_track

#endif
