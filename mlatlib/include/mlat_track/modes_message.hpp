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

#ifndef MLAT_MODES_MESSAGE_HPP_
#define MLAT_MODES_MESSAGE_HPP_

#include <string>
#include <cstdint>

#include "mlat_constant.hpp"

namespace mlat_track
{
    #define MODES_SHORT_LEN     7               /* short message length (bytes) */
    #define MODES_LONG_LEN      14              /* long message length (bytes) */

    /* decode mode s message -------------------------------------------------------
    * decode the fields of a mode s reply used by the tracker
    * args   : std::string message      I   raw message bytes (7 or 14 bytes)
    *          DecodedMessage decoded   O   decoded fields
    * return : status (true:ok, false:unsupported format or bad length)
    * notes  : the address of DF0/4/5/16/20/21 is recovered from the AP field
    *          and is only meaningful for error-free messages
    *-----------------------------------------------------------------------------*/
    bool decode_modes(const std::string &message, DecodedMessage &decoded);

    /* decode 13-bit altitude code (AC13) to feet (0:ok, -1:invalid/unavailable) */
    int decode_ac13(uint32_t ac13, int32_t &altitude_ft);

    /* decode 12-bit extended squitter altitude (AC12) to feet (0:ok, -1:invalid) */
    int decode_ac12(uint32_t ac12, int32_t &altitude_ft);

    /* decode 13-bit identity code to an octal packed squawk */
    uint16_t decode_id13(uint32_t id13);
}   // namespace mlat_track

#endif
