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
#include <glog/logging.h>

#include "mlat_track/mlat_common.hpp"
#include "mlat_track/modes_message.hpp"

namespace mlat_track
{
    static const char CALLSIGN_CHARS[] =
        "#ABCDEFGHIJKLMNOPQRSTUVWXYZ##### ###############0123456789######";

    static uint32_t gray2bin(uint32_t gray)
    {
        uint32_t bin = gray;
        while (gray >>= 1) bin ^= gray;
        return bin;
    }

    /* gillham (mode c) altitude -----------------------------------------------
    * bits (msb to lsb): D1 D2 D4 A1 A2 A4 B1 B2 B4 C1 C2 C4
    *-------------------------------------------------------------------------*/
    static int gillham2alt(uint32_t gillham, int32_t &altitude_ft)
    {
        int32_t five_hundreds = static_cast<int32_t>(gray2bin(gillham>>3));
        int32_t one_hundreds  = static_cast<int32_t>(gray2bin(gillham&0x7));

        if (one_hundreds == 0 || one_hundreds == 5 || one_hundreds == 6) return -1;
        if (one_hundreds == 7) one_hundreds = 5;
        if (five_hundreds%2) one_hundreds = 6-one_hundreds;

        altitude_ft = five_hundreds*500+one_hundreds*100-1300;
        return 0;
    }

    int decode_ac13(uint32_t ac13, int32_t &altitude_ft)
    {
        // C1 A1 C2 A2 C4 A4 M B1 Q B2 D2 B4 D4
        if (ac13 == 0) return -1;

        const uint32_t m = (ac13>>6)&1, q = (ac13>>4)&1;
        if (m)
        {
            uint32_t metres = ((ac13&0x1F80)>>1)|(ac13&0x3F);
            altitude_ft = static_cast<int32_t>(std::lround(metres*MTOF));
            return 0;
        }
        if (q)
        {
            uint32_t n = ((ac13&0x1F80)>>2)|((ac13&0x20)>>1)|(ac13&0xF);
            altitude_ft = static_cast<int32_t>(n)*25-1000;
            return 0;
        }

        uint32_t c1 = (ac13>>12)&1, a1 = (ac13>>11)&1, c2 = (ac13>>10)&1, a2 = (ac13>>9)&1;
        uint32_t c4 = (ac13>>8)&1,  a4 = (ac13>>7)&1,  b1 = (ac13>>5)&1,  b2 = (ac13>>3)&1;
        uint32_t d2 = (ac13>>2)&1,  b4 = (ac13>>1)&1,  d4 = ac13&1,       d1 = q;
        uint32_t gillham = (d1<<11)|(d2<<10)|(d4<<9)|(a1<<8)|(a2<<7)|(a4<<6)|
                           (b1<<5)|(b2<<4)|(b4<<3)|(c1<<2)|(c2<<1)|c4;
        return gillham2alt(gillham, altitude_ft);
    }

    int decode_ac12(uint32_t ac12, int32_t &altitude_ft)
    {
        // re-insert the M bit (always 0 in extended squitter)
        return decode_ac13(((ac12&0xFC0)<<1)|(ac12&0x3F), altitude_ft);
    }

    uint16_t decode_id13(uint32_t id13)
    {
        // C1 A1 C2 A2 C4 A4 X B1 D1 B2 D2 B4 D4
        uint32_t c1 = (id13>>12)&1, a1 = (id13>>11)&1, c2 = (id13>>10)&1, a2 = (id13>>9)&1;
        uint32_t c4 = (id13>>8)&1,  a4 = (id13>>7)&1,  b1 = (id13>>5)&1,  d1 = (id13>>4)&1;
        uint32_t b2 = (id13>>3)&1,  d2 = (id13>>2)&1,  b4 = (id13>>1)&1,  d4 = id13&1;
        return static_cast<uint16_t>((a4<<11)|(a2<<10)|(a1<<9)|(b4<<8)|(b2<<7)|(b1<<6)|
                                     (c4<<5)|(c2<<4)|(c1<<3)|(d4<<2)|(d2<<1)|d1);
    }

    /* 8 six-bit characters starting at bit pos; false on reserved characters */
    static bool decode_callsign(const uint8_t *buff, int pos, std::string &callsign)
    {
        callsign.clear();
        for (int i = 0; i < 8; ++i)
        {
            char c = CALLSIGN_CHARS[getbitu(buff, pos+6*i, 6)];
            if (c == '#') return false;
            callsign.push_back(c);
        }
        size_t end = callsign.find_last_not_of(' ');
        callsign.erase(end == std::string::npos ? 0 : end+1);
        return true;
    }

    bool decode_modes(const std::string &message, DecodedMessage &decoded)
    {
        decoded = DecodedMessage();
        if (message.empty()) return false;

        const uint8_t *buff = reinterpret_cast<const uint8_t*>(message.data());
        const int len = static_cast<int>(message.size());
        const uint32_t df = getbitu(buff, 0, 5);
        decoded.df = df;

        int expect = 0;
        switch (df)
        {
            case 0: case 4: case 5: case 11:
                expect = MODES_SHORT_LEN; break;
            case 16: case 17: case 18: case 20: case 21:
                expect = MODES_LONG_LEN; break;
            default:
                VLOG(2) << "unsupported downlink format " << df;
                return false;
        }
        if (len != expect)
        {
            VLOG(2) << "DF" << df << " with bad length " << len;
            return false;
        }

        uint32_t ap_address = getbitu(buff, (len-3)*8, 24)^crc24_modes(buff, len-3);
        int32_t altitude_ft;

        switch (df)
        {
            case 0: case 4: case 16: case 20:
                decoded.address = ap_address;
                if (!decode_ac13(getbitu(buff, 19, 13), altitude_ft))
                {
                    decoded.has_altitude = true;
                    decoded.altitude = altitude_ft;
                }
                break;
            case 5: case 21:
                decoded.address = ap_address;
                decoded.has_squawk = true;
                decoded.squawk = decode_id13(getbitu(buff, 19, 13));
                break;
            case 11:
                decoded.address = getbitu(buff, 8, 24);
                break;
            case 17: case 18:
            {
                decoded.address = getbitu(buff, 8, 24);
                const uint32_t tc = getbitu(buff, 32, 5);
                if (tc >= 1 && tc <= 4)
                {
                    decoded.has_callsign = decode_callsign(buff, 40, decoded.callsign);
                }
                else if (tc >= 9 && tc <= 18)
                {
                    if (!decode_ac12(getbitu(buff, 40, 12), altitude_ft))
                    {
                        decoded.has_altitude = true;
                        decoded.altitude = altitude_ft;
                    }
                }
                break;
            }
        }

        // comm-b identification (BDS 2,0)
        if ((df == 20 || df == 21) && getbitu(buff, 32, 8) == 0x20)
            decoded.has_callsign = decode_callsign(buff, 40, decoded.callsign);

        return true;
    }
}   // namespace mlat_track
