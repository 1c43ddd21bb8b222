///////////////////////////////////////////////////////////////////////////////
// FILE:          DeviceUtils.h
// PROJECT:       MCMControl
// SUBSYSTEM:     MCMDevice - Device kit
//-----------------------------------------------------------------------------
// DESCRIPTION:   Class with utility methods for building device drivers
// LICENSE:       This file is distributed under the BSD license.
//                License text is included with the source distribution.
//
//                This file is distributed in the hope that it will be useful,
//                but WITHOUT ANY WARRANTY; without even the implied warranty
//                of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//
//                IN NO EVENT SHALL THE COPYRIGHT OWNER OR
//                CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT,
//                INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES.
//

#pragma once

#include <string>
#include <vector>

namespace mcm {

class CDeviceUtils
{
public:
   static void SleepMs(long ms);
   // Space-separated upper-case hex bytes, e.g. "0A 04 00 00 00 00"
   static std::string HexRep(const std::vector<unsigned char>& values);
   static std::string ToLower(const std::string& str);
};

} // namespace mcm
