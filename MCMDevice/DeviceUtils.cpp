///////////////////////////////////////////////////////////////////////////////
// FILE:          DeviceUtils.cpp
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

#include "DeviceUtils.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <thread>

namespace mcm {

/**
 * Suspends the calling thread for the specified number of milliseconds.
 */
void CDeviceUtils::SleepMs(long ms)
{
   if (ms <= 0)
      return;
   std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

std::string CDeviceUtils::HexRep(const std::vector<unsigned char>& values)
{
   std::string ret;
   ret.reserve(values.size() * 3);
   char buf[4];
   for (std::vector<unsigned char>::const_iterator it = values.begin();
         it != values.end(); ++it)
   {
      if (it != values.begin())
         ret += ' ';
      std::snprintf(buf, sizeof(buf), "%02X", static_cast<unsigned>(*it));
      ret += buf;
   }
   return ret;
}

std::string CDeviceUtils::ToLower(const std::string& str)
{
   std::string lower(str);
   std::transform(lower.begin(), lower.end(), lower.begin(),
         [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
   return lower;
}

} // namespace mcm
