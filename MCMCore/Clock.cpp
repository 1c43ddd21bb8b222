///////////////////////////////////////////////////////////////////////////////
// FILE:          Clock.cpp
// PROJECT:       MCMControl
// SUBSYSTEM:     MCMCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Time source and sleep abstraction for motion polling
//
// LICENSE:       This file is distributed under the "Lesser GPL" (LGPL) license.
//                License text is included with the source distribution.
//
//                This file is distributed in the hope that it will be useful,
//                but WITHOUT ANY WARRANTY; without even the implied warranty
//                of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//
//                IN NO EVENT SHALL THE COPYRIGHT OWNER OR
//                CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT,
//                INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES.

#include "Clock.h"

#include "../MCMDevice/DeviceUtils.h"

namespace mcm {

Clock::TimePoint
SystemClock::Now()
{
   return std::chrono::steady_clock::now();
}


void
SystemClock::SleepFor(std::chrono::milliseconds duration)
{
   CDeviceUtils::SleepMs(static_cast<long>(duration.count()));
}

} // namespace mcm
