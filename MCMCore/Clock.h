///////////////////////////////////////////////////////////////////////////////
// FILE:          Clock.h
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

#pragma once

#include <atomic>
#include <chrono>

namespace mcm {

/**
 * Time source used by the motion poll loop. Production code uses
 * SystemClock; tests substitute a clock whose sleeps advance virtual time.
 */
class Clock {
public:
   typedef std::chrono::steady_clock::time_point TimePoint;

   virtual ~Clock() {}

   virtual TimePoint Now() = 0;
   virtual void SleepFor(std::chrono::milliseconds duration) = 0;
};


class SystemClock : public Clock {
public:
   virtual TimePoint Now();
   virtual void SleepFor(std::chrono::milliseconds duration);
};


// Set from any thread to end a motion wait early.
class CancellationToken {
   std::atomic<bool> cancelled_;

public:
   CancellationToken() : cancelled_(false) {}

   void Cancel() { cancelled_.store(true); }
   void Reset() { cancelled_.store(false); }
   bool IsCancelled() const { return cancelled_.load(); }
};

} // namespace mcm
