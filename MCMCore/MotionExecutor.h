///////////////////////////////////////////////////////////////////////////////
// FILE:          MotionExecutor.h
// PROJECT:       MCMControl
// SUBSYSTEM:     MCMCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Sends protocol commands and waits for motion to settle
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

#include "ChannelIndex.h"
#include "ChannelTable.h"
#include "Clock.h"
#include "Logging/Logger.h"
#include "Transport.h"

#include <chrono>
#include <cstddef>
#include <vector>

namespace mcm {

enum MotionStatus {
   MotionIdle,      // nothing was pending
   MotionSettled,   // encoder reached the pending target
   MotionTimedOut,  // deadline passed first
   MotionCancelled, // wait interrupted through the cancellation token
};

struct MotionOutcome {
   MotionOutcome() :
      status(MotionIdle), finalEncoder(0), positionError(0), positionUm(0.0)
   {}

   MotionStatus status;
   long finalEncoder;
   long positionError; // finalEncoder - target; 0 unless timed out/cancelled
   double positionUm;
};

const char* MotionStatusName(MotionStatus status);


struct MotionTiming {
   MotionTiming() : pollInterval(100), timeout(6000) {}

   std::chrono::milliseconds pollInterval;
   std::chrono::milliseconds timeout;
};


/**
 * Executes moves on the wire and tracks the per-channel pending target.
 *
 * Every command requires the channel to have a stage
 * (MCMERR_ChannelNotConfigured). After each exchange the input buffer must
 * be empty; leftover bytes are discarded and reported as
 * MCMERR_UnexpectedData.
 */
class MotionExecutor {
public:
   MotionExecutor(ChannelTable& table, Transport& transport, Clock& clock,
         CancellationToken& cancelToken, logging::Logger logger,
         const MotionTiming& timing);

   // Finishes any pending move first. With block, waits for this one too.
   // The channel records the new target as soon as the frame is written,
   // even if stray input after it then raises MCMERR_UnexpectedData.
   void MoveToEncoderValue(ChannelIndex index, long value, bool block);

   // Polls until the pending target is reached, the timeout passes or the
   // token is cancelled. The token is not reset here; a cancelled token ends
   // every later wait at its first poll until its owner resets it. The
   // channel is idle afterwards in every case.
   MotionOutcome FinishMove(ChannelIndex index);
   MotionOutcome FinishMove(ChannelIndex index,
         std::chrono::milliseconds pollInterval,
         std::chrono::milliseconds timeout);

   long GetEncoderValue(ChannelIndex index);

   // Makes the current position encoder zero. Limits keep their old
   // numeric values, so they no longer mean the same physical positions.
   void SetEncoderToZero(ChannelIndex index);

private:
   void Send(const std::vector<unsigned char>& cmd);
   // Reads out anything left in the input and throws MCMERR_UnexpectedData
   void DrainResidue(const std::vector<unsigned char>& cmd);
   std::vector<unsigned char> Transact(const std::vector<unsigned char>& cmd,
         std::size_t responseLength);

   ChannelTable& table_;
   Transport& transport_;
   Clock& clock_;
   CancellationToken& cancelToken_;
   logging::Logger logger_;
   MotionTiming timing_;
};

} // namespace mcm
