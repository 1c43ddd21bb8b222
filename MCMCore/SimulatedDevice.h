///////////////////////////////////////////////////////////////////////////////
// FILE:          SimulatedDevice.h
// PROJECT:       MCMControl
// SUBSYSTEM:     MCMCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   In-process stand-in for an MCM3000 controller
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

#include "Transport.h"

#include <deque>
#include <string>
#include <vector>

namespace mcm {

/**
 * Answers the MCM3000 protocol without hardware.
 *
 * Each channel has an encoder value and a target. A move command sets the
 * target; the encoder advances toward it by StepPerRead counts on every
 * position query (0 means it arrives at once). Behavior is fully
 * deterministic. The knobs below let tests produce stalls, settling errors
 * and stray input.
 */
class SimulatedDevice : public Transport {
public:
   SimulatedDevice();

   virtual void Write(const std::vector<unsigned char>& bytes);
   virtual std::vector<unsigned char> Read(std::size_t count);
   virtual std::size_t BytesWaiting();
   virtual void Close();
   virtual bool IsOpen() const;
   virtual std::string Describe() const;

   // Places the stage at value without a move (as if moved by hand)
   void SetEncoderValue(unsigned index, long value);
   long GetEncoderValue(unsigned index) const;
   long GetTargetValue(unsigned index) const;

   void SetStepPerRead(long counts) { stepPerRead_ = counts; }

   // A stalled channel ignores move and zero commands
   void SetStalled(unsigned index, bool stalled);

   // Moves on this channel stop offset counts from the commanded target
   void SetSettleOffset(unsigned index, long offset);

   // Queued after the response to the next command
   void InjectNoise(const std::vector<unsigned char>& bytes);

   unsigned GetMoveCommandCount() const { return moveCommands_; }
   unsigned GetQueryCount() const { return queries_; }

private:
   struct Axis {
      Axis() : encoder(0), target(0), stalled(false), settleOffset(0) {}
      long encoder;
      long target;
      bool stalled;
      long settleOffset;
   };

   Axis& AxisAt(unsigned index);
   const Axis& AxisAt(unsigned index) const;
   void Advance(Axis& axis);
   void QueuePositionResponse(unsigned index);

   std::vector<Axis> axes_;
   std::deque<unsigned char> output_;
   std::vector<unsigned char> noise_;
   long stepPerRead_;
   bool open_;
   unsigned moveCommands_;
   unsigned queries_;
};

} // namespace mcm
