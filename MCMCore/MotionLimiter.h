///////////////////////////////////////////////////////////////////////////////
// FILE:          MotionLimiter.h
// PROJECT:       MCMControl
// SUBSYSTEM:     MCMCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Turns move requests into legal encoder targets
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

namespace mcm {

struct MotionPlan {
   MotionPlan() :
      motionRequired(false),
      deadbandBump(false),
      targetEncoder(0),
      targetUm(0.0)
   {}

   // False when the target equals the pending target (motion already in
   // progress) or, with nothing pending, the current position.
   bool motionRequired;

   // The target is within the minimum encoder motion of the reference;
   // a corrective excursion (FindExcursion()) should be made first.
   bool deadbandBump;

   long targetEncoder;
   double targetUm;
};


/**
 * Legalizes move requests against a channel's scan limits.
 *
 * The limiter never moves anything; it reads channel state from the table
 * and reports what the caller must do.
 */
class MotionLimiter {
public:
   explicit MotionLimiter(const ChannelTable& table) : table_(table) {}

   /**
    * Computes the absolute target for a move request.
    *
    * Relative requests are taken from the pending target when a move is in
    * flight, else from the current encoder value.
    *
    * Throws MCMERR_ChannelNotConfigured for a channel without a stage and
    * MCMERR_LimitExceeded for a target outside [scanLowestUm, scanHighestUm]
    * or outside the 32-bit encoder range.
    * Out-of-range targets are never clamped.
    */
   MotionPlan LegalizeMove(ChannelIndex index, double um, bool relative) const;

   /**
    * Finds the point of the corrective excursion made before a move that
    * falls within the deadband.
    *
    * The excursion is 10 um up, or 10 um down when the scan range has no
    * room above. When neither fits it shrinks to the larger room available.
    * Returns false, leaving excursionEncoder untouched, when no point inside
    * the scan range is more than minMotionCounts away from both the
    * reference and the target.
    */
   bool FindExcursion(ChannelIndex index, long targetEncoder,
         long& excursionEncoder) const;

   // Pending target if a move is in flight, else the current encoder value
   static long ReferenceEncoder(const Channel& ch);

private:
   bool InScanRange(const Channel& ch, double um) const;

   const ChannelTable& table_;
};

} // namespace mcm
