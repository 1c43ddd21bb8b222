///////////////////////////////////////////////////////////////////////////////
// FILE:          MotionLimiter.cpp
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

#include "MotionLimiter.h"

#include "CoreFeatures.h"
#include "CoreUtils.h"
#include "Error.h"
#include "UnitConverter.h"

#include <cstdint>
#include <cstdlib>
#include <limits>

namespace mcm {

namespace {

const double DeadbandBumpUm = 10.0;

} // anonymous namespace


long
MotionLimiter::ReferenceEncoder(const Channel& ch)
{
   return ch.hasPending ? ch.pendingEncoder : ch.currentEncoder;
}


bool
MotionLimiter::InScanRange(const Channel& ch, double um) const
{
   return ch.scanLowestUm <= um && um <= ch.scanHighestUm;
}


MotionPlan
MotionLimiter::LegalizeMove(ChannelIndex index, double um, bool relative) const
{
   const Channel& ch = table_.RequireConfigured(index);
   const long reference = ReferenceEncoder(ch);

   long long sum = EncoderFromUm(ch, um);
   if (relative)
      sum += reference;
   if (sum < std::numeric_limits<std::int32_t>::min() ||
         sum > std::numeric_limits<std::int32_t>::max())
      throw CMCMError("Channel " + ToString(ch.label) + ": requested move_um (" +
            ToString(um) + (relative ? ", relative" : "") +
            ") is beyond the encoder range", MCMERR_LimitExceeded);
   const long target = static_cast<long>(sum);

   MotionPlan plan;
   plan.targetEncoder = target;
   plan.targetUm = UmFromEncoder(ch, target);

   if (target == reference)
      return plan;

   plan.motionRequired = true;
   plan.deadbandBump = features::flags().deadbandCorrection &&
      std::labs(target - reference) <= ch.minMotionCounts;

   if (!InScanRange(ch, plan.targetUm))
      throw CMCMError("Channel " + ToString(ch.label) +
            ": requested move_um (" + ToString(plan.targetUm) +
            ") exceeds the limit_um " +
            ToRangeString(ch.scanLowestUm, ch.scanHighestUm),
            MCMERR_LimitExceeded);

   return plan;
}


bool
MotionLimiter::FindExcursion(ChannelIndex index, long targetEncoder,
      long& excursionEncoder) const
{
   const Channel& ch = table_.RequireConfigured(index);
   const long reference = ReferenceEncoder(ch);
   const double referenceUm = UmFromEncoder(ch, reference);
   const double roomUp = ch.scanHighestUm - referenceUm;
   const double roomDown = referenceUm - ch.scanLowestUm;

   double excursionUm;
   if (roomUp >= DeadbandBumpUm)
      excursionUm = DeadbandBumpUm;
   else if (roomDown >= DeadbandBumpUm)
      excursionUm = -DeadbandBumpUm;
   else
      excursionUm = roomUp >= roomDown ? roomUp : -roomDown;

   const long candidate = reference + EncoderFromUm(ch, excursionUm);
   if (!InScanRange(ch, UmFromEncoder(ch, candidate)))
      return false;
   if (std::labs(candidate - reference) <= ch.minMotionCounts ||
         std::labs(targetEncoder - candidate) <= ch.minMotionCounts)
      return false;

   excursionEncoder = candidate;
   return true;
}

} // namespace mcm
