///////////////////////////////////////////////////////////////////////////////
// FILE:          Channel.h
// PROJECT:       MCMControl
// SUBSYSTEM:     MCMCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   State and configuration of one motor channel
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
#include "StageCatalog.h"

namespace mcm {

/**
 * One physical axis of the controller.
 *
 * Limits are in micrometres, encoder values in counts. The limit fields are
 * meaningful only when stageType is not StageType::None. Invariants
 * (maintained by ChannelTable):
 *    hardLowerUm <= scanLowestUm <= scanHighestUm <= hardUpperUm
 *    scanLowestUm <= retractUm <= scanHighestUm
 */
struct Channel {
   Channel(int channelLabel, ChannelIndex channelIndex) :
      label(channelLabel),
      index(channelIndex),
      stageType(StageType::None),
      reverse(false),
      conversionUmPerCount(1.0),
      hardLowerUm(0.0),
      hardUpperUm(0.0),
      scanLowestUm(0.0),
      scanHighestUm(0.0),
      retractUm(0.0),
      minMotionCounts(0),
      currentEncoder(0),
      hasPending(false),
      pendingEncoder(0)
   {}

   bool IsConfigured() const { return stageType != StageType::None; }

   int label;
   ChannelIndex index;
   StageType stageType;
   bool reverse;
   double conversionUmPerCount; // always positive
   double hardLowerUm;
   double hardUpperUm;
   double scanLowestUm;
   double scanHighestUm;
   double retractUm;
   long minMotionCounts;
   long currentEncoder;
   bool hasPending; // a move is in flight toward pendingEncoder
   long pendingEncoder;
};

} // namespace mcm
