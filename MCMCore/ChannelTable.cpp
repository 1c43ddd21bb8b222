///////////////////////////////////////////////////////////////////////////////
// FILE:          ChannelTable.cpp
// PROJECT:       MCMControl
// SUBSYSTEM:     MCMCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Per-channel configuration, limits and motion state
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

#include "ChannelTable.h"

#include "CoreUtils.h"
#include "Error.h"

#include <cmath>

namespace mcm {

ChannelTable::ChannelTable(const std::vector<ChannelConfig>& configs,
      long minEncoderMotion, logging::Logger logger) :
   logger_(logger)
{
   if (configs.size() != ChannelCount)
      throw CMCMError("Expected configuration for " + ToString(ChannelCount) +
            " channels, got " + ToString(configs.size()),
            MCMERR_InvalidConfiguration);
   if (minEncoderMotion < 0)
      throw CMCMError("Minimum encoder motion must not be negative",
            MCMERR_InvalidConfiguration);

   channels_.reserve(configs.size());
   for (unsigned i = 0; i < configs.size(); ++i)
   {
      for (unsigned j = 0; j < i; ++j)
      {
         if (configs[j].label == configs[i].label)
            throw CMCMError("Channel label " + ToString(configs[i].label) +
                  " is used more than once", MCMERR_InvalidConfiguration);
      }

      Channel ch(configs[i].label, ChannelIndex(i));
      if (configs[i].stageType != StageType::None)
         ConfigureStage(ch, configs[i].stageType, configs[i].reverse,
               minEncoderMotion);
      else
         ch.reverse = configs[i].reverse;
      channels_.push_back(ch);
   }
}


void
ChannelTable::ConfigureStage(Channel& ch, StageType type, bool reverse,
      long minEncoderMotion)
{
   const StageSpec spec = GetStageSpec(type);
   double lower = spec.lowerLimitUm;
   double upper = spec.upperLimitUm;
   switch (NormalizeLimits(lower, upper))
   {
      case LimitsMadeSymmetric:
         LOG_WARNING(logger_) << "Stage " << StageTypeName(type) <<
            " has equal upper and lower limits; assuming symmetric range " <<
            ToRangeString(lower, upper);
         break;
      case LimitsSwapped:
         LOG_WARNING(logger_) << "Stage " << StageTypeName(type) <<
            " has its upper limit below its lower limit; swapping them";
         break;
      case LimitsUnchanged:
         break;
   }

   ch.stageType = type;
   ch.reverse = reverse;
   ch.conversionUmPerCount = std::fabs(spec.conversionUmPerCount);
   ch.hardLowerUm = lower;
   ch.hardUpperUm = upper;
   ch.scanLowestUm = lower;
   ch.scanHighestUm = upper;
   // 10 counts below the top of the range
   ch.retractUm = upper - 10.0 * ch.conversionUmPerCount;
   if (ch.retractUm < ch.scanLowestUm)
      ch.retractUm = ch.scanLowestUm;
   ch.minMotionCounts = minEncoderMotion;
}


ChannelIndex
ChannelTable::IndexForLabel(int label) const
{
   for (const Channel& ch : channels_)
   {
      if (ch.label == label)
         return ch.index;
   }
   throw CMCMError("Channel " + ToString(label) + " not available",
         MCMERR_InvalidChannel);
}


std::vector<int>
ChannelTable::GetLabels() const
{
   std::vector<int> labels;
   for (const Channel& ch : channels_)
      labels.push_back(ch.label);
   return labels;
}


const Channel&
ChannelTable::Get(ChannelIndex index) const
{
   return channels_.at(index.Value());
}


Channel&
ChannelTable::GetMutable(ChannelIndex index)
{
   return channels_.at(index.Value());
}


const Channel&
ChannelTable::RequireConfigured(ChannelIndex index) const
{
   const Channel& ch = Get(index);
   if (!ch.IsConfigured())
      throw CMCMError("Channel " + ToString(ch.label) +
            ": stage = None (cannot send command)",
            MCMERR_ChannelNotConfigured);
   return ch;
}


bool
ChannelTable::SetScanLimit(ChannelIndex index, double um, bool lower)
{
   RequireConfigured(index);
   Channel& ch = GetMutable(index);

   if (!(ch.hardLowerUm <= um && um <= ch.hardUpperUm))
      throw CMCMError("Channel " + ToString(ch.label) + ": requested limit (" +
            ToString(um) + ") exceeds the stage limits " +
            ToRangeString(ch.hardLowerUm, ch.hardUpperUm),
            MCMERR_LimitExceeded);
   if (lower && um > ch.scanHighestUm)
      throw CMCMError("Channel " + ToString(ch.label) +
            ": requested lowest scan point (" + ToString(um) +
            ") is above the highest scan point (" +
            ToString(ch.scanHighestUm) + ")", MCMERR_LimitExceeded);
   if (!lower && um < ch.scanLowestUm)
      throw CMCMError("Channel " + ToString(ch.label) +
            ": requested highest scan point (" + ToString(um) +
            ") is below the lowest scan point (" +
            ToString(ch.scanLowestUm) + ")", MCMERR_LimitExceeded);

   if (lower)
      ch.scanLowestUm = um;
   else
      ch.scanHighestUm = um;

   if (ch.retractUm > ch.scanHighestUm)
   {
      ch.retractUm = ch.scanHighestUm;
      LOG_INFO(logger_) << "Channel " << ch.label <<
         ": retract point lowered to the highest scan point (" <<
         ch.retractUm << " um)";
      return true;
   }
   if (ch.retractUm < ch.scanLowestUm)
   {
      ch.retractUm = ch.scanLowestUm;
      LOG_INFO(logger_) << "Channel " << ch.label <<
         ": retract point raised to the lowest scan point (" <<
         ch.retractUm << " um)";
      return true;
   }
   return false;
}


void
ChannelTable::SetRetractPoint(ChannelIndex index, double um)
{
   RequireConfigured(index);
   Channel& ch = GetMutable(index);
   if (!(ch.scanLowestUm <= um && um <= ch.scanHighestUm))
      throw CMCMError("Channel " + ToString(ch.label) +
            ": requested retract point (" + ToString(um) +
            ") exceeds the scan limits " +
            ToRangeString(ch.scanLowestUm, ch.scanHighestUm),
            MCMERR_LimitExceeded);
   ch.retractUm = um;
}


void
ChannelTable::SetCurrentEncoder(ChannelIndex index, long value)
{
   GetMutable(index).currentEncoder = value;
}


void
ChannelTable::SetPending(ChannelIndex index, long value)
{
   Channel& ch = GetMutable(index);
   ch.hasPending = true;
   ch.pendingEncoder = value;
}


void
ChannelTable::ClearPending(ChannelIndex index)
{
   Channel& ch = GetMutable(index);
   ch.hasPending = false;
   ch.pendingEncoder = 0;
}

} // namespace mcm
