///////////////////////////////////////////////////////////////////////////////
// FILE:          ChannelTable.h
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

#pragma once

#include "Channel.h"
#include "Logging/Logger.h"
#include "StageCatalog.h"

#include <vector>

namespace mcm {

struct ChannelConfig {
   int label;
   StageType stageType;
   bool reverse;
};


/**
 * The controller's fixed array of channels.
 *
 * Stage configuration is fixed at construction. Scan limits and the retract
 * point change only through the setters below, which reject any value that
 * would break the ordering invariants (MCMERR_LimitExceeded) rather than
 * adjusting it.
 */
class ChannelTable {
public:
   // configs must have exactly ChannelCount entries with distinct labels
   // (MCMERR_InvalidConfiguration).
   ChannelTable(const std::vector<ChannelConfig>& configs,
         long minEncoderMotion, logging::Logger logger);

   unsigned Size() const { return static_cast<unsigned>(channels_.size()); }

   // MCMERR_InvalidChannel if no channel has this label
   ChannelIndex IndexForLabel(int label) const;

   std::vector<int> GetLabels() const;

   const Channel& Get(ChannelIndex index) const;

   // MCMERR_ChannelNotConfigured if the channel has no stage
   const Channel& RequireConfigured(ChannelIndex index) const;

   // Sets the lowest (lower == true) or highest scan point. The value must
   // lie within the hard limits and must not cross the other scan point.
   // When the new range excludes the retract point, the retract point is
   // moved to the nearest end of the range. Returns true if that happened.
   bool SetScanLimit(ChannelIndex index, double um, bool lower);

   // The value must lie within the scan range.
   void SetRetractPoint(ChannelIndex index, double um);

   void SetCurrentEncoder(ChannelIndex index, long value);
   void SetPending(ChannelIndex index, long value);
   void ClearPending(ChannelIndex index);

private:
   Channel& GetMutable(ChannelIndex index);
   void ConfigureStage(Channel& ch, StageType type, bool reverse,
         long minEncoderMotion);

   logging::Logger logger_;
   std::vector<Channel> channels_;
};

} // namespace mcm
