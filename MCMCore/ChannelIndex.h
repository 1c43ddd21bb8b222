///////////////////////////////////////////////////////////////////////////////
// FILE:          ChannelIndex.h
// PROJECT:       MCMControl
// SUBSYSTEM:     MCMCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Validated 0-based index of a controller channel
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

#include "../MCMDevice/MCMDeviceConstants.h"
#include "CoreUtils.h"
#include "Error.h"

namespace mcm {

/**
 * Position of a channel in the controller's fixed channel array, as used on
 * the wire. Distinct from the channel label that callers use; the only way
 * from a label to an index is ChannelTable::IndexForLabel().
 */
class ChannelIndex {
   unsigned value_;

public:
   explicit ChannelIndex(unsigned value) : value_(value)
   {
      if (value_ >= ChannelCount)
         throw CMCMError("Channel index " + ToString(value_) +
               " out of range (controller has " + ToString(ChannelCount) +
               " channels)", MCMERR_InvalidChannel);
   }

   unsigned Value() const { return value_; }

   bool operator==(const ChannelIndex& rhs) const { return value_ == rhs.value_; }
   bool operator!=(const ChannelIndex& rhs) const { return value_ != rhs.value_; }
};

} // namespace mcm
