///////////////////////////////////////////////////////////////////////////////
// FILE:          SimulatedDevice.cpp
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

#include "SimulatedDevice.h"

#include "../MCMDevice/DeviceUtils.h"
#include "../MCMDevice/MCMDeviceConstants.h"
#include "CommandCodec.h"
#include "CoreUtils.h"
#include "Error.h"

#include <cstdint>

namespace mcm {

namespace {

std::int32_t LittleEndianInt32(const std::vector<unsigned char>& bytes,
      std::size_t offset)
{
   std::uint32_t u = 0;
   for (int i = 3; i >= 0; --i)
      u = (u << 8) | bytes[offset + i];
   return static_cast<std::int32_t>(u);
}

} // anonymous namespace


SimulatedDevice::SimulatedDevice() :
   axes_(ChannelCount),
   stepPerRead_(0),
   open_(true),
   moveCommands_(0),
   queries_(0)
{
}


SimulatedDevice::Axis&
SimulatedDevice::AxisAt(unsigned index)
{
   if (index >= axes_.size())
      throw CMCMError("Simulated device has no channel index " +
            ToString(index), MCMERR_InvalidChannel);
   return axes_[index];
}


const SimulatedDevice::Axis&
SimulatedDevice::AxisAt(unsigned index) const
{
   if (index >= axes_.size())
      throw CMCMError("Simulated device has no channel index " +
            ToString(index), MCMERR_InvalidChannel);
   return axes_[index];
}


void
SimulatedDevice::Advance(Axis& axis)
{
   if (axis.encoder == axis.target)
      return;
   const long remaining = axis.target - axis.encoder;
   const long distance = (remaining < 0) ? -remaining : remaining;
   if (stepPerRead_ <= 0 || distance <= stepPerRead_)
      axis.encoder = axis.target;
   else
      axis.encoder += (remaining > 0) ? stepPerRead_ : -stepPerRead_;
}


void
SimulatedDevice::QueuePositionResponse(unsigned index)
{
   Axis& axis = AxisAt(index);
   Advance(axis);

   TxFrame response;
   response.AddUInt8(0x0B);
   response.AddUInt8(0x04);
   response.AddUInt8(0x06);
   response.AddUInt8(0x00);
   response.AddUInt8(0x00);
   response.AddUInt8(0x00);
   response.AddUInt16(static_cast<std::uint16_t>(index));
   response.AddInt32(static_cast<std::int32_t>(axis.encoder));
   output_.insert(output_.end(), response.GetData().begin(),
         response.GetData().end());
}


void
SimulatedDevice::Write(const std::vector<unsigned char>& bytes)
{
   if (!open_)
      throw CMCMError("Simulated device is closed", MCMERR_ConnectionClosed);

   if (bytes.size() == 6 && bytes[0] == 0x0A && bytes[1] == 0x04)
   {
      ++queries_;
      QueuePositionResponse(bytes[2]);
   }
   else if (bytes.size() == 12 && bytes[1] == 0x04 && bytes[2] == 0x06 &&
         (bytes[0] == 0x09 || bytes[0] == 0x53))
   {
      const unsigned index = bytes[6] | (static_cast<unsigned>(bytes[7]) << 8);
      Axis& axis = AxisAt(index);
      if (bytes[0] == 0x09)
      {
         if (!axis.stalled)
            axis.encoder = axis.target = 0;
      }
      else
      {
         ++moveCommands_;
         if (!axis.stalled)
            axis.target = LittleEndianInt32(bytes, 8) + axis.settleOffset;
      }
   }
   else
   {
      throw CMCMError("Simulated device: unrecognized command " +
            CDeviceUtils::HexRep(bytes), MCMERR_SerialIOFailed);
   }

   output_.insert(output_.end(), noise_.begin(), noise_.end());
   noise_.clear();
}


std::vector<unsigned char>
SimulatedDevice::Read(std::size_t count)
{
   if (!open_)
      throw CMCMError("Simulated device is closed", MCMERR_ConnectionClosed);
   if (output_.size() < count)
      throw CMCMError("Simulated device: read of " + ToString(count) +
            " bytes timed out (" + ToString(output_.size()) + " available)",
            MCMERR_SerialTimeout);
   std::vector<unsigned char> bytes(output_.begin(), output_.begin() + count);
   output_.erase(output_.begin(), output_.begin() + count);
   return bytes;
}


std::size_t
SimulatedDevice::BytesWaiting()
{
   if (!open_)
      throw CMCMError("Simulated device is closed", MCMERR_ConnectionClosed);
   return output_.size();
}


void
SimulatedDevice::Close()
{
   open_ = false;
   output_.clear();
}


bool
SimulatedDevice::IsOpen() const
{
   return open_;
}


std::string
SimulatedDevice::Describe() const
{
   return "simulated controller";
}


void
SimulatedDevice::SetEncoderValue(unsigned index, long value)
{
   Axis& axis = AxisAt(index);
   axis.encoder = axis.target = value;
}


long
SimulatedDevice::GetEncoderValue(unsigned index) const
{
   return AxisAt(index).encoder;
}


long
SimulatedDevice::GetTargetValue(unsigned index) const
{
   return AxisAt(index).target;
}


void
SimulatedDevice::SetStalled(unsigned index, bool stalled)
{
   AxisAt(index).stalled = stalled;
}


void
SimulatedDevice::SetSettleOffset(unsigned index, long offset)
{
   AxisAt(index).settleOffset = offset;
}


void
SimulatedDevice::InjectNoise(const std::vector<unsigned char>& bytes)
{
   noise_.insert(noise_.end(), bytes.begin(), bytes.end());
}

} // namespace mcm
