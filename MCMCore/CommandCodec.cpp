///////////////////////////////////////////////////////////////////////////////
// FILE:          CommandCodec.cpp
// PROJECT:       MCMControl
// SUBSYSTEM:     MCMCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Binary frames of the MCM3000 serial protocol
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

#include "CommandCodec.h"

#include "../MCMDevice/DeviceUtils.h"
#include "CoreUtils.h"
#include "Error.h"

namespace mcm {

void TxFrame::AddUInt8(std::uint8_t byte)
{
   data_.push_back(byte);
}

void TxFrame::AddUInt16(std::uint16_t word)
{
   data_.push_back(static_cast<unsigned char>(word & 0xFF));
   data_.push_back(static_cast<unsigned char>((word >> 8) & 0xFF));
}

void TxFrame::AddInt32(std::int32_t dword)
{
   const std::uint32_t u = static_cast<std::uint32_t>(dword);
   data_.push_back(static_cast<unsigned char>(u & 0xFF));
   data_.push_back(static_cast<unsigned char>((u >> 8) & 0xFF));
   data_.push_back(static_cast<unsigned char>((u >> 16) & 0xFF));
   data_.push_back(static_cast<unsigned char>((u >> 24) & 0xFF));
}


bool RxFrame::GetByte(std::uint8_t& value)
{
   if (RemainingBytes() < 1)
      return false;
   value = data_[index_++];
   return true;
}

bool RxFrame::GetInt32(std::int32_t& value)
{
   if (RemainingBytes() < 4)
      return false;
   std::uint32_t u = 0;
   for (int i = 3; i >= 0; --i)
      u = (u << 8) | data_[index_ + i];
   index_ += 4;
   value = static_cast<std::int32_t>(u);
   return true;
}

void RxFrame::Skip(std::size_t count)
{
   index_ += (count < RemainingBytes()) ? count : RemainingBytes();
}


namespace codec {

namespace {

// Common header of the zero and move commands
void AddLongCommandHeader(TxFrame& frame, std::uint8_t opcode)
{
   frame.AddUInt8(opcode);
   frame.AddUInt8(0x04);
   frame.AddUInt8(0x06);
   frame.AddUInt8(0x00);
   frame.AddUInt8(0x00);
   frame.AddUInt8(0x00);
}

} // anonymous namespace


std::vector<unsigned char> EncodeGetPosition(ChannelIndex ch)
{
   TxFrame frame;
   frame.AddUInt8(0x0A);
   frame.AddUInt8(0x04);
   frame.AddUInt8(static_cast<std::uint8_t>(ch.Value()));
   frame.AddUInt8(0x00);
   frame.AddUInt8(0x00);
   frame.AddUInt8(0x00);
   return frame.GetData();
}


std::int32_t DecodePositionResponse(const std::vector<unsigned char>& response,
      ChannelIndex expected)
{
   if (response.size() != PositionResponseLength)
      throw CMCMError("Position response has " + ToString(response.size()) +
            " bytes (expected " + ToString(PositionResponseLength) + "): " +
            CDeviceUtils::HexRep(response), MCMERR_ShortResponse);

   RxFrame frame(response);
   frame.Skip(PositionResponseChannelOffset);
   std::uint8_t channel = 0;
   frame.GetByte(channel);
   if (channel != expected.Value())
      throw CMCMError("Position response is for channel index " +
            ToString(static_cast<unsigned>(channel)) + " (expected " +
            ToString(expected.Value()) + ")", MCMERR_ChannelMismatch);

   frame.Skip(PositionResponseValueOffset - PositionResponseChannelOffset - 1);
   std::int32_t value = 0;
   if (!frame.GetInt32(value))
      throw CMCMError("Truncated position response", MCMERR_ShortResponse);
   return value;
}


std::vector<unsigned char> EncodeZero(ChannelIndex ch)
{
   TxFrame frame;
   AddLongCommandHeader(frame, 0x09);
   frame.AddUInt16(static_cast<std::uint16_t>(ch.Value()));
   frame.AddInt32(0);
   return frame.GetData();
}


std::vector<unsigned char> EncodeMoveTo(ChannelIndex ch, std::int32_t value)
{
   TxFrame frame;
   AddLongCommandHeader(frame, 0x53);
   frame.AddUInt16(static_cast<std::uint16_t>(ch.Value()));
   frame.AddInt32(value);
   return frame.GetData();
}

} // namespace codec

} // namespace mcm
