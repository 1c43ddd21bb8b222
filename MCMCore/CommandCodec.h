///////////////////////////////////////////////////////////////////////////////
// FILE:          CommandCodec.h
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

#pragma once

#include "ChannelIndex.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace mcm {

/**
 * Builder for little-endian request frames.
 */
class TxFrame {
   std::vector<unsigned char> data_;

public:
   TxFrame() {}

   void AddUInt8(std::uint8_t byte);
   void AddUInt16(std::uint16_t word);
   void AddInt32(std::int32_t dword);

   const std::vector<unsigned char>& GetData() const { return data_; }
};


/**
 * Sequential reader over a received frame. Getters return false (and leave
 * the value untouched) when the frame is exhausted.
 */
class RxFrame {
   const std::vector<unsigned char>& data_;
   std::size_t index_;

public:
   explicit RxFrame(const std::vector<unsigned char>& data) :
      data_(data), index_(0) {}

   bool GetByte(std::uint8_t& value);
   bool GetInt32(std::int32_t& value);

   void Skip(std::size_t count);
   std::size_t RemainingBytes() const { return data_.size() - index_; }
};


namespace codec {

const std::size_t PositionResponseLength = 12;

// Offset of the channel byte within a position response
const std::size_t PositionResponseChannelOffset = 6;

// Offset of the encoder value (int32 LE) within a position response
const std::size_t PositionResponseValueOffset = 8;

// 0A 04 <idx> 00 00 00
std::vector<unsigned char> EncodeGetPosition(ChannelIndex ch);

// Throws MCMERR_ShortResponse unless the response has exactly
// PositionResponseLength bytes, MCMERR_ChannelMismatch if the channel byte
// does not match expected.
std::int32_t DecodePositionResponse(const std::vector<unsigned char>& response,
      ChannelIndex expected);

// 09 04 06 00 00 00 <idx:2> <0:4>
std::vector<unsigned char> EncodeZero(ChannelIndex ch);

// 53 04 06 00 00 00 <idx:2> <value:4>
std::vector<unsigned char> EncodeMoveTo(ChannelIndex ch, std::int32_t value);

} // namespace codec

} // namespace mcm
