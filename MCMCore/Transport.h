///////////////////////////////////////////////////////////////////////////////
// FILE:          Transport.h
// PROJECT:       MCMControl
// SUBSYSTEM:     MCMCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Byte-level link to the motor controller
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

#include <cstddef>
#include <string>
#include <vector>

namespace mcm {

/**
 * Byte-level, exclusively owned link to the controller.
 *
 * All methods report failure by throwing CMCMError with one of the serial
 * error codes (MCMERR_SerialIOFailed, MCMERR_SerialTimeout,
 * MCMERR_ConnectionClosed).
 */
class Transport {
public:
   virtual ~Transport() {}

   virtual void Write(const std::vector<unsigned char>& bytes) = 0;

   // Blocks until exactly count bytes have been read, or throws.
   virtual std::vector<unsigned char> Read(std::size_t count) = 0;

   // Number of received bytes not yet read.
   virtual std::size_t BytesWaiting() = 0;

   virtual void Close() = 0;
   virtual bool IsOpen() const = 0;

   // Human-readable identification, for log messages.
   virtual std::string Describe() const = 0;
};

} // namespace mcm
