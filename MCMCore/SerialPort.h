///////////////////////////////////////////////////////////////////////////////
// FILE:          SerialPort.h
// PROJECT:       MCMControl
// SUBSYSTEM:     MCMCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Transport over a serial port (Boost.Asio)
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

#include "Transport.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/serial_port.hpp>

#include <string>

namespace mcm {

class SerialPort : public Transport {
public:
   // Opens the port at the given baud rate, 8N1, no flow control. Throws
   // MCMERR_SerialOpenFailed.
   SerialPort(const std::string& portName, unsigned long baudRate,
         long readTimeoutMs);
   virtual ~SerialPort();

   virtual void Write(const std::vector<unsigned char>& bytes);
   virtual std::vector<unsigned char> Read(std::size_t count);
   virtual std::size_t BytesWaiting();
   virtual void Close();
   virtual bool IsOpen() const;
   virtual std::string Describe() const;

private:
   SerialPort(const SerialPort&);
   SerialPort& operator=(const SerialPort&);

   void EnsureOpen() const;

   std::string portName_;
   long readTimeoutMs_;
   boost::asio::io_context io_;
   boost::asio::serial_port port_;
};

} // namespace mcm
