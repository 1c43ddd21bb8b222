///////////////////////////////////////////////////////////////////////////////
// FILE:          SerialPort.cpp
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

#include "SerialPort.h"

#include "CoreUtils.h"
#include "Error.h"

#include <boost/asio/error.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>

#include <chrono>

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#include <Windows.h>
#else
#include <sys/ioctl.h>
#endif

namespace mcm {

SerialPort::SerialPort(const std::string& portName, unsigned long baudRate,
      long readTimeoutMs) :
   portName_(portName),
   readTimeoutMs_(readTimeoutMs),
   port_(io_)
{
   using boost::asio::serial_port_base;

   boost::system::error_code ec;
   port_.open(portName_, ec);
   if (ec)
      throw CMCMError("No connection on port " + ToQuotedString(portName_) +
            ": " + ec.message(), MCMERR_SerialOpenFailed);

   port_.set_option(serial_port_base::baud_rate(
            static_cast<unsigned int>(baudRate)), ec);
   if (!ec)
      port_.set_option(serial_port_base::character_size(8), ec);
   if (!ec)
      port_.set_option(serial_port_base::parity(
               serial_port_base::parity::none), ec);
   if (!ec)
      port_.set_option(serial_port_base::stop_bits(
               serial_port_base::stop_bits::one), ec);
   if (!ec)
      port_.set_option(serial_port_base::flow_control(
               serial_port_base::flow_control::none), ec);
   if (ec)
   {
      boost::system::error_code ignored;
      port_.close(ignored);
      throw CMCMError("Cannot configure port " + ToQuotedString(portName_) +
            ": " + ec.message(), MCMERR_SerialOpenFailed);
   }
}


SerialPort::~SerialPort()
{
   boost::system::error_code ec;
   if (port_.is_open())
      port_.close(ec);
}


void
SerialPort::EnsureOpen() const
{
   if (!port_.is_open())
      throw CMCMError("Port " + ToQuotedString(portName_) + " is closed",
            MCMERR_ConnectionClosed);
}


void
SerialPort::Write(const std::vector<unsigned char>& bytes)
{
   EnsureOpen();
   boost::system::error_code ec;
   boost::asio::write(port_, boost::asio::buffer(bytes), ec);
   if (ec)
      throw CMCMError("Write to " + ToQuotedString(portName_) + " failed: " +
            ec.message(), MCMERR_SerialIOFailed);
}


std::vector<unsigned char>
SerialPort::Read(std::size_t count)
{
   EnsureOpen();
   std::vector<unsigned char> buf(count);
   if (count == 0)
      return buf;

   boost::system::error_code readEc = boost::asio::error::would_block;
   std::size_t received = 0;
   boost::asio::async_read(port_, boost::asio::buffer(buf),
         [&readEc, &received](const boost::system::error_code& ec,
            std::size_t len)
         {
            readEc = ec;
            received = len;
         });

   io_.restart();
   io_.run_for(std::chrono::milliseconds(readTimeoutMs_));
   if (readEc == boost::asio::error::would_block)
   {
      // Deliver the cancellation to the pending handler before returning
      boost::system::error_code ignored;
      port_.cancel(ignored);
      io_.restart();
      io_.run();
      throw CMCMError("Read from " + ToQuotedString(portName_) +
            " timed out after " + ToString(readTimeoutMs_) + " ms (" +
            ToString(received) + " of " + ToString(count) + " bytes)",
            MCMERR_SerialTimeout);
   }
   if (readEc)
      throw CMCMError("Read from " + ToQuotedString(portName_) + " failed: " +
            readEc.message(), MCMERR_SerialIOFailed);
   return buf;
}


std::size_t
SerialPort::BytesWaiting()
{
   EnsureOpen();
#ifdef _WIN32
   DWORD errors = 0;
   COMSTAT status = {};
   if (!::ClearCommError(port_.native_handle(), &errors, &status))
      throw CMCMError("Cannot query input queue of " +
            ToQuotedString(portName_), MCMERR_SerialIOFailed);
   return static_cast<std::size_t>(status.cbInQue);
#else
   int available = 0;
   if (::ioctl(port_.native_handle(), FIONREAD, &available) < 0)
      throw CMCMError("Cannot query input queue of " +
            ToQuotedString(portName_), MCMERR_SerialIOFailed);
   return static_cast<std::size_t>(available);
#endif
}


void
SerialPort::Close()
{
   if (!port_.is_open())
      return;
   boost::system::error_code ec;
   port_.close(ec);
   if (ec)
      throw CMCMError("Cannot close port " + ToQuotedString(portName_) +
            ": " + ec.message(), MCMERR_SerialIOFailed);
}


bool
SerialPort::IsOpen() const
{
   return port_.is_open();
}


std::string
SerialPort::Describe() const
{
   return "serial port " + portName_;
}

} // namespace mcm
