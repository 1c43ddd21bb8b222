///////////////////////////////////////////////////////////////////////////////
// FILE:          Logger.h
// PROJECT:       MCMControl
// SUBSYSTEM:     MCMCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Component-labelled logger and stream-style log macros
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

#include "LoggingCore.h"
#include "Metadata.h"

#include <memory>
#include <sstream>
#include <string>


namespace mcm
{
namespace logging
{


/**
 * Function object that sends entries, tagged with a component label, to a
 * LoggingCore. Cheap to copy.
 */
class Logger
{
   std::shared_ptr<LoggingCore> core_;
   Metadata::LoggerDataType loggerData_;

public:
   Logger(std::shared_ptr<LoggingCore> core,
         const std::string& componentLabel) :
      core_(core),
      loggerData_(componentLabel)
   {}

   void operator()(LogLevel level, const std::string& text) const
   { core_->SendEntry(loggerData_, level, text); }

   void operator()(LogLevel level, const char* text) const
   { core_->SendEntry(loggerData_, level, text ? text : ""); }
};


namespace internal
{

// Collects one entry; sent when MarkUsed() is called by the LOG_* macro.
class LogStream : public std::ostringstream
{
   const Logger& logger_;
   LogLevel level_;
   bool used_;

public:
   LogStream(const Logger& logger, LogLevel level) :
      logger_(logger),
      level_(level),
      used_(false)
   {}

   bool Used() const { return used_; }

   void MarkUsed()
   {
      logger_(level_, str());
      used_ = true;
   }
};

} // namespace internal

} // namespace logging
} // namespace mcm


// Usage: LOG_INFO(logger) << "text" << value;
#define MCM_LOG_WITH_LEVEL(logger, level) \
   for (::mcm::logging::internal::LogStream mcmLogStrm((logger), (level)); \
         !mcmLogStrm.Used(); mcmLogStrm.MarkUsed()) \
      mcmLogStrm

#define LOG_TRACE(logger) \
   MCM_LOG_WITH_LEVEL((logger), ::mcm::logging::LogLevelTrace)
#define LOG_DEBUG(logger) \
   MCM_LOG_WITH_LEVEL((logger), ::mcm::logging::LogLevelDebug)
#define LOG_INFO(logger) \
   MCM_LOG_WITH_LEVEL((logger), ::mcm::logging::LogLevelInfo)
#define LOG_WARNING(logger) \
   MCM_LOG_WITH_LEVEL((logger), ::mcm::logging::LogLevelWarning)
#define LOG_ERROR(logger) \
   MCM_LOG_WITH_LEVEL((logger), ::mcm::logging::LogLevelError)
#define LOG_FATAL(logger) \
   MCM_LOG_WITH_LEVEL((logger), ::mcm::logging::LogLevelFatal)
