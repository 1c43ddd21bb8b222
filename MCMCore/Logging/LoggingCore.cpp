///////////////////////////////////////////////////////////////////////////////
// FILE:          LoggingCore.cpp
// PROJECT:       MCMControl
// SUBSYSTEM:     MCMCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Registry of log sinks; entry point for all log entries
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

#include "LoggingCore.h"

#include "Logger.h"

#include <algorithm>


namespace mcm
{
namespace logging
{


Logger
LoggingCore::NewLogger(const std::string& componentLabel)
{
   return Logger(shared_from_this(), componentLabel);
}


void
LoggingCore::AddSink(std::shared_ptr<LogSink> sink)
{
   std::lock_guard<std::mutex> lock(sinksMutex_);
   if (std::find(sinks_.begin(), sinks_.end(), sink) == sinks_.end())
      sinks_.push_back(sink);
}


void
LoggingCore::RemoveSink(std::shared_ptr<LogSink> sink)
{
   std::lock_guard<std::mutex> lock(sinksMutex_);
   sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink),
         sinks_.end());
}


void
LoggingCore::SwapSink(std::shared_ptr<LogSink> oldSink,
      std::shared_ptr<LogSink> newSink)
{
   std::lock_guard<std::mutex> lock(sinksMutex_);
   std::vector< std::shared_ptr<LogSink> >::iterator it =
      std::find(sinks_.begin(), sinks_.end(), oldSink);
   if (it != sinks_.end())
      *it = newSink;
   else
      sinks_.push_back(newSink);
}


void
LoggingCore::SendEntry(const Metadata::LoggerDataType& loggerData,
      const Metadata::EntryDataType& entryData, const std::string& text)
{
   Metadata::StampDataType stampData;
   stampData.Stamp();
   Metadata metadata(loggerData, entryData, stampData);

   std::lock_guard<std::mutex> lock(sinksMutex_);
   for (std::size_t i = 0; i < sinks_.size(); ++i)
      sinks_[i]->Dispatch(metadata, text);
}

} // namespace logging
} // namespace mcm
