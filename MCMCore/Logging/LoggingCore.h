///////////////////////////////////////////////////////////////////////////////
// FILE:          LoggingCore.h
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

#pragma once

#include "LogSink.h"
#include "Metadata.h"

#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>


namespace mcm
{
namespace logging
{

class Logger;


/**
 * Owns the set of sinks and forwards every entry to each of them.
 *
 * Entries are delivered synchronously on the calling thread. The core is
 * shared (via shared_ptr) by all Loggers created from it.
 */
class LoggingCore : public std::enable_shared_from_this<LoggingCore>
{
   std::mutex sinksMutex_;
   std::vector< std::shared_ptr<LogSink> > sinks_;

public:
   LoggingCore() {}

   Logger NewLogger(const std::string& componentLabel);

   void AddSink(std::shared_ptr<LogSink> sink);
   void RemoveSink(std::shared_ptr<LogSink> sink);

   // Replace one sink with another without dropping entries in between.
   void SwapSink(std::shared_ptr<LogSink> oldSink,
         std::shared_ptr<LogSink> newSink);

   // Change the filters of several sinks at once.
   template <typename TIter>
   void AtomicSetSinkFilters(TIter first, TIter last)
   {
      std::lock_guard<std::mutex> lock(sinksMutex_);
      for (TIter it = first; it != last; ++it)
         it->first->SetFilter(it->second);
   }

   void SendEntry(const Metadata::LoggerDataType& loggerData,
         const Metadata::EntryDataType& entryData, const std::string& text);
};

} // namespace logging
} // namespace mcm
