///////////////////////////////////////////////////////////////////////////////
// FILE:          Metadata.h
// PROJECT:       MCMControl
// SUBSYSTEM:     MCMCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Per-entry metadata carried through the logging subsystem
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

#include <chrono>
#include <string>
#include <thread>


namespace mcm
{
namespace logging
{

// Ordered from least to most severe; filters compare with >=.
enum LogLevel
{
   LogLevelTrace,
   LogLevelDebug,
   LogLevelInfo,
   LogLevelWarning,
   LogLevelError,
   LogLevelFatal,
};


// Per-entry data supplied by the caller of the logger.
class EntryData
{
public:
   EntryData(LogLevel level) : level_(level) {}

   LogLevel GetLevel() const { return level_; }

private:
   LogLevel level_;
};


// When and where an entry was produced. Filled in by the core at send time.
class StampData
{
public:
   typedef std::chrono::system_clock::time_point TimePoint;

   void Stamp()
   {
      when_ = std::chrono::system_clock::now();
      thread_ = std::this_thread::get_id();
   }

   TimePoint GetTimestamp() const { return when_; }
   std::thread::id GetThreadId() const { return thread_; }

private:
   TimePoint when_;
   std::thread::id thread_;
};


// Fixed per-logger data: the component label shown in the line prefix.
class LoggerData
{
public:
   LoggerData(const char* label) : label_(label) {}
   LoggerData(const std::string& label) : label_(label) {}

   const char* GetComponentLabel() const { return label_.c_str(); }

private:
   std::string label_;
};


class Metadata
{
public:
   typedef LoggerData LoggerDataType;
   typedef EntryData EntryDataType;
   typedef StampData StampDataType;

   Metadata(const LoggerData& logger, const EntryData& entry,
         const StampData& stamp) :
      logger_(logger),
      entry_(entry),
      stamp_(stamp)
   {}

   const LoggerData& GetLoggerData() const { return logger_; }
   const EntryData& GetEntryData() const { return entry_; }
   const StampData& GetStampData() const { return stamp_; }

private:
   LoggerData logger_;
   EntryData entry_;
   StampData stamp_;
};

} // namespace logging
} // namespace mcm
