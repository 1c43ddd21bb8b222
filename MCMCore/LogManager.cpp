///////////////////////////////////////////////////////////////////////////////
// FILE:          LogManager.cpp
// PROJECT:       MCMControl
// SUBSYSTEM:     MCMCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Facade to the logging subsystem
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

#include "LogManager.h"

#include "CoreUtils.h"
#include "Error.h"

#include <utility>
#include <vector>

namespace mcm
{

namespace
{

const char* LevelName(logging::LogLevel level)
{
   static const char* const names[] =
      { "trace", "debug", "info", "warning", "error", "fatal" };
   const int i = static_cast<int>(level);
   if (i < 0 || i >= static_cast<int>(sizeof(names) / sizeof(names[0])))
      return "(unknown)";
   return names[i];
}

} // anonymous namespace


LogManager::LogManager() :
   core_(std::make_shared<logging::LoggingCore>()),
   selfLogger_(core_->NewLogger("LogManager")),
   primaryLevel_(logging::LogLevelInfo),
   stdErrAttached_(false)
{}


std::shared_ptr<logging::EntryFilter>
LogManager::MakePrimaryFilter() const
{
   return std::make_shared<logging::LevelFilter>(primaryLevel_);
}


// Caller holds mutex_
void
LogManager::DetachPrimaryFile()
{
   if (!fileSink_)
      return;
   LOG_INFO(selfLogger_) << "Closing log file " << fileName_;
   core_->RemoveSink(fileSink_);
   fileSink_.reset();
}


void
LogManager::SetUseStdErr(bool flag)
{
   std::lock_guard<std::mutex> lock(mutex_);
   if (flag == stdErrAttached_)
      return;

   if (!flag)
   {
      LOG_INFO(selfLogger_) << "Stopping output to stderr";
      core_->RemoveSink(stdErrSink_);
      stdErrAttached_ = false;
      return;
   }

   if (!stdErrSink_)
      stdErrSink_ = std::make_shared<logging::StdErrLogSink>();
   stdErrSink_->SetFilter(MakePrimaryFilter());
   core_->AddSink(stdErrSink_);
   stdErrAttached_ = true;
   LOG_INFO(selfLogger_) << "Started output to stderr";
}


bool
LogManager::IsUsingStdErr() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return stdErrAttached_;
}


void
LogManager::SetPrimaryLogFilename(const std::string& filename, bool truncate)
{
   std::lock_guard<std::mutex> lock(mutex_);
   if (filename == fileName_)
      return;

   if (filename.empty())
   {
      DetachPrimaryFile();
      fileName_.clear();
      return;
   }

   std::shared_ptr<logging::LogSink> opened;
   try
   {
      opened = std::make_shared<logging::FileLogSink>(filename, !truncate);
   }
   catch (const logging::CannotOpenFileException&)
   {
      LOG_ERROR(selfLogger_) << "Failed to open file " << filename <<
         " for logging";
      DetachPrimaryFile();
      fileName_.clear();
      throw CMCMError("Cannot open log file " + ToQuotedString(filename));
   }
   opened->SetFilter(MakePrimaryFilter());

   if (fileSink_)
      core_->SwapSink(fileSink_, opened);
   else
      core_->AddSink(opened);
   fileSink_ = opened;
   fileName_ = filename;
   LOG_INFO(selfLogger_) << "Logging to file " << fileName_;
}


std::string
LogManager::GetPrimaryLogFilename() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return fileName_;
}


bool
LogManager::IsUsingPrimaryLogFile() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return fileSink_ != nullptr;
}


void
LogManager::SetPrimaryLogLevel(logging::LogLevel level)
{
   std::lock_guard<std::mutex> lock(mutex_);
   if (level == primaryLevel_)
      return;

   const logging::LogLevel previous = primaryLevel_;
   primaryLevel_ = level;

   // Both primary outputs switch together so no entry sees a mixed state
   const std::shared_ptr<logging::EntryFilter> filter = MakePrimaryFilter();
   std::vector<std::pair<std::shared_ptr<logging::LogSink>,
      std::shared_ptr<logging::EntryFilter> > > updates;
   if (stdErrSink_)
      updates.emplace_back(stdErrSink_, filter);
   if (fileSink_)
      updates.emplace_back(fileSink_, filter);
   core_->AtomicSetSinkFilters(updates.begin(), updates.end());

   LOG_INFO(selfLogger_) << "Log level changed from " << LevelName(previous) <<
      " to " << LevelName(level);
}


logging::LogLevel
LogManager::GetPrimaryLogLevel() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return primaryLevel_;
}


void
LogManager::AddSink(std::shared_ptr<logging::LogSink> sink)
{
   core_->AddSink(sink);
}


void
LogManager::RemoveSink(std::shared_ptr<logging::LogSink> sink)
{
   core_->RemoveSink(sink);
}


logging::Logger
LogManager::NewLogger(const std::string& label)
{
   return core_->NewLogger(label);
}

} // namespace mcm
