///////////////////////////////////////////////////////////////////////////////
// FILE:          LogManager.h
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

#pragma once

#include "Logging/Logging.h"

#include <memory>
#include <mutex>
#include <string>

namespace mcm
{

/**
 * Owns the logging core for one controller and the outputs attached to it.
 *
 * Stderr and the primary log file are the "primary" outputs and follow a
 * single level threshold. Other sinks (a capturing sink in tests, say) are
 * attached with AddSink() and keep whatever filter they were given.
 */
class LogManager
{
public:
   LogManager();

   void SetUseStdErr(bool flag);
   bool IsUsingStdErr() const;

   // Empty filename closes the primary file. Throws CMCMError when the
   // file cannot be opened; the previous file is closed in that case.
   void SetPrimaryLogFilename(const std::string& filename, bool truncate);
   std::string GetPrimaryLogFilename() const;
   bool IsUsingPrimaryLogFile() const;

   void SetPrimaryLogLevel(logging::LogLevel level);
   logging::LogLevel GetPrimaryLogLevel() const;

   void AddSink(std::shared_ptr<logging::LogSink> sink);
   void RemoveSink(std::shared_ptr<logging::LogSink> sink);

   logging::Logger NewLogger(const std::string& label);

private:
   std::shared_ptr<logging::EntryFilter> MakePrimaryFilter() const;
   void DetachPrimaryFile();

   std::shared_ptr<logging::LoggingCore> core_;
   logging::Logger selfLogger_;

   mutable std::mutex mutex_;
   logging::LogLevel primaryLevel_;

   std::shared_ptr<logging::LogSink> stdErrSink_;
   bool stdErrAttached_;

   std::shared_ptr<logging::LogSink> fileSink_;
   std::string fileName_;
};

} // namespace mcm
