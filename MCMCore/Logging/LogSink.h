///////////////////////////////////////////////////////////////////////////////
// FILE:          LogSink.h
// PROJECT:       MCMControl
// SUBSYSTEM:     MCMCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Log sinks and entry filters
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

#include "Metadata.h"
#include "MetadataFormatter.h"

#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>


namespace mcm
{
namespace logging
{


class EntryFilter
{
public:
   virtual ~EntryFilter() {}
   virtual bool Filter(const Metadata& metadata) const = 0;
};


class LevelFilter : public EntryFilter
{
   LogLevel minLevel_;

public:
   LevelFilter(LogLevel minLevel) : minLevel_(minLevel) {}

   virtual bool Filter(const Metadata& metadata) const
   { return metadata.GetEntryData().GetLevel() >= minLevel_; }
};


class CannotOpenFileException : public std::runtime_error
{
public:
   CannotOpenFileException(const std::string& filename) :
      std::runtime_error("Cannot open log file " + filename)
   {}
};


/**
 * Destination for log entries.
 *
 * Sinks are called with the LoggingCore's sink lock held, so an
 * implementation never sees two entries at once.
 */
class LogSink
{
   std::shared_ptr<EntryFilter> filter_;

public:
   virtual ~LogSink() {}

   void SetFilter(std::shared_ptr<EntryFilter> filter) { filter_ = filter; }
   std::shared_ptr<EntryFilter> GetFilter() const { return filter_; }

   // Applies the filter, then hands the entry to Consume().
   void Dispatch(const Metadata& metadata, const std::string& text);

protected:
   virtual void Consume(const Metadata& metadata, const std::string& text) = 0;
};


// Writes each entry as prefixed lines to an output stream.
class StreamLogSink : public LogSink
{
   internal::MetadataFormatter formatter_;

protected:
   virtual std::ostream& Stream() = 0;
   virtual void Consume(const Metadata& metadata, const std::string& text);
};


class StdErrLogSink : public StreamLogSink
{
protected:
   virtual std::ostream& Stream();
};


class FileLogSink : public StreamLogSink
{
   std::string filename_;
   std::ofstream fileStream_;

public:
   FileLogSink(const std::string& filename, bool append = false);
   virtual ~FileLogSink();

   std::string GetFilename() const { return filename_; }

protected:
   virtual std::ostream& Stream() { return fileStream_; }
};

} // namespace logging
} // namespace mcm
