///////////////////////////////////////////////////////////////////////////////
// FILE:          LogSink.cpp
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

#include "LogSink.h"

#include <iostream>
#include <vector>


namespace mcm
{
namespace logging
{


void
LogSink::Dispatch(const Metadata& metadata, const std::string& text)
{
   if (filter_ && !filter_->Filter(metadata))
      return;
   Consume(metadata, text);
}


void
StreamLogSink::Consume(const Metadata& metadata, const std::string& text)
{
   std::ostream& stream = Stream();
   const std::vector<std::string> lines = internal::SplitEntryIntoLines(text);
   for (std::size_t i = 0; i < lines.size(); ++i)
   {
      if (i == 0)
         formatter_.FormatLinePrefix(stream, metadata);
      else
         formatter_.FormatContinuationPrefix(stream);
      stream << ' ' << lines[i] << '\n';
   }
   stream.flush();
}


std::ostream&
StdErrLogSink::Stream()
{
   return std::clog;
}


FileLogSink::FileLogSink(const std::string& filename, bool append) :
   filename_(filename)
{
   std::ios_base::openmode mode = std::ios_base::out;
   mode |= (append ? std::ios_base::app : std::ios_base::trunc);

   fileStream_.open(filename_.c_str(), mode);
   if (!fileStream_)
      throw CannotOpenFileException(filename_);
}


FileLogSink::~FileLogSink()
{
   fileStream_.close();
}

} // namespace logging
} // namespace mcm
