///////////////////////////////////////////////////////////////////////////////
// FILE:          MetadataFormatter.h
// PROJECT:       MCMControl
// SUBSYSTEM:     MCMCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Line prefixes for formatted log output
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

#include <chrono>
#include <cstddef>
#include <cstdio>
#include <ctime>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>


namespace mcm
{
namespace logging
{
namespace internal
{


// Three-letter tag shown inside the bracketed prefix.
inline const char*
LevelTag(LogLevel level)
{
   static const char* const tags[] = { "trc", "dbg", "IFO", "WRN", "ERR", "FTL" };
   const int index = static_cast<int>(level);
   if (index < 0 || index >= static_cast<int>(sizeof(tags) / sizeof(tags[0])))
      return "???";
   return tags[index];
}


// Timestamp with microsecond resolution, e.g. 2024-03-01T12:00:00.000250
inline std::string
TimestampText(std::chrono::system_clock::time_point when)
{
   const auto sinceEpoch = when.time_since_epoch();
   const auto wholeSeconds = std::chrono::duration_cast<std::chrono::seconds>(sinceEpoch);
   const long micros = static_cast<long>(
         std::chrono::duration_cast<std::chrono::microseconds>(
            sinceEpoch - wholeSeconds).count());

   const std::time_t secs = static_cast<std::time_t>(wholeSeconds.count());
   std::tm local;
#ifdef _WIN32
   localtime_s(&local, &secs);
#else
   localtime_r(&secs, &local);
#endif

   char text[40];
   const std::size_t n = std::strftime(text, sizeof(text), "%Y-%m-%dT%H:%M:%S", &local);
   std::snprintf(text + n, sizeof(text) - n, ".%06ld", micros);
   return text;
}


/// Writes "<time> tid<id> [LVL,Component]" before the first line of an
/// entry, and a blank prefix of the same width with the brackets kept in
/// place before each continuation line. Not thread-safe; sinks call it
/// with their own lock held.
class MetadataFormatter
{
public:
   MetadataFormatter() : bracketOpen_(0), bracketClose_(0) {}

   void FormatLinePrefix(std::ostream& stream, const Metadata& metadata)
   {
      std::ostringstream head;
      head << TimestampText(metadata.GetStampData().GetTimestamp())
         << " tid" << metadata.GetStampData().GetThreadId() << ' ';
      const std::string lead = head.str();

      bracketOpen_ = lead.size();
      const std::string tag = std::string(LevelTag(metadata.GetEntryData().GetLevel())) +
         ',' + metadata.GetLoggerData().GetComponentLabel();
      bracketClose_ = bracketOpen_ + 1 + tag.size();

      stream << lead << '[' << tag << ']';
   }

   void FormatContinuationPrefix(std::ostream& stream) const
   {
      std::string blank(bracketClose_ + 1, ' ');
      blank[bracketOpen_] = '[';
      blank[bracketClose_] = ']';
      stream << blank;
   }

private:
   std::size_t bracketOpen_;
   std::size_t bracketClose_;
};


// Split entry text at CR, LF or CRLF. Trailing line breaks are dropped; an
// entry always yields at least one (possibly empty) line.
inline std::vector<std::string>
SplitEntryIntoLines(const std::string& text)
{
   std::vector<std::string> lines;
   std::string current;
   for (std::size_t i = 0; i < text.size(); ++i)
   {
      const char ch = text[i];
      if (ch == '\r' || ch == '\n')
      {
         lines.push_back(current);
         current.clear();
         if (ch == '\r' && i + 1 < text.size() && text[i + 1] == '\n')
            ++i;
      }
      else
      {
         current += ch;
      }
   }
   if (!current.empty())
      lines.push_back(current);

   while (lines.size() > 1 && lines.back().empty())
      lines.pop_back();
   if (lines.empty())
      lines.push_back(std::string());
   return lines;
}

} // namespace internal
} // namespace logging
} // namespace mcm
