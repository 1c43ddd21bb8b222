///////////////////////////////////////////////////////////////////////////////
// FILE:          CoreUtils.h
// PROJECT:       MCMControl
// SUBSYSTEM:     MCMCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Utility functions for use in MCMCore
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

#include <sstream>
#include <string>


inline std::string ToString(int d) { return std::to_string(d); }
inline std::string ToString(long d) { return std::to_string(d); }
inline std::string ToString(long long d) { return std::to_string(d); }
inline std::string ToString(unsigned d) { return std::to_string(d); }
inline std::string ToString(unsigned long d) { return std::to_string(d); }
inline std::string ToString(unsigned long long d) { return std::to_string(d); }

// std::to_string(double) always prints six decimals, which turns
// 0.2116667 into "0.211667"; keep enough digits to identify the value.
inline std::string ToString(double d)
{
   std::ostringstream os;
   os.precision(10);
   os << d;
   return os.str();
}

inline std::string ToString(bool b) { return b ? "true" : "false"; }

inline std::string ToString(const std::string& d) { return d; }

inline std::string ToString(const char* d)
{
   if (!d)
      return "(null)";
   return d;
}

template <typename T>
inline std::string ToQuotedString(const T& d)
{ return "\"" + ToString(d) + "\""; }

// "[lower, upper]"
inline std::string ToRangeString(double lower, double upper)
{ return "[" + ToString(lower) + ", " + ToString(upper) + "]"; }
