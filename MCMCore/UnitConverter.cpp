///////////////////////////////////////////////////////////////////////////////
// FILE:          UnitConverter.cpp
// PROJECT:       MCMControl
// SUBSYSTEM:     MCMCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Conversion between micrometres and encoder counts
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

#include "UnitConverter.h"

#include "CoreUtils.h"
#include "Error.h"

#include <cmath>
#include <cstdint>
#include <limits>

namespace mcm {

double UmFromEncoder(double conversionUmPerCount, bool reverse, long counts)
{
   double um = static_cast<double>(counts) * conversionUmPerCount;
   if (reverse)
      um = -um;
   return um + 0.0; // -0.0 + 0.0 == +0.0
}


long EncoderFromUm(double conversionUmPerCount, bool reverse, double um)
{
   if (!std::isfinite(um))
      throw CMCMError("Position " + ToString(um) + " um is not a number",
            MCMERR_LimitExceeded);

   const double counts = std::trunc(um / conversionUmPerCount);
   if (std::fabs(counts) >
         static_cast<double>(std::numeric_limits<std::int32_t>::max()))
      throw CMCMError("Position " + ToString(um) +
            " um is beyond the encoder range", MCMERR_LimitExceeded);

   long value = static_cast<long>(counts);
   if (reverse)
      value = -value;
   return value;
}

} // namespace mcm
