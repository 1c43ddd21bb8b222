///////////////////////////////////////////////////////////////////////////////
// FILE:          UnitConverter.h
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

#pragma once

#include "Channel.h"

namespace mcm {

// counts * conversion, negated for reversed channels. Never returns -0.0.
double UmFromEncoder(double conversionUmPerCount, bool reverse, long counts);

// um / conversion truncated toward zero, negated for reversed channels.
// Throws MCMERR_LimitExceeded when um is not finite or the result does not
// fit the protocol's 32-bit encoder range.
long EncoderFromUm(double conversionUmPerCount, bool reverse, double um);

inline double UmFromEncoder(const Channel& ch, long counts)
{ return UmFromEncoder(ch.conversionUmPerCount, ch.reverse, counts); }

inline long EncoderFromUm(const Channel& ch, double um)
{ return EncoderFromUm(ch.conversionUmPerCount, ch.reverse, um); }

} // namespace mcm
