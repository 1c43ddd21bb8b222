///////////////////////////////////////////////////////////////////////////////
// FILE:          ErrorCodes.h
// PROJECT:       MCMControl
// SUBSYSTEM:     MCMCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   List of error IDs
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

#define MCMERR_OK                      0
#define MCMERR_GENERIC                 1 // unspecified error

// Serial link
#define MCMERR_SerialOpenFailed        2
#define MCMERR_SerialIOFailed          3
#define MCMERR_SerialTimeout           4
#define MCMERR_ConnectionClosed        5

// Protocol (framing desync)
#define MCMERR_ChannelMismatch         6
#define MCMERR_UnexpectedData          7
#define MCMERR_ShortResponse           8

// Configuration and usage
#define MCMERR_InvalidChannel          9
#define MCMERR_ChannelNotConfigured    10
#define MCMERR_UnsupportedStage        11
#define MCMERR_InvalidConfiguration    12
#define MCMERR_UnsupportedUnit         13
#define MCMERR_NoSuchFeature           14

// Motion
#define MCMERR_LimitExceeded           15
#define MCMERR_MotionTimeout           16
