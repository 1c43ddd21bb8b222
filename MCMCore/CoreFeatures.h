///////////////////////////////////////////////////////////////////////////////
// FILE:          CoreFeatures.h
// PROJECT:       MCMControl
// SUBSYSTEM:     MCMCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Process-wide switches for optional core behavior
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

#include <string>

namespace mcm {
namespace features {

struct Flags {
   // A motion that does not settle before the deadline throws
   // MCMERR_MotionTimeout instead of only being logged.
   bool strictMotionTimeout = false;
   // Moves closer than the minimum encoder motion are preceded by a
   // corrective excursion.
   bool deadbandCorrection = true;
};

namespace internal {

extern Flags g_flags;

}

inline const Flags& flags() { return internal::g_flags; }

void enableFeature(const std::string& name, bool enable);
bool isFeatureEnabled(const std::string& name);

} // namespace features
} // namespace mcm
