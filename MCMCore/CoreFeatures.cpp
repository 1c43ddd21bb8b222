///////////////////////////////////////////////////////////////////////////////
// FILE:          CoreFeatures.cpp
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

// Adding a feature:
// 1. Add a bool to Flags (CoreFeatures.h), with its default.
// 2. Add the name and get/set functions to featureMap() below.
// 3. Read it through mcm::features::flags() where the behavior branches.
// Feature names are part of the API and must not be renamed once released.

#include "CoreFeatures.h"

#include "CoreUtils.h"
#include "Error.h"

#include <map>
#include <utility>


namespace mcm {
namespace features {

namespace internal {

Flags g_flags{};

}

namespace {

const auto& featureMap() {
   using GetFunc = bool(*)();
   using SetFunc = void(*)(bool);
   using internal::g_flags;
   static const std::map<std::string, std::pair<GetFunc, SetFunc>> map = {
      {
         "StrictMotionTimeout", {
            [] { return g_flags.strictMotionTimeout; },
            [](bool e) { g_flags.strictMotionTimeout = e; }
         }
      },
      {
         "DeadbandCorrection", {
            [] { return g_flags.deadbandCorrection; },
            [](bool e) { g_flags.deadbandCorrection = e; }
         }
      },
   };
   return map;
}

using Accessors = std::pair<bool(*)(), void(*)(bool)>;

const Accessors& lookup(const std::string& name) {
   const auto& all = featureMap();
   const auto it = all.find(name);
   if (it == all.end()) {
      throw CMCMError("No such feature: " + ToQuotedString(name),
            MCMERR_NoSuchFeature);
   }
   return it->second;
}

} // namespace

void enableFeature(const std::string& name, bool enable) {
   lookup(name).second(enable);
}

bool isFeatureEnabled(const std::string& name) {
   return lookup(name).first();
}

} // namespace features
} // namespace mcm
