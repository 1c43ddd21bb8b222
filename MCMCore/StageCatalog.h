///////////////////////////////////////////////////////////////////////////////
// FILE:          StageCatalog.h
// PROJECT:       MCMControl
// SUBSYSTEM:     MCMCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Stage models supported by the controller
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
#include <vector>

namespace mcm {

enum class StageType {
   None,
   ZFM2020,
   ZFM2030,
};

struct StageSpec {
   double lowerLimitUm;
   double upperLimitUm;
   double conversionUmPerCount;
};

// Empty name maps to StageType::None. Throws MCMERR_UnsupportedStage for
// names not in the catalog.
StageType StageTypeFromName(const std::string& name);

// "None" for StageType::None
const char* StageTypeName(StageType type);

// Throws MCMERR_UnsupportedStage for StageType::None.
StageSpec GetStageSpec(StageType type);

std::vector<std::string> GetSupportedStageNames();

enum LimitNormalization {
   LimitsUnchanged,
   LimitsMadeSymmetric, // lower == upper; expanded to [-|l|, +|l|]
   LimitsSwapped,       // lower > upper
};

LimitNormalization NormalizeLimits(double& lowerUm, double& upperUm);

} // namespace mcm
