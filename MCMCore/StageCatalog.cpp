///////////////////////////////////////////////////////////////////////////////
// FILE:          StageCatalog.cpp
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

#include "StageCatalog.h"

#include "CoreUtils.h"
#include "Error.h"

#include <cmath>
#include <utility>

namespace mcm {

namespace {

struct CatalogEntry {
   StageType type;
   const char* name;
   StageSpec spec;
};

// The MCM3001 encoder resolution is given as 0.212 um; 0.2116667 um/count
// is the exact figure. ZFM2020 and ZFM2030 both travel 1 inch (25.4 mm),
// centred on zero.
const CatalogEntry g_catalog[] = {
   { StageType::ZFM2020, "ZFM2020", { -12700.0, 12700.0, 0.2116667 } },
   { StageType::ZFM2030, "ZFM2030", { -12700.0, 12700.0, 0.2116667 } },
};

} // anonymous namespace


StageType StageTypeFromName(const std::string& name)
{
   if (name.empty())
      return StageType::None;
   for (const CatalogEntry& entry : g_catalog)
   {
      if (name == entry.name)
         return entry.type;
   }
   throw CMCMError("Stage " + ToQuotedString(name) +
         " is not supported by this controller", MCMERR_UnsupportedStage);
}


const char* StageTypeName(StageType type)
{
   for (const CatalogEntry& entry : g_catalog)
   {
      if (entry.type == type)
         return entry.name;
   }
   return "None";
}


StageSpec GetStageSpec(StageType type)
{
   for (const CatalogEntry& entry : g_catalog)
   {
      if (entry.type == type)
         return entry.spec;
   }
   throw CMCMError("No stage specification for stage type " +
         ToQuotedString(StageTypeName(type)), MCMERR_UnsupportedStage);
}


std::vector<std::string> GetSupportedStageNames()
{
   std::vector<std::string> names;
   for (const CatalogEntry& entry : g_catalog)
      names.push_back(entry.name);
   return names;
}


LimitNormalization NormalizeLimits(double& lowerUm, double& upperUm)
{
   if (lowerUm == upperUm)
   {
      const double half = std::fabs(lowerUm);
      lowerUm = -half;
      upperUm = half;
      return LimitsMadeSymmetric;
   }
   if (lowerUm > upperUm)
   {
      std::swap(lowerUm, upperUm);
      return LimitsSwapped;
   }
   return LimitsUnchanged;
}

} // namespace mcm
