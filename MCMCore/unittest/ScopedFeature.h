#pragma once

#include "CoreFeatures.h"

#include <string>

// Sets a core feature for the lifetime of the object.
class ScopedFeature {
   std::string name_;
   bool previous_;

public:
   ScopedFeature(const std::string& name, bool enable) :
      name_(name),
      previous_(mcm::features::isFeatureEnabled(name))
   {
      mcm::features::enableFeature(name_, enable);
   }

   ~ScopedFeature() { mcm::features::enableFeature(name_, previous_); }

   ScopedFeature(const ScopedFeature&) = delete;
   ScopedFeature& operator=(const ScopedFeature&) = delete;
};
