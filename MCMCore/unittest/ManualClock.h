#pragma once

#include "Clock.h"

#include <chrono>
#include <functional>
#include <vector>

// Clock whose sleeps advance virtual time instantly.
class ManualClock : public mcm::Clock {
   TimePoint now_;

public:
   std::vector<std::chrono::milliseconds> sleeps;
   std::function<void()> onSleep;

   ManualClock() : now_() {}

   TimePoint Now() override { return now_; }

   void SleepFor(std::chrono::milliseconds duration) override {
      sleeps.push_back(duration);
      now_ += duration;
      if (onSleep)
         onSleep();
   }

   void Advance(std::chrono::milliseconds duration) { now_ += duration; }

   std::chrono::milliseconds Elapsed() const {
      return std::chrono::duration_cast<std::chrono::milliseconds>(
            now_ - TimePoint());
   }
};
