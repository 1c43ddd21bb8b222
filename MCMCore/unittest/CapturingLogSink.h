#pragma once

#include "Logging/Logging.h"

#include <mutex>
#include <string>
#include <vector>

// Keeps every entry in memory for inspection.
class CapturingLogSink : public mcm::logging::LogSink {
public:
   struct Entry {
      mcm::logging::LogLevel level;
      std::string component;
      std::string text;
   };

   std::vector<Entry> Entries() const {
      std::lock_guard<std::mutex> lock(mutex_);
      return entries_;
   }

   bool Contains(mcm::logging::LogLevel level,
         const std::string& fragment) const {
      std::lock_guard<std::mutex> lock(mutex_);
      for (const auto& e : entries_)
         if (e.level == level && e.text.find(fragment) != std::string::npos)
            return true;
      return false;
   }

   std::size_t CountAtLevel(mcm::logging::LogLevel level) const {
      std::lock_guard<std::mutex> lock(mutex_);
      std::size_t n = 0;
      for (const auto& e : entries_)
         if (e.level == level)
            ++n;
      return n;
   }

protected:
   void Consume(const mcm::logging::Metadata& metadata,
         const std::string& text) override {
      std::lock_guard<std::mutex> lock(mutex_);
      entries_.push_back(Entry{metadata.GetEntryData().GetLevel(),
            metadata.GetLoggerData().GetComponentLabel(), text});
   }

private:
   mutable std::mutex mutex_;
   std::vector<Entry> entries_;
};
