///////////////////////////////////////////////////////////////////////////////
// PROJECT:       MCMControl
// SUBSYSTEM:     MCMDevice
//-----------------------------------------------------------------------------
// LICENSE:       This file is distributed under the BSD license.
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

#include <cassert>
#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace mcm {

/**
 * @brief Key-value description of a device's identity and current state.
 *
 * Returned by Device::GetMetadata(). Orchestration code reads it to record
 * which hardware (and which settings) produced a measurement.
 */
class DeviceMetadata {
public:
   /**
    * @brief Add a tag.
    *
    * The key must not contain newlines. The value should be a string, integer,
    * boolean or floating point number; strings must not contain newlines.
    *
    * If a tag with the same key is added more than once, the last value wins.
    *
    * @param key the key (must not be null)
    * @param value the value
    */
   template <typename V>
   void AddTag(const char* key, V value) {
      assert(key != nullptr);
      std::ostringstream strm;
      strm.precision(12);
      strm << std::boolalpha << value;
      tags_[key] = strm.str();
   }

   /** @brief Optimized overload for string values. */
   void AddTag(const char* key, const char* value) {
      assert(key != nullptr);
      assert(value != nullptr);
      tags_[key] = value;
   }

   /** @brief Overload for std::string key. */
   template <typename V>
   void AddTag(const std::string& key, V value) {
      AddTag(key.c_str(), value);
   }

   /**
    * @brief Look up a tag.
    * @return false if no tag with the key exists (value is left untouched)
    */
   bool GetTag(const std::string& key, std::string& value) const {
      auto it = tags_.find(key);
      if (it == tags_.end())
         return false;
      value = it->second;
      return true;
   }

   bool HasTag(const std::string& key) const {
      return tags_.find(key) != tags_.end();
   }

   std::vector<std::string> GetKeys() const {
      std::vector<std::string> keys;
      keys.reserve(tags_.size());
      for (const auto& tag : tags_)
         keys.push_back(tag.first);
      return keys;
   }

   size_t Size() const { return tags_.size(); }

   /**
    * @brief Remove all tags.
    */
   void Clear() { tags_.clear(); }

   /**
    * @brief Copy all tags of another map into this one, prefixing their keys.
    *
    * Used to nest a channel's metadata inside its controller's, e.g.
    * "Channel1-StageType".
    */
   void Merge(const DeviceMetadata& other, const std::string& prefix) {
      for (const auto& tag : other.tags_)
         tags_[prefix + tag.first] = tag.second;
   }

   /**
    * @brief Return this metadata map serialized to string form.
    *
    * Header: <tag_count>\n
    * For each tag, in key order: <key>=<value>\n
    */
   std::string Serialize() const {
      std::string serialized = std::to_string(tags_.size());
      serialized += '\n';
      for (const auto& tag : tags_) {
         serialized += tag.first;
         serialized += '=';
         serialized += tag.second;
         serialized += '\n';
      }
      return serialized;
   }

private:
   std::map<std::string, std::string> tags_;
};

} // namespace mcm
