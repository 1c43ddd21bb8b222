#include <catch2/catch_all.hpp>

#include "DeviceMetadata.h"
#include "MCMDeviceConstants.h"

#include <string>
#include <vector>

using mcm::DeviceMetadata;

TEST_CASE("DeviceMetadata serialize empty", "[Metadata]") {
   DeviceMetadata m;
   CHECK(m.Serialize() == "0\n");
   CHECK(m.Size() == 0);
}

TEST_CASE("DeviceMetadata serializes tags in key order", "[Metadata]") {
   DeviceMetadata m;
   m.AddTag("StageType", "ZFM2020");
   m.AddTag("Channel", 2);
   m.AddTag("RetractPointUm", 12697.88);
   CHECK(m.Serialize() ==
       "3\n"
       "Channel=2\n"
       "RetractPointUm=12697.88\n"
       "StageType=ZFM2020\n");
}

TEST_CASE("DeviceMetadata formats booleans as words", "[Metadata]") {
   DeviceMetadata m;
   m.AddTag(mcm::g_Keyword_Reverse, true);
   std::string value;
   REQUIRE(m.GetTag(mcm::g_Keyword_Reverse, value));
   CHECK(value == "true");
}

TEST_CASE("DeviceMetadata keeps enough digits for the conversion factor",
          "[Metadata]") {
   DeviceMetadata m;
   m.AddTag(mcm::g_Keyword_Conversion, 0.2116667);
   std::string value;
   REQUIRE(m.GetTag(mcm::g_Keyword_Conversion, value));
   CHECK(value == "0.2116667");
}

TEST_CASE("DeviceMetadata duplicate key keeps last value", "[Metadata]") {
   DeviceMetadata m;
   m.AddTag("Key", "first");
   m.AddTag(std::string("Key"), "second");
   CHECK(m.Serialize() == "1\nKey=second\n");
}

TEST_CASE("DeviceMetadata lookup of missing key leaves value", "[Metadata]") {
   DeviceMetadata m;
   std::string value = "unchanged";
   CHECK_FALSE(m.GetTag("Missing", value));
   CHECK(value == "unchanged");
   CHECK_FALSE(m.HasTag("Missing"));
}

TEST_CASE("DeviceMetadata merge prefixes keys", "[Metadata]") {
   DeviceMetadata channel;
   channel.AddTag("StageType", "ZFM2030");
   channel.AddTag("Reverse", false);

   DeviceMetadata controller;
   controller.AddTag("Name", "MCM3000");
   controller.Merge(channel, "Channel3-");

   const std::vector<std::string> keys = controller.GetKeys();
   REQUIRE(keys.size() == 3);
   CHECK(keys[0] == "Channel3-Reverse");
   CHECK(keys[1] == "Channel3-StageType");
   CHECK(keys[2] == "Name");

   controller.Clear();
   CHECK(controller.Size() == 0);
}
