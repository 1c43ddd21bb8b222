#include <catch2/catch_all.hpp>

#include "Logging/Logging.h"

#include <string>
#include <vector>

namespace mcm {
namespace logging {

TEST_CASE("split entry into lines", "[Logging]")
{
   SECTION("empty result")
   {
      const char *testStr = GENERATE(
         "", "\r", "\n", "\r\r", "\r\n", "\n\n",
         "\r\r\r", "\r\r\n", "\r\n\r", "\r\n\n",
         "\n\r\r", "\n\r\n", "\n\n\r", "\n\n\n");
      const std::vector<std::string> result = internal::SplitEntryIntoLines(testStr);
      CHECK(result.size() == 1);
      CHECK_THAT(result[0], Catch::Matchers::Equals(""));
   }

   SECTION("single-line result")
   {
      const char *testStr = GENERATE(
         "X", "X\r", "X\n", "X\r\r", "X\r\n", "X\n\n",
         "X\r\r\r", "X\r\n\n", "X\n\n\n");
      const std::vector<std::string> result = internal::SplitEntryIntoLines(testStr);
      CHECK(result.size() == 1);
      CHECK_THAT(result[0], Catch::Matchers::Equals("X"));
   }

   SECTION("two-line result")
   {
      const char *testStr = GENERATE(
         "X\rY", "X\nY", "X\r\nY",
         "X\nY\r", "X\nY\n", "X\nY\r\n", "X\nY\n\n", "X\nY\r\n\r\n");
      const std::vector<std::string> result = internal::SplitEntryIntoLines(testStr);
      REQUIRE(result.size() == 2);
      CHECK_THAT(result[0], Catch::Matchers::Equals("X"));
      CHECK_THAT(result[1], Catch::Matchers::Equals("Y"));
   }

   SECTION("three-line result with empty middle line")
   {
      const char *testStr = GENERATE(
         "X\r\rY", "X\n\nY", "X\n\rY", "X\r\n\rY", "X\r\n\nY",
         "X\r\r\nY", "X\n\r\nY", "X\r\n\r\nY");
      const std::vector<std::string> result = internal::SplitEntryIntoLines(testStr);
      REQUIRE(result.size() == 3);
      CHECK_THAT(result[0], Catch::Matchers::Equals("X"));
      CHECK_THAT(result[1], Catch::Matchers::Equals(""));
      CHECK_THAT(result[2], Catch::Matchers::Equals("Y"));
   }
}

} // namespace logging
} // namespace mcm
