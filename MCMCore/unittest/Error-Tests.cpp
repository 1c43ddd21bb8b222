#include <catch2/catch_all.hpp>

#include "Error.h"

#include <string>

TEST_CASE("error without underlying error", "[Error]")
{
   CMCMError e("limit exceeded", MCMERR_LimitExceeded);
   CHECK(e.getMsg() == "limit exceeded");
   CHECK(e.getFullMsg() == "limit exceeded");
   CHECK(std::string(e.what()) == "limit exceeded");
   CHECK(e.getCode() == MCMERR_LimitExceeded);
   CHECK(e.getSpecificCode() == MCMERR_LimitExceeded);
   CHECK(e.getUnderlyingError() == nullptr);
}

TEST_CASE("chained errors", "[Error]")
{
   CMCMError io("read timed out", MCMERR_SerialTimeout);
   CMCMError e("cannot read position", MCMERR_GENERIC, io);
   CHECK(e.getFullMsg() == "cannot read position [ read timed out ]");
   CHECK(e.getCode() == MCMERR_GENERIC);
   CHECK(e.getSpecificCode() == MCMERR_SerialTimeout);
   REQUIRE(e.getUnderlyingError() != nullptr);
   CHECK(e.getUnderlyingError()->getMsg() == "read timed out");

   SECTION("copies are deep")
   {
      CMCMError copy(e);
      CHECK(copy.getFullMsg() == e.getFullMsg());
      REQUIRE(copy.getUnderlyingError() != nullptr);
      CHECK(copy.getUnderlyingError() != e.getUnderlyingError());

      CMCMError assigned("x");
      assigned = e;
      CHECK(assigned.getSpecificCode() == MCMERR_SerialTimeout);
   }
}

TEST_CASE("empty message", "[Error]")
{
   CMCMError e("");
   CHECK(e.getFullMsg() == "(No message)");
   CHECK(e.getSpecificCode() == MCMERR_GENERIC);
}
