#include <catch2/catch_all.hpp>

#include "TestRig.h"
#include "ThrownCode.h"
#include "ZStage.h"

#include <string>

using namespace mcm;

TEST_CASE("stage identity", "[ZStage]")
{
   TestRig rig;
   ZStage stage(*rig.controller, 1, "Focus");
   std::string name;
   stage.GetName(name);
   CHECK(name == "Focus");
   CHECK(stage.GetType() == StageDevice);
   CHECK(stage.GetChannel() == 1);
}

TEST_CASE("stage on a channel without a stage", "[ZStage]")
{
   TestRig rig;
   CHECK(ThrownCode([&] { ZStage stage(*rig.controller, 2); }) ==
         MCMERR_ChannelNotConfigured);
   CHECK(ThrownCode([&] { ZStage stage(*rig.controller, 9); }) ==
         MCMERR_InvalidChannel);
}

TEST_CASE("stage motion through the device interface", "[ZStage]")
{
   TestRig rig;
   ZStage zstage(*rig.controller, 1);
   Stage& stage = zstage;

   double target = 0.0;
   REQUIRE(stage.MoveUm(8000.0, false, target) == DEVICE_OK);
   CHECK(target == Catch::Approx(37795 * 0.2116667));
   double pos = 0.0;
   REQUIRE(stage.GetPositionUm(pos) == DEVICE_OK);
   CHECK(pos == Catch::Approx(8000.0).margin(0.2116667));

   REQUIRE(stage.Home() == DEVICE_OK);
   REQUIRE(stage.GetPositionUm(pos) == DEVICE_OK);
   CHECK(pos == 0.0);

   REQUIRE(stage.Retract() == DEVICE_OK);
   REQUIRE(stage.GetPositionUm(pos) == DEVICE_OK);
   CHECK(pos == Catch::Approx(rig.controller->getRetractPointUm(1)).margin(0.2116667));
}

TEST_CASE("stage errors become codes", "[ZStage]")
{
   TestRig rig;
   ZStage stage(*rig.controller, 1);

   double target = 0.0;
   CHECK(stage.MoveUm(20000.0, false, target) == MCMERR_LimitExceeded);
   CHECK_THAT(stage.GetLastErrorText(), Catch::Matchers::ContainsSubstring("exceeds the limit_um"));
   CHECK(rig.log->Contains(logging::LogLevelError, "exceeds the limit_um"));

   CHECK(stage.SetRetractUm(20000.0, false) == MCMERR_LimitExceeded);
   CHECK(stage.SetRetractUm(100.0, false) == DEVICE_OK);
   CHECK(rig.controller->getRetractPointUm(1) == 100.0);

   rig.controller->close();
   double pos = 0.0;
   CHECK(stage.GetPositionUm(pos) == MCMERR_ConnectionClosed);
}

TEST_CASE("stage limits are the scan limits", "[ZStage]")
{
   TestRig rig;
   ZStage stage(*rig.controller, 1);
   rig.controller->setStageLimitUm(1, -300.0, true);

   double lower = 0.0, upper = 0.0;
   REQUIRE(stage.GetLimitsUm(lower, upper) == DEVICE_OK);
   CHECK(lower == -300.0);
   CHECK(upper == 12700.0);
}

TEST_CASE("length units", "[ZStage]")
{
   CHECK(ZStage::UmPerUnit("um") == 1.0);
   CHECK(ZStage::UmPerUnit("mm") == 1e3);
   CHECK(ZStage::UmPerUnit("cm") == 1e4);
   CHECK(ZStage::UmPerUnit("m") == 1e6);
   CHECK(ZStage::UmPerUnit("nm") == 1e-3);
   CHECK(ZStage::UmPerUnit("pm") == 1e-6);
   CHECK(ZStage::UmPerUnit("MM") == 1e3);

   const std::string unit = GENERATE("inch", "", "mu", "km");
   CAPTURE(unit);
   CHECK(ThrownCode([&] { ZStage::UmPerUnit(unit); }) == MCMERR_UnsupportedUnit);
}

TEST_CASE("moves in other units", "[ZStage]")
{
   TestRig rig;
   ZStage stage(*rig.controller, 1);

   CHECK(stage.Move(8.0, false, "mm"));
   CHECK(rig.device->GetTargetValue(0) == 37795);
   CHECK(stage.GetPosition("mm") == Catch::Approx(8.0).margin(0.001));
   CHECK(stage.GetPosition("nm") == Catch::Approx(8e6).margin(300.0));

   CHECK(ThrownCode([&] { stage.Move(1.0, true, "furlong"); }) == MCMERR_UnsupportedUnit);
   CHECK(rig.device->GetMoveCommandCount() == 1);
}

TEST_CASE("velocity and acceleration are fixed", "[ZStage]")
{
   TestRig rig;
   ZStage stage(*rig.controller, 1);
   stage.SetVelocity(2.0);
   stage.SetAcceleration(5.0);
   CHECK(rig.log->CountAtLevel(logging::LogLevelWarning) == 2);
   CHECK(rig.log->Contains(logging::LogLevelWarning, "Velocity cannot be changed"));
}

TEST_CASE("stage metadata", "[ZStage]")
{
   TestRig rig;
   ZStage stage(*rig.controller, 1);
   DeviceMetadata md;
   REQUIRE(stage.GetMetadata(md) == DEVICE_OK);

   std::string value;
   REQUIRE(md.GetTag("Name", value));
   CHECK(value == "ZStage");
   REQUIRE(md.GetTag("Description", value));
   CHECK(value == "MCM3000 channel 1");
   REQUIRE(md.GetTag("Unit", value));
   CHECK(value == "um");
   REQUIRE(md.GetTag("StageType", value));
   CHECK(value == "ZFM2020");
   REQUIRE(md.GetTag("PositionUm", value));
   CHECK(value == "0");
}
