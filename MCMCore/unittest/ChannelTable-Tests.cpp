#include <catch2/catch_all.hpp>

#include "CapturingLogSink.h"
#include "ChannelTable.h"
#include "ThrownCode.h"

#include <memory>
#include <vector>

using namespace mcm;

namespace {

std::vector<ChannelConfig> Configs(StageType first, StageType second = StageType::None,
      StageType third = StageType::None)
{
   std::vector<ChannelConfig> configs(3);
   configs[0] = ChannelConfig{ 1, first, false };
   configs[1] = ChannelConfig{ 2, second, false };
   configs[2] = ChannelConfig{ 3, third, true };
   return configs;
}

logging::Logger NewTestLogger(std::shared_ptr<CapturingLogSink> sink)
{
   std::shared_ptr<logging::LoggingCore> core =
      std::make_shared<logging::LoggingCore>();
   core->AddSink(sink);
   return core->NewLogger("test");
}

} // anonymous namespace

TEST_CASE("configured channels start at the stage limits", "[ChannelTable]")
{
   auto sink = std::make_shared<CapturingLogSink>();
   ChannelTable table(Configs(StageType::ZFM2020), 5, NewTestLogger(sink));

   REQUIRE(table.Size() == 3);
   const Channel& ch = table.Get(ChannelIndex(0));
   CHECK(ch.IsConfigured());
   CHECK(ch.label == 1);
   CHECK(ch.hardLowerUm == -12700.0);
   CHECK(ch.hardUpperUm == 12700.0);
   CHECK(ch.scanLowestUm == -12700.0);
   CHECK(ch.scanHighestUm == 12700.0);
   CHECK(ch.retractUm == Catch::Approx(12700.0 - 10 * 0.2116667));
   CHECK(ch.conversionUmPerCount == 0.2116667);
   CHECK(ch.minMotionCounts == 5);
   CHECK_FALSE(ch.hasPending);

   const Channel& unused = table.Get(ChannelIndex(2));
   CHECK_FALSE(unused.IsConfigured());
   CHECK(unused.reverse);
}

TEST_CASE("invalid channel configurations", "[ChannelTable]")
{
   auto sink = std::make_shared<CapturingLogSink>();
   const logging::Logger logger = NewTestLogger(sink);

   SECTION("wrong channel count")
   {
      std::vector<ChannelConfig> configs = Configs(StageType::ZFM2020);
      configs.pop_back();
      CHECK(ThrownCode([&] { ChannelTable t(configs, 5, logger); }) ==
            MCMERR_InvalidConfiguration);
   }

   SECTION("duplicate labels")
   {
      std::vector<ChannelConfig> configs = Configs(StageType::ZFM2020);
      configs[2].label = 1;
      CHECK(ThrownCode([&] { ChannelTable t(configs, 5, logger); }) ==
            MCMERR_InvalidConfiguration);
   }

   SECTION("negative minimum motion")
   {
      CHECK(ThrownCode([&] { ChannelTable t(Configs(StageType::ZFM2020), -1, logger); }) ==
            MCMERR_InvalidConfiguration);
   }
}

TEST_CASE("channel labels map to indices", "[ChannelTable]")
{
   auto sink = std::make_shared<CapturingLogSink>();
   std::vector<ChannelConfig> configs = Configs(StageType::ZFM2020, StageType::ZFM2030);
   configs[0].label = 10;
   configs[1].label = 20;
   configs[2].label = 30;
   ChannelTable table(configs, 5, NewTestLogger(sink));

   CHECK(table.IndexForLabel(20) == ChannelIndex(1));
   CHECK(table.GetLabels() == std::vector<int>{ 10, 20, 30 });
   CHECK(ThrownCode([&] { table.IndexForLabel(1); }) == MCMERR_InvalidChannel);
   CHECK(ThrownCode([&] { table.RequireConfigured(ChannelIndex(2)); }) ==
         MCMERR_ChannelNotConfigured);
}

TEST_CASE("scan limits", "[ChannelTable]")
{
   auto sink = std::make_shared<CapturingLogSink>();
   ChannelTable table(Configs(StageType::ZFM2020), 5, NewTestLogger(sink));
   const ChannelIndex idx(0);

   SECTION("within the stage limits")
   {
      CHECK_FALSE(table.SetScanLimit(idx, -5000.0, true));
      CHECK(table.Get(idx).scanLowestUm == -5000.0);
      CHECK(table.Get(idx).hardLowerUm == -12700.0);
   }

   SECTION("beyond the stage limits")
   {
      CHECK(ThrownCode([&] { table.SetScanLimit(idx, -12701.0, true); }) ==
            MCMERR_LimitExceeded);
      CHECK(ThrownCode([&] { table.SetScanLimit(idx, 20000.0, false); }) ==
            MCMERR_LimitExceeded);
      CHECK(table.Get(idx).scanLowestUm == -12700.0);
      CHECK(table.Get(idx).scanHighestUm == 12700.0);
   }

   SECTION("scan points may not cross")
   {
      table.SetScanLimit(idx, 100.0, false);
      CHECK(ThrownCode([&] { table.SetScanLimit(idx, 200.0, true); }) ==
            MCMERR_LimitExceeded);
      table.SetScanLimit(idx, 100.0, true);
      CHECK(ThrownCode([&] { table.SetScanLimit(idx, 50.0, false); }) ==
            MCMERR_LimitExceeded);
   }

   SECTION("lowering the highest scan point pulls the retract point down")
   {
      CHECK(table.SetScanLimit(idx, 1000.0, false));
      CHECK(table.Get(idx).retractUm == 1000.0);
      CHECK(sink->Contains(logging::LogLevelInfo, "retract point lowered"));
   }

   SECTION("raising the lowest scan point pulls the retract point up")
   {
      table.SetScanLimit(idx, 1000.0, false);
      table.SetRetractPoint(idx, 0.0);
      CHECK(table.SetScanLimit(idx, 500.0, true));
      CHECK(table.Get(idx).retractUm == 500.0);
   }

   SECTION("unconfigured channel")
   {
      CHECK(ThrownCode([&] { table.SetScanLimit(ChannelIndex(1), 0.0, true); }) ==
            MCMERR_ChannelNotConfigured);
   }
}

TEST_CASE("retract point must lie within the scan range", "[ChannelTable]")
{
   auto sink = std::make_shared<CapturingLogSink>();
   ChannelTable table(Configs(StageType::ZFM2030), 5, NewTestLogger(sink));
   const ChannelIndex idx(0);
   table.SetScanLimit(idx, -100.0, true);
   table.SetScanLimit(idx, 100.0, false);

   table.SetRetractPoint(idx, 100.0);
   CHECK(table.Get(idx).retractUm == 100.0);
   table.SetRetractPoint(idx, -100.0);
   CHECK(table.Get(idx).retractUm == -100.0);

   CHECK(ThrownCode([&] { table.SetRetractPoint(idx, 100.5); }) ==
         MCMERR_LimitExceeded);
   CHECK(table.Get(idx).retractUm == -100.0);
}

TEST_CASE("pending target bookkeeping", "[ChannelTable]")
{
   auto sink = std::make_shared<CapturingLogSink>();
   ChannelTable table(Configs(StageType::ZFM2020), 5, NewTestLogger(sink));
   const ChannelIndex idx(0);

   table.SetPending(idx, 400);
   CHECK(table.Get(idx).hasPending);
   CHECK(table.Get(idx).pendingEncoder == 400);
   table.SetCurrentEncoder(idx, 398);
   table.ClearPending(idx);
   CHECK_FALSE(table.Get(idx).hasPending);
   CHECK(table.Get(idx).currentEncoder == 398);
}
