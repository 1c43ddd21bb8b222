#include <catch2/catch_all.hpp>

#include "CapturingLogSink.h"
#include "ChannelTable.h"
#include "CommandCodec.h"
#include "ManualClock.h"
#include "MockTransport.h"
#include "MotionExecutor.h"
#include "ScopedFeature.h"
#include "SimulatedDevice.h"
#include "ThrownCode.h"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

using namespace mcm;
using logging::LogLevelError;
using logging::LogLevelWarning;

namespace {

std::vector<ChannelConfig> Configs()
{
   std::vector<ChannelConfig> configs(3);
   configs[0] = ChannelConfig{ 1, StageType::ZFM2020, false };
   configs[1] = ChannelConfig{ 2, StageType::None, false };
   configs[2] = ChannelConfig{ 3, StageType::ZFM2030, false };
   return configs;
}

logging::Logger NewTestLogger(std::shared_ptr<CapturingLogSink> sink)
{
   std::shared_ptr<logging::LoggingCore> core =
      std::make_shared<logging::LoggingCore>();
   core->AddSink(sink);
   return core->NewLogger("MCM3000");
}

struct ExecutorFixture {
   std::shared_ptr<CapturingLogSink> log;
   ChannelTable table;
   SimulatedDevice device;
   ManualClock clock;
   CancellationToken token;
   MotionExecutor executor;
   const ChannelIndex idx;

   ExecutorFixture() :
      log(std::make_shared<CapturingLogSink>()),
      table(Configs(), 5, NewTestLogger(log)),
      executor(table, device, clock, token, NewTestLogger(log), MotionTiming()),
      idx(0)
   {}
};

} // anonymous namespace

TEST_CASE("motion status names", "[MotionExecutor]")
{
   CHECK(std::string(MotionStatusName(MotionSettled)) == "settled");
   CHECK(std::string(MotionStatusName(MotionTimedOut)) == "timed out");
}

TEST_CASE_METHOD(ExecutorFixture, "encoder reads go to the device", "[MotionExecutor]")
{
   device.SetEncoderValue(0, 1234);
   CHECK(executor.GetEncoderValue(idx) == 1234);
   device.SetEncoderValue(0, -5);
   CHECK(executor.GetEncoderValue(idx) == -5);
   CHECK(device.GetQueryCount() == 2);
}

TEST_CASE_METHOD(ExecutorFixture, "commands to a channel without a stage are not sent", "[MotionExecutor]")
{
   const ChannelIndex unused(1);
   CHECK(ThrownCode([&] { executor.GetEncoderValue(unused); }) ==
         MCMERR_ChannelNotConfigured);
   CHECK(ThrownCode([&] { executor.MoveToEncoderValue(unused, 10, true); }) ==
         MCMERR_ChannelNotConfigured);
   CHECK(ThrownCode([&] { executor.SetEncoderToZero(unused); }) ==
         MCMERR_ChannelNotConfigured);
   CHECK(device.GetQueryCount() == 0);
   CHECK(device.GetMoveCommandCount() == 0);
}

TEST_CASE_METHOD(ExecutorFixture, "blocking move polls until the target is reached", "[MotionExecutor]")
{
   device.SetStepPerRead(1000);
   executor.MoveToEncoderValue(idx, 5000, true);

   CHECK(device.GetEncoderValue(0) == 5000);
   CHECK(table.Get(idx).currentEncoder == 5000);
   CHECK_FALSE(table.Get(idx).hasPending);
   REQUIRE(clock.sleeps.size() == 4);
   CHECK(clock.sleeps[0] == std::chrono::milliseconds(100));
}

TEST_CASE_METHOD(ExecutorFixture, "non-blocking move leaves the target pending", "[MotionExecutor]")
{
   device.SetStepPerRead(1000);
   executor.MoveToEncoderValue(idx, 5000, false);
   CHECK(table.Get(idx).hasPending);
   CHECK(table.Get(idx).pendingEncoder == 5000);
   CHECK(clock.sleeps.empty());

   const MotionOutcome outcome = executor.FinishMove(idx);
   CHECK(outcome.status == MotionSettled);
   CHECK(outcome.finalEncoder == 5000);
   CHECK(outcome.positionError == 0);
   CHECK(outcome.positionUm == Catch::Approx(5000 * 0.2116667));
   CHECK_FALSE(table.Get(idx).hasPending);
}

TEST_CASE_METHOD(ExecutorFixture, "a new move finishes the pending one first", "[MotionExecutor]")
{
   device.SetStepPerRead(1000);
   executor.MoveToEncoderValue(idx, 3000, false);
   executor.MoveToEncoderValue(idx, 6000, false);

   CHECK(device.GetMoveCommandCount() == 2);
   CHECK(table.Get(idx).currentEncoder == 3000);
   CHECK(table.Get(idx).pendingEncoder == 6000);
}

TEST_CASE_METHOD(ExecutorFixture, "finishing an idle channel does nothing", "[MotionExecutor]")
{
   device.SetEncoderValue(0, 42);
   table.SetCurrentEncoder(idx, 42);
   const MotionOutcome outcome = executor.FinishMove(idx);
   CHECK(outcome.status == MotionIdle);
   CHECK(outcome.finalEncoder == 42);
   CHECK(device.GetQueryCount() == 0);
}

TEST_CASE_METHOD(ExecutorFixture, "stalled stage times out", "[MotionExecutor]")
{
   device.SetStalled(0, true);
   executor.MoveToEncoderValue(idx, 5000, false);
   const MotionOutcome outcome = executor.FinishMove(idx);

   CHECK(outcome.status == MotionTimedOut);
   CHECK(outcome.finalEncoder == 0);
   CHECK(outcome.positionError == -5000);
   CHECK(clock.Elapsed() > std::chrono::milliseconds(6000));
   CHECK(clock.Elapsed() <= std::chrono::milliseconds(6100));

   CHECK_FALSE(table.Get(idx).hasPending);
   CHECK(table.Get(idx).currentEncoder == 0);
   CHECK(log->Contains(LogLevelWarning, "motion timed out"));
   CHECK(log->Contains(LogLevelError, "position error: -5000 counts"));

   SECTION("the channel accepts commands afterwards")
   {
      device.SetStalled(0, false);
      executor.MoveToEncoderValue(idx, 100, true);
      CHECK(table.Get(idx).currentEncoder == 100);
   }
}

TEST_CASE_METHOD(ExecutorFixture, "blocking move on a stalled stage returns", "[MotionExecutor]")
{
   device.SetStalled(0, true);
   CHECK_NOTHROW(executor.MoveToEncoderValue(idx, 5000, true));
   CHECK_FALSE(table.Get(idx).hasPending);
}

TEST_CASE_METHOD(ExecutorFixture, "strict motion timeout throws", "[MotionExecutor]")
{
   ScopedFeature strict("StrictMotionTimeout", true);
   device.SetStalled(0, true);
   CHECK(ThrownCode([&] { executor.MoveToEncoderValue(idx, 5000, true); }) ==
         MCMERR_MotionTimeout);
   CHECK_FALSE(table.Get(idx).hasPending);
}

TEST_CASE_METHOD(ExecutorFixture, "a one-count settling error is not reported as an error", "[MotionExecutor]")
{
   device.SetSettleOffset(0, 1);
   executor.MoveToEncoderValue(idx, 5000, false);
   const MotionOutcome outcome = executor.FinishMove(idx);
   CHECK(outcome.status == MotionTimedOut);
   CHECK(outcome.positionError == 1);
   CHECK(log->Contains(LogLevelWarning, "motion timed out"));
   CHECK(log->CountAtLevel(LogLevelError) == 0);
}

TEST_CASE_METHOD(ExecutorFixture, "motion wait can be cancelled", "[MotionExecutor]")
{
   device.SetStalled(0, true);
   clock.onSleep = [this] { token.Cancel(); };
   executor.MoveToEncoderValue(idx, 5000, false);
   const MotionOutcome outcome = executor.FinishMove(idx);

   CHECK(outcome.status == MotionCancelled);
   CHECK(clock.sleeps.size() == 1);
   CHECK(outcome.positionError == -5000);
   CHECK_FALSE(table.Get(idx).hasPending);
}

TEST_CASE_METHOD(ExecutorFixture, "a cancelled token ends later waits until reset", "[MotionExecutor]")
{
   device.SetStalled(0, true);
   token.Cancel();

   executor.MoveToEncoderValue(idx, 5000, false);
   CHECK(executor.FinishMove(idx).status == MotionCancelled);
   executor.MoveToEncoderValue(idx, 6000, false);
   CHECK(executor.FinishMove(idx).status == MotionCancelled);
   CHECK(clock.sleeps.empty());

   token.Reset();
   device.SetStalled(0, false);
   device.SetStepPerRead(1000);
   executor.MoveToEncoderValue(idx, 5000, false);
   CHECK(executor.FinishMove(idx).status == MotionSettled);
}

TEST_CASE_METHOD(ExecutorFixture, "custom poll interval and timeout", "[MotionExecutor]")
{
   device.SetStalled(0, true);
   executor.MoveToEncoderValue(idx, 5000, false);
   const MotionOutcome outcome = executor.FinishMove(idx,
         std::chrono::milliseconds(250), std::chrono::milliseconds(1000));
   CHECK(outcome.status == MotionTimedOut);
   CHECK(clock.sleeps.size() == 5);
   CHECK(clock.sleeps.back() == std::chrono::milliseconds(250));
}

TEST_CASE_METHOD(ExecutorFixture, "set encoder to zero", "[MotionExecutor]")
{
   device.SetEncoderValue(0, 777);
   table.SetCurrentEncoder(idx, 777);

   executor.SetEncoderToZero(idx);
   CHECK(device.GetEncoderValue(0) == 0);
   CHECK(table.Get(idx).currentEncoder == 0);
   CHECK(log->Contains(LogLevelWarning, "encoder set to zero"));
}

TEST_CASE_METHOD(ExecutorFixture, "zeroing a stalled stage times out", "[MotionExecutor]")
{
   device.SetEncoderValue(0, 777);
   device.SetStalled(0, true);
   CHECK(ThrownCode([&] { executor.SetEncoderToZero(idx); }) ==
         MCMERR_MotionTimeout);
}

TEST_CASE_METHOD(ExecutorFixture, "stray input after a response is an error", "[MotionExecutor]")
{
   device.SetEncoderValue(0, 10);
   device.InjectNoise({ 0xAA, 0xBB });
   CHECK(ThrownCode([&] { executor.GetEncoderValue(idx); }) ==
         MCMERR_UnexpectedData);

   // drained
   CHECK(device.BytesWaiting() == 0);
   CHECK(executor.GetEncoderValue(idx) == 10);
}

TEST_CASE_METHOD(ExecutorFixture, "stray input after a move frame keeps the new target", "[MotionExecutor]")
{
   device.InjectNoise({ 0xAA });
   CHECK(ThrownCode([&] { executor.MoveToEncoderValue(idx, 472, true); }) ==
         MCMERR_UnexpectedData);

   // the frame went out, so the stage is on its way
   CHECK(device.GetTargetValue(0) == 472);
   CHECK(table.Get(idx).hasPending);
   CHECK(table.Get(idx).pendingEncoder == 472);
   CHECK(device.BytesWaiting() == 0);

   CHECK(executor.FinishMove(idx).status == MotionSettled);
   CHECK(table.Get(idx).currentEncoder == 472);
}

TEST_CASE("frames on the wire", "[MotionExecutor]")
{
   auto log = std::make_shared<CapturingLogSink>();
   ChannelTable table(Configs(), 5, NewTestLogger(log));
   MockTransport transport;
   ManualClock clock;
   CancellationToken token;
   MotionExecutor executor(table, transport, clock, token,
         NewTestLogger(log), MotionTiming());
   const ChannelIndex idx(2);

   SECTION("move then poll")
   {
      transport.AnswerQueriesWith(-1);
      executor.MoveToEncoderValue(idx, -1, true);
      REQUIRE(transport.writes.size() == 2);
      CHECK(transport.writes[0] == codec::EncodeMoveTo(idx, -1));
      CHECK(transport.writes[1] == codec::EncodeGetPosition(idx));
   }

   SECTION("response for the wrong channel")
   {
      transport.onWrite = [&transport](const std::vector<unsigned char>&) {
         transport.QueueInput(MockTransport::PositionResponse(0, 5));
      };
      CHECK(ThrownCode([&] { executor.GetEncoderValue(idx); }) ==
            MCMERR_ChannelMismatch);
   }

   SECTION("no response")
   {
      CHECK(ThrownCode([&] { executor.GetEncoderValue(idx); }) ==
            MCMERR_SerialTimeout);
   }

   SECTION("unsolicited bytes after a move command")
   {
      transport.QueueInput({ 0x01 });
      CHECK(ThrownCode([&] { executor.MoveToEncoderValue(idx, 10, false); }) ==
            MCMERR_UnexpectedData);
      CHECK(transport.input.empty());
   }
}
