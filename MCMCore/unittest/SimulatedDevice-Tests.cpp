#include <catch2/catch_all.hpp>

#include "CommandCodec.h"
#include "SimulatedDevice.h"
#include "ThrownCode.h"

#include <vector>

using namespace mcm;

typedef std::vector<unsigned char> Bytes;

TEST_CASE("simulated position response", "[SimulatedDevice]")
{
   SimulatedDevice device;
   device.SetEncoderValue(2, -2);
   device.Write(codec::EncodeGetPosition(ChannelIndex(2)));
   REQUIRE(device.BytesWaiting() == 12);
   const Bytes response = device.Read(12);
   CHECK(response == Bytes{ 0x0B, 0x04, 0x06, 0x00, 0x00, 0x00,
         0x02, 0x00, 0xFE, 0xFF, 0xFF, 0xFF });
   CHECK(codec::DecodePositionResponse(response, ChannelIndex(2)) == -2);
   CHECK(device.GetQueryCount() == 1);
}

TEST_CASE("simulated motion advances on each query", "[SimulatedDevice]")
{
   SimulatedDevice device;
   device.SetStepPerRead(40);
   device.Write(codec::EncodeMoveTo(ChannelIndex(0), -100));
   CHECK(device.BytesWaiting() == 0);
   CHECK(device.GetTargetValue(0) == -100);
   CHECK(device.GetEncoderValue(0) == 0);

   const long expected[] = { -40, -80, -100, -100 };
   for (long e : expected)
   {
      device.Write(codec::EncodeGetPosition(ChannelIndex(0)));
      CHECK(codec::DecodePositionResponse(device.Read(12), ChannelIndex(0)) == e);
   }
}

TEST_CASE("simulated zeroing", "[SimulatedDevice]")
{
   SimulatedDevice device;
   device.SetEncoderValue(1, 5000);
   device.Write(codec::EncodeZero(ChannelIndex(1)));
   CHECK(device.GetEncoderValue(1) == 0);

   device.SetEncoderValue(1, 5000);
   device.SetStalled(1, true);
   device.Write(codec::EncodeZero(ChannelIndex(1)));
   CHECK(device.GetEncoderValue(1) == 5000);
}

TEST_CASE("simulated device errors", "[SimulatedDevice]")
{
   SimulatedDevice device;

   CHECK(ThrownCode([&] { device.Write(Bytes{ 0x01, 0x02 }); }) == MCMERR_SerialIOFailed);
   CHECK(ThrownCode([&] { device.Read(1); }) == MCMERR_SerialTimeout);

   device.InjectNoise(Bytes{ 0x55 });
   device.Write(codec::EncodeMoveTo(ChannelIndex(0), 1));
   CHECK(device.BytesWaiting() == 1);

   device.Close();
   CHECK_FALSE(device.IsOpen());
   CHECK(ThrownCode([&] { device.Write(codec::EncodeGetPosition(ChannelIndex(0))); }) ==
         MCMERR_ConnectionClosed);
   CHECK(ThrownCode([&] { device.BytesWaiting(); }) == MCMERR_ConnectionClosed);
}
