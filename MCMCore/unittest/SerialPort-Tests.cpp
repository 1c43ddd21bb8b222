#include <catch2/catch_all.hpp>

#include "SerialPort.h"
#include "StageController.h"
#include "ThrownCode.h"

using namespace mcm;

TEST_CASE("opening a missing serial port fails", "[SerialPort]")
{
   CHECK(ThrownCode([] { SerialPort port("/dev/no-such-mcm-port", DefaultBaudRate, 100); }) ==
         MCMERR_SerialOpenFailed);
}

TEST_CASE("controller on a missing serial port fails", "[SerialPort]")
{
   ControllerSettings settings;
   settings.port = "/dev/no-such-mcm-port";
   settings.stages[0] = "ZFM2020";
   CHECK(ThrownCode([&] { StageController controller(settings); }) ==
         MCMERR_SerialOpenFailed);
}
