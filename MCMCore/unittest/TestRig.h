#pragma once

#include "CapturingLogSink.h"
#include "LogManager.h"
#include "ManualClock.h"
#include "SimulatedDevice.h"
#include "StageController.h"

#include <memory>
#include <string>

// A StageController on a simulated device with a manual clock and a
// capturing log sink.
struct TestRig {
   mcm::SimulatedDevice* device;
   std::shared_ptr<ManualClock> clock;
   std::shared_ptr<mcm::LogManager> logManager;
   std::shared_ptr<CapturingLogSink> log;
   std::unique_ptr<mcm::StageController> controller;

   static mcm::ControllerSettings Settings(const std::string& stage1 = "ZFM2020",
         const std::string& stage2 = "", const std::string& stage3 = "") {
      mcm::ControllerSettings settings;
      settings.port = "SIM";
      settings.simulated = true;
      settings.stages[0] = stage1;
      settings.stages[1] = stage2;
      settings.stages[2] = stage3;
      return settings;
   }

   explicit TestRig(const mcm::ControllerSettings& settings = Settings(),
         long initialEncoder = 0) :
      device(new mcm::SimulatedDevice()),
      clock(std::make_shared<ManualClock>()),
      logManager(std::make_shared<mcm::LogManager>()),
      log(std::make_shared<CapturingLogSink>())
   {
      for (unsigned i = 0; i < mcm::ChannelCount; ++i)
         device->SetEncoderValue(i, initialEncoder);
      logManager->AddSink(log);
      std::unique_ptr<mcm::Transport> transport(device);
      controller.reset(new mcm::StageController(settings,
               std::move(transport), clock, logManager));
   }
};
