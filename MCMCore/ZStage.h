///////////////////////////////////////////////////////////////////////////////
// FILE:          ZStage.h
// PROJECT:       MCMControl
// SUBSYSTEM:     MCMCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Focus stage device on one StageController channel
//
// LICENSE:       This file is distributed under the "Lesser GPL" (LGPL) license.
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

#include "../MCMDevice/MCMDevice.h"
#include "Logging/Logger.h"
#include "StageController.h"

#include <string>

namespace mcm {

/**
 * Exposes one channel of a StageController as an mcm::Stage.
 *
 * The controller must outlive the stage. The Stage interface methods
 * return DEVICE_OK or the MCMERR_* code of the failure; the unit-aware
 * methods (Move, GetPosition) throw CMCMError.
 */
class ZStage : public Stage
{
public:
   ZStage(StageController& controller, int channel,
         const std::string& name = "ZStage");

   // Device
   virtual void GetName(std::string& name) const;
   virtual int GetMetadata(DeviceMetadata& metadata);

   // Stage
   virtual int MoveUm(double pos, bool relative, double& targetUm);
   virtual int GetPositionUm(double& pos);
   virtual int Home();
   virtual int Retract();
   virtual int GetLimitsUm(double& lower, double& upper);

   int SetRetractUm(double pos, bool relative);

   // Units: um, mm, cm, m, nm, pm (MCMERR_UnsupportedUnit otherwise)
   bool Move(double value, bool relative, const std::string& unit);
   double GetPosition(const std::string& unit);
   static double UmPerUnit(const std::string& unit);

   // The controller runs fixed velocity and acceleration profiles.
   void SetVelocity(double value);
   void SetAcceleration(double value);

   int GetChannel() const { return channel_; }

   // Message of the last error returned as a code
   std::string GetLastErrorText() const { return lastErrorText_; }

private:
   int ErrorCode(const CMCMError& e);

   StageController& controller_;
   int channel_;
   std::string name_;
   logging::Logger logger_;
   std::string lastErrorText_;
};

} // namespace mcm
