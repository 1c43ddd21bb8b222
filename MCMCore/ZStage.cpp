///////////////////////////////////////////////////////////////////////////////
// FILE:          ZStage.cpp
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

#include "ZStage.h"

#include "../MCMDevice/DeviceUtils.h"
#include "CoreUtils.h"

namespace mcm {

ZStage::ZStage(StageController& controller, int channel,
      const std::string& name) :
   controller_(controller),
   channel_(channel),
   name_(name),
   logger_(controller.getLogManager()->NewLogger(name))
{
   // Rejects unknown labels and unconfigured channels up front
   controller_.getConversionUmPerCount(channel_);
}


int
ZStage::ErrorCode(const CMCMError& e)
{
   lastErrorText_ = e.getFullMsg();
   LOG_ERROR(logger_) << lastErrorText_;
   return e.getCode() == MCMERR_OK ? DEVICE_ERR : e.getCode();
}


void
ZStage::GetName(std::string& name) const
{
   name = name_;
}


int
ZStage::GetMetadata(DeviceMetadata& metadata)
{
   try
   {
      metadata.AddTag(g_Keyword_Name, name_.c_str());
      metadata.AddTag(g_Keyword_Description,
            (controller_.getName() + " channel " + ToString(channel_)).c_str());
      metadata.AddTag(g_Keyword_Unit, "um");
      metadata.Merge(controller_.getChannelInfo(channel_), "");
      metadata.AddTag(g_Keyword_Position, controller_.getPositionUm(channel_));
      return DEVICE_OK;
   }
   catch (const CMCMError& e)
   {
      return ErrorCode(e);
   }
}


int
ZStage::MoveUm(double pos, bool relative, double& targetUm)
{
   try
   {
      controller_.moveUm(channel_, pos, relative, true, targetUm);
      return DEVICE_OK;
   }
   catch (const CMCMError& e)
   {
      return ErrorCode(e);
   }
}


int
ZStage::GetPositionUm(double& pos)
{
   try
   {
      pos = controller_.getPositionUm(channel_);
      return DEVICE_OK;
   }
   catch (const CMCMError& e)
   {
      return ErrorCode(e);
   }
}


int
ZStage::Home()
{
   try
   {
      controller_.moveZero(channel_, true);
      return DEVICE_OK;
   }
   catch (const CMCMError& e)
   {
      return ErrorCode(e);
   }
}


int
ZStage::Retract()
{
   try
   {
      controller_.retract(channel_);
      return DEVICE_OK;
   }
   catch (const CMCMError& e)
   {
      return ErrorCode(e);
   }
}


int
ZStage::GetLimitsUm(double& lower, double& upper)
{
   try
   {
      lower = controller_.getLowestScanPointUm(channel_);
      upper = controller_.getHighestScanPointUm(channel_);
      return DEVICE_OK;
   }
   catch (const CMCMError& e)
   {
      return ErrorCode(e);
   }
}


int
ZStage::SetRetractUm(double pos, bool relative)
{
   try
   {
      controller_.setRetractPointUm(channel_, pos, relative);
      return DEVICE_OK;
   }
   catch (const CMCMError& e)
   {
      return ErrorCode(e);
   }
}


double
ZStage::UmPerUnit(const std::string& unit)
{
   const std::string u = CDeviceUtils::ToLower(unit);
   if (u == "um")
      return 1.0;
   if (u == "mm")
      return 1e3;
   if (u == "cm")
      return 1e4;
   if (u == "m")
      return 1e6;
   if (u == "nm")
      return 1e-3;
   if (u == "pm")
      return 1e-6;
   throw CMCMError("Unit " + ToQuotedString(unit) + " not supported",
         MCMERR_UnsupportedUnit);
}


bool
ZStage::Move(double value, bool relative, const std::string& unit)
{
   const double um = value * UmPerUnit(unit);
   return controller_.moveUm(channel_, um, relative, true);
}


double
ZStage::GetPosition(const std::string& unit)
{
   const double factor = UmPerUnit(unit);
   return controller_.getPositionUm(channel_) / factor;
}


void
ZStage::SetVelocity(double value)
{
   LOG_WARNING(logger_) << "Velocity cannot be changed on " <<
      controller_.getName() << " (requested " << value << ")";
}


void
ZStage::SetAcceleration(double value)
{
   LOG_WARNING(logger_) << "Acceleration cannot be changed on " <<
      controller_.getName() << " (requested " << value << ")";
}

} // namespace mcm
