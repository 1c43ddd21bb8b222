///////////////////////////////////////////////////////////////////////////////
// FILE:          MCMDeviceConstants.h
// PROJECT:       MCMControl
// SUBSYSTEM:     MCMDevice - Device kit
//-----------------------------------------------------------------------------
// DESCRIPTION:   Global constants shared by the device interfaces and the core
//
// LICENSE:       This file is distributed under the BSD license.
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

#define DEVICE_OK   0
#define DEVICE_ERR  1 // generic, undefined error

namespace mcm {

   // Number of motor channels on the controller
   const unsigned ChannelCount = 3;

   const unsigned long DefaultBaudRate = 460800;

   // Metadata keywords
   const char* const g_Keyword_Name = "Name";
   const char* const g_Keyword_Description = "Description";
   const char* const g_Keyword_Port = "Port";
   const char* const g_Keyword_Simulated = "Simulated";
   const char* const g_Keyword_Channel = "Channel";
   const char* const g_Keyword_Channels = "Channels";
   const char* const g_Keyword_StageType = "StageType";
   const char* const g_Keyword_Reverse = "Reverse";
   const char* const g_Keyword_Unit = "Unit";
   const char* const g_Keyword_Position = "PositionUm";
   const char* const g_Keyword_LowerLimit = "LowerLimitUm";
   const char* const g_Keyword_UpperLimit = "UpperLimitUm";
   const char* const g_Keyword_LowestScanPoint = "LowestScanPointUm";
   const char* const g_Keyword_HighestScanPoint = "HighestScanPointUm";
   const char* const g_Keyword_RetractPoint = "RetractPointUm";
   const char* const g_Keyword_Conversion = "ConversionUmPerCount";
   const char* const g_Keyword_MinEncoderMotion = "MinEncoderMotion";
   const char* const g_Keyword_CurrentEncoder = "CurrentEncoderValue";
   const char* const g_Keyword_PendingEncoder = "PendingEncoderValue";
   const char* const g_Keyword_SensorWidth = "SensorWidthUm";
   const char* const g_Keyword_SensorHeight = "SensorHeightUm";

   // Placeholder used for absent values (unconfigured stage, idle channel)
   const char* const g_Value_None = "None";

} // namespace mcm
