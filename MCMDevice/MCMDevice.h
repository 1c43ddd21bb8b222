///////////////////////////////////////////////////////////////////////////////
// FILE:          MCMDevice.h
// PROJECT:       MCMControl
// SUBSYSTEM:     MCMDevice - Device kit
//-----------------------------------------------------------------------------
// DESCRIPTION:   The narrow interfaces through which instrument devices are
//                consumed by orchestration code. Stages are implemented in
//                this project; cameras and spectrometers are external
//                collaborators that only need to honour these interfaces.
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

// N.B.
//
// Device methods report failure through their int return value (DEVICE_OK on
// success, otherwise an error code). They must not let exceptions escape.

#include "MCMDeviceConstants.h"
#include "DeviceMetadata.h"

#include <string>

namespace mcm {

   enum DeviceType {
      UnknownType = 0,
      StageDevice,
      CameraDevice,
      SpectrometerDevice
   };

   /**
    * Generic device interface.
    */
   class Device {
   public:
      Device() {}
      virtual ~Device() {}

      virtual DeviceType GetType() const = 0;
      virtual void GetName(std::string& name) const = 0;

      /**
       * Describes the device (identity, configuration and, where cheap to
       * obtain, current state).
       */
      virtual int GetMetadata(DeviceMetadata& metadata) = 0;
   };

   /**
    * Single-axis (focus) stage API.
    */
   class Stage : public Device
   {
   public:
      Stage() {}
      virtual ~Stage() {}

      virtual DeviceType GetType() const { return StageDevice; }

      /**
       * Moves the stage, blocking until the motion finishes.
       *
       * @param pos target in micrometres (absolute or relative)
       * @param relative whether pos is an offset from the current position
       * @param targetUm receives the position actually commanded, which is
       *        pos rounded to a whole encoder count. Untouched when no motion
       *        was required.
       */
      virtual int MoveUm(double pos, bool relative, double& targetUm) = 0;
      virtual int GetPositionUm(double& pos) = 0;
      virtual int Home() = 0;

      /**
       * Moves to the retract point, the position from which lateral (XY)
       * motion can proceed without collision.
       */
      virtual int Retract() = 0;
      virtual int GetLimitsUm(double& lower, double& upper) = 0;
   };

   /**
    * Camera API as consumed by orchestration code.
    */
   class Camera : public Device
   {
   public:
      Camera() {}
      virtual ~Camera() {}

      virtual DeviceType GetType() const { return CameraDevice; }

      virtual int GetSensorSizeUm(double& width, double& height) = 0;
   };

   /**
    * Spectrometer API as consumed by orchestration code.
    */
   class Spectrometer : public Device
   {
   public:
      Spectrometer() {}
      virtual ~Spectrometer() {}

      virtual DeviceType GetType() const { return SpectrometerDevice; }

      virtual int GetSensorSizeUm(double& width, double& height) = 0;
   };

} // namespace mcm
