///////////////////////////////////////////////////////////////////////////////
// FILE:          StageController.h
// PROJECT:       MCMControl
// SUBSYSTEM:     MCMCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Multi-channel MCM3000 motor controller
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

#include "../MCMDevice/DeviceMetadata.h"
#include "ChannelTable.h"
#include "Clock.h"
#include "Error.h"
#include "LogManager.h"
#include "MotionExecutor.h"
#include "MotionLimiter.h"
#include "StageCatalog.h"
#include "Transport.h"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace mcm {

/// Construction parameters of a StageController.
struct ControllerSettings {
   ControllerSettings();

   std::string port;
   std::string name;
   std::vector<std::string> stages; // one per channel; empty means no stage
   std::vector<bool> reverse;
   std::vector<int> channels;       // labels used by callers
   bool simulated;
   long pollIntervalMs;
   long motionTimeoutMs;
   long readTimeoutMs;
   long minEncoderMotion;
};


/// Controller for a Thorlabs MCM3000 three-channel motor controller.
/**
 * Converts between micrometres and encoder counts, keeps each channel within
 * its scan limits, and drives the serial protocol. Channels are addressed by
 * their labels (ControllerSettings::channels).
 *
 * All public member functions may be called from any thread; calls are
 * serialized. Errors are thrown as CMCMError. A motion that does not settle
 * in time is logged and the channel made idle again; it becomes an error
 * only with the StrictMotionTimeout core feature enabled.
 */
class StageController
{
public:
   /// Opens the serial port (460800 baud) or, if settings.simulated, an
   /// in-process simulated device.
   explicit StageController(const ControllerSettings& settings);

   /// Uses the given transport, clock and log manager.
   StageController(const ControllerSettings& settings,
         std::unique_ptr<Transport> transport,
         std::shared_ptr<Clock> clock,
         std::shared_ptr<LogManager> logManager);

   ~StageController();

   /** \name Motion. */
   ///@{
   /// Moves a channel.
   /**
    * @param targetUm receives the legalized target (the request rounded to
    *        a whole encoder count); unchanged when no motion was needed
    * @return false if the channel is already at, or already moving to, the
    *         requested position
    */
   bool moveUm(int channel, double um, bool relative, bool block,
         double& targetUm);
   bool moveUm(int channel, double um, bool relative = true,
         bool block = true);
   bool moveZero(int channel, bool block = true);
   /// Blocking absolute move to the channel's retract point.
   void retract(int channel);
   MotionOutcome finishMove(int channel);
   /// Interrupts the motion wait in progress and any further wait of the
   /// same call (a deadband excursion is followed by the main move). Does
   /// not take the call lock. A cancellation made while no call is running
   /// is discarded when the next call starts.
   void cancelMotionWait();
   ///@}

   /** \name Position and limits. */
   ///@{
   /// Reads the encoder (never a cached value).
   double getPositionUm(int channel);
   /// Sets a scan limit at the current position.
   double setStageLimitUm(int channel, bool lower);
   double setStageLimitUm(int channel, double um, bool lower);
   /// Sets the retract point at the current position.
   double setRetractPointUm(int channel);
   double setRetractPointUm(int channel, double um, bool relative = false);
   /// Declares the current position encoder zero. Limits must be set again
   /// afterwards unless the stage sits at the centre of its travel.
   void setEncoderToZero(int channel);
   ///@}

   /** \name Connection. */
   ///@{
   /// Releases the port. Further commands fail with MCMERR_ConnectionClosed.
   void close();
   bool isClosed() const;
   bool isSimulated() const;
   std::string getName() const;
   ///@}

   /** \name Configuration and state. */
   ///@{
   std::vector<int> getChannels() const;
   StageType getStageType(int channel) const;
   bool getReverse(int channel) const;
   double getStageLowerLimitUm(int channel) const;
   double getStageUpperLimitUm(int channel) const;
   double getLowestScanPointUm(int channel) const;
   double getHighestScanPointUm(int channel) const;
   double getRetractPointUm(int channel) const;
   double getConversionUmPerCount(int channel) const;
   long getMinEncoderMotion(int channel) const;
   long getCurrentEncoderValue(int channel) const;
   /// @return false if the channel is idle
   bool getPendingEncoderValue(int channel, long& value) const;
   DeviceMetadata getInfo() const;
   DeviceMetadata getChannelInfo(int channel) const;
   std::shared_ptr<LogManager> getLogManager() const { return logManager_; }
   ///@}

private:
   StageController(const StageController&);
   StageController& operator=(const StageController&);

   void EnsureOpen() const;
   // Start of a call that may wait for motion; clears stale cancellations
   void BeginMotionCall();
   ChannelIndex IndexFor(int channel) const;
   const Channel& ConfiguredChannel(int channel) const;

   bool MoveUmImpl(ChannelIndex index, double um, bool relative, bool block,
         double& targetUm);
   double GetPositionUmImpl(ChannelIndex index);
   DeviceMetadata ChannelInfoImpl(ChannelIndex index) const;

   ControllerSettings settings_;
   std::shared_ptr<LogManager> logManager_;
   logging::Logger logger_;
   std::shared_ptr<Clock> clock_;
   std::unique_ptr<Transport> transport_;
   ChannelTable table_;
   MotionLimiter limiter_;
   CancellationToken cancelToken_;
   MotionExecutor executor_;
   bool closed_;
   mutable std::mutex mutex_;
};

} // namespace mcm
