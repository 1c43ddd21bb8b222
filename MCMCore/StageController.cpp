///////////////////////////////////////////////////////////////////////////////
// FILE:          StageController.cpp
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

#include "StageController.h"

#include "../MCMDevice/MCMDeviceConstants.h"
#include "CoreUtils.h"
#include "SerialPort.h"
#include "SimulatedDevice.h"
#include "UnitConverter.h"

#include <chrono>
#include <sstream>
#include <utility>

namespace mcm {

namespace {

std::vector<ChannelConfig>
ValidatedChannelConfigs(const ControllerSettings& settings)
{
   if (settings.stages.size() != ChannelCount ||
         settings.reverse.size() != ChannelCount ||
         settings.channels.size() != ChannelCount)
      throw CMCMError("Stages, reverse flags and channel labels must each " +
            std::string("have ") + ToString(ChannelCount) + " entries",
            MCMERR_InvalidConfiguration);
   if (settings.pollIntervalMs < 0 || settings.motionTimeoutMs < 0 ||
         settings.readTimeoutMs <= 0)
      throw CMCMError("Invalid poll interval or timeout",
            MCMERR_InvalidConfiguration);

   std::vector<ChannelConfig> configs;
   for (unsigned i = 0; i < ChannelCount; ++i)
   {
      ChannelConfig config;
      config.label = settings.channels[i];
      config.stageType = StageTypeFromName(settings.stages[i]);
      config.reverse = settings.reverse[i];
      configs.push_back(config);
   }
   return configs;
}


std::unique_ptr<Transport>
CreateTransport(const ControllerSettings& settings)
{
   ValidatedChannelConfigs(settings);
   if (settings.simulated)
      return std::unique_ptr<Transport>(new SimulatedDevice());
   return std::unique_ptr<Transport>(new SerialPort(settings.port,
            DefaultBaudRate, settings.readTimeoutMs));
}


std::shared_ptr<LogManager>
CreateDefaultLogManager()
{
   std::shared_ptr<LogManager> logManager = std::make_shared<LogManager>();
   logManager->SetUseStdErr(true);
   return logManager;
}


Transport&
RequireTransport(const std::unique_ptr<Transport>& transport)
{
   if (!transport)
      throw CMCMError("No transport given", MCMERR_InvalidConfiguration);
   return *transport;
}


MotionTiming
TimingFrom(const ControllerSettings& settings)
{
   MotionTiming timing;
   timing.pollInterval = std::chrono::milliseconds(settings.pollIntervalMs);
   timing.timeout = std::chrono::milliseconds(settings.motionTimeoutMs);
   return timing;
}


std::string
JoinLabels(const std::vector<int>& labels)
{
   std::ostringstream os;
   for (std::size_t i = 0; i < labels.size(); ++i)
   {
      if (i > 0)
         os << ',';
      os << labels[i];
   }
   return os.str();
}

} // anonymous namespace


ControllerSettings::ControllerSettings() :
   name("MCM3000"),
   stages(ChannelCount),
   reverse(ChannelCount, false),
   simulated(false),
   pollIntervalMs(100),
   motionTimeoutMs(6000),
   readTimeoutMs(1000),
   minEncoderMotion(5)
{
   for (unsigned i = 0; i < ChannelCount; ++i)
      channels.push_back(static_cast<int>(i) + 1);
}


StageController::StageController(const ControllerSettings& settings) :
   StageController(settings, CreateTransport(settings),
         std::make_shared<SystemClock>(), CreateDefaultLogManager())
{
}


StageController::StageController(const ControllerSettings& settings,
      std::unique_ptr<Transport> transport,
      std::shared_ptr<Clock> clock,
      std::shared_ptr<LogManager> logManager) :
   settings_(settings),
   logManager_(logManager ? logManager : CreateDefaultLogManager()),
   logger_(logManager_->NewLogger(settings.name)),
   clock_(clock ? clock : std::make_shared<SystemClock>()),
   transport_(std::move(transport)),
   table_(ValidatedChannelConfigs(settings), settings.minEncoderMotion,
         logger_),
   limiter_(table_),
   executor_(table_, RequireTransport(transport_), *clock_, cancelToken_,
         logger_, TimingFrom(settings)),
   closed_(false)
{
   LOG_INFO(logger_) << "Opened " << transport_->Describe();

   for (unsigned i = 0; i < table_.Size(); ++i)
   {
      const ChannelIndex index(i);
      if (!table_.Get(index).IsConfigured())
         continue;
      try
      {
         table_.SetCurrentEncoder(index, executor_.GetEncoderValue(index));
      }
      catch (const CMCMError& e)
      {
         throw CMCMError("Cannot read the initial position of channel " +
               ToString(table_.Get(index).label), e.getCode(), e);
      }
   }

   LOG_DEBUG(logger_) << "Configuration:\n" << getInfo().Serialize();
}


StageController::~StageController()
{
   try
   {
      close();
   }
   catch (const CMCMError& e)
   {
      LOG_ERROR(logger_) << "Error while closing: " << e.getFullMsg();
   }
}


void
StageController::EnsureOpen() const
{
   if (closed_)
      throw CMCMError(settings_.name + " is closed", MCMERR_ConnectionClosed);
}


void
StageController::BeginMotionCall()
{
   cancelToken_.Reset();
}


ChannelIndex
StageController::IndexFor(int channel) const
{
   return table_.IndexForLabel(channel);
}


const Channel&
StageController::ConfiguredChannel(int channel) const
{
   return table_.RequireConfigured(IndexFor(channel));
}


bool
StageController::MoveUmImpl(ChannelIndex index, double um, bool relative,
      bool block, double& targetUm)
{
   EnsureOpen();
   const Channel& ch = table_.RequireConfigured(index);

   const MotionPlan plan = limiter_.LegalizeMove(index, um, relative);
   if (!plan.motionRequired)
   {
      if (ch.hasPending)
         LOG_INFO(logger_) << "ch" << ch.label << " -> motion already in progress";
      else
         LOG_INFO(logger_) << "ch" << ch.label << " -> already at position";
      return false;
   }

   LOG_DEBUG(logger_) << "ch" << ch.label << " -> legalized move_um = " <<
      plan.targetUm << " (" << um << " requested, relative=" <<
      (relative ? "true" : "false") << ")";

   if (plan.deadbandBump)
   {
      long excursion = 0;
      if (limiter_.FindExcursion(index, plan.targetEncoder, excursion))
      {
         LOG_DEBUG(logger_) << "ch" << ch.label << " -> target within " <<
            ch.minMotionCounts << " counts; moving to encoder value " <<
            excursion << " first";
         executor_.MoveToEncoderValue(index, excursion, true);
      }
      else
      {
         LOG_WARNING(logger_) << "ch" << ch.label << " -> no room for a " <<
            "deadband excursion within the scan range " <<
            ToRangeString(ch.scanLowestUm, ch.scanHighestUm) <<
            "; moving directly";
      }
   }

   LOG_INFO(logger_) << "ch" << ch.label << " -> moving to position_um = " <<
      plan.targetUm;
   executor_.MoveToEncoderValue(index, plan.targetEncoder, block);
   targetUm = plan.targetUm;
   return true;
}


bool
StageController::moveUm(int channel, double um, bool relative, bool block,
      double& targetUm)
{
   std::lock_guard<std::mutex> lock(mutex_);
   BeginMotionCall();
   return MoveUmImpl(IndexFor(channel), um, relative, block, targetUm);
}


bool
StageController::moveUm(int channel, double um, bool relative, bool block)
{
   double targetUm = 0.0;
   return moveUm(channel, um, relative, block, targetUm);
}


bool
StageController::moveZero(int channel, bool block)
{
   std::lock_guard<std::mutex> lock(mutex_);
   BeginMotionCall();
   const ChannelIndex index = IndexFor(channel);
   LOG_DEBUG(logger_) << "ch" << channel << " -> moving to zero";
   double targetUm = 0.0;
   return MoveUmImpl(index, 0.0, false, block, targetUm);
}


void
StageController::retract(int channel)
{
   std::lock_guard<std::mutex> lock(mutex_);
   BeginMotionCall();
   const ChannelIndex index = IndexFor(channel);
   const double retractUm = table_.RequireConfigured(index).retractUm;
   LOG_DEBUG(logger_) << "ch" << channel << " -> moving to retract position " <<
      retractUm << " um";
   double targetUm = 0.0;
   MoveUmImpl(index, retractUm, false, true, targetUm);
}


MotionOutcome
StageController::finishMove(int channel)
{
   std::lock_guard<std::mutex> lock(mutex_);
   EnsureOpen();
   BeginMotionCall();
   return executor_.FinishMove(IndexFor(channel));
}


void
StageController::cancelMotionWait()
{
   cancelToken_.Cancel();
}


double
StageController::GetPositionUmImpl(ChannelIndex index)
{
   EnsureOpen();
   const Channel& ch = table_.RequireConfigured(index);
   return UmFromEncoder(ch, executor_.GetEncoderValue(index));
}


double
StageController::getPositionUm(int channel)
{
   std::lock_guard<std::mutex> lock(mutex_);
   return GetPositionUmImpl(IndexFor(channel));
}


double
StageController::setStageLimitUm(int channel, bool lower)
{
   std::lock_guard<std::mutex> lock(mutex_);
   const ChannelIndex index = IndexFor(channel);
   const double um = GetPositionUmImpl(index);
   table_.SetScanLimit(index, um, lower);
   LOG_INFO(logger_) << "ch" << channel << " -> stage " <<
      (lower ? "lowest" : "highest") << " scan point set to: " << um << " um";
   return um;
}


double
StageController::setStageLimitUm(int channel, double um, bool lower)
{
   std::lock_guard<std::mutex> lock(mutex_);
   const ChannelIndex index = IndexFor(channel);
   table_.SetScanLimit(index, um, lower);
   LOG_INFO(logger_) << "ch" << channel << " -> stage " <<
      (lower ? "lowest" : "highest") << " scan point set to: " << um << " um";
   return um;
}


double
StageController::setRetractPointUm(int channel)
{
   std::lock_guard<std::mutex> lock(mutex_);
   const ChannelIndex index = IndexFor(channel);
   const double um = GetPositionUmImpl(index);
   table_.SetRetractPoint(index, um);
   LOG_INFO(logger_) << "ch" << channel << " -> stage retract point set to: " <<
      um << " um";
   return um;
}


double
StageController::setRetractPointUm(int channel, double um, bool relative)
{
   std::lock_guard<std::mutex> lock(mutex_);
   const ChannelIndex index = IndexFor(channel);
   const double target = relative ? um + GetPositionUmImpl(index) : um;
   table_.SetRetractPoint(index, target);
   LOG_INFO(logger_) << "ch" << channel << " -> stage retract point set to: " <<
      target << " um";
   return target;
}


void
StageController::setEncoderToZero(int channel)
{
   std::lock_guard<std::mutex> lock(mutex_);
   BeginMotionCall();
   EnsureOpen();
   executor_.SetEncoderToZero(IndexFor(channel));
}


void
StageController::close()
{
   std::lock_guard<std::mutex> lock(mutex_);
   if (closed_)
      return;
   closed_ = true;
   transport_->Close();
   LOG_INFO(logger_) << settings_.name << " closed";
}


bool
StageController::isClosed() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return closed_;
}


bool
StageController::isSimulated() const
{
   return settings_.simulated;
}


std::string
StageController::getName() const
{
   return settings_.name;
}


std::vector<int>
StageController::getChannels() const
{
   return table_.GetLabels();
}


StageType
StageController::getStageType(int channel) const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return table_.Get(IndexFor(channel)).stageType;
}


bool
StageController::getReverse(int channel) const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return table_.Get(IndexFor(channel)).reverse;
}


double
StageController::getStageLowerLimitUm(int channel) const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return ConfiguredChannel(channel).hardLowerUm;
}


double
StageController::getStageUpperLimitUm(int channel) const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return ConfiguredChannel(channel).hardUpperUm;
}


double
StageController::getLowestScanPointUm(int channel) const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return ConfiguredChannel(channel).scanLowestUm;
}


double
StageController::getHighestScanPointUm(int channel) const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return ConfiguredChannel(channel).scanHighestUm;
}


double
StageController::getRetractPointUm(int channel) const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return ConfiguredChannel(channel).retractUm;
}


double
StageController::getConversionUmPerCount(int channel) const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return ConfiguredChannel(channel).conversionUmPerCount;
}


long
StageController::getMinEncoderMotion(int channel) const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return ConfiguredChannel(channel).minMotionCounts;
}


long
StageController::getCurrentEncoderValue(int channel) const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return ConfiguredChannel(channel).currentEncoder;
}


bool
StageController::getPendingEncoderValue(int channel, long& value) const
{
   std::lock_guard<std::mutex> lock(mutex_);
   const Channel& ch = ConfiguredChannel(channel);
   if (!ch.hasPending)
      return false;
   value = ch.pendingEncoder;
   return true;
}


DeviceMetadata
StageController::ChannelInfoImpl(ChannelIndex index) const
{
   const Channel& ch = table_.Get(index);
   DeviceMetadata md;
   md.AddTag(g_Keyword_Channel, ch.label);
   md.AddTag(g_Keyword_StageType, StageTypeName(ch.stageType));
   md.AddTag(g_Keyword_Reverse, ch.reverse);
   if (!ch.IsConfigured())
      return md;

   md.AddTag(g_Keyword_LowerLimit, ch.hardLowerUm);
   md.AddTag(g_Keyword_UpperLimit, ch.hardUpperUm);
   md.AddTag(g_Keyword_LowestScanPoint, ch.scanLowestUm);
   md.AddTag(g_Keyword_HighestScanPoint, ch.scanHighestUm);
   md.AddTag(g_Keyword_RetractPoint, ch.retractUm);
   md.AddTag(g_Keyword_Conversion, ch.conversionUmPerCount);
   md.AddTag(g_Keyword_MinEncoderMotion, ch.minMotionCounts);
   md.AddTag(g_Keyword_CurrentEncoder, ch.currentEncoder);
   if (ch.hasPending)
      md.AddTag(g_Keyword_PendingEncoder, ch.pendingEncoder);
   else
      md.AddTag(g_Keyword_PendingEncoder, g_Value_None);
   return md;
}


DeviceMetadata
StageController::getChannelInfo(int channel) const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return ChannelInfoImpl(IndexFor(channel));
}


DeviceMetadata
StageController::getInfo() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   DeviceMetadata md;
   md.AddTag(g_Keyword_Name, settings_.name.c_str());
   md.AddTag(g_Keyword_Port, settings_.port.c_str());
   md.AddTag(g_Keyword_Simulated, settings_.simulated);
   md.AddTag(g_Keyword_Channels, JoinLabels(table_.GetLabels()).c_str());
   for (unsigned i = 0; i < table_.Size(); ++i)
   {
      const ChannelIndex index(i);
      md.Merge(ChannelInfoImpl(index),
            "Channel" + ToString(table_.Get(index).label) + "-");
   }
   return md;
}

} // namespace mcm
