///////////////////////////////////////////////////////////////////////////////
// FILE:          MotionExecutor.cpp
// PROJECT:       MCMControl
// SUBSYSTEM:     MCMCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Sends protocol commands and waits for motion to settle
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

#include "MotionExecutor.h"

#include "../MCMDevice/DeviceUtils.h"
#include "CommandCodec.h"
#include "CoreFeatures.h"
#include "CoreUtils.h"
#include "Error.h"
#include "UnitConverter.h"

#include <cstdint>
#include <cstdlib>

namespace mcm {

const char* MotionStatusName(MotionStatus status)
{
   switch (status)
   {
      case MotionIdle: return "idle";
      case MotionSettled: return "settled";
      case MotionTimedOut: return "timed out";
      case MotionCancelled: return "cancelled";
      default: return "(unknown)";
   }
}


MotionExecutor::MotionExecutor(ChannelTable& table, Transport& transport,
      Clock& clock, CancellationToken& cancelToken,
      logging::Logger logger, const MotionTiming& timing) :
   table_(table),
   transport_(transport),
   clock_(clock),
   cancelToken_(cancelToken),
   logger_(logger),
   timing_(timing)
{
}


void
MotionExecutor::Send(const std::vector<unsigned char>& cmd)
{
   LOG_TRACE(logger_) << "Send " << CDeviceUtils::HexRep(cmd);
   transport_.Write(cmd);
}


void
MotionExecutor::DrainResidue(const std::vector<unsigned char>& cmd)
{
   const std::size_t residue = transport_.BytesWaiting();
   if (residue == 0)
      return;
   const std::vector<unsigned char> extra = transport_.Read(residue);
   throw CMCMError(ToString(residue) + " unexpected byte(s) after command " +
         CDeviceUtils::HexRep(cmd) + ": " + CDeviceUtils::HexRep(extra),
         MCMERR_UnexpectedData);
}


std::vector<unsigned char>
MotionExecutor::Transact(const std::vector<unsigned char>& cmd,
      std::size_t responseLength)
{
   Send(cmd);
   const std::vector<unsigned char> response = transport_.Read(responseLength);
   LOG_TRACE(logger_) << "Recv " << CDeviceUtils::HexRep(response);
   DrainResidue(cmd);
   return response;
}


long
MotionExecutor::GetEncoderValue(ChannelIndex index)
{
   const Channel& ch = table_.RequireConfigured(index);
   const std::vector<unsigned char> response =
      Transact(codec::EncodeGetPosition(index),
            codec::PositionResponseLength);
   const long value = codec::DecodePositionResponse(response, index);
   LOG_TRACE(logger_) << "ch" << ch.label << " -> stage encoder value = " <<
      value;
   return value;
}


void
MotionExecutor::MoveToEncoderValue(ChannelIndex index, long value, bool block)
{
   const Channel& ch = table_.RequireConfigured(index);
   if (ch.hasPending)
      FinishMove(index);

   // Once the frame is out the stage is moving, whatever follows on the line
   const std::vector<unsigned char> cmd =
      codec::EncodeMoveTo(index, static_cast<std::int32_t>(value));
   Send(cmd);
   table_.SetPending(index, value);
   LOG_DEBUG(logger_) << "ch" << ch.label <<
      " -> moving stage encoder to value = " << value;
   DrainResidue(cmd);

   if (block)
      FinishMove(index);
}


MotionOutcome
MotionExecutor::FinishMove(ChannelIndex index)
{
   return FinishMove(index, timing_.pollInterval, timing_.timeout);
}


MotionOutcome
MotionExecutor::FinishMove(ChannelIndex index,
      std::chrono::milliseconds pollInterval,
      std::chrono::milliseconds timeout)
{
   const Channel& ch = table_.RequireConfigured(index);

   MotionOutcome outcome;
   if (!ch.hasPending)
   {
      outcome.status = MotionIdle;
      outcome.finalEncoder = ch.currentEncoder;
      outcome.positionUm = UmFromEncoder(ch, ch.currentEncoder);
      return outcome;
   }

   const long pending = ch.pendingEncoder;
   const Clock::TimePoint deadline = clock_.Now() + timeout;

   long observed = GetEncoderValue(index);
   outcome.status = MotionSettled;
   while (observed != pending)
   {
      if (cancelToken_.IsCancelled())
      {
         outcome.status = MotionCancelled;
         break;
      }
      if (clock_.Now() > deadline)
      {
         outcome.status = MotionTimedOut;
         break;
      }
      clock_.SleepFor(pollInterval);
      observed = GetEncoderValue(index);
   }

   table_.SetCurrentEncoder(index, observed);
   table_.ClearPending(index);

   outcome.finalEncoder = observed;
   outcome.positionError = observed - pending;
   outcome.positionUm = UmFromEncoder(ch, observed);

   switch (outcome.status)
   {
      case MotionSettled:
         LOG_DEBUG(logger_) << "ch" << ch.label <<
            " -> finished moving to position_um = " << outcome.positionUm;
         break;
      case MotionCancelled:
         LOG_INFO(logger_) << "ch" << ch.label <<
            " -> wait for motion cancelled at encoder value " << observed <<
            " (target " << pending << ")";
         break;
      case MotionTimedOut:
         LOG_WARNING(logger_) << "ch" << ch.label << " -> motion timed out";
         if (std::labs(outcome.positionError) > 1)
            LOG_ERROR(logger_) << "ch" << ch.label << " -> position error: " <<
               outcome.positionError << " counts";
         if (features::flags().strictMotionTimeout)
            throw CMCMError("Channel " + ToString(ch.label) +
                  ": motion did not settle within " +
                  ToString(static_cast<long>(timeout.count())) +
                  " ms (position error " + ToString(outcome.positionError) +
                  " counts)", MCMERR_MotionTimeout);
         break;
      default:
         break;
   }
   return outcome;
}


void
MotionExecutor::SetEncoderToZero(ChannelIndex index)
{
   const Channel& ch = table_.RequireConfigured(index);
   if (ch.hasPending)
      FinishMove(index);

   const std::vector<unsigned char> cmd = codec::EncodeZero(index);
   Send(cmd);
   DrainResidue(cmd);
   LOG_DEBUG(logger_) << "ch" << ch.label << " -> waiting for re-set to zero";

   const Clock::TimePoint deadline = clock_.Now() + timing_.timeout;
   long observed = GetEncoderValue(index);
   while (observed != 0)
   {
      if (clock_.Now() > deadline)
         throw CMCMError("Channel " + ToString(ch.label) +
               ": encoder did not read zero after reset (reads " +
               ToString(observed) + ")", MCMERR_MotionTimeout);
      clock_.SleepFor(timing_.pollInterval);
      observed = GetEncoderValue(index);
   }
   table_.SetCurrentEncoder(index, 0);

   LOG_WARNING(logger_) << "ch" << ch.label << " -> encoder set to zero; " <<
      "stage and scan limits must be set again unless zeroed at the centre " <<
      "of the travel range";
}

} // namespace mcm
