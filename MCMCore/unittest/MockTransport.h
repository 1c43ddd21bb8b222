#pragma once

#include "Error.h"
#include "Transport.h"

#include <cstdint>
#include <deque>
#include <functional>
#include <string>
#include <vector>

// Scripted transport: records every write and serves bytes queued by the
// test (directly, or from onWrite in response to a command).
class MockTransport : public mcm::Transport {
public:
   std::vector<std::vector<unsigned char>> writes;
   std::deque<unsigned char> input;
   std::function<void(const std::vector<unsigned char>&)> onWrite;
   bool open = true;

   void Write(const std::vector<unsigned char>& bytes) override {
      if (!open)
         throw CMCMError("mock closed", MCMERR_ConnectionClosed);
      writes.push_back(bytes);
      if (onWrite)
         onWrite(bytes);
   }

   std::vector<unsigned char> Read(std::size_t count) override {
      if (input.size() < count)
         throw CMCMError("mock read timed out", MCMERR_SerialTimeout);
      std::vector<unsigned char> bytes(input.begin(), input.begin() + count);
      input.erase(input.begin(), input.begin() + count);
      return bytes;
   }

   std::size_t BytesWaiting() override { return input.size(); }
   void Close() override { open = false; }
   bool IsOpen() const override { return open; }
   std::string Describe() const override { return "mock transport"; }

   void QueueInput(const std::vector<unsigned char>& bytes) {
      input.insert(input.end(), bytes.begin(), bytes.end());
   }

   // 12-byte position response; byte 6 is the channel index
   static std::vector<unsigned char> PositionResponse(unsigned channelByte,
         std::int32_t value) {
      const std::uint32_t u = static_cast<std::uint32_t>(value);
      return {
         0x0B, 0x04, 0x06, 0x00, 0x00, 0x00,
         static_cast<unsigned char>(channelByte), 0x00,
         static_cast<unsigned char>(u & 0xFF),
         static_cast<unsigned char>((u >> 8) & 0xFF),
         static_cast<unsigned char>((u >> 16) & 0xFF),
         static_cast<unsigned char>((u >> 24) & 0xFF),
      };
   }

   // Answer every position query with the given value for its channel
   void AnswerQueriesWith(std::int32_t value) {
      onWrite = [this, value](const std::vector<unsigned char>& cmd) {
         if (cmd.size() == 6 && cmd[0] == 0x0A)
            QueueInput(PositionResponse(cmd[2], value));
      };
   }

   std::size_t CountWritesStartingWith(unsigned char opcode) const {
      std::size_t n = 0;
      for (const auto& w : writes)
         if (!w.empty() && w[0] == opcode)
            ++n;
      return n;
   }
};
