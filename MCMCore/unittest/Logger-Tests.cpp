#include <catch2/catch_all.hpp>

#include "CapturingLogSink.h"
#include "Logging/Logging.h"

#include <cstdio>
#include <fstream>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace mcm {
namespace logging {

TEST_CASE("logger basics", "[Logger]")
{
   std::shared_ptr<LoggingCore> c =
      std::make_shared<LoggingCore>();

   c->AddSink(std::make_shared<StdErrLogSink>());

   Logger lgr = c->NewLogger("mylabel");

   lgr(LogLevelDebug, "My entry text\nMy second line");
   for (unsigned i = 0; i < 100; ++i)
      lgr(LogLevelDebug, "More lines!\n\n\n");
}


TEST_CASE("log stream basics", "[Logger]")
{
   std::shared_ptr<LoggingCore> c =
      std::make_shared<LoggingCore>();
   auto sink = std::make_shared<CapturingLogSink>();
   c->AddSink(sink);

   Logger lgr = c->NewLogger("mylabel");

   LOG_INFO(lgr) << 123 << "ABC" << 456;

   const auto entries = sink->Entries();
   REQUIRE(entries.size() == 1);
   CHECK(entries[0].level == LogLevelInfo);
   CHECK(entries[0].component == "mylabel");
   CHECK(entries[0].text == "123ABC456");
}


TEST_CASE("level filter", "[Logger]")
{
   std::shared_ptr<LoggingCore> c =
      std::make_shared<LoggingCore>();
   auto sink = std::make_shared<CapturingLogSink>();
   sink->SetFilter(std::make_shared<LevelFilter>(LogLevelWarning));
   c->AddSink(sink);
   c->AddSink(sink);

   Logger lgr = c->NewLogger("filtered");
   LOG_TRACE(lgr) << "trace";
   LOG_DEBUG(lgr) << "debug";
   LOG_INFO(lgr) << "info";
   LOG_WARNING(lgr) << "warning";
   LOG_ERROR(lgr) << "error";
   LOG_FATAL(lgr) << "fatal";

   const auto entries = sink->Entries();
   REQUIRE(entries.size() == 3);
   CHECK(entries[0].text == "warning");
   CHECK(entries[2].level == LogLevelFatal);
}


TEST_CASE("removed and swapped sinks", "[Logger]")
{
   std::shared_ptr<LoggingCore> c =
      std::make_shared<LoggingCore>();
   auto first = std::make_shared<CapturingLogSink>();
   auto second = std::make_shared<CapturingLogSink>();
   c->AddSink(first);

   Logger lgr = c->NewLogger("swap");
   lgr(LogLevelInfo, "one");
   c->SwapSink(first, second);
   lgr(LogLevelInfo, "two");
   c->RemoveSink(second);
   lgr(LogLevelInfo, "three");

   CHECK(first->Entries().size() == 1);
   REQUIRE(second->Entries().size() == 1);
   CHECK(second->Entries()[0].text == "two");
}


TEST_CASE("file sink writes prefixed lines", "[Logger]")
{
   const std::string filename = "Logger-Tests-file-sink.log";
   {
      std::shared_ptr<LoggingCore> c =
         std::make_shared<LoggingCore>();
      c->AddSink(std::make_shared<FileLogSink>(filename));
      Logger lgr = c->NewLogger("MCM3000");
      LOG_WARNING(lgr) << "first line\nsecond line";
   }

   std::ifstream in(filename.c_str());
   std::string line1, line2, extra;
   REQUIRE(std::getline(in, line1));
   REQUIRE(std::getline(in, line2));
   CHECK_FALSE(std::getline(in, extra));
   in.close();
   std::remove(filename.c_str());

   CHECK_THAT(line1, Catch::Matchers::EndsWith("[WRN,MCM3000] first line"));
   const std::size_t bracket = line1.find(']');
   REQUIRE(bracket != std::string::npos);
   CHECK(line2.size() == bracket + 1 + std::string(" second line").size());
   CHECK(line2[bracket] == ']');
   CHECK_THAT(line2, Catch::Matchers::EndsWith("] second line"));
}


TEST_CASE("file sink reports files it cannot open", "[Logger]")
{
   CHECK_THROWS_AS(FileLogSink("no/such/directory/x.log"), CannotOpenFileException);
}


class LoggerTestThreadFunc
{
   unsigned n_;
   std::shared_ptr<LoggingCore> c_;

public:
   LoggerTestThreadFunc(unsigned n,
         std::shared_ptr<LoggingCore> c) :
      n_(n), c_(c)
   {}

   void Run()
   {
      Logger lgr = c_->NewLogger("thread" + std::to_string(n_));
      for (unsigned j = 0; j < 50; ++j)
      {
         LOG_TRACE(lgr) << j;
      }
   }
};


TEST_CASE("logger with multiple threads", "[Logger]")
{
   std::shared_ptr<LoggingCore> c =
      std::make_shared<LoggingCore>();
   auto sink = std::make_shared<CapturingLogSink>();
   c->AddSink(sink);

   std::vector<std::thread> threads;
   std::vector<LoggerTestThreadFunc> funcs;
   for (unsigned i = 0; i < 10; ++i)
      funcs.push_back(LoggerTestThreadFunc(i, c));
   for (unsigned i = 0; i < 10; ++i)
      threads.emplace_back(&LoggerTestThreadFunc::Run, &funcs[i]);
   for (unsigned i = 0; i < 10; ++i)
      threads[i].join();

   CHECK(sink->Entries().size() == 500);
}

} // namespace logging
} // namespace mcm
