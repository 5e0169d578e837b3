// AmpPoll headers
#include "core/ConfigLoader.hpp"
#include "core/DeviceProfile.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "core/LoggingObserver.hpp"
#include "core/RingBuffer.hpp"
#include "core/SessionTransport.hpp"

// AmpPoll fakes
#include "FakeSessionTransport.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

// nlohmann
#include <nlohmann/json.hpp>

// STL headers
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>
#include <vector>

#include <stdlib.h>
#include <unistd.h>

namespace amppoll::test {

  using namespace amppoll::core;
  using namespace std::chrono_literals;
  namespace fs = std::filesystem;

  class MockErrorMonitor : public ErrorMonitor {
  public:
    MOCK_METHOD(void, notifyFailure, (const std::string&), (override));
  };

  namespace {

    fs::path scratchDir(const std::string& name) {
      const auto dir = fs::temp_directory_path() / ("amppoll_core_" + std::to_string(::getpid()) + "_" + name);
      fs::remove_all(dir);
      fs::create_directories(dir);
      return dir;
    }

    std::string slurp(const fs::path& p) {
      std::ifstream in(p);
      std::stringstream ss;
      ss << in.rdbuf();
      return ss.str();
    }

    const char* kConfig = R"json({
      // comments are allowed
      "environments": {
        "prod": { "relay": { "host": "jump.prod", "username": "op", "password": "pw" } },
        "lab":  { "relay": null }
      },
      "profiles": {
        "CC": {
          "username": "admin",
          "promptMarker": ">",
          "quietPeriodMs": 300,
          "taskTimeoutsMs": { "run_alignment": 120000 },
          "constants": { "fftSize": 16384 },
          "prerequisites": { "hal": [ { "command": "debug hal", "validation": "Connected", "waitForPrompt": false } ] },
          "tasks": {
            "get_nc_input_power": {
              "requires": "hal",
              "steps": [ { "command": "/leap/fafe_show_status 4", "validation": ["NcInputPower"],
                           "promptMarker": "hal>", "timeoutMs": 5000,
                           "capture": { "nc": "NcInputPower\\s*=\\s*(\\S+)" } } ]
            },
            "get_wbfft": {
              "steps": [ { "command": "cap {start}", "range": "99M-117M(6M)" } ],
              "artifacts": [ { "remotePath": "/tmp/w_{device}.bin", "minSize": 1024 } ]
            },
            "run_alignment": { "steps": [ { "command": "start-ds1" } ] }
          }
        }
      }
    })json";

  } // namespace

  //---ErrorMonitor-------------------------------------------------------------

  TEST(error_monitor, escalates_each_unique_failure_once) {
    ErrorMonitor monitor;
    std::vector<std::string> escalated;
    monitor.registerEscalation([&](const std::string& msg) { escalated.push_back(msg); });

    monitor.notifyFailure("amp1: timeout");
    monitor.notifyFailure("amp1: timeout");
    monitor.notifyFailure("amp2: auth");

    EXPECT_EQ(escalated, (std::vector<std::string>{ "amp1: timeout", "amp2: auth" }));
    EXPECT_EQ(monitor.failures().size(), 2u);
    EXPECT_EQ(monitor.reportCount(), 3u);
  }

  TEST(error_monitor, every_sink_sees_the_failure) {
    ErrorMonitor monitor;
    int first = 0;
    int second = 0;
    monitor.registerEscalation([&](const std::string&) { ++first; });
    monitor.registerEscalation([&](const std::string&) { ++second; });
    monitor.registerEscalation(nullptr);

    monitor.notifyFailure("amp3: relay unreachable");

    EXPECT_EQ(first, 1);
    EXPECT_EQ(second, 1);
  }

  TEST(error_monitor, callback_may_report_again_without_deadlock) {
    ErrorMonitor monitor;
    monitor.registerEscalation([&](const std::string& msg) {
      if (msg == "first")
        monitor.notifyFailure("second");
    });

    monitor.notifyFailure("first");

    EXPECT_EQ(monitor.failures(), (std::vector<std::string>{ "first", "second" }));
  }

  //---RingBuffer / Logger-------------------------------------------------------

  TEST(ring_buffer, overwrites_the_oldest_when_full) {
    RingBuffer<int> rb(2);
    EXPECT_FALSE(rb.push(1));
    EXPECT_FALSE(rb.push(2));
    EXPECT_TRUE(rb.push(3));
    EXPECT_EQ(rb.pop(), 2);
    EXPECT_EQ(rb.pop(), 3);
    EXPECT_FALSE(rb.pop());
    EXPECT_THROW(RingBuffer<int>(0), std::invalid_argument);
  }

  TEST(logger, csv_lines_quote_source_and_message) {
    LogEvent ev;
    ev.level = LogLevel::Warning;
    ev.source = "amp \"7\"";
    ev.message = "two\nlines";

    const std::string line = Logger::toCsv(ev);

    EXPECT_NE(line.find(",WARNING,\"amp \"\"7\"\"\",\"two lines\"\n"), std::string::npos);
  }

  TEST(logger, run_writes_every_event_to_the_csv) {
    const auto dir = scratchDir("logger_run");
    fs::path file;
    {
      Logger logger;
      logger.setEchoLevel(LogLevel::Critical);
      file = logger.startNewRun(dir);
      for (int i = 0; i < 100; ++i)
        logger.log(LogLevel::Info, "amp" + std::to_string(i), "step done");
      logger.finishRun();
      EXPECT_EQ(logger.dropped(), 0u);
    }

    EXPECT_EQ(file.parent_path(), dir);
    EXPECT_EQ(file.filename().string().rfind("workflow_log_", 0), 0u);
    const std::string text = slurp(file);
    EXPECT_EQ(std::count(text.begin(), text.end(), '\n'), 100);
    EXPECT_NE(text.find("\"amp99\""), std::string::npos);
    fs::remove_all(dir);
  }

  TEST(logger, events_racing_the_end_of_a_run_are_not_lost) {
    const auto dir = scratchDir("logger_race");
    std::ostringstream captured;
    auto* saved = std::clog.rdbuf(captured.rdbuf());
    {
      Logger logger(1 << 16);
      logger.setEchoLevel(LogLevel::Debug);
      logger.startNewRun(dir);
      std::vector<std::thread> producers;
      for (int p = 0; p < 4; ++p)
        producers.emplace_back([&logger, p] {
          for (int i = 0; i < 500; ++i)
            logger.log(LogLevel::Debug, "p" + std::to_string(p), "#" + std::to_string(p * 1000 + i) + ";");
        });
      std::this_thread::sleep_for(2ms);
      logger.finishRun();
      for (auto& t : producers)
        t.join();
      EXPECT_EQ(logger.dropped(), 0u);
    }
    std::clog.rdbuf(saved);

    // every event is either drained by the run or echoed after it
    const std::string out = captured.str();
    int missing = 0;
    for (int p = 0; p < 4; ++p)
      for (int i = 0; i < 500; ++i)
        if (out.find("#" + std::to_string(p * 1000 + i) + ";") == std::string::npos)
          ++missing;
    EXPECT_EQ(missing, 0);
    fs::remove_all(dir);
  }

  TEST(logging_observer, writes_progress_and_summary) {
    const auto dir = scratchDir("logging_observer");
    auto logger = std::make_shared<Logger>();
    logger->setEchoLevel(LogLevel::Critical);
    const auto file = logger->startNewRun(dir);
    LoggingObserver observer(logger);

    ProgressEvent ev;
    ev.deviceKey = "amp1";
    ev.task = "t5";
    ev.stepIndex = 3;
    ev.command = "s3";
    ev.status = protocols::ExecutionStatus::Timeout;
    observer.onStep(ev);

    DeviceSummary summary;
    summary.deviceKey = "amp1";
    summary.outcome = DeviceOutcome::Failed;
    summary.failedAtStep = 3;
    TaskSummary task;
    task.name = "t5";
    task.status = TaskStatus::Timeout;
    summary.tasks.push_back(task);
    observer.onDeviceFinished(summary);
    logger->finishRun();

    const std::string text = slurp(file);
    EXPECT_NE(text.find("t5 #3 's3' Timeout"), std::string::npos);
    EXPECT_NE(text.find("failed at step 3"), std::string::npos);
    fs::remove_all(dir);
  }

  //---ConfigLoader / ProfileCatalog-------------------------------------------------

  TEST(config_loader, missing_file_and_bad_json_throw) {
    EXPECT_THROW(ConfigLoader("/nonexistent/amppoll.json").load(), std::runtime_error);

    const auto dir = scratchDir("config_bad");
    { std::ofstream(dir / "bad.json") << "{ \"profiles\": "; }
    EXPECT_THROW(ConfigLoader((dir / "bad.json").string()).load(), std::runtime_error);
    { std::ofstream(dir / "array.json") << "[1, 2]"; }
    EXPECT_THROW(ConfigLoader(dir / "array.json").load(), std::runtime_error);
    fs::remove_all(dir);
  }

  TEST(config_loader, locate_prefers_the_environment_variable) {
    const auto dir = scratchDir("config_locate");
    { std::ofstream(dir / "site.json") << "{}"; }
    ::setenv("AMPPOLL_CONFIG", (dir / "site.json").c_str(), 1);

    const auto found = ConfigLoader::locate();

    ::unsetenv("AMPPOLL_CONFIG");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->string(), (dir / "site.json").string());
    fs::remove_all(dir);
  }

  TEST(profile_catalog, parses_profiles_and_relays) {
    const auto dir = scratchDir("config_ok");
    { std::ofstream(dir / "amppoll.json") << kConfig; }
    const auto catalog = ProfileCatalog::fromJson(ConfigLoader((dir / "amppoll.json").string()).load());
    fs::remove_all(dir);

    const auto cc = catalog.profile("CC");
    EXPECT_EQ(cc->username, "admin");
    EXPECT_EQ(cc->quietPeriod, 300ms);
    EXPECT_EQ(cc->defaultTimeout, 20000ms);
    EXPECT_EQ(cc->timeoutFor("run_alignment"), 120000ms);
    EXPECT_EQ(cc->constants.at("fftSize"), 16384.0);
    EXPECT_EQ(cc->supportedTasks(), (std::set<std::string>{ "get_nc_input_power", "get_wbfft", "run_alignment" }));

    const auto& nc = cc->tasks.at("get_nc_input_power");
    EXPECT_EQ(nc.prerequisites, std::vector<std::string>{ "hal" });
    EXPECT_EQ(nc.steps[0].step.promptMarker, "hal>");
    EXPECT_EQ(nc.steps[0].step.timeout, std::optional<std::chrono::milliseconds>(5000ms));
    EXPECT_EQ(nc.steps[0].step.captures.at("nc"), "NcInputPower\\s*=\\s*(\\S+)");
    EXPECT_FALSE(cc->prerequisites.at("hal")[0].step.waitForPrompt);

    const auto& wbfft = cc->tasks.at("get_wbfft");
    EXPECT_EQ(wbfft.steps[0].range, "99M-117M(6M)");
    EXPECT_EQ(wbfft.artifacts[0].minSize, 1024u);
    EXPECT_EQ(wbfft.artifacts[0].task, "get_wbfft");

    ASSERT_TRUE(catalog.relayFor("prod"));
    EXPECT_EQ(catalog.relayFor("prod")->port, 22);
    EXPECT_FALSE(catalog.relayFor("lab"));
    EXPECT_THROW(catalog.profile("XX"), std::out_of_range);
  }

  TEST(profile_catalog, rejects_bad_profiles_with_context) {
    auto doc = nlohmann::json::parse(R"({ "profiles": { "CC": { "promptMarker": "", "tasks": {} } } })");
    try {
      ProfileCatalog::fromJson(doc);
      FAIL() << "expected runtime_error";
    } catch (const std::runtime_error& e) {
      EXPECT_THAT(e.what(), testing::HasSubstr("profile 'CC'"));
    }

    doc = nlohmann::json::parse(
        R"({ "profiles": { "CC": { "promptMarker": ">", "tasks": { "t": { "steps": [ { "command": "x", "capture": { "k": "[" } } ] } } } } })");
    EXPECT_THROW(ProfileCatalog::fromJson(doc), std::runtime_error);

    EXPECT_THROW(ProfileCatalog::fromJson(nlohmann::json::object()), std::runtime_error);
  }

  TEST(profile_catalog, reads_expectations_and_critical_flags) {
    const auto doc = nlohmann::json::parse(R"({ "profiles": { "CC": { "promptMarker": ">", "tasks": {
      "configure": { "steps": [ { "command": "rlsp {rlsp}" } ], "expect": { "rlsp": "{rlsp}", "mode": 3 },
                     "critical": true },
      "show": { "steps": [ { "command": "show" } ] } } } } })");

    const auto cc = ProfileCatalog::fromJson(doc).profile("CC");

    const auto& configure = cc->tasks.at("configure");
    EXPECT_TRUE(configure.critical);
    EXPECT_EQ(configure.expectations.at("rlsp"), "{rlsp}");
    EXPECT_EQ(configure.expectations.at("mode"), "3");
    EXPECT_FALSE(cc->tasks.at("show").critical);
    EXPECT_TRUE(cc->tasks.at("show").expectations.empty());
  }

  //---SessionTransport------------------------------------------------------------

  TEST(session_transport, refuses_a_second_session_to_one_address) {
    auto monitor = std::make_shared<ErrorMonitor>();
    FakeSessionTransport transport(monitor);
    transport.device("10.0.0.7");
    auto profile = std::make_shared<const DeviceProfile>();

    Session first = transport.open(profile, "10.0.0.7", true);
    EXPECT_TRUE(first.isOpen());
    EXPECT_THROW(transport.open(profile, "10.0.0.7", true), std::logic_error);

    transport.close(first);
    transport.close(first);
    EXPECT_FALSE(first.isOpen());
    EXPECT_EQ(transport.device("10.0.0.7").shell->closeCalls, 1);

    Session again = transport.open(profile, "10.0.0.7", true);
    EXPECT_TRUE(again.isOpen());
    transport.close(again);
  }

  TEST(session_transport, failed_open_releases_the_address_and_reports) {
    auto monitor = std::make_shared<testing::NiceMock<MockErrorMonitor>>();
    FakeSessionTransport transport(monitor);
    transport.device("10.0.0.8").failure =
        ConnectError(ConnectError::Kind::TargetUnreachable, ConnectError::Hop::Target, "[Fake] timed out");
    auto profile = std::make_shared<const DeviceProfile>();

    EXPECT_CALL(*monitor, notifyFailure(testing::HasSubstr("timed out"))).Times(1);
    EXPECT_THROW(transport.open(profile, "10.0.0.8", false), ConnectError);
    EXPECT_FALSE(transport.hasOpenSession("10.0.0.8"));
  }

  TEST(session_transport, close_on_a_never_opened_session_is_harmless) {
    FakeSessionTransport transport(std::make_shared<ErrorMonitor>());
    Session never;
    transport.close(never);
    EXPECT_FALSE(never.isOpen());
  }

} // namespace amppoll::test
