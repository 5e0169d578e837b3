// AmpPoll headers
#include "core/IdentityResolver.hpp"
#include "core/RunCoordinator.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

// STL headers
#include <filesystem>
#include <fstream>
#include <map>

#include <unistd.h>

namespace amppoll::test {

  using namespace amppoll::core;
  namespace fs = std::filesystem;

  class TableResolver : public IdentityResolver {
  public:
    std::map<std::string, std::string> table;

    DeviceIdentity resolve(const std::string& hardwareId) override {
      auto it = table.find(hardwareId);
      if (it == table.end())
        throw IdentityError(IdentityError::Kind::NotFound, "[TableResolver] unknown " + hardwareId);
      return DeviceIdentity{ it->second, "N-1", hardwareId };
    }
  };

  class RunCoordinatorTest : public ::testing::Test {
  protected:
    void SetUp() override {
      dir = fs::temp_directory_path() / ("amppoll_coord_" + std::to_string(::getpid()));
      fs::remove_all(dir);
      fs::create_directories(dir);
      std::ofstream(dir / "amppoll.json") << R"({
        "environments": { "prod": { "relay": { "host": "jump.test", "username": "op" } }, "lab": {} },
        "profiles": {
          "CC": { "promptMarker": ">", "tasks": { "reset": { "steps": [ { "command": "reboot", "waitForPrompt": false } ] } } }
        }
      })";

      options.configPath = (dir / "amppoll.json").string();
      options.image = "CC";
      options.environment = "prod";
      options.tasks = { "reset" };
      options.devices = { { "amp1", "192.0.2.1" } };
      options.outputDir = dir / "out";
      options.stateDir = dir / "state";
    }

    void TearDown() override { fs::remove_all(dir); }

    void expectSetupError(const std::string& fragment) {
      RunCoordinator coordinator(options, resolver);
      try {
        coordinator.initialize();
        FAIL() << "expected SetupError containing " << fragment;
      } catch (const SetupError& e) {
        EXPECT_THAT(e.what(), testing::HasSubstr(fragment));
      }
    }

    fs::path dir;
    RunOptions options;
    std::shared_ptr<TableResolver> resolver = std::make_shared<TableResolver>();
  };

  TEST_F(RunCoordinatorTest, rejects_bad_invocations_before_any_device) {
    options.image = "XX";
    expectSetupError("unknown image");

    options.image = "CC";
    options.tasks = { "reset", "run_alignment" };
    expectSetupError("run_alignment");

    options.tasks = { "reset" };
    options.environment = "lab";
    expectSetupError("no relay");

    options.environment = "prod";
    options.devices.push_back({ "amp1", "192.0.2.2" });
    expectSetupError("given twice");

    options.devices.clear();
    expectSetupError("no devices");

    options.configPath = (dir / "missing.json").string();
    options.devices = { { "amp1", "192.0.2.1" } };
    expectSetupError("missing.json");
  }

  TEST_F(RunCoordinatorTest, lookups_become_jobs) {
    resolver->table["00:aa"] = "2001:db8::1";
    options.lookups = { "00:aa" };
    options.timeout = std::chrono::milliseconds{ 750 };

    RunCoordinator coordinator(options, resolver);
    coordinator.initialize();

    ASSERT_EQ(coordinator.jobs().size(), 2u);
    EXPECT_EQ(coordinator.jobs()[1].deviceKey, "00:aa");
    EXPECT_EQ(coordinator.jobs()[1].address, "2001:db8::1");
    EXPECT_TRUE(coordinator.jobs()[1].viaRelay);
    EXPECT_EQ(coordinator.jobs()[0].profile->defaultTimeout, std::chrono::milliseconds{ 750 });
  }

  TEST_F(RunCoordinatorTest, unresolvable_lookup_is_a_setup_error) {
    options.lookups = { "00:bb" };
    expectSetupError("NotFound");
  }

  TEST_F(RunCoordinatorTest, abort_before_run_stops_every_device) {
    RunCoordinator coordinator(options, resolver);
    coordinator.initialize();
    coordinator.handleAbort();

    const RunReport report = coordinator.run();

    ASSERT_EQ(report.devices.size(), 1u);
    EXPECT_EQ(report.devices[0].outcome, DeviceOutcome::Aborted);
    EXPECT_EQ(report.devices[0].tasks[0].status, TaskStatus::Aborted);
    EXPECT_EQ(report.exitCode(), 1);
  }

  TEST_F(RunCoordinatorTest, run_requires_initialize) {
    RunCoordinator coordinator(options, resolver);
    EXPECT_THROW(coordinator.run(), std::logic_error);
  }

} // namespace amppoll::test
