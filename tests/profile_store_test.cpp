// AmpPoll headers
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "core/ProfileStore.hpp"

// GTest headers
#include <gtest/gtest.h>

// STL headers
#include <atomic>
#include <fstream>
#include <sstream>
#include <future>
#include <thread>
#include <vector>

#include <unistd.h>

namespace amppoll::test {

  using amppoll::core::Logger;
  using amppoll::core::PersistError;
  using amppoll::core::PersistRetryPolicy;
  using amppoll::core::ProfileState;
  using amppoll::core::ProfileStore;
  using namespace std::chrono_literals;
  namespace fs = std::filesystem;

  namespace {

    fs::path scratchDir(const std::string& name) {
      const auto dir = fs::temp_directory_path() / ("amppoll_store_" + std::to_string(::getpid()) + "_" + name);
      fs::remove_all(dir);
      fs::create_directories(dir);
      return dir;
    }

    /// Blocks writes for keys containing "slow" until released.
    class GatedStore : public ProfileStore {
    public:
      using ProfileStore::ProfileStore;

      std::promise<void> entered;
      std::promise<void> release;

    protected:
      void writeFile(const fs::path& target, const std::string& contents) override {
        if (target.filename().string().find("slow") != std::string::npos) {
          entered.set_value();
          release.get_future().wait();
        }
        ProfileStore::writeFile(target, contents);
      }
    };

    /// Fails the first `failures` writes.
    class FlakyStore : public ProfileStore {
    public:
      FlakyStore(fs::path dir, int failures)
          : ProfileStore(std::move(dir), PersistRetryPolicy{ 3, 1ms }), failures_(failures) {}

      std::atomic<int> calls{ 0 };

    protected:
      void writeFile(const fs::path& target, const std::string& contents) override {
        if (calls++ < failures_)
          throw std::runtime_error("disk full");
        ProfileStore::writeFile(target, contents);
      }

    private:
      int failures_;
    };

  } // namespace

  class ProfileStoreTest : public ::testing::Test {
  protected:
    void SetUp() override { dir = scratchDir(::testing::UnitTest::GetInstance()->current_test_info()->name()); }
    void TearDown() override { fs::remove_all(dir); }

    fs::path dir;
  };

  TEST_F(ProfileStoreTest, concurrent_updates_to_one_key_are_both_kept) {
    ProfileStore store(dir);
    ASSERT_TRUE(store.read("24a1861dda90").empty());

    std::thread w1([&] { store.update("24a1861dda90", { { "dsProfile", "3" } }); });
    std::thread w2([&] { store.update("24a1861dda90", { { "usProfile", "2" } }); });
    w1.join();
    w2.join();

    const ProfileState state = store.read("24a1861dda90");
    EXPECT_EQ(state.value("dsProfile", ""), "3");
    EXPECT_EQ(state.value("usProfile", ""), "2");
  }

  TEST_F(ProfileStoreTest, no_patch_is_lost_under_contention) {
    ProfileStore store(dir);
    std::vector<std::thread> workers;
    for (int w = 0; w < 8; ++w)
      workers.emplace_back([&, w] {
        for (int i = 0; i < 10; ++i)
          store.update("amp-1", { { "k" + std::to_string(w) + "_" + std::to_string(i), i } });
      });
    for (auto& t : workers)
      t.join();

    EXPECT_EQ(store.read("amp-1").size(), 80u);
  }

  TEST_F(ProfileStoreTest, other_keys_are_not_blocked_by_a_slow_write) {
    GatedStore store(dir);
    auto entered = store.entered.get_future();

    std::thread slow([&] { store.update("slow-amp", { { "rlsp", 11 } }); });
    entered.wait();

    const auto fast = std::async(std::launch::async, [&] { return store.update("fast-amp", { { "rlsp", 7 } }); });
    EXPECT_EQ(fast.wait_for(5s), std::future_status::ready);

    store.release.set_value();
    slow.join();
    EXPECT_EQ(store.read("slow-amp").value("rlsp", 0), 11);
    EXPECT_EQ(store.read("fast-amp").value("rlsp", 0), 7);
  }

  TEST_F(ProfileStoreTest, merge_is_deep_and_skips_nulls) {
    ProfileStore store(dir);
    store.update("amp", { { "us", { { "rlsp", 10 }, { "mode", "fdx" } } }, { "serial", "A1" } });
    const auto merged = store.update("amp", { { "us", { { "rlsp", 12 } } }, { "serial", nullptr } });

    EXPECT_EQ(merged["us"]["rlsp"], 12);
    EXPECT_EQ(merged["us"]["mode"], "fdx");
    EXPECT_EQ(merged["serial"], "A1");
    EXPECT_EQ(store.read("amp"), merged);
  }

  TEST_F(ProfileStoreTest, corrupt_or_empty_file_reads_as_empty) {
    ProfileStore store(dir);
    { std::ofstream(store.pathFor("broken")) << "{ not json"; }
    { std::ofstream(store.pathFor("blank")) << "  \n"; }

    EXPECT_TRUE(store.read("broken").empty());
    EXPECT_TRUE(store.read("blank").empty());

    store.update("broken", { { "fixed", true } });
    EXPECT_EQ(store.read("broken")["fixed"], true);
  }

  TEST_F(ProfileStoreTest, write_leaves_no_temp_files) {
    ProfileStore store(dir);
    store.update("amp", { { "a", 1 } });

    std::size_t files = 0;
    for (const auto& entry : fs::directory_iterator(dir)) {
      ++files;
      EXPECT_EQ(entry.path().extension(), ".json");
    }
    EXPECT_EQ(files, 1u);
  }

  TEST_F(ProfileStoreTest, keys_cannot_escape_the_directory) {
    ProfileStore store(dir);
    EXPECT_EQ(store.pathFor("../../etc/passwd").parent_path(), dir);
    EXPECT_EQ(store.pathFor("..").parent_path(), dir);
    EXPECT_THROW(store.pathFor(""), std::invalid_argument);
  }

  TEST_F(ProfileStoreTest, keys_differing_only_in_unsafe_bytes_get_separate_files) {
    ProfileStore store(dir);
    EXPECT_NE(store.pathFor("amp/1"), store.pathFor("amp:1"));
    EXPECT_NE(store.pathFor("amp_1"), store.pathFor("amp:1"));
    EXPECT_NE(store.pathFor("amp%3A1"), store.pathFor("amp:1"));
    EXPECT_EQ(store.pathFor("amp:1").filename().string(), "amp%3A1.json");

    store.update("amp/1", { { "rlsp", 10 } });
    store.update("amp:1", { { "rlsp", 14 } });
    store.update("amp_1", { { "rlsp", 17 } });

    EXPECT_EQ(store.read("amp/1").value("rlsp", 0), 10);
    EXPECT_EQ(store.read("amp:1").value("rlsp", 0), 14);
    EXPECT_EQ(store.read("amp_1").value("rlsp", 0), 17);
  }

  TEST_F(ProfileStoreTest, persisted_file_holds_exactly_the_merged_state) {
    ProfileStore store(dir);
    const auto state = store.update("amp", { { "usProfile", "2" } });

    std::ifstream in(store.pathFor("amp"));
    std::stringstream ss;
    ss << in.rdbuf();
    EXPECT_EQ(ss.str(), state.dump(2) + "\n");
  }

  TEST_F(ProfileStoreTest, unwritable_directory_raises_persist_error) {
    { std::ofstream(dir / "blocker") << "not a directory"; }
    ProfileStore store(dir / "blocker" / "state", PersistRetryPolicy{ 2, 1ms });

    EXPECT_THROW(store.update("amp", { { "a", 1 } }), PersistError);
  }

  TEST_F(ProfileStoreTest, corrupt_file_warning_goes_to_the_run_log) {
    auto logger = std::make_shared<Logger>();
    const auto csv = logger->startNewRun(dir / "logs");
    ProfileStore store(dir / "state", {}, logger);
    fs::create_directories(dir / "state");
    { std::ofstream(store.pathFor("broken")) << "[1, 2"; }

    EXPECT_TRUE(store.read("broken").empty());
    logger->finishRun();

    std::ifstream in(csv);
    std::stringstream ss;
    ss << in.rdbuf();
    EXPECT_NE(ss.str().find("ignoring corrupt state file"), std::string::npos);
    EXPECT_NE(ss.str().find("WARNING"), std::string::npos);
  }

  TEST_F(ProfileStoreTest, transient_write_failures_are_retried) {
    FlakyStore store(dir, 2);
    store.update("amp", { { "a", 1 } });

    EXPECT_EQ(store.calls.load(), 3);
    EXPECT_EQ(store.read("amp")["a"], 1);
  }

  TEST_F(ProfileStoreTest, exhausted_retries_raise_persist_error) {
    FlakyStore store(dir, 100);

    EXPECT_THROW(store.update("amp", { { "a", 1 } }), PersistError);
    EXPECT_EQ(store.calls.load(), 3);
    EXPECT_TRUE(store.read("amp").empty());
  }

} // namespace amppoll::test
