// AmpPoll headers
#include "core/RetrievalVerifier.hpp"

// AmpPoll fakes
#include "FakeRemoteFiles.hpp"

// GTest headers
#include <gtest/gtest.h>

namespace amppoll::test {

  using amppoll::core::RetrievalVerifier;
  using amppoll::core::VerifyStatus;
  using amppoll::protocols::RetrievalSpec;

  namespace {
    RetrievalSpec spec(const std::string& path, std::uintmax_t minSize = 1) {
      RetrievalSpec s;
      s.remotePath = path;
      s.minSize = minSize;
      s.task = "get_s2p";
      return s;
    }
  } // namespace

  class RetrievalVerifierTest : public ::testing::Test {
  protected:
    FakeRemoteFiles files;
    RetrievalVerifier verifier;
  };

  TEST_F(RetrievalVerifierTest, ok_when_every_artifact_is_large_enough) {
    files.sizes = { { "/run/data/calibration/H21.s2p", 4096 }, { "/run/data/calibration/H35.s2p", 12 } };

    const auto outcome =
        verifier.verify(files, { spec("/run/data/calibration/H21.s2p", 1024), spec("/run/data/calibration/H35.s2p") });

    EXPECT_TRUE(outcome.ok());
    EXPECT_TRUE(files.fetched.empty());
  }

  TEST_F(RetrievalVerifierTest, missing_and_empty_are_told_apart) {
    files.sizes = { { "/tmp/empty.bin", 0 } };

    const auto missing = verifier.verify(files, { spec("/tmp/nope.bin") });
    EXPECT_EQ(missing.status, VerifyStatus::MissingArtifact);
    EXPECT_EQ(missing.path, "/tmp/nope.bin");

    const auto empty = verifier.verify(files, { spec("/tmp/empty.bin") });
    EXPECT_EQ(empty.status, VerifyStatus::EmptyArtifact);
    EXPECT_EQ(empty.path, "/tmp/empty.bin");

    EXPECT_TRUE(files.fetched.empty());
  }

  TEST_F(RetrievalVerifierTest, below_minimum_size_counts_as_empty) {
    files.sizes = { { "/tmp/wbfft.bin", 100 } };

    const auto outcome = verifier.verify(files, { spec("/tmp/wbfft.bin", 1024) });

    EXPECT_EQ(outcome.status, VerifyStatus::EmptyArtifact);
    EXPECT_EQ(outcome.size, 100u);
  }

  TEST_F(RetrievalVerifierTest, stops_at_the_first_bad_artifact) {
    files.sizes = { { "/b", 10 } };

    const auto outcome = verifier.verify(files, { spec("/a"), spec("/b") });

    EXPECT_EQ(outcome.status, VerifyStatus::MissingArtifact);
    EXPECT_EQ(files.probed, std::vector<std::string>{ "/a" });
  }

  TEST_F(RetrievalVerifierTest, probe_faults_propagate) {
    files.unreachable = { "/tmp/wbfft.bin" };

    EXPECT_THROW(verifier.verify(files, { spec("/tmp/wbfft.bin") }), io::TransferError);
  }

  TEST_F(RetrievalVerifierTest, nothing_to_verify_is_ok) { EXPECT_TRUE(verifier.verify(files, {}).ok()); }

} // namespace amppoll::test
