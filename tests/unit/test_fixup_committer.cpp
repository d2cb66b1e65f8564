#include "core/FixupCommitter.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/BranchResolver.hpp"
#include "support/FakeRepositoryGateway.hpp"

#include <gtest/gtest.h>

using mirror::common::RepositoryRef;
using mirror::core::BranchResolver;
using mirror::core::FixupCommitter;
using mirror::core::FixupSettings;
using mirror::test::FakeRepositoryGateway;

namespace {

const std::string kPrevious = "aaaaaaaabbbbbbbbccccccccddddddddeeeeeeee";
const std::string kHead = "1111111122222222333333334444444455555555";

}  // namespace

class FixupCommitterTest : public ::testing::Test {
 protected:
  void SetUp() override {
    mirror::common::Logger::init("warn");
    _fgw.repo("/mirror").bUncommitted = true;
    _fgw.repo("/mirror").vStaged = {"a.cpp", "b.h"};
  }

  mirror::common::FixupOutcome run(FixupSettings fsSettings = {}, bool bDryRun = false) {
    FixupCommitter fc(_fgw, _bres, _rrMirror, std::move(fsSettings));
    return fc.run(bDryRun);
  }

  FakeRepositoryGateway _fgw;
  RepositoryRef _rrSource{"/src"};
  RepositoryRef _rrMirror{"/mirror"};
  BranchResolver _bres{_fgw, _rrSource, _rrMirror};
};

TEST_F(FixupCommitterTest, NoUncommittedChangesIsNoOp) {
  _fgw.repo("/mirror").bUncommitted = false;

  auto foOutcome = run();
  EXPECT_TRUE(foOutcome.bSucceeded);
  EXPECT_EQ(foOutcome.iFilesModified, 0);
  EXPECT_FALSE(foOutcome.oFixupCommit.has_value());
  EXPECT_TRUE(_fgw.mutatingCalls().empty());
}

TEST_F(FixupCommitterTest, CreatesFixupAgainstPreviousCommitAndSquashes) {
  auto foOutcome = run();
  EXPECT_TRUE(foOutcome.bSucceeded);
  EXPECT_TRUE(foOutcome.bSquashed);
  EXPECT_EQ(foOutcome.sBaseCommit, kPrevious);
  EXPECT_EQ(foOutcome.iFilesModified, 2);
  ASSERT_TRUE(foOutcome.oFixupCommit.has_value());
  EXPECT_EQ(*foOutcome.oFixupCommit, _fgw.sFixupHash);
  EXPECT_EQ(_fgw.sLastFixupBase, kPrevious);
  EXPECT_EQ(_fgw.mutatingCalls(),
            (std::vector<std::string>{"stageModifiedOnly:/mirror", "fixupCommit:/mirror",
                                      "autosquashRebase:/mirror"}));
  EXPECT_EQ(_fgw.sLastMessage.rfind("fixup! Automated fixup for aaaaaaaa @ ", 0), 0u)
      << _fgw.sLastMessage;
}

TEST_F(FixupCommitterTest, SingleCommitHistoryUsesHead) {
  _fgw.repo("/mirror").oPrevious.reset();

  auto foOutcome = run();
  EXPECT_EQ(foOutcome.sBaseCommit, kHead);
}

TEST_F(FixupCommitterTest, NoCommitsAtAllThrows) {
  _fgw.repo("/mirror").oPrevious.reset();
  _fgw.repo("/mirror").oHead.reset();

  try {
    run();
    FAIL() << "expected AppError";
  } catch (const mirror::common::AppError& ex) {
    EXPECT_EQ(ex._sErrorCode, "no_base_commit");
  }
  EXPECT_FALSE(_fgw.called("fixupCommit"));
}

TEST_F(FixupCommitterTest, UntrackedOnlyChangesAreNoOp) {
  _fgw.repo("/mirror").vStaged.clear();

  auto foOutcome = run();
  EXPECT_TRUE(foOutcome.bSucceeded);
  EXPECT_EQ(foOutcome.iFilesModified, 0);
  EXPECT_FALSE(_fgw.called("fixupCommit"));
}

TEST_F(FixupCommitterTest, AutosquashDisabledLeavesFixupCommit) {
  FixupSettings fsSettings;
  fsSettings.bAutosquash = false;

  auto foOutcome = run(fsSettings);
  EXPECT_TRUE(foOutcome.bSucceeded);
  EXPECT_FALSE(foOutcome.bSquashed);
  EXPECT_TRUE(foOutcome.oFixupCommit.has_value());
  EXPECT_FALSE(_fgw.called("autosquashRebase"));
}

TEST_F(FixupCommitterTest, AutosquashFailureKeepsFixupCommit) {
  _fgw.failOn("autosquashRebase");

  auto foOutcome = run();
  EXPECT_FALSE(foOutcome.bSucceeded);
  EXPECT_FALSE(foOutcome.bSquashed);
  ASSERT_TRUE(foOutcome.oFixupCommit.has_value());
  EXPECT_EQ(foOutcome.iFilesModified, 2);
  EXPECT_EQ(foOutcome.sFailure.rfind("autosquash_failed: ", 0), 0u) << foOutcome.sFailure;
}

TEST_F(FixupCommitterTest, CustomPrefixAndAuthor) {
  FixupSettings fsSettings;
  fsSettings.sMessagePrefix = "squash! ";
  fsSettings.oAuthor = "Mirror Bot <bot@example.com>";

  run(fsSettings);
  EXPECT_EQ(_fgw.sLastMessage.rfind("squash! Automated fixup", 0), 0u);
  EXPECT_EQ(_fgw.oLastAuthor, std::optional<std::string>("Mirror Bot <bot@example.com>"));
}

TEST_F(FixupCommitterTest, DryRunMakesNoMutations) {
  _fgw.repo("/src").sBranch = "dev";

  auto foOutcome = run({}, true);
  EXPECT_TRUE(foOutcome.bSucceeded);
  EXPECT_EQ(foOutcome.sBaseCommit, kPrevious);
  EXPECT_FALSE(foOutcome.oFixupCommit.has_value());
  EXPECT_TRUE(_fgw.mutatingCalls().empty());
}

TEST_F(FixupCommitterTest, DryRunWithOnlyUntrackedChangesIsNoOp) {
  _fgw.repo("/mirror").vStaged.clear();

  auto foOutcome = run({}, true);
  EXPECT_TRUE(foOutcome.bSucceeded);
  EXPECT_TRUE(foOutcome.sBaseCommit.empty());
  EXPECT_EQ(foOutcome.iFilesModified, 0);
  EXPECT_TRUE(_fgw.called("hasTrackedChanges"));
  EXPECT_TRUE(_fgw.mutatingCalls().empty());
}

TEST_F(FixupCommitterTest, ResolvesBranchBeforeCommitting) {
  _fgw.repo("/src").sBranch = "release";

  run();
  EXPECT_EQ(_fgw.repo("/mirror").sBranch, "release");
  EXPECT_EQ(_fgw.mutatingCalls().front(), "createBranch:/mirror");
}

TEST_F(FixupCommitterTest, MirrorNotARepositoryThrows) {
  _fgw.repo("/mirror").bIsRepository = false;
  EXPECT_THROW(run(), mirror::common::NotARepositoryError);
}
