#include "core/FixupCommitter.hpp"

#include "common/Logger.hpp"
#include "core/BranchResolver.hpp"
#include "gitops/GitCliGateway.hpp"
#include "support/TempGitRepo.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>

using mirror::core::BranchResolver;
using mirror::core::FixupCommitter;
using mirror::core::FixupSettings;
using mirror::test::TempGitRepo;

class FixupFlowTest : public ::testing::Test {
 protected:
  void SetUp() override {
    if (!mirror::test::gitAvailable()) {
      GTEST_SKIP() << "git not available, skipping integration test";
    }
    mirror::common::Logger::init("warn");

    _upSource = std::make_unique<TempGitRepo>();
    _upSource->commitFile("src.cpp", "s\n", "source root");
    _upMirror = std::make_unique<TempGitRepo>();
    _upResolver = std::make_unique<BranchResolver>(_gw, _upSource->ref(), _upMirror->ref());
  }

  mirror::common::FixupOutcome runFixup(FixupSettings fsSettings = {}, bool bDryRun = false) {
    FixupCommitter fc(_gw, *_upResolver, _upMirror->ref(), std::move(fsSettings));
    return fc.run(bDryRun);
  }

  TempGitRepo& mirrorRepo() { return *_upMirror; }

  mirror::gitops::GitCliGateway _gw;
  std::unique_ptr<TempGitRepo> _upSource;
  std::unique_ptr<TempGitRepo> _upMirror;
  std::unique_ptr<BranchResolver> _upResolver;
};

TEST_F(FixupFlowTest, CleanMirrorIsNoOp) {
  mirrorRepo().commitFile("a.cpp", "1\n", "first");
  const auto sHead = mirrorRepo().head();

  auto foOutcome = runFixup();
  EXPECT_TRUE(foOutcome.bSucceeded);
  EXPECT_EQ(foOutcome.iFilesModified, 0);
  EXPECT_EQ(mirrorRepo().head(), sHead);
}

TEST_F(FixupFlowTest, EditIsFoldedIntoPreviousCommit) {
  mirrorRepo().commitFile("a.cpp", "1\n", "first");
  const auto sBase = mirrorRepo().commitFile("b.cpp", "1\n", "second");
  mirrorRepo().commitFile("c.cpp", "1\n", "third");
  mirrorRepo().write("b.cpp", "hand edit\n");

  auto foOutcome = runFixup();
  EXPECT_TRUE(foOutcome.bSucceeded) << foOutcome.sFailure;
  EXPECT_TRUE(foOutcome.bSquashed);
  EXPECT_EQ(foOutcome.sBaseCommit, sBase);
  EXPECT_EQ(foOutcome.iFilesModified, 1);

  EXPECT_EQ(mirrorRepo().commitCount(), 3);
  EXPECT_EQ(mirrorRepo().git({"show", "HEAD~1:b.cpp"}), "hand edit");
  EXPECT_EQ(mirrorRepo().git({"log", "--format=%s", "-1", "HEAD~1"}), "second");
  EXPECT_EQ(mirrorRepo().git({"status", "--porcelain"}), "");
}

TEST_F(FixupFlowTest, SingleCommitHistoryFoldsIntoRoot) {
  const auto sRoot = mirrorRepo().commitFile("a.cpp", "1\n", "root");
  mirrorRepo().write("a.cpp", "2\n");

  auto foOutcome = runFixup();
  EXPECT_TRUE(foOutcome.bSucceeded) << foOutcome.sFailure;
  EXPECT_EQ(foOutcome.sBaseCommit, sRoot);
  EXPECT_EQ(mirrorRepo().commitCount(), 1);
  EXPECT_EQ(mirrorRepo().read("a.cpp"), "2\n");
}

TEST_F(FixupFlowTest, WithoutAutosquashFixupCommitRemains) {
  mirrorRepo().commitFile("a.cpp", "1\n", "first");
  mirrorRepo().commitFile("b.cpp", "1\n", "second");
  mirrorRepo().write("a.cpp", "2\n");

  FixupSettings fsSettings;
  fsSettings.bAutosquash = false;
  auto foOutcome = runFixup(fsSettings);

  EXPECT_TRUE(foOutcome.bSucceeded);
  EXPECT_FALSE(foOutcome.bSquashed);
  EXPECT_EQ(mirrorRepo().commitCount(), 3);
  const std::string sMessage = mirrorRepo().lastMessage();
  EXPECT_EQ(sMessage.rfind("fixup! first", 0), 0u) << sMessage;
  EXPECT_NE(sMessage.find("Automated fixup for "), std::string::npos) << sMessage;
}

TEST_F(FixupFlowTest, UntrackedFilesAreNotCommitted) {
  mirrorRepo().commitFile("a.cpp", "1\n", "first");
  mirrorRepo().write("scratch.cpp", "tmp\n");
  const auto sHead = mirrorRepo().head();

  auto foOutcome = runFixup();
  EXPECT_TRUE(foOutcome.bSucceeded);
  EXPECT_EQ(foOutcome.iFilesModified, 0);
  EXPECT_EQ(mirrorRepo().head(), sHead);
  EXPECT_TRUE(mirrorRepo().exists("scratch.cpp"));
}

TEST_F(FixupFlowTest, DryRunWithOnlyUntrackedFilesIsNoOp) {
  mirrorRepo().commitFile("a.cpp", "1\n", "first");
  mirrorRepo().commitFile("b.cpp", "1\n", "second");
  mirrorRepo().write("scratch.cpp", "tmp\n");

  auto foOutcome = runFixup({}, true);
  EXPECT_TRUE(foOutcome.bSucceeded);
  EXPECT_TRUE(foOutcome.sBaseCommit.empty());
  EXPECT_EQ(mirrorRepo().git({"status", "--porcelain"}), "?? scratch.cpp");
}

TEST_F(FixupFlowTest, ConflictKeepsFixupCommitAndCleanState) {
  mirrorRepo().commitFile("a.cpp", "1\n", "first");
  mirrorRepo().commitFile("b.cpp", "1\n", "second");
  // b.cpp is introduced by HEAD, so folding the edit into HEAD~1 conflicts
  mirrorRepo().write("b.cpp", "2\n");

  auto foOutcome = runFixup();
  EXPECT_FALSE(foOutcome.bSucceeded);
  ASSERT_TRUE(foOutcome.oFixupCommit.has_value());
  EXPECT_EQ(mirrorRepo().head(), *foOutcome.oFixupCommit);
  EXPECT_EQ(mirrorRepo().commitCount(), 3);
  EXPECT_FALSE(std::filesystem::exists(mirrorRepo().path() / ".git" / "rebase-merge"));
  EXPECT_EQ(mirrorRepo().git({"branch", "--show-current"}), "main");
}

TEST_F(FixupFlowTest, DryRunChangesNothing) {
  mirrorRepo().commitFile("a.cpp", "1\n", "first");
  mirrorRepo().write("a.cpp", "2\n");
  const auto sHead = mirrorRepo().head();

  auto foOutcome = runFixup({}, true);
  EXPECT_TRUE(foOutcome.bSucceeded);
  EXPECT_FALSE(foOutcome.oFixupCommit.has_value());
  EXPECT_EQ(mirrorRepo().head(), sHead);
  EXPECT_EQ(mirrorRepo().git({"status", "--porcelain"}), " M a.cpp");
}
