#include "patch/patch_analyzer.hpp"

#include <map>
#include <stdexcept>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::ElementsAre;
using ::testing::UnorderedElementsAre;

const char kTenLines[] =
    "line1\nline2\nline3\nline4\nline5\nline6\nline7\nline8\nline9\nline10\n";

const char kChangeLine5[] =
    "diff --git a/a.py b/a.py\n"
    "--- a/a.py\n"
    "+++ b/a.py\n"
    "@@ -4,3 +4,3 @@\n"
    " line4\n"
    "-line5\n"
    "+LINE5\n"
    " line6\n";

proto::PatchApplication ApplyTo(patch::WorkingTree* tree,
                                const std::string& diff,
                                patch::PatchOptions options = {}) {
  return patch::Apply(tree, diff, proto::PatchTarget::TARGET_CANDIDATE_PATCH,
                      options);
}

// NOLINTNEXTLINE
TEST(PatchAnalyzer, AppliesAtExpectedPosition) {
  patch::MemoryTree tree(std::map<std::string, std::string>{{"a.py", kTenLines}});
  proto::PatchApplication result = ApplyTo(&tree, kChangeLine5);
  EXPECT_EQ(result.outcome(), proto::PatchOutcome::PATCH_APPLIED);
  EXPECT_EQ(result.target(), proto::PatchTarget::TARGET_CANDIDATE_PATCH);
  EXPECT_THAT(result.changed_files(), ElementsAre("a.py"));
  EXPECT_EQ(*tree.ReadFile("a.py"),
            "line1\nline2\nline3\nline4\nLINE5\nline6\nline7\nline8\nline9\n"
            "line10\n");
}

// NOLINTNEXTLINE
TEST(PatchAnalyzer, AppliesWithOffset) {
  patch::MemoryTree tree(std::map<std::string, std::string>{{"a.py", std::string("x\ny\n") + kTenLines}});
  proto::PatchApplication result = ApplyTo(&tree, kChangeLine5);
  EXPECT_EQ(result.outcome(), proto::PatchOutcome::PATCH_APPLIED);
  EXPECT_EQ(*tree.ReadFile("a.py"),
            "x\ny\nline1\nline2\nline3\nline4\nLINE5\nline6\nline7\nline8\n"
            "line9\nline10\n");
}

// NOLINTNEXTLINE
TEST(PatchAnalyzer, OffsetIsBounded) {
  patch::MemoryTree tree(std::map<std::string, std::string>{{"a.py", std::string("x\ny\n") + kTenLines}});
  patch::PatchOptions options;
  options.max_offset = 1;
  options.fuzz = 0;
  EXPECT_EQ(ApplyTo(&tree, kChangeLine5, options).outcome(),
            proto::PatchOutcome::PATCH_CONFLICT);
}

// NOLINTNEXTLINE
TEST(PatchAnalyzer, AppliesWithFuzz) {
  const char drifted[] = "line1\nline2\nline3\nchanged4\nline5\nline6\n";
  patch::MemoryTree tree(std::map<std::string, std::string>{{"a.py", drifted}});
  patch::PatchOptions options;
  options.fuzz = 0;
  EXPECT_EQ(ApplyTo(&tree, kChangeLine5, options).outcome(),
            proto::PatchOutcome::PATCH_CONFLICT);
  EXPECT_EQ(*tree.ReadFile("a.py"), drifted);

  options.fuzz = 1;
  EXPECT_EQ(ApplyTo(&tree, kChangeLine5, options).outcome(),
            proto::PatchOutcome::PATCH_APPLIED);
  EXPECT_EQ(*tree.ReadFile("a.py"),
            "line1\nline2\nline3\nchanged4\nLINE5\nline6\n");
}

// NOLINTNEXTLINE
TEST(PatchAnalyzer, ConflictLeavesTreeUnchanged) {
  std::map<std::string, std::string> files = {{"a.py", kTenLines},
                                              {"b.py", "one\ntwo\n"}};
  patch::MemoryTree tree(files);
  std::string diff = std::string(kChangeLine5) +
                     "diff --git a/b.py b/b.py\n"
                     "--- a/b.py\n"
                     "+++ b/b.py\n"
                     "@@ -1,2 +1,2 @@\n"
                     " one\n"
                     "-three\n"
                     "+four\n";
  proto::PatchApplication result = ApplyTo(&tree, diff);
  EXPECT_EQ(result.outcome(), proto::PatchOutcome::PATCH_CONFLICT);
  EXPECT_THAT(result.message(), ::testing::HasSubstr("b.py"));
  EXPECT_TRUE(result.changed_files().empty());
  EXPECT_EQ(tree.Files(), files);
}

// NOLINTNEXTLINE
TEST(PatchAnalyzer, MissingFileIsConflict) {
  patch::MemoryTree tree;
  EXPECT_EQ(ApplyTo(&tree, kChangeLine5).outcome(),
            proto::PatchOutcome::PATCH_CONFLICT);
}

// NOLINTNEXTLINE
TEST(PatchAnalyzer, AlreadyAppliedIsNoOp) {
  patch::MemoryTree tree(std::map<std::string, std::string>{{"a.py", kTenLines}});
  ASSERT_EQ(ApplyTo(&tree, kChangeLine5).outcome(),
            proto::PatchOutcome::PATCH_APPLIED);
  std::map<std::string, std::string> after = tree.Files();
  EXPECT_EQ(ApplyTo(&tree, kChangeLine5).outcome(),
            proto::PatchOutcome::PATCH_NO_OP);
  EXPECT_EQ(tree.Files(), after);
}

// NOLINTNEXTLINE
TEST(PatchAnalyzer, NewDeletedAndRenamedFiles) {
  patch::MemoryTree tree(std::map<std::string, std::string>{{"gone.py", "a\nb\n"}, {"old.py", "x = 1\n"}});
  const char diff[] =
      "diff --git a/tests/test_new.py b/tests/test_new.py\n"
      "new file mode 100644\n"
      "--- /dev/null\n"
      "+++ b/tests/test_new.py\n"
      "@@ -0,0 +1,2 @@\n"
      "+def test_x():\n"
      "+    assert True\n"
      "diff --git a/gone.py b/gone.py\n"
      "deleted file mode 100644\n"
      "--- a/gone.py\n"
      "+++ /dev/null\n"
      "@@ -1,2 +0,0 @@\n"
      "-a\n"
      "-b\n"
      "diff --git a/old.py b/new.py\n"
      "similarity index 50%\n"
      "rename from old.py\n"
      "rename to new.py\n"
      "--- a/old.py\n"
      "+++ b/new.py\n"
      "@@ -1 +1 @@\n"
      "-x = 1\n"
      "+x = 2\n";
  proto::PatchApplication result = ApplyTo(&tree, diff);
  EXPECT_EQ(result.outcome(), proto::PatchOutcome::PATCH_APPLIED);
  EXPECT_THAT(result.changed_files(),
              UnorderedElementsAre("tests/test_new.py", "gone.py", "old.py",
                                   "new.py"));
  std::map<std::string, std::string> expected = {
      {"tests/test_new.py", "def test_x():\n    assert True\n"},
      {"new.py", "x = 2\n"}};
  EXPECT_EQ(tree.Files(), expected);

  EXPECT_EQ(ApplyTo(&tree, diff).outcome(), proto::PatchOutcome::PATCH_NO_OP);
}

// NOLINTNEXTLINE
TEST(PatchAnalyzer, NewFileClashingWithExistingOne) {
  patch::MemoryTree tree(std::map<std::string, std::string>{{"new.py", "something else\n"}});
  EXPECT_EQ(ApplyTo(&tree,
                    "--- /dev/null\n"
                    "+++ b/new.py\n"
                    "@@ -0,0 +1 @@\n"
                    "+content\n")
                .outcome(),
            proto::PatchOutcome::PATCH_CONFLICT);
}

// NOLINTNEXTLINE
TEST(PatchAnalyzer, NoNewlineAtEndOfFile) {
  patch::MemoryTree tree(std::map<std::string, std::string>{{"f.txt", "old"}});
  EXPECT_EQ(ApplyTo(&tree,
                    "--- a/f.txt\n"
                    "+++ b/f.txt\n"
                    "@@ -1 +1 @@\n"
                    "-old\n"
                    "\\ No newline at end of file\n"
                    "+new\n"
                    "\\ No newline at end of file\n")
                .outcome(),
            proto::PatchOutcome::PATCH_APPLIED);
  EXPECT_EQ(*tree.ReadFile("f.txt"), "new");
}

// NOLINTNEXTLINE
TEST(PatchAnalyzer, DryRunDoesNotTouchTheTree) {
  patch::MemoryTree tree(std::map<std::string, std::string>{{"a.py", kTenLines}});
  patch::PatchOptions options;
  options.dry_run = true;
  proto::PatchApplication result = ApplyTo(&tree, kChangeLine5, options);
  EXPECT_EQ(result.outcome(), proto::PatchOutcome::PATCH_APPLIED);
  EXPECT_THAT(result.changed_files(), ElementsAre("a.py"));
  EXPECT_EQ(*tree.ReadFile("a.py"), kTenLines);
}

// NOLINTNEXTLINE
TEST(PatchAnalyzer, ExcludedFilesAreIgnored) {
  patch::MemoryTree tree(std::map<std::string, std::string>{{"a.py", kTenLines}});
  std::string diff = std::string(kChangeLine5) +
                     "--- /dev/null\n"
                     "+++ b/tests/test_a.py\n"
                     "@@ -0,0 +1 @@\n"
                     "+def test_a(): pass\n";
  patch::PatchOptions options;
  options.exclude = {"tests/test_a.py"};
  proto::PatchApplication result = ApplyTo(&tree, diff, options);
  EXPECT_EQ(result.outcome(), proto::PatchOutcome::PATCH_APPLIED);
  EXPECT_THAT(result.changed_files(), ElementsAre("a.py"));
  EXPECT_FALSE(tree.ReadFile("tests/test_a.py").has_value());

  options.exclude = {"a.py", "tests/test_a.py"};
  EXPECT_EQ(ApplyTo(&tree, diff, options).outcome(),
            proto::PatchOutcome::PATCH_NO_OP);
}

// NOLINTNEXTLINE
TEST(PatchAnalyzer, Malformed) {
  patch::MemoryTree tree(std::map<std::string, std::string>{{"img.png", "\x89PNG"}});
  EXPECT_EQ(ApplyTo(&tree, "").outcome(), proto::PatchOutcome::PATCH_MALFORMED);
  EXPECT_EQ(ApplyTo(&tree, "not a diff\n").outcome(),
            proto::PatchOutcome::PATCH_MALFORMED);
  EXPECT_EQ(ApplyTo(&tree,
                    "diff --git a/img.png b/img.png\n"
                    "index 1111111..2222222 100644\n"
                    "Binary files a/img.png and b/img.png differ\n")
                .outcome(),
            proto::PatchOutcome::PATCH_MALFORMED);
}

class FailingTree : public patch::MemoryTree {
 public:
  using patch::MemoryTree::MemoryTree;
  void WriteFile(const std::string& path, const std::string& content) override {
    if (path == fail_on && failures < max_failures) {
      failures++;
      if (truncate) patch::MemoryTree::WriteFile(path, "");
      throw std::runtime_error("disk full");
    }
    patch::MemoryTree::WriteFile(path, content);
  }
  std::string fail_on;
  // Empty the file before failing, like a write interrupted halfway.
  bool truncate = false;
  int max_failures = 1000;
  int failures = 0;
};

// NOLINTNEXTLINE
TEST(PatchAnalyzer, FailedWriteIsRolledBack) {
  std::map<std::string, std::string> files = {{"a.py", kTenLines},
                                              {"b.py", "one\ntwo\n"}};
  FailingTree tree(files);
  tree.fail_on = "b.py";
  std::string diff = std::string(kChangeLine5) +
                     "--- a/b.py\n"
                     "+++ b/b.py\n"
                     "@@ -1,2 +1,2 @@\n"
                     " one\n"
                     "-two\n"
                     "+three\n";
  EXPECT_THROW(ApplyTo(&tree, diff), std::runtime_error);
  EXPECT_EQ(tree.Files(), files);
}

// NOLINTNEXTLINE
TEST(PatchAnalyzer, HalfWrittenFileIsRestored) {
  std::map<std::string, std::string> files = {{"a.py", kTenLines},
                                              {"b.py", "one\ntwo\n"}};
  FailingTree tree(files);
  tree.fail_on = "b.py";
  tree.truncate = true;
  tree.max_failures = 1;
  std::string diff = std::string(kChangeLine5) +
                     "--- a/b.py\n"
                     "+++ b/b.py\n"
                     "@@ -1,2 +1,2 @@\n"
                     " one\n"
                     "-two\n"
                     "+three\n";
  EXPECT_THROW(ApplyTo(&tree, diff), std::runtime_error);
  EXPECT_EQ(tree.failures, 1);
  EXPECT_EQ(tree.Files(), files);
}

// NOLINTNEXTLINE
TEST(PatchAnalyzer, TouchedFiles) {
  EXPECT_THAT(patch::TouchedFiles(kChangeLine5), ElementsAre("a.py"));
  EXPECT_TRUE(patch::TouchedFiles("garbage").empty());
}

}  // namespace
