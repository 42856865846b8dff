#ifndef PATCH_PATCH_ANALYZER_HPP
#define PATCH_PATCH_ANALYZER_HPP

#include <set>
#include <string>

#include "patch/working_tree.hpp"
#include "proto/result.pb.h"

namespace patch {

struct PatchOptions {
  // Maximum number of context lines dropped from each end of a hunk.
  int fuzz = 2;
  // Maximum distance, in lines, between the expected and the actual
  // position of a hunk.
  int max_offset = 200;
  // Only check whether the diff applies, do not touch the tree.
  bool dry_run = false;
  // Changes to these paths are ignored.
  std::set<std::string> exclude;
};

// Applies a git or unified diff to the tree. The application is all or
// nothing: the tree is modified only if every hunk of every file can be
// placed. Throws only if writing to the tree fails, after restoring the
// files already written.
proto::PatchApplication Apply(WorkingTree* tree, const std::string& diff,
                              proto::PatchTarget target,
                              const PatchOptions& options);

// The paths touched by the diff, both before and after renames. Returns an
// empty set if the diff cannot be parsed.
std::set<std::string> TouchedFiles(const std::string& diff);

}  // namespace patch

#endif
