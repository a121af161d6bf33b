#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "internal/classify/sibling_probe.hpp"
#include "internal/config/settings.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/model/stage_record.hpp"
#include "internal/model/decision.hpp"

namespace photosift::core {

struct ClassifySummary {
  std::size_t                        examined  = 0; // photos without a prior decision
  std::size_t                        rejected  = 0;
  std::size_t                        separated = 0;
  std::size_t                        undecided = 0;
  std::map<std::string, std::size_t> by_rule;
};

struct GroupSummary {
  model::LinkageMode                 linkage          = model::LinkageMode::kSingle;
  std::size_t                        candidates       = 0;
  std::size_t                        skipped_unhashed = 0; // no usable primary hash (includes off-width ones)
  std::size_t                        off_width        = 0; // hashes whose width differs from the rest
  std::size_t                        groups           = 0;
  std::size_t                        grouped_photos   = 0;
  std::size_t                        singletons       = 0;
  std::size_t                        unlinked_pairs   = 0;
  std::size_t                        resumed_blocks   = 0;
  std::size_t                        scanned_blocks   = 0;
  std::map<std::size_t, std::size_t> size_distribution; // group size -> number of groups
};

struct ResolveSummary {
  std::size_t                        groups           = 0;
  std::size_t                        rejected         = 0;
  std::size_t                        kept             = 0;
  std::size_t                        halted_groups    = 0;
  std::size_t                        aggregated_paths = 0;
  std::map<std::string, std::size_t> by_rule;
};

struct RunSummary {
  ClassifySummary classify;
  GroupSummary    group;
  ResolveSummary  resolve;
};

struct ImportSummary {
  std::size_t imported        = 0;
  std::size_t already_hashed  = 0; // target kept its own hashes
  std::size_t unknown_photos  = 0; // not present in the target
  std::size_t source_unhashed = 0;
  std::size_t off_width       = 0; // width differs from the target's hashes
};

struct StatusReport {
  std::size_t photos = 0;
  std::size_t hashed = 0;

  std::size_t                        rejected  = 0;
  std::size_t                        separated = 0;
  std::map<std::string, std::size_t> decisions_by_rule;

  std::size_t groups         = 0;
  std::size_t grouped_photos = 0;

  std::size_t                        group_rejected = 0;
  std::map<std::string, std::size_t> group_rejections_by_rule;
  std::size_t                        aggregated_paths = 0;

  std::vector<db::model::StageRecord> history;
};

/*
  Pipeline

  Runs the three decision stages against a repository:

    classify -> group -> resolve

  Each stage reads, decides and writes inside one transaction; a failure
  anywhere rolls that stage back and leaves earlier stages as committed.
  The pairwise scan is the exception: every finished row block is committed
  on its own so an interrupted group stage resumes where it stopped.
*/
class Pipeline {
 public:
  Pipeline(std::shared_ptr<db::Repository> repository, config::Settings settings, std::shared_ptr<const classify::SiblingProbe> probe);

  // Decides every photo without a decision; clear=true re-decides all.
  ClassifySummary Classify(bool clear);

  // Re-clusters every undecided hashed photo. Replaces memberships and
  // invalidates earlier group rejections. clear=true drops scan progress.
  GroupSummary Group(bool clear);

  // Recomputes group rejections and aggregated paths from the memberships.
  ResolveSummary Resolve();

  RunSummary Run(bool clear);

  // Copies hashes from another photosift database for photos that have none.
  ImportSummary ImportHashes(db::Repository& source);

  StatusReport Status();

 private:
  void RecordStage(db::Transaction& tx, const std::string& stage, std::uint64_t count, const std::string& linkage, const std::string& notes);

  std::shared_ptr<db::Repository>               repository_;
  config::Settings                              settings_;
  std::shared_ptr<const classify::SiblingProbe> probe_;
};

} // namespace photosift::core
