#include "manager/pipeline.hpp"

#include <unistd.h>

#include <algorithm>

#include "absl/memory/memory.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "glog/logging.h"
#include "google/protobuf/util/time_util.h"
#include "manager/verdict.hpp"
#include "util/errors.hpp"
#include "util/file.hpp"

namespace manager {

namespace {

using google::protobuf::util::TimeUtil;

int64_t MillisSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - start)
      .count();
}

proto::FailureReason PatchFailure(proto::PatchOutcome outcome) {
  switch (outcome) {
    case proto::PatchOutcome::PATCH_CONFLICT:
      return proto::FailureReason::REASON_PATCH_CONFLICT;
    case proto::PatchOutcome::PATCH_MALFORMED:
      return proto::FailureReason::REASON_PATCH_MALFORMED;
    case proto::PatchOutcome::PATCH_NO_OP:
      return proto::FailureReason::REASON_PATCH_NO_OP;
    default:
      return proto::FailureReason::REASON_NONE;
  }
}

std::string AgentFailureMessage(const agent::AgentResult& result) {
  switch (result.failure_reason) {
    case proto::FailureReason::REASON_AGENT_TIMEOUT:
      return "agent timed out";
    case proto::FailureReason::REASON_AGENT_CRASH_EXIT:
      return absl::StrCat("agent exited with ", result.exit_code);
    case proto::FailureReason::REASON_NO_PATCH_PRODUCED:
      return "agent produced no patch";
    default:
      return proto::FailureReason_Name(result.failure_reason);
  }
}

}  // namespace

std::string InstanceName(const std::string& instance_id,
                         const std::string& agent, int64_t sequence) {
  std::string name = absl::StrCat("pb-", getpid(), "-", sequence, "-");
  for (char c : absl::AsciiStrToLower(absl::StrCat(agent, "-", instance_id))) {
    bool safe = absl::ascii_isalnum(c) || c == '_' || c == '.' || c == '-';
    name += safe ? c : '-';
  }
  return name.substr(0, 128);
}

// State of one evaluation: the record being filled, the stage clock and the
// resources acquired so far.
class Pipeline::Attempt {
 public:
  Attempt(proto::ResultRecord* record, std::chrono::milliseconds budget)
      : record_(record),
        start_(std::chrono::steady_clock::now()),
        deadline_(start_ + budget) {}

  void Enter(proto::SpecState stage) {
    Close();
    stage_ = stage;
    stage_start_ = std::chrono::steady_clock::now();
    VLOG(1) << record_->instance_id() << ": "
            << proto::SpecState_Name(stage);
  }

  void Finish(proto::SpecState state, proto::Verdict verdict,
              proto::FailureReason reason, const std::string& message) {
    Close();
    record_->set_state(state);
    record_->set_verdict(verdict);
    record_->set_failure_reason(reason);
    record_->set_message(message);
  }

  // The smaller of cap and the time left to the spec. Throws
  // util::StageTimeout if no time is left.
  std::chrono::milliseconds Budget(std::chrono::milliseconds cap) const {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline_ - std::chrono::steady_clock::now());
    if (left.count() <= 0) {
      throw util::StageTimeout(
          absl::StrCat(record_->instance_id(), ": time budget exhausted in ",
                       proto::SpecState_Name(stage_)));
    }
    return std::min(cap, left);
  }

  void CheckTimeLeft() const { Budget(std::chrono::milliseconds::max()); }

  std::chrono::steady_clock::time_point Deadline() const { return deadline_; }

  int64_t ElapsedMillis() const { return MillisSince(start_); }

  proto::ResultRecord* record() const { return record_; }

  std::unique_ptr<container::InstanceGuard> guard;
  std::unique_ptr<container::Workspace> workspace;

 private:
  void Close() {
    if (stage_ == proto::SpecState::STATE_QUEUED) return;
    proto::StageTiming* timing = record_->add_stage_timing();
    timing->set_stage(stage_);
    *timing->mutable_duration() =
        TimeUtil::MillisecondsToDuration(MillisSince(stage_start_));
    stage_ = proto::SpecState::STATE_QUEUED;
  }

  proto::ResultRecord* record_;
  std::chrono::steady_clock::time_point start_;
  std::chrono::steady_clock::time_point deadline_;
  proto::SpecState stage_ = proto::SpecState::STATE_QUEUED;
  std::chrono::steady_clock::time_point stage_start_;
};

void Pipeline::RunStages(const proto::EvaluationSpec& spec,
                         agent::Agent* agent, Attempt* attempt) {
  proto::ResultRecord* record = attempt->record();
  const std::string& id = spec.instance_id();

  attempt->Enter(proto::SpecState::STATE_IMAGE_PREPARING);
  container::ImageRequest image_request;
  image_request.repo = spec.repo();
  image_request.environment = spec.environment();
  proto::CachedImage image = images_->Acquire(image_request, cancel_);
  record->set_image_fingerprint(image.fingerprint());
  attempt->CheckTimeLeft();

  std::string name = InstanceName(id, record->agent(), record->sequence());
  std::string host_dir = util::File::JoinPath(options_.workspace_root, name);
  util::File::MakeDirs(host_dir);
  container::ContainerSpec container;
  container.image = image.tag();
  container.name = name;
  container.limits = options_.limits;
  container::Mount workspace_mount;
  workspace_mount.host_path = host_dir;
  workspace_mount.container_path = container::InstanceWorkspace::kAgentDir;
  container.mounts.push_back(workspace_mount);
  attempt->guard = absl::make_unique<container::InstanceGuard>(
      manager_, manager_->Start(container));
  // Commands in the instance, tests included, end with the spec's budget.
  attempt->guard->Get()->SetDeadline(attempt->Deadline());
  attempt->workspace = workspace_factory_(attempt->guard->Get(), host_dir);
  container::Workspace* workspace = attempt->workspace.get();
  workspace->Checkout(spec.base_commit());

  patch::PatchOptions dry_run = options_.patch;
  dry_run.dry_run = true;
  proto::PatchApplication check =
      patch::Apply(workspace->BaseTree(), spec.test_patch(),
                   proto::PatchTarget::TARGET_TEST_PATCH, dry_run);
  if (check.outcome() == proto::PatchOutcome::PATCH_MALFORMED ||
      check.outcome() == proto::PatchOutcome::PATCH_CONFLICT) {
    LOG(WARNING) << id << ": test patch does not apply: " << check.message();
    *record->add_patch_application() = check;
    attempt->Finish(proto::SpecState::STATE_DONE,
                    proto::Verdict::VERDICT_UNRESOLVED,
                    PatchFailure(check.outcome()),
                    "test patch: " + check.message());
    return;
  }

  attempt->Enter(proto::SpecState::STATE_AGENT_RUNNING);
  workspace->PrepareAgentWorkspace();
  agent::AgentTask task;
  task.instance_id = id;
  task.prompt = spec.problem_statement();
  task.instance = attempt->guard->Get();
  task.workspace = workspace;
  task.timeout = attempt->Budget(options_.agent_timeout);
  agent::AgentResult result = agent->Run(task);
  *record->mutable_token_usage() = result.tokens;
  if (!result.Success()) {
    attempt->Finish(proto::SpecState::STATE_DONE,
                    proto::Verdict::VERDICT_UNRESOLVED, result.failure_reason,
                    AgentFailureMessage(result));
    return;
  }
  record->set_candidate_patch(result.patch);

  attempt->Enter(proto::SpecState::STATE_PATCH_VALIDATING);
  attempt->CheckTimeLeft();
  patch::PatchOptions apply = options_.patch;
  apply.dry_run = false;
  proto::PatchApplication test_patch =
      patch::Apply(workspace->BaseTree(), spec.test_patch(),
                   proto::PatchTarget::TARGET_TEST_PATCH, apply);
  *record->add_patch_application() = test_patch;
  if (test_patch.outcome() == proto::PatchOutcome::PATCH_MALFORMED ||
      test_patch.outcome() == proto::PatchOutcome::PATCH_CONFLICT) {
    attempt->Finish(proto::SpecState::STATE_DONE,
                    proto::Verdict::VERDICT_UNRESOLVED,
                    PatchFailure(test_patch.outcome()),
                    "test patch: " + test_patch.message());
    return;
  }
  workspace->ForkCandidate();
  // The test patch is authoritative for the files it touches.
  apply.exclude = patch::TouchedFiles(spec.test_patch());
  proto::PatchApplication candidate =
      patch::Apply(workspace->CandidateTree(), result.patch,
                   proto::PatchTarget::TARGET_CANDIDATE_PATCH, apply);
  *record->add_patch_application() = candidate;
  if (candidate.outcome() != proto::PatchOutcome::PATCH_APPLIED) {
    LOG(INFO) << id << ": candidate patch not applied: "
              << proto::PatchOutcome_Name(candidate.outcome());
    attempt->Finish(proto::SpecState::STATE_DONE,
                    proto::Verdict::VERDICT_UNRESOLVED,
                    PatchFailure(candidate.outcome()),
                    "candidate patch: " + candidate.message());
    return;
  }

  selector::Selection selection =
      selector::Select(spec, workspace->BaseTree(), options_.selection);
  record->set_tests_derived(selection.derived);
  if (selection.fail_to_pass.empty()) {
    attempt->Finish(proto::SpecState::STATE_DONE,
                    proto::Verdict::VERDICT_ERROR,
                    proto::FailureReason::REASON_NO_TESTS_SELECTED,
                    "no FAIL_TO_PASS tests");
    return;
  }

  PhaseRequest request;
  request.instance = attempt->guard->Get();
  request.instance_id = id;
  request.agent = record->agent();
  request.test_command = spec.environment().test_command().empty()
                             ? options_.test_command
                             : spec.environment().test_command();
  request.tests = selection.fail_to_pass;
  request.tests.insert(request.tests.end(), selection.pass_to_pass.begin(),
                       selection.pass_to_pass.end());

  attempt->Enter(proto::SpecState::STATE_TESTING_PRE);
  attempt->CheckTimeLeft();
  request.workdir = workspace->BaseDir();
  request.phase = proto::TestPhase::PHASE_PRE_PATCH;
  std::vector<proto::TestResult> pre = tests_->RunPhase(request);
  for (const proto::TestResult& outcome : pre) {
    *record->add_pre_patch() = outcome;
  }
  Outcomes pre_outcomes = ToOutcomes(pre);
  if (selection.derived) {
    size_t dropped = DropViolations(&selection, pre_outcomes);
    if (dropped > 0) {
      LOG(INFO) << id << ": dropped " << dropped
                << " derived tests with unexpected pre-patch outcomes";
    }
    if (!selection.fail_to_pass.empty() &&
        !ConfirmDerivedTests(spec, attempt, request, &selection)) {
      return;
    }
  }
  for (const std::string& test : selection.fail_to_pass) {
    record->add_fail_to_pass(test);
  }
  for (const std::string& test : selection.pass_to_pass) {
    record->add_pass_to_pass(test);
  }
  if (selection.fail_to_pass.empty() ||
      !PreconditionViolations(selection, pre_outcomes).empty()) {
    Scoring scoring = Score(selection, pre_outcomes, Outcomes());
    LOG(WARNING) << id << ": " << scoring.message;
    attempt->Finish(proto::SpecState::STATE_DONE, scoring.verdict,
                    scoring.failure_reason, scoring.message);
    return;
  }

  attempt->Enter(proto::SpecState::STATE_TESTING_POST);
  attempt->CheckTimeLeft();
  request.workdir = workspace->CandidateDir();
  request.phase = proto::TestPhase::PHASE_POST_PATCH;
  request.tests = selection.fail_to_pass;
  request.tests.insert(request.tests.end(), selection.pass_to_pass.begin(),
                       selection.pass_to_pass.end());
  std::vector<proto::TestResult> post = tests_->RunPhase(request);
  for (const proto::TestResult& outcome : post) {
    *record->add_post_patch() = outcome;
  }

  attempt->Enter(proto::SpecState::STATE_SCORED);
  Scoring scoring = Score(selection, pre_outcomes, ToOutcomes(post));
  attempt->Finish(proto::SpecState::STATE_DONE, scoring.verdict,
                  scoring.failure_reason, scoring.message);
}

bool Pipeline::ConfirmDerivedTests(const proto::EvaluationSpec& spec,
                                   Attempt* attempt, PhaseRequest request,
                                   selector::Selection* selection) {
  proto::ResultRecord* record = attempt->record();
  container::Workspace* workspace = attempt->workspace.get();
  attempt->CheckTimeLeft();
  workspace->ForkReference();
  patch::PatchOptions apply = options_.patch;
  apply.dry_run = false;
  apply.exclude = patch::TouchedFiles(spec.test_patch());
  proto::PatchApplication gold =
      patch::Apply(workspace->ReferenceTree(), spec.gold_patch(),
                   proto::PatchTarget::TARGET_GOLD_PATCH, apply);
  *record->add_patch_application() = gold;
  if (gold.outcome() != proto::PatchOutcome::PATCH_APPLIED) {
    std::string message =
        absl::StrCat("gold patch: ", proto::PatchOutcome_Name(gold.outcome()),
                     " ", gold.message());
    LOG(WARNING) << spec.instance_id() << ": " << message;
    attempt->Finish(proto::SpecState::STATE_DONE,
                    proto::Verdict::VERDICT_ERROR,
                    proto::FailureReason::REASON_NO_TESTS_SELECTED, message);
    return false;
  }

  request.workdir = workspace->ReferenceDir();
  request.phase = proto::TestPhase::PHASE_REFERENCE;
  request.tests = selection->fail_to_pass;
  request.tests.insert(request.tests.end(), selection->pass_to_pass.begin(),
                       selection->pass_to_pass.end());
  std::vector<proto::TestResult> reference = tests_->RunPhase(request);
  for (const proto::TestResult& outcome : reference) {
    *record->add_reference() = outcome;
  }
  size_t dropped = DropUnconfirmed(selection, ToOutcomes(reference));
  if (dropped > 0) {
    LOG(INFO) << spec.instance_id() << ": dropped " << dropped
              << " derived tests not passing with the gold patch";
  }
  return true;
}

agent::Agent* Pipeline::FindAgent(const std::string& name) const {
  if (agents_.empty()) throw util::FatalError("no agent configured");
  if (name.empty()) return agents_.front();
  for (agent::Agent* agent : agents_) {
    if (agent->Name() == name) return agent;
  }
  throw util::FatalError("unknown agent " + name);
}

proto::ResultRecord Pipeline::Process(const core::SpecTask& task) {
  const proto::EvaluationSpec& spec = task.spec;
  agent::Agent* agent = FindAgent(task.agent);
  proto::ResultRecord record;
  record.set_instance_id(spec.instance_id());
  record.set_sequence(task.sequence);
  record.set_repo(spec.repo());
  record.set_agent(agent->Name());
  *record.mutable_started() = TimeUtil::GetCurrentTime();
  LOG(INFO) << spec.instance_id() << ": starting";

  Attempt attempt(&record, options_.instance_timeout);
  auto fail = [&attempt, &spec](proto::SpecState state,
                                proto::FailureReason reason,
                                const std::exception& exc) {
    LOG(WARNING) << spec.instance_id() << ": "
                 << proto::FailureReason_Name(reason) << ": " << exc.what();
    attempt.Finish(state,
                   state == proto::SpecState::STATE_ABORTED
                       ? proto::Verdict::VERDICT_UNKNOWN
                       : proto::Verdict::VERDICT_ERROR,
                   reason, exc.what());
  };
  try {
    RunStages(spec, agent, &attempt);
  } catch (const util::FatalError&) {
    throw;
  } catch (const util::BuildFailure& exc) {
    fail(proto::SpecState::STATE_FAILED,
         proto::FailureReason::REASON_BUILD_FAILURE, exc);
  } catch (const util::BuildTimeout& exc) {
    fail(proto::SpecState::STATE_FAILED,
         proto::FailureReason::REASON_BUILD_TIMEOUT, exc);
  } catch (const util::EnvironmentFailure& exc) {
    fail(proto::SpecState::STATE_FAILED,
         proto::FailureReason::REASON_ENVIRONMENT_FAILURE, exc);
  } catch (const util::StageTimeout& exc) {
    fail(proto::SpecState::STATE_FAILED,
         proto::FailureReason::REASON_STAGE_TIMEOUT, exc);
  } catch (const util::CancellationRequested& exc) {
    fail(proto::SpecState::STATE_ABORTED,
         proto::FailureReason::REASON_CANCELLATION_REQUESTED, exc);
  } catch (const std::system_error& exc) {
    fail(proto::SpecState::STATE_FAILED, proto::FailureReason::REASON_IO_ERROR,
         exc);
  } catch (const std::runtime_error& exc) {
    fail(proto::SpecState::STATE_FAILED,
         proto::FailureReason::REASON_ENVIRONMENT_FAILURE, exc);
  }

  // Cleanup is not bounded by the spec's budget.
  if (attempt.guard) attempt.guard->Get()->ClearDeadline();
  if (attempt.workspace) attempt.workspace->Release();
  if (attempt.guard) attempt.guard->Destroy();
  *record.mutable_duration() =
      TimeUtil::MillisecondsToDuration(attempt.ElapsedMillis());
  return record;
}

}  // namespace manager
