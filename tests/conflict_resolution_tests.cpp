#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "kiln/conflict_resolution.hpp"

namespace {

using kiln::AssetId;
using kiln::AssetIdSet;
using kiln::ConflictPolicy;
using kiln::PromptState;

struct TestCase {
    const char *name;
    const char *intent;
    std::function<bool(void)> run;
};

const AssetIdSet kConflicts = {{"app", "lib/b.g.dart"}, {"app", "lib/a.g.dart"}};

/// Scripted terminal plus a recording delete callback.
struct Harness {
    explicit Harness(std::string answers, bool interactive = true)
        : in(std::move(answers)), logger("kiln", log), terminal{&in, &out, interactive} {
    }

    kiln::Result<void> resolve(ConflictPolicy policy, const AssetIdSet &conflicts = kConflicts) {
        return kiln::resolve_conflicting_outputs(conflicts, policy, terminal, logger, [this](const AssetId &id) {
            deleted.push_back(id);
            return kiln::Result<void>{};
        });
    }

    std::istringstream in;
    std::ostringstream out;
    std::ostringstream log;
    kiln::Logger logger;
    kiln::Terminal terminal;
    std::vector<AssetId> deleted;
};

const std::vector<AssetId> kSorted = {{"app", "lib/a.g.dart"}, {"app", "lib/b.g.dart"}};

bool test_empty_conflicts_are_noop() {
    Harness harness("", false);
    auto res = harness.resolve({}, {});
    return res && harness.deleted.empty() && harness.out.str().empty() && harness.log.str().empty();
}

bool test_delete_by_default_skips_prompt() {
    Harness harness("", false);
    auto res = harness.resolve({.delete_files_by_default = true});
    return res && harness.deleted == kSorted && harness.out.str().empty() &&
           harness.log.str().find("Deleting 2 declared outputs") != std::string::npos;
}

// Intent: nobody to ask means refusing, never guessing.
bool test_non_interactive_fails() {
    Harness harness("y\n", false);
    auto res = harness.resolve({});
    return !res && res.error().kind == kiln::ErrorKind::UnexpectedExistingOutputs && res.error().assets == kSorted &&
           res.error().message.find("app|lib/a.g.dart") != std::string::npos && harness.deleted.empty() &&
           harness.out.str().empty();
}

bool test_assume_tty_prompts_anyway() {
    Harness harness("y\n", false);
    auto res = harness.resolve({.assume_tty = true});
    return res && harness.deleted == kSorted && harness.out.str().find("Deleting files...") != std::string::npos;
}

bool test_answer_yes_deletes() {
    Harness harness("  Y \n");
    auto res = harness.resolve({});
    return res && harness.deleted == kSorted &&
           harness.out.str().find("Delete these files (y/n) (or list them (l))?: ") != std::string::npos;
}

bool test_answer_no_aborts() {
    Harness harness("n\n");
    auto res = harness.resolve({});
    return !res && res.error().kind == kiln::ErrorKind::UnexpectedExistingOutputs && harness.deleted.empty();
}

// Intent: listing and unknown answers re-prompt until a decision is made.
bool test_list_and_unrecognized_reprompt() {
    Harness harness("l\nmaybe\ny\n");
    auto res = harness.resolve({});
    const std::string out = harness.out.str();
    size_t prompts = 0;
    for (size_t pos = out.find("Delete these files"); pos != std::string::npos;
         pos = out.find("Delete these files", pos + 1)) {
        ++prompts;
    }
    const size_t first = out.find("app|lib/a.g.dart");
    const size_t second = out.find("app|lib/b.g.dart");
    return res && harness.deleted == kSorted && prompts == 3 && first != std::string::npos &&
           second != std::string::npos && first < second &&
           out.find("Unrecognized option maybe, (y/n/l) expected.") != std::string::npos;
}

bool test_closed_input_aborts() {
    Harness harness("l\n");
    auto res = harness.resolve({});
    return !res && res.error().kind == kiln::ErrorKind::UnexpectedExistingOutputs && harness.deleted.empty();
}

bool test_prompt_state_machine_steps() {
    Harness harness("l\nx\nn\n");
    const std::vector<AssetId> ids = kSorted;
    return kiln::advance_prompt(ids, harness.terminal) == PromptState::Prompting &&
           kiln::advance_prompt(ids, harness.terminal) == PromptState::Prompting &&
           kiln::advance_prompt(ids, harness.terminal) == PromptState::ResolvedAbort &&
           kiln::advance_prompt(ids, harness.terminal) == PromptState::ResolvedAbort;
}

bool test_delete_failure_propagates() {
    Harness harness("", false);
    auto res = kiln::resolve_conflicting_outputs(
        kConflicts, {.delete_files_by_default = true}, harness.terminal, harness.logger, [](const AssetId &id) {
            return kiln::Result<void>(std::unexpected(kiln::Error(kiln::ErrorKind::Io, "read-only", {id})));
        });
    return !res && res.error().kind == kiln::ErrorKind::Io && res.error().assets == std::vector<AssetId>{kSorted[0]};
}

} // namespace

int main() {
    const std::vector<TestCase> tests = {
        {"Conflicts_Empty", "no conflicts means nothing to do", test_empty_conflicts_are_noop},
        {"Conflicts_DeleteByDefault", "policy deletes without prompting", test_delete_by_default_skips_prompt},
        {"Conflicts_NonInteractive", "non-interactive run fails with the ids", test_non_interactive_fails},
        {"Conflicts_AssumeTty", "assume-tty prompts without a terminal", test_assume_tty_prompts_anyway},
        {"Prompt_Yes", "y deletes every conflict", test_answer_yes_deletes},
        {"Prompt_No", "n aborts with the conflict error", test_answer_no_aborts},
        {"Prompt_ListUnknown", "l lists, unknown answers re-prompt", test_list_and_unrecognized_reprompt},
        {"Prompt_ClosedInput", "end of input aborts", test_closed_input_aborts},
        {"Prompt_States", "prompt steps through its states", test_prompt_state_machine_steps},
        {"Conflicts_DeleteFailure", "a failed delete is reported", test_delete_failure_propagates},
    };

    bool all_passed = true;
    for (const TestCase &test : tests) {
        const bool passed = test.run();
        std::cout << (passed ? "[PASS] " : "[FAIL] ") << test.name << " - " << test.intent << "\n";
        all_passed = all_passed && passed;
    }

    if (!all_passed) {
        std::cerr << "conflict resolution tests failed\n";
        return 1;
    }

    std::cout << "conflict resolution tests passed (" << tests.size() << " cases)\n";
    return 0;
}
