#include "kiln/conflict_resolution.hpp"

#include "kiln/constants.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <print>
#include <string>

namespace kiln {

namespace {

std::vector<AssetId> sorted(const AssetIdSet &ids) {
    std::vector<AssetId> out(ids.begin(), ids.end());
    std::sort(out.begin(), out.end());
    return out;
}

std::string normalize_answer(std::string input) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    input.erase(input.begin(), std::find_if(input.begin(), input.end(), not_space));
    input.erase(std::find_if(input.rbegin(), input.rend(), not_space).base(), input.end());
    std::transform(input.begin(), input.end(), input.begin(), [](unsigned char c) { return std::tolower(c); });
    return input;
}

Result<void> delete_all(const std::vector<AssetId> &conflicts, const DeleteCallback &delete_fn) {
    for (const auto &id : conflicts) {
        if (auto res = delete_fn(id); !res) {
            return res;
        }
    }
    return {};
}

} // namespace

Error unexpected_existing_outputs(const AssetIdSet &conflicts) {
    std::vector<AssetId> ids = sorted(conflicts);
    std::string message = std::format("Found {} declared outputs which already exist on disk:", ids.size());
    for (const auto &id : ids) {
        message += std::format("\n  - {}", id);
    }
    return Error(ErrorKind::UnexpectedExistingOutputs, std::move(message), std::move(ids));
}

PromptState advance_prompt(const std::vector<AssetId> &conflicts, const Terminal &terminal) {
    std::ostream &out = *terminal.out;
    std::print(out, "\nDelete these files (y/n) (or list them (l))?: ");
    out.flush();

    std::string line;
    if (!std::getline(*terminal.in, line)) {
        // A closed input can never confirm.
        std::println(out, "");
        return PromptState::ResolvedAbort;
    }

    const std::string answer = normalize_answer(line);
    if (answer == "y") {
        std::println(out, "Deleting files...");
        return PromptState::ResolvedDelete;
    }
    if (answer == "n") {
        return PromptState::ResolvedAbort;
    }
    if (answer == "l") {
        for (const auto &id : conflicts) {
            std::println(out, "{}", id);
        }
        return PromptState::Prompting;
    }
    std::println(out, "Unrecognized option {}, (y/n/l) expected.", line);
    return PromptState::Prompting;
}

Result<void> resolve_conflicting_outputs(const AssetIdSet &conflicts,
                                         const ConflictPolicy &policy,
                                         const Terminal &terminal,
                                         const Logger &logger,
                                         const DeleteCallback &delete_fn) {
    if (conflicts.empty()) {
        return {};
    }
    const std::vector<AssetId> ids = sorted(conflicts);

    if (policy.delete_files_by_default) {
        logger.info("Deleting {} declared outputs which already existed on disk.", ids.size());
        return delete_all(ids, delete_fn);
    }

    logger.info("Found {} declared outputs which already exist on disk. This is likely because the `{}` folder was "
                "deleted, or you are submitting generated files to your source repository.",
                ids.size(),
                cache_dir);

    if (!policy.assume_tty && !terminal.interactive) {
        return std::unexpected(unexpected_existing_outputs(conflicts));
    }

    std::println(*terminal.out, "");
    PromptState state = PromptState::Prompting;
    while (state == PromptState::Prompting) {
        state = advance_prompt(ids, terminal);
    }
    if (state == PromptState::ResolvedAbort) {
        return std::unexpected(unexpected_existing_outputs(conflicts));
    }
    return delete_all(ids, delete_fn);
}

} // namespace kiln
