#pragma once

#include "kiln/asset_id.hpp"
#include "kiln/asset_io.hpp"
#include "kiln/logging.hpp"
#include "kiln/options.hpp"
#include "kiln/utility.hpp"

#include <vector>

namespace kiln {

struct ConflictPolicy {
    bool delete_files_by_default = false;
    bool assume_tty = false;
};

/// States of the interactive prompt.
enum class PromptState { Prompting, ResolvedDelete, ResolvedAbort };

/**
 * @brief Reads one answer and advances the prompt.
 *
 * `y` resolves to delete, `n` (or a closed input stream) to abort, `l` lists
 * the conflicts; anything else is reported and asked again.
 */
PromptState advance_prompt(const std::vector<AssetId> &conflicts, const Terminal &terminal);

/**
 * @brief Handles declared outputs that already exist before the first build.
 *
 * Deletes them when `delete_files_by_default` is set; otherwise asks on the
 * terminal, failing with `ErrorKind::UnexpectedExistingOutputs` when there is
 * nobody to ask or the user refuses. Nothing happens for an empty set.
 */
Result<void> resolve_conflicting_outputs(const AssetIdSet &conflicts,
                                         const ConflictPolicy &policy,
                                         const Terminal &terminal,
                                         const Logger &logger,
                                         const DeleteCallback &delete_fn);

/** @brief The error reported for outputs that may not be deleted. */
Error unexpected_existing_outputs(const AssetIdSet &conflicts);

} // namespace kiln
