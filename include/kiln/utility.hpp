#pragma once

#include "kiln/asset_id.hpp"

#include <expected>
#include <string>
#include <utility>
#include <vector>

namespace kiln {

enum class ErrorKind {
    Generic,
    Io,
    InvalidBuildAction,
    UnexpectedExistingOutputs,
    MissingGraphNode,
    VersionMismatch,
    DuplicateOutput,
};

/**
 * @brief Error payload carried by `Result`.
 *
 * Implicitly constructible from a message so plain `std::unexpected("...")`
 * keeps working for generic failures. Fatal conditions that concern specific
 * assets list them in `assets`.
 */
struct Error {
    ErrorKind kind = ErrorKind::Generic;
    std::string message;
    std::vector<AssetId> assets;

    Error(std::string msg) : message(std::move(msg)) {
    }
    Error(const char *msg) : message(msg) {
    }
    Error(ErrorKind k, std::string msg, std::vector<AssetId> ids = {})
        : kind(k), message(std::move(msg)), assets(std::move(ids)) {
    }
};

template <typename T>
using Result = std::expected<T, Error>;

} // namespace kiln
