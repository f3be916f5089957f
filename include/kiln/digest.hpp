#pragma once

#include "kiln/utility.hpp"

#include <string>
#include <string_view>

struct evp_md_ctx_st;

namespace kiln {

/// Lower-case hex MD5 of some content.
using Digest = std::string;

/**
 * @brief Computes the content digest of a byte sequence.
 * @return The hex digest, or an error if OpenSSL fails.
 */
Result<Digest> compute_digest(std::string_view bytes);

/**
 * @brief Incremental digest over several chunks, for fingerprints spanning many records.
 */
class DigestBuilder {
public:
    DigestBuilder();
    ~DigestBuilder();

    DigestBuilder(const DigestBuilder &) = delete;
    DigestBuilder &operator=(const DigestBuilder &) = delete;

    DigestBuilder &add(std::string_view bytes);
    Result<Digest> finish();

private:
    ::evp_md_ctx_st *ctx_;
    bool failed_ = false;
};

} // namespace kiln
