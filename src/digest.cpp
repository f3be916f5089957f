#include "kiln/digest.hpp"

#include <array>
#include <format>
#include <openssl/evp.h>

namespace kiln {

namespace {

std::string to_hex(const unsigned char *data, unsigned int len) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out.push_back(hex_chars[data[i] >> 4]);
        out.push_back(hex_chars[data[i] & 0x0f]);
    }
    return out;
}

} // namespace

Result<Digest> compute_digest(std::string_view bytes) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
    unsigned int len = 0;
    if (EVP_Digest(bytes.data(), bytes.size(), md.data(), &len, EVP_md5(), nullptr) != 1) {
        return std::unexpected("Failed to compute md5 digest");
    }
    return to_hex(md.data(), len);
}

DigestBuilder::DigestBuilder() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_ || EVP_DigestInit_ex(ctx_, EVP_md5(), nullptr) != 1) {
        failed_ = true;
    }
}

DigestBuilder::~DigestBuilder() {
    if (ctx_) {
        EVP_MD_CTX_free(ctx_);
    }
}

DigestBuilder &DigestBuilder::add(std::string_view bytes) {
    if (!failed_ && EVP_DigestUpdate(ctx_, bytes.data(), bytes.size()) != 1) {
        failed_ = true;
    }
    return *this;
}

Result<Digest> DigestBuilder::finish() {
    if (failed_) {
        return std::unexpected("Failed to update md5 digest");
    }
    std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_, md.data(), &len) != 1) {
        failed_ = true;
        return std::unexpected("Failed to finalize md5 digest");
    }
    return to_hex(md.data(), len);
}

} // namespace kiln
