#include "crypto/sha256.hpp"

#include <openssl/evp.h>

#include <array>

namespace genup {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

} // namespace

void ContentDigest::CtxFree::operator()(evp_md_ctx_st* ctx) const {
    EVP_MD_CTX_free(ctx);
}

ContentDigest::ContentDigest() : ctx_(EVP_MD_CTX_new()) {
    if (ctx_ && EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1)
        ctx_.reset();
}

ContentDigest& ContentDigest::Add(std::string_view bytes) {
    if (ctx_ && !bytes.empty() && EVP_DigestUpdate(ctx_.get(), bytes.data(), bytes.size()) != 1)
        ctx_.reset();
    return *this;
}

ContentDigest& ContentDigest::AddField(std::string_view field) {
    Add(std::to_string(field.size()));
    Add(":");
    return Add(field);
}

std::string ContentDigest::HexDigest() {
    if (!ctx_)
        return {};
    std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
    unsigned int len = 0;
    const bool ok = EVP_DigestFinal_ex(ctx_.get(), md.data(), &len) == 1;
    ctx_.reset();
    if (!ok)
        return {};

    std::string hex;
    hex.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        hex.push_back(kHexDigits[md[i] >> 4]);
        hex.push_back(kHexDigits[md[i] & 0x0f]);
    }
    return hex;
}

std::string Sha256Hex(std::string_view bytes) {
    return ContentDigest().Add(bytes).HexDigest();
}

} // namespace genup
