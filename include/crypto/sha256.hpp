#pragma once

#include <memory>
#include <string>
#include <string_view>

struct evp_md_ctx_st;

namespace genup {

// SHA-256 of `bytes` as lowercase hex; empty if OpenSSL failed.
std::string Sha256Hex(std::string_view bytes);

// Incremental SHA-256 used for content-addressed revision ids.
// HexDigest() finishes the digest; any later call returns an empty string.
class ContentDigest {
public:
    ContentDigest();
    ContentDigest(ContentDigest&&) noexcept = default;
    ContentDigest& operator=(ContentDigest&&) noexcept = default;
    ~ContentDigest() = default;

    ContentDigest& Add(std::string_view bytes);
    // Length-prefixed, so ("ab", "c") and ("a", "bc") hash differently.
    ContentDigest& AddField(std::string_view field);

    std::string HexDigest();

private:
    struct CtxFree {
        void operator()(evp_md_ctx_st* ctx) const;
    };
    std::unique_ptr<evp_md_ctx_st, CtxFree> ctx_;
};

} // namespace genup
