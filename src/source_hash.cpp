//
//  source_hash.cpp
//  NarrateForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "source_hash.hpp"

#include <openssl/evp.h>

#include <array>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

#include "logging.hpp"

namespace narrateforge {

namespace {

constexpr size_t kHashBlockBytes = 8192;

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

std::string to_hex(const unsigned char *digest, unsigned int len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<unsigned int>(digest[i]);
    }
    return oss.str();
}

MdCtxPtr new_sha256_ctx() {
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return nullptr;
    }
    return ctx;
}

std::optional<std::string> finish(EVP_MD_CTX *ctx) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx, digest.data(), &len) != 1) {
        return std::nullopt;
    }
    return to_hex(digest.data(), len);
}

}  // namespace

std::optional<std::string> sha256_file(const std::string &path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        NF_LOG("error", "open failed for " << path << " " << errno_text());
        return std::nullopt;
    }
    auto ctx = new_sha256_ctx();
    if (!ctx) {
        NF_LOG("error", "SHA-256 context setup failed");
        return std::nullopt;
    }
    std::array<char, kHashBlockBytes> block{};
    while (f) {
        f.read(block.data(), static_cast<std::streamsize>(block.size()));
        const auto got = f.gcount();
        if (got > 0 && EVP_DigestUpdate(ctx.get(), block.data(), static_cast<size_t>(got)) != 1) {
            return std::nullopt;
        }
    }
    if (f.bad()) {
        NF_LOG("error", "read failed for " << path << " " << errno_text());
        return std::nullopt;
    }
    return finish(ctx.get());
}

std::string sha256_hex(const std::string &data) {
    auto ctx = new_sha256_ctx();
    if (!ctx || EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        return {};
    }
    return finish(ctx.get()).value_or(std::string{});
}

}  // namespace narrateforge
