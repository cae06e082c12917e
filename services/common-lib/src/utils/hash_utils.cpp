/**
 * @file hash_utils.cpp
 * @brief SHA-256 digests implementation
 */

#include "everify/utils/hash_utils.h"
#include "everify/utils/string_utils.h"

#include <fstream>
#include <memory>
#include <stdexcept>
#include <openssl/evp.h>

namespace everify {
namespace utils {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

MdCtxPtr newSha256Context() {
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 init failed");
    }
    return ctx;
}

std::string finish(EVP_MD_CTX* ctx) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &len) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    return toHex(hash, len);
}

} // anonymous namespace

std::string sha256Hex(const std::string& data) {
    MdCtxPtr ctx = newSha256Context();
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        throw std::runtime_error("SHA-256 update failed");
    }
    return finish(ctx.get());
}

std::string sha256FileHex(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("cannot open file for hashing: " + path);
    }

    MdCtxPtr ctx = newSha256Context();
    char buf[8192];
    while (in.read(buf, sizeof(buf)) || in.gcount() > 0) {
        if (EVP_DigestUpdate(ctx.get(), buf, static_cast<size_t>(in.gcount())) != 1) {
            throw std::runtime_error("SHA-256 update failed");
        }
    }
    if (in.bad()) {
        throw std::runtime_error("read error while hashing: " + path);
    }
    return finish(ctx.get());
}

} // namespace utils
} // namespace everify
