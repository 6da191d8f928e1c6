/**
 * @file sha1.cpp
 * @brief SHA-1 implementation over OpenSSL EVP.
 *
 * @copyright Copyright (c) 2024 uuidkit Contributors
 * @license MIT License
 */

#include "uuidkit/generators/sha1.hpp"
#include "uuidkit/core/errors.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>

namespace uuidkit {
namespace generators {

namespace {

[[noreturn]] void throwOpenSslError(const char* what) {
    throw core::UuidError(std::string(what) + " failed: error " +
                          std::to_string(ERR_get_error()));
}

}  // anonymous namespace

void Sha1::ContextDeleter::operator()(evp_md_ctx_st* ctx) const {
    EVP_MD_CTX_free(ctx);
}

Sha1::Sha1() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throwOpenSslError("EVP_MD_CTX_new");
    }
    reset();
}

Sha1::~Sha1() = default;

void Sha1::update(const void* data, size_t length) {
    if (length == 0) {
        return;
    }
    if (EVP_DigestUpdate(ctx_.get(), data, length) != 1) {
        throwOpenSslError("EVP_DigestUpdate");
    }
}

Sha1::Digest Sha1::finalize() {
    Digest digest{};
    unsigned int digestLength = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), digest.data(), &digestLength) != 1) {
        throwOpenSslError("EVP_DigestFinal_ex");
    }
    if (digestLength != DIGEST_SIZE) {
        throw core::UuidError("Unexpected SHA-1 digest length " +
                              std::to_string(digestLength));
    }
    reset();
    return digest;
}

void Sha1::reset() {
    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha1(), nullptr) != 1) {
        throwOpenSslError("EVP_DigestInit_ex");
    }
}

}  // namespace generators
}  // namespace uuidkit
