/**
 * @file sha1.hpp
 * @brief SHA-1 digest used by name-based (v5) UUIDs.
 *
 * Thin wrapper over the OpenSSL EVP digest interface.
 *
 * @copyright Copyright (c) 2024 uuidkit Contributors
 * @license MIT License
 */

#pragma once

#include "uuidkit/generators/export.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

// Forward declaration for OpenSSL context type
struct evp_md_ctx_st;

namespace uuidkit {
namespace generators {

/**
 * @class Sha1
 * @brief SHA-1 hash calculator.
 *
 * Usage:
 * @code
 * auto digest = Sha1::compute("hello world");
 *
 * // Or incremental:
 * Sha1 sha;
 * sha.update(nsBytes.data(), nsBytes.size());
 * sha.update(name);
 * auto digest = sha.finalize();
 * @endcode
 *
 * @throws core::UuidError if OpenSSL reports a failure.
 */
class UUIDKIT_GENERATORS_API Sha1 {
public:
    static constexpr size_t DIGEST_SIZE = 20;
    using Digest = std::array<uint8_t, DIGEST_SIZE>;

    /**
     * @brief Compute the digest of a string in one call.
     */
    static Digest compute(const std::string& data) {
        return compute(data.data(), data.size());
    }

    /**
     * @brief Compute the digest of a byte buffer in one call.
     */
    static Digest compute(const void* data, size_t length) {
        Sha1 sha;
        sha.update(data, length);
        return sha.finalize();
    }

    Sha1();
    ~Sha1();

    Sha1(const Sha1&) = delete;
    Sha1& operator=(const Sha1&) = delete;

    void update(const std::string& data) {
        update(data.data(), data.size());
    }

    void update(const void* data, size_t length);

    /**
     * @brief Finish and return the digest.
     *
     * The object is reset and may be reused afterwards.
     */
    Digest finalize();

    /**
     * @brief Discard buffered input.
     */
    void reset();

private:
    struct ContextDeleter {
        void operator()(evp_md_ctx_st* ctx) const;
    };

    std::unique_ptr<evp_md_ctx_st, ContextDeleter> ctx_;
};

}  // namespace generators
}  // namespace uuidkit
