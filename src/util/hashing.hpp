#ifndef PORTAL_UTIL_HASHING_HPP
#define PORTAL_UTIL_HASHING_HPP

#include <cstdint>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <openssl/evp.h>
#include <openssl/sha.h>

/**
 * @file hashing.hpp
 * @brief SHA-256 content digests used to identify and verify transferred files.
 *
 * REQUIREMENTS:
 *   - Links against OpenSSL libcrypto.
 *
 * DESIGN:
 *   - Digests are exchanged as lowercase hex strings (64 characters).
 *   - The transfer id is the first digest byte, see fileIdFromDigest().
 *
 * USAGE:
 *   @code
 *   using namespace portal::util::hashing;
 *
 *   std::string digest = sha256File("notes.txt");
 *   uint8_t id = fileIdFromDigest(digest);
 *   @endcode
 */

namespace portal {
namespace util {
namespace hashing {

namespace detail {

struct MdCtxDeleter
{
    void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

inline std::string toHex(const unsigned char *digest, size_t len)
{
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<unsigned>(digest[i]);
    }
    return oss.str();
}

inline MdCtxPtr newSha256Context(const char *caller)
{
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error(std::string(caller) + ": failed to create EVP_MD_CTX.");
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error(std::string(caller) + ": EVP_DigestInit_ex failed.");
    }
    return ctx;
}

inline std::string finish(EVP_MD_CTX *ctx, const char *caller)
{
    unsigned char hash[SHA256_DIGEST_LENGTH];
    if (EVP_DigestFinal_ex(ctx, hash, nullptr) != 1) {
        throw std::runtime_error(std::string(caller) + ": EVP_DigestFinal_ex failed.");
    }
    return toHex(hash, SHA256_DIGEST_LENGTH);
}

} // namespace detail

/**
 * @brief Compute a SHA-256 hash of a byte buffer, return as lowercase hex.
 * @throw std::runtime_error if OpenSSL fails.
 */
inline std::string sha256(const uint8_t *data, size_t len)
{
    auto ctx = detail::newSha256Context("hashing::sha256");
    if (len > 0 && EVP_DigestUpdate(ctx.get(), data, len) != 1) {
        throw std::runtime_error("hashing::sha256: EVP_DigestUpdate failed.");
    }
    return detail::finish(ctx.get(), "hashing::sha256");
}

inline std::string sha256(const std::vector<uint8_t> &input)
{
    return sha256(input.data(), input.size());
}

/**
 * @brief Compute a SHA-256 hash of a file, return as lowercase hex.
 * @param filePath The path to the file to be hashed.
 * @throw std::runtime_error if the file cannot be opened or read, or if OpenSSL fails.
 * @note The file is streamed in chunks, never loaded whole.
 */
inline std::string sha256File(const std::string &filePath)
{
    std::ifstream ifs(filePath, std::ios::binary);
    if (!ifs.is_open()) {
        throw std::runtime_error("hashing::sha256File: Failed to open file: " + filePath);
    }

    auto ctx = detail::newSha256Context("hashing::sha256File");

    char buffer[4096];
    while (ifs.read(buffer, sizeof(buffer)) || ifs.gcount()) {
        if (EVP_DigestUpdate(ctx.get(), buffer, static_cast<size_t>(ifs.gcount())) != 1) {
            throw std::runtime_error("hashing::sha256File: EVP_DigestUpdate failed.");
        }
    }
    if (ifs.bad()) {
        throw std::runtime_error("hashing::sha256File: read error on " + filePath);
    }

    return detail::finish(ctx.get(), "hashing::sha256File");
}

/**
 * @brief Interpret the first two hex characters of a digest as one byte.
 * @throw std::invalid_argument if the digest is shorter than two characters
 *        or does not start with hex digits.
 */
inline uint8_t fileIdFromDigest(const std::string &hexDigest)
{
    auto nibble = [&](char c) -> uint8_t {
        if (c >= '0' && c <= '9') {
            return static_cast<uint8_t>(c - '0');
        }
        if (c >= 'a' && c <= 'f') {
            return static_cast<uint8_t>(c - 'a' + 10);
        }
        if (c >= 'A' && c <= 'F') {
            return static_cast<uint8_t>(c - 'A' + 10);
        }
        throw std::invalid_argument("hashing::fileIdFromDigest: not a hex digest: " + hexDigest);
    };

    if (hexDigest.size() < 2) {
        throw std::invalid_argument("hashing::fileIdFromDigest: digest too short");
    }
    return static_cast<uint8_t>((nibble(hexDigest[0]) << 4) | nibble(hexDigest[1]));
}

} // namespace hashing
} // namespace util
} // namespace portal

#endif // PORTAL_UTIL_HASHING_HPP
