/**
 * @file hash_utils.cpp
 * @brief SHA-256 helpers on top of the OpenSSL EVP interface
 *
 * @date 2025
 */

#include "scriptjail/utils/hash_utils.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace scriptjail {
namespace utils {

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

DigestContext NewSHA256Context() {
    DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("OpenSSL: failed to initialise SHA-256 context");
    }
    return ctx;
}

void Update(EVP_MD_CTX* ctx, const void* data, std::size_t length) {
    if (EVP_DigestUpdate(ctx, data, length) != 1) {
        throw std::runtime_error("OpenSSL: SHA-256 update failed");
    }
}

std::string Finish(EVP_MD_CTX* ctx) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx, digest, &length) != 1) {
        throw std::runtime_error("OpenSSL: SHA-256 finalisation failed");
    }
    return HashUtils::BinaryToHex(digest, length);
}

} // anonymous namespace

std::string HashUtils::ComputeSHA256(const std::filesystem::path& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + file_path.string());
    }

    auto ctx = NewSHA256Context();

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        Update(ctx.get(), buffer, static_cast<std::size_t>(file.gcount()));
    }

    if (file.bad()) {
        throw std::runtime_error("Failed to read file: " + file_path.string());
    }

    return Finish(ctx.get());
}

std::string HashUtils::ComputeSHA256(const std::string& data) {
    auto ctx = NewSHA256Context();
    Update(ctx.get(), data.data(), data.size());
    return Finish(ctx.get());
}

std::string HashUtils::ComputeTreeSHA256(const std::filesystem::path& root,
                                         const std::vector<std::filesystem::path>& files) {
    std::vector<std::pair<std::string, std::filesystem::path>> entries;
    entries.reserve(files.size());
    for (const auto& file : files) {
        auto absolute = file.is_absolute() ? file : root / file;
        entries.emplace_back(absolute.lexically_relative(root).generic_string(), absolute);
    }
    std::sort(entries.begin(), entries.end());

    auto ctx = NewSHA256Context();
    for (const auto& [relative, absolute] : entries) {
        Update(ctx.get(), relative.data(), relative.size() + 1);  // include the NUL
        std::string file_digest = ComputeSHA256(absolute);
        Update(ctx.get(), file_digest.data(), file_digest.size());
    }
    return Finish(ctx.get());
}

std::string HashUtils::BinaryToHex(const unsigned char* data, std::size_t length) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

} // namespace utils
} // namespace scriptjail
