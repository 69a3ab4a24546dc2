/**
 * @file hash_utils.hpp
 * @brief SHA-256 fingerprints for build contexts and files
 *
 * The image provisioner fingerprints the build context it hands to the
 * container runtime, so an image can be traced back to the exact Dockerfile
 * and interceptor sources it was built from.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <filesystem>

namespace scriptjail {
namespace utils {

/**
 * @class HashUtils
 * @brief OpenSSL-backed SHA-256 helpers
 *
 * All methods are static and thread-safe.
 *
 * **Error Handling**:
 * - File not found / unreadable: throws std::runtime_error
 * - OpenSSL failure: throws std::runtime_error
 */
class HashUtils {
public:
    /**
     * @brief SHA-256 of a file's contents
     * @param file_path File to hash
     * @return Lowercase hex digest (64 chars)
     */
    static std::string ComputeSHA256(const std::filesystem::path& file_path);

    /// SHA-256 of an in-memory string
    static std::string ComputeSHA256(const std::string& data);

    /**
     * @brief Digest over a set of files below a root
     *
     * Every file contributes its path relative to root and its own digest, in
     * sorted order, so the result is independent of the order given.
     *
     * @param root Directory the relative paths are taken against
     * @param files Files to include (absolute or relative to root)
     * @return Lowercase hex digest
     */
    static std::string ComputeTreeSHA256(const std::filesystem::path& root,
                                         const std::vector<std::filesystem::path>& files);

    /// Hex-encode a byte buffer
    static std::string BinaryToHex(const unsigned char* data, std::size_t length);
};

} // namespace utils
} // namespace scriptjail
