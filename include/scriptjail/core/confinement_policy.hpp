/**
 * @file confinement_policy.hpp
 * @brief Filesystem confinement rules for sandboxed scripts
 *
 * A ConfinementPolicy is an ordered list of (prefix, mode) rules. Every
 * file-open attempt is resolved to its canonical absolute path and matched
 * against the rules; the first rule whose prefix contains the path decides.
 * No match means denial.
 *
 * The policy is compiled into the open interceptor that runs inside the
 * sandboxed process, so this header depends on the standard library only.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <stdexcept>

namespace scriptjail {
namespace core {

/// Environment variable carrying the serialized policy into the sandbox
constexpr const char* kPolicyEnvVar = "SCRIPTJAIL_POLICY";

/**
 * @enum AccessMode
 * @brief What a matching rule grants
 */
enum class AccessMode {
    READ_ONLY,   ///< Reads allowed, write-like opens rejected
    READ_WRITE,  ///< Any mode allowed
    DENIED       ///< Explicitly rejected (same outcome as no match)
};

/**
 * @enum AccessIntent
 * @brief Classification of one open request
 */
enum class AccessIntent {
    READ,   ///< O_RDONLY without create/truncate/append
    WRITE   ///< Anything that can modify the filesystem
};

/**
 * @struct PolicyRule
 * @brief One prefix rule
 */
struct PolicyRule {
    std::filesystem::path prefix;  ///< Absolute, lexically normal
    AccessMode mode{AccessMode::DENIED};
};

/**
 * @struct PolicyDecision
 * @brief Outcome of evaluating one access
 *
 * The interceptor reports a denial to the script only through errno: the
 * call fails with EACCES, which the interpreter raises as a permission error
 * carrying the path the script passed.
 */
struct PolicyDecision {
    bool allowed{false};
    std::filesystem::path resolved_path;     ///< Canonical path that was matched
    std::optional<std::size_t> rule_index;   ///< Index of the deciding rule, if any
};

/**
 * @class PolicyFormatError
 * @brief Malformed rule or serialized policy text
 */
class PolicyFormatError : public std::invalid_argument {
public:
    explicit PolicyFormatError(const std::string& message)
        : std::invalid_argument("invalid confinement policy: " + message) {}
};

/**
 * @class ConfinementPolicy
 * @brief Ordered prefix rules, first match wins, default deny
 *
 * Rule prefixes are stored as given (absolute, lexically normalized). Call
 * Canonicalized() in the environment that enforces the policy so that
 * symlinked prefixes match their targets.
 *
 * **Usage Example**:
 * @code
 * ConfinementPolicy policy;
 * policy.Allow("/tmp/job-17", AccessMode::READ_WRITE)
 *       .Allow("/usr/lib/python3.11", AccessMode::READ_ONLY);
 *
 * auto decision = policy.Evaluate("/etc/passwd", AccessIntent::READ);
 * // decision.allowed == false
 * @endcode
 */
class ConfinementPolicy {
public:
    ConfinementPolicy() = default;

    /**
     * @brief Append a rule
     * @param prefix Absolute directory or file path
     * @param mode Access granted below the prefix
     * @return Reference to this policy for chaining
     *
     * @throws PolicyFormatError if prefix is relative or contains a newline
     */
    ConfinementPolicy& Allow(const std::filesystem::path& prefix, AccessMode mode);

    /// Append an explicit deny rule
    ConfinementPolicy& Deny(const std::filesystem::path& prefix);

    /**
     * @brief Decide one access attempt
     *
     * Relative paths are resolved against base_dir (the current directory when
     * base_dir is empty). Symlinks and ".." are resolved before matching; for
     * a path that does not exist yet, the longest existing ancestor is
     * canonicalized.
     *
     * @param path Path as passed to open()
     * @param intent Read or write
     * @param base_dir Directory relative paths are resolved against
     * @return Decision with the resolved path and deciding rule
     */
    PolicyDecision Evaluate(const std::filesystem::path& path,
                            AccessIntent intent,
                            const std::filesystem::path& base_dir = {}) const;

    /// Copy with every rule prefix resolved through symlinks
    ConfinementPolicy Canonicalized() const;

    const std::vector<PolicyRule>& Rules() const { return rules_; }
    bool Empty() const { return rules_.empty(); }

    /**
     * @brief Encode as text, one "<mode>\t<prefix>" line per rule
     */
    std::string Serialize() const;

    /**
     * @brief Decode text produced by Serialize()
     * @throws PolicyFormatError on unknown modes or relative prefixes
     */
    static ConfinementPolicy Parse(const std::string& text);

    /// Absolute, symlink-free form of path (lexical fallback when unresolvable)
    static std::filesystem::path Resolve(const std::filesystem::path& path,
                                         const std::filesystem::path& base_dir);

    /// Component-wise prefix test: "/work" contains "/work/a" but not "/workspace"
    static bool IsUnder(const std::filesystem::path& candidate,
                        const std::filesystem::path& prefix);

private:
    std::vector<PolicyRule> rules_;
};

/// Classify open(2) flags
AccessIntent IntentFromOpenFlags(int flags);

/// Classify an fopen(3) mode string
AccessIntent IntentFromFopenMode(const char* mode);

/// Short serialized name: "ro", "rw" or "deny"
const char* AccessModeName(AccessMode mode);

/// Inverse of AccessModeName()
std::optional<AccessMode> ParseAccessMode(const std::string& name);

} // namespace core
} // namespace scriptjail
