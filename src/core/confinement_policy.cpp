/**
 * @file confinement_policy.cpp
 * @brief Implementation of prefix-based filesystem confinement
 *
 * **Resolution**:
 * Paths are made absolute against the caller's directory, then resolved with
 * weakly_canonical() so that "..", "." and symlinked directories cannot step
 * around a prefix check. A trailing symlink that does not resolve (dangling
 * link) is followed by hand, because open(O_CREAT) would create its target.
 *
 * **Matching**:
 * Component-wise prefix comparison, first match wins, default deny.
 *
 * This file is also compiled into the open interceptor, keep it free of
 * third-party dependencies and logging.
 *
 * @date 2025
 */

#include "scriptjail/core/confinement_policy.hpp"

#include <fcntl.h>
#include <cstring>
#include <sstream>
#include <system_error>

namespace scriptjail {
namespace core {

namespace fs = std::filesystem;

namespace {

// Upper bound on hand-followed symlinks (matches the kernel's ELOOP limit)
constexpr int kMaxSymlinkDepth = 40;

fs::path Normalize(const fs::path& path) {
    fs::path normal = path.lexically_normal();
    // "/a/b/" normalizes with an empty filename, drop it
    if (!normal.has_filename() && normal != normal.root_path()) {
        normal = normal.parent_path();
    }
    return normal;
}

fs::path FollowTrailingSymlinks(fs::path path) {
    for (int depth = 0; depth < kMaxSymlinkDepth; ++depth) {
        std::error_code ec;
        auto status = fs::symlink_status(path, ec);
        if (ec || !fs::is_symlink(status)) {
            break;
        }

        fs::path target = fs::read_symlink(path, ec);
        if (ec) {
            break;
        }

        path = target.is_absolute() ? target : path.parent_path() / target;

        fs::path resolved = fs::weakly_canonical(path, ec);
        if (!ec) {
            path = resolved;
        }
    }
    return path;
}

void ValidatePrefix(const fs::path& prefix) {
    if (prefix.empty() || !prefix.is_absolute()) {
        throw PolicyFormatError("rule prefix must be absolute: '" + prefix.string() + "'");
    }
    if (prefix.string().find('\n') != std::string::npos) {
        throw PolicyFormatError("rule prefix contains a newline");
    }
}

} // anonymous namespace

ConfinementPolicy& ConfinementPolicy::Allow(const fs::path& prefix, AccessMode mode) {
    ValidatePrefix(prefix);
    rules_.push_back(PolicyRule{Normalize(prefix), mode});
    return *this;
}

ConfinementPolicy& ConfinementPolicy::Deny(const fs::path& prefix) {
    return Allow(prefix, AccessMode::DENIED);
}

PolicyDecision ConfinementPolicy::Evaluate(const fs::path& path,
                                           AccessIntent intent,
                                           const fs::path& base_dir) const {
    PolicyDecision decision;
    decision.resolved_path = Resolve(path, base_dir);

    for (std::size_t i = 0; i < rules_.size(); ++i) {
        const auto& rule = rules_[i];
        if (!IsUnder(decision.resolved_path, rule.prefix)) {
            continue;
        }

        decision.rule_index = i;
        switch (rule.mode) {
            case AccessMode::READ_WRITE:
                decision.allowed = true;
                break;
            case AccessMode::READ_ONLY:
                decision.allowed = (intent == AccessIntent::READ);
                break;
            case AccessMode::DENIED:
                break;
        }
        return decision;
    }

    return decision;
}

ConfinementPolicy ConfinementPolicy::Canonicalized() const {
    ConfinementPolicy canonical;
    for (const auto& rule : rules_) {
        canonical.rules_.push_back(PolicyRule{Resolve(rule.prefix, "/"), rule.mode});
    }
    return canonical;
}

std::string ConfinementPolicy::Serialize() const {
    std::ostringstream out;
    for (const auto& rule : rules_) {
        out << AccessModeName(rule.mode) << '\t' << rule.prefix.string() << '\n';
    }
    return out.str();
}

ConfinementPolicy ConfinementPolicy::Parse(const std::string& text) {
    ConfinementPolicy policy;
    std::istringstream in(text);
    std::string line;
    std::size_t line_number = 0;

    while (std::getline(in, line)) {
        ++line_number;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto tab = line.find('\t');
        if (tab == std::string::npos) {
            throw PolicyFormatError("line " + std::to_string(line_number) +
                                    ": expected '<mode>\\t<prefix>'");
        }

        auto mode = ParseAccessMode(line.substr(0, tab));
        if (!mode) {
            throw PolicyFormatError("line " + std::to_string(line_number) +
                                    ": unknown mode '" + line.substr(0, tab) + "'");
        }

        policy.Allow(line.substr(tab + 1), *mode);
    }

    return policy;
}

fs::path ConfinementPolicy::Resolve(const fs::path& path, const fs::path& base_dir) {
    fs::path absolute = path;
    if (absolute.is_relative()) {
        fs::path base = base_dir;
        if (base.empty()) {
            std::error_code ec;
            base = fs::current_path(ec);
            if (ec) {
                base = "/";
            }
        }
        absolute = base / path;
    }

    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(absolute, ec);
    if (ec) {
        return Normalize(absolute);
    }

    return Normalize(FollowTrailingSymlinks(canonical));
}

bool ConfinementPolicy::IsUnder(const fs::path& candidate, const fs::path& prefix) {
    auto it = candidate.begin();
    for (const auto& part : prefix) {
        if (part.empty()) {
            continue;
        }
        if (it == candidate.end() || *it != part) {
            return false;
        }
        ++it;
    }
    return true;
}

AccessIntent IntentFromOpenFlags(int flags) {
    if ((flags & O_ACCMODE) != O_RDONLY) {
        return AccessIntent::WRITE;
    }
    if (flags & (O_CREAT | O_TRUNC | O_APPEND)) {
        return AccessIntent::WRITE;
    }
    return AccessIntent::READ;
}

AccessIntent IntentFromFopenMode(const char* mode) {
    if (mode == nullptr) {
        return AccessIntent::READ;
    }
    if (std::strpbrk(mode, "wa+") != nullptr) {
        return AccessIntent::WRITE;
    }
    return AccessIntent::READ;
}

const char* AccessModeName(AccessMode mode) {
    switch (mode) {
        case AccessMode::READ_ONLY: return "ro";
        case AccessMode::READ_WRITE: return "rw";
        case AccessMode::DENIED: return "deny";
    }
    return "deny";
}

std::optional<AccessMode> ParseAccessMode(const std::string& name) {
    if (name == "ro") return AccessMode::READ_ONLY;
    if (name == "rw") return AccessMode::READ_WRITE;
    if (name == "deny") return AccessMode::DENIED;
    return std::nullopt;
}

} // namespace core
} // namespace scriptjail
