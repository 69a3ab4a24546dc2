/**
 * @file open_interceptor.cpp
 * @brief LD_PRELOAD shim enforcing a ConfinementPolicy on file opens
 *
 * Loaded into the sandboxed interpreter (and every process it spawns) through
 * LD_PRELOAD. The policy arrives serialized in SCRIPTJAIL_POLICY; without that
 * variable the shim is inert. A malformed policy fails closed: every
 * intercepted open is denied.
 *
 * Denied calls return -1 (or NULL) with errno = EACCES, which the interpreter
 * surfaces as a catchable permission error naming the path, e.g.
 * "PermissionError: [Errno 13] Permission denied: '/etc/passwd'".
 *
 * Opens issued from inside libc itself (loader, locale, tzfile) do not go
 * through the PLT and are not seen here.
 *
 * @date 2025
 */

// The interposed symbols must keep their plain names
#undef _FILE_OFFSET_BITS
#undef _FORTIFY_SOURCE

#include "scriptjail/core/confinement_policy.hpp"

#include <dlfcn.h>
#include <fcntl.h>
#include <errno.h>
#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>
#include <limits.h>

#include <string>
#include <optional>

namespace {

namespace fs = std::filesystem;
using scriptjail::core::AccessIntent;
using scriptjail::core::ConfinementPolicy;

struct InterceptorState {
    bool active{false};
    ConfinementPolicy policy;
};

const InterceptorState& State() {
    static const InterceptorState state = [] {
        InterceptorState loaded;
        const char* text = getenv(scriptjail::core::kPolicyEnvVar);
        if (text == nullptr) {
            return loaded;
        }

        loaded.active = true;
        try {
            loaded.policy = ConfinementPolicy::Parse(text).Canonicalized();
        }
        catch (const std::exception&) {
            // Empty policy denies everything
            loaded.policy = ConfinementPolicy{};
        }
        return loaded;
    }();
    return state;
}

// Set while a decision is being computed on this thread
thread_local bool in_check = false;

std::optional<fs::path> DirectoryOfFd(int dirfd) {
    char link[64];
    snprintf(link, sizeof(link), "/proc/self/fd/%d", dirfd);

    char target[PATH_MAX];
    ssize_t length = readlink(link, target, sizeof(target) - 1);
    if (length <= 0) {
        return std::nullopt;
    }
    target[length] = '\0';
    return fs::path(target);
}

bool Permitted(int dirfd, const char* path, AccessIntent intent) {
    if (path == nullptr || in_check) {
        return true;
    }

    const auto& state = State();
    if (!state.active) {
        return true;
    }

    in_check = true;
    bool allowed = false;
    try {
        fs::path base;
        if (path[0] != '/' && dirfd != AT_FDCWD) {
            auto directory = DirectoryOfFd(dirfd);
            if (directory) {
                base = *directory;
                allowed = state.policy.Evaluate(path, intent, base).allowed;
            }
        } else {
            allowed = state.policy.Evaluate(path, intent).allowed;
        }
    }
    catch (const std::exception&) {
        allowed = false;
    }
    in_check = false;

    if (!allowed) {
        errno = EACCES;
    }
    return allowed;
}

template <typename Fn>
Fn Next(const char* name) {
    return reinterpret_cast<Fn>(dlsym(RTLD_NEXT, name));
}

bool NeedsMode(int flags) {
    return (flags & O_CREAT) != 0 || (flags & O_TMPFILE) == O_TMPFILE;
}

using OpenFn = int (*)(const char*, int, ...);
using OpenAtFn = int (*)(int, const char*, int, ...);
using CreatFn = int (*)(const char*, mode_t);
using FopenFn = FILE* (*)(const char*, const char*);
using Open2Fn = int (*)(const char*, int);
using OpenAt2Fn = int (*)(int, const char*, int);

} // anonymous namespace

extern "C" {

int open(const char* path, int flags, ...) {
    static const auto real = Next<OpenFn>("open");
    mode_t mode = 0;
    if (NeedsMode(flags)) {
        va_list args;
        va_start(args, flags);
        mode = static_cast<mode_t>(va_arg(args, int));
        va_end(args);
    }
    if (!Permitted(AT_FDCWD, path, scriptjail::core::IntentFromOpenFlags(flags))) {
        return -1;
    }
    return real(path, flags, mode);
}

int open64(const char* path, int flags, ...) {
    static const auto real = Next<OpenFn>("open64");
    mode_t mode = 0;
    if (NeedsMode(flags)) {
        va_list args;
        va_start(args, flags);
        mode = static_cast<mode_t>(va_arg(args, int));
        va_end(args);
    }
    if (!Permitted(AT_FDCWD, path, scriptjail::core::IntentFromOpenFlags(flags))) {
        return -1;
    }
    return real(path, flags, mode);
}

int openat(int dirfd, const char* path, int flags, ...) {
    static const auto real = Next<OpenAtFn>("openat");
    mode_t mode = 0;
    if (NeedsMode(flags)) {
        va_list args;
        va_start(args, flags);
        mode = static_cast<mode_t>(va_arg(args, int));
        va_end(args);
    }
    if (!Permitted(dirfd, path, scriptjail::core::IntentFromOpenFlags(flags))) {
        return -1;
    }
    return real(dirfd, path, flags, mode);
}

int openat64(int dirfd, const char* path, int flags, ...) {
    static const auto real = Next<OpenAtFn>("openat64");
    mode_t mode = 0;
    if (NeedsMode(flags)) {
        va_list args;
        va_start(args, flags);
        mode = static_cast<mode_t>(va_arg(args, int));
        va_end(args);
    }
    if (!Permitted(dirfd, path, scriptjail::core::IntentFromOpenFlags(flags))) {
        return -1;
    }
    return real(dirfd, path, flags, mode);
}

// Fortified entry points used by callers built with _FORTIFY_SOURCE
int __open_2(const char* path, int flags) {
    static const auto real = Next<Open2Fn>("__open_2");
    if (!Permitted(AT_FDCWD, path, scriptjail::core::IntentFromOpenFlags(flags))) {
        return -1;
    }
    return real(path, flags);
}

int __open64_2(const char* path, int flags) {
    static const auto real = Next<Open2Fn>("__open64_2");
    if (!Permitted(AT_FDCWD, path, scriptjail::core::IntentFromOpenFlags(flags))) {
        return -1;
    }
    return real(path, flags);
}

int __openat_2(int dirfd, const char* path, int flags) {
    static const auto real = Next<OpenAt2Fn>("__openat_2");
    if (!Permitted(dirfd, path, scriptjail::core::IntentFromOpenFlags(flags))) {
        return -1;
    }
    return real(dirfd, path, flags);
}

int __openat64_2(int dirfd, const char* path, int flags) {
    static const auto real = Next<OpenAt2Fn>("__openat64_2");
    if (!Permitted(dirfd, path, scriptjail::core::IntentFromOpenFlags(flags))) {
        return -1;
    }
    return real(dirfd, path, flags);
}

int creat(const char* path, mode_t mode) {
    static const auto real = Next<CreatFn>("creat");
    if (!Permitted(AT_FDCWD, path, AccessIntent::WRITE)) {
        return -1;
    }
    return real(path, mode);
}

int creat64(const char* path, mode_t mode) {
    static const auto real = Next<CreatFn>("creat64");
    if (!Permitted(AT_FDCWD, path, AccessIntent::WRITE)) {
        return -1;
    }
    return real(path, mode);
}

FILE* fopen(const char* path, const char* mode) {
    static const auto real = Next<FopenFn>("fopen");
    if (!Permitted(AT_FDCWD, path, scriptjail::core::IntentFromFopenMode(mode))) {
        return nullptr;
    }
    return real(path, mode);
}

FILE* fopen64(const char* path, const char* mode) {
    static const auto real = Next<FopenFn>("fopen64");
    if (!Permitted(AT_FDCWD, path, scriptjail::core::IntentFromFopenMode(mode))) {
        return nullptr;
    }
    return real(path, mode);
}

} // extern "C"
