/**
 * @file build_info.cpp
 * @brief Build identity
 */

#include "kcenon/streamup/core/build_info.h"

#include <utility>

#ifndef STREAMUP_VERSION
#define STREAMUP_VERSION "1.0.0"
#endif

#ifndef STREAMUP_GIT_COMMIT
#define STREAMUP_GIT_COMMIT "dev"
#endif

#ifndef STREAMUP_BUILD_DATE
#define STREAMUP_BUILD_DATE "unknown"
#endif

namespace kcenon::streamup {

build_info::build_info(std::string version, std::string git_commit, std::string build_date)
    : version_(std::move(version)),
      git_commit_(std::move(git_commit)),
      build_date_(std::move(build_date)) {}

auto build_info::current() -> const build_info& {
    static const build_info info(STREAMUP_VERSION, STREAMUP_GIT_COMMIT, STREAMUP_BUILD_DATE);
    return info;
}

auto build_info::has_commit() const -> bool {
    return !git_commit_.empty() && git_commit_ != "dev";
}

auto build_info::user_agent() const -> std::string {
    auto agent = "streamup/" + version_ + " (" + os_name() + "; " + arch_name() + ")";
    if (has_commit()) {
        agent += " git-" + git_commit_;
    }
    return agent;
}

auto build_info::version_string() const -> std::string {
    if (has_commit()) {
        return version_ + " (commit " + git_commit_ + ", built " + build_date_ + ")";
    }
    return version_;
}

auto build_info::os_name() -> std::string {
#if defined(_WIN32)
    return "windows";
#elif defined(__APPLE__)
    return "darwin";
#elif defined(__linux__)
    return "linux";
#elif defined(__FreeBSD__)
    return "freebsd";
#else
    return "unknown";
#endif
}

auto build_info::arch_name() -> std::string {
#if defined(__x86_64__) || defined(_M_X64)
    return "amd64";
#elif defined(__aarch64__) || defined(_M_ARM64)
    return "arm64";
#elif defined(__i386__) || defined(_M_IX86)
    return "386";
#elif defined(__arm__)
    return "arm";
#else
    return "unknown";
#endif
}

}  // namespace kcenon::streamup
