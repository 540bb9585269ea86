/**
 * @file build_info.h
 * @brief Build identity injected at startup
 */

#ifndef KCENON_STREAMUP_CORE_BUILD_INFO_H
#define KCENON_STREAMUP_CORE_BUILD_INFO_H

#include <string>

namespace kcenon::streamup {

/**
 * @brief Immutable build identity
 *
 * The library never reads process-wide version globals; components that
 * need the identity (the S3 backend's User-Agent) receive a build_info
 * value. current() reflects the STREAMUP_VERSION, STREAMUP_GIT_COMMIT and
 * STREAMUP_BUILD_DATE compile definitions.
 */
class build_info {
public:
    build_info(std::string version, std::string git_commit, std::string build_date);

    /**
     * @brief Identity of this build
     */
    [[nodiscard]] static auto current() -> const build_info&;

    [[nodiscard]] auto version() const -> const std::string& { return version_; }
    [[nodiscard]] auto git_commit() const -> const std::string& { return git_commit_; }
    [[nodiscard]] auto build_date() const -> const std::string& { return build_date_; }

    /**
     * @brief HTTP User-Agent: "streamup/<version> (<os>; <arch>)[ git-<commit>]"
     */
    [[nodiscard]] auto user_agent() const -> std::string;

    /**
     * @brief "<version> (commit <commit>, built <date>)" or "<version>"
     */
    [[nodiscard]] auto version_string() const -> std::string;

    /**
     * @brief Operating system name as reported in the User-Agent
     */
    [[nodiscard]] static auto os_name() -> std::string;

    /**
     * @brief CPU architecture as reported in the User-Agent
     */
    [[nodiscard]] static auto arch_name() -> std::string;

private:
    [[nodiscard]] auto has_commit() const -> bool;

    std::string version_;
    std::string git_commit_;
    std::string build_date_;
};

}  // namespace kcenon::streamup

#endif  // KCENON_STREAMUP_CORE_BUILD_INFO_H
