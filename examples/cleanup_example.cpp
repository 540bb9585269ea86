/**
 * @file cleanup_example.cpp
 * @brief List or abort incomplete multipart uploads left behind in a bucket
 */

#include <kcenon/streamup/streamup.h>

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <string>

using namespace kcenon::streamup;

namespace {

auto env_or(const char* name) -> std::string {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string{};
}

auto format_time(std::chrono::system_clock::time_point tp) -> std::string {
    if (tp == std::chrono::system_clock::time_point{}) {
        return "unknown";
    }
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%SZ", &tm);
    return buf;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options] <bucket>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --endpoint <url>        Custom endpoint" << std::endl;
    std::cout << "  --account-id <id>       Cloudflare R2 account id" << std::endl;
    std::cout << "  --prefix <prefix>       Only keys under this prefix" << std::endl;
    std::cout << "  --older-than <hours>    Only uploads started at least this long ago" << std::endl;
    std::cout << "  --abort                 Abort the uploads (default: list only)" << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    cleanup_config config;
    config.connection.access_key_id = env_or("AWS_ACCESS_KEY_ID");
    config.connection.secret_access_key = env_or("AWS_SECRET_ACCESS_KEY");
    config.dry_run = true;

    std::string bucket;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--abort") {
            config.dry_run = false;
        } else if (arg == "--endpoint" || arg == "--account-id" || arg == "--prefix" ||
                   arg == "--older-than") {
            if (++i >= argc) {
                std::cerr << "Error: " << arg << " requires an argument" << std::endl;
                return 1;
            }
            std::string value = argv[i];
            if (arg == "--endpoint") {
                config.connection.endpoint = value;
            } else if (arg == "--account-id") {
                config.connection.account_id = value;
            } else if (arg == "--prefix") {
                config.prefix = value;
            } else {
                try {
                    config.older_than = std::chrono::hours(std::stol(value));
                } catch (const std::exception&) {
                    std::cerr << "Error: invalid hour count: " << value << std::endl;
                    return 1;
                }
            }
        } else {
            bucket = arg;
        }
    }

    if (bucket.empty()) {
        print_usage(argv[0]);
        return 1;
    }
    config.connection.bucket = bucket;

    auto report = cleanup_incomplete_uploads(config);
    if (!report) {
        std::cerr << "Error: " << report.error().describe() << std::endl;
        return 1;
    }

    for (const auto& upload : report.value().uploads) {
        std::cout << format_time(upload.initiated) << "  " << upload.key << "  "
                  << upload.upload_id << std::endl;
    }
    std::cout << report.value().total_found << " incomplete uploads";
    if (!config.dry_run) {
        std::cout << ", " << report.value().total_aborted << " aborted";
    }
    std::cout << std::endl;

    for (const auto& err : report.value().errors) {
        std::cerr << "  " << err.message << std::endl;
    }
    return report.value().errors.empty() ? 0 : 2;
}
