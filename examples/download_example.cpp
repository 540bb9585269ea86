/**
 * @file download_example.cpp
 * @brief Stream an object from an S3-compatible bucket to a file or stdout
 *
 * This example demonstrates:
 * - Downloading into a file_sink or an ostream_sink
 * - Optional digest of the written bytes
 * - Progress reporting on stderr so stdout stays clean for piping
 */

#include <kcenon/streamup/streamup.h>

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace kcenon::streamup;

namespace {

auto env_or(const char* name) -> std::string {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string{};
}

void print_usage(const char* program) {
    std::cout << "Download Example - streamup " << version::to_string() << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <bucket> <key> <local_file|->" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --endpoint <url>        Custom endpoint" << std::endl;
    std::cout << "  --account-id <id>       Cloudflare R2 account id" << std::endl;
    std::cout << "  --region <region>       Signing region" << std::endl;
    std::cout << "  --checksum <algo>       Print an md5 or sha256 digest when done" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    download_config config;
    config.connection.access_key_id = env_or("AWS_ACCESS_KEY_ID");
    config.connection.secret_access_key = env_or("AWS_SECRET_ACCESS_KEY");
    if (auto token = env_or("AWS_SESSION_TOKEN"); !token.empty()) {
        config.connection.session_token = token;
    }

    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        if (arg == "--endpoint" || arg == "--account-id" || arg == "--region" ||
            arg == "--checksum") {
            if (++i >= argc) {
                std::cerr << "Error: " << arg << " requires an argument" << std::endl;
                return 1;
            }
            std::string value = argv[i];
            if (arg == "--endpoint") {
                config.connection.endpoint = value;
            } else if (arg == "--account-id") {
                config.connection.account_id = value;
            } else if (arg == "--region") {
                config.connection.region = value;
            } else {
                config.calculate_checksum = true;
                config.checksum_algorithm = value;
            }
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 3) {
        print_usage(argv[0]);
        return 1;
    }
    config.connection.bucket = positional[0];
    config.key = positional[1];
    const auto& target = positional[2];

    auto dl = downloader::create(config);
    if (!dl) {
        std::cerr << "Error: " << dl.error().describe() << std::endl;
        return 1;
    }

    auto size = dl.value()->get_size();
    if (!size) {
        std::cerr << "Error: " << size.error().describe() << std::endl;
        return 1;
    }
    const auto total = size.value();

    dl.value()->set_progress_callback([total](uint64_t bytes) {
        double percent = total > 0 ? 100.0 * static_cast<double>(bytes) /
                                         static_cast<double>(total)
                                   : 100.0;
        std::cerr << "\r  " << std::fixed << std::setprecision(1) << percent << "% ("
                  << format_size(bytes) << " / " << format_size(total) << ")   " << std::flush;
    });

    std::unique_ptr<byte_sink> sink;
    if (target == "-") {
        sink = std::make_unique<ostream_sink>(std::cout);
    } else {
        auto file = file_sink::open(target);
        if (!file) {
            std::cerr << "Error: " << file.error().describe() << std::endl;
            return 1;
        }
        sink = std::move(file.value());
    }

    auto written = dl.value()->download(*sink);
    std::cerr << std::endl;
    if (!written) {
        std::cerr << "Download failed: " << written.error().describe() << std::endl;
        return 1;
    }

    std::cerr << "Downloaded " << format_size(written.value()) << std::endl;
    if (config.calculate_checksum) {
        std::cerr << config.checksum_algorithm << ": " << dl.value()->checksum() << std::endl;
    }
    return 0;
}
