/**
 * @file upload_example.cpp
 * @brief Stream a file or standard input into an S3-compatible bucket
 *
 * This example demonstrates:
 * - Building an upload configuration from command line options
 * - Reading credentials from the environment
 * - Streaming from a file or from stdin with a declared size
 * - Progress reporting and Ctrl+C cancellation
 */

#include <kcenon/streamup/streamup.h>

#include <atomic>
#include <cctype>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

using namespace kcenon::streamup;

namespace {

std::atomic<uploader*> g_active_upload{nullptr};

void handle_interrupt(int) {
    if (auto* up = g_active_upload.load()) {
        (void)up->abort();
    }
}

auto env_or(const char* name, const std::string& fallback = {}) -> std::string {
    const char* value = std::getenv(name);
    return value ? std::string(value) : fallback;
}

auto parse_size(const std::string& size_str) -> uint64_t {
    std::size_t pos = 0;
    double value = std::stod(size_str, &pos);

    if (pos < size_str.size()) {
        switch (std::toupper(static_cast<unsigned char>(size_str[pos]))) {
            case 'K': return static_cast<uint64_t>(value * kib);
            case 'M': return static_cast<uint64_t>(value * mib);
            case 'G': return static_cast<uint64_t>(value * gib);
            default: break;
        }
    }
    return static_cast<uint64_t>(value);
}

void print_usage(const char* program) {
    std::cout << "Upload Example - streamup " << version::to_string() << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <local_file|-> <bucket> <key>" << std::endl;
    std::cout << std::endl;
    std::cout << "Credentials are read from AWS_ACCESS_KEY_ID, AWS_SECRET_ACCESS_KEY" << std::endl;
    std::cout << "and AWS_SESSION_TOKEN." << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --endpoint <url>        Custom endpoint (MinIO, B2, ...)" << std::endl;
    std::cout << "  --account-id <id>       Cloudflare R2 account id" << std::endl;
    std::cout << "  --region <region>       Signing region (default: us-east-1)" << std::endl;
    std::cout << "  --path-style            Force path-style addressing" << std::endl;
    std::cout << "  --size <size>           Declared size, required for stdin (e.g. 10G)" << std::endl;
    std::cout << "  --workers <n>           Concurrent part uploads (default: 4)" << std::endl;
    std::cout << "  --memory <mb>           Memory budget in MiB (default: unbounded)" << std::endl;
    std::cout << "  --checksum <algo>       md5, sha256 or none (default: md5)" << std::endl;
    std::cout << "  --content-type <type>   Override the detected content type" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " backup.tar.gz my-bucket db/backup.tar.gz" << std::endl;
    std::cout << "  pg_dump db | " << program
              << " --size 70G --account-id abc123 - backups db/dump.sql" << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    upload_config_builder builder;
    builder.with_credentials(env_or("AWS_ACCESS_KEY_ID"), env_or("AWS_SECRET_ACCESS_KEY"));
    if (auto token = env_or("AWS_SESSION_TOKEN"); !token.empty()) {
        builder.with_session_token(token);
    }

    std::optional<uint64_t> declared_size;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires an argument" << std::endl;
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--path-style") {
            builder.with_path_style(true);
        } else if (arg == "--endpoint" || arg == "--account-id" || arg == "--region" ||
                   arg == "--size" || arg == "--workers" || arg == "--memory" ||
                   arg == "--checksum" || arg == "--content-type") {
            auto value = next();
            if (!value) {
                return 1;
            }
            try {
                if (arg == "--endpoint") {
                    builder.with_endpoint(*value);
                } else if (arg == "--account-id") {
                    builder.with_account_id(*value);
                } else if (arg == "--region") {
                    builder.with_region(*value);
                } else if (arg == "--size") {
                    declared_size = parse_size(*value);
                } else if (arg == "--workers") {
                    builder.with_workers(static_cast<std::size_t>(std::stoul(*value)));
                } else if (arg == "--memory") {
                    builder.with_memory_limit_mb(std::stoull(*value));
                } else if (arg == "--checksum") {
                    if (*value == "none") {
                        builder.without_checksum();
                    } else {
                        builder.with_checksum(*value);
                    }
                } else {
                    builder.with_content_type(*value);
                }
            } catch (const std::exception& e) {
                std::cerr << "Error: invalid value for " << arg << ": " << e.what() << std::endl;
                return 1;
            }
        } else if (!arg.empty() && arg[0] == '-' && arg != "-") {
            std::cerr << "Error: unknown option " << arg << std::endl;
            return 1;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 3) {
        print_usage(argv[0]);
        return 1;
    }
    const auto& local_path = positional[0];
    builder.with_bucket(positional[1]).with_key(positional[2]);

    // Open the input
    std::unique_ptr<byte_source> source;
    if (local_path == "-") {
        if (!declared_size) {
            std::cerr << "Error: --size is required when reading from stdin" << std::endl;
            return 1;
        }
        source = std::make_unique<istream_source>(std::cin);
    } else {
        auto file = file_source::open(local_path);
        if (!file) {
            std::cerr << "Error: " << file.error().describe() << std::endl;
            return 1;
        }
        if (!declared_size) {
            declared_size = file.value()->size();
        }
        source = std::move(file.value());
    }
    builder.with_total_size(*declared_size);

    const auto started = std::chrono::steady_clock::now();
    std::mutex progress_mutex;
    uint64_t shown_bytes = 0;
    builder.with_progress_callback([&](uint64_t bytes, uint32_t parts) {
        // Workers report concurrently; print only totals newer than the last line
        std::lock_guard<std::mutex> lock(progress_mutex);
        if (bytes <= shown_bytes) {
            return;
        }
        shown_bytes = bytes;
        auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started);
        double percent = 100.0 * static_cast<double>(bytes) / static_cast<double>(*declared_size);
        double rate = elapsed.count() > 0 ? static_cast<double>(bytes) / elapsed.count() : 0.0;
        std::cout << "\r  " << std::fixed << std::setprecision(1) << percent << "% "
                  << format_size(bytes) << " in " << parts << " parts ("
                  << format_size(static_cast<uint64_t>(rate)) << "/s)   " << std::flush;
    });

    auto config = builder.build();
    if (!config) {
        std::cerr << "Error: " << config.error().describe() << std::endl;
        return 1;
    }

    auto up = uploader::create(config.value());
    if (!up) {
        std::cerr << "Error: " << up.error().describe() << std::endl;
        return 1;
    }

    g_active_upload = up.value().get();
    std::signal(SIGINT, handle_interrupt);

    std::cout << "Uploading " << local_path << " to " << positional[1] << "/" << positional[2]
              << " (" << format_size(*declared_size) << ")" << std::endl;

    auto res = up.value()->upload(*source);
    g_active_upload = nullptr;
    std::cout << std::endl;

    if (!res) {
        std::cerr << "Upload failed: " << res.error().describe() << std::endl;
        return is_cancellation(res.error().code) ? 130 : 1;
    }

    const auto& r = res.value();
    std::cout << "Upload complete" << std::endl;
    std::cout << "  Upload ID: " << r.upload_id << std::endl;
    std::cout << "  ETag:      " << r.etag << std::endl;
    std::cout << "  Location:  " << r.location << std::endl;
    std::cout << "  Size:      " << format_size(r.bytes_uploaded) << " in " << r.parts_uploaded
              << " parts of " << format_size(r.part_size) << std::endl;
    if (!r.checksum.empty()) {
        std::cout << "  Checksum:  " << r.checksum << std::endl;
    }
    std::cout << "  Duration:  " << r.duration.count() << " ms" << std::endl;
    return 0;
}
