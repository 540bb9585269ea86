/**
 * @file memory_round_trip.cpp
 * @brief Offline walkthrough of upload, listing, download and cleanup
 *
 * Runs against the in-memory backend, so no credentials or network are
 * needed. One part is made to fail once to show the retry path.
 */

#include <kcenon/streamup/streamup.h>

#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

using namespace kcenon::streamup;

int main() {
    auto backend = std::make_shared<memory_backend>();

    // Fail the first attempt of part 2 with a throttling response
    backend->set_part_hook([](uint32_t part, uint32_t attempt) -> std::optional<error> {
        if (part == 2 && attempt == 1) {
            error err{error_code::throttled, "Please reduce your request rate"};
            err.http_status = 503;
            err.service_code = "SlowDown";
            return err;
        }
        return std::nullopt;
    });

    std::string payload;
    payload.reserve(12 * mib);
    while (payload.size() < 12 * mib) {
        payload += "2024-01-01T00:00:00Z INFO upload part completed\n";
    }
    payload.resize(12 * mib);

    std::mutex output;
    retry_config retry;
    retry.initial_delay = std::chrono::milliseconds(10);

    auto config = upload_config_builder()
                      .with_credentials("offline", "offline")
                      .with_bucket("demo")
                      .with_key("logs/app.log")
                      .with_total_size(payload.size())
                      .with_workers(3)
                      .with_retry(retry)
                      .with_checksum("sha256")
                      .with_progress_callback([&output](uint64_t bytes, uint32_t parts) {
                          std::lock_guard<std::mutex> lock(output);
                          std::cout << "  progress: " << format_size(bytes) << " (" << parts
                                    << " parts)" << std::endl;
                      })
                      .build();
    if (!config) {
        std::cerr << "Error: " << config.error().describe() << std::endl;
        return 1;
    }

    std::cout << "Uploading " << format_size(payload.size()) << std::endl;
    uploader up(config.value(), backend);
    memory_source source(payload);
    auto uploaded = up.upload(source);
    if (!uploaded) {
        std::cerr << "Upload failed: " << uploaded.error().describe() << std::endl;
        return 1;
    }
    std::cout << "Uploaded " << uploaded.value().parts_uploaded << " parts, etag "
              << uploaded.value().etag << std::endl;
    std::cout << "  sha256 " << uploaded.value().checksum << std::endl;

    // Leave an abandoned session behind, then list objects
    (void)backend->begin_multipart("logs/abandoned.log", {});

    list_config lc;
    lc.connection = config.value().connection;
    lc.prefix = "logs/";
    object_lister lister(lc, backend);
    if (auto objects = lister.list(); objects) {
        for (const auto& obj : objects.value()) {
            std::cout << "Object " << obj.key << " " << format_size(obj.size) << " "
                      << obj.content_type << std::endl;
        }
    }

    // Download and compare digests
    download_config dc;
    dc.connection = config.value().connection;
    dc.key = "logs/app.log";
    dc.calculate_checksum = true;
    dc.checksum_algorithm = "sha256";
    downloader dl(dc, backend);
    memory_sink sink;
    auto written = dl.download(sink);
    if (!written) {
        std::cerr << "Download failed: " << written.error().describe() << std::endl;
        return 1;
    }
    std::cout << "Downloaded " << format_size(written.value()) << ", digest "
              << (dl.checksum() == uploaded.value().checksum ? "matches" : "DIFFERS")
              << std::endl;

    // Abort leftovers
    cleanup_config cc;
    cc.prefix = "logs/";
    auto report = cleanup_incomplete_uploads(*backend, cc);
    if (!report) {
        std::cerr << "Cleanup failed: " << report.error().describe() << std::endl;
        return 1;
    }
    std::cout << "Cleanup aborted " << report.value().total_aborted << " of "
              << report.value().total_found << " incomplete uploads" << std::endl;

    return sink.str() == payload ? 0 : 1;
}
