/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

#include <algorithm>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>

namespace kcenon::streamup::benchmark {

// test_data_generator implementation

auto test_data_generator::generate_random_data(std::size_t size, uint32_t seed) -> byte_buffer {
    byte_buffer data(size);

    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::uniform_int_distribution<uint16_t> dis(0, 255);

    for (auto& byte : data) {
        byte = static_cast<std::byte>(dis(gen));
    }
    return data;
}

auto test_data_generator::generate_text_data(std::size_t size, uint32_t seed) -> byte_buffer {
    byte_buffer data;
    data.reserve(size);

    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);

    static const std::vector<std::string> fields = {
        "INFO", "WARN", "DEBUG", "upload", "part", "bytes", "etag", "bucket",
        "key", "retry", "backoff", "session", "complete", "abort", "worker",
    };
    std::uniform_int_distribution<std::size_t> field_dis(0, fields.size() - 1);
    std::uniform_int_distribution<int> number_dis(0, 99999);

    while (data.size() < size) {
        std::string line = fields[field_dis(gen)] + " " + fields[field_dis(gen)] + "=" +
                           std::to_string(number_dis(gen)) + "\n";
        for (char c : line) {
            if (data.size() >= size) {
                break;
            }
            data.push_back(static_cast<std::byte>(c));
        }
    }
    return data;
}

// repeating_source implementation

repeating_source::repeating_source(const byte_buffer& block, uint64_t total_size)
    : block_(block), remaining_(total_size) {}

auto repeating_source::read(std::span<std::byte> buffer) -> result<std::size_t> {
    if (remaining_ == 0 || block_.empty()) {
        return std::size_t{0};
    }
    auto n = std::min<uint64_t>({buffer.size(), block_.size() - offset_, remaining_});
    std::memcpy(buffer.data(), block_.data() + offset_, static_cast<std::size_t>(n));
    offset_ = (offset_ + static_cast<std::size_t>(n)) % block_.size();
    remaining_ -= n;
    return static_cast<std::size_t>(n);
}

// temp_file_manager implementation

temp_file_manager::temp_file_manager(const std::filesystem::path& base_dir) {
    if (base_dir.empty()) {
        base_dir_ = std::filesystem::temp_directory_path() / "streamup_benchmarks";
        owns_dir_ = true;
    } else {
        base_dir_ = base_dir;
    }

    std::error_code ec;
    std::filesystem::create_directories(base_dir_, ec);
}

temp_file_manager::~temp_file_manager() {
    cleanup();
}

auto temp_file_manager::create_random_file(const std::string& name, std::size_t size,
                                           uint32_t seed) -> std::filesystem::path {
    auto data = test_data_generator::generate_random_data(size, seed);
    auto path = base_dir_ / name;
    std::ofstream file(path, std::ios::binary);
    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
    created_files_.push_back(path);
    return path;
}

auto temp_file_manager::base_dir() const -> const std::filesystem::path& {
    return base_dir_;
}

void temp_file_manager::cleanup() {
    std::error_code ec;

    for (const auto& path : created_files_) {
        std::filesystem::remove(path, ec);
    }
    created_files_.clear();

    if (owns_dir_) {
        std::filesystem::remove_all(base_dir_, ec);
    }
}

// Utility functions

auto format_bytes(uint64_t bytes) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= sizes::GB) {
        oss << static_cast<double>(bytes) / sizes::GB << " GB";
    } else if (bytes >= sizes::MB) {
        oss << static_cast<double>(bytes) / sizes::MB << " MB";
    } else if (bytes >= sizes::KB) {
        oss << static_cast<double>(bytes) / sizes::KB << " KB";
    } else {
        oss << bytes << " B";
    }
    return oss.str();
}

auto format_throughput(double bytes_per_second) -> std::string {
    return format_bytes(static_cast<uint64_t>(bytes_per_second)) + "/s";
}

}  // namespace kcenon::streamup::benchmark
