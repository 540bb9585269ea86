/**
 * @file memory_backend.cpp
 * @brief In-process storage backend implementation
 * @version 0.1.0
 */

#include "kcenon/streamup/backend/memory_backend.h"
#include "kcenon/streamup/core/checksum.h"
#include "kcenon/streamup/core/content_type.h"

#include <algorithm>
#include <map>

namespace kcenon::streamup {

namespace {

struct stored_object {
    byte_buffer data;
    std::string etag;
    object_metadata metadata;
    std::chrono::system_clock::time_point last_modified;
};

struct stored_part {
    byte_buffer data;
    std::string etag;
};

struct session {
    std::string key;
    object_metadata metadata;
    std::chrono::system_clock::time_point initiated;
    std::map<uint32_t, stored_part> parts;
};

auto quoted(const std::string& value) -> std::string {
    return "\"" + value + "\"";
}

auto not_found_upload(const std::string& upload_id) -> error {
    error err{error_code::upload_not_found, "no such upload: " + upload_id};
    err.http_status = 404;
    err.service_code = "NoSuchUpload";
    return err;
}

}  // namespace

struct memory_backend::impl {
    mutable std::mutex mutex;
    std::map<std::string, stored_object> objects;
    std::map<std::string, session> sessions;
    std::map<std::pair<std::string, uint32_t>, uint32_t> attempts;
    std::vector<completed_part> last_completed;
    std::vector<uint32_t> completion_order;
    uint64_t next_upload_id = 1;
    uint32_t failing_aborts = 0;

    std::mutex hook_mutex;
    part_hook hook;

    auto new_upload_id() -> std::string {
        return "mem-upload-" + std::to_string(next_upload_id++);
    }
};

memory_backend::memory_backend() : impl_(std::make_unique<impl>()) {}

memory_backend::~memory_backend() = default;

auto memory_backend::begin_multipart(const std::string& key,
                                     const object_metadata& metadata)
    -> result<std::string> {
    begin_calls_.fetch_add(1);

    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto id = impl_->new_upload_id();
    impl_->sessions.emplace(id, session{key, metadata, std::chrono::system_clock::now(), {}});
    return id;
}

auto memory_backend::upload_part(const std::string& key,
                                 const std::string& upload_id,
                                 uint32_t part_number,
                                 std::span<const std::byte> data)
    -> result<std::string> {
    upload_part_calls_.fetch_add(1);

    auto now_in_flight = in_flight_.fetch_add(1) + 1;
    auto peak = peak_in_flight_.load();
    while (now_in_flight > peak && !peak_in_flight_.compare_exchange_weak(peak, now_in_flight)) {
    }

    struct in_flight_guard {
        std::atomic<uint32_t>& counter;
        ~in_flight_guard() { counter.fetch_sub(1); }
    } guard{in_flight_};

    uint32_t attempt = 0;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        attempt = ++impl_->attempts[{upload_id, part_number}];
    }

    part_hook hook;
    {
        std::lock_guard<std::mutex> lock(impl_->hook_mutex);
        hook = impl_->hook;
    }
    if (hook) {
        if (auto injected = hook(part_number, attempt)) {
            return unexpected{*injected};
        }
    }

    if (part_number == 0 || part_number > 10000) {
        error err{error_code::backend_error, "part number out of range"};
        err.http_status = 400;
        err.service_code = "InvalidArgument";
        return unexpected{err};
    }

    auto etag = quoted(checksum_accumulator::digest(checksum_algorithm::md5, data));

    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->sessions.find(upload_id);
    if (it == impl_->sessions.end() || it->second.key != key) {
        return unexpected{not_found_upload(upload_id)};
    }
    it->second.parts[part_number] = stored_part{byte_buffer(data.begin(), data.end()), etag};
    impl_->completion_order.push_back(part_number);
    return etag;
}

auto memory_backend::complete_multipart(const std::string& key,
                                        const std::string& upload_id,
                                        const std::vector<completed_part>& parts)
    -> result<multipart_completion> {
    complete_calls_.fetch_add(1);

    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->last_completed = parts;

    auto it = impl_->sessions.find(upload_id);
    if (it == impl_->sessions.end() || it->second.key != key) {
        return unexpected{not_found_upload(upload_id)};
    }
    if (parts.empty()) {
        error err{error_code::backend_error, "completion list is empty"};
        err.http_status = 400;
        err.service_code = "MalformedXML";
        return unexpected{err};
    }

    byte_buffer assembled;
    std::string etag_material;
    uint32_t previous = 0;
    for (const auto& part : parts) {
        if (part.part_number <= previous) {
            error err{error_code::backend_error, "parts must be sorted ascending"};
            err.http_status = 400;
            err.service_code = "InvalidPartOrder";
            return unexpected{err};
        }
        previous = part.part_number;

        auto stored = it->second.parts.find(part.part_number);
        if (stored == it->second.parts.end() || stored->second.etag != part.etag) {
            error err{error_code::backend_error,
                      "part " + std::to_string(part.part_number) + " not found or ETag mismatch"};
            err.http_status = 400;
            err.service_code = "InvalidPart";
            return unexpected{err};
        }
        assembled.insert(assembled.end(), stored->second.data.begin(), stored->second.data.end());
        etag_material += stored->second.etag;
    }

    auto digest = checksum_accumulator::digest(
        checksum_algorithm::md5,
        std::span<const std::byte>(reinterpret_cast<const std::byte*>(etag_material.data()),
                                   etag_material.size()));
    auto etag = quoted(digest + "-" + std::to_string(parts.size()));

    auto metadata = it->second.metadata;
    if (metadata.content_type.empty()) {
        metadata.content_type = detect_content_type(key);
    }
    impl_->objects[key] = stored_object{std::move(assembled), etag, std::move(metadata),
                                        std::chrono::system_clock::now()};
    impl_->sessions.erase(it);

    return multipart_completion{etag, "memory://" + key};
}

auto memory_backend::abort_multipart(const std::string& key,
                                     const std::string& upload_id) -> result<void> {
    abort_calls_.fetch_add(1);

    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->failing_aborts > 0) {
        --impl_->failing_aborts;
        error err{error_code::service_unavailable, "abort rejected"};
        err.http_status = 503;
        err.service_code = "ServiceUnavailable";
        return unexpected{err};
    }

    auto it = impl_->sessions.find(upload_id);
    if (it == impl_->sessions.end() || it->second.key != key) {
        return unexpected{not_found_upload(upload_id)};
    }
    impl_->sessions.erase(it);
    return {};
}

auto memory_backend::head_object(const std::string& key) -> result<object_info> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->objects.find(key);
    if (it == impl_->objects.end()) {
        error err{error_code::object_not_found, "no such key: " + key};
        err.http_status = 404;
        err.service_code = "NoSuchKey";
        return unexpected{err};
    }
    return object_info{key, it->second.data.size(), it->second.etag,
                       it->second.metadata.content_type, it->second.last_modified};
}

auto memory_backend::get_object(const std::string& key) -> result<std::unique_ptr<byte_source>> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->objects.find(key);
    if (it == impl_->objects.end()) {
        error err{error_code::object_not_found, "no such key: " + key};
        err.http_status = 404;
        err.service_code = "NoSuchKey";
        return unexpected{err};
    }
    return std::unique_ptr<byte_source>(std::make_unique<memory_source>(it->second.data));
}

auto memory_backend::list_multipart_sessions(const session_list_request& request)
    -> result<session_list_page> {
    const uint32_t page_size = request.max_uploads == 0 ? 1000 : request.max_uploads;

    std::lock_guard<std::mutex> lock(impl_->mutex);

    std::vector<multipart_session_info> matching;
    for (const auto& [id, s] : impl_->sessions) {
        if (!s.key.starts_with(request.prefix)) {
            continue;
        }
        matching.push_back(multipart_session_info{s.key, id, s.initiated, "STANDARD"});
    }
    std::sort(matching.begin(), matching.end(), [](const auto& a, const auto& b) {
        return a.key != b.key ? a.key < b.key : a.upload_id < b.upload_id;
    });

    session_list_page page;
    for (const auto& info : matching) {
        if (!request.key_marker.empty()) {
            if (info.key < request.key_marker) {
                continue;
            }
            if (info.key == request.key_marker &&
                (request.upload_id_marker.empty() || info.upload_id <= request.upload_id_marker)) {
                continue;
            }
        }
        if (page.sessions.size() == page_size) {
            page.is_truncated = true;
            break;
        }
        page.sessions.push_back(info);
    }
    if (page.is_truncated && !page.sessions.empty()) {
        page.next_key_marker = page.sessions.back().key;
        page.next_upload_id_marker = page.sessions.back().upload_id;
    }
    return page;
}

auto memory_backend::list_objects(const object_list_request& request) -> result<object_list_page> {
    const uint32_t page_size = request.max_keys == 0 ? 1000 : request.max_keys;

    std::lock_guard<std::mutex> lock(impl_->mutex);

    object_list_page page;
    for (const auto& [key, obj] : impl_->objects) {
        if (!key.starts_with(request.prefix)) {
            continue;
        }
        if (!request.continuation_token.empty() && key <= request.continuation_token) {
            continue;
        }
        if (page.objects.size() == page_size) {
            page.is_truncated = true;
            break;
        }
        page.objects.push_back(object_info{key, obj.data.size(), obj.etag,
                                           obj.metadata.content_type, obj.last_modified});
    }
    if (page.is_truncated && !page.objects.empty()) {
        page.next_continuation_token = page.objects.back().key;
    }
    return page;
}

auto memory_backend::delete_object(const std::string& key) -> result<void> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->objects.erase(key);
    return {};
}

void memory_backend::set_part_hook(part_hook hook) {
    std::lock_guard<std::mutex> lock(impl_->hook_mutex);
    impl_->hook = std::move(hook);
}

void memory_backend::put_object(const std::string& key, byte_buffer data,
                                std::string content_type) {
    auto etag = quoted(checksum_accumulator::digest(checksum_algorithm::md5, data));
    object_metadata metadata;
    metadata.content_type = std::move(content_type);

    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->objects[key] = stored_object{std::move(data), std::move(etag), std::move(metadata),
                                        std::chrono::system_clock::now()};
}

auto memory_backend::create_session(const std::string& key,
                                    std::chrono::system_clock::time_point initiated)
    -> std::string {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto id = impl_->new_upload_id();
    impl_->sessions.emplace(id, session{key, {}, initiated, {}});
    return id;
}

void memory_backend::fail_next_aborts(uint32_t count) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->failing_aborts = count;
}

auto memory_backend::object_data(const std::string& key) const -> std::optional<byte_buffer> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->objects.find(key);
    if (it == impl_->objects.end()) {
        return std::nullopt;
    }
    return it->second.data;
}

auto memory_backend::object_metadata_of(const std::string& key) const
    -> std::optional<object_metadata> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->objects.find(key);
    if (it == impl_->objects.end()) {
        return std::nullopt;
    }
    return it->second.metadata;
}

auto memory_backend::has_session(const std::string& upload_id) const -> bool {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->sessions.count(upload_id) > 0;
}

auto memory_backend::session_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->sessions.size();
}

auto memory_backend::last_completed_parts() const -> std::vector<completed_part> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->last_completed;
}

auto memory_backend::part_completion_order() const -> std::vector<uint32_t> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->completion_order;
}

}  // namespace kcenon::streamup
