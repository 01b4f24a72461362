// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file upload_session.cpp
 * @brief Implementation of upload sessions and the session registry
 */

#include <arbor/transfer/upload/upload_session.h>

#include <arbor/transfer/core/logging.h>
#include <arbor/transfer/upload/upload_policy.h>

#include <array>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <system_error>

namespace arbor::transfer {

namespace {

auto to_epoch_seconds(std::chrono::system_clock::time_point tp) -> double {
    return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

void write_file_entry(std::ostringstream& oss, const file_metadata& f) {
    using detail::escape_json_string;
    oss << "    {\n";
    oss << "      \"relativePath\": \"" << escape_json_string(f.relative_path) << "\",\n";
    oss << "      \"originalName\": \"" << escape_json_string(f.original_name) << "\",\n";
    oss << "      \"size\": " << f.size << ",\n";
    if (f.mode) {
        oss << "      \"mode\": " << *f.mode << ",\n";
    } else {
        oss << "      \"mode\": null,\n";
    }
    if (f.mtime) {
        oss << "      \"mtime\": " << to_epoch_seconds(*f.mtime) << ",\n";
    } else {
        oss << "      \"mtime\": null,\n";
    }
    if (f.atime) {
        oss << "      \"atime\": " << to_epoch_seconds(*f.atime) << ",\n";
    } else {
        oss << "      \"atime\": null,\n";
    }
    oss << "      \"sha256\": \"" << escape_json_string(f.sha256) << "\"\n";
    oss << "    }";
}

}  // namespace

// upload_session implementation

upload_session::upload_session(std::string id, std::string user_id, uint64_t total_files,
                               uint64_t total_bytes, std::filesystem::path directory)
    : id_(std::move(id)),
      user_id_(std::move(user_id)),
      total_files_(total_files),
      total_bytes_(total_bytes),
      directory_(std::move(directory)),
      created_at_(clock::now()) {}

auto upload_session::state() const -> session_state {
    std::lock_guard lock(mutex_);
    return state_;
}

auto upload_session::completed_at() const -> std::optional<clock::time_point> {
    std::lock_guard lock(mutex_);
    return completed_at_;
}

auto upload_session::completed_files() const -> uint64_t {
    std::lock_guard lock(mutex_);
    return completed_files_;
}

auto upload_session::transferred_bytes() const -> uint64_t {
    std::lock_guard lock(mutex_);
    return transferred_bytes_;
}

auto upload_session::current_file() const -> std::string {
    std::lock_guard lock(mutex_);
    return current_file_;
}

auto upload_session::errors() const -> std::vector<session_error> {
    std::lock_guard lock(mutex_);
    return errors_;
}

auto upload_session::files() const -> std::vector<file_metadata> {
    std::lock_guard lock(mutex_);
    return files_;
}

auto upload_session::transition_to(session_state next) -> result<void> {
    session_state previous;
    {
        std::lock_guard lock(mutex_);
        if (!can_transition(state_, next)) {
            return unexpected(error{error_code::invalid_state_transition,
                                    std::string("cannot move session from ") +
                                        to_string(state_) + " to " + to_string(next)});
        }
        previous = state_;
        state_ = next;
        if (next == session_state::completed) {
            completed_at_ = clock::now();
        }
    }

    task_log_context ctx;
    ctx.session_id = id_;
    ARBOR_LOG_INFO_CTX(log_category::session,
                       std::string("Session ") + to_string(previous) + " -> " + to_string(next),
                       ctx);
    return {};
}

void upload_session::begin_file(const std::string& relative_path) {
    std::lock_guard lock(mutex_);
    current_file_ = relative_path;
}

void upload_session::record_file_completed(const file_metadata& meta) {
    std::lock_guard lock(mutex_);
    ++completed_files_;
    transferred_bytes_ += meta.size;
    current_file_ = meta.relative_path;
    files_.push_back(meta);
}

void upload_session::record_file_failed(const std::string& file, const std::string& message) {
    std::lock_guard lock(mutex_);
    errors_.push_back(session_error{file, message});
}

auto upload_session::progress() const -> session_progress {
    std::lock_guard lock(mutex_);

    session_progress p;
    p.files_completed = completed_files_;
    p.files_total = total_files_;
    p.bytes_transferred = transferred_bytes_;
    p.bytes_total = total_bytes_;
    p.current_file = current_file_;
    p.state = state_;

    if (total_files_ > 0) {
        p.overall_percent =
            static_cast<double>(completed_files_) / static_cast<double>(total_files_) * 100.0;
    }

    auto elapsed = std::chrono::duration<double>(clock::now() - created_at_).count();
    if (elapsed > 0.0) {
        p.transfer_speed = static_cast<double>(transferred_bytes_) / elapsed;
    }
    if (p.transfer_speed > 0.0) {
        auto remaining = total_bytes_ > transferred_bytes_ ? total_bytes_ - transferred_bytes_ : 0;
        p.eta_seconds = static_cast<double>(remaining) / p.transfer_speed;
    }
    return p;
}

auto upload_session::to_manifest_json() const -> std::string {
    using detail::escape_json_string;
    std::lock_guard lock(mutex_);

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3);
    oss << "{\n";
    oss << "  \"session_id\": \"" << escape_json_string(id_) << "\",\n";
    oss << "  \"user_id\": \"" << escape_json_string(user_id_) << "\",\n";
    oss << "  \"status\": \"" << to_string(state_) << "\",\n";
    oss << "  \"created_at\": " << to_epoch_seconds(created_at_) << ",\n";
    if (completed_at_) {
        oss << "  \"completed_at\": " << to_epoch_seconds(*completed_at_) << ",\n";
    } else {
        oss << "  \"completed_at\": null,\n";
    }
    oss << "  \"total_files\": " << total_files_ << ",\n";
    oss << "  \"completed_files\": " << completed_files_ << ",\n";
    oss << "  \"total_bytes\": " << total_bytes_ << ",\n";
    oss << "  \"transferred_bytes\": " << transferred_bytes_ << ",\n";

    oss << "  \"files\": [";
    for (std::size_t i = 0; i < files_.size(); ++i) {
        oss << (i == 0 ? "\n" : ",\n");
        write_file_entry(oss, files_[i]);
    }
    oss << (files_.empty() ? "],\n" : "\n  ],\n");

    oss << "  \"errors\": [";
    for (std::size_t i = 0; i < errors_.size(); ++i) {
        oss << (i == 0 ? "\n" : ",\n");
        oss << "    {\"file\": \"" << escape_json_string(errors_[i].file) << "\", \"error\": \""
            << escape_json_string(errors_[i].error) << "\"}";
    }
    oss << (errors_.empty() ? "]\n" : "\n  ]\n");
    oss << "}\n";
    return oss.str();
}

auto upload_session::write_manifest() const -> result<std::filesystem::path> {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        return unexpected(error{error_code::file_write_error,
                                "cannot create " + directory_.string() + ": " + ec.message()});
    }

    auto path = directory_ / "manifest.json";
    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        return unexpected(
            error{error_code::file_write_error, "cannot write manifest: " + path.string()});
    }
    file << to_manifest_json();
    file.close();
    if (!file) {
        return unexpected(
            error{error_code::file_write_error, "cannot write manifest: " + path.string()});
    }
    return path;
}

// session_registry implementation

session_registry::session_registry(std::filesystem::path upload_root)
    : root_(std::move(upload_root)) {}

auto session_registry::generate_session_id() -> std::string {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;

    std::array<uint8_t, 16> bytes{};
    uint64_t part1 = dis(gen);
    uint64_t part2 = dis(gen);
    for (int i = 0; i < 8; ++i) {
        bytes[i] = static_cast<uint8_t>((part1 >> (i * 8)) & 0xFF);
        bytes[i + 8] = static_cast<uint8_t>((part2 >> (i * 8)) & 0xFF);
    }

    // Version 4, RFC 4122 variant
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

auto session_registry::create(const std::string& user_id, uint64_t total_files,
                              uint64_t total_bytes) -> result<std::shared_ptr<upload_session>> {
    // The user id becomes one directory level under the root
    auto user = sanitize_path(user_id);
    if (user.empty() || user != user_id || user.find('/') != std::string::npos) {
        return unexpected(error{error_code::invalid_file_path, "invalid user id: " + user_id});
    }

    std::unique_lock lock(mutex_);

    auto id = generate_session_id();
    if (sessions_.count(id) != 0) {
        return unexpected(error{error_code::session_already_exists, "session id collision"});
    }

    auto directory = root_ / user / id;
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        return unexpected(error{error_code::file_write_error,
                                "cannot create " + directory.string() + ": " + ec.message()});
    }

    auto session =
        std::make_shared<upload_session>(id, user_id, total_files, total_bytes, directory);
    sessions_.emplace(id, session);

    task_log_context ctx;
    ctx.session_id = id;
    ctx.bytes = total_bytes;
    ARBOR_LOG_INFO_CTX(log_category::session,
                       "Created upload session for " + user_id + " with " +
                           std::to_string(total_files) + " files",
                       ctx);
    return session;
}

auto session_registry::find(const std::string& session_id) const
    -> std::shared_ptr<upload_session> {
    std::shared_lock lock(mutex_);
    auto it = sessions_.find(session_id);
    return it == sessions_.end() ? nullptr : it->second;
}

auto session_registry::complete(const std::string& session_id)
    -> result<std::filesystem::path> {
    auto session = find(session_id);
    if (!session) {
        return unexpected(
            error{error_code::session_not_found, "session not found: " + session_id});
    }

    if (auto moved = session->transition_to(session_state::completed); !moved) {
        return unexpected(moved.error());
    }
    return session->write_manifest();
}

auto session_registry::cancel(const std::string& session_id) -> result<void> {
    auto session = find(session_id);
    if (!session) {
        return unexpected(
            error{error_code::session_not_found, "session not found: " + session_id});
    }

    if (auto moved = session->transition_to(session_state::cancelled); !moved) {
        return moved;
    }

    std::error_code ec;
    std::filesystem::remove_all(session->directory(), ec);
    if (ec) {
        ARBOR_LOG_WARN(log_category::session,
                       "Could not remove " + session->directory().string() + ": " + ec.message());
    }

    remove(session_id);
    return {};
}

auto session_registry::remove(const std::string& session_id) -> bool {
    std::unique_lock lock(mutex_);
    return sessions_.erase(session_id) > 0;
}

auto session_registry::size() const -> std::size_t {
    std::shared_lock lock(mutex_);
    return sessions_.size();
}

}  // namespace arbor::transfer
