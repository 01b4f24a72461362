// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file upload_policy.cpp
 * @brief Path sanitizing, size parsing and upload limit checks
 */

#include <arbor/transfer/upload/upload_policy.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <utility>

namespace arbor::transfer {

namespace {

auto to_lower(std::string_view text) -> std::string {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

auto contains_extension(const std::vector<std::string>& list, const std::string& ext) -> bool {
    return std::any_of(list.begin(), list.end(),
                       [&ext](const std::string& item) { return to_lower(item) == ext; });
}

}  // namespace

auto sanitize_path(std::string_view path) -> std::string {
    std::vector<std::string_view> parts;

    std::size_t start = 0;
    while (start <= path.size()) {
        auto end = path.find_first_of("/\\", start);
        if (end == std::string_view::npos) {
            end = path.size();
        }
        auto part = path.substr(start, end - start);
        if (part == "..") {
            if (!parts.empty()) {
                parts.pop_back();
            }
        } else if (!part.empty() && part != ".") {
            parts.push_back(part);
        }
        start = end + 1;
    }

    std::string sanitized;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            sanitized += '/';
        }
        sanitized.append(parts[i]);
    }
    return sanitized;
}

auto parse_size(std::string_view text) -> result<uint64_t> {
    static constexpr std::array<std::pair<std::string_view, uint64_t>, 5> units = {{
        {"TB", 1ULL << 40},
        {"GB", 1ULL << 30},
        {"MB", 1ULL << 20},
        {"KB", 1ULL << 10},
        {"B", 1ULL},
    }};

    std::string upper(trim(text));
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    std::string_view number = upper;
    uint64_t multiplier = 1;
    for (const auto& [suffix, factor] : units) {
        if (number.size() > suffix.size() &&
            number.substr(number.size() - suffix.size()) == suffix) {
            number.remove_suffix(suffix.size());
            multiplier = factor;
            break;
        }
    }
    number = trim(number);

    double value = 0.0;
    auto [ptr, ec] = std::from_chars(number.data(), number.data() + number.size(), value);
    if (number.empty() || ec != std::errc{} || ptr != number.data() + number.size() ||
        !std::isfinite(value) || value < 0.0) {
        return unexpected(error{error_code::invalid_configuration,
                                "invalid size format: " + std::string(text)});
    }

    return static_cast<uint64_t>(value * static_cast<double>(multiplier));
}

auto upload_policy::validate() const -> result<void> {
    if (auto chunks = chunk_config(chunk_size).validate(); !chunks) {
        return chunks;
    }
    if (look_ahead == 0) {
        return unexpected(
            error{error_code::invalid_configuration, "look-ahead must be at least 1"});
    }
    if (max_file_size == 0) {
        return unexpected(
            error{error_code::invalid_configuration, "max file size must be positive"});
    }
    return {};
}

auto upload_policy::is_extension_allowed(std::string_view filename) const -> bool {
    auto ext = to_lower(std::filesystem::path(std::string(filename)).extension().string());

    if (contains_extension(blocked_extensions, ext)) {
        return false;
    }
    if (allowed_extensions.empty()) {
        return true;
    }
    return contains_extension(allowed_extensions, ext);
}

auto upload_policy::check(const file_metadata& meta) const -> result<void> {
    if (meta.size > max_file_size) {
        return unexpected(error{error_code::file_too_large,
                                "file size " + std::to_string(meta.size) +
                                    " exceeds maximum of " + std::to_string(max_file_size)});
    }

    const auto& name = meta.original_name.empty() ? meta.relative_path : meta.original_name;
    if (!is_extension_allowed(name)) {
        return unexpected(
            error{error_code::extension_not_allowed, "file type not allowed: " + name});
    }

    if (sanitize_path(meta.relative_path).empty()) {
        return unexpected(error{error_code::invalid_file_path,
                                "invalid file path: '" + meta.relative_path + "'"});
    }
    return {};
}

}  // namespace arbor::transfer
