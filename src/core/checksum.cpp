// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file checksum.cpp
 * @brief Implementation of SHA-256 utilities
 */

#include <arbor/transfer/core/checksum.h>

#include <openssl/err.h>
#include <openssl/evp.h>

#include <array>
#include <cctype>
#include <fstream>
#include <vector>

namespace arbor::transfer {

namespace {

/**
 * @brief Get OpenSSL error message
 */
auto get_openssl_error() -> std::string {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return "Unknown OpenSSL error";
    }
    std::array<char, 256> buffer{};
    ERR_error_string_n(err, buffer.data(), buffer.size());
    return std::string(buffer.data());
}

/**
 * @brief RAII wrapper for EVP_MD_CTX
 */
class evp_md_ctx_wrapper {
public:
    evp_md_ctx_wrapper() : ctx_(EVP_MD_CTX_new()) {}

    ~evp_md_ctx_wrapper() {
        if (ctx_) {
            EVP_MD_CTX_free(ctx_);
        }
    }

    evp_md_ctx_wrapper(const evp_md_ctx_wrapper&) = delete;
    auto operator=(const evp_md_ctx_wrapper&) -> evp_md_ctx_wrapper& = delete;

    [[nodiscard]] auto get() const -> EVP_MD_CTX* { return ctx_; }
    [[nodiscard]] explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_;
};

/**
 * @brief Incremental SHA-256 over an EVP digest context
 */
class sha256_digest {
public:
    auto init() -> result<void> {
        if (!ctx_) {
            return unexpected(error{error_code::internal_error, "EVP_MD_CTX_new failed"});
        }
        if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
            return unexpected(error{error_code::internal_error,
                                    "EVP_DigestInit_ex failed: " + get_openssl_error()});
        }
        return {};
    }

    auto update(const void* data, std::size_t size) -> result<void> {
        if (size == 0) {
            return {};
        }
        if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
            return unexpected(error{error_code::internal_error,
                                    "EVP_DigestUpdate failed: " + get_openssl_error()});
        }
        return {};
    }

    auto finish() -> result<std::string> {
        std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
        unsigned int length = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), digest.data(), &length) != 1) {
            return unexpected(error{error_code::internal_error,
                                    "EVP_DigestFinal_ex failed: " + get_openssl_error()});
        }
        return to_hex(digest.data(), length);
    }

private:
    static auto to_hex(const unsigned char* bytes, unsigned int length) -> std::string {
        static constexpr char digits[] = "0123456789abcdef";
        std::string hex;
        hex.reserve(static_cast<std::size_t>(length) * 2);
        for (unsigned int i = 0; i < length; ++i) {
            hex.push_back(digits[bytes[i] >> 4]);
            hex.push_back(digits[bytes[i] & 0x0F]);
        }
        return hex;
    }

    evp_md_ctx_wrapper ctx_;
};

}  // namespace

auto checksum::sha256(std::span<const std::byte> data) -> std::string {
    sha256_digest digest;
    if (!digest.init() || !digest.update(data.data(), data.size())) {
        return {};
    }
    auto hex = digest.finish();
    return hex ? hex.value() : std::string{};
}

auto checksum::sha256_file(const std::filesystem::path& path) -> result<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected(
            error{error_code::file_not_found, "cannot open file: " + path.string()});
    }

    sha256_digest digest;
    if (auto init = digest.init(); !init) {
        return unexpected(init.error());
    }

    std::vector<char> buffer(file_buffer_size);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto bytes_read = file.gcount();
        if (bytes_read > 0) {
            if (auto upd = digest.update(buffer.data(), static_cast<std::size_t>(bytes_read));
                !upd) {
                return unexpected(upd.error());
            }
        }
    }

    if (file.bad()) {
        return unexpected(
            error{error_code::file_read_error, "read failed: " + path.string()});
    }

    return digest.finish();
}

auto checksum::verify_sha256(const std::filesystem::path& path, std::string_view expected)
    -> bool {
    auto result = sha256_file(path);
    if (!result) {
        return false;
    }
    return digests_equal(result.value(), expected);
}

auto checksum::digests_equal(std::string_view lhs, std::string_view rhs) -> bool {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        auto a = std::tolower(static_cast<unsigned char>(lhs[i]));
        auto b = std::tolower(static_cast<unsigned char>(rhs[i]));
        if (a != b) {
            return false;
        }
    }
    return true;
}

}  // namespace arbor::transfer
