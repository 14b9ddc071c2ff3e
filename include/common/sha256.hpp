//! # SHA-256 Digest Utility
//!
//! Content hashing for cached tools and bundle resources, backed by
//! OpenSSL's EVP interface.
//!
//! ## Usage
//!
//! ```cpp
//! #include "common/sha256.hpp"
//!
//! std::string hex = relpack::sha256_hex("Hello, world!");
//!
//! // Or hash a file (nullopt if it cannot be read)
//! auto file_hash = relpack::sha256_file("path/to/file");
//! ```

#ifndef RELPACK_COMMON_SHA256_HPP
#define RELPACK_COMMON_SHA256_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace relpack {

/// Lower-case hex SHA-256 of an in-memory buffer.
std::string sha256_hex(std::string_view data);

/// Lower-case hex SHA-256 of a file's content, streamed in 64 KiB chunks.
std::optional<std::string> sha256_file(const std::filesystem::path& path);

} // namespace relpack

#endif // RELPACK_COMMON_SHA256_HPP
