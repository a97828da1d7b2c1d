/// @file snapshot.hpp
/// @brief Compact binary snapshots of documents and sessions.
///
/// A snapshot is the JSON form from json.hpp encoded as CBOR and
/// compressed with raw DEFLATE, behind a small header:
///
/// | bytes | content                           |
/// |-------|-----------------------------------|
/// | 0..3  | magic "CEDT"                      |
/// | 4     | format version (currently 1)      |
/// | 5     | kind: 1 = document, 2 = session   |
/// | 6..   | DEFLATE(CBOR(json))               |

#pragma once

#include <coedit-cpp/document.hpp>
#include <coedit-cpp/session.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace coedit_cpp {

/// Current snapshot format version.
inline constexpr std::uint8_t snapshot_format_version = 1;

/// What a snapshot holds.
enum class SnapshotKind : std::uint8_t {
    document = 1,
    session = 2,
};

/// Serialize a document, its full change history included.
auto save_document(const Document& doc) -> std::vector<std::byte>;

/// Deserialize a document.
/// @return nullopt if the data is not a valid document snapshot, or if
///   the restored history breaks a Document invariant.
auto load_document(std::span<const std::byte> data) -> std::optional<Document>;

/// Serialize a session and its membership.
auto save_session(const CollaborationSession& session) -> std::vector<std::byte>;

/// Deserialize a session.
/// @return nullopt if the data is not a valid session snapshot.
auto load_session(std::span<const std::byte> data) -> std::optional<CollaborationSession>;

/// Read the kind byte of a snapshot without decoding it.
/// @return nullopt if the header is missing or not recognised.
auto snapshot_kind(std::span<const std::byte> data) -> std::optional<SnapshotKind>;

}  // namespace coedit_cpp
