#include <coedit-cpp/snapshot.hpp>

#include <coedit-cpp/error.hpp>
#include <coedit-cpp/json.hpp>

#include "compression.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <stdexcept>
#include <utility>

namespace coedit_cpp {

namespace {

constexpr auto magic = std::array{std::byte{'C'}, std::byte{'E'}, std::byte{'D'}, std::byte{'T'}};
constexpr std::size_t header_size = magic.size() + 2;

auto encode(SnapshotKind kind, const nlohmann::json& j) -> std::vector<std::byte> {
    const auto cbor = nlohmann::json::to_cbor(j);
    const auto body = std::span{reinterpret_cast<const std::byte*>(cbor.data()), cbor.size()};
    auto compressed = detail::deflate_compress(body);
    if (!compressed) {
        throw std::runtime_error{"snapshot compression failed"};
    }

    auto out = std::vector<std::byte>{};
    out.reserve(header_size + compressed->size());
    out.insert(out.end(), magic.begin(), magic.end());
    out.push_back(std::byte{snapshot_format_version});
    out.push_back(static_cast<std::byte>(kind));
    out.insert(out.end(), compressed->begin(), compressed->end());
    return out;
}

auto decode(SnapshotKind expected, std::span<const std::byte> data)
    -> std::optional<nlohmann::json> {
    if (snapshot_kind(data) != expected) return std::nullopt;
    if (data[magic.size()] != std::byte{snapshot_format_version}) return std::nullopt;

    auto inflated = detail::deflate_decompress(data.subspan(header_size));
    if (!inflated || inflated->empty()) return std::nullopt;

    const auto* first = reinterpret_cast<const std::uint8_t*>(inflated->data());
    // allow_exceptions = false: a malformed body yields a discarded value.
    auto j = nlohmann::json::from_cbor(first, first + inflated->size(), true, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;
    return j;
}

}  // anonymous namespace

auto snapshot_kind(std::span<const std::byte> data) -> std::optional<SnapshotKind> {
    if (data.size() < header_size) return std::nullopt;
    if (!std::equal(magic.begin(), magic.end(), data.begin())) return std::nullopt;
    switch (static_cast<SnapshotKind>(data[magic.size() + 1])) {
        case SnapshotKind::document: return SnapshotKind::document;
        case SnapshotKind::session:  return SnapshotKind::session;
    }
    return std::nullopt;
}

auto save_document(const Document& doc) -> std::vector<std::byte> {
    return encode(SnapshotKind::document, nlohmann::json(doc));
}

auto load_document(std::span<const std::byte> data) -> std::optional<Document> {
    auto j = decode(SnapshotKind::document, data);
    if (!j) return std::nullopt;
    try {
        return j->get<Document>();
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    } catch (const Exception&) {
        return std::nullopt;
    }
}

auto save_session(const CollaborationSession& session) -> std::vector<std::byte> {
    return encode(SnapshotKind::session, nlohmann::json(session));
}

auto load_session(std::span<const std::byte> data) -> std::optional<CollaborationSession> {
    auto j = decode(SnapshotKind::session, data);
    if (!j) return std::nullopt;
    try {
        return j->get<CollaborationSession>();
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    } catch (const Exception&) {
        return std::nullopt;
    }
}

}  // namespace coedit_cpp
