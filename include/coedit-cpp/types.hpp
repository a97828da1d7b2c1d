/// @file types.hpp
/// @brief Identity value objects: UserId, UserName, UserColor, DocumentId,
/// DocumentContent, and Timestamp.

#pragma once

#include <coedit-cpp/error.hpp>

#include <chrono>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace coedit_cpp {

/// A millisecond-precision point in time.
struct Timestamp {
    std::int64_t millis_since_epoch{0};  ///< Milliseconds since Unix epoch.

    auto operator<=>(const Timestamp&) const = default;
    auto operator==(const Timestamp&) const -> bool = default;

    /// Read the system clock.
    static auto now() -> Timestamp {
        const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
        return Timestamp{
            std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count()};
    }
};

/// A validated, non-empty string identity.
///
/// Each alias below instantiates this with its own tag, so a UserId can
/// never be passed where a DocumentId is expected. Construction from an
/// empty string throws InvalidValueError. A default-constructed value is
/// empty and only exists as a placeholder; check it with empty().
template <typename Tag>
class StringValue {
public:
    StringValue() = default;

    /// Construct from a non-empty string.
    /// @throws InvalidValueError if @p value is empty.
    explicit StringValue(std::string value) : value_{std::move(value)} {
        if (value_.empty()) {
            throw InvalidValueError{std::string{Tag::name} + " cannot be empty"};
        }
    }

    auto value() const noexcept -> const std::string& { return value_; }
    auto empty() const noexcept -> bool { return value_.empty(); }

    auto operator<=>(const StringValue&) const = default;
    auto operator==(const StringValue&) const -> bool = default;

private:
    std::string value_;
};

/// @cond TAGS
struct UserIdTag    { static constexpr std::string_view name = "UserId"; };
struct UserNameTag  { static constexpr std::string_view name = "UserName"; };
struct UserColorTag { static constexpr std::string_view name = "UserColor"; };
struct DocumentIdTag { static constexpr std::string_view name = "DocumentId"; };
/// @endcond

/// Stable identity of a user. Session membership is keyed by this.
using UserId = StringValue<UserIdTag>;

/// Display name shown to other participants.
using UserName = StringValue<UserNameTag>;

/// Display colour (e.g. "#FF6B6B") used for the user's cursor.
using UserColor = StringValue<UserColorTag>;

/// Identity of a document.
using DocumentId = StringValue<DocumentIdTag>;

/// The markdown body of a document. Unlike the identity types, empty
/// content is valid.
class DocumentContent {
public:
    DocumentContent() = default;
    explicit DocumentContent(std::string value) : value_{std::move(value)} {}

    auto value() const noexcept -> const std::string& { return value_; }
    auto is_empty() const noexcept -> bool { return value_.empty(); }

    auto operator==(const DocumentContent&) const -> bool = default;

private:
    std::string value_;
};

}  // namespace coedit_cpp

// -- std::hash specializations ------------------------------------------------

/// @cond HASH_SPECIALIZATIONS

template <typename Tag>
struct std::hash<coedit_cpp::StringValue<Tag>> {
    auto operator()(const coedit_cpp::StringValue<Tag>& v) const noexcept -> std::size_t {
        return std::hash<std::string>{}(v.value());
    }
};

template <>
struct std::hash<coedit_cpp::Timestamp> {
    auto operator()(const coedit_cpp::Timestamp& t) const noexcept -> std::size_t {
        return std::hash<std::int64_t>{}(t.millis_since_epoch);
    }
};

/// @endcond
