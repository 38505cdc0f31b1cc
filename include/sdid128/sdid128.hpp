#pragma once

/**
 * @file sdid128.hpp
 * @brief sdid128 C++ wrapper for libsystemd's sd-id128
 *
 * Provides the 128-bit identifier value type, its text codecs and the
 * Result type shared by the native call layer.
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace sdid128 {

/// Library version
constexpr const char* VERSION = "0.1.0";

/// Error codes returned by sdid128 operations
enum class ErrorCode {
    Success = 0,

    // Native library errors
    InvalidArgument,
    Unavailable,
    PermissionDenied,
    NotSupported,

    // Text parsing errors
    ParseError,

    Unknown
};

/// Convert error code to string
[[nodiscard]] constexpr const char* error_code_to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:
            return "Success";
        case ErrorCode::InvalidArgument:
            return "Invalid argument";
        case ErrorCode::Unavailable:
            return "Resource unavailable";
        case ErrorCode::PermissionDenied:
            return "Permission denied";
        case ErrorCode::NotSupported:
            return "Not supported by the running system";
        case ErrorCode::ParseError:
            return "Parse error";
        case ErrorCode::Unknown:
            return "Unknown error";
    }
    return "Unknown error";
}

/**
 * @brief Result type for operations that can fail
 * @tparam T The success value type
 */
template <typename T> class Result {
  public:
    /// Construct a success result
    static Result ok(T value) {
        Result r;
        r.value_ = std::move(value);
        r.error_ = ErrorCode::Success;
        return r;
    }

    /// Construct an error result
    static Result error(ErrorCode code, std::string message = "") {
        Result r;
        r.error_ = code;
        r.error_message_ = std::move(message);
        return r;
    }

    /// Check if the result is successful
    [[nodiscard]] bool is_ok() const noexcept { return error_ == ErrorCode::Success; }

    /// Check if the result is an error
    [[nodiscard]] bool is_error() const noexcept { return error_ != ErrorCode::Success; }

    /// Get the value (undefined behavior if is_error())
    [[nodiscard]] const T& value() const& { return *value_; }
    [[nodiscard]] T& value() & { return *value_; }
    [[nodiscard]] T&& value() && { return std::move(*value_); }

    /// Get the error code
    [[nodiscard]] ErrorCode error_code() const noexcept { return error_; }

    /// Get the error message
    [[nodiscard]] const std::string& error_message() const noexcept { return error_message_; }

  private:
    Result() = default;
    std::optional<T> value_;
    ErrorCode error_ = ErrorCode::Unknown;
    std::string error_message_;
};

/// Specialization for void results
template <> class Result<void> {
  public:
    static Result ok() {
        Result r;
        r.error_ = ErrorCode::Success;
        return r;
    }

    static Result error(ErrorCode code, std::string message = "") {
        Result r;
        r.error_ = code;
        r.error_message_ = std::move(message);
        return r;
    }

    [[nodiscard]] bool is_ok() const noexcept { return error_ == ErrorCode::Success; }
    [[nodiscard]] bool is_error() const noexcept { return error_ != ErrorCode::Success; }
    [[nodiscard]] ErrorCode error_code() const noexcept { return error_; }
    [[nodiscard]] const std::string& error_message() const noexcept { return error_message_; }

  private:
    Result() = default;
    ErrorCode error_ = ErrorCode::Unknown;
    std::string error_message_;
};

/// Text layout of a formatted identifier
enum class Format {
    Hex,      // 0123456789abcdef0123456789abcdef (libsystemd)
    Uuid,     // 01234567-89ab-cdef-0123-456789abcdef (RFC 4122)
    Grouped   // 0123-4567-89ab-cdef-0123-4567-89ab-cdef
};

/// Letter case of hexadecimal digits in formatted output
enum class Case {
    Lower,
    Upper
};

/// Convert format to string
[[nodiscard]] constexpr const char* format_to_string(Format format) noexcept {
    switch (format) {
        case Format::Hex:
            return "hex";
        case Format::Uuid:
            return "uuid";
        case Format::Grouped:
            return "grouped";
    }
    return "hex";
}

/// Parse format from its name
[[nodiscard]] inline std::optional<Format> format_from_string(std::string_view str) noexcept {
    if (str == "hex")
        return Format::Hex;
    if (str == "uuid")
        return Format::Uuid;
    if (str == "grouped")
        return Format::Grouped;
    return std::nullopt;
}

/// Convert case to string
[[nodiscard]] constexpr const char* case_to_string(Case letter_case) noexcept {
    switch (letter_case) {
        case Case::Lower:
            return "lower";
        case Case::Upper:
            return "upper";
    }
    return "lower";
}

/// Parse case from its name
[[nodiscard]] inline std::optional<Case> case_from_string(std::string_view str) noexcept {
    if (str == "lower")
        return Case::Lower;
    if (str == "upper")
        return Case::Upper;
    return std::nullopt;
}

/**
 * @brief A 128-bit identifier as used by systemd
 *
 * Wraps exactly 16 bytes. Instances are immutable; the default value is the
 * null identifier. Ordering and hashing follow the byte content, so IDs can
 * key both ordered and unordered containers.
 *
 * Instances are created by parsing text (parse, parse_lax), from raw bytes,
 * or through the libsystemd calls in native.hpp.
 */
class Id128 {
  public:
    /// Number of bytes in an identifier
    static constexpr std::size_t SIZE = 16;

    using Bytes = std::array<uint8_t, SIZE>;

    /// Construct the null identifier
    constexpr Id128() noexcept : bytes_{} {}

    /// Construct from a byte array
    constexpr explicit Id128(const Bytes& bytes) noexcept : bytes_(bytes) {}

    /// Construct by copying SIZE bytes from the given buffer
    [[nodiscard]] static Id128 from_bytes(const uint8_t* data) noexcept;

    /**
     * @brief Parse an identifier applying strict rules
     *
     * The layout is detected from the length and the number of dashes:
     * 32 characters without dashes (Hex), 36 with 4 (Uuid) or 39 with 7
     * (Grouped). Dashes must sit exactly where the detected layout puts
     * them. Hex digits may be upper or lower case.
     *
     * @return The identifier, or ErrorCode::ParseError
     */
    [[nodiscard]] static Result<Id128> parse(std::string_view text);

    /**
     * @brief Parse an identifier applying lax rules
     *
     * Surrounding whitespace is trimmed and all dashes are dropped before
     * parsing the remainder strictly as Hex.
     */
    [[nodiscard]] static Result<Id128> parse_lax(std::string_view text);

    /// Get the raw bytes
    [[nodiscard]] const Bytes& bytes() const noexcept { return bytes_; }

    /// Get a pointer to the raw bytes
    [[nodiscard]] const uint8_t* data() const noexcept { return bytes_.data(); }

    /// Format the identifier (lower case UUID by default)
    [[nodiscard]] std::string to_string(Format format = Format::Uuid,
                                        Case letter_case = Case::Lower) const;

    /// Check if all bytes are zero
    [[nodiscard]] bool is_null() const noexcept;

    /// Check if all bytes are 0xff
    [[nodiscard]] bool is_all_f() const noexcept;

    /// UUID version field (high nibble of byte 6)
    [[nodiscard]] int uuid_version() const noexcept { return bytes_[6] >> 4; }

    friend bool operator==(const Id128& a, const Id128& b) noexcept { return a.bytes_ == b.bytes_; }
    friend bool operator!=(const Id128& a, const Id128& b) noexcept { return a.bytes_ != b.bytes_; }
    friend bool operator<(const Id128& a, const Id128& b) noexcept { return a.bytes_ < b.bytes_; }
    friend bool operator<=(const Id128& a, const Id128& b) noexcept { return a.bytes_ <= b.bytes_; }
    friend bool operator>(const Id128& a, const Id128& b) noexcept { return a.bytes_ > b.bytes_; }
    friend bool operator>=(const Id128& a, const Id128& b) noexcept { return a.bytes_ >= b.bytes_; }

  private:
    Bytes bytes_;
};

/// Write the identifier as a lower case UUID
std::ostream& operator<<(std::ostream& os, const Id128& id);

}  // namespace sdid128

namespace std {

template <> struct hash<sdid128::Id128> {
    std::size_t operator()(const sdid128::Id128& id) const noexcept;
};

}  // namespace std
