#include "sdid128/sdid128.hpp"

#include <algorithm>
#include <cstring>
#include <iterator>
#include <ostream>

namespace sdid128 {

namespace {

constexpr char LOWER_DIGITS[] = "0123456789abcdef";
constexpr char UPPER_DIGITS[] = "0123456789ABCDEF";

// Dash positions in the text form of each layout
constexpr std::size_t UUID_DASHES[] = {8, 13, 18, 23};
constexpr std::size_t GROUPED_DASHES[] = {4, 9, 14, 19, 24, 29, 34};

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

template <std::size_t N>
bool is_dash_position(const std::size_t (&positions)[N], std::size_t pos) noexcept {
    return std::find(std::begin(positions), std::end(positions), pos) != std::end(positions);
}

// Whether a dash follows the byte at the given index
bool dash_after_byte(Format format, std::size_t index) noexcept {
    switch (format) {
        case Format::Hex:
            return false;
        case Format::Uuid:
            return index == 3 || index == 5 || index == 7 || index == 9;
        case Format::Grouped:
            return index % 2 == 1 && index < Id128::SIZE - 1;
    }
    return false;
}

bool is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

}  // namespace

Id128 Id128::from_bytes(const uint8_t* data) noexcept {
    Bytes bytes{};
    std::memcpy(bytes.data(), data, SIZE);
    return Id128(bytes);
}

Result<Id128> Id128::parse(std::string_view text) {
    const auto dashes = static_cast<std::size_t>(std::count(text.begin(), text.end(), '-'));

    Format format = Format::Hex;
    if (text.size() == 32 && dashes == 0) {
        format = Format::Hex;
    } else if (text.size() == 36 && dashes == 4) {
        format = Format::Uuid;
    } else if (text.size() == 39 && dashes == 7) {
        format = Format::Grouped;
    } else {
        return Result<Id128>::error(ErrorCode::ParseError,
                                    "invalid string length: " + std::to_string(text.size()));
    }

    Bytes bytes{};
    std::size_t index = 0;
    bool high = true;

    for (std::size_t pos = 0; pos < text.size(); ++pos) {
        char c = text[pos];

        if (c == '-') {
            bool expected = false;
            if (format == Format::Uuid) {
                expected = is_dash_position(UUID_DASHES, pos);
            } else if (format == Format::Grouped) {
                expected = is_dash_position(GROUPED_DASHES, pos);
            }
            if (!expected) {
                return Result<Id128>::error(ErrorCode::ParseError,
                                            "unexpected dash at position: " + std::to_string(pos));
            }
            continue;
        }

        int value = hex_value(c);
        if (value < 0) {
            return Result<Id128>::error(ErrorCode::ParseError,
                                        "invalid character at position: " + std::to_string(pos));
        }

        if (high) {
            bytes[index] = static_cast<uint8_t>(value << 4);
        } else {
            bytes[index] = static_cast<uint8_t>(bytes[index] | value);
            ++index;
        }
        high = !high;
    }

    return Result<Id128>::ok(Id128(bytes));
}

Result<Id128> Id128::parse_lax(std::string_view text) {
    while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(text.back())) {
        text.remove_suffix(1);
    }

    std::string compact;
    compact.reserve(text.size());
    for (char c : text) {
        if (c != '-') {
            compact.push_back(c);
        }
    }

    return parse(compact);
}

std::string Id128::to_string(Format format, Case letter_case) const {
    const char* digits = letter_case == Case::Upper ? UPPER_DIGITS : LOWER_DIGITS;

    std::string out;
    out.reserve(39);

    for (std::size_t i = 0; i < SIZE; ++i) {
        out.push_back(digits[bytes_[i] >> 4]);
        out.push_back(digits[bytes_[i] & 0x0f]);
        if (dash_after_byte(format, i)) {
            out.push_back('-');
        }
    }

    return out;
}

bool Id128::is_null() const noexcept {
    return std::all_of(bytes_.begin(), bytes_.end(), [](uint8_t b) { return b == 0x00; });
}

bool Id128::is_all_f() const noexcept {
    return std::all_of(bytes_.begin(), bytes_.end(), [](uint8_t b) { return b == 0xff; });
}

std::ostream& operator<<(std::ostream& os, const Id128& id) {
    return os << id.to_string();
}

}  // namespace sdid128

std::size_t std::hash<sdid128::Id128>::operator()(const sdid128::Id128& id) const noexcept {
    uint64_t lo = 0;
    uint64_t hi = 0;
    std::memcpy(&lo, id.data(), sizeof(lo));
    std::memcpy(&hi, id.data() + sizeof(lo), sizeof(hi));
    return std::hash<uint64_t>{}(lo ^ (hi * 0x9e3779b97f4a7c15ULL));
}
