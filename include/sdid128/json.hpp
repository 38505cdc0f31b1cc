#pragma once

/**
 * @file json.hpp
 * @brief JSON serialization utilities for sdid128 types
 *
 * Uses nlohmann/json. Identifiers serialize as lower case UUID strings.
 */

#include "sdid128.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

namespace sdid128 {

// ==================== ADL Serializers ====================

inline void to_json(nlohmann::json& j, const Id128& id) {
    j = id.to_string(Format::Uuid, Case::Lower);
}

/// Accepts any strict text layout; throws std::invalid_argument on bad input
inline void from_json(const nlohmann::json& j, Id128& id) {
    auto parsed = Id128::parse(j.get<std::string>());
    if (parsed.is_error()) {
        throw std::invalid_argument(parsed.error_message());
    }
    id = parsed.value();
}

inline void to_json(nlohmann::json& j, Format format) {
    j = format_to_string(format);
}

inline void from_json(const nlohmann::json& j, Format& format) {
    auto text = j.get<std::string>();
    auto parsed = format_from_string(text);
    if (!parsed) {
        throw std::invalid_argument("invalid format \"" + text + "\"");
    }
    format = *parsed;
}

inline void to_json(nlohmann::json& j, Case letter_case) {
    j = case_to_string(letter_case);
}

inline void from_json(const nlohmann::json& j, Case& letter_case) {
    auto text = j.get<std::string>();
    auto parsed = case_from_string(text);
    if (!parsed) {
        throw std::invalid_argument("invalid case \"" + text + "\"");
    }
    letter_case = *parsed;
}

namespace json {

using nlohmann::json;

/// Parse an identifier from a JSON string without throwing
[[nodiscard]] inline Result<Id128> parse_id(const json& j) {
    if (!j.is_string()) {
        return Result<Id128>::error(ErrorCode::ParseError,
                                    std::string("expected a string, got ") + j.type_name());
    }
    return Id128::parse(j.get<std::string>());
}

/**
 * @brief Describe an identifier in every layout
 *
 * @param id The identifier
 * @param format Layout of the "id" field
 * @param letter_case Case of all text fields
 * @return {"id", "hex", "uuid", "null", "uuid_version"}
 */
[[nodiscard]] inline json describe(const Id128& id, Format format = Format::Hex,
                                   Case letter_case = Case::Lower) {
    json j;
    j["id"] = id.to_string(format, letter_case);
    j["hex"] = id.to_string(Format::Hex, letter_case);
    j["uuid"] = id.to_string(Format::Uuid, letter_case);
    j["null"] = id.is_null();
    j["uuid_version"] = id.uuid_version();
    return j;
}

}  // namespace json
}  // namespace sdid128
