// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace toolhost
{

struct InputShape;

/// @brief Accepts any value. Used for missing or unsupported schemas.
struct AnyShape
{
};

struct StringShape
{
};

/// @brief A JSON number. @c integer is set for schema type "integer".
struct NumberShape
{
    bool integer = false;
};

struct BooleanShape
{
};

/// @brief A JSON object with named properties.
struct ObjectShape
{
    std::map<std::string, std::shared_ptr<const InputShape>> properties;
    std::vector<std::string> required;
};

/// @brief A JSON array. A null @c items accepts any element.
struct ArrayShape
{
    std::shared_ptr<const InputShape> items;
};

/// @brief Simplified description of a tool's input, derived from its JSON schema.
///
/// This is a soft mapping, not a JSON-schema validator: anything the mapping does not
/// understand degrades to AnyShape instead of failing.
struct InputShape
{
    std::variant<AnyShape, StringShape, NumberShape, BooleanShape, ObjectShape, ArrayShape> kind;

    [[nodiscard]] auto isAny() const -> bool { return std::holds_alternative<AnyShape>(kind); }
};

/// @brief Maps a JSON schema to an InputShape.
/// @param schema The JSON schema (may be null or malformed).
/// @return The shape; AnyShape for unsupported or missing schemas.
[[nodiscard]] auto shapeFromJsonSchema(const nlohmann::json& schema) -> InputShape;

/// @brief Converts an InputShape back to a minimal JSON schema.
[[nodiscard]] auto shapeToJsonSchema(const InputShape& shape) -> nlohmann::json;

/// @brief Returns true if the value matches the shape's type and required properties.
///
/// Property values are checked recursively; unknown properties are accepted.
[[nodiscard]] auto shapeAccepts(const InputShape& shape, const nlohmann::json& value) -> bool;

/// @brief Returns a short human-readable form, e.g. "object{path:string}".
[[nodiscard]] auto describeShape(const InputShape& shape) -> std::string;

} // namespace toolhost
