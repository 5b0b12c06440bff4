// SPDX-License-Identifier: Apache-2.0
#include "InputShape.hpp"

#include <format>

namespace toolhost
{

auto shapeFromJsonSchema(const nlohmann::json& schema) -> InputShape
{
    if (!schema.is_object() || !schema.contains("type") || !schema["type"].is_string())
        return InputShape { AnyShape {} };

    auto const type = schema["type"].get<std::string>();

    if (type == "string")
        return InputShape { StringShape {} };
    if (type == "number")
        return InputShape { NumberShape { .integer = false } };
    if (type == "integer")
        return InputShape { NumberShape { .integer = true } };
    if (type == "boolean")
        return InputShape { BooleanShape {} };

    if (type == "array")
    {
        auto shape = ArrayShape {};
        if (schema.contains("items") && schema["items"].is_object())
            shape.items = std::make_shared<const InputShape>(shapeFromJsonSchema(schema["items"]));
        return InputShape { std::move(shape) };
    }

    if (type == "object")
    {
        auto shape = ObjectShape {};
        if (schema.contains("properties") && schema["properties"].is_object())
        {
            for (const auto& [name, propertySchema]: schema["properties"].items())
                shape.properties[name] = std::make_shared<const InputShape>(shapeFromJsonSchema(propertySchema));
        }
        if (schema.contains("required") && schema["required"].is_array())
        {
            for (const auto& name: schema["required"])
            {
                if (name.is_string())
                    shape.required.push_back(name.get<std::string>());
            }
        }
        return InputShape { std::move(shape) };
    }

    return InputShape { AnyShape {} };
}

auto shapeToJsonSchema(const InputShape& shape) -> nlohmann::json
{
    if (std::holds_alternative<StringShape>(shape.kind))
        return { { "type", "string" } };
    if (auto const* number = std::get_if<NumberShape>(&shape.kind))
        return { { "type", number->integer ? "integer" : "number" } };
    if (std::holds_alternative<BooleanShape>(shape.kind))
        return { { "type", "boolean" } };

    if (auto const* array = std::get_if<ArrayShape>(&shape.kind))
    {
        auto schema = nlohmann::json { { "type", "array" } };
        if (array->items)
            schema["items"] = shapeToJsonSchema(*array->items);
        return schema;
    }

    if (auto const* object = std::get_if<ObjectShape>(&shape.kind))
    {
        auto properties = nlohmann::json::object();
        for (const auto& [name, property]: object->properties)
            properties[name] = property ? shapeToJsonSchema(*property) : nlohmann::json::object();

        auto schema = nlohmann::json { { "type", "object" }, { "properties", std::move(properties) } };
        if (!object->required.empty())
            schema["required"] = object->required;
        return schema;
    }

    return nlohmann::json::object();
}

auto shapeAccepts(const InputShape& shape, const nlohmann::json& value) -> bool
{
    if (std::holds_alternative<AnyShape>(shape.kind))
        return true;
    if (std::holds_alternative<StringShape>(shape.kind))
        return value.is_string();
    if (auto const* number = std::get_if<NumberShape>(&shape.kind))
        return number->integer ? value.is_number_integer() : value.is_number();
    if (std::holds_alternative<BooleanShape>(shape.kind))
        return value.is_boolean();

    if (auto const* array = std::get_if<ArrayShape>(&shape.kind))
    {
        if (!value.is_array())
            return false;
        if (!array->items)
            return true;
        for (const auto& element: value)
        {
            if (!shapeAccepts(*array->items, element))
                return false;
        }
        return true;
    }

    if (auto const* object = std::get_if<ObjectShape>(&shape.kind))
    {
        if (!value.is_object())
            return false;
        for (const auto& name: object->required)
        {
            if (!value.contains(name))
                return false;
        }
        for (const auto& [name, property]: object->properties)
        {
            if (property && value.contains(name) && !shapeAccepts(*property, value[name]))
                return false;
        }
        return true;
    }

    return true;
}

auto describeShape(const InputShape& shape) -> std::string
{
    if (std::holds_alternative<StringShape>(shape.kind))
        return "string";
    if (auto const* number = std::get_if<NumberShape>(&shape.kind))
        return number->integer ? "integer" : "number";
    if (std::holds_alternative<BooleanShape>(shape.kind))
        return "boolean";

    if (auto const* array = std::get_if<ArrayShape>(&shape.kind))
        return std::format("array<{}>", array->items ? describeShape(*array->items) : "any");

    if (auto const* object = std::get_if<ObjectShape>(&shape.kind))
    {
        auto text = std::string { "object{" };
        auto first = true;
        for (const auto& [name, property]: object->properties)
        {
            if (!first)
                text += ",";
            first = false;
            text += std::format("{}:{}", name, property ? describeShape(*property) : "any");
        }
        text += "}";
        return text;
    }

    return "any";
}

} // namespace toolhost
