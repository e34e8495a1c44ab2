//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONValue.h
// Purpose: Minimal JSON value type, parser and serializer for token and backend payloads
//==========================================================================================================

#pragma once

#include <cstdint>
#include <string>
#include <memory>
#include <variant>
#include <optional>
#include <unordered_map>
#include <vector>

namespace deskauth {

//==========================================================================================================
// JSONValue
// Purpose: Simplified JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: unordered_map<string, shared_ptr<JSONValue>> representing a JSON object.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
//==========================================================================================================
struct JSONValue {
    using Array = std::vector<std::shared_ptr<JSONValue>>;
    using Object = std::unordered_map<std::string, std::shared_ptr<JSONValue>>;

    std::variant<
        std::nullptr_t,
        bool,
        int64_t,
        double,
        std::string,
        Array,
        Object
    > value;

    // Constructors and special members (defined out-of-line)
    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&);
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&);
    ~JSONValue();

    // Explicit constructors for supported types
    explicit JSONValue(std::nullptr_t);
    explicit JSONValue(bool v);
    explicit JSONValue(int64_t v);
    explicit JSONValue(double v);
    explicit JSONValue(const char* s);
    explicit JSONValue(const std::string& s);
    explicit JSONValue(std::string&& s);
    explicit JSONValue(const Array& a);
    explicit JSONValue(Array&& a);
    explicit JSONValue(const Object& o);
    explicit JSONValue(Object&& o);

    // Access the underlying variant
    auto& get() { return value; }
    const auto& get() const { return value; }

    bool isObject() const { return std::holds_alternative<Object>(value); }
};

//==========================================================================================================
// parseJSON
// Purpose: Parses a complete JSON document.
// Args:
//   json: UTF-8 JSON text. Leading/trailing whitespace is allowed; any other trailing content is not.
// Returns:
//   Parsed JSONValue.
// Throws:
//   std::runtime_error on malformed input.
//==========================================================================================================
JSONValue parseJSON(const std::string& json);

//==========================================================================================================
// serializeJSONValue
// Purpose: Serializes a JSONValue to compact JSON text (object key order unspecified).
//==========================================================================================================
std::string serializeJSONValue(const JSONValue& value);

// Field accessors for Object values. Each returns nullopt/nullptr when the value is not an object,
// the key is absent, or the field has a different type.
std::optional<std::string> getStringField(const JSONValue& obj, const std::string& key);
std::optional<int64_t> getIntField(const JSONValue& obj, const std::string& key);
const JSONValue* getObjectField(const JSONValue& obj, const std::string& key);

} // namespace deskauth
