// Repository: Seedling
// Component: JSON reader / writer
// Purpose: Minimal JSON document model for protocol payloads and HTTP bodies.
// Copyright (c) 2025 RetroVue

#ifndef SEEDLING_UTIL_JSON_HPP_
#define SEEDLING_UTIL_JSON_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace seedling::util {

// JsonValue is an immutable-after-parse JSON tree node. Objects keep member
// order as received; duplicate keys are kept and Find() returns the first.
class JsonValue {
 public:
  enum class Type { kNull, kBool, kNumber, kString, kArray, kObject };

  JsonValue() = default;

  static JsonValue Bool(bool v);
  static JsonValue Number(double v);
  static JsonValue String(std::string v);
  static JsonValue Array();
  static JsonValue Object();

  Type type() const { return type_; }
  bool IsNull() const { return type_ == Type::kNull; }
  bool IsBool() const { return type_ == Type::kBool; }
  bool IsNumber() const { return type_ == Type::kNumber; }
  bool IsString() const { return type_ == Type::kString; }
  bool IsArray() const { return type_ == Type::kArray; }
  bool IsObject() const { return type_ == Type::kObject; }

  // Typed accessors return the zero value when the type does not match.
  bool AsBool() const { return type_ == Type::kBool && bool_; }
  double AsNumber() const { return type_ == Type::kNumber ? number_ : 0.0; }
  int64_t AsInt() const { return static_cast<int64_t>(AsNumber()); }
  const std::string& AsString() const;

  // Arrays and objects.
  size_t size() const { return items_.size(); }
  const JsonValue& At(size_t i) const { return items_.at(i); }
  const std::string& KeyAt(size_t i) const { return keys_.at(i); }

  // Object member lookup; nullptr when not an object or key absent.
  const JsonValue* Find(std::string_view key) const;

  // Convenience: string member or nullopt when absent / not a string.
  std::optional<std::string> GetString(std::string_view key) const;

  void Append(JsonValue v);
  void Set(std::string key, JsonValue v);

  // Compact serialization.
  std::string Serialize() const;

 private:
  void SerializeTo(std::ostringstream& o) const;

  Type type_ = Type::kNull;
  bool bool_ = false;
  double number_ = 0.0;
  std::string string_;
  std::vector<std::string> keys_;   // objects only, parallel to items_
  std::vector<JsonValue> items_;    // array elements or object values
};

// Parses a complete JSON text (RFC 8259). Trailing non-whitespace, nesting
// deeper than kMaxJsonDepth, or any syntax error yields nullopt.
constexpr int kMaxJsonDepth = 64;
std::optional<JsonValue> ParseJson(std::string_view text);

// Escapes a UTF-8 string for inclusion between JSON double quotes.
std::string JsonEscape(std::string_view s);

// Streaming builder for flat or nested objects (nest via AddRaw).
class JsonObjectWriter {
 public:
  JsonObjectWriter& AddString(std::string_view key, std::string_view value);
  JsonObjectWriter& AddBool(std::string_view key, bool value);
  JsonObjectWriter& AddInt(std::string_view key, int64_t value);
  // Fixed-point number with `decimals` digits after the point.
  JsonObjectWriter& AddFixed(std::string_view key, double value, int decimals);
  // Inserts an already-serialized JSON value.
  JsonObjectWriter& AddRaw(std::string_view key, std::string_view json);

  std::string str() const;

 private:
  void Key(std::string_view key);

  std::ostringstream o_;
  bool empty_ = true;
};

}  // namespace seedling::util

#endif  // SEEDLING_UTIL_JSON_HPP_
