// Repository: Seedling
// Component: JSON reader / writer
// Purpose: Minimal JSON document model for protocol payloads and HTTP bodies.
// Copyright (c) 2025 RetroVue

#include "seedling/util/Json.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iomanip>

namespace seedling::util {

namespace {

const std::string kEmptyString;

void AppendUtf8(uint32_t cp, std::string* out) {
  if (cp < 0x80) {
    *out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    *out += static_cast<char>(0xC0 | (cp >> 6));
    *out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    *out += static_cast<char>(0xE0 | (cp >> 12));
    *out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    *out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    *out += static_cast<char>(0xF0 | (cp >> 18));
    *out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    *out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    *out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

// Recursive-descent parser over a string_view. Every Parse* returns false on
// the first syntax error; the caller discards the partial tree.
class Parser {
 public:
  explicit Parser(std::string_view text) : text_(text) {}

  bool ParseDocument(JsonValue* out) {
    SkipWhitespace();
    if (!ParseValue(out, 0)) return false;
    SkipWhitespace();
    return pos_ == text_.size();
  }

 private:
  void SkipWhitespace() {
    while (pos_ < text_.size()) {
      const char c = text_[pos_];
      if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
      ++pos_;
    }
  }

  bool Consume(std::string_view literal) {
    if (text_.substr(pos_, literal.size()) != literal) return false;
    pos_ += literal.size();
    return true;
  }

  bool ParseValue(JsonValue* out, int depth) {
    if (depth > kMaxJsonDepth || pos_ >= text_.size()) return false;
    switch (text_[pos_]) {
      case '{': return ParseObject(out, depth);
      case '[': return ParseArray(out, depth);
      case '"': {
        std::string s;
        if (!ParseString(&s)) return false;
        *out = JsonValue::String(std::move(s));
        return true;
      }
      case 't':
        if (!Consume("true")) return false;
        *out = JsonValue::Bool(true);
        return true;
      case 'f':
        if (!Consume("false")) return false;
        *out = JsonValue::Bool(false);
        return true;
      case 'n':
        if (!Consume("null")) return false;
        *out = JsonValue();
        return true;
      default:
        return ParseNumber(out);
    }
  }

  bool ParseObject(JsonValue* out, int depth) {
    ++pos_;  // '{'
    *out = JsonValue::Object();
    SkipWhitespace();
    if (pos_ < text_.size() && text_[pos_] == '}') {
      ++pos_;
      return true;
    }
    while (true) {
      SkipWhitespace();
      if (pos_ >= text_.size() || text_[pos_] != '"') return false;
      std::string key;
      if (!ParseString(&key)) return false;
      SkipWhitespace();
      if (pos_ >= text_.size() || text_[pos_] != ':') return false;
      ++pos_;
      SkipWhitespace();
      JsonValue value;
      if (!ParseValue(&value, depth + 1)) return false;
      out->Set(std::move(key), std::move(value));
      SkipWhitespace();
      if (pos_ >= text_.size()) return false;
      if (text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (text_[pos_] == '}') {
        ++pos_;
        return true;
      }
      return false;
    }
  }

  bool ParseArray(JsonValue* out, int depth) {
    ++pos_;  // '['
    *out = JsonValue::Array();
    SkipWhitespace();
    if (pos_ < text_.size() && text_[pos_] == ']') {
      ++pos_;
      return true;
    }
    while (true) {
      SkipWhitespace();
      JsonValue value;
      if (!ParseValue(&value, depth + 1)) return false;
      out->Append(std::move(value));
      SkipWhitespace();
      if (pos_ >= text_.size()) return false;
      if (text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (text_[pos_] == ']') {
        ++pos_;
        return true;
      }
      return false;
    }
  }

  bool ParseHex4(uint32_t* out) {
    if (pos_ + 4 > text_.size()) return false;
    uint32_t v = 0;
    for (int i = 0; i < 4; ++i) {
      const char c = text_[pos_++];
      v <<= 4;
      if (c >= '0' && c <= '9') v |= static_cast<uint32_t>(c - '0');
      else if (c >= 'a' && c <= 'f') v |= static_cast<uint32_t>(c - 'a' + 10);
      else if (c >= 'A' && c <= 'F') v |= static_cast<uint32_t>(c - 'A' + 10);
      else return false;
    }
    *out = v;
    return true;
  }

  bool ParseString(std::string* out) {
    ++pos_;  // opening quote
    out->clear();
    while (pos_ < text_.size()) {
      const char c = text_[pos_++];
      if (c == '"') return true;
      if (static_cast<unsigned char>(c) < 0x20) return false;
      if (c != '\\') {
        *out += c;
        continue;
      }
      if (pos_ >= text_.size()) return false;
      const char esc = text_[pos_++];
      switch (esc) {
        case '"': *out += '"'; break;
        case '\\': *out += '\\'; break;
        case '/': *out += '/'; break;
        case 'b': *out += '\b'; break;
        case 'f': *out += '\f'; break;
        case 'n': *out += '\n'; break;
        case 'r': *out += '\r'; break;
        case 't': *out += '\t'; break;
        case 'u': {
          uint32_t cp = 0;
          if (!ParseHex4(&cp)) return false;
          if (cp >= 0xD800 && cp <= 0xDBFF) {
            uint32_t low = 0;
            if (!Consume("\\u") || !ParseHex4(&low)) return false;
            if (low < 0xDC00 || low > 0xDFFF) return false;
            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
          } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
            return false;
          }
          AppendUtf8(cp, out);
          break;
        }
        default:
          return false;
      }
    }
    return false;
  }

  bool ParseNumber(JsonValue* out) {
    const size_t start = pos_;
    if (pos_ < text_.size() && text_[pos_] == '-') ++pos_;
    if (pos_ >= text_.size()) return false;
    if (text_[pos_] == '0') {
      ++pos_;
    } else if (text_[pos_] >= '1' && text_[pos_] <= '9') {
      while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) ++pos_;
    } else {
      return false;
    }
    if (pos_ < text_.size() && text_[pos_] == '.') {
      ++pos_;
      const size_t frac_start = pos_;
      while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) ++pos_;
      if (pos_ == frac_start) return false;
    }
    if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
      ++pos_;
      if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-')) ++pos_;
      const size_t exp_start = pos_;
      while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) ++pos_;
      if (pos_ == exp_start) return false;
    }
    const std::string literal(text_.substr(start, pos_ - start));
    *out = JsonValue::Number(std::strtod(literal.c_str(), nullptr));
    return true;
  }

  std::string_view text_;
  size_t pos_ = 0;
};

}  // namespace

JsonValue JsonValue::Bool(bool v) {
  JsonValue j;
  j.type_ = Type::kBool;
  j.bool_ = v;
  return j;
}

JsonValue JsonValue::Number(double v) {
  JsonValue j;
  j.type_ = Type::kNumber;
  j.number_ = v;
  return j;
}

JsonValue JsonValue::String(std::string v) {
  JsonValue j;
  j.type_ = Type::kString;
  j.string_ = std::move(v);
  return j;
}

JsonValue JsonValue::Array() {
  JsonValue j;
  j.type_ = Type::kArray;
  return j;
}

JsonValue JsonValue::Object() {
  JsonValue j;
  j.type_ = Type::kObject;
  return j;
}

const std::string& JsonValue::AsString() const {
  return type_ == Type::kString ? string_ : kEmptyString;
}

const JsonValue* JsonValue::Find(std::string_view key) const {
  if (type_ != Type::kObject) return nullptr;
  for (size_t i = 0; i < keys_.size(); ++i) {
    if (keys_[i] == key) return &items_[i];
  }
  return nullptr;
}

std::optional<std::string> JsonValue::GetString(std::string_view key) const {
  const JsonValue* v = Find(key);
  if (v == nullptr || !v->IsString()) return std::nullopt;
  return v->AsString();
}

void JsonValue::Append(JsonValue v) {
  items_.push_back(std::move(v));
}

void JsonValue::Set(std::string key, JsonValue v) {
  keys_.push_back(std::move(key));
  items_.push_back(std::move(v));
}

std::string JsonValue::Serialize() const {
  std::ostringstream o;
  SerializeTo(o);
  return o.str();
}

void JsonValue::SerializeTo(std::ostringstream& o) const {
  switch (type_) {
    case Type::kNull:
      o << "null";
      break;
    case Type::kBool:
      o << (bool_ ? "true" : "false");
      break;
    case Type::kNumber: {
      if (!std::isfinite(number_)) {
        o << "null";
      } else if (number_ == std::floor(number_) && std::fabs(number_) < 9.007199254740992e15) {
        o << static_cast<int64_t>(number_);
      } else {
        char buf[32];
        snprintf(buf, sizeof(buf), "%.17g", number_);
        o << buf;
      }
      break;
    }
    case Type::kString:
      o << '"' << JsonEscape(string_) << '"';
      break;
    case Type::kArray:
      o << '[';
      for (size_t i = 0; i < items_.size(); ++i) {
        if (i > 0) o << ',';
        items_[i].SerializeTo(o);
      }
      o << ']';
      break;
    case Type::kObject:
      o << '{';
      for (size_t i = 0; i < items_.size(); ++i) {
        if (i > 0) o << ',';
        o << '"' << JsonEscape(keys_[i]) << "\":";
        items_[i].SerializeTo(o);
      }
      o << '}';
      break;
  }
}

std::optional<JsonValue> ParseJson(std::string_view text) {
  JsonValue root;
  Parser parser(text);
  if (!parser.ParseDocument(&root)) return std::nullopt;
  return root;
}

std::string JsonEscape(std::string_view s) {
  std::string out;
  out.reserve(s.size() + 8);
  for (char c : s) {
    if (c == '"') out += "\\\"";
    else if (c == '\\') out += "\\\\";
    else if (c == '\n') out += "\\n";
    else if (c == '\r') out += "\\r";
    else if (c == '\t') out += "\\t";
    else if (static_cast<unsigned char>(c) < 0x20) {
      char buf[8];
      snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
      out += buf;
    } else {
      out += c;
    }
  }
  return out;
}

void JsonObjectWriter::Key(std::string_view key) {
  o_ << (empty_ ? "" : ",") << '"' << JsonEscape(key) << "\":";
  empty_ = false;
}

JsonObjectWriter& JsonObjectWriter::AddString(std::string_view key, std::string_view value) {
  Key(key);
  o_ << '"' << JsonEscape(value) << '"';
  return *this;
}

JsonObjectWriter& JsonObjectWriter::AddBool(std::string_view key, bool value) {
  Key(key);
  o_ << (value ? "true" : "false");
  return *this;
}

JsonObjectWriter& JsonObjectWriter::AddInt(std::string_view key, int64_t value) {
  Key(key);
  o_ << value;
  return *this;
}

JsonObjectWriter& JsonObjectWriter::AddFixed(std::string_view key, double value, int decimals) {
  Key(key);
  if (!std::isfinite(value)) {
    o_ << "null";
  } else {
    o_ << std::fixed << std::setprecision(decimals) << value;
    o_.unsetf(std::ios_base::floatfield);
  }
  return *this;
}

JsonObjectWriter& JsonObjectWriter::AddRaw(std::string_view key, std::string_view json) {
  Key(key);
  o_ << json;
  return *this;
}

std::string JsonObjectWriter::str() const {
  return "{" + o_.str() + "}";
}

}  // namespace seedling::util
