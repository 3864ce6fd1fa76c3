/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <cmath>
#include <cstdlib>
#include <format>
#include <fstream>
#include <iomanip>
#include <limits>
#include <ostream>
#include <sstream>

namespace PongEngine {

std::ostream &operator<<(std::ostream &os, JsonType type) {
  switch (type) {
  case JsonType::Null:
    return os << "Null";
  case JsonType::Boolean:
    return os << "Boolean";
  case JsonType::Number:
    return os << "Number";
  case JsonType::String:
    return os << "String";
  case JsonType::Array:
    return os << "Array";
  case JsonType::Object:
    return os << "Object";
  }
  return os << "Unknown";
}

// ---------------------------------------------------------------------------
// JsonValue
// ---------------------------------------------------------------------------

JsonType JsonValue::getType() const {
  return static_cast<JsonType>(m_value.index());
}

std::optional<bool> JsonValue::tryAsBool() const {
  if (isBool())
    return asBool();
  return std::nullopt;
}

std::optional<double> JsonValue::tryAsNumber() const {
  if (isNumber())
    return asNumber();
  return std::nullopt;
}

std::optional<float> JsonValue::tryAsFloat() const {
  if (isNumber())
    return asFloat();
  return std::nullopt;
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (isString())
    return asString();
  return std::nullopt;
}

const JsonObject *JsonValue::tryAsObject() const {
  return isObject() ? &asObject() : nullptr;
}

bool JsonValue::hasKey(const std::string &key) const {
  return isObject() && asObject().count(key) > 0;
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  static const JsonValue null_value;
  if (!isObject())
    return null_value;
  auto it = asObject().find(key);
  return it != asObject().end() ? it->second : null_value;
}

JsonValue &JsonValue::operator[](const std::string &key) {
  if (!isObject()) {
    m_value = JsonObject{};
  }
  return asObject()[key];
}

const JsonValue &JsonValue::operator[](size_t index) const {
  static const JsonValue null_value;
  if (!isArray() || index >= asArray().size())
    return null_value;
  return asArray()[index];
}

size_t JsonValue::size() const {
  if (isArray())
    return asArray().size();
  if (isObject())
    return asObject().size();
  return 0;
}

std::string JsonValue::toString() const {
  std::ostringstream oss;
  writeToStream(oss);
  return oss.str();
}

namespace {

void writeEscaped(std::ostream &stream, const std::string &text) {
  stream << '"';
  for (char c : text) {
    switch (c) {
    case '"':
      stream << "\\\"";
      break;
    case '\\':
      stream << "\\\\";
      break;
    case '\n':
      stream << "\\n";
      break;
    case '\r':
      stream << "\\r";
      break;
    case '\t':
      stream << "\\t";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        stream << std::format("\\u{:04x}", static_cast<unsigned>(c));
      } else {
        stream << c;
      }
    }
  }
  stream << '"';
}

} // namespace

void JsonValue::writeToStream(std::ostream &stream) const {
  switch (getType()) {
  case JsonType::Null:
    stream << "null";
    break;
  case JsonType::Boolean:
    stream << (asBool() ? "true" : "false");
    break;
  case JsonType::Number: {
    double num = asNumber();
    if (!std::isfinite(num)) {
      // JSON has no NaN/Inf
      stream << "null";
    } else if (std::floor(num) == num && std::abs(num) < 1e15) {
      stream << static_cast<long long>(num);
    } else {
      // Enough digits to round-trip a double
      stream << std::setprecision(std::numeric_limits<double>::max_digits10)
             << num;
    }
    break;
  }
  case JsonType::String:
    writeEscaped(stream, asString());
    break;
  case JsonType::Array: {
    stream << "[";
    const auto &arr = asArray();
    for (size_t i = 0; i < arr.size(); ++i) {
      if (i > 0)
        stream << ",";
      arr[i].writeToStream(stream);
    }
    stream << "]";
    break;
  }
  case JsonType::Object: {
    stream << "{";
    bool first = true;
    for (const auto &[key, value] : asObject()) {
      if (!first)
        stream << ",";
      first = false;
      writeEscaped(stream, key);
      stream << ":";
      value.writeToStream(stream);
    }
    stream << "}";
    break;
  }
  }
}

// ---------------------------------------------------------------------------
// JsonReader
// ---------------------------------------------------------------------------

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    m_lastError = "Could not open file: " + path;
    return false;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

bool JsonReader::parse(const std::string &jsonString) {
  clearError();
  m_input = jsonString;
  m_position = 0;
  m_line = 1;
  m_column = 1;
  m_root = JsonValue();

  skipWhitespace();
  auto value = parseValue(0);
  if (!value) {
    return false;
  }
  skipWhitespace();
  if (!atEnd()) {
    setError("Unexpected trailing characters");
    return false;
  }
  m_root = std::move(*value);
  return true;
}

void JsonReader::setError(const std::string &message) {
  if (m_lastError.empty()) {
    m_lastError =
        std::format("Line {}, Column {}: {}", m_line, m_column, message);
  }
}

char JsonReader::peek() const { return atEnd() ? '\0' : m_input[m_position]; }

char JsonReader::advance() {
  if (atEnd())
    return '\0';
  char c = m_input[m_position++];
  if (c == '\n') {
    m_line++;
    m_column = 1;
  } else {
    m_column++;
  }
  return c;
}

void JsonReader::skipWhitespace() {
  while (!atEnd()) {
    char c = peek();
    if (c != ' ' && c != '\t' && c != '\r' && c != '\n')
      break;
    advance();
  }
}

std::optional<JsonValue> JsonReader::parseValue(size_t depth) {
  if (depth > MAX_DEPTH) {
    setError("Maximum nesting depth exceeded");
    return std::nullopt;
  }
  switch (peek()) {
  case '{':
    return parseObject(depth + 1);
  case '[':
    return parseArray(depth + 1);
  case '"': {
    auto str = parseString();
    if (!str)
      return std::nullopt;
    return JsonValue(std::move(*str));
  }
  case 't':
    if (parseLiteral("true"))
      return JsonValue(true);
    return std::nullopt;
  case 'f':
    if (parseLiteral("false"))
      return JsonValue(false);
    return std::nullopt;
  case 'n':
    if (parseLiteral("null"))
      return JsonValue(nullptr);
    return std::nullopt;
  case '\0':
    setError("Unexpected end of input");
    return std::nullopt;
  default:
    if (peek() == '-' || (peek() >= '0' && peek() <= '9')) {
      return parseNumber();
    }
    setError(std::format("Unexpected character: '{}'", peek()));
    return std::nullopt;
  }
}

std::optional<JsonValue> JsonReader::parseObject(size_t depth) {
  advance(); // '{'
  JsonObject object;
  skipWhitespace();
  if (peek() == '}') {
    advance();
    return JsonValue(std::move(object));
  }

  while (true) {
    skipWhitespace();
    if (peek() != '"') {
      setError("Expected string key in object");
      return std::nullopt;
    }
    auto key = parseString();
    if (!key)
      return std::nullopt;

    skipWhitespace();
    if (advance() != ':') {
      setError("Expected ':' after object key");
      return std::nullopt;
    }
    skipWhitespace();
    auto value = parseValue(depth);
    if (!value)
      return std::nullopt;
    object[std::move(*key)] = std::move(*value);

    skipWhitespace();
    char c = advance();
    if (c == '}')
      break;
    if (c != ',') {
      setError("Expected ',' or '}' in object");
      return std::nullopt;
    }
  }
  return JsonValue(std::move(object));
}

std::optional<JsonValue> JsonReader::parseArray(size_t depth) {
  advance(); // '['
  JsonArray array;
  skipWhitespace();
  if (peek() == ']') {
    advance();
    return JsonValue(std::move(array));
  }

  while (true) {
    skipWhitespace();
    auto value = parseValue(depth);
    if (!value)
      return std::nullopt;
    array.push_back(std::move(*value));

    skipWhitespace();
    char c = advance();
    if (c == ']')
      break;
    if (c != ',') {
      setError("Expected ',' or ']' in array");
      return std::nullopt;
    }
  }
  return JsonValue(std::move(array));
}

std::optional<std::string> JsonReader::parseString() {
  advance(); // opening quote
  std::string result;
  while (!atEnd()) {
    char c = advance();
    if (c == '"') {
      return result;
    }
    if (static_cast<unsigned char>(c) < 0x20) {
      setError("Unescaped control character in string");
      return std::nullopt;
    }
    if (c != '\\') {
      result += c;
      continue;
    }

    char escaped = advance();
    switch (escaped) {
    case '"':
    case '\\':
    case '/':
      result += escaped;
      break;
    case 'b':
      result += '\b';
      break;
    case 'f':
      result += '\f';
      break;
    case 'n':
      result += '\n';
      break;
    case 'r':
      result += '\r';
      break;
    case 't':
      result += '\t';
      break;
    case 'u':
      if (!appendUnicodeEscape(result))
        return std::nullopt;
      break;
    default:
      setError(std::format("Invalid escape sequence: \\{}", escaped));
      return std::nullopt;
    }
  }
  setError("Unterminated string");
  return std::nullopt;
}

bool JsonReader::appendUnicodeEscape(std::string &out) {
  uint32_t codepoint = 0;
  for (int i = 0; i < 4; ++i) {
    char h = advance();
    codepoint <<= 4;
    if (h >= '0' && h <= '9') {
      codepoint |= static_cast<uint32_t>(h - '0');
    } else if (h >= 'a' && h <= 'f') {
      codepoint |= static_cast<uint32_t>(h - 'a' + 10);
    } else if (h >= 'A' && h <= 'F') {
      codepoint |= static_cast<uint32_t>(h - 'A' + 10);
    } else {
      setError("Invalid unicode escape");
      return false;
    }
  }

  // UTF-8 encode (basic multilingual plane only)
  if (codepoint <= 0x7F) {
    out += static_cast<char>(codepoint);
  } else if (codepoint <= 0x7FF) {
    out += static_cast<char>(0xC0 | (codepoint >> 6));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else {
    out += static_cast<char>(0xE0 | (codepoint >> 12));
    out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  }
  return true;
}

std::optional<JsonValue> JsonReader::parseNumber() {
  const size_t start = m_position;
  if (peek() == '-')
    advance();
  if (peek() < '0' || peek() > '9') {
    setError("Invalid number");
    return std::nullopt;
  }
  while (peek() >= '0' && peek() <= '9')
    advance();
  if (peek() == '.') {
    advance();
    if (peek() < '0' || peek() > '9') {
      setError("Expected digit after decimal point");
      return std::nullopt;
    }
    while (peek() >= '0' && peek() <= '9')
      advance();
  }
  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-')
      advance();
    if (peek() < '0' || peek() > '9') {
      setError("Expected digit in exponent");
      return std::nullopt;
    }
    while (peek() >= '0' && peek() <= '9')
      advance();
  }

  const std::string text = m_input.substr(start, m_position - start);
  char *end = nullptr;
  double value = std::strtod(text.c_str(), &end);
  if (end != text.c_str() + text.size()) {
    setError("Invalid number: " + text);
    return std::nullopt;
  }
  return JsonValue(value);
}

bool JsonReader::parseLiteral(const char *literal) {
  for (const char *p = literal; *p != '\0'; ++p) {
    if (advance() != *p) {
      setError(std::format("Invalid literal, expected '{}'", literal));
      return false;
    }
  }
  return true;
}

} // namespace PongEngine
