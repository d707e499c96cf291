/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace Formicary {

// JsonValue implementation

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

std::optional<int> JsonValue::tryAsInt() const {
  if (!isNumber())
    return std::nullopt;
  const double number = asNumber();
  if (std::floor(number) != number || number < -2147483648.0 ||
      number > 2147483647.0)
    return std::nullopt;
  return static_cast<int>(number);
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (isString())
    return asString();
  return std::nullopt;
}

bool JsonValue::hasKey(const std::string &key) const {
  if (!isObject())
    return false;
  const auto &obj = asObject();
  return obj.find(key) != obj.end();
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  static const JsonValue null_value;
  if (!isObject())
    return null_value;
  const auto &obj = asObject();
  auto it = obj.find(key);
  return (it != obj.end()) ? it->second : null_value;
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

// JsonReader implementation

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    m_lastError = "Failed to open file: " + path;
    return false;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

bool JsonReader::parse(const std::string &jsonString) {
  m_lastError.clear();
  m_input = &jsonString;
  m_position = 0;
  m_line = 1;
  m_column = 1;

  JsonValue root;
  skipWhitespace();
  bool ok = parseValue(root, 0);
  if (ok) {
    skipWhitespace();
    if (!atEnd()) {
      ok = fail("Unexpected trailing characters");
    }
  }

  m_input = nullptr;
  if (ok) {
    m_root = std::move(root);
  }
  return ok;
}

char JsonReader::peek() const {
  return atEnd() ? '\0' : (*m_input)[m_position];
}

char JsonReader::advance() {
  if (atEnd())
    return '\0';
  const char c = (*m_input)[m_position++];
  if (c == '\n') {
    ++m_line;
    m_column = 1;
  } else {
    ++m_column;
  }
  return c;
}

bool JsonReader::atEnd() const { return m_position >= m_input->size(); }

void JsonReader::skipWhitespace() {
  while (!atEnd()) {
    const char c = peek();
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r')
      break;
    advance();
  }
}

bool JsonReader::expectLiteral(const char *literal) {
  for (const char *p = literal; *p != '\0'; ++p) {
    if (peek() != *p) {
      return fail(std::string("Invalid literal, expected '") + literal + "'");
    }
    advance();
  }
  return true;
}

bool JsonReader::parseValue(JsonValue &out, int depth) {
  if (depth > MAX_NESTING) {
    return fail("Nesting too deep");
  }

  switch (peek()) {
  case '{':
    return parseObject(out, depth + 1);
  case '[':
    return parseArray(out, depth + 1);
  case '"': {
    std::string text;
    if (!parseString(text))
      return false;
    out = JsonValue(std::move(text));
    return true;
  }
  case 't':
    if (!expectLiteral("true"))
      return false;
    out = JsonValue(true);
    return true;
  case 'f':
    if (!expectLiteral("false"))
      return false;
    out = JsonValue(false);
    return true;
  case 'n':
    if (!expectLiteral("null"))
      return false;
    out = JsonValue();
    return true;
  case '\0':
    return fail("Unexpected end of input");
  default:
    return parseNumber(out);
  }
}

bool JsonReader::parseObject(JsonValue &out, int depth) {
  advance(); // '{'
  JsonObject object;
  skipWhitespace();

  if (peek() == '}') {
    advance();
    out = JsonValue(std::move(object));
    return true;
  }

  while (true) {
    skipWhitespace();
    if (peek() != '"')
      return fail("Expected string key in object");

    std::string key;
    if (!parseString(key))
      return false;

    skipWhitespace();
    if (advance() != ':')
      return fail("Expected ':' after object key");

    skipWhitespace();
    JsonValue value;
    if (!parseValue(value, depth))
      return false;
    object[key] = std::move(value);

    skipWhitespace();
    const char c = advance();
    if (c == '}')
      break;
    if (c != ',')
      return fail("Expected ',' or '}' in object");
  }

  out = JsonValue(std::move(object));
  return true;
}

bool JsonReader::parseArray(JsonValue &out, int depth) {
  advance(); // '['
  JsonArray array;
  skipWhitespace();

  if (peek() == ']') {
    advance();
    out = JsonValue(std::move(array));
    return true;
  }

  while (true) {
    skipWhitespace();
    JsonValue value;
    if (!parseValue(value, depth))
      return false;
    array.push_back(std::move(value));

    skipWhitespace();
    const char c = advance();
    if (c == ']')
      break;
    if (c != ',')
      return fail("Expected ',' or ']' in array");
  }

  out = JsonValue(std::move(array));
  return true;
}

bool JsonReader::parseString(std::string &out) {
  advance(); // opening quote
  out.clear();

  while (true) {
    if (atEnd())
      return fail("Unterminated string");

    const char c = advance();
    if (c == '"')
      return true;
    if (static_cast<unsigned char>(c) < 0x20)
      return fail("Control character in string");
    if (c != '\\') {
      out += c;
      continue;
    }

    const char escaped = advance();
    switch (escaped) {
    case '"':  out += '"'; break;
    case '\\': out += '\\'; break;
    case '/':  out += '/'; break;
    case 'b':  out += '\b'; break;
    case 'f':  out += '\f'; break;
    case 'n':  out += '\n'; break;
    case 'r':  out += '\r'; break;
    case 't':  out += '\t'; break;
    case 'u': {
      uint32_t codePoint = 0;
      if (!parseUnicodeEscape(codePoint))
        return false;
      // Encode as UTF-8
      if (codePoint < 0x80) {
        out += static_cast<char>(codePoint);
      } else if (codePoint < 0x800) {
        out += static_cast<char>(0xC0 | (codePoint >> 6));
        out += static_cast<char>(0x80 | (codePoint & 0x3F));
      } else {
        out += static_cast<char>(0xE0 | (codePoint >> 12));
        out += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codePoint & 0x3F));
      }
      break;
    }
    default:
      return fail("Invalid escape sequence");
    }
  }
}

bool JsonReader::parseUnicodeEscape(uint32_t &codePoint) {
  codePoint = 0;
  for (int i = 0; i < 4; ++i) {
    const char c = advance();
    codePoint <<= 4;
    if (c >= '0' && c <= '9')
      codePoint |= static_cast<uint32_t>(c - '0');
    else if (c >= 'a' && c <= 'f')
      codePoint |= static_cast<uint32_t>(c - 'a' + 10);
    else if (c >= 'A' && c <= 'F')
      codePoint |= static_cast<uint32_t>(c - 'A' + 10);
    else
      return fail("Invalid unicode escape");
  }
  return true;
}

bool JsonReader::parseNumber(JsonValue &out) {
  const size_t start = m_position;

  if (peek() == '-')
    advance();
  if (!std::isdigit(static_cast<unsigned char>(peek())))
    return fail("Unexpected character");

  while (std::isdigit(static_cast<unsigned char>(peek())))
    advance();
  if (peek() == '.') {
    advance();
    if (!std::isdigit(static_cast<unsigned char>(peek())))
      return fail("Expected digit after decimal point");
    while (std::isdigit(static_cast<unsigned char>(peek())))
      advance();
  }
  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-')
      advance();
    if (!std::isdigit(static_cast<unsigned char>(peek())))
      return fail("Expected digit in exponent");
    while (std::isdigit(static_cast<unsigned char>(peek())))
      advance();
  }

  const std::string text = m_input->substr(start, m_position - start);
  out = JsonValue(std::strtod(text.c_str(), nullptr));
  return true;
}

bool JsonReader::fail(const std::string &message) {
  if (m_lastError.empty()) {
    m_lastError = message + " at line " + std::to_string(m_line) +
                  ", column " + std::to_string(m_column);
  }
  return false;
}

} // namespace Formicary
