// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of LedgerGate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
/// \file json.hpp
/// \brief Header-only JSON value, parser and serializer.
///
/// - DOM value: null, bool, int64, double, string, array, object
/// - Non-throwing parse with line/column errors, plus parseOrThrow
/// - Objects are kept in key order (\c std::map), so serialized output is
///   always sorted by key
/// - Pretty output ends member lines with `,` and separates keys from
///   values with `": "`
/// - \uXXXX escapes (including surrogate pairs) are decoded to UTF-8 and can
///   be re-emitted with SerializeOptions::asciiOnly

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace ledgergate
{
namespace parsers
{

enum class JsonType
{
  Null,
  Boolean,
  Int,
  Double,
  String,
  Array,
  Object
};

/// \brief Location of a parse error in the source text.
struct JsonLocation
{
  std::size_t offset{0};
  std::size_t line{1};
  std::size_t column{1};
};

struct JsonError
{
  std::string message;
  JsonLocation where;
};

/// \brief Parse limits to prevent resource exhaustion.
struct ParseLimits
{
  std::size_t arrayItemsMax{100000};
  std::size_t membersMax{10000};
  std::size_t depthMax{100};
  std::size_t stringLengthMax{1000000};
};

struct SerializeOptions
{
  bool pretty{false};       ///< One member per line with indentation
  std::string indent{"  "}; ///< Indentation unit for pretty output
  bool asciiOnly{false};    ///< Escape every non-ASCII code point as \uXXXX
};

struct ParseResult;

class Json
{
public:
  using Array = std::vector<Json>;
  using Object = std::map<std::string, Json>;

  class parse_error : public std::runtime_error
  {
  public:
    explicit parse_error(const std::string &msg) : std::runtime_error(msg) {}
  };

  class type_error : public std::runtime_error
  {
  public:
    explicit type_error(const std::string &msg) : std::runtime_error(msg) {}
  };

  Json() : _value(nullptr) {}
  Json(std::nullptr_t) : _value(nullptr) {}
  Json(bool b) : _value(b) {}
  template <typename T,
            typename = std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>>
  Json(T i) : _value(static_cast<std::int64_t>(i))
  {
  }
  Json(double d) : _value(d) {}
  Json(const char *s) : _value(std::string(s)) {}
  Json(const std::string &s) : _value(s) {}
  Json(std::string &&s) : _value(std::move(s)) {}
  Json(const Array &a) : _value(a) {}
  Json(Array &&a) : _value(std::move(a)) {}
  Json(const Object &o) : _value(o) {}
  Json(Object &&o) : _value(std::move(o)) {}

  static Json object() { return Json(Object{}); }
  static Json array() { return Json(Array{}); }

  JsonType type() const { return static_cast<JsonType>(_value.index()); }

  bool isNull() const { return std::holds_alternative<std::nullptr_t>(_value); }
  bool isBool() const { return std::holds_alternative<bool>(_value); }
  bool isInt() const { return std::holds_alternative<std::int64_t>(_value); }
  bool isDouble() const { return std::holds_alternative<double>(_value); }
  bool isNumber() const { return isInt() || isDouble(); }
  bool isString() const { return std::holds_alternative<std::string>(_value); }
  bool isArray() const { return std::holds_alternative<Array>(_value); }
  bool isObject() const { return std::holds_alternative<Object>(_value); }

  bool getBool() const { return checked<bool>("boolean"); }
  std::int64_t getInt() const { return checked<std::int64_t>("integer"); }
  double getDouble() const
  {
    if (isInt())
    {
      return static_cast<double>(std::get<std::int64_t>(_value));
    }
    return checked<double>("number");
  }
  const std::string &getString() const { return checked<std::string>("string"); }
  const Array &getArray() const { return checked<Array>("array"); }
  const Object &getObject() const { return checked<Object>("object"); }
  Array &getArray() { return checked<Array>("array"); }
  Object &getObject() { return checked<Object>("object"); }

  /// \brief Object member access; a null value is promoted to an object.
  Json &operator[](const std::string &key)
  {
    if (isNull())
    {
      _value = Object{};
    }
    return getObject()[key];
  }
  Json &operator[](const char *key) { return operator[](std::string(key)); }

  /// \throws type_error if not an object, std::out_of_range if missing.
  const Json &at(const std::string &key) const
  {
    const auto &obj = getObject();
    auto it = obj.find(key);
    if (it == obj.end())
    {
      throw std::out_of_range("JSON key not found: " + key);
    }
    return it->second;
  }

  const Json &at(std::size_t index) const { return getArray().at(index); }

  bool contains(const std::string &key) const
  {
    return isObject() && std::get<Object>(_value).count(key) > 0;
  }

  std::size_t size() const
  {
    if (isArray())
    {
      return std::get<Array>(_value).size();
    }
    if (isObject())
    {
      return std::get<Object>(_value).size();
    }
    return isNull() ? 0 : 1;
  }

  bool empty() const { return size() == 0; }

  /// \brief Append to an array; a null value is promoted to an array.
  void push_back(Json val)
  {
    if (isNull())
    {
      _value = Array{};
    }
    getArray().push_back(std::move(val));
  }

  std::size_t erase(const std::string &key) { return getObject().erase(key); }

  bool operator==(const Json &other) const { return _value == other._value; }
  bool operator!=(const Json &other) const { return !(*this == other); }

  std::string serialize(const SerializeOptions &options = {}) const
  {
    std::string out;
    serializeTo(out, options, 0);
    return out;
  }

  static ParseResult parse(std::string_view text, const ParseLimits &limits = {});
  static Json parseOrThrow(std::string_view text, const ParseLimits &limits = {});

private:
  using Value =
    std::variant<std::nullptr_t, bool, std::int64_t, double, std::string, Array, Object>;
  Value _value;

  template <typename T> const T &checked(const char *name) const
  {
    if (auto *v = std::get_if<T>(&_value))
    {
      return *v;
    }
    throw type_error(std::string("JSON value is not a ") + name);
  }

  template <typename T> T &checked(const char *name)
  {
    if (auto *v = std::get_if<T>(&_value))
    {
      return *v;
    }
    throw type_error(std::string("JSON value is not a ") + name);
  }

  static void newline(std::string &out, const SerializeOptions &options, int depth)
  {
    out += '\n';
    for (int i = 0; i < depth; ++i)
    {
      out += options.indent;
    }
  }

  void serializeTo(std::string &out, const SerializeOptions &options, int depth) const
  {
    switch (type())
    {
    case JsonType::Null:
      out += "null";
      break;
    case JsonType::Boolean:
      out += std::get<bool>(_value) ? "true" : "false";
      break;
    case JsonType::Int:
      out += std::to_string(std::get<std::int64_t>(_value));
      break;
    case JsonType::Double:
      out += formatDouble(std::get<double>(_value));
      break;
    case JsonType::String:
      escapeString(out, std::get<std::string>(_value), options.asciiOnly);
      break;
    case JsonType::Array:
    {
      const auto &arr = std::get<Array>(_value);
      if (arr.empty())
      {
        out += "[]";
        break;
      }
      out += '[';
      for (std::size_t i = 0; i < arr.size(); ++i)
      {
        if (i > 0)
        {
          out += options.pretty ? "," : ", ";
        }
        if (options.pretty)
        {
          newline(out, options, depth + 1);
        }
        arr[i].serializeTo(out, options, depth + 1);
      }
      if (options.pretty)
      {
        newline(out, options, depth);
      }
      out += ']';
      break;
    }
    case JsonType::Object:
    {
      const auto &obj = std::get<Object>(_value);
      if (obj.empty())
      {
        out += "{}";
        break;
      }
      out += '{';
      bool first = true;
      for (const auto &member : obj)
      {
        if (!first)
        {
          out += options.pretty ? "," : ", ";
        }
        first = false;
        if (options.pretty)
        {
          newline(out, options, depth + 1);
        }
        escapeString(out, member.first, options.asciiOnly);
        out += ": ";
        member.second.serializeTo(out, options, depth + 1);
      }
      if (options.pretty)
      {
        newline(out, options, depth);
      }
      out += '}';
      break;
    }
    }
  }

  /// Shortest representation that reads back to the same double.
  static std::string formatDouble(double d)
  {
    if (std::isnan(d))
    {
      return "NaN";
    }
    if (std::isinf(d))
    {
      return d > 0 ? "Infinity" : "-Infinity";
    }
    char buf[32];
    for (int precision = 1; precision <= 17; ++precision)
    {
      std::snprintf(buf, sizeof(buf), "%.*g", precision, d);
      if (std::strtod(buf, nullptr) == d)
      {
        break;
      }
    }
    std::string s(buf);
    if (s.find_first_of(".en") == std::string::npos)
    {
      s += ".0";
    }
    return s;
  }

  static void appendHex4(std::string &out, unsigned int v)
  {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "\\u%04x", v & 0xFFFFu);
    out += buf;
  }

  static void escapeString(std::string &out, const std::string &str, bool asciiOnly)
  {
    out += '"';
    for (std::size_t i = 0; i < str.size(); ++i)
    {
      unsigned char c = static_cast<unsigned char>(str[i]);
      switch (c)
      {
      case '"':
        out += "\\\"";
        continue;
      case '\\':
        out += "\\\\";
        continue;
      case '\b':
        out += "\\b";
        continue;
      case '\f':
        out += "\\f";
        continue;
      case '\n':
        out += "\\n";
        continue;
      case '\r':
        out += "\\r";
        continue;
      case '\t':
        out += "\\t";
        continue;
      default:
        break;
      }
      if (c < 0x20)
      {
        appendHex4(out, c);
        continue;
      }
      if (c < 0x80 || !asciiOnly)
      {
        out += static_cast<char>(c);
        continue;
      }

      // Decode one UTF-8 sequence; invalid bytes are emitted as U+FFFD.
      unsigned int cp = 0xFFFD;
      std::size_t extra = 0;
      if ((c & 0xE0) == 0xC0)
      {
        cp = c & 0x1F;
        extra = 1;
      }
      else if ((c & 0xF0) == 0xE0)
      {
        cp = c & 0x0F;
        extra = 2;
      }
      else if ((c & 0xF8) == 0xF0)
      {
        cp = c & 0x07;
        extra = 3;
      }
      if (extra == 0 || i + extra >= str.size())
      {
        appendHex4(out, 0xFFFD);
        continue;
      }
      bool continued = true;
      for (std::size_t k = 1; k <= extra && continued; ++k)
      {
        auto next = static_cast<unsigned char>(str[i + k]);
        continued = (next & 0xC0) == 0x80;
        cp = (cp << 6) | (next & 0x3F);
      }
      if (!continued || cp > 0x10FFFF)
      {
        // Only the lead byte is consumed; the rest is scanned again.
        appendHex4(out, 0xFFFD);
        continue;
      }
      i += extra;
      if (cp >= 0x10000)
      {
        cp -= 0x10000;
        appendHex4(out, 0xD800 + (cp >> 10));
        appendHex4(out, 0xDC00 + (cp & 0x3FF));
      }
      else
      {
        appendHex4(out, cp);
      }
    }
    out += '"';
  }
};

/// \brief Result of a non-throwing parse.
struct ParseResult
{
  Json value;
  bool ok{false};
  JsonError error;
};

class JsonParser
{
public:
  JsonParser(std::string_view text, const ParseLimits &limits) : _text(text), _limits(limits) {}

  ParseResult parse()
  {
    ParseResult result;
    skipWhitespace();
    if (parseValue(result.value, 0))
    {
      skipWhitespace();
      if (_pos < _text.size())
      {
        _error = "Extra characters after JSON value";
      }
      else
      {
        result.ok = true;
        return result;
      }
    }
    result.error.message = _error.empty() ? "Parse error" : _error;
    result.error.where = location();
    return result;
  }

private:
  std::string_view _text;
  std::size_t _pos{0};
  ParseLimits _limits;
  std::string _error;

  JsonLocation location() const
  {
    JsonLocation loc;
    loc.offset = _pos;
    for (std::size_t i = 0; i < _pos && i < _text.size(); ++i)
    {
      if (_text[i] == '\n')
      {
        ++loc.line;
        loc.column = 1;
      }
      else
      {
        ++loc.column;
      }
    }
    return loc;
  }

  bool fail(const char *message)
  {
    _error = message;
    return false;
  }

  bool atEnd() const { return _pos >= _text.size(); }

  void skipWhitespace()
  {
    while (!atEnd() && (_text[_pos] == ' ' || _text[_pos] == '\t' || _text[_pos] == '\n' ||
                        _text[_pos] == '\r'))
    {
      ++_pos;
    }
  }

  bool literal(std::string_view word)
  {
    if (_text.substr(_pos, word.size()) != word)
    {
      return false;
    }
    _pos += word.size();
    return true;
  }

  bool parseValue(Json &out, std::size_t depth)
  {
    if (depth > _limits.depthMax)
    {
      return fail("Maximum nesting depth exceeded");
    }
    skipWhitespace();
    if (atEnd())
    {
      return fail("Unexpected end of input");
    }

    char c = _text[_pos];
    if (c == 'n')
    {
      out = Json();
      return literal("null") || fail("Invalid literal");
    }
    if (c == 't')
    {
      out = Json(true);
      return literal("true") || fail("Invalid literal");
    }
    if (c == 'f')
    {
      out = Json(false);
      return literal("false") || fail("Invalid literal");
    }
    if (c == '"')
    {
      std::string s;
      if (!parseString(s))
      {
        return false;
      }
      out = Json(std::move(s));
      return true;
    }
    if (c == '[')
    {
      return parseArray(out, depth);
    }
    if (c == '{')
    {
      return parseObject(out, depth);
    }
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c)))
    {
      return parseNumber(out);
    }
    return fail("Unexpected character");
  }

  bool digits()
  {
    std::size_t start = _pos;
    while (!atEnd() && std::isdigit(static_cast<unsigned char>(_text[_pos])))
    {
      ++_pos;
    }
    return _pos > start;
  }

  bool parseNumber(Json &out)
  {
    std::size_t start = _pos;
    if (_text[_pos] == '-')
    {
      ++_pos;
    }
    if (atEnd() || !std::isdigit(static_cast<unsigned char>(_text[_pos])))
    {
      return fail("Invalid number format");
    }
    if (_text[_pos] == '0')
    {
      ++_pos;
    }
    else
    {
      digits();
    }

    bool isFloat = false;
    if (!atEnd() && _text[_pos] == '.')
    {
      isFloat = true;
      ++_pos;
      if (!digits())
      {
        return fail("Invalid number format");
      }
    }
    if (!atEnd() && (_text[_pos] == 'e' || _text[_pos] == 'E'))
    {
      isFloat = true;
      ++_pos;
      if (!atEnd() && (_text[_pos] == '+' || _text[_pos] == '-'))
      {
        ++_pos;
      }
      if (!digits())
      {
        return fail("Invalid number format");
      }
    }

    std::string_view num = _text.substr(start, _pos - start);
    if (!isFloat)
    {
      std::int64_t i = 0;
      auto res = std::from_chars(num.data(), num.data() + num.size(), i);
      if (res.ec == std::errc{})
      {
        out = Json(i);
        return true;
      }
    }
    out = Json(std::strtod(std::string(num).c_str(), nullptr));
    return true;
  }

  bool hex4(unsigned int &value)
  {
    if (_pos + 4 > _text.size())
    {
      return fail("Truncated unicode escape");
    }
    value = 0;
    for (int i = 0; i < 4; ++i)
    {
      char h = _text[_pos++];
      value <<= 4;
      if (h >= '0' && h <= '9')
      {
        value |= static_cast<unsigned int>(h - '0');
      }
      else if (h >= 'a' && h <= 'f')
      {
        value |= static_cast<unsigned int>(h - 'a' + 10);
      }
      else if (h >= 'A' && h <= 'F')
      {
        value |= static_cast<unsigned int>(h - 'A' + 10);
      }
      else
      {
        return fail("Invalid unicode escape");
      }
    }
    return true;
  }

  static void appendUtf8(std::string &out, unsigned int cp)
  {
    if (cp < 0x80)
    {
      out += static_cast<char>(cp);
    }
    else if (cp < 0x800)
    {
      out += static_cast<char>(0xC0 | (cp >> 6));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    else if (cp < 0x10000)
    {
      out += static_cast<char>(0xE0 | (cp >> 12));
      out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    else
    {
      out += static_cast<char>(0xF0 | (cp >> 18));
      out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
      out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    }
  }

  bool parseString(std::string &out)
  {
    ++_pos; // opening quote
    while (true)
    {
      if (atEnd())
      {
        return fail("Unterminated string");
      }
      if (out.size() > _limits.stringLengthMax)
      {
        return fail("String length exceeds limit");
      }
      char c = _text[_pos++];
      if (c == '"')
      {
        return true;
      }
      if (static_cast<unsigned char>(c) < 0x20)
      {
        return fail("Control character in string");
      }
      if (c != '\\')
      {
        out += c;
        continue;
      }
      if (atEnd())
      {
        return fail("Unterminated string");
      }
      char e = _text[_pos++];
      switch (e)
      {
      case '"':
      case '\\':
      case '/':
        out += e;
        break;
      case 'b':
        out += '\b';
        break;
      case 'f':
        out += '\f';
        break;
      case 'n':
        out += '\n';
        break;
      case 'r':
        out += '\r';
        break;
      case 't':
        out += '\t';
        break;
      case 'u':
      {
        unsigned int cp = 0;
        if (!hex4(cp))
        {
          return false;
        }
        if (cp >= 0xD800 && cp <= 0xDBFF && _text.substr(_pos, 2) == "\\u")
        {
          std::size_t save = _pos;
          _pos += 2;
          unsigned int low = 0;
          if (!hex4(low))
          {
            return false;
          }
          if (low >= 0xDC00 && low <= 0xDFFF)
          {
            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
          }
          else
          {
            _pos = save;
          }
        }
        appendUtf8(out, cp);
        break;
      }
      default:
        return fail("Invalid escape sequence");
      }
    }
  }

  bool parseArray(Json &out, std::size_t depth)
  {
    ++_pos;
    Json::Array arr;
    skipWhitespace();
    if (!atEnd() && _text[_pos] == ']')
    {
      ++_pos;
      out = Json(std::move(arr));
      return true;
    }
    while (true)
    {
      if (arr.size() >= _limits.arrayItemsMax)
      {
        return fail("Array size exceeds limit");
      }
      Json element;
      if (!parseValue(element, depth + 1))
      {
        return false;
      }
      arr.push_back(std::move(element));
      skipWhitespace();
      if (atEnd())
      {
        return fail("Unexpected end of array");
      }
      char c = _text[_pos++];
      if (c == ']')
      {
        break;
      }
      if (c != ',')
      {
        return fail("Expected ',' or ']'");
      }
    }
    out = Json(std::move(arr));
    return true;
  }

  bool parseObject(Json &out, std::size_t depth)
  {
    ++_pos;
    Json::Object obj;
    skipWhitespace();
    if (!atEnd() && _text[_pos] == '}')
    {
      ++_pos;
      out = Json(std::move(obj));
      return true;
    }
    while (true)
    {
      if (obj.size() >= _limits.membersMax)
      {
        return fail("Object member count exceeds limit");
      }
      skipWhitespace();
      if (atEnd() || _text[_pos] != '"')
      {
        return fail("Expected string key");
      }
      std::string key;
      if (!parseString(key))
      {
        return false;
      }
      skipWhitespace();
      if (atEnd() || _text[_pos] != ':')
      {
        return fail("Expected ':'");
      }
      ++_pos;
      Json value;
      if (!parseValue(value, depth + 1))
      {
        return false;
      }
      obj[std::move(key)] = std::move(value);
      skipWhitespace();
      if (atEnd())
      {
        return fail("Unexpected end of object");
      }
      char c = _text[_pos++];
      if (c == '}')
      {
        break;
      }
      if (c != ',')
      {
        return fail("Expected ',' or '}'");
      }
    }
    out = Json(std::move(obj));
    return true;
  }
};

inline ParseResult Json::parse(std::string_view text, const ParseLimits &limits)
{
  return JsonParser(text, limits).parse();
}

inline Json Json::parseOrThrow(std::string_view text, const ParseLimits &limits)
{
  auto result = parse(text, limits);
  if (!result.ok)
  {
    throw parse_error("JSON parse error at line " + std::to_string(result.error.where.line) +
                      ", column " + std::to_string(result.error.where.column) + ": " +
                      result.error.message);
  }
  return std::move(result.value);
}

} // namespace parsers
} // namespace ledgergate
