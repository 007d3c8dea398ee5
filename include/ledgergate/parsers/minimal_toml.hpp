// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of LedgerGate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cctype>
#include <cstdint>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <variant>

namespace ledgergate
{
namespace parsers
{
namespace toml
{

/// \brief Thrown for malformed TOML input, carrying the 1-based line number.
class ParseError : public std::runtime_error
{
public:
  ParseError(const std::string &what, std::size_t line)
      : std::runtime_error("TOML line " + std::to_string(line) + ": " + what), _line(line)
  {
  }

  std::size_t line() const { return _line; }

private:
  std::size_t _line;
};

using Value = std::variant<int64_t, double, bool, std::string>;

/// \brief A parsed document flattened to dotted keys, e.g. "server.port".
///
/// Supports the subset the gateway configuration uses: `[section]` and
/// `[section.sub]` headers, bare keys, basic and literal strings, integers,
/// floats, booleans and `#` comments.
class Document
{
public:
  bool contains(const std::string &dottedKey) const
  {
    return _values.find(dottedKey) != _values.end();
  }

  bool empty() const { return _values.empty(); }
  std::size_t size() const { return _values.size(); }

  void set(const std::string &dottedKey, Value value) { _values[dottedKey] = std::move(value); }

  /// \brief Typed lookup; returns nullopt if the key is absent or of another type.
  /// An integer is accepted where a double is requested.
  template <typename T> std::optional<T> get(const std::string &dottedKey) const
  {
    auto it = _values.find(dottedKey);
    if (it == _values.end())
    {
      return std::nullopt;
    }
    if (auto *v = std::get_if<T>(&it->second))
    {
      return *v;
    }
    if constexpr (std::is_same_v<T, double>)
    {
      if (auto *i = std::get_if<int64_t>(&it->second))
      {
        return static_cast<double>(*i);
      }
    }
    return std::nullopt;
  }

  std::map<std::string, Value>::const_iterator begin() const { return _values.begin(); }
  std::map<std::string, Value>::const_iterator end() const { return _values.end(); }

private:
  std::map<std::string, Value> _values;
};

class Parser
{
public:
  explicit Parser(const std::string &input) : _input(input) {}

  Document parse()
  {
    Document doc;
    std::string section;
    skipBlank();
    while (!atEnd())
    {
      if (peek() == '[')
      {
        section = parseSection();
      }
      else
      {
        std::string key = parseKey();
        skipSpaces();
        expect('=');
        skipSpaces();
        std::string full = section.empty() ? key : section + "." + key;
        if (doc.contains(full))
        {
          throw ParseError("duplicate key '" + full + "'", _line);
        }
        doc.set(full, parseValue());
      }
      endOfLine();
      skipBlank();
    }
    return doc;
  }

private:
  const std::string &_input;
  std::size_t _pos = 0;
  std::size_t _line = 1;

  bool atEnd() const { return _pos >= _input.size(); }
  char peek() const { return atEnd() ? '\0' : _input[_pos]; }

  char advance()
  {
    char c = _input[_pos++];
    if (c == '\n')
    {
      ++_line;
    }
    return c;
  }

  void expect(char c)
  {
    if (peek() != c)
    {
      throw ParseError(std::string("expected '") + c + "'", _line);
    }
    advance();
  }

  void skipSpaces()
  {
    while (!atEnd() && (peek() == ' ' || peek() == '\t'))
    {
      advance();
    }
  }

  void skipComment()
  {
    if (peek() == '#')
    {
      while (!atEnd() && peek() != '\n')
      {
        advance();
      }
    }
  }

  void skipBlank()
  {
    while (!atEnd())
    {
      skipSpaces();
      skipComment();
      if (peek() == '\n' || peek() == '\r')
      {
        advance();
        continue;
      }
      break;
    }
  }

  void endOfLine()
  {
    skipSpaces();
    skipComment();
    if (peek() == '\r')
    {
      advance();
    }
    if (!atEnd() && peek() != '\n')
    {
      throw ParseError("unexpected trailing characters", _line);
    }
  }

  static bool isKeyChar(char c)
  {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
  }

  std::string parseKey()
  {
    std::string key;
    while (!atEnd() && (isKeyChar(peek()) || peek() == '.'))
    {
      key += advance();
    }
    if (key.empty() || key.front() == '.' || key.back() == '.')
    {
      throw ParseError("invalid key", _line);
    }
    return key;
  }

  std::string parseSection()
  {
    advance(); // '['
    skipSpaces();
    std::string name = parseKey();
    skipSpaces();
    expect(']');
    return name;
  }

  Value parseValue()
  {
    char c = peek();
    if (c == '"')
    {
      return parseBasicString();
    }
    if (c == '\'')
    {
      return parseLiteralString();
    }
    if (c == 't' || c == 'f')
    {
      return parseBool();
    }
    if (c == '+' || c == '-' || std::isdigit(static_cast<unsigned char>(c)))
    {
      return parseNumber();
    }
    throw ParseError("invalid value", _line);
  }

  std::string parseBasicString()
  {
    advance();
    std::string out;
    while (!atEnd() && peek() != '"' && peek() != '\n')
    {
      char c = advance();
      if (c != '\\')
      {
        out += c;
        continue;
      }
      if (atEnd())
      {
        break;
      }
      char e = advance();
      switch (e)
      {
      case 'n':
        out += '\n';
        break;
      case 't':
        out += '\t';
        break;
      case 'r':
        out += '\r';
        break;
      case '\\':
      case '"':
        out += e;
        break;
      default:
        throw ParseError(std::string("unsupported escape '\\") + e + "'", _line);
      }
    }
    expect('"');
    return out;
  }

  std::string parseLiteralString()
  {
    advance();
    std::string out;
    while (!atEnd() && peek() != '\'' && peek() != '\n')
    {
      out += advance();
    }
    expect('\'');
    return out;
  }

  bool parseBool()
  {
    std::string word;
    while (!atEnd() && std::isalpha(static_cast<unsigned char>(peek())))
    {
      word += advance();
    }
    if (word == "true")
    {
      return true;
    }
    if (word == "false")
    {
      return false;
    }
    throw ParseError("invalid boolean '" + word + "'", _line);
  }

  Value parseNumber()
  {
    std::string num;
    bool isFloat = false;
    while (!atEnd())
    {
      char c = peek();
      if (c == '_')
      {
        advance();
        continue;
      }
      if (c == '.' || c == 'e' || c == 'E')
      {
        isFloat = true;
      }
      else if (!std::isdigit(static_cast<unsigned char>(c)) && c != '+' && c != '-')
      {
        break;
      }
      num += advance();
    }
    try
    {
      std::size_t used = 0;
      Value v = isFloat ? Value(std::stod(num, &used)) : Value(int64_t(std::stoll(num, &used)));
      if (used != num.size())
      {
        throw ParseError("invalid number '" + num + "'", _line);
      }
      return v;
    }
    catch (const std::logic_error &)
    {
      throw ParseError("invalid number '" + num + "'", _line);
    }
  }
};

inline Document parse(const std::string &text) { return Parser(text).parse(); }

inline Document parseFile(const std::string &filename)
{
  std::ifstream file(filename);
  if (!file.is_open())
  {
    throw std::runtime_error("Cannot open file: " + filename);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

} // namespace toml
} // namespace parsers
} // namespace ledgergate
