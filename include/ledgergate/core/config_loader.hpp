// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of LedgerGate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <ledgergate/parsers/minimal_toml.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace ledgergate
{
namespace core
{
/// \brief Loads a TOML configuration file and exposes typed lookups.
class ConfigLoader
{
public:
  /// \brief Loads the file immediately.
  /// \throws std::runtime_error if the file cannot be read or parsed.
  explicit ConfigLoader(const std::string &filename) : _filename(filename) { reload(); }

  /// \brief Re-reads the file from disk, replacing the current table.
  void reload()
  {
    try
    {
      _doc = parsers::toml::parseFile(_filename);
    }
    catch (const std::exception &ex)
    {
      throw std::runtime_error("Failed to load configuration file " + _filename + ": " +
                               ex.what());
    }
  }

  const parsers::toml::Document &document() const { return _doc; }

  std::optional<int64_t> getInt(const std::string &key) const { return _doc.get<int64_t>(key); }

  std::optional<bool> getBool(const std::string &key) const { return _doc.get<bool>(key); }

  std::optional<std::string> getString(const std::string &key) const
  {
    return _doc.get<std::string>(key);
  }

private:
  std::string _filename;
  parsers::toml::Document _doc;
};

} // namespace core
} // namespace ledgergate
