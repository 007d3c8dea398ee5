// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of LedgerGate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>

#include <openssl/err.h>
#include <openssl/rand.h>

namespace ledgergate
{
namespace ids
{

  /// \brief RFC 4122 version 4 identifiers, used as validator correlation ids.
  class Uuid
  {
  public:
    using Bytes = std::array<std::uint8_t, 16>;

    /// \return e.g. "550e8400-e29b-41d4-a716-446655440000"
    /// \throws std::runtime_error if OpenSSL cannot supply random bytes.
    static std::string v4()
    {
      Bytes b{};
      if (RAND_bytes(b.data(), static_cast<int>(b.size())) != 1)
      {
        char reason[256] = "no OpenSSL error queued";
        if (unsigned long code = ERR_get_error()) // NOLINT(google-runtime-int)
        {
          ERR_error_string_n(code, reason, sizeof(reason));
        }
        throw std::runtime_error(std::string("Uuid: RAND_bytes failed: ") + reason);
      }
      b[6] = static_cast<std::uint8_t>((b[6] & 0x0F) | 0x40);
      b[8] = static_cast<std::uint8_t>((b[8] & 0x3F) | 0x80);
      return toString(b);
    }

    /// \brief Canonical 8-4-4-4-12 lower-case hex form.
    static std::string toString(const Bytes &b)
    {
      static constexpr char kHex[] = "0123456789abcdef";
      std::string s;
      s.reserve(36);
      for (std::size_t i = 0; i < b.size(); ++i)
      {
        if (i == 4 || i == 6 || i == 8 || i == 10)
        {
          s.push_back('-');
        }
        s.push_back(kHex[b[i] >> 4]);
        s.push_back(kHex[b[i] & 0x0F]);
      }
      return s;
    }
  };

} // namespace ids
} // namespace ledgergate
