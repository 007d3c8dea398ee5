// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of LedgerGate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace ledgergate
{
namespace util
{

  /// \brief Standard Base64 (RFC 4648 section 4) with '=' padding, the
  /// encoding protobuf's JSON printer uses for `bytes` fields.
  class Base64
  {
  public:
    static std::string encode(const std::string &bytes)
    {
      static constexpr char kTable[65] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
      const auto *data = reinterpret_cast<const std::uint8_t *>(bytes.data());
      const std::size_t len = bytes.size();

      std::string out;
      out.reserve(((len + 2) / 3) * 4);
      std::size_t i = 0;
      for (; i + 3 <= len; i += 3)
      {
        std::uint32_t v = (std::uint32_t(data[i]) << 16) | (std::uint32_t(data[i + 1]) << 8) |
                          std::uint32_t(data[i + 2]);
        out.push_back(kTable[(v >> 18) & 0x3F]);
        out.push_back(kTable[(v >> 12) & 0x3F]);
        out.push_back(kTable[(v >> 6) & 0x3F]);
        out.push_back(kTable[v & 0x3F]);
      }

      std::size_t rem = len - i;
      if (rem > 0)
      {
        std::uint32_t v = std::uint32_t(data[i]) << 16;
        if (rem == 2)
        {
          v |= std::uint32_t(data[i + 1]) << 8;
        }
        out.push_back(kTable[(v >> 18) & 0x3F]);
        out.push_back(kTable[(v >> 12) & 0x3F]);
        out.push_back(rem == 2 ? kTable[(v >> 6) & 0x3F] : '=');
        out.push_back('=');
      }
      return out;
    }

    /// \brief Strict decode. Padding is optional but must be well placed.
    /// \throws std::invalid_argument on characters outside the alphabet,
    /// misplaced padding or an impossible length.
    static std::string decode(const std::string &text)
    {
      std::size_t len = text.size();
      std::size_t pad = 0;
      while (len > 0 && text[len - 1] == '=' && pad < 2)
      {
        --len;
        ++pad;
      }
      if (len % 4 == 1 || (pad > 0 && (len + pad) % 4 != 0))
      {
        throw std::invalid_argument("Base64: invalid length");
      }

      std::string out;
      out.reserve(len * 3 / 4);
      std::uint32_t acc = 0;
      int bits = 0;
      for (std::size_t i = 0; i < len; ++i)
      {
        int v = value(text[i]);
        if (v < 0)
        {
          throw std::invalid_argument("Base64: invalid character at offset " +
                                      std::to_string(i));
        }
        acc = (acc << 6) | static_cast<std::uint32_t>(v);
        bits += 6;
        if (bits >= 8)
        {
          bits -= 8;
          out.push_back(static_cast<char>((acc >> bits) & 0xFF));
        }
      }
      return out;
    }

  private:
    static int value(char c)
    {
      if (c >= 'A' && c <= 'Z')
      {
        return c - 'A';
      }
      if (c >= 'a' && c <= 'z')
      {
        return c - 'a' + 26;
      }
      if (c >= '0' && c <= '9')
      {
        return c - '0' + 52;
      }
      if (c == '+')
      {
        return 62;
      }
      if (c == '/')
      {
        return 63;
      }
      return -1;
    }
  };

} // namespace util
} // namespace ledgergate
