// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of LedgerGate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace ledgergate
{
namespace validator
{

/// \brief Thrown when a peer announces a frame larger than the limit.
class FrameTooLarge : public std::runtime_error
{
public:
  explicit FrameTooLarge(std::uint32_t size)
      : std::runtime_error("Validator frame of " + std::to_string(size) +
                           " bytes exceeds the limit")
  {
  }
};

/// \brief Length-prefixed framing for validator messages: a 4-byte
/// big-endian payload length followed by the serialized envelope.
class FrameCodec
{
public:
  static constexpr std::uint32_t MAX_FRAME_SIZE = 64u * 1024u * 1024u;

  static std::string encode(const std::string &payload)
  {
    if (payload.size() > MAX_FRAME_SIZE)
    {
      throw FrameTooLarge(static_cast<std::uint32_t>(payload.size()));
    }
    const auto n = static_cast<std::uint32_t>(payload.size());
    std::string frame;
    frame.reserve(4 + payload.size());
    frame.push_back(static_cast<char>((n >> 24) & 0xFF));
    frame.push_back(static_cast<char>((n >> 16) & 0xFF));
    frame.push_back(static_cast<char>((n >> 8) & 0xFF));
    frame.push_back(static_cast<char>(n & 0xFF));
    frame += payload;
    return frame;
  }

  /// \brief Buffer more stream bytes.
  void feed(const char *data, std::size_t len) { _buffer.append(data, len); }

  /// \brief Pop the next complete payload, if one is buffered.
  /// \throws FrameTooLarge when the announced length exceeds the limit.
  std::optional<std::string> next()
  {
    if (_buffer.size() < 4)
    {
      return std::nullopt;
    }
    const auto *p = reinterpret_cast<const std::uint8_t *>(_buffer.data());
    std::uint32_t n = (std::uint32_t(p[0]) << 24) | (std::uint32_t(p[1]) << 16) |
                      (std::uint32_t(p[2]) << 8) | std::uint32_t(p[3]);
    if (n > MAX_FRAME_SIZE)
    {
      throw FrameTooLarge(n);
    }
    if (_buffer.size() < 4 + static_cast<std::size_t>(n))
    {
      return std::nullopt;
    }
    std::string payload = _buffer.substr(4, n);
    _buffer.erase(0, 4 + static_cast<std::size_t>(n));
    return payload;
  }

  std::size_t buffered() const { return _buffer.size(); }

private:
  std::string _buffer;
};

} // namespace validator
} // namespace ledgergate
