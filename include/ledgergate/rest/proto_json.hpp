// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of LedgerGate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <stdexcept>
#include <string>

#include <google/protobuf/message.h>
#include <google/protobuf/util/json_util.h>

#include <ledgergate/parsers/json.hpp>

namespace ledgergate
{
namespace rest
{

/// \brief Convert a protobuf message to a JSON value using proto field names
/// and printing fields that hold their default value. Enums print by name,
/// `bytes` as base64 and 64-bit integers as strings.
/// \throws std::runtime_error if the printer rejects the message.
inline parsers::Json messageToJson(const google::protobuf::Message &message)
{
  google::protobuf::util::JsonPrintOptions options;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names = true;

  std::string text;
  auto status = google::protobuf::util::MessageToJsonString(message, &text, options);
  if (!status.ok())
  {
    throw std::runtime_error("Cannot convert " + message.GetTypeName() +
                             " to JSON: " + status.ToString());
  }
  // The printer's output is trusted: no array, object or string in it can
  // outgrow the text itself.
  parsers::ParseLimits limits;
  limits.arrayItemsMax = text.size();
  limits.membersMax = text.size();
  limits.stringLengthMax = text.size();
  return parsers::Json::parseOrThrow(text, limits);
}

} // namespace rest
} // namespace ledgergate
