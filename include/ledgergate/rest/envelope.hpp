// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of LedgerGate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <optional>
#include <string>

#include <ledgergate/parsers/http_message.hpp>
#include <ledgergate/parsers/json.hpp>

namespace ledgergate
{
namespace rest
{

using network::HttpRequest;
using network::HttpResponse;

/// \brief Builds the `{data, head, link}` JSON envelope every endpoint
/// answers with.
class Envelope
{
public:
  static constexpr const char *CONTENT_TYPE = "application/json";

  /// \brief Sorted, two-space indented JSON with non-ASCII escaped.
  static std::string format(const parsers::Json &body)
  {
    parsers::SerializeOptions options;
    options.pretty = true;
    options.asciiOnly = true;
    return body.serialize(options);
  }

  /// \brief `metadata` plus `data` when present. `data` is omitted, never
  /// null, when absent.
  static HttpResponse wrap(const std::optional<parsers::Json> &data,
                           const std::optional<parsers::Json> &metadata, int status = 200)
  {
    parsers::Json envelope = metadata ? *metadata : parsers::Json::object();
    if (data)
    {
      envelope["data"] = *data;
    }
    HttpResponse response;
    response.status = status;
    response.setContent(format(envelope), CONTENT_TYPE);
    return response;
  }

  /// \brief `head` and `link` for a reply. Without a reported head the link
  /// is the request URL as sent; with one it is rebuilt with `head` first,
  /// followed by the other query parameters in their original order.
  static parsers::Json computeMetadata(const HttpRequest &request, const parsers::Json &reply)
  {
    parsers::Json metadata = parsers::Json::object();
    std::string head;
    if (reply.contains("head_id") && reply.at("head_id").isString())
    {
      head = reply.at("head_id").getString();
    }
    if (head.empty())
    {
      metadata["link"] = request.url();
      return metadata;
    }

    std::string link = request.scheme + "://" + request.host() +
                       network::urlDecode(request.path, false) + "?head=" + head;
    for (const auto &param : request.queryParams)
    {
      if (param.first != "head")
      {
        link += "&" + param.first + "=" + param.second;
      }
    }
    metadata["head"] = head;
    metadata["link"] = link;
    return metadata;
  }
};

} // namespace rest
} // namespace ledgergate
