// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of LedgerGate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <charconv>
#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include "batch.pb.h"
#include "client.pb.h"
#include "validator.pb.h"

#include <ledgergate/core/logger.hpp>
#include <ledgergate/parsers/http_message.hpp>
#include <ledgergate/parsers/json.hpp>
#include <ledgergate/rest/api_error.hpp>
#include <ledgergate/rest/envelope.hpp>
#include <ledgergate/rest/error_traps.hpp>
#include <ledgergate/rest/header_expander.hpp>
#include <ledgergate/rest/proto_json.hpp>
#include <ledgergate/validator/connection.hpp>
#include <ledgergate/validator/message_traits.hpp>

namespace ledgergate
{
namespace rest
{

/// \brief The REST endpoints. Each handler validates its input, queries the
/// validator through the shared connection, checks the reply status against
/// its traps and answers with an envelope.
///
/// Failures meant for the client are thrown as ApiError. Anything else that
/// escapes (e.g. an undecodable nested header) is an internal fault.
class RouteHandler
{
public:
  static constexpr const char *OCTET_STREAM = "application/octet-stream";
  static constexpr const char *JSON_TYPE = "application/json";

  RouteHandler(validator::Connection &connection, std::chrono::seconds timeout)
      : _connection(connection), _timeout(timeout)
  {
  }

  std::chrono::seconds timeout() const { return _timeout; }

  /// \brief POST /batches
  ///
  /// 202 when the validator reported no statuses, 200 with the statuses when
  /// any batch is not yet committed, 201 without data when all committed.
  HttpResponse submitBatches(const HttpRequest &request) const
  {
    if (mediaType(request) != OCTET_STREAM)
    {
      throw ApiError(ErrorCode::WrongBodyType);
    }
    if (request.body.empty())
    {
      throw ApiError(ErrorCode::EmptyProtobuf);
    }
    protocol::BatchList batchList;
    if (!batchList.ParseFromString(request.body))
    {
      throw ApiError(ErrorCode::BadProtobuf);
    }
    if (batchList.batches_size() == 0)
    {
      throw ApiError(ErrorCode::EmptyProtobuf);
    }

    protocol::ClientBatchSubmitRequest query;
    *query.mutable_batches() = batchList.batches();
    setWait(request, query);

    parsers::Json reply = queryValidator(query, {traps::invalidBatch()});

    std::string ids;
    for (const auto &batch : batchList.batches())
    {
      if (!ids.empty())
      {
        ids += ",";
      }
      ids += batch.header_signature();
    }
    std::string link = request.scheme + "://" + request.host() + "/batch_status?id=" + ids;

    std::optional<parsers::Json> data;
    if (reply.contains("batch_statuses") && !reply.at("batch_statuses").empty())
    {
      data = reply.at("batch_statuses");
    }

    int status = 202;
    if (data)
    {
      bool allCommitted = true;
      for (const auto &entry : data->getObject())
      {
        if (!entry.second.isString() || entry.second.getString() != "COMMITTED")
        {
          allCommitted = false;
          break;
        }
      }
      if (allCommitted)
      {
        status = 201;
        data.reset();
        link.replace(link.find("batch_status"), std::string("batch_status").size(), "batches");
      }
      else
      {
        status = 200;
      }
    }

    parsers::Json metadata = parsers::Json::object();
    metadata["link"] = link;
    return Envelope::wrap(data, metadata, status);
  }

  /// \brief GET or POST /batch_status
  ///
  /// GET takes a comma-separated `id` query parameter, POST a JSON array of
  /// id strings. Only GET responses carry head and link metadata.
  HttpResponse listStatuses(const HttpRequest &request) const
  {
    std::vector<std::string> ids;
    const bool isPost = request.method == network::HttpMethod::POST;
    if (isPost)
    {
      ids = statusIdsFromBody(request);
    }
    else
    {
      auto id = request.queryParam("id");
      if (!id)
      {
        throw ApiError(ErrorCode::MissingStatusId);
      }
      ids = split(*id);
    }

    protocol::ClientBatchStatusRequest query;
    for (const auto &id : ids)
    {
      query.add_batch_ids(id);
    }
    setWait(request, query);

    parsers::Json reply = queryValidator(query, {traps::statusesNotReturned()});

    std::optional<parsers::Json> data;
    if (reply.contains("batch_statuses"))
    {
      data = reply.at("batch_statuses");
    }
    std::optional<parsers::Json> metadata;
    if (!isPost)
    {
      metadata = Envelope::computeMetadata(request, reply);
    }
    return Envelope::wrap(data, metadata);
  }

  /// \brief GET /state, optionally at `head` and under an `address` prefix.
  HttpResponse listState(const HttpRequest &request) const
  {
    protocol::ClientStateListRequest query;
    query.set_head_id(request.queryParam("head").value_or(""));
    query.set_address(request.queryParam("address").value_or(""));

    parsers::Json reply = queryValidator(query);
    parsers::Json leaves = reply.contains("leaves") ? reply.at("leaves") : parsers::Json::array();
    return Envelope::wrap(leaves, Envelope::computeMetadata(request, reply));
  }

  /// \brief GET /state/{address}: the base64 value stored at one address.
  HttpResponse fetchState(const HttpRequest &request) const
  {
    protocol::ClientStateGetRequest query;
    query.set_head_id(request.queryParam("head").value_or(""));
    query.set_address(request.pathParam("address"));

    parsers::Json reply = queryValidator(query, {traps::missingLeaf(), traps::badAddress()});
    return Envelope::wrap(member(reply, "value"), Envelope::computeMetadata(request, reply));
  }

  /// \brief GET /blocks, optionally at `head` and filtered by `id`.
  HttpResponse listBlocks(const HttpRequest &request) const
  {
    protocol::ClientBlockListRequest query;
    query.set_head_id(request.queryParam("head").value_or(""));
    for (const auto &id : filterIds(request))
    {
      query.add_block_ids(id);
    }

    parsers::Json reply = queryValidator(query);
    parsers::Json blocks = reply.contains("blocks") ? reply.at("blocks") : parsers::Json::array();
    for (auto &block : blocks.getArray())
    {
      HeaderExpander::expandBlock(block);
    }
    return Envelope::wrap(blocks, Envelope::computeMetadata(request, reply));
  }

  /// \brief GET /blocks/{block_id}
  HttpResponse fetchBlock(const HttpRequest &request) const
  {
    protocol::ClientBlockGetRequest query;
    query.set_block_id(request.pathParam("block_id"));

    parsers::Json reply =
      queryValidator(query, {traps::missingBlock(), traps::invalidBlockId()});
    parsers::Json block = member(reply, "block");
    HeaderExpander::expandBlock(block);
    return Envelope::wrap(block, Envelope::computeMetadata(request, reply));
  }

  /// \brief GET /batches, optionally at `head` and filtered by `id`.
  HttpResponse listBatches(const HttpRequest &request) const
  {
    protocol::ClientBatchListRequest query;
    query.set_head_id(request.queryParam("head").value_or(""));
    for (const auto &id : filterIds(request))
    {
      query.add_batch_ids(id);
    }

    parsers::Json reply = queryValidator(query);
    parsers::Json batches =
      reply.contains("batches") ? reply.at("batches") : parsers::Json::array();
    for (auto &batch : batches.getArray())
    {
      HeaderExpander::expandBatch(batch);
    }
    return Envelope::wrap(batches, Envelope::computeMetadata(request, reply));
  }

  /// \brief GET /batches/{batch_id}
  HttpResponse fetchBatch(const HttpRequest &request) const
  {
    protocol::ClientBatchGetRequest query;
    query.set_batch_id(request.pathParam("batch_id"));

    parsers::Json reply =
      queryValidator(query, {traps::missingBatch(), traps::invalidBatchId()});
    parsers::Json batch = member(reply, "batch");
    HeaderExpander::expandBatch(batch);
    return Envelope::wrap(batch, Envelope::computeMetadata(request, reply));
  }

  /// \brief Backend wait timeout for a `wait` query value: the value itself
  /// when it is an unsigned 32-bit integer, otherwise 95% of the gateway timeout.
  std::uint32_t waitTimeout(const std::string &wait) const
  {
    std::uint32_t seconds = 0;
    const char *end = wait.data() + wait.size();
    auto parsed = std::from_chars(wait.data(), end, seconds);
    if (!wait.empty() && parsed.ec == std::errc() && parsed.ptr == end)
    {
      return seconds;
    }
    return static_cast<std::uint32_t>(_timeout.count() * 95 / 100);
  }

  /// \brief Comma-separated list as sent; an empty string yields one empty id.
  static std::vector<std::string> split(const std::string &value)
  {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (true)
    {
      auto comma = value.find(',', start);
      parts.push_back(value.substr(start, comma - start));
      if (comma == std::string::npos)
      {
        break;
      }
      start = comma + 1;
    }
    return parts;
  }

private:
  /// \brief Send `query`, wait for its paired reply and check the reply
  /// status against the endpoint traps followed by the baseline traps.
  template <typename Query> parsers::Json queryValidator(const Query &query,
                                                         TrapChain chain = {}) const
  {
    using Traits = validator::MessageTraits<Query>;

    validator::Reply reply;
    try
    {
      auto future = _connection.send(Traits::requestType, query.SerializeAsString());
      reply = future.result(_timeout);
    }
    catch (const validator::ReplyTimeout &ex)
    {
      LEDGERGATE_LOG_WARN(ex.what());
      throw ApiError(ErrorCode::ValidatorUnavailable);
    }
    catch (const validator::ConnectionError &ex)
    {
      LEDGERGATE_LOG_WARN("Validator request failed: " << ex.what());
      throw ApiError(ErrorCode::ValidatorUnavailable);
    }

    if (reply.type != Traits::responseType)
    {
      LEDGERGATE_LOG_ERROR("Expected " << protocol::Message::MessageType_Name(Traits::responseType)
                                       << " from validator, got "
                                       << protocol::Message::MessageType_Name(reply.type));
      throw ApiError(ErrorCode::ValidatorResponseInvalid);
    }

    typename Traits::Response response;
    if (!response.ParseFromString(reply.content))
    {
      LEDGERGATE_LOG_ERROR("Cannot decode " << response.GetTypeName() << " from validator");
      throw ApiError(ErrorCode::ValidatorResponseInvalid);
    }

    chain.append(traps::baselineFor(Traits::responseType));
    chain.check(response.status());
    return messageToJson(response);
  }

  template <typename Query> void setWait(const HttpRequest &request, Query &query) const
  {
    std::string wait = request.queryParam("wait").value_or("false");
    if (network::toLower(wait) == "false")
    {
      return;
    }
    query.set_wait_for_commit(true);
    query.set_timeout(waitTimeout(wait));
  }

  static std::vector<std::string> filterIds(const HttpRequest &request)
  {
    auto id = request.queryParam("id");
    if (!id || id->empty())
    {
      return {};
    }
    return split(*id);
  }

  static std::vector<std::string> statusIdsFromBody(const HttpRequest &request)
  {
    if (mediaType(request) != JSON_TYPE)
    {
      throw ApiError(ErrorCode::BadStatusBody);
    }
    auto parsed = parsers::Json::parse(request.body);
    if (!parsed.ok || !parsed.value.isArray())
    {
      throw ApiError(ErrorCode::BadStatusBody);
    }
    if (parsed.value.empty())
    {
      throw ApiError(ErrorCode::MissingStatusId);
    }
    std::vector<std::string> ids;
    for (const auto &id : parsed.value.getArray())
    {
      if (!id.isString())
      {
        throw ApiError(ErrorCode::BadStatusBody);
      }
      ids.push_back(id.getString());
    }
    return ids;
  }

  /// \brief Content-Type without parameters, lower case.
  static std::string mediaType(const HttpRequest &request)
  {
    std::string type = request.getHeader("Content-Type");
    auto semi = type.find(';');
    if (semi != std::string::npos)
    {
      type.erase(semi);
    }
    return network::toLower(network::trim(type));
  }

  /// \throws ApiError ValidatorResponseInvalid if an OK reply lacks `key`.
  static parsers::Json member(const parsers::Json &reply, const std::string &key)
  {
    if (!reply.contains(key))
    {
      LEDGERGATE_LOG_ERROR("Validator reply is missing '" << key << "'");
      throw ApiError(ErrorCode::ValidatorResponseInvalid);
    }
    return reply.at(key);
  }

  validator::Connection &_connection;
  std::chrono::seconds _timeout;
};

} // namespace rest
} // namespace ledgergate
