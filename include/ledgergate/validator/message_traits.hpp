// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of LedgerGate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <stdexcept>
#include <string>

#include "client.pb.h"
#include "validator.pb.h"

#include <ledgergate/validator/pending_requests.hpp>

namespace ledgergate
{
namespace validator
{

/// \brief The reply type the validator answers a given request type with.
/// \throws std::invalid_argument for types that are not client requests.
inline MessageType responseTypeFor(MessageType request)
{
  using M = protocol::Message;
  switch (request)
  {
  case M::CLIENT_BATCH_SUBMIT_REQUEST:
    return M::CLIENT_BATCH_SUBMIT_RESPONSE;
  case M::CLIENT_BATCH_STATUS_REQUEST:
    return M::CLIENT_BATCH_STATUS_RESPONSE;
  case M::CLIENT_STATE_LIST_REQUEST:
    return M::CLIENT_STATE_LIST_RESPONSE;
  case M::CLIENT_STATE_GET_REQUEST:
    return M::CLIENT_STATE_GET_RESPONSE;
  case M::CLIENT_BLOCK_LIST_REQUEST:
    return M::CLIENT_BLOCK_LIST_RESPONSE;
  case M::CLIENT_BLOCK_GET_REQUEST:
    return M::CLIENT_BLOCK_GET_RESPONSE;
  case M::CLIENT_BATCH_LIST_REQUEST:
    return M::CLIENT_BATCH_LIST_RESPONSE;
  case M::CLIENT_BATCH_GET_REQUEST:
    return M::CLIENT_BATCH_GET_RESPONSE;
  default:
    throw std::invalid_argument("Not a client request type: " +
                                protocol::Message::MessageType_Name(request));
  }
}

/// \brief Compile-time pairing of request and response protobuf types.
template <typename Request> struct MessageTraits;

#define LEDGERGATE_MESSAGE_TRAITS(REQ, RESP, TYPE)                                                 \
  template <> struct MessageTraits<protocol::REQ>                                                  \
  {                                                                                                \
    using Response = protocol::RESP;                                                               \
    static constexpr MessageType requestType = protocol::Message::TYPE##_REQUEST;                  \
    static constexpr MessageType responseType = protocol::Message::TYPE##_RESPONSE;                \
  }

LEDGERGATE_MESSAGE_TRAITS(ClientBatchSubmitRequest, ClientBatchSubmitResponse, CLIENT_BATCH_SUBMIT);
LEDGERGATE_MESSAGE_TRAITS(ClientBatchStatusRequest, ClientBatchStatusResponse, CLIENT_BATCH_STATUS);
LEDGERGATE_MESSAGE_TRAITS(ClientStateListRequest, ClientStateListResponse, CLIENT_STATE_LIST);
LEDGERGATE_MESSAGE_TRAITS(ClientStateGetRequest, ClientStateGetResponse, CLIENT_STATE_GET);
LEDGERGATE_MESSAGE_TRAITS(ClientBlockListRequest, ClientBlockListResponse, CLIENT_BLOCK_LIST);
LEDGERGATE_MESSAGE_TRAITS(ClientBlockGetRequest, ClientBlockGetResponse, CLIENT_BLOCK_GET);
LEDGERGATE_MESSAGE_TRAITS(ClientBatchListRequest, ClientBatchListResponse, CLIENT_BATCH_LIST);
LEDGERGATE_MESSAGE_TRAITS(ClientBatchGetRequest, ClientBatchGetResponse, CLIENT_BATCH_GET);

#undef LEDGERGATE_MESSAGE_TRAITS

} // namespace validator
} // namespace ledgergate
