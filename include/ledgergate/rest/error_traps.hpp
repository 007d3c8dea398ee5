// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of LedgerGate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <initializer_list>
#include <map>
#include <vector>

#include "client.pb.h"
#include "validator.pb.h"

#include <ledgergate/rest/api_error.hpp>
#include <ledgergate/validator/pending_requests.hpp>

namespace ledgergate
{
namespace rest
{

/// \brief Raise `error` when a validator reply carries status `trigger`.
struct ErrorTrap
{
  int trigger;
  ErrorCode error;
};

/// \brief Ordered list of traps checked against a reply status. The first
/// trap whose trigger matches wins.
class TrapChain
{
public:
  TrapChain() = default;
  TrapChain(std::initializer_list<ErrorTrap> traps) : _traps(traps) {}

  void add(const ErrorTrap &trap) { _traps.push_back(trap); }

  void append(const std::vector<ErrorTrap> &traps)
  {
    _traps.insert(_traps.end(), traps.begin(), traps.end());
  }

  /// \throws ApiError for the first matching trap.
  void check(int status) const
  {
    for (const auto &trap : _traps)
    {
      if (trap.trigger == status)
      {
        throw ApiError(trap.error);
      }
    }
  }

  const std::vector<ErrorTrap> &traps() const { return _traps; }

private:
  std::vector<ErrorTrap> _traps;
};

namespace traps
{

  inline ErrorTrap invalidBatch()
  {
    return {protocol::ClientBatchSubmitResponse::INVALID_BATCH, ErrorCode::InvalidBatch};
  }

  inline ErrorTrap statusesNotReturned()
  {
    return {protocol::ClientBatchStatusResponse::NO_RESOURCE, ErrorCode::StatusesNotReturned};
  }

  inline ErrorTrap missingLeaf()
  {
    return {protocol::ClientStateGetResponse::NO_RESOURCE, ErrorCode::LeafNotFound};
  }

  inline ErrorTrap badAddress()
  {
    return {protocol::ClientStateGetResponse::INVALID_ADDRESS, ErrorCode::InvalidStateAddress};
  }

  inline ErrorTrap missingBlock()
  {
    return {protocol::ClientBlockGetResponse::NO_RESOURCE, ErrorCode::BlockNotFound};
  }

  inline ErrorTrap invalidBlockId()
  {
    return {protocol::ClientBlockGetResponse::INVALID_ID, ErrorCode::InvalidResourceId};
  }

  inline ErrorTrap missingBatch()
  {
    return {protocol::ClientBatchGetResponse::NO_RESOURCE, ErrorCode::BatchNotFound};
  }

  inline ErrorTrap invalidBatchId()
  {
    return {protocol::ClientBatchGetResponse::INVALID_ID, ErrorCode::InvalidResourceId};
  }

  /// \brief Traps every reply of `replyType` gets after its endpoint traps:
  /// INTERNAL_ERROR, NOT_READY and NO_ROOT, for the types that declare them.
  inline const std::vector<ErrorTrap> &baselineFor(validator::MessageType replyType)
  {
    using M = protocol::Message;
    static const std::map<validator::MessageType, std::vector<ErrorTrap>> kBaseline = {
      {M::CLIENT_BATCH_SUBMIT_RESPONSE,
       {{protocol::ClientBatchSubmitResponse::INTERNAL_ERROR, ErrorCode::UnknownValidatorError}}},
      {M::CLIENT_BATCH_STATUS_RESPONSE,
       {{protocol::ClientBatchStatusResponse::INTERNAL_ERROR, ErrorCode::UnknownValidatorError}}},
      {M::CLIENT_STATE_LIST_RESPONSE,
       {{protocol::ClientStateListResponse::INTERNAL_ERROR, ErrorCode::UnknownValidatorError},
        {protocol::ClientStateListResponse::NOT_READY, ErrorCode::ValidatorNotReady},
        {protocol::ClientStateListResponse::NO_ROOT, ErrorCode::HeadNotFound}}},
      {M::CLIENT_STATE_GET_RESPONSE,
       {{protocol::ClientStateGetResponse::INTERNAL_ERROR, ErrorCode::UnknownValidatorError},
        {protocol::ClientStateGetResponse::NOT_READY, ErrorCode::ValidatorNotReady},
        {protocol::ClientStateGetResponse::NO_ROOT, ErrorCode::HeadNotFound}}},
      {M::CLIENT_BLOCK_LIST_RESPONSE,
       {{protocol::ClientBlockListResponse::INTERNAL_ERROR, ErrorCode::UnknownValidatorError},
        {protocol::ClientBlockListResponse::NOT_READY, ErrorCode::ValidatorNotReady},
        {protocol::ClientBlockListResponse::NO_ROOT, ErrorCode::HeadNotFound}}},
      {M::CLIENT_BLOCK_GET_RESPONSE,
       {{protocol::ClientBlockGetResponse::INTERNAL_ERROR, ErrorCode::UnknownValidatorError}}},
      {M::CLIENT_BATCH_LIST_RESPONSE,
       {{protocol::ClientBatchListResponse::INTERNAL_ERROR, ErrorCode::UnknownValidatorError},
        {protocol::ClientBatchListResponse::NOT_READY, ErrorCode::ValidatorNotReady},
        {protocol::ClientBatchListResponse::NO_ROOT, ErrorCode::HeadNotFound}}},
      {M::CLIENT_BATCH_GET_RESPONSE,
       {{protocol::ClientBatchGetResponse::INTERNAL_ERROR, ErrorCode::UnknownValidatorError}}},
    };
    static const std::vector<ErrorTrap> kNone;
    auto it = kBaseline.find(replyType);
    return it != kBaseline.end() ? it->second : kNone;
  }

} // namespace traps

} // namespace rest
} // namespace ledgergate
