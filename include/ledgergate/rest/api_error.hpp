// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of LedgerGate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <stdexcept>
#include <string>

#include <ledgergate/parsers/json.hpp>

namespace ledgergate
{
namespace rest
{

enum class ErrorCode
{
  UnknownValidatorError,
  ValidatorNotReady,
  ValidatorUnavailable,
  ValidatorResponseInvalid,
  InvalidBatch,
  EmptyProtobuf,
  BadProtobuf,
  WrongBodyType,
  BadStatusBody,
  HeadNotFound,
  InvalidResourceId,
  InvalidStateAddress,
  MissingStatusId,
  StatusesNotReturned,
  BlockNotFound,
  BatchNotFound,
  LeafNotFound
};

/// \brief Static description of a client-visible error.
struct ErrorInfo
{
  int apiCode;
  int httpStatus;
  const char *title;
  const char *message;
};

inline const ErrorInfo &errorInfo(ErrorCode code)
{
  static const ErrorInfo kUnknown{
    10, 500, "Unknown Validator Error",
    "An unknown error occurred with the validator while processing your request"};
  static const ErrorInfo kNotReady{
    15, 503, "Validator Not Ready",
    "The validator has no genesis block, and is not yet ready to be queried"};
  static const ErrorInfo kUnavailable{
    17, 503, "Validator Unavailable",
    "The validator could not be reached or did not respond in time"};
  static const ErrorInfo kResponseInvalid{
    20, 500, "Invalid Validator Response",
    "The response from the validator could not be decoded"};
  static const ErrorInfo kInvalidBatch{
    30, 400, "Submitted Batches Invalid",
    "The submitted BatchList is invalid. It was poorly formed or has an invalid signature"};
  static const ErrorInfo kEmptyProtobuf{
    34, 400, "No Batches Submitted",
    "The protobuf BatchList you submitted was empty and contained no Batches"};
  static const ErrorInfo kBadProtobuf{
    35, 400, "Protobuf Not Decodable",
    "The protobuf BatchList you submitted was malformed and could not be read"};
  static const ErrorInfo kWrongBodyType{
    42, 400, "Wrong Content Type",
    "Batches must be submitted as a BatchList protobuf binary, with a 'Content-Type' header "
    "of 'application/octet-stream'"};
  static const ErrorInfo kBadStatusBody{
    43, 400, "Bad Status Request",
    "Requests for batch statuses sent as a POST must have a JSON formatted body with an "
    "array of at least one id string"};
  static const ErrorInfo kHeadNotFound{
    50, 404, "Head Not Found",
    "There is no block with the id specified in the 'head' query parameter"};
  static const ErrorInfo kInvalidResourceId{
    60, 400, "Invalid Resource Id",
    "Blockchain items are identified by 128 character hex-strings. A submitted block, batch "
    "or transaction id was invalid"};
  static const ErrorInfo kInvalidStateAddress{
    62, 400, "Invalid State Address",
    "The state address submitted was invalid. State addresses must be 70 character "
    "hex-strings"};
  static const ErrorInfo kMissingStatusId{
    66, 400, "Id Query Invalid or Missing",
    "Requests for batch statuses sent as a GET request must have an 'id' query parameter "
    "with a comma-separated list of at least one batch id"};
  static const ErrorInfo kStatusesNotReturned{
    67, 500, "Unable to Fetch Statuses",
    "An unknown error occurred while attempting to fetch batch statuses, and nothing was "
    "returned"};
  static const ErrorInfo kBlockNotFound{
    70, 404, "Block Not Found", "There is no block with the id specified in the blockchain"};
  static const ErrorInfo kBatchNotFound{
    71, 404, "Batch Not Found", "There is no batch with the id specified in the blockchain"};
  static const ErrorInfo kLeafNotFound{
    75, 404, "Leaf Not Found",
    "There is no leaf at the address specified in the state tree"};

  switch (code)
  {
  case ErrorCode::UnknownValidatorError:
    return kUnknown;
  case ErrorCode::ValidatorNotReady:
    return kNotReady;
  case ErrorCode::ValidatorUnavailable:
    return kUnavailable;
  case ErrorCode::ValidatorResponseInvalid:
    return kResponseInvalid;
  case ErrorCode::InvalidBatch:
    return kInvalidBatch;
  case ErrorCode::EmptyProtobuf:
    return kEmptyProtobuf;
  case ErrorCode::BadProtobuf:
    return kBadProtobuf;
  case ErrorCode::WrongBodyType:
    return kWrongBodyType;
  case ErrorCode::BadStatusBody:
    return kBadStatusBody;
  case ErrorCode::HeadNotFound:
    return kHeadNotFound;
  case ErrorCode::InvalidResourceId:
    return kInvalidResourceId;
  case ErrorCode::InvalidStateAddress:
    return kInvalidStateAddress;
  case ErrorCode::MissingStatusId:
    return kMissingStatusId;
  case ErrorCode::StatusesNotReturned:
    return kStatusesNotReturned;
  case ErrorCode::BlockNotFound:
    return kBlockNotFound;
  case ErrorCode::BatchNotFound:
    return kBatchNotFound;
  case ErrorCode::LeafNotFound:
    return kLeafNotFound;
  }
  return kUnknown;
}

/// \brief A failure that is reported to the HTTP client with its own status
/// and a structured JSON error body.
class ApiError : public std::runtime_error
{
public:
  explicit ApiError(ErrorCode code) : std::runtime_error(errorInfo(code).message), _code(code) {}

  ErrorCode code() const { return _code; }
  int status() const { return errorInfo(_code).httpStatus; }
  int apiCode() const { return errorInfo(_code).apiCode; }
  const char *title() const { return errorInfo(_code).title; }

  /// \brief `{"error": {"code", "message", "title"}}`
  parsers::Json toJson() const
  {
    parsers::Json error = parsers::Json::object();
    error["code"] = apiCode();
    error["message"] = std::string(what());
    error["title"] = std::string(title());
    parsers::Json body = parsers::Json::object();
    body["error"] = std::move(error);
    return body;
  }

private:
  ErrorCode _code;
};

} // namespace rest
} // namespace ledgergate
