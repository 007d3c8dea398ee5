// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// Tests for API errors and the reply status trap chain

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <ledgergate/rest/error_traps.hpp>

using namespace ledgergate::rest;
namespace protocol = ledgergate::protocol;

namespace
{

ErrorCode trapped(const TrapChain &chain, int status)
{
  try
  {
    chain.check(status);
  }
  catch (const ApiError &ex)
  {
    return ex.code();
  }
  FAIL("status " << status << " was not trapped");
  return ErrorCode::UnknownValidatorError;
}

} // namespace

TEST_CASE("API errors carry their status, code and title", "[errors]")
{
  ApiError notFound(ErrorCode::BlockNotFound);
  REQUIRE(notFound.status() == 404);
  REQUIRE(notFound.apiCode() == 70);
  REQUIRE(std::string(notFound.title()) == "Block Not Found");

  auto body = notFound.toJson();
  REQUIRE(body.size() == 1);
  REQUIRE(body.at("error").at("code").getInt() == 70);
  REQUIRE(body.at("error").at("title").getString() == "Block Not Found");
  REQUIRE(body.at("error").at("message").getString() == notFound.what());

  REQUIRE(ApiError(ErrorCode::ValidatorUnavailable).status() == 503);
  REQUIRE(ApiError(ErrorCode::ValidatorResponseInvalid).status() == 500);
  REQUIRE(ApiError(ErrorCode::WrongBodyType).apiCode() == 42);
  REQUIRE(ApiError(ErrorCode::MissingStatusId).apiCode() == 66);
  REQUIRE(ApiError(ErrorCode::StatusesNotReturned).status() == 500);
}

TEST_CASE("The first matching trap wins", "[errors][traps]")
{
  TrapChain chain{{5, ErrorCode::BlockNotFound}, {5, ErrorCode::BatchNotFound}};
  chain.add({8, ErrorCode::InvalidResourceId});
  REQUIRE(trapped(chain, 5) == ErrorCode::BlockNotFound);
  REQUIRE(trapped(chain, 8) == ErrorCode::InvalidResourceId);
  REQUIRE_NOTHROW(chain.check(1));
  REQUIRE_NOTHROW(TrapChain().check(2));
}

TEST_CASE("Endpoint traps are checked before the baseline", "[errors][traps]")
{
  TrapChain chain{traps::missingLeaf(), traps::badAddress()};
  chain.append(traps::baselineFor(protocol::Message::CLIENT_STATE_GET_RESPONSE));
  REQUIRE(chain.traps().size() == 5);

  REQUIRE(trapped(chain, protocol::ClientStateGetResponse::NO_RESOURCE) ==
          ErrorCode::LeafNotFound);
  REQUIRE(trapped(chain, protocol::ClientStateGetResponse::INVALID_ADDRESS) ==
          ErrorCode::InvalidStateAddress);
  REQUIRE(trapped(chain, protocol::ClientStateGetResponse::NOT_READY) ==
          ErrorCode::ValidatorNotReady);
  REQUIRE(trapped(chain, protocol::ClientStateGetResponse::NO_ROOT) == ErrorCode::HeadNotFound);
  REQUIRE(trapped(chain, protocol::ClientStateGetResponse::INTERNAL_ERROR) ==
          ErrorCode::UnknownValidatorError);
  REQUIRE_NOTHROW(chain.check(protocol::ClientStateGetResponse::OK));
}

TEST_CASE("Baseline traps follow each reply's status set", "[errors][traps]")
{
  using M = protocol::Message;
  REQUIRE(traps::baselineFor(M::CLIENT_BLOCK_LIST_RESPONSE).size() == 3);
  REQUIRE(traps::baselineFor(M::CLIENT_BATCH_LIST_RESPONSE).size() == 3);
  REQUIRE(traps::baselineFor(M::CLIENT_STATE_LIST_RESPONSE).size() == 3);

  // Replies without NOT_READY or NO_ROOT only trap INTERNAL_ERROR.
  for (auto type : {M::CLIENT_BATCH_SUBMIT_RESPONSE, M::CLIENT_BATCH_STATUS_RESPONSE,
                    M::CLIENT_BLOCK_GET_RESPONSE, M::CLIENT_BATCH_GET_RESPONSE})
  {
    const auto &baseline = traps::baselineFor(type);
    REQUIRE(baseline.size() == 1);
    REQUIRE(baseline[0].trigger == 2);
    REQUIRE(baseline[0].error == ErrorCode::UnknownValidatorError);
  }

  TrapChain batchGet{traps::missingBatch(), traps::invalidBatchId()};
  batchGet.append(traps::baselineFor(M::CLIENT_BATCH_GET_RESPONSE));
  REQUIRE(trapped(batchGet, protocol::ClientBatchGetResponse::NO_RESOURCE) ==
          ErrorCode::BatchNotFound);
  REQUIRE(trapped(batchGet, protocol::ClientBatchGetResponse::INVALID_ID) ==
          ErrorCode::InvalidResourceId);
  REQUIRE_NOTHROW(batchGet.check(3));

  REQUIRE(traps::baselineFor(M::CLIENT_BLOCK_GET_REQUEST).empty());
}
