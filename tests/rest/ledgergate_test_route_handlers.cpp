// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// Tests for the REST route handlers against a scripted validator connection

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <ledgergate/rest/route_handlers.hpp>

using namespace ledgergate::rest;
using ledgergate::parsers::Json;
using ledgergate::validator::MessageType;
using ledgergate::validator::Reply;
using ledgergate::validator::ReplyFuture;
using namespace std::chrono_literals;
namespace protocol = ledgergate::protocol;
namespace validator = ledgergate::validator;

namespace
{

/// \brief Connection that answers every send with a scripted reply.
class ScriptedConnection : public validator::Connection
{
public:
  enum class Mode
  {
    Answer,
    Fail,
    Silent
  };

  ReplyFuture send(MessageType type, const std::string &content) override
  {
    sentType = type;
    sentContent = content;
    ++sends;
    if (mode == Mode::Fail)
    {
      return ReplyFuture::failed("validator is down");
    }

    auto table = std::make_shared<validator::PendingRequestTable>();
    std::string id = "scripted-" + std::to_string(sends);
    auto slot = table->add(id);
    if (mode == Mode::Answer)
    {
      Reply reply = next;
      if (reply.type == protocol::Message::DEFAULT)
      {
        reply.type = validator::responseTypeFor(type);
      }
      table->resolve(id, std::move(reply));
    }
    return ReplyFuture(id, slot, table);
  }

  /// \brief Answer the next send with `response`, typed to match the request.
  template <typename Response> void answer(const Response &response)
  {
    mode = Mode::Answer;
    next = Reply{};
    next.content = response.SerializeAsString();
  }

  template <typename Query> Query sent() const
  {
    Query query;
    REQUIRE(query.ParseFromString(sentContent));
    return query;
  }

  Mode mode = Mode::Answer;
  Reply next;
  MessageType sentType = protocol::Message::DEFAULT;
  std::string sentContent;
  int sends = 0;
};

HttpRequest makeRequest(const std::string &method, const std::string &target,
                        const std::string &contentType = "", const std::string &body = "")
{
  std::string head = method + " " + target + " HTTP/1.1\r\nHost: localhost:8008\r\n";
  if (!contentType.empty())
  {
    head += "Content-Type: " + contentType + "\r\n";
  }
  auto request = HttpRequest::parseHead(head);
  request.body = body;
  return request;
}

template <typename Fn> ErrorCode errorOf(Fn &&fn)
{
  try
  {
    fn();
  }
  catch (const ApiError &ex)
  {
    return ex.code();
  }
  FAIL("no ApiError was thrown");
  return ErrorCode::UnknownValidatorError;
}

protocol::Batch makeBatch(const std::string &id)
{
  protocol::BatchHeader header;
  header.set_signer_pubkey("03ab");
  protocol::Batch batch;
  batch.set_header(header.SerializeAsString());
  batch.set_header_signature(id);
  return batch;
}

protocol::Block makeBlock(const std::string &id, std::uint64_t num)
{
  protocol::BlockHeader header;
  header.set_block_num(num);
  protocol::Block block;
  block.set_header(header.SerializeAsString());
  block.set_header_signature(id);
  *block.add_batches() = makeBatch("batch-of-" + id);
  return block;
}

std::string batchList(std::initializer_list<std::string> ids)
{
  protocol::BatchList list;
  for (const auto &id : ids)
  {
    *list.add_batches() = makeBatch(id);
  }
  return list.SerializeAsString();
}

} // namespace

// ══════════════════════════════════════════════════════════════════════════
// POST /batches
// ══════════════════════════════════════════════════════════════════════════

TEST_CASE("Submitted batches must be a non-empty BatchList", "[routes][submit]")
{
  ledgergate::test::initializeTestLogging();
  ScriptedConnection connection;
  RouteHandler handler(connection, 300s);

  auto submit = [&handler](const std::string &contentType, const std::string &body)
  { handler.submitBatches(makeRequest("POST", "/batches", contentType, body)); };

  REQUIRE(errorOf([&] { submit("application/json", batchList({"b1"})); }) ==
          ErrorCode::WrongBodyType);
  REQUIRE(errorOf([&] { submit("", batchList({"b1"})); }) == ErrorCode::WrongBodyType);
  REQUIRE(errorOf([&] { submit("application/octet-stream", ""); }) == ErrorCode::EmptyProtobuf);
  REQUIRE(errorOf([&] { submit("application/octet-stream", "\xff"); }) == ErrorCode::BadProtobuf);
  // Decodes, but holds only an unknown field and no batches.
  REQUIRE(errorOf([&] { submit("application/octet-stream", std::string("\x10\x01", 2)); }) ==
          ErrorCode::EmptyProtobuf);
  REQUIRE(connection.sends == 0);
}

TEST_CASE("A submit without statuses is accepted", "[routes][submit]")
{
  ledgergate::test::initializeTestLogging();
  ScriptedConnection connection;
  RouteHandler handler(connection, 300s);

  protocol::ClientBatchSubmitResponse reply;
  reply.set_status(protocol::ClientBatchSubmitResponse::OK);
  connection.answer(reply);

  auto response = handler.submitBatches(makeRequest(
    "POST", "/batches", "Application/Octet-Stream; charset=binary", batchList({"b1", "b2"})));
  REQUIRE(response.status == 202);
  auto body = Json::parseOrThrow(response.body);
  REQUIRE_FALSE(body.contains("data"));
  REQUIRE(body.at("link").getString() == "http://localhost:8008/batch_status?id=b1,b2");

  REQUIRE(connection.sentType == protocol::Message::CLIENT_BATCH_SUBMIT_REQUEST);
  auto query = connection.sent<protocol::ClientBatchSubmitRequest>();
  REQUIRE(query.batches_size() == 2);
  REQUIRE(query.batches(1).header_signature() == "b2");
  REQUIRE_FALSE(query.wait_for_commit());
}

TEST_CASE("A waited submit reports pending statuses", "[routes][submit]")
{
  ledgergate::test::initializeTestLogging();
  ScriptedConnection connection;
  RouteHandler handler(connection, 300s);

  protocol::ClientBatchSubmitResponse reply;
  reply.set_status(protocol::ClientBatchSubmitResponse::OK);
  (*reply.mutable_batch_statuses())["b1"] = protocol::COMMITTED;
  (*reply.mutable_batch_statuses())["b2"] = protocol::PENDING;
  connection.answer(reply);

  auto response = handler.submitBatches(
    makeRequest("POST", "/batches?wait=10", "application/octet-stream", batchList({"b1", "b2"})));
  REQUIRE(response.status == 200);
  auto body = Json::parseOrThrow(response.body);
  REQUIRE(body.at("data").at("b1").getString() == "COMMITTED");
  REQUIRE(body.at("data").at("b2").getString() == "PENDING");
  REQUIRE(body.at("link").getString() == "http://localhost:8008/batch_status?id=b1,b2");

  auto query = connection.sent<protocol::ClientBatchSubmitRequest>();
  REQUIRE(query.wait_for_commit());
  REQUIRE(query.timeout() == 10);
}

TEST_CASE("A fully committed submit is created", "[routes][submit]")
{
  ledgergate::test::initializeTestLogging();
  ScriptedConnection connection;
  RouteHandler handler(connection, 300s);

  protocol::ClientBatchSubmitResponse reply;
  reply.set_status(protocol::ClientBatchSubmitResponse::OK);
  (*reply.mutable_batch_statuses())["b1"] = protocol::COMMITTED;
  connection.answer(reply);

  auto response = handler.submitBatches(
    makeRequest("POST", "/batches?wait", "application/octet-stream", batchList({"b1"})));
  REQUIRE(response.status == 201);
  auto body = Json::parseOrThrow(response.body);
  REQUIRE_FALSE(body.contains("data"));
  REQUIRE(body.at("link").getString() == "http://localhost:8008/batches?id=b1");
  REQUIRE(connection.sent<protocol::ClientBatchSubmitRequest>().timeout() == 285);
}

TEST_CASE("An invalid batch is reported to the client", "[routes][submit]")
{
  ledgergate::test::initializeTestLogging();
  ScriptedConnection connection;
  RouteHandler handler(connection, 300s);

  protocol::ClientBatchSubmitResponse reply;
  reply.set_status(protocol::ClientBatchSubmitResponse::INVALID_BATCH);
  connection.answer(reply);
  auto submit = [&handler]()
  {
    handler.submitBatches(
      makeRequest("POST", "/batches", "application/octet-stream", batchList({"b1"})));
  };
  REQUIRE(errorOf(submit) == ErrorCode::InvalidBatch);

  reply.set_status(protocol::ClientBatchSubmitResponse::INTERNAL_ERROR);
  connection.answer(reply);
  REQUIRE(errorOf(submit) == ErrorCode::UnknownValidatorError);
}

// ══════════════════════════════════════════════════════════════════════════
// /batch_status
// ══════════════════════════════════════════════════════════════════════════

TEST_CASE("Batch statuses by query", "[routes][status]")
{
  ledgergate::test::initializeTestLogging();
  ScriptedConnection connection;
  RouteHandler handler(connection, 300s);

  REQUIRE(errorOf([&] { handler.listStatuses(makeRequest("GET", "/batch_status")); }) ==
          ErrorCode::MissingStatusId);

  protocol::ClientBatchStatusResponse reply;
  reply.set_status(protocol::ClientBatchStatusResponse::OK);
  (*reply.mutable_batch_statuses())["b1"] = protocol::UNKNOWN;
  connection.answer(reply);

  auto response = handler.listStatuses(makeRequest("GET", "/batch_status?id=b1,b2&wait=3"));
  REQUIRE(response.status == 200);
  auto body = Json::parseOrThrow(response.body);
  REQUIRE(body.at("data").at("b1").getString() == "UNKNOWN");
  REQUIRE(body.at("link").getString() == "http://localhost:8008/batch_status?id=b1,b2&wait=3");

  auto query = connection.sent<protocol::ClientBatchStatusRequest>();
  REQUIRE(query.batch_ids_size() == 2);
  REQUIRE(query.batch_ids(1) == "b2");
  REQUIRE(query.timeout() == 3);

  reply.set_status(protocol::ClientBatchStatusResponse::NO_RESOURCE);
  connection.answer(reply);
  REQUIRE(errorOf([&] { handler.listStatuses(makeRequest("GET", "/batch_status?id=b9")); }) ==
          ErrorCode::StatusesNotReturned);
}

TEST_CASE("Batch statuses by JSON body", "[routes][status]")
{
  ledgergate::test::initializeTestLogging();
  ScriptedConnection connection;
  RouteHandler handler(connection, 300s);

  auto post = [](const std::string &contentType, const std::string &body)
  { return makeRequest("POST", "/batch_status", contentType, body); };

  REQUIRE(errorOf([&] { handler.listStatuses(post("text/plain", R"(["b1"])")); }) ==
          ErrorCode::BadStatusBody);
  REQUIRE(errorOf([&] { handler.listStatuses(post("application/json", "[\"b1\"")); }) ==
          ErrorCode::BadStatusBody);
  REQUIRE(errorOf([&] { handler.listStatuses(post("application/json", R"({"ids": ["b1"]})")); }) ==
          ErrorCode::BadStatusBody);
  REQUIRE(errorOf([&] { handler.listStatuses(post("application/json", R"(["b1", 2])")); }) ==
          ErrorCode::BadStatusBody);
  REQUIRE(errorOf([&] { handler.listStatuses(post("application/json", "[]")); }) ==
          ErrorCode::MissingStatusId);
  REQUIRE(connection.sends == 0);

  protocol::ClientBatchStatusResponse reply;
  reply.set_status(protocol::ClientBatchStatusResponse::OK);
  (*reply.mutable_batch_statuses())["b1"] = protocol::PENDING;
  connection.answer(reply);

  auto response = handler.listStatuses(post("application/json; charset=utf-8", R"(["b1", "b2"])"));
  auto body = Json::parseOrThrow(response.body);
  REQUIRE(body.size() == 1);
  REQUIRE(body.at("data").at("b1").getString() == "PENDING");
  REQUIRE(connection.sent<protocol::ClientBatchStatusRequest>().batch_ids_size() == 2);
}

// ══════════════════════════════════════════════════════════════════════════
// /state
// ══════════════════════════════════════════════════════════════════════════

TEST_CASE("State listing forwards head and address", "[routes][state]")
{
  ledgergate::test::initializeTestLogging();
  ScriptedConnection connection;
  RouteHandler handler(connection, 300s);

  protocol::ClientStateListResponse reply;
  reply.set_status(protocol::ClientStateListResponse::OK);
  reply.set_head_id("h2");
  auto *leaf = reply.add_leaves();
  leaf->set_address("1cf126aa");
  leaf->set_data("\x01\x02\x03");
  connection.answer(reply);

  auto response = handler.listState(makeRequest("GET", "/state?address=1cf1&head=h1"));
  auto body = Json::parseOrThrow(response.body);
  REQUIRE(body.at("head").getString() == "h2");
  REQUIRE(body.at("link").getString() == "http://localhost:8008/state?head=h2&address=1cf1");
  REQUIRE(body.at("data").size() == 1);
  REQUIRE(body.at("data").at(0).at("address").getString() == "1cf126aa");
  REQUIRE(body.at("data").at(0).at("data").getString() == "AQID");

  auto query = connection.sent<protocol::ClientStateListRequest>();
  REQUIRE(query.head_id() == "h1");
  REQUIRE(query.address() == "1cf1");

  reply.set_status(protocol::ClientStateListResponse::NOT_READY);
  connection.answer(reply);
  REQUIRE(errorOf([&] { handler.listState(makeRequest("GET", "/state")); }) ==
          ErrorCode::ValidatorNotReady);
}

TEST_CASE("A single state value is fetched by address", "[routes][state]")
{
  ledgergate::test::initializeTestLogging();
  ScriptedConnection connection;
  RouteHandler handler(connection, 300s);

  protocol::ClientStateGetResponse reply;
  reply.set_status(protocol::ClientStateGetResponse::OK);
  reply.set_value("foo");
  reply.set_head_id("h1");
  connection.answer(reply);

  auto request = makeRequest("GET", "/state/1cf126");
  request.pathParams["address"] = "1cf126";
  auto body = Json::parseOrThrow(handler.fetchState(request).body);
  REQUIRE(body.at("data").getString() == "Zm9v");
  REQUIRE(body.at("head").getString() == "h1");
  REQUIRE(connection.sent<protocol::ClientStateGetRequest>().address() == "1cf126");

  reply.set_status(protocol::ClientStateGetResponse::NO_RESOURCE);
  connection.answer(reply);
  REQUIRE(errorOf([&] { handler.fetchState(request); }) == ErrorCode::LeafNotFound);

  reply.set_status(protocol::ClientStateGetResponse::INVALID_ADDRESS);
  connection.answer(reply);
  REQUIRE(errorOf([&] { handler.fetchState(request); }) == ErrorCode::InvalidStateAddress);

  reply.set_status(protocol::ClientStateGetResponse::NO_ROOT);
  connection.answer(reply);
  REQUIRE(errorOf([&] { handler.fetchState(request); }) == ErrorCode::HeadNotFound);
}

TEST_CASE("Large state replies are passed through whole", "[routes][state]")
{
  ledgergate::test::initializeTestLogging();
  ScriptedConnection connection;
  RouteHandler handler(connection, 300s);

  ledgergate::parsers::ParseLimits unbounded;
  unbounded.arrayItemsMax = SIZE_MAX;
  unbounded.membersMax = SIZE_MAX;
  unbounded.stringLengthMax = SIZE_MAX;

  protocol::ClientStateListResponse list;
  list.set_status(protocol::ClientStateListResponse::OK);
  for (int i = 0; i < 100001; ++i)
  {
    list.add_leaves()->set_address(std::to_string(i));
  }
  connection.answer(list);
  auto listed = Json::parseOrThrow(handler.listState(makeRequest("GET", "/state")).body, unbounded);
  REQUIRE(listed.at("data").size() == 100001);
  REQUIRE(listed.at("data").at(100000).at("address").getString() == "100000");

  protocol::ClientStateGetResponse value;
  value.set_status(protocol::ClientStateGetResponse::OK);
  value.set_value(std::string(800000, 'v'));
  connection.answer(value);
  auto request = makeRequest("GET", "/state/1cf126");
  request.pathParams["address"] = "1cf126";
  auto fetched = Json::parseOrThrow(handler.fetchState(request).body, unbounded);
  REQUIRE(fetched.at("data").getString().size() == 1066668);
}

// ══════════════════════════════════════════════════════════════════════════
// /blocks and /batches
// ══════════════════════════════════════════════════════════════════════════

TEST_CASE("Block listings expand headers and honour id filters", "[routes][blocks]")
{
  ledgergate::test::initializeTestLogging();
  ScriptedConnection connection;
  RouteHandler handler(connection, 300s);

  protocol::ClientBlockListResponse reply;
  reply.set_status(protocol::ClientBlockListResponse::OK);
  reply.set_head_id("blk2");
  *reply.add_blocks() = makeBlock("blk2", 2);
  *reply.add_blocks() = makeBlock("blk1", 1);
  connection.answer(reply);

  auto body = Json::parseOrThrow(handler.listBlocks(makeRequest("GET", "/blocks?id=blk1,blk2")).body);
  REQUIRE(body.at("head").getString() == "blk2");
  REQUIRE(body.at("data").size() == 2);
  REQUIRE(body.at("data").at(0).at("header").at("block_num").getString() == "2");
  REQUIRE(body.at("data").at(1).at("batches").at(0).at("header").at("signer_pubkey").getString() ==
          "03ab");
  auto query = connection.sent<protocol::ClientBlockListRequest>();
  REQUIRE(query.block_ids_size() == 2);
  REQUIRE(query.head_id().empty());

  connection.answer(reply);
  handler.listBlocks(makeRequest("GET", "/blocks?id="));
  REQUIRE(connection.sent<protocol::ClientBlockListRequest>().block_ids_size() == 0);

  reply.set_status(protocol::ClientBlockListResponse::NO_ROOT);
  connection.answer(reply);
  REQUIRE(errorOf([&] { handler.listBlocks(makeRequest("GET", "/blocks?head=nope")); }) ==
          ErrorCode::HeadNotFound);
}

TEST_CASE("A single block is fetched by id", "[routes][blocks]")
{
  ledgergate::test::initializeTestLogging();
  ScriptedConnection connection;
  RouteHandler handler(connection, 300s);

  auto request = makeRequest("GET", "/blocks/blk1");
  request.pathParams["block_id"] = "blk1";

  protocol::ClientBlockGetResponse reply;
  reply.set_status(protocol::ClientBlockGetResponse::OK);
  *reply.mutable_block() = makeBlock("blk1", 1);
  connection.answer(reply);

  auto body = Json::parseOrThrow(handler.fetchBlock(request).body);
  REQUIRE(body.at("data").at("header_signature").getString() == "blk1");
  REQUIRE(body.at("data").at("header").at("block_num").getString() == "1");
  REQUIRE(body.at("link").getString() == "http://localhost:8008/blocks/blk1");
  REQUIRE_FALSE(body.contains("head"));
  REQUIRE(connection.sent<protocol::ClientBlockGetRequest>().block_id() == "blk1");

  reply.set_status(protocol::ClientBlockGetResponse::NO_RESOURCE);
  connection.answer(reply);
  REQUIRE(errorOf([&] { handler.fetchBlock(request); }) == ErrorCode::BlockNotFound);

  reply.set_status(protocol::ClientBlockGetResponse::INVALID_ID);
  connection.answer(reply);
  REQUIRE(errorOf([&] { handler.fetchBlock(request); }) == ErrorCode::InvalidResourceId);

  protocol::ClientBlockGetResponse empty;
  empty.set_status(protocol::ClientBlockGetResponse::OK);
  connection.answer(empty);
  REQUIRE(errorOf([&] { handler.fetchBlock(request); }) == ErrorCode::ValidatorResponseInvalid);
}

TEST_CASE("Batch listings and lookups", "[routes][batches]")
{
  ledgergate::test::initializeTestLogging();
  ScriptedConnection connection;
  RouteHandler handler(connection, 300s);

  protocol::ClientBatchListResponse list;
  list.set_status(protocol::ClientBatchListResponse::OK);
  list.set_head_id("blk9");
  *list.add_batches() = makeBatch("b1");
  connection.answer(list);

  auto listed = Json::parseOrThrow(handler.listBatches(makeRequest("GET", "/batches?head=blk9&id=b1")).body);
  REQUIRE(listed.at("data").at(0).at("header").at("signer_pubkey").getString() == "03ab");
  REQUIRE(listed.at("link").getString() == "http://localhost:8008/batches?head=blk9&id=b1");
  auto listQuery = connection.sent<protocol::ClientBatchListRequest>();
  REQUIRE(listQuery.head_id() == "blk9");
  REQUIRE(listQuery.batch_ids(0) == "b1");

  auto request = makeRequest("GET", "/batches/b1");
  request.pathParams["batch_id"] = "b1";
  protocol::ClientBatchGetResponse get;
  get.set_status(protocol::ClientBatchGetResponse::OK);
  *get.mutable_batch() = makeBatch("b1");
  connection.answer(get);
  auto fetched = Json::parseOrThrow(handler.fetchBatch(request).body);
  REQUIRE(fetched.at("data").at("header_signature").getString() == "b1");
  REQUIRE(connection.sent<protocol::ClientBatchGetRequest>().batch_id() == "b1");

  get.set_status(protocol::ClientBatchGetResponse::NO_RESOURCE);
  connection.answer(get);
  REQUIRE(errorOf([&] { handler.fetchBatch(request); }) == ErrorCode::BatchNotFound);

  get.set_status(protocol::ClientBatchGetResponse::INVALID_ID);
  connection.answer(get);
  REQUIRE(errorOf([&] { handler.fetchBatch(request); }) == ErrorCode::InvalidResourceId);
}

// ══════════════════════════════════════════════════════════════════════════
// Validator failures
// ══════════════════════════════════════════════════════════════════════════

TEST_CASE("Validator faults map to gateway errors", "[routes][validator]")
{
  ledgergate::test::initializeTestLogging();
  ScriptedConnection connection;
  RouteHandler handler(connection, 1s);
  auto request = makeRequest("GET", "/blocks");

  SECTION("unreachable validator")
  {
    connection.mode = ScriptedConnection::Mode::Fail;
    REQUIRE(errorOf([&] { handler.listBlocks(request); }) == ErrorCode::ValidatorUnavailable);
    REQUIRE(ApiError(ErrorCode::ValidatorUnavailable).status() == 503);
  }

  SECTION("no reply in time")
  {
    connection.mode = ScriptedConnection::Mode::Silent;
    REQUIRE(errorOf([&] { handler.listBlocks(request); }) == ErrorCode::ValidatorUnavailable);
  }

  SECTION("reply of the wrong type")
  {
    protocol::ClientBatchListResponse reply;
    reply.set_status(protocol::ClientBatchListResponse::OK);
    connection.answer(reply);
    connection.next.type = protocol::Message::CLIENT_BATCH_LIST_RESPONSE;
    REQUIRE(errorOf([&] { handler.listBlocks(request); }) == ErrorCode::ValidatorResponseInvalid);
  }

  SECTION("undecodable reply")
  {
    connection.mode = ScriptedConnection::Mode::Answer;
    connection.next = Reply{};
    connection.next.content = "\xff";
    REQUIRE(errorOf([&] { handler.listBlocks(request); }) == ErrorCode::ValidatorResponseInvalid);
  }
}

TEST_CASE("Wait values and id lists", "[routes][params]")
{
  ScriptedConnection connection;
  RouteHandler handler(connection, 300s);
  REQUIRE(handler.waitTimeout("10") == 10);
  REQUIRE(handler.waitTimeout("0") == 0);
  REQUIRE(handler.waitTimeout("true") == 285);
  REQUIRE(handler.waitTimeout("") == 285);
  REQUIRE(handler.waitTimeout("-5") == 285);
  REQUIRE(handler.waitTimeout("12s") == 285);
  REQUIRE(handler.waitTimeout("1234567890") == 1234567890u);
  REQUIRE(handler.waitTimeout("4294967295") == 4294967295u);
  REQUIRE(handler.waitTimeout("4294967296") == 285);

  REQUIRE(RouteHandler::split("a,b,,c") == std::vector<std::string>{"a", "b", "", "c"});
  REQUIRE(RouteHandler::split("") == std::vector<std::string>{""});
}
