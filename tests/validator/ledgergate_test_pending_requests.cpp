// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// Tests for reply slots and the correlation id table

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <ledgergate/validator/pending_requests.hpp>

#include <thread>

using namespace ledgergate::validator;
using namespace std::chrono_literals;
namespace protocol = ledgergate::protocol;

namespace
{

Reply makeReply(const std::string &content)
{
  Reply reply;
  reply.type = protocol::Message::CLIENT_BLOCK_GET_RESPONSE;
  reply.content = content;
  return reply;
}

} // namespace

TEST_CASE("A slot is resolved exactly once", "[pending][slot]")
{
  ReplySlot slot;
  REQUIRE(slot.state() == ReplySlot::State::Waiting);
  REQUIRE(slot.fulfill(makeReply("one")));
  REQUIRE_FALSE(slot.fulfill(makeReply("two")));
  REQUIRE_FALSE(slot.fail("late failure"));
  REQUIRE(slot.state() == ReplySlot::State::Fulfilled);
  REQUIRE(slot.takeReply().content == "one");
}

TEST_CASE("A slot wait ends at the deadline", "[pending][slot]")
{
  ReplySlot slot;
  auto start = std::chrono::steady_clock::now();
  REQUIRE(slot.waitUntil(start + 100ms) == ReplySlot::State::Waiting);
  REQUIRE(std::chrono::steady_clock::now() - start >= 100ms);
}

TEST_CASE("A slot wakes its waiter on failure", "[pending][slot]")
{
  ReplySlot slot;
  std::thread failer(
    [&slot]()
    {
      std::this_thread::sleep_for(20ms);
      slot.fail("connection lost");
    });
  REQUIRE(slot.waitUntil(std::chrono::steady_clock::now() + 5s) == ReplySlot::State::Failed);
  REQUIRE(slot.error() == "connection lost");
  failer.join();
}

TEST_CASE("Replies go to the slot with the matching id", "[pending][table]")
{
  PendingRequestTable table;
  auto a = table.add("a");
  auto b = table.add("b");
  REQUIRE(table.size() == 2);
  REQUIRE_THROWS_AS(table.add("a"), std::logic_error);

  REQUIRE(table.resolve("b", makeReply("for b")));
  REQUIRE(b->state() == ReplySlot::State::Fulfilled);
  REQUIRE(a->state() == ReplySlot::State::Waiting);
  REQUIRE(b->takeReply().content == "for b");

  REQUIRE_FALSE(table.contains("b"));
  REQUIRE_FALSE(table.resolve("b", makeReply("duplicate")));
  REQUIRE_FALSE(table.resolve("unknown", makeReply("stray")));
  REQUIRE(table.size() == 1);
}

TEST_CASE("Removed entries refuse late replies", "[pending][table]")
{
  PendingRequestTable table;
  auto slot = table.add("timed-out");
  table.remove("timed-out");
  REQUIRE_FALSE(table.resolve("timed-out", makeReply("late")));
  REQUIRE(slot->state() == ReplySlot::State::Waiting);
}

TEST_CASE("failAll fails every outstanding request", "[pending][table]")
{
  PendingRequestTable table;
  auto a = table.add("a");
  auto b = table.add("b");
  auto c = table.add("c");
  REQUIRE(table.fail("c", "write failed"));

  REQUIRE(table.failAll("validator disconnected") == 2);
  REQUIRE(table.size() == 0);
  REQUIRE(a->state() == ReplySlot::State::Failed);
  REQUIRE(b->error() == "validator disconnected");
  REQUIRE(c->error() == "write failed");
  REQUIRE(table.failAll("again") == 0);
}
