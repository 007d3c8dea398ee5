// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of LedgerGate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <stdexcept>
#include <string>

#include "batch.pb.h"
#include "block.pb.h"
#include "transaction.pb.h"

#include <ledgergate/parsers/json.hpp>
#include <ledgergate/rest/proto_json.hpp>
#include <ledgergate/util/base64.hpp>

namespace ledgergate
{
namespace rest
{

/// \brief Replaces the base64 `header` of blocks, batches and transactions
/// (as printed by messageToJson) with the decoded header record, children
/// first.
///
/// A header that is not valid base64 or does not parse as its protobuf type
/// means the validator broke its contract; this is reported as a
/// std::runtime_error, which the HTTP layer answers with 500.
class HeaderExpander
{
public:
  static parsers::Json &expandBlock(parsers::Json &block)
  {
    if (block.contains("batches"))
    {
      for (auto &batch : block["batches"].getArray())
      {
        expandBatch(batch);
      }
    }
    decodeHeader<protocol::BlockHeader>(block);
    return block;
  }

  static parsers::Json &expandBatch(parsers::Json &batch)
  {
    if (batch.contains("transactions"))
    {
      for (auto &transaction : batch["transactions"].getArray())
      {
        expandTransaction(transaction);
      }
    }
    decodeHeader<protocol::BatchHeader>(batch);
    return batch;
  }

  static parsers::Json &expandTransaction(parsers::Json &transaction)
  {
    decodeHeader<protocol::TransactionHeader>(transaction);
    return transaction;
  }

private:
  template <typename Header> static void decodeHeader(parsers::Json &record)
  {
    Header header;
    const std::string typeName = header.GetTypeName();
    if (!record.contains("header") || !record.at("header").isString())
    {
      throw std::runtime_error(typeName + " missing from validator record");
    }

    std::string bytes;
    try
    {
      bytes = util::Base64::decode(record.at("header").getString());
    }
    catch (const std::invalid_argument &ex)
    {
      throw std::runtime_error(typeName + " is not valid base64: " + ex.what());
    }
    if (!header.ParseFromString(bytes))
    {
      throw std::runtime_error(typeName + " could not be decoded");
    }
    record["header"] = messageToJson(header);
  }
};

} // namespace rest
} // namespace ledgergate
