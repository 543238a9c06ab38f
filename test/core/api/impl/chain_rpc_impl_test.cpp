/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "api/impl/chain_rpc_impl.hpp"

#include <gtest/gtest.h>

#include "api/storage_keys.hpp"
#include "api/transport/error.hpp"
#include "mock/api/transport/rpc_connection_mock.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"
#include "testutil/primitives/mp_utils.hpp"

using namespace slotwatch;
using api::ChainRpcImpl;
using api::TransportError;
using testing::AllOf;
using testing::HasSubstr;
using testing::Return;

namespace {
  std::string result(int id, std::string_view json) {
    return fmt::format(R"({{"jsonrpc":"2.0","id":{},"result":{}}})", id, json);
  }

  const auto kHash = "0x" + std::string(64, 'a');
  const auto kKeyA = std::string(64, '1');
  const auto kKeyB = std::string(64, '2');
}  // namespace

class ChainRpcImplTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    connection = std::make_shared<api::RpcConnectionMock>();
    rpc = std::make_shared<ChainRpcImpl>(connection);
  }

 protected:
  std::shared_ptr<api::RpcConnectionMock> connection;
  std::shared_ptr<ChainRpcImpl> rpc;
};

/**
 * @given node answering chain_getBlockHash without params
 * @when best head is requested
 * @then its hash is returned
 */
TEST_F(ChainRpcImplTest, BestHead) {
  EXPECT_CALL(*connection,
              request(AllOf(HasSubstr(R"("method":"chain_getBlockHash")"),
                            HasSubstr(R"("params":[])"))))
      .WillOnce(Return(result(1, "\"" + kHash + "\"")));
  EXPECT_OUTCOME_TRUE(hash, rpc->bestHead());
  EXPECT_EQ(hash.toHex0x(), kHash);
}

/**
 * @given node without block 9000
 * @when its hash is requested
 * @then nothing is returned
 */
TEST_F(ChainRpcImplTest, BlockHashUnknown) {
  EXPECT_CALL(*connection, request(HasSubstr(R"("params":[9000])")))
      .WillOnce(Return(result(1, "null")));
  EXPECT_OUTCOME_TRUE(hash, rpc->blockHash(9000));
  EXPECT_FALSE(hash.has_value());
}

/**
 * @given Timestamp.Now stored at a block, and absent at best block
 * @when timestamps are requested
 * @then SCALE u64 is decoded, absence gives nothing
 */
TEST_F(ChainRpcImplTest, Timestamp) {
  auto at = primitives::BlockHash::fromHexWithPrefix(kHash).value();
  EXPECT_CALL(*connection,
              request(AllOf(HasSubstr(std::string{
                                api::storage_keys::kTimestampNow}),
                            HasSubstr(kHash))))
      .WillOnce(Return(result(1, R"("0xb08e1b0000000000")")));
  EXPECT_OUTCOME_TRUE(ts, rpc->timestamp(at));
  EXPECT_EQ(ts, 1'806'000);

  EXPECT_CALL(*connection, request(testing::Not(HasSubstr(kHash))))
      .WillOnce(Return(result(2, "null")));
  EXPECT_OUTCOME_TRUE(none, rpc->timestamp(std::nullopt));
  EXPECT_FALSE(none.has_value());
}

/**
 * @given runtime answering AuraApi_slot_duration
 * @when slot duration is requested
 * @then u64 is decoded, zero is rejected
 */
TEST_F(ChainRpcImplTest, SlotDuration) {
  EXPECT_CALL(*connection,
              request(AllOf(HasSubstr(R"("method":"state_call")"),
                            HasSubstr(R"(["AuraApi_slot_duration","0x"])"))))
      .WillOnce(Return(result(1, R"("0x7017000000000000")")))
      .WillOnce(Return(result(2, R"("0x0000000000000000")")));
  EXPECT_OUTCOME_TRUE(duration, rpc->slotDuration());
  EXPECT_EQ(duration, 6000);
  EXPECT_EC(rpc->slotDuration(), TransportError::UNEXPECTED_RESULT);
}

/**
 * @given Aura.Authorities holding two keys
 * @when authorities are requested
 * @then keys are returned in stored order
 */
TEST_F(ChainRpcImplTest, Authorities) {
  EXPECT_CALL(*connection,
              request(HasSubstr(std::string{
                  api::storage_keys::kAuraAuthorities})))
      .WillOnce(Return(result(1, "\"0x08" + kKeyB + kKeyA + "\"")))
      .WillOnce(Return(result(2, "null")));
  EXPECT_OUTCOME_TRUE(list, rpc->authorities());
  ASSERT_EQ(list.size(), 2);
  EXPECT_EQ(list[0], testutil::createAuthority(0x22));
  EXPECT_EQ(list[1], testutil::createAuthority(0x11));

  EXPECT_OUTCOME_TRUE(empty, rpc->authorities());
  EXPECT_TRUE(empty.empty());
}

/**
 * @given malformed authority lists
 * @when they are decoded
 * @then UNEXPECTED_RESULT is returned
 */
TEST_F(ChainRpcImplTest, DecodeAuthoritiesMalformed) {
  // three keys announced, one present
  auto short_list = common::Buffer::fromHex("0c" + kKeyA).value();
  EXPECT_EC(api::decodeAuthorities(short_list),
            TransportError::UNEXPECTED_RESULT);
  // trailing byte
  auto trailing = common::Buffer::fromHex("04" + kKeyA + "00").value();
  EXPECT_EC(api::decodeAuthorities(trailing),
            TransportError::UNEXPECTED_RESULT);
}

/**
 * @given node holding the aura key
 * @when key presence is checked
 * @then author_hasKey is called with hex key and key type
 */
TEST_F(ChainRpcImplTest, HasKey) {
  auto key = testutil::createAuthority(0x11);
  EXPECT_CALL(*connection,
              request(AllOf(HasSubstr(R"("method":"author_hasKey")"),
                            HasSubstr(R"(["0x)" + kKeyA + R"(","aura"])"))))
      .WillOnce(Return(result(1, "true")));
  EXPECT_OUTCOME_TRUE(has, rpc->hasKey(key.view(), "aura"));
  EXPECT_TRUE(has);
}

/**
 * @given node answering with an error object, and a dead connection
 * @when calls are made
 * @then RPC_ERROR and the transport error are returned
 */
TEST_F(ChainRpcImplTest, Errors) {
  EXPECT_CALL(*connection, request(testing::_))
      .WillOnce(Return(std::string{
          R"({"jsonrpc":"2.0","id":1,"error":{"code":-32000,"message":"boom"}})"}))
      .WillOnce(Return(TransportError::RECEIVE_FAILED))
      .WillOnce(Return(result(1, "\"" + kHash + "\"")));
  EXPECT_EC(rpc->finalizedHead(), TransportError::RPC_ERROR);
  EXPECT_EC(rpc->finalizedHead(), TransportError::RECEIVE_FAILED);
  // id 3 was expected
  EXPECT_EC(rpc->finalizedHead(), TransportError::UNEXPECTED_RESPONSE_ID);
}
