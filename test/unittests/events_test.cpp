// gasket: Deterministic contract execution engine
// Copyright 2026 The gasket Authors.
// SPDX-License-Identifier: Apache-2.0

#include "engine_fixture.hpp"
#include <gasket/state/event_log.hpp>
#include <gmock/gmock.h>

using namespace gasket;
using namespace gasket::test;

namespace
{
const EventDecl Transfer{"Transfer", {{"from", true}, {"to", true}, {"amount", false}}};

ContractDefinition token()
{
    const std::vector<Param> params{{"to", ValueType::address}, {"amount"}};
    return contract("Token",
        {
            {.name = "constructor", .code = emit("Transfer", {0, 0, 0})},
            {.name = "mint", .params = params, .code = emit("Transfer", {0, arg(0), arg(1)})},
            {.name = "mint_and_fail", .params = params,
                .code = emit("Transfer", {0, arg(0), arg(1)}) + revert("minting closed")},
        },
        {Transfer});
}

ContractDefinition relay()
{
    const Param token_param{"token", ValueType::address};
    const Param to_param{"to", ValueType::address};
    return contract("Relay",
        {
            {.name = "relay", .params = {token_param, to_param},
                .code = emit("Step", {1}) + call(arg(0), "mint").args({arg(1), 5}) + OP_POP +
                        emit("Step", {2})},
            {.name = "relay_try", .params = {token_param, to_param},
                .code = emit("Step", {1}) +
                        trycall(arg(0), "mint_and_fail").args({arg(1), 5}) + OP_POP + OP_POP +
                        emit("Step", {2})},
            {.name = "peek", .params = {token_param, to_param}, .mutability = Mutability::view,
                .code = call(arg(0), "mint").args({arg(1), 5}) + OP_POP},
        },
        {{"Step", {{"n", true}}}});
}

Event transfer(const address& emitter, const address& to, uint64_t amount)
{
    return {emitter, "Transfer",
        {{"from", 0, true}, {"to", to_word(to), true}, {"amount", amount, false}}};
}
}  // namespace

TEST_F(engine_test, events_emission_order)
{
    const auto t = deploy(token());
    const auto r = deploy(relay());

    const auto res = execute(r, "relay", {Value::of_address(t), Value::of_address(Bob)});
    ASSERT_EQ(res.status, SUCCESS);
    ASSERT_EQ(res.events.size(), 3);
    EXPECT_EQ(res.events[0].name, "Step");
    EXPECT_EQ(res.events[0].emitter, r);
    EXPECT_EQ(res.events[0].indexed_value("n"), 1);
    EXPECT_EQ(res.events[1], transfer(t, Bob, 5));
    EXPECT_EQ(res.events[2].indexed_value("n"), 2);

    // The log holds the constructor event and the call's events in the same order.
    const auto all = events();
    ASSERT_EQ(all.size(), 4);
    EXPECT_EQ(all[0], transfer(t, {}, 0));
    EXPECT_EQ(all[2], transfer(t, Bob, 5));
}

TEST_F(engine_test, events_emit_cost)
{
    const auto t = deploy(token());
    const auto r = execute(t, "mint", {Value::of_address(Bob), Value::of_uint(1)});
    EXPECT_EQ(r.gas_used, 3 * 3 + 375 + 2 * 375);
}

TEST_F(engine_test, events_of_reverted_frames_are_discarded)
{
    const auto t = deploy(token());
    const auto r = deploy(relay());

    const auto res = execute(r, "relay_try", {Value::of_address(t), Value::of_address(Bob)});
    ASSERT_EQ(res.status, SUCCESS);
    ASSERT_EQ(res.events.size(), 2);
    EXPECT_EQ(res.events[0].indexed_value("n"), 1);
    EXPECT_EQ(res.events[1].indexed_value("n"), 2);

    const auto failed = execute(t, "mint_and_fail", {Value::of_address(Bob), Value::of_uint(1)});
    EXPECT_EQ(failed.status, REVERTED);
    EXPECT_EQ(failed.reason, "minting closed");
    EXPECT_TRUE(failed.events.empty());

    EXPECT_TRUE(events({.name = "Transfer", .topics = {{"to", to_word(Bob)}}}).empty());
}

TEST_F(engine_test, events_in_static_context)
{
    const auto t = deploy(token());
    const auto r = deploy(relay());

    const auto res = execute(r, "peek", {Value::of_address(t), Value::of_address(Bob)});
    EXPECT_EQ(res.status, STATIC_MODE_VIOLATION);
    EXPECT_EQ(events({.emitter = t}).size(), 1);
}

TEST_F(engine_test, events_query)
{
    const auto t = deploy(token());
    const auto r = deploy(relay());
    const auto mint = [&](const address& to, uint64_t amount) {
        ASSERT_EQ(
            execute(t, "mint", {Value::of_address(to), Value::of_uint(amount)}).status, SUCCESS);
    };
    mint(Alice, 1);
    mint(Bob, 2);
    mint(Alice, 3);
    ASSERT_EQ(
        execute(r, "relay", {Value::of_address(t), Value::of_address(Bob)}).status, SUCCESS);

    EXPECT_EQ(events().size(), 7);
    EXPECT_EQ(events({.emitter = t}).size(), 5);
    EXPECT_EQ(events({.emitter = r}).size(), 2);
    EXPECT_EQ(events({.name = "Step"}).size(), 2);

    const auto to_alice = events({.topics = {{"to", to_word(Alice)}}});
    ASSERT_EQ(to_alice.size(), 2);
    EXPECT_EQ(to_alice[0], transfer(t, Alice, 1));
    EXPECT_EQ(to_alice[1], transfer(t, Alice, 3));

    const auto to_bob =
        events({.emitter = t, .name = "Transfer", .topics = {{"to", to_word(Bob)}}});
    ASSERT_EQ(to_bob.size(), 2);
    EXPECT_EQ(to_bob[0], transfer(t, Bob, 2));
    EXPECT_EQ(to_bob[1], transfer(t, Bob, 5));

    EXPECT_TRUE(events({.emitter = Alice}).empty());
    EXPECT_TRUE(events({.topics = {{"memo", 1}}}).empty());
    EXPECT_EQ(events({.topics = {{"n", 2}}}).size(), 1);
}

TEST_F(engine_test, events_filter_not_indexed)
{
    const auto t = deploy(token());
    ASSERT_EQ(execute(t, "mint", {Value::of_address(Bob), Value::of_uint(5)}).status, SUCCESS);

    const auto check = [&](const EventFilter& filter) {
        const auto r = engine.query_events(filter);
        ASSERT_TRUE(std::holds_alternative<std::error_code>(r));
        EXPECT_EQ(std::get<std::error_code>(r), FILTER_NOT_INDEXED);
    };
    check({.topics = {{"amount", 5}}});
    check({.emitter = t, .topics = {{"amount", 5}}});
    check({.name = "Transfer", .topics = {{"to", to_word(Bob)}, {"amount", 5}}});

    // Other events do not declare the field.
    EXPECT_TRUE(events({.name = "Step", .topics = {{"amount", 5}}}).empty());
}

TEST_F(engine_test, events_filter_not_indexed_without_declaration)
{
    const auto logic = deploy(contract("PayLogic",
        {{.name = "pay", .params = {{"amount"}}, .code = emit("Paid", {OP_CALLER, arg(0)})}},
        {{"Paid", {{"payer", true}, {"amount", false}}}}));
    const auto proxy = deploy(contract("PayProxy", {
        {.name = "constructor", .params = {{"logic", ValueType::address}},
            .code = sstore(1, arg(0))},
        {.name = "pay", .params = {{"amount"}},
            .code = delegatecall(sload(1), "pay").args({arg(0)}) + OP_POP},
    }), {Value::of_address(logic)});
    const auto t = deploy(token());

    ASSERT_EQ(execute(proxy, "pay", {Value::of_uint(5)}).status, SUCCESS);
    ASSERT_EQ(execute(t, "mint", {Value::of_address(Bob), Value::of_uint(5)}).status, SUCCESS);
    ASSERT_EQ(engine.terminate(t), std::error_code{});

    const auto check = [&](const EventFilter& filter) {
        const auto r = engine.query_events(filter);
        ASSERT_TRUE(std::holds_alternative<std::error_code>(r));
        EXPECT_EQ(std::get<std::error_code>(r), FILTER_NOT_INDEXED);
    };

    // The proxy emits the event declared by the logic contract.
    check({.emitter = proxy, .topics = {{"amount", 5}}});
    check({.emitter = proxy, .name = "Paid", .topics = {{"amount", 5}}});
    const auto paid = events({.emitter = proxy, .topics = {{"payer", to_word(Alice)}}});
    ASSERT_EQ(paid.size(), 1);
    EXPECT_EQ(paid[0].name, "Paid");

    // The emitter is no longer registered.
    check({.emitter = t, .topics = {{"amount", 5}}});
    EXPECT_EQ(events({.emitter = t, .topics = {{"to", to_word(Bob)}}}).size(), 1);
}

TEST(event_log, lazy_query)
{
    EventLog log;
    log.append(
        {transfer(0x01_address, 0xb0b_address, 1), transfer(0x02_address, 0xb0b_address, 2)});
    log.append({});
    log.append({transfer(0x01_address, 0xa11ce_address, 3)});
    EXPECT_EQ(log.size(), 3);

    auto view = log.query({.emitter = 0x01_address});
    std::vector<uint256> amounts;
    for (const auto& e : view)
        amounts.push_back(e.fields[2].value);
    EXPECT_THAT(amounts, testing::ElementsAre(1, 3));

    const EventMatcher matcher{{.topics = {{"to", to_word(0xb0b_address)}}}};
    EXPECT_TRUE(matcher(log.events()[0]));
    EXPECT_TRUE(matcher(log.events()[1]));
    EXPECT_FALSE(matcher(log.events()[2]));
}
