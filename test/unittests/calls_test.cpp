// gasket: Deterministic contract execution engine
// Copyright 2026 The gasket Authors.
// SPDX-License-Identifier: Apache-2.0

#include "engine_fixture.hpp"

using namespace gasket;
using namespace gasket::test;

namespace
{
const Param Target{"target", ValueType::address};

ContractDefinition target_contract()
{
    return contract("Target", {
        {.name = "set", .params = {{"v"}}, .code = sstore(0, arg(0)) + ret(add(arg(0), 1))},
        {.name = "get", .mutability = Mutability::view, .code = ret(sload(0))},
        {.name = "fail", .code = sstore(0, 13) + revert("target failed")},
        {.name = "boom", .code = assertion(0)},
        {.name = "deposit", .mutability = Mutability::payable, .code = ret(OP_CALLVALUE)},
        {.name = "who", .mutability = Mutability::view, .code = ret(OP_CALLER)},
        {.name = "hidden", .visibility = Visibility::internal, .code = sstore(0, 1)},
    });
}

ContractDefinition caller_contract()
{
    return contract("Caller", {
        {.name = "forward", .params = {Target, {"v"}},
            .code = ret(call(arg(0), "set").args({arg(1)}))},
        {.name = "call_fail", .params = {Target},
            .code = sstore(2, 5) + call(arg(0), "fail") + OP_POP},
        {.name = "try_fail", .params = {Target},
            .code = sstore(2, 1) + trycall(arg(0), "fail") + OP_RETURN},
        {.name = "try_fail_output", .params = {Target},
            .code = trycall(arg(0), "fail") + OP_POP + OP_RETURN},
        {.name = "try_boom", .params = {Target},
            .code = trycall(arg(0), "boom").gas(10'000) + OP_RETURN},
        {.name = "pay", .params = {Target}, .mutability = Mutability::payable,
            .code = ret(call(arg(0), "deposit").value(OP_CALLVALUE))},
        {.name = "pay_wrong", .params = {Target}, .mutability = Mutability::payable,
            .code = ret(call(arg(0), "set").value(OP_CALLVALUE).args({1}))},
        {.name = "peek", .params = {Target}, .mutability = Mutability::view,
            .code = ret(call(arg(0), "set").args({1}))},
        {.name = "try_peek", .params = {Target}, .mutability = Mutability::view,
            .code = trycall(arg(0), "set").args({1}) + OP_RETURN},
        {.name = "read", .params = {Target}, .mutability = Mutability::view,
            .code = ret(call(arg(0), "get"))},
        {.name = "hidden", .params = {Target}, .code = call(arg(0), "hidden") + OP_POP},
        {.name = "who_via", .params = {Target}, .code = ret(call(arg(0), "who"))},
        {.name = "tip", .params = {Target}, .mutability = Mutability::payable,
            .code = ret(call(arg(0)).value(OP_CALLVALUE).gas(1))},
    });
}

ContractDefinition logic_contract()
{
    return contract("Logic",
        {
            {.name = "set", .params = {{"v"}}, .code = sstore(0, arg(0))},
            {.name = "get", .mutability = Mutability::view, .code = ret(sload(0))},
            {.name = "whoami", .code = sstore(2, OP_CALLER)},
            {.name = "clobber", .code = sstore(1, 0xdead)},
            {.name = "log", .code = emit("Touched", {OP_ADDRESS})},
            {.name = "value", .code = ret(OP_CALLVALUE)},
        },
        {{"Touched", {{"who", true}}}});
}

/// The proxy forwarding its functions to the logic contract stored in slot 1.
ContractDefinition proxy_contract()
{
    const auto logic = sload(1);
    return contract("Proxy", {
        {.name = "constructor", .params = {{"logic", ValueType::address}},
            .code = sstore(1, arg(0))},
        {.name = "set", .params = {{"v"}},
            .code = delegatecall(logic, "set").args({arg(0)}) + OP_POP},
        {.name = "get", .mutability = Mutability::view, .code = ret(delegatecall(logic, "get"))},
        {.name = "whoami", .code = delegatecall(logic, "whoami") + OP_POP},
        {.name = "clobber", .code = delegatecall(logic, "clobber") + OP_POP},
        {.name = "log", .code = delegatecall(logic, "log") + OP_POP},
        {.name = "paid", .mutability = Mutability::payable,
            .code = ret(delegatecall(logic, "value"))},
        {.name = "try_missing", .code = trydelegatecall(logic, "missing") + OP_RETURN},
    });
}
}  // namespace

TEST_F(engine_test, call_returns_output)
{
    const auto t = deploy(target_contract());
    const auto c = deploy(caller_contract());

    const auto r = execute(c, "forward", {Value::of_address(t), Value::of_uint(41)});
    EXPECT_EQ(r.status, SUCCESS);
    EXPECT_EQ(r.output, 42);
    EXPECT_EQ(storage_at(t, 0), 41);
    EXPECT_EQ(storage_at(c, 0), 0);

    EXPECT_EQ(execute(c, "read", {Value::of_address(t)}).output, 41);
    EXPECT_EQ(execute(c, "who_via", {Value::of_address(t)}).output, to_word(c));
}

TEST_F(engine_test, call_failure_propagates)
{
    const auto t = deploy(target_contract());
    const auto c = deploy(caller_contract());

    const auto r = execute(c, "call_fail", {Value::of_address(t)});
    EXPECT_EQ(r.status, REVERTED);
    EXPECT_EQ(r.reason, "target failed");
    EXPECT_GT(r.gas_left, 0);
    EXPECT_EQ(storage_at(c, 2), 0);
    EXPECT_EQ(storage_at(t, 0), 0);
}

TEST_F(engine_test, trycall_catches_failure)
{
    const auto t = deploy(target_contract());
    const auto c = deploy(caller_contract());

    const auto r = execute(c, "try_fail", {Value::of_address(t)});
    EXPECT_EQ(r.status, SUCCESS);
    EXPECT_EQ(r.output, 0);
    EXPECT_TRUE(r.reason.empty());

    // The output word of the failed call is 0.
    EXPECT_EQ(execute(c, "try_fail_output", {Value::of_address(t)}).output, 0);

    // The caller's writes are kept, the callee's are reverted.
    EXPECT_EQ(storage_at(c, 2), 1);
    EXPECT_EQ(storage_at(t, 0), 0);
}

TEST_F(engine_test, trycall_assert_burns_forwarded_gas_only)
{
    const auto t = deploy(target_contract());
    const auto c = deploy(caller_contract());

    const auto r = execute(c, "try_boom", {Value::of_address(t)});
    EXPECT_EQ(r.status, SUCCESS);
    EXPECT_EQ(r.output, 0);
    EXPECT_GE(r.gas_used, 10'000 + 700);
    EXPECT_LT(r.gas_used, 11'000);
}

TEST_F(engine_test, call_with_value)
{
    const auto t = deploy(target_contract());
    const auto c = deploy(caller_contract());
    engine.fund(Alice, 1000);

    const auto r = execute(c, "pay", {Value::of_address(t)}, 300);
    EXPECT_EQ(r.status, SUCCESS);
    EXPECT_EQ(r.output, 300);
    EXPECT_EQ(engine.get_balance(Alice), 700);
    EXPECT_EQ(engine.get_balance(c), 0);
    EXPECT_EQ(engine.get_balance(t), 300);

    // The value cannot be attached to a non-payable function. The whole call is reverted.
    const auto wrong = execute(c, "pay_wrong", {Value::of_address(t)}, 100);
    EXPECT_EQ(wrong.status, PAYABLE_VIOLATION);
    EXPECT_EQ(engine.get_balance(Alice), 700);
    EXPECT_EQ(engine.get_balance(c), 0);
}

TEST_F(engine_test, call_value_stipend)
{
    const auto c = deploy(caller_contract());
    const auto receiver = deploy(contract("Receiver", {
        {.name = "fallback", .visibility = Visibility::external,
            .mutability = Mutability::payable, .code = ret(OP_GAS)},
    }));
    engine.fund(Alice, 10);

    // The callee gets the requested 1 gas and the stipend. GAS itself costs 2.
    const auto r = execute(c, "tip", {Value::of_address(receiver)}, 10);
    EXPECT_EQ(r.status, SUCCESS);
    EXPECT_EQ(r.output, 1 + 2300 - 2);
    EXPECT_EQ(engine.get_balance(receiver), 10);
}

TEST_F(engine_test, static_context)
{
    const auto t = deploy(target_contract());
    const auto c = deploy(caller_contract());

    const auto r = execute(c, "peek", {Value::of_address(t)});
    EXPECT_EQ(r.status, STATIC_MODE_VIOLATION);
    EXPECT_EQ(storage_at(t, 0), 0);

    const auto tr = execute(c, "try_peek", {Value::of_address(t)});
    EXPECT_EQ(tr.status, SUCCESS);
    EXPECT_EQ(tr.output, 0);
    EXPECT_EQ(storage_at(t, 0), 0);
}

TEST_F(engine_test, call_visibility)
{
    const auto t = deploy(target_contract());
    const auto c = deploy(caller_contract());

    EXPECT_EQ(execute(c, "hidden", {Value::of_address(t)}).status, VISIBILITY_VIOLATION);
    EXPECT_EQ(execute(t, "hidden").status, VISIBILITY_VIOLATION);
    EXPECT_EQ(execute(t, "constructor").status, VISIBILITY_VIOLATION);

    // Without a fallback the unknown names are not callable.
    const auto r = execute(t, "unknown");
    EXPECT_EQ(r.status, VISIBILITY_VIOLATION);
    EXPECT_EQ(r.gas_left, DefaultGas);
    EXPECT_EQ(r.gas_used, 0);
}

TEST_F(engine_test, fallback_receives_unknown_calls)
{
    const auto c = deploy(contract("Catchall", {
        {.name = "fallback", .visibility = Visibility::external,
            .mutability = Mutability::payable, .code = sstore(0, add(sload(0), 1))},
    }));
    engine.fund(Alice, 5);

    EXPECT_EQ(execute(c, "anything").status, SUCCESS);
    EXPECT_EQ(execute(c, "", {}, 5).status, SUCCESS);
    EXPECT_EQ(storage_at(c, 0), 2);
    EXPECT_EQ(engine.get_balance(c), 5);
}

TEST_F(engine_test, plain_transfer)
{
    engine.fund(Alice, 50);

    const auto r = engine.call(Alice, Bob, "", {}, 20, DefaultGas);
    EXPECT_EQ(r.status, SUCCESS);
    EXPECT_EQ(r.gas_used, 0);
    EXPECT_EQ(engine.get_balance(Alice), 30);
    EXPECT_EQ(engine.get_balance(Bob), 20);

    const auto poor = engine.call(Bob, Alice, "", {}, 21, DefaultGas);
    EXPECT_EQ(poor.status, INSUFFICIENT_BALANCE);
    EXPECT_EQ(engine.get_balance(Bob), 20);
}

TEST_F(engine_test, no_such_contract)
{
    const auto r = execute(0xdead_address, "f");
    EXPECT_EQ(r.status, NO_SUCH_CONTRACT);
    EXPECT_EQ(r.gas_left, DefaultGas);
}

TEST_F(engine_test, insufficient_balance)
{
    const auto t = deploy(target_contract());
    const auto r = engine.call(Bob, t, "deposit", {}, 5, DefaultGas);
    EXPECT_EQ(r.status, INSUFFICIENT_BALANCE);
    EXPECT_EQ(engine.get_balance(t), 0);
}

TEST_F(engine_test, call_depth_limit)
{
    const auto c = deploy(contract("Recursive", {
        {.name = "down", .code = call(OP_ADDRESS, "down") + OP_POP},
        {.name = "try_down",
            .code = sstore(0, add(sload(0), 1)) + trycall(OP_ADDRESS, "try_down") + OP_POP +
                    OP_POP},
    }));
    ASSERT_EQ(engine.set_option("max_depth", "8"), SetOptionResult::success);

    const auto r = execute(c, "down");
    EXPECT_EQ(r.status, CALL_DEPTH_EXCEEDED);
    EXPECT_GT(r.gas_left, 0);

    // The frames at depths 0 to 7 succeed.
    EXPECT_EQ(execute(c, "try_down").status, SUCCESS);
    EXPECT_EQ(storage_at(c, 0), 8);
}

TEST_F(engine_test, call_depth_limit_counts_internal_invocations)
{
    // nest(n) descends through n internal invocations.
    // hop(n) does the same and then calls nest(4) from the bottom invocation.
    // spin(n) keeps alternating n invocations with a call to itself.
    const auto c = deploy(contract("Nesting", {
        {.name = "nest", .params = {{"n"}},
            .code = if_(iszero(arg(0)), ret(0)) + ret(invoke("nest", {sub(arg(0), 1)}))},
        {.name = "hop", .params = {{"n"}},
            .code = if_(iszero(arg(0)), ret(call(OP_ADDRESS, "nest").args({4}))) +
                    ret(invoke("hop", {sub(arg(0), 1)}))},
        {.name = "spin", .params = {{"n"}},
            .code = if_(iszero(arg(0)), ret(call(OP_ADDRESS, "spin").args({3}))) +
                    ret(invoke("spin", {sub(arg(0), 1)}))},
    }));
    ASSERT_EQ(engine.set_option("max_depth", "8"), SetOptionResult::success);

    // The levels 0 to 7 are available to a single frame.
    EXPECT_EQ(execute(c, "nest", {Value::of_uint(7)}).status, SUCCESS);
    EXPECT_EQ(execute(c, "nest", {Value::of_uint(8)}).status, CALL_DEPTH_EXCEEDED);

    // The call made from the level 3 runs at the level 4, so nest(4) reaches the level 8.
    EXPECT_EQ(execute(c, "hop", {Value::of_uint(2)}).status, SUCCESS);
    EXPECT_EQ(execute(c, "hop", {Value::of_uint(3)}).status, CALL_DEPTH_EXCEEDED);

    const auto r = execute(c, "spin", {Value::of_uint(3)});
    EXPECT_EQ(r.status, CALL_DEPTH_EXCEEDED);
    EXPECT_GT(r.gas_left, 0);
}

TEST_F(engine_test, delegatecall_uses_caller_storage)
{
    const auto logic = deploy(logic_contract());
    const auto proxy = deploy(proxy_contract(), {Value::of_address(logic)});
    EXPECT_EQ(storage_at(proxy, 1), to_word(logic));

    EXPECT_EQ(execute(proxy, "set", {Value::of_uint(5)}).status, SUCCESS);
    EXPECT_EQ(storage_at(proxy, 0), 5);
    EXPECT_EQ(storage_at(logic, 0), 0);
    EXPECT_EQ(execute(proxy, "get").output, 5);
    EXPECT_EQ(execute(logic, "get").output, 0);

    // The sender and the value of the proxy call are preserved.
    EXPECT_EQ(execute(proxy, "whoami").status, SUCCESS);
    EXPECT_EQ(storage_at(proxy, 2), to_word(Alice));
    engine.fund(Alice, 9);
    EXPECT_EQ(execute(proxy, "paid", {}, 9).output, 9);
    EXPECT_EQ(engine.get_balance(proxy), 9);
    EXPECT_EQ(engine.get_balance(logic), 0);

    EXPECT_EQ(execute(proxy, "try_missing").output, 0);
}

TEST_F(engine_test, delegatecall_events_emitted_by_storage_owner)
{
    const auto logic = deploy(logic_contract());
    const auto proxy = deploy(proxy_contract(), {Value::of_address(logic)});

    const auto r = execute(proxy, "log");
    ASSERT_EQ(r.status, SUCCESS);
    ASSERT_EQ(r.events.size(), 1);
    EXPECT_EQ(r.events[0].emitter, proxy);
    EXPECT_EQ(r.events[0].indexed_value("who"), to_word(proxy));
}

TEST_F(engine_test, delegatecall_storage_collision)
{
    const auto logic = deploy(logic_contract());
    const auto proxy = deploy(proxy_contract(), {Value::of_address(logic)});

    // The logic writes its slot 1, which the proxy uses for the logic address.
    EXPECT_EQ(execute(proxy, "clobber").status, SUCCESS);
    EXPECT_EQ(storage_at(proxy, 1), 0xdead);

    const auto r = execute(proxy, "set", {Value::of_uint(1)});
    EXPECT_EQ(r.status, NO_SUCH_CONTRACT);
}
