// gasket: Deterministic contract execution engine
// Copyright 2026 The gasket Authors.
// SPDX-License-Identifier: Apache-2.0

#include "engine_fixture.hpp"

using namespace gasket;
using namespace gasket::test;

namespace
{
/// The balance of the caller in the bank's mapping at slot 0.
code caller_balance()
{
    return sload(mapslot(OP_CALLER, 0));
}

Function deposit()
{
    return {
        .name = "deposit",
        .mutability = Mutability::payable,
        .code = sstore(mapslot(OP_CALLER, 0), add(caller_balance(), OP_CALLVALUE)),
    };
}

/// The bank sending the funds before clearing the balance.
ContractDefinition vulnerable_bank(bool guarded = false)
{
    return contract(guarded ? "GuardedBank" : "Bank",
        {
            deposit(),
            {
                .name = "withdraw",
                .non_reentrant = guarded,
                .code = mstore(0, caller_balance()) +
                        require(gt(mload(0), 0), "nothing to withdraw") +
                        call(OP_CALLER).value(mload(0)) + OP_POP +
                        sstore(mapslot(OP_CALLER, 0), 0),
            },
        });
}

/// The bank clearing the balance before sending the funds.
ContractDefinition checks_effects_interactions_bank()
{
    return contract("SafeBank", {
        deposit(),
        {
            .name = "withdraw",
            .code = mstore(0, caller_balance()) + require(gt(mload(0), 0), "nothing to withdraw") +
                    sstore(mapslot(OP_CALLER, 0), 0) + call(OP_CALLER).value(mload(0)) + OP_POP,
        },
    });
}

/// The attacker re-entering the bank's withdraw once from its fallback.
///
/// Slot 0 keeps the bank address, slot 1 counts the re-entries.
ContractDefinition attacker(bool soft_reentry = false)
{
    const auto reenter = soft_reentry ? code{trycall(sload(0), "withdraw")} + OP_POP + OP_POP :
                                        code{call(sload(0), "withdraw")} + OP_POP;
    return contract("Attacker", {
        {.name = "constructor", .params = {{"bank", ValueType::address}},
            .code = sstore(0, arg(0))},
        {
            .name = "attack",
            .mutability = Mutability::payable,
            .code = call(sload(0), "deposit").value(OP_CALLVALUE) + OP_POP +
                    call(sload(0), "withdraw") + OP_POP,
        },
        {
            .name = "fallback",
            .visibility = Visibility::external,
            .mutability = Mutability::payable,
            .code = if_(iszero(sload(1)), sstore(1, 1) + reenter),
        },
    });
}

class reentrancy : public engine_test
{
protected:
    static constexpr auto Honest = 0x40be57_address;

    address bank;
    address thief;

    void setup(const ContractDefinition& bank_definition, bool soft_reentry = false)
    {
        bank = deploy(bank_definition);
        thief = deploy(attacker(soft_reentry), {Value::of_address(bank)});

        engine.fund(Honest, 100);
        engine.fund(Alice, 10);
        ASSERT_EQ(engine.call(Honest, bank, "deposit", {}, 100, DefaultGas).status, SUCCESS);
        ASSERT_EQ(engine.get_balance(bank), 100);
    }
};
}  // namespace

TEST_F(reentrancy, vulnerable_bank_double_withdrawal)
{
    setup(vulnerable_bank());

    const auto r = execute(thief, "attack", {}, 10);
    ASSERT_EQ(r.status, SUCCESS) << r.reason;

    // The attacker deposited 10 and withdrew it twice.
    EXPECT_EQ(engine.get_balance(thief), 20);
    EXPECT_EQ(engine.get_balance(bank), 90);
    EXPECT_EQ(mapping_at(bank, to_word(thief), 0), 0);
    EXPECT_EQ(mapping_at(bank, to_word(Honest), 0), 100);
    EXPECT_EQ(storage_at(thief, 1), 1);
}

TEST_F(reentrancy, guarded_bank_blocks_reentry)
{
    setup(vulnerable_bank(true));
    const auto world_before = engine.world();

    const auto r = execute(thief, "attack", {}, 10);
    EXPECT_EQ(r.status, REENTRANCY_BLOCKED);
    EXPECT_GT(r.gas_left, 0);

    EXPECT_EQ(engine.world(), world_before);
    EXPECT_EQ(engine.get_balance(bank), 100);
    EXPECT_EQ(engine.get_balance(Alice), 10);
}

TEST_F(reentrancy, guarded_bank_soft_reentry)
{
    setup(vulnerable_bank(true), true);

    const auto r = execute(thief, "attack", {}, 10);
    ASSERT_EQ(r.status, SUCCESS) << r.reason;
    EXPECT_EQ(engine.get_balance(thief), 10);
    EXPECT_EQ(engine.get_balance(bank), 100);
    EXPECT_EQ(mapping_at(bank, to_word(thief), 0), 0);
}

TEST_F(reentrancy, guard_released_after_call)
{
    setup(vulnerable_bank(true));

    engine.fund(Bob, 7);
    ASSERT_EQ(engine.call(Bob, bank, "deposit", {}, 7, DefaultGas).status, SUCCESS);
    EXPECT_EQ(engine.call(Bob, bank, "withdraw", {}, 0, DefaultGas).status, SUCCESS);
    EXPECT_EQ(engine.get_balance(Bob), 7);

    // The lock of the previous call does not outlive it.
    ASSERT_EQ(engine.call(Bob, bank, "deposit", {}, 7, DefaultGas).status, SUCCESS);
    EXPECT_EQ(engine.call(Bob, bank, "withdraw", {}, 0, DefaultGas).status, SUCCESS);
    EXPECT_EQ(engine.get_balance(Bob), 7);
}

TEST_F(reentrancy, checks_effects_interactions)
{
    setup(checks_effects_interactions_bank());
    const auto world_before = engine.world();

    const auto r = execute(thief, "attack", {}, 10);
    EXPECT_EQ(r.status, REQUIRE_FAILED);
    EXPECT_EQ(r.reason, "nothing to withdraw");
    EXPECT_EQ(engine.world(), world_before);
}

TEST_F(reentrancy, checks_effects_interactions_soft_reentry)
{
    setup(checks_effects_interactions_bank(), true);

    const auto r = execute(thief, "attack", {}, 10);
    ASSERT_EQ(r.status, SUCCESS) << r.reason;
    EXPECT_EQ(engine.get_balance(thief), 10);
    EXPECT_EQ(engine.get_balance(bank), 100);
}

TEST_F(engine_test, reentrancy_guard_shared_by_delegated_code)
{
    const auto logic = deploy(contract("Logic", {
        {.name = "locked", .non_reentrant = true, .code = sstore(0, 1)},
    }));
    const auto proxy = deploy(contract("Proxy", {
        {.name = "constructor", .params = {{"logic", ValueType::address}},
            .code = sstore(1, arg(0))},
        {.name = "run", .non_reentrant = true,
            .code = delegatecall(sload(1), "locked") + OP_POP},
        {.name = "run_unlocked", .code = delegatecall(sload(1), "locked") + OP_POP},
    }), {Value::of_address(logic)});

    // The delegated function takes the lock of the proxy, which is already held.
    EXPECT_EQ(execute(proxy, "run").status, REENTRANCY_BLOCKED);
    EXPECT_EQ(execute(proxy, "run_unlocked").status, SUCCESS);
    EXPECT_EQ(storage_at(proxy, 0), 1);
    EXPECT_EQ(storage_at(logic, 0), 0);
}

TEST_F(engine_test, reentrancy_guard_internal_invoke)
{
    const auto c = deploy(contract("Nested", {
        {.name = "inner", .visibility = Visibility::private_, .non_reentrant = true,
            .code = sstore(0, 1)},
        {.name = "outer", .non_reentrant = true, .code = invoke("inner") + OP_POP},
        {.name = "plain", .code = invoke("inner") + OP_POP},
    }));

    EXPECT_EQ(execute(c, "outer").status, REENTRANCY_BLOCKED);
    EXPECT_EQ(execute(c, "plain").status, SUCCESS);
    EXPECT_EQ(storage_at(c, 0), 1);
}
