// gasket: Deterministic contract execution engine
// Copyright 2026 The gasket Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "opcodes.hpp"
#include "value.hpp"
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace gasket
{
/// The name of the function executed once when the contract is deployed.
inline constexpr std::string_view CONSTRUCTOR_NAME = "constructor";

/// The name of the function receiving plain value transfers and calls to unknown functions.
inline constexpr std::string_view FALLBACK_NAME = "fallback";

/// The maximum number of indexed fields of an event.
inline constexpr size_t MAX_INDEXED_FIELDS = 3;

/// A single primitive operation of a function body.
struct Instruction
{
    Opcode opcode = OP_STOP;

    /// PUSH value, DUP/SWAP depth, ARG index or the number of call arguments.
    uint256 immediate;

    /// The relative destination of JUMP and JUMPI.
    int32_t offset = 0;

    /// The REQUIRE/REVERT reason, the EMIT event name or the called function name.
    std::string name;

    bool operator==(const Instruction&) const noexcept = default;
};

enum class Visibility : uint8_t
{
    external,
    public_,
    internal,
    private_,
};

enum class Mutability : uint8_t
{
    pure,
    view,
    nonpayable,
    payable,
};

struct Param
{
    std::string name;
    ValueType type = ValueType::uint256;
};

/// The contract function definition.
struct Function
{
    std::string name;
    std::vector<Param> params;
    Visibility visibility = Visibility::public_;
    Mutability mutability = Mutability::nonpayable;

    /// Can be overridden in a derived contract.
    bool is_virtual = false;

    /// Overrides a function inherited from a base contract.
    bool is_override = false;

    /// The function is protected by the reentrancy guard of the storage owner.
    bool non_reentrant = false;

    std::vector<Instruction> code;

    /// Checks if the function can be called from another contract or from the host.
    [[nodiscard]] bool is_externally_visible() const noexcept
    {
        return visibility == Visibility::external || visibility == Visibility::public_;
    }

    /// Checks if the function executes in static mode.
    [[nodiscard]] bool is_static() const noexcept
    {
        return mutability == Mutability::pure || mutability == Mutability::view;
    }
};

struct EventField
{
    std::string name;
    bool indexed = false;

    bool operator==(const EventField&) const noexcept = default;
};

/// The event declaration.
struct EventDecl
{
    std::string name;
    std::vector<EventField> fields;

    bool operator==(const EventDecl&) const noexcept = default;

    [[nodiscard]] size_t num_indexed() const noexcept;

    /// Returns the declared field with the given name or null.
    [[nodiscard]] const EventField* find_field(std::string_view field_name) const noexcept;
};

/// The contract source: functions and events declared by the contract
/// and the list of inherited contracts.
struct ContractDefinition
{
    std::string name;

    /// The base contracts, linearized: the most base contract first.
    std::vector<std::shared_ptr<const ContractDefinition>> bases;

    std::vector<Function> functions;
    std::vector<EventDecl> events;
};

/// The flattened, immutable contract code with the final dispatch table.
struct ContractCode
{
    std::string name;

    /// The function dispatch table (without constructors).
    std::map<std::string, Function, std::less<>> functions;

    std::map<std::string, EventDecl, std::less<>> events;

    /// The constructors to execute at deployment, the most base contract first.
    std::vector<Function> constructors;

    [[nodiscard]] const Function* find_function(std::string_view fn_name) const noexcept;

    [[nodiscard]] const EventDecl* find_event(std::string_view event_name) const noexcept;

    /// Returns the function executed for the given call name:
    /// the function itself or the fallback function when the name is not found.
    [[nodiscard]] const Function* resolve(std::string_view fn_name) const noexcept;

    /// The most derived constructor or null if the contract declares none.
    [[nodiscard]] const Function* constructor() const noexcept
    {
        return constructors.empty() ? nullptr : &constructors.back();
    }
};

enum class CodeValidationError
{
    success,
    duplicate_function,
    missing_virtual,
    missing_override,
    override_without_base,
    conflicting_event,
    too_many_indexed_fields,
    duplicate_event_field,
    undeclared_event,
    event_field_count,
    undeclared_function,
    external_function_invoked,
    argument_count,
    invalid_jump_destination,
    invalid_stack_index,
    invalid_argument_index,
    state_mutation_in_view,
    state_access_in_pure,
    call_in_constructor,
    invalid_fallback,
    invalid_constructor,
    base_constructor_with_parameters,
    undefined_instruction,
};

/// Flattens the contract definition with all its bases into the final dispatch table
/// and validates every function body.
[[nodiscard]] std::variant<std::shared_ptr<const ContractCode>, CodeValidationError> flatten(
    const ContractDefinition& definition);

/// Validates a single function body against the flattened contract code.
[[nodiscard]] CodeValidationError validate_function(
    const ContractCode& code, const Function& fn, bool is_constructor) noexcept;

/// Validates the event declaration.
[[nodiscard]] CodeValidationError validate_event(const EventDecl& event) noexcept;

/// Returns the error message corresponding to an error code.
[[nodiscard]] std::string_view get_error_message(CodeValidationError err) noexcept;

/// Output operator for CodeValidationError.
std::ostream& operator<<(std::ostream& os, CodeValidationError err) noexcept;

}  // namespace gasket
