// gasket: Deterministic contract execution engine
// Copyright 2026 The gasket Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cassert>
#include <string>
#include <system_error>

namespace gasket
{
/// The outcome of a deployment, a call or one of the host operations.
enum ErrorCode : int
{
    SUCCESS = 0,
    OUT_OF_GAS,
    REQUIRE_FAILED,
    ASSERT_FAILED,
    REVERTED,
    REENTRANCY_BLOCKED,
    VISIBILITY_VIOLATION,
    PAYABLE_VIOLATION,
    NO_SUCH_CONTRACT,
    DEPLOYMENT_ERROR,
    ARGUMENT_MISMATCH,
    STATIC_MODE_VIOLATION,
    INSUFFICIENT_BALANCE,
    CALL_DEPTH_EXCEEDED,
    STACK_UNDERFLOW,
    STACK_OVERFLOW,
    BAD_JUMP_DESTINATION,
    MEMORY_OUT_OF_BOUNDS,
    INVALID_INSTRUCTION,
    FILTER_NOT_INDEXED,
    UNKNOWN_ERROR,
};

/// Checks if the failure consumes all gas of the frame it happened in.
///
/// These are the "assert-class" failures. All other failures (require, revert and the
/// failures detected before the frame starts executing) leave the remaining gas untouched.
constexpr bool burns_all_gas(ErrorCode ec) noexcept
{
    switch (ec)
    {
    case OUT_OF_GAS:
    case ASSERT_FAILED:
    case STACK_UNDERFLOW:
    case STACK_OVERFLOW:
    case BAD_JUMP_DESTINATION:
    case MEMORY_OUT_OF_BOUNDS:
    case STATIC_MODE_VIOLATION:
    case INVALID_INSTRUCTION:
        return true;
    default:
        return false;
    }
}

/// Obtains a reference to the static error category object for gasket errors.
inline const std::error_category& gasket_category() noexcept
{
    struct Category : std::error_category
    {
        [[nodiscard]] const char* name() const noexcept final { return "gasket"; }

        [[nodiscard]] std::string message(int ev) const noexcept final
        {
            switch (ev)
            {
            case SUCCESS:
                return "";
            case OUT_OF_GAS:
                return "out of gas";
            case REQUIRE_FAILED:
                return "require failed";
            case ASSERT_FAILED:
                return "assert failed";
            case REVERTED:
                return "reverted";
            case REENTRANCY_BLOCKED:
                return "reentrancy blocked";
            case VISIBILITY_VIOLATION:
                return "function not visible to the caller";
            case PAYABLE_VIOLATION:
                return "value attached to non-payable function";
            case NO_SUCH_CONTRACT:
                return "no such contract";
            case DEPLOYMENT_ERROR:
                return "deployment error";
            case ARGUMENT_MISMATCH:
                return "arguments do not match function parameters";
            case STATIC_MODE_VIOLATION:
                return "state modification in static context";
            case INSUFFICIENT_BALANCE:
                return "insufficient balance for value transfer";
            case CALL_DEPTH_EXCEEDED:
                return "call depth exceeded";
            case STACK_UNDERFLOW:
                return "stack underflow";
            case STACK_OVERFLOW:
                return "stack overflow";
            case BAD_JUMP_DESTINATION:
                return "bad jump destination";
            case MEMORY_OUT_OF_BOUNDS:
                return "memory access out of bounds";
            case INVALID_INSTRUCTION:
                return "invalid instruction";
            case FILTER_NOT_INDEXED:
                return "event filter uses a non-indexed field";
            case UNKNOWN_ERROR:
                return "Unknown error";
            default:
                assert(false);
                return "Wrong error code";
            }
        }
    };

    static const Category category_instance;
    return category_instance;
}

/// Creates error_code object out of a gasket error code value.
/// This is used by std::error_code to implement implicit conversion
/// gasket::ErrorCode -> std::error_code.
inline std::error_code make_error_code(ErrorCode errc) noexcept
{
    return {errc, gasket_category()};
}
}  // namespace gasket

template <>
struct std::is_error_code_enum<gasket::ErrorCode> : std::true_type
{};
