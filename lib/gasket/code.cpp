// gasket: Deterministic contract execution engine
// Copyright 2026 The gasket Authors.
// SPDX-License-Identifier: Apache-2.0

#include "code.hpp"
#include "instructions_traits.hpp"
#include <algorithm>
#include <set>
#include <unordered_set>

namespace gasket
{
namespace
{
constexpr uint256 MAX_STACK_INDEX = 16;

class Flattener
{
    ContractCode m_code;
    std::set<const ContractDefinition*> m_visited;

    CodeValidationError add_events(const ContractDefinition& def)
    {
        for (const auto& event : def.events)
        {
            if (const auto err = validate_event(event); err != CodeValidationError::success)
                return err;

            const auto [it, inserted] = m_code.events.try_emplace(event.name, event);
            if (!inserted && it->second != event)
                return CodeValidationError::conflicting_event;
        }
        return CodeValidationError::success;
    }

    CodeValidationError add_functions(const ContractDefinition& def, bool is_most_derived)
    {
        std::unordered_set<std::string_view> declared;
        for (const auto& fn : def.functions)
        {
            if (!declared.insert(fn.name).second)
                return CodeValidationError::duplicate_function;

            if (fn.name == CONSTRUCTOR_NAME)
            {
                if (fn.visibility != Visibility::public_ || fn.is_static())
                    return CodeValidationError::invalid_constructor;
                if (!is_most_derived && !fn.params.empty())
                    return CodeValidationError::base_constructor_with_parameters;
                m_code.constructors.push_back(fn);
                continue;
            }

            if (fn.name == FALLBACK_NAME &&
                (fn.visibility != Visibility::external || !fn.params.empty()))
                return CodeValidationError::invalid_fallback;

            const auto it = m_code.functions.find(fn.name);
            if (it == m_code.functions.end())
            {
                if (fn.is_override)
                    return CodeValidationError::override_without_base;
                m_code.functions.emplace(fn.name, fn);
                continue;
            }

            if (!fn.is_override)
                return CodeValidationError::missing_override;
            if (!it->second.is_virtual)
                return CodeValidationError::missing_virtual;
            it->second = fn;
        }
        return CodeValidationError::success;
    }

    CodeValidationError add(  // NOLINT(misc-no-recursion)
        const ContractDefinition& def, bool is_most_derived)
    {
        for (const auto& base : def.bases)
        {
            if (base == nullptr || !m_visited.insert(base.get()).second)
                continue;
            if (const auto err = add(*base, false); err != CodeValidationError::success)
                return err;
        }

        if (const auto err = add_events(def); err != CodeValidationError::success)
            return err;
        return add_functions(def, is_most_derived);
    }

public:
    explicit Flattener(std::string name) { m_code.name = std::move(name); }

    std::variant<std::shared_ptr<const ContractCode>, CodeValidationError> run(
        const ContractDefinition& definition)
    {
        m_visited.insert(&definition);
        if (const auto err = add(definition, true); err != CodeValidationError::success)
            return err;

        for (const auto& [_, fn] : m_code.functions)
        {
            if (const auto err = validate_function(m_code, fn, false);
                err != CodeValidationError::success)
                return err;
        }
        for (const auto& ctor : m_code.constructors)
        {
            if (const auto err = validate_function(m_code, ctor, true);
                err != CodeValidationError::success)
                return err;
        }

        return std::make_shared<const ContractCode>(std::move(m_code));
    }
};
}  // namespace

std::string_view to_string(ValueType type) noexcept
{
    switch (type)
    {
    case ValueType::uint256:
        return "uint256";
    case ValueType::address:
        return "address";
    case ValueType::boolean:
        return "bool";
    }
    return "<unknown>";
}

size_t EventDecl::num_indexed() const noexcept
{
    return static_cast<size_t>(std::ranges::count_if(fields, &EventField::indexed));
}

const EventField* EventDecl::find_field(std::string_view field_name) const noexcept
{
    const auto it = std::ranges::find(fields, field_name, &EventField::name);
    return it != fields.end() ? &*it : nullptr;
}

const Function* ContractCode::find_function(std::string_view fn_name) const noexcept
{
    const auto it = functions.find(fn_name);
    return it != functions.end() ? &it->second : nullptr;
}

const EventDecl* ContractCode::find_event(std::string_view event_name) const noexcept
{
    const auto it = events.find(event_name);
    return it != events.end() ? &it->second : nullptr;
}

const Function* ContractCode::resolve(std::string_view fn_name) const noexcept
{
    if (!fn_name.empty())
    {
        if (const auto* fn = find_function(fn_name); fn != nullptr)
            return fn;
    }
    return find_function(FALLBACK_NAME);
}

CodeValidationError validate_event(const EventDecl& event) noexcept
{
    if (event.num_indexed() > MAX_INDEXED_FIELDS)
        return CodeValidationError::too_many_indexed_fields;

    for (auto it = event.fields.begin(); it != event.fields.end(); ++it)
    {
        if (std::find_if(std::next(it), event.fields.end(),
                [&](const EventField& f) { return f.name == it->name; }) != event.fields.end())
            return CodeValidationError::duplicate_event_field;
    }
    return CodeValidationError::success;
}

CodeValidationError validate_function(
    const ContractCode& code, const Function& fn, bool is_constructor) noexcept
{
    const auto code_size = static_cast<int64_t>(fn.code.size());
    for (int64_t pc = 0; pc < code_size; ++pc)
    {
        const auto& instr = fn.code[static_cast<size_t>(pc)];
        const auto& tr = instr::traits[instr.opcode];
        if (tr.name == nullptr)
            return CodeValidationError::undefined_instruction;

        if (fn.is_static() && tr.is_state_mutating)
            return CodeValidationError::state_mutation_in_view;
        if (fn.mutability == Mutability::pure && tr.is_state_reading)
            return CodeValidationError::state_access_in_pure;
        if (is_constructor && tr.is_external_call)
            return CodeValidationError::call_in_constructor;

        switch (instr.opcode)
        {
        case OP_DUP:
        case OP_SWAP:
            if (instr.immediate == 0 || instr.immediate > MAX_STACK_INDEX)
                return CodeValidationError::invalid_stack_index;
            break;

        case OP_ARG:
            if (instr.immediate >= fn.params.size())
                return CodeValidationError::invalid_argument_index;
            break;

        case OP_JUMP:
        case OP_JUMPI:
        {
            // Jumping to the end of the code is allowed and stops the execution.
            const auto dst = pc + instr.offset;
            if (dst < 0 || dst > code_size)
                return CodeValidationError::invalid_jump_destination;
            break;
        }

        case OP_EMIT:
        {
            const auto* event = code.find_event(instr.name);
            if (event == nullptr)
                return CodeValidationError::undeclared_event;
            if (instr.immediate != event->fields.size())
                return CodeValidationError::event_field_count;
            break;
        }

        case OP_INVOKE:
        {
            const auto* target = code.find_function(instr.name);
            if (target == nullptr)
                return CodeValidationError::undeclared_function;
            if (target->visibility == Visibility::external)
                return CodeValidationError::external_function_invoked;
            if (instr.immediate != target->params.size())
                return CodeValidationError::argument_count;
            if (fn.mutability == Mutability::pure && target->mutability != Mutability::pure)
                return CodeValidationError::state_access_in_pure;
            if (fn.is_static() && !target->is_static())
                return CodeValidationError::state_mutation_in_view;
            break;
        }

        default:
            break;
        }
    }
    return CodeValidationError::success;
}

std::variant<std::shared_ptr<const ContractCode>, CodeValidationError> flatten(
    const ContractDefinition& definition)
{
    return Flattener{definition.name}.run(definition);
}

std::string_view get_error_message(CodeValidationError err) noexcept
{
    switch (err)
    {
    case CodeValidationError::success:
        return "success";
    case CodeValidationError::duplicate_function:
        return "duplicate_function";
    case CodeValidationError::missing_virtual:
        return "missing_virtual";
    case CodeValidationError::missing_override:
        return "missing_override";
    case CodeValidationError::override_without_base:
        return "override_without_base";
    case CodeValidationError::conflicting_event:
        return "conflicting_event";
    case CodeValidationError::too_many_indexed_fields:
        return "too_many_indexed_fields";
    case CodeValidationError::duplicate_event_field:
        return "duplicate_event_field";
    case CodeValidationError::undeclared_event:
        return "undeclared_event";
    case CodeValidationError::event_field_count:
        return "event_field_count";
    case CodeValidationError::undeclared_function:
        return "undeclared_function";
    case CodeValidationError::external_function_invoked:
        return "external_function_invoked";
    case CodeValidationError::argument_count:
        return "argument_count";
    case CodeValidationError::invalid_jump_destination:
        return "invalid_jump_destination";
    case CodeValidationError::invalid_stack_index:
        return "invalid_stack_index";
    case CodeValidationError::invalid_argument_index:
        return "invalid_argument_index";
    case CodeValidationError::state_mutation_in_view:
        return "state_mutation_in_view";
    case CodeValidationError::state_access_in_pure:
        return "state_access_in_pure";
    case CodeValidationError::call_in_constructor:
        return "call_in_constructor";
    case CodeValidationError::invalid_fallback:
        return "invalid_fallback";
    case CodeValidationError::invalid_constructor:
        return "invalid_constructor";
    case CodeValidationError::base_constructor_with_parameters:
        return "base_constructor_with_parameters";
    case CodeValidationError::undefined_instruction:
        return "undefined_instruction";
    }
    return "<unknown>";
}

std::ostream& operator<<(std::ostream& os, CodeValidationError err) noexcept
{
    os << get_error_message(err);
    return os;
}
}  // namespace gasket
