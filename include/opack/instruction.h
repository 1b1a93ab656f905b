// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file instruction.h
/// @brief Instruction set of the opack virtual machine.
///
/// A Program is a flat instruction sequence bound to one native type and one
/// direction. The VM keeps three stacks per run:
///
/// - scratch: native scalars and references to native objects or slots
/// - results: Values under construction (serialize), or borrowed pointers to
///   the input nodes under consumption (deserialize)
/// - frames:  one per program invocation
///
/// Sequence and mapping programs repeat their body (from `loop_begin` to the
/// end) once per element; object programs run once.

#pragma once

#include <opack/opack_config.h>

#include <opack/api.h>
#include <opack/type_info.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace opack {

class Transformer;
struct Property;

enum class OpCode : uint8_t {
    // ===== Serialize: build Values =====
    CreateObject,              ///< push an empty Object
    CreateArray,               ///< push an Array; `flag`: pre-size to the frame's length
    CreateNone,                ///< push None
    CreateBool,                ///< pop scalar, push Bool (empty -> None)
    CreateNumber,              ///< pop scalar, push Number (empty -> None)
    CreateString,              ///< pop scalar, push String (empty -> None)
    CloneValue,                ///< pop a reference to a Value, push its clone
    ModifyObject,              ///< pop value and key, put into the Object below
    ModifyObjectWithConstKey,  ///< pop value, put under `key` into the Object below
    ModifyArray,               ///< pop value and a scratch index, set into the Array below
    ModifyArrayWithIndex,      ///< pop value, set at `index` into the Array below

    // ===== Serialize: read natives =====
    PushConst,                 ///< push `constant` onto scratch
    PushField,                 ///< push `property` of the frame object; `flag`: raw reference
    PushSelf,                  ///< push a reference to the frame object
    PushElement,               ///< push the current sequence element; `flag`: raw reference
    PushEntryKey,              ///< push the current mapping key
    PushEntryValue,            ///< push the current mapping value; `flag`: raw reference
    PushIndex,                 ///< push the iteration counter as a Number
    Call,                      ///< pop a reference, run its type's program (null -> None)
    ApplyTransformer,          ///< pop a reference, push transformer->serialize(...)

    // ===== Deserialize: walk the input =====
    ExpectObject,              ///< the frame's input must be an Object
    ExpectArray,               ///< the frame's input must be an Array
    LoadWithConstKey,          ///< push input[`key`]; if absent skip the next `index` instructions
    LoadElement,               ///< push the current input Array element
    LoadEntryKey,              ///< push the current input Object entry key
    LoadEntryValue,            ///< push the current input Object entry value
    PopValue,                  ///< drop the top input node

    // ===== Deserialize: write natives =====
    ReadBool,                  ///< pop an input node, push its bool (None -> empty)
    ReadNumber,                ///< pop an input node, push its Number (None -> empty)
    ReadString,                ///< pop an input node, push its string (None -> empty)
    PushFieldSlot,             ///< push a writable reference to `property` of the frame object
    PushElementSlot,           ///< push a writable reference to the current sequence element
    EmplaceEntry,              ///< pop a scalar key, push a slot for its mapped value
    Store,                     ///< pop a scalar and a slot, write with numeric narrowing
    AssignValue,               ///< pop a Value slot, clone the top input node into it
    CallInto,                  ///< pop a slot, run `type`'s program on it (None resets pointers)
    RevertTransformer,         ///< pop a slot, transformer->deserialize(top input, slot)
    ResizeSequence,            ///< resize the frame's sequence to the input Array size
    ClearMapping,              ///< clear the frame's mapping, loop over the input Object
};

[[nodiscard]] OPACK_API const char* to_string(OpCode op) noexcept;

/// @brief One VM instruction with its (opcode specific) operands
struct OPACK_API Instruction {
    OpCode op;
    const Property* property = nullptr;
    const TypeInfo* type = nullptr;
    const Transformer* transformer = nullptr;
    Scalar constant;
    std::string key;
    std::size_t index = 0;
    bool flag = false;

    explicit Instruction(OpCode op) : op(op) {}

    [[nodiscard]] static Instruction create_array(bool presized);
    [[nodiscard]] static Instruction modify_object(std::string key);
    [[nodiscard]] static Instruction modify_array(std::size_t index);
    [[nodiscard]] static Instruction push_const(Scalar constant);
    [[nodiscard]] static Instruction push_field(const Property& property, bool raw = false);
    [[nodiscard]] static Instruction push_element(bool raw = false);
    [[nodiscard]] static Instruction push_entry_value(bool raw = false);
    [[nodiscard]] static Instruction apply_transformer(const Transformer& transformer);
    [[nodiscard]] static Instruction load_with_const_key(std::string key, std::size_t skip);
    [[nodiscard]] static Instruction push_field_slot(const Property& property);
    [[nodiscard]] static Instruction call_into(const TypeInfo& type);
    [[nodiscard]] static Instruction revert_transformer(const Transformer& transformer);

    /// Human-readable form, for diagnostics
    [[nodiscard]] std::string to_string() const;
};

/// @brief Instruction sequence for one type and direction
struct OPACK_API Program {
    static constexpr std::size_t no_loop = static_cast<std::size_t>(-1);

    std::vector<Instruction> code;
    std::size_t loop_begin = no_loop;

    [[nodiscard]] bool loops() const noexcept { return loop_begin != no_loop; }

    Program& emit(Instruction instruction)
    {
        code.push_back(std::move(instruction));
        return *this;
    }

    Program& emit(OpCode op) { return emit(Instruction{op}); }

    /// Elements are processed from here on, once per element
    Program& begin_loop() noexcept
    {
        loop_begin = code.size();
        return *this;
    }

    [[nodiscard]] std::string to_string() const;
};

} // namespace opack
