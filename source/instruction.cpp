// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <opack/instruction.h>

#include <opack/baked_type.h>

#include <sstream>

namespace opack {

const char* to_string(OpCode op) noexcept
{
    switch (op) {
    case OpCode::CreateObject:             return "CreateObject";
    case OpCode::CreateArray:              return "CreateArray";
    case OpCode::CreateNone:               return "CreateNone";
    case OpCode::CreateBool:               return "CreateBool";
    case OpCode::CreateNumber:             return "CreateNumber";
    case OpCode::CreateString:             return "CreateString";
    case OpCode::CloneValue:               return "CloneValue";
    case OpCode::ModifyObject:             return "ModifyObject";
    case OpCode::ModifyObjectWithConstKey: return "ModifyObjectWithConstKey";
    case OpCode::ModifyArray:              return "ModifyArray";
    case OpCode::ModifyArrayWithIndex:     return "ModifyArrayWithIndex";
    case OpCode::PushConst:                return "PushConst";
    case OpCode::PushField:                return "PushField";
    case OpCode::PushSelf:                 return "PushSelf";
    case OpCode::PushElement:              return "PushElement";
    case OpCode::PushEntryKey:             return "PushEntryKey";
    case OpCode::PushEntryValue:           return "PushEntryValue";
    case OpCode::PushIndex:                return "PushIndex";
    case OpCode::Call:                     return "Call";
    case OpCode::ApplyTransformer:         return "ApplyTransformer";
    case OpCode::ExpectObject:             return "ExpectObject";
    case OpCode::ExpectArray:              return "ExpectArray";
    case OpCode::LoadWithConstKey:         return "LoadWithConstKey";
    case OpCode::LoadElement:              return "LoadElement";
    case OpCode::LoadEntryKey:             return "LoadEntryKey";
    case OpCode::LoadEntryValue:           return "LoadEntryValue";
    case OpCode::PopValue:                 return "PopValue";
    case OpCode::ReadBool:                 return "ReadBool";
    case OpCode::ReadNumber:               return "ReadNumber";
    case OpCode::ReadString:               return "ReadString";
    case OpCode::PushFieldSlot:            return "PushFieldSlot";
    case OpCode::PushElementSlot:          return "PushElementSlot";
    case OpCode::EmplaceEntry:             return "EmplaceEntry";
    case OpCode::Store:                    return "Store";
    case OpCode::AssignValue:              return "AssignValue";
    case OpCode::CallInto:                 return "CallInto";
    case OpCode::RevertTransformer:        return "RevertTransformer";
    case OpCode::ResizeSequence:           return "ResizeSequence";
    case OpCode::ClearMapping:             return "ClearMapping";
    }
    return "<unknown>";
}

// ============================================================
// Instruction factories
// ============================================================

Instruction Instruction::create_array(bool presized)
{
    Instruction i{OpCode::CreateArray};
    i.flag = presized;
    return i;
}

Instruction Instruction::modify_object(std::string key)
{
    Instruction i{OpCode::ModifyObjectWithConstKey};
    i.key = std::move(key);
    return i;
}

Instruction Instruction::modify_array(std::size_t index)
{
    Instruction i{OpCode::ModifyArrayWithIndex};
    i.index = index;
    return i;
}

Instruction Instruction::push_const(Scalar constant)
{
    Instruction i{OpCode::PushConst};
    i.constant = std::move(constant);
    return i;
}

Instruction Instruction::push_field(const Property& property, bool raw)
{
    Instruction i{OpCode::PushField};
    i.property = &property;
    i.flag = raw;
    return i;
}

Instruction Instruction::push_element(bool raw)
{
    Instruction i{OpCode::PushElement};
    i.flag = raw;
    return i;
}

Instruction Instruction::push_entry_value(bool raw)
{
    Instruction i{OpCode::PushEntryValue};
    i.flag = raw;
    return i;
}

Instruction Instruction::apply_transformer(const Transformer& transformer)
{
    Instruction i{OpCode::ApplyTransformer};
    i.transformer = &transformer;
    return i;
}

Instruction Instruction::load_with_const_key(std::string key, std::size_t skip)
{
    Instruction i{OpCode::LoadWithConstKey};
    i.key = std::move(key);
    i.index = skip;
    return i;
}

Instruction Instruction::push_field_slot(const Property& property)
{
    Instruction i{OpCode::PushFieldSlot};
    i.property = &property;
    return i;
}

Instruction Instruction::call_into(const TypeInfo& type)
{
    Instruction i{OpCode::CallInto};
    i.type = &type;
    return i;
}

Instruction Instruction::revert_transformer(const Transformer& transformer)
{
    Instruction i{OpCode::RevertTransformer};
    i.transformer = &transformer;
    return i;
}

std::string Instruction::to_string() const
{
    std::ostringstream oss;
    oss << opack::to_string(op);
    if (property) oss << " ." << property->name;
    if (type) oss << " <" << type->name << ">";
    if (!key.empty()) oss << " \"" << key << "\"";

    switch (op) {
    case OpCode::ModifyArrayWithIndex:
    case OpCode::LoadWithConstKey:
        oss << " " << index;
        break;
    case OpCode::PushConst:
        oss << " " << scalar_kind_name(constant);
        break;
    default:
        break;
    }
    if (flag) oss << " +";
    return oss.str();
}

std::string Program::to_string() const
{
    std::ostringstream oss;
    for (std::size_t i = 0; i < code.size(); ++i) {
        if (i == loop_begin) oss << "  loop:\n";
        oss << "  " << i << ": " << code[i].to_string() << "\n";
    }
    return oss.str();
}

} // namespace opack
