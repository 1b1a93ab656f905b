// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <opack/baker.h>

#include <opack/diagnostics.h>
#include <opack/errors.h>
#include <opack/transformer.h>

#include <string>
#include <vector>

namespace opack {

namespace {

// ============================================================
// Validation
// ============================================================

bool is_key_type(const TypeInfo& type) noexcept
{
    return is_primitive(type) || type.kind == TypeKind::String;
}

void validate_value_type(const TypeInfo& type, const std::string& where)
{
    switch (type.kind) {
    case TypeKind::Bool:
    case TypeKind::Int8:
    case TypeKind::Int16:
    case TypeKind::Int32:
    case TypeKind::Int64:
    case TypeKind::UInt8:
    case TypeKind::UInt16:
    case TypeKind::UInt32:
    case TypeKind::UInt64:
    case TypeKind::Float:
    case TypeKind::Double:
    case TypeKind::String:
    case TypeKind::Value:
        return;

    case TypeKind::Optional:
        if (!is_wrapper(type)) {
            throw TypeNotAllowedError(where + ": " + type.name +
                                      " is not allowed, std::optional must wrap a primitive type");
        }
        return;

    case TypeKind::Object:
        if (!type.registered) {
            throw TypeNotAllowedError(where + ": " + type.name + " is not registered with reflect<T>()");
        }
        return;

    case TypeKind::Sequence:
        validate_value_type(*type.element, where + "[]");
        return;

    case TypeKind::Mapping:
        if (!is_key_type(*type.key)) {
            throw TypeNotAllowedError(where + ": " + type.name +
                                      " is not allowed, mapping keys must be primitive or std::string");
        }
        validate_value_type(*type.element, where + "{}");
        return;

    case TypeKind::Pointer:
        if (type.element->kind != TypeKind::Object) {
            throw TypeNotAllowedError(where + ": " + type.name +
                                      " is not allowed, smart pointers must point to a registered class");
        }
        validate_value_type(*type.element, where);
        return;

    case TypeKind::Unsupported:
        break;
    }
    throw TypeNotAllowedError(where + ": " + type.name + " is not allowed type");
}

// ============================================================
// Descriptor
// ============================================================

std::vector<std::shared_ptr<const Transformer>> collect_transformers(const TypeInfo& type)
{
    std::vector<std::shared_ptr<const Transformer>> result;
    if (type.transformer) {
        result.push_back(type.transformer);
    }
    for (const TypeInfo* ancestor = type.base; ancestor; ancestor = ancestor->base) {
        if (ancestor->transformer && ancestor->transformer_inheritable) {
            result.push_back(ancestor->transformer);
        }
    }
    return result;
}

std::vector<void* (*)(void*)> upcast_chain(const TypeInfo& from, const TypeInfo& to)
{
    std::vector<void* (*)(void*)> chain;
    for (const TypeInfo* t = &from; t != &to; t = t->base) {
        chain.push_back(t->upcast);
    }
    return chain;
}

/// Field types are only validated when the generated code will touch them,
/// i.e. not under a class-level transformer
std::vector<Property> build_properties(const TypeInfo& type, bool validate)
{
    std::vector<Property> properties;
    for (const FieldInfo* field : enumerate_fields(type)) {
        Property property;
        property.field = field;
        property.name = field->name;
        property.explicit_type = field->explicit_type;
        property.type = field->explicit_type ? field->explicit_type : field->type;
        property.upcasts = upcast_chain(type, *field->owner);

        if (field->transformer) {
            property.transformer = field->transformer;
        } else if (field->type->kind == TypeKind::Object) {
            auto inherited = collect_transformers(*field->type);
            if (!inherited.empty()) property.transformer = inherited.front();
        }

        const std::string where = type.name + "." + field->name;
        if (validate && !property.transformer) {
            validate_value_type(*field->type, where);
        }
        if (field->explicit_type) {
            const TypeInfo& pointee = *field->type->element;
            if (field->explicit_type->kind != TypeKind::Object || !field->explicit_type->registered ||
                !field->explicit_type->derives_from(pointee)) {
                throw TypeNotAllowedError(where + ": explicit type " + field->explicit_type->name +
                                          " is not a registered class derived from " + pointee.name);
            }
        }
        properties.push_back(std::move(property));
    }
    return properties;
}

// ============================================================
// Code generation
// ============================================================

/// The scalar kind a Value is created from / read into
const TypeInfo& scalar_target(const TypeInfo& type)
{
    return type.kind == TypeKind::Optional ? *type.element : type;
}

OpCode create_op(const TypeInfo& type)
{
    const TypeInfo& target = scalar_target(type);
    if (target.kind == TypeKind::Bool) return OpCode::CreateBool;
    if (target.kind == TypeKind::String) return OpCode::CreateString;
    return OpCode::CreateNumber;
}

OpCode read_op(const TypeInfo& type)
{
    const TypeInfo& target = scalar_target(type);
    if (target.kind == TypeKind::Bool) return OpCode::ReadBool;
    if (target.kind == TypeKind::String) return OpCode::ReadString;
    return OpCode::ReadNumber;
}

/// Emit code leaving the Value form of one native value on the result stack.
/// `push(raw)` is the instruction that reads the native value.
template <typename PushFn>
void emit_serialize_value(Program& program, PushFn push, const TypeInfo& type, const Transformer* transformer)
{
    if (transformer) {
        program.emit(push(true));
        program.emit(Instruction::apply_transformer(*transformer));
        return;
    }

    program.emit(push(false));
    switch (type.kind) {
    case TypeKind::Value:
        program.emit(OpCode::CloneValue);
        break;
    case TypeKind::Object:
    case TypeKind::Sequence:
    case TypeKind::Mapping:
    case TypeKind::Pointer:
        program.emit(OpCode::Call);
        break;
    default:
        program.emit(create_op(type));
        break;
    }
}

/// Emit code consuming the top input node into the slot on top of scratch.
/// Scalars consume the node through Read*; everything else pops it explicitly.
void emit_deserialize_value(std::vector<Instruction>& out,
                            const TypeInfo& type,
                            const TypeInfo* explicit_type,
                            const Transformer* transformer)
{
    if (transformer) {
        out.push_back(Instruction::revert_transformer(*transformer));
        out.emplace_back(OpCode::PopValue);
        return;
    }

    switch (type.kind) {
    case TypeKind::Value:
        out.emplace_back(OpCode::AssignValue);
        out.emplace_back(OpCode::PopValue);
        break;
    case TypeKind::Object:
    case TypeKind::Sequence:
    case TypeKind::Mapping:
        out.push_back(Instruction::call_into(type));
        out.emplace_back(OpCode::PopValue);
        break;
    case TypeKind::Pointer:
        out.push_back(Instruction::call_into(explicit_type ? *explicit_type : *type.element));
        out.emplace_back(OpCode::PopValue);
        break;
    default:
        out.emplace_back(read_op(type));
        out.emplace_back(OpCode::Store);
        break;
    }
}

void compile_transformed(const BakedType& baked, Program& serialize, Program& deserialize)
{
    const Transformer& transformer = *baked.transformers().front();

    serialize.emit(OpCode::PushSelf);
    serialize.emit(Instruction::apply_transformer(transformer));

    deserialize.emit(OpCode::PushSelf);
    deserialize.emit(Instruction::revert_transformer(transformer));
}

void compile_object(const BakedType& baked, Program& serialize, Program& deserialize)
{
    serialize.emit(OpCode::CreateObject);
    deserialize.emit(OpCode::ExpectObject);

    for (const Property& property : baked.properties()) {
        const TypeInfo& declared = *property.field->type;
        const Transformer* transformer = property.transformer.get();

        emit_serialize_value(
            serialize,
            [&property](bool raw) { return Instruction::push_field(property, raw); },
            declared,
            transformer);
        serialize.emit(Instruction::modify_object(property.name));

        std::vector<Instruction> block;
        block.push_back(Instruction::push_field_slot(property));
        emit_deserialize_value(block, declared, property.explicit_type, transformer);

        deserialize.emit(Instruction::load_with_const_key(property.name, block.size()));
        for (auto& instruction : block) {
            deserialize.emit(std::move(instruction));
        }
    }
}

void compile_sequence(const TypeInfo& type, Program& serialize, Program& deserialize)
{
    const TypeInfo& element = *type.element;

    serialize.emit(Instruction::create_array(true));
    serialize.begin_loop();
    emit_serialize_value(
        serialize, [](bool raw) { return Instruction::push_element(raw); }, element, nullptr);
    serialize.emit(OpCode::PushIndex);
    serialize.emit(OpCode::ModifyArray);

    deserialize.emit(OpCode::ExpectArray);
    deserialize.emit(OpCode::ResizeSequence);
    deserialize.begin_loop();
    deserialize.emit(OpCode::LoadElement);
    deserialize.emit(OpCode::PushElementSlot);
    std::vector<Instruction> block;
    emit_deserialize_value(block, element, nullptr, nullptr);
    for (auto& instruction : block) {
        deserialize.emit(std::move(instruction));
    }
}

void compile_mapping(const TypeInfo& type, Program& serialize, Program& deserialize)
{
    const TypeInfo& key = *type.key;
    const TypeInfo& element = *type.element;

    serialize.emit(OpCode::CreateObject);
    serialize.begin_loop();
    serialize.emit(OpCode::PushEntryKey);
    serialize.emit(create_op(key));
    emit_serialize_value(
        serialize, [](bool raw) { return Instruction::push_entry_value(raw); }, element, nullptr);
    serialize.emit(OpCode::ModifyObject);

    deserialize.emit(OpCode::ExpectObject);
    deserialize.emit(OpCode::ClearMapping);
    deserialize.begin_loop();
    deserialize.emit(OpCode::LoadEntryKey);
    deserialize.emit(read_op(key));
    deserialize.emit(OpCode::EmplaceEntry);
    deserialize.emit(OpCode::LoadEntryValue);
    std::vector<Instruction> block;
    emit_deserialize_value(block, element, nullptr, nullptr);
    for (auto& instruction : block) {
        deserialize.emit(std::move(instruction));
    }
}

} // anonymous namespace

// ============================================================
// Baker
// ============================================================

Baker::Baker() = default;
Baker::~Baker() = default;

Baker& Baker::global()
{
    static Baker instance;
    return instance;
}

std::shared_ptr<const BakedType> Baker::find(const TypeInfo& type) const
{
    auto snapshot = registry_.load();
    if (const auto* hit = snapshot->find(&type)) {
        return *hit;
    }
    return nullptr;
}

std::size_t Baker::size() const
{
    return registry_.load()->size();
}

std::shared_ptr<const BakedType> Baker::bake(const TypeInfo& type)
{
    if (auto hit = find(type)) {
        return hit;
    }

    std::lock_guard<std::mutex> lock(bake_mutex_);

    // Another thread may have finished while we waited
    if (auto hit = find(type)) {
        return hit;
    }

    std::shared_ptr<const BakedType> baked;
    try {
        baked = compile(type);
    } catch (const Error& e) {
        detail::log_event("baker", "failed to bake " + type.name + ": " + e.what());
        throw;
    }

    registry_.update([&](const registry_map& current) { return current.set(&type, baked); });
    bake_count_.fetch_add(1, std::memory_order_release);

    detail::log_event("baker",
                      "baked " + type.name + " (" + std::to_string(baked->properties().size()) + " properties)");
    return baked;
}

std::shared_ptr<BakedType> Baker::compile(const TypeInfo& type)
{
    switch (type.kind) {
    case TypeKind::Object: {
        if (type.is_interface) {
            throw NotInstantiableError(type.name + " is interface");
        }
        if (type.abstract) {
            throw NotInstantiableError(type.name + " is abstract class");
        }
        if (!type.registered) {
            throw TypeNotAllowedError(type.name + " is not registered with reflect<T>()");
        }

        auto transformers = collect_transformers(type);
        const bool generated = transformers.empty();
        auto baked = std::make_shared<BakedType>(type, std::move(transformers), build_properties(type, generated));
        if (generated) {
            compile_object(*baked, baked->serialize_, baked->deserialize_);
        } else {
            compile_transformed(*baked, baked->serialize_, baked->deserialize_);
        }
        return baked;
    }

    case TypeKind::Sequence: {
        validate_value_type(type, type.name);
        auto baked = std::make_shared<BakedType>(type, std::vector<std::shared_ptr<const Transformer>>{},
                                                 std::vector<Property>{});
        compile_sequence(type, baked->serialize_, baked->deserialize_);
        return baked;
    }

    case TypeKind::Mapping: {
        validate_value_type(type, type.name);
        auto baked = std::make_shared<BakedType>(type, std::vector<std::shared_ptr<const Transformer>>{},
                                                 std::vector<Property>{});
        compile_mapping(type, baked->serialize_, baked->deserialize_);
        return baked;
    }

    default:
        throw TypeNotAllowedError(type.name + " (" + to_string(type.kind) +
                                  ") is compiled into its owner and cannot be baked on its own");
    }
}

} // namespace opack
