// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <opack/type_info.h>

#include <opack/diagnostics.h>
#include <opack/errors.h>

#include <boost/core/demangle.hpp>

#include <algorithm>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace opack {

const char* to_string(TypeKind kind) noexcept
{
    switch (kind) {
    case TypeKind::Bool:        return "Bool";
    case TypeKind::Int8:        return "Int8";
    case TypeKind::Int16:       return "Int16";
    case TypeKind::Int32:       return "Int32";
    case TypeKind::Int64:       return "Int64";
    case TypeKind::UInt8:       return "UInt8";
    case TypeKind::UInt16:      return "UInt16";
    case TypeKind::UInt32:      return "UInt32";
    case TypeKind::UInt64:      return "UInt64";
    case TypeKind::Float:       return "Float";
    case TypeKind::Double:      return "Double";
    case TypeKind::String:      return "String";
    case TypeKind::Optional:    return "Optional";
    case TypeKind::Object:      return "Object";
    case TypeKind::Sequence:    return "Sequence";
    case TypeKind::Mapping:     return "Mapping";
    case TypeKind::Pointer:     return "Pointer";
    case TypeKind::Value:       return "Value";
    case TypeKind::Unsupported: return "Unsupported";
    }
    return "<unknown>";
}

const char* scalar_kind_name(const Scalar& value) noexcept
{
    switch (value.index()) {
    case 0:  return "empty";
    case 1:  return "bool";
    case 2:  return "number";
    case 3:  return "string";
    default: return "<unknown>";
    }
}

// ============================================================
// FieldInfo
// ============================================================

const void* FieldInfo::locate(const void* object) const
{
    if (!object && !is_static) {
        throw FieldAccessError(owner ? owner->name : std::string{}, name, "object is null");
    }
    return locate_fn(const_cast<void*>(object));
}

void* FieldInfo::locate_mutable(void* object) const
{
    if (read_only) {
        throw FieldAccessError(owner ? owner->name : std::string{}, name, "field is read-only");
    }
    if (!object && !is_static) {
        throw FieldAccessError(owner ? owner->name : std::string{}, name, "object is null");
    }
    return locate_fn(object);
}

// ============================================================
// TypeInfo
// ============================================================

TypeInfo::TypeInfo(TypeKind kind, std::type_index id, std::string name)
    : kind(kind)
    , id(id)
    , name(std::move(name))
{
}

bool TypeInfo::derives_from(const TypeInfo& other) const noexcept
{
    for (const TypeInfo* t = this; t; t = t->base) {
        if (t == &other) return true;
    }
    return false;
}

void* TypeInfo::upcast_to(void* object, const TypeInfo& target) const noexcept
{
    const TypeInfo* t = this;
    void* p = object;
    while (t && t != &target) {
        if (!t->upcast) return nullptr;
        p = p ? t->upcast(p) : nullptr;
        t = t->base;
    }
    return t ? p : nullptr;
}

// ============================================================
// TypeRegistry
// ============================================================

struct TypeRegistry::Impl {
    mutable std::shared_mutex mutex;
    std::vector<std::unique_ptr<TypeInfo>> owned;
    std::unordered_map<std::type_index, const TypeInfo*> by_id;
};

TypeRegistry::TypeRegistry() : impl_(std::make_unique<Impl>()) {}
TypeRegistry::~TypeRegistry() = default;

TypeRegistry& TypeRegistry::global()
{
    static TypeRegistry instance;
    return instance;
}

TypeInfo& TypeRegistry::adopt(std::unique_ptr<TypeInfo> info)
{
    std::unique_lock lock(impl_->mutex);
    TypeInfo& ref = *info;
    impl_->by_id.emplace(ref.id, &ref);
    impl_->owned.push_back(std::move(info));
    return ref;
}

const TypeInfo* TypeRegistry::find(std::type_index id) const
{
    std::shared_lock lock(impl_->mutex);
    auto it = impl_->by_id.find(id);
    return it == impl_->by_id.end() ? nullptr : it->second;
}

// ============================================================
// Introspection API
// ============================================================

std::vector<const FieldInfo*> enumerate_fields(const TypeInfo& type)
{
    std::vector<const TypeInfo*> lineage;
    for (const TypeInfo* t = &type; t; t = t->base) {
        lineage.push_back(t);
    }

    std::vector<const FieldInfo*> result;
    for (auto it = lineage.rbegin(); it != lineage.rend(); ++it) {
        for (const auto& field : (*it)->fields) {
            if (field->is_static || field->transient) continue;
            if (std::find(result.begin(), result.end(), field.get()) != result.end()) continue;
            result.push_back(field.get());
        }
    }
    return result;
}

bool is_primitive(const TypeInfo& type) noexcept
{
    return type.kind == TypeKind::Bool || type.is_number();
}

bool is_wrapper(const TypeInfo& type) noexcept
{
    return type.kind == TypeKind::Optional && type.element && is_primitive(*type.element);
}

const TypeInfo& wrapper_of(const TypeInfo& type)
{
    if (!is_primitive(type) || !type.wrapper) {
        throw TypeNotAllowedError(type.name + " is not a primitive type");
    }
    return type.wrapper();
}

const TypeInfo& primitive_of(const TypeInfo& type)
{
    if (!is_wrapper(type)) {
        throw TypeNotAllowedError(type.name + " is not a primitive wrapper type");
    }
    return *type.element;
}

Scalar read_scalar(const TypeInfo& type, const void* native)
{
    if (!type.scalar.read) {
        throw TypeNotAllowedError(type.name + " is not a scalar type");
    }
    return type.scalar.read(native);
}

void write_scalar(const TypeInfo& type, void* native, const Scalar& value)
{
    if (!type.scalar.write) {
        throw TypeNotAllowedError(type.name + " is not a scalar type");
    }
    type.scalar.write(native, value);
}

Instance instantiate(const TypeInfo& type)
{
    if (type.is_interface) {
        throw NotInstantiableError(type.name + " is interface");
    }
    if (type.abstract) {
        throw NotInstantiableError(type.name + " is abstract class");
    }
    if (!type.destroy) {
        throw NotInstantiableError(type.name + " is not destructible");
    }
    if (type.factory) {
        void* object = type.factory();
        if (!object) {
            throw NotInstantiableError("factory of " + type.name + " returned null");
        }
        return Instance{object, type.destroy};
    }
    if (!type.allocate) {
        throw NotInstantiableError(type.name + " has no default constructor and no registered factory");
    }
    return Instance{type.allocate(), type.destroy};
}

ObjectRef resolve_dynamic(void* object, const TypeInfo& static_type)
{
    if (!object || !static_type.object.dynamic_type) {
        return {object, &static_type};
    }

    const std::type_index dynamic = static_type.object.dynamic_type(object);
    if (dynamic == static_type.id) {
        return {object, &static_type};
    }

    const TypeInfo* found = TypeRegistry::global().find(dynamic);
    if (!found || !found->registered) {
        detail::log_access_error("resolve_dynamic",
                                 "runtime type " + detail::demangled_name_of(dynamic) +
                                     " is not registered, using " + static_type.name);
        return {object, &static_type};
    }
    return {static_type.object.most_derived(object), found};
}

namespace detail {

std::string demangled_name(const std::type_info& info)
{
    return boost::core::demangle(info.name());
}

std::string demangled_name_of(std::type_index id)
{
    return boost::core::demangle(id.name());
}

void throw_scalar_mismatch(const Scalar& value, const std::string& target)
{
    throw TypeNotAllowedError(std::string("cannot store ") + scalar_kind_name(value) + " into " + target);
}

void throw_number_out_of_range(const Number& value, const std::string& target)
{
    throw TypeNotAllowedError("number " + value.to_string() + " is out of range for " + target);
}

void throw_generic_mismatch(const Value& value, const std::string& target)
{
    throw TypeNotAllowedError(std::string("cannot store ") + to_string(value.kind()) + " into " + target);
}

void throw_not_deletable(const std::string& type_name)
{
    throw NotInstantiableError("std::unique_ptr<" + type_name +
                               "> cannot own a derived instance: missing virtual destructor");
}

} // namespace detail

} // namespace opack
