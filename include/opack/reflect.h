// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file reflect.h
/// @brief Registration of classes with the type introspection layer.
///
/// ## Usage Example
/// ```cpp
/// struct Shape { virtual ~Shape() = default; virtual double area() const = 0; std::string label; };
/// struct Circle : Shape { double radius = 0; double area() const override; };
/// struct Drawing { std::shared_ptr<Shape> main; int revision = 0; };
///
/// reflect<Shape>("Shape").field("label", &Shape::label);
/// reflect<Circle>("Circle").base<Shape>().field("radius", &Circle::radius);
/// reflect<Drawing>("Drawing")
///     .field("main", &Drawing::main).explicit_type<Circle>()
///     .field("revision", &Drawing::revision);
/// ```
///
/// Options such as transient(), transform() and explicit_type() apply to
/// the field registered last.
///
/// @note Registration must complete before the type is baked or used from
///       several threads.

#pragma once

#include <opack/opack_config.h>

#include <opack/api.h>
#include <opack/errors.h>
#include <opack/transformer.h>
#include <opack/type_info.h>

#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace opack {

template <typename T>
class ClassBinder {
    static_assert(std::is_class_v<T>, "only classes can be registered");

public:
    explicit ClassBinder(TypeInfo& info) : info_(info) {}

    /// Declare the registered base class of T
    template <typename B>
    ClassBinder& base()
    {
        static_assert(std::is_base_of_v<B, T> && !std::is_same_v<B, T>, "B must be a base class of T");
        info_.base = &detail::mutable_type_of<B>();
        info_.upcast = [](void* object) -> void* {
            return static_cast<B*>(static_cast<T*>(object));
        };
        return *this;
    }

    /// Register a data member. A const member is registered read-only.
    template <typename M>
    ClassBinder& field(std::string name, M T::*member)
    {
        using Stored = std::remove_const_t<M>;
        auto field = std::make_unique<FieldInfo>();
        field->name = std::move(name);
        field->owner = &info_;
        field->type = &detail::mutable_type_of<Stored>();
        field->read_only = std::is_const_v<M>;
        field->locate_fn = [member](void* object) -> void* {
            return const_cast<Stored*>(&(static_cast<T*>(object)->*member));
        };
        info_.fields.push_back(std::move(field));
        return *this;
    }

    /// Register a static data member. Static fields are never serialized.
    template <typename M>
    ClassBinder& static_field(std::string name, M* variable)
    {
        using Stored = std::remove_const_t<M>;
        auto field = std::make_unique<FieldInfo>();
        field->name = std::move(name);
        field->owner = &info_;
        field->type = &detail::mutable_type_of<Stored>();
        field->is_static = true;
        field->read_only = std::is_const_v<M>;
        field->locate_fn = [variable](void*) -> void* { return const_cast<Stored*>(variable); };
        info_.fields.push_back(std::move(field));
        return *this;
    }

    /// Exclude the last field from serialization
    ClassBinder& transient()
    {
        last_field("transient").transient = true;
        return *this;
    }

    /// Convert the last field with `transformer` instead of the generated code
    ClassBinder& transform(std::shared_ptr<const Transformer> transformer)
    {
        last_field("transform").transformer = std::move(transformer);
        return *this;
    }

    /// Concrete class to instantiate for the last field, a smart pointer
    /// whose element type is abstract or an interface
    template <typename E>
    ClassBinder& explicit_type()
    {
        FieldInfo& field = last_field("explicit_type");
        if (field.type->kind != TypeKind::Pointer) {
            throw TypeNotAllowedError("explicit type on " + info_.name + "." + field.name +
                                      " requires a std::shared_ptr or std::unique_ptr field");
        }
        field.explicit_type = &detail::mutable_type_of<E>();
        return *this;
    }

    /// Convert every use of T with `transformer`. With `inheritable`,
    /// classes derived from T use it too unless they declare their own.
    ClassBinder& class_transform(std::shared_ptr<const Transformer> transformer, bool inheritable = false)
    {
        info_.transformer = std::move(transformer);
        info_.transformer_inheritable = inheritable;
        return *this;
    }

    /// Mark T as an interface: it can be referenced but never instantiated
    ClassBinder& as_interface()
    {
        info_.is_interface = true;
        return *this;
    }

    /// Replace value-initialization with `make` when opack creates a T
    ClassBinder& factory(std::function<std::unique_ptr<T>()> make)
    {
        info_.factory = [make = std::move(make)]() -> void* { return make().release(); };
        return *this;
    }

    [[nodiscard]] const TypeInfo& info() const noexcept { return info_; }

private:
    FieldInfo& last_field(const char* option)
    {
        if (info_.fields.empty()) {
            throw Error(std::string(option) + "() on " + info_.name + " requires a registered field");
        }
        return *info_.fields.back();
    }

    TypeInfo& info_;
};

/// Begin (or continue) the registration of T under `name`
template <typename T>
ClassBinder<T> reflect(std::string name)
{
    TypeInfo& info = detail::mutable_type_of<T>();
    if (info.kind != TypeKind::Object) {
        throw TypeNotAllowedError(info.name + " is a " + to_string(info.kind) + " type and cannot be registered");
    }
    info.name = std::move(name);
    info.registered = true;
    return ClassBinder<T>(info);
}

/// Register T under its demangled C++ name
template <typename T>
ClassBinder<T> reflect()
{
    return reflect<T>(detail::demangled_name(typeid(T)));
}

} // namespace opack
