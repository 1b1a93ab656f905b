// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file transformer.h
/// @brief Pluggable conversion between a native value and its Value form.
///
/// A transformer replaces the generated conversion of a field (field-level)
/// or of every use of a class (class-level, see ClassBinder::class_transform).
/// Instances are shared between threads and must not carry mutable state.
///
/// ## Usage Example
/// ```cpp
/// struct CelsiusAsString : TypedTransformer<double> {
///     Value to_generic(const double& c) const override {
///         return std::to_string(c) + "C";
///     }
///     double from_generic(const Value& v) const override {
///         return std::stod(std::string(v.as_string_view()));
///     }
/// };
///
/// reflect<Weather>("Weather")
///     .field("temperature", &Weather::temperature)
///     .transform(std::make_shared<CelsiusAsString>());
/// ```

#pragma once

#include <opack/opack_config.h>

#include <opack/api.h>
#include <opack/errors.h>
#include <opack/type_info.h>
#include <opack/value.h>

#include <typeindex>

namespace opack {

class OPACK_API Transformer {
public:
    virtual ~Transformer() = default;

    /// @param native address of the native value (a field, or the whole object)
    /// @param type   runtime type of *native
    [[nodiscard]] virtual Value serialize(const void* native, const TypeInfo& type) const = 0;

    /// Populate *native from `value`
    virtual void deserialize(const Value& value, void* native, const TypeInfo& type) const = 0;
};

/// @brief Transformer for values of a known native type T
///
/// When inherited by a derived class (class_transform(t, true)), the
/// native object is converted to its T subobject first.
template <typename T>
class TypedTransformer : public Transformer {
public:
    [[nodiscard]] virtual Value to_generic(const T& native) const = 0;
    [[nodiscard]] virtual T from_generic(const Value& value) const = 0;

    [[nodiscard]] Value serialize(const void* native, const TypeInfo& type) const final
    {
        return to_generic(*static_cast<const T*>(as_target(const_cast<void*>(native), type)));
    }

    void deserialize(const Value& value, void* native, const TypeInfo& type) const final
    {
        *static_cast<T*>(as_target(native, type)) = from_generic(value);
    }

private:
    static void* as_target(void* native, const TypeInfo& type)
    {
        const TypeInfo& target = type_of<T>();
        if (&type == &target) return native;

        void* converted = type.upcast_to(native, target);
        if (!converted) {
            throw TypeNotAllowedError("transformer for " + target.name + " cannot handle " + type.name);
        }
        return converted;
    }
};

} // namespace opack
