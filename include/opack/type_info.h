// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file type_info.h
/// @brief Runtime type descriptors for native C++ types.
///
/// C++ has no runtime reflection, so every type opack touches gets a
/// process-wide TypeInfo, created on first use by type_of<T>(). The
/// descriptor classifies the type (TypeKind) and carries type-erased
/// operations for it:
///
/// | Kind          | Native types                                | Operations        |
/// |---------------|---------------------------------------------|-------------------|
/// | Bool..Double  | bool, integers, float, double               | ScalarOps         |
/// | String        | std::string                                 | ScalarOps         |
/// | Optional      | std::optional<T>                            | ScalarOps         |
/// | Object        | classes registered with reflect<T>()        | fields, ObjectOps |
/// | Sequence      | std::vector<T>                              | SequenceOps       |
/// | Mapping       | std::map<K, V>, std::unordered_map<K, V>    | MappingOps        |
/// | Pointer       | std::shared_ptr<T>, std::unique_ptr<T>      | PointerOps        |
/// | Value         | opack::Value, Object, Array, Number         | GenericOps        |
///
/// Anything else is Unsupported. Classes only get fields, a base class and
/// transformers through reflect<T>() (see reflect.h).
///
/// ## Usage Example
/// ```cpp
/// const TypeInfo& t = type_of<std::vector<int>>();
/// assert(t.kind == TypeKind::Sequence);
/// assert(t.element == &type_of<int>());
/// ```

#pragma once

#include <opack/opack_config.h>

#include <opack/api.h>
#include <opack/concepts.h>
#include <opack/value.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <variant>
#include <vector>

namespace opack {

class Transformer;
struct TypeInfo;

// ============================================================
// Type Kinds
// ============================================================

enum class TypeKind : uint8_t {
    Bool,
    Int8,
    Int16,
    Int32,
    Int64,
    UInt8,
    UInt16,
    UInt32,
    UInt64,
    Float,
    Double,
    String,
    Optional,
    Object,
    Sequence,
    Mapping,
    Pointer,
    Value,
    Unsupported
};

[[nodiscard]] OPACK_API const char* to_string(TypeKind kind) noexcept;

/// Native scalar as it travels between a field and a Value.
/// monostate stands for an empty std::optional.
using Scalar = std::variant<std::monostate, bool, Number, std::string>;

/// Owned, type-erased instance created by instantiate()
using Instance = std::unique_ptr<void, void (*)(void*)>;

/// Non-owning reference to a native object (or a field/element slot) and its type
struct ObjectRef {
    void* address = nullptr;
    const TypeInfo* type = nullptr;
};

// ============================================================
// Type-erased operations
// ============================================================

struct ScalarOps {
    Scalar (*read)(const void* native) = nullptr;
    void (*write)(void* native, const Scalar& value) = nullptr;
};

/// Deep copies between a native slot and the generic tree
struct GenericOps {
    Value (*load)(const void* native) = nullptr;
    /// @throws TypeNotAllowedError if `value` does not have the slot's kind
    void (*assign)(void* native, const Value& value) = nullptr;
};

struct ObjectOps {
    /// Set only for polymorphic classes
    std::type_index (*dynamic_type)(const void* object) = nullptr;
    void* (*most_derived)(void* object) = nullptr;
};

struct SequenceOps {
    std::size_t (*size)(const void* seq) = nullptr;
    void* (*element)(void* seq, std::size_t index) = nullptr;
    void (*resize)(void* seq, std::size_t size) = nullptr;
};

struct MappingOps {
    using EntryRefs = std::vector<std::pair<const void*, void*>>;

    std::size_t (*size)(const void* map) = nullptr;
    /// Addresses of every (key, mapped) pair, in the container's iteration order
    void (*entries)(void* map, EntryRefs& out) = nullptr;
    void (*clear)(void* map) = nullptr;
    /// Address of the mapped value under `key`, inserting a value-initialized one if absent
    void* (*emplace)(void* map, const Scalar& key) = nullptr;
};

struct PointerOps {
    /// Pointee as the declared element type, or nullptr
    void* (*get)(const void* holder) = nullptr;
    void (*reset)(void* holder) = nullptr;
    /// Take ownership of `instance`; `pointee` is its address converted to the element type.
    /// `exact` is false when the instance is of a class derived from the element type.
    void (*adopt)(void* holder, Instance instance, void* pointee, bool exact) = nullptr;
};

// ============================================================
// FieldInfo
// ============================================================

/// @brief A data member registered on a class
///
/// Field identity is the FieldInfo address: two classes declaring a field
/// with the same name own two distinct FieldInfo objects.
struct OPACK_API FieldInfo {
    std::string name;
    const TypeInfo* owner = nullptr;         ///< declaring class
    const TypeInfo* type = nullptr;          ///< declared type
    const TypeInfo* explicit_type = nullptr; ///< concrete pointee override for pointer fields
    std::shared_ptr<const Transformer> transformer;
    bool is_static = false;
    bool transient = false;
    bool read_only = false;

    /// Maps the declaring object's address to the field's address
    std::function<void*(void* object)> locate_fn;

    /// Address of the field inside `object` (an instance of `owner`)
    /// @throws FieldAccessError if object is null for an instance field
    [[nodiscard]] const void* locate(const void* object) const;

    /// Writable address of the field inside `object`
    /// @throws FieldAccessError if the field is read-only or object is null
    [[nodiscard]] void* locate_mutable(void* object) const;
};

// ============================================================
// TypeInfo
// ============================================================

struct OPACK_API TypeInfo {
    TypeInfo(TypeKind kind, std::type_index id, std::string name);

    TypeInfo(const TypeInfo&) = delete;
    TypeInfo& operator=(const TypeInfo&) = delete;

    TypeKind kind;
    std::type_index id;
    std::string name;

    // Object
    bool registered = false;  ///< reflect<T>() was called
    bool abstract = false;
    bool is_interface = false;
    bool polymorphic = false;
    const TypeInfo* base = nullptr;
    void* (*upcast)(void* object) = nullptr; ///< this type's address -> base address
    std::vector<std::unique_ptr<FieldInfo>> fields;
    std::shared_ptr<const Transformer> transformer;
    bool transformer_inheritable = false;
    ObjectOps object;

    // Optional: the wrapped primitive. Sequence, Pointer: element type.
    // Mapping: mapped type (key type in `key`).
    const TypeInfo* element = nullptr;
    const TypeInfo* key = nullptr;

    ScalarOps scalar;
    GenericOps generic;
    SequenceOps sequence;
    MappingOps mapping;
    PointerOps pointer;

    /// Primitive -> its std::optional wrapper (resolved lazily)
    const TypeInfo& (*wrapper)() = nullptr;

    void* (*allocate)() = nullptr;
    void (*destroy)(void* object) = nullptr;
    std::function<void*()> factory;

    [[nodiscard]] bool is_scalar() const noexcept { return scalar.read != nullptr; }
    [[nodiscard]] bool is_number() const noexcept {
        return kind >= TypeKind::Int8 && kind <= TypeKind::Double;
    }

    /// True if `other` is this type or one of its registered ancestors
    [[nodiscard]] bool derives_from(const TypeInfo& other) const noexcept;

    /// Convert `object` (an instance of this type) to the address of its
    /// `target` subobject, following registered base classes.
    /// Returns nullptr if target is not an ancestor.
    [[nodiscard]] void* upcast_to(void* object, const TypeInfo& target) const noexcept;
};

// ============================================================
// TypeRegistry
// ============================================================

/// @brief Owns every TypeInfo and maps std::type_index back to it
///
/// Used to resolve the runtime type of a polymorphic object reached
/// through a base-class pointer.
class OPACK_API TypeRegistry {
public:
    static TypeRegistry& global();

    TypeInfo& adopt(std::unique_ptr<TypeInfo> info);

    /// nullptr if the type was never seen by type_of<T>()
    [[nodiscard]] const TypeInfo* find(std::type_index id) const;

    TypeRegistry();
    ~TypeRegistry();
    TypeRegistry(const TypeRegistry&) = delete;
    TypeRegistry& operator=(const TypeRegistry&) = delete;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// ============================================================
// Introspection API
// ============================================================

/// Serializable fields of `type` in declaration order, base-class fields
/// first (most distant ancestor first). Static and transient fields are
/// skipped; each FieldInfo appears once.
[[nodiscard]] OPACK_API std::vector<const FieldInfo*> enumerate_fields(const TypeInfo& type);

[[nodiscard]] OPACK_API bool is_primitive(const TypeInfo& type) noexcept;
[[nodiscard]] OPACK_API bool is_wrapper(const TypeInfo& type) noexcept;

/// bool -> std::optional<bool>, int -> std::optional<int>, ...
/// @throws TypeNotAllowedError if type is not a primitive
[[nodiscard]] OPACK_API const TypeInfo& wrapper_of(const TypeInfo& type);

/// std::optional<int> -> int, ...
/// @throws TypeNotAllowedError if type is not a wrapper
[[nodiscard]] OPACK_API const TypeInfo& primitive_of(const TypeInfo& type);

/// @throws TypeNotAllowedError if type is not a scalar
[[nodiscard]] OPACK_API Scalar read_scalar(const TypeInfo& type, const void* native);

/// Write with numeric narrowing; monostate empties an optional
/// @throws TypeNotAllowedError on a kind mismatch, a number outside the
///         target's range (NaN or infinity into an integer), or if type is not a scalar
OPACK_API void write_scalar(const TypeInfo& type, void* native, const Scalar& value);

/// Create a value-initialized instance (or call the registered factory)
/// @throws NotInstantiableError for interfaces, abstract classes, and
///         classes without a default constructor or factory
[[nodiscard]] OPACK_API Instance instantiate(const TypeInfo& type);

/// Resolve the most-derived registered type of a polymorphic object.
/// Non-polymorphic objects, and objects whose dynamic type was never
/// registered, resolve to `static_type` unchanged.
[[nodiscard]] OPACK_API ObjectRef resolve_dynamic(void* object, const TypeInfo& static_type);

[[nodiscard]] OPACK_API const char* scalar_kind_name(const Scalar& value) noexcept;

// ============================================================
// type_of<T>()
// ============================================================

namespace detail {

[[nodiscard]] OPACK_API std::string demangled_name(const std::type_info& info);
[[nodiscard]] OPACK_API std::string demangled_name_of(std::type_index id);

[[noreturn]] OPACK_API void throw_scalar_mismatch(const Scalar& value, const std::string& target);
[[noreturn]] OPACK_API void throw_number_out_of_range(const Number& value, const std::string& target);
[[noreturn]] OPACK_API void throw_generic_mismatch(const Value& value, const std::string& target);

/// unique_ptr<Base> cannot own a Derived without a virtual destructor
[[noreturn]] OPACK_API void throw_not_deletable(const std::string& type_name);

template <typename T>
TypeInfo& mutable_type_of();

template <typename T>
inline constexpr bool is_scalar_v = std::is_same_v<T, bool> || NumericType<T> ||
                                    std::is_same_v<T, std::string> || WrapperType<T>;

template <typename T>
Scalar read_scalar_as(const void* native)
{
    const T& v = *static_cast<const T*>(native);
    if constexpr (std::is_same_v<T, bool>) {
        return Scalar{std::in_place_type<bool>, v};
    } else if constexpr (std::is_same_v<T, std::string>) {
        return Scalar{std::in_place_type<std::string>, v};
    } else if constexpr (NumericType<T>) {
        return Scalar{std::in_place_type<Number>, Number{v}};
    } else {
        if (!v.has_value()) return Scalar{};
        return read_scalar_as<typename T::value_type>(&*v);
    }
}

template <typename T>
void write_scalar_as(void* native, const Scalar& value)
{
    T& slot = *static_cast<T*>(native);
    if constexpr (std::is_same_v<T, bool>) {
        if (auto* b = std::get_if<bool>(&value)) {
            slot = *b;
            return;
        }
    } else if constexpr (std::is_same_v<T, std::string>) {
        if (auto* s = std::get_if<std::string>(&value)) {
            slot = *s;
            return;
        }
    } else if constexpr (NumericType<T>) {
        if (auto* n = std::get_if<Number>(&value)) {
            if (!n->fits<T>()) throw_number_out_of_range(*n, mutable_type_of<T>().name);
            slot = n->as<T>();
            return;
        }
    } else {
        if (std::holds_alternative<std::monostate>(value)) {
            slot.reset();
            return;
        }
        typename T::value_type inner{};
        write_scalar_as<typename T::value_type>(&inner, value);
        slot = std::move(inner);
        return;
    }
    throw_scalar_mismatch(value, mutable_type_of<T>().name);
}

template <typename T>
inline constexpr bool is_generic_v = std::is_same_v<T, Value> || std::is_same_v<T, Object> ||
                                     std::is_same_v<T, Array> || std::is_same_v<T, Number>;

template <typename T>
Value load_generic_as(const void* native)
{
    const T& v = *static_cast<const T*>(native);
    if constexpr (std::is_same_v<T, Number>) {
        return Value{v};
    } else {
        return Value{v.clone()};
    }
}

template <typename T>
void assign_generic_as(void* native, const Value& value)
{
    T& slot = *static_cast<T*>(native);
    if constexpr (std::is_same_v<T, Value>) {
        slot = value.clone();
        return;
    } else if constexpr (std::is_same_v<T, Number>) {
        if (auto* n = value.get_if<Number>()) {
            slot = *n;
            return;
        }
    } else if constexpr (std::is_same_v<T, Object>) {
        if (auto* p = value.get_if<ObjectPtr>()) {
            slot = (*p)->clone();
            return;
        }
    } else {
        if (auto* p = value.get_if<ArrayPtr>()) {
            slot = (*p)->clone();
            return;
        }
    }
    throw_generic_mismatch(value, mutable_type_of<T>().name);
}

template <typename T>
constexpr TypeKind kind_of()
{
    if constexpr (std::is_same_v<T, bool>) {
        return TypeKind::Bool;
    } else if constexpr (NumericType<T>) {
        using F = fixed_width_t<T>;
        if constexpr (std::is_same_v<F, int8_t>) return TypeKind::Int8;
        else if constexpr (std::is_same_v<F, int16_t>) return TypeKind::Int16;
        else if constexpr (std::is_same_v<F, int32_t>) return TypeKind::Int32;
        else if constexpr (std::is_same_v<F, int64_t>) return TypeKind::Int64;
        else if constexpr (std::is_same_v<F, uint8_t>) return TypeKind::UInt8;
        else if constexpr (std::is_same_v<F, uint16_t>) return TypeKind::UInt16;
        else if constexpr (std::is_same_v<F, uint32_t>) return TypeKind::UInt32;
        else if constexpr (std::is_same_v<F, uint64_t>) return TypeKind::UInt64;
        else if constexpr (std::is_same_v<F, float>) return TypeKind::Float;
        else return TypeKind::Double;
    } else if constexpr (std::is_same_v<T, std::string>) {
        return TypeKind::String;
    } else if constexpr (is_generic_v<T>) {
        return TypeKind::Value;
    } else if constexpr (OptionalType<T>) {
        return TypeKind::Optional;
    } else if constexpr (SequenceType<T>) {
        // std::vector<bool> has no addressable elements
        if constexpr (std::is_same_v<typename T::value_type, bool>) return TypeKind::Unsupported;
        else return TypeKind::Sequence;
    } else if constexpr (MappingType<T>) {
        return TypeKind::Mapping;
    } else if constexpr (PointerType<T>) {
        return TypeKind::Pointer;
    } else if constexpr (std::is_class_v<T>) {
        return TypeKind::Object;
    } else {
        return TypeKind::Unsupported;
    }
}

template <typename T>
void fill_lifetime(TypeInfo& info)
{
    if constexpr (std::is_default_constructible_v<T> && !std::is_abstract_v<T>) {
        info.allocate = []() -> void* { return new T(); };
    }
    if constexpr (!std::is_abstract_v<T> && std::is_destructible_v<T>) {
        info.destroy = [](void* p) { delete static_cast<T*>(p); };
    }
}

template <typename T>
void fill_operations(TypeInfo& info)
{
    constexpr TypeKind kind = kind_of<T>();

    if constexpr (is_scalar_v<T>) {
        info.scalar.read = &read_scalar_as<T>;
        info.scalar.write = &write_scalar_as<T>;
    }

    if constexpr (is_generic_v<T>) {
        info.generic.load = &load_generic_as<T>;
        info.generic.assign = &assign_generic_as<T>;
    }

    if constexpr (PrimitiveType<T>) {
        info.wrapper = []() -> const TypeInfo& { return mutable_type_of<std::optional<T>>(); };
    } else if constexpr (kind == TypeKind::Optional) {
        // Only primitive wrappers get ScalarOps; other optionals are rejected at bake time
        info.element = &mutable_type_of<std::remove_cv_t<typename T::value_type>>();
    } else if constexpr (kind == TypeKind::Sequence) {
        using E = typename T::value_type;
        info.element = &mutable_type_of<E>();
        info.sequence.size = [](const void* seq) -> std::size_t {
            return static_cast<const T*>(seq)->size();
        };
        info.sequence.element = [](void* seq, std::size_t index) -> void* {
            return &(*static_cast<T*>(seq))[index];
        };
        info.sequence.resize = [](void* seq, std::size_t size) {
            static_cast<T*>(seq)->resize(size);
        };
    } else if constexpr (kind == TypeKind::Mapping) {
        using K = typename T::key_type;
        using V = typename T::mapped_type;
        info.key = &mutable_type_of<K>();
        info.element = &mutable_type_of<V>();
        info.mapping.size = [](const void* map) -> std::size_t {
            return static_cast<const T*>(map)->size();
        };
        info.mapping.entries = [](void* map, MappingOps::EntryRefs& out) {
            out.clear();
            for (auto& [k, v] : *static_cast<T*>(map)) {
                out.emplace_back(&k, &v);
            }
        };
        info.mapping.clear = [](void* map) { static_cast<T*>(map)->clear(); };
        info.mapping.emplace = [](void* map, const Scalar& key) -> void* {
            if constexpr (is_scalar_v<K> && std::is_default_constructible_v<V>) {
                K native_key{};
                write_scalar_as<K>(&native_key, key);
                auto [it, inserted] = static_cast<T*>(map)->try_emplace(std::move(native_key));
                (void)inserted;
                return &it->second;
            } else {
                (void)map;
                throw_scalar_mismatch(key, mutable_type_of<K>().name);
            }
        };
    } else if constexpr (kind == TypeKind::Pointer) {
        using E = typename T::element_type;
        info.element = &mutable_type_of<std::remove_cv_t<E>>();
        info.pointer.get = [](const void* holder) -> void* {
            return const_cast<std::remove_cv_t<E>*>(static_cast<const T*>(holder)->get());
        };
        info.pointer.reset = [](void* holder) { static_cast<T*>(holder)->reset(); };
        info.pointer.adopt = [](void* holder, Instance instance, void* pointee, bool exact) {
            auto* typed = static_cast<E*>(pointee);
            if constexpr (detail::is_shared_ptr<T>::value) {
                (void)exact;
                auto deleter = instance.get_deleter();
                std::shared_ptr<void> owner(instance.release(), deleter);
                *static_cast<T*>(holder) = T(std::move(owner), typed);
            } else {
                if constexpr (!std::has_virtual_destructor_v<E>) {
                    if (!exact) {
                        throw_not_deletable(mutable_type_of<std::remove_cv_t<E>>().name);
                    }
                }
                (void)instance.release();
                static_cast<T*>(holder)->reset(typed);
            }
        };
    } else if constexpr (kind == TypeKind::Object) {
        info.abstract = std::is_abstract_v<T>;
        info.polymorphic = std::is_polymorphic_v<T>;
        if constexpr (std::is_polymorphic_v<T>) {
            info.object.dynamic_type = [](const void* object) -> std::type_index {
                return typeid(*static_cast<const T*>(object));
            };
            info.object.most_derived = [](void* object) -> void* {
                return dynamic_cast<void*>(static_cast<T*>(object));
            };
        }
    }
}

template <typename T>
std::unique_ptr<TypeInfo> make_type_info()
{
    auto info = std::make_unique<TypeInfo>(kind_of<T>(), std::type_index(typeid(T)), demangled_name(typeid(T)));
    fill_lifetime<T>(*info);
    fill_operations<T>(*info);
    return info;
}

template <typename T>
TypeInfo& mutable_type_of()
{
    static TypeInfo& info = TypeRegistry::global().adopt(make_type_info<T>());
    return info;
}

} // namespace detail

/// Process-wide descriptor of T, created on first use
template <typename T>
const TypeInfo& type_of()
{
    return detail::mutable_type_of<std::remove_cv_t<T>>();
}

} // namespace opack
