// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file baked_type.h
/// @brief Immutable, cached description of a type prepared for the VM.

#pragma once

#include <opack/opack_config.h>

#include <opack/api.h>
#include <opack/instruction.h>
#include <opack/type_info.h>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace opack {

class Transformer;

/// @brief A serializable field of a baked class
struct OPACK_API Property {
    const FieldInfo* field = nullptr;
    std::string name;
    /// Explicit type if declared, else the declared type
    const TypeInfo* type = nullptr;
    const TypeInfo* explicit_type = nullptr;
    /// Field-level transformer, else the class-level one of the field's type
    std::shared_ptr<const Transformer> transformer;
    /// Upcasts from the baked class to the class declaring the field
    std::vector<void* (*)(void*)> upcasts;

    /// Address of the declaring subobject of `object` (an instance of the baked class)
    [[nodiscard]] void* owner_of(void* object) const noexcept
    {
        for (auto upcast : upcasts) {
            object = upcast(object);
        }
        return object;
    }
};

class OPACK_API BakedType {
public:
    BakedType(const TypeInfo& type,
              std::vector<std::shared_ptr<const Transformer>> transformers,
              std::vector<Property> properties);

    BakedType(const BakedType&) = delete;
    BakedType& operator=(const BakedType&) = delete;

    [[nodiscard]] const TypeInfo& type() const noexcept { return type_; }

    /// Own transformer first, then inheritable ones of ancestors, nearest first
    [[nodiscard]] const std::vector<std::shared_ptr<const Transformer>>& transformers() const noexcept
    {
        return transformers_;
    }

    [[nodiscard]] const std::vector<Property>& properties() const noexcept { return properties_; }

    /// First property called `name` (base-class fields come first)
    [[nodiscard]] const Property* find_property(std::string_view name) const noexcept;

    [[nodiscard]] const Program& serialize_program() const noexcept { return serialize_; }
    [[nodiscard]] const Program& deserialize_program() const noexcept { return deserialize_; }

private:
    friend class Baker;

    const TypeInfo& type_;
    std::vector<std::shared_ptr<const Transformer>> transformers_;
    std::vector<Property> properties_;
    Program serialize_;
    Program deserialize_;
};

} // namespace opack
