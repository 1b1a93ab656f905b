// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file opack.h
/// @brief Entry point: convert registered native objects to Values and back.
///
/// ## Usage Example
/// ```cpp
/// struct Point { int x = 0; int y = 0; };
/// reflect<Point>("Point").field("x", &Point::x).field("y", &Point::y);
///
/// Opacker opacker;
/// Value v = opacker.serialize(Point{3, 4});           // {"x": 3, "y": 4}
/// std::unique_ptr<Point> p = opacker.deserialize<Point>(v);
/// ```
///
/// Each call runs on its own VirtualMachine, so one Opacker can be shared
/// between threads. Baked types come from the Baker passed at construction
/// (Baker::global() by default).

#pragma once

#include <opack/opack_config.h>

#include <opack/api.h>
#include <opack/baked_type.h>
#include <opack/baker.h>
#include <opack/errors.h>
#include <opack/reflect.h>
#include <opack/transformer.h>
#include <opack/type_info.h>
#include <opack/value.h>
#include <opack/virtual_machine.h>

#include <memory>

namespace opack {

class OPACK_API Opacker {
public:
    explicit Opacker(VmOptions options = {}, Baker& baker = Baker::global());

    /// Baked descriptor of `type`, compiling it on first use
    [[nodiscard]] std::shared_ptr<const BakedType> bake(const TypeInfo& type) const;

    /// Serialize `object`; its runtime type is resolved from `type`
    [[nodiscard]] Value serialize(const void* object, const TypeInfo& type) const;

    /// Create a new `type` instance and populate it from `value`
    [[nodiscard]] Instance deserialize(const Value& value, const TypeInfo& type) const;

    /// Populate an existing instance of exactly `type`. Fields missing from
    /// `value` keep their current contents.
    void deserialize_into(const Value& value, void* object, const TypeInfo& type) const;

    template <typename T>
    [[nodiscard]] Value serialize(const T& object) const
    {
        return serialize(&object, type_of<T>());
    }

    template <typename T>
    [[nodiscard]] std::unique_ptr<T> deserialize(const Value& value) const
    {
        Instance instance = deserialize(value, type_of<T>());
        return std::unique_ptr<T>(static_cast<T*>(instance.release()));
    }

    template <typename T>
    void deserialize_into(const Value& value, T& object) const
    {
        deserialize_into(value, &object, type_of<T>());
    }

    [[nodiscard]] const VmOptions& options() const noexcept { return options_; }
    [[nodiscard]] Baker& baker() const noexcept { return baker_; }

private:
    VmOptions options_;
    Baker& baker_;
};

} // namespace opack
