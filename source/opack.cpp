// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <opack/opack.h>

namespace opack {

Opacker::Opacker(VmOptions options, Baker& baker)
    : options_(options)
    , baker_(baker)
{
}

std::shared_ptr<const BakedType> Opacker::bake(const TypeInfo& type) const
{
    return baker_.bake(type);
}

Value Opacker::serialize(const void* object, const TypeInfo& type) const
{
    VirtualMachine vm(baker_, options_);
    return vm.serialize(object, type);
}

Instance Opacker::deserialize(const Value& value, const TypeInfo& type) const
{
    // Bake first: an unbakeable type fails before anything is allocated
    (void)baker_.bake(type);

    Instance instance = instantiate(type);
    VirtualMachine vm(baker_, options_);
    vm.deserialize(value, instance.get(), type);
    return instance;
}

void Opacker::deserialize_into(const Value& value, void* object, const TypeInfo& type) const
{
    VirtualMachine vm(baker_, options_);
    vm.deserialize(value, object, type);
}

} // namespace opack
