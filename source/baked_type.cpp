// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <opack/baked_type.h>

namespace opack {

BakedType::BakedType(const TypeInfo& type,
                     std::vector<std::shared_ptr<const Transformer>> transformers,
                     std::vector<Property> properties)
    : type_(type)
    , transformers_(std::move(transformers))
    , properties_(std::move(properties))
{
}

const Property* BakedType::find_property(std::string_view name) const noexcept
{
    for (const auto& property : properties_) {
        if (property.name == name) return &property;
    }
    return nullptr;
}

} // namespace opack
