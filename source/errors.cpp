// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <opack/errors.h>

namespace opack {

FieldAccessError::FieldAccessError(std::string type_name, std::string field_name, const std::string& reason)
    : Error("cannot access field '" + field_name + "' of " + type_name + ": " + reason)
    , type_name_(std::move(type_name))
    , field_name_(std::move(field_name))
{
}

IndexOutOfRangeError::IndexOutOfRangeError(std::size_t index, std::size_t size)
    : Error("index " + std::to_string(index) + " out of range for array of size " + std::to_string(size))
    , index_(index)
    , size_(size)
{
}

DepthExceededError::DepthExceededError(std::size_t depth)
    : Error("traversal depth exceeded " + std::to_string(depth) +
            " frames (cyclic object graph or VmOptions::max_depth too small)")
    , depth_(depth)
{
}

} // namespace opack
