// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file errors.h
/// @brief Exception taxonomy for opack.
///
/// Every failure that aborts a bake, a serialize or a deserialize is thrown
/// as a subclass of opack::Error:
///
/// | Exception              | Raised when                                             |
/// |------------------------|---------------------------------------------------------|
/// | TypeNotAllowedError    | a value or field type is outside the permitted set      |
/// | NotInstantiableError   | baking/instantiating an interface or abstract class     |
/// | FieldAccessError       | a field cannot be read or written                       |
/// | IndexOutOfRangeError   | Array::set past the end of the array                    |
/// | MalformedProgramError  | a program violates the VM stack discipline              |
/// | DepthExceededError     | a traversal grows past VmOptions::max_depth             |

#pragma once

#include <opack/api.h>

#include <cstddef>
#include <stdexcept>
#include <string>

namespace opack {

/// Base class of all opack exceptions
class OPACK_API Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class OPACK_API TypeNotAllowedError : public Error {
public:
    using Error::Error;
};

class OPACK_API NotInstantiableError : public Error {
public:
    using Error::Error;
};

/// Reflective read/write failure, carrying the class and field it happened on
class OPACK_API FieldAccessError : public Error {
public:
    FieldAccessError(std::string type_name, std::string field_name, const std::string& reason);

    [[nodiscard]] const std::string& type_name() const noexcept { return type_name_; }
    [[nodiscard]] const std::string& field_name() const noexcept { return field_name_; }

private:
    std::string type_name_;
    std::string field_name_;
};

class OPACK_API IndexOutOfRangeError : public Error {
public:
    IndexOutOfRangeError(std::size_t index, std::size_t size);

    [[nodiscard]] std::size_t index() const noexcept { return index_; }
    [[nodiscard]] std::size_t size() const noexcept { return size_; }

private:
    std::size_t index_;
    std::size_t size_;
};

/// Raised when a program's operands are missing or have the wrong shape.
/// This indicates a defect in the program, never a bad input.
class OPACK_API MalformedProgramError : public Error {
public:
    using Error::Error;
};

class OPACK_API DepthExceededError : public Error {
public:
    explicit DepthExceededError(std::size_t depth);

    [[nodiscard]] std::size_t depth() const noexcept { return depth_; }

private:
    std::size_t depth_;
};

} // namespace opack
