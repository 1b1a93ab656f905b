// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file concepts.h
/// @brief C++20 Concepts for type constraints in opack.
///
/// These concepts classify native C++ types the way the reflection layer
/// sees them:
/// - primitives (bool, fixed-width integers, float, double)
/// - wrapper equivalents (std::optional of a primitive)
/// - strings, sequences, mappings and owning pointers
///
/// @note Requires C++20 or later.

#pragma once

#include <cstdint>
#include <concepts>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace opack {

// ============================================================
// Primitive Type Concepts
// ============================================================

namespace detail {

template <typename T>
inline constexpr bool is_char_type_v = std::is_same_v<T, char> || std::is_same_v<T, wchar_t> ||
                                       std::is_same_v<T, char8_t> || std::is_same_v<T, char16_t> ||
                                       std::is_same_v<T, char32_t>;

} // namespace detail

/// Concept for numeric types a Number can hold without widening.
/// Character types are text, not numbers, and long double has no
/// fixed-width counterpart; both are excluded.
template <typename T>
concept NumericType = std::is_arithmetic_v<std::decay_t<T>> &&
                      !std::is_same_v<std::decay_t<T>, bool> &&
                      !detail::is_char_type_v<std::decay_t<T>> &&
                      !std::is_same_v<std::decay_t<T>, long double>;

/// Concept for types that are directly stored as primitive values
template <typename T>
concept PrimitiveType = NumericType<T> || std::is_same_v<std::decay_t<T>, bool>;

/// Concept for string-like types that can be converted to std::string
template <typename T>
concept StringLike = std::is_same_v<std::decay_t<T>, std::string> ||
                     std::is_same_v<std::decay_t<T>, const char*> ||
                     std::is_convertible_v<T, std::string_view>;

// ============================================================
// Wrapper / Container Traits
// ============================================================

namespace detail {

template <typename T>
struct is_optional : std::false_type {};
template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};

template <typename T>
struct is_vector : std::false_type {};
template <typename T, typename A>
struct is_vector<std::vector<T, A>> : std::true_type {};

template <typename T>
struct is_map : std::false_type {};
template <typename K, typename V, typename C, typename A>
struct is_map<std::map<K, V, C, A>> : std::true_type {};
template <typename K, typename V, typename H, typename E, typename A>
struct is_map<std::unordered_map<K, V, H, E, A>> : std::true_type {};

template <typename T>
struct is_shared_ptr : std::false_type {};
template <typename T>
struct is_shared_ptr<std::shared_ptr<T>> : std::true_type {};

template <typename T>
struct is_unique_ptr : std::false_type {};
template <typename T>
struct is_unique_ptr<std::unique_ptr<T>> : std::true_type {};

/// Maps a numeric type onto the fixed-width type of the same size and signedness
template <typename T>
struct fixed_width {
    using type = std::conditional_t<
        std::is_floating_point_v<T>,
        std::conditional_t<sizeof(T) == sizeof(float), float, double>,
        std::conditional_t<
            std::is_signed_v<T>,
            std::conditional_t<sizeof(T) == 1, int8_t,
                std::conditional_t<sizeof(T) == 2, int16_t,
                    std::conditional_t<sizeof(T) == 4, int32_t, int64_t>>>,
            std::conditional_t<sizeof(T) == 1, uint8_t,
                std::conditional_t<sizeof(T) == 2, uint16_t,
                    std::conditional_t<sizeof(T) == 4, uint32_t, uint64_t>>>>>;
};

template <typename T>
using fixed_width_t = typename fixed_width<std::decay_t<T>>::type;

} // namespace detail

/// Concept for primitive-wrapper equivalents (nullable primitives)
template <typename T>
concept WrapperType = detail::is_optional<std::decay_t<T>>::value &&
                      PrimitiveType<typename std::decay_t<T>::value_type>;

template <typename T>
concept OptionalType = detail::is_optional<std::decay_t<T>>::value;

template <typename T>
concept SequenceType = detail::is_vector<std::decay_t<T>>::value;

template <typename T>
concept MappingType = detail::is_map<std::decay_t<T>>::value;

template <typename T>
concept PointerType = detail::is_shared_ptr<std::decay_t<T>>::value ||
                      detail::is_unique_ptr<std::decay_t<T>>::value;

} // namespace opack
