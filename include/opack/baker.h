// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file baker.h
/// @brief Compiles types into BakedType descriptors and caches them.
///
/// Baking inspects a type once: it validates the field types, resolves
/// transformers, and emits the serialize and deserialize programs. The
/// result is immutable and cached for the lifetime of the Baker.
///
/// ## Thread Safety
/// Lookups read an immer::map snapshot published through an immer::atom and
/// never block. A cache miss takes a mutex and checks the snapshot again, so
/// concurrent first use of a type compiles it exactly once.
///
/// ## What can be baked
/// - registered concrete classes (interfaces and abstract classes throw
///   NotInstantiableError)
/// - std::vector and std::map / std::unordered_map with scalar keys
///
/// Scalars, optionals, pointers and Value fields are compiled inline into
/// the program that owns them; baking them directly throws TypeNotAllowedError.

#pragma once

#include <opack/opack_config.h>

#include <opack/api.h>
#include <opack/baked_type.h>
#include <opack/type_info.h>

#include <immer/atom.hpp>
#include <immer/heap/cpp_heap.hpp>
#include <immer/heap/heap_policy.hpp>
#include <immer/lock/spinlock_policy.hpp>
#include <immer/map.hpp>
#include <immer/memory_policy.hpp>
#include <immer/refcount/refcount_policy.hpp>

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>

namespace opack {

/// Atomic refcount + spinlock: registry snapshots are shared across threads
using thread_safe_memory_policy = immer::memory_policy<
    immer::free_list_heap_policy<immer::cpp_heap>,
    immer::refcount_policy,
    immer::spinlock_policy
>;

class OPACK_API Baker {
public:
    Baker();
    ~Baker();

    Baker(const Baker&) = delete;
    Baker& operator=(const Baker&) = delete;

    /// Process-wide instance used by Opacker by default
    static Baker& global();

    /// Cached descriptor of `type`, compiling it on first use.
    /// Failures are not cached; the next call compiles again.
    /// @throws NotInstantiableError, TypeNotAllowedError
    [[nodiscard]] std::shared_ptr<const BakedType> bake(const TypeInfo& type);

    /// Cached descriptor, or nullptr if `type` was not baked yet
    [[nodiscard]] std::shared_ptr<const BakedType> find(const TypeInfo& type) const;

    /// Number of successful compilations so far
    [[nodiscard]] std::size_t bake_count() const noexcept { return bake_count_.load(std::memory_order_acquire); }

    /// Number of cached descriptors
    [[nodiscard]] std::size_t size() const;

private:
    using registry_map = immer::map<const TypeInfo*,
                                    std::shared_ptr<const BakedType>,
                                    std::hash<const TypeInfo*>,
                                    std::equal_to<const TypeInfo*>,
                                    thread_safe_memory_policy>;

    [[nodiscard]] static std::shared_ptr<BakedType> compile(const TypeInfo& type);

    immer::atom<registry_map, thread_safe_memory_policy> registry_;
    std::mutex bake_mutex_;
    std::atomic<std::size_t> bake_count_{0};
};

} // namespace opack
