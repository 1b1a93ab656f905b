// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file virtual_machine.h
/// @brief Stack machine executing baked serialize / deserialize programs.
///
/// A run seeds exactly one root frame and loops until the frame stack is
/// empty: an exhausted frame is popped, otherwise the instruction at its
/// cursor is executed. Call / CallInto push frames for nested objects,
/// baking their runtime type on first use.
///
/// At the end of a serialize run the result stack holds exactly one Value
/// (the result) and the scratch stack is empty. At the end of a deserialize
/// run the input stack holds exactly the root input node. Anything else
/// raises MalformedProgramError.
///
/// ## Failure
/// Any exception aborts the run: the stacks are cleared, the failing type,
/// instruction and cursor are logged, and the exception propagates. No
/// partial result is returned. The object being deserialized keeps whatever
/// fields were written before the failure.
///
/// ## Reuse
/// A VirtualMachine may run many times (never concurrently). Stacks keep
/// their capacity between runs, never their contents.

#pragma once

#include <opack/opack_config.h>

#include <opack/api.h>
#include <opack/baked_type.h>
#include <opack/baker.h>
#include <opack/instruction.h>
#include <opack/type_info.h>
#include <opack/value.h>

#include <cstddef>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace opack {

struct VmOptions {
    /// Maximum frame-stack depth of a run; 0 means unlimited
    std::size_t max_depth = OPACK_DEFAULT_MAX_DEPTH;
};

class OPACK_API VirtualMachine {
public:
    explicit VirtualMachine(Baker& baker = Baker::global(), VmOptions options = {});

    /// Serialize `object`, resolving its runtime type from `type`.
    /// A null object serializes to None.
    [[nodiscard]] Value serialize(const void* object, const TypeInfo& type);

    /// Populate `object` (an instance of exactly `type`) from `value`
    void deserialize(const Value& value, void* object, const TypeInfo& type);

    /// Run a serialize program with `object` bound to the root frame
    [[nodiscard]] Value run_serialize(const Program& program, const void* object, const TypeInfo& type);

    /// Run a deserialize program with `object` and `value` bound to the root frame
    void run_deserialize(const Program& program, const Value& value, void* object, const TypeInfo& type);

    [[nodiscard]] const VmOptions& options() const noexcept { return options_; }

private:
    using Operand = std::variant<Scalar, ObjectRef>;

    enum class Direction { Serialize, Deserialize };

    struct Frame {
        ObjectRef object;
        const Program* program = nullptr;
        std::shared_ptr<const BakedType> baked; ///< keeps the program alive
        const Value* input = nullptr;           ///< deserialize: node bound to this frame
        std::size_t cursor = 0;
        std::size_t iteration = 0;
        std::size_t length = 0;                 ///< element count of a looping program
        MappingOps::EntryRefs entries;          ///< serialize: mapping entries snapshot
    };

    void start(Direction direction,
               ObjectRef root,
               const Program& program,
               std::shared_ptr<const BakedType> baked,
               const Value* input);
    void loop();
    void execute(Frame& frame, const Instruction& instruction);
    void finish_serialize();
    void finish_deserialize();
    void abort(const char* what);
    void reset() noexcept;

    void push_frame(ObjectRef object,
                    const Program& program,
                    std::shared_ptr<const BakedType> baked,
                    const Value* input);

    /// Push a native value onto scratch: scalars by value, the rest by
    /// reference, smart pointers dereferenced to their runtime type
    void push_native(const void* address, const TypeInfo& type, bool raw);

    [[nodiscard]] Scalar pop_scalar();
    [[nodiscard]] ObjectRef pop_ref();
    [[nodiscard]] Value pop_result();
    [[nodiscard]] const Value& pop_input();
    [[nodiscard]] const Value& top_input() const;
    [[nodiscard]] Object& top_object();
    [[nodiscard]] Array& top_array();

    [[nodiscard]] const Object& input_object(const Frame& frame) const;
    [[nodiscard]] const Array& input_array(const Frame& frame) const;
    [[nodiscard]] void* current_element(Frame& frame) const;
    void check_kind(const Frame& frame, TypeKind kind) const;

    [[noreturn]] void malformed(const std::string& what) const;

    Baker& baker_;
    VmOptions options_;
    Direction direction_ = Direction::Serialize;

    std::vector<Frame> frames_;
    std::vector<Operand> scratch_;
    std::vector<Value> results_;
    std::vector<const Value*> inputs_;

    // Context of the instruction being executed, for diagnostics
    const TypeInfo* current_type_ = nullptr;
    const Instruction* current_instruction_ = nullptr;
    std::size_t current_cursor_ = 0;
};

} // namespace opack
