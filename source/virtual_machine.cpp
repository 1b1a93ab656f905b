// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <opack/virtual_machine.h>

#include <opack/diagnostics.h>
#include <opack/errors.h>
#include <opack/transformer.h>

#include <exception>
#include <utility>

namespace opack {

VirtualMachine::VirtualMachine(Baker& baker, VmOptions options)
    : baker_(baker)
    , options_(options)
{
}

// ============================================================
// Entry points
// ============================================================

Value VirtualMachine::serialize(const void* object, const TypeInfo& type)
{
    if (!object) {
        return Value{};
    }
    const ObjectRef root = resolve_dynamic(const_cast<void*>(object), type);
    auto baked = baker_.bake(*root.type);
    const Program& program = baked->serialize_program();
    start(Direction::Serialize, root, program, std::move(baked), nullptr);

    Value result = std::move(results_.back());
    reset();
    return result;
}

void VirtualMachine::deserialize(const Value& value, void* object, const TypeInfo& type)
{
    auto baked = baker_.bake(type);
    const Program& program = baked->deserialize_program();
    start(Direction::Deserialize, ObjectRef{object, &type}, program, std::move(baked), &value);
    reset();
}

Value VirtualMachine::run_serialize(const Program& program, const void* object, const TypeInfo& type)
{
    start(Direction::Serialize, ObjectRef{const_cast<void*>(object), &type}, program, nullptr, nullptr);

    Value result = std::move(results_.back());
    reset();
    return result;
}

void VirtualMachine::run_deserialize(const Program& program, const Value& value, void* object, const TypeInfo& type)
{
    start(Direction::Deserialize, ObjectRef{object, &type}, program, nullptr, &value);
    reset();
}

void VirtualMachine::start(Direction direction,
                           ObjectRef root,
                           const Program& program,
                           std::shared_ptr<const BakedType> baked,
                           const Value* input)
{
    reset();
    direction_ = direction;

    try {
        if (input) {
            inputs_.push_back(input);
        }
        push_frame(root, program, std::move(baked), input);
        loop();

        if (direction_ == Direction::Serialize) {
            finish_serialize();
        } else {
            finish_deserialize();
        }
    } catch (const std::exception& e) {
        abort(e.what());
        throw;
    }
}

void VirtualMachine::finish_serialize()
{
    if (results_.size() != 1 || !scratch_.empty() || !inputs_.empty()) {
        current_instruction_ = nullptr;
        malformed("unbalanced stacks after serialize: " + std::to_string(results_.size()) + " results, " +
                  std::to_string(scratch_.size()) + " scratch operands");
    }
}

void VirtualMachine::finish_deserialize()
{
    if (inputs_.size() != 1 || !scratch_.empty() || !results_.empty()) {
        current_instruction_ = nullptr;
        malformed("unbalanced stacks after deserialize: " + std::to_string(inputs_.size()) + " input nodes, " +
                  std::to_string(scratch_.size()) + " scratch operands");
    }
}

void VirtualMachine::abort(const char* what)
{
    std::string where = current_type_ ? current_type_->name : std::string("<no frame>");
    if (current_instruction_) {
        where += " at " + std::to_string(current_cursor_) + " (" + current_instruction_->to_string() + ")";
    }
    detail::log_event("vm", "run aborted in " + where + ": " + what);
    reset();
}

void VirtualMachine::reset() noexcept
{
    frames_.clear();
    scratch_.clear();
    results_.clear();
    inputs_.clear();
    current_type_ = nullptr;
    current_instruction_ = nullptr;
    current_cursor_ = 0;
}

// ============================================================
// Interpreter loop
// ============================================================

void VirtualMachine::push_frame(ObjectRef object,
                                const Program& program,
                                std::shared_ptr<const BakedType> baked,
                                const Value* input)
{
    if (options_.max_depth != 0 && frames_.size() >= options_.max_depth) {
        throw DepthExceededError(options_.max_depth);
    }

    Frame frame;
    frame.object = object;
    frame.program = &program;
    frame.baked = std::move(baked);
    frame.input = input;

    if (direction_ == Direction::Serialize && object.address) {
        if (object.type->kind == TypeKind::Sequence) {
            frame.length = object.type->sequence.size(object.address);
        } else if (object.type->kind == TypeKind::Mapping) {
            object.type->mapping.entries(object.address, frame.entries);
            frame.length = frame.entries.size();
        }
    }

    frames_.push_back(std::move(frame));
}

void VirtualMachine::loop()
{
    while (!frames_.empty()) {
        Frame& frame = frames_.back();
        const Program& program = *frame.program;

        if (program.loops() && frame.cursor == program.loop_begin && frame.iteration >= frame.length) {
            frames_.pop_back();
            continue;
        }
        if (frame.cursor >= program.code.size()) {
            if (program.loops()) {
                ++frame.iteration;
                frame.cursor = program.loop_begin;
            } else {
                frames_.pop_back();
            }
            continue;
        }

        current_type_ = frame.object.type;
        current_cursor_ = frame.cursor;
        current_instruction_ = &program.code[frame.cursor];
        ++frame.cursor;

        // May push a frame: `frame` must not be used after this call
        execute(frame, *current_instruction_);
    }
}

void VirtualMachine::execute(Frame& frame, const Instruction& instruction)
{
    switch (instruction.op) {

    // ===== Serialize: build Values =====

    case OpCode::CreateObject:
        results_.push_back(Value::object());
        break;

    case OpCode::CreateArray:
        results_.push_back(Value::array(instruction.flag ? frame.length : 0));
        break;

    case OpCode::CreateNone:
        results_.emplace_back();
        break;

    case OpCode::CreateBool: {
        Scalar scalar = pop_scalar();
        if (std::holds_alternative<std::monostate>(scalar)) {
            results_.emplace_back();
        } else if (auto* b = std::get_if<bool>(&scalar)) {
            results_.emplace_back(*b);
        } else {
            malformed(std::string("expected bool operand, got ") + scalar_kind_name(scalar));
        }
        break;
    }

    case OpCode::CreateNumber: {
        Scalar scalar = pop_scalar();
        if (std::holds_alternative<std::monostate>(scalar)) {
            results_.emplace_back();
        } else if (auto* n = std::get_if<Number>(&scalar)) {
            results_.emplace_back(*n);
        } else {
            malformed(std::string("expected number operand, got ") + scalar_kind_name(scalar));
        }
        break;
    }

    case OpCode::CreateString: {
        Scalar scalar = pop_scalar();
        if (std::holds_alternative<std::monostate>(scalar)) {
            results_.emplace_back();
        } else if (auto* s = std::get_if<std::string>(&scalar)) {
            results_.emplace_back(std::move(*s));
        } else {
            malformed(std::string("expected string operand, got ") + scalar_kind_name(scalar));
        }
        break;
    }

    case OpCode::CloneValue: {
        const ObjectRef ref = pop_ref();
        if (ref.type->kind != TypeKind::Value) {
            malformed("expected a reference to a Value, got " + ref.type->name);
        }
        results_.push_back(ref.type->generic.load(ref.address));
        break;
    }

    case OpCode::ModifyObject: {
        Value value = pop_result();
        Value key = pop_result();
        top_object().put(std::move(key), std::move(value));
        break;
    }

    case OpCode::ModifyObjectWithConstKey: {
        Value value = pop_result();
        top_object().put(Value{instruction.key}, std::move(value));
        break;
    }

    case OpCode::ModifyArray: {
        Value value = pop_result();
        const Scalar index = pop_scalar();
        const auto* n = std::get_if<Number>(&index);
        if (!n) {
            malformed(std::string("expected number index, got ") + scalar_kind_name(index));
        }
        if (!n->fits<std::size_t>()) {
            malformed("array index " + n->to_string() + " is not a valid position");
        }
        top_array().set(n->as<std::size_t>(), std::move(value));
        break;
    }

    case OpCode::ModifyArrayWithIndex: {
        Value value = pop_result();
        top_array().set(instruction.index, std::move(value));
        break;
    }

    // ===== Serialize: read natives =====

    case OpCode::PushConst:
        scratch_.emplace_back(instruction.constant);
        break;

    case OpCode::PushField: {
        if (!instruction.property) {
            malformed("PushField without property");
        }
        const Property& property = *instruction.property;
        const void* address = property.field->locate(property.owner_of(frame.object.address));
        push_native(address, *property.field->type, instruction.flag);
        break;
    }

    case OpCode::PushSelf:
        scratch_.emplace_back(frame.object);
        break;

    case OpCode::PushElement: {
        check_kind(frame, TypeKind::Sequence);
        push_native(current_element(frame), *frame.object.type->element, instruction.flag);
        break;
    }

    case OpCode::PushEntryKey:
    case OpCode::PushEntryValue: {
        check_kind(frame, TypeKind::Mapping);
        if (frame.iteration >= frame.entries.size()) {
            malformed("no mapping entry at iteration " + std::to_string(frame.iteration));
        }
        const auto& [key, mapped] = frame.entries[frame.iteration];
        if (instruction.op == OpCode::PushEntryKey) {
            push_native(key, *frame.object.type->key, false);
        } else {
            push_native(mapped, *frame.object.type->element, instruction.flag);
        }
        break;
    }

    case OpCode::PushIndex:
        scratch_.emplace_back(Scalar{std::in_place_type<Number>, Number{frame.iteration}});
        break;

    case OpCode::Call: {
        const ObjectRef ref = pop_ref();
        if (!ref.address) {
            results_.emplace_back();
            break;
        }
        auto baked = baker_.bake(*ref.type);
        const Program& program = baked->serialize_program();
        push_frame(ref, program, std::move(baked), nullptr);
        break;
    }

    case OpCode::ApplyTransformer: {
        if (!instruction.transformer) {
            malformed("ApplyTransformer without transformer");
        }
        const ObjectRef ref = pop_ref();
        if (!ref.address) {
            results_.emplace_back();
            break;
        }
        results_.push_back(instruction.transformer->serialize(ref.address, *ref.type));
        break;
    }

    // ===== Deserialize: walk the input =====

    case OpCode::ExpectObject:
        (void)input_object(frame);
        break;

    case OpCode::ExpectArray:
        (void)input_array(frame);
        break;

    case OpCode::LoadWithConstKey: {
        if (const Value* child = input_object(frame).get(instruction.key)) {
            inputs_.push_back(child);
        } else {
            if (frame.cursor + instruction.index > frame.program->code.size()) {
                malformed("skip of " + std::to_string(instruction.index) + " runs past the end of the program");
            }
            frame.cursor += instruction.index;
        }
        break;
    }

    case OpCode::LoadElement: {
        const Value* element = input_array(frame).get(frame.iteration);
        if (!element) {
            malformed("no input element at iteration " + std::to_string(frame.iteration));
        }
        inputs_.push_back(element);
        break;
    }

    case OpCode::LoadEntryKey:
    case OpCode::LoadEntryValue: {
        const Object& object = input_object(frame);
        if (frame.iteration >= object.size()) {
            malformed("no input entry at iteration " + std::to_string(frame.iteration));
        }
        const auto& entry = object.entry(frame.iteration);
        inputs_.push_back(instruction.op == OpCode::LoadEntryKey ? &entry.first : &entry.second);
        break;
    }

    case OpCode::PopValue:
        (void)pop_input();
        break;

    // ===== Deserialize: write natives =====

    case OpCode::ReadBool: {
        const Value& node = pop_input();
        if (node.is_none()) {
            scratch_.emplace_back(Scalar{});
        } else if (auto* b = node.get_if<bool>()) {
            scratch_.emplace_back(Scalar{std::in_place_type<bool>, *b});
        } else {
            throw TypeNotAllowedError(std::string("expected Bool, got ") + to_string(node.kind()));
        }
        break;
    }

    case OpCode::ReadNumber: {
        const Value& node = pop_input();
        if (node.is_none()) {
            scratch_.emplace_back(Scalar{});
        } else if (auto* n = node.get_if<Number>()) {
            scratch_.emplace_back(Scalar{std::in_place_type<Number>, *n});
        } else {
            throw TypeNotAllowedError(std::string("expected Number, got ") + to_string(node.kind()));
        }
        break;
    }

    case OpCode::ReadString: {
        const Value& node = pop_input();
        if (node.is_none()) {
            scratch_.emplace_back(Scalar{});
        } else if (auto* s = node.get_if<std::string>()) {
            scratch_.emplace_back(Scalar{std::in_place_type<std::string>, *s});
        } else {
            throw TypeNotAllowedError(std::string("expected String, got ") + to_string(node.kind()));
        }
        break;
    }

    case OpCode::PushFieldSlot: {
        if (!instruction.property) {
            malformed("PushFieldSlot without property");
        }
        const Property& property = *instruction.property;
        void* address = property.field->locate_mutable(property.owner_of(frame.object.address));
        scratch_.emplace_back(ObjectRef{address, property.field->type});
        break;
    }

    case OpCode::PushElementSlot:
        check_kind(frame, TypeKind::Sequence);
        scratch_.emplace_back(ObjectRef{current_element(frame), frame.object.type->element});
        break;

    case OpCode::EmplaceEntry: {
        check_kind(frame, TypeKind::Mapping);
        const Scalar key = pop_scalar();
        void* mapped = frame.object.type->mapping.emplace(frame.object.address, key);
        scratch_.emplace_back(ObjectRef{mapped, frame.object.type->element});
        break;
    }

    case OpCode::Store: {
        const Scalar scalar = pop_scalar();
        const ObjectRef slot = pop_ref();
        write_scalar(*slot.type, slot.address, scalar);
        break;
    }

    case OpCode::AssignValue: {
        const ObjectRef slot = pop_ref();
        if (slot.type->kind != TypeKind::Value) {
            malformed("expected a Value slot, got " + slot.type->name);
        }
        slot.type->generic.assign(slot.address, top_input());
        break;
    }

    case OpCode::CallInto: {
        const ObjectRef slot = pop_ref();
        const Value& input = top_input();

        if (slot.type->kind == TypeKind::Pointer) {
            if (input.is_none()) {
                slot.type->pointer.reset(slot.address);
                break;
            }
            const TypeInfo& pointee = *slot.type->element;
            const TypeInfo& target = instruction.type ? *instruction.type : pointee;
            Instance instance = instantiate(target);
            void* object = instance.get();
            void* as_pointee = target.upcast_to(object, pointee);
            if (!as_pointee) {
                throw TypeNotAllowedError(target.name + " is not derived from " + pointee.name);
            }
            slot.type->pointer.adopt(slot.address, std::move(instance), as_pointee, &target == &pointee);

            auto baked = baker_.bake(target);
            const Program& program = baked->deserialize_program();
            push_frame(ObjectRef{object, &target}, program, std::move(baked), &input);
            break;
        }

        auto baked = baker_.bake(*slot.type);
        if (input.is_none() && baked->transformers().empty()) {
            // Non-nullable slot: keep its current contents. A transformer still sees the None.
            detail::log_access_error("CallInto", "None for non-nullable " + slot.type->name + " ignored");
            break;
        }
        const Program& program = baked->deserialize_program();
        push_frame(slot, program, std::move(baked), &input);
        break;
    }

    case OpCode::RevertTransformer: {
        if (!instruction.transformer) {
            malformed("RevertTransformer without transformer");
        }
        const ObjectRef slot = pop_ref();
        instruction.transformer->deserialize(top_input(), slot.address, *slot.type);
        break;
    }

    case OpCode::ResizeSequence: {
        check_kind(frame, TypeKind::Sequence);
        const std::size_t size = input_array(frame).size();
        frame.object.type->sequence.resize(frame.object.address, size);
        frame.length = size;
        break;
    }

    case OpCode::ClearMapping: {
        check_kind(frame, TypeKind::Mapping);
        const std::size_t size = input_object(frame).size();
        frame.object.type->mapping.clear(frame.object.address);
        frame.length = size;
        break;
    }
    }
}

// ============================================================
// Operands
// ============================================================

void VirtualMachine::push_native(const void* address, const TypeInfo& type, bool raw)
{
    if (raw) {
        scratch_.emplace_back(ObjectRef{const_cast<void*>(address), &type});
    } else if (type.is_scalar()) {
        scratch_.emplace_back(read_scalar(type, address));
    } else if (type.kind == TypeKind::Pointer) {
        void* pointee = type.pointer.get(address);
        scratch_.emplace_back(resolve_dynamic(pointee, *type.element));
    } else {
        scratch_.emplace_back(ObjectRef{const_cast<void*>(address), &type});
    }
}

Scalar VirtualMachine::pop_scalar()
{
    if (scratch_.empty()) {
        malformed("scratch stack underflow");
    }
    auto* scalar = std::get_if<Scalar>(&scratch_.back());
    if (!scalar) {
        malformed("expected a scalar operand, got a reference");
    }
    Scalar result = std::move(*scalar);
    scratch_.pop_back();
    return result;
}

ObjectRef VirtualMachine::pop_ref()
{
    if (scratch_.empty()) {
        malformed("scratch stack underflow");
    }
    auto* ref = std::get_if<ObjectRef>(&scratch_.back());
    if (!ref) {
        malformed("expected a reference operand, got a scalar");
    }
    const ObjectRef result = *ref;
    scratch_.pop_back();
    return result;
}

Value VirtualMachine::pop_result()
{
    if (results_.empty()) {
        malformed("result stack underflow");
    }
    Value result = std::move(results_.back());
    results_.pop_back();
    return result;
}

const Value& VirtualMachine::pop_input()
{
    if (inputs_.empty()) {
        malformed("input stack underflow");
    }
    const Value* node = inputs_.back();
    inputs_.pop_back();
    return *node;
}

const Value& VirtualMachine::top_input() const
{
    if (inputs_.empty()) {
        malformed("input stack underflow");
    }
    return *inputs_.back();
}

Object& VirtualMachine::top_object()
{
    Object* object = results_.empty() ? nullptr : results_.back().object_if();
    if (!object) {
        malformed("no Object under construction");
    }
    return *object;
}

Array& VirtualMachine::top_array()
{
    Array* array = results_.empty() ? nullptr : results_.back().array_if();
    if (!array) {
        malformed("no Array under construction");
    }
    return *array;
}

const Object& VirtualMachine::input_object(const Frame& frame) const
{
    if (!frame.input) {
        malformed("frame has no input");
    }
    const Object* object = frame.input->object_if();
    if (!object) {
        throw TypeNotAllowedError("expected Object for " + frame.object.type->name + ", got " +
                                  to_string(frame.input->kind()));
    }
    return *object;
}

const Array& VirtualMachine::input_array(const Frame& frame) const
{
    if (!frame.input) {
        malformed("frame has no input");
    }
    const Array* array = frame.input->array_if();
    if (!array) {
        throw TypeNotAllowedError("expected Array for " + frame.object.type->name + ", got " +
                                  to_string(frame.input->kind()));
    }
    return *array;
}

void* VirtualMachine::current_element(Frame& frame) const
{
    const TypeInfo& type = *frame.object.type;
    if (frame.iteration >= type.sequence.size(frame.object.address)) {
        malformed("no sequence element at iteration " + std::to_string(frame.iteration));
    }
    return type.sequence.element(frame.object.address, frame.iteration);
}

void VirtualMachine::check_kind(const Frame& frame, TypeKind kind) const
{
    if (!frame.object.address || frame.object.type->kind != kind) {
        malformed(std::string("frame is not bound to a ") + to_string(kind) + " (" + frame.object.type->name + ")");
    }
}

void VirtualMachine::malformed(const std::string& what) const
{
    std::string message = current_type_ ? current_type_->name : std::string("<no frame>");
    if (current_instruction_) {
        message += ": " + std::string(to_string(current_instruction_->op)) + " at " + std::to_string(current_cursor_);
    }
    throw MalformedProgramError(message + ": " + what);
}

} // namespace opack
