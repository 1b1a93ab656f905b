// test_baker.cpp - Tests for Baker (type compilation and caching)

#include <catch2/catch_all.hpp>

#include "test_types.h"

using namespace opack;
using namespace opack_test;

namespace {

std::vector<OpCode> opcodes(const Program& program)
{
    std::vector<OpCode> ops;
    for (const auto& instruction : program.code) {
        ops.push_back(instruction.op);
    }
    return ops;
}

} // namespace

// ============================================================
// Properties
// ============================================================

TEST_CASE("Baker builds properties", "[baker][properties]") {
    register_test_types();
    Baker baker;

    SECTION("one property per serializable field, bases first") {
        auto baked = baker.bake(type_of<OrderLeaf>());
        REQUIRE(&baked->type() == &type_of<OrderLeaf>());
        REQUIRE(baked->properties().size() == 3);
        REQUIRE(baked->properties()[0].name == "a");
        REQUIRE(baked->properties()[2].name == "c");
        REQUIRE(baked->find_property("b") != nullptr);
        REQUIRE(baked->find_property("missing") == nullptr);
    }

    SECTION("inherited properties upcast to their declaring class") {
        auto baked = baker.bake(type_of<OrderLeaf>());
        OrderLeaf leaf;
        leaf.a = 7;
        const Property& a = *baked->find_property("a");
        REQUIRE(a.field->owner == &type_of<OrderBase>());
        REQUIRE(a.owner_of(&leaf) == static_cast<OrderBase*>(&leaf));
    }

    SECTION("transient and static fields produce no property") {
        auto baked = baker.bake(type_of<WithExclusions>());
        REQUIRE(baked->properties().size() == 1);
        REQUIRE(baked->properties()[0].name == "kept");
    }

    SECTION("explicit type replaces the declared pointee") {
        auto baked = baker.bake(type_of<Drawing>());
        const Property& main = *baked->find_property("main");
        REQUIRE(main.explicit_type == &type_of<Circle>());
        REQUIRE(main.type == &type_of<Circle>());
        REQUIRE(main.field->type == &type_of<std::shared_ptr<Shape>>());
    }
}

// ============================================================
// Programs
// ============================================================

TEST_CASE("Baker emits object programs", "[baker][program]") {
    register_test_types();
    Baker baker;
    auto baked = baker.bake(type_of<Point>());

    SECTION("serialize builds an Object field by field") {
        const Program& program = baked->serialize_program();
        REQUIRE_FALSE(program.loops());
        REQUIRE(opcodes(program) == std::vector<OpCode>{
                    OpCode::CreateObject,
                    OpCode::PushField, OpCode::CreateNumber, OpCode::ModifyObjectWithConstKey,
                    OpCode::PushField, OpCode::CreateNumber, OpCode::ModifyObjectWithConstKey,
                });
        REQUIRE(program.code[3].key == "x");
        REQUIRE(program.code[6].key == "y");
        REQUIRE(program.code[1].property == &baked->properties()[0]);
    }

    SECTION("deserialize loads each key with a skip over its block") {
        const Program& program = baked->deserialize_program();
        REQUIRE(opcodes(program) == std::vector<OpCode>{
                    OpCode::ExpectObject,
                    OpCode::LoadWithConstKey, OpCode::PushFieldSlot, OpCode::ReadNumber, OpCode::Store,
                    OpCode::LoadWithConstKey, OpCode::PushFieldSlot, OpCode::ReadNumber, OpCode::Store,
                });
        REQUIRE(program.code[1].key == "x");
        REQUIRE(program.code[1].index == 3);
    }

    SECTION("programs render for diagnostics") {
        REQUIRE_FALSE(baked->serialize_program().to_string().empty());
        REQUIRE(std::string(to_string(OpCode::CallInto)) == "CallInto");
    }
}

TEST_CASE("Baker emits nested and container programs", "[baker][program]") {
    register_test_types();
    Baker baker;

    SECTION("nested objects are called") {
        auto baked = baker.bake(type_of<Segment>());
        const Program& serialize = baked->serialize_program();
        REQUIRE(serialize.code[1].op == OpCode::PushField);
        REQUIRE(serialize.code[2].op == OpCode::Call);

        const Program& deserialize = baked->deserialize_program();
        REQUIRE(deserialize.code[1].op == OpCode::LoadWithConstKey);
        REQUIRE(deserialize.code[3].op == OpCode::CallInto);
        REQUIRE(deserialize.code[3].type == &type_of<Point>());
        REQUIRE(deserialize.code[4].op == OpCode::PopValue);
    }

    SECTION("sequences loop per element") {
        auto baked = baker.bake(type_of<std::vector<int>>());
        const Program& serialize = baked->serialize_program();
        REQUIRE(serialize.loops());
        REQUIRE(serialize.loop_begin == 1);
        REQUIRE(opcodes(serialize) == std::vector<OpCode>{
                    OpCode::CreateArray,
                    OpCode::PushElement, OpCode::CreateNumber, OpCode::PushIndex, OpCode::ModifyArray,
                });

        const Program& deserialize = baked->deserialize_program();
        REQUIRE(deserialize.loop_begin == 2);
        REQUIRE(opcodes(deserialize) == std::vector<OpCode>{
                    OpCode::ExpectArray, OpCode::ResizeSequence,
                    OpCode::LoadElement, OpCode::PushElementSlot, OpCode::ReadNumber, OpCode::Store,
                });
    }

    SECTION("mappings loop per entry") {
        auto baked = baker.bake(type_of<std::map<std::string, Point>>());
        REQUIRE(opcodes(baked->serialize_program()) == std::vector<OpCode>{
                    OpCode::CreateObject,
                    OpCode::PushEntryKey, OpCode::CreateString, OpCode::PushEntryValue, OpCode::Call,
                    OpCode::ModifyObject,
                });
        REQUIRE(opcodes(baked->deserialize_program()) == std::vector<OpCode>{
                    OpCode::ExpectObject, OpCode::ClearMapping,
                    OpCode::LoadEntryKey, OpCode::ReadString, OpCode::EmplaceEntry, OpCode::LoadEntryValue,
                    OpCode::CallInto, OpCode::PopValue,
                });
    }

    SECTION("Value fields are cloned") {
        auto baked = baker.bake(type_of<Inventory>());
        const Program& serialize = baked->serialize_program();
        const auto& code = serialize.code;
        REQUIRE(code[code.size() - 2].op == OpCode::CloneValue);
        REQUIRE(code.back().key == "extra");
    }

    SECTION("Object, Array and Number fields are cloned like Value fields") {
        auto baked = baker.bake(type_of<Document>());
        std::size_t clones = 0;
        for (const auto& instruction : baked->serialize_program().code) {
            if (instruction.op == OpCode::CloneValue) ++clones;
        }
        REQUIRE(clones == 4);
        REQUIRE(type_of<Array>().kind == TypeKind::Value);
    }
}

// ============================================================
// Rejected types
// ============================================================

TEST_CASE("Baker rejects types it cannot compile", "[baker][errors]") {
    register_test_types();
    Baker baker;

    SECTION("interfaces and abstract classes") {
        REQUIRE_THROWS_AS(baker.bake(type_of<Marker>()), NotInstantiableError);
        REQUIRE_THROWS_AS(baker.bake(type_of<Shape>()), NotInstantiableError);
    }

    SECTION("unsupported field types") {
        REQUIRE_THROWS_AS(baker.bake(type_of<HasThread>()), TypeNotAllowedError);
        REQUIRE_THROWS_AS(baker.bake(type_of<HasOptionalText>()), TypeNotAllowedError);
    }

    SECTION("unregistered classes") {
        struct Unregistered {
            int value = 0;
        };
        REQUIRE_THROWS_AS(baker.bake(type_of<Unregistered>()), TypeNotAllowedError);
    }

    SECTION("unregistered abstract classes are not instantiable") {
        struct UnregisteredShape {
            virtual ~UnregisteredShape() = default;
            virtual int sides() const = 0;
        };
        REQUIRE_THROWS_AS(baker.bake(type_of<UnregisteredShape>()), NotInstantiableError);
        REQUIRE(baker.bake_count() == 0);
    }

    SECTION("scalars and pointers are not baked on their own") {
        REQUIRE_THROWS_AS(baker.bake(type_of<int>()), TypeNotAllowedError);
        REQUIRE_THROWS_AS(baker.bake(type_of<std::shared_ptr<Circle>>()), TypeNotAllowedError);
    }

    SECTION("mapping keys must be scalar") {
        REQUIRE_THROWS_AS(baker.bake(type_of<std::map<Point, int>>()), TypeNotAllowedError);
    }

    SECTION("failures are not cached") {
        REQUIRE_THROWS_AS(baker.bake(type_of<HasThread>()), TypeNotAllowedError);
        REQUIRE_THROWS_AS(baker.bake(type_of<HasThread>()), TypeNotAllowedError);
        REQUIRE(baker.find(type_of<HasThread>()) == nullptr);
        REQUIRE(baker.bake_count() == 0);
        REQUIRE(baker.size() == 0);
    }
}

// ============================================================
// Transformers
// ============================================================

TEST_CASE("Baker resolves transformers", "[baker][transformer]") {
    register_test_types();
    Baker baker;

    SECTION("class-level transformer replaces the generated code") {
        auto baked = baker.bake(type_of<Version>());
        REQUIRE(baked->transformers().size() == 1);
        REQUIRE(opcodes(baked->serialize_program()) ==
                std::vector<OpCode>{OpCode::PushSelf, OpCode::ApplyTransformer});
        REQUIRE(opcodes(baked->deserialize_program()) ==
                std::vector<OpCode>{OpCode::PushSelf, OpCode::RevertTransformer});
        REQUIRE(baked->serialize_program().code[1].transformer == baked->transformers().front().get());
    }

    SECTION("own transformer comes before inherited ones") {
        auto baked = baker.bake(type_of<Monster>());
        REQUIRE(baked->transformers().size() == 2);
        REQUIRE(baked->transformers()[0] == type_of<Monster>().transformer);
        REQUIRE(baked->transformers()[1] == type_of<Entity>().transformer);
        REQUIRE(baked->serialize_program().code[1].transformer == type_of<Monster>().transformer.get());
    }

    SECTION("inheritable transformer applies to derived classes") {
        auto baked = baker.bake(type_of<Player>());
        REQUIRE(baked->transformers().size() == 1);
        REQUIRE(baked->transformers()[0] == type_of<Entity>().transformer);
    }

    SECTION("field transformer wins over the class transformer") {
        auto baked = baker.bake(type_of<Squad>());
        REQUIRE(baked->find_property("leader")->transformer == type_of<Entity>().transformer);
        REQUIRE(baked->find_property("boss")->transformer == type_of<Monster>().transformer);

        const Property& scout = *baked->find_property("scout");
        REQUIRE(scout.transformer == scout.field->transformer);
        REQUIRE(scout.transformer != type_of<Entity>().transformer);
    }

    SECTION("transformed fields read the raw native value") {
        auto baked = baker.bake(type_of<Release>());
        const Program& serialize = baked->serialize_program();
        REQUIRE(serialize.code[1].op == OpCode::PushField);
        REQUIRE(serialize.code[1].flag);
        REQUIRE(serialize.code[2].op == OpCode::ApplyTransformer);
    }
}

// ============================================================
// Caching
// ============================================================

TEST_CASE("Baker caches descriptors", "[baker][cache]") {
    register_test_types();
    Baker baker;

    REQUIRE(baker.find(type_of<Point>()) == nullptr);

    auto first = baker.bake(type_of<Point>());
    auto second = baker.bake(type_of<Point>());

    REQUIRE(first == second);
    REQUIRE(baker.find(type_of<Point>()) == first);
    REQUIRE(baker.bake_count() == 1);
    REQUIRE(baker.size() == 1);

    SECTION("separate bakers keep separate caches") {
        Baker other;
        auto third = other.bake(type_of<Point>());
        REQUIRE(third != first);
        REQUIRE(other.bake_count() == 1);
    }

    SECTION("nested types are baked lazily") {
        (void)baker.bake(type_of<Segment>());
        REQUIRE(baker.bake_count() == 2);
        REQUIRE(baker.find(type_of<Segment>()) != nullptr);
    }
}
