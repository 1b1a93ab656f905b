// test_reflect.cpp - Tests for type descriptors and class registration

#include <catch2/catch_all.hpp>

#include "test_types.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>

using namespace opack;
using namespace opack_test;

namespace {

std::vector<std::string> field_names(const TypeInfo& type)
{
    std::vector<std::string> names;
    for (const FieldInfo* field : enumerate_fields(type)) {
        names.push_back(field->name);
    }
    return names;
}

} // namespace

// ============================================================
// Type classification
// ============================================================

TEST_CASE("type_of classifies native types", "[reflect][kind]") {
    register_test_types();

    SECTION("primitives and strings") {
        REQUIRE(type_of<bool>().kind == TypeKind::Bool);
        REQUIRE(type_of<int8_t>().kind == TypeKind::Int8);
        REQUIRE(type_of<uint16_t>().kind == TypeKind::UInt16);
        REQUIRE(type_of<int>().kind == TypeKind::Int32);
        REQUIRE(type_of<long long>().kind == TypeKind::Int64);
        REQUIRE(type_of<float>().kind == TypeKind::Float);
        REQUIRE(type_of<double>().kind == TypeKind::Double);
        REQUIRE(type_of<std::string>().kind == TypeKind::String);
        REQUIRE(type_of<int>().is_scalar());
        REQUIRE(type_of<int>().is_number());
        REQUIRE_FALSE(type_of<bool>().is_number());
    }

    SECTION("containers and pointers") {
        REQUIRE(type_of<std::vector<int>>().kind == TypeKind::Sequence);
        REQUIRE(type_of<std::vector<int>>().element == &type_of<int>());
        REQUIRE(type_of<std::map<std::string, Point>>().kind == TypeKind::Mapping);
        REQUIRE(type_of<std::map<std::string, Point>>().key == &type_of<std::string>());
        REQUIRE(type_of<std::unordered_map<int, double>>().kind == TypeKind::Mapping);
        REQUIRE(type_of<std::shared_ptr<Shape>>().kind == TypeKind::Pointer);
        REQUIRE(type_of<std::unique_ptr<Node>>().element == &type_of<Node>());
        REQUIRE(type_of<Value>().kind == TypeKind::Value);
    }

    SECTION("classes") {
        REQUIRE(type_of<Point>().kind == TypeKind::Object);
        REQUIRE(type_of<Point>().registered);
        REQUIRE(type_of<Point>().name == "Point");
        REQUIRE(type_of<Shape>().abstract);
        REQUIRE(type_of<Shape>().polymorphic);
        REQUIRE_FALSE(type_of<Point>().polymorphic);
        REQUIRE(type_of<Marker>().is_interface);
    }

    SECTION("unsupported types") {
        REQUIRE(type_of<char>().kind == TypeKind::Unsupported);
        REQUIRE(type_of<long double>().kind == TypeKind::Unsupported);
        REQUIRE(type_of<std::vector<bool>>().kind == TypeKind::Unsupported);
    }

    SECTION("const is stripped") {
        REQUIRE(&type_of<const int>() == &type_of<int>());
    }
}

TEST_CASE("reflect rejects non-class kinds", "[reflect][registration]") {
    REQUIRE_THROWS_AS(reflect<std::vector<int>>("IntList"), TypeNotAllowedError);
    REQUIRE_THROWS_AS(reflect<std::string>("Text"), TypeNotAllowedError);
}

TEST_CASE("field options require a field", "[reflect][registration]") {
    struct Empty {};
    REQUIRE_THROWS_AS(reflect<Empty>("Empty").transient(), Error);
}

TEST_CASE("explicit_type requires a pointer field", "[reflect][registration]") {
    struct Holder {
        Point point;
    };
    REQUIRE_THROWS_AS(reflect<Holder>("Holder").field("point", &Holder::point).explicit_type<Point>(),
                      TypeNotAllowedError);
}

// ============================================================
// Field enumeration
// ============================================================

TEST_CASE("enumerate_fields order", "[reflect][fields]") {
    register_test_types();

    SECTION("base-class fields come first") {
        REQUIRE(field_names(type_of<OrderLeaf>()) == std::vector<std::string>{"a", "b", "c"});
        REQUIRE(field_names(type_of<OrderMiddle>()) == std::vector<std::string>{"a", "b"});
    }

    SECTION("shadowed fields are distinct") {
        auto fields = enumerate_fields(type_of<ShadowDerived>());
        REQUIRE(fields.size() == 2);
        REQUIRE(fields[0]->name == "value");
        REQUIRE(fields[1]->name == "value");
        REQUIRE(fields[0] != fields[1]);
        REQUIRE(fields[0]->owner == &type_of<ShadowBase>());
        REQUIRE(fields[1]->owner == &type_of<ShadowDerived>());
        REQUIRE(fields[0]->type == &type_of<int>());
        REQUIRE(fields[1]->type == &type_of<std::string>());
    }

    SECTION("static and transient fields are skipped") {
        REQUIRE(field_names(type_of<WithExclusions>()) == std::vector<std::string>{"kept"});
        REQUIRE(type_of<WithExclusions>().fields.size() == 3);
    }
}

TEST_CASE("FieldInfo access", "[reflect][fields]") {
    register_test_types();

    SECTION("locate returns the member address") {
        Point p{3, 4};
        const FieldInfo& y = *type_of<Point>().fields[1];
        REQUIRE(y.locate(&p) == &p.y);
        REQUIRE(y.locate_mutable(&p) == &p.y);
    }

    SECTION("null object throws") {
        const FieldInfo& x = *type_of<Point>().fields[0];
        REQUIRE_THROWS_AS(x.locate(nullptr), FieldAccessError);
    }

    SECTION("const members are read-only") {
        Settings settings;
        const FieldInfo& version = *type_of<Settings>().fields[0];
        REQUIRE(version.read_only);
        REQUIRE(version.locate(&settings) == &settings.version);

        try {
            (void)version.locate_mutable(&settings);
            FAIL("expected FieldAccessError");
        } catch (const FieldAccessError& e) {
            REQUIRE(e.type_name() == "Settings");
            REQUIRE(e.field_name() == "version");
        }
    }

    SECTION("static fields ignore the object") {
        const FieldInfo& instances = *type_of<WithExclusions>().fields[2];
        REQUIRE(instances.is_static);
        REQUIRE(instances.locate(nullptr) == &WithExclusions::instances);
    }
}

// ============================================================
// Wrappers and scalars
// ============================================================

TEST_CASE("primitive and wrapper mapping", "[reflect][wrapper]") {
    REQUIRE(is_primitive(type_of<int>()));
    REQUIRE(is_primitive(type_of<bool>()));
    REQUIRE_FALSE(is_primitive(type_of<std::string>()));

    REQUIRE(is_wrapper(type_of<std::optional<double>>()));
    REQUIRE_FALSE(is_wrapper(type_of<std::optional<std::string>>()));

    REQUIRE(&wrapper_of(type_of<int>()) == &type_of<std::optional<int>>());
    REQUIRE(&wrapper_of(type_of<bool>()) == &type_of<std::optional<bool>>());
    REQUIRE(&primitive_of(type_of<std::optional<float>>()) == &type_of<float>());

    REQUIRE_THROWS_AS(wrapper_of(type_of<std::string>()), TypeNotAllowedError);
    REQUIRE_THROWS_AS(primitive_of(type_of<int>()), TypeNotAllowedError);
}

TEST_CASE("read_scalar and write_scalar", "[reflect][scalar]") {
    SECTION("numbers keep their native width") {
        int16_t native = 300;
        Scalar s = read_scalar(type_of<int16_t>(), &native);
        REQUIRE(std::get<Number>(s).is<int16_t>());
    }

    SECTION("writes narrow numbers") {
        uint8_t native = 0;
        write_scalar(type_of<uint8_t>(), &native, Scalar{std::in_place_type<Number>, Number{int64_t{200}}});
        REQUIRE(native == 200);
    }

    SECTION("empty scalar resets an optional") {
        std::optional<int> native = 5;
        REQUIRE(std::get<Number>(read_scalar(type_of<std::optional<int>>(), &native)).as<int>() == 5);

        write_scalar(type_of<std::optional<int>>(), &native, Scalar{});
        REQUIRE_FALSE(native.has_value());
        REQUIRE(std::holds_alternative<std::monostate>(read_scalar(type_of<std::optional<int>>(), &native)));
    }

    SECTION("kind mismatch throws") {
        int native = 0;
        REQUIRE_THROWS_AS(write_scalar(type_of<int>(), &native, Scalar{std::in_place_type<std::string>, "x"}),
                          TypeNotAllowedError);
        REQUIRE_THROWS_AS(write_scalar(type_of<int>(), &native, Scalar{}), TypeNotAllowedError);
    }

    SECTION("non-scalars are rejected") {
        Point p;
        REQUIRE_THROWS_AS(read_scalar(type_of<Point>(), &p), TypeNotAllowedError);
    }
}

TEST_CASE("write_scalar rejects numbers outside the field range", "[reflect][scalar]") {
    auto number = [](auto v) { return Scalar{std::in_place_type<Number>, Number{v}}; };

    SECTION("too large for an int") {
        int native = 7;
        REQUIRE_THROWS_AS(write_scalar(type_of<int>(), &native, number(1e10)), TypeNotAllowedError);
        REQUIRE_THROWS_AS(write_scalar(type_of<int>(), &native, number(int64_t{1} << 40)), TypeNotAllowedError);
        REQUIRE(native == 7);
    }

    SECTION("NaN and infinity into an integer") {
        int64_t native = 7;
        REQUIRE_THROWS_AS(write_scalar(type_of<int64_t>(), &native, number(std::nan(""))), TypeNotAllowedError);
        REQUIRE_THROWS_AS(write_scalar(type_of<int64_t>(), &native,
                                       number(std::numeric_limits<double>::infinity())),
                          TypeNotAllowedError);
        REQUIRE(native == 7);
    }

    SECTION("negative into unsigned") {
        uint32_t native = 7;
        REQUIRE_THROWS_AS(write_scalar(type_of<uint32_t>(), &native, number(-1)), TypeNotAllowedError);
        REQUIRE_THROWS_AS(write_scalar(type_of<uint32_t>(), &native, number(-0.5)), TypeNotAllowedError);
        REQUIRE(native == 7);
    }

    SECTION("double overflowing a float") {
        float native = 1.0f;
        REQUIRE_THROWS_AS(write_scalar(type_of<float>(), &native, number(1e300)), TypeNotAllowedError);
        REQUIRE(native == 1.0f);
    }

    SECTION("in-range values still narrow") {
        int native = 0;
        write_scalar(type_of<int>(), &native, number(41.9));
        REQUIRE(native == 41);

        float ratio = 0.0f;
        write_scalar(type_of<float>(), &ratio, number(std::numeric_limits<double>::infinity()));
        REQUIRE(std::isinf(ratio));

        std::optional<uint8_t> maybe;
        REQUIRE_THROWS_AS(write_scalar(type_of<std::optional<uint8_t>>(), &maybe, number(256)), TypeNotAllowedError);
        REQUIRE_FALSE(maybe.has_value());
    }

    SECTION("the message names the number and the target") {
        int8_t native = 0;
        try {
            write_scalar(type_of<int8_t>(), &native, number(int32_t{300}));
            FAIL("expected TypeNotAllowedError");
        } catch (const TypeNotAllowedError& e) {
            const std::string message = e.what();
            REQUIRE(message.find("300") != std::string::npos);
            REQUIRE(message.find("out of range") != std::string::npos);
        }
    }
}

// ============================================================
// Instantiation
// ============================================================

TEST_CASE("instantiate", "[reflect][instantiate]") {
    register_test_types();

    SECTION("value-initialized instance") {
        Instance instance = instantiate(type_of<Point>());
        auto* p = static_cast<Point*>(instance.get());
        REQUIRE(p->x == 0);
        REQUIRE(p->y == 0);
    }

    SECTION("registered factory") {
        Instance instance = instantiate(type_of<Account>());
        REQUIRE(static_cast<Account*>(instance.get())->owner == "anonymous");
    }

    SECTION("interfaces and abstract classes cannot be instantiated") {
        REQUIRE_THROWS_AS(instantiate(type_of<Marker>()), NotInstantiableError);
        REQUIRE_THROWS_AS(instantiate(type_of<Shape>()), NotInstantiableError);
    }

    SECTION("no default constructor and no factory") {
        struct NeedsArgument {
            explicit NeedsArgument(int v) : v(v) {}
            int v;
        };
        REQUIRE_THROWS_AS(instantiate(type_of<NeedsArgument>()), NotInstantiableError);
    }
}

// ============================================================
// Inheritance
// ============================================================

TEST_CASE("derives_from and upcast_to", "[reflect][inheritance]") {
    register_test_types();

    REQUIRE(type_of<OrderLeaf>().derives_from(type_of<OrderBase>()));
    REQUIRE(type_of<OrderLeaf>().derives_from(type_of<OrderLeaf>()));
    REQUIRE_FALSE(type_of<OrderBase>().derives_from(type_of<OrderLeaf>()));

    OrderLeaf leaf;
    void* base = type_of<OrderLeaf>().upcast_to(&leaf, type_of<OrderBase>());
    REQUIRE(base == static_cast<OrderBase*>(&leaf));
    REQUIRE(type_of<OrderLeaf>().upcast_to(&leaf, type_of<Point>()) == nullptr);
}

TEST_CASE("resolve_dynamic", "[reflect][polymorphism]") {
    register_test_types();

    SECTION("most-derived registered type") {
        Circle circle;
        Shape* shape = &circle;
        ObjectRef ref = resolve_dynamic(shape, type_of<Shape>());
        REQUIRE(ref.type == &type_of<Circle>());
        REQUIRE(ref.address == &circle);
    }

    SECTION("non-polymorphic types resolve to themselves") {
        Point p;
        ObjectRef ref = resolve_dynamic(&p, type_of<Point>());
        REQUIRE(ref.type == &type_of<Point>());
    }

    SECTION("unregistered dynamic type falls back to the static type") {
        struct Triangle : Shape {
            double area() const override { return 0.0; }
        };
        Triangle triangle;
        ObjectRef ref = resolve_dynamic(static_cast<Shape*>(&triangle), type_of<Shape>());
        REQUIRE(ref.type == &type_of<Shape>());
    }

    SECTION("null stays null") {
        ObjectRef ref = resolve_dynamic(nullptr, type_of<Shape>());
        REQUIRE(ref.address == nullptr);
    }
}
