// test_value.cpp - Tests for the generic Value tree (Number, Object, Array)

#include <catch2/catch_all.hpp>
#include <opack/errors.h>
#include <opack/value.h>

#include <cmath>
#include <limits>
#include <string>
#include <thread>

using namespace opack;

// ============================================================
// Number
// ============================================================

TEST_CASE("Number keeps its width", "[value][number]") {
    SECTION("same value at different widths is not equal") {
        REQUIRE(Number{int32_t{3}} == Number{int32_t{3}});
        REQUIRE(Number{int32_t{3}} != Number{int64_t{3}});
        REQUIRE(Number{3.0f} != Number{3.0});
    }

    SECTION("platform integer types map to fixed widths") {
        REQUIRE(Number{static_cast<short>(7)}.is<int16_t>());
        REQUIRE(Number{7u}.is<uint32_t>());
        REQUIRE(Number{static_cast<long long>(7)}.is<int64_t>());
    }

    SECTION("as() converts across widths") {
        Number n{int8_t{-5}};
        REQUIRE(n.as<int64_t>() == -5);
        REQUIRE(n.as<double>() == Catch::Approx(-5.0));
        REQUIRE(n.is_integral());
        REQUIRE_FALSE(Number{2.5}.is_integral());
    }

    SECTION("fits() checks the target range") {
        REQUIRE(Number{int64_t{200}}.fits<uint8_t>());
        REQUIRE_FALSE(Number{int64_t{256}}.fits<uint8_t>());
        REQUIRE_FALSE(Number{-1}.fits<uint64_t>());
        REQUIRE(Number{41.9}.fits<int>());
        REQUIRE_FALSE(Number{1e10}.fits<int>());
        REQUIRE_FALSE(Number{std::nan("")}.fits<int>());
        REQUIRE(Number{std::nan("")}.fits<double>());
        REQUIRE_FALSE(Number{1e300}.fits<float>());
        REQUIRE(Number{std::numeric_limits<uint64_t>::max()}.fits<float>());
    }

    SECTION("as() saturates outside the target range") {
        REQUIRE(Number{1e10}.as<int>() == std::numeric_limits<int>::max());
        REQUIRE(Number{-1e10}.as<int>() == std::numeric_limits<int>::min());
        REQUIRE(Number{-5}.as<uint16_t>() == 0);
        REQUIRE(Number{std::nan("")}.as<int64_t>() == 0);
        REQUIRE(Number{int32_t{300}}.as<int8_t>() == 127);
    }

    SECTION("to_string carries a width suffix") {
        REQUIRE(Number{int32_t{42}}.to_string() == "42");
        REQUIRE(Number{int64_t{42}}.to_string() == "42L");
        REQUIRE(Number{uint8_t{42}}.to_string() == "42u8");
    }
}

// ============================================================
// Value kinds
// ============================================================

TEST_CASE("Value construction and kinds", "[value][kind]") {
    REQUIRE(Value{}.is_none());
    REQUIRE(Value::none().kind() == ValueKind::None);
    REQUIRE(Value{true}.is_bool());
    REQUIRE(Value{42}.is_number());
    REQUIRE(Value{"text"}.is_string());
    REQUIRE(Value::object().is_object());
    REQUIRE(Value::array(3).is_array());
    REQUIRE(Value::array(3).as_array().size() == 3);

    SECTION("typed accessors with defaults") {
        REQUIRE(Value{true}.as_bool());
        REQUIRE(Value{"x"}.as_bool(true));
        REQUIRE(Value{42}.as_number<int>() == 42);
        REQUIRE(Value{"x"}.as_number<int>(-1) == -1);
        REQUIRE(Value{"hello"}.as_string_view() == "hello");
        REQUIRE(Value{42}.as_string_view().empty());
    }

    SECTION("to_string renders the tree") {
        Value v = Value::object();
        v.as_object().put("a", 1);
        v.as_object().put("b", Value::array(1));
        REQUIRE(v.to_string() == "{\"a\": 1, \"b\": [none]}");
    }
}

// ============================================================
// Object
// ============================================================

TEST_CASE("Object put and get", "[value][object]") {
    Object obj;

    SECTION("put appends in insertion order") {
        obj.put("z", 1);
        obj.put("a", 2);
        obj.put("m", 3);

        REQUIRE(obj.size() == 3);
        REQUIRE(obj.entry(0).first.as_string_view() == "z");
        REQUIRE(obj.entry(1).first.as_string_view() == "a");
        REQUIRE(obj.entry(2).first.as_string_view() == "m");
    }

    SECTION("put on an existing key replaces in place") {
        obj.put("x", 1);
        obj.put("y", 2);
        obj.put("x", 10);

        REQUIRE(obj.size() == 2);
        REQUIRE(obj.entry(0).first.as_string_view() == "x");
        REQUIRE(obj.entry(0).second.as_number<int>() == 10);
    }

    SECTION("missing keys return nullptr") {
        obj.put("x", 1);
        REQUIRE(obj.get("y") == nullptr);
        REQUIRE_FALSE(obj.contains("y"));
        REQUIRE(obj.contains(std::string("x")));
    }

    SECTION("None is a value, not an absent key") {
        obj.put("nothing", Value{});
        REQUIRE(obj.contains("nothing"));
        REQUIRE(obj.get("nothing")->is_none());
    }

    SECTION("any Value can be a key") {
        obj.put(1, "one");
        obj.put(int64_t{1}, "wide one");
        obj.put(true, "yes");

        REQUIRE(obj.size() == 3);
        REQUIRE(obj.get(Value{1})->as_string_view() == "one");
        REQUIRE(obj.get(Value{int64_t{1}})->as_string_view() == "wide one");
        REQUIRE(obj.get(Value{true})->as_string_view() == "yes");
    }

    SECTION("compound keys are looked up structurally") {
        Value key = Value::array(2);
        key.as_array().set(0, 1);
        key.as_array().set(1, 2);
        Value lookup = key.clone();

        obj.put(std::move(key), "pair");
        REQUIRE(obj.get(lookup) != nullptr);
        REQUIRE(obj.get(lookup)->as_string_view() == "pair");
    }
}

TEST_CASE("Object equality ignores order", "[value][object][equality]") {
    Object a;
    a.put("x", 1);
    a.put("y", 2);

    Object b;
    b.put("y", 2);
    b.put("x", 1);

    REQUIRE(a == b);
    REQUIRE(Value{a.clone()}.hash() == Value{b.clone()}.hash());

    b.put("x", 3);
    REQUIRE_FALSE(a == b);
}

// ============================================================
// Array
// ============================================================

TEST_CASE("Array set and bounds", "[value][array]") {
    Array arr(3);

    SECTION("new slots are None") {
        for (const auto& item : arr) {
            REQUIRE(item.is_none());
        }
    }

    SECTION("set replaces an element") {
        arr.set(1, "middle");
        REQUIRE(arr.get(1)->as_string_view() == "middle");
    }

    SECTION("set past the end throws and leaves the array untouched") {
        arr.set(0, 1);
        REQUIRE_THROWS_AS(arr.set(5, 99), IndexOutOfRangeError);
        REQUIRE(arr.size() == 3);
        REQUIRE(arr.get(0)->as_number<int>() == 1);

        try {
            arr.set(5, 99);
        } catch (const IndexOutOfRangeError& e) {
            REQUIRE(e.index() == 5);
            REQUIRE(e.size() == 3);
        }
    }

    SECTION("get out of bounds returns nullptr") {
        REQUIRE(arr.get(3) == nullptr);
    }

    SECTION("resize grows with None and shrinks") {
        arr.resize(5);
        REQUIRE(arr.size() == 5);
        REQUIRE(arr.get(4)->is_none());
        arr.resize(1);
        REQUIRE(arr.size() == 1);
    }

    SECTION("equality is positional") {
        Array a;
        a.push_back(1);
        a.push_back(2);
        Array b;
        b.push_back(2);
        b.push_back(1);
        REQUIRE_FALSE(a == b);
        REQUIRE(a == a.clone());
    }
}

// ============================================================
// Clone
// ============================================================

TEST_CASE("Value clone is independent", "[value][clone]") {
    Value original = Value::object();
    original.as_object().put("list", Value::array(2));
    original.as_object().get("list")->as_array().set(0, "first");

    Value copy = original.clone();
    REQUIRE(copy == original);

    copy.as_object().get("list")->as_array().set(1, "second");
    copy.as_object().put("extra", true);

    REQUIRE(copy != original);
    REQUIRE(original.as_object().size() == 1);
    REQUIRE(original.as_object().get("list")->as_array().get(1)->is_none());
}

// ============================================================
// Allowed payload types
// ============================================================

TEST_CASE("Value allowed payload types", "[value][types]") {
    SECTION("primitives, wrappers, strings and values are allowed") {
        REQUIRE_NOTHROW(Value::assert_allowed_type<int>());
        REQUIRE_NOTHROW(Value::assert_allowed_type<double>());
        REQUIRE_NOTHROW(Value::assert_allowed_type<std::optional<bool>>());
        REQUIRE_NOTHROW(Value::assert_allowed_type<std::string>());
        REQUIRE_NOTHROW(Value::assert_allowed_type<Value>());
        REQUIRE_NOTHROW(Value::assert_allowed_type<Object>());
    }

    SECTION("other native types are rejected") {
        REQUIRE_THROWS_AS(Value::assert_allowed_type<std::thread>(), TypeNotAllowedError);
        REQUIRE_FALSE(Value::is_allowed_type(typeid(std::optional<std::string>)));
    }
}
