#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <boost/log/trivial.hpp>

#include "libmeshslim/Utils.hpp"
#include "libmeshslim/Exception.hpp"
#include "libmeshslim/Subdivide.hpp"

using namespace MeshSlim;

TEST_CASE("Logging level round trips through its name", "[Utils]") {
    for (unsigned level = 0; level <= 5; ++ level)
        CHECK(level_string_to_boost(get_string_logging_level(level)) == level);
}

TEST_CASE("Unknown logging level name reports errors only", "[Utils]") {
    CHECK(level_string_to_boost("verbose") == 1);
    CHECK(level_string_to_boost("") == 1);
    CHECK(get_string_logging_level(42) == "error");
}

TEST_CASE("Logging level is applied to the boost::log core", "[Utils]") {
    // The library starts quiet, warnings and worse.
    unsigned initial = get_logging_level();
    CHECK(initial == 2);

    SECTION("Debug level") {
        set_logging_level(4);
        REQUIRE(get_logging_level() == 4);
        trace(4, "debug message from the unit tests");
    }

    SECTION("Levels above trace saturate") {
        set_logging_level(9);
        REQUIRE(get_logging_level() == 5);
    }

    set_logging_level(initial);
    REQUIRE(get_logging_level() == initial);
}

TEST_CASE("Entry points keep an explicitly chosen logging level", "[Utils]") {
    set_logging_level(4);

    IndexedMesh box = make_unit_box();
    split_triangles(box, 1);
    init_default_logging_level();

    CHECK(get_logging_level() == 4);
    boost::log::record rec = boost::log::trivial::logger::get().open_record(
        boost::log::keywords::severity = boost::log::trivial::debug);
    CHECK(bool(rec));
    rec.reset();

    set_logging_level(2);
}

TEST_CASE("Exception hierarchy", "[Utils]") {
    CHECK_THROWS_AS(throw InvalidMeshError("bad"), InvalidArgument);
    CHECK_THROWS_AS(throw InvalidArgument("bad"), LogicError);
    CHECK_THROWS_AS(throw LogicError("bad"), CriticalException);
    CHECK_THROWS_AS(throw RuntimeError("bad"), std::runtime_error);
    CHECK_THROWS_WITH(throw InvalidMeshError("index out of range"), "index out of range");
}
