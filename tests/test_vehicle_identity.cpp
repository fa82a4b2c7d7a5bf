#include <catch2/catch_test_macros.hpp>

#include "pitwall/ingest/vehicle_identity.hpp"

using namespace pitwall::ingest;
using pitwall::support::Error;
using pitwall::support::ErrorKind;

TEST_CASE("resolve is deterministic for a car number") {
    VehicleIdentityResolver ids("GR86-004");
    std::string first;
    std::string second;
    REQUIRE(ids.resolve(78, &first, nullptr));
    REQUIRE(ids.resolve(78, &second, nullptr));
    REQUIRE(first == "GR86-004-78");
    REQUIRE(first == second);
    REQUIRE(ids.seen().size() == 1);
}

TEST_CASE("separate resolvers agree on the same car") {
    VehicleIdentityResolver a("GR86-004");
    VehicleIdentityResolver b("GR86-004");
    std::string ida;
    std::string idb;
    REQUIRE(a.resolve(13, &ida, nullptr));
    REQUIRE(b.resolve(13, &idb, nullptr));
    REQUIRE(ida == idb);
    REQUIRE(VehicleIdentityResolver::canonical_id("GR86-004", 13) == ida);
}

TEST_CASE("resolve_id unifies padded and unpadded vehicle ids") {
    VehicleIdentityResolver ids("GR86-004");
    std::string id;
    int number = 0;
    REQUIRE(ids.resolve_id("GR86-004-078", &id, &number, nullptr));
    REQUIRE(id == "GR86-004-78");
    REQUIRE(number == 78);

    REQUIRE(ids.resolve_id(" GR86-004-78 ", &id, &number, nullptr));
    REQUIRE(id == "GR86-004-78");
    REQUIRE(ids.seen().size() == 1);

    REQUIRE(ids.resolve_id("55", &id, &number, nullptr));
    REQUIRE(id == "GR86-004-55");
    REQUIRE(ids.seen().size() == 2);
}

TEST_CASE("non-positive or non-numeric car numbers are identity errors") {
    VehicleIdentityResolver ids("GR86-004");
    std::string id;
    int number = 0;
    Error error;
    REQUIRE_FALSE(ids.resolve(0, &id, &error));
    REQUIRE(error.kind == ErrorKind::Identity);

    error = Error{};
    REQUIRE_FALSE(ids.resolve_id("GR86-004-XX", &id, &number, &error));
    REQUIRE(error.kind == ErrorKind::Identity);

    REQUIRE_FALSE(ids.resolve(-4, &id, nullptr));
    REQUIRE(ids.seen().empty());
}

TEST_CASE("the first class label seen for a car is kept") {
    VehicleIdentityResolver ids("GR86-004");
    std::string id;
    REQUIRE(ids.resolve(7, &id, nullptr));
    ids.note_class(7, "  ");
    REQUIRE_FALSE(ids.seen().at(7).class_name.has_value());
    ids.note_class(7, "Am");
    ids.note_class(7, "Pro");
    REQUIRE(ids.seen().at(7).class_name == std::string("Am"));

    ids.note_class(99, "Pro");
    REQUIRE(ids.seen().count(99) == 0);
}
