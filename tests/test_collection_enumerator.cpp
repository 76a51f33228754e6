/**
 * @file test_collection_enumerator.cpp
 * @brief Collection plan resolution
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <doctest/doctest.h>

#include "core/CollectionEnumerator.hpp"
#include "TransferErrors.hpp"
#include "support/MemoryStore.hpp"

using namespace mongocopy;
using mongocopy::test::MemoryStoreConnector;

namespace {

struct EnumeratorFixture {
    MemoryStoreConnector connector;
    std::shared_ptr<test::MemoryDatabase> db = connector.add_endpoint("mem://source");
    std::unique_ptr<StoreHandle> source;
    CollectionEnumerator enumerator;

    EnumeratorFixture() {
        db->add_collection("users");
        db->add_collection("orders");
        db->add_collection("posts");
        source = connector.connect("mem://source", "app");
    }
};

} // namespace

TEST_CASE_FIXTURE(EnumeratorFixture, "empty request selects every collection in store order") {
    CollectionPlan plan = enumerator.resolve(*source, {});
    CHECK(plan.names == std::vector<std::string>{"users", "orders", "posts"});
    CHECK(plan.missing.empty());
}

TEST_CASE_FIXTURE(EnumeratorFixture, "request order is kept and missing names are reported") {
    CollectionPlan plan = enumerator.resolve(*source, {"posts", "ghost", "users"});
    CHECK(plan.names == std::vector<std::string>{"posts", "users"});
    CHECK(plan.missing == std::vector<std::string>{"ghost"});
}

TEST_CASE_FIXTURE(EnumeratorFixture, "duplicate requested names are processed once") {
    CollectionPlan plan = enumerator.resolve(*source, {"users", "users", "orders"});
    CHECK(plan.names == std::vector<std::string>{"users", "orders"});
    CHECK(plan.size() == 2);
}

TEST_CASE_FIXTURE(EnumeratorFixture, "no matching names gives an empty plan") {
    CollectionPlan plan = enumerator.resolve(*source, {"ghost"});
    CHECK(plan.empty());
    CHECK(plan.missing.size() == 1);
}

TEST_CASE_FIXTURE(EnumeratorFixture, "listing failure is an enumeration error") {
    db->fail_list = true;
    CHECK_THROWS_AS(enumerator.resolve(*source, {}), EnumerationError);
}

TEST_CASE("empty store yields an empty plan") {
    MemoryStoreConnector connector;
    connector.add_endpoint("mem://empty");
    auto source = connector.connect("mem://empty", "app");

    CollectionEnumerator enumerator;
    CHECK(enumerator.resolve(*source, {}).empty());
}
