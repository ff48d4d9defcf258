/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "nmoskit/core/util/subscriber_list.hpp"

#include <catch2/catch_all.hpp>

TEST_CASE("nmk::SubscriberList") {
    int a = 1;
    int b = 2;
    nmk::SubscriberList<int> list;

    REQUIRE(list.add(&a));
    REQUIRE_FALSE(list.add(&a));
    REQUIRE(list.add(&b));
    REQUIRE(list.size() == 2);
    REQUIRE(list.contains(&a));

    SECTION("foreach visits all subscribers") {
        int sum = 0;
        list.foreach ([&sum](const int* value) {
            sum += *value;
        });
        REQUIRE(sum == 3);
    }

    SECTION("Subscribers can be removed while iterating") {
        int visited = 0;
        list.foreach ([&](const int* value) {
            std::ignore = list.remove(value);
            visited++;
        });
        REQUIRE(visited == 2);
        REQUIRE(list.empty());
    }

    SECTION("Remove") {
        REQUIRE(list.remove(&a));
        REQUIRE_FALSE(list.remove(&a));
        REQUIRE(list.size() == 1);
    }

    list.clear();
}
