// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include <bstl/mem_ext.hpp>
#include <doctest/doctest.h>

namespace {
struct handle {
    int id;
};
int freed = 0;
handle* open_handle(int id) { return new handle{id}; }
void close_handle(handle* h) {
    ++freed;
    delete h;
}
} // namespace

TEST_CASE("c_unique_ptr") {
    freed = 0;
    {
        bstl::c_unique_ptr<handle> h(open_handle(3), close_handle);
        CHECK(h->id == 3);
        auto moved = std::move(h);
        CHECK_FALSE(h);
        CHECK(moved->id == 3);
        CHECK(freed == 0);
    }
    CHECK(freed == 1);

    bstl::c_unique_ptr<handle> h(open_handle(1), close_handle);
    h.reset(open_handle(2));
    CHECK(h->id == 2);
    CHECK(freed == 2);
    h.reset();
    CHECK(freed == 3);
}
