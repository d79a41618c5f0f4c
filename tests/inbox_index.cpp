/**********************************************************************
File name: inbox_index.cpp
This file is part of: InboxFS

LICENSE

This program is free software: you can redistribute it and/or modify it
under the terms of the GNU General Public License as published by the
Free Software Foundation, either version 3 of the License, or (at your
option) any later version.

This program is distributed in the hope that it will be useful, but
WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
General Public License for more details.

You should have received a copy of the GNU General Public License along
with this program.  If not, see <http://www.gnu.org/licenses/>.

FEEDBACK & QUESTIONS

For feedback and questions about InboxFS please e-mail one of the
authors named in the AUTHORS file.
**********************************************************************/
#include <catch2/catch.hpp>

#include "inboxfs/inbox_index.hpp"

#include "testutils/fixtures.hpp"

using namespace Inboxfs;

SCENARIO("Building an inbox index") {
    GIVEN("an empty listing") {
        InboxIndex index(std::vector<Backend::InboxItem>{});

        THEN("it has no entries") {
            CHECK(index.size() == 0);
            CHECK(index.entries().empty());
            CHECK(index.by_id(1) == nullptr);
            CHECK(index.by_name("anything") == nullptr);
        }
    }

    GIVEN("a listing in arbitrary order") {
        std::vector<Backend::InboxItem> items{
            make_item("c", "Carol", "Third", fixture_time(300)),
            make_item("a", "Alice", "First", fixture_time(100)),
            make_item("b", "Bob", "Second", fixture_time(200)),
        };

        WHEN("the index is built") {
            InboxIndex index(items);

            THEN("entries are numbered from 1 by creation time") {
                REQUIRE(index.size() == 3);
                CHECK(index.by_id(1)->item.key == "a");
                CHECK(index.by_id(2)->item.key == "b");
                CHECK(index.by_id(3)->item.key == "c");
                CHECK(index.by_id(0) == nullptr);
                CHECK(index.by_id(4) == nullptr);
            }

            THEN("entries are listed in ascending id order") {
                const auto &entries = index.entries();
                for (std::size_t i = 0; i < entries.size(); ++i) {
                    CHECK(entries[i].id == i + 1);
                }
            }

            THEN("every entry is found by its name") {
                for (const auto &entry: index.entries()) {
                    const InboxEntry *found = index.by_name(entry.name);
                    REQUIRE(found != nullptr);
                    CHECK(found->id == entry.id);
                }
                CHECK(index.by_name("1-Alice-First") == index.by_id(1));
            }

            AND_WHEN("the same listing is indexed again in a different order") {
                std::vector<Backend::InboxItem> shuffled{items[2], items[0], items[1]};
                InboxIndex again(shuffled);

                THEN("the numbering is identical") {
                    for (std::uint32_t id = 1; id <= 3; ++id) {
                        CHECK(again.by_id(id)->item.key == index.by_id(id)->item.key);
                        CHECK(again.by_id(id)->name == index.by_id(id)->name);
                    }
                }
            }
        }
    }

    GIVEN("messages with identical subjects and creation times") {
        std::vector<Backend::InboxItem> items{
            make_item("x", "Shop", "Receipt", fixture_time(0)),
            make_item("y", "Shop", "Receipt", fixture_time(0)),
        };
        InboxIndex index(items);

        THEN("the remote order is kept") {
            CHECK(index.by_id(1)->item.key == "x");
            CHECK(index.by_id(2)->item.key == "y");
        }

        THEN("names do not collide") {
            CHECK(index.by_id(1)->name != index.by_id(2)->name);
            CHECK(index.by_name(index.by_id(2)->name)->item.key == "y");
        }
    }
}
