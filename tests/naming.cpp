/**********************************************************************
File name: naming.cpp
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

#include "inboxfs/naming.hpp"

#include "testutils/fixtures.hpp"
#include "testutils/result.hpp"

using namespace Inboxfs;

TEST_CASE("format_timestamp renders RFC 3339 in UTC")
{
    CHECK(format_timestamp(fixture_time(0)) == "2024-01-01T00:00:00+00:00");
    CHECK(format_timestamp(fixture_time(3600 * 13 + 61)) == "2024-01-01T13:01:01+00:00");
}

TEST_CASE("attachment_extension")
{
    CHECK(attachment_extension("application/pdf") == "pdf");
    CHECK(attachment_extension("text/html") == "html");
    CHECK(attachment_extension("text/plain") == "txt");
    CHECK(attachment_extension("image/png") == "txt");
    CHECK(attachment_extension("") == "txt");
}

SCENARIO("Synthesized names") {
    GIVEN("a message from a sender with spaces in the name") {
        auto item = make_item("k1", "Tax Agency", "Annual statement", fixture_time(0));

        THEN("the directory name carries the sequence number and has no spaces") {
            CHECK(entry_name(3, item) == "3-Tax_Agency-Annual_statement");
        }

        AND_GIVEN("details with attachments") {
            auto details = make_details(item);
            details.parts.push_back(inline_attachment("hello"));
            details.parts.push_back(remote_attachment("a1", 10, "application/pdf"));
            details.parts.push_back(remote_attachment("a2", 10, "text/html"));

            THEN("attachment names follow the created-at, sender, subject, index pattern") {
                auto name0 = attachment_name(details, 0);
                require_result_ok(name0);
                CHECK(*name0 == "2024-01-01T00:00:00+00:00-Tax_Agency-Annual_statement-0.txt");

                auto name1 = attachment_name(details, 1);
                require_result_ok(name1);
                CHECK(*name1 == "2024-01-01T00:00:00+00:00-Tax_Agency-Annual_statement-1.pdf");

                auto name2 = attachment_name(details, 2);
                require_result_ok(name2);
                CHECK(*name2 == "2024-01-01T00:00:00+00:00-Tax_Agency-Annual_statement-2.html");
            }

            THEN("an out of range index is not found") {
                check_result_error(attachment_name(details, 3), ErrorKind::NOT_FOUND);
            }
        }
    }

    GIVEN("a subject containing a path separator") {
        auto item = make_item("k1", "Bank", "Statement 01/2024", fixture_time(0));
        auto details = make_details(item);
        details.parts.push_back(inline_attachment("x"));

        THEN("names do not contain slashes") {
            CHECK(entry_name(1, item).find('/') == std::string::npos);
            auto name = attachment_name(details, 0);
            require_result_ok(name);
            CHECK(name->find('/') == std::string::npos);
        }
    }
}
