/**********************************************************************
File name: fs.cpp
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

#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/statvfs.h>

#include "inboxfs/fs.hpp"
#include "inboxfs/in_memory_backend.hpp"

#include "testutils/counting_mailbox.hpp"
#include "testutils/fixtures.hpp"
#include "testutils/fuse_backend.hpp"
#include "testutils/manual_clock.hpp"
#include "testutils/result.hpp"

using namespace Inboxfs;

static MountOptions test_mount_options()
{
    MountOptions options;
    options.uid = 1000;
    options.gid = 1001;
    options.attr_timeout = 60.0;
    return options;
}

static int reply_errno(const TestFuseRequest &req)
{
    REQUIRE(req.has_reply());
    REQUIRE(req.reply_type() == TestFuseReplyType::ERROR);
    return std::get<TestFuseReplyErr>(req.reply_argv());
}

SCENARIO("Filesystem replies") {
    TestFuseBackend fake_backend;
    Backend::InMemoryMailbox mailbox;
    CountingMailbox counting(mailbox);
    ManualClock clock;
    Driver driver(counting, clock);
    Filesystem fs(driver, test_mount_options());

    auto item = make_item("k1", "Tax Agency", "Refund", fixture_time(0));
    auto details = make_details(item);
    details.parts.push_back(inline_attachment("hello"));
    details.parts.push_back(remote_attachment("pdf-1", 1000));
    mailbox.add_message(item, details);
    require_result_ok(mailbox.add_blob("k1", "pdf-1", std::string(1000, 'x')));

    const std::uint64_t entry_ino = encode(EntryInode{1});
    const std::uint64_t text_ino = encode(AttachmentInode{1, 0, 5});
    const std::uint64_t pdf_ino = encode(AttachmentInode{1, 1, 1000});

    GIVEN("A lookup of an attachment") {
        auto req = fake_backend.new_request();
        fs.lookup(req.wrap(), entry_ino, "2024-01-01T00:00:00+00:00-Tax_Agency-Refund-0.txt");

        THEN("An entry for a read-only file is returned") {
            REQUIRE(req.has_reply());
            REQUIRE(req.reply_type() == TestFuseReplyType::ENTRY);
            const auto &e = std::get<TestFuseReplyEntry>(req.reply_argv());
            CHECK(e.ino == text_ino);
            CHECK(e.attr.st_ino == text_ino);
            CHECK(e.attr.st_mode == (S_IFREG | 0400));
            CHECK(e.attr.st_nlink == 1);
            CHECK(e.attr.st_size == 5);
            CHECK(e.attr.st_blksize == 512);
            CHECK(e.attr.st_blocks == 1);
            CHECK(e.attr.st_uid == 1000);
            CHECK(e.attr.st_gid == 1001);
            CHECK(e.attr_timeout == 60.0);
            CHECK(e.entry_timeout == 60.0);
        }
    }

    GIVEN("A lookup of a name which does not exist") {
        auto req = fake_backend.new_request();
        fs.lookup(req.wrap(), ROOT_INO, "nope");

        THEN("ENOENT is returned") {
            CHECK(reply_errno(req) == ENOENT);
        }
    }

    GIVEN("A getattr of the root") {
        auto req = fake_backend.new_request();
        fs.getattr(req.wrap(), ROOT_INO, nullptr);

        THEN("A read-only directory is returned") {
            REQUIRE(req.has_reply());
            REQUIRE(req.reply_type() == TestFuseReplyType::ATTR);
            struct stat attr{};
            double timeout = 0;
            std::tie(attr, timeout) = std::get<TestFuseReplyAttr>(req.reply_argv());
            CHECK(attr.st_ino == ROOT_INO);
            CHECK(attr.st_mode == (S_IFDIR | 0500));
            CHECK(attr.st_nlink == 2);
            CHECK(timeout == 60.0);
        }
    }

    GIVEN("A getattr of a larger attachment") {
        auto req = fake_backend.new_request();
        fs.getattr(req.wrap(), pdf_ino, nullptr);

        THEN("The block count is rounded up") {
            REQUIRE(req.reply_type() == TestFuseReplyType::ATTR);
            const auto &attr = std::get<0>(std::get<TestFuseReplyAttr>(req.reply_argv()));
            CHECK(attr.st_size == 1000);
            CHECK(attr.st_blocks == 2);
        }
    }

    GIVEN("A getattr while the remote is unreachable") {
        mailbox.set_connected(false);
        auto req = fake_backend.new_request();
        fs.getattr(req.wrap(), entry_ino, nullptr);

        THEN("EFAULT is returned") {
            CHECK(reply_errno(req) == EFAULT);
        }
    }

    GIVEN("Opening an attachment") {
        WHEN("Opening it read-only") {
            auto req = fake_backend.new_request();
            fuse_file_info fi{};
            fi.flags = O_RDONLY;
            fs.open(req.wrap(), text_ino, &fi);

            THEN("The open succeeds and keeps the page cache") {
                REQUIRE(req.has_reply());
                REQUIRE(req.reply_type() == TestFuseReplyType::OPEN);
                CHECK(std::get<TestFuseReplyOpen>(req.reply_argv()).keep_cache);
            }
        }

        WHEN("Opening it for writing") {
            auto req = fake_backend.new_request();
            fuse_file_info fi{};
            fi.flags = O_RDWR;
            fs.open(req.wrap(), text_ino, &fi);

            THEN("EROFS is returned") {
                CHECK(reply_errno(req) == EROFS);
            }
        }

        WHEN("Opening a directory as a file") {
            auto req = fake_backend.new_request();
            fuse_file_info fi{};
            fi.flags = O_RDONLY;
            fs.open(req.wrap(), entry_ino, &fi);

            THEN("EISDIR is returned") {
                CHECK(reply_errno(req) == EISDIR);
            }
        }

        WHEN("Opening a file as a directory") {
            auto req = fake_backend.new_request();
            fuse_file_info fi{};
            fs.opendir(req.wrap(), text_ino, &fi);

            THEN("ENOTDIR is returned") {
                CHECK(reply_errno(req) == ENOTDIR);
            }
        }
    }

    GIVEN("Reading an attachment") {
        WHEN("Reading a range") {
            auto req = fake_backend.new_request();
            fs.read(req.wrap(), text_ino, 3, 1, nullptr);

            THEN("The bytes are returned") {
                REQUIRE(req.has_reply());
                REQUIRE(req.reply_type() == TestFuseReplyType::BUF);
                CHECK(std::get<TestFuseReplyBuf>(req.reply_argv()) == "ell");
            }
        }

        WHEN("Reading a downloaded attachment twice") {
            auto first = fake_backend.new_request();
            fs.read(first.wrap(), pdf_ino, 4096, 0, nullptr);
            auto second = fake_backend.new_request();
            fs.read(second.wrap(), pdf_ino, 4096, 512, nullptr);

            THEN("It is downloaded once") {
                REQUIRE(first.reply_type() == TestFuseReplyType::BUF);
                REQUIRE(second.reply_type() == TestFuseReplyType::BUF);
                CHECK(std::get<TestFuseReplyBuf>(first.reply_argv()).size() == 1000);
                CHECK(std::get<TestFuseReplyBuf>(second.reply_argv()).size() == 488);
                CHECK(counting.download_calls == 1);
            }
        }

        WHEN("Reading a directory") {
            auto req = fake_backend.new_request();
            fs.read(req.wrap(), entry_ino, 10, 0, nullptr);

            THEN("EISDIR is returned") {
                CHECK(reply_errno(req) == EISDIR);
            }
        }

        WHEN("Reading at a negative offset") {
            auto req = fake_backend.new_request();
            fs.read(req.wrap(), text_ino, 10, -1, nullptr);

            THEN("EINVAL is returned") {
                CHECK(reply_errno(req) == EINVAL);
            }
        }
    }

    GIVEN("Housekeeping requests") {
        THEN("forget sends no reply") {
            auto req = fake_backend.new_request();
            fs.forget(req.wrap(), text_ino, 1);
            REQUIRE(req.has_reply());
            CHECK(req.reply_type() == TestFuseReplyType::NONE);
        }

        THEN("release succeeds") {
            auto req = fake_backend.new_request();
            fs.release(req.wrap(), text_ino, nullptr);
            CHECK(reply_errno(req) == 0);
        }

        THEN("statfs reports a read-only filesystem") {
            auto req = fake_backend.new_request();
            fs.statfs(req.wrap(), ROOT_INO);
            REQUIRE(req.has_reply());
            REQUIRE(req.reply_type() == TestFuseReplyType::STATFS);
            const auto &stbuf = std::get<TestFuseReplyStatfs>(req.reply_argv());
            CHECK((stbuf.f_flag & ST_RDONLY) != 0);
            CHECK(stbuf.f_bsize == 512);
            CHECK(stbuf.f_namemax == 255);
        }
    }
}

SCENARIO("Filesystem directory listing") {
    TestFuseBackend fake_backend;
    Backend::InMemoryMailbox mailbox;
    ManualClock clock;
    Driver driver(mailbox, clock);
    Filesystem fs(driver, test_mount_options());

    // each name is 17 bytes long, giving 48 byte directory entries
    for (long i = 1; i <= 3; ++i) {
        auto item = make_item("k" + std::to_string(i), "Sender", "Letter " + std::to_string(i),
                              fixture_time(i * 60));
        mailbox.add_message(item, make_details(item));
    }

    GIVEN("An opened root directory") {
        auto open_req = fake_backend.new_request();
        fuse_file_info fi{};
        fs.opendir(open_req.wrap(), ROOT_INO, &fi);
        REQUIRE(open_req.reply_type() == TestFuseReplyType::OPEN);

        WHEN("Reading it with a large buffer") {
            auto req = fake_backend.new_request();
            fs.readdir(req.wrap(), ROOT_INO, 4096, 0, &fi);

            THEN("All entries are returned with increasing offsets") {
                REQUIRE(req.reply_type() == TestFuseReplyType::BUF);
                auto dirents = parse_dirents(std::get<TestFuseReplyBuf>(req.reply_argv()));
                REQUIRE(dirents.size() == 3);
                CHECK(dirents[0].name == "1-Sender-Letter_1");
                CHECK(dirents[0].ino == encode(EntryInode{1}));
                CHECK(dirents[0].off == 1);
                CHECK(dirents[0].type == DT_DIR);
                CHECK(dirents[1].off == 2);
                CHECK(dirents[2].name == "3-Sender-Letter_3");
                CHECK(dirents[2].off == 3);
            }
        }

        WHEN("Reading it with a small buffer") {
            auto req = fake_backend.new_request();
            fs.readdir(req.wrap(), ROOT_INO, 100, 0, &fi);

            THEN("Only the entries which fit are returned") {
                REQUIRE(req.reply_type() == TestFuseReplyType::BUF);
                auto dirents = parse_dirents(std::get<TestFuseReplyBuf>(req.reply_argv()));
                REQUIRE(dirents.size() == 2);
                CHECK(dirents[1].off == 2);
            }

            AND_WHEN("Continuing at the last offset") {
                auto next = fake_backend.new_request();
                fs.readdir(next.wrap(), ROOT_INO, 100, 2, &fi);

                THEN("The remaining entry is returned") {
                    REQUIRE(next.reply_type() == TestFuseReplyType::BUF);
                    auto dirents = parse_dirents(std::get<TestFuseReplyBuf>(next.reply_argv()));
                    REQUIRE(dirents.size() == 1);
                    CHECK(dirents[0].name == "3-Sender-Letter_3");
                    CHECK(dirents[0].off == 3);
                }
            }
        }

        WHEN("Continuing past the end") {
            auto req = fake_backend.new_request();
            fs.readdir(req.wrap(), ROOT_INO, 4096, 3, &fi);

            THEN("An empty buffer ends the listing") {
                REQUIRE(req.reply_type() == TestFuseReplyType::BUF);
                CHECK(std::get<TestFuseReplyBuf>(req.reply_argv()).empty());
            }
        }

        WHEN("Releasing it") {
            auto req = fake_backend.new_request();
            fs.releasedir(req.wrap(), ROOT_INO, &fi);

            THEN("The release succeeds") {
                CHECK(reply_errno(req) == 0);
            }
        }
    }

    GIVEN("Listing an unknown entry") {
        auto req = fake_backend.new_request();
        fs.readdir(req.wrap(), encode(EntryInode{7}), 4096, 0, nullptr);

        THEN("ENOENT is returned") {
            CHECK(reply_errno(req) == ENOENT);
        }
    }
}
