/**********************************************************************
File name: main.cpp
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
#include "inboxfs/fuse/interface.hpp"
#include "inboxfs/fs.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "inboxfs/clock.hpp"
#include "inboxfs/driver.hpp"
#include "inboxfs/in_memory_backend.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

using namespace std::chrono_literals;

static void fill_mock_mailbox(Inboxfs::Backend::InMemoryMailbox &mailbox)
{
    using namespace Inboxfs::Backend;
    const Timestamp base = std::chrono::system_clock::from_time_t(1704067200);

    mailbox.add_message(
        InboxItem{
            .key = "mock-1",
            .sender = "sender-1",
            .sender_name = "Tax Agency",
            .created_at = base,
            .subject = "Annual statement",
            .status = "read",
            .content_type = "letter",
            .payable = false,
        },
        ItemDetails{
            .subject = "Annual statement",
            .sender_name = "Tax Agency",
            .created_at = base,
            .parts = {
                Attachment{
                    .content_type = "text/plain",
                    .size = 5,
                    .key = std::nullopt,
                    .body = "hello",
                },
                Attachment{
                    .content_type = "application/pdf",
                    .size = 5,
                    .key = "mock-1-pdf",
                    .body = std::nullopt,
                },
            },
        });
    (void)mailbox.add_blob("mock-1", "mock-1-pdf", "tjena");

    mailbox.add_message(
        InboxItem{
            .key = "mock-2",
            .sender = "sender-2",
            .sender_name = "Power Company",
            .created_at = base + 24h,
            .subject = "Invoice March",
            .status = "unread",
            .content_type = "invoice",
            .payable = true,
            .amount = "499.00",
            .currency = "SEK",
            .due_date = "2024-03-31",
        },
        ItemDetails{
            .subject = "Invoice March",
            .sender_name = "Power Company",
            .created_at = base + 24h,
            .parts = {
                Attachment{
                    .content_type = "text/html",
                    .size = 25,
                    .key = std::nullopt,
                    .body = "<p>Amount due: 499.00</p>",
                },
            },
        });
}

class MountCommand
{
public:
    explicit MountCommand(CLI::App &app):
        m_cmd(*app.add_subcommand("mount", "Mount an inbox as a read-only filesystem"))
    {
        auto &backend_group = *m_cmd.add_option_group("Backend");
        backend_group.require_option(1, 1);
        backend_group.add_flag("-M,--mock", "Use a built-in mailbox with canned messages");

        m_cmd.add_flag("-d,--debug", "Enable debug logging and FUSE debug output (implies -f)");
        m_cmd.add_flag("-f,--foreground", "Stay in foreground");
        m_cmd.add_flag("-s,--single-threaded", "Run the single-threaded FUSE loop");
        m_cmd.add_option("--log-level", m_log_level, "Log level")
                ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}))
                ->capture_default_str();

        m_cmd.add_option("--uid", m_mount_options.uid, "Owner reported for all files")->capture_default_str();
        m_cmd.add_option("--gid", m_mount_options.gid, "Group reported for all files")->capture_default_str();

        m_cmd.add_option("--listing-ttl", m_listing_ttl, "Seconds the inbox listing is cached")
                ->check(CLI::NonNegativeNumber)->capture_default_str();
        m_cmd.add_option("--details-ttl", m_details_ttl, "Seconds message details are cached")
                ->check(CLI::NonNegativeNumber)->capture_default_str();
        m_cmd.add_option("--attachment-cache-size", m_cache_options.attachment_capacity,
                         "Number of downloaded attachments kept in memory")
                ->capture_default_str();

        m_cmd.add_option("mountpoint", m_mountpoint, "Path to the mountpoint")->required()->type_name("PATH");
    }

private:
    CLI::App &m_cmd;

    std::string m_mountpoint;
    std::string m_log_level{"info"};
    long m_listing_ttl{60};
    long m_details_ttl{60 * 60};

    Inboxfs::CacheOptions m_cache_options;
    Inboxfs::MountOptions m_mount_options;

public:
    int execute() {
        const bool debug = m_cmd.count("-d");
        const bool foreground = debug || m_cmd.count("-f");
        const bool single_threaded = m_cmd.count("-s");
        const bool clone_fd = true;

        spdlog::set_level(debug ? spdlog::level::debug : spdlog::level::from_str(m_log_level));

        m_cache_options.listing_ttl = std::chrono::seconds(m_listing_ttl);
        m_cache_options.details_ttl = std::chrono::seconds(m_details_ttl);
        m_mount_options.attr_timeout = static_cast<double>(m_listing_ttl);

        std::unique_ptr<Inboxfs::Backend::Mailbox> mailbox;
        if (m_cmd.count("--mock")) {
            auto in_memory = std::make_unique<Inboxfs::Backend::InMemoryMailbox>();
            fill_mock_mailbox(*in_memory);
            mailbox = std::move(in_memory);
        }
        if (!mailbox) {
            spdlog::error("no mailbox backend selected");
            return 1;
        }

        Inboxfs::SystemClock clock;
        Inboxfs::Driver driver(*mailbox, clock, m_cache_options);
        Inboxfs::Filesystem fs(driver, m_mount_options);

        // construct an argv array to trick fuse into setting the right options
        // ... this is a bit hacky, but it does what's needed.
        std::vector<std::string> shadow_argv;
        shadow_argv.emplace_back("\0", 1);
        shadow_argv.emplace_back("-o");
        shadow_argv.emplace_back("ro,noatime,default_permissions,auto_unmount,fsname=inboxfs");
        if (debug) {
            shadow_argv.emplace_back("-d");
        }

        std::vector<char*> argv;
        argv.reserve(shadow_argv.size());
        for (auto &s: shadow_argv) {
            argv.push_back(s.data());
        }

        struct fuse_args args{static_cast<int>(argv.size()), argv.data(), 0};

        int ret = 255;
        Fuse::Session<Inboxfs::Filesystem> session(fs, &args);

        if (session.set_signal_handlers() != 0) {
            spdlog::error("failed to set signal handlers");
            ret = 1;
            goto exit;
        }

        if (session.mount(m_mountpoint.c_str()) != 0) {
            spdlog::error("failed to mount at {}", m_mountpoint);
            ret = 1;
            goto cleanup_signal;
        }

        spdlog::info("mounted inbox at {}", m_mountpoint);
        if (fuse_daemonize(foreground) != 0) {
            spdlog::error("failed to daemonize");
            ret = 1;
        } else if (single_threaded) {
            ret = session.loop() != 0;
        } else {
            ret = session.loop_mt(clone_fd) != 0;
        }

        session.unmount();
        spdlog::info("unmounted {}", m_mountpoint);

cleanup_signal:
        session.remove_signal_handlers();
exit:
        return ret;
    }

    explicit operator bool() const {
        return bool(m_cmd);
    }

};


int main(int argc, char **argv) {
    CLI::App app{"InboxFS"};
    app.require_subcommand(1);

    MountCommand mount(app);

    CLI11_PARSE(app, argc, argv);

    if (mount) {
        return mount.execute();
    }
    return 0;
}
