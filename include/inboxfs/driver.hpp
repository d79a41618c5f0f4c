/**********************************************************************
File name: driver.hpp
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
#ifndef INBOXFS_DRIVER_H
#define INBOXFS_DRIVER_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "inboxfs/backend.hpp"
#include "inboxfs/cache/bounded_cache.hpp"
#include "inboxfs/clock.hpp"
#include "inboxfs/error.hpp"
#include "inboxfs/inbox_index.hpp"
#include "inboxfs/inode.hpp"

namespace Inboxfs {

struct CacheOptions {
    std::chrono::seconds listing_ttl{60};
    std::chrono::seconds details_ttl{60 * 60};
    std::size_t attachment_capacity{10};
};

struct DirectoryEntry {
    std::string name;
    Inode inode;
};

struct AttachmentRef {
    std::uint32_t entry_id;
    std::uint32_t attachment_id;

    inline bool operator==(const AttachmentRef &other) const {
        return entry_id == other.entry_id && attachment_id == other.attachment_id;
    }
};

struct AttachmentRefHash {
    inline std::size_t operator()(const AttachmentRef &ref) const {
        return std::hash<std::uint64_t>()(
                    (static_cast<std::uint64_t>(ref.entry_id) << 32) | ref.attachment_id);
    }
};

/**
 * Resolves filesystem operations against a remote mailbox.
 *
 * The driver is not thread-safe: callers must ensure that at most one
 * operation runs at any time.
 */
class Driver {
public:
    Driver() = delete;
    Driver(Backend::Mailbox &mailbox,
           const Clock &clock,
           const CacheOptions &options = CacheOptions());
    Driver(const Driver &src) = delete;
    Driver(Driver &&src) = delete;
    Driver &operator=(const Driver &src) = delete;
    Driver &operator=(Driver &&src) = delete;
    ~Driver() = default;

private:
    Backend::Mailbox &m_mailbox;
    BoundedCache<std::monostate, std::shared_ptr<const InboxIndex>> m_listing_cache;
    BoundedCache<std::uint32_t, std::shared_ptr<const Backend::ItemDetails>> m_details_cache;
    BoundedCache<AttachmentRef, Backend::Blob, AttachmentRefHash> m_attachment_cache;

    Result<std::shared_ptr<const InboxIndex>> inbox_index();
    Result<InboxEntry> inbox_entry(std::uint32_t entry_id);
    Result<std::shared_ptr<const Backend::ItemDetails>> details(std::uint32_t entry_id);
    Result<Backend::Attachment> attachment(std::uint32_t entry_id,
                                           std::uint32_t attachment_id);
    Result<Backend::Blob> attachment_contents(std::uint32_t entry_id,
                                              std::uint32_t attachment_id);

    Result<Inode> resolve(std::uint64_t ino);
    Result<std::vector<DirectoryEntry>> children(const Inode &parent);

public:
    /**
     * @brief Find the child called @a name in the directory @a parent.
     */
    Result<Inode> lookup(std::uint64_t parent, std::string_view name);

    Result<Attributes> getattr(std::uint64_t ino);

    /**
     * @brief Read up to @a count bytes of an attachment starting at
     * @a offset.
     *
     * Reads starting at or beyond the end of the attachment return an
     * empty buffer.
     */
    Result<std::string> read(std::uint64_t ino, std::uint64_t offset, std::size_t count);

    /**
     * @brief List the directory @a ino starting at position @a offset.
     *
     * The order of the entries is stable as long as the cached listing
     * and details do not expire.
     */
    Result<std::vector<DirectoryEntry>> readdir(std::uint64_t ino, std::uint64_t offset);

};

}

#endif
