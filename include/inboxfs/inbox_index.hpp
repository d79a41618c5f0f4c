/**********************************************************************
File name: inbox_index.hpp
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
#ifndef INBOXFS_INBOX_INDEX_H
#define INBOXFS_INBOX_INDEX_H

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "inboxfs/backend.hpp"

namespace Inboxfs {

struct InboxEntry {
    std::uint32_t id;
    std::string name;
    Backend::InboxItem item;
};

/**
 * Queryable view of one inbox listing.
 *
 * Messages are ordered by creation time and numbered from 1 in that
 * order. Messages with equal creation times keep the order in which the
 * remote listed them.
 */
class InboxIndex {
public:
    InboxIndex() = default;
    explicit InboxIndex(std::vector<Backend::InboxItem> items);

private:
    std::vector<InboxEntry> m_entries;
    std::map<std::string, std::uint32_t, std::less<>> m_by_name;

public:
    /**
     * @return The entry with sequence number @a id or nullptr.
     */
    [[nodiscard]] const InboxEntry *by_id(std::uint32_t id) const;

    /**
     * @return The entry whose directory name is @a name or nullptr.
     */
    [[nodiscard]] const InboxEntry *by_name(std::string_view name) const;

    /**
     * @brief All entries, in ascending sequence number order.
     */
    [[nodiscard]] inline const std::vector<InboxEntry> &entries() const {
        return m_entries;
    }

    [[nodiscard]] inline std::size_t size() const {
        return m_entries.size();
    }

};

}

#endif
