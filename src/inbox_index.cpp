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
#include "inboxfs/inbox_index.hpp"

#include <algorithm>

#include "inboxfs/naming.hpp"

namespace Inboxfs {

InboxIndex::InboxIndex(std::vector<Backend::InboxItem> items)
{
    std::stable_sort(items.begin(), items.end(),
                     [](const Backend::InboxItem &a, const Backend::InboxItem &b) {
        return a.created_at < b.created_at;
    });

    m_entries.reserve(items.size());
    std::uint32_t id = 1;
    for (auto &item: items) {
        std::string name = entry_name(id, item);
        m_by_name.emplace(name, id);
        m_entries.push_back(InboxEntry{id, std::move(name), std::move(item)});
        ++id;
    }
}

const InboxEntry *InboxIndex::by_id(std::uint32_t id) const
{
    if (id == 0 || id > m_entries.size()) {
        return nullptr;
    }
    return &m_entries[id - 1];
}

const InboxEntry *InboxIndex::by_name(std::string_view name) const
{
    auto iter = m_by_name.find(name);
    if (iter == m_by_name.end()) {
        return nullptr;
    }
    return by_id(iter->second);
}

}
