/**********************************************************************
File name: inode.cpp
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
#include "inboxfs/inode.hpp"

#include <cstdio>

namespace Inboxfs {

static constexpr unsigned ENTRY_SHIFT = 32;
static constexpr std::uint64_t ATTACHMENT_MASK = 0xffffffffULL;

static std::uint64_t entry_bits(std::uint32_t entry_id)
{
    return (static_cast<std::uint64_t>(entry_id) + 1) << ENTRY_SHIFT;
}

std::uint64_t encode(const Inode &inode)
{
    if (const auto *entry = std::get_if<EntryInode>(&inode)) {
        return entry_bits(entry->entry_id);
    }
    if (const auto *attachment = std::get_if<AttachmentInode>(&inode)) {
        return entry_bits(attachment->entry_id) +
                (static_cast<std::uint64_t>(attachment->attachment_id) + 1);
    }
    return ROOT_INO;
}

std::optional<std::uint32_t> entry_id_of(std::uint64_t ino)
{
    const auto bits = static_cast<std::uint32_t>(ino >> ENTRY_SHIFT);
    if (bits == 0) {
        return std::nullopt;
    }
    return bits - 1;
}

std::optional<std::uint32_t> attachment_id_of(std::uint64_t ino)
{
    const auto bits = static_cast<std::uint32_t>(ino & ATTACHMENT_MASK);
    if (bits == 0) {
        return std::nullopt;
    }
    return bits - 1;
}

Attributes attributes_of(const Inode &inode)
{
    Attributes attr{};
    attr.ino = encode(inode);
    attr.directory = is_directory(inode);
    if (const auto *attachment = std::get_if<AttachmentInode>(&inode)) {
        attr.size = attachment->size;
    }
    return attr;
}

std::string format_ino(std::uint64_t ino)
{
    char buf[19];
    std::snprintf(buf, sizeof(buf), "0x%016llx", static_cast<unsigned long long>(ino));
    return buf;
}

}
