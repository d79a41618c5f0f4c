/**********************************************************************
File name: inode.hpp
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
#ifndef INBOXFS_INODE_H
#define INBOXFS_INODE_H

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace Inboxfs {

static constexpr std::uint64_t INVALID_INO = 0;
static constexpr std::uint64_t ROOT_INO = 1;

struct RootInode {
};

struct EntryInode {
    std::uint32_t entry_id;
};

struct AttachmentInode {
    std::uint32_t entry_id;
    std::uint32_t attachment_id;
    std::uint64_t size;
};

/**
 * Semantic location of an inode number.
 *
 * The entry id lives in the upper 32 bits of the inode number and the
 * attachment id in the lower 32 bits, both offset by one so that zero
 * means "absent". Inode 1 is the root directory.
 */
using Inode = std::variant<RootInode, EntryInode, AttachmentInode>;

[[nodiscard]] std::uint64_t encode(const Inode &inode);

/**
 * @return The entry id, or nullopt if @a ino addresses the root.
 */
[[nodiscard]] std::optional<std::uint32_t> entry_id_of(std::uint64_t ino);

/**
 * @return The attachment id, or nullopt if @a ino does not address an
 * attachment.
 */
[[nodiscard]] std::optional<std::uint32_t> attachment_id_of(std::uint64_t ino);

[[nodiscard]] inline bool is_directory(const Inode &inode) {
    return !std::holds_alternative<AttachmentInode>(inode);
}

struct Attributes {
    std::uint64_t ino;
    bool directory;
    std::uint64_t size;
};

[[nodiscard]] Attributes attributes_of(const Inode &inode);

/**
 * @brief Render an inode number for log output.
 */
[[nodiscard]] std::string format_ino(std::uint64_t ino);

}

#endif
