/**********************************************************************
File name: naming.hpp
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
#ifndef INBOXFS_NAMING_H
#define INBOXFS_NAMING_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "inboxfs/backend.hpp"
#include "inboxfs/error.hpp"

namespace Inboxfs {

/**
 * @brief RFC 3339 rendering of a timestamp in UTC, with second precision.
 */
[[nodiscard]] std::string format_timestamp(Backend::Timestamp ts);

[[nodiscard]] std::string_view attachment_extension(std::string_view content_type);

/**
 * @brief Directory name of the message with sequence number @a id.
 *
 * The sequence number prefix keeps names unique within one listing.
 */
[[nodiscard]] std::string entry_name(std::uint32_t id, const Backend::InboxItem &item);

/**
 * @brief File name of the attachment at @a index of a message.
 *
 * @return ErrorKind::NOT_FOUND if @a index is out of range.
 */
[[nodiscard]] Result<std::string> attachment_name(const Backend::ItemDetails &details,
                                                  std::size_t index);

}

#endif
