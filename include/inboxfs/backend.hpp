/**********************************************************************
File name: backend.hpp
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
#ifndef INBOXFS_BACKEND_H
#define INBOXFS_BACKEND_H

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "inboxfs/error.hpp"

namespace Inboxfs::Backend {

using ContentKey = std::string;
using SenderKey = std::string;
using AttachmentKey = std::string;
using Timestamp = std::chrono::system_clock::time_point;

/**
 * Attachment bytes. Shared so that cached contents can be handed out
 * without copying them.
 */
using Blob = std::shared_ptr<const std::string>;

struct InboxItem {
    ContentKey key;
    SenderKey sender;
    std::string sender_name;
    Timestamp created_at;
    std::string subject;
    std::string status;
    std::string content_type;
    bool payable;
    std::optional<std::string> amount;
    std::optional<std::string> currency;
    std::optional<std::string> due_date;
};

struct Attachment {
    std::string content_type;
    std::uint64_t size;
    std::optional<AttachmentKey> key;
    std::optional<std::string> body;
};

struct ItemDetails {
    std::string subject;
    std::string sender_name;
    Timestamp created_at;
    std::vector<Attachment> parts;
};

/**
 * Remote mailbox as seen by the filesystem.
 *
 * Implementations own whatever session state is required to authorize
 * the calls. Errors are reported with ErrorKind::INTERNAL and a message
 * describing the failure.
 */
class Mailbox {
public:
    virtual ~Mailbox();

public:
    virtual Result<std::vector<InboxItem>> list_inbox() = 0;
    virtual Result<ItemDetails> get_item_details(std::string_view item_key) = 0;
    virtual Result<Blob> download_attachment(std::string_view item_key,
                                             std::string_view attachment_key) = 0;

};

}

#endif
