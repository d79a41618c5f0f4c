/**********************************************************************
File name: in_memory_backend.hpp
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
#ifndef INBOXFS_BACKEND_IN_MEMORY_H
#define INBOXFS_BACKEND_IN_MEMORY_H

#include <map>
#include <string>
#include <vector>

#include "inboxfs/backend.hpp"

namespace Inboxfs::Backend {

class InMemoryMailbox: public Mailbox {
public:
    InMemoryMailbox() = default;
    InMemoryMailbox(const InMemoryMailbox &src) = delete;
    InMemoryMailbox(InMemoryMailbox &&src) = delete;
    InMemoryMailbox &operator=(const InMemoryMailbox &src) = delete;
    InMemoryMailbox &operator=(InMemoryMailbox &&src) = delete;
    ~InMemoryMailbox() override;

private:
    struct Message {
        InboxItem item;
        ItemDetails details;
        std::map<AttachmentKey, Blob, std::less<>> blobs;
    };

    bool m_connected{true};
    std::vector<Message> m_messages;

    Message *find(std::string_view item_key);

public:
    [[nodiscard]] inline bool connected() const {
        return m_connected;
    }

    void set_connected(bool connected);

    /**
     * @brief Add a message to the mailbox.
     *
     * Messages are listed in insertion order.
     */
    void add_message(InboxItem item, ItemDetails details);

    /**
     * @brief Provide the bytes returned when downloading an attachment.
     *
     * @return ErrorKind::NOT_FOUND if no message with @a item_key exists.
     */
    Result<void> add_blob(std::string_view item_key,
                          std::string_view attachment_key,
                          std::string data);

    /**
     * @brief Remove a message and its attachments.
     */
    Result<void> remove_message(std::string_view item_key);

    // Mailbox interface
public:
    [[nodiscard]] Result<std::vector<InboxItem>> list_inbox() override;
    [[nodiscard]] Result<ItemDetails> get_item_details(std::string_view item_key) override;
    [[nodiscard]] Result<Blob> download_attachment(std::string_view item_key,
                                                   std::string_view attachment_key) override;
};

}

#endif
