/**********************************************************************
File name: in_memory_backend.cpp
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
#include "inboxfs/in_memory_backend.hpp"

#include <algorithm>

namespace Inboxfs::Backend {

static Error not_connected()
{
    return Error::internal("mailbox not connected");
}

InMemoryMailbox::~InMemoryMailbox() = default;

InMemoryMailbox::Message *InMemoryMailbox::find(std::string_view item_key)
{
    auto iter = std::find_if(m_messages.begin(), m_messages.end(),
                             [item_key](const Message &message) {
        return message.item.key == item_key;
    });
    if (iter == m_messages.end()) {
        return nullptr;
    }
    return &*iter;
}

void InMemoryMailbox::set_connected(bool connected)
{
    m_connected = connected;
}

void InMemoryMailbox::add_message(InboxItem item, ItemDetails details)
{
    m_messages.push_back(Message{std::move(item), std::move(details), {}});
}

Result<void> InMemoryMailbox::add_blob(std::string_view item_key,
                                       std::string_view attachment_key,
                                       std::string data)
{
    Message *message = find(item_key);
    if (!message) {
        return make_result(FAILED, Error::not_found());
    }
    message->blobs[std::string(attachment_key)] =
            std::make_shared<const std::string>(std::move(data));
    return make_result();
}

Result<void> InMemoryMailbox::remove_message(std::string_view item_key)
{
    auto iter = std::find_if(m_messages.begin(), m_messages.end(),
                             [item_key](const Message &message) {
        return message.item.key == item_key;
    });
    if (iter == m_messages.end()) {
        return make_result(FAILED, Error::not_found());
    }
    m_messages.erase(iter);
    return make_result();
}

Result<std::vector<InboxItem>> InMemoryMailbox::list_inbox()
{
    if (!m_connected) {
        return make_result(FAILED, not_connected());
    }

    std::vector<InboxItem> items;
    items.reserve(m_messages.size());
    for (const auto &message: m_messages) {
        items.push_back(message.item);
    }
    return make_result(std::move(items));
}

Result<ItemDetails> InMemoryMailbox::get_item_details(std::string_view item_key)
{
    if (!m_connected) {
        return make_result(FAILED, not_connected());
    }

    Message *message = find(item_key);
    if (!message) {
        return make_result(FAILED, Error::internal("no such item: " + std::string(item_key)));
    }
    return make_result(message->details);
}

Result<Blob> InMemoryMailbox::download_attachment(std::string_view item_key,
                                                  std::string_view attachment_key)
{
    if (!m_connected) {
        return make_result(FAILED, not_connected());
    }

    Message *message = find(item_key);
    if (!message) {
        return make_result(FAILED, Error::internal("no such item: " + std::string(item_key)));
    }
    auto iter = message->blobs.find(attachment_key);
    if (iter == message->blobs.end()) {
        return make_result(FAILED, Error::internal("no such attachment: " + std::string(attachment_key)));
    }
    return make_result(iter->second);
}

}
