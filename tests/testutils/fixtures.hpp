/**********************************************************************
File name: fixtures.hpp
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
#ifndef INBOXFS_TESTS_TESTUTILS_FIXTURES_H
#define INBOXFS_TESTS_TESTUTILS_FIXTURES_H

#include <chrono>
#include <string>

#include "inboxfs/backend.hpp"

inline Inboxfs::Backend::Timestamp fixture_time(long seconds_after_base)
{
    // 2024-01-01T00:00:00Z
    return std::chrono::system_clock::from_time_t(1704067200 + seconds_after_base);
}

inline Inboxfs::Backend::InboxItem make_item(std::string key,
                                             std::string sender_name,
                                             std::string subject,
                                             Inboxfs::Backend::Timestamp created_at)
{
    Inboxfs::Backend::InboxItem item{};
    item.key = std::move(key);
    item.sender = "sender-" + sender_name;
    item.sender_name = std::move(sender_name);
    item.created_at = created_at;
    item.subject = std::move(subject);
    item.status = "unread";
    item.content_type = "letter";
    item.payable = false;
    return item;
}

inline Inboxfs::Backend::ItemDetails make_details(const Inboxfs::Backend::InboxItem &item)
{
    Inboxfs::Backend::ItemDetails details{};
    details.subject = item.subject;
    details.sender_name = item.sender_name;
    details.created_at = item.created_at;
    return details;
}

inline Inboxfs::Backend::Attachment inline_attachment(std::string body,
                                                      std::string content_type = "text/plain")
{
    Inboxfs::Backend::Attachment attachment{};
    attachment.content_type = std::move(content_type);
    attachment.size = body.size();
    attachment.body = std::move(body);
    return attachment;
}

inline Inboxfs::Backend::Attachment remote_attachment(std::string key,
                                                      std::uint64_t size,
                                                      std::string content_type = "application/pdf")
{
    Inboxfs::Backend::Attachment attachment{};
    attachment.content_type = std::move(content_type);
    attachment.size = size;
    attachment.key = std::move(key);
    return attachment;
}

#endif
