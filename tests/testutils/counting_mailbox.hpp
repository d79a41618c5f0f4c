/**********************************************************************
File name: counting_mailbox.hpp
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
#ifndef INBOXFS_TESTS_TESTUTILS_COUNTING_MAILBOX_H
#define INBOXFS_TESTS_TESTUTILS_COUNTING_MAILBOX_H

#include "inboxfs/backend.hpp"

/**
 * Forwards to another mailbox and counts the calls made.
 */
class CountingMailbox: public Inboxfs::Backend::Mailbox {
public:
    explicit CountingMailbox(Inboxfs::Backend::Mailbox &inner):
        m_inner(inner)
    {

    }

private:
    Inboxfs::Backend::Mailbox &m_inner;

public:
    unsigned list_calls = 0;
    unsigned details_calls = 0;
    unsigned download_calls = 0;

public:
    Inboxfs::Result<std::vector<Inboxfs::Backend::InboxItem>> list_inbox() override {
        ++list_calls;
        return m_inner.list_inbox();
    }

    Inboxfs::Result<Inboxfs::Backend::ItemDetails> get_item_details(std::string_view item_key) override {
        ++details_calls;
        return m_inner.get_item_details(item_key);
    }

    Inboxfs::Result<Inboxfs::Backend::Blob> download_attachment(std::string_view item_key,
                                                                std::string_view attachment_key) override {
        ++download_calls;
        return m_inner.download_attachment(item_key, attachment_key);
    }

};

#endif
