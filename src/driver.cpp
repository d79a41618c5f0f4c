/**********************************************************************
File name: driver.cpp
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
#include "inboxfs/driver.hpp"

#include <spdlog/spdlog.h>

#include "inboxfs/naming.hpp"

namespace Inboxfs {

static Error remote_error(const Error &err)
{
    if (err.kind() == ErrorKind::INTERNAL) {
        return err;
    }
    return Error::internal(err.what());
}

Driver::Driver(Backend::Mailbox &mailbox,
               const Clock &clock,
               const CacheOptions &options):
    m_mailbox(mailbox),
    m_listing_cache(clock, options.listing_ttl, 1),
    m_details_cache(clock, options.details_ttl, std::nullopt),
    m_attachment_cache(clock, std::nullopt, options.attachment_capacity)
{

}

Result<std::shared_ptr<const InboxIndex>> Driver::inbox_index()
{
    return m_listing_cache.get_or_fetch(
                std::monostate(),
                [this]() -> Result<std::shared_ptr<const InboxIndex>> {
        spdlog::debug("fetching inbox listing");
        auto listing = m_mailbox.list_inbox();
        if (!listing) {
            return make_result(FAILED, remote_error(listing.error()));
        }
        auto index = std::make_shared<const InboxIndex>(std::move(*listing));
        spdlog::debug("inbox listing has {} entries", index->size());
        return make_result(std::move(index));
    });
}

Result<InboxEntry> Driver::inbox_entry(std::uint32_t entry_id)
{
    auto index = inbox_index();
    if (!index) {
        return copy_error(index);
    }
    const InboxEntry *entry = (*index)->by_id(entry_id);
    if (!entry) {
        return make_result(FAILED, Error::not_found());
    }
    return make_result(*entry);
}

Result<std::shared_ptr<const Backend::ItemDetails>> Driver::details(std::uint32_t entry_id)
{
    auto entry = inbox_entry(entry_id);
    if (!entry) {
        return copy_error(entry);
    }

    const std::string &item_key = entry->item.key;
    return m_details_cache.get_or_fetch(
                entry_id,
                [this, entry_id, &item_key]() -> Result<std::shared_ptr<const Backend::ItemDetails>> {
        spdlog::debug("fetching details of entry {}", entry_id);
        auto details = m_mailbox.get_item_details(item_key);
        if (!details) {
            return make_result(FAILED, remote_error(details.error()));
        }
        return make_result(std::make_shared<const Backend::ItemDetails>(std::move(*details)));
    });
}

Result<Backend::Attachment> Driver::attachment(std::uint32_t entry_id,
                                               std::uint32_t attachment_id)
{
    auto item_details = details(entry_id);
    if (!item_details) {
        return copy_error(item_details);
    }
    const auto &parts = (*item_details)->parts;
    if (attachment_id >= parts.size()) {
        return make_result(FAILED, Error::not_found());
    }
    return make_result(parts[attachment_id]);
}

Result<Backend::Blob> Driver::attachment_contents(std::uint32_t entry_id,
                                                  std::uint32_t attachment_id)
{
    auto entry = inbox_entry(entry_id);
    if (!entry) {
        return copy_error(entry);
    }
    auto part = attachment(entry_id, attachment_id);
    if (!part) {
        return copy_error(part);
    }

    if (part->body) {
        return make_result(std::make_shared<const std::string>(*part->body));
    }
    if (!part->key) {
        return make_result(FAILED, Error::invalid());
    }

    const std::string &item_key = entry->item.key;
    const std::string &attachment_key = *part->key;
    return m_attachment_cache.get_or_fetch(
                AttachmentRef{entry_id, attachment_id},
                [&]() -> Result<Backend::Blob> {
        spdlog::debug("downloading attachment {} of entry {}", attachment_id, entry_id);
        auto blob = m_mailbox.download_attachment(item_key, attachment_key);
        if (!blob) {
            return make_result(FAILED, remote_error(blob.error()));
        }
        return blob;
    });
}

Result<Inode> Driver::resolve(std::uint64_t ino)
{
    const auto entry_id = entry_id_of(ino);
    if (!entry_id) {
        return Inode(RootInode{});
    }

    const auto attachment_id = attachment_id_of(ino);
    if (!attachment_id) {
        auto entry = inbox_entry(*entry_id);
        if (!entry) {
            return copy_error(entry);
        }
        return Inode(EntryInode{*entry_id});
    }

    auto part = attachment(*entry_id, *attachment_id);
    if (!part) {
        return copy_error(part);
    }
    return Inode(AttachmentInode{*entry_id, *attachment_id, part->size});
}

Result<std::vector<DirectoryEntry>> Driver::children(const Inode &parent)
{
    std::vector<DirectoryEntry> result;

    if (std::holds_alternative<RootInode>(parent)) {
        auto index = inbox_index();
        if (!index) {
            return copy_error(index);
        }
        result.reserve((*index)->size());
        for (const auto &entry: (*index)->entries()) {
            result.push_back(DirectoryEntry{entry.name, EntryInode{entry.id}});
        }
        return make_result(std::move(result));
    }

    if (const auto *entry = std::get_if<EntryInode>(&parent)) {
        auto item_details = details(entry->entry_id);
        if (!item_details) {
            return copy_error(item_details);
        }
        const auto &parts = (*item_details)->parts;
        result.reserve(parts.size());
        for (std::size_t i = 0; i < parts.size(); ++i) {
            auto name = attachment_name(**item_details, i);
            if (!name) {
                continue;
            }
            result.push_back(DirectoryEntry{
                                 std::move(*name),
                                 AttachmentInode{
                                     entry->entry_id,
                                     static_cast<std::uint32_t>(i),
                                     parts[i].size,
                                 }});
        }
        return make_result(std::move(result));
    }

    return make_result(FAILED, Error::is_not_dir());
}

Result<Inode> Driver::lookup(std::uint64_t parent, std::string_view name)
{
    auto parent_inode = resolve(parent);
    if (!parent_inode) {
        return copy_error(parent_inode);
    }

    if (std::holds_alternative<RootInode>(*parent_inode)) {
        auto index = inbox_index();
        if (!index) {
            return copy_error(index);
        }
        const InboxEntry *entry = (*index)->by_name(name);
        if (!entry) {
            return make_result(FAILED, Error::not_found());
        }
        return Inode(EntryInode{entry->id});
    }

    auto siblings = children(*parent_inode);
    if (!siblings) {
        return copy_error(siblings);
    }
    for (auto &child: *siblings) {
        if (child.name == name) {
            spdlog::debug("found inode {} by name {}", format_ino(encode(child.inode)), name);
            return make_result(std::move(child.inode));
        }
    }
    return make_result(FAILED, Error::not_found());
}

Result<Attributes> Driver::getattr(std::uint64_t ino)
{
    auto inode = resolve(ino);
    if (!inode) {
        return copy_error(inode);
    }
    return attributes_of(*inode);
}

Result<std::string> Driver::read(std::uint64_t ino, std::uint64_t offset, std::size_t count)
{
    auto inode = resolve(ino);
    if (!inode) {
        return copy_error(inode);
    }
    const auto *file = std::get_if<AttachmentInode>(&*inode);
    if (!file) {
        return make_result(FAILED, Error::is_dir());
    }

    auto contents = attachment_contents(file->entry_id, file->attachment_id);
    if (!contents) {
        return copy_error(contents);
    }
    const std::string &data = **contents;
    if (offset >= data.size()) {
        return make_result(std::string());
    }
    return make_result(data.substr(offset, count));
}

Result<std::vector<DirectoryEntry>> Driver::readdir(std::uint64_t ino, std::uint64_t offset)
{
    auto inode = resolve(ino);
    if (!inode) {
        return copy_error(inode);
    }
    auto entries = children(*inode);
    if (!entries) {
        return entries;
    }

    spdlog::debug("{} children, offset {}", entries->size(), offset);
    if (offset >= entries->size()) {
        return make_result(std::vector<DirectoryEntry>());
    }
    entries->erase(entries->begin(),
                   entries->begin() + static_cast<std::ptrdiff_t>(offset));
    return entries;
}

}
