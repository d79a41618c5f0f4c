/**********************************************************************
File name: fs.cpp
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
#include "inboxfs/fs.hpp"

#include <fcntl.h>
#include <sys/statvfs.h>

#include <mutex>

#include <spdlog/spdlog.h>

#include "inboxfs/fuse/buffer.hpp"

namespace Inboxfs {

static constexpr blksize_t BLOCK_SIZE = 512;
static constexpr unsigned long NAME_MAX_LENGTH = 255;

Filesystem::Filesystem(Driver &driver, const MountOptions &options):
    m_driver(driver),
    m_options(options)
{

}

struct stat Filesystem::make_stat(const Attributes &attr) const
{
    struct stat stbuf{};
    stbuf.st_ino = attr.ino;
    if (attr.directory) {
        stbuf.st_mode = S_IFDIR | S_IRUSR | S_IXUSR;
        stbuf.st_nlink = 2;
    } else {
        stbuf.st_mode = S_IFREG | S_IRUSR;
        stbuf.st_nlink = 1;
    }
    stbuf.st_size = static_cast<off_t>(attr.size);
    stbuf.st_blksize = BLOCK_SIZE;
    stbuf.st_blocks = static_cast<blkcnt_t>((attr.size + BLOCK_SIZE - 1) / BLOCK_SIZE);
    stbuf.st_uid = m_options.uid;
    stbuf.st_gid = m_options.gid;
    return stbuf;
}

void Filesystem::reply_error(Fuse::Request &req, const Error &err)
{
    log_error(err);
    req.reply_err(err.errno_code());
}

void Filesystem::init(fuse_conn_info *conn)
{
    spdlog::info("filesystem initialized");
}

void Filesystem::lookup(Fuse::Request &&req, fuse_ino_t parent, std::string_view name)
{
    std::lock_guard<debug_mutex> guard(m_driver_mutex);

    auto inode = m_driver.lookup(parent, name);
    if (!inode) {
        reply_error(req, inode.error());
        return;
    }

    const Attributes attr = attributes_of(*inode);
    struct fuse_entry_param e{};
    e.ino = attr.ino;
    e.attr = make_stat(attr);
    e.attr_timeout = m_options.attr_timeout;
    e.entry_timeout = m_options.attr_timeout;
    req.reply_entry(&e);
}

void Filesystem::forget(Fuse::Request &&req, fuse_ino_t ino, uint64_t nlookup)
{
    req.reply_none();
}

void Filesystem::getattr(Fuse::Request &&req, fuse_ino_t ino, fuse_file_info *fi)
{
    std::lock_guard<debug_mutex> guard(m_driver_mutex);

    auto attr = m_driver.getattr(ino);
    if (!attr) {
        reply_error(req, attr.error());
        return;
    }

    req.reply_attr(make_stat(*attr), m_options.attr_timeout);
}

void Filesystem::open(Fuse::Request &&req, fuse_ino_t ino, fuse_file_info *fi)
{
    std::lock_guard<debug_mutex> guard(m_driver_mutex);

    auto attr = m_driver.getattr(ino);
    if (!attr) {
        reply_error(req, attr.error());
        return;
    }
    if (attr->directory) {
        reply_error(req, Error::is_dir());
        return;
    }
    if ((fi->flags & O_ACCMODE) != O_RDONLY) {
        req.reply_err(EROFS);
        return;
    }

    // attachment contents never change
    fi->keep_cache = 1;
    req.reply_open(fi);
}

void Filesystem::read(Fuse::Request &&req, fuse_ino_t ino, size_t size, off_t off, fuse_file_info *fi)
{
    if (off < 0) {
        reply_error(req, Error::invalid());
        return;
    }

    std::lock_guard<debug_mutex> guard(m_driver_mutex);

    auto data = m_driver.read(ino, static_cast<std::uint64_t>(off), size);
    if (!data) {
        reply_error(req, data.error());
        return;
    }

    req.reply_buf(*data);
}

void Filesystem::release(Fuse::Request &&req, fuse_ino_t ino, fuse_file_info *fi)
{
    req.reply_err(0);
}

void Filesystem::opendir(Fuse::Request &&req, fuse_ino_t ino, fuse_file_info *fi)
{
    std::lock_guard<debug_mutex> guard(m_driver_mutex);

    auto attr = m_driver.getattr(ino);
    if (!attr) {
        reply_error(req, attr.error());
        return;
    }
    if (!attr->directory) {
        reply_error(req, Error::is_not_dir());
        return;
    }

    fi->fh = 0;
    req.reply_open(fi);
}

void Filesystem::readdir(Fuse::Request &&req, fuse_ino_t ino, size_t size, off_t off, fuse_file_info *fi)
{
    std::lock_guard<debug_mutex> guard(m_driver_mutex);

    const std::uint64_t start = off < 0 ? 0 : static_cast<std::uint64_t>(off);
    auto children = m_driver.readdir(ino, start);
    if (!children) {
        reply_error(req, children.error());
        return;
    }

    Fuse::DirBuffer buffer;
    off_t cursor = static_cast<off_t>(start);
    for (const auto &child: *children) {
        const std::size_t rollback = buffer.length();
        ++cursor;
        buffer.add(req, child.name.c_str(), make_stat(attributes_of(child.inode)), cursor);
        if (buffer.length() > size) {
            // does not fit anymore, the kernel asks again starting here
            buffer.rewind(rollback);
            break;
        }
    }

    req.reply_buf(buffer.get());
}

void Filesystem::releasedir(Fuse::Request &&req, fuse_ino_t ino, fuse_file_info *fi)
{
    req.reply_err(0);
}

void Filesystem::statfs(Fuse::Request &&req, fuse_ino_t ino)
{
    struct statvfs stbuf{};
    stbuf.f_bsize = BLOCK_SIZE;
    stbuf.f_frsize = BLOCK_SIZE;
    stbuf.f_namemax = NAME_MAX_LENGTH;
    stbuf.f_flag = ST_RDONLY;
    req.reply_statfs(&stbuf);
}

}
