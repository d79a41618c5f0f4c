/**********************************************************************
File name: fs.hpp
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
#ifndef INBOXFS_FS_H
#define INBOXFS_FS_H

#include <sys/types.h>
#include <unistd.h>

#include "inboxfs/fuse/interface.hpp"
#include "inboxfs/debug_mutex.hpp"
#include "inboxfs/driver.hpp"

namespace Inboxfs {

struct MountOptions {
    uid_t uid = getuid();
    gid_t gid = getgid();
    /**
     * How long the kernel may cache attributes and entries, in seconds.
     */
    double attr_timeout = 60.0;
};

/**
 * FUSE low-level handlers on top of a Driver.
 *
 * All handlers run under one mutex, so the driver sees at most one
 * operation at a time even with the multi-threaded session loop.
 */
class Filesystem: public Fuse::Interface
{
public:
    Filesystem() = delete;
    Filesystem(Driver &driver, const MountOptions &options);

private:
    Driver &m_driver;
    const MountOptions m_options;
    debug_mutex m_driver_mutex;

    [[nodiscard]] struct stat make_stat(const Attributes &attr) const;
    void reply_error(Fuse::Request &req, const Error &err);

public:
    void init(struct fuse_conn_info *conn);
    void lookup(Fuse::Request &&req, fuse_ino_t parent, std::string_view name);
    void forget(Fuse::Request &&req, fuse_ino_t ino, uint64_t nlookup);
    void getattr(Fuse::Request &&req, fuse_ino_t ino, struct fuse_file_info *fi);
    void open(Fuse::Request &&req, fuse_ino_t ino, struct fuse_file_info *fi);
    void read(Fuse::Request &&req, fuse_ino_t ino, size_t size, off_t off, struct fuse_file_info *fi);
    void release(Fuse::Request &&req, fuse_ino_t ino, struct fuse_file_info *fi);
    void opendir(Fuse::Request &&req, fuse_ino_t ino, struct fuse_file_info *fi);
    void readdir(Fuse::Request &&req, fuse_ino_t ino, size_t size, off_t off, struct fuse_file_info *fi);
    void releasedir(Fuse::Request &&req, fuse_ino_t ino, struct fuse_file_info *fi);
    void statfs(Fuse::Request &&req, fuse_ino_t ino);

};

}

#endif
