/**********************************************************************
File name: interface.cpp
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
#include "inboxfs/fuse/interface.hpp"

namespace Fuse {

void Interface::init(fuse_conn_info *conn)
{

}

void Interface::destroy()
{

}

void Interface::lookup(Fuse::Request &&req, fuse_ino_t parent, std::string_view name) {
    req.reply_err(ENOSYS);
}

void Interface::forget(Fuse::Request &&req, fuse_ino_t ino, uint64_t nlookup) {
    req.reply_none();
}

void Interface::getattr(Fuse::Request &&req, fuse_ino_t ino, struct fuse_file_info *fi) {
    req.reply_err(ENOSYS);
}

void Interface::open(Fuse::Request &&req, fuse_ino_t ino, struct fuse_file_info *fi) {
    req.reply_err(ENOSYS);
}

void Interface::read(Fuse::Request &&req, fuse_ino_t ino, size_t size, off_t off, struct fuse_file_info *fi) {
    req.reply_err(ENOSYS);
}

void Interface::release(Fuse::Request &&req, fuse_ino_t ino, struct fuse_file_info *fi) {
    req.reply_err(0);
}

void Interface::opendir(Fuse::Request &&req, fuse_ino_t ino, struct fuse_file_info *fi) {
    req.reply_err(ENOSYS);
}

void Interface::readdir(Fuse::Request &&req, fuse_ino_t ino, size_t size, off_t off, struct fuse_file_info *fi) {
    req.reply_err(ENOSYS);
}

void Interface::releasedir(Fuse::Request &&req, fuse_ino_t ino, struct fuse_file_info *fi) {
    req.reply_err(0);
}

void Interface::statfs(Fuse::Request &&req, fuse_ino_t ino) {
    req.reply_err(ENOSYS);
}

}
