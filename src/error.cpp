/**********************************************************************
File name: error.cpp
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
#include "inboxfs/error.hpp"

#include <cerrno>

#include <spdlog/spdlog.h>

namespace Inboxfs {

Error::Error(ErrorKind kind, std::string message):
    m_kind(kind),
    m_message(std::move(message))
{

}

Error Error::not_found()
{
    return Error(ErrorKind::NOT_FOUND);
}

Error Error::internal(std::string_view message)
{
    return Error(ErrorKind::INTERNAL, std::string(message));
}

Error Error::invalid()
{
    return Error(ErrorKind::INVALID);
}

Error Error::is_dir()
{
    return Error(ErrorKind::IS_DIR);
}

Error Error::is_not_dir()
{
    return Error(ErrorKind::IS_NOT_DIR);
}

std::string Error::what() const
{
    switch (m_kind) {
    case ErrorKind::NOT_FOUND:
        return "not found";
    case ErrorKind::INTERNAL:
        return "internal error: " + m_message;
    case ErrorKind::INVALID:
        return "invalid";
    case ErrorKind::IS_DIR:
        return "inode is directory";
    case ErrorKind::IS_NOT_DIR:
        return "inode is not directory";
    }
    return "unknown error";
}

int Error::errno_code() const
{
    switch (m_kind) {
    case ErrorKind::NOT_FOUND:
        return ENOENT;
    case ErrorKind::INTERNAL:
        return EFAULT;
    case ErrorKind::INVALID:
        return EINVAL;
    case ErrorKind::IS_DIR:
        return EISDIR;
    case ErrorKind::IS_NOT_DIR:
        return ENOTDIR;
    }
    return EIO;
}

spdlog::level::level_enum Error::severity() const
{
    switch (m_kind) {
    case ErrorKind::INTERNAL:
        return spdlog::level::err;
    case ErrorKind::INVALID:
        return spdlog::level::warn;
    case ErrorKind::NOT_FOUND:
    case ErrorKind::IS_DIR:
    case ErrorKind::IS_NOT_DIR:
        return spdlog::level::debug;
    }
    return spdlog::level::err;
}

void log_error(const Error &err)
{
    spdlog::log(err.severity(), "{}", err.what());
}

}
