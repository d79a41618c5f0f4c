/**********************************************************************
File name: buffer.hpp
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
#ifndef INBOXFS_FUSE_BUFFER_H
#define INBOXFS_FUSE_BUFFER_H

#include <sys/types.h>

#include <cstddef>
#include <string>

struct stat;

namespace Fuse {

class Request;

/**
 * Accumulates directory entries in the format expected by the kernel.
 */
class DirBuffer {
private:
    std::basic_string<char> m_buf;

    size_t prepare_add(Request &req, const char *name);

public:
    /**
     * @brief Append an entry.
     *
     * @param off Offset the kernel passes to the next readdir call to
     * continue after this entry.
     */
    void add(Request &req,
             const char *name,
             const struct stat &stbuf,
             off_t off);

    [[nodiscard]] inline const std::basic_string<char> &get() const {
        return m_buf;
    }

    [[nodiscard]] inline std::size_t length() const {
        return m_buf.size();
    }

    inline void rewind(std::size_t offs) {
        if (m_buf.size() > offs) {
            m_buf.resize(offs);
        }
    }
};

}

#endif
