/**********************************************************************
File name: naming.cpp
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
#include "inboxfs/naming.hpp"

#include <algorithm>
#include <ctime>

namespace Inboxfs {

static void sanitize(std::string &name)
{
    std::replace(name.begin(), name.end(), ' ', '_');
    std::replace(name.begin(), name.end(), '/', '_');
}

std::string format_timestamp(Backend::Timestamp ts)
{
    const std::time_t t = std::chrono::system_clock::to_time_t(ts);
    struct tm parts{};
    gmtime_r(&t, &parts);

    char buf[32];
    const std::size_t len = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S+00:00", &parts);
    return std::string(buf, len);
}

std::string_view attachment_extension(std::string_view content_type)
{
    if (content_type == "application/pdf") {
        return "pdf";
    }
    if (content_type == "text/html") {
        return "html";
    }
    return "txt";
}

std::string entry_name(std::uint32_t id, const Backend::InboxItem &item)
{
    std::string name = std::to_string(id);
    name += '-';
    name += item.sender_name;
    name += '-';
    name += item.subject;
    sanitize(name);
    return name;
}

Result<std::string> attachment_name(const Backend::ItemDetails &details,
                                    std::size_t index)
{
    if (index >= details.parts.size()) {
        return make_result(FAILED, Error::not_found());
    }

    std::string name = format_timestamp(details.created_at);
    name += '-';
    name += details.sender_name;
    name += '-';
    name += details.subject;
    name += '-';
    name += std::to_string(index);
    name += '.';
    name += attachment_extension(details.parts[index].content_type);
    sanitize(name);
    return make_result(std::move(name));
}

}
