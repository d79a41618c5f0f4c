/**********************************************************************
File name: clock.hpp
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
#ifndef INBOXFS_CLOCK_H
#define INBOXFS_CLOCK_H

#include <chrono>

namespace Inboxfs {

class Clock {
public:
    using duration = std::chrono::steady_clock::duration;
    using time_point = std::chrono::steady_clock::time_point;

public:
    virtual ~Clock();

public:
    [[nodiscard]] virtual time_point now() const = 0;

};

class SystemClock: public Clock {
public:
    ~SystemClock() override;

public:
    [[nodiscard]] time_point now() const override;

};

}

#endif
