/**********************************************************************
File name: error.hpp
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
#ifndef INBOXFS_ERROR_H
#define INBOXFS_ERROR_H

#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <spdlog/common.h>

namespace Inboxfs {

enum class ErrorKind {
    NOT_FOUND,
    INTERNAL,
    INVALID,
    IS_DIR,
    IS_NOT_DIR,
};

class Error {
public:
    Error() = delete;
    explicit Error(ErrorKind kind, std::string message = std::string());

    Error(const Error &src) = default;
    Error(Error &&src) noexcept = default;
    Error &operator=(const Error &src) = default;
    Error &operator=(Error &&src) noexcept = default;
    ~Error() = default;

private:
    ErrorKind m_kind;
    std::string m_message;

public:
    static Error not_found();
    static Error internal(std::string_view message);
    static Error invalid();
    static Error is_dir();
    static Error is_not_dir();

    [[nodiscard]] inline ErrorKind kind() const {
        return m_kind;
    }

    /**
     * @brief Message of the failed collaborator call.
     *
     * Only populated for ErrorKind::INTERNAL.
     */
    [[nodiscard]] inline const std::string &message() const {
        return m_message;
    }

    [[nodiscard]] std::string what() const;

    /**
     * @brief The POSIX error code reported to the kernel for this error.
     */
    [[nodiscard]] int errno_code() const;

    /**
     * @brief The level at which this error is logged when it is reported.
     */
    [[nodiscard]] spdlog::level::level_enum severity() const;

    inline bool operator==(const Error &other) const {
        return m_kind == other.m_kind && m_message == other.m_message;
    }

    inline bool operator!=(const Error &other) const {
        return !(*this == other);
    }

};

void log_error(const Error &err);

enum failed_t {
    FAILED = 0,
};

struct ErrorResultHelper {
    Error error;
};

template <typename T>
struct Result {
public:
    template<typename U, typename _ = typename std::enable_if<std::is_convertible<U, T>::value>::type>
    Result(U &&value):
        m_value(std::forward<U>(value))
    {

    }

    Result(failed_t, Error err):
        m_value(),
        m_error(std::move(err))
    {

    }

    Result(ErrorResultHelper &&helper):
        Result(FAILED, std::move(helper.error))
    {

    }

    Result(const Result &ref) = default;
    Result(Result &&src) noexcept = default;
    Result &operator=(const Result &ref) = default;
    Result &operator=(Result &&src) noexcept = default;

    ~Result() = default;

private:
    std::optional<T> m_value;
    std::optional<Error> m_error;

public:
    inline explicit operator bool() const {
        return m_value.has_value();
    }

    /**
     * @brief The error of a failed result.
     *
     * Must only be called if the result evaluates to false.
     */
    [[nodiscard]] inline const Error &error() const {
        return m_error.value();
    }

    inline T &operator*() {
        return m_value.value();
    }

    inline const T &operator*() const {
        return m_value.value();
    }

    inline T *operator->() {
        return &m_value.value();
    }

    inline const T *operator->() const {
        return &m_value.value();
    }

};

template<>
struct Result<void> {
public:
    Result() = default;

    Result(const Result &src) = default;
    Result(Result &&src) = default;
    Result &operator=(const Result &src) = default;
    Result &operator=(Result &&src) = default;

    Result(ErrorResultHelper &&helper):
        m_error(std::move(helper.error))
    {

    }

    Result(failed_t, Error err):
        m_error(std::move(err))
    {

    }

private:
    std::optional<Error> m_error;

public:
    inline explicit operator bool() const {
        return !m_error.has_value();
    }

    [[nodiscard]] inline const Error &error() const {
        return m_error.value();
    }

};


template<typename T>
[[nodiscard]] inline Result<typename std::decay<T>::type> make_result(T &&value)
{
    return Result<typename std::decay<T>::type>(std::forward<T>(value));
}

[[nodiscard]] inline ErrorResultHelper make_result(failed_t, Error err)
{
    return ErrorResultHelper{std::move(err)};
}

template<typename T>
[[nodiscard]] inline ErrorResultHelper copy_error(const Result<T> &result)
{
    return ErrorResultHelper{result.error()};
}

[[nodiscard]] inline Result<void> make_result()
{
    return Result<void>();
}


}

#endif
