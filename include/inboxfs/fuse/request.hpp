#ifndef INBOXFS_FUSE_REQUEST_H
#define INBOXFS_FUSE_REQUEST_H

#include "inboxfs/inboxfs-config.h"
#include <fuse_lowlevel.h>

#include <sys/types.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace Fuse {

/**
 * Table of the libfuse request functions used by Request. Tests replace
 * the entries to intercept replies.
 */
struct RequestBackend {
    void *(*req_userdata)(fuse_req_t);

    void (*reply_none)(fuse_req_t);
    int (*reply_err)(fuse_req_t, int);
    int (*reply_entry)(fuse_req_t, const fuse_entry_param*);
    int (*reply_attr)(fuse_req_t, const struct stat*, double);
    int (*reply_open)(fuse_req_t, const fuse_file_info*);
    int (*reply_buf)(fuse_req_t, const char*, size_t);
    int (*reply_statfs)(fuse_req_t, const struct statvfs*);
};

extern RequestBackend backend;

class Request {
public:
    Request();
    explicit Request(fuse_req_t req, int default_error = ECANCELED);
    Request(const Request &src) = delete;
    Request(Request &&src) noexcept;
    Request &operator=(const Request &src) = delete;
    Request &operator=(Request &&src) noexcept;
    Request &operator=(std::nullptr_t);
    ~Request();

private:
    fuse_req_t m_req;
    int m_default_error;

protected:
    void reset();

    inline void check() {
#ifndef NDEBUG
        if (!(*this)) {
            throw std::runtime_error("attempt to execute an operation on a closed FuseRequest");
        }
#endif
    }

public:
    inline operator bool() const {
        return m_req != nullptr;
    }

    inline fuse_req_t release() {
        fuse_req_t result = m_req;
        m_req = nullptr;
        return result;
    }

    inline fuse_req_t operator*() const {
        return m_req;
    }

public: /* GETTERS */
    inline void *userdata() {
        return backend.req_userdata(m_req);
    }

public: /* REPLY FUNCTIONS */
    inline void reply_none() {
        backend.reply_none(release());
    }

    inline int reply_err(int err)
    {
        check();
        return backend.reply_err(release(), err);
    }

    inline int reply_entry(const fuse_entry_param *e)
    {
        check();
        return backend.reply_entry(release(), e);
    }

    inline int reply_attr(const struct stat &attr, double attr_timeout)
    {
        check();
        return backend.reply_attr(release(), &attr, attr_timeout);
    }

    inline int reply_open(const fuse_file_info *fi) {
        check();
        return backend.reply_open(release(), fi);
    }

    inline int reply_buf(const char *buf, size_t size) {
        check();
        return backend.reply_buf(release(), buf, size);
    }

    inline int reply_buf(const std::basic_string<char> &s) {
        check();
        return reply_buf(s.data(), s.size());
    }

    inline int reply_statfs(const struct statvfs *stbuf) {
        check();
        return backend.reply_statfs(release(), stbuf);
    }
};

}

#endif
