#ifndef INBOXFS_FUSE_INTERFACE_H
#define INBOXFS_FUSE_INTERFACE_H

#include "inboxfs/inboxfs-config.h"
#include <fuse_lowlevel.h>

#include <stdexcept>
#include <string_view>

#include "inboxfs/fuse/request.hpp"

namespace Fuse {

#define inboxfs_fuse_dispatch(func, ...) do {\
    Request request_handle(req); \
    Impl *impl = static_cast<Impl*>(request_handle.userdata()); \
    impl->func(std::move(request_handle), __VA_ARGS__); \
    } while (0)

template <typename Impl>
class Session {
public:
    Session(Impl &impl, struct fuse_args *args):
        m_impl(&impl),
        m_op({
             .init = &Session<Impl>::init,
             .destroy = &Session<Impl>::destroy,
             .lookup = &Session<Impl>::lookup,
             .forget = &Session<Impl>::forget,
             .getattr = &Session<Impl>::getattr,
             .open = &Session<Impl>::open,
             .read = &Session<Impl>::read,
             .release = &Session<Impl>::release,
             .opendir = &Session<Impl>::opendir,
             .readdir = &Session<Impl>::readdir,
             .releasedir = &Session<Impl>::releasedir,
             .statfs = &Session<Impl>::statfs,
             }),
        m_session(fuse_session_new(args, &m_op, sizeof(m_op), m_impl))
    {
        if (!m_session) {
            throw std::runtime_error("failed to set up session");
        }

    }
    Session(const Session &src) = delete;
    Session &operator=(const Session &src) = delete;
    ~Session() {
        fuse_session_destroy(m_session);
    }

private:
    Impl *m_impl;
    fuse_lowlevel_ops m_op;
    struct fuse_session *m_session;

private:
    static void init(void *userdata, struct fuse_conn_info *conn) {
        Impl *impl = static_cast<Impl*>(userdata);
        impl->init(conn);
    }

    static void destroy(void *userdata) {
        Impl *impl = static_cast<Impl*>(userdata);
        impl->destroy();
    }

    static void lookup(fuse_req_t req, fuse_ino_t parent, const char *name) {
        inboxfs_fuse_dispatch(lookup, parent, name);
    }

    static void forget(fuse_req_t req, fuse_ino_t ino, uint64_t nlookup) {
        inboxfs_fuse_dispatch(forget, ino, nlookup);
    }

    static void getattr(fuse_req_t req, fuse_ino_t ino, struct fuse_file_info *fi) {
        inboxfs_fuse_dispatch(getattr, ino, fi);
    }

    static void open(fuse_req_t req, fuse_ino_t ino, struct fuse_file_info *fi) {
        inboxfs_fuse_dispatch(open, ino, fi);
    }

    static void read(fuse_req_t req, fuse_ino_t ino, size_t size, off_t off, struct fuse_file_info *fi) {
        inboxfs_fuse_dispatch(read, ino, size, off, fi);
    }

    static void release(fuse_req_t req, fuse_ino_t ino, struct fuse_file_info *fi) {
        inboxfs_fuse_dispatch(release, ino, fi);
    }

    static void opendir(fuse_req_t req, fuse_ino_t ino, struct fuse_file_info *fi) {
        inboxfs_fuse_dispatch(opendir, ino, fi);
    }

    static void readdir(fuse_req_t req, fuse_ino_t ino, size_t size, off_t off, struct fuse_file_info *fi) {
        inboxfs_fuse_dispatch(readdir, ino, size, off, fi);
    }

    static void releasedir(fuse_req_t req, fuse_ino_t ino, struct fuse_file_info *fi) {
        inboxfs_fuse_dispatch(releasedir, ino, fi);
    }

    static void statfs(fuse_req_t req, fuse_ino_t ino) {
        inboxfs_fuse_dispatch(statfs, ino);
    }

public:
    inline int mount(const char *mountpoint) {
        return fuse_session_mount(m_session, mountpoint);
    }

    inline int loop() {
        return fuse_session_loop(m_session);
    }

    inline int loop_mt(bool clone_fds) {
        return fuse_session_loop_mt(m_session, clone_fds);
    }

    inline void unmount() {
        fuse_session_unmount(m_session);
    }

    inline int set_signal_handlers() {
        return fuse_set_signal_handlers(m_session);
    }

    inline void remove_signal_handlers() {
        fuse_remove_signal_handlers(m_session);
    }

};

#undef inboxfs_fuse_dispatch

/**
 * Default handlers for the operations wired up by Session. Every request
 * is answered with ENOSYS.
 */
class Interface {
public:
    void init(struct fuse_conn_info *conn);
    void destroy();
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
