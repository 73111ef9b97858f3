#ifndef __CATENA_FD_STREAM_H__
#define __CATENA_FD_STREAM_H__
// Copyright (c) 2009 - Mozy, Inc.

#include "stream.h"

namespace Catena {

/// @brief Stream over a POSIX file descriptor
/// @details
/// Every call blocks the calling thread (and with it any Fibers sharing
/// that thread) for as long as the system call takes.  Failures are thrown
/// as the NativeException that matches errno.
class FDStream : public Stream
{
public:
    typedef boost::shared_ptr<FDStream> ptr;

    /// @param own Whether close() and the destructor close @c fd
    FDStream(int fd, bool own = true);
    ~FDStream();

    bool supportsRead() { return true; }
    bool supportsWrite() { return true; }
    bool supportsSeek() { return true; }
    bool supportsSize() { return true; }

    void close(CloseType type = BOTH);
    using Stream::read;
    size_t read(void *buffer, size_t length);
    using Stream::write;
    size_t write(const void *buffer, size_t length);
    long long seek(long long offset, Anchor anchor = BEGIN);
    /// fstat()'s st_size, whatever kind of file this is
    long long size();

    /// -1 once closed
    int fd() const { return m_fd; }

protected:
    FDStream();
    void init(int fd, bool own = true);

private:
    int checkOpen() const;

    int m_fd;
    bool m_own;
};

}

#endif
