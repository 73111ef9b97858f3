// Copyright (c) 2009 - Mozy, Inc.

#include "fd.h"

#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <algorithm>
#include <sstream>
#include <stdexcept>

#include "catena/exception.h"
#include "catena/log.h"

namespace Catena {

static Logger::ptr g_log = Log::lookup("catena:streams:fd");

// Largest single read() or write() Linux will perform
static const size_t g_maxTransfer = 0x7ffff000;

// Log a completed system call, and throw if it failed
static long long
checked(const FDStream *stream, const char *api, long long rc,
    error_t error, Log::Level successLevel, long long argument = -1)
{
    if (g_log->enabled(rc < 0 ? Log::ERROR : successLevel)) {
        std::ostringstream args;
        args << stream->fd();
        if (argument >= 0)
            args << ", " << argument;
        CATENA_LOG_LEVEL(g_log, rc < 0 ? Log::ERROR : successLevel) << stream
            << ' ' << api << '(' << args.str() << "): " << rc << " ("
            << error << ')';
    }
    if (rc < 0)
        CATENA_THROW_EXCEPTION_FROM_ERROR_API(error, api);
    return rc;
}

FDStream::FDStream()
    : m_fd(-1),
      m_own(false)
{}

FDStream::FDStream(int fd, bool own)
    : m_fd(-1),
      m_own(false)
{
    init(fd, own);
}

void
FDStream::init(int fd, bool own)
{
    CATENA_ASSERT(fd >= 0);
    CATENA_ASSERT(m_fd == -1);
    m_fd = fd;
    m_own = own;
}

FDStream::~FDStream()
{
    if (m_own && m_fd >= 0) {
        int rc = ::close(m_fd);
        CATENA_LOG_LEVEL(g_log, rc ? Log::ERROR : Log::VERBOSE) << this
            << " close(" << m_fd << "): " << rc << " (" << lastError() << ')';
    }
}

int
FDStream::checkOpen() const
{
    if (m_fd < 0)
        CATENA_THROW_EXCEPTION(BadHandleException());
    return m_fd;
}

void
FDStream::close(CloseType type)
{
    CATENA_ASSERT(type == BOTH);
    if (m_fd < 0)
        return;
    int fd = m_fd;
    if (!m_own) {
        m_fd = -1;
        return;
    }
    int rc = ::close(fd);
    error_t error = lastError();
    m_fd = -1;
    CATENA_LOG_LEVEL(g_log, rc ? Log::ERROR : Log::VERBOSE) << this
        << " close(" << fd << "): " << rc << " (" << error << ')';
    if (rc)
        CATENA_THROW_EXCEPTION_FROM_ERROR_API(error, "close");
}

size_t
FDStream::read(void *buffer, size_t length)
{
    ssize_t rc = ::read(checkOpen(), buffer,
        std::min(length, g_maxTransfer));
    return (size_t)checked(this, "read", rc, lastError(), Log::DEBUG,
        (long long)length);
}

size_t
FDStream::write(const void *buffer, size_t length)
{
    ssize_t rc = ::write(checkOpen(), buffer,
        std::min(length, g_maxTransfer));
    checked(this, "write", rc, lastError(), Log::DEBUG, (long long)length);
    if (rc == 0 && length > 0)
        CATENA_THROW_EXCEPTION(WriteBeyondEofException());
    return (size_t)rc;
}

long long
FDStream::seek(long long offset, Anchor anchor)
{
    int whence;
    switch (anchor) {
        case BEGIN:
            whence = SEEK_SET;
            break;
        case CURRENT:
            whence = SEEK_CUR;
            break;
        case END:
            whence = SEEK_END;
            break;
        default:
            CATENA_THROW_EXCEPTION(std::invalid_argument("anchor"));
    }
    if (anchor == BEGIN && offset < 0)
        CATENA_THROW_EXCEPTION(std::invalid_argument("offset"));
    off_t rc = lseek(checkOpen(), (off_t)offset, whence);
    return checked(this, "lseek", rc, lastError(),
        anchor == CURRENT && offset == 0 ? Log::DEBUG : Log::VERBOSE,
        offset);
}

long long
FDStream::size()
{
    struct stat statbuf;
    int rc = fstat(checkOpen(), &statbuf);
    checked(this, "fstat", rc, lastError(), Log::VERBOSE);
    return statbuf.st_size;
}

}
