// Copyright (c) 2009 - Mozy, Inc.

#include "buffered.h"

#include <algorithm>
#include <stdexcept>

#include "catena/config.h"
#include "catena/exception.h"
#include "catena/log.h"

namespace Catena {

static ConfigVar<size_t>::ptr g_defaultBufferSize =
    Config::lookup<size_t>("stream.buffered.defaultbuffersize", 65536u,
    "Read-ahead size of a new BufferedStream");

static Logger::ptr g_log = Log::lookup("catena:streams:buffered");

static bool nonZero(size_t value)
{
    return value != 0;
}

namespace {

static struct RegisterValidators
{
    RegisterValidators()
    {
        g_defaultBufferSize->beforeChange.connect(&nonZero);
    }
} g_registerValidators;

}

BufferedStream::BufferedStream(Stream::ptr parent, bool own)
    : FilterStream(parent, own),
      m_bufferSize(g_defaultBufferSize->val()),
      m_allowPartialReads(false)
{}

void
BufferedStream::close(CloseType type)
{
    CATENA_LOG_VERBOSE(g_log) << this << " close(" << type << ")";
    if (type & READ)
        m_readBuffer.clear();
    FilterStream::close(type);
}

size_t
BufferedStream::takeBuffered(unsigned char *buffer, size_t length)
{
    size_t taken = std::min(length, m_readBuffer.readAvailable());
    m_readBuffer.copyOut(buffer, taken);
    m_readBuffer.consume(taken);
    return taken;
}

// Ask the parent for at least length bytes, rounded up to whole buffers
size_t
BufferedStream::fill(size_t length)
{
    size_t request = ((length + m_bufferSize - 1) / m_bufferSize) *
        m_bufferSize;
    size_t result = parent()->read(m_readBuffer, request);
    CATENA_LOG_DEBUG(g_log) << this << " fill(" << request << "): "
        << result;
    return result;
}

size_t
BufferedStream::read(void *buffer, size_t length)
{
    unsigned char *out = static_cast<unsigned char *>(buffer);
    size_t done = takeBuffered(out, length);
    CATENA_LOG_TRACE(g_log) << this << " read(" << length << "): " << done
        << " from buffer";
    if (done == length || (done > 0 && m_allowPartialReads))
        return done;
    while (done < length) {
        size_t result = fill(length - done);
        done += takeBuffered(out + done, length - done);
        if (result == 0 || m_allowPartialReads)
            break;
    }
    return done;
}

long long
BufferedStream::seek(long long offset, Anchor anchor)
{
    long long parentPosition = parent()->tell();
    long long position =
        parentPosition - (long long)m_readBuffer.readAvailable();
    long long target;
    switch (anchor) {
        case BEGIN:
            target = offset;
            break;
        case CURRENT:
            if (offset == 0)
                return position;
            target = position + offset;
            break;
        case END:
            m_readBuffer.clear(false);
            return parent()->seek(offset, END);
        default:
            CATENA_THROW_EXCEPTION(std::invalid_argument("anchor"));
    }
    // Forward within what is buffered costs nothing
    if (target >= position && target <= parentPosition) {
        m_readBuffer.consume((size_t)(target - position));
        return target;
    }
    long long result = parent()->seek(target);
    m_readBuffer.clear(false);
    return result;
}

template <class Delimiter>
ptrdiff_t
BufferedStream::search(const Delimiter &delimiter, size_t delimiterLength,
    size_t sanitySize, bool throwIfNotFound)
{
    size_t limit = (sanitySize == (size_t)~0 ? 2 * m_bufferSize : sanitySize)
        + delimiterLength;
    for (;;) {
        size_t available = m_readBuffer.readAvailable();
        if (available > 0) {
            ptrdiff_t found = m_readBuffer.find(delimiter,
                std::min(limit, available));
            if (found >= 0)
                return found;
        }
        if (available >= limit) {
            if (throwIfNotFound)
                CATENA_THROW_EXCEPTION(BufferOverflowException());
            return -(ptrdiff_t)available - 1;
        }
        if (fill(m_bufferSize) == 0) {
            if (throwIfNotFound)
                CATENA_THROW_EXCEPTION(UnexpectedEofException());
            return -(ptrdiff_t)available - 1;
        }
    }
}

ptrdiff_t
BufferedStream::find(char delimiter, size_t sanitySize, bool throwIfNotFound)
{
    return search(delimiter, 1u, sanitySize, throwIfNotFound);
}

ptrdiff_t
BufferedStream::find(const std::string &delimiter, size_t sanitySize,
    bool throwIfNotFound)
{
    CATENA_ASSERT(!delimiter.empty());
    return search(delimiter, delimiter.size(), sanitySize, throwIfNotFound);
}

}
