// Copyright (c) 2009 - Mozy, Inc.

#include "concatenated.h"

#include <algorithm>
#include <limits>
#include <stdexcept>

#include <boost/bind.hpp>

#include "catena/assert.h"
#include "catena/log.h"
#include "catena/parallel.h"

namespace Catena {

static Logger::ptr g_log = Log::lookup("catena:streams:concatenated");

ConcatenatedStream::ConcatenatedStream(const std::vector<Stream::ptr> &streams,
    const std::string &name, const std::vector<LengthProbe::ptr> &probes)
    : m_name(name),
      m_probes(probes),
      m_state(UNINITIALIZED),
      m_readable(false),
      m_seekable(false),
      m_synced(false),
      m_size(0ll),
      m_pos(0ll),
      m_offset(0ll),
      m_index(0)
{
    if (streams.empty())
        CATENA_THROW_EXCEPTION(std::invalid_argument("no streams to concatenate"));
    m_sources.reserve(streams.size());
    for (std::vector<Stream::ptr>::const_iterator it = streams.begin();
        it != streams.end();
        ++it) {
        CATENA_ASSERT(*it);
        m_sources.push_back(Source(*it));
    }
}

ConcatenatedStream::ptr
ConcatenatedStream::create(const std::vector<Stream::ptr> &streams,
    const std::string &name)
{
    ptr result(new ConcatenatedStream(streams, name));
    result->open();
    return result;
}

void
ConcatenatedStream::probe(Source &source)
{
    source.readable = source.stream->supportsRead();
    source.seekable = source.stream->supportsSeek();
    source.length = probeLength(*source.stream, m_probes);
}

void
ConcatenatedStream::open()
{
    RecursiveFiberMutex::ScopedLock lock(m_mutex);
    if (m_state == OPEN)
        return;
    if (m_state == CLOSED)
        CATENA_THROW_EXCEPTION(ClosedStreamException());

    std::vector<boost::function<void ()> > dgs;
    for (std::vector<Source>::iterator it = m_sources.begin();
        it != m_sources.end();
        ++it)
        dgs.push_back(boost::bind(&ConcatenatedStream::probe, this,
            boost::ref(*it)));
    parallel_do(dgs);

    long long size = 0;
    bool readable = true, seekable = true;
    for (size_t i = 0; i < m_sources.size(); ++i) {
        const Source &source = m_sources[i];
        if (source.length < 0) {
            CATENA_LOG_ERROR(g_log) << this << " " << m_name << " source " << i
                << " (" << source.stream.get() << ") has unknown length";
            CATENA_THROW_EXCEPTION(InitializationException())
                << errinfo_source_index(i);
        }
        size += source.length;
        readable = readable && source.readable;
        seekable = seekable && source.seekable;
    }

    m_size = size;
    m_readable = readable;
    m_seekable = seekable;
    m_pos = m_offset = 0ll;
    m_index = 0;
    // Skip any empty sources at the front
    if (m_seekable)
        resync(0ll);
    m_state = OPEN;
    CATENA_LOG_VERBOSE(g_log) << this << " open(" << m_name << "): "
        << m_sources.size() << " sources, " << m_size << " bytes";
}

bool
ConcatenatedStream::isOpen()
{
    RecursiveFiberMutex::ScopedLock lock(m_mutex);
    return m_state == OPEN;
}

bool
ConcatenatedStream::closed()
{
    RecursiveFiberMutex::ScopedLock lock(m_mutex);
    return m_state == CLOSED;
}

void
ConcatenatedStream::checkOpen()
{
    if (m_state != OPEN)
        CATENA_THROW_EXCEPTION(ClosedStreamException());
}

bool
ConcatenatedStream::supportsRead()
{
    RecursiveFiberMutex::ScopedLock lock(m_mutex);
    return m_state == OPEN && m_readable;
}

bool
ConcatenatedStream::supportsSeek()
{
    RecursiveFiberMutex::ScopedLock lock(m_mutex);
    return m_state == OPEN && m_seekable;
}

bool
ConcatenatedStream::supportsTell()
{
    RecursiveFiberMutex::ScopedLock lock(m_mutex);
    return m_state == OPEN;
}

bool
ConcatenatedStream::supportsSize()
{
    RecursiveFiberMutex::ScopedLock lock(m_mutex);
    return m_state == OPEN;
}

void
ConcatenatedStream::close(CloseType type)
{
    // There are no half-closed sources; any close releases them all
    RecursiveFiberMutex::ScopedLock lock(m_mutex);
    if (m_state == CLOSED)
        return;
    m_state = CLOSED;
    CATENA_LOG_VERBOSE(g_log) << this << " close(" << m_name << ")";
    std::vector<boost::function<void ()> > dgs;
    for (std::vector<Source>::iterator it = m_sources.begin();
        it != m_sources.end();
        ++it)
        dgs.push_back(boost::bind(&Stream::close, it->stream, BOTH));
    parallel_do(dgs);
}

void
ConcatenatedStream::resync(long long pos)
{
    // Find the source holding pos; past the end, the last source holds it
    long long offset = pos;
    size_t index = 0;
    while (offset >= m_sources[index].length && index + 1 < m_sources.size()) {
        offset -= m_sources[index].length;
        ++index;
    }

    m_synced = false;
    long long reported = m_sources[index].stream->seek(offset, BEGIN);
    CATENA_LOG_TRACE(g_log) << this << " resync(" << pos << "): source "
        << index << " seek(" << offset << "): " << reported;
    if (reported != offset) {
        // The source is shorter than it was measured to be
        CATENA_LOG_VERBOSE(g_log) << this << " source " << index
            << " stopped at " << reported << " instead of " << offset;
        pos -= offset - reported;
    }
    m_pos = pos;
    m_index = index;
    m_offset = reported;
    m_synced = true;
}

size_t
ConcatenatedStream::read(void *buffer, size_t length)
{
    RecursiveFiberMutex::ScopedLock lock(m_mutex);
    checkOpen();
    if (!m_readable || !m_seekable)
        CATENA_THROW_EXCEPTION(UnsupportedOperationException());

    // A failed resync left the source somewhere other than m_offset
    if (!m_synced)
        resync(m_pos);
    Source &source = m_sources[m_index];
    long long before = m_offset;
    m_synced = false;
    size_t result = source.stream->read(buffer, length);
    CATENA_ASSERT(result <= length);
    long long allowed = std::max(source.length - before, 0ll);
    if ((long long)result > allowed) {
        CATENA_LOG_VERBOSE(g_log) << this << " source " << m_index
            << " returned " << result << " bytes past offset " << before
            << "; only " << allowed << " belong to it";
        result = (size_t)allowed;
    }
    if (result == 0 && m_index + 1 < m_sources.size())
        CATENA_LOG_VERBOSE(g_log) << this << " source " << m_index
            << " ended early at " << before;

    // The cursor only moves once the next source position is known
    resync(m_pos + (long long)result);
    CATENA_LOG_DEBUG(g_log) << this << " read(" << length << "): " << result
        << " (" << m_pos << ")";
    return result;
}

size_t
ConcatenatedStream::read(Buffer &buffer, size_t length)
{
    iovec target = buffer.writeBuffer(length);
    size_t result = read(target.iov_base, length);
    buffer.produce(result);
    return result;
}

long long
ConcatenatedStream::seek(long long offset, Anchor anchor)
{
    RecursiveFiberMutex::ScopedLock lock(m_mutex);
    checkOpen();
    if (offset == 0 && anchor == CURRENT)
        return m_pos;
    if (!m_seekable)
        CATENA_THROW_EXCEPTION(UnsupportedOperationException());

    long long base;
    switch (anchor) {
        case BEGIN:
            base = 0;
            break;
        case CURRENT:
            base = m_pos;
            break;
        case END:
            base = m_size;
            break;
        default:
            CATENA_THROW_EXCEPTION(std::invalid_argument("anchor"));
    }
    // base is never negative, so only a forward seek can overflow; it lands
    // past the end like any other seek beyond the last source
    long long pos;
    if (offset > std::numeric_limits<long long>::max() - base)
        pos = std::numeric_limits<long long>::max();
    else
        pos = base + offset;
    if (pos < 0)
        CATENA_THROW_EXCEPTION(std::invalid_argument("resulting offset is negative"));

    resync(pos);
    CATENA_LOG_DEBUG(g_log) << this << " seek(" << offset << ", " << anchor
        << "): " << m_pos;
    return m_pos;
}

long long
ConcatenatedStream::size()
{
    RecursiveFiberMutex::ScopedLock lock(m_mutex);
    checkOpen();
    return m_size;
}

std::vector<long long>
ConcatenatedStream::lengths()
{
    RecursiveFiberMutex::ScopedLock lock(m_mutex);
    std::vector<long long> result;
    result.reserve(m_sources.size());
    for (std::vector<Source>::const_iterator it = m_sources.begin();
        it != m_sources.end();
        ++it)
        result.push_back(it->length);
    return result;
}

size_t
ConcatenatedStream::currentSource()
{
    RecursiveFiberMutex::ScopedLock lock(m_mutex);
    return m_index;
}

long long
ConcatenatedStream::currentSourceOffset()
{
    RecursiveFiberMutex::ScopedLock lock(m_mutex);
    return m_offset;
}

}
