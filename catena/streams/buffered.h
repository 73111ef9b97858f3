#ifndef __CATENA_BUFFERED_STREAM_H__
#define __CATENA_BUFFERED_STREAM_H__
// Copyright (c) 2009 - Mozy, Inc.

#include "buffer.h"
#include "filter.h"

namespace Catena {

/// @brief Read-ahead on top of a readable Stream
/// @details
/// The parent is always asked for whole multiples of bufferSize(), and
/// whatever the caller did not want is kept for the next read().  Holding
/// that surplus is what lets find() and getDelimited() work on parents that
/// cannot look ahead themselves.  Writing is not supported.
class BufferedStream : public FilterStream
{
public:
    typedef boost::shared_ptr<BufferedStream> ptr;

    BufferedStream(Stream::ptr parent, bool own = true);

    size_t bufferSize() const { return m_bufferSize; }
    void bufferSize(size_t bufferSize)
    {
        CATENA_ASSERT(bufferSize > 0);
        m_bufferSize = bufferSize;
    }

    /// Whether read() may return early with just what was already buffered
    bool allowPartialReads() const { return m_allowPartialReads; }
    void allowPartialReads(bool allow) { m_allowPartialReads = allow; }

    bool supportsWrite() { return false; }
    bool supportsTruncate() { return false; }
    bool supportsFind() { return supportsRead(); }

    void close(CloseType type = BOTH);
    using Stream::read;
    size_t read(void *buffer, size_t length);
    long long seek(long long offset, Anchor anchor = BEGIN);
    ptrdiff_t find(char delimiter, size_t sanitySize = ~0,
        bool throwIfNotFound = true);
    ptrdiff_t find(const std::string &delimiter, size_t sanitySize = ~0,
        bool throwIfNotFound = true);

private:
    size_t takeBuffered(unsigned char *buffer, size_t length);
    size_t fill(size_t length);
    template <class Delimiter>
    ptrdiff_t search(const Delimiter &delimiter, size_t delimiterLength,
        size_t sanitySize, bool throwIfNotFound);

    size_t m_bufferSize;
    bool m_allowPartialReads;
    Buffer m_readBuffer;
};

}

#endif
