#ifndef __CATENA_STREAM_H__
#define __CATENA_STREAM_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <stddef.h>

#include <string>

#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>

#include "catena/assert.h"
#include "buffer.h"

namespace Catena {

/// @brief A source and/or sink of bytes, possibly with a position
/// @details
/// Each capability is advertised by a supports*() query; the matching
/// operation throws UnsupportedOperationException when the query says no.
/// close() and flush() are safe on every Stream.
///
/// A Stream is only safe to use from one Fiber at a time unless the derived
/// class says otherwise.
class Stream : boost::noncopyable
{
public:
    typedef boost::shared_ptr<Stream> ptr;

    enum CloseType {
        NONE  = 0x00,
        READ  = 0x01,
        WRITE = 0x02,
        BOTH  = READ | WRITE
    };

    /// Origin for seek()
    enum Anchor {
        BEGIN,
        CURRENT,
        END
    };

    virtual ~Stream() {}

    virtual bool supportsRead() { return false; }
    virtual bool supportsWrite() { return false; }
    virtual bool supportsSeek() { return false; }
    /// Defaults to supportsSeek()
    virtual bool supportsTell() { return supportsSeek(); }
    virtual bool supportsSize() { return false; }
    virtual bool supportsTruncate() { return false; }
    virtual bool supportsFind() { return false; }

    /// May be called any number of times
    virtual void close(CloseType type = BOTH) {}

    /// @brief Read up to @c length bytes
    /// @details
    /// Returning fewer bytes than asked for says nothing about EOF; only a
    /// return of 0 (for a non-zero @c length) means EOF.
    ///
    /// Each overload is implemented in terms of the other, so a derived
    /// class must override at least one of them.
    virtual size_t read(void *buffer, size_t length);
    /// Appends to @c buffer
    virtual size_t read(Buffer &buffer, size_t length);

    /// @brief Write up to @c length bytes
    /// @details Never returns 0.  As with read(), override at least one.
    virtual size_t write(const void *buffer, size_t length);
    /// Writes from the front of @c buffer without consuming it
    virtual size_t write(const Buffer &buffer, size_t length);
    size_t write(const char *string);

    /// @return The new position
    /// @exception std::invalid_argument The position would be negative
    virtual long long seek(long long offset, Anchor anchor = BEGIN);
    long long tell() { return seek(0, CURRENT); }

    virtual long long size();
    virtual void truncate(long long size);
    /// @param flushParent Whether a filter also flushes the Stream it wraps
    virtual void flush(bool flushParent = true) {}

    /// @brief Look ahead for @c delimiter without consuming anything
    /// @return The offset of the delimiter from the current position.  If
    /// @c throwIfNotFound is false and the search fails, -(available + 1),
    /// where available is how much could be examined.
    /// @exception BufferOverflowException Not found within @c sanitySize
    /// bytes
    /// @exception UnexpectedEofException Not found before EOF
    virtual ptrdiff_t find(char delimiter, size_t sanitySize = ~0,
        bool throwIfNotFound = true);
    virtual ptrdiff_t find(const std::string &delimiter,
        size_t sanitySize = ~0, bool throwIfNotFound = true);

    /// @brief find() followed by a read() of everything up to the delimiter
    /// @param eofIsDelimiter Return the rest of the stream if EOF comes
    /// first, instead of throwing
    std::string getDelimited(char delimiter = '\n',
        bool eofIsDelimiter = false, bool includeDelimiter = true);
    std::string getDelimited(const std::string &delimiter,
        bool eofIsDelimiter = false, bool includeDelimiter = true);

private:
    std::string readDelimited(ptrdiff_t offset, size_t delimiterLength,
        bool includeDelimiter);
};

}

#endif
