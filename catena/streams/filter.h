#ifndef __CATENA_FILTER_STREAM_H__
#define __CATENA_FILTER_STREAM_H__
// Copyright (c) 2009 - Mozy, Inc.

#include "stream.h"

namespace Catena {

/// @brief A Stream layered on top of another one
/// @details
/// Everything except read() and write() is forwarded to parent().  A
/// derived class overrides at least one read() and one write() overload
/// (if it supports them), since the Stream defaults only convert between
/// the two.
class FilterStream : public Stream
{
public:
    typedef boost::shared_ptr<FilterStream> ptr;

    /// @param own Whether close() also closes @c parent
    FilterStream(Stream::ptr parent, bool own = true)
        : m_parent(parent),
          m_own(own)
    {
        CATENA_ASSERT(m_parent);
    }

    const Stream::ptr &parent() const { return m_parent; }
    bool ownsParent() const { return m_own; }

    bool supportsRead() { return m_parent->supportsRead(); }
    bool supportsWrite() { return m_parent->supportsWrite(); }
    bool supportsSeek() { return m_parent->supportsSeek(); }
    bool supportsTell() { return m_parent->supportsTell(); }
    bool supportsSize() { return m_parent->supportsSize(); }
    bool supportsTruncate() { return m_parent->supportsTruncate(); }
    bool supportsFind() { return m_parent->supportsFind(); }

    void close(CloseType type = BOTH)
    {
        if (m_own)
            m_parent->close(type);
    }
    long long seek(long long offset, Anchor anchor = BEGIN)
    { return m_parent->seek(offset, anchor); }
    long long size() { return m_parent->size(); }
    void truncate(long long size) { m_parent->truncate(size); }
    void flush(bool flushParent = true)
    {
        if (flushParent)
            m_parent->flush();
    }
    ptrdiff_t find(char delimiter, size_t sanitySize = ~0,
        bool throwIfNotFound = true)
    { return m_parent->find(delimiter, sanitySize, throwIfNotFound); }
    ptrdiff_t find(const std::string &delimiter, size_t sanitySize = ~0,
        bool throwIfNotFound = true)
    { return m_parent->find(delimiter, sanitySize, throwIfNotFound); }

private:
    Stream::ptr m_parent;
    bool m_own;
};

}

#endif
