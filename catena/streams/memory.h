#ifndef __CATENA_MEMORY_STREAM_H__
#define __CATENA_MEMORY_STREAM_H__
// Copyright (c) 2009 - Mozy, Inc.

#include "buffer.h"
#include "stream.h"

namespace Catena {

/// @brief Seekable, growable Stream held entirely in a Buffer
/// @details
/// The position may be moved past the end; reading there returns EOF, and
/// writing there first pads the gap with zeroes.
class MemoryStream : public Stream
{
public:
    typedef boost::shared_ptr<MemoryStream> ptr;

    MemoryStream();
    /// Starts at position 0 over a copy of @c contents
    MemoryStream(const Buffer &contents);

    bool supportsRead() { return true; }
    bool supportsWrite() { return true; }
    bool supportsSeek() { return true; }
    bool supportsSize() { return true; }
    bool supportsTruncate() { return true; }
    bool supportsFind() { return true; }

    size_t read(Buffer &buffer, size_t length);
    size_t read(void *buffer, size_t length);
    using Stream::write;
    size_t write(const Buffer &buffer, size_t length);
    size_t write(const void *buffer, size_t length);
    long long seek(long long offset, Anchor anchor = BEGIN);
    long long size();
    void truncate(long long size);
    ptrdiff_t find(char delimiter, size_t sanitySize = ~0,
        bool throwIfNotFound = true);
    ptrdiff_t find(const std::string &delimiter, size_t sanitySize = ~0,
        bool throwIfNotFound = true);

    /// The whole contents, independent of the position
    const Buffer &buffer() const { return m_buffer; }

private:
    size_t readAvailable() const;

    Buffer m_buffer;
    size_t m_offset;
};

}

#endif
