#ifndef __CATENA_BUFFER_H__
#define __CATENA_BUFFER_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <stddef.h>
#include <sys/uio.h>

#include <iosfwd>
#include <string>
#include <vector>

namespace Catena {

/// @brief A growable byte buffer with separate read and write regions
/// @details
/// Data is appended at the write end with writeBuffer() + produce() or
/// copyIn(), and removed from the read end with copyOut() + consume().
/// Storage is a single contiguous region; consumed space is reclaimed
/// the next time more room is reserved.
class Buffer
{
public:
    Buffer();
    Buffer(const std::string &string);
    Buffer(const char *string);
    Buffer(const void *data, size_t length);

    /// Number of bytes that can be read
    size_t readAvailable() const { return m_writeIndex - m_readIndex; }
    /// Number of bytes that can be written without reallocating
    size_t writeAvailable() const { return m_storage.size() - m_writeIndex; }

    /// Ensure at least @c length bytes can be written
    void reserve(size_t length);
    /// Release all data and storage
    void clear(bool clearWriteAvailableAsWell = true);

    /// Mark @c length bytes of the write region as readable data
    /// @pre @c length <= writeAvailable()
    void produce(size_t length);
    /// Discard @c length bytes from the front of the read region
    /// @pre @c length <= readAvailable()
    void consume(size_t length);
    /// Discard everything after the first @c length readable bytes
    /// @pre @c length <= readAvailable()
    void truncate(size_t length);

    /// Contiguous view of the first @c length readable bytes
    const iovec readBuffer(size_t length) const;
    /// Contiguous region of @c length writable bytes; reserves as needed
    iovec writeBuffer(size_t length);

    void copyIn(const Buffer &buffer, size_t length = ~0);
    void copyIn(const void *data, size_t length);
    void copyIn(const char *string);
    void copyIn(const std::string &string);

    /// Copy (without consuming) the first @c length readable bytes
    void copyOut(void *buffer, size_t length) const;
    void copyOut(Buffer &buffer, size_t length) const
    { buffer.copyIn(*this, length); }

    /// @return Offset of @c delimiter within the first @c length readable
    /// bytes, or -1 if it is not there
    ptrdiff_t find(char delimiter, size_t length = ~0) const;
    ptrdiff_t find(const std::string &string, size_t length = ~0) const;

    std::string toString() const;
    std::string getDelimited(char delimiter, bool eofIsDelimiter = true,
        bool includeDelimiter = true);

    bool operator== (const Buffer &rhs) const;
    bool operator!= (const Buffer &rhs) const;
    bool operator== (const std::string &string) const;
    bool operator!= (const std::string &string) const;
    bool operator== (const char *string) const;
    bool operator!= (const char *string) const;

private:
    void compact();

private:
    std::vector<unsigned char> m_storage;
    size_t m_readIndex, m_writeIndex;
};

std::ostream &operator <<(std::ostream &os, const Buffer &buffer);

}

#endif
