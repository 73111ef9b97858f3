// Copyright (c) 2009 - Mozy, Inc.

#include "buffer.h"

#include <string.h>

#include <algorithm>
#include <ostream>

#include "catena/assert.h"
#include "catena/exception.h"

namespace Catena {

Buffer::Buffer()
: m_readIndex(0),
  m_writeIndex(0)
{}

Buffer::Buffer(const std::string &string)
: m_readIndex(0),
  m_writeIndex(0)
{
    copyIn(string);
}

Buffer::Buffer(const char *string)
: m_readIndex(0),
  m_writeIndex(0)
{
    copyIn(string);
}

Buffer::Buffer(const void *data, size_t length)
: m_readIndex(0),
  m_writeIndex(0)
{
    copyIn(data, length);
}

void
Buffer::compact()
{
    if (m_readIndex == 0)
        return;
    size_t available = readAvailable();
    if (available != 0)
        memmove(&m_storage[0], &m_storage[m_readIndex], available);
    m_readIndex = 0;
    m_writeIndex = available;
}

void
Buffer::reserve(size_t length)
{
    if (writeAvailable() >= length)
        return;
    compact();
    if (writeAvailable() >= length)
        return;
    size_t needed = m_writeIndex + length;
    // Grow geometrically so repeated small appends stay linear
    m_storage.resize(std::max(needed, m_storage.size() * 2));
}

void
Buffer::clear(bool clearWriteAvailableAsWell)
{
    m_readIndex = m_writeIndex = 0;
    if (clearWriteAvailableAsWell)
        std::vector<unsigned char>().swap(m_storage);
}

void
Buffer::produce(size_t length)
{
    CATENA_ASSERT(length <= writeAvailable());
    m_writeIndex += length;
}

void
Buffer::consume(size_t length)
{
    CATENA_ASSERT(length <= readAvailable());
    m_readIndex += length;
    if (m_readIndex == m_writeIndex)
        m_readIndex = m_writeIndex = 0;
}

void
Buffer::truncate(size_t length)
{
    CATENA_ASSERT(length <= readAvailable());
    m_writeIndex = m_readIndex + length;
}

const iovec
Buffer::readBuffer(size_t length) const
{
    CATENA_ASSERT(length <= readAvailable());
    iovec result;
    result.iov_base = length == 0 ? NULL :
        const_cast<unsigned char *>(&m_storage[m_readIndex]);
    result.iov_len = length;
    return result;
}

iovec
Buffer::writeBuffer(size_t length)
{
    reserve(length);
    iovec result;
    result.iov_base = length == 0 ? NULL : &m_storage[m_writeIndex];
    result.iov_len = length;
    return result;
}

void
Buffer::copyIn(const Buffer &buffer, size_t length)
{
    if (length == (size_t)~0)
        length = buffer.readAvailable();
    CATENA_ASSERT(length <= buffer.readAvailable());
    if (length == 0)
        return;
    if (&buffer == this) {
        // Self-append; the source moves when we reserve
        std::vector<unsigned char> copy(&m_storage[m_readIndex],
            &m_storage[m_readIndex] + length);
        copyIn(&copy[0], length);
        return;
    }
    copyIn(&buffer.m_storage[buffer.m_readIndex], length);
}

void
Buffer::copyIn(const void *data, size_t length)
{
    if (length == 0)
        return;
    iovec iov = writeBuffer(length);
    memcpy(iov.iov_base, data, length);
    produce(length);
}

void
Buffer::copyIn(const char *string)
{
    copyIn(string, strlen(string));
}

void
Buffer::copyIn(const std::string &string)
{
    copyIn(string.c_str(), string.size());
}

void
Buffer::copyOut(void *buffer, size_t length) const
{
    CATENA_ASSERT(length <= readAvailable());
    if (length != 0)
        memcpy(buffer, &m_storage[m_readIndex], length);
}

ptrdiff_t
Buffer::find(char delimiter, size_t length) const
{
    if (length == (size_t)~0)
        length = readAvailable();
    CATENA_ASSERT(length <= readAvailable());
    if (length == 0)
        return -1;

    const unsigned char *start = &m_storage[m_readIndex];
    const void *point = memchr(start, delimiter, length);
    if (point == NULL)
        return -1;
    return (const unsigned char *)point - start;
}

ptrdiff_t
Buffer::find(const std::string &string, size_t length) const
{
    if (length == (size_t)~0)
        length = readAvailable();
    CATENA_ASSERT(length <= readAvailable());
    CATENA_ASSERT(!string.empty());
    if (length < string.size())
        return -1;

    const unsigned char *start = &m_storage[m_readIndex];
    const unsigned char *end = start + length;
    const unsigned char *point = std::search(start, end,
        (const unsigned char *)string.c_str(),
        (const unsigned char *)string.c_str() + string.size());
    if (point == end)
        return -1;
    return point - start;
}

std::string
Buffer::toString() const
{
    if (readAvailable() == 0)
        return std::string();
    return std::string((const char *)&m_storage[m_readIndex], readAvailable());
}

std::string
Buffer::getDelimited(char delimiter, bool eofIsDelimiter, bool includeDelimiter)
{
    ptrdiff_t offset = find(delimiter);
    CATENA_ASSERT(offset >= -1);
    if (offset == -1 && !eofIsDelimiter)
        CATENA_THROW_EXCEPTION(UnexpectedEofException());
    eofIsDelimiter = offset == -1;
    if (offset == -1)
        offset = readAvailable();
    std::string result;
    result.resize(offset + (eofIsDelimiter ? 0 : (includeDelimiter ? 1 : 0)));
    if (!result.empty())
        copyOut(&result[0], result.size());
    consume(result.size());
    if (!eofIsDelimiter && !includeDelimiter)
        consume(1u);
    return result;
}

bool
Buffer::operator== (const Buffer &rhs) const
{
    if (rhs.readAvailable() != readAvailable())
        return false;
    if (readAvailable() == 0)
        return true;
    return memcmp(&m_storage[m_readIndex], &rhs.m_storage[rhs.m_readIndex],
        readAvailable()) == 0;
}

bool
Buffer::operator!= (const Buffer &rhs) const
{
    return !(*this == rhs);
}

bool
Buffer::operator== (const std::string &string) const
{
    if (string.size() != readAvailable())
        return false;
    if (string.empty())
        return true;
    return memcmp(&m_storage[m_readIndex], string.c_str(), string.size()) == 0;
}

bool
Buffer::operator!= (const std::string &string) const
{
    return !(*this == string);
}

bool
Buffer::operator== (const char *string) const
{
    return *this == std::string(string);
}

bool
Buffer::operator!= (const char *string) const
{
    return !(*this == string);
}

std::ostream &
operator <<(std::ostream &os, const Buffer &buffer)
{
    return os << buffer.toString();
}

}
