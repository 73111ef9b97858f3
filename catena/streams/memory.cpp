// Copyright (c) 2009 - Mozy, Inc.

#include "memory.h"

#include <string.h>

#include <algorithm>
#include <stdexcept>

#include "catena/exception.h"

namespace Catena {

MemoryStream::MemoryStream()
    : m_offset(0)
{}

MemoryStream::MemoryStream(const Buffer &contents)
    : m_buffer(contents),
      m_offset(0)
{}

size_t
MemoryStream::readAvailable() const
{
    size_t size = m_buffer.readAvailable();
    return m_offset < size ? size - m_offset : 0;
}

size_t
MemoryStream::read(void *buffer, size_t length)
{
    size_t todo = std::min(length, readAvailable());
    if (todo > 0) {
        const unsigned char *data = static_cast<const unsigned char *>(
            m_buffer.readBuffer(m_offset + todo).iov_base);
        memcpy(buffer, data + m_offset, todo);
        m_offset += todo;
    }
    return todo;
}

size_t
MemoryStream::read(Buffer &buffer, size_t length)
{
    size_t todo = std::min(length, readAvailable());
    iovec target = buffer.writeBuffer(todo);
    size_t result = read(target.iov_base, todo);
    buffer.produce(result);
    return result;
}

size_t
MemoryStream::write(const void *buffer, size_t length)
{
    if (length == 0)
        return 0;
    if (m_offset + length > m_buffer.readAvailable())
        truncate((long long)(m_offset + length));
    unsigned char *data = static_cast<unsigned char *>(
        m_buffer.readBuffer(m_offset + length).iov_base);
    memcpy(data + m_offset, buffer, length);
    m_offset += length;
    return length;
}

size_t
MemoryStream::write(const Buffer &buffer, size_t length)
{
    CATENA_ASSERT(length <= buffer.readAvailable());
    return write(buffer.readBuffer(length).iov_base, length);
}

long long
MemoryStream::seek(long long offset, Anchor anchor)
{
    long long base;
    switch (anchor) {
        case BEGIN:
            base = 0;
            break;
        case CURRENT:
            base = (long long)m_offset;
            break;
        case END:
            base = (long long)m_buffer.readAvailable();
            break;
        default:
            CATENA_THROW_EXCEPTION(std::invalid_argument("anchor"));
    }
    long long target = base + offset;
    if (target < 0)
        CATENA_THROW_EXCEPTION(std::invalid_argument("offset"));
    if ((unsigned long long)target > (size_t)~0)
        CATENA_THROW_EXCEPTION(std::invalid_argument("offset"));
    m_offset = (size_t)target;
    return target;
}

long long
MemoryStream::size()
{
    return (long long)m_buffer.readAvailable();
}

void
MemoryStream::truncate(long long size)
{
    if (size < 0 || (unsigned long long)size > (size_t)~0)
        CATENA_THROW_EXCEPTION(std::invalid_argument("size"));
    size_t current = m_buffer.readAvailable();
    size_t wanted = (size_t)size;
    if (wanted <= current) {
        m_buffer.truncate(wanted);
        return;
    }
    size_t padding = wanted - current;
    memset(m_buffer.writeBuffer(padding).iov_base, 0, padding);
    m_buffer.produce(padding);
}

namespace {

// Searches the unread part of a MemoryStream's Buffer
struct Window
{
    Window(const Buffer &buffer, size_t offset, size_t length)
        : start(length == 0 ? NULL : static_cast<const unsigned char *>(
              buffer.readBuffer(offset + length).iov_base) + offset),
          length(length)
    {}

    ptrdiff_t find(char delimiter) const
    {
        if (length == 0)
            return -1;
        const void *found = memchr(start, delimiter, length);
        return found ? (const unsigned char *)found - start : -1;
    }

    ptrdiff_t find(const std::string &delimiter) const
    {
        if (length < delimiter.size())
            return -1;
        const unsigned char *end = start + length;
        const unsigned char *found = std::search(start, end,
            (const unsigned char *)delimiter.data(),
            (const unsigned char *)delimiter.data() + delimiter.size());
        return found == end ? -1 : found - start;
    }

    const unsigned char *start;
    size_t length;
};

}

template <class Delimiter>
static ptrdiff_t
findIn(const Buffer &buffer, size_t offset, size_t available,
    const Delimiter &delimiter, size_t sanitySize, bool throwIfNotFound)
{
    Window window(buffer, offset, std::min(sanitySize, available));
    ptrdiff_t found = window.find(delimiter);
    if (found >= 0)
        return found;
    if (throwIfNotFound) {
        if (sanitySize < available)
            CATENA_THROW_EXCEPTION(BufferOverflowException());
        CATENA_THROW_EXCEPTION(UnexpectedEofException());
    }
    return -(ptrdiff_t)window.length - 1;
}

ptrdiff_t
MemoryStream::find(char delimiter, size_t sanitySize, bool throwIfNotFound)
{
    return findIn(m_buffer, m_offset, readAvailable(), delimiter, sanitySize,
        throwIfNotFound);
}

ptrdiff_t
MemoryStream::find(const std::string &delimiter, size_t sanitySize,
    bool throwIfNotFound)
{
    CATENA_ASSERT(!delimiter.empty());
    return findIn(m_buffer, m_offset, readAvailable(), delimiter, sanitySize,
        throwIfNotFound);
}

}
