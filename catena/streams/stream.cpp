// Copyright (c) 2009 - Mozy, Inc.

#include "stream.h"

#include <string.h>

#include "catena/exception.h"

namespace Catena {

static void checkSupported(bool supported)
{
    if (!supported)
        CATENA_THROW_EXCEPTION(UnsupportedOperationException());
}

size_t
Stream::read(void *buffer, size_t length)
{
    checkSupported(supportsRead());
    Buffer staging;
    size_t result = read(staging, length);
    CATENA_ASSERT(result <= length);
    staging.copyOut(buffer, result);
    return result;
}

size_t
Stream::read(Buffer &buffer, size_t length)
{
    checkSupported(supportsRead());
    iovec target = buffer.writeBuffer(length);
    size_t result = read(target.iov_base, target.iov_len);
    buffer.produce(result);
    return result;
}

size_t
Stream::write(const void *buffer, size_t length)
{
    checkSupported(supportsWrite());
    Buffer staging;
    staging.copyIn(buffer, length);
    return write(staging, length);
}

size_t
Stream::write(const Buffer &buffer, size_t length)
{
    checkSupported(supportsWrite());
    const iovec source = buffer.readBuffer(length);
    return write(source.iov_base, source.iov_len);
}

size_t
Stream::write(const char *string)
{
    return write((const void *)string, strlen(string));
}

long long
Stream::seek(long long offset, Anchor anchor)
{
    CATENA_THROW_EXCEPTION(UnsupportedOperationException());
}

long long
Stream::size()
{
    CATENA_THROW_EXCEPTION(UnsupportedOperationException());
}

void
Stream::truncate(long long size)
{
    CATENA_THROW_EXCEPTION(UnsupportedOperationException());
}

ptrdiff_t
Stream::find(char delimiter, size_t sanitySize, bool throwIfNotFound)
{
    CATENA_THROW_EXCEPTION(UnsupportedOperationException());
}

ptrdiff_t
Stream::find(const std::string &delimiter, size_t sanitySize,
    bool throwIfNotFound)
{
    CATENA_THROW_EXCEPTION(UnsupportedOperationException());
}

std::string
Stream::getDelimited(char delimiter, bool eofIsDelimiter,
    bool includeDelimiter)
{
    return readDelimited(find(delimiter, ~0, !eofIsDelimiter), 1u,
        includeDelimiter);
}

std::string
Stream::getDelimited(const std::string &delimiter, bool eofIsDelimiter,
    bool includeDelimiter)
{
    return readDelimited(find(delimiter, ~0, !eofIsDelimiter),
        delimiter.size(), includeDelimiter);
}

// offset is what find() returned; negative means EOF came first
std::string
Stream::readDelimited(ptrdiff_t offset, size_t delimiterLength,
    bool includeDelimiter)
{
    bool found = offset >= 0;
    size_t length = found ? (size_t)offset + delimiterLength :
        (size_t)(-offset - 1);
    std::string result(length, '\0');
    size_t filled = 0;
    while (filled < length) {
        size_t got = read(&result[filled], length - filled);
        if (got == 0)
            CATENA_THROW_EXCEPTION(UnexpectedEofException());
        filled += got;
    }
    if (found && !includeDelimiter)
        result.resize(length - delimiterLength);
    return result;
}

}
