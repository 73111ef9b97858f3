#ifndef __CATENA_READ_STREAM_H__
#define __CATENA_READ_STREAM_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <string>
#include <vector>

#include "stream.h"

namespace Catena {

/// @brief Fill @c buffer, calling read() as many times as it takes
/// @return Less than @c length only at EOF
size_t readInto(Stream &stream, void *buffer, size_t length);

/// @brief Read up to @c length bytes, stopping early only at EOF
/// @details
/// If the stream knows its size and position, @c length is first clamped to
/// what remains.
std::string readString(Stream &stream, size_t length = ~0);

/// Read until EOF
std::string readAll(Stream &stream);

/// @brief Read one line, including its terminating '\\n'
/// @details
/// At most @c limit bytes are returned; the last line of a stream may lack
/// a terminator.  Never reads past the end of the line: a stream that
/// supportsFind() is asked where the line ends, a seekable stream is read
/// ahead and then repositioned, and any other stream is read a byte at a
/// time.
/// @return An empty string at EOF
std::string readLine(Stream &stream, size_t limit = ~0);

/// @brief Read lines until EOF
/// @param hint Stop once this many bytes have been returned
std::vector<std::string> readLines(Stream &stream, size_t hint = ~0);

inline size_t readInto(Stream::ptr stream, void *buffer, size_t length)
{ return readInto(*stream.get(), buffer, length); }
inline std::string readString(Stream::ptr stream, size_t length = ~0)
{ return readString(*stream.get(), length); }
inline std::string readAll(Stream::ptr stream)
{ return readAll(*stream.get()); }
inline std::string readLine(Stream::ptr stream, size_t limit = ~0)
{ return readLine(*stream.get(), limit); }
inline std::vector<std::string> readLines(Stream::ptr stream,
    size_t hint = ~0)
{ return readLines(*stream.get(), hint); }

}

#endif
