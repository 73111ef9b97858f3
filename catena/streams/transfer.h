#ifndef __CATENA_TRANSFER_STREAM_H__
#define __CATENA_TRANSFER_STREAM_H__
// Copyright (c) 2009 - Mozy, Inc.

#include "stream.h"

namespace Catena {

/// How transferStream() treats running out of input
enum ExactLength
{
    /// EXACT when a length is given, UNTILEOF for ~0ull
    INFER,
    /// Throw UnexpectedEofException if @c src ends early
    EXACT,
    /// Stop quietly at EOF
    UNTILEOF
};

/// @brief Copy up to @c length bytes from @c src to @c dst
/// @details
/// Two buffers alternate, so the next chunk (transferstream.chunksize bytes)
/// is read while the previous one is written, concurrently if there is a
/// Scheduler to run them on.
/// @return How many bytes were copied
unsigned long long transferStream(Stream &src, Stream &dst,
    unsigned long long length = ~0ull, ExactLength exactLength = INFER);

inline unsigned long long transferStream(Stream::ptr src, Stream &dst,
    unsigned long long length = ~0ull, ExactLength exactLength = INFER)
{ return transferStream(*src, dst, length, exactLength); }
inline unsigned long long transferStream(Stream &src, Stream::ptr dst,
    unsigned long long length = ~0ull, ExactLength exactLength = INFER)
{ return transferStream(src, *dst, length, exactLength); }
inline unsigned long long transferStream(Stream::ptr src, Stream::ptr dst,
    unsigned long long length = ~0ull, ExactLength exactLength = INFER)
{ return transferStream(*src, *dst, length, exactLength); }

}

#endif
