#ifndef __CATENA_LENGTH_PROBE_H__
#define __CATENA_LENGTH_PROBE_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <vector>

#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>

#include "stream.h"

namespace Catena {

/// @brief Determines the total byte length of a Stream
/// @details
/// Each LengthProbe knows one way of measuring a Stream, and says up front
/// whether that way applies to a given Stream.  Probes are tried in rank
/// order by probeLength() until one produces a length.
class LengthProbe : boost::noncopyable
{
public:
    typedef boost::shared_ptr<LengthProbe> ptr;

public:
    virtual ~LengthProbe() {}

    virtual const char *name() const = 0;
    /// @return If length() knows how to measure @c stream
    virtual bool appliesTo(Stream &stream) = 0;
    /// @return The length of @c stream, or -1 if it cannot be determined
    /// @pre appliesTo(stream)
    virtual long long length(Stream &stream) = 0;
};

/// Stream::size(), for Streams that supportsSize()
class SizeLengthProbe : public LengthProbe
{
public:
    const char *name() const { return "size"; }
    bool appliesTo(Stream &stream);
    long long length(Stream &stream);
};

/// Length of the Buffer behind a MemoryStream
class BufferLengthProbe : public LengthProbe
{
public:
    const char *name() const { return "buffer"; }
    bool appliesTo(Stream &stream);
    long long length(Stream &stream);
};

/// fstat() of the descriptor behind an FDStream; only regular files have a
/// meaningful size, so anything else is indeterminate
class DescriptorLengthProbe : public LengthProbe
{
public:
    const char *name() const { return "descriptor"; }
    bool appliesTo(Stream &stream);
    long long length(Stream &stream);
};

/// Seek to the end and back again
class SeekLengthProbe : public LengthProbe
{
public:
    const char *name() const { return "seek"; }
    bool appliesTo(Stream &stream);
    long long length(Stream &stream);
};

/// size, buffer, descriptor, seek; in that order
const std::vector<LengthProbe::ptr> &defaultLengthProbes();

/// @brief Try each of @c probes in turn
/// @details
/// A probe that does not apply is skipped.  A probe that applies but fails,
/// either by returning -1 or by throwing an I/O error, is logged and the next
/// probe is tried.
/// @return The first length found, or -1 if no probe succeeded
long long probeLength(Stream &stream,
    const std::vector<LengthProbe::ptr> &probes = defaultLengthProbes());

}

#endif
