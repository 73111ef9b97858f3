#ifndef __CATENA_CONCATENATED_STREAM_H__
#define __CATENA_CONCATENATED_STREAM_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <string>
#include <vector>

#include "catena/exception.h"
#include "catena/fibersynchronization.h"
#include "length_probe.h"
#include "stream.h"

namespace Catena {

/// The length of one of the Streams given to a ConcatenatedStream could not
/// be determined; errinfo_source_index names which one
struct InitializationException : virtual StreamException {};
typedef boost::error_info<struct tag_source_index, size_t> errinfo_source_index;

/// @brief Presents an ordered list of seekable Streams as one seekable Stream
/// @details
/// The logical stream is the concatenation of every source's bytes, each
/// source contributing exactly the length measured for it by open().
/// Nothing is copied; each read() is a single read() on the source that
/// holds the current position, so a read never crosses a source boundary.
///
/// Every operation is serialized by one RecursiveFiberMutex, so a single
/// ConcatenatedStream may be shared by Fibers on any number of threads.
/// Waiting for that mutex needs a Scheduler: callers that may contend have
/// to run as Fibers on one (a WorkerPool, for instance).  A thread with no
/// Scheduler may only use the stream while nobody else does.
/// The sources are owned exclusively by the ConcatenatedStream; nothing
/// else may move their positions while it is open.
///
/// A source that turns out to be shorter than its measured length is
/// tolerated: the logical position is pulled back to what the source can
/// actually reach.  A source that is longer never contributes more than
/// its measured length.
class ConcatenatedStream : public Stream
{
public:
    typedef boost::shared_ptr<ConcatenatedStream> ptr;

public:
    /// @exception std::invalid_argument @c streams is empty
    ConcatenatedStream(const std::vector<Stream::ptr> &streams,
        const std::string &name = std::string(),
        const std::vector<LengthProbe::ptr> &probes = defaultLengthProbes());

    /// Construct and open() in one step
    static ptr create(const std::vector<Stream::ptr> &streams,
        const std::string &name = std::string());

    /// @brief Measure every source and make the stream usable
    /// @details
    /// The sources are measured concurrently with probeLength().  Calling
    /// open() on an already open stream does nothing.
    /// @exception InitializationException A source has no determinable
    /// length; the stream stays unopened
    /// @exception ClosedStreamException The stream has been closed
    void open();
    bool isOpen();
    bool closed();

    const std::string &name() const { return m_name; }

    /// True only when open and every source supports the capability
    bool supportsRead();
    bool supportsSeek();
    bool supportsTell();
    bool supportsSize();

    /// Closes every source concurrently.  Closing again does nothing.
    void close(CloseType type = BOTH);

    /// @brief Read from the source holding the current position
    /// @details
    /// At most one read() is made on one source.  Bytes the source returns
    /// beyond its measured length are discarded.  Returns 0 at the end of
    /// the logical stream.
    /// @exception ClosedStreamException
    /// @exception UnsupportedOperationException Not every source can read
    /// and seek
    size_t read(void *buffer, size_t length);
    /// Same as read(void *, size_t), into @c buffer's write region
    size_t read(Buffer &buffer, size_t length);

    /// @exception ClosedStreamException
    /// @exception UnsupportedOperationException Not every source can seek
    /// @exception std::invalid_argument Unknown @c anchor, or the resulting
    /// position would be negative
    /// @note seek(0, CURRENT) (and so tell()) never touches the sources
    long long seek(long long offset, Anchor anchor = BEGIN);

    /// Sum of the measured lengths of every source
    long long size();

    /// @name Introspection
    //@{
    size_t sourceCount() const { return m_sources.size(); }
    /// Measured length of each source
    std::vector<long long> lengths();
    /// Index of the source that holds the current position
    size_t currentSource();
    /// Position the current source reported after it was last repositioned
    long long currentSourceOffset();
    //@}

private:
    enum State {
        UNINITIALIZED,
        OPEN,
        CLOSED
    };

    struct Source
    {
        Source(Stream::ptr stream_)
            : stream(stream_), length(-1ll), readable(false), seekable(false)
        {}

        Stream::ptr stream;
        long long length;
        bool readable, seekable;
    };

    void checkOpen();
    void probe(Source &source);
    void resync(long long pos);

private:
    RecursiveFiberMutex m_mutex;
    std::string m_name;
    std::vector<LengthProbe::ptr> m_probes;
    std::vector<Source> m_sources;
    State m_state;
    bool m_readable, m_seekable;
    // false while a source may not be where m_offset says
    bool m_synced;
    long long m_size, m_pos, m_offset;
    size_t m_index;
};

}

#endif
