#ifndef __CATENA_TEST_STREAM_H__
#define __CATENA_TEST_STREAM_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <algorithm>

#include <boost/function.hpp>

#include "filter.h"

namespace Catena {

// This stream is for use in unit tests to force a parent stream to behave
// in unusual (but legal) ways: short reads, missing capabilities, or a size
// that does not agree with its contents
class TestStream : public FilterStream
{
public:
    typedef boost::shared_ptr<TestStream> ptr;

public:
    TestStream(Stream::ptr parent)
        : FilterStream(parent, true),
          m_maxReadSize(~0),
          m_declaredSize(-1ll),
          m_hideRead(false),
          m_hideSeek(false),
          m_hideSize(false),
          m_clampSeeks(false)
    {}

    size_t maxReadSize() const { return m_maxReadSize; }
    void maxReadSize(size_t max) { m_maxReadSize = max; }

    /// Report @c size from size() instead of the parent's size
    void declaredSize(long long size) { m_declaredSize = size; }

    void hideRead(bool hide) { m_hideRead = hide; }
    void hideSeek(bool hide) { m_hideSeek = hide; }
    void hideSize(bool hide) { m_hideSize = hide; }
    /// Seeks beyond the parent's real size land on its end instead
    void clampSeeks(bool clamp) { m_clampSeeks = clamp; }

    void onClose(boost::function<void (CloseType)> dg)
    { m_onClose = dg; }
    void onRead(boost::function<void ()> dg)
    { m_onRead = dg; }
    void onSeek(boost::function<void ()> dg)
    { m_onSeek = dg; }

    bool supportsRead() { return !m_hideRead && parent()->supportsRead(); }
    bool supportsSeek() { return !m_hideSeek && parent()->supportsSeek(); }
    bool supportsTell() { return supportsSeek(); }
    bool supportsSize()
    { return !m_hideSize && (m_declaredSize != -1ll || parent()->supportsSize()); }
    bool supportsFind() { return false; }

    void close(CloseType type = BOTH)
    {
        if (m_onClose)
            m_onClose(type);
        FilterStream::close(type);
    }

    using FilterStream::read;
    size_t read(Buffer &b, size_t len)
    {
        if (m_onRead)
            m_onRead();
        return parent()->read(b, std::min(len, m_maxReadSize));
    }

    long long seek(long long offset, Anchor anchor = BEGIN)
    {
        if (m_onSeek)
            m_onSeek();
        if (m_clampSeeks && anchor == BEGIN) {
            long long realSize = parent()->size();
            if (offset > realSize)
                offset = realSize;
        }
        return parent()->seek(offset, anchor);
    }

    long long size()
    {
        if (m_declaredSize != -1ll)
            return m_declaredSize;
        return parent()->size();
    }

private:
    size_t m_maxReadSize;
    long long m_declaredSize;
    bool m_hideRead, m_hideSeek, m_hideSize, m_clampSeeks;
    boost::function<void (CloseType)> m_onClose;
    boost::function<void ()> m_onRead, m_onSeek;
};

}

#endif
