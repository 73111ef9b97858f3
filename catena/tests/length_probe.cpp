// Copyright (c) 2009 - Mozy, Inc.

#include <stdlib.h>
#include <unistd.h>

#include "catena/exception.h"
#include "catena/streams/concatenated.h"
#include "catena/streams/fd.h"
#include "catena/streams/file.h"
#include "catena/streams/length_probe.h"
#include "catena/streams/memory.h"
#include "catena/streams/read.h"
#include "catena/streams/test.h"
#include "catena/test/test.h"

using namespace Catena;

namespace {

// Claims a size it cannot produce
class BrokenSizeStream : public TestStream
{
public:
    BrokenSizeStream(Stream::ptr parent) : TestStream(parent) {}

    bool supportsSize() { return true; }
    long long size() { CATENA_THROW_EXCEPTION(BadHandleException()); }
};

class FixedProbe : public LengthProbe
{
public:
    FixedProbe(long long length) : m_length(length), m_calls(0) {}

    const char *name() const { return "fixed"; }
    bool appliesTo(Stream &stream) { return true; }
    long long length(Stream &stream) { ++m_calls; return m_length; }

    int calls() const { return m_calls; }

private:
    long long m_length;
    int m_calls;
};

}

static std::string tempfilename()
{
    std::string result("/tmp/catenaXXXXXX");
    int fd = mkstemp(&result[0]);
    if (fd < 0)
        CATENA_THROW_EXCEPTION_FROM_LAST_ERROR_API("mkstemp");
    close(fd);
    return result;
}

static std::string writeTempFile(const std::string &contents)
{
    std::string path = tempfilename();
    FileStream stream(path, FileStream::WRITE, FileStream::OVERWRITE);
    if (!contents.empty())
        stream.write(contents.c_str(), contents.size());
    stream.close();
    return path;
}

CATENA_UNITTEST(LengthProbe, size)
{
    MemoryStream stream(Buffer("hello"));
    SizeLengthProbe probe;
    CATENA_TEST_ASSERT(probe.appliesTo(stream));
    CATENA_TEST_ASSERT_EQUAL(probe.length(stream), 5);

    TestStream::ptr hidden(new TestStream(Stream::ptr(
        new MemoryStream(Buffer("hello")))));
    hidden->hideSize(true);
    CATENA_TEST_ASSERT(!probe.appliesTo(*hidden));
}

CATENA_UNITTEST(LengthProbe, buffer)
{
    MemoryStream stream(Buffer("hello world"));
    stream.seek(6);
    BufferLengthProbe probe;
    CATENA_TEST_ASSERT(probe.appliesTo(stream));
    CATENA_TEST_ASSERT_EQUAL(probe.length(stream), 11);
    // Measuring does not move the stream
    CATENA_TEST_ASSERT_EQUAL(stream.tell(), 6);

    TestStream wrapped(Stream::ptr(new MemoryStream(Buffer("hello"))));
    CATENA_TEST_ASSERT(!probe.appliesTo(wrapped));
}

CATENA_UNITTEST(LengthProbe, seek)
{
    MemoryStream stream(Buffer("hello world"));
    stream.seek(3);
    SeekLengthProbe probe;
    CATENA_TEST_ASSERT(probe.appliesTo(stream));
    CATENA_TEST_ASSERT_EQUAL(probe.length(stream), 11);
    CATENA_TEST_ASSERT_EQUAL(stream.tell(), 3);

    TestStream unseekable(Stream::ptr(new MemoryStream(Buffer("hello"))));
    unseekable.hideSeek(true);
    CATENA_TEST_ASSERT(!probe.appliesTo(unseekable));
}

CATENA_UNITTEST(LengthProbe, descriptorRegularFile)
{
    std::string path = writeTempFile("0123456789");
    try {
        FileStream stream(path, FileStream::READ);
        DescriptorLengthProbe probe;
        CATENA_TEST_ASSERT(probe.appliesTo(stream));
        CATENA_TEST_ASSERT_EQUAL(probe.length(stream), 10);
        CATENA_TEST_ASSERT_EQUAL(probeLength(stream), 10);

        MemoryStream memory;
        CATENA_TEST_ASSERT(!probe.appliesTo(memory));
    } catch (...) {
        unlink(path.c_str());
        throw;
    }
    unlink(path.c_str());
}

CATENA_UNITTEST(LengthProbe, descriptorPipe)
{
    int fds[2];
    if (pipe(fds))
        CATENA_THROW_EXCEPTION_FROM_LAST_ERROR_API("pipe");
    FDStream readEnd(fds[0]);
    FDStream writeEnd(fds[1]);
    DescriptorLengthProbe probe;
    CATENA_TEST_ASSERT(probe.appliesTo(readEnd));
    // A pipe has no length until it is drained
    CATENA_TEST_ASSERT_EQUAL(probe.length(readEnd), -1);
}

CATENA_UNITTEST(LengthProbe, descriptorClosed)
{
    std::string path = writeTempFile("abc");
    FileStream stream(path, FileStream::READ,
        (FileStream::CreateFlags)(FileStream::OPEN |
        FileStream::DELETE_ON_CLOSE));
    stream.close();
    DescriptorLengthProbe probe;
    CATENA_TEST_ASSERT(!probe.appliesTo(stream));
    CATENA_TEST_ASSERT_EQUAL(probeLength(stream), -1);
}

CATENA_UNITTEST(LengthProbe, failingProbeFallsThrough)
{
    // The size probe throws, the buffer and descriptor probes do not apply,
    // and the seek probe measures it
    BrokenSizeStream stream(Stream::ptr(new MemoryStream(Buffer("hello"))));
    CATENA_TEST_ASSERT_EQUAL(probeLength(stream), 5);
    CATENA_TEST_ASSERT_EQUAL(stream.tell(), 0);
}

CATENA_UNITTEST(LengthProbe, negativeProbeFallsThrough)
{
    boost::shared_ptr<FixedProbe> unknown(new FixedProbe(-1));
    boost::shared_ptr<FixedProbe> known(new FixedProbe(42));
    std::vector<LengthProbe::ptr> probes;
    probes.push_back(unknown);
    probes.push_back(known);
    MemoryStream stream;
    CATENA_TEST_ASSERT_EQUAL(probeLength(stream, probes), 42);
    CATENA_TEST_ASSERT_EQUAL(unknown->calls(), 1);
    CATENA_TEST_ASSERT_EQUAL(known->calls(), 1);
}

CATENA_UNITTEST(LengthProbe, firstAnswerWins)
{
    boost::shared_ptr<FixedProbe> first(new FixedProbe(0));
    boost::shared_ptr<FixedProbe> second(new FixedProbe(42));
    std::vector<LengthProbe::ptr> probes;
    probes.push_back(first);
    probes.push_back(second);
    MemoryStream stream(Buffer("hello"));
    CATENA_TEST_ASSERT_EQUAL(probeLength(stream, probes), 0);
    CATENA_TEST_ASSERT_EQUAL(second->calls(), 0);
}

CATENA_UNITTEST(LengthProbe, nothingApplies)
{
    TestStream stream(Stream::ptr(new MemoryStream(Buffer("hello"))));
    stream.hideSize(true);
    stream.hideSeek(true);
    CATENA_TEST_ASSERT_EQUAL(probeLength(stream), -1);
    CATENA_TEST_ASSERT_EQUAL(probeLength(stream,
        std::vector<LengthProbe::ptr>()), -1);
}

CATENA_UNITTEST(LengthProbe, concatenatedFiles)
{
    std::string first = writeTempFile("first\n");
    std::string second = writeTempFile("");
    std::string third = writeTempFile("third\nline");
    try {
        std::vector<Stream::ptr> streams;
        streams.push_back(Stream::ptr(new FileStream(first, FileStream::READ)));
        streams.push_back(Stream::ptr(new FileStream(second, FileStream::READ)));
        streams.push_back(Stream::ptr(new MemoryStream(Buffer("memory\n"))));
        streams.push_back(Stream::ptr(new FileStream(third, FileStream::READ)));
        ConcatenatedStream stream(streams, "files");
        stream.open();
        CATENA_TEST_ASSERT_EQUAL(stream.size(), 23);
        std::vector<std::string> lines = readLines(stream);
        CATENA_TEST_ASSERT_EQUAL(lines.size(), 4u);
        CATENA_TEST_ASSERT_EQUAL(lines[0], "first\n");
        CATENA_TEST_ASSERT_EQUAL(lines[1], "memory\n");
        CATENA_TEST_ASSERT_EQUAL(lines[2], "third\n");
        CATENA_TEST_ASSERT_EQUAL(lines[3], "line");
        CATENA_TEST_ASSERT_EQUAL(stream.seek(-4, Stream::END), 19);
        CATENA_TEST_ASSERT_EQUAL(stream.currentSource(), 3u);
        CATENA_TEST_ASSERT_EQUAL(readAll(stream), "line");
        stream.close();
    } catch (...) {
        unlink(first.c_str());
        unlink(second.c_str());
        unlink(third.c_str());
        throw;
    }
    unlink(first.c_str());
    unlink(second.c_str());
    unlink(third.c_str());
}

CATENA_UNITTEST(LengthProbe, pipeCannotBeConcatenated)
{
    int fds[2];
    if (pipe(fds))
        CATENA_THROW_EXCEPTION_FROM_LAST_ERROR_API("pipe");
    // FDStream claims a size for anything, so leave the size probe out
    std::vector<LengthProbe::ptr> probes;
    probes.push_back(LengthProbe::ptr(new BufferLengthProbe()));
    probes.push_back(LengthProbe::ptr(new DescriptorLengthProbe()));
    FDStream::ptr writeEnd(new FDStream(fds[1]));
    std::vector<Stream::ptr> streams;
    streams.push_back(Stream::ptr(new MemoryStream(Buffer("abc"))));
    streams.push_back(Stream::ptr(new FDStream(fds[0])));
    ConcatenatedStream stream(streams, "pipe", probes);
    try {
        stream.open();
        CATENA_TEST_ASSERT(false);
    } catch (InitializationException &ex) {
        const size_t *index = boost::get_error_info<errinfo_source_index>(ex);
        CATENA_TEST_ASSERT(index);
        CATENA_TEST_ASSERT_EQUAL(*index, 1u);
    }
}
