// Copyright (c) 2009 - Mozy, Inc.

#include "catena/config.h"
#include "catena/streams/buffered.h"
#include "catena/streams/concatenated.h"
#include "catena/streams/memory.h"
#include "catena/streams/read.h"
#include "catena/streams/test.h"
#include "catena/test/test.h"

using namespace Catena;

static ConcatenatedStream::ptr example()
{
    std::vector<Stream::ptr> streams;
    streams.push_back(Stream::ptr(new MemoryStream(Buffer("test"))));
    streams.push_back(Stream::ptr(new MemoryStream(Buffer(" KURWA\n"))));
    streams.push_back(Stream::ptr(new MemoryStream(Buffer("kek"))));
    return ConcatenatedStream::create(streams, "example");
}

// Line reading never consumes more than the line, whichever way it finds
// the end of it
static void checkReadLine(Stream::ptr stream)
{
    CATENA_TEST_ASSERT_EQUAL(readLine(stream, 6), "test K");
    CATENA_TEST_ASSERT_EQUAL(readLine(stream, 6), "URWA\n");
    CATENA_TEST_ASSERT_EQUAL(readLine(stream, 6), "kek");
    CATENA_TEST_ASSERT_EQUAL(readLine(stream, 6), "");
}

static void checkReadLineThenString(Stream::ptr stream)
{
    CATENA_TEST_ASSERT_EQUAL(readLine(stream), "test KURWA\n");
    CATENA_TEST_ASSERT_EQUAL(readString(stream), "kek");
    CATENA_TEST_ASSERT_EQUAL(readLine(stream), "");
}

CATENA_UNITTEST(ReadStream, readInto)
{
    ConcatenatedStream::ptr stream = example();
    char buffer[10];
    CATENA_TEST_ASSERT_EQUAL(readInto(stream, buffer, 10), 10u);
    CATENA_TEST_ASSERT_EQUAL(std::string(buffer, 10), "test KURWA");
    CATENA_TEST_ASSERT_EQUAL(readInto(stream, buffer, 10), 4u);
    CATENA_TEST_ASSERT_EQUAL(std::string(buffer, 4), "\nkek");
    CATENA_TEST_ASSERT_EQUAL(readInto(stream, buffer, 10), 0u);
}

CATENA_UNITTEST(ReadStream, readString)
{
    ConcatenatedStream::ptr stream = example();
    stream->seek(3);
    CATENA_TEST_ASSERT_EQUAL(readString(stream, 5), "t KUR");
    CATENA_TEST_ASSERT_EQUAL(stream->tell(), 8);
    CATENA_TEST_ASSERT_EQUAL(readString(stream), "WA\nkek");
    CATENA_TEST_ASSERT_EQUAL(readString(stream), "");
    CATENA_TEST_ASSERT_EQUAL(readString(stream, 0), "");

    // Nothing is left past the end, whatever was asked for
    stream->seek(20);
    CATENA_TEST_ASSERT_EQUAL(readString(stream, 5), "");
}

CATENA_UNITTEST(ReadStream, readStringUnsized)
{
    TestStream::ptr stream(new TestStream(example()));
    stream->hideSeek(true);
    stream->hideSize(true);
    CATENA_TEST_ASSERT_EQUAL(readString(stream, 5), "test ");
    CATENA_TEST_ASSERT_EQUAL(readString(stream, 100), "KURWA\nkek");
}

CATENA_UNITTEST(ReadStream, readAll)
{
    ConcatenatedStream::ptr stream = example();
    CATENA_TEST_ASSERT_EQUAL(readAll(stream), "test KURWA\nkek");
    CATENA_TEST_ASSERT_EQUAL(readAll(stream), "");
    stream->seek(-3, Stream::END);
    CATENA_TEST_ASSERT_EQUAL(readAll(stream), "kek");
}

CATENA_UNITTEST(ReadStream, readLineSeekable)
{
    ConcatenatedStream::ptr stream = example();
    checkReadLine(stream);
    stream->seek(0);
    checkReadLineThenString(stream);
}

CATENA_UNITTEST(ReadStream, readLineSeekableSmallChunks)
{
    ConfigVar<size_t>::ptr chunkSize = boost::dynamic_pointer_cast<
        ConfigVar<size_t> >(Config::lookup("stream.readline.chunksize"));
    CATENA_TEST_ASSERT(chunkSize);
    size_t previous = chunkSize->val();
    chunkSize->val(2);
    try {
        ConcatenatedStream::ptr stream = example();
        checkReadLine(stream);
        stream->seek(0);
        checkReadLineThenString(stream);
    } catch (...) {
        chunkSize->val(previous);
        throw;
    }
    chunkSize->val(previous);
}

CATENA_UNITTEST(ReadStream, readLineUnseekable)
{
    TestStream::ptr stream(new TestStream(example()));
    stream->hideSeek(true);
    CATENA_TEST_ASSERT(!stream->supportsFind());
    checkReadLine(stream);

    stream.reset(new TestStream(example()));
    stream->hideSeek(true);
    checkReadLineThenString(stream);
}

CATENA_UNITTEST(ReadStream, readLineBuffered)
{
    BufferedStream::ptr stream(new BufferedStream(example()));
    stream->bufferSize(3);
    CATENA_TEST_ASSERT(stream->supportsFind());
    checkReadLine(stream);

    stream.reset(new BufferedStream(example()));
    checkReadLineThenString(stream);
}

CATENA_UNITTEST(ReadStream, readLineMemory)
{
    MemoryStream::ptr stream(new MemoryStream(Buffer("test KURWA\nkek")));
    CATENA_TEST_ASSERT(stream->supportsFind());
    checkReadLine(stream);
    stream->seek(0);
    checkReadLineThenString(stream);
}

CATENA_UNITTEST(ReadStream, readLineEmptyLines)
{
    MemoryStream::ptr stream(new MemoryStream(Buffer("\n\nx\n")));
    CATENA_TEST_ASSERT_EQUAL(readLine(stream), "\n");
    CATENA_TEST_ASSERT_EQUAL(readLine(stream), "\n");
    CATENA_TEST_ASSERT_EQUAL(readLine(stream), "x\n");
    CATENA_TEST_ASSERT_EQUAL(readLine(stream), "");
}

CATENA_UNITTEST(ReadStream, readLines)
{
    ConcatenatedStream::ptr stream = example();
    std::vector<std::string> lines = readLines(stream);
    CATENA_TEST_ASSERT_EQUAL(lines.size(), 2u);
    CATENA_TEST_ASSERT_EQUAL(lines[0], "test KURWA\n");
    CATENA_TEST_ASSERT_EQUAL(lines[1], "kek");
    CATENA_TEST_ASSERT(readLines(stream).empty());
}

CATENA_UNITTEST(ReadStream, readLinesHint)
{
    MemoryStream::ptr stream(new MemoryStream(Buffer("a\nb\nc\nd\n")));
    std::vector<std::string> lines = readLines(stream, 3);
    CATENA_TEST_ASSERT_EQUAL(lines.size(), 2u);
    CATENA_TEST_ASSERT_EQUAL(lines[1], "b\n");
    CATENA_TEST_ASSERT_EQUAL(readAll(stream), "c\nd\n");
}
