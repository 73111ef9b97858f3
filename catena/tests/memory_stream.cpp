// Copyright (c) 2009 - Mozy, Inc.

#include "catena/streams/memory.h"
#include "catena/test/test.h"

using namespace Catena;
using namespace Catena::Test;

CATENA_UNITTEST(MemoryStream, basic)
{
    MemoryStream stream;
    Buffer buffer;
    CATENA_TEST_ASSERT_EQUAL(stream.size(), 0);
    CATENA_TEST_ASSERT_EQUAL(stream.tell(), 0);
    CATENA_TEST_ASSERT_EQUAL(stream.write("part", 4), 4u);
    CATENA_TEST_ASSERT_EQUAL(stream.size(), 4);
    CATENA_TEST_ASSERT_EQUAL(stream.tell(), 4);
    CATENA_TEST_ASSERT(stream.buffer() == "part");
    CATENA_TEST_ASSERT_EQUAL(stream.read(buffer, 2), 0u);
    CATENA_TEST_ASSERT_EQUAL(stream.seek(0), 0);
    CATENA_TEST_ASSERT_EQUAL(stream.read(buffer, 2), 2u);
    CATENA_TEST_ASSERT(buffer == "pa");
    CATENA_TEST_ASSERT_EQUAL(stream.tell(), 2);
    CATENA_TEST_ASSERT_EQUAL(stream.read(buffer, 10), 2u);
    CATENA_TEST_ASSERT(buffer == "part");
    CATENA_TEST_ASSERT(stream.buffer() == "part");
}

CATENA_UNITTEST(MemoryStream, seek)
{
    MemoryStream stream(Buffer("part"));
    CATENA_TEST_ASSERT_EXCEPTION(stream.seek(-1), std::invalid_argument);
    CATENA_TEST_ASSERT_EQUAL(stream.seek(2), 2);
    CATENA_TEST_ASSERT_EQUAL(stream.seek(1, Stream::CURRENT), 3);
    CATENA_TEST_ASSERT_EQUAL(stream.seek(-3, Stream::CURRENT), 0);
    CATENA_TEST_ASSERT_EXCEPTION(stream.seek(-1, Stream::CURRENT),
        std::invalid_argument);
    CATENA_TEST_ASSERT_EQUAL(stream.tell(), 0);
    CATENA_TEST_ASSERT_EQUAL(stream.seek(-1, Stream::END), 3);
    CATENA_TEST_ASSERT_EXCEPTION(stream.seek(-5, Stream::END),
        std::invalid_argument);
    CATENA_TEST_ASSERT_EXCEPTION(stream.seek(0, (Stream::Anchor)7),
        std::invalid_argument);
    CATENA_TEST_ASSERT_EQUAL(stream.tell(), 3);
}

CATENA_UNITTEST(MemoryStream, seekPastEnd)
{
    MemoryStream stream(Buffer("part"));
    char c;
    CATENA_TEST_ASSERT_EQUAL(stream.seek(6), 6);
    CATENA_TEST_ASSERT_EQUAL(stream.read(&c, 1), 0u);
    CATENA_TEST_ASSERT_EQUAL(stream.size(), 4);
    CATENA_TEST_ASSERT_EQUAL(stream.seek(2, Stream::END), 6);
    CATENA_TEST_ASSERT(stream.buffer() == "part");
}

CATENA_UNITTEST(MemoryStream, truncate)
{
    MemoryStream stream(Buffer("part"));
    stream.seek(4);
    stream.truncate(3);
    CATENA_TEST_ASSERT(stream.buffer() == "par");
    CATENA_TEST_ASSERT_EQUAL(stream.tell(), 4);
    stream.truncate(5);
    CATENA_TEST_ASSERT(stream.buffer() == std::string("par\0\0", 5));
    stream.truncate(0);
    CATENA_TEST_ASSERT(stream.buffer() == "");
    CATENA_TEST_ASSERT_EQUAL(stream.size(), 0);
}

CATENA_UNITTEST(MemoryStream, writeExtension)
{
    MemoryStream stream(Buffer("part"));
    CATENA_TEST_ASSERT_EQUAL(stream.seek(1, Stream::END), 5);
    CATENA_TEST_ASSERT_EQUAL(stream.write("two", 3), 3u);
    CATENA_TEST_ASSERT_EQUAL(stream.size(), 8);
    CATENA_TEST_ASSERT(stream.buffer() == std::string("part\0two", 8));
}

CATENA_UNITTEST(MemoryStream, overwrite)
{
    MemoryStream stream(Buffer("part"));
    stream.seek(1);
    CATENA_TEST_ASSERT_EQUAL(stream.write("ortion", 6), 6u);
    CATENA_TEST_ASSERT_EQUAL(stream.tell(), 7);
    CATENA_TEST_ASSERT(stream.buffer() == "portion");
}

CATENA_UNITTEST(MemoryStream, find)
{
    MemoryStream stream(Buffer("first\nsecond\r\nthird"));
    CATENA_TEST_ASSERT_EQUAL(stream.find('\n'), 5);
    CATENA_TEST_ASSERT_EQUAL(stream.find("\r\n"), 12);
    CATENA_TEST_ASSERT_EQUAL(stream.getDelimited(), "first\n");
    CATENA_TEST_ASSERT_EQUAL(stream.getDelimited("\r\n", false, false),
        "second");
    CATENA_TEST_ASSERT_EQUAL(stream.tell(), 14);
    CATENA_TEST_ASSERT_EXCEPTION(stream.find('\n'), UnexpectedEofException);
    CATENA_TEST_ASSERT_EXCEPTION(stream.find('\n', 2), BufferOverflowException);
    CATENA_TEST_ASSERT_EQUAL(stream.find('\n', 2, false), -3);
    CATENA_TEST_ASSERT_EQUAL(stream.find('\n', ~0, false), -6);
    CATENA_TEST_ASSERT_EQUAL(stream.getDelimited('\n', true), "third");
    CATENA_TEST_ASSERT_EQUAL(stream.tell(), 19);
    // find() never moves the stream
    stream.seek(0);
    stream.find("third");
    CATENA_TEST_ASSERT_EQUAL(stream.tell(), 0);
}
