// Copyright (c) 2009 - Mozy, Inc.

#include "read.h"

#include <string.h>

#include <algorithm>

#include "catena/config.h"
#include "catena/log.h"
#include "memory.h"
#include "transfer.h"

namespace Catena {

static ConfigVar<size_t>::ptr g_readLineChunkSize =
    Config::lookup("stream.readline.chunksize", (size_t)4096,
    "How far readLine() reads ahead on a seekable stream");

static Logger::ptr g_log = Log::lookup("catena:streams:read");

static bool verifyChunkSize(size_t value)
{
    return value != 0;
}

namespace {
static struct ChunkSizeVerifier
{
    ChunkSizeVerifier()
    {
        g_readLineChunkSize->beforeChange.connect(&verifyChunkSize);
    }
} g_chunkSizeVerifier;
}

size_t
readInto(Stream &stream, void *buffer, size_t length)
{
    size_t total = 0;
    while (total < length) {
        size_t result = stream.read((unsigned char *)buffer + total,
            length - total);
        if (result == 0)
            break;
        total += result;
    }
    return total;
}

std::string
readString(Stream &stream, size_t length)
{
    if (stream.supportsSize() && stream.supportsTell()) {
        long long remaining = std::max(stream.size() - stream.tell(), 0ll);
        if ((unsigned long long)remaining < (unsigned long long)length)
            length = (size_t)remaining;
    }
    if (length == (size_t)~0)
        return readAll(stream);
    std::string result;
    result.resize(length);
    if (length != 0)
        result.resize(readInto(stream, &result[0], length));
    return result;
}

std::string
readAll(Stream &stream)
{
    MemoryStream memory;
    transferStream(stream, memory);
    return memory.buffer().toString();
}

// Asks the stream where the line ends
static bool
readLineWithFind(Stream &stream, std::string &line, size_t limit)
{
    size_t remaining = limit - line.size();
    ptrdiff_t offset = stream.find('\n', remaining, false);
    bool found = offset >= 0;
    size_t todo = found ? (size_t)offset + 1 : (size_t)(-offset - 1);
    todo = std::min(todo, remaining);
    if (todo == 0)
        return false;
    size_t start = line.size();
    line.resize(start + todo);
    size_t result = readInto(stream, &line[start], todo);
    line.resize(start + result);
    return !found && result == todo;
}

// Reads ahead, then gives back everything after the '\n'
static bool
readLineWithSeek(Stream &stream, std::string &line, size_t limit)
{
    size_t todo = std::min(limit - line.size(), g_readLineChunkSize->val());
    size_t start = line.size();
    line.resize(start + todo);
    size_t result = stream.read(&line[start], todo);
    const char *newline = (const char *)memchr(line.c_str() + start, '\n',
        result);
    if (newline == NULL) {
        line.resize(start + result);
        return result != 0;
    }
    size_t keep = newline - (line.c_str() + start) + 1;
    if (keep < result)
        stream.seek(-(long long)(result - keep), Stream::CURRENT);
    line.resize(start + keep);
    return false;
}

static bool
readLineByByte(Stream &stream, std::string &line)
{
    char c;
    if (stream.read(&c, 1u) == 0)
        return false;
    line.append(1, c);
    return c != '\n';
}

std::string
readLine(Stream &stream, size_t limit)
{
    // An unreadable or closed stream throws from its first read()
    std::string line;
    bool more = true;
    while (more && line.size() < limit) {
        if (stream.supportsFind())
            more = readLineWithFind(stream, line, limit);
        else if (stream.supportsSeek())
            more = readLineWithSeek(stream, line, limit);
        else
            more = readLineByByte(stream, line);
    }
    CATENA_LOG_DEBUG(g_log) << &stream << " readLine(" << limit << "): "
        << line.size();
    return line;
}

std::vector<std::string>
readLines(Stream &stream, size_t hint)
{
    std::vector<std::string> lines;
    size_t total = 0;
    while (true) {
        std::string line = readLine(stream);
        if (line.empty())
            break;
        total += line.size();
        lines.push_back(line);
        if (hint != (size_t)~0 && total >= hint)
            break;
    }
    return lines;
}

}
