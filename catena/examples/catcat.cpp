// Copyright (c) 2009 - Mozy, Inc.

#include <unistd.h>

#include <iostream>
#include <sstream>

#include <boost/exception/diagnostic_information.hpp>

#include "catena/config.h"
#include "catena/streams/concatenated.h"
#include "catena/streams/fd.h"
#include "catena/streams/file.h"
#include "catena/streams/read.h"
#include "catena/streams/transfer.h"
#include "catena/workerpool.h"

using namespace Catena;

static ConfigVar<long long>::ptr g_offset =
    Config::lookup("catcat.offset", 0ll,
    "Where to start in the concatenated files; negative counts from the end");
static ConfigVar<long long>::ptr g_length =
    Config::lookup("catcat.length", -1ll,
    "How many bytes to copy; -1 for everything");
static ConfigVar<bool>::ptr g_lines =
    Config::lookup("catcat.lines", false,
    "Number each line of output");

static void
numberLines(Stream &stream, Stream &out, long long length)
{
    unsigned long long number = 0;
    while (length != 0) {
        std::string line = readLine(stream,
            length < 0 ? (size_t)~0 : (size_t)length);
        if (line.empty())
            break;
        if (length > 0)
            length -= (long long)line.size();
        std::ostringstream os;
        os.width(6);
        os << ++number << '\t' << line;
        std::string numbered = os.str();
        size_t written = 0;
        while (written < numbered.size())
            written += out.write(numbered.c_str() + written,
                numbered.size() - written);
    }
}

int main(int argc, char *argv[])
{
    try {
        Config::loadFromEnvironment();
        Config::loadFromCommandLine(argc, argv);
        if (argc < 2) {
            std::cerr << "usage: " << argv[0]
                << " [--catcat.offset N] [--catcat.length N] [--catcat.lines 1]"
                << " file..." << std::endl;
            return 1;
        }
        WorkerPool pool(2);
        FDStream stdoutStream(STDOUT_FILENO, false);

        std::vector<Stream::ptr> files;
        for (int i = 1; i < argc; ++i)
            files.push_back(Stream::ptr(new FileStream(argv[i],
                FileStream::READ)));
        ConcatenatedStream::ptr stream = ConcatenatedStream::create(files);

        long long offset = g_offset->val();
        if (offset < 0)
            stream->seek(offset, Stream::END);
        else if (offset > 0)
            stream->seek(offset);

        long long length = g_length->val();
        if (g_lines->val())
            numberLines(*stream, stdoutStream, length);
        else if (length < 0)
            transferStream(stream, stdoutStream);
        else
            transferStream(stream, stdoutStream, (unsigned long long)length,
                UNTILEOF);
        stream->close();
    } catch (std::exception &) {
        std::cerr << boost::current_exception_diagnostic_information()
            << std::endl;
        return 1;
    }
    return 0;
}
