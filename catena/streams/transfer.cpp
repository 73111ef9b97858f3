// Copyright (c) 2009 - Mozy, Inc.

#include "transfer.h"

#include <algorithm>
#include <vector>

#include <boost/bind.hpp>

#include "catena/config.h"
#include "catena/exception.h"
#include "catena/log.h"
#include "catena/parallel.h"

namespace Catena {

static ConfigVar<size_t>::ptr g_chunkSize =
    Config::lookup("transferstream.chunksize", (size_t)65536,
    "Bytes read from the source per transferStream step");

static Logger::ptr g_log = Log::lookup("catena:streams:transfer");

namespace {

struct Transfer
{
    Transfer(Stream &src, Stream &dst, unsigned long long length)
        : src(src),
          dst(dst),
          remaining(length),
          filling(&buffers[0]),
          draining(&buffers[1]),
          lastRead(0)
    {}

    void readChunk()
    {
        size_t todo = g_chunkSize->val();
        if (remaining < (unsigned long long)todo)
            todo = (size_t)remaining;
        lastRead = todo == 0 ? 0 : src.read(*filling, todo);
    }

    void writeChunk()
    {
        while (draining->readAvailable() > 0)
            draining->consume(dst.write(*draining,
                draining->readAvailable()));
    }

    Stream &src, &dst;
    unsigned long long remaining;
    Buffer buffers[2];
    Buffer *filling, *draining;
    size_t lastRead;
};

}

unsigned long long
transferStream(Stream &src, Stream &dst, unsigned long long length,
    ExactLength exactLength)
{
    if (exactLength == INFER)
        exactLength = length == ~0ull ? UNTILEOF : EXACT;
    if (length == 0)
        return 0;

    Transfer transfer(src, dst, length);
    std::vector<boost::function<void ()> > step;
    step.push_back(boost::bind(&Transfer::readChunk, &transfer));
    step.push_back(boost::bind(&Transfer::writeChunk, &transfer));

    unsigned long long total = 0;
    // The first chunk has nothing to overlap with
    transfer.readChunk();
    while (transfer.lastRead > 0) {
        total += transfer.lastRead;
        transfer.remaining -= transfer.lastRead;
        std::swap(transfer.filling, transfer.draining);
        if (transfer.remaining == 0) {
            transfer.writeChunk();
            break;
        }
        parallel_do(step);
    }
    CATENA_LOG_DEBUG(g_log) << "transferStream(" << &src << ", " << &dst
        << ", " << length << "): " << total;
    if (exactLength == EXACT && total < length)
        CATENA_THROW_EXCEPTION(UnexpectedEofException());
    return total;
}

}
