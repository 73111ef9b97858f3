// Copyright (c) 2009 - Mozy, Inc.

#include "length_probe.h"

#include <sys/stat.h>

#include <boost/exception/diagnostic_information.hpp>

#include "catena/exception.h"
#include "catena/log.h"
#include "fd.h"
#include "memory.h"

namespace Catena {

static Logger::ptr g_log = Log::lookup("catena:streams:lengthprobe");

bool
SizeLengthProbe::appliesTo(Stream &stream)
{
    return stream.supportsSize();
}

long long
SizeLengthProbe::length(Stream &stream)
{
    long long size = stream.size();
    return size < 0 ? -1ll : size;
}

bool
BufferLengthProbe::appliesTo(Stream &stream)
{
    return dynamic_cast<MemoryStream *>(&stream) != NULL;
}

long long
BufferLengthProbe::length(Stream &stream)
{
    return (long long)
        static_cast<MemoryStream &>(stream).buffer().readAvailable();
}

bool
DescriptorLengthProbe::appliesTo(Stream &stream)
{
    FDStream *fdStream = dynamic_cast<FDStream *>(&stream);
    return fdStream && fdStream->fd() >= 0;
}

long long
DescriptorLengthProbe::length(Stream &stream)
{
    int fd = static_cast<FDStream &>(stream).fd();
    struct stat statbuf;
    int rc = fstat(fd, &statbuf);
    error_t error = lastError();
    CATENA_LOG_LEVEL(g_log, rc ? Log::ERROR : Log::VERBOSE) << &stream
        << " fstat(" << fd << "): " << rc << " (" << error << ")";
    if (rc)
        CATENA_THROW_EXCEPTION_FROM_ERROR_API(error, "fstat");
    if (!S_ISREG(statbuf.st_mode))
        return -1ll;
    return statbuf.st_size;
}

bool
SeekLengthProbe::appliesTo(Stream &stream)
{
    return stream.supportsSeek();
}

long long
SeekLengthProbe::length(Stream &stream)
{
    long long offset = stream.tell();
    long long length = stream.seek(0, Stream::END);
    stream.seek(offset, Stream::BEGIN);
    return length;
}

static std::vector<LengthProbe::ptr>
makeDefaultLengthProbes()
{
    std::vector<LengthProbe::ptr> probes;
    probes.push_back(LengthProbe::ptr(new SizeLengthProbe()));
    probes.push_back(LengthProbe::ptr(new BufferLengthProbe()));
    probes.push_back(LengthProbe::ptr(new DescriptorLengthProbe()));
    probes.push_back(LengthProbe::ptr(new SeekLengthProbe()));
    return probes;
}

const std::vector<LengthProbe::ptr> &
defaultLengthProbes()
{
    static const std::vector<LengthProbe::ptr> s_probes =
        makeDefaultLengthProbes();
    return s_probes;
}

long long
probeLength(Stream &stream, const std::vector<LengthProbe::ptr> &probes)
{
    for (std::vector<LengthProbe::ptr>::const_iterator it = probes.begin();
        it != probes.end();
        ++it) {
        LengthProbe &probe = **it;
        if (!probe.appliesTo(stream))
            continue;
        long long length = -1ll;
        try {
            length = probe.length(stream);
        } catch (NativeException &) {
            CATENA_LOG_VERBOSE(g_log) << &stream << " " << probe.name()
                << " probe failed: "
                << boost::current_exception_diagnostic_information();
            continue;
        } catch (StreamException &) {
            CATENA_LOG_VERBOSE(g_log) << &stream << " " << probe.name()
                << " probe failed: "
                << boost::current_exception_diagnostic_information();
            continue;
        } catch (std::invalid_argument &) {
            CATENA_LOG_VERBOSE(g_log) << &stream << " " << probe.name()
                << " probe failed: "
                << boost::current_exception_diagnostic_information();
            continue;
        }
        CATENA_LOG_DEBUG(g_log) << &stream << " " << probe.name()
            << " probe: " << length;
        if (length >= 0)
            return length;
    }
    return -1ll;
}

}
