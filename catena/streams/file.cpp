// Copyright (c) 2009 - Mozy, Inc.

#include "file.h"

#include <unistd.h>

#include <stdexcept>

#include "catena/exception.h"
#include "catena/log.h"

namespace Catena {

static Logger::ptr g_log = Log::lookup("catena:streams:file");

static int openFlags(FileStream::AccessFlags accessFlags,
    FileStream::CreateFlags createFlags)
{
    int flags = accessFlags;
    switch (createFlags & ~FileStream::DELETE_ON_CLOSE) {
        case FileStream::OPEN:
            return flags;
        case FileStream::CREATE:
            return flags | O_CREAT | O_EXCL;
        case FileStream::OPEN_OR_CREATE:
            return flags | O_CREAT;
        case FileStream::OVERWRITE:
            return flags | O_TRUNC;
        case FileStream::OVERWRITE_OR_CREATE:
            return flags | O_CREAT | O_TRUNC;
        default:
            CATENA_THROW_EXCEPTION(std::invalid_argument("createFlags"));
    }
}

FileStream::FileStream(const std::string &path, AccessFlags accessFlags,
    CreateFlags createFlags)
    : m_path(path),
      m_accessFlags(accessFlags)
{
    int flags = openFlags(accessFlags, createFlags);
    int fd = ::open(path.c_str(), flags, 0666);
    error_t error = lastError();
    CATENA_LOG_LEVEL(g_log, fd < 0 ? Log::ERROR : Log::VERBOSE) << this
        << " open(" << path << ", " << flags << "): " << fd << " (" << error
        << ')';
    if (fd < 0)
        CATENA_THROW_EXCEPTION_FROM_ERROR_API(error, "open");
    // From here on the destructor closes fd
    init(fd);
    if ((createFlags & DELETE_ON_CLOSE) && unlink(path.c_str()) != 0)
        CATENA_THROW_EXCEPTION_FROM_LAST_ERROR_API("unlink");
}

}
