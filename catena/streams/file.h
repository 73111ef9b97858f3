#ifndef __CATENA_FILE_STREAM_H__
#define __CATENA_FILE_STREAM_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <fcntl.h>

#include <string>

#include "fd.h"

namespace Catena {

/// An FDStream that opens a path itself
class FileStream : public FDStream
{
public:
    typedef boost::shared_ptr<FileStream> ptr;

    enum AccessFlags {
        READ = O_RDONLY,
        WRITE = O_WRONLY,
        READWRITE = O_RDWR,
        /// Every write lands at the current end of the file
        APPEND = O_APPEND | O_WRONLY
    };
    enum CreateFlags {
        /// The file must exist
        OPEN = 1,
        /// The file must not exist
        CREATE,
        OPEN_OR_CREATE,
        /// The file must exist, and is emptied
        OVERWRITE,
        OVERWRITE_OR_CREATE,

        /// May be or'ed with any of the above; the name is unlinked right
        /// after opening, so the data goes away with the last descriptor
        DELETE_ON_CLOSE = 0x40000000
    };

    FileStream(const std::string &path, AccessFlags accessFlags = READWRITE,
        CreateFlags createFlags = OPEN);

    bool supportsRead()
    { return m_accessFlags == READ || m_accessFlags == READWRITE; }
    bool supportsWrite() { return m_accessFlags != READ; }
    bool supportsSeek() { return m_accessFlags != APPEND; }

    const std::string &path() const { return m_path; }

private:
    std::string m_path;
    AccessFlags m_accessFlags;
};

}

#endif
