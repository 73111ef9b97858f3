#ifndef __CATENA_VERSION_H__
#define __CATENA_VERSION_H__
// Copyright (c) 2009 - Mozy, Inc.

// Only POSIX platforms are supported; LINUX additionally enables /proc
// based debugger detection
#ifdef _WIN32
#   error catena requires a POSIX platform
#endif

#if defined(linux) || defined(__linux__)
#   define LINUX
#endif

#if defined(__GNUC__) && (defined(__x86_64) || defined(__i386__))
#   define X86
#endif

#endif
