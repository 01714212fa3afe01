#ifndef __MOCKIO_VERSION_H__
#define __MOCKIO_VERSION_H__
// Copyright (c) 2009 - Mozy, Inc.

// OS
#ifdef _WIN32
#   define WINDOWS
#endif

#if defined(linux) || defined(__linux__)
#   define LINUX
#endif

#ifdef __APPLE__
#   define OSX
#endif

// MSVC release builds don't define NDEBUG on their own
#if defined(_MSC_VER) && !defined(_DEBUG) && !defined(NDEBUG)
#   define NDEBUG
#endif

#ifdef WINDOWS
#   define WIN32_LEAN_AND_MEAN
#   include <windows.h>
// From WinGDI.h: #define ERROR 0; it collides with Log::ERROR
#   ifdef ERROR
#       undef ERROR
#   endif
#endif

#endif
