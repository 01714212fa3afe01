// Copyright (c) 2009 - Mozy, Inc.

#include "exception.h"

#include <algorithm>
#include <ostream>
#include <sstream>

#include <boost/shared_ptr.hpp>

#ifndef WINDOWS
#include <execinfo.h>
#include <stdlib.h>
#endif

namespace MockIO {

static const char *kindStrs[] = {
    "NOT_FOUND",
    "PERMISSION_DENIED",
    "CONNECTION_REFUSED",
    "CONNECTION_RESET",
    "CONNECTION_ABORTED",
    "NOT_CONNECTED",
    "ADDRESS_IN_USE",
    "ADDRESS_NOT_AVAILABLE",
    "BROKEN_PIPE",
    "ALREADY_EXISTS",
    "WOULD_BLOCK",
    "INVALID_INPUT",
    "INVALID_DATA",
    "TIMED_OUT",
    "WRITE_ZERO",
    "INTERRUPTED",
    "UNEXPECTED_EOF",
    "OTHER",
};

std::ostream &operator <<(std::ostream &os, IOErrorKind kind)
{
    if (kind < NOT_FOUND || kind > OTHER)
        return os << "IOErrorKind(" << (int)kind << ")";
    return os << kindStrs[kind];
}

std::string to_string(const errinfo_backtrace &bt)
{
    const std::vector<void *> &frames = bt.value();
    std::ostringstream os;
#ifndef WINDOWS
    boost::shared_ptr<char *> symbols;
    if (!frames.empty())
        symbols.reset(backtrace_symbols(&frames[0], (int)frames.size()), &free);
#endif
    for (size_t i = 0; i < frames.size(); ++i) {
        if (i > 0)
            os << "\n";
#ifndef WINDOWS
        if (symbols) {
            os << symbols.get()[i];
            continue;
        }
#endif
        os << frames[i];
    }
    return os.str();
}

std::vector<void *> backtrace(int framesToSkip)
{
    // Never report backtrace() itself
    ++framesToSkip;
    std::vector<void *> frames(62);
#ifdef WINDOWS
    frames.resize(CaptureStackBackTrace(framesToSkip,
        (DWORD)frames.size() - framesToSkip, &frames[0], NULL));
#else
    frames.resize(::backtrace(&frames[0], (int)frames.size()));
    frames.erase(frames.begin(),
        frames.begin() + (std::min)((int)frames.size(), framesToSkip));
#endif
    return frames;
}

#define THROW_KIND(type)                                                        \
    throw boost::enable_current_exception(type())                               \
        << errinfo_errorkind(kind) << errinfo_message(message)

void throwExceptionFromErrorKind(IOErrorKind kind, const std::string &message)
{
    switch (kind) {
        case NOT_FOUND:
            THROW_KIND(FileNotFoundException);
        case PERMISSION_DENIED:
            THROW_KIND(AccessDeniedException);
        case CONNECTION_REFUSED:
            THROW_KIND(ConnectionRefusedException);
        case CONNECTION_RESET:
            THROW_KIND(ConnectionResetException);
        case CONNECTION_ABORTED:
            THROW_KIND(ConnectionAbortedException);
        case NOT_CONNECTED:
            THROW_KIND(NotConnectedException);
        case ADDRESS_IN_USE:
            THROW_KIND(AddressInUseException);
        case BROKEN_PIPE:
            THROW_KIND(BrokenPipeException);
        case TIMED_OUT:
            THROW_KIND(TimedOutException);
        case INTERRUPTED:
            THROW_KIND(InterruptedException);
        case UNEXPECTED_EOF:
            THROW_KIND(UnexpectedEofException);
        default:
            THROW_KIND(NativeException);
    }
}

#undef THROW_KIND

}
