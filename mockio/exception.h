#ifndef __MOCKIO_EXCEPTION_H__
#define __MOCKIO_EXCEPTION_H__
// Copyright (c) 2009 - Mozy, Inc.

#include "version.h"

#include <iosfwd>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/exception/all.hpp>

namespace MockIO {

/// Categories an I/O failure can be reported as
enum IOErrorKind {
    NOT_FOUND,
    PERMISSION_DENIED,
    CONNECTION_REFUSED,
    CONNECTION_RESET,
    CONNECTION_ABORTED,
    NOT_CONNECTED,
    ADDRESS_IN_USE,
    ADDRESS_NOT_AVAILABLE,
    BROKEN_PIPE,
    ALREADY_EXISTS,
    WOULD_BLOCK,
    INVALID_INPUT,
    INVALID_DATA,
    TIMED_OUT,
    WRITE_ZERO,
    INTERRUPTED,
    UNEXPECTED_EOF,
    OTHER
};

std::ostream &operator <<(std::ostream &os, IOErrorKind kind);

typedef boost::error_info<struct tag_backtrace, std::vector<void *> > errinfo_backtrace;
typedef boost::error_info<struct tag_errorkind, IOErrorKind> errinfo_errorkind;
typedef boost::error_info<struct tag_message, std::string> errinfo_message;

std::string to_string( errinfo_backtrace const &bt );

std::vector<void *> backtrace(int framesToSkip = 0);

#define MOCKIO_THROW_EXCEPTION(x)                                               \
    throw ::boost::enable_current_exception(::boost::enable_error_info(x))      \
        << ::boost::throw_function(BOOST_CURRENT_FUNCTION)                      \
        << ::boost::throw_file(__FILE__)                                        \
        << ::boost::throw_line((int)__LINE__)                                   \
        << ::MockIO::errinfo_backtrace(::MockIO::backtrace())

struct Exception : virtual boost::exception, virtual std::exception {};

struct StreamException : virtual Exception {};
struct UnexpectedEofException : virtual StreamException {};
struct BufferOverflowException : virtual StreamException {};

struct NativeException : virtual Exception {};

struct FileNotFoundException : virtual NativeException {};
struct AccessDeniedException : virtual NativeException {};
struct BrokenPipeException : virtual NativeException {};
struct InterruptedException : virtual NativeException {};
struct TimedOutException : virtual NativeException {};

struct SocketException : virtual NativeException {};
struct AddressInUseException : virtual SocketException {};
struct ConnectionAbortedException : virtual SocketException {};
struct ConnectionResetException : virtual SocketException {};
struct ConnectionRefusedException : virtual SocketException {};
struct NotConnectedException : virtual SocketException {};

/// Throws the exception type that corresponds to kind, tagged with
/// errinfo_errorkind and errinfo_message.  Kinds without a dedicated type
/// are thrown as NativeException; UNEXPECTED_EOF is an
/// UnexpectedEofException.
void throwExceptionFromErrorKind(IOErrorKind kind, const std::string &message);

#define MOCKIO_THROW_EXCEPTION_FROM_ERROR_KIND(kind, message)                   \
    try {                                                                       \
        ::MockIO::throwExceptionFromErrorKind(kind, message);                   \
    } catch (::boost::exception &ex) {                                          \
        ex << ::boost::throw_function(BOOST_CURRENT_FUNCTION)                   \
            << ::boost::throw_file(__FILE__)                                    \
            << ::boost::throw_line((int)__LINE__)                               \
            << ::MockIO::errinfo_backtrace(::MockIO::backtrace());              \
        throw;                                                                  \
    }

}

#endif
