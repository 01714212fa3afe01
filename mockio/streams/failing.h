#ifndef __MOCKIO_FAILING_STREAM_H__
#define __MOCKIO_FAILING_STREAM_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <string>

#include "mockio/exception.h"
#include "stream.h"

namespace MockIO {

/// @brief A Stream that fails a fixed number of times, then behaves like
/// NullStream
/// @details
/// Every read() or write() while failures remain throws the exception that
/// throwExceptionFromErrorKind() maps @c kind to, carrying @c kind and
/// @c message as errinfo_errorkind and errinfo_message.  Reads and writes
/// draw from the same countdown.  Once it reaches 0, read() returns 0 and
/// write() accepts everything; the bytes go nowhere.
///
/// A negative repeat never runs out.  flush() never fails.
class FailingMockStream : public Stream
{
public:
    typedef boost::shared_ptr<FailingMockStream> ptr;

public:
    FailingMockStream(IOErrorKind kind, const std::string &message,
        int repeat);

    bool supportsRead() { return true; }
    bool supportsWrite() { return true; }

    size_t read(void *buffer, size_t length);
    size_t write(const void *buffer, size_t length);

    IOErrorKind kind() const { return m_kind; }
    const std::string &message() const { return m_message; }
    /// @return How many more calls will fail; negative if unbounded
    int remainingFailures() const { return m_remaining; }

private:
    void fail(const char *operation, size_t length);

private:
    IOErrorKind m_kind;
    std::string m_message;
    int m_remaining;
};

}

#endif
