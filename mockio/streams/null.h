#ifndef __MOCKIO_NULL_STREAM_H__
#define __MOCKIO_NULL_STREAM_H__
// Copyright (c) 2009 - Mozy, Inc.

#include "stream.h"
#include "mockio/util.h"

namespace MockIO {

/// Always at end-of-stream for reads, and swallows every write whole
class NullStream : public Stream
{
private:
    NullStream() {}

public:
    /// Process-wide instance
    static NullStream &get()
    {
        static NullStream s_stream;
        return s_stream;
    }
    static Stream::ptr get_ptr() { return unmanagedPtr<Stream>(get()); }

    bool supportsRead() { return true; }
    bool supportsWrite() { return true; }

    size_t read(void *buffer, size_t length) { return 0; }
    size_t write(const void *buffer, size_t length) { return length; }
};

}

#endif
