#ifndef __MOCKIO_CAT_STREAM_H__
#define __MOCKIO_CAT_STREAM_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <vector>

#include "stream.h"

namespace MockIO {

/// @brief Reads each of several streams to end-of-stream, in order
/// @details
/// A read() that returns 0 from the current stream moves on to the next one.
/// An exception from the current stream propagates as is, and the next read()
/// asks the same stream again, so a FailingMockStream in the chain looks like
/// a transport that recovers after a few errors.
class CatStream : public Stream
{
public:
    typedef boost::shared_ptr<CatStream> ptr;

public:
    CatStream(const std::vector<Stream::ptr> &streams);

    bool supportsRead() { return true; }

    size_t read(void *buffer, size_t length);

    /// @return How many bytes have been read through this stream
    long long tell() const { return m_pos; }

private:
    std::vector<Stream::ptr> m_streams;
    // Index of the stream read() asks next
    size_t m_current;
    long long m_pos;
};

}

#endif
