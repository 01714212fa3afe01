#ifndef __MOCKIO_MOCK_STREAM_H__
#define __MOCKIO_MOCK_STREAM_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <string>

#include <boost/thread/mutex.hpp>

#include "stream.h"

namespace MockIO {

/// @brief In-memory stand-in for a full duplex transport
/// @details
/// A MockStream holds two independent byte queues.  The test pushes bytes
/// with pushBytesToRead(), and the code under test consumes them in FIFO
/// order with read().  Everything the code under test write()s accumulates
/// until the test collects it with popBytesWritten().
///
/// read() on an empty queue returns 0; that is end-of-stream for that call
/// only, and data pushed later is returned by later reads.  write() always
/// accepts everything.  Neither ever throws.
///
/// Not thread safe; see SharedMockStream.
class MockStream : public Stream
{
public:
    typedef boost::shared_ptr<MockStream> ptr;

public:
    MockStream();

    bool supportsRead() { return true; }
    bool supportsWrite() { return true; }
    bool supportsFind() { return true; }

    size_t read(void *buffer, size_t length);
    size_t write(const void *buffer, size_t length);
    ptrdiff_t find(char delimiter, size_t sanitySize = ~0,
        bool throwIfNotFound = true);
    ptrdiff_t find(const std::string &delimiter, size_t sanitySize = ~0,
        bool throwIfNotFound = true);

    /// Append bytes to the tail of the queue returned by read()
    void pushBytesToRead(const void *bytes, size_t length);
    void pushBytesToRead(const std::string &bytes);

    /// @return Everything written since the last call, in order; the write
    /// queue is left empty
    std::string popBytesWritten();
    /// @return Everything written since the last popBytesWritten(), without
    /// consuming it
    const std::string &peekBytesWritten() const { return m_written; }

    /// @return How many pushed bytes have not been read yet
    size_t readAvailable() const { return m_read.size() - m_readOffset; }

private:
    std::string m_read;
    size_t m_readOffset;
    std::string m_written;
};

/// @brief A MockStream that several owners can drive at once
/// @details
/// Every SharedMockStream produced by clone() refers to the same underlying
/// MockStream, so a test can keep one handle for assertions while another is
/// buried inside the code under test.  The underlying MockStream lives until
/// the last handle is destroyed.
///
/// Each call locks the underlying MockStream for exactly its own duration.
/// Calls from different threads are serialized, but nothing orders them;
/// a read() and a later write() are never atomic together.
class SharedMockStream : public Stream
{
public:
    typedef boost::shared_ptr<SharedMockStream> ptr;

private:
    struct State : boost::noncopyable
    {
        boost::mutex mutex;
        MockStream stream;
    };

    SharedMockStream(boost::shared_ptr<State> state);

public:
    /// Creates a new, empty, underlying MockStream
    SharedMockStream();

    /// @return Another handle to the same underlying MockStream
    SharedMockStream::ptr clone() const;

    bool supportsRead() { return true; }
    bool supportsWrite() { return true; }
    bool supportsFind() { return true; }

    size_t read(void *buffer, size_t length);
    size_t write(const void *buffer, size_t length);
    void flush(bool flushParent = true);
    ptrdiff_t find(char delimiter, size_t sanitySize = ~0,
        bool throwIfNotFound = true);
    ptrdiff_t find(const std::string &delimiter, size_t sanitySize = ~0,
        bool throwIfNotFound = true);

    void pushBytesToRead(const void *bytes, size_t length);
    void pushBytesToRead(const std::string &bytes);
    std::string popBytesWritten();
    std::string peekBytesWritten() const;
    size_t readAvailable() const;

private:
    boost::shared_ptr<State> m_state;
};

}

#endif
