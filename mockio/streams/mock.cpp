// Copyright (c) 2009 - Mozy, Inc.

#include "mock.h"

#include <algorithm>

#include <string.h>

#include "mockio/exception.h"
#include "mockio/log.h"

namespace MockIO {

static Logger::ptr g_log = Log::lookup("mockio:streams:mock");

MockStream::MockStream()
    : m_readOffset(0)
{}

size_t
MockStream::read(void *buffer, size_t length)
{
    size_t result = (std::min)(length, readAvailable());
    if (result > 0) {
        memcpy(buffer, m_read.data() + m_readOffset, result);
        m_readOffset += result;
        if (m_readOffset == m_read.size()) {
            m_read.clear();
            m_readOffset = 0;
        }
    }
    MOCKIO_LOG_DEBUG(g_log) << this << " read(" << length << "): " << result;
    return result;
}

size_t
MockStream::write(const void *buffer, size_t length)
{
    m_written.append((const char *)buffer, length);
    MOCKIO_LOG_DEBUG(g_log) << this << " write(" << length << "): " << length;
    return length;
}

ptrdiff_t
MockStream::find(char delimiter, size_t sanitySize, bool throwIfNotFound)
{
    return find(std::string(1, delimiter), sanitySize, throwIfNotFound);
}

ptrdiff_t
MockStream::find(const std::string &delimiter, size_t sanitySize,
    bool throwIfNotFound)
{
    MOCKIO_ASSERT(!delimiter.empty());
    size_t available = readAvailable();
    // The delimiter itself doesn't count against sanitySize
    size_t window = available;
    bool limited = sanitySize != (size_t)~0;
    if (limited) {
        sanitySize = (std::min)(sanitySize, (size_t)~0 - delimiter.size()) +
            delimiter.size();
        window = (std::min)(window, sanitySize);
    }

    std::string::size_type pos = m_read.find(delimiter, m_readOffset);
    if (pos != std::string::npos &&
        pos - m_readOffset + delimiter.size() <= window) {
        MOCKIO_LOG_TRACE(g_log) << this << " find(" << delimiter.size()
            << " bytes): " << pos - m_readOffset;
        return (ptrdiff_t)(pos - m_readOffset);
    }

    MOCKIO_LOG_TRACE(g_log) << this << " find(" << delimiter.size()
        << " bytes): not found in " << available;
    if (limited && available >= sanitySize) {
        if (throwIfNotFound)
            MOCKIO_THROW_EXCEPTION(BufferOverflowException());
        return -(ptrdiff_t)available - 1;
    }
    if (throwIfNotFound)
        MOCKIO_THROW_EXCEPTION(UnexpectedEofException());
    return -(ptrdiff_t)available - 1;
}

void
MockStream::pushBytesToRead(const void *bytes, size_t length)
{
    if (length == 0)
        return;
    // Drop what was already consumed before growing
    if (m_readOffset > 0) {
        m_read.erase(0, m_readOffset);
        m_readOffset = 0;
    }
    m_read.append((const char *)bytes, length);
    MOCKIO_LOG_DEBUG(g_log) << this << " pushBytesToRead(" << length
        << "): " << readAvailable() << " available";
}

void
MockStream::pushBytesToRead(const std::string &bytes)
{
    pushBytesToRead(bytes.data(), bytes.size());
}

std::string
MockStream::popBytesWritten()
{
    std::string result;
    result.swap(m_written);
    MOCKIO_LOG_DEBUG(g_log) << this << " popBytesWritten(): " << result.size();
    return result;
}


SharedMockStream::SharedMockStream()
    : m_state(new State())
{}

SharedMockStream::SharedMockStream(boost::shared_ptr<State> state)
    : m_state(state)
{}

SharedMockStream::ptr
SharedMockStream::clone() const
{
    return SharedMockStream::ptr(new SharedMockStream(m_state));
}

size_t
SharedMockStream::read(void *buffer, size_t length)
{
    boost::mutex::scoped_lock lock(m_state->mutex);
    return m_state->stream.read(buffer, length);
}

size_t
SharedMockStream::write(const void *buffer, size_t length)
{
    boost::mutex::scoped_lock lock(m_state->mutex);
    return m_state->stream.write(buffer, length);
}

void
SharedMockStream::flush(bool flushParent)
{
    boost::mutex::scoped_lock lock(m_state->mutex);
    m_state->stream.flush(flushParent);
}

ptrdiff_t
SharedMockStream::find(char delimiter, size_t sanitySize,
    bool throwIfNotFound)
{
    boost::mutex::scoped_lock lock(m_state->mutex);
    return m_state->stream.find(delimiter, sanitySize, throwIfNotFound);
}

ptrdiff_t
SharedMockStream::find(const std::string &delimiter, size_t sanitySize,
    bool throwIfNotFound)
{
    boost::mutex::scoped_lock lock(m_state->mutex);
    return m_state->stream.find(delimiter, sanitySize, throwIfNotFound);
}

void
SharedMockStream::pushBytesToRead(const void *bytes, size_t length)
{
    boost::mutex::scoped_lock lock(m_state->mutex);
    m_state->stream.pushBytesToRead(bytes, length);
}

void
SharedMockStream::pushBytesToRead(const std::string &bytes)
{
    boost::mutex::scoped_lock lock(m_state->mutex);
    m_state->stream.pushBytesToRead(bytes);
}

std::string
SharedMockStream::popBytesWritten()
{
    boost::mutex::scoped_lock lock(m_state->mutex);
    return m_state->stream.popBytesWritten();
}

std::string
SharedMockStream::peekBytesWritten() const
{
    boost::mutex::scoped_lock lock(m_state->mutex);
    return m_state->stream.peekBytesWritten();
}

size_t
SharedMockStream::readAvailable() const
{
    boost::mutex::scoped_lock lock(m_state->mutex);
    return m_state->stream.readAvailable();
}

}
