// Copyright (c) 2009 - Mozy, Inc.

#include "failing.h"

#include "mockio/log.h"
#include "null.h"

namespace MockIO {

static Logger::ptr g_log = Log::lookup("mockio:streams:failing");

FailingMockStream::FailingMockStream(IOErrorKind kind,
    const std::string &message, int repeat)
    : m_kind(kind),
      m_message(message),
      m_remaining(repeat)
{}

size_t
FailingMockStream::read(void *buffer, size_t length)
{
    if (m_remaining != 0)
        fail("read", length);
    size_t result = NullStream::get().read(buffer, length);
    MOCKIO_LOG_DEBUG(g_log) << this << " read(" << length << "): " << result;
    return result;
}

size_t
FailingMockStream::write(const void *buffer, size_t length)
{
    if (m_remaining != 0)
        fail("write", length);
    size_t result = NullStream::get().write(buffer, length);
    MOCKIO_LOG_DEBUG(g_log) << this << " write(" << length << "): " << result;
    return result;
}

void
FailingMockStream::fail(const char *operation, size_t length)
{
    MOCKIO_ASSERT(m_remaining != 0);
    if (m_remaining > 0)
        --m_remaining;
    MOCKIO_LOG_VERBOSE(g_log) << this << " " << operation << "(" << length
        << "): " << m_kind << " \"" << m_message << "\" ("
        << m_remaining << " remaining)";
    MOCKIO_THROW_EXCEPTION_FROM_ERROR_KIND(m_kind, m_message);
}

}
