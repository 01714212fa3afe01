// Copyright (c) 2009 - Mozy, Inc.

#include "cat.h"

#include "mockio/assert.h"
#include "mockio/log.h"

namespace MockIO {

static Logger::ptr g_log = Log::lookup("mockio:streams:cat");

CatStream::CatStream(const std::vector<Stream::ptr> &streams)
    : m_streams(streams),
      m_current(0),
      m_pos(0ll)
{
    for (size_t i = 0; i < m_streams.size(); ++i)
        MOCKIO_ASSERT(m_streams[i]->supportsRead());
}

size_t
CatStream::read(void *buffer, size_t length)
{
    if (length == 0)
        return 0;
    for (; m_current < m_streams.size(); ++m_current) {
        size_t result = m_streams[m_current]->read(buffer, length);
        if (result > 0) {
            m_pos += result;
            return result;
        }
        MOCKIO_LOG_DEBUG(g_log) << this << " stream " << m_current
            << " exhausted at " << m_pos;
    }
    return 0;
}

}
