// Copyright (c) 2009 - Mozy, Inc.

#include "stream.h"

#include <string.h>

#include "mockio/assert.h"

namespace MockIO {

size_t
Stream::read(void *buffer, size_t length)
{
    MOCKIO_NOTREACHED();
}

size_t
Stream::write(const void *buffer, size_t length)
{
    MOCKIO_NOTREACHED();
}

size_t
Stream::write(const char *string)
{
    return write(string, strlen(string));
}

ptrdiff_t
Stream::find(char delimiter, size_t sanitySize, bool throwIfNotFound)
{
    MOCKIO_NOTREACHED();
}

ptrdiff_t
Stream::find(const std::string &delimiter, size_t sanitySize,
    bool throwIfNotFound)
{
    MOCKIO_NOTREACHED();
}

std::string
Stream::getDelimited(char delimiter, bool eofIsDelimiter,
    bool includeDelimiter)
{
    return getDelimited(std::string(1, delimiter), eofIsDelimiter,
        includeDelimiter);
}

std::string
Stream::getDelimited(const std::string &delimiter, bool eofIsDelimiter,
    bool includeDelimiter)
{
    MOCKIO_ASSERT(supportsFind() && supportsRead());
    ptrdiff_t offset = find(delimiter, ~0, !eofIsDelimiter);
    // Only negative when eofIsDelimiter; -offset - 1 bytes are left
    bool found = offset >= 0;
    size_t length = found ? (size_t)offset : (size_t)(-offset - 1);
    std::string result(length + (found ? delimiter.size() : 0), '\0');
    if (!result.empty())
        MOCKIO_VERIFY(read(&result[0], result.size()) == result.size());
    if (found && !includeDelimiter)
        result.resize(length);
    return result;
}

}
