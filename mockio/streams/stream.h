#ifndef __MOCKIO_STREAM_H__
#define __MOCKIO_STREAM_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <stddef.h>
#include <string>

#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>

#include "mockio/assert.h"

namespace MockIO {

/// @brief Byte-oriented stream
/// @details
/// Stream is the interface that code under test is written against.  A
/// MockStream, a FailingMockStream, or any real transport deriving from
/// Stream can be handed to the same code.  By default, a Stream advertises
/// that it cannot support any operations, and calling any of them will result
/// in an assertion.  flush() is always safe to call.
///
/// Streams are not thread safe unless documented otherwise
/// (SharedMockStream is).  read() and write() are @b not re-entrant.
class Stream : boost::noncopyable
{
public:
    typedef boost::shared_ptr<Stream> ptr;

public:
    virtual ~Stream() {}

    /// @return If it is valid to call read()
    virtual bool supportsRead() { return false; }
    /// @return If it is valid to call write()
    virtual bool supportsWrite() { return false; }
    /// @return If it is valid to call find()
    virtual bool supportsFind() { return false; }

    /// @brief Read data from the Stream
    /// @details
    /// read() is allowed to return less than length, even if there is more data
    /// available. A return value of 0 is the @b only reliable method of
    /// detecting EOF; a failure is always an exception, never a 0.  If an
    /// exception is thrown, you can be assured that nothing was read from the
    /// underlying implementation.
    /// @param buffer The memory to read in to
    /// @param length The maximum amount to read
    /// @return The amount actually read
    /// @pre supportsRead()
    virtual size_t read(void *buffer, size_t length);

    /// @brief Write data to the Stream
    /// @details
    /// write() is allowed to return less than length.  It is @b not allowed to
    /// return 0 unless length is 0. If an exception is thrown, you can be
    /// assured that nothing was written to the underlying implementation.
    /// @return The amount actually written
    /// @pre supportsWrite()
    virtual size_t write(const void *buffer, size_t length);
    /// @copydoc write(const void *, size_t)
    /// @brief
    /// Convenience function to call write() with a null-terminated string
    /// @note Cannot be overridden.
    size_t write(const char *string);

    /// @brief Flush the stream
    /// @details
    /// flush() ensures that nothing is left in internal buffers.  It is safe
    /// to call flush() on any Stream.
    /// @param flushParent Also flush() a parent stream(), if there is one
    virtual void flush(bool flushParent = true) {}

    //@{
    /// @brief Find a delimiter by looking ahead in the stream
    /// @param delimiter The byte to look for
    /// @param sanitySize The maximum amount to look ahead before throwing an
    /// exception
    /// @param throwIfNotFound Instead of throwing an exception on error, it
    /// will return a negative number.  Negate and subtract 1 to find out how
    /// much buffered data is available before hitting the error
    /// @exception BufferOverflowException @c delimiter was not found before
    /// @c sanitySize
    /// @exception UnexpectedEofException EOF was reached without finding
    /// @c delimiter
    /// @return Offset from the current stream position of the found
    /// @c delimiter
    /// @pre supportsFind()
    virtual ptrdiff_t find(char delimiter, size_t sanitySize = ~0,
        bool throwIfNotFound = true);
    virtual ptrdiff_t find(const std::string &delimiter,
        size_t sanitySize = ~0, bool throwIfNotFound = true);
    //@}

    /// @brief Convenience function for calling find() then read(), and return
    /// the results in a std::string
    /// @note Cannot be overridden.
    /// @param delimiter The byte to look for
    /// @param eofIsDelimiter Instead of throwing an exception if the delimiter
    /// is not found, return the remainder of the stream.
    /// @param includeDelimiter Keep the delimiter at the end of the result
    /// @return The data from the current stream position up to the delimiter
    /// @pre supportsFind() && supportsRead()
    std::string getDelimited(char delimiter = '\n',
        bool eofIsDelimiter = false, bool includeDelimiter = true);
    std::string getDelimited(const std::string &delimiter,
        bool eofIsDelimiter = false, bool includeDelimiter = true);
};

}

#endif
