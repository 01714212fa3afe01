// Copyright (c) 2009 - Mozy, Inc.

#include "mockio/streams/mock.h"
#include "mockio/streams/null.h"
#include "mockio/streams/stream.h"
#include "mockio/test/test.h"

using namespace MockIO;

namespace {

class EmptyStream : public Stream
{};

// Code written against Stream, unaware it is talking to a mock
static void reverseLine(Stream &stream)
{
    std::string line = stream.getDelimited('\n', false, false);
    std::string reversed(line.rbegin(), line.rend());
    stream.write(reversed.c_str());
    stream.write("\n");
    stream.flush();
}

}

MOCKIO_UNITTEST(Stream, defaults)
{
    EmptyStream stream;
    MOCKIO_TEST_ASSERT(!stream.supportsRead());
    MOCKIO_TEST_ASSERT(!stream.supportsWrite());
    MOCKIO_TEST_ASSERT(!stream.supportsFind());
    stream.flush();
}

#ifndef NDEBUG
MOCKIO_UNITTEST(Stream, unsupportedOperationsAssert)
{
    EmptyStream stream;
    char buffer[1];
    MOCKIO_TEST_ASSERT_ASSERTED(stream.read(buffer, 1));
    MOCKIO_TEST_ASSERT_ASSERTED(stream.write(buffer, 1));
    MOCKIO_TEST_ASSERT_ASSERTED(stream.find('\n'));
    MOCKIO_TEST_ASSERT_ASSERTED(stream.getDelimited());
}
#endif

MOCKIO_UNITTEST(Stream, codeUnderTestAgainstMock)
{
    MockStream stream;
    stream.pushBytesToRead("stressed\nlevel\n");
    reverseLine(stream);
    reverseLine(stream);
    MOCKIO_TEST_ASSERT_EQUAL(stream.popBytesWritten(), "desserts\nlevel\n");
    MOCKIO_TEST_ASSERT_EXCEPTION(reverseLine(stream), UnexpectedEofException);
    MOCKIO_TEST_ASSERT(stream.popBytesWritten().empty());
}

MOCKIO_UNITTEST(Stream, writeCString)
{
    SharedMockStream stream;
    Stream &base = stream;
    MOCKIO_TEST_ASSERT_EQUAL(base.write("abc"), 3u);
    MOCKIO_TEST_ASSERT_EQUAL(base.write(""), 0u);
    MOCKIO_TEST_ASSERT_EQUAL(stream.popBytesWritten(), "abc");
}

MOCKIO_UNITTEST(NullStream, readWrite)
{
    Stream::ptr stream = NullStream::get_ptr();
    MOCKIO_TEST_ASSERT(stream->supportsRead());
    MOCKIO_TEST_ASSERT(stream->supportsWrite());
    char buffer[4] = { 'x', 'x', 'x', 'x' };
    MOCKIO_TEST_ASSERT_EQUAL(stream->read(buffer, 4), 0u);
    MOCKIO_TEST_ASSERT_EQUAL(std::string(buffer, 4), "xxxx");
    MOCKIO_TEST_ASSERT_EQUAL(stream->write(buffer, 4), 4u);
    MOCKIO_TEST_ASSERT(stream.get() == &NullStream::get());
}
