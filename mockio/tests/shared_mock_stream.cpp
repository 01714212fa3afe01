// Copyright (c) 2009 - Mozy, Inc.

#include <ctype.h>

#include <boost/bind.hpp>
#include <boost/thread/thread.hpp>

#include "mockio/streams/mock.h"
#include "mockio/test/test.h"

using namespace MockIO;

namespace {

// Stands in for production code that owns its transport
class LineEcho
{
public:
    LineEcho(Stream::ptr stream) : m_stream(stream) {}

    /// Echoes one line back, upper-cased; false at end-of-stream
    bool echoLine()
    {
        std::string line = m_stream->getDelimited('\n', true);
        if (line.empty())
            return false;
        for (std::string::iterator it = line.begin(); it != line.end(); ++it)
            *it = (char)toupper((unsigned char)*it);
        m_stream->write(line.c_str());
        return true;
    }

private:
    Stream::ptr m_stream;
};

}

MOCKIO_UNITTEST(SharedMockStream, cloneSharesReadBuffer)
{
    SharedMockStream stream;
    SharedMockStream::ptr other = stream.clone();
    stream.pushBytesToRead("shared");
    MOCKIO_TEST_ASSERT_EQUAL(other->readAvailable(), 6u);
    char buffer[16];
    MOCKIO_TEST_ASSERT_EQUAL(other->read(buffer, 16), 6u);
    MOCKIO_TEST_ASSERT_EQUAL(std::string(buffer, 6), "shared");
    MOCKIO_TEST_ASSERT_EQUAL(stream.readAvailable(), 0u);
    MOCKIO_TEST_ASSERT_EQUAL(stream.read(buffer, 16), 0u);
}

MOCKIO_UNITTEST(SharedMockStream, cloneSharesWriteBuffer)
{
    SharedMockStream stream;
    SharedMockStream::ptr other = stream.clone();
    MOCKIO_TEST_ASSERT_EQUAL(other->write("abc", 3), 3u);
    MOCKIO_TEST_ASSERT_EQUAL(stream.write("def", 3), 3u);
    MOCKIO_TEST_ASSERT_EQUAL(other->peekBytesWritten(), "abcdef");
    MOCKIO_TEST_ASSERT_EQUAL(stream.popBytesWritten(), "abcdef");
    MOCKIO_TEST_ASSERT(other->popBytesWritten().empty());
}

MOCKIO_UNITTEST(SharedMockStream, cloneOfClone)
{
    SharedMockStream stream;
    SharedMockStream::ptr third = stream.clone()->clone();
    third->pushBytesToRead("x");
    MOCKIO_TEST_ASSERT_EQUAL(stream.readAvailable(), 1u);
}

MOCKIO_UNITTEST(SharedMockStream, independentStreams)
{
    SharedMockStream a, b;
    a.pushBytesToRead("a");
    a.write("a", 1);
    MOCKIO_TEST_ASSERT_EQUAL(b.readAvailable(), 0u);
    MOCKIO_TEST_ASSERT(b.peekBytesWritten().empty());
}

MOCKIO_UNITTEST(SharedMockStream, outlivesOriginalHandle)
{
    SharedMockStream::ptr clone;
    {
        SharedMockStream stream;
        stream.pushBytesToRead("still here");
        clone = stream.clone();
    }
    MOCKIO_TEST_ASSERT_EQUAL(clone->getDelimited(' '), "still ");
    MOCKIO_TEST_ASSERT_EQUAL(clone->readAvailable(), 4u);
}

MOCKIO_UNITTEST(SharedMockStream, zeroLength)
{
    SharedMockStream stream;
    stream.pushBytesToRead("abc");
    char buffer[1];
    MOCKIO_TEST_ASSERT_EQUAL(stream.read(buffer, 0), 0u);
    MOCKIO_TEST_ASSERT_EQUAL(stream.readAvailable(), 3u);
    MOCKIO_TEST_ASSERT_EQUAL(stream.write(buffer, 0), 0u);
    MOCKIO_TEST_ASSERT(stream.popBytesWritten().empty());
    stream.flush();
}

MOCKIO_UNITTEST(SharedMockStream, embeddedInCodeUnderTest)
{
    SharedMockStream stream;
    LineEcho echo(stream.clone());

    stream.pushBytesToRead("hello\nworld");
    MOCKIO_TEST_ASSERT(echo.echoLine());
    MOCKIO_TEST_ASSERT_EQUAL(stream.popBytesWritten(), "HELLO\n");
    MOCKIO_TEST_ASSERT(echo.echoLine());
    MOCKIO_TEST_ASSERT_EQUAL(stream.popBytesWritten(), "WORLD");
    MOCKIO_TEST_ASSERT(!echo.echoLine());
    MOCKIO_TEST_ASSERT(stream.popBytesWritten().empty());

    stream.pushBytesToRead("again\n");
    MOCKIO_TEST_ASSERT(echo.echoLine());
    MOCKIO_TEST_ASSERT_EQUAL(stream.popBytesWritten(), "AGAIN\n");
}

static void writeRecords(SharedMockStream::ptr stream, char c, int count)
{
    std::string record(16, c);
    for (int i = 0; i < count; ++i)
        stream->write(record.data(), record.size());
}

MOCKIO_UNITTEST(SharedMockStream, concurrentWritesAreNotTorn)
{
    SharedMockStream stream;
    boost::thread_group threads;
    for (int i = 0; i < 4; ++i)
        threads.create_thread(boost::bind(&writeRecords, stream.clone(),
            (char)('a' + i), 500));
    threads.join_all();

    std::string written = stream.popBytesWritten();
    MOCKIO_TEST_ASSERT_EQUAL(written.size(), 4u * 500u * 16u);
    size_t counts[4] = { 0, 0, 0, 0 };
    for (size_t i = 0; i < written.size(); i += 16) {
        MOCKIO_TEST_ASSERT_EQUAL(written.substr(i, 16),
            std::string(16, written[i]));
        MOCKIO_TEST_ASSERT_GREATER_THAN_OR_EQUAL(written[i], 'a');
        MOCKIO_TEST_ASSERT_LESS_THAN_OR_EQUAL(written[i], 'd');
        ++counts[written[i] - 'a'];
    }
    for (int i = 0; i < 4; ++i)
        MOCKIO_TEST_ASSERT_EQUAL(counts[i], 500u);
}

static void produce(SharedMockStream::ptr stream, int total)
{
    for (int i = 0; i < total; ++i) {
        char c = (char)(i % 251);
        stream->pushBytesToRead(&c, 1);
        if (i % 64 == 0)
            boost::this_thread::yield();
    }
}

MOCKIO_UNITTEST(SharedMockStream, concurrentProducerConsumer)
{
    SharedMockStream stream;
    const int total = 10000;
    boost::thread producer(boost::bind(&produce, stream.clone(), total));

    std::string received;
    char buffer[37];
    while (received.size() < (size_t)total) {
        size_t read = stream.read(buffer, sizeof(buffer));
        if (read == 0)
            boost::this_thread::yield();
        received.append(buffer, read);
    }
    producer.join();

    MOCKIO_TEST_ASSERT_EQUAL(received.size(), (size_t)total);
    for (int i = 0; i < total; ++i)
        MOCKIO_TEST_ASSERT_EQUAL(received[i], (char)(i % 251));
    MOCKIO_TEST_ASSERT_EQUAL(stream.read(buffer, sizeof(buffer)), 0u);
}
