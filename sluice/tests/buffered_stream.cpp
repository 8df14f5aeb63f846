// Copyright (c) 2009 - Mozy, Inc.

#include <algorithm>

#include "sluice/exception.h"
#include "sluice/streams/buffered.h"
#include "sluice/streams/memory.h"
#include "sluice/test/test.h"

using namespace Sluice;
using namespace Sluice::Test;

namespace {
// Moves at most two bytes per call, and fails every call after the first
// failAfter ones
class TrickleStream : public FilterStream
{
public:
    typedef boost::shared_ptr<TrickleStream> ptr;

    TrickleStream(Stream::ptr parent)
        : FilterStream(parent, true),
          m_failAfter(~0ull),
          m_calls(0)
    {}

    void failAfter(unsigned long long calls) { m_failAfter = calls; }

    using FilterStream::read;
    size_t read(Buffer &buffer, size_t length)
    {
        check();
        return parent()->read(buffer, std::min<size_t>(length, 2));
    }

    using FilterStream::write;
    size_t write(const Buffer &buffer, size_t length)
    {
        check();
        return parent()->write(buffer, std::min<size_t>(length, 2));
    }

private:
    void check()
    {
        if (m_calls++ >= m_failAfter)
            SLUICE_THROW_EXCEPTION(BrokenPipeException());
    }

private:
    unsigned long long m_failAfter, m_calls;
};

struct BufferedFixture
{
    BufferedFixture(const char *input = "")
        : base(new MemoryStream(Buffer(input))),
          trickle(new TrickleStream(base)),
          buffered(new BufferedStream(trickle))
    {
        buffered->bufferSize(5);
    }

    MemoryStream::ptr base;
    TrickleStream::ptr trickle;
    BufferedStream::ptr buffered;
};
}

SLUICE_UNITTEST(BufferedStream, readAhead)
{
    MemoryStream::ptr base(new MemoryStream(Buffer("0123456789abcdefghij")));
    BufferedStream buffered(base);
    buffered.bufferSize(5);

    Buffer output;
    SLUICE_TEST_ASSERT_EQUAL(buffered.read(output, 2), 2u);
    SLUICE_TEST_ASSERT(output == "01");
    // A whole buffer's worth came off the parent
    SLUICE_TEST_ASSERT_EQUAL(base->remaining().readAvailable(), 15u);

    // What was read ahead is handed out before the parent is touched again
    output.clear();
    SLUICE_TEST_ASSERT_EQUAL(buffered.read(output, 7), 3u);
    SLUICE_TEST_ASSERT(output == "234");
    SLUICE_TEST_ASSERT_EQUAL(base->remaining().readAvailable(), 15u);

    // A large read goes to the parent in one call
    output.clear();
    SLUICE_TEST_ASSERT_EQUAL(buffered.read(output, 12), 12u);
    SLUICE_TEST_ASSERT(output == "56789abcdefg");

    output.clear();
    SLUICE_TEST_ASSERT_EQUAL(buffered.read(output, 12), 3u);
    SLUICE_TEST_ASSERT_EQUAL(buffered.read(output, 12), 0u);
}

SLUICE_UNITTEST_FIXTURE(BufferedFixture, BufferedStream, shortReads)
{
    base.reset(new MemoryStream(Buffer("0123456789")));
    trickle.reset(new TrickleStream(base));
    buffered.reset(new BufferedStream(trickle));
    buffered->bufferSize(5);

    Buffer output;
    SLUICE_TEST_ASSERT_EQUAL(buffered->read(output, 5), 2u);
    SLUICE_TEST_ASSERT(output == "01");
    char raw[5];
    SLUICE_TEST_ASSERT_EQUAL(buffered->read(raw, 5), 2u);
    SLUICE_TEST_ASSERT_EQUAL(std::string(raw, 2), "23");
}

// Small writes coalesce until a buffer's worth accumulates
SLUICE_UNITTEST(BufferedStream, coalescesWrites)
{
    MemoryStream::ptr base(new MemoryStream());
    BufferedStream buffered(base);
    buffered.bufferSize(5);

    SLUICE_TEST_ASSERT_EQUAL(buffered.write("abc", 3), 3u);
    SLUICE_TEST_ASSERT_EQUAL(base->written().readAvailable(), 0u);
    SLUICE_TEST_ASSERT_EQUAL(buffered.write("de", 2), 2u);
    SLUICE_TEST_ASSERT(base->written() == "abcde");
    SLUICE_TEST_ASSERT_EQUAL(buffered.write("f", 1), 1u);
    SLUICE_TEST_ASSERT(base->written() == "abcde");
    buffered.flush();
    SLUICE_TEST_ASSERT(base->written() == "abcdef");
}

SLUICE_UNITTEST(BufferedStream, closeFlushes)
{
    MemoryStream::ptr base(new MemoryStream());
    BufferedStream buffered(base);
    buffered.write("HTTP/1.1 200 OK\r\n\r\n");
    SLUICE_TEST_ASSERT_EQUAL(base->written().readAvailable(), 0u);
    buffered.close();
    SLUICE_TEST_ASSERT(base->written() == "HTTP/1.1 200 OK\r\n\r\n");
}

// Accepted whole, even though the parent takes two bytes at a time
SLUICE_UNITTEST_FIXTURE(BufferedFixture, BufferedStream, slowParent)
{
    SLUICE_TEST_ASSERT_EQUAL(buffered->write("0123456", 7), 7u);
    SLUICE_TEST_ASSERT(base->written() == "0123");
    buffered->flush();
    SLUICE_TEST_ASSERT(base->written() == "0123456");
}

SLUICE_UNITTEST(BufferedStream, find)
{
    MemoryStream::ptr base(new MemoryStream(
        Buffer("GET / HTTP/1.1\r\nHost: a\r\n\r\n")));
    BufferedStream buffered(base);

    SLUICE_TEST_ASSERT_EQUAL(buffered.find('\n', 100), 15);
    // Nothing was consumed
    SLUICE_TEST_ASSERT_EQUAL(buffered.find('\n', 100), 15);
    SLUICE_TEST_ASSERT_EQUAL(buffered.getDelimited(), "GET / HTTP/1.1\r");
    SLUICE_TEST_ASSERT_EQUAL(buffered.getDelimited('\r'), "Host: a");
    // "\n\r\n" is left
    SLUICE_TEST_ASSERT_EQUAL(buffered.find('Z', 100), -4);
    SLUICE_TEST_ASSERT_EXCEPTION(buffered.getDelimited('Z'),
        UnexpectedEofException);
}

SLUICE_UNITTEST(BufferedStream, findLimit)
{
    MemoryStream::ptr base(new MemoryStream(Buffer("0123456789")));
    BufferedStream buffered(base);
    buffered.bufferSize(5);

    // Stops reading once limit bytes are available
    SLUICE_TEST_ASSERT_EQUAL(buffered.find('\n', 3), -6);
    SLUICE_TEST_ASSERT_EQUAL(buffered.find('7', 3), -6);
    SLUICE_TEST_ASSERT_EQUAL(buffered.find('7', 10), 7);
    SLUICE_TEST_ASSERT_EXCEPTION(buffered.getDelimited('\n', 3),
        BufferOverflowException);
}

SLUICE_UNITTEST_FIXTURE(BufferedFixture, BufferedStream, readFailure)
{
    trickle->failAfter(0);
    Buffer output;
    SLUICE_TEST_ASSERT_EXCEPTION(buffered->read(output, 5),
        BrokenPipeException);
}

SLUICE_UNITTEST_FIXTURE(BufferedFixture, BufferedStream, writeFailure)
{
    trickle->failAfter(0);
    // Nothing reached the parent, so the write fails outright and is backed
    // out
    SLUICE_TEST_ASSERT_EXCEPTION(buffered->write("01234", 5),
        BrokenPipeException);
    SLUICE_TEST_ASSERT_EQUAL(base->written().readAvailable(), 0u);
    buffered->flush();
    SLUICE_TEST_ASSERT_EQUAL(base->written().readAvailable(), 0u);
}

SLUICE_UNITTEST_FIXTURE(BufferedFixture, BufferedStream, deferredWriteFailure)
{
    trickle->failAfter(1);
    // Part of it reached the parent, so the failure waits for the next call
    SLUICE_TEST_ASSERT_EQUAL(buffered->write("0123456789", 10), 10u);
    SLUICE_TEST_ASSERT(base->written() == "01");
    SLUICE_TEST_ASSERT_EXCEPTION(buffered->flush(), BrokenPipeException);
}
