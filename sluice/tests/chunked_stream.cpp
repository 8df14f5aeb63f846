// Copyright (c) 2009 - Mozy, Inc.

#include "sluice/http/chunked.h"
#include "sluice/streams/buffered.h"
#include "sluice/streams/memory.h"
#include "sluice/test/test.h"

using namespace Sluice;
using namespace Sluice::HTTP;
using namespace Sluice::Test;

static Stream::ptr
decoder(const char *wire)
{
    Stream::ptr buffered(new BufferedStream(
        Stream::ptr(new MemoryStream(Buffer(wire)))));
    return Stream::ptr(new ChunkedStream(buffered));
}

static std::string
decodeAll(const char *wire)
{
    Stream::ptr chunked = decoder(wire);
    Buffer output;
    while (chunked->read(output, 64) > 0);
    return output.toString();
}

SLUICE_UNITTEST(ChunkedStream, lastChunkOnly)
{
    Stream::ptr chunked = decoder("0\r\n\r\n");
    Buffer output;
    SLUICE_TEST_ASSERT_EQUAL(chunked->read(output, 10), 0u);
    // Stays at EOF
    SLUICE_TEST_ASSERT_EQUAL(chunked->read(output, 10), 0u);
}

SLUICE_UNITTEST(ChunkedStream, readsStopAtChunkBoundaries)
{
    Stream::ptr chunked =
        decoder("a\r\nhelloworld\r\n5\r\nagain\r\n0\r\n\r\n");
    Buffer output;
    SLUICE_TEST_ASSERT_EQUAL(chunked->read(output, 15), 10u);
    SLUICE_TEST_ASSERT_EQUAL(chunked->read(output, 3), 3u);
    SLUICE_TEST_ASSERT_EQUAL(chunked->read(output, 15), 2u);
    SLUICE_TEST_ASSERT_EQUAL(chunked->read(output, 15), 0u);
    SLUICE_TEST_ASSERT(output == "helloworldagain");
}

SLUICE_UNITTEST(ChunkedStream, extensionsAndTrailer)
{
    SLUICE_TEST_ASSERT_EQUAL(
        decodeAll("A;name=value\r\nhelloworld\r\n0\r\nX-Sum: 12\r\n\r\n"),
        "helloworld");
}

SLUICE_UNITTEST(ChunkedStream, bareLineFeeds)
{
    SLUICE_TEST_ASSERT_EQUAL(decodeAll("3\nabc\n0\n\n"), "abc");
}

SLUICE_UNITTEST(ChunkedStream, badSizeLine)
{
    Stream::ptr chunked = decoder("zz\r\nhelloworld\r\n0\r\n\r\n");
    Buffer output;
    try {
        chunked->read(output, 15);
        SLUICE_TEST_ASSERT(false);
    } catch (const InvalidChunkException &ex) {
        SLUICE_TEST_ASSERT_EQUAL(ex.line(), "zz");
    }
    SLUICE_TEST_ASSERT_EXCEPTION(decodeAll("\r\nhello\r\n"),
        InvalidChunkException);
    SLUICE_TEST_ASSERT_EXCEPTION(decodeAll("ffffffffffffffff\r\n"),
        InvalidChunkException);
}

// Chunk data longer than its size line said
SLUICE_UNITTEST(ChunkedStream, overlongData)
{
    Stream::ptr chunked = decoder("5\r\nhelloworld\r\n0\r\n\r\n");
    Buffer output;
    SLUICE_TEST_ASSERT_EQUAL(chunked->read(output, 15), 5u);
    try {
        chunked->read(output, 15);
        SLUICE_TEST_ASSERT(false);
    } catch (const InvalidChunkException &ex) {
        SLUICE_TEST_ASSERT_EQUAL(ex.line(), "world");
    }
}

SLUICE_UNITTEST(ChunkedStream, truncated)
{
    Stream::ptr chunked = decoder("a\r\nhello");
    Buffer output;
    // What arrived before EOF is still passed on
    SLUICE_TEST_ASSERT_EQUAL(chunked->read(output, 15), 5u);
    SLUICE_TEST_ASSERT_EXCEPTION(chunked->read(output, 15),
        UnexpectedEofException);
    SLUICE_TEST_ASSERT_EXCEPTION(decodeAll("5\r\nhello\r\n"),
        UnexpectedEofException);
}

SLUICE_UNITTEST(ChunkedStream, write)
{
    MemoryStream::ptr base(new MemoryStream());
    ChunkedStream chunked(base);
    SLUICE_TEST_ASSERT_EQUAL(chunked.write("hello", 5), 5u);
    Buffer big(std::string(300, 'x'));
    SLUICE_TEST_ASSERT_EQUAL(chunked.write(big, 300), 300u);
    chunked.close();
    // Closing twice doesn't repeat the last chunk
    chunked.close();
    SLUICE_TEST_ASSERT(base->written() ==
        "5\r\nhello\r\n12c\r\n" + std::string(300, 'x') + "\r\n0\r\n\r\n");
}

SLUICE_UNITTEST(ChunkedStream, encodeThenDecode)
{
    MemoryStream::ptr base(new MemoryStream());
    ChunkedStream writer(base);
    writer.write("abc", 3);
    writer.write("defgh", 5);
    writer.close(Stream::WRITE);
    std::string wire = base->written().toString();
    SLUICE_TEST_ASSERT_EQUAL(decodeAll(wire.c_str()), "abcdefgh");
}
