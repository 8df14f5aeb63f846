// Copyright (c) 2009 - Mozy, Inc.

#include "sluice/string.h"
#include "sluice/test/test.h"

using namespace Sluice;
using namespace Sluice::Test;

SLUICE_UNITTEST(String, split)
{
    std::vector<std::string> pieces = split("bytes=0-99,200-", '=');
    SLUICE_TEST_ASSERT_EQUAL(pieces.size(), 2u);
    SLUICE_TEST_ASSERT_EQUAL(pieces[0], "bytes");
    SLUICE_TEST_ASSERT_EQUAL(pieces[1], "0-99,200-");

    pieces = split("a,,b,", ',');
    SLUICE_TEST_ASSERT_EQUAL(pieces.size(), 4u);
    SLUICE_TEST_ASSERT_EQUAL(pieces[1], "");
    SLUICE_TEST_ASSERT_EQUAL(pieces[3], "");

    SLUICE_TEST_ASSERT(split("", ',').empty());
}

SLUICE_UNITTEST(String, splitMax)
{
    std::vector<std::string> pieces =
        split("HTTP/1.1 416 Requested range not satisfiable", ' ', 3);
    SLUICE_TEST_ASSERT_EQUAL(pieces.size(), 3u);
    SLUICE_TEST_ASSERT_EQUAL(pieces[1], "416");
    SLUICE_TEST_ASSERT_EQUAL(pieces[2], "Requested range not satisfiable");

    SLUICE_TEST_ASSERT_ASSERTED(split("a b", ' ', 1));
}

SLUICE_UNITTEST(String, trim)
{
    SLUICE_TEST_ASSERT_EQUAL(trim(" \t value \r\n"), "value");
    SLUICE_TEST_ASSERT_EQUAL(trim("  "), "");
    SLUICE_TEST_ASSERT_EQUAL(trim("--x--", "-"), "x");
    SLUICE_TEST_ASSERT_EQUAL(trim("in side"), "in side");
}

SLUICE_UNITTEST(String, caseInsensitiveLess)
{
    caseinsensitiveless less;
    SLUICE_TEST_ASSERT(!less("Chunked", "chunked"));
    SLUICE_TEST_ASSERT(!less("chunked", "CHUNKED"));
    SLUICE_TEST_ASSERT(less("bytes", "Chunked"));
}
