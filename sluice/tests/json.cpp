// Copyright (c) 2009 - Mozy, Inc.

#include <sstream>

#include "sluice/json.h"
#include "sluice/test/test.h"

using namespace Sluice;
using namespace Sluice::JSON;
using namespace Sluice::Test;

static std::string
serialize(const Value &value)
{
    std::ostringstream os;
    os << value;
    return os.str();
}

SLUICE_UNITTEST(JSON, scalars)
{
    SLUICE_TEST_ASSERT_EQUAL(serialize(Value()), "null");
    SLUICE_TEST_ASSERT_EQUAL(serialize(Value(5)), "5");
    SLUICE_TEST_ASSERT_EQUAL(serialize(Value(-12ll)), "-12");
    SLUICE_TEST_ASSERT_EQUAL(serialize(Value(18446744073709551ull)),
        "18446744073709551");
    SLUICE_TEST_ASSERT_EQUAL(serialize(Value(0.5)), "0.5");
    SLUICE_TEST_ASSERT_EQUAL(serialize(Value(std::string("abc"))), "\"abc\"");
}

SLUICE_UNITTEST(JSON, accessors)
{
    Value value(42u);
    SLUICE_TEST_ASSERT_EQUAL(value.get<long long>(), 42ll);
    SLUICE_TEST_ASSERT_EXCEPTION(value.get<std::string>(), boost::bad_get);
    SLUICE_TEST_ASSERT(Value().isBlank());
    SLUICE_TEST_ASSERT(!value.isBlank());
}

SLUICE_UNITTEST(JSON, object)
{
    Value root;
    root["error"] = std::string("No space left on device");
    root["bytesWritten"] = 65536ull;
    SLUICE_TEST_ASSERT_EQUAL(root.get<Object>().size(), 2u);
    // Members come out in key order
    SLUICE_TEST_ASSERT_EQUAL(serialize(root),
        "{\"bytesWritten\": 65536, \"error\": \"No space left on device\"}");

    root["bytesWritten"] = 0;
    SLUICE_TEST_ASSERT_EQUAL(root["bytesWritten"].get<long long>(), 0ll);
}

SLUICE_UNITTEST(JSON, nested)
{
    Array array;
    array.push_back(Value(1));
    array.push_back(Value(std::string("two")));
    array.push_back(Value());
    Value root;
    root["list"] = array;
    root["empty"] = Object();
    SLUICE_TEST_ASSERT_EQUAL(serialize(root),
        "{\"empty\": {}, \"list\": [1, \"two\", null]}");
}

SLUICE_UNITTEST(JSON, escaping)
{
    SLUICE_TEST_ASSERT_EQUAL(quote("\"\\\b\f\n\r\t\x1b"), "\"\\\"\\\\\\b\\f\\n\\r\\t\\u001b\"");
    SLUICE_TEST_ASSERT_EQUAL(quote("caf\xc3\xa9"), "\"caf\xc3\xa9\"");
}
