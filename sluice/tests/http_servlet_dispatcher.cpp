// Copyright (c) 2010 - Mozy, Inc.

#include "sluice/http/servlet.h"
#include "sluice/test/test.h"

using namespace Sluice;
using namespace Sluice::HTTP;

namespace {
class DummyServlet : public Servlet
{
public:
    void request(boost::shared_ptr<ServerRequest> request) {}
};
}

SLUICE_UNITTEST(ServletDispatcher, basic)
{
    ServletDispatcher dispatcher;
    Servlet::ptr root(new DummyServlet), ab(new DummyServlet),
        files(new DummyServlet);

    SLUICE_TEST_ASSERT(!dispatcher.getServlet("/d/e/f"));

    dispatcher.registerServlet("/", root);
    dispatcher.registerServlet("/a/b", ab);
    dispatcher.registerServlet("/files/", files);

    SLUICE_TEST_ASSERT_EQUAL(dispatcher.getServlet("/"), root);
    SLUICE_TEST_ASSERT_EQUAL(dispatcher.getServlet("/d/e/f"), root);
    SLUICE_TEST_ASSERT_EQUAL(dispatcher.getServlet("/a/b"), ab);
    // Without a trailing '/', only the exact path matches
    SLUICE_TEST_ASSERT_EQUAL(dispatcher.getServlet("/a/b/c"), root);
    SLUICE_TEST_ASSERT_EQUAL(dispatcher.getServlet("/A/B"), root);
    SLUICE_TEST_ASSERT_EQUAL(dispatcher.getServlet("/a/bc"), root);
    SLUICE_TEST_ASSERT_EQUAL(dispatcher.getServlet("/files/"), files);
    SLUICE_TEST_ASSERT_EQUAL(dispatcher.getServlet("/files/1196798"), files);
    SLUICE_TEST_ASSERT_EQUAL(dispatcher.getServlet("/files/a/b"), files);
    SLUICE_TEST_ASSERT_EQUAL(dispatcher.getServlet("/files"), root);
}

SLUICE_UNITTEST(ServletDispatcher, noRoot)
{
    ServletDispatcher dispatcher;
    Servlet::ptr files(new DummyServlet);
    dispatcher.registerServlet("/files/", files);

    SLUICE_TEST_ASSERT(!dispatcher.getServlet("/"));
    SLUICE_TEST_ASSERT(!dispatcher.getServlet("/other/files/"));
    SLUICE_TEST_ASSERT(!dispatcher.getServlet("files/abc"));
    SLUICE_TEST_ASSERT_EQUAL(dispatcher.getServlet("/files/abc"), files);
}

SLUICE_UNITTEST(ServletDispatcher, duplicate)
{
    ServletDispatcher dispatcher;
    Servlet::ptr files(new DummyServlet);
    dispatcher.registerServlet("/files/", files);
    SLUICE_TEST_ASSERT_ASSERTED(dispatcher.registerServlet("/files/", files));
}

SLUICE_UNITTEST(ServletDispatcher, path)
{
    SLUICE_TEST_ASSERT_EQUAL(ServletDispatcher::path("/files/abc"), "/files/abc");
    SLUICE_TEST_ASSERT_EQUAL(ServletDispatcher::path("/files/abc?v=1"), "/files/abc");
    SLUICE_TEST_ASSERT_EQUAL(ServletDispatcher::path("/files/abc#top"), "/files/abc");
    SLUICE_TEST_ASSERT_EQUAL(ServletDispatcher::path("http://host:8080/files/abc"),
        "/files/abc");
    SLUICE_TEST_ASSERT_EQUAL(ServletDispatcher::path("http://host"), "/");
}
