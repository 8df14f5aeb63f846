// Copyright (c) 2010 - Mozy, Inc.

#include "servlet.h"

#include "sluice/assert.h"
#include "server.h"

namespace Sluice {
namespace HTTP {

void
ServletDispatcher::registerServlet(const std::string &path,
    Servlet::ptr servlet)
{
    SLUICE_ASSERT(!path.empty() && path[0] == '/');
    SLUICE_ASSERT(servlet);
    SLUICE_ASSERT(m_servlets.insert(std::make_pair(path, servlet)).second);
}

Servlet::ptr
ServletDispatcher::getServlet(const std::string &path) const
{
    std::string copy(path);
    while (!copy.empty()) {
        std::map<std::string, Servlet::ptr>::const_iterator it =
            m_servlets.find(copy);
        if (it != m_servlets.end() &&
            (copy == path || copy[copy.size() - 1] == '/'))
            return it->second;
        // can't find any match, shorten the path
        if (copy[copy.size() - 1] == '/')
            copy.resize(copy.size() - 1);
        else
            copy.resize(copy.rfind('/') + 1);
    }
    return Servlet::ptr();
}

std::string
ServletDispatcher::path(const std::string &requestTarget)
{
    std::string result(requestTarget);
    // absolute-form
    size_t scheme = result.find("://");
    if (scheme != std::string::npos && scheme < result.find('/')) {
        size_t slash = result.find('/', scheme + 3);
        result = slash == std::string::npos ? "/" : result.substr(slash);
    }
    size_t end = result.find_first_of("?#");
    if (end != std::string::npos)
        result.resize(end);
    return result;
}

void
ServletDispatcher::request(ServerRequest::ptr request)
{
    Servlet::ptr servlet = getServlet(path(request->request().requestLine.uri));
    if (servlet)
        servlet->request(request);
    else
        respondError(request, NOT_FOUND, reason(NOT_FOUND));
}

}}
