#ifndef __SLUICE_HTTP_SERVLET_H__
#define __SLUICE_HTTP_SERVLET_H__
// Copyright (c) 2010 - Mozy, Inc.

#include <map>
#include <string>

#include <boost/shared_ptr.hpp>

namespace Sluice {
namespace HTTP {

class ServerRequest;

class Servlet
{
public:
    typedef boost::shared_ptr<Servlet> ptr;

public:
    virtual ~Servlet() {}

    virtual void request(boost::shared_ptr<ServerRequest> request) = 0;
};

/// Dispatches different parts of the URI namespace to registered servlets
///
/// URI match rule:
/// * longest path match first; a path registered with a trailing '/' also
///   matches everything beneath it
/// * the same path is not allowed to register more than once, otherwise
///   assertion will be triggered.
/// Requests that match nothing get 404.
class ServletDispatcher : public Servlet
{
public:
    typedef boost::shared_ptr<ServletDispatcher> ptr;

public:
    void registerServlet(const std::string &path,
        boost::shared_ptr<Servlet> servlet);

    Servlet::ptr getServlet(const std::string &path) const;

    void request(boost::shared_ptr<ServerRequest> request);

    /// The path component of a request-target, without query or fragment
    static std::string path(const std::string &requestTarget);

private:
    std::map<std::string, Servlet::ptr> m_servlets;
};

}}

#endif
