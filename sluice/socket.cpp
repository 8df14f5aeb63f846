// Copyright (c) 2009 - Mozy, Inc.

#include "socket.h"

#include <arpa/inet.h>
#include <errno.h>
#include <netdb.h>
#include <string.h>
#include <unistd.h>

#include <boost/bind.hpp>

#include "assert.h"
#include "log.h"

namespace Sluice {

static Logger::ptr g_log = Log::lookup("sluice:socket");

Address::Address(int family)
{
    SLUICE_ASSERT(family == AF_INET || family == AF_INET6);
    memset(&m_storage, 0, sizeof(sockaddr_storage));
    m_storage.ss_family = family;
}

Address::Address(const sockaddr *name, socklen_t nameLen)
{
    SLUICE_ASSERT(name->sa_family == AF_INET || name->sa_family == AF_INET6);
    SLUICE_ASSERT(nameLen <= sizeof(sockaddr_storage));
    memset(&m_storage, 0, sizeof(sockaddr_storage));
    memcpy(&m_storage, name, nameLen);
}

Address::ptr
Address::loopback(unsigned short port)
{
    Address::ptr result(new Address(AF_INET));
    sockaddr_in *sin = (sockaddr_in *)result->name();
    sin->sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    sin->sin_port = htons(port);
    return result;
}

unsigned short
Address::port() const
{
    if (family() == AF_INET)
        return ntohs(((const sockaddr_in *)name())->sin_port);
    return ntohs(((const sockaddr_in6 *)name())->sin6_port);
}

socklen_t
Address::nameLen() const
{
    return family() == AF_INET ? sizeof(sockaddr_in) : sizeof(sockaddr_in6);
}

Socket::ptr
Address::createSocket(IOManager &ioManager, int type)
{
    return Socket::ptr(new Socket(ioManager, family(), type));
}

static void
splitHostPort(const std::string &host, std::string &node,
    std::string &service)
{
    if (!host.empty() && host[0] == '[') {
        size_t close = host.find(']');
        if (close != std::string::npos) {
            node = host.substr(1, close - 1);
            if (close + 1 < host.size() && host[close + 1] == ':')
                service = host.substr(close + 2);
            return;
        }
    }
    size_t colon = host.find(':');
    // A second ':' makes it a bare IPv6 address
    if (colon != std::string::npos &&
        host.find(':', colon + 1) == std::string::npos) {
        node = host.substr(0, colon);
        service = host.substr(colon + 1);
    } else {
        node = host;
    }
}

std::vector<Address::ptr>
Address::lookup(const std::string &host, int family, int type)
{
    std::string node, service;
    splitHostPort(host, node, service);
    addrinfo hints, *results;
    memset(&hints, 0, sizeof(addrinfo));
    hints.ai_family = family;
    hints.ai_socktype = type;
    // ":port" binds every local address
    hints.ai_flags = AI_PASSIVE;
    int error = getaddrinfo(node.empty() ? NULL : node.c_str(),
        service.empty() ? NULL : service.c_str(), &hints, &results);
    if (error) {
        SLUICE_LOG_ERROR(g_log) << "getaddrinfo(" << host << "): (" << error
            << ")";
        SLUICE_THROW_EXCEPTION(NameLookupException()
            << errinfo_gaierror(error)
            << boost::errinfo_api_function("getaddrinfo"));
    }
    boost::shared_ptr<addrinfo> guard(results, &freeaddrinfo);
    std::vector<Address::ptr> result;
    for (addrinfo *next = results; next; next = next->ai_next) {
        if (next->ai_family != AF_INET && next->ai_family != AF_INET6)
            continue;
        result.push_back(Address::ptr(new Address(next->ai_addr,
            (socklen_t)next->ai_addrlen)));
    }
    SLUICE_LOG_DEBUG(g_log) << "getaddrinfo(" << host << "): "
        << result.size() << " addresses";
    return result;
}

std::ostream &
operator <<(std::ostream &os, const Address &addr)
{
    char buf[INET6_ADDRSTRLEN];
    const void *raw = addr.family() == AF_INET ?
        (const void *)&((const sockaddr_in *)addr.name())->sin_addr :
        (const void *)&((const sockaddr_in6 *)addr.name())->sin6_addr;
    if (!inet_ntop(addr.family(), raw, buf, sizeof(buf)))
        SLUICE_THROW_EXCEPTION_FROM_LAST_ERROR_API("inet_ntop");
    if (addr.family() == AF_INET6)
        return os << '[' << buf << "]:" << addr.port();
    return os << buf << ':' << addr.port();
}

Socket::Socket(IOManager &ioManager, int family, int type)
    : m_family(family),
      m_ioManager(ioManager),
      m_send(IOManager::WRITE),
      m_receive(IOManager::READ)
{
    m_sock = socket(family, type | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (m_sock == -1) {
        int error = errno;
        SLUICE_LOG_ERROR(g_log) << this << " socket(" << family << ", " << type
            << "): (" << error << ")";
        SLUICE_THROW_EXCEPTION_FROM_ERROR_API(error, "socket");
    }
    SLUICE_LOG_DEBUG(g_log) << this << " socket(" << family << ", " << type
        << "): " << m_sock;
}

Socket::Socket(int fd, IOManager &ioManager, int family)
    : m_sock(fd),
      m_family(family),
      m_ioManager(ioManager),
      m_send(IOManager::WRITE),
      m_receive(IOManager::READ)
{}

Socket::~Socket()
{
    if (::close(m_sock)) {
        SLUICE_LOG_ERROR(g_log) << this << " close(" << m_sock << "): ("
            << errno << ")";
    } else {
        SLUICE_LOG_VERBOSE(g_log) << this << " close(" << m_sock << ")";
    }
}

void
Socket::bind(Address::ptr addr)
{
    SLUICE_ASSERT(addr->family() == m_family);
    if (::bind(m_sock, addr->name(), addr->nameLen())) {
        int error = errno;
        SLUICE_LOG_ERROR(g_log) << this << " bind(" << m_sock << ", " << *addr
            << "): (" << error << ")";
        SLUICE_THROW_EXCEPTION_FROM_ERROR_API(error, "bind");
    }
    SLUICE_LOG_DEBUG(g_log) << this << " bind(" << m_sock << ", " << *addr
        << ")";
    // Port 0 only becomes a real port now
    m_localAddress.reset();
}

void
Socket::connect(Address::ptr addr)
{
    SLUICE_ASSERT(addr->family() == m_family);
    check(m_send, "connect");
    if (::connect(m_sock, addr->name(), addr->nameLen())) {
        int error = errno;
        if (error != EINPROGRESS) {
            SLUICE_LOG_ERROR(g_log) << this << " connect(" << m_sock << ", "
                << *addr << "): (" << error << ")";
            SLUICE_THROW_EXCEPTION_FROM_ERROR_API(error, "connect");
        }
        wait(m_send, "connect");
        socklen_t len = sizeof(int);
        if (getsockopt(m_sock, SOL_SOCKET, SO_ERROR, &error, &len))
            SLUICE_THROW_EXCEPTION_FROM_LAST_ERROR_API("getsockopt");
        if (error) {
            SLUICE_LOG_ERROR(g_log) << this << " connect(" << m_sock << ", "
                << *addr << "): (" << error << ")";
            SLUICE_THROW_EXCEPTION_FROM_ERROR_API(error, "connect");
        }
    }
    SLUICE_LOG_VERBOSE(g_log) << this << " connect(" << m_sock << ", " << *addr
        << ")";
}

void
Socket::listen(int backlog)
{
    if (::listen(m_sock, backlog)) {
        int error = errno;
        SLUICE_LOG_ERROR(g_log) << this << " listen(" << m_sock << ", "
            << backlog << "): (" << error << ")";
        SLUICE_THROW_EXCEPTION_FROM_ERROR_API(error, "listen");
    }
    SLUICE_LOG_DEBUG(g_log) << this << " listen(" << m_sock << ", " << backlog
        << ")";
}

Socket::ptr
Socket::accept()
{
    check(m_receive, "accept");
    int fd;
    while ((fd = accept4(m_sock, NULL, NULL, SOCK_NONBLOCK | SOCK_CLOEXEC))
        == -1) {
        int error = errno;
        if (error == EINTR)
            continue;
        if (error != EAGAIN && error != EWOULDBLOCK) {
            SLUICE_LOG_ERROR(g_log) << this << " accept(" << m_sock << "): ("
                << error << ")";
            SLUICE_THROW_EXCEPTION_FROM_ERROR_API(error, "accept");
        }
        wait(m_receive, "accept");
    }
    Socket::ptr result(new Socket(fd, m_ioManager, m_family));
    SLUICE_LOG_VERBOSE(g_log) << this << " accept(" << m_sock << "): " << fd;
    return result;
}

void
Socket::shutdown(int how)
{
    if (::shutdown(m_sock, how)) {
        int error = errno;
        SLUICE_LOG_ERROR(g_log) << this << " shutdown(" << m_sock << ", "
            << how << "): (" << error << ")";
        SLUICE_THROW_EXCEPTION_FROM_ERROR_API(error, "shutdown");
    }
    SLUICE_LOG_VERBOSE(g_log) << this << " shutdown(" << m_sock << ", " << how
        << ")";
}

void
Socket::setOption(int level, int option, const void *value, size_t len)
{
    if (setsockopt(m_sock, level, option, value, (socklen_t)len)) {
        int error = errno;
        SLUICE_LOG_ERROR(g_log) << this << " setsockopt(" << m_sock << ", "
            << level << ", " << option << "): (" << error << ")";
        SLUICE_THROW_EXCEPTION_FROM_ERROR_API(error, "setsockopt");
    }
}

template <bool isSend>
size_t
Socket::transfer(void *buffer, size_t length)
{
    const char *api = isSend ? "send" : "recv";
    Direction &direction = isSend ? m_send : m_receive;
    check(direction, api);
    ssize_t rc;
    while ((rc = isSend ? ::send(m_sock, buffer, length, MSG_NOSIGNAL) :
        ::recv(m_sock, buffer, length, 0)) == -1) {
        int error = errno;
        if (error == EINTR)
            continue;
        if (error != EAGAIN && error != EWOULDBLOCK) {
            SLUICE_LOG_ERROR(g_log) << this << " " << api << "(" << m_sock
                << ", " << length << "): (" << error << ")";
            SLUICE_THROW_EXCEPTION_FROM_ERROR_API(error, api);
        }
        wait(direction, api);
    }
    SLUICE_LOG_TRACE(g_log) << this << " " << api << "(" << m_sock << ", "
        << length << "): " << rc;
    return (size_t)rc;
}

size_t
Socket::send(const void *buffer, size_t length)
{
    return transfer<true>(const_cast<void *>(buffer), length);
}

size_t
Socket::receive(void *buffer, size_t length)
{
    return transfer<false>(buffer, length);
}

// The socket buffer is full (or empty); park until epoll says otherwise
void
Socket::wait(Direction &direction, const char *api)
{
    m_ioManager.registerEvent(m_sock, direction.event);
    if (direction.cancelled) {
        // Cancelled before we parked, so nobody else will wake us
        m_ioManager.cancelEvent(m_sock, direction.event);
        Scheduler::yieldTo();
    } else {
        Timer::ptr timer;
        if (direction.timeout != ~0ull)
            timer = m_ioManager.registerTimer(direction.timeout,
                boost::bind(&Socket::cancel, this, boost::ref(direction),
                    (int)ETIMEDOUT));
        Scheduler::yieldTo();
        if (timer)
            timer->cancel();
    }
    check(direction, api);
}

void
Socket::check(const Direction &direction, const char *api)
{
    if (!direction.cancelled)
        return;
    SLUICE_LOG_VERBOSE(g_log) << this << " " << api << "(" << m_sock << "): ("
        << direction.cancelled << ")";
    SLUICE_THROW_EXCEPTION_FROM_ERROR_API(direction.cancelled, api);
}

void
Socket::cancel(Direction &direction, int error)
{
    if (direction.cancelled)
        return;
    direction.cancelled = error;
    m_ioManager.cancelEvent(m_sock, direction.event);
}

void
Socket::cancelSend()
{
    cancel(m_send, ECANCELED);
}

void
Socket::cancelReceive()
{
    cancel(m_receive, ECANCELED);
}

Address::ptr
Socket::localAddress()
{
    if (!m_localAddress) {
        Address::ptr result(new Address(m_family));
        socklen_t len = sizeof(sockaddr_storage);
        if (getsockname(m_sock, result->name(), &len))
            SLUICE_THROW_EXCEPTION_FROM_LAST_ERROR_API("getsockname");
        m_localAddress = result;
    }
    return m_localAddress;
}

Address::ptr
Socket::remoteAddress()
{
    if (!m_remoteAddress) {
        Address::ptr result(new Address(m_family));
        socklen_t len = sizeof(sockaddr_storage);
        if (getpeername(m_sock, result->name(), &len))
            SLUICE_THROW_EXCEPTION_FROM_LAST_ERROR_API("getpeername");
        m_remoteAddress = result;
    }
    return m_remoteAddress;
}

}
