#ifndef __SLUICE_SOCKET_H__
#define __SLUICE_SOCKET_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <iosfwd>
#include <vector>

#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>

#include "exception.h"
#include "iomanager.h"

#include <sys/socket.h>
#include <netinet/in.h>

namespace Sluice {

struct SocketException : virtual NativeException {};

struct AddressInUseException : virtual SocketException {};
struct ConnectionAbortedException : virtual SocketException {};
struct ConnectionResetException : virtual SocketException {};
struct ConnectionRefusedException : virtual SocketException {};
struct TimedOutException : virtual SocketException {};

typedef boost::error_info<struct tag_gaierror, int> errinfo_gaierror;
std::string to_string( errinfo_gaierror const & e );

struct NameLookupException : virtual SocketException {};

class Socket;

/// An IPv4 or IPv6 socket address
class Address
{
public:
    typedef boost::shared_ptr<Address> ptr;

    explicit Address(int family = AF_INET);
    Address(const sockaddr *name, socklen_t nameLen);

    /// 127.0.0.1:port
    static ptr loopback(unsigned short port = 0);
    /// Resolve "host", "host:service" or "[ipv6]:service"
    static std::vector<ptr> lookup(const std::string &host,
        int family = AF_UNSPEC, int type = SOCK_STREAM);

    boost::shared_ptr<Socket> createSocket(IOManager &ioManager, int type);

    int family() const { return m_storage.ss_family; }
    unsigned short port() const;
    const sockaddr *name() const { return (const sockaddr *)&m_storage; }
    sockaddr *name() { return (sockaddr *)&m_storage; }
    socklen_t nameLen() const;

private:
    sockaddr_storage m_storage;
};

std::ostream &operator <<(std::ostream &os, const Address &addr);

/// A non-blocking stream socket driven by an IOManager
///
/// A call that would block parks the calling Fiber with the IOManager until
/// the descriptor is ready. It fails with TimedOutException once the
/// direction's timeout passes, and with OperationAbortedException after a
/// cancel; either outcome sticks for every later call in that direction.
class Socket : boost::noncopyable
{
public:
    typedef boost::shared_ptr<Socket> ptr;

    Socket(IOManager &ioManager, int family, int type);
    ~Socket();

    void receiveTimeout(unsigned long long us) { m_receive.timeout = us; }
    void sendTimeout(unsigned long long us) { m_send.timeout = us; }

    void bind(Address::ptr addr);
    void connect(Address::ptr addr);
    void listen(int backlog = SOMAXCONN);
    /// Waits as a receive; cancelAccept() and receiveTimeout() apply
    Socket::ptr accept();
    void shutdown(int how = SHUT_RDWR);

    void setOption(int level, int option, const void *value, size_t len);
    template <class T>
    void setOption(int level, int option, const T &value)
    {
        setOption(level, option, &value, sizeof(T));
    }

    void cancelAccept() { cancelReceive(); }
    void cancelSend();
    void cancelReceive();

    size_t send(const void *buffer, size_t length);
    /// @return 0 once the peer has closed its half
    size_t receive(void *buffer, size_t length);

    Address::ptr localAddress();
    Address::ptr remoteAddress();

private:
    struct Direction
    {
        Direction(IOManager::Event e)
            : event(e), timeout(~0ull), cancelled(0)
        {}

        IOManager::Event event;
        unsigned long long timeout;
        int cancelled;
    };

    Socket(int fd, IOManager &ioManager, int family);

    template <bool isSend>
    size_t transfer(void *buffer, size_t length);
    void wait(Direction &direction, const char *api);
    void cancel(Direction &direction, int error);
    void check(const Direction &direction, const char *api);

private:
    int m_sock;
    int m_family;
    IOManager &m_ioManager;
    Direction m_send, m_receive;
    Address::ptr m_localAddress, m_remoteAddress;
};

}

#endif
