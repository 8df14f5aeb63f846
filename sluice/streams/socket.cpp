// Copyright (c) 2009 - Mozy, Inc.

#include "socket.h"

#include "sluice/socket.h"

namespace Sluice {

SocketStream::SocketStream(Socket::ptr socket)
: m_socket(socket)
{
    SLUICE_ASSERT(m_socket);
}

void
SocketStream::close(CloseType type)
{
    int how = SHUT_RDWR;
    if (type == READ)
        how = SHUT_RD;
    else if (type == WRITE)
        how = SHUT_WR;
    m_socket->shutdown(how);
}

size_t
SocketStream::read(void *buffer, size_t length)
{
    return m_socket->receive(buffer, length);
}

size_t
SocketStream::write(const void *buffer, size_t length)
{
    return m_socket->send(buffer, length);
}

void
SocketStream::cancelRead()
{
    m_socket->cancelReceive();
}

void
SocketStream::cancelWrite()
{
    m_socket->cancelSend();
}

}
