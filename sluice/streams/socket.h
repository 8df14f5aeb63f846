#ifndef __SLUICE_SOCKET_STREAM_H__
#define __SLUICE_SOCKET_STREAM_H__
// Copyright (c) 2009 - Mozy, Inc.

#include "stream.h"

namespace Sluice {

class Socket;

/// A connected Socket; reads and writes suspend the Fiber on the IOManager
/// until the kernel is ready, or until the Socket's timeout
class SocketStream : public Stream
{
public:
    explicit SocketStream(boost::shared_ptr<Socket> socket);

    /// Shuts down the matching direction; the descriptor closes with the
    /// last reference to the Socket
    void close(CloseType type = BOTH);

    using Stream::read;
    size_t read(void *buffer, size_t length);
    void cancelRead();
    using Stream::write;
    size_t write(const void *buffer, size_t length);
    void cancelWrite();

private:
    boost::shared_ptr<Socket> m_socket;
};

}

#endif
