// Copyright (c) 2026 - Sluice contributors


#include <iostream>
#include <set>

#include <boost/bind.hpp>
#include <boost/thread/mutex.hpp>

#include "sluice/config.h"
#include "sluice/daemon.h"
#include "sluice/files/file_servlet.h"
#include "sluice/http/server.h"
#include "sluice/iomanager.h"
#include "sluice/log.h"
#include "sluice/socket.h"
#include "sluice/streams/socket.h"
#include "sluice/string.h"

using namespace Sluice;

static Logger::ptr g_log = Log::lookup("sluice:sluiced");

static ConfigVar<std::string>::ptr g_root =
    Config::lookup<std::string>("sluice.root", std::string("."),
    "Directory holding the file resources");
static ConfigVar<std::string>::ptr g_listen =
    Config::lookup<std::string>("sluice.listen", std::string("0.0.0.0:8080"),
    "Comma separated addresses to listen on");
static ConfigVar<int>::ptr g_threads =
    Config::lookup("sluice.threads", 4,
    "Number of IOManager threads; file reads and writes block the thread "
    "they run on");
static ConfigVar<unsigned long long>::ptr g_idleWriteTimeout =
    Config::lookup("http.server.idlewritetimeout", 30000000ull,
    "Microseconds a send may wait for the client to accept data");
static ConfigVar<unsigned long long>::ptr g_idleReadTimeout =
    Config::lookup("http.server.idlereadtimeout", 120000000ull,
    "Microseconds a connection may wait for the client to send data");

namespace {

class Server : boost::noncopyable
{
public:
    Server(IOManager &ioManager, HTTP::Servlet::ptr servlet)
        : m_ioManager(ioManager),
          m_servlet(servlet),
          m_stopping(false)
    {}

    void listen(const std::string &addresses)
    {
        std::vector<std::string> hosts = split(addresses, ',');
        for (std::vector<std::string>::const_iterator it(hosts.begin());
            it != hosts.end();
            ++it) {
            std::string host = trim(*it);
            if (host.empty())
                continue;
            std::vector<Address::ptr> resolved = Address::lookup(host,
                AF_UNSPEC, SOCK_STREAM);
            for (std::vector<Address::ptr>::const_iterator it2(resolved.begin());
                it2 != resolved.end();
                ++it2) {
                Socket::ptr s = (*it2)->createSocket(m_ioManager, SOCK_STREAM);
                s->setOption(SOL_SOCKET, SO_REUSEADDR, 1);
                s->bind(*it2);
                s->listen();
                SLUICE_LOG_INFO(g_log) << "listening on " << **it2;
                m_listeners.push_back(s);
                m_ioManager.schedule(boost::bind(&Server::acceptLoop, this, s));
            }
        }
    }

    /// Stop accepting, and abort every connection
    void shutdown()
    {
        boost::mutex::scoped_lock lock(m_mutex);
        if (m_stopping)
            return;
        m_stopping = true;
        SLUICE_LOG_INFO(g_log) << "shutting down " << m_connections.size()
            << " connections";
        for (std::vector<Socket::ptr>::const_iterator it(m_listeners.begin());
            it != m_listeners.end();
            ++it)
            (*it)->cancelAccept();
        for (std::set<HTTP::ServerConnection::ptr>::const_iterator it(m_connections.begin());
            it != m_connections.end();
            ++it)
            (*it)->cancel();
    }

private:
    void acceptLoop(Socket::ptr listen)
    {
        while (true) {
            Socket::ptr socket;
            try {
                socket = listen->accept();
            } catch (OperationAbortedException &) {
                SLUICE_LOG_VERBOSE(g_log) << "stopped accepting on "
                    << *listen->localAddress();
                return;
            } catch (SocketException &) {
                SLUICE_LOG_WARNING(g_log) << "accept failed: "
                    << boost::current_exception_diagnostic_information();
                continue;
            }
            socket->sendTimeout(g_idleWriteTimeout->val());
            socket->receiveTimeout(g_idleReadTimeout->val());
            m_ioManager.schedule(boost::bind(&Server::serve, this, socket));
        }
    }

    void serve(Socket::ptr socket)
    {
        Address::ptr remote;
        try {
            remote = socket->remoteAddress();
        } catch (SocketException &) {
            SLUICE_LOG_VERBOSE(g_log) << "connection gone before it was served: "
                << boost::current_exception_diagnostic_information();
            return;
        }
        SLUICE_LOG_INFO(g_log) << "accepted " << *remote;
        Stream::ptr stream(new SocketStream(socket));
        HTTP::ServerConnection::ptr conn(new HTTP::ServerConnection(stream,
            boost::bind(&HTTP::Servlet::request, m_servlet, _1)));
        {
            boost::mutex::scoped_lock lock(m_mutex);
            if (m_stopping)
                conn->cancel();
            else
                m_connections.insert(conn);
        }
        conn->processRequests();
        {
            boost::mutex::scoped_lock lock(m_mutex);
            m_connections.erase(conn);
        }
        SLUICE_LOG_INFO(g_log) << "closed " << *remote << " after "
            << conn->requestCount() << " requests";
    }

private:
    IOManager &m_ioManager;
    HTTP::Servlet::ptr m_servlet;
    boost::mutex m_mutex;
    bool m_stopping;
    std::vector<Socket::ptr> m_listeners;
    std::set<HTTP::ServerConnection::ptr> m_connections;
};

}

static void requestShutdown(IOManager &ioManager, Server &server)
{
    ioManager.schedule(boost::bind(&Server::shutdown, &server));
}

// Values the environment gets wrong are logged and left as they were
static void reload()
{
    Config::loadFromEnvironment();
    SLUICE_LOG_INFO(g_log) << "configuration reloaded";
}

static int daemonMain(int argc, char *argv[])
{
    try {
        int threads = g_threads->val();
        IOManager ioManager(threads > 0 ? threads : 1);

        ChunkSource::ptr source(new FileChunkSource(g_root->val()));
        HTTP::ServletDispatcher::ptr dispatcher(new HTTP::ServletDispatcher());
        dispatcher->registerServlet("/files/",
            HTTP::Servlet::ptr(new FileServlet(source)));
        SLUICE_LOG_INFO(g_log) << "serving " << g_root->val() << " with "
            << FileServlet::chunkSize() << " byte chunks";

        Server server(ioManager, dispatcher);
        boost::signals2::scoped_connection terminate(Daemon::onTerminate.connect(
            boost::bind(&requestShutdown, boost::ref(ioManager),
                boost::ref(server))));
        boost::signals2::scoped_connection interrupt(Daemon::onInterrupt.connect(
            boost::bind(&requestShutdown, boost::ref(ioManager),
                boost::ref(server))));
        boost::signals2::scoped_connection reloadConnection(
            Daemon::onReload.connect(&reload));
        try {
            server.listen(g_listen->val());
        } catch (SocketException &) {
            server.shutdown();
            ioManager.stop();
            throw;
        }
        // Returns once the listeners and connections are all gone
        ioManager.stop();
    } catch (std::exception &) {
        SLUICE_LOG_FATAL(g_log) << boost::current_exception_diagnostic_information();
        std::cerr << boost::current_exception_diagnostic_information() << std::endl;
        return 1;
    }
    return 0;
}

int main(int argc, char *argv[])
{
    try {
        Config::loadFromEnvironment();
        Config::loadFromCommandLine(argc, argv);
    } catch (std::invalid_argument &ex) {
        std::cerr << "Invalid value for " << ex.what() << std::endl;
        return 1;
    }
    return Daemon::run(argc, argv, &daemonMain);
}
