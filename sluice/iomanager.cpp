// Copyright (c) 2009 - Mozy, Inc.

#include "iomanager.h"

#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <string.h>
#include <sys/epoll.h>
#include <unistd.h>

#include <algorithm>

#include "assert.h"
#include "fiber.h"
#include "log.h"

namespace Sluice {

static Logger::ptr g_log = Log::lookup("sluice:iomanager");

static const char *
opName(int op)
{
    switch (op) {
        case EPOLL_CTL_ADD:
            return "EPOLL_CTL_ADD";
        case EPOLL_CTL_MOD:
            return "EPOLL_CTL_MOD";
        default:
            return "EPOLL_CTL_DEL";
    }
}

static uint32_t
interest(const boost::shared_ptr<Fiber> &reader,
    const boost::shared_ptr<Fiber> &writer)
{
    return (reader ? EPOLLIN : 0) | (writer ? EPOLLOUT : 0);
}

IOManager::IOManager(size_t threads, bool useCaller)
    : Scheduler(threads, useCaller),
      m_parked(0)
{
    m_epfd = epoll_create1(EPOLL_CLOEXEC);
    if (m_epfd < 0) {
        SLUICE_LOG_ERROR(g_log) << this << " epoll_create1(): ("
            << errno << ")";
        SLUICE_THROW_EXCEPTION_FROM_LAST_ERROR_API("epoll_create1");
    }
    if (pipe2(m_tickleFds, O_NONBLOCK | O_CLOEXEC)) {
        int error = errno;
        close(m_epfd);
        SLUICE_THROW_EXCEPTION_FROM_ERROR_API(error, "pipe2");
    }
    int error = control(EPOLL_CTL_ADD, m_tickleFds[0], EPOLLIN);
    if (error) {
        close(m_tickleFds[0]);
        close(m_tickleFds[1]);
        close(m_epfd);
        SLUICE_THROW_EXCEPTION_FROM_ERROR_API(error, "epoll_ctl");
    }
    start();
}

IOManager::~IOManager()
{
    stop();
    SLUICE_ASSERT(m_waiters.empty());
    close(m_tickleFds[0]);
    close(m_tickleFds[1]);
    close(m_epfd);
    SLUICE_LOG_TRACE(g_log) << this << " closed epoll " << m_epfd;
}

int
IOManager::control(int op, int fd, uint32_t events)
{
    epoll_event event;
    memset(&event, 0, sizeof(epoll_event));
    event.events = events;
    event.data.fd = fd;
    if (epoll_ctl(m_epfd, op, fd, &event)) {
        int error = errno;
        SLUICE_LOG_ERROR(g_log) << this << " epoll_ctl(" << m_epfd << ", "
            << opName(op) << ", " << fd << ", " << events << "): (" << error
            << ")";
        return error;
    }
    SLUICE_LOG_TRACE(g_log) << this << " epoll_ctl(" << m_epfd << ", "
        << opName(op) << ", " << fd << ", " << events << ")";
    return 0;
}

void
IOManager::registerEvent(int fd, Event event)
{
    SLUICE_ASSERT(fd >= 0);
    SLUICE_ASSERT(event == READ || event == WRITE);
    SLUICE_ASSERT(Scheduler::getThis() == this);
    boost::mutex::scoped_lock lock(m_mutex);
    std::pair<WaiterMap::iterator, bool> entry =
        m_waiters.insert(std::make_pair(fd, Waiters()));
    Waiters &waiters = entry.first->second;
    boost::shared_ptr<Fiber> &slot =
        event == READ ? waiters.reader : waiters.writer;
    SLUICE_ASSERT(!slot);
    slot = Fiber::getThis();
    int error = control(entry.second ? EPOLL_CTL_ADD : EPOLL_CTL_MOD, fd,
        interest(waiters.reader, waiters.writer));
    if (error) {
        slot.reset();
        if (entry.second)
            m_waiters.erase(entry.first);
        SLUICE_THROW_EXCEPTION_FROM_ERROR_API(error, "epoll_ctl");
    }
    ++m_parked;
}

bool
IOManager::cancelEvent(int fd, Event event)
{
    SLUICE_ASSERT(event == READ || event == WRITE);
    boost::mutex::scoped_lock lock(m_mutex);
    WaiterMap::iterator it = m_waiters.find(fd);
    if (it == m_waiters.end())
        return false;
    const boost::shared_ptr<Fiber> &slot =
        event == READ ? it->second.reader : it->second.writer;
    if (!slot)
        return false;
    SLUICE_LOG_DEBUG(g_log) << this << " cancelling "
        << (event == READ ? "read" : "write") << " on " << fd;
    wake(it, event == READ ? EPOLLIN : EPOLLOUT);
    return true;
}

// m_mutex is held
void
IOManager::wake(WaiterMap::iterator it, uint32_t ready)
{
    int fd = it->first;
    Waiters &waiters = it->second;
    if ((ready & EPOLLIN) && waiters.reader) {
        schedule(waiters.reader);
        waiters.reader.reset();
        --m_parked;
    }
    if ((ready & EPOLLOUT) && waiters.writer) {
        schedule(waiters.writer);
        waiters.writer.reset();
        --m_parked;
    }
    uint32_t remaining = interest(waiters.reader, waiters.writer);
    if (!remaining)
        m_waiters.erase(it);
    int error = control(remaining ? EPOLL_CTL_MOD : EPOLL_CTL_DEL, fd,
        remaining);
    if (error)
        SLUICE_THROW_EXCEPTION_FROM_ERROR_API(error, "epoll_ctl");
}

bool
IOManager::stopping()
{
    if (nextTimer() != ~0ull)
        return false;
    {
        boost::mutex::scoped_lock lock(m_mutex);
        if (m_parked)
            return false;
    }
    return Scheduler::stopping();
}

void
IOManager::idle()
{
    unsigned long long next = nextTimer();
    int timeout = -1;
    // Round up, so the timer is due by the time epoll_wait returns
    if (next != ~0ull)
        timeout = (int)std::min<unsigned long long>(next / 1000 + 1, INT_MAX);
    epoll_event events[64];
    int rc = epoll_wait(m_epfd, events, 64, timeout);
    if (rc < 0) {
        int error = errno;
        if (error == EINTR)
            return;
        SLUICE_LOG_ERROR(g_log) << this << " epoll_wait(" << m_epfd << ", "
            << timeout << "): (" << error << ")";
        SLUICE_THROW_EXCEPTION_FROM_ERROR_API(error, "epoll_wait");
    }
    SLUICE_LOG_TRACE(g_log) << this << " epoll_wait(" << m_epfd << ", "
        << timeout << "): " << rc;

    std::vector<boost::function<void ()> > due = processTimers();
    for (size_t i = 0; i < due.size(); ++i)
        schedule(due[i]);

    boost::mutex::scoped_lock lock(m_mutex);
    for (int i = 0; i < rc; ++i) {
        int fd = events[i].data.fd;
        if (fd == m_tickleFds[0]) {
            char drain[64];
            while (read(fd, drain, sizeof(drain)) > 0) {}
            continue;
        }
        // Cancelled, or already woken by another thread
        WaiterMap::iterator it = m_waiters.find(fd);
        if (it == m_waiters.end())
            continue;
        uint32_t ready = events[i].events;
        if (ready & (EPOLLERR | EPOLLHUP))
            ready |= EPOLLIN | EPOLLOUT;
        wake(it, ready);
    }
}

void
IOManager::tickle()
{
    // A full pipe already guarantees a wakeup
    if (write(m_tickleFds[1], "T", 1) < 0 && errno != EAGAIN)
        SLUICE_THROW_EXCEPTION_FROM_LAST_ERROR_API("write");
    SLUICE_LOG_TRACE(g_log) << this << " tickled";
}

}
