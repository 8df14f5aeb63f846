#ifndef __SLUICE_IOMANAGER_H__
#define __SLUICE_IOMANAGER_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <stdint.h>

#include <map>

#include "scheduler.h"
#include "timer.h"

namespace Sluice {

class Fiber;

/// Scheduler whose idle threads wait in epoll_wait for descriptors and timers
///
/// A Fiber that would block on a socket calls registerEvent() and then
/// Scheduler::yieldTo(); it is rescheduled once epoll reports the descriptor
/// ready, or straight away if someone calls cancelEvent().
class IOManager : public Scheduler, public TimerManager
{
public:
    enum Event {
        READ  = 0x0001,
        WRITE = 0x0004
    };

    IOManager(size_t threads = 1, bool useCaller = true);
    ~IOManager();

    /// Park the current Fiber on fd until event is ready
    /// @pre No other Fiber is waiting for the same event on fd
    void registerEvent(int fd, Event event);
    /// Wake the Fiber parked on fd for event without waiting for readiness
    /// @return If a Fiber was parked there
    bool cancelEvent(int fd, Event event);

protected:
    bool stopping();
    void idle();
    void tickle();

    void onTimerInsertedAtFront() { tickle(); }

private:
    struct Waiters
    {
        boost::shared_ptr<Fiber> reader, writer;
    };
    typedef std::map<int, Waiters> WaiterMap;

    void wake(WaiterMap::iterator it, uint32_t ready);
    int control(int op, int fd, uint32_t events);

private:
    int m_epfd;
    int m_tickleFds[2];
    boost::mutex m_mutex;
    WaiterMap m_waiters;
    size_t m_parked;
};

}

#endif
