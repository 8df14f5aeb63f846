// Copyright (c) 2009 - Mozy, Inc.

#include "timer.h"

#include <time.h>

#include "assert.h"
#include "exception.h"
#include "log.h"

namespace Sluice {

static Logger::ptr g_log = Log::lookup("sluice:timer");

static boost::function<unsigned long long ()> g_clock;

Timer::Timer(boost::function<void ()> dg, TimerManager *manager)
    : m_dg(dg),
      m_manager(manager)
{}

bool
Timer::cancel()
{
    if (!m_manager)
        return false;
    boost::mutex::scoped_lock lock(m_manager->m_mutex);
    if (!m_dg)
        return false;
    m_dg = NULL;
    m_manager->m_timers.erase(m_position);
    SLUICE_LOG_TRACE(g_log) << this << " cancelled";
    return true;
}

TimerManager::~TimerManager()
{
    boost::mutex::scoped_lock lock(m_mutex);
    for (TimerQueue::iterator it = m_timers.begin(); it != m_timers.end();
        ++it) {
        it->second->m_dg = NULL;
        it->second->m_manager = NULL;
    }
}

Timer::ptr
TimerManager::registerTimer(unsigned long long us, boost::function<void ()> dg)
{
    SLUICE_ASSERT(dg);
    Timer::ptr timer(new Timer(dg, this));
    unsigned long long deadline = now() + us;
    bool atFront;
    {
        boost::mutex::scoped_lock lock(m_mutex);
        // Equal deadlines fire in the order they were registered
        timer->m_position = m_timers.insert(std::make_pair(deadline, timer));
        atFront = timer->m_position == m_timers.begin();
    }
    SLUICE_LOG_TRACE(g_log) << timer.get() << " due in " << us << "us";
    if (atFront)
        onTimerInsertedAtFront();
    return timer;
}

unsigned long long
TimerManager::nextTimer()
{
    boost::mutex::scoped_lock lock(m_mutex);
    if (m_timers.empty())
        return ~0ull;
    unsigned long long deadline = m_timers.begin()->first;
    unsigned long long current = now();
    return deadline > current ? deadline - current : 0;
}

std::vector<boost::function<void ()> >
TimerManager::processTimers()
{
    std::vector<boost::function<void ()> > due;
    unsigned long long current = now();
    boost::mutex::scoped_lock lock(m_mutex);
    TimerQueue::iterator end = m_timers.upper_bound(current);
    for (TimerQueue::iterator it = m_timers.begin(); it != end; ++it) {
        due.push_back(it->second->m_dg);
        it->second->m_dg = NULL;
    }
    m_timers.erase(m_timers.begin(), end);
    return due;
}

void
TimerManager::executeTimers()
{
    std::vector<boost::function<void ()> > due = processTimers();
    for (size_t i = 0; i < due.size(); ++i)
        due[i]();
}

unsigned long long
TimerManager::now()
{
    if (g_clock)
        return g_clock();
    timespec ts;
    if (clock_gettime(CLOCK_MONOTONIC, &ts))
        SLUICE_THROW_EXCEPTION_FROM_LAST_ERROR_API("clock_gettime");
    return ts.tv_sec * 1000000ull + ts.tv_nsec / 1000;
}

void
TimerManager::setClock(boost::function<unsigned long long ()> dg)
{
    g_clock = dg;
}

}
