// Copyright (c) 2009 - Mozy, Inc.

#include "scheduler.h"

#include <boost/bind.hpp>

#include "assert.h"
#include "fiber.h"
#include "log.h"
#include "thread_local_storage.h"

namespace Sluice {

static Logger::ptr g_log = Log::lookup("sluice:scheduler");

static ThreadLocalStorage<Scheduler *> t_scheduler;

Scheduler::Scheduler(size_t threads, bool useCaller)
    : m_threadCount(threads),
      m_busy(0),
      m_stopping(true),
      m_callingFiber(NULL)
{
    if (useCaller) {
        SLUICE_ASSERT(threads >= 1);
        SLUICE_ASSERT(!getThis());
        --m_threadCount;
        m_rootThread = boost::this_thread::get_id();
        m_rootFiber.reset(new Fiber(boost::bind(&Scheduler::run, this)));
        t_scheduler = this;
    }
}

Scheduler::~Scheduler()
{
    SLUICE_ASSERT(m_stopping);
    SLUICE_ASSERT(m_threads.empty());
    if (getThis() == this)
        t_scheduler = NULL;
}

Scheduler *
Scheduler::getThis()
{
    return t_scheduler.get();
}

void
Scheduler::start()
{
    boost::mutex::scoped_lock lock(m_mutex);
    SLUICE_ASSERT(m_threads.empty());
    m_stopping = false;
    SLUICE_LOG_VERBOSE(g_log) << this << " starting " << m_threadCount
        << " threads" << (m_rootFiber ? " plus the caller" : "");
    for (size_t i = 0; i < m_threadCount; ++i)
        m_threads.push_back(boost::shared_ptr<boost::thread>(
            new boost::thread(boost::bind(&Scheduler::run, this))));
}

void
Scheduler::schedule(boost::shared_ptr<Fiber> fiber)
{
    SLUICE_ASSERT(fiber);
    Task task;
    task.fiber = fiber;
    enqueue(task);
}

void
Scheduler::schedule(boost::function<void ()> dg)
{
    SLUICE_ASSERT(dg);
    Task task;
    task.dg.swap(dg);
    enqueue(task);
}

void
Scheduler::enqueue(const Task &task)
{
    bool wasEmpty;
    {
        boost::mutex::scoped_lock lock(m_mutex);
        wasEmpty = m_tasks.empty();
        m_tasks.push_back(task);
    }
    SLUICE_LOG_TRACE(g_log) << this << " scheduled "
        << (task.fiber ? "fiber " : "functor ") << task.fiber.get();
    // A thread of this Scheduler gets back to the queue on its own
    if (wasEmpty && getThis() != this)
        tickle();
}

void
Scheduler::yieldTo()
{
    Scheduler *self = getThis();
    SLUICE_ASSERT(self);
    if (Fiber::getThis()->hasCaller()) {
        Fiber::yield();
        return;
    }
    // The caller's own stack can't be suspended into a queue; work on the
    // root fiber until the queue hands it back
    SLUICE_ASSERT(self->m_rootFiber);
    SLUICE_ASSERT(self->m_threads.empty());
    self->enterRoot();
}

void
Scheduler::yield()
{
    Scheduler *self = getThis();
    SLUICE_ASSERT(self);
    self->schedule(Fiber::getThis());
    yieldTo();
}

void
Scheduler::dispatch()
{
    SLUICE_ASSERT(m_rootFiber);
    SLUICE_ASSERT(m_threads.empty());
    SLUICE_ASSERT(boost::this_thread::get_id() == m_rootThread);
    {
        boost::mutex::scoped_lock lock(m_mutex);
        m_stopping = true;
    }
    SLUICE_LOG_DEBUG(g_log) << this << " dispatching";
    enterRoot();
}

void
Scheduler::stop()
{
    if (m_rootFiber)
        SLUICE_ASSERT(boost::this_thread::get_id() == m_rootThread);
    else
        SLUICE_ASSERT(getThis() != this);
    SLUICE_ASSERT(!Fiber::getThis()->hasCaller());
    {
        boost::mutex::scoped_lock lock(m_mutex);
        m_stopping = true;
    }
    SLUICE_LOG_VERBOSE(g_log) << this << " stopping";
    for (size_t i = 0; i < m_threads.size(); ++i)
        tickle();
    if (m_rootFiber) {
        do {
            enterRoot();
        } while (m_rootFiber->state() == Fiber::HOLD);
    }
    std::vector<boost::shared_ptr<boost::thread> > threads;
    {
        boost::mutex::scoped_lock lock(m_mutex);
        threads.swap(m_threads);
    }
    for (size_t i = 0; i < threads.size(); ++i)
        threads[i]->join();
    SLUICE_LOG_VERBOSE(g_log) << this << " stopped";
}

bool
Scheduler::stopping()
{
    boost::mutex::scoped_lock lock(m_mutex);
    return m_stopping && m_tasks.empty() && m_busy == 0;
}

void
Scheduler::enterRoot()
{
    {
        boost::mutex::scoped_lock lock(m_mutex);
        m_callingFiber = Fiber::getThis().get();
    }
    Fiber::State state = m_rootFiber->state();
    if (state == Fiber::TERM || state == Fiber::EXCEPT)
        m_rootFiber->reset();
    m_rootFiber->call();
}

void
Scheduler::run()
{
    t_scheduler = this;
    const bool onRoot = boost::this_thread::get_id() == m_rootThread;
    SLUICE_LOG_DEBUG(g_log) << this << " running on "
        << (onRoot ? "the caller" : "a spawned thread");
    boost::shared_ptr<Fiber> dgFiber;
    while (true) {
        Task task;
        bool backToCaller = false, pending = false;
        {
            boost::mutex::scoped_lock lock(m_mutex);
            std::list<Task>::iterator it = m_tasks.begin();
            for (; it != m_tasks.end(); ++it) {
                Fiber *fiber = it->fiber.get();
                if (fiber && fiber == m_callingFiber) {
                    SLUICE_ASSERT(onRoot);
                    backToCaller = true;
                    break;
                }
                // Rescheduled before it finished switching out elsewhere
                if (fiber && fiber->state() == Fiber::EXEC) {
                    pending = true;
                    continue;
                }
                break;
            }
            if (it != m_tasks.end()) {
                task = *it;
                m_tasks.erase(it);
                if (!backToCaller)
                    ++m_busy;
            }
        }
        if (backToCaller) {
            SLUICE_LOG_TRACE(g_log) << this << " returning to the caller";
            Fiber::yield();
            continue;
        }
        if (task.fiber || task.dg) {
            try {
                runTask(task, dgFiber);
            } catch (...) {
                boost::mutex::scoped_lock lock(m_mutex);
                --m_busy;
                throw;
            }
            boost::mutex::scoped_lock lock(m_mutex);
            --m_busy;
            continue;
        }
        if (pending)
            continue;
        if (stopping())
            break;
        idle();
    }
    SLUICE_LOG_DEBUG(g_log) << this << " queue drained";
    // Pass the news on to the next idle thread
    tickle();
}

void
Scheduler::runTask(Task &task, boost::shared_ptr<Fiber> &dgFiber)
{
    try {
        if (task.fiber) {
            if (task.fiber->state() != Fiber::TERM)
                task.fiber->call();
            return;
        }
        if (dgFiber)
            dgFiber->reset(task.dg);
        else
            dgFiber.reset(new Fiber(task.dg));
        task.dg = NULL;
        dgFiber->call();
        // Parked; whatever wakes it now owns it
        if (dgFiber->state() != Fiber::TERM)
            dgFiber.reset();
    } catch (...) {
        SLUICE_LOG_FATAL(g_log) << this << " "
            << boost::current_exception_diagnostic_information();
        throw;
    }
}

}
