#ifndef __SLUICE_SCHEDULER_H__
#define __SLUICE_SCHEDULER_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <list>
#include <vector>

#include <boost/function.hpp>
#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/thread.hpp>

namespace Sluice {

class Fiber;

/// Runs Fibers and functors on a set of threads
///
/// Work is taken from a single queue in order by whichever thread is free.
/// A Fiber that suspends itself with yieldTo() is off the queue until
/// something schedule()s it again; that is how sockets and timers park a
/// connection without holding a thread.
///
/// With useCaller the constructing thread is one of the Scheduler's threads,
/// but it only does the Scheduler's work while it is inside dispatch(),
/// stop() or yieldTo().  Only a Scheduler without spawned threads may park
/// the caller itself.
class Scheduler : boost::noncopyable
{
public:
    /// @param threads Number of threads, the caller included if useCaller
    /// @pre !useCaller || Scheduler::getThis() == NULL
    Scheduler(size_t threads = 1, bool useCaller = true);
    virtual ~Scheduler();

    /// @return The Scheduler that owns the calling thread, if any
    static Scheduler *getThis();

    void schedule(boost::shared_ptr<Fiber> fiber);
    /// dg runs on a Fiber of its own
    void schedule(boost::function<void ()> dg);

    /// Suspend the current Fiber without rescheduling it
    static void yieldTo();
    /// Suspend the current Fiber and put it at the back of the queue
    static void yield();

    /// Run queued work on the calling thread until the queue is drained
    /// @pre useCaller, no spawned threads, called from the creating thread
    void dispatch();

    /// Finish all queued work, then shut down every thread
    ///
    /// Safe to call more than once.  Must be called from outside the
    /// Scheduler's own Fibers.
    void stop();

protected:
    /// Derived constructors call this once they can idle and tickle
    void start();

    /// Queue empty, nothing running, and stop() or dispatch() requested;
    /// derived classes add the work only they know about
    virtual bool stopping();
    /// Block the calling thread until there might be more work
    virtual void idle() = 0;
    /// Wake one idle thread
    virtual void tickle() = 0;

private:
    struct Task
    {
        boost::shared_ptr<Fiber> fiber;
        boost::function<void ()> dg;
    };

    void enqueue(const Task &task);
    void run();
    void runTask(Task &task, boost::shared_ptr<Fiber> &dgFiber);
    void enterRoot();

private:
    boost::mutex m_mutex;
    std::list<Task> m_tasks;
    std::vector<boost::shared_ptr<boost::thread> > m_threads;
    size_t m_threadCount;
    size_t m_busy;
    bool m_stopping;
    boost::thread::id m_rootThread;
    // Runs the caller's share of the work; call()ed only from the caller
    boost::shared_ptr<Fiber> m_rootFiber;
    Fiber *m_callingFiber;
};

}

#endif
