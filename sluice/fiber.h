#ifndef __SLUICE_FIBER_H__
#define __SLUICE_FIBER_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <stdint.h>
#include <ucontext.h>

#include <iosfwd>
#include <vector>

#include <boost/enable_shared_from_this.hpp>
#include <boost/function.hpp>
#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/weak_ptr.hpp>

#include "exception.h"

namespace Sluice {

/// Coroutine with its own stack
///
/// Every connection the server accepts runs on a Fiber.  A Fiber is entered
/// with call() and hands control back to whoever called it with yield();
/// the Scheduler builds everything else (parking on a socket, waking on a
/// timer) out of those two switches.
class Fiber : public boost::enable_shared_from_this<Fiber>, boost::noncopyable
{
    template <class T> friend class FiberLocalStorage;
public:
    typedef boost::shared_ptr<Fiber> ptr;
    typedef boost::weak_ptr<Fiber> weak_ptr;

    enum State
    {
        /// Not started yet
        INIT,
        /// Suspended in yield()
        HOLD,
        /// Running
        EXEC,
        /// The function threw; call() rethrows it
        EXCEPT,
        /// The function returned
        TERM
    };

    /// @param stacksize Virtual size of the stack; 0 for fiber.defaultstacksize
    Fiber(boost::function<void ()> dg, size_t stacksize = 0);
    ~Fiber();

    /// Rewind a finished Fiber so it can run its function again
    /// @pre state() is INIT, TERM or EXCEPT
    void reset();
    void reset(boost::function<void ()> dg);

    /// The Fiber running on this thread; the first call on a thread wraps
    /// the thread's own stack
    static ptr getThis();

    /// Switch into this Fiber until it yields or finishes
    ///
    /// An exception that escapes the Fiber's function is rethrown here.
    /// @pre state() == INIT || state() == HOLD
    void call();

    /// call(), but make the suspended yield() throw exception
    void inject(boost::exception_ptr exception);

    /// Switch back to the Fiber that call()ed the current one
    static void yield();

    /// If this Fiber was entered through call() and so can yield()
    bool hasCaller() const { return m_caller.get() != NULL; }

    State state() const { return m_state; }

private:
    Fiber();

    static void trampoline();
    void prepareContext();

    static intptr_t &localSlot(size_t key);
    static size_t allocateLocalKey();

private:
    boost::function<void ()> m_dg;
    void *m_stack;
    size_t m_stacksize;
    ucontext_t m_ctx;
    State m_state;
    // Written by the Fiber before it switches out; its caller copies it into
    // m_state once the switch has completed
    State m_leaving;
    ptr m_caller;
    boost::exception_ptr m_exception;
    std::vector<intptr_t> m_locals;
};

std::ostream &operator<<(std::ostream &os, Fiber::State state);

/// A pointer-sized value with a separate copy in every Fiber
template <class T>
class FiberLocalStorage : boost::noncopyable
{
public:
    FiberLocalStorage() : m_key(Fiber::allocateLocalKey()) {}

    T get() const { return (T)Fiber::localSlot(m_key); }
    operator T() const { return get(); }

    FiberLocalStorage &operator =(T value)
    {
        Fiber::localSlot(m_key) = (intptr_t)value;
        return *this;
    }

private:
    size_t m_key;
};

}

#endif
