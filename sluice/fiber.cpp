// Copyright (c) 2009 - Mozy, Inc.

#include "fiber.h"

#include <errno.h>
#include <sys/mman.h>
#include <unistd.h>

#include <ostream>
#include <utility>

#include <boost/thread/mutex.hpp>
#include <boost/thread/tss.hpp>

#include "assert.h"
#include "config.h"
#include "log.h"
#include "thread_local_storage.h"

namespace Sluice {

static Logger::ptr g_log = Log::lookup("sluice:fiber");

static ConfigVar<size_t>::ptr g_defaultStackSize = Config::lookup<size_t>(
    "fiber.defaultstacksize", 1024 * 1024u,
    "Virtual size of a new fiber's stack; pages are only committed as the "
    "fiber touches them");

// The Fiber executing on this thread
static ThreadLocalStorage<Fiber *> t_current;
// Owns the Fiber that wraps the thread's own stack
static boost::thread_specific_ptr<Fiber::ptr> t_threadFiber;

static void
switchContext(ucontext_t &from, ucontext_t &to)
{
    if (swapcontext(&from, &to))
        SLUICE_THROW_EXCEPTION_FROM_LAST_ERROR_API("swapcontext");
}

// An exception handed over by inject() surfaces at the point of resumption
static void
throwPending(boost::exception_ptr &pending)
{
    if (!pending)
        return;
    boost::exception_ptr exception;
    std::swap(exception, pending);
    Sluice::rethrow_exception(exception);
}

Fiber::Fiber()
    : m_stack(NULL),
      m_stacksize(0),
      m_state(EXEC),
      m_leaving(EXEC)
{
    SLUICE_ASSERT(!t_current.get());
    t_current = this;
}

Fiber::Fiber(boost::function<void ()> dg, size_t stacksize)
    : m_dg(dg),
      m_stack(NULL),
      m_stacksize(stacksize ? stacksize : g_defaultStackSize->val()),
      m_state(INIT),
      m_leaving(INIT)
{
    size_t page = (size_t)sysconf(_SC_PAGESIZE);
    // One extra page at the bottom is left inaccessible, so running off the
    // end of the stack faults
    m_stacksize = (m_stacksize + page - 1) / page * page + page;
    void *stack = mmap(NULL, m_stacksize, PROT_READ | PROT_WRITE,
        MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
    if (stack == MAP_FAILED) {
        int error = errno;
        SLUICE_LOG_ERROR(g_log) << "mmap(" << m_stacksize << "): (" << error
            << ")";
        SLUICE_THROW_EXCEPTION_FROM_ERROR_API(error, "mmap");
    }
    m_stack = stack;
    if (mprotect(m_stack, page, PROT_NONE)) {
        int error = errno;
        munmap(m_stack, m_stacksize);
        SLUICE_THROW_EXCEPTION_FROM_ERROR_API(error, "mprotect");
    }
    try {
        prepareContext();
    } catch (NativeException &) {
        munmap(m_stack, m_stacksize);
        throw;
    }
}

Fiber::~Fiber()
{
    if (!m_stack) {
        if (t_current.get() == this)
            t_current = NULL;
        return;
    }
    SLUICE_ASSERT(m_state == INIT || m_state == TERM || m_state == EXCEPT);
    munmap(m_stack, m_stacksize);
}

void
Fiber::prepareContext()
{
    if (getcontext(&m_ctx))
        SLUICE_THROW_EXCEPTION_FROM_LAST_ERROR_API("getcontext");
    m_ctx.uc_link = NULL;
    m_ctx.uc_stack.ss_sp = m_stack;
    m_ctx.uc_stack.ss_size = m_stacksize;
    makecontext(&m_ctx, &Fiber::trampoline, 0);
}

void
Fiber::reset()
{
    SLUICE_ASSERT(m_stack);
    SLUICE_ASSERT(m_state == INIT || m_state == TERM || m_state == EXCEPT);
    m_exception = boost::exception_ptr();
    prepareContext();
    m_state = m_leaving = INIT;
}

void
Fiber::reset(boost::function<void ()> dg)
{
    m_dg.swap(dg);
    reset();
}

Fiber::ptr
Fiber::getThis()
{
    if (!t_current.get()) {
        Fiber::ptr threadFiber(new Fiber());
        t_threadFiber.reset(new Fiber::ptr(threadFiber));
    }
    return t_current->shared_from_this();
}

void
Fiber::call()
{
    Fiber::ptr caller = getThis();
    SLUICE_ASSERT(caller.get() != this);
    SLUICE_ASSERT(m_state == INIT || m_state == HOLD);
    SLUICE_ASSERT(!m_caller);
    SLUICE_ASSERT(m_dg);
    m_caller = caller;
    m_state = EXEC;
    t_current = this;
    switchContext(caller->m_ctx, m_ctx);
    t_current = caller.get();
    m_caller.reset();
    if (m_leaving == EXCEPT) {
        boost::exception_ptr exception = m_exception;
        m_state = EXCEPT;
        Sluice::rethrow_exception(exception);
    }
    // Last, so another thread's scheduler never resumes a half switched Fiber
    m_state = m_leaving;
}

void
Fiber::inject(boost::exception_ptr exception)
{
    SLUICE_ASSERT(exception);
    m_exception = exception;
    call();
}

void
Fiber::yield()
{
    Fiber::ptr self = getThis();
    SLUICE_ASSERT(self->m_caller);
    SLUICE_ASSERT(self->m_state == EXEC);
    self->m_leaving = HOLD;
    switchContext(self->m_ctx, self->m_caller->m_ctx);
    throwPending(self->m_exception);
}

void
Fiber::trampoline()
{
    // This frame is abandoned rather than unwound, so it holds no smart
    // pointers
    Fiber *self = t_current.get();
    SLUICE_ASSERT(self);
    self->m_leaving = TERM;
    try {
        throwPending(self->m_exception);
        self->m_dg();
    } catch (...) {
        // Rethrown from call() on the caller's stack
        self->m_exception = boost::current_exception();
        self->m_leaving = EXCEPT;
    }
    setcontext(&self->m_caller->m_ctx);
    SLUICE_NOTREACHED();
}

size_t
Fiber::allocateLocalKey()
{
    static boost::mutex mutex;
    static size_t next = 0;
    boost::mutex::scoped_lock lock(mutex);
    return next++;
}

intptr_t &
Fiber::localSlot(size_t key)
{
    Fiber::ptr self = getThis();
    if (self->m_locals.size() <= key)
        self->m_locals.resize(key + 1, 0);
    return self->m_locals[key];
}

std::ostream &operator<<(std::ostream &os, Fiber::State state)
{
    static const char *names[] = { "INIT", "HOLD", "EXEC", "EXCEPT", "TERM" };
    if (state >= Fiber::INIT && state <= Fiber::TERM)
        return os << names[state];
    return os << (int)state;
}

}
