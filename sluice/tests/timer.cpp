// Copyright (c) 2009 - Mozy, Inc.

#include <boost/bind.hpp>

#include "sluice/timer.h"
#include "sluice/test/test.h"

using namespace Sluice;
using namespace Sluice::Test;

static unsigned long long g_now;

static unsigned long long fakeClock()
{
    return g_now;
}

namespace {
class FakeClock
{
public:
    FakeClock() { g_now = 100000000ull; TimerManager::setClock(&fakeClock); }
    ~FakeClock() { TimerManager::setClock(); }

    void advance(unsigned long long us) { g_now += us; }
};
}

static void
countTimer(int &fired)
{
    ++fired;
}

static void
orderedTimer(int &sequence, int expected)
{
    SLUICE_TEST_ASSERT_EQUAL(++sequence, expected);
}

SLUICE_UNITTEST(Timer, none)
{
    TimerManager manager;
    SLUICE_TEST_ASSERT_EQUAL(manager.nextTimer(), ~0ull);
    manager.executeTimers();
}

SLUICE_UNITTEST(Timer, immediate)
{
    int fired = 0;
    TimerManager manager;
    manager.registerTimer(0, boost::bind(&countTimer, boost::ref(fired)));
    SLUICE_TEST_ASSERT_EQUAL(manager.nextTimer(), 0ull);
    SLUICE_TEST_ASSERT_EQUAL(fired, 0);
    manager.executeTimers();
    SLUICE_TEST_ASSERT_EQUAL(fired, 1);
    SLUICE_TEST_ASSERT_EQUAL(manager.nextTimer(), ~0ull);
    manager.executeTimers();
    SLUICE_TEST_ASSERT_EQUAL(fired, 1);
}

SLUICE_UNITTEST(Timer, fireInDeadlineOrder)
{
    FakeClock clock;
    int sequence = 0;
    TimerManager manager;
    manager.registerTimer(300, boost::bind(&orderedTimer, boost::ref(sequence), 3));
    manager.registerTimer(100, boost::bind(&orderedTimer, boost::ref(sequence), 1));
    manager.registerTimer(200, boost::bind(&orderedTimer, boost::ref(sequence), 2));
    SLUICE_TEST_ASSERT_EQUAL(manager.nextTimer(), 100ull);
    clock.advance(150);
    manager.executeTimers();
    SLUICE_TEST_ASSERT_EQUAL(sequence, 1);
    SLUICE_TEST_ASSERT_EQUAL(manager.nextTimer(), 50ull);
    clock.advance(1000);
    manager.executeTimers();
    SLUICE_TEST_ASSERT_EQUAL(sequence, 3);
    SLUICE_TEST_ASSERT_EQUAL(manager.nextTimer(), ~0ull);
}

SLUICE_UNITTEST(Timer, cancel)
{
    int fired = 0;
    TimerManager manager;
    Timer::ptr timer =
        manager.registerTimer(0, boost::bind(&countTimer, boost::ref(fired)));
    SLUICE_TEST_ASSERT(timer->cancel());
    SLUICE_TEST_ASSERT(!timer->cancel());
    SLUICE_TEST_ASSERT_EQUAL(manager.nextTimer(), ~0ull);
    manager.executeTimers();
    SLUICE_TEST_ASSERT_EQUAL(fired, 0);
}

SLUICE_UNITTEST(Timer, cancelAfterFiring)
{
    int fired = 0;
    TimerManager manager;
    Timer::ptr timer =
        manager.registerTimer(0, boost::bind(&countTimer, boost::ref(fired)));
    manager.executeTimers();
    SLUICE_TEST_ASSERT_EQUAL(fired, 1);
    SLUICE_TEST_ASSERT(!timer->cancel());
}

SLUICE_UNITTEST(Timer, equalDeadlinesFireInOrder)
{
    FakeClock clock;
    int sequence = 0;
    TimerManager manager;
    for (int i = 1; i <= 3; ++i)
        manager.registerTimer(100,
            boost::bind(&orderedTimer, boost::ref(sequence), i));
    clock.advance(100);
    manager.executeTimers();
    SLUICE_TEST_ASSERT_EQUAL(sequence, 3);
}

namespace {
class FrontCounter : public TimerManager
{
public:
    FrontCounter() : fronts(0) {}

    int fronts;

protected:
    void onTimerInsertedAtFront() { ++fronts; }
};
}

// The IOManager only needs waking when its sleep just got shorter
SLUICE_UNITTEST(Timer, earlierTimerNotifies)
{
    FakeClock clock;
    int fired = 0;
    FrontCounter manager;
    manager.registerTimer(1000, boost::bind(&countTimer, boost::ref(fired)));
    SLUICE_TEST_ASSERT_EQUAL(manager.fronts, 1);
    manager.registerTimer(2000, boost::bind(&countTimer, boost::ref(fired)));
    manager.registerTimer(1000, boost::bind(&countTimer, boost::ref(fired)));
    SLUICE_TEST_ASSERT_EQUAL(manager.fronts, 1);
    manager.registerTimer(500, boost::bind(&countTimer, boost::ref(fired)));
    SLUICE_TEST_ASSERT_EQUAL(manager.fronts, 2);
}

SLUICE_UNITTEST(Timer, outlivesManager)
{
    int fired = 0;
    Timer::ptr timer;
    {
        TimerManager manager;
        timer = manager.registerTimer(1000,
            boost::bind(&countTimer, boost::ref(fired)));
    }
    SLUICE_TEST_ASSERT(!timer->cancel());
    SLUICE_TEST_ASSERT_EQUAL(fired, 0);
}
