#include "manual_clock.hpp"
#include "tabletimer/log.hpp"
#include "tabletimer/scheduler.hpp"
#include <cassert>

using namespace tabletimer;
using tabletimer::test::ManualClock;
using tabletimer::test::runFor;

int main() {
  LOG("Test 1: One-shot and repeating handles");
  {
    ManualClock clock;
    Poller poller(clock.function());
    Scheduler scheduler(poller);
    int once = 0;
    int repeating = 0;

    Scheduler::HandleID once_handle =
        scheduler.scheduleOnce(300, [&] { once++; });
    scheduler.scheduleRepeating(200, [&] { repeating++; });

    runFor(poller, clock, 1000);
    assert(once == 1);
    assert(repeating == 5);
    assert(!scheduler.isActive(once_handle));
    assert(scheduler.size() == 1);
    LOG("✓ One-shot fired once, repeating every period");
  }

  LOG("\nTest 2: Pause keeps the phase of a repeating handle");
  {
    ManualClock clock;
    Poller poller(clock.function());
    Scheduler scheduler(poller);
    int fired = 0;

    Scheduler::HandleID handle =
        scheduler.scheduleRepeating(5000, [&] { fired++; });

    runFor(poller, clock, 2000);
    scheduler.pauseAll();
    assert(scheduler.isPaused());
    assert(scheduler.remainingMs(handle) == 3000);

    runFor(poller, clock, 10000);
    assert(fired == 0);
    LOG("✓ Nothing fires while paused");

    scheduler.resumeAll();
    runFor(poller, clock, 2990);
    assert(fired == 0);
    runFor(poller, clock, 10);
    assert(fired == 1);
    LOG("✓ Paused 2s into 5s, fired 3s after resume");

    runFor(poller, clock, 4990);
    assert(fired == 1);
    runFor(poller, clock, 10);
    assert(fired == 2);
    LOG("✓ Back on the full period after the realigned firing");
  }

  LOG("\nTest 3: Elapsed time adds up over several pauses");
  {
    ManualClock clock;
    Poller poller(clock.function());
    Scheduler scheduler(poller);
    int fired = 0;

    scheduler.scheduleRepeating(5000, [&] { fired++; });

    runFor(poller, clock, 1000);
    scheduler.pauseAll();
    runFor(poller, clock, 700);
    scheduler.resumeAll();
    runFor(poller, clock, 1500);
    scheduler.pauseAll();
    runFor(poller, clock, 700);
    scheduler.resumeAll();

    runFor(poller, clock, 2490);
    assert(fired == 0);
    runFor(poller, clock, 10);
    assert(fired == 1);
    LOG("✓ 1s + 1.5s + 2.5s of running time make one period");
  }

  LOG("\nTest 4: One-shots resume with what was left");
  {
    ManualClock clock;
    Poller poller(clock.function());
    Scheduler scheduler(poller);
    int fired = 0;

    Scheduler::HandleID handle = scheduler.scheduleOnce(1000, [&] { fired++; });

    runFor(poller, clock, 400);
    scheduler.pauseAll();
    runFor(poller, clock, 5000);
    scheduler.resumeAll();

    runFor(poller, clock, 590);
    assert(fired == 0);
    runFor(poller, clock, 10);
    assert(fired == 1);
    assert(!scheduler.isActive(handle));
    LOG("✓ One-shot paused at 400ms fired 600ms after resume");

    scheduler.pauseAll();
    scheduler.scheduleOnce(100, [&] { fired++; });
    runFor(poller, clock, 1000);
    assert(fired == 1);
    scheduler.resumeAll();
    runFor(poller, clock, 100);
    assert(fired == 2);
    LOG("✓ Handle added while paused starts on resume");
  }

  LOG("\nTest 5: Cancel and stop");
  {
    ManualClock clock;
    Poller poller(clock.function());
    Scheduler scheduler(poller);
    int fired = 0;

    Scheduler::HandleID self = 0;
    self = scheduler.scheduleRepeating(100, [&] {
      fired++;
      scheduler.cancel(self);
    });
    runFor(poller, clock, 1000);
    assert(fired == 1);
    assert(!scheduler.cancel(self));
    LOG("✓ Repeating handle cancelled from its own callback");

    scheduler.scheduleRepeating(100, [&] { fired++; });
    scheduler.scheduleOnce(100, [&] { fired++; });
    scheduler.pauseAll();
    scheduler.stopAll();
    assert(scheduler.size() == 0);
    assert(!scheduler.isPaused());
    assert(poller.timerCount() == 0);

    runFor(poller, clock, 1000);
    assert(fired == 1);
    LOG("✓ stopAll drops every handle and the paused state");
  }

  LOG("\nAll scheduler tests passed!");
  return 0;
}
