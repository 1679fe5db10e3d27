#include "manual_clock.hpp"
#include "tabletimer/log.hpp"
#include "tabletimer/session.hpp"
#include <cassert>
#include <memory>
#include <stdexcept>
#include <string>

using namespace tabletimer;
using tabletimer::test::ManualClock;
using tabletimer::test::RecordingNotifier;
using tabletimer::test::RecordingSoundPlayer;
using tabletimer::test::runFor;

namespace {

struct ThrowingNotifier : Notifier {
  void show(const std::string &message) override {
    throw std::runtime_error("cannot show " + message);
  }
};

// A list with a session on a hand-driven clock, heartbeat 100 ms
struct Fixture {
  ManualClock clock;
  Poller poller{clock.function()};
  Store store;
  RecordingSoundPlayer sounds;
  RecordingNotifier notifier;
  std::string list_id = store.createList("Table");
  std::unique_ptr<Session> session;

  void open(Notifier &session_notifier, const SessionConfig &config) {
    session.reset(
        new Session(poller, store, sounds, session_notifier, config));
    assert(session->open(list_id));
  }

  void open(const SessionConfig &config = SessionConfig()) {
    open(notifier, config);
  }

  std::string addAutomation(const std::string &name, TriggerPtr trigger,
                            std::vector<ActionPtr> actions) {
    AutomationDraft draft;
    draft.name = name;
    draft.triggers.push_back(trigger);
    draft.actions = actions;
    std::string error;
    std::string id = store.createAutomation(list_id, draft, &error);
    if (id.empty()) {
      LOG_ERROR(error);
    }
    assert(!id.empty());
    return id;
  }

  std::string addCounter(const std::string &name, int initial,
                         bool bounded = false, int max_value = 0) {
    Counter counter;
    counter.name = name;
    counter.initial_value = initial;
    counter.has_max = bounded;
    counter.max_value = max_value;
    return store.addCounter(list_id, counter);
  }

  int counterValue(const std::string &counter_id) {
    return store.findCounter(counter_id)->value;
  }

  void run(uint32_t ms) { runFor(poller, clock, ms); }
};

} // namespace

int main() {
  LOG("Test 1: Time remaining fires once per descent");
  {
    Fixture f;
    f.store.addTimer(f.list_id, "Round", 10000);
    std::string id = f.addAutomation(
        "Hurry", makeTimeRemainingTrigger("Round", 3000),
        {makeShowNotificationAction("3 seconds left")});
    f.open();

    const TimerDefinition round = f.store.findList(f.list_id)->timers[0];
    std::string trigger_id = f.store.findAutomation(id)->triggers[0]->id;
    AutomationEngine &engine = f.session->getEngine();

    for (int64_t remaining = 10000; remaining >= 0; remaining -= 1000) {
      engine.onTimerTick(round, remaining);
      if (remaining == 3000) {
        assert(f.notifier.messages.size() == 1);
        assert(engine.isArmed(id, trigger_id));
      }
    }
    assert(f.notifier.messages.size() == 1);
    LOG("✓ Fired at the first tick at the threshold and not after");

    engine.onTimerTick(round, 5000);
    assert(!engine.isArmed(id, trigger_id));
    engine.onTimerTick(round, 2500);
    assert(f.notifier.messages.size() == 2);
    LOG("✓ Rising above the threshold re-arms it");

    Fixture g;
    g.store.addTimer(g.list_id, "Round", 3000);
    g.store.addTimer(g.list_id, "Round", 3000);
    g.addAutomation("Hurry", makeTimeRemainingTrigger("Round", 1000),
                    {makePlaySoundAction(Sound::ALERT)});
    g.open();
    g.session->start();
    g.run(1900);
    assert(g.sounds.count(Sound::ALERT) == 0);
    g.run(100);
    assert(g.sounds.count(Sound::ALERT) == 1);
    g.run(5000);
    assert(g.sounds.count(Sound::ALERT) == 2);
    LOG("✓ Heartbeat driven, once for each timer of that name");
  }

  LOG("\nTest 2: Time elapsed runs after the offset and dies with the timer");
  {
    Fixture f;
    f.store.addTimer(f.list_id, "A", 5000);
    f.store.addTimer(f.list_id, "B", 5000);
    f.addAutomation("Two in", makeTimeElapsedTrigger("A", 2000),
                    {makeShowNotificationAction("two seconds")});
    f.open();

    f.session->start();
    assert(f.session->getEngine().pendingDelayedCount() == 1);
    f.run(1990);
    assert(f.notifier.messages.empty());
    f.run(10);
    assert(f.notifier.messages.size() == 1);
    assert(f.session->getEngine().pendingDelayedCount() == 0);
    LOG("✓ Fired 2s after A started");

    f.session->stop();
    f.session->start();
    f.run(1000);
    f.session->skipToNext();
    assert(f.session->getEngine().pendingDelayedCount() == 0);
    assert(f.session->getScheduler().size() == 0);
    f.run(5000);
    assert(f.notifier.messages.size() == 1);
    LOG("✓ Skipping A cancelled the pending run");
  }

  LOG("\nTest 3: Counter reaches value is edge triggered");
  {
    Fixture f;
    std::string score = f.addCounter("Score", 0, true, 3);
    f.addAutomation("Win", makeCounterReachesTrigger("Score", 3),
                    {makePlaySoundAction(Sound::CHIME)});
    f.open();

    f.session->incrementCounter(score);
    f.session->incrementCounter(score);
    assert(f.sounds.played.empty());
    f.session->incrementCounter(score);
    assert(f.sounds.count(Sound::CHIME) == 1);
    LOG("✓ Fired on the change into 3");

    f.session->incrementCounter(score);
    f.session->incrementCounter(score);
    assert(f.counterValue(score) == 3);
    assert(f.sounds.count(Sound::CHIME) == 1);
    LOG("✓ Holding at the target does not fire again");

    f.session->decrementCounter(score);
    f.session->incrementCounter(score);
    assert(f.sounds.count(Sound::CHIME) == 2);
    LOG("✓ Leaving and coming back fires again");
  }

  LOG("\nTest 4: Names resolve at run time");
  {
    Fixture f;
    f.store.addTimer(f.list_id, "Round", 5000);
    std::string low = f.addCounter("Score", 0);
    std::string high = f.addCounter("Score", 10);
    std::string bonus = f.addCounter("Bonus", 0);
    std::string round_id = f.store.findList(f.list_id)->timers[0].id;

    f.addAutomation("Both scores", makeAnyTimerStartTrigger(),
                    {makeModifyCounterAction("Score", 2)});
    f.addAutomation("Bonus", makeAnyTimerStartTrigger(),
                    {makeModifyCounterAction("Bonus", 1),
                     makePlaySoundAction(Sound::NOTIFICATION)});
    f.addAutomation("Round start", makeTimerStartTrigger("Round"),
                    {makePlaySoundAction(Sound::ALERT)});

    assert(f.store.removeCounter(bonus));
    assert(f.store.updateTimer(round_id, "Final round", 5000));

    f.open();
    f.session->start();

    assert(f.counterValue(low) == 2);
    assert(f.counterValue(high) == 12);
    LOG("✓ Modify counter applied to every counter with the name");

    assert(f.sounds.count(Sound::NOTIFICATION) == 1);
    assert(f.sounds.count(Sound::ALERT) == 0);
    assert(f.session->getSequencer().state() == SequencerState::RUNNING);
    LOG("✓ Missing counter and renamed timer are silent no-ops");
  }

  LOG("\nTest 5: Counter cascades are cut off");
  {
    Fixture f;
    std::string a = f.addCounter("A", 0);
    f.addAutomation("Bounce", makeCounterReachesTrigger("A", 1),
                    {makeModifyCounterAction("A", -1),
                     makeModifyCounterAction("A", 1)});

    SessionConfig config;
    config.max_cascade_depth = 8;
    f.open(config);

    f.session->incrementCounter(a);
    assert(f.session->getEngine().executedCount() == 16);
    assert(f.counterValue(a) == 1);
    LOG("✓ Self-retriggering automation stopped after 8 levels");
  }

  LOG("\nTest 6: Disabled automations and failing actions");
  {
    ThrowingNotifier throwing;
    Fixture f;
    f.store.addTimer(f.list_id, "Round", 5000);
    std::string off = f.addAutomation("Off", makeAnyTimerStartTrigger(),
                                      {makePlaySoundAction(Sound::CUSTOM)});
    f.store.setAutomationEnabled(off, false);
    f.addAutomation("Broken", makeAnyTimerStartTrigger(),
                    {makeShowNotificationAction("never shown"),
                     makePlaySoundAction(Sound::ALERT)});
    f.addAutomation("Fine", makeAnyTimerStartTrigger(),
                    {makePlaySoundAction(Sound::CHIME)});

    f.open(throwing, SessionConfig());
    f.session->start();

    assert(f.sounds.count(Sound::CUSTOM) == 0);
    LOG("✓ Disabled automation skipped");
    assert(f.sounds.count(Sound::ALERT) == 0);
    assert(f.sounds.count(Sound::CHIME) == 1);
    LOG("✓ A throwing action stops its automation only");
  }

  LOG("\nTest 7: Pause and skip actions");
  {
    Fixture f;
    f.store.addTimer(f.list_id, "Setup", 5000);
    f.store.addTimer(f.list_id, "Play", 5000);
    f.addAutomation("Hold", makeTimerStartTrigger("Setup"),
                    {makePauseTimerAction()});
    f.addAutomation("Hurry", makeTimeElapsedTrigger("Play", 1000),
                    {makeSkipTimerAction()});
    f.open();

    f.session->start();
    assert(f.session->getSequencer().state() == SequencerState::PAUSED);
    f.run(10000);
    assert(f.session->getSequencer().timeRemainingMs() == 5000);
    LOG("✓ Paused as soon as Setup started");

    f.session->resume();
    f.run(5000);
    assert(f.session->getSequencer().currentTimer()->name == "Play");
    f.run(1000);
    assert(f.session->getSequencer().state() == SequencerState::IDLE);
    assert(f.sounds.count(Sound::BELL) == 1);
    LOG("✓ Play skipped 1s in, the run ended without a second bell");
  }

  LOG("\nTest 8: Intervals pause with the sequence");
  {
    Fixture f;
    f.store.addTimer(f.list_id, "Long", 60000);
    f.store.addTimer(f.list_id, "Short", 3000);
    f.addAutomation("Pulse", makeRepeatingIntervalTrigger(5000),
                    {makeShowNotificationAction("pulse")});
    f.open();

    f.session->start();
    assert(f.session->getEngine().activeIntervalCount() == 1);
    f.run(2000);
    f.session->pause();
    f.run(10000);
    f.session->resume();

    f.run(2990);
    assert(f.notifier.messages.empty());
    f.run(10);
    assert(f.notifier.messages.size() == 1);
    LOG("✓ Paused 2s into the period, fired 3s after resume");

    f.run(5000);
    assert(f.notifier.messages.size() == 2);

    f.session->skipToNext();
    assert(f.session->getSequencer().currentTimer()->name == "Short");
    assert(f.session->getEngine().activeIntervalCount() == 1);
    f.run(3000);
    assert(f.session->getSequencer().state() == SequencerState::IDLE);
    assert(f.session->getEngine().activeIntervalCount() == 0);
    assert(f.notifier.messages.size() == 2);
    assert(f.poller.timerCount() == 0);
    LOG("✓ New timer restarts the period, nothing left after the run");
  }

  LOG("\nTest 9: Counter changes survive a failed save");
  {
    Fixture f;
    f.store.addTimer(f.list_id, "Round", 5000);
    std::string score = f.addCounter("Score", 0);
    f.addAutomation("Point", makeTimerEndTrigger("Round"),
                    {makeModifyCounterAction("Score", 5)});
    f.open();

    f.store.saveFunction = [](const Store &) { return false; };
    f.session->start();
    f.run(5000);
    assert(f.counterValue(score) == 5);
    LOG("✓ Value kept in memory");
  }

  LOG("\nTest 10: Interval edits made while paused apply on resume");
  {
    Fixture f;
    f.store.addTimer(f.list_id, "Long", 60000);
    std::string pulse =
        f.addAutomation("Pulse", makeRepeatingIntervalTrigger(5000),
                        {makeShowNotificationAction("pulse")});
    std::string late =
        f.addAutomation("Late", makeRepeatingIntervalTrigger(3000),
                        {makeShowNotificationAction("late")});
    std::string edited =
        f.addAutomation("Edited", makeRepeatingIntervalTrigger(4000),
                        {makeShowNotificationAction("edited")});
    std::string gone =
        f.addAutomation("Gone", makeRepeatingIntervalTrigger(2500),
                        {makeShowNotificationAction("gone")});
    assert(f.store.setAutomationEnabled(late, false));
    f.open();

    f.session->start();
    assert(f.session->getEngine().activeIntervalCount() == 3);
    f.run(2000);
    f.session->pause();
    assert(f.notifier.messages.empty());

    assert(f.store.setAutomationEnabled(pulse, false));
    assert(f.store.setAutomationEnabled(late, true));
    AutomationDraft draft;
    draft.name = "Edited";
    draft.triggers.push_back(makeRepeatingIntervalTrigger(4000));
    draft.actions.push_back(makeShowNotificationAction("edited again"));
    assert(f.store.updateAutomation(edited, draft));
    assert(f.store.removeAutomation(gone));
    f.run(10000);

    f.session->resume();
    assert(f.session->getEngine().activeIntervalCount() == 2);
    LOG("✓ Disabled and removed intervals dropped, enabled one armed");

    f.run(2990);
    assert(f.notifier.messages.empty());
    f.run(10);
    assert(f.notifier.messages == std::vector<std::string>{"late"});
    LOG("✓ Newly enabled interval runs a full period from resume");

    f.run(1000);
    assert((f.notifier.messages ==
            std::vector<std::string>{"late", "edited again"}));
    LOG("✓ Edited interval restarted on a full period");

    f.run(2000);
    assert((f.notifier.messages ==
            std::vector<std::string>{"late", "edited again", "late"}));
    LOG("✓ Nothing left from the old handles");
  }

  LOG("\nAll automation engine tests passed!");
  return 0;
}
