//
// Timer.cc
//
// Copyright 2017-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "Timer.hh"
#include "Logging.hh"
#include "ThreadUtil.hh"
#include <exception>

using namespace std;

namespace litefeed::actor {

    Timer::Manager& Timer::manager() {
        static auto* sManager = new Manager;
        return *sManager;
    }

    Timer::Manager::Manager() : _thread([this]() { run(); }) {}

    // Body of the manager's background thread. Waits for timers and calls their callbacks.
    void Timer::Manager::run() {
        SetThreadName("LiteFeed Timer");
        unique_lock<mutex> lock(_mutex);
        while ( true ) {
            auto earliest = _schedule.begin();
            if ( earliest == _schedule.end() ) {
                _condition.wait(lock);
            } else if ( earliest->first <= clock::now() ) {
                // A Timer is ready to fire, so remove it and call the callback:
                auto timer        = earliest->second;
                timer->_triggered = true;
                _unschedule(timer);

                // Fire the timer, while not holding the mutex (the callback may call the Timer API.)
                lock.unlock();
                try {
                    timer->_callback();
                } catch ( const std::exception& x ) {
                    LogWarn(ActorLog, "Timer callback threw %s", x.what());
                }
                timer->_triggered = false;
                lock.lock();
            } else {
                _condition.wait_until(lock, earliest->first);
            }
        }
    }

    // Removes a Timer from _schedule. Returns true if the next fire time is affected.
    // Precondition: _mutex must be locked.
    bool Timer::Manager::_unschedule(Timer* timer) {
        if ( timer->_state != kScheduled ) return false;
        bool affectsTiming = (timer->_entry == _schedule.begin());
        _schedule.erase(timer->_entry);
        timer->_entry    = _schedule.end();
        timer->_state    = kUnscheduled;
        timer->_fireTime = time();
        return affectsTiming && !_schedule.empty();
    }

    // Unschedules a timer, preventing it from firing if it hasn't been triggered yet.
    // Precondition: _mutex must NOT be locked.
    void Timer::Manager::unschedule(Timer* timer, bool deleting) {
        unique_lock<mutex> lock(_mutex);
        if ( _unschedule(timer) ) _condition.notify_one();

        if ( deleting ) {
            timer->_state = kDeleted;
            lock.unlock();
            // Wait for the callback to complete, unless it's the callback deleting its own Timer:
            if ( this_thread::get_id() != _thread.get_id() ) {
                while ( timer->_triggered ) this_thread::sleep_for(100us);
            }
        }
    }

    // Schedules or re-schedules a timer.
    // Precondition: _mutex must NOT be locked.
    void Timer::Manager::setFireTime(Timer* timer, clock::time_point when) {
        unique_lock<mutex> lock(_mutex);
        // Don't allow timer's callback to reschedule itself when deletion is pending:
        if ( timer->_state == kDeleted ) return;
        bool notify      = _unschedule(timer);
        timer->_entry    = _schedule.insert({when, timer});
        timer->_state    = kScheduled;
        timer->_fireTime = when;
        if ( timer->_entry == _schedule.begin() || notify ) _condition.notify_one();
    }

}  // namespace litefeed::actor
