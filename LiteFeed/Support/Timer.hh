//
// Timer.hh
//
// Copyright 2017-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

namespace litefeed::actor {

    /** An object that can trigger a callback at (approximately) a specific future time.
        All Timers share one background thread. */
    class Timer {
      public:
        using clock    = std::chrono::steady_clock;
        using time     = clock::time_point;
        using duration = clock::duration;
        using callback = std::function<void()>;

        /** Constructs a Timer that will call the given callback when it triggers.
            The call happens on the timer thread, so it should not block; typically it just
            enqueues a call on an Actor. Exceptions it throws are logged and discarded. */
        explicit Timer(callback cb) : _callback(std::move(cb)) {}

        /** If the callback is running on the timer thread, the destructor waits for it to
            finish, so the callback may safely capture the owner of the Timer. */
        ~Timer() { manager().unschedule(this, true); }

        Timer(const Timer&)            = delete;
        Timer& operator=(const Timer&) = delete;

        /** Schedules the timer to fire at the given time (or slightly later.)
            If it was already scheduled, its fire time will be changed. */
        void fireAt(time t) { manager().setFireTime(this, t); }

        /** Schedules the timer to fire after the given interval from now. */
        template <class Rep, class Period>
        void fireAfter(const std::chrono::duration<Rep, Period>& dur) {
            fireAt(clock::now() + std::chrono::duration_cast<duration>(dur));
        }

        /** Unschedules the timer. After this call returns the callback will NOT be invoked
            unless fireAt() or fireAfter() are called. */
        void stop() {
            if ( scheduled() ) manager().unschedule(this);
        }

        /** Is the timer active: waiting to fire or in the act of firing? */
        bool scheduled() const { return _state == kScheduled || _triggered; }

      private:
        enum state : uint8_t {
            kUnscheduled,  // Idle
            kScheduled,    // In _schedule queue, waiting to fire
            kDeleted,      // Destructor called, waiting for fire to complete
        };

        /** Internal singleton that tracks all scheduled Timers and runs a background thread. */
        class Manager {
          public:
            using map = std::multimap<time, Timer*>;

            Manager();
            void setFireTime(Timer*, time);
            void unschedule(Timer*, bool deleting = false);

          private:
            bool _unschedule(Timer*);
            void run();

            map                     _schedule;   // A priority queue of Timers ordered by time
            std::mutex              _mutex;      // Thread-safety for _schedule
            std::condition_variable _condition;  // Used to signal that _schedule has changed
            std::thread             _thread;     // Bg thread that waits & fires Timers
        };

        friend class Manager;
        static Manager& manager();

        callback               _callback;                // The function to call when I fire
        time                   _fireTime;                // Absolute time that I fire
        std::atomic<state>     _state{kUnscheduled};     // Current state
        std::atomic<bool>      _triggered{false};        // True while callback is being called
        Manager::map::iterator _entry;                   // My map entry in Manager::_schedule
    };

}  // namespace litefeed::actor
