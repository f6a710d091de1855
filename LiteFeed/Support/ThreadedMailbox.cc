//
// ThreadedMailbox.cc
//
// Copyright 2017-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "ThreadedMailbox.hh"
#include "Actor.hh"
#include "Error.hh"
#include "Logging.hh"
#include "ThreadUtil.hh"
#include <mutex>

using namespace std;

namespace litefeed::actor {

#pragma mark - SCHEDULER:

    Scheduler* Scheduler::sharedScheduler() {
        static Scheduler* sScheduler = [] {
            auto s = new Scheduler;
            s->start();
            return s;
        }();
        return sScheduler;
    }

    void Scheduler::start() {
        if ( !_started.test_and_set() ) {
            if ( _numThreads == 0 ) {
                _numThreads = thread::hardware_concurrency();
                if ( _numThreads < 2 ) _numThreads = 2;
            }
            LogTo(ActorLog, "Starting Scheduler<%p> with %u threads", this, _numThreads);
            for ( unsigned id = 1; id <= _numThreads; id++ ) _threadPool.emplace_back([this, id] { task(id); });
        }
    }

    void Scheduler::stop() {
        LogTo(ActorLog, "Stopping Scheduler<%p>...", this);
        _queue.close();
        for ( auto& t : _threadPool ) { t.join(); }
        LogTo(ActorLog, "Scheduler<%p> has stopped", this);
        _started.clear();
    }

    void Scheduler::task(unsigned taskID) {
        LogVerbose(ActorLog, "   task %u starting", taskID);
        char name[32];
        snprintf(name, sizeof(name), "LiteFeed Sched#%u", taskID);
        SetThreadName(name);
        ThreadedMailbox* mailbox;
        while ( (mailbox = _queue.pop()) != nullptr ) {
            LogDebug(ActorLog, "   task %u calling Actor<%p>", taskID, mailbox);
            mailbox->performNextMessage();
        }
        LogTo(ActorLog, "   task %u finished", taskID);
    }

    void Scheduler::schedule(ThreadedMailbox* mbox) { sharedScheduler()->_queue.push(mbox); }

    // Explicitly instantiate the Channel specializations we need; this corresponds to the
    // "extern template..." declarations at the bottom of ThreadedMailbox.hh
    template class Channel<ThreadedMailbox*>;
    template class Channel<std::function<void()>>;

#pragma mark - MAILBOX:

    thread_local Actor* ThreadedMailbox::sCurrentActor;

    ThreadedMailbox::ThreadedMailbox(Actor* a, std::string name) : _actor(a), _name(std::move(name)) {
        Scheduler::sharedScheduler();
    }

    void ThreadedMailbox::enqueue(const char* name, std::function<void()> f) {
        LogDebug(ActorLog, "%s enqueue %s", _name.c_str(), name);
        retain(_actor);
        auto wrappedBlock = [f = std::move(f), this] { safelyCall(f); };
        if ( push(std::move(wrappedBlock)) ) reschedule();
    }

    void ThreadedMailbox::safelyCall(const std::function<void()>& f) const {
        try {
            f();
        } catch ( const std::exception& x ) { _actor->caughtException(x); }
    }

    void ThreadedMailbox::reschedule() { Scheduler::schedule(this); }

    void ThreadedMailbox::performNextMessage() {
        DebugAssert(++_active == 1);  // Fail-safe check to detect 'impossible' re-entrant call
        sCurrentActor = _actor;
        auto& fn      = front();
        fn();
        sCurrentActor = nullptr;
        DebugAssert(--_active == 0);

        bool empty;
        popNoWaiting(empty);
        release(_actor);  // For enqueue's retain call
        if ( !empty ) reschedule();
    }

}  // namespace litefeed::actor
