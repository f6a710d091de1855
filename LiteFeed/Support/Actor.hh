//
// Actor.hh
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
#include "ThreadedMailbox.hh"
#include "Logging.hh"
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <string>

namespace litefeed::actor {

    using Mailbox = ThreadedMailbox;

#define FUNCTION_TO_QUEUE(METHOD) #METHOD, &METHOD

    /** Abstract base actor class. Subclasses should implement their public methods as calls to
        `enqueue` that pass the parameter values through, and name a matching private
        implementation method; for example:
            class Adder : public Actor {
                public:  void add(int a, bool clear)        {enqueue(FUNCTION_TO_QUEUE(Adder::_add), a, clear);}
                private: void _add(int a, bool clear)       {... actual implementation...}
            };
        The public method will return immediately; the private one will be called later (on
        a private thread belonging to the Scheduler). It is guaranteed that only one enqueued
        method call will be run at once, so the Actor implementation is effectively single-
        threaded. */
    class Actor
        : public RefCounted
        , public Logging {
      public:
        unsigned eventCount() const { return _mailbox.eventCount(); }

        std::string actorName() const { return _mailbox.name(); }

        /** The Actor that's currently running, else nullptr */
        static Actor* currentActor() { return Mailbox::currentActor(); }

        /** Blocks until the Actor has finished handling all events enqueued before this call.
            Must not be called by the Actor on itself. */
        void waitTillDrained();

      protected:
        /** Constructs an Actor.
            @param domain The domain which this actor is logged to.
            @param name  Used for logging; otherwise unimportant. */
        explicit Actor(LogDomain& domain, const std::string& name = "") : Logging(domain), _mailbox(this, name) {}

        /** Schedules a call to a method. */
        template <class Rcvr, class... Args>
        void enqueue(const char* methodName, void (Rcvr::*fn)(Args...), Args... args) {
            _mailbox.enqueue(methodName, std::bind(fn, (Rcvr*)this, args...));
        }

        /** Runs `fn` on the mailbox and blocks the calling thread until it has run, returning
            its result or rethrowing its exception. When called from the Actor's own thread `fn`
            runs immediately, so a handler can never wait on itself. */
        template <class T>
        T enqueueSync(const char* methodName, std::function<T()> fn) {
            if ( currentActor() == this ) return fn();
            auto promise = std::make_shared<std::promise<T>>();
            auto future  = promise->get_future();
            _mailbox.enqueue(methodName, [fn = std::move(fn), promise] {
                try {
                    promise->set_value(fn());
                } catch ( const std::exception& ) { promise->set_exception(std::current_exception()); }
            });
            return future.get();
        }

        /** Called when an enqueued method throws. */
        virtual void caughtException(const std::exception& x);

        std::string loggingIdentifier() const override { return actorName(); }

      private:
        friend class ThreadedMailbox;

        Mailbox _mailbox;
    };

}  // namespace litefeed::actor
