//
// ChangeTracker.hh
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
#include "Actor.hh"
#include "ChangeTrackerOptions.hh"
#include "ChangeTrackerTypes.hh"
#include "RetryPolicy.hh"
#include "Timer.hh"
#include "fleece/RefCounted.hh"
#include <atomic>
#include <chrono>
#include <string>

namespace litefeed::tracker {

    /** Abstract base of change trackers. A ChangeTracker is an Actor that follows the change feed
        of a remote database and reports each change to its client; subclasses supply the
        transport. All state belongs to the actor's mailbox, but the public methods are
        thread-safe. */
    class ChangeTracker : public actor::Actor {
      public:
        /** Opens a connection, blocking until it has begun connecting.
            @return false (and does nothing) if a connection already exists.
            @throws error if the request can't be made, e.g. error(Network, kNetErrInvalidURL). */
        bool start();

        /** Closes the connection and cancels any scheduled retry. Callable from any thread, any
            number of times. The client's `changeTrackerStopped` is called unless it was already
            stopped. */
        void stop();

        /** Pauses or resumes reading from the connection. */
        void setPaused(bool paused);

        TrackerState state() const { return _state; }

        bool running() const { return _running; }

        bool caughtUp() const { return _caughtUp; }

        bool paused() const { return _paused; }

        unsigned retryCount() const { return _retryCount; }

        fleece::alloc_slice databaseURL() const { return _databaseURL; }

        const ChangeTrackerOptions& options() const { return *_options; }

        /** The sequence ID of the latest change received, else the `since` option. */
        std::string lastSequenceID();

      protected:
        ChangeTracker(fleece::slice databaseURL, fleece::Retained<ChangeTrackerOptions>, ChangeTrackerClient*,
                      fleece::Retained<RetryPolicy>, const std::string& name);

        //---- Transport hooks, all called on the mailbox:

        /** Creates and opens a new connection. May throw. */
        virtual void openConnection() = 0;

        virtual bool hasConnection() const = 0;

        /** Discards the current connection (if any) and closes it normally. */
        virtual void closeConnection() = 0;

        /** Pauses or resumes the connection to match the client's pause and the backlog. */
        virtual void updateReadPaused() = 0;

        //---- For subclasses, on the mailbox:

        /** The connection is open: resets the retry count. */
        void connectionOpened();

        /** The connection failed. Notifies the client, then schedules a retry if the
            RetryPolicy wants one. The connection must already be discarded. */
        void failedWithError(const error&);

        bool checkServerTrust(fleece::slice certData);

        void receivedChange(const RevisionChange&);

        /** An empty batch arrived. Notifies the client the first time per connection. */
        void receivedCaughtUp();

        /** The first message to send on a new connection. */
        fleece::alloc_slice feedOptionsBody() const;

        ChangeTrackerClient* client() const { return _client; }

        void caughtException(const std::exception&) override;

        std::atomic<TrackerState> _state{TrackerState::Idle};
        std::atomic<bool>         _running{false};
        std::atomic<bool>         _caughtUp{false};
        std::atomic<bool>         _paused{false};  // Set by the client
        std::atomic<unsigned>     _retryCount{0};

      private:
        bool _start(bool resetRetryCount);
        void _stop();
        void _setPaused(bool paused);
        void _retry();

        fleece::alloc_slice const                    _databaseURL;
        fleece::Retained<ChangeTrackerOptions> const _options;
        ChangeTrackerClient* const                   _client;
        fleece::Retained<RetryPolicy> const          _retryPolicy;
        std::string                                  _lastSequenceID;
        std::chrono::steady_clock::time_point        _startTime;
        actor::Timer                                 _retryTimer;
    };

}  // namespace litefeed::tracker
