//
// ChangeTracker.cc
//
// Copyright 2017-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "ChangeTracker.hh"
#include "ChangesFeedRequest.hh"
#include "StringUtil.hh"

using namespace std;
using namespace fleece;

namespace litefeed::tracker {

    LogDomain ChangesLog("Changes");

    const char* TrackerStateName(TrackerState state) {
        static const char* const kNames[] = {"idle", "connecting", "open", "closing", "failed"};
        return kNames[int(state)];
    }

    ChangeTracker::ChangeTracker(slice databaseURL, Retained<ChangeTrackerOptions> options,
                                 ChangeTrackerClient* client, Retained<RetryPolicy> retryPolicy, const string& name)
        : Actor(ChangesLog, name)
        , _databaseURL(databaseURL)
        , _options(options ? std::move(options) : make_retained<ChangeTrackerOptions>())
        , _client(client)
        , _retryPolicy(std::move(retryPolicy))
        , _lastSequenceID(_options->since())
        , _retryTimer([this] { enqueue(FUNCTION_TO_QUEUE(ChangeTracker::_retry)); }) {}

    string ChangeTracker::lastSequenceID() {
        return enqueueSync<string>("lastSequenceID", [this] { return _lastSequenceID; });
    }

#pragma mark - LIFECYCLE:

    bool ChangeTracker::start() {
        return enqueueSync<bool>("start", [this] { return _start(true); });
    }

    // Both `start` and `_retry` end up calling this.
    bool ChangeTracker::_start(bool resetRetryCount) {
        if ( hasConnection() ) {
            warn("Can't start: already connected");
            return false;
        }
        _retryTimer.stop();
        if ( resetRetryCount ) _retryCount = 0;
        _startTime = chrono::steady_clock::now();
        _caughtUp  = false;
        _running   = true;
        _state     = TrackerState::Connecting;
        logInfo("Starting from '%s'; %s", _lastSequenceID.c_str(), string(*_options).c_str());
        try {
            openConnection();
        } catch ( const std::exception& ) {
            _running = false;
            _state   = TrackerState::Idle;
            throw;
        }
        return true;
    }

    void ChangeTracker::stop() {
        _running = false;
        if ( currentActor() == this )
            _stop();
        else
            enqueue(FUNCTION_TO_QUEUE(ChangeTracker::_stop));
    }

    void ChangeTracker::_stop() {
        _running = false;
        _retryTimer.stop();
        closeConnection();
        TrackerState oldState = _state.exchange(TrackerState::Idle);
        if ( oldState != TrackerState::Idle ) {
            logInfo("Stopped (was %s)", TrackerStateName(oldState));
            if ( _client ) _client->changeTrackerStopped();
        }
    }

    void ChangeTracker::setPaused(bool paused) { enqueue(FUNCTION_TO_QUEUE(ChangeTracker::_setPaused), paused); }

    void ChangeTracker::_setPaused(bool paused) {
        if ( _paused.exchange(paused) != paused ) logInfo("%s", (paused ? "Paused" : "Resumed"));
        updateReadPaused();
    }

    void ChangeTracker::connectionOpened() {
        logInfo("Connected");
        _state      = TrackerState::Open;
        _retryCount = 0;
    }

#pragma mark - FAILURE & RETRY:

    void ChangeTracker::failedWithError(const error& err) {
        _running = false;
        _state   = TrackerState::Failed;
        if ( err.isUnremarkable() )
            logInfo("Failed: %s (%s %d)", err.what(), error::nameOfDomain(err.domain), err.code);
        else
            logError("Failed: %s (%s %d)", err.what(), error::nameOfDomain(err.domain), err.code);

        if ( _client ) {
            try {
                _client->changeTrackerFailed(err);
            } catch ( const std::exception& x ) { warn("Client threw from changeTrackerFailed: %s", x.what()); }
        }

        if ( !_retryPolicy ) return;
        if ( auto delay = _retryPolicy->retryDelay(err, _retryCount); delay ) {
            ++_retryCount;
            logInfo("Will retry in %.3f sec (retry #%u)", delay->count(), unsigned(_retryCount));
            _retryTimer.fireAfter(*delay);
        } else {
            logInfo("Giving up after %u retries", unsigned(_retryCount));
        }
    }

    void ChangeTracker::_retry() {
        if ( _state != TrackerState::Failed ) return;  // stopped or restarted meanwhile
        logInfo("Retrying connection (retry #%u)...", unsigned(_retryCount));
        try {
            if ( !_start(false) ) warn("Retry found a connection already open");
        } catch ( const std::exception& x ) { failedWithError(error::convertException(x)); }
    }

    // An enqueued call threw: treat it as a failure of the connection.
    void ChangeTracker::caughtException(const std::exception& x) {
        Actor::caughtException(x);
        if ( _state == TrackerState::Idle ) return;
        closeConnection();
        failedWithError(error::convertException(x));
    }

#pragma mark - FEED:

    bool ChangeTracker::checkServerTrust(slice certData) {
        if ( slice pinned = _options->pinnedServerCert(); pinned ) {
            if ( pinned == certData ) return true;
            warn("Server certificate doesn't match the pinned certificate");
            return false;
        }
        if ( !_client ) return true;
        try {
            return _client->changeTrackerShouldTrustServer(certData);
        } catch ( const std::exception& x ) {
            warn("Client threw while checking server trust: %s", x.what());
            return false;
        }
    }

    void ChangeTracker::receivedChange(const RevisionChange& change) {
        _lastSequenceID = string(change.sequence);
        logDebug("Change: seq %s, doc '%.*s'", _lastSequenceID.c_str(), SPLAT(change.docID));
        if ( _client ) _client->changeTrackerReceivedChange(change);
    }

    void ChangeTracker::receivedCaughtUp() {
        if ( _caughtUp.exchange(true) ) return;
        auto elapsed = chrono::duration<double>(chrono::steady_clock::now() - _startTime);
        logInfo("Caught up after %.3f sec", elapsed.count());
        if ( _client ) _client->changeTrackerCaughtUp();
    }

    alloc_slice ChangeTracker::feedOptionsBody() const {
        return ChangesFeedRequest::optionsBody(*_options, slice(_lastSequenceID), _caughtUp);
    }

}  // namespace litefeed::tracker
