//
// ChangeTrackerTypes.hh
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
#include "Error.hh"
#include "Logging.hh"
#include "fleece/slice.hh"
#include <iosfwd>
#include <vector>

namespace litefeed::tracker {

    extern LogDomain ChangesLog;

    /** The tracker's connection state. A clean close or a stop() returns it to Idle. */
    enum class TrackerState {
        Idle,
        Connecting,
        Open,
        Closing,
        Failed,
    };

    const char* TrackerStateName(TrackerState);

    /** One entry of a change feed: a document that has new revisions. */
    struct RevisionChange {
        fleece::alloc_slice              sequence;  // Remote sequence ID, as a string
        fleece::alloc_slice              docID;
        std::vector<fleece::alloc_slice> revIDs;    // Current leaf revisions (one, unless conflicted)
        bool                             deleted{false};
        bool                             removed{false};  // Doc is no longer accessible to the user
    };

    std::ostream& operator<<(std::ostream&, const RevisionChange&);

    /** Receives a change tracker's notifications. All calls are made on the tracker's mailbox,
        one at a time. The client must outlive the tracker, or stop it and wait for
        `changeTrackerStopped` before going away. */
    class ChangeTrackerClient {
      public:
        virtual ~ChangeTrackerClient() = default;

        virtual void changeTrackerReceivedChange(const RevisionChange&) = 0;

        /** The server has no more changes to send for now. Called at most once per connection. */
        virtual void changeTrackerCaughtUp() {}

        /** The connection failed. If a RetryPolicy is set, a retry may follow. */
        virtual void changeTrackerFailed(const error&) {}

        virtual void changeTrackerStopped() {}

        /** Decides whether to accept the server's TLS certificate. Not called if the options
            pin a certificate. */
        virtual bool changeTrackerShouldTrustServer(fleece::slice certData) { return true; }
    };

}  // namespace litefeed::tracker
