//
// Actor.cc
//
// Copyright 2018-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "Actor.hh"
#include "Error.hh"

namespace litefeed::actor {

    void Actor::caughtException(const std::exception& x) {
        Warn("Caught exception in Actor %s: %s", actorName().c_str(), x.what());
    }

    void Actor::waitTillDrained() {
        Assert(currentActor() != this, "Actor %s waiting on itself", actorName().c_str());
        logVerbose("Waiting for pending events...");
        (void)enqueueSync<bool>("waitTillDrained", [] { return true; });
        logVerbose("...pending events handled");
    }

}  // namespace litefeed::actor
