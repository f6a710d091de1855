//
// RetryPolicy.hh
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
#include "ThreadedMailbox.hh"  // for delay_t
#include "fleece/RefCounted.hh"
#include <optional>

namespace litefeed::tracker {

    /** Decides whether, and when, a failed change tracker reconnects. */
    class RetryPolicy : public fleece::RefCounted {
      public:
        /** Returns the delay before the next attempt, or nullopt to give up.
            @param err  The error the connection failed with.
            @param retryCount  Number of consecutive retries already made. */
        virtual std::optional<actor::delay_t> retryDelay(const error& err, unsigned retryCount) = 0;
    };

}  // namespace litefeed::tracker
