//
// ChangesFeedRequest.hh
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
#include "Address.hh"
#include "WebSocketInterface.hh"
#include "fleece/slice.hh"

namespace litefeed::net {
    class CookieStore;
}

namespace litefeed::tracker {
    class Authorizer;
    class ChangeTrackerOptions;

    /** The handshake request of a WebSocket change feed: where to connect, and the transport
        parameters (headers, timeout, TLS options) to connect with. */
    struct ChangesFeedRequest {
        net::Address          url;         // The feed URL, i.e. the database URL + `_changes?feed=websocket`
        websocket::Parameters parameters;  // Headers, timeout, TLS options, cookie handling

        /** Composes the request. Doesn't open anything.
            @param databaseURL  URL of the remote database.
            @param options  The tracker options; `headers`, `heartbeat` and `tls` are used.
            @param cookies  Cookie store to take the `Cookie` header from, or nullptr.
            @param authorizer  Supplies the `Authorization` header, or nullptr.
            @throws error(Network, kNetErrInvalidURL) if the database URL can't be parsed. */
        static ChangesFeedRequest build(fleece::slice databaseURL, const ChangeTrackerOptions& options,
                                        net::CookieStore* cookies, Authorizer* authorizer);

        /** The JSON object the client sends as the first message after opening, describing which
            changes it wants.
            @param lastSequenceID  The sequence to start after; empty for the beginning.
            @param caughtUp  True if the tracker has already caught up once. */
        static fleece::alloc_slice optionsBody(const ChangeTrackerOptions& options, fleece::slice lastSequenceID,
                                               bool caughtUp);

        static constexpr const char* kFeedPath = "_changes?feed=websocket";
    };

}  // namespace litefeed::tracker
