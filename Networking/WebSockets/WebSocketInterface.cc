//
// WebSocketInterface.cc
//
// Copyright 2018-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "WebSocketInterface.hh"
#include "Error.hh"
#include "Logging.hh"
#include <string>
#include <utility>

using namespace std;
using namespace fleece;


#pragma mark - WEBSOCKET:

namespace litefeed::websocket {

    LogDomain WSLogDomain("WS", LogLevel::Warning);

    WebSocket::WebSocket(URL url) : _url(std::move(url)) {}

    WebSocket::~WebSocket() = default;

    void WebSocket::connect(Retained<WeakHolder<Delegate>> weakDelegate) {
        Assert(!_delegateWeakHolder, "WebSocket connected twice");
        _delegateWeakHolder = std::move(weakDelegate);
        connect();
    }

    const char* CloseStatus::reasonName() const {
        static const char* kReasonNames[] = {"WebSocket/HTTP status", "errno", "Network error", "Exception",
                                             "Unknown error"};
        if ( reason < kWebSocketClose || reason > kUnknownError ) return "???";
        return kReasonNames[reason];
    }

    error::Domain CloseStatus::errorDomain() const {
        switch ( reason ) {
            case kWebSocketClose:
                // Handshake failures report the HTTP status as the close code:
                return (code > 0 && code < kCodeNormal) ? error::HTTP : error::WebSocket;
            case kPOSIXError:
                return error::POSIX;
            case kNetworkError:
                return error::Network;
            default:
                return error::LiteFeed;
        }
    }

}  // namespace litefeed::websocket
