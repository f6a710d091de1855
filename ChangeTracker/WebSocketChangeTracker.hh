//
// WebSocketChangeTracker.hh
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
#include "ChangeTracker.hh"
#include "ChangeParser.hh"
#include "Authorizer.hh"
#include "CookieStore.hh"
#include "WebSocketInterface.hh"
#include <memory>

namespace litefeed::tracker {
    class FeedConnection;

    /** A ChangeTracker that reads a `_changes?feed=websocket` feed over a WebSocket.
        After opening, it sends the feed options as a text message; the server replies with text
        messages each holding a JSON array of changes, where an empty array means it's caught up.
        Reading pauses while more than `maxPendingMessages` messages are waiting to be handled. */
    class WebSocketChangeTracker final : public ChangeTracker {
      public:
        /** The objects a tracker works with. Only the provider is required. */
        struct Collaborators {
            Retained<websocket::Provider> provider;
            Retained<net::CookieStore>    cookieStore;
            Retained<Authorizer>          authorizer;
            Retained<RetryPolicy>         retryPolicy;
            std::unique_ptr<ChangeParser> parser;  // defaults to a JSONChangeParser
        };

        WebSocketChangeTracker(fleece::slice databaseURL, Retained<ChangeTrackerOptions>, ChangeTrackerClient*,
                               Collaborators);

        /** The URL of the feed, once start() has been called. */
        fleece::alloc_slice feedURL();

        /** Number of messages received on the current connection that haven't been handled yet. */
        int pendingMessages();

      protected:
        ~WebSocketChangeTracker() override;

        std::string loggingClassName() const override { return "WSChangeTracker"; }

        void openConnection() override;

        bool hasConnection() const override { return _connection != nullptr; }

        void closeConnection() override;
        void updateReadPaused() override;

      private:
        friend class FeedConnection;

        Retained<websocket::WebSocket> discardConnection();
        bool                           trustServer(FeedConnection*, fleece::alloc_slice certData);
        error                          errorWithURL(error::Domain, int code, fleece::slice message) const;
        void                           handleChanges(FeedConnection*, fleece::slice data);

        // Transport events, forwarded by the FeedConnection:
        void _onHTTPResponse(Retained<FeedConnection>, int status, net::Headers);
        void _onOpen(Retained<FeedConnection>);
        void _onMessage(Retained<FeedConnection>, Retained<websocket::Message>);
        void _onError(Retained<FeedConnection>, error);
        void _onClose(Retained<FeedConnection>, websocket::CloseStatus);

        Retained<websocket::Provider> const _provider;
        Retained<net::CookieStore> const    _cookieStore;
        Retained<Authorizer> const          _authorizer;
        std::unique_ptr<ChangeParser>       _parser;
        unsigned const                      _maxPendingMessages;
        Retained<FeedConnection>            _connection;  // The current connection, if any
        fleece::alloc_slice                 _feedURL;
        bool                                _handleCookies{true};
    };

}  // namespace litefeed::tracker
