//
// WebSocketChangeTracker.cc
//
// Copyright 2017-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "WebSocketChangeTracker.hh"
#include "Address.hh"
#include "ChangesFeedRequest.hh"
#include "StringUtil.hh"
#include <atomic>
#include <mutex>

using namespace std;
using namespace fleece;
using namespace litefeed::websocket;

namespace litefeed::tracker {

#pragma mark - FEED CONNECTION:

    /** Pairs one WebSocket with the tracker that opened it, and forwards the socket's events
        (which arrive on the transport's threads) to the tracker's mailbox. When the tracker is
        done with it, `detach` cuts both links, after which events go nowhere. */
    class FeedConnection final
        : public RefCounted
        , public Delegate {
      public:
        FeedConnection(WebSocketChangeTracker* tracker, Retained<WebSocket> webSocket, unsigned maxPendingMessages)
            : _tracker(tracker), _webSocket(std::move(webSocket)), _maxPendingMessages(maxPendingMessages) {}

        Retained<WebSocket> webSocket() const {
            lock_guard<mutex> lock(_mutex);
            return _webSocket;
        }

        /** Disconnects from the tracker, and returns the WebSocket. */
        Retained<WebSocket> detach() {
            lock_guard<mutex> lock(_mutex);
            _tracker = nullptr;
            return std::move(_webSocket);
        }

        /** Records the client's pause state, then pauses or resumes reading to match. */
        void setClientPaused(bool paused) {
            _clientPaused = paused;
            syncReadPaused();
        }

        /** Pauses or resumes the socket to match the client's pause and the current backlog.
            Runs on both the transport thread and the mailbox; the state is recomputed under
            `_pauseMutex`, so the last call always leaves the socket matching it. */
        void syncReadPaused() {
            lock_guard<mutex> lock(_pauseMutex);
            bool paused = _clientPaused || (_maxPendingMessages > 0 && pendingMessages >= int(_maxPendingMessages));
            if ( paused == _readPaused ) return;
            _readPaused = paused;
            LogVerbose(ChangesLog, "%s reading from the feed", (paused ? "Pausing" : "Resuming"));
            if ( auto ws = webSocket(); ws ) ws->setReadPaused(paused);
        }

        // Messages received but not yet handled by the tracker
        atomic<int> pendingMessages{0};

        //---- WebSocket delegate methods; called on the transport's thread:

        void onWebSocketGotHTTPResponse(int status, const net::Headers& headers) override {
            if ( auto tracker = this->tracker(); tracker )
                tracker->enqueue(FUNCTION_TO_QUEUE(WebSocketChangeTracker::_onHTTPResponse),
                                 Retained<FeedConnection>(this), status, net::Headers(headers));
        }

        bool onWebSocketValidateServerTrust(slice certData) override {
            auto tracker = this->tracker();
            return tracker && tracker->trustServer(this, alloc_slice(certData));
        }

        void onWebSocketConnect() override {
            if ( auto tracker = this->tracker(); tracker )
                tracker->enqueue(FUNCTION_TO_QUEUE(WebSocketChangeTracker::_onOpen), Retained<FeedConnection>(this));
        }

        void onWebSocketFailed(const error& err) override {
            if ( auto tracker = this->tracker(); tracker )
                tracker->enqueue(FUNCTION_TO_QUEUE(WebSocketChangeTracker::_onError), Retained<FeedConnection>(this),
                                 error(err));
        }

        void onWebSocketClose(CloseStatus status) override {
            if ( auto tracker = this->tracker(); tracker )
                tracker->enqueue(FUNCTION_TO_QUEUE(WebSocketChangeTracker::_onClose), Retained<FeedConnection>(this),
                                 status);
        }

        void onWebSocketMessage(Message* message) override {
            auto tracker = this->tracker();
            if ( !tracker ) return;
            ++pendingMessages;
            syncReadPaused();
            tracker->enqueue(FUNCTION_TO_QUEUE(WebSocketChangeTracker::_onMessage), Retained<FeedConnection>(this),
                             Retained<Message>(message));
        }

      private:
        Retained<WebSocketChangeTracker> tracker() const {
            lock_guard<mutex> lock(_mutex);
            return _tracker;
        }

        mutable mutex                    _mutex;
        Retained<WebSocketChangeTracker> _tracker;  // Keeps the tracker alive while connected
        Retained<WebSocket>              _webSocket;
        unsigned const                   _maxPendingMessages;
        mutex                            _pauseMutex;
        atomic<bool>                     _clientPaused{false};
        bool                             _readPaused{false};  // guarded by _pauseMutex
    };

#pragma mark - TRACKER:

    WebSocketChangeTracker::WebSocketChangeTracker(slice databaseURL, Retained<ChangeTrackerOptions> options,
                                                   ChangeTrackerClient* client, Collaborators collaborators)
        : ChangeTracker(databaseURL, std::move(options), client, std::move(collaborators.retryPolicy),
                        "WSChangeTracker")
        , _provider(std::move(collaborators.provider))
        , _cookieStore(std::move(collaborators.cookieStore))
        , _authorizer(std::move(collaborators.authorizer))
        , _parser(std::move(collaborators.parser))
        , _maxPendingMessages(this->options().maxPendingMessages()) {
        if ( !_provider ) error::_throw(error::InvalidParameter, "WebSocketChangeTracker requires a Provider");
        if ( !_parser ) _parser = make_unique<JSONChangeParser>();
    }

    WebSocketChangeTracker::~WebSocketChangeTracker() = default;

    alloc_slice WebSocketChangeTracker::feedURL() {
        return enqueueSync<alloc_slice>("feedURL", [this] { return _feedURL; });
    }

    void WebSocketChangeTracker::openConnection() {
        auto request   = ChangesFeedRequest::build(databaseURL(), options(), _cookieStore, _authorizer);
        _feedURL       = request.url.url();
        _handleCookies = request.parameters.handleCookies;
        logInfo("Connecting to <%.*s>", SPLAT(_feedURL));

        Retained<WebSocket> webSocket = _provider->createWebSocket(_feedURL, request.parameters);
        _connection                   = new FeedConnection(this, webSocket, _maxPendingMessages);
        try {
            webSocket->connect(new WeakHolder<Delegate>(_connection.get()));
        } catch ( const std::exception& ) {
            discardConnection();
            throw;
        }
    }

    // Makes the current connection stale, so its remaining events will be ignored.
    Retained<WebSocket> WebSocketChangeTracker::discardConnection() {
        Retained<FeedConnection> connection = std::move(_connection);
        _connection                         = nullptr;
        if ( !connection ) return nullptr;
        return connection->detach();
    }

    void WebSocketChangeTracker::closeConnection() {
        if ( auto webSocket = discardConnection(); webSocket ) {
            logVerbose("Closing WebSocket");
            webSocket->close(kCodeNormal);
        }
    }

    void WebSocketChangeTracker::updateReadPaused() {
        if ( _connection ) _connection->setClientPaused(_paused);
    }

    int WebSocketChangeTracker::pendingMessages() {
        return enqueueSync<int>("pendingMessages",
                                [this] { return _connection ? _connection->pendingMessages.load() : 0; });
    }

    error WebSocketChangeTracker::errorWithURL(error::Domain domain, int code, slice message) const {
        return error(domain, code, stringprintf("%.*s (URL: %.*s)", SPLAT(message), SPLAT(_feedURL)));
    }

#pragma mark - TRANSPORT EVENTS:

    // Called on the transport's thread; blocks it until the mailbox has decided.
    bool WebSocketChangeTracker::trustServer(FeedConnection* connection, alloc_slice certData) {
        try {
            return enqueueSync<bool>("trustServer", [=] {
                if ( connection != _connection.get() ) return false;
                return checkServerTrust(certData);
            });
        } catch ( const std::exception& x ) {
            warn("Exception checking server trust: %s", x.what());
            return false;
        }
    }

    void WebSocketChangeTracker::_onHTTPResponse(Retained<FeedConnection> connection, int status,
                                                 net::Headers headers) {
        if ( connection.get() != _connection.get() ) return;
        logVerbose("Got HTTP response, status %d", status);
        if ( _cookieStore && _handleCookies ) {
            net::Address from(_feedURL);
            if ( unsigned n = _cookieStore->setCookies(headers, from); n > 0 ) logVerbose("Stored %u cookie(s)", n);
        }
    }

    void WebSocketChangeTracker::_onOpen(Retained<FeedConnection> connection) {
        if ( connection.get() != _connection.get() || !_running ) return;
        connectionOpened();
        alloc_slice body = feedOptionsBody();
        logVerbose("Sending feed options: %.*s", SPLAT(body));
        if ( auto webSocket = connection->webSocket(); webSocket ) webSocket->send(body, false);
        updateReadPaused();
    }

    void WebSocketChangeTracker::_onMessage(Retained<FeedConnection> connection, Retained<Message> message) {
        // The message is no longer pending once handled, even if handling it threw.
        auto handled = [&] {
            --connection->pendingMessages;
            updateReadPaused();
        };
        try {
            if ( connection.get() == _connection.get() && _running && _state != TrackerState::Closing ) {
                if ( message->binary ) {
                    warn("Received a binary message; closing");
                    _state = TrackerState::Closing;
                    if ( auto webSocket = connection->webSocket(); webSocket )
                        webSocket->close(kCodeUnsupportedData, "Unknown message"_sl);
                } else if ( message->data.size > 0 ) {
                    handleChanges(connection, message->data);
                }
            }
        } catch ( const std::exception& ) {
            handled();
            throw;
        }
        handled();
    }

    void WebSocketChangeTracker::handleChanges(FeedConnection* connection, slice data) {
        bool    parsed = _parser->parseBytes(data);
        int64_t count  = _parser->endParsingData();
        if ( !parsed || count < 0 ) {
            warn("Couldn't parse change-feed message; closing");
            _state = TrackerState::Closing;
            if ( auto webSocket = connection->webSocket(); webSocket )
                webSocket->close(kCodeUnsupportedData, "Unparseable change entry"_sl);
            return;
        }
        if ( count == 0 ) {
            receivedCaughtUp();
            return;
        }
        logVerbose("Received %lld changes", (long long)count);
        for ( auto& change : _parser->takeChanges() ) {
            if ( !_running || connection != _connection.get() ) break;  // client stopped us
            receivedChange(change);
        }
    }

    void WebSocketChangeTracker::_onError(Retained<FeedConnection> connection, error err) {
        if ( connection.get() != _connection.get() ) return;
        discardConnection();
        error::Domain domain = err.domain;
        // A failed handshake reports the HTTP status:
        if ( domain == error::WebSocket && err.code < 1000 ) domain = error::HTTP;
        failedWithError(errorWithURL(domain, err.code, slice(err.what())));
    }

    void WebSocketChangeTracker::_onClose(Retained<FeedConnection> connection, CloseStatus status) {
        if ( connection.get() != _connection.get() ) return;
        discardConnection();
        logInfo("Connection closed with %s %d: %.*s", status.reasonName(), status.code, SPLAT(status.message));
        if ( status.isNormal() ) {
            stop();
            return;
        }

        error::Domain domain = status.errorDomain();
        int           code   = status.code;
        if ( domain == error::LiteFeed ) {
            code = error::UnexpectedError;
        } else if ( code == 0 ) {
            domain = error::WebSocket;
            code   = kCodeAbnormal;
        }
        string message = status.message ? string(status.message) : error::_what(domain, code);
        failedWithError(errorWithURL(domain, code, slice(message)));
    }

}  // namespace litefeed::tracker
