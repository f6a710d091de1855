//
// MockWebSocket.hh
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
#include "WebSocketInterface.hh"
#include "Headers.hh"
#include "Actor.hh"
#include "Error.hh"
#include "Logging.hh"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <iomanip>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace litefeed::websocket {

    /** A WebSocket that doesn't touch the network, for tests. Nothing happens on its own: the
        test calls the `simulate...` methods to make the "server" respond, and inspects what the
        client sent. Delegate callbacks are made on the socket's own Actor thread, like a real
        transport's. */
    class MockWebSocket final : public WebSocket {
      protected:
        class Driver;

      public:
        MockWebSocket(const URL& url, Parameters params)
            : WebSocket(url), _parameters(std::move(params)), _driver(new Driver(this)) {}

        /** The parameters the Provider was given. */
        const Parameters& parameters() const { return _parameters; }

        //---- WebSocket API:

        bool send(fleece::slice msg, bool binary) override {
            _driver->enqueue(FUNCTION_TO_QUEUE(Driver::_send), fleece::alloc_slice(msg), binary);
            return true;
        }

        void close(int status = kCodeNormal, fleece::slice message = fleece::nullslice) override {
            _driver->enqueue(FUNCTION_TO_QUEUE(Driver::_close), status, fleece::alloc_slice(message));
        }

        void setReadPaused(bool paused) override {
            ++_pauseCalls;
            // A slow transport takes a while to stop reading:
            if ( paused && _pauseDelay.count() > 0 ) std::this_thread::sleep_for(_pauseDelay);
            {
                std::lock_guard<std::mutex> lock(_mutex);
                _pauseHistory.push_back(paused);
            }
            _driver->_readPaused = paused;
            if ( !paused ) _driver->enqueue(FUNCTION_TO_QUEUE(Driver::_flushHeldMessages));
        }

        //---- Inspection, callable from any thread:

        bool connectCalled() const { return _driver->_connectCalled; }

        bool isOpen() const { return _driver->_state == State::connected; }

        bool readPaused() const { return _driver->_readPaused; }

        /** Number of setReadPaused calls begun, including any still in progress. */
        int pauseCalls() const { return _pauseCalls; }

        std::vector<bool> pauseHistory() const {
            std::lock_guard<std::mutex> lock(_mutex);
            return _pauseHistory;
        }

        std::vector<std::string> sentMessages() const {
            std::lock_guard<std::mutex> lock(_mutex);
            return _sent;
        }

        /** The status and message the client passed to close(), if it called it. */
        std::optional<CloseStatus> closeRequest() const {
            std::lock_guard<std::mutex> lock(_mutex);
            return _closeRequest;
        }

        //---- Simulating the server:

        void simulateHTTPResponse(int status, const net::Headers& headers = {}) {
            _driver->enqueue(FUNCTION_TO_QUEUE(Driver::_httpResponse), status, net::Headers(headers));
        }

        void simulateConnected() { _driver->enqueue(FUNCTION_TO_QUEUE(Driver::_connected)); }

        void simulateReceived(fleece::slice message, bool binary = false) {
            Retained<Message> msg = new Message(fleece::alloc_slice(message), binary);
            _driver->enqueue(FUNCTION_TO_QUEUE(Driver::_received), msg);
        }

        void simulateClosed(CloseReason reason = kWebSocketClose, int code = kCodeNormal,
                            fleece::slice message = fleece::nullslice) {
            _driver->enqueue(FUNCTION_TO_QUEUE(Driver::_closed), CloseStatus(reason, code, message));
        }

        void simulateFailed(const error& err) { _driver->enqueue(FUNCTION_TO_QUEUE(Driver::_failed), error(err)); }

        /** Asks the delegate to validate a server certificate, blocking like a real TLS handshake.
            If it's rejected, the connection then fails with kNetErrTLSCertUntrusted. */
        bool simulateServerTrust(fleece::slice certData) {
            auto holder  = delegateWeak();
            bool trusted = holder && holder->call<bool>(&Delegate::onWebSocketValidateServerTrust, certData).value_or(false);
            if ( !trusted ) simulateFailed(error(error::Network, kNetErrTLSCertUntrusted));
            return trusted;
        }

        /** Blocks until all simulated events enqueued so far have been delivered. */
        void waitTillDrained() { _driver->waitTillDrained(); }

        //---- Misbehaving, set up before connecting:

        /** Makes connect() throw this error. */
        void setConnectError(std::optional<error> err) { _connectError = std::move(err); }

        /** Makes each setReadPaused(true) call block this long before taking effect. */
        void setPauseDelay(std::chrono::milliseconds delay) { _pauseDelay = delay; }

        /** Makes the server ignore the client's close request, so the socket stays open. */
        void setIgnoresClose(bool ignores) { _driver->_ignoresClose = ignores; }

      protected:
        void connect() override {
            if ( _connectError ) _connectError->_throw();
            _driver->enqueue(FUNCTION_TO_QUEUE(Driver::_connect));
        }

        enum class State { unconnected, connecting, connected, closed };

        // The internal Actor that delivers the events
        class Driver final : public actor::Actor {
          public:
            explicit Driver(MockWebSocket* ws) : Actor(WSLogDomain, "MockWebSocket"), _webSocket(ws) {}

            std::string loggingClassName() const override { return "MockWS"; }

          protected:
            template <typename MemFuncPtr, typename... Args>
            void notify(MemFuncPtr fn, Args&&... args) {
                if ( !_webSocket ) return;
                if ( auto holder = _webSocket->delegateWeak(); holder )
                    holder->invoke(fn, std::forward<Args>(args)...);
            }

            void _connect() {
                logVerbose("Client called connect()");
                _connectCalled = true;
                if ( _state == State::unconnected ) _state = State::connecting;
            }

            void _httpResponse(int status, net::Headers headers) {
                logVerbose("HTTP response %d", status);
                notify(&Delegate::onWebSocketGotHTTPResponse, status, headers);
            }

            void _connected() {
                if ( _state != State::connecting ) {
                    warn("simulateConnected called in wrong state");
                    return;
                }
                logInfo("CONNECTED");
                _state = State::connected;
                notify(&Delegate::onWebSocketConnect);
            }

            void _send(fleece::alloc_slice msg, bool binary) {
                if ( _state != State::connected ) {
                    logInfo("SEND: Failed, socket is not open");
                    return;
                }
                logVerbose("SEND: %s", formatMsg(msg, binary).c_str());
                std::lock_guard<std::mutex> lock(_webSocket->_mutex);
                _webSocket->_sent.emplace_back(msg);
            }

            void _received(Retained<Message> message) {
                if ( _state != State::connected ) return;
                if ( _readPaused ) {
                    logVerbose("Holding message while reading is paused");
                    _held.push_back(std::move(message));
                    return;
                }
                logVerbose("RECEIVED: %s", formatMsg(message->data, message->binary).c_str());
                notify(&Delegate::onWebSocketMessage, message.get());
            }

            void _flushHeldMessages() {
                while ( !_held.empty() && !_readPaused && _state == State::connected ) {
                    Retained<Message> message = std::move(_held.front());
                    _held.pop_front();
                    notify(&Delegate::onWebSocketMessage, message.get());
                }
            }

            void _close(int status, fleece::alloc_slice message) {
                if ( !_webSocket ) return;
                logInfo("Client called close(%d)", status);
                {
                    std::lock_guard<std::mutex> lock(_webSocket->_mutex);
                    _webSocket->_closeRequest = CloseStatus(kWebSocketClose, status, message);
                }
                // The mock server acknowledges the close handshake immediately:
                if ( _ignoresClose ) return;
                if ( _state == State::connecting || _state == State::connected )
                    _closed(CloseStatus(kWebSocketClose, status, message));
            }

            void _closed(CloseStatus status) {
                if ( _state == State::closed || !_webSocket ) return;
                logInfo("CLOSED with %s %d: %.*s", status.reasonName(), status.code, (int)status.message.size,
                        (const char*)status.message.buf);
                _state = State::closed;
                _held.clear();
                notify(&Delegate::onWebSocketClose, status);
                _webSocket = nullptr;  // breaks cycle
            }

            void _failed(error err) {
                if ( _state == State::closed || !_webSocket ) return;
                logInfo("FAILED: %s", err.what());
                _state = State::closed;
                _held.clear();
                notify(&Delegate::onWebSocketFailed, err);
                _webSocket = nullptr;  // breaks cycle
            }

            static std::string formatMsg(fleece::slice msg, bool binary, size_t maxBytes = 64) {
                std::stringstream desc;
                size_t            size = std::min(msg.size, maxBytes);
                if ( binary ) {
                    desc << std::hex;
                    for ( size_t i = 0; i < size; i++ ) {
                        if ( i > 0 && (i % 4) == 0 ) desc << ' ';
                        desc << std::setw(2) << std::setfill('0') << (unsigned)msg[i];
                    }
                    desc << std::dec;
                } else {
                    desc.write((const char*)msg.buf, (std::streamsize)size);
                }
                if ( size < msg.size ) desc << "... [" << msg.size << "]";
                return desc.str();
            }

          private:
            friend class MockWebSocket;

            Retained<MockWebSocket>       _webSocket;
            std::atomic<State>            _state{State::unconnected};
            std::atomic<bool>             _connectCalled{false};
            std::atomic<bool>             _readPaused{false};
            std::atomic<bool>             _ignoresClose{false};
            std::deque<Retained<Message>> _held;
        };

      private:
        Parameters const           _parameters;
        Retained<Driver>           _driver;
        mutable std::mutex         _mutex;
        std::vector<std::string>   _sent;
        std::vector<bool>          _pauseHistory;
        std::optional<CloseStatus> _closeRequest;
        std::optional<error>       _connectError;
        std::chrono::milliseconds  _pauseDelay{0};
        std::atomic<int>           _pauseCalls{0};
    };

    /** Provider that creates MockWebSockets and remembers them, so a test can drive them. */
    class MockProvider final : public Provider {
      public:
        Retained<WebSocket> createWebSocket(const URL& url, const Parameters& params) override {
            std::lock_guard<std::mutex> lock(_mutex);
            if ( _createError ) _createError->_throw();
            Retained<MockWebSocket> ws = new MockWebSocket(url, params);
            ws->setConnectError(_connectError);
            ws->setPauseDelay(_pauseDelay);
            _sockets.push_back(ws);
            return ws;
        }

        /** Makes subsequent createWebSocket calls throw this error (or not, if nullopt.) */
        void setCreateError(std::optional<error> err) {
            std::lock_guard<std::mutex> lock(_mutex);
            _createError = std::move(err);
        }

        /** Makes the sockets created from now on throw this error from connect(). */
        void setConnectError(std::optional<error> err) {
            std::lock_guard<std::mutex> lock(_mutex);
            _connectError = std::move(err);
        }

        /** Gives the sockets created from now on a slow setReadPaused(true). */
        void setPauseDelay(std::chrono::milliseconds delay) {
            std::lock_guard<std::mutex> lock(_mutex);
            _pauseDelay = delay;
        }

        size_t socketCount() const {
            std::lock_guard<std::mutex> lock(_mutex);
            return _sockets.size();
        }

        /** The most recently created socket, or nullptr. */
        Retained<MockWebSocket> latest() const {
            std::lock_guard<std::mutex> lock(_mutex);
            return _sockets.empty() ? nullptr : _sockets.back();
        }

      private:
        mutable std::mutex                   _mutex;
        std::vector<Retained<MockWebSocket>> _sockets;
        std::optional<error>                 _createError;
        std::optional<error>                 _connectError;
        std::chrono::milliseconds            _pauseDelay{0};
    };

}  // namespace litefeed::websocket
