//
// WebSocketInterface.hh
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#pragma once
#include "Error.hh"
#include "Headers.hh"
#include "Logging.hh"
#include "WeakHolder.hh"
#include "fleece/RefCounted.hh"
#include "fleece/Expert.hh"  // for AllocedDict
#include <chrono>
#include <utility>

/*  The transport seam. LiteFeed doesn't implement WebSockets itself: the application supplies a
    Provider that creates WebSocket objects, whose events go to a Delegate. */

namespace litefeed::websocket {
    using fleece::RefCounted;
    using fleece::Retained;

    /** "WS" log domain, for transports */
    extern LogDomain WSLogDomain;

    using URL = fleece::alloc_slice;

#pragma mark - STATUS CODES:

    /** Why a WebSocket closed; determines how to interpret CloseStatus::code. */
    enum CloseReason {
        kWebSocketClose,  // WebSocket close code, or HTTP status if the handshake failed
        kPOSIXError,      // errno value
        kNetworkError,    // NetworkError value
        kException,       // An exception was thrown
        kUnknownError
    };

    /** WebSocket close codes (RFC 6455 section 7.4.1) */
    enum CloseCode {
        kCodeNormal = 1000,
        kCodeGoingAway,
        kCodeProtocolError,
        kCodeUnsupportedData,
        kCodeStatusCodeExpected = 1005,  // Never sent on the wire
        kCodeAbnormal,                   // Never sent on the wire
        kCodeInconsistentData,
        kCodePolicyViolation,
        kCodeMessageTooBig,
        kCodeExtensionNotNegotiated,
        kCodeUnexpectedCondition,
        kCodeFailedTLSHandshake = 1015,
    };

    /** Codes in the `error::Network` domain. Each has a message in Error.cc. */
    enum NetworkError {
        kNetErrDNSFailure = 1,
        kNetErrUnknownHost,
        kNetErrTimeout,
        kNetErrInvalidURL,
        kNetErrTooManyRedirects,
        kNetErrTLSHandshakeFailed,
        kNetErrTLSCertExpired,
        kNetErrTLSCertUntrusted,
        kNetErrTLSCertRequiredByPeer,
        kNetErrTLSCertRejectedByPeer,  // 10
        kNetErrTLSCertUnknownRoot,
        kNetErrInvalidRedirect,
        kNetErrUnknown,
        kNetErrTLSCertRevoked,
        kNetErrTLSCertNameMismatch,
        kNetErrNetworkReset,
        kNetErrConnectionAborted,
        kNetErrConnectionReset,
        kNetErrConnectionRefused,
        kNetErrNetworkDown,  // 20
        kNetErrNetworkUnreachable,
        kNetErrNotConnected,
        kNetErrHostDown,
        kNetErrHostUnreachable,
        kNetErrAddressNotAvailable,
        kNetErrBrokenPipe,

        kNetErrorMaxPlus1
    };

    /** How a connection ended. */
    struct CloseStatus {
        CloseReason         reason;
        int                 code;
        fleece::alloc_slice message;

        CloseStatus() : CloseStatus(kUnknownError, 0, fleece::nullslice) {}

        CloseStatus(CloseReason reason_, int code_, fleece::alloc_slice message_)
            : reason(reason_), code(code_), message(std::move(message_)) {}

        CloseStatus(CloseReason reason_, int code_, fleece::slice message_)
            : CloseStatus(reason_, code_, fleece::alloc_slice(message_)) {}

        /** True for a completed close handshake with status 1000. */
        [[nodiscard]] bool isNormal() const { return reason == kWebSocketClose && code == kCodeNormal; }

        [[nodiscard]] const char* reasonName() const;

        /** The error domain `code` belongs to. An unknown reason maps to the LiteFeed domain,
            and `code` is then meaningless. */
        [[nodiscard]] error::Domain errorDomain() const;
    };

#pragma mark - CONNECTION:

    class Delegate;

    /** An incoming message. */
    class Message : public RefCounted {
      public:
        Message(fleece::slice d, bool b) : data(d), binary(b) {}

        Message(fleece::alloc_slice d, bool b) : data(std::move(d)), binary(b) {}

        const fleece::alloc_slice data;
        const bool                binary;
    };

    /** Connection settings passed to Provider::createWebSocket. */
    struct Parameters {
        net::Headers                  headers;              // Added to the HTTP upgrade request
        std::chrono::duration<double> timeout{0};           // 0 means the transport's default
        fleece::AllocedDict           tlsOptions;           // Opaque to LiteFeed
        bool                          handleCookies{true};  // False if the caller set the Cookie header
    };

    /** A client WebSocket connection, implemented by the transport. */
    class WebSocket : public RefCounted {
      public:
        const URL& url() const { return _url; }

        /** The delegate's holder; null until connect() has been called. */
        Retained<WeakHolder<Delegate>> delegateWeak() { return _delegateWeakHolder; }

        /** Sets the delegate, then opens the connection. Can only be called once. */
        void connect(Retained<WeakHolder<Delegate>>);

        /** Queues a message to send. Thread-safe. Returns false if the send buffer is full. */
        virtual bool send(fleece::slice message, bool binary = true) = 0;

        /** Starts the close handshake. Thread-safe. */
        virtual void close(int status = kCodeNormal, fleece::slice message = fleece::nullslice) = 0;

        /** Stops or resumes delivering incoming messages. Thread-safe and non-blocking; the
            transport stops reading from the network while paused. */
        virtual void setReadPaused(bool paused) = 0;

      protected:
        explicit WebSocket(URL url);
        ~WebSocket() override;

        /** Opens the connection; the delegate is set by now. */
        virtual void connect() = 0;

      private:
        const URL                      _url;
        Retained<WeakHolder<Delegate>> _delegateWeakHolder;
    };

    /** Receives a WebSocket's events, on a thread of the transport's choosing. */
    class Delegate {
      public:
        virtual ~Delegate() = default;

        /** The HTTP response to the upgrade request, successful or not. */
        virtual void onWebSocketGotHTTPResponse(int status, const net::Headers& headers) {}

        /** Decides whether to accept the server's TLS certificate. The handshake blocks until
            this returns; if it returns false, the connection fails with kNetErrTLSCertUntrusted. */
        virtual bool onWebSocketValidateServerTrust(fleece::slice certData) { return true; }

        virtual void onWebSocketConnect() = 0;

        /** The connection failed without a close handshake, or never opened. */
        virtual void onWebSocketFailed(const error&) = 0;

        virtual void onWebSocketClose(CloseStatus) = 0;

        virtual void onWebSocketMessage(Message*) = 0;
    };

    /** Creates WebSockets. This is where a transport plugs in. */
    class Provider : public RefCounted {
      public:
        /** Returns a new unopened WebSocket. May throw, e.g. for an unsupported URL scheme. */
        virtual Retained<WebSocket> createWebSocket(const URL&, const Parameters&) = 0;
    };

}  // namespace litefeed::websocket
