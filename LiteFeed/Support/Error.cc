//
// Error.cc
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "Error.hh"
#include "Logging.hh"
#include "StringUtil.hh"
#include "HTTPTypes.hh"          // for HTTP status messages
#include "WebSocketInterface.hh"  // for Network error codes
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <new>
#include <string>
#include <typeinfo>

namespace litefeed {

    using namespace std;

#pragma mark ERROR CODES, NAMES, etc.

    __cold static const char* litefeed_errstr(error::LiteFeedError code) {
        static const char* kLiteFeedMessages[] = {
                // These must match up with the codes in the declaration of LiteFeedError
                "no error",  // 0
                "assertion failed",
                "unimplemented function called",
                "connection not open",
                "invalid parameter",
                "unexpected exception",
                "data is corrupted",
                "busy",
                "unsupported operation",
                "error on remote server",
        };
        static_assert(sizeof(kLiteFeedMessages) / sizeof(kLiteFeedMessages[0]) == error::NumLiteFeedErrorsPlus1,
                      "Incomplete error message table");
        const char* str = nullptr;
        if ( code < sizeof(kLiteFeedMessages) / sizeof(char*) ) str = kLiteFeedMessages[code];
        if ( !str ) str = "(unknown LiteFeedError)";
        return str;
    }

    __cold static const char* fleece_errstr(int code) {
        static const char* kFleeceMessages[] = {
                // These must match up with the codes in the declaration of FLError
                "no error",  // 0
                "memory error",
                "out of range",
                "invalid data",
                "Fleece encode/decode error",
                "JSON encode/decode error",
                "unparseable Fleece value",
                "path syntax error",
                "internal error",
                "item not found",
                "misuse of Fleece shared-keys API",
                "POSIX error",
                "unsupported operation",
        };
        const char* str = nullptr;
        if ( code >= 0 && code < sizeof(kFleeceMessages) / sizeof(char*) ) str = kFleeceMessages[code];
        if ( !str ) str = "(unknown Fleece error)";
        return str;
    }

    __cold static const char* network_errstr(int code) {
        static const char* kNetworkMessages[] = {
                // These must match up with the codes in the NetworkError enum in WebSocketInterface.hh
                "no error",  // 0
                "DNS error",
                "unknown hostname",
                "connection timed out",
                "invalid URL",
                "too many redirects",
                "TLS handshake failed",
                "server TLS certificate expired",
                "server TLS certificate untrusted",
                "server requires a TLS client certificate",
                "server rejected the TLS client certificate",
                "server TLS certificate is self-signed or has unknown root cert",
                "redirected to an invalid URL",
                "unknown network error",
                "server TLS certificate has been revoked",
                "server TLS certificate name mismatch",
                "network subsystem was reset",
                "connection aborted",
                "connection reset",
                "connection refused",
                "network subsystem down",
                "network unreachable",
                "socket not connected",
                "host reported not available",
                "host not reachable",
                "address not available",
                "broken pipe",
        };
        static_assert(sizeof(kNetworkMessages) / sizeof(kNetworkMessages[0]) == websocket::kNetErrorMaxPlus1,
                      "Incomplete network error message table");
        const char* str = nullptr;
        if ( code >= 0 && code < sizeof(kNetworkMessages) / sizeof(char*) ) str = kNetworkMessages[code];
        if ( !str ) str = "(unknown network error)";
        return str;
    }

    __cold static const char* websocket_errstr(int code) {
        static const struct {
            int         code;
            const char* message;
        } kWebSocketMessages[] = {{1000, "normal close"},
                                  {1001, "peer going away"},
                                  {1002, "protocol error"},
                                  {1003, "unsupported data"},
                                  {1004, "reserved"},
                                  {1005, "no status code received"},
                                  {1006, "connection closed abnormally"},
                                  {1007, "inconsistent data"},
                                  {1008, "policy violation"},
                                  {1009, "message too big"},
                                  {1010, "extension not negotiated"},
                                  {1011, "unexpected condition"},
                                  {1015, "TLS handshake failed"},
                                  {0, nullptr}};

        for ( unsigned i = 0; kWebSocketMessages[i].message; ++i ) {
            if ( kWebSocketMessages[i].code == code ) return kWebSocketMessages[i].message;
        }
        return code >= 1000 ? "WebSocket error" : "HTTP error";
    }

    __cold static const char* http_errstr(int code) {
        const char* message = net::StatusMessage(net::HTTPStatus(code));
        return message ? message : "HTTP error";
    }

    __cold string error::_what(error::Domain domain, int code) noexcept {
        switch ( domain ) {
            case LiteFeed:
                return litefeed_errstr((LiteFeedError)code);
            case POSIX:
                return strerror(code);
            case Fleece:
                return fleece_errstr(code);
            case Network:
                return network_errstr(code);
            case WebSocket:
                return websocket_errstr(code);
            case HTTP:
                return http_errstr(code);
            default:
                return "unknown error domain";
        }
    }

    __cold const char* error::nameOfDomain(Domain domain) noexcept {
        // Indexed by Domain
        static const char* kDomainNames[] = {"0", "LiteFeed", "POSIX", "Fleece", "Network", "WebSocket", "HTTP"};
        static_assert(sizeof(kDomainNames) / sizeof(kDomainNames[0]) == error::NumDomainsPlus1,
                      "Incomplete domain name table");

        if ( domain >= NumDomainsPlus1 ) return "INVALID_DOMAIN";
        return kDomainNames[domain];
    }

#pragma mark - ERROR CLASS:

    bool error::sWarnOnError = true;

    __cold error::error(error::Domain d, int c) : error(d, c, _what(d, c)) {}

    __cold error::error(error::Domain d, int c, const std::string& what) : runtime_error(what), domain(d), code(c) {
        DebugAssert(code != 0);
    }

    __cold error& error::operator=(const error& e) {
        // This has to be hacked, since `domain` and `code` are marked `const`.
        this->~error();
        new (this) error(e);
        return *this;
    }

    __cold static error unexpectedException(const std::exception& x) {
        // Get the actual exception class name using RTTI.
        // Unmangle it by skipping class name prefix like "St12" (may be compiler dependent)
        const char* name = typeid(x).name();
        while ( isalpha(*name) ) ++name;
        while ( isdigit(*name) ) ++name;
        Warn("Caught unexpected C++ %s(\"%s\")", name, x.what());
        return error(error::LiteFeed, error::UnexpectedError, x.what());
    }

    __cold error error::convertException(const std::exception& x) {
        if ( auto e = dynamic_cast<const error*>(&x); e ) return *e;
        if ( auto le = dynamic_cast<const std::logic_error*>(&x); le ) {
            LiteFeedError code = AssertionFailed;
            if ( dynamic_cast<const std::invalid_argument*>(le) != nullptr
                 || dynamic_cast<const std::domain_error*>(le) != nullptr )
                code = InvalidParameter;
            return error(LiteFeed, code, le->what());
        }
        return unexpectedException(x);
    }

    __cold bool error::isUnremarkable() const {
        if ( code == 0 ) return true;
        switch ( domain ) {
            case LiteFeed:
                return code == NotOpen;
            case Network:
                return code != websocket::kNetErrUnknown;
            default:
                return false;
        }
    }

    __cold void error::_throw() const {
        if ( sWarnOnError && !isUnremarkable() ) {
            WarnError("LiteFeed throwing %s error %d: %s", nameOfDomain(domain), code, what());
        }
        throw *this;
    }

    __cold void error::_throw(Domain domain, int code) { error{domain, code}._throw(); }

    __cold void error::_throw(error::LiteFeedError err) { error{LiteFeed, err}._throw(); }

    __cold void error::_throw(error::LiteFeedError code, const char* fmt, ...) {
        va_list args;
        va_start(args, fmt);
        std::string message = vstringprintf(fmt, args);
        va_end(args);
        error{LiteFeed, code, message}._throw();
    }

    __cold void error::_throw(Domain domain, int code, const char* fmt, ...) {
        va_list args;
        va_start(args, fmt);
        std::string message = vstringprintf(fmt, args);
        va_end(args);
        error{domain, code, message}._throw();
    }

    __cold void error::assertionFailed(const char* fn, const char* file, unsigned line, const char* expr,
                                       const char* message, ...) {
        string messageStr = "Assertion failed: ";
        if ( message ) {
            va_list args;
            va_start(args, message);
            messageStr += vstringprintf(message, args);
            va_end(args);
        } else {
            messageStr += expr;
        }
        if ( !WillLog(LogLevel::Error) ) fprintf(stderr, "%s (%s:%u, in %s)", messageStr.c_str(), file, line, fn);
        WarnError("%s (%s:%u, in %s)", messageStr.c_str(), file, line, fn);
        throw error(LiteFeed, AssertionFailed, messageStr);
    }

}  // namespace litefeed
