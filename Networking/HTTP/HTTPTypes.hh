//
//  HTTPTypes.hh
//
//  Copyright 2019-Present Couchbase, Inc.
//
//  Use of this software is governed by the Business Source License included
//  in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
//  in that file, in accordance with the Business Source License, use of this
//  software will be governed by the Apache License, Version 2.0, included in
//  the file licenses/APL2.txt.
//

#pragma once

namespace litefeed::net {

    /// HTTP status codes
    enum class HTTPStatus : int {
        undefined = -1,
        Upgraded  = 101,

        OK        = 200,
        Created   = 201,
        NoContent = 204,

        MovedPermanently  = 301,
        Found             = 302,
        SeeOther          = 303,
        NotModified       = 304,
        TemporaryRedirect = 307,

        BadRequest         = 400,
        Unauthorized       = 401,
        Forbidden          = 403,
        NotFound           = 404,
        MethodNotAllowed   = 405,
        NotAcceptable      = 406,
        ProxyAuthRequired  = 407,
        RequestTimeout     = 408,
        Conflict           = 409,
        Gone               = 410,
        PreconditionFailed = 412,
        TooManyRequests    = 429,

        ServerError        = 500,
        NotImplemented     = 501,
        GatewayError       = 502,
        ServiceUnavailable = 503,
        GatewayTimeout     = 504,
    };

    inline bool IsSuccess(HTTPStatus s) { return int(s) >= 200 && int(s) < 300; }

    /// The largest value that's treated as an HTTP status when it arrives as a WebSocket close
    /// code; real close codes start at 1000.
    constexpr int kMaxHTTPStatus = 999;

    /// The standard reason phrase for a status, or nullptr if it's not one we know.
    const char* StatusMessage(HTTPStatus);

}  // namespace litefeed::net
