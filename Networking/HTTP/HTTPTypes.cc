//
//  HTTPTypes.cc
//
//  Copyright 2019-Present Couchbase, Inc.
//
//  Use of this software is governed by the Business Source License included
//  in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
//  in that file, in accordance with the Business Source License, use of this
//  software will be governed by the Apache License, Version 2.0, included in
//  the file licenses/APL2.txt.
//

#include "HTTPTypes.hh"

namespace litefeed::net {

    static const struct {
        HTTPStatus  code;
        const char* message;
    } kHTTPStatusMessages[] = {{HTTPStatus::Upgraded, "Switching Protocols"},
                               {HTTPStatus::OK, "OK"},
                               {HTTPStatus::Created, "Created"},
                               {HTTPStatus::NoContent, "No Content"},
                               {HTTPStatus::MovedPermanently, "Moved Permanently"},
                               {HTTPStatus::Found, "Found"},
                               {HTTPStatus::SeeOther, "See Other"},
                               {HTTPStatus::NotModified, "Not Modified"},
                               {HTTPStatus::TemporaryRedirect, "Temporary Redirect"},
                               {HTTPStatus::BadRequest, "Invalid Request"},
                               {HTTPStatus::Unauthorized, "Unauthorized"},
                               {HTTPStatus::Forbidden, "Forbidden"},
                               {HTTPStatus::NotFound, "Not Found"},
                               {HTTPStatus::MethodNotAllowed, "Method Not Allowed"},
                               {HTTPStatus::NotAcceptable, "Not Acceptable"},
                               {HTTPStatus::ProxyAuthRequired, "Proxy Authentication Required"},
                               {HTTPStatus::RequestTimeout, "Request Timeout"},
                               {HTTPStatus::Conflict, "Conflict"},
                               {HTTPStatus::Gone, "Gone"},
                               {HTTPStatus::PreconditionFailed, "Precondition Failed"},
                               {HTTPStatus::TooManyRequests, "Too Many Requests"},
                               {HTTPStatus::ServerError, "Internal Server Error"},
                               {HTTPStatus::NotImplemented, "Not Implemented"},
                               {HTTPStatus::GatewayError, "Bad Gateway"},
                               {HTTPStatus::ServiceUnavailable, "Service Unavailable"},
                               {HTTPStatus::GatewayTimeout, "Gateway Timeout"},
                               {HTTPStatus::undefined, nullptr}};

    const char* StatusMessage(HTTPStatus code) {
        for ( unsigned i = 0; kHTTPStatusMessages[i].message; ++i ) {
            if ( kHTTPStatusMessages[i].code == code ) return kHTTPStatusMessages[i].message;
        }
        return nullptr;
    }

}  // namespace litefeed::net
