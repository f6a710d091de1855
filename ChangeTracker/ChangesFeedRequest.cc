//
// ChangesFeedRequest.cc
//
// Copyright 2017-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "ChangesFeedRequest.hh"
#include "Authorizer.hh"
#include "ChangeTrackerOptions.hh"
#include "ChangeTrackerTypes.hh"
#include "CookieStore.hh"
#include "StringUtil.hh"
#include "fleece/Fleece.hh"
#include <cerrno>
#include <cstdlib>
#include <set>
#include <string>

using namespace std;
using namespace fleece;

namespace litefeed::tracker {

    ChangesFeedRequest ChangesFeedRequest::build(slice databaseURL, const ChangeTrackerOptions& options,
                                                 net::CookieStore* cookies, Authorizer* authorizer) {
        net::Address       dbAddress(databaseURL);
        ChangesFeedRequest request{dbAddress.appendingPath(kFeedPath), websocket::Parameters{}};
        auto&              params = request.parameters;

        // Give the server time to send a heartbeat before timing out:
        params.timeout = options.heartbeat() * 1.5;

        if ( Dict headers = options.headers(); headers ) {
            params.headers = net::Headers(headers);
            if ( params.headers.contains("Cookie"_sl) ) {
                // The client is managing cookies itself
                LogVerbose(ChangesLog, "Request has a custom Cookie header; not adding stored cookies");
                params.handleCookies = false;
            }
        }

        if ( params.handleCookies && cookies ) {
            string cookieHeader = cookies->cookiesForRequest(request.url);
            if ( !cookieHeader.empty() ) params.headers.set("Cookie"_sl, slice(cookieHeader));
        }

        if ( authorizer ) {
            string auth = authorizer->authorizationHeader(request.url, nullslice);
            if ( !auth.empty() ) params.headers.set("Authorization"_sl, slice(auth));
        }

        if ( Dict tls = options.tlsOptions(); tls ) {
            Encoder enc;
            enc.writeValue(tls);
            params.tlsOptions = AllocedDict(enc.finish());
        }
        return request;
    }

    alloc_slice ChangesFeedRequest::optionsBody(const ChangeTrackerOptions& options, slice lastSequenceID,
                                                bool caughtUp) {
        set<string> written;
        JSONEncoder enc;
        auto        key = [&](const char* name) {
            written.insert(name);
            enc.writeKey(slice(name));
        };

        enc.beginDict();
        key("feed");
        enc.writeString("websocket"_sl);
        key("heartbeat");
        enc.writeInt(int64_t(options.heartbeat().count() * 1000.0));
        if ( options.includeConflicts() ) {
            key("style");
            enc.writeString("all_docs"_sl);
        }
        if ( options.activeOnly() && !caughtUp ) {
            key("active_only");
            enc.writeBool(true);
        }
        if ( lastSequenceID.size > 0 ) {
            key("since");
            // A number is sent as a number, unless it's too big for one.
            string             since(lastSequenceID);
            unsigned long long seq = 0;
            bool               numeric = false;
            if ( isDecimalInteger(since) ) {
                errno   = 0;
                seq     = strtoull(since.c_str(), nullptr, 10);
                numeric = (errno != ERANGE);
            }
            if ( numeric )
                enc.writeUInt(seq);
            else
                enc.writeString(lastSequenceID);
        }
        if ( int64_t limit = options.limit(); limit > 0 ) {
            key("limit");
            enc.writeInt(limit);
        }

        slice filter = options.filter();
        Array docIDs = options.docIDs();
        if ( docIDs && !filter ) filter = "_doc_ids"_sl;
        if ( filter ) {
            key("filter");
            enc.writeString(filter);
        }
        if ( docIDs ) {
            key("doc_ids");
            enc.writeValue(docIDs);
        }
        if ( Dict params = options.filterParams(); params && filter ) {
            for ( Dict::iterator i(params); i; ++i ) {
                string name(i.keyString());
                if ( written.count(name) > 0 ) {
                    LogWarn(ChangesLog, "Ignoring filter parameter '%s' that conflicts with a feed option",
                            name.c_str());
                    continue;
                }
                written.insert(name);
                enc.writeKey(i.keyString());
                enc.writeValue(i.value());
            }
        }
        enc.endDict();
        return enc.finish();
    }

}  // namespace litefeed::tracker
