//
// Authorizer.hh
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
#include "fleece/RefCounted.hh"
#include <string>
#include <utility>

namespace litefeed::tracker {

    /** Supplies the `Authorization` header of a request. */
    class Authorizer : public fleece::RefCounted {
      public:
        /** Returns the header value for a request to `url`, or an empty string for none.
            `realm` is the realm of a previous 401 challenge, or null if there wasn't one. */
        virtual std::string authorizationHeader(const net::Address& url, fleece::slice realm) = 0;
    };

    /** An Authorizer that always returns the same value, like "Bearer xxxxx". */
    class StaticAuthorizer final : public Authorizer {
      public:
        explicit StaticAuthorizer(std::string header) : _header(std::move(header)) {}

        std::string authorizationHeader(const net::Address&, fleece::slice) override { return _header; }

      private:
        std::string const _header;
    };

}  // namespace litefeed::tracker
