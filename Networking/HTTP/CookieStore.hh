//
// CookieStore.hh
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
#include "fleece/RefCounted.hh"
#include "fleece/Fleece.hh"
#include <ctime>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace litefeed::net {
    using fleece::RefCounted;

    struct Address;
    class Headers;

    /** An HTTP cookie, as parsed from a `Set-Cookie` response header. */
    struct Cookie {
        // The constructors don't throw on invalid input; the resulting Cookie is just invalid.

        Cookie() = default;
        Cookie(const std::string& header, const std::string& fromHost, const std::string& fromPath,
               bool acceptParentDomain = false);
        explicit Cookie(fleece::Dict);

        explicit operator bool() const { return valid(); }

        [[nodiscard]] bool valid() const { return !name.empty(); }

        /** A persistent cookie has an expiration time; others last only as long as the store. */
        [[nodiscard]] bool persistent() const { return expires > 0; }

        [[nodiscard]] bool expired() const { return expires > 0 && expires < time(nullptr); }

        /** True if the other cookie has the same name, domain and path, i.e. replaces this one. */
        [[nodiscard]] bool matches(const Cookie&) const;

        /** True if this cookie should be sent in a request to this address. */
        [[nodiscard]] bool matches(const Address&) const;

        [[nodiscard]] bool sameValueAs(const Cookie&) const;

        std::string name;
        std::string value;
        std::string domain;
        std::string path;
        time_t      created{0};
        time_t      expires{0};
        bool        secure{false};
    };

    std::ostream&    operator<<(std::ostream&, const Cookie&);
    fleece::Encoder& operator<<(fleece::Encoder&, const Cookie&);

    /** A cookie jar. Cookies are added from `Set-Cookie` headers, and the store generates the
        `Cookie` header value for a request. Persistent cookies can be encoded as Fleece and
        restored later; where that data is kept is up to the owner.
        Instances are thread-safe, so one store can be shared by many connections. */
    class CookieStore : public RefCounted {
      public:
        CookieStore() = default;
        explicit CookieStore(fleece::slice data);

        CookieStore(const CookieStore&) = delete;

        /** Encodes the unexpired persistent cookies as a Fleece array. */
        fleece::alloc_slice encode();

        std::vector<const Cookie*> cookies() const;

        /** The value of a `Cookie` header for a request to this address; empty if none apply. */
        std::string cookiesForRequest(const Address&) const;

        /** Adds a cookie from a Set-Cookie: header value. Returns false if the cookie is invalid. */
        bool setCookie(const std::string& headerValue, const std::string& fromHost, const std::string& fromPath,
                       bool acceptParentDomain = false);

        /** Adds every `Set-Cookie` header of a response from the given address.
            Returns the number of cookies accepted. */
        unsigned setCookies(const Headers& responseHeaders, const Address& fromAddress);

        void clearCookies();

        /** True if the set of persistent cookies has changed since the last clearChanged(). */
        bool changed();
        void clearChanged();

      private:
        using CookiePtr = std::unique_ptr<const Cookie>;

        void _addCookie(CookiePtr newCookie);

        std::vector<CookiePtr> _cookies;
        bool                   _changed{false};
        mutable std::mutex     _mutex;
    };

}  // namespace litefeed::net
