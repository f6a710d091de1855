//
// CookieStore.cc
//
// Copyright 2017-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "CookieStore.hh"
#include "Address.hh"
#include "Error.hh"
#include "Headers.hh"
#include "Logging.hh"
#include "StringUtil.hh"
#include "fleece/PlatformCompat.hh"
#include "date/date.h"
#include <chrono>
#include <cstdlib>
#include <limits>
#include <regex>
#include <sstream>
#include <string_view>

using namespace std;
using namespace std::chrono;
using namespace fleece;

namespace litefeed::net {

    // Expires formats we can parse; see date::parse for the format specifiers
    static constexpr string_view kDateFormats[] = {
            "%a, %d %b %Y %T GMT",  // RFC 822
            "%a, %d-%b-%Y %T GMT",  // Netscape format, still used by some load balancers
            "%a %b %d %T %Y"        // ANSI C asctime() format
    };

    // Returns 0 on failure.
    static time_t parseExpires(const string& timeStr) {
        for ( auto format : kDateFormats ) {
            date::sys_seconds tp;
            istringstream     in(timeStr);
            in >> date::parse(format.data(), tp);
            if ( in.fail() ) continue;

            auto secs = tp.time_since_epoch().count();
            if ( _usuallyFalse(secs > numeric_limits<time_t>::max()) ) {
                Warn("Cookie Expires overflows time_t; capping to max");
                return numeric_limits<time_t>::max();
            }
            return (time_t)secs;
        }
        Warn("Couldn't parse Expires in cookie: %s", timeStr.c_str());
        return 0;
    }

#pragma mark - COOKIE:

    Cookie::Cookie(const string& header, const string& fromHost, const string& fromPath, bool acceptParentDomain)
        : domain(fromHost), created(time(nullptr)) {
        // Default path is the request path minus its last component:
        if ( auto slash = fromPath.rfind('/'); slash != string::npos && slash > 0 ) path = fromPath.substr(0, slash);

        // <https://tools.ietf.org/html/rfc6265#section-4.1.1>
        static const regex sAttributeRE("\\s*([^;=]+)=?([^;]*)");
        string             provisionalName;
        unsigned           n = 0;
        for ( sregex_iterator match(header.begin(), header.end(), sAttributeRE), end; match != end; ++match, ++n ) {
            string key = (*match)[1];
            string val = (*match)[2];
            if ( n == 0 ) {
                // The first pair is the cookie's name and value:
                if ( (*match)[0].str().find('=') == string::npos ) break;
                provisionalName = key;
                if ( val.size() >= 2 && hasPrefix(val, "\"") && hasSuffix(val, "\"") )
                    val = val.substr(1, val.size() - 2);
                value = val;
                continue;
            }

            toLowercase(key);
            while ( !key.empty() && isspace((unsigned char)key.back()) ) key.pop_back();
            if ( key == "domain" ) {
                while ( !val.empty() && val[0] == '.' ) val.erase(0, 1);
                if ( !Address::domainContains(fromHost, val) ) {
                    if ( !acceptParentDomain ) {
                        Warn("Cookie Domain isn't legal because it is not a subdomain of the host");
                        return;
                    } else if ( !Address::domainContains(val, fromHost) ) {
                        Warn("Cookie Domain isn't legal");
                        return;
                    }
                }
                domain = val;
            } else if ( key == "path" ) {
                path = val;
            } else if ( key == "secure" ) {
                secure = true;
            } else if ( key == "expires" ) {
                if ( expires == 0 ) {  // Max-Age takes priority
                    expires = parseExpires(val);
                    if ( expires == 0 ) return;
                }
            } else if ( key == "max-age" ) {
                char* valEnd;
                long  maxAge = strtol(val.c_str(), &valEnd, 10);
                if ( val.empty() || *valEnd != '\0' ) {
                    Warn("Couldn't parse Max-Age in cookie");
                    return;
                }
                // A non-positive Max-Age means "expire now"
                expires = (maxAge > 0) ? created + maxAge : 1;
            }
        }

        if ( provisionalName.empty() ) {
            Warn("Couldn't parse Set-Cookie header: %s", header.c_str());
            return;
        }
        name = provisionalName;
    }

    Cookie::Cookie(Dict dict)
        : name(dict["name"].asstring())
        , value(dict["value"].asstring())
        , domain(dict["domain"].asstring())
        , path(dict["path"].asstring())
        , created((time_t)dict["created"].asInt())
        , expires((time_t)dict["expires"].asInt())
        , secure(dict["secure"].asBool()) {
        if ( domain.empty() || expires == 0 || created == 0 ) name.clear();  // invalidate
    }

    bool Cookie::matches(const Cookie& c) const {
        return name == c.name && compareIgnoringCase(domain, c.domain) == 0 && path == c.path;
    }

    bool Cookie::sameValueAs(const Cookie& c) const {
        return value == c.value && expires == c.expires && secure == c.secure;
    }

    bool Cookie::matches(const Address& addr) const {
        slice requestPath = addr.path();
        if ( auto query = requestPath.findByte('?'); query ) requestPath.setEnd(query);
        return Address::domainContains(domain, addr.hostname()) && Address::pathContains(path, requestPath)
               && (!secure || addr.isSecure());
    }

    ostream& operator<<(ostream& out, const Cookie& cookie) { return out << cookie.name << '=' << cookie.value; }

    fleece::Encoder& operator<<(fleece::Encoder& enc, const Cookie& cookie) {
        Assert(cookie.persistent());
        enc.beginDict();
        enc.writeKey("name"_sl);
        enc.writeString(cookie.name);
        enc.writeKey("value"_sl);
        enc.writeString(cookie.value);
        enc.writeKey("domain"_sl);
        enc.writeString(cookie.domain);
        enc.writeKey("created"_sl);
        enc.writeInt(cookie.created);
        enc.writeKey("expires"_sl);
        enc.writeInt(cookie.expires);
        if ( !cookie.path.empty() ) {
            enc.writeKey("path"_sl);
            enc.writeString(cookie.path);
        }
        if ( cookie.secure ) {
            enc.writeKey("secure"_sl);
            enc.writeBool(true);
        }
        enc.endDict();
        return enc;
    }

#pragma mark - COOKIE STORE:

    CookieStore::CookieStore(slice data) {
        if ( data.size == 0 ) return;
        Array cookies = ValueFromData(data).asArray();
        if ( !cookies ) {
            Warn("Couldn't parse persisted cookie store!");
            return;
        }
        for ( Array::iterator i(cookies); i; ++i ) {
            auto cookie = make_unique<const Cookie>(i.value().asDict());
            if ( !cookie->valid() ) Warn("Couldn't read a cookie from persisted cookie store!");
            else if ( !cookie->expired() )
                _cookies.emplace_back(std::move(cookie));
        }
    }

    alloc_slice CookieStore::encode() {
        lock_guard<mutex> lock(_mutex);
        Encoder           enc;
        enc.beginArray();
        for ( CookiePtr& cookie : _cookies ) {
            if ( cookie->persistent() && !cookie->expired() ) enc << *cookie;
        }
        enc.endArray();
        return enc.finish();
    }

    vector<const Cookie*> CookieStore::cookies() const {
        lock_guard<mutex>     lock(_mutex);
        vector<const Cookie*> cookies;
        cookies.reserve(_cookies.size());
        for ( const CookiePtr& cookie : _cookies ) cookies.push_back(cookie.get());
        return cookies;
    }

    string CookieStore::cookiesForRequest(const Address& addr) const {
        lock_guard<mutex> lock(_mutex);
        stringstream      s;
        int               n = 0;
        for ( const CookiePtr& cookie : _cookies ) {
            if ( cookie->matches(addr) && !cookie->expired() ) {
                if ( n++ ) s << "; ";
                s << *cookie;
            }
        }
        return s.str();
    }

    bool CookieStore::setCookie(const string& headerValue, const string& fromHost, const string& fromPath,
                                bool acceptParentDomain) {
        auto newCookie = make_unique<const Cookie>(headerValue, fromHost, fromPath, acceptParentDomain);
        if ( !newCookie->valid() ) {
            Warn("Rejecting invalid cookie in setCookie!");
            return false;
        }
        lock_guard<mutex> lock(_mutex);
        _addCookie(std::move(newCookie));
        return true;
    }

    unsigned CookieStore::setCookies(const Headers& responseHeaders, const Address& fromAddress) {
        string host(fromAddress.hostname()), path(fromAddress.path());
        if ( auto query = path.find('?'); query != string::npos ) path.resize(query);
        unsigned accepted = 0;
        responseHeaders.forEach("Set-Cookie"_sl, [&](slice value) {
            if ( setCookie(string(value), host, path) ) ++accepted;
        });
        return accepted;
    }

    void CookieStore::_addCookie(CookiePtr newCookie) {
        for ( auto i = _cookies.begin(); i != _cookies.end(); ++i ) {
            const Cookie* oldCookie = i->get();
            if ( newCookie->matches(*oldCookie) ) {
                if ( newCookie->created < oldCookie->created ) {
                    LogVerbose(kDefaultLog, "CookieStore: ignoring obsolete cookie %s", newCookie->name.c_str());
                    return;
                }
                if ( newCookie->sameValueAs(*oldCookie) ) return;  // No-op

                // Remove the replaced cookie:
                if ( oldCookie->persistent() ) _changed = true;
                _cookies.erase(i);
                break;
            }
        }
        if ( newCookie->expired() ) return;  // A past expiration just deletes the old cookie
        if ( newCookie->persistent() ) _changed = true;
        _cookies.emplace_back(std::move(newCookie));
    }

    void CookieStore::clearCookies() {
        lock_guard<mutex> lock(_mutex);
        for ( auto& cookie : _cookies ) {
            if ( cookie->persistent() ) _changed = true;
        }
        _cookies.clear();
    }

    bool CookieStore::changed() {
        lock_guard<mutex> lock(_mutex);
        return _changed;
    }

    void CookieStore::clearChanged() {
        lock_guard<mutex> lock(_mutex);
        _changed = false;
    }

}  // namespace litefeed::net
