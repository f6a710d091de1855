//
//  Address.cc
//
// Copyright 2018-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "Address.hh"
#include "Error.hh"
#include "StringUtil.hh"
#include "WebSocketInterface.hh"
#include <cctype>
#include <cstdlib>
#include <sstream>

using namespace std;
using namespace fleece;

namespace litefeed::net {

    static bool isValidScheme(slice scheme) { return scheme.size > 0 && isalpha(scheme[0]); }

    Address::Address(alloc_slice url) : _url(std::move(url)) {
        if ( !parse(_url, _scheme, _hostname, _port, _path) )
            error::_throw(error::Network, websocket::kNetErrInvalidURL);
    }

    Address::Address(slice scheme, slice hostname, uint16_t port, slice path)
        : Address(toURL(scheme, hostname, port, path)) {}

    bool Address::parse(slice url, slice& scheme, slice& hostname, uint16_t& port, slice& path) noexcept {
        slice str = url;

        auto colon = str.findByteOrEnd(':');
        if ( colon >= str.end() ) return false;
        scheme = slice(str.buf, colon);
        if ( !isValidScheme(scheme) ) return false;
        port = defaultPortForScheme(scheme);
        str.setStart(colon);
        if ( !str.hasPrefix("://"_sl) ) return false;
        str.moveStart(3);

        if ( str.size > 0 && str[0] == '[' ) {
            // IPv6 address in URL is bracketed (RFC 2732):
            auto endBr = str.findByte(']');
            if ( !endBr ) return false;
            hostname = slice(&str[1], endBr);
            if ( hostname.size == 0 ) return false;
            str.setStart(endBr + 1);
        } else {
            hostname = nullslice;
        }

        auto pathStart = str.findByteOrEnd('/');
        if ( auto query = str.findByteOrEnd('?'); query < pathStart ) pathStart = query;
        colon = str.findByteOrEnd(':');
        if ( str.findByteOrEnd('@') < pathStart ) return false;  // No usernames or passwords allowed!
        if ( colon < pathStart ) {
            string portStr(slice(colon + 1, pathStart));
            if ( portStr.empty() || !isDecimalInteger(portStr) ) return false;
            long p = strtol(portStr.c_str(), nullptr, 10);
            if ( p < 0 || p > 65535 ) return false;
            port = (uint16_t)p;
        } else {
            colon = pathStart;
        }
        if ( !hostname.buf ) {
            hostname = slice(str.buf, colon);
            if ( hostname.size == 0 ) return false;
        }

        path = slice(pathStart, str.end());
        return true;
    }

    alloc_slice Address::toURL(slice scheme, slice hostname, uint16_t port, slice path) {
        stringstream s;
        s << scheme << "://";
        if ( hostname.findByte(':') ) s << '[' << hostname << ']';
        else
            s << hostname;
        if ( port && port != defaultPortForScheme(scheme) ) s << ':' << port;
        if ( path.size == 0 || path[0] != '/' ) s << '/';
        s << path;
        return alloc_slice(s.str());
    }

    Address Address::appendingPath(slice component) const {
        string newPath(_path);
        string query;
        if ( auto q = newPath.find('?'); q != string::npos ) {
            query = newPath.substr(q);
            newPath.resize(q);
        }
        if ( newPath.empty() || newPath.back() != '/' ) newPath += '/';
        newPath += string(component);
        if ( !query.empty() ) {
            // Merge the base URL's query into the component's:
            newPath += (component.findByte('?') ? '&' : '?');
            newPath += query.substr(1);
        }
        return {_scheme, _hostname, _port, slice(newPath)};
    }

    bool Address::isSecure(slice scheme) noexcept {
        return scheme.caseEquivalent("wss"_sl) || scheme.caseEquivalent("https"_sl);
    }

    uint16_t Address::defaultPortForScheme(slice scheme) noexcept {
        if ( scheme.size == 0 || scheme.caseEquivalent("ws"_sl) || tolower(scheme[scheme.size - 1]) != 's' )
            return 80;
        else
            return 443;
    }

    bool Address::domainEquals(slice d1, slice d2) noexcept { return d1.caseEquivalent(d2); }

    bool Address::domainContains(slice baseDomain_, slice hostname_) noexcept {
        string baseDomain(baseDomain_), hostname(hostname_);
        return hasSuffixIgnoringCase(hostname, baseDomain)
               && (hostname.size() == baseDomain.size() || hostname[hostname.size() - baseDomain.size() - 1] == '.');
    }

    bool Address::pathContains(slice basePath, slice path) noexcept {
        if ( basePath.size == 0 ) basePath = "/"_sl;
        if ( path.size == 0 ) path = "/"_sl;
        return path.hasPrefix(basePath)
               && (path.size == basePath.size || path[basePath.size] == '/' || basePath[basePath.size - 1] == '/');
    }

}  // namespace litefeed::net
