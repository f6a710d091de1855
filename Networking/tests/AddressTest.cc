//
// AddressTest.cc
//
// Copyright 2017-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "TestsCommon.hh"
#include "Address.hh"
#include "Error.hh"
#include "WebSocketInterface.hh"
#include "catch.hpp"

using namespace std;
using namespace fleece;
using namespace litefeed;
using namespace litefeed::net;


TEST_CASE("Address parsing", "[Address]") {
    SECTION("Basic") {
        Address addr("ws://example.com/db"_sl);
        CHECK(addr.scheme() == "ws"_sl);
        CHECK(addr.hostname() == "example.com"_sl);
        CHECK(addr.port() == 80);
        CHECK(addr.path() == "/db"_sl);
        CHECK(!addr.isSecure());
    }
    SECTION("Port and query") {
        Address addr("wss://sg.example.com:4984/travel-sample?x=1"_sl);
        CHECK(addr.scheme() == "wss"_sl);
        CHECK(addr.hostname() == "sg.example.com"_sl);
        CHECK(addr.port() == 4984);
        CHECK(addr.path() == "/travel-sample?x=1"_sl);
        CHECK(addr.isSecure());
    }
    SECTION("Default secure port") {
        Address addr("https://example.com/"_sl);
        CHECK(addr.port() == 443);
        CHECK(addr.isSecure());
    }
    SECTION("IPv6") {
        Address addr("ws://[::1]:4984/db"_sl);
        CHECK(addr.hostname() == "::1"_sl);
        CHECK(addr.port() == 4984);
        CHECK(string(addr.url()) == "ws://[::1]:4984/db");
    }
    SECTION("No path") {
        Address addr("ws://example.com"_sl);
        CHECK(addr.path().size == 0);
    }
}


TEST_CASE("Address parse failures", "[Address]") {
    static const char* kBadURLs[] = {
            "",
            "example.com/db",
            "ws:/example.com/db",
            "ws://user:pass@example.com/db",
            "ws:///db",
            "ws://example.com:/db",
            "ws://example.com:49x4/db",
            "ws://example.com:99999/db",
            "://example.com/db",
    };
    for ( auto url : kBadURLs ) {
        INFO("URL is " << url);
        ExpectingExceptions x;
        try {
            Address addr{slice(url)};
            FAIL_CHECK("Parsed a bad URL");
        } catch ( const error& e ) { CHECK(e == error(error::Network, websocket::kNetErrInvalidURL)); }
    }
}


TEST_CASE("Address toURL", "[Address]") {
    CHECK(string(Address::toURL("ws"_sl, "example.com"_sl, 80, "/db"_sl)) == "ws://example.com/db");
    CHECK(string(Address::toURL("wss"_sl, "example.com"_sl, 443, "db"_sl)) == "wss://example.com/db");
    CHECK(string(Address::toURL("wss"_sl, "example.com"_sl, 4984, "/db"_sl)) == "wss://example.com:4984/db");

    Address addr("ws"_sl, "example.com"_sl, 4984, "/db"_sl);
    CHECK(string(addr.url()) == "ws://example.com:4984/db");
}


TEST_CASE("Address appendingPath", "[Address]") {
    auto append = [](const char* base, const char* component) {
        return string(Address(slice(base)).appendingPath(slice(component)).url());
    };
    CHECK(append("ws://example.com/db", "_changes") == "ws://example.com/db/_changes");
    CHECK(append("ws://example.com/db/", "_changes") == "ws://example.com/db/_changes");
    CHECK(append("ws://example.com", "_changes") == "ws://example.com/_changes");
    CHECK(append("ws://example.com:4984/db?x=1", "_changes?feed=websocket")
          == "ws://example.com:4984/db/_changes?feed=websocket&x=1");
    CHECK(append("ws://example.com/db?x=1", "_changes") == "ws://example.com/db/_changes?x=1");
}


TEST_CASE("Address domain and path matching", "[Address]") {
    CHECK(Address::domainEquals("Example.COM"_sl, "example.com"_sl));
    CHECK(Address::domainContains("example.com"_sl, "example.com"_sl));
    CHECK(Address::domainContains("example.com"_sl, "www.Example.com"_sl));
    CHECK(!Address::domainContains("example.com"_sl, "counterexample.com"_sl));
    CHECK(!Address::domainContains("www.example.com"_sl, "example.com"_sl));

    CHECK(Address::pathContains(""_sl, "/db"_sl));
    CHECK(Address::pathContains("/db"_sl, "/db"_sl));
    CHECK(Address::pathContains("/db"_sl, "/db/_changes"_sl));
    CHECK(Address::pathContains("/db/"_sl, "/db/_changes"_sl));
    CHECK(!Address::pathContains("/db"_sl, "/dbx"_sl));
    CHECK(!Address::pathContains("/db/_changes"_sl, "/db"_sl));
}
