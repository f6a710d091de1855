//
// CookieStoreTest.cc
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
#include "CookieStore.hh"
#include "Address.hh"
#include "Headers.hh"
#include <cstdlib>
#include <ctime>
#include "catch.hpp"

using namespace fleece;
using namespace litefeed;
using namespace litefeed::net;
using namespace std;

TEST_CASE("Cookie Parser", "[Cookies]") {
    SECTION("Minimal") {
        Cookie c("name=", "example.com", "/");
        CHECK(c);
        CHECK(c.name == "name");
        CHECK(c.value.empty());
        CHECK(c.domain == "example.com");
        CHECK(c.path.empty());
        CHECK(!c.secure);
        CHECK(!c.persistent());
        CHECK(!c.expired());
    }
    SECTION("Quoted value") {
        Cookie c("size=\"XXL\"", "example.com", "/");
        CHECK(c);
        CHECK(c.name == "size");
        CHECK(c.value == "XXL");
    }
    SECTION("Name keeps its case") {
        Cookie c("SyncGatewaySession=abc123; Path=/db", "example.com", "/db/_changes");
        CHECK(c.name == "SyncGatewaySession");
        CHECK(c.path == "/db");
    }
    SECTION("Domain") {
        Cookie c("x=y; doMaIN=example.com", "example.com", "/");
        CHECK(c);
        CHECK(c.domain == "example.com");
        Cookie d("x=y; Domain=.www.example.com", "example.com", "/");
        CHECK(d);
        CHECK(d.domain == "www.example.com");
    }
    SECTION("Parent domain") {
        ExpectingExceptions x;
        Cookie              c("x=y; Domain=example.com", "www.example.com", "/");
        CHECK(!c);
        Cookie d("x=y; Domain=example.com", "www.example.com", "/", true);
        CHECK(d);
        CHECK(d.domain == "example.com");
    }
    SECTION("Implicit Path") {
        Cookie c("x=y", "example.com", "/db/_changes");
        CHECK(c.path == "/db");
        Cookie d("x=y", "example.com", "/db/");
        CHECK(d.path == "/db");
    }
    SECTION("Secure") {
        Cookie c("x=y; Path=/foo/bar; Secure", "example.com", "/");
        CHECK(c);
        CHECK(c.secure);
        CHECK(c.path == "/foo/bar");
    }
    SECTION("Expires") {
        Cookie c("x=y; lang=en-US; EXPIRES=Tue, 09 Jun 2099 10:18:14 GMT", "example.com", "/");
        CHECK(c);
        if ( sizeof(time_t) == 4 ) {
            CHECK(c.expires == 2147483647);
        } else {
            CHECK(c.expires == 4084683494);
        }
        CHECK(c.persistent());
        CHECK(!c.expired());
    }
    SECTION("Expires - Netscape format") {
        Cookie c("GCLB=COWjp4rwlqauaQ; path=/; HttpOnly; EXPIRES=Tue, 09-Jun-2099 10:18:14 GMT", "example.com", "/");
        CHECK(c);
        CHECK(c.name == "GCLB");
        CHECK(c.path == "/");
        CHECK(c.persistent());
    }
    SECTION("Expires - ANSI C format") {
        Cookie c("x=y; expires=Tue Jun  9 10:18:14 2099", "example.com", "/");
        CHECK(c);
        CHECK(c.persistent());
    }
    SECTION("Expired") {
        Cookie c("x=y; expires=Wed, 09 Jun 1999 10:18:14 GMT", "example.com", "/");
        CHECK(c);
        CHECK(c.expires == 928923494);
        CHECK(c.expired());
    }
    SECTION("Max-Age") {
        Cookie c("x=y; Max-age=30", "example.com", "/");
        CHECK(c);
        CHECK(abs(c.expires - (time(nullptr) + 30)) <= 1);
        CHECK(!c.expired());
        Cookie d("x=y; Max-Age=0", "example.com", "/");
        CHECK(d);
        CHECK(d.expired());
    }
}

TEST_CASE("Cookie Parser Failure", "[Cookies]") {
    static const char* badCookies[] = {
            "",
            "duh?",
            "=value",
            "name=value; Domain=counterexample.com",
            "name=value; Domain=couchbase.com",
            "name=value; Domain=.com",
            "name=value; Domain=",
            "name=value; Expires=someday",
            "name=value; Max-Age=123x3",
            "name=value; Max-Age=",
    };
    for ( const auto& badCookie : badCookies ) {
        INFO("Checking " << badCookie);
        ExpectingExceptions x;
        Cookie              c(badCookie, "example.com", "/");
        CHECK(!c);
    }
}

static const Address kRequest{"ws"_sl, "www.example.com"_sl, 4984, "/db/_changes"_sl};
static const Address kSecureRequest{"wss"_sl, "www.example.com"_sl, 4984, "/db/_changes"_sl};
static const Address kOtherPathRequest{"wss"_sl, "www.example.com"_sl, 4984, "/qat/_changes"_sl};
static const Address kOtherHostRequest{"ws"_sl, "couchbase.com"_sl, 4984, "/beer/_changes"_sl};

TEST_CASE("CookieStore", "[Cookies]") {
    ExpectingExceptions   x;
    Retained<CookieStore> store = new CookieStore;
    CHECK(store->cookies().empty());
    CHECK(!store->changed());
    CHECK(store->cookiesForRequest(kRequest).empty());

    CHECK(store->setCookie("x=y; Domain=Example.Com", "example.com", "/"));
    CHECK(!store->cookies().empty());
    CHECK(!store->changed());  // it's non-persistent
    CHECK(store->setCookie("e=mc^2; Domain=WWW.Example.Com; Max-Age=30", "www.example.com", "/"));
    CHECK(store->setCookie("f=ma; Domain=www.ox.ac.uk; Expires=Tue, 09 Jun 2099 10:18:14 GMT", "www.ox.ac.uk", "/"));
    CHECK(store->changed());
    CHECK(!store->setCookie("jens=awesome; Domain=snej.example.com", "www.example.com", "/"));
    CHECK(store->cookiesForRequest(kRequest) == "x=y; e=mc^2");
    CHECK(store->cookiesForRequest(kOtherPathRequest) == "x=y; e=mc^2");
    CHECK(store->cookiesForRequest(kOtherHostRequest).empty());

    SECTION("Replace Cookie") {
        store->clearChanged();
        CHECK(store->setCookie("e=something else; Domain=WWW.Example.Com", "www.example.com", "/"));
        CHECK(store->changed());  // a persistent cookie got removed
        CHECK(store->cookiesForRequest(kRequest) == "x=y; e=something else");
    }
    SECTION("No-Op Replace Cookie") {
        store->clearChanged();
        CHECK(store->setCookie("x=y; Domain=Example.Com", "example.com", "/"));
        CHECK(store->setCookie("f=ma; Domain=www.ox.ac.uk; Expires=Tue, 09 Jun 2099 10:18:14 GMT", "www.ox.ac.uk",
                               "/"));
        CHECK(!store->changed());
    }
    SECTION("Expired Cookie Deletes") {
        CHECK(store->setCookie("x=gone; Domain=Example.Com; Max-Age=0", "example.com", "/"));
        CHECK(store->cookiesForRequest(kRequest) == "e=mc^2");
    }
    SECTION("Secure Cookie") {
        CHECK(store->setCookie("password=123456; Domain=WWW.Example.Com; Secure=true", "www.example.com", "/"));
        CHECK(store->cookiesForRequest(kRequest) == "x=y; e=mc^2");
        CHECK(store->cookiesForRequest(kSecureRequest) == "x=y; e=mc^2; password=123456");
    }
    SECTION("Paths") {
        CHECK(store->setCookie("path=qat; Domain=example.com; Path=/qat", "example.com", "/"));
        CHECK(store->setCookie("path=Qat; Domain=example.com; Path=/Qat", "example.com", "/"));
        CHECK(store->setCookie("path=qaternion; Domain=example.com; Path=/qaternion", "example.com", "/"));
        CHECK(store->setCookie("x=z; Domain=Example.com; Path=/elsewhere", "example.com", "/"));
        CHECK(store->cookiesForRequest(kRequest) == "x=y; e=mc^2");
        CHECK(store->cookiesForRequest(kOtherPathRequest) == "x=y; e=mc^2; path=qat");
    }
    SECTION("Persistence") {
        alloc_slice encoded = store->encode();
        CHECK(encoded);
        Retained<CookieStore> store2 = new CookieStore(encoded);
        CHECK(store2->cookies().size() == 2);
        CHECK(!store2->changed());
        CHECK(store2->cookiesForRequest(kRequest) == "e=mc^2");
    }
    SECTION("Clear") {
        store->clearChanged();
        store->clearCookies();
        CHECK(store->cookies().empty());
        CHECK(store->changed());
    }
}

TEST_CASE("CookieStore from response headers", "[Cookies]") {
    ExpectingExceptions   x;
    Retained<CookieStore> store = new CookieStore;
    Address               feed("ws://www.example.com:4984/db/_changes?feed=websocket"_sl);

    Headers response;
    response.add("Content-Type"_sl, "text/plain"_sl);
    response.add("Set-Cookie"_sl, "SyncGatewaySession=1234; Max-Age=600"_sl);
    response.add("set-cookie"_sl, "lb=west"_sl);
    response.add("Set-Cookie"_sl, "evil=1; Domain=couchbase.com"_sl);
    CHECK(store->setCookies(response, feed) == 2);

    CHECK(store->cookiesForRequest(feed) == "SyncGatewaySession=1234; lb=west");
    // Cookies default to the request's directory:
    CHECK(store->cookiesForRequest(kRequest) == "SyncGatewaySession=1234; lb=west");
    CHECK(store->cookiesForRequest(kOtherPathRequest).empty());
}

TEST_CASE("RootPathMatch", "[Cookies]") {
    static const Address kRootPathRequest{"ws"_sl, "example.com"_sl, 4984, "/"_sl};

    Retained<CookieStore> store = new CookieStore;
    CHECK(store->setCookie("a1=b1; Domain=example.com; Path=/", "example.com", "/"));
    CHECK(store->setCookie("a2=b2; Domain=example.com; Path=/", "example.com", ""));
    CHECK(store->setCookie("a3=b3; Domain=example.com", "example.com", "/"));
    CHECK(store->setCookie("a4=b4; Domain=example.com", "example.com", ""));
    CHECK(store->cookiesForRequest(kRootPathRequest) == "a1=b1; a2=b2; a3=b3; a4=b4");
}
