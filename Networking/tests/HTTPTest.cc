//
// HTTPTest.cc
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
#include "Headers.hh"
#include "HTTPTypes.hh"
#include "fleece/Fleece.hh"
#include <optional>
#include "catch.hpp"

using namespace std;
using namespace fleece;
using namespace litefeed;
using namespace litefeed::net;


TEST_CASE("Headers", "[HTTP]") {
    Headers headers;
    CHECK(headers.empty());
    headers.add("Content-Type"_sl, "application/json"_sl);
    headers.add("Set-Cookie"_sl, "a=1"_sl);
    headers.add("set-cookie"_sl, "b=2"_sl);
    headers.add("Content-Length"_sl, "1234"_sl);
    CHECK(headers.size() == 4);

    CHECK(headers.contains("content-type"_sl));
    CHECK(headers["CONTENT-TYPE"_sl] == "application/json"_sl);
    CHECK(!headers["Accept"_sl]);
    CHECK(headers.getInt("Content-Length"_sl) == 1234);
    CHECK(headers.getInt("Content-Type"_sl, -1) == -1);
    CHECK(headers.getAll("Set-Cookie"_sl) == "a=1,b=2");

    vector<string> cookies;
    headers.forEach("SET-COOKIE"_sl, [&](slice value) { cookies.emplace_back(value); });
    CHECK(cookies == (vector<string>{"a=1", "b=2"}));

    headers.set("Set-Cookie"_sl, "c=3"_sl);
    CHECK(headers.getAll("Set-Cookie"_sl) == "c=3");
    headers.remove("content-length"_sl);
    CHECK(!headers.contains("Content-Length"_sl));
    CHECK(headers.size() == 2);

    headers.clear();
    CHECK(headers.empty());
}


TEST_CASE("Headers from Dict", "[HTTP]") {
    optional<Headers> copy;
    {
        Doc doc = Doc::fromJSON(json5slice("{Authorization: 'Bearer xyzzy', 'X-Thing': ['1', '2'], Empty: 17}"));
        REQUIRE(doc.root().asDict());
        Headers headers(doc.root().asDict());
        CHECK(headers.size() == 3);  // a non-string value adds nothing
        CHECK(headers["authorization"_sl] == "Bearer xyzzy"_sl);
        CHECK(headers.getAll("x-thing"_sl) == "1,2");
        CHECK(!headers.contains("Empty"_sl));
        copy.emplace(headers);
    }
    // The copy owns its data after the Dict is gone:
    CHECK(copy->getAll("X-Thing"_sl) == "1,2");
    CHECK((*copy)["Authorization"_sl] == "Bearer xyzzy"_sl);
}


TEST_CASE("HTTP status", "[HTTP]") {
    CHECK(IsSuccess(HTTPStatus::OK));
    CHECK(!IsSuccess(HTTPStatus::Upgraded));
    CHECK(!IsSuccess(HTTPStatus::NotFound));
    CHECK(string(StatusMessage(HTTPStatus::NotFound)) == "Not Found");
    CHECK(string(StatusMessage(HTTPStatus::Unauthorized)) == "Unauthorized");
}
