//
// ChangeParserTest.cc
//
// Copyright 2019-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "TestsCommon.hh"
#include "ChangeParser.hh"
#include "catch.hpp"

using namespace std;
using namespace fleece;
using namespace litefeed;
using namespace litefeed::tracker;


static int64_t parse(JSONChangeParser& parser, const string& json) {
    if ( !parser.parseBytes(slice(json)) ) {
        (void)parser.endParsingData();
        return -1;
    }
    return parser.endParsingData();
}


TEST_CASE("Parse change batch", "[Changes]") {
    JSONChangeParser parser;
    string           json = json5("[{seq:1, id:'apple', changes:[{rev:'1-aa'}]},"
                                  " {seq:'2::5', id:'banana', changes:[{rev:'3-bb'},{rev:'3-cc'}], deleted:true},"
                                  " {seq:3, id:'cherry', changes:[{rev:'2-dd'}], removed:['sales']}]");
    REQUIRE(parse(parser, json) == 3);
    auto changes = parser.takeChanges();
    REQUIRE(changes.size() == 3);

    CHECK(changes[0].sequence == "1"_sl);
    CHECK(changes[0].docID == "apple"_sl);
    REQUIRE(changes[0].revIDs.size() == 1);
    CHECK(changes[0].revIDs[0] == "1-aa"_sl);
    CHECK(!changes[0].deleted);
    CHECK(!changes[0].removed);

    CHECK(changes[1].sequence == "2::5"_sl);
    REQUIRE(changes[1].revIDs.size() == 2);
    CHECK(changes[1].revIDs[1] == "3-cc"_sl);
    CHECK(changes[1].deleted);

    CHECK(changes[2].removed);
    CHECK(!changes[2].deleted);

    CHECK(parser.takeChanges().empty());  // they've been taken
}


TEST_CASE("Parse empty batch", "[Changes]") {
    JSONChangeParser parser;
    CHECK(parse(parser, "[]") == 0);
    CHECK(parse(parser, "  [ ]\n") == 0);
    CHECK(parser.takeChanges().empty());
}


TEST_CASE("Parse batch in pieces", "[Changes]") {
    JSONChangeParser parser;
    CHECK(parser.parseBytes("  "_sl));
    CHECK(parser.parseBytes("[{\"seq\":17,\"i"_sl));
    CHECK(parser.parseBytes("d\":\"doc\",\"changes\":[{\"rev\":\"1-ab\"}]}"_sl));
    CHECK(parser.parseBytes("]"_sl));
    REQUIRE(parser.endParsingData() == 1);
    auto changes = parser.takeChanges();
    REQUIRE(changes.size() == 1);
    CHECK(changes[0].sequence == "17"_sl);
    CHECK(changes[0].docID == "doc"_sl);
}


TEST_CASE("Parse entry without revisions", "[Changes]") {
    JSONChangeParser parser;
    REQUIRE(parse(parser, "[{\"seq\":4,\"id\":\"gone\",\"deleted\":true}]") == 1);
    auto changes = parser.takeChanges();
    REQUIRE(changes.size() == 1);
    CHECK(changes[0].revIDs.empty());
    CHECK(changes[0].deleted);
}


TEST_CASE("Parse last_seq entry", "[Changes]") {
    JSONChangeParser parser;
    CHECK(parse(parser, "[{\"seq\":8,\"id\":\"a\",\"changes\":[{\"rev\":\"1-a\"}]},{\"last_seq\":9}]") == 1);
    CHECK(parse(parser, "[{\"last_seq\":9}]") == 0);
}


TEST_CASE("Parse invalid batches", "[Changes]") {
    ExpectingExceptions x;
    JSONChangeParser    parser;
    const char*         badBatches[] = {
            "",
            "{\"seq\":1,\"id\":\"a\"}",
            "[{\"seq\":1,\"id\":\"a\"",
            "[17]",
            "[{\"id\":\"noseq\"}]",
            "[{\"seq\":1}]",
            "[{\"seq\":1,\"id\":42}]",
            "[{\"seq\":1,\"id\":\"a\",\"changes\":\"1-a\"}]",
            "[{\"seq\":1,\"id\":\"a\",\"changes\":[{\"revision\":\"1-a\"}]}]",
            "[{\"seq\":1,\"id\":\"a\"}, {\"seq\":2}]",
    };
    for ( const char* batch : badBatches ) {
        INFO("Parsing " << batch);
        CHECK(parse(parser, batch) == -1);
        CHECK(parser.takeChanges().empty());
    }

    // The parser recovers for the next batch:
    CHECK(parse(parser, "[{\"seq\":1,\"id\":\"a\"}]") == 1);
}


TEST_CASE("Parser rejects non-array early", "[Changes]") {
    ExpectingExceptions x;
    JSONChangeParser    parser;
    CHECK(!parser.parseBytes("  {\"seq\":"_sl));
    CHECK(!parser.parseBytes("1}"_sl));
    CHECK(parser.endParsingData() == -1);
}


TEST_CASE("Parse single entry", "[Changes]") {
    Doc doc = Doc::fromJSON(json5slice("{seq:[3,'x'], id:'doc', changes:[{rev:'5-e'}]}"));
    REQUIRE(doc);
    auto change = JSONChangeParser::parseEntry(doc.root());
    REQUIRE(change);
    CHECK(change->sequence == "[3,\"x\"]"_sl);
    CHECK(change->docID == "doc"_sl);

    Doc notDict = Doc::fromJSON("\"doc\""_sl);
    CHECK(!JSONChangeParser::parseEntry(notDict.root()));
}
