//
// TestsCommon.cc
//
// Copyright 2021-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "TestsCommon.hh"  // iwyu pragma: keep
#include "Error.hh"
#include "Logging.hh"
#include "fleece/FLExpert.h"
#include <atomic>
#include <cstdlib>
#include <iomanip>
#include <mutex>
#include <ostream>
#include <thread>

#include "catch.hpp"


using namespace std;
using namespace litefeed;
using namespace fleece;

void InitTestLogging() {
    static once_flag sOnce;
    call_once(sOnce, [] {
        if ( !getenv("LiteFeedLog") ) LogDomain::setCallbackLogLevel(LogLevel::Warning);
        Log("Test logging initialized");
    });
}

alloc_slice json5slice(string_view str) {
    FLStringResult errorMsg = {};
    size_t         errorPos = 0;
    FLError        err      = kFLNoError;
    alloc_slice    json(FLJSON5_ToJSON(slice(str), &errorMsg, &errorPos, &err));
    if ( !json ) {
        alloc_slice message(std::move(errorMsg));
        FAIL("Invalid JSON5 at " << errorPos << " (" << string(message) << "): " << str);
    }
    return json;
}

namespace fleece {
    ostream& operator<<(ostream& out, pure_slice s) {
        if ( !s.buf ) return out << "nullslice";
        for ( size_t i = 0; i < s.size; ++i ) {
            uint8_t c = s[i];
            if ( c < 32 || c > 126 ) {
                // Not printable ASCII:
                out << "<" << hex << setfill('0');
                for ( size_t j = 0; j < s.size; ++j ) out << setw(2) << unsigned(s[j]);
                return out << dec << ">";
            }
        }
        return out << '"' << string(s) << '"';
    }
}  // namespace fleece


#pragma mark - EXPECTED ERRORS:

static atomic<int> sExpectingExceptions{0};

ExpectingExceptions::ExpectingExceptions() {
    if ( sExpectingExceptions++ == 0 ) error::sWarnOnError = false;
}

ExpectingExceptions::~ExpectingExceptions() {
    if ( --sExpectingExceptions == 0 ) error::sWarnOnError = true;
}


#pragma mark - ASYNC CHECKS:

bool WaitUntil(chrono::milliseconds timeout, function_ref<bool()> predicate) {
    auto const deadline = chrono::steady_clock::now() + timeout;
    while ( !predicate() ) {
        if ( chrono::steady_clock::now() >= deadline ) return predicate();
        this_thread::sleep_for(20ms);
    }
    return true;
}
