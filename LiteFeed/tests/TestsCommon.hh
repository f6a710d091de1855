//
// TestsCommon.hh
//
// Copyright 2021-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#pragma once
#include "fleece/slice.hh"
#include "fleece/function_ref.hh"
#include <chrono>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#ifdef CATCH_VERSION_MAJOR
#    error "Include TestsCommon.hh before catch.hpp"
#endif


using namespace std::literals;

/** Sets up logging for a test run. Unless the `LiteFeedLog` environment variable says otherwise,
    only warnings and errors are shown. Called by main(); fixtures may call it too. */
void InitTestLogging();

/** Converts JSON5 to JSON, failing the test if it's invalid. */
fleece::alloc_slice json5slice(std::string_view);

inline std::string json5(std::string_view str) { return std::string(json5slice(str)); }


#pragma mark - CATCH STRINGIFICATION:


// Lets Catch show slices in failure messages; binary data is shown in hex.
namespace fleece {
    std::ostream& operator<<(std::ostream&, pure_slice);
}

template <class T>
std::ostream& operator<<(std::ostream& out, const std::vector<T>& items) {
    out << "[";
    const char* sep = "";
    for ( const T& item : items ) {
        out << sep << '"' << item << '"';
        sep = ", ";
    }
    return out << "]";
}


#pragma mark - EXPECTED ERRORS:


/** While an instance exists, thrown LiteFeed errors aren't logged as warnings. Use it in tests
    that provoke errors on purpose. Instances may nest. */
struct ExpectingExceptions {
    ExpectingExceptions();
    ~ExpectingExceptions();
};


#pragma mark - ASYNC CHECKS:


/** Polls `predicate` until it returns true or `timeout` has passed. Returns its last result. */
[[nodiscard]] bool WaitUntil(std::chrono::milliseconds timeout, fleece::function_ref<bool()> predicate);

#define LITEFEED_CHECK_EVENTUALLY(MACRO, TIMEOUT, CONDITION)                                                           \
    do {                                                                                                               \
        auto _ms = std::chrono::duration_cast<std::chrono::milliseconds>(TIMEOUT);                                     \
        if ( !WaitUntil(_ms, [&] { return (CONDITION); }) )                                                            \
            MACRO(#CONDITION << " still false after " << _ms.count() << "ms");                                         \
    } while ( false )

/** Like CHECK, but waits up to TIMEOUT for CONDITION to become true. */
#define CHECK_BEFORE(TIMEOUT, CONDITION) LITEFEED_CHECK_EVENTUALLY(FAIL_CHECK, TIMEOUT, CONDITION)

/** Like REQUIRE, but waits up to TIMEOUT for CONDITION to become true. */
#define REQUIRE_BEFORE(TIMEOUT, CONDITION) LITEFEED_CHECK_EVENTUALLY(FAIL, TIMEOUT, CONDITION)
