//
// main.cpp
//
// Copyright 2015-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

// This defines the main entry point of a target that runs 'Catch' unit tests.


#define CATCH_CONFIG_CONSOLE_WIDTH 120
#define CATCH_CONFIG_RUNNER  // We supply main() ourselves, to initialize logging first

#include "TestsCommon.hh"
#include "catch.hpp"

int main(int argc, char* argv[]) {
    InitTestLogging();
    return Catch::Session().run(argc, argv);
}
