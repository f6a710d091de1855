//
// ThreadUtil.hh
//
// Copyright 2019-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#pragma once
#include <pthread.h>

namespace litefeed {

    /** Names the current thread, for debuggers and crash reports. Linux truncates to 15 chars. */
    static inline void SetThreadName(const char* name) {
#ifdef __APPLE__
        pthread_setname_np(name);
#else
        pthread_setname_np(pthread_self(), name);
#endif
    }

}  // namespace litefeed
