//
// StringUtil.hh
//
// Copyright 2017-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#pragma once
#include "fleece/slice.hh"
#include "fleece/PlatformCompat.hh"
#include <cstdarg>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

namespace litefeed {

    // Adds EXPR to a stringstream and returns the resulting string.
    // Example: CONCAT("2+2=" << 4 << "!") --> "2+2=4!"
#ifndef _LIBCPP_VERSION
#    define CONCAT(EXPR) (static_cast<const std::stringstream&>(std::stringstream() << EXPR)).str()
#else
#    define CONCAT(EXPR) (std::stringstream() << EXPR).str()
#endif

    /** Writes a slice to a stream with the usual "<<" syntax */
    static inline std::ostream& operator<<(std::ostream& o, fleece::slice s) {
        o.write((const char*)s.buf, static_cast<std::streamsize>(s.size));
        return o;
    }

    /** Like sprintf(), but returns a std::string */
    std::string stringprintf(const char* fmt, ...) __printflike(1, 2);

    /** Like vsprintf(), but returns a std::string */
    std::string vstringprintf(const char* fmt, va_list) __printflike(1, 0);

    /** Returns true if `str` begins with the string `prefix`. */
    bool hasPrefix(std::string_view str, std::string_view prefix) noexcept;

    /** Returns true if `str` ends with the string `suffix`. */
    bool hasSuffix(std::string_view str, std::string_view suffix) noexcept;

    /** Returns true if `str` ends with the string `suffix`, treating ASCII upper/lower case
        letters as equivalent. */
    bool hasSuffixIgnoringCase(std::string_view str, std::string_view suffix) noexcept;

    /** Compares strings, treating ASCII upper/lowercase letters equivalent. Returns -1, 0 or 1. */
    int compareIgnoringCase(const std::string& a, const std::string& b);

    /** Converts an ASCII string to lowercase, in place. */
    void toLowercase(std::string&);

    static inline std::string lowercase(std::string str) {
        toLowercase(str);
        return str;
    }

    /** True if the string is non-empty and consists only of ASCII digits. */
    bool isDecimalInteger(std::string_view) noexcept;

}  // namespace litefeed

// Utility for using slice with printf-style formatting.
// Use "%.*" in the format string; then for the corresponding argument put SPLAT(theslice).
#define SPLAT(S) (int)(S).size, (char*)(S).buf
