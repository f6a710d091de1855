//
// Headers.hh
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
#include "fleece/slice.hh"
#include "fleece/function_ref.hh"
#include <map>
#include <string>
#include <vector>

namespace fleece {
    class Dict;
}

namespace litefeed::net {

    /** HTTP headers of a handshake request or response. Keys are case-insensitive, and a key
        may occur more than once (e.g. `Set-Cookie`). */
    class Headers {
      public:
        using slice       = fleece::slice;
        using alloc_slice = fleece::alloc_slice;

        Headers() = default;

        /** Instantiate from a Fleece Dict whose keys are header names and values are either
            strings or arrays of strings. */
        explicit Headers(fleece::Dict);

        Headers(const Headers&)                = default;
        Headers& operator=(const Headers&)     = default;
        Headers(Headers&&) noexcept            = default;
        Headers& operator=(Headers&&) noexcept = default;

        void clear();

        [[nodiscard]] bool empty() const { return _map.empty(); }

        [[nodiscard]] size_t size() const { return _map.size(); }

        /** Adds a header. If a header with that name already exists, it adds a second. */
        void add(slice name, slice value);

        /** Sets the value of a header, replacing any existing ones with that name. */
        void set(slice name, slice value);

        /** Removes all headers with that name. */
        void remove(slice name);

        [[nodiscard]] bool contains(slice name) const { return _map.find(name) != _map.end(); }

        /** Returns the (first) value of the header with that name, or nullslice. */
        [[nodiscard]] slice get(slice name) const;

        [[nodiscard]] slice operator[](slice name) const { return get(name); }

        /** Returns a header parsed as a decimal integer, or `defaultValue` if it's missing or
            not a number. */
        [[nodiscard]] int64_t getInt(slice name, int64_t defaultValue = 0) const;

        /** Returns all values of the header with the given name, separated by commas. */
        [[nodiscard]] std::string getAll(slice name) const;

        /** Calls the function once for each header/value pair, in case-insensitive name order. */
        void forEach(fleece::function_ref<void(slice, slice)> callback) const;

        /** Calls the function once for each value of the header with the given name. */
        void forEach(slice name, fleece::function_ref<void(slice)> callback) const;

      private:
        void  readFrom(fleece::Dict);
        slice store(slice s);

        class HeaderCmp {
          public:
            bool operator()(slice a, slice b) const noexcept { return a.caseEquivalentCompare(b) < 0; }
        };

        std::multimap<slice, slice, HeaderCmp> _map;
        std::vector<alloc_slice>               _backingStore;  // Owns the data that _map points to
    };

}  // namespace litefeed::net
