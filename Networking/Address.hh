//
// Address.hh
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
#include <cstdint>

namespace litefeed::net {

    /** A parsed absolute URL of the form `scheme://host[:port]/path[?query]`.
        The component slices point into the URL's own storage. */
    struct Address {
        using slice       = fleece::slice;
        using alloc_slice = fleece::alloc_slice;

        /** Parses a URL. Throws error(Network, kNetErrInvalidURL) if it's malformed or
            contains a username/password. */
        explicit Address(alloc_slice url);

        explicit Address(slice url) : Address(alloc_slice(url)) {}

        Address(slice scheme, slice hostname, uint16_t port, slice path);

        [[nodiscard]] alloc_slice url() const { return _url; }

        explicit operator alloc_slice() const { return _url; }

        [[nodiscard]] slice scheme() const { return _scheme; }

        [[nodiscard]] slice hostname() const { return _hostname; }

        [[nodiscard]] uint16_t port() const { return _port; }

        /** The path, starting with "/", including any query string. */
        [[nodiscard]] slice path() const { return _path; }

        [[nodiscard]] bool isSecure() const noexcept { return isSecure(_scheme); }

        /** Returns a new Address whose path is this one's with `component` appended to it,
            inserting a "/" separator if the current path doesn't end with one. */
        [[nodiscard]] Address appendingPath(slice component) const;

        // Static utility functions:
        static bool parse(slice url, slice& scheme, slice& hostname, uint16_t& port, slice& path) noexcept;
        static alloc_slice toURL(slice scheme, slice hostname, uint16_t port, slice path);
        static bool        isSecure(slice scheme) noexcept;
        static uint16_t    defaultPortForScheme(slice scheme) noexcept;
        static bool        domainEquals(slice d1, slice d2) noexcept;
        static bool        domainContains(slice baseDomain, slice hostname) noexcept;
        static bool        pathContains(slice basePath, slice path) noexcept;

      private:
        alloc_slice _url;  // slice fields point inside this
        slice       _scheme, _hostname, _path;
        uint16_t    _port{0};
    };

}  // namespace litefeed::net
