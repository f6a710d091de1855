//
// Headers.cc
//
// Copyright 2019-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "Headers.hh"
#include "Error.hh"
#include "StringUtil.hh"
#include "fleece/Fleece.hh"
#include <cerrno>
#include <cstdlib>

namespace litefeed::net {
    using namespace std;
    using namespace fleece;

    Headers::Headers(Dict dict) { readFrom(dict); }

    void Headers::readFrom(Dict dict) {
        for ( Dict::iterator i(dict); i; ++i ) {
            slice key = i.keyString();
            if ( Array multiple = i.value().asArray(); multiple ) {
                for ( Array::iterator j(multiple); j; ++j ) add(key, j.value().asString());
            } else {
                add(key, i.value().asString());
            }
        }
    }

    void Headers::clear() {
        _map.clear();
        _backingStore.clear();
    }

    // Returns an equivalent slice whose memory is owned by _backingStore.
    slice Headers::store(slice s) {
        for ( auto& stored : _backingStore ) {
            if ( stored.containsAddressRange(s) ) return s;
        }
        _backingStore.emplace_back(s);
        return _backingStore.back();
    }

    void Headers::add(slice name, slice value) {
        Assert(name);
        if ( value ) _map.insert({store(name), store(value)});
    }

    void Headers::set(slice name, slice value) {
        remove(name);
        add(name, value);
    }

    void Headers::remove(slice name) { _map.erase(name); }

    slice Headers::get(slice name) const {
        auto i = _map.find(name);
        if ( i == _map.end() ) return nullslice;
        return i->second;
    }

    int64_t Headers::getInt(slice name, int64_t defaultValue) const {
        string str(get(name));
        if ( str.empty() ) return defaultValue;
        char* end;
        errno     = 0;
        int64_t n = strtoll(str.c_str(), &end, 10);
        if ( errno || *end != '\0' ) return defaultValue;
        return n;
    }

    std::string Headers::getAll(slice name) const {
        string all;
        forEach(name, [&all](slice value) {
            if ( !all.empty() ) all += ',';
            all += string_view(value);
        });
        return all;
    }

    void Headers::forEach(fleece::function_ref<void(slice, slice)> callback) const {
        for ( const auto& i : _map ) callback(i.first, i.second);
    }

    void Headers::forEach(slice name, fleece::function_ref<void(slice)> callback) const {
        auto range = _map.equal_range(name);
        for ( auto i = range.first; i != range.second; ++i ) callback(i->second);
    }

}  // namespace litefeed::net
