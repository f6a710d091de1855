//
//  ChangeTrackerOptions.cc
//
//  Copyright 2019-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "ChangeTrackerOptions.hh"
#include "Error.hh"
#include "StringUtil.hh"
#include "fleece/FLExpert.h"
#include <sstream>

using namespace std;
using namespace fleece;

namespace litefeed::tracker {

    Retained<ChangeTrackerOptions> ChangeTrackerOptions::fromJSON(slice json) {
        FLError        flErr  = kFLNoError;
        FLStringResult errMsg = {};
        alloc_slice    json5(FLJSON5_ToJSON(json, &errMsg, nullptr, &flErr));
        if ( !json5 ) {
            alloc_slice message(std::move(errMsg));
            error::_throw(error::Fleece, flErr, "Invalid options JSON: %.*s", SPLAT(message));
        }
        Doc doc = Doc::fromJSON(json5, &flErr);
        if ( !doc || !doc.root().asDict() ) error::_throw(error::Fleece, flErr ? flErr : kFLInvalidData);
        return new ChangeTrackerOptions(doc.allocedData());
    }

    string ChangeTrackerOptions::since() const {
        Value v = properties[kTrackerOptionSince];
        if ( slice str = v.asString(); str ) return string(str);
        if ( v.type() == kFLNumber ) return string(alloc_slice(v.toString()));
        return "";
    }

    // Credentials don't belong in logs.
    static bool isSecretKey(slice key) {
        return compareIgnoringCase(string(key), "Authorization") == 0
               || compareIgnoringCase(string(key), "Cookie") == 0 || key == slice(kTrackerOptionPinnedServerCert);
    }

    static void writeRedacted(Dict dict, stringstream& s) {
        s << "{";
        int n = 0;
        for ( Dict::iterator i(dict); i; ++i ) {
            if ( n++ > 0 ) s << ", ";
            slice key = i.keyString();
            s << string(key) << ":";
            if ( isSecretKey(key) ) {
                s << "\"********\"";
            } else if ( i.value().asDict() ) {
                writeRedacted(i.value().asDict(), s);
            } else {
                alloc_slice json(i.value().toJSON5());
                s << string(json);
            }
        }
        s << "}";
    }

    ChangeTrackerOptions::operator string() const {
        stringstream s;
        s << "Options=";
        writeRedacted(properties, s);
        return s.str();
    }

}  // namespace litefeed::tracker
