//
// ChangeParser.cc
//
// Copyright 2017-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "ChangeParser.hh"
#include "StringUtil.hh"
#include <cctype>
#include <ostream>

using namespace std;
using namespace fleece;

namespace litefeed::tracker {

    ostream& operator<<(ostream& out, const RevisionChange& change) {
        out << "{seq " << string(change.sequence) << ", '" << string(change.docID) << "'";
        for ( auto& revID : change.revIDs ) out << " " << string(revID);
        if ( change.deleted ) out << " (deleted)";
        if ( change.removed ) out << " (removed)";
        return out << "}";
    }

    // Sequence IDs may be numbers or opaque strings; either way they're kept as strings.
    static alloc_slice sequenceString(Value seq) {
        switch ( seq.type() ) {
            case kFLString:
                return alloc_slice(seq.asString());
            case kFLNumber:
                return seq.toString();
            default:
                return seq.toJSON();
        }
    }

    bool JSONChangeParser::parseBytes(slice bytes) {
        if ( _invalid ) return false;
        if ( _buffer.find_first_not_of(" \t\r\n") == string::npos ) {
            // Still at the start: the first real character has to open an array.
            for ( size_t i = 0; i < bytes.size; ++i ) {
                if ( isspace(bytes[i]) ) continue;
                if ( bytes[i] != '[' ) {
                    LogWarn(ChangesLog, "Change feed message doesn't start with '['");
                    _invalid = true;
                    _buffer.clear();
                    return false;
                }
                break;
            }
        }
        _buffer.append((const char*)bytes.buf, bytes.size);
        return true;
    }

    int64_t JSONChangeParser::endParsingData() {
        string json    = std::move(_buffer);
        bool   invalid = _invalid;
        _buffer.clear();
        _invalid = false;
        _changes.clear();
        if ( invalid ) return -1;

        FLError err = kFLNoError;
        Doc     doc = Doc::fromJSON(slice(json), &err);
        if ( !doc ) {
            LogWarn(ChangesLog, "Change feed message is not valid JSON (Fleece error %d)", int(err));
            return -1;
        }
        Array entries = doc.root().asArray();
        if ( !entries ) {
            LogWarn(ChangesLog, "Change feed message is not a JSON array");
            return -1;
        }

        vector<RevisionChange> changes;
        changes.reserve(entries.count());
        for ( Array::iterator i(entries); i; ++i ) {
            auto change = parseEntry(i.value());
            if ( !change ) {
                alloc_slice entryJSON(i.value().toJSON());
                LogWarn(ChangesLog, "Invalid change entry: %.*s", SPLAT(entryJSON));
                return -1;
            }
            if ( change->docID ) changes.push_back(std::move(*change));
        }
        LogVerbose(ChangesLog, "Parsed %zu changes", changes.size());
        _changes = std::move(changes);
        return int64_t(_changes.size());
    }

    vector<RevisionChange> JSONChangeParser::takeChanges() { return std::move(_changes); }

    optional<RevisionChange> JSONChangeParser::parseEntry(Value entry) {
        Dict dict = entry.asDict();
        if ( !dict ) return nullopt;

        RevisionChange change;
        Value          seq = dict["seq"];
        if ( !seq ) {
            // When a feed ends, its last entry carries only the final sequence.
            Value lastSeq = dict["last_seq"];
            if ( !lastSeq ) return nullopt;
            change.sequence = sequenceString(lastSeq);
            return change;
        }
        slice docID = dict["id"].asString();
        if ( !docID ) return nullopt;
        change.sequence = sequenceString(seq);
        change.docID    = alloc_slice(docID);

        if ( Value revs = dict["changes"]; revs ) {
            Array revArray = revs.asArray();
            if ( !revArray ) return nullopt;
            for ( Array::iterator i(revArray); i; ++i ) {
                slice revID = i.value().asDict()["rev"].asString();
                if ( !revID ) return nullopt;
                change.revIDs.emplace_back(revID);
            }
        }
        change.deleted = dict["deleted"].asBool();
        change.removed = (bool)dict["removed"];
        return change;
    }

}  // namespace litefeed::tracker
