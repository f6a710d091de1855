//
// ChangeParser.hh
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
#include "ChangeTrackerTypes.hh"
#include "fleece/Fleece.hh"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace litefeed::tracker {

    /** Parses the body of a change-feed message into RevisionChanges. Bytes may arrive in pieces;
        `endParsingData` finishes the batch and resets the parser for the next one. */
    class ChangeParser {
      public:
        virtual ~ChangeParser() = default;

        /** Adds input. Returns false if the input is already known to be invalid, in which case
            the batch is discarded. */
        virtual bool parseBytes(fleece::slice bytes) = 0;

        /** Finishes the batch. Returns the number of changes it contained (possibly 0), or -1 if
            it was invalid. */
        virtual int64_t endParsingData() = 0;

        /** Returns the changes of the last successful batch, and forgets them. */
        virtual std::vector<RevisionChange> takeChanges() = 0;
    };

    /** The default parser: a batch is a JSON array of entries like
        `{"seq":12, "id":"doc", "changes":[{"rev":"1-abc"}], "deleted":true}`. */
    class JSONChangeParser final : public ChangeParser {
      public:

        bool                        parseBytes(fleece::slice bytes) override;
        int64_t                     endParsingData() override;
        std::vector<RevisionChange> takeChanges() override;

        /** Parses one entry. Returns nullopt if it's invalid. An entry with only a `last_seq` is
            valid but yields a RevisionChange with no docID. */
        static std::optional<RevisionChange> parseEntry(fleece::Value entry);

      private:
        std::string                 _buffer;
        bool                        _invalid{false};
        std::vector<RevisionChange> _changes;
    };

}  // namespace litefeed::tracker
