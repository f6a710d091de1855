//
//  ChangeTrackerOptions.hh
//
//  Copyright 2019-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#pragma once
#include "ThreadedMailbox.hh"  // for delay_t
#include "fleece/RefCounted.hh"
#include "fleece/Fleece.hh"
#include "fleece/Expert.hh"  // for AllocedDict
#include <string>
#include <type_traits>

namespace litefeed::tracker {

    // Option keys:
    static constexpr const char* kTrackerOptionHeaders            = "headers";     // Dict: extra HTTP headers
    static constexpr const char* kTrackerOptionHeartbeat          = "heartbeat";   // number, seconds
    static constexpr const char* kTrackerOptionTLS                = "tls";         // Dict, passed to the transport
    static constexpr const char* kTrackerOptionPinnedServerCert   = "pinnedServerCert";  // data or string
    static constexpr const char* kTrackerOptionSince              = "since";       // string or number
    static constexpr const char* kTrackerOptionFilter             = "filter";      // string
    static constexpr const char* kTrackerOptionFilterParams       = "filterParams";  // Dict
    static constexpr const char* kTrackerOptionDocIDs             = "docIDs";      // Array of strings
    static constexpr const char* kTrackerOptionIncludeConflicts   = "includeConflicts";  // bool
    static constexpr const char* kTrackerOptionActiveOnly         = "activeOnly";  // bool
    static constexpr const char* kTrackerOptionLimit              = "limit";       // int
    static constexpr const char* kTrackerOptionMaxPendingMessages = "maxPendingMessages";  // int; 0 = unlimited

    /** Change tracker configuration options, stored in a Fleece dictionary. */
    class ChangeTrackerOptions final : public fleece::RefCounted {
      public:
        static constexpr double   kDefaultHeartbeatSecs        = 300;
        static constexpr unsigned kDefaultMaxPendingMessages   = 2;

        fleece::AllocedDict properties;

        ChangeTrackerOptions() = default;

        template <class SLICE>
        explicit ChangeTrackerOptions(SLICE propertiesFleece) : properties(propertiesFleece) {}

        ChangeTrackerOptions(const ChangeTrackerOptions& opt)
            : fleece::RefCounted(), properties(fleece::slice(opt.properties.data()))  // copy data, bc dtor wipes it
        {}

        /** Creates options from JSON (or JSON5) text. Throws error(Fleece, ...) if it's invalid. */
        static fleece::Retained<ChangeTrackerOptions> fromJSON(fleece::slice json);

        //---- Property accessors:

        fleece::Dict headers() const { return properties[kTrackerOptionHeaders].asDict(); }

        /** Interval at which the server sends heartbeats; defaults to 5 minutes. */
        actor::delay_t heartbeat() const {
            double secs = properties[kTrackerOptionHeartbeat].asDouble();
            return actor::delay_t(secs > 0 ? secs : kDefaultHeartbeatSecs);
        }

        fleece::Dict tlsOptions() const { return properties[kTrackerOptionTLS].asDict(); }

        fleece::slice pinnedServerCert() const {
            fleece::Value cert = properties[kTrackerOptionPinnedServerCert];
            fleece::slice data = cert.asData();
            return data ? data : cert.asString();
        }

        /** The sequence to start from; numbers are converted to their decimal form. */
        std::string since() const;

        fleece::slice filter() const { return properties[kTrackerOptionFilter].asString(); }

        fleece::Dict filterParams() const { return properties[kTrackerOptionFilterParams].asDict(); }

        fleece::Array docIDs() const { return properties[kTrackerOptionDocIDs].asArray(); }

        bool includeConflicts() const { return boolProperty(kTrackerOptionIncludeConflicts); }

        bool activeOnly() const { return boolProperty(kTrackerOptionActiveOnly); }

        int64_t limit() const { return properties[kTrackerOptionLimit].asInt(); }

        /** Number of received messages that may wait to be processed before reading pauses.
            Defaults to 2; zero disables the limit. */
        unsigned maxPendingMessages() const {
            fleece::Value v = properties[kTrackerOptionMaxPendingMessages];
            if ( !v ) return kDefaultMaxPendingMessages;
            int64_t n = v.asInt();
            return n > 0 ? unsigned(n) : 0;
        }

        bool boolProperty(fleece::slice property) const { return properties[property].asBool(); }

        explicit operator std::string() const;

        //---- Property setters (used only by tests)

        template <class T>
        static fleece::AllocedDict updateProperties(const fleece::AllocedDict& properties, fleece::slice name,
                                                    T value) {
            fleece::Encoder enc;
            enc.beginDict();
            if ( std::is_same<decltype(value), bool>::value ) {
                enc.writeKey(name);
                enc.writeBool((bool)value);
            } else if ( std::is_arithmetic<decltype(value)>::value || value ) {
                enc.writeKey(name);
                enc << value;
            }
            for ( fleece::Dict::iterator i(properties); i; ++i ) {
                fleece::slice key = i.keyString();
                if ( key != name ) {
                    enc.writeKey(key);
                    enc.writeValue(i.value());
                }
            }
            enc.endDict();
            return fleece::AllocedDict(enc.finish());
        }

        /** Sets/clears the value of a property.
            Warning: This rewrites the backing store of the properties, invalidating any
            Fleece value pointers or slices previously accessed from it. */
        template <class T>
        ChangeTrackerOptions& setProperty(fleece::slice name, T value) {
            properties = updateProperties(properties, name, value);
            return *this;
        }
    };

}  // namespace litefeed::tracker
