//
//  WeakHolder.hh
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
#include "Error.hh"
#include "fleece/RefCounted.hh"
#include <optional>
#include <utility>

namespace litefeed {
    using fleece::RefCounted;
    using fleece::Retained;

    /** WeakHolder<T>: lets a WebSocket call back into its delegate without keeping the delegate's
        owner alive. The holder does retain the object, but the object counts as "gone" as soon as
        nobody else does: `invoke` then skips the call. The owner drops its reference to disconnect.
        Pre-condition: T must be dynamically castable to RefCounted. */
    template <typename T>
    class WeakHolder : public RefCounted {
      public:
        template <typename U>
        explicit WeakHolder(U* pointer) : _pointer(pointer), _holder(dynamic_cast<RefCounted*>(pointer)) {
            Assert(_holder);
        }

        /** Calls a member function of the held object, unless only this holder still references it.
            @return true if the call was made. Any return value of the function is discarded. */
        template <typename MemFuncPtr, typename... Args>
        bool invoke(MemFuncPtr memFuncPtr, Args&&... args) {
            Retained<RefCounted> holdingIt = _holder;
            if ( holdingIt->refCount() == 2 ) return false;  // Just me and `holdingIt`
            (_pointer->*memFuncPtr)(std::forward<Args>(args)...);
            return true;
        }

        /** Like `invoke`, but returns the member function's result, or nullopt if the held object
            has gone away. */
        template <typename R, typename MemFuncPtr, typename... Args>
        std::optional<R> call(MemFuncPtr memFuncPtr, Args&&... args) {
            Retained<RefCounted> holdingIt = _holder;
            if ( holdingIt->refCount() == 2 ) return std::nullopt;
            return (_pointer->*memFuncPtr)(std::forward<Args>(args)...);
        }

        /** True if some object other than this holder still references the held object. */
        bool alive() const { return _holder->refCount() > 1; }

      private:
        // Invariant: dynamic_cast<RefCounted*>(_pointer) == _holder.get()
        T*                   _pointer;
        Retained<RefCounted> _holder;
    };

}  // namespace litefeed
