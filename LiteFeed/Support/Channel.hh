//
// Channel.hh
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
#include "Error.hh"
#include <condition_variable>
#include <deque>
#include <mutex>
#include <utility>

namespace litefeed::actor {

    /** A thread-safe FIFO shared by any number of producers and consumers.
        Items are moved in and out; nothing is copied once pushed. */
    template <class T>
    class Channel {
      public:
        /** Appends a value to the queue. Ignored once the channel is closed.
            @return  True if the queue was empty before the push. */
        bool push(T t);

        /** Removes and returns the oldest value, blocking while the queue is empty.
            A closed, empty channel returns a default (zero) T instead of blocking.
            @param empty  Set to true if the queue is empty afterwards. */
        T pop(bool& empty) { return _pop(empty, true); }

        /** Like pop() but never blocks: an empty queue yields a default (zero) T. */
        T popNoWaiting(bool& empty) { return _pop(empty, false); }

        T pop() {
            bool empty;
            return pop(empty);
        }

        /** The oldest item, left in place. The queue MUST be non-empty. */
        const T& front() const;

        size_t size() const;

        bool empty() const { return size() == 0; }

        /** After this, pushes are ignored, and pops drain what's left and then stop blocking. */
        void close();

        bool closed() const {
            std::lock_guard<std::mutex> lock(_mutex);
            return _closed;
        }

      protected:
        mutable std::mutex _mutex;

      private:
        T _pop(bool& empty, bool wait);

        std::condition_variable _cond;
        std::deque<T>           _items;
        bool                    _closed{false};
    };

    template <class T>
    bool Channel<T>::push(T t) {
        std::unique_lock<std::mutex> lock(_mutex);
        bool                         wasEmpty = _items.empty();
        if ( _closed ) return false;
        _items.push_back(std::move(t));
        lock.unlock();
        _cond.notify_one();
        return wasEmpty;
    }

    template <class T>
    T Channel<T>::_pop(bool& empty, bool wait) {
        std::unique_lock<std::mutex> lock(_mutex);
        if ( wait ) _cond.wait(lock, [this] { return !_items.empty() || _closed; });
        if ( _items.empty() ) {
            empty = true;
            return T();
        }
        T t(std::move(_items.front()));
        _items.pop_front();
        empty = _items.empty();
        return t;
    }

    template <class T>
    const T& Channel<T>::front() const {
        std::lock_guard<std::mutex> lock(_mutex);
        Assert(!_items.empty());
        return _items.front();
    }

    template <class T>
    size_t Channel<T>::size() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _items.size();
    }

    template <class T>
    void Channel<T>::close() {
        std::lock_guard<std::mutex> lock(_mutex);
        if ( !_closed ) {
            _closed = true;
            _cond.notify_all();
        }
    }

}  // namespace litefeed::actor
