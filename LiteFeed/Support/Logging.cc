//
// Logging.cc
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "Logging.hh"
#include "StringUtil.hh"
#include "date/date.h"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <strings.h>
#include <typeinfo>

#if ( defined(__linux__) || defined(__APPLE__) ) && !defined(__ANDROID__)
#    include <cxxabi.h>
#endif

using namespace std;
using namespace std::chrono;

namespace litefeed {

    LogDomain* LogDomain::sFirstDomain = nullptr;
    LogDomain  kDefaultLog("");
    LogDomain  ActorLog("Actor");

    LogLevel                     LogDomain::sCallbackMinLevel = LogLevel::Uninitialized;
    unsigned                     LogDomain::sLastObjRef{0};
    static LogDomain::Callback_t sCallback             = LogDomain::defaultCallback;
    static bool                  sCallbackPreformatted = false;
    static mutex                 sLogMutex;
    static char                  sFormatBuffer[2048];

    static const char* kLevels[] = {"Debug", "Verbose", "Info", "WARNING", "ERROR"};

#pragma mark - GLOBAL SETTINGS:

    void LogDomain::setCallback(Callback_t callback, bool preformatted) {
        unique_lock<mutex> lock(sLogMutex);
        if ( !callback ) sCallbackMinLevel = LogLevel::None;
        sCallback             = callback;
        sCallbackPreformatted = preformatted;
        _invalidateEffectiveLevels();
    }

    LogDomain::Callback_t LogDomain::currentCallback() {
        unique_lock<mutex> lock(sLogMutex);
        return sCallback;
    }

    void LogDomain::setCallbackLogLevel(LogLevel level) noexcept {
        unique_lock<mutex> lock(sLogMutex);

        // Setting "LiteFeedLog" env var forces a minimum level of logging:
        auto envLevel = kDefaultLog.levelFromEnvironment();
        if ( envLevel != LogLevel::Uninitialized ) level = min(level, envLevel);

        if ( level != sCallbackMinLevel ) {
            sCallbackMinLevel = level;
            _invalidateEffectiveLevels();
        }
    }

    // Only call while holding sLogMutex!
    void LogDomain::_invalidateEffectiveLevels() noexcept {
        for ( auto d = sFirstDomain; d; d = d->_next ) d->_effectiveLevel = LogLevel::Uninitialized;
    }

    LogLevel LogDomain::callbackLogLevel() noexcept {
        unique_lock<mutex> lock(sLogMutex);
        return _callbackLogLevel();
    }

    // Only call while holding sLogMutex!
    LogLevel LogDomain::_callbackLogLevel() noexcept {
        auto level = sCallbackMinLevel;
        if ( level == LogLevel::Uninitialized ) {
            // Allow 'LiteFeedLog' env var to set initial callback level:
            level = kDefaultLog.levelFromEnvironment();
            if ( level == LogLevel::Uninitialized ) level = LogLevel::Info;
            sCallbackMinLevel = level;
        }
        return level;
    }

#pragma mark - INITIALIZATION:

    // Returns the LogLevel override set by an environment variable, or Uninitialized if none
    LogLevel LogDomain::levelFromEnvironment() const noexcept {
        char* val = getenv((string("LiteFeedLog") + _name).c_str());
        if ( val ) {
            static const char* const kEnvLevelNames[] = {"debug", "verbose", "info", "warning",
                                                         "error", "none",    nullptr};
            for ( int i = 0; kEnvLevelNames[i]; i++ ) {
                if ( 0 == strcasecmp(val, kEnvLevelNames[i]) ) return LogLevel(i);
            }
            return LogLevel::Info;
        }
        return LogLevel::Uninitialized;
    }

    LogLevel LogDomain::computeLevel() noexcept {
        if ( _effectiveLevel == LogLevel::Uninitialized ) setLevel(_level);
        return _level;
    }

    LogLevel LogDomain::level() const noexcept { return const_cast<LogDomain*>(this)->computeLevel(); }

    void LogDomain::setLevel(LogLevel level) noexcept {
        unique_lock<mutex> lock(sLogMutex);

        // Setting "LiteFeedLog___" env var forces a minimum level:
        auto envLevel = levelFromEnvironment();
        if ( envLevel != LogLevel::Uninitialized ) level = min(level, envLevel);

        _level = level;
        // The effective level is the level at which I will actually trigger because there is
        // a place for my output to go:
        _effectiveLevel = max((LogLevel)_level, _callbackLogLevel());
    }

    LogDomain* LogDomain::named(const char* name) {
        unique_lock<mutex> lock(sLogMutex);
        if ( !name ) name = "";
        for ( auto d = sFirstDomain; d; d = d->_next )
            if ( strcmp(d->name(), name) == 0 ) return d;
        return nullptr;
    }

#pragma mark - LOGGING:

    void LogDomain::vlog(LogLevel level, const string& prefix, const char* fmt, va_list args) {
        if ( !willLog(level) ) return;

        unique_lock<mutex> lock(sLogMutex);
        if ( !sCallback || level < _callbackLogLevel() ) return;

        va_list args2;
        va_copy(args2, args);
        if ( sCallbackPreformatted || !prefix.empty() ) {
            size_t n = 0;
            if ( !prefix.empty() ) n = (size_t)snprintf(sFormatBuffer, sizeof(sFormatBuffer), "%s ", prefix.c_str());
            if ( n < sizeof(sFormatBuffer) ) vsnprintf(&sFormatBuffer[n], sizeof(sFormatBuffer) - n, fmt, args2);
            va_list noArgs{};
            // The buffer is already formatted, so it's passed as a format with no arguments;
            // escape any '%' it contains unless the callback takes preformatted messages.
            if ( sCallbackPreformatted ) {
                sCallback(*this, level, sFormatBuffer, noArgs);
            } else {
                string escaped;
                for ( const char* c = sFormatBuffer; *c; ++c ) {
                    if ( *c == '%' ) escaped += '%';
                    escaped += *c;
                }
                sCallback(*this, level, escaped.c_str(), noArgs);
            }
        } else {
            sCallback(*this, level, fmt, args2);
        }
        va_end(args2);
    }

    void LogDomain::vlog(LogLevel level, const char* fmt, va_list args) { vlog(level, string(), fmt, args); }

    void LogDomain::log(LogLevel level, const char* fmt, ...) {
        va_list args;
        va_start(args, fmt);
        vlog(level, string(), fmt, args);
        va_end(args);
    }

    // The default logging callback writes to stderr.
    void LogDomain::defaultCallback(const LogDomain& domain, LogLevel level, const char* fmt, va_list args) {
        auto   now       = date::floor<microseconds>(system_clock::now());
        string timestamp = date::format("%T", now);
        auto   name      = domain.name();
        if ( name[0] ) fprintf(stderr, "%s| [%s] %s: ", timestamp.c_str(), name, kLevels[(int)level]);
        else
            fprintf(stderr, "%s| %s: ", timestamp.c_str(), kLevels[(int)level]);
        vfprintf(stderr, fmt, args);
        fputc('\n', stderr);
    }

    unsigned LogDomain::registerObject(const void* object, const string& description, const string& nickname) {
        unsigned objRef;
        {
            unique_lock<mutex> lock(sLogMutex);
            objRef = ++sLastObjRef;
        }
        if ( willLog(LogLevel::Info) )
            log(LogLevel::Info, "{%s#%u}==> %s @%p", nickname.c_str(), objRef, description.c_str(), object);
        return objRef;
    }

#pragma mark - LOGGING CLASS:

    static std::string classNameOf(const Logging* obj) {
        const char* name = typeid(*obj).name();
#if ( defined(__linux__) || defined(__APPLE__) ) && !defined(__ANDROID__)
        // Get the name of my class, unmangle it, and remove namespaces:
        size_t unmangledLen;
        int    status;
        char*  unmangled = abi::__cxa_demangle(name, nullptr, &unmangledLen, &status);
        if ( unmangled ) name = unmangled;
        string result(name);
        free(unmangled);
        return result;
#else
        return name;
#endif
    }

    std::string Logging::loggingName() const {
        return stringprintf("%s#%u", loggingClassName().c_str(), getObjectRef());
    }

    std::string Logging::loggingClassName() const {
        string name  = classNameOf(this);
        auto   colon = name.find_last_of(':');
        if ( colon != string::npos ) name = name.substr(colon + 1);
        return name;
    }

    std::string Logging::loggingIdentifier() const { return stringprintf("%p", this); }

    unsigned Logging::getObjectRef() const {
        unsigned ref = _objectRef;
        if ( ref == 0 ) {
            string   nickname   = loggingClassName();
            string   identifier = classNameOf(this) + " " + loggingIdentifier();
            unsigned newRef     = _domain.registerObject(this, identifier, nickname);
            // Another thread may have registered me meanwhile; keep whichever ref won.
            if ( _objectRef.compare_exchange_strong(ref, newRef) ) ref = newRef;
        }
        return ref;
    }

    void Logging::_log(LogLevel level, const char* format, ...) const {
        va_list args;
        va_start(args, format);
        _logv(level, format, args);
        va_end(args);
    }

    void Logging::_logv(LogLevel level, const char* format, va_list args) const {
        if ( _domain.willLog(level) ) {
            string prefix = stringprintf("{%s#%u}", loggingClassName().c_str(), getObjectRef());
            _domain.vlog(level, prefix, format, args);
        }
    }

}  // namespace litefeed
