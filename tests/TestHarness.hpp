#pragma once

#include "ruida/log/Log.hpp"

#include <chrono>
#include <functional>
#include <thread>

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { ruida::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { ruida::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", +_va, " != ", +_vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_NEAR(a,b,tol,msg) \
    do { double _va=(a); double _vb=(b); double _d=_va-_vb; if (_d < 0) _d = -_d; \
        if (_d > (tol)) { ruida::logError("ASSERT NEAR FAILED: ", (msg), \
        "  (", _va, " vs ", _vb, ")  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

// Polls @p pred until it holds or @p limit passes.
inline bool waitUntil(const std::function<bool()>& pred,
                      std::chrono::milliseconds limit = std::chrono::milliseconds(3000)) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (!pred()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

inline int finish(const char* suite) {
    if (g_failures) {
        ruida::logError("Tests failed: ", g_failures, " failure(s)\n");
        return 1;
    }
    ruida::logInfo(suite, " tests passed.\n");
    return 0;
}
