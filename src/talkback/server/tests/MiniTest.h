#pragma once

#include "talkback/server/ErrorHandler.h"
#include "talkback/server/ErrorTypes.h"

#include <functional>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// 不依赖 gtest 的自测工具：每个用例是一个 lambda，断言失败抛异常，main 返回失败数是否为 0
namespace mini_test {

inline std::string toString(const std::string& v) { return v; }
inline std::string toString(const char* v) { return v ? std::string(v) : "null"; }
inline std::string toString(bool v) { return v ? "true" : "false"; }

inline std::string toString(talkback::server::ErrorType v) {
    return talkback::server::ErrorInfo::errorTypeToString(v);
}

inline std::string toString(talkback::server::ErrorHandler::LogLevel v) {
    return talkback::server::ErrorHandler::logLevelToString(v);
}

template <typename T>
std::string toString(const T& v) {
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

class AssertionFailed : public std::runtime_error {
public:
    explicit AssertionFailed(const std::string& msg) : std::runtime_error(msg) {}
};

struct TestCase {
    std::string name;
    std::function<void()> fn;
};

inline int run(const std::vector<TestCase>& tests) {
    size_t failed = 0;
    for (const auto& t : tests) {
        try {
            t.fn();
            std::cout << "[  OK  ] " << t.name << "\n";
            continue;
        } catch (const AssertionFailed& e) {
            std::cout << "[ FAIL ] " << t.name << " :: " << e.what() << "\n";
        } catch (const std::exception& e) {
            std::cout << "[ EXC  ] " << t.name << " :: " << e.what() << "\n";
        } catch (...) {
            std::cout << "[ EXC  ] " << t.name << " :: non-standard exception\n";
        }
        ++failed;
    }
    std::cout << tests.size() << " cases, " << failed << " failed\n";
    return failed == 0 ? 0 : 1;
}

} // namespace mini_test

#define CHECK_TRUE(cond)                                                                  \
    do {                                                                                  \
        if (!(cond)) throw mini_test::AssertionFailed("CHECK_TRUE(" #cond ")");           \
    } while (0)

#define CHECK_FALSE(cond) CHECK_TRUE(!(cond))

#define CHECK_EQ(a, b)                                                                    \
    do {                                                                                  \
        const auto _lhs = (a);                                                            \
        const auto _rhs = (b);                                                            \
        if (!(_lhs == _rhs)) {                                                            \
            throw mini_test::AssertionFailed("CHECK_EQ(" #a ", " #b "): " +               \
                mini_test::toString(_lhs) + " != " + mini_test::toString(_rhs));          \
        }                                                                                 \
    } while (0)
