// test_framework.h - Simple test framework shared by the svgview tests
//
// TEST(name) registers a function, ASSERT_* throw on failure, and
// runTests() prints [RUN ]/[PASS]/[FAIL] lines and a summary. main() of each
// test executable returns runTests("Suite name").

#ifndef SVGVIEW_TEST_FRAMEWORK_H
#define SVGVIEW_TEST_FRAMEWORK_H

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

struct TestResult {
    std::string name;
    bool passed;
    std::string message;
};

using TestFunc = std::function<void()>;

inline std::vector<std::pair<std::string, TestFunc>>& testRegistry() {
    static std::vector<std::pair<std::string, TestFunc>> tests;
    return tests;
}

inline void registerTest(const char* name, TestFunc func) {
    testRegistry().push_back({name, std::move(func)});
}

#define TEST(name) \
    static void test_##name(); \
    static struct TestRegistrar_##name { \
        TestRegistrar_##name() { registerTest(#name, test_##name); } \
    } g_registrar_##name; \
    static void test_##name()

#define ASSERT_TRUE(expr) \
    do { \
        if (!(expr)) { \
            throw std::runtime_error("ASSERT_TRUE failed: " #expr); \
        } \
    } while(0)

#define ASSERT_FALSE(expr) \
    do { \
        if (expr) { \
            throw std::runtime_error("ASSERT_FALSE failed: " #expr); \
        } \
    } while(0)

#define ASSERT_EQ(a, b) \
    do { \
        if ((a) != (b)) { \
            throw std::runtime_error("ASSERT_EQ failed: " #a " != " #b); \
        } \
    } while(0)

#define ASSERT_NE(a, b) \
    do { \
        if ((a) == (b)) { \
            throw std::runtime_error("ASSERT_NE failed: " #a " == " #b); \
        } \
    } while(0)

#define ASSERT_NULL(ptr) \
    do { \
        if ((ptr) != nullptr) { \
            throw std::runtime_error("ASSERT_NULL failed: " #ptr " is not null"); \
        } \
    } while(0)

#define ASSERT_NOT_NULL(ptr) \
    do { \
        if ((ptr) == nullptr) { \
            throw std::runtime_error("ASSERT_NOT_NULL failed: " #ptr " is null"); \
        } \
    } while(0)

// Expect statement to throw svgview::ViewerError of the given kind
#define ASSERT_THROWS_KIND(statement, expectedKind) \
    do { \
        bool thrown_ = false; \
        try { \
            statement; \
        } catch (const svgview::ViewerError& e_) { \
            thrown_ = true; \
            if (e_.kind() != (expectedKind)) { \
                throw std::runtime_error("ASSERT_THROWS_KIND failed: " #statement " threw " + \
                                         std::string(svgview::errorKindName(e_.kind()))); \
            } \
        } \
        if (!thrown_) { \
            throw std::runtime_error("ASSERT_THROWS_KIND failed: " #statement " did not throw"); \
        } \
    } while(0)

// Poll predicate until it holds or timeout expires
inline bool waitFor(const std::function<bool()>& predicate,
                    std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

// =============================================================================
// Temporary files
// =============================================================================

class TempDir {
public:
    explicit TempDir(const std::string& prefix) {
        path_ = std::filesystem::temp_directory_path() /
                (prefix + "_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string file(const std::string& name) const { return (path_ / name).string(); }
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// Truncate and write content; the close produces IN_CLOSE_WRITE
inline void writeFile(const std::string& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file << content;
    file.close();
}

// =============================================================================
// Test Runner
// =============================================================================

inline int runTests(const char* suiteName) {
    std::vector<TestResult> results;
    int passCount = 0;
    int failCount = 0;

    std::cout << "\n========================================" << std::endl;
    std::cout << suiteName << std::endl;
    std::cout << "========================================\n" << std::endl;

    for (const auto& [name, func] : testRegistry()) {
        std::cout << "[RUN ] " << name << std::endl;
        try {
            func();
            passCount++;
            results.push_back({name, true, ""});
            std::cout << "[PASS] " << name << std::endl;
        } catch (const std::exception& e) {
            failCount++;
            results.push_back({name, false, e.what()});
            std::cout << "[FAIL] " << name << ": " << e.what() << std::endl;
        }
        std::cout << std::endl;
    }

    std::cout << "========================================" << std::endl;
    std::cout << "Results: " << passCount << "/" << (passCount + failCount) << " tests passed";
    if (failCount > 0) {
        std::cout << " (" << failCount << " failed)";
    }
    std::cout << std::endl;
    std::cout << "========================================" << std::endl;

    if (failCount > 0) {
        std::cout << "\nFailed tests:" << std::endl;
        for (const auto& result : results) {
            if (!result.passed) {
                std::cout << "  - " << result.name << ": " << result.message << std::endl;
            }
        }
    }
    return failCount > 0 ? 1 : 0;
}

#endif  // SVGVIEW_TEST_FRAMEWORK_H
