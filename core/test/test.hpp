#pragma once

//
// Minimal GTest-compatible test header.
// Supports: TEST(suite, name), EXPECT_TRUE/FALSE, EXPECT_EQ/NE/LT/GT/LE/GE,
//           EXPECT_FLOAT_EQ, EXPECT_NEAR, EXPECT_THROW, EXPECT_NO_THROW,
//           ASSERT_* variants.
//

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>
#include <vector>

namespace rg_test {

struct Test {
    const char* suite;
    const char* name;
    void (*fn)();
};

inline std::vector<Test>& tests()
{
    static std::vector<Test> t;
    return t;
}

inline int& fail_count()
{
    static int n = 0;
    return n;
}

struct Register {
    Register(const char* suite, const char* name, void (*fn)())
    {
        tests().push_back({suite, name, fn});
    }
};

} // namespace rg_test

// ---- test registration ------------------------------------------------------

#define TEST(suite, name)                                                    \
    static void rg_test_##suite##_##name();                                  \
    static ::rg_test::Register rg_reg_##suite##_##name(                      \
        #suite, #name, rg_test_##suite##_##name);                            \
    static void rg_test_##suite##_##name()

// ---- expect (non-fatal) -----------------------------------------------------

#define RG_TEST_CHECK(cond, what)                                            \
    do {                                                                     \
        if (!(cond)) {                                                       \
            std::fprintf(stderr, "  FAIL %s:%d: %s\n",                      \
                         __FILE__, __LINE__, what);                          \
            ++::rg_test::fail_count();                                       \
        }                                                                    \
    } while (0)

#define EXPECT_TRUE(expr)  RG_TEST_CHECK((expr), "EXPECT_TRUE(" #expr ")")
#define EXPECT_FALSE(expr) RG_TEST_CHECK(!(expr), "EXPECT_FALSE(" #expr ")")
#define EXPECT_EQ(a, b) RG_TEST_CHECK((a) == (b), "EXPECT_EQ(" #a ", " #b ")")
#define EXPECT_NE(a, b) RG_TEST_CHECK((a) != (b), "EXPECT_NE(" #a ", " #b ")")
#define EXPECT_LT(a, b) RG_TEST_CHECK((a) < (b), "EXPECT_LT(" #a ", " #b ")")
#define EXPECT_GT(a, b) RG_TEST_CHECK((a) > (b), "EXPECT_GT(" #a ", " #b ")")
#define EXPECT_LE(a, b) RG_TEST_CHECK((a) <= (b), "EXPECT_LE(" #a ", " #b ")")
#define EXPECT_GE(a, b) RG_TEST_CHECK((a) >= (b), "EXPECT_GE(" #a ", " #b ")")

#define EXPECT_NEAR(a, b, eps)                                               \
    do {                                                                     \
        auto va_ = (a); auto vb_ = (b);                                     \
        if (std::fabs(double(va_) - double(vb_)) > double(eps)) {           \
            std::fprintf(stderr,                                             \
                "  FAIL %s:%d: EXPECT_NEAR(%s, %s, %s) got %g vs %g\n",    \
                __FILE__, __LINE__, #a, #b, #eps,                            \
                double(va_), double(vb_));                                   \
            ++::rg_test::fail_count();                                       \
        }                                                                    \
    } while (0)

#define EXPECT_FLOAT_EQ(a, b) EXPECT_NEAR(a, b, 1e-6)

#define EXPECT_THROW(stmt, exc)                                              \
    do {                                                                     \
        bool caught_ = false;                                                \
        try {                                                                \
            stmt;                                                            \
        } catch (const exc&) {                                               \
            caught_ = true;                                                  \
        } catch (const std::exception& e_) {                                 \
            std::fprintf(stderr, "  FAIL %s:%d: EXPECT_THROW(%s, %s) "      \
                         "threw other: %s\n",                                \
                         __FILE__, __LINE__, #stmt, #exc, e_.what());        \
            ++::rg_test::fail_count();                                       \
            break;                                                           \
        }                                                                    \
        if (!caught_) {                                                      \
            std::fprintf(stderr, "  FAIL %s:%d: EXPECT_THROW(%s, %s) "      \
                         "did not throw\n", __FILE__, __LINE__, #stmt, #exc);\
            ++::rg_test::fail_count();                                       \
        }                                                                    \
    } while (0)

#define EXPECT_NO_THROW(stmt)                                                \
    do {                                                                     \
        try {                                                                \
            stmt;                                                            \
        } catch (const std::exception& e_) {                                 \
            std::fprintf(stderr, "  FAIL %s:%d: EXPECT_NO_THROW(%s) "       \
                         "threw: %s\n", __FILE__, __LINE__, #stmt, e_.what());\
            ++::rg_test::fail_count();                                       \
        }                                                                    \
    } while (0)

// ---- assert (fatal, aborts current test) -----------------------------------

#define RG_TEST_REQUIRE(cond, what)                                          \
    do {                                                                     \
        if (!(cond)) {                                                       \
            std::fprintf(stderr, "  FAIL %s:%d: %s\n",                      \
                         __FILE__, __LINE__, what);                          \
            ++::rg_test::fail_count();                                       \
            return;                                                          \
        }                                                                    \
    } while (0)

#define ASSERT_TRUE(expr)  RG_TEST_REQUIRE((expr), "ASSERT_TRUE(" #expr ")")
#define ASSERT_FALSE(expr) RG_TEST_REQUIRE(!(expr), "ASSERT_FALSE(" #expr ")")
#define ASSERT_EQ(a, b) RG_TEST_REQUIRE((a) == (b), "ASSERT_EQ(" #a ", " #b ")")
#define ASSERT_NE(a, b) RG_TEST_REQUIRE((a) != (b), "ASSERT_NE(" #a ", " #b ")")

// ---- runner -----------------------------------------------------------------

inline int rg_test_main()
{
    int passed = 0, failed = 0;
    for (auto& t : ::rg_test::tests()) {
        ::rg_test::fail_count() = 0;
        try {
            t.fn();
        } catch (const std::exception& e) {
            std::fprintf(stderr, "  FAIL %s.%s: uncaught exception: %s\n",
                         t.suite, t.name, e.what());
            ++::rg_test::fail_count();
        }
        if (::rg_test::fail_count() == 0) {
            std::printf("  PASS  %s.%s\n", t.suite, t.name);
            ++passed;
        } else {
            std::printf("  FAIL  %s.%s\n", t.suite, t.name);
            ++failed;
        }
    }
    std::printf("\n%d passed, %d failed\n", passed, failed);
    return failed ? 1 : 0;
}

int main() { return rg_test_main(); }
