#include <gtest/gtest.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include "infra/error_handler/error.hpp"
#include "infra/hash/xxhash_digest.hpp"
#include "infra/retry.hpp"
#include "infra/thread_pool/thread_pool.hpp"
#include "support/temp_dir.hpp"

using namespace fxfer::infra;

TEST(ErrorTest, Classification)
{
    EXPECT_TRUE(make_error(ErrorCode::NetworkTimeout, "t").is_transient());
    EXPECT_TRUE(make_error(ErrorCode::ServiceUnavailable, "t").is_transient());
    EXPECT_FALSE(make_error(ErrorCode::PermissionDenied, "t").is_transient());
    EXPECT_TRUE(make_error(ErrorCode::NoMatch, "t").is_fatal());
    EXPECT_FALSE(make_error(ErrorCode::ChunkTransferFailed, "t").is_fatal());
    EXPECT_EQ(make_error(ErrorCode::Interrupted, "t").to_exit_code(), 130);
    EXPECT_EQ(error_from_errno(ENOENT, "open").code, ErrorCode::FileNotFound);
    EXPECT_EQ(to_string(ErrorCode::SizeMismatch), "SizeMismatch");
}

TEST(RetryTest, RetriesTransientUntilSuccess)
{
    int calls = 0;
    int observed = 0;
    auto res = with_retry([&]() -> Result<int> {
        if (++calls < 3) return std::unexpected(make_error(ErrorCode::NetworkTimeout, "slow"));
        return 42;
    }, RetryPolicy{.max_attempts = 5, .initial_delay = std::chrono::milliseconds(1)},
       [&](int, const Error&) { ++observed; });

    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(*res, 42);
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(observed, 2);
}

TEST(RetryTest, GivesUpAfterMaxAttempts)
{
    int calls = 0;
    auto res = with_retry([&]() -> VoidResult {
        ++calls;
        return std::unexpected(make_error(ErrorCode::ServiceUnavailable, "busy"));
    }, RetryPolicy{.max_attempts = 3, .initial_delay = std::chrono::milliseconds(1)});

    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(calls, 3);
}

TEST(RetryTest, PermanentErrorReturnsImmediately)
{
    int calls = 0;
    auto res = with_retry([&]() -> VoidResult {
        ++calls;
        return std::unexpected(make_error(ErrorCode::PermissionDenied, "no"));
    }, RetryPolicy{.max_attempts = 3, .initial_delay = std::chrono::milliseconds(1)});

    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(calls, 1);
}

TEST(ThreadPoolTest, RunsEveryTask)
{
    std::atomic<int> sum{0};
    ThreadPool pool{4};
    EXPECT_EQ(pool.size(), 4u);

    std::vector<std::future<int>> results;
    for (int i = 1; i <= 100; ++i) {
        results.push_back(pool.submit([i, &sum] { sum += i; return i; }));
    }
    pool.wait();
    EXPECT_EQ(sum.load(), 5050);
    EXPECT_EQ(results.back().get(), 100);
}

TEST(XXHashDigestTest, KnownValueAndFileHash)
{
    XXHashDigest empty;
    EXPECT_EQ(XXHashDigest::to_hex(empty.digest()), "ef46db3751d8e999");

    fxfer::testing::TempDir tmp;
    const std::string content(5'000'000, 'q');
    fxfer::testing::write_file(tmp / "f", content);

    XXHashDigest streaming;
    streaming.update(content.substr(0, 1234));
    streaming.update(content.substr(1234));

    auto from_file = XXHashDigest::hash_file(tmp / "f");
    ASSERT_TRUE(from_file.has_value());
    EXPECT_EQ(*from_file, streaming.digest());

    auto missing = XXHashDigest::hash_file(tmp / "nope");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::FileNotFound);
}
