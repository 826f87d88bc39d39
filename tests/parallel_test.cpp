//! # Parallel Extraction Tests
//!
//! Test Coverage:
//! - WorkQueue push/pop/stop semantics
//! - CancellationToken explicit cancel and deadlines
//! - ParallelExtractor output order independent of thread count
//! - Failed files are isolated from the rest of the run
//! - Cancelled runs discard every outcome
//! - extract_repository() end to end on a temporary tree

#include "extract/assembler.hpp"
#include "extract/parallel.hpp"
#include "extract/repository_extractor.hpp"

#include <fstream>
#include <gtest/gtest.h>
#include <thread>

using namespace pystruct;
using namespace pystruct::extract;

// ============================================================================
// WorkQueue
// ============================================================================

TEST(WorkQueueTest, FifoOrder) {
    WorkQueue queue;
    queue.push(3);
    queue.push(1);
    queue.push(2);
    EXPECT_EQ(queue.size(), 3u);
    EXPECT_EQ(queue.pop(), 3u);
    EXPECT_EQ(queue.pop(), 1u);
    EXPECT_EQ(queue.pop(), 2u);
    EXPECT_TRUE(queue.is_empty());
}

TEST(WorkQueueTest, PopTimesOutWhenEmpty) {
    WorkQueue queue;
    EXPECT_FALSE(queue.pop(10).has_value());
}

TEST(WorkQueueTest, StopWakesWaiters) {
    WorkQueue queue;
    std::optional<size_t> popped = 42;
    std::thread waiter([&] { popped = queue.pop(5000); });
    queue.stop();
    waiter.join();
    EXPECT_FALSE(popped.has_value());
    EXPECT_TRUE(queue.is_stopped());
}

// ============================================================================
// CancellationToken
// ============================================================================

TEST(CancellationTokenTest, ExplicitCancel) {
    CancellationToken token;
    EXPECT_FALSE(token.is_cancelled());
    token.cancel();
    EXPECT_TRUE(token.is_cancelled());
}

TEST(CancellationTokenTest, DeadlinePasses) {
    CancellationToken token;
    token.set_timeout(std::chrono::milliseconds(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_TRUE(token.is_cancelled());
}

TEST(CancellationTokenTest, ZeroTimeoutMeansNoDeadline) {
    CancellationToken token;
    token.set_timeout(std::chrono::milliseconds(0));
    EXPECT_FALSE(token.is_cancelled());
    token.set_timeout(std::chrono::milliseconds(60000));
    EXPECT_FALSE(token.is_cancelled());
}

// ============================================================================
// ParallelExtractor
// ============================================================================

class ParallelExtractorTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (int i = 0; i < 24; ++i) {
            std::string path = "pkg/mod_" + std::to_string(i) + ".py";
            std::string code = "def f" + std::to_string(i) + "(x: int) -> int:\n    return x\n";
            if (i % 7 == 3) {
                code = "def broken(:\n";
            }
            units_.push_back(SourceUnit{.relative_path = path,
                                        .source = lexer::Source::from_string(code, path)});
        }
    }

    std::vector<SourceUnit> units_;
};

TEST_F(ParallelExtractorTest, OutcomesFollowInputOrder) {
    CancellationToken token;
    ParallelExtractor extractor(4);
    auto outcomes = extractor.run(units_, token);

    ASSERT_EQ(outcomes.size(), units_.size());
    for (size_t i = 0; i < outcomes.size(); ++i) {
        if (i % 7 == 3) {
            ASSERT_TRUE(is_err(outcomes[i])) << "slot " << i;
            EXPECT_EQ(unwrap_err(outcomes[i]).file, units_[i].relative_path);
            EXPECT_EQ(unwrap_err(outcomes[i]).kind, FailureKind::Syntax);
        } else {
            ASSERT_TRUE(is_ok(outcomes[i])) << "slot " << i;
            EXPECT_EQ(unwrap(outcomes[i]).file_path, units_[i].relative_path);
            EXPECT_EQ(unwrap(outcomes[i]).functions[0]->callable.name, "f" + std::to_string(i));
        }
    }

    const auto& stats = extractor.get_stats();
    EXPECT_EQ(stats.total_files.load(), 24);
    EXPECT_EQ(stats.failed.load(), 3);
    EXPECT_EQ(stats.completed.load(), 21);
    EXPECT_EQ(stats.cancelled.load(), 0);
}

TEST_F(ParallelExtractorTest, ThreadCountDoesNotChangeResult) {
    CancellationToken token;
    ParallelExtractor serial(1);
    ParallelExtractor wide(8);
    auto a = assemble_repository({}, serial.run(units_, token));
    auto b = assemble_repository({}, wide.run(units_, token));
    EXPECT_TRUE(*a.repository == *b.repository);
    EXPECT_EQ(a.failures, b.failures);
}

TEST_F(ParallelExtractorTest, DefaultThreadCountIsPositive) {
    ParallelExtractor extractor;
    EXPECT_GE(extractor.thread_count(), 1);
}

TEST_F(ParallelExtractorTest, CancelledRunDiscardsEverything) {
    CancellationToken token;
    token.cancel();
    ParallelExtractor extractor(4);
    auto outcomes = extractor.run(units_, token);

    ASSERT_EQ(outcomes.size(), units_.size());
    for (size_t i = 0; i < outcomes.size(); ++i) {
        ASSERT_TRUE(is_err(outcomes[i]));
        EXPECT_EQ(unwrap_err(outcomes[i]).kind, FailureKind::Cancelled);
        EXPECT_EQ(unwrap_err(outcomes[i]).file, units_[i].relative_path);
    }
    EXPECT_EQ(extractor.get_stats().cancelled.load(), 24);
}

TEST_F(ParallelExtractorTest, EmptyInput) {
    CancellationToken token;
    ParallelExtractor extractor(4);
    EXPECT_TRUE(extractor.run({}, token).empty());
}

// ============================================================================
// extract_repository
// ============================================================================

class RepositoryExtractorTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() / "pystruct_repository_extractor_test";
        fs::remove_all(root_);
        fs::create_directories(root_ / "pkg");
        write("pkg/__init__.py", "");
        write("pkg/core.py", "class Engine(Base):\n    def start(self) -> None: pass\n");
        write("pkg/bad.py", "def oops(\n");
    }

    void TearDown() override {
        fs::remove_all(root_);
    }

    void write(const std::string& relative, const std::string& content) {
        std::ofstream out(root_ / relative, std::ios::binary);
        out << content;
    }

    fs::path root_;
};

TEST_F(RepositoryExtractorTest, ExtractsTreeAndReportsFailures) {
    ExtractOptions options{.root = root_,
                           .identity = {.name = "pkg",
                                        .url = "https://example.com/pkg",
                                        .pypi_tag = "",
                                        .git_commit_hash = ""},
                           .jobs = 2};
    CancellationToken token;
    auto result = extract_repository(options, token);
    ASSERT_TRUE(is_ok(result));

    const auto& extraction = unwrap(result);
    EXPECT_EQ(extraction.repository->identity.name, "pkg");
    ASSERT_EQ(extraction.repository->modules.size(), 2u);
    EXPECT_EQ(extraction.repository->modules[0]->file_path, "pkg/__init__.py");
    EXPECT_EQ(extraction.repository->modules[1]->file_path, "pkg/core.py");

    EXPECT_EQ(extraction.report.files_discovered, 3u);
    EXPECT_EQ(extraction.report.modules_extracted, 2u);
    ASSERT_EQ(extraction.report.failures.size(), 1u);
    EXPECT_EQ(extraction.report.failures[0].file, "pkg/bad.py");
    EXPECT_EQ(extraction.report.count(FailureKind::Syntax), 1u);
    EXPECT_EQ(extraction.report.count(FailureKind::Cancelled), 0u);
}

TEST_F(RepositoryExtractorTest, MissingRootFails) {
    ExtractOptions options{.root = root_ / "missing", .identity = {}, .jobs = 1};
    CancellationToken token;
    EXPECT_TRUE(is_err(extract_repository(options, token)));
}
