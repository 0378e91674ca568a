//! # Logger Unit Tests
//!
//! LogFilter parsing, command-line option extraction, sink output and
//! concurrent logging from worker threads.

#include "log/log.hpp"

#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <mutex>
#include <thread>

using namespace conform::log;
using conform::test_support::TempDir;

// ============================================================================
// LogFilter
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, ModuleLevelAndDefault) {
    filter.parse("engine=debug,*=info");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "engine"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "engine"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "engine"));

    EXPECT_TRUE(filter.should_log(LogLevel::Info, "fix"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "fix"));
}

TEST_F(LogFilterTest, ModuleOff) {
    filter.parse("lexer=off");

    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "lexer"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "engine"));
}

TEST_F(LogFilterTest, BareModuleNameEnablesTrace) {
    filter.parse("fix");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "fix"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "engine"));
}

TEST_F(LogFilterTest, MinLevelCoversOverrides) {
    filter.parse("engine=trace,*=error");
    EXPECT_EQ(filter.default_level(), LogLevel::Error);
    EXPECT_EQ(filter.min_level(), LogLevel::Trace);
}

TEST_F(LogFilterTest, EmptySpecKeepsDefault) {
    filter.parse("");
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "engine"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "engine"));
}

TEST(LogLevelTest, ParseAndName) {
    EXPECT_EQ(parse_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_level("WARN"), LogLevel::Warn);
    EXPECT_EQ(parse_level("off"), LogLevel::Off);
    EXPECT_EQ(parse_level("nonsense"), LogLevel::Info);
    EXPECT_STREQ(level_name(LogLevel::Error), "ERROR");
}

// ============================================================================
// Command-Line Options
// ============================================================================

class LogOptionsTest : public ::testing::Test {
protected:
    auto parse(std::vector<std::string> args) -> LogConfig {
        args.insert(args.begin(), "conform");
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return parse_log_options(static_cast<int>(argv.size()), argv.data());
    }
};

TEST_F(LogOptionsTest, ExplicitLevelAndFilter) {
    auto config = parse({"check", "--log-level=debug", "--log-filter=engine=trace", "."});
    EXPECT_EQ(config.level, LogLevel::Debug);
    EXPECT_EQ(config.filter_spec, "engine=trace");
}

TEST_F(LogOptionsTest, VerbosityFlags) {
    EXPECT_EQ(parse({"-v"}).level, LogLevel::Info);
    EXPECT_EQ(parse({"-vv"}).level, LogLevel::Debug);
    EXPECT_EQ(parse({"-vvv"}).level, LogLevel::Trace);
    EXPECT_EQ(parse({"-v", "--log-level=error"}).level, LogLevel::Error);
}

TEST_F(LogOptionsTest, FileAndFormat) {
    auto config = parse({"--log-file=out.log", "--log-format=json"});
    EXPECT_EQ(config.log_file, "out.log");
    EXPECT_EQ(config.format, LogFormat::JSON);
}

TEST_F(LogOptionsTest, RecognizesOnlyLogOptions) {
    EXPECT_TRUE(is_log_option("--log-level=info"));
    EXPECT_TRUE(is_log_option("-vv"));
    EXPECT_TRUE(is_log_option("--verbose"));
    EXPECT_FALSE(is_log_option("-q"));
    EXPECT_FALSE(is_log_option("--fix"));
    EXPECT_FALSE(is_log_option("-j"));
}

// ============================================================================
// Sinks
// ============================================================================

namespace {

/// Collects records in memory.
class CaptureSink : public LogSink {
public:
    explicit CaptureSink(std::vector<std::string>* out, std::mutex* mutex)
        : out_(out), mutex_(mutex) {}

    void write(const LogRecord& record) override {
        std::lock_guard<std::mutex> lock(*mutex_);
        out_->push_back(std::string(record.module) + ":" + record.message);
    }

    void flush() override {}

private:
    std::vector<std::string>* out_;
    std::mutex* mutex_;
};

} // namespace

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        LogConfig config;
        config.level = LogLevel::Debug;
        config.console = false;
        Logger::init(config);
        Logger::instance().add_sink(std::make_unique<CaptureSink>(&records_, &mutex_));
    }

    void TearDown() override {
        LogConfig config;
        config.level = LogLevel::Off;
        config.console = false;
        Logger::init(config);
    }

    std::vector<std::string> records_;
    std::mutex mutex_;
};

TEST_F(LoggerTest, MacrosRespectTheLevel) {
    CONFORM_LOG_DEBUG("engine", "pass " << 1);
    CONFORM_LOG_TRACE("engine", "hidden");
    CONFORM_LOG_WARN("fix", "did not converge");

    ASSERT_EQ(records_.size(), 2u);
    EXPECT_EQ(records_[0], "engine:pass 1");
    EXPECT_EQ(records_[1], "fix:did not converge");
}

TEST_F(LoggerTest, FilterSelectsModules) {
    Logger::instance().set_filter("fix=trace,*=error");
    CONFORM_LOG_TRACE("fix", "edit");
    CONFORM_LOG_INFO("engine", "dropped");
    CONFORM_LOG_ERROR("engine", "kept");

    ASSERT_EQ(records_.size(), 2u);
    EXPECT_EQ(records_[0], "fix:edit");
    EXPECT_EQ(records_[1], "engine:kept");
}

TEST_F(LoggerTest, ConcurrentWorkersDoNotLoseRecords) {
    constexpr int THREADS = 4;
    constexpr int PER_THREAD = 50;
    std::vector<std::thread> workers;
    for (int t = 0; t < THREADS; ++t) {
        workers.emplace_back([t] {
            for (int i = 0; i < PER_THREAD; ++i) {
                CONFORM_LOG_INFO("runner", "worker " << t << " item " << i);
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    EXPECT_EQ(records_.size(), static_cast<size_t>(THREADS * PER_THREAD));
}

TEST(FileSinkTest, WritesTextAndJson) {
    TempDir dir("log_sink");
    auto path = (dir.path() / "conform.log").string();
    {
        FileSink sink(path, false);
        ASSERT_TRUE(sink.is_open());
        LogRecord record{LogLevel::Warn, "engine", "a \"quoted\" note", __FILE__, __LINE__, 0};
        sink.write(record);
        sink.set_format(LogFormat::JSON);
        sink.write(record);
        sink.flush();
    }

    std::string content = dir.read("conform.log");
    EXPECT_NE(content.find("WARN  [engine] a \"quoted\" note"), std::string::npos);
    EXPECT_NE(content.find(R"("level":"WARN","module":"engine","msg":"a \"quoted\" note")"),
              std::string::npos);
}

TEST(MultiSinkTest, FansOutToEverySink) {
    std::vector<std::string> first;
    std::vector<std::string> second;
    std::mutex mutex;
    MultiSink multi;
    multi.add(std::make_unique<CaptureSink>(&first, &mutex));
    multi.add(std::make_unique<CaptureSink>(&second, &mutex));
    multi.add(std::make_unique<NullSink>());
    EXPECT_EQ(multi.size(), 3u);

    multi.write(LogRecord{LogLevel::Info, "cli", "hello", __FILE__, __LINE__, 0});
    EXPECT_EQ(first.size(), 1u);
    EXPECT_EQ(second.size(), 1u);
}
