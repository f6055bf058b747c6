#include <catch2/catch.hpp>
#include <reroute/core/logging.hpp>

#include <memory>
#include <vector>

using namespace reroute;

namespace {

std::shared_ptr<CallbackSink> capture_into(std::vector<LogEntry>& entries) {
    return std::make_shared<CallbackSink>([&entries](const LogEntry& e) {
        entries.push_back(e);
    });
}

} // anonymous namespace

TEST_CASE("Log level names", "[logging]") {
    SECTION("round trip through parse") {
        REQUIRE(parse_log_level("debug") == LogLevel::Debug);
        REQUIRE(parse_log_level("WARN") == LogLevel::Warn);
        REQUIRE(parse_log_level("warning") == LogLevel::Warn);
        REQUIRE(parse_log_level("off") == LogLevel::Off);
    }

    SECTION("unknown names fall back to info") {
        REQUIRE(parse_log_level("verbose") == LogLevel::Info);
        REQUIRE(parse_log_level("") == LogLevel::Info);
    }
}

TEST_CASE("Logger level filtering", "[logging]") {
    std::vector<LogEntry> entries;
    Logger logger("routes", LogLevel::Info);
    logger.add_sink(capture_into(entries));

    logger.debug("dropped");
    logger.info("kept");
    logger.error("kept too");

    REQUIRE(entries.size() == 2);
    REQUIRE(entries[0].message == "kept");
    REQUIRE(entries[0].level == LogLevel::Info);
    REQUIRE(entries[0].logger_name == "routes");
    REQUIRE(entries[1].level == LogLevel::Error);

    SECTION("lowering the level") {
        logger.set_level(LogLevel::Trace);
        logger.trace("now visible");
        REQUIRE(entries.size() == 3);
    }

    SECTION("off silences everything") {
        logger.set_level(LogLevel::Off);
        logger.error("silenced");
        REQUIRE(entries.size() == 2);
        REQUIRE(!logger.is_enabled(LogLevel::Fatal));
    }
}

TEST_CASE("Structured log entries", "[logging]") {
    std::vector<LogEntry> entries;
    Logger logger("routes", LogLevel::Debug);
    logger.add_sink(capture_into(entries));

    auto entry = logger.entry(LogLevel::Info, "generation index built");
    entry.field("routes", 3).field("keys", std::string("action,controller"));
    logger.log(entry);

    REQUIRE(entries.size() == 1);
    REQUIRE(entries[0].fields.size() == 2);
    REQUIRE(entries[0].fields[0] == std::pair<std::string, std::string>("routes", "3"));
    REQUIRE(entries[0].fields[1].second == "action,controller");
}

TEST_CASE("Logger sinks", "[logging]") {
    std::vector<LogEntry> first;
    std::vector<LogEntry> second;
    Logger logger("routes");
    logger.add_sink(capture_into(first)).add_sink(capture_into(second));

    logger.warn("both");
    REQUIRE(first.size() == 1);
    REQUIRE(second.size() == 1);

    logger.clear_sinks();
    logger.warn("nobody");
    REQUIRE(first.size() == 1);
}

TEST_CASE("Console sink", "[logging]") {
    REQUIRE(console_sink() == console_sink());
    REQUIRE(console_sink() != nullptr);
}
