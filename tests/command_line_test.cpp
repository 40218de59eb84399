#include <catch2/catch.hpp>

#include <initializer_list>

#include "typing_trainer/command_line.hpp"

using namespace tt::trainer;
using namespace std::chrono_literals;

namespace {

CommandLine parse(std::initializer_list<const char*> args) {
    std::vector<const char*> argv{"typing-trainer"};
    argv.insert(argv.end(), args.begin(), args.end());
    return parseCommandLine(static_cast<int>(argv.size()), argv.data());
}

}  // namespace

TEST_CASE("no arguments overrides nothing", "[cli]") {
    const auto cli = parse({});
    CHECK_FALSE(cli.duration.has_value());
    CHECK_FALSE(cli.require_correction);
    CHECK_FALSE(cli.text_source.has_value());
    CHECK_FALSE(cli.max_word_length.has_value());
    CHECK_FALSE(cli.config_path.has_value());
    CHECK_FALSE(cli.no_history);
    CHECK_FALSE(cli.show_help);
}

TEST_CASE("short and long options", "[cli]") {
    const auto cli = parse({"-d", "60", "-c", "-s", "dict", "-m", "10"});
    CHECK(cli.duration == 60s);
    CHECK(cli.require_correction);
    CHECK(cli.text_source == TextSource::System);
    CHECK(cli.max_word_length == std::size_t{10});

    const auto eq = parse({"--duration=45", "--text-source=BUILT-IN", "--max-word-length", "20",
                           "--config", "my.toml", "--history=h.csv", "--no-history"});
    CHECK(eq.duration == 45s);
    CHECK(eq.text_source == TextSource::Builtin);
    CHECK(eq.max_word_length == std::size_t{20});
    REQUIRE(eq.config_path.has_value());
    CHECK(eq.config_path->string() == "my.toml");
    REQUIRE(eq.history_path.has_value());
    CHECK(eq.history_path->string() == "h.csv");
    CHECK(eq.no_history);
}

TEST_CASE("help and version", "[cli]") {
    CHECK(parse({"-h"}).show_help);
    CHECK(parse({"--help"}).show_help);
    CHECK(parse({"-V"}).show_version);
    CHECK(parse({"--version"}).show_version);
}

TEST_CASE("bad values are rejected", "[cli]") {
    CHECK_THROWS_AS(parse({"-d", "0"}), CommandLineError);
    CHECK_THROWS_AS(parse({"-d", "-3"}), CommandLineError);
    CHECK_THROWS_AS(parse({"-d", "abc"}), CommandLineError);
    CHECK_THROWS_AS(parse({"-d", "10s"}), CommandLineError);
    CHECK_THROWS_AS(parse({"-m", "2"}), CommandLineError);
    CHECK_THROWS_AS(parse({"-m", "21"}), CommandLineError);
    CHECK_THROWS_AS(parse({"-s", "wikipedia"}), CommandLineError);
}

TEST_CASE("malformed command lines are rejected", "[cli]") {
    CHECK_THROWS_WITH(parse({"--turbo"}), "Unknown option: --turbo");
    CHECK_THROWS_WITH(parse({"-d"}), "Missing value for -d");
    CHECK_THROWS_AS(parse({"--no-history=yes"}), CommandLineError);
    CHECK_THROWS_AS(parse({"--require-correction=1"}), CommandLineError);
}

TEST_CASE("command line values win over the config", "[cli]") {
    TrainerConfig config;
    config.duration = 90s;
    config.text_source = TextSource::System;
    config.max_word_length = 12;
    config.history_path = "/var/tmp/a.csv";

    applyCommandLine(parse({"-d", "15", "--no-history"}), config);
    CHECK(config.duration == 15s);
    CHECK(config.text_source == TextSource::System);
    CHECK(config.max_word_length == 12);
    CHECK_FALSE(config.history_enabled);
    CHECK(config.history_path.string() == "/var/tmp/a.csv");

    applyCommandLine(parse({"-c", "--history", "/tmp/b.csv"}), config);
    CHECK(config.require_correction);
    CHECK(config.history_path.string() == "/tmp/b.csv");
}

TEST_CASE("usage lists every option", "[cli]") {
    const auto text = usageText("typing-trainer");
    for (const char* option : {"--duration", "--require-correction", "--text-source",
                               "--max-word-length", "--config", "--history", "--no-history",
                               "--help", "--version"}) {
        CHECK(text.find(option) != std::string::npos);
    }
}

TEST_CASE("usage describes the embedded word list", "[cli]") {
    const auto text = usageText("typing-trainer");
    CHECK(text.find("google (top English words)") != std::string::npos);
    CHECK(text.find("10k") == std::string::npos);
}
