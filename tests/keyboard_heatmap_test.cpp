#include <catch2/catch.hpp>

#include <sstream>
#include <stdexcept>

#include "typing_trainer/keyboard_heatmap.hpp"
#include "typing_trainer/logging_transport.hpp"

using namespace tt::trainer;
using namespace std::chrono_literals;

namespace {

const std::filesystem::path kDataDir{TYPING_TRAINER_TEST_DATA_DIR};

KeyboardModel smallModel() {
    return KeyboardModel("Tiny", 0x1234, 0x5678, {0x06, 0x08}, 20,
                         KeyboardModel::Layout{{"Q", "W"}, {"A", "Space", "NAN"}});
}

std::size_t countOf(const std::string& haystack, const std::string& needle) {
    std::size_t count = 0;
    for (auto pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) {
        ++count;
    }
    return count;
}

}  // namespace

TEST_CASE("layout labels map to typed characters", "[keyboard]") {
    const auto model = smallModel();
    CHECK(model.keyCount() == 5);
    CHECK(model.characterAt(0) == 'q');
    CHECK(model.characterAt(2) == 'a');
    CHECK(model.characterAt(3) == ' ');
    CHECK_FALSE(model.characterAt(4).has_value());
    CHECK_THROWS_AS(model.characterAt(5), std::out_of_range);
    CHECK(model.indexForKey("Space") == std::size_t{3});
    CHECK_FALSE(model.indexForKey("NAN").has_value());
}

TEST_CASE("frames carry the header, one RGB per key and padding", "[keyboard]") {
    const auto model = smallModel();
    const std::vector<RgbColor> colors{{1, 2, 3}, {4, 5, 6}, {7, 8, 9}, {10, 11, 12}, {13, 14, 15}};
    const auto frame = model.encodeFrame(colors);

    REQUIRE(frame.size() == 20);
    CHECK(frame[0] == 0x06);
    CHECK(frame[1] == 0x08);
    CHECK(std::vector<std::uint8_t>(frame.begin() + 2, frame.begin() + 14) ==
          std::vector<std::uint8_t>{1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12});
    // NAN slot stays dark.
    CHECK(std::vector<std::uint8_t>(frame.begin() + 14, frame.end()) == std::vector<std::uint8_t>(6, 0));
    CHECK_THROWS_AS(model.encodeFrame({}), std::runtime_error);
}

TEST_CASE("a layout larger than the packet is rejected", "[keyboard]") {
    CHECK_THROWS_AS(KeyboardModel("Tiny", 1, 2, {0x06}, 6, KeyboardModel::Layout{{"Q", "W"}}),
                    std::invalid_argument);
}

TEST_CASE("layout files skip comments and blank lines", "[keyboard]") {
    const auto layout = readLayoutFile(kDataDir / "layout_ansi.csv");
    REQUIRE(layout.size() == 5);
    CHECK(layout[1][1] == "Q");
    CHECK(layout[4][3] == "Space");
    CHECK_THROWS_AS(readLayoutFile(kDataDir / "no_such_layout.csv"), std::runtime_error);
}

TEST_CASE("speed heatmap colors the typed keys", "[keyboard]") {
    std::ostringstream log;
    KeyboardHeatmap heatmap(smallModel(), std::make_unique<LoggingTransport>(log), HeatmapKind::Speed);

    KeyMetricsTracker tracker;
    tracker.recordAttempt('q', 100ms);
    tracker.recordAttempt('w', 300ms);
    const auto colors = heatmap.render(HeatmapColorMapper(tracker));

    REQUIRE(colors.size() == 5);
    CHECK(colors[0] == bandColor(SpeedBand::Fastest));
    CHECK(colors[1] == bandColor(SpeedBand::Slowest));
    CHECK(colors[2] == bandColor(SpeedBand::Unused));
    CHECK(colors[3] == bandColor(SpeedBand::Unused));
}

TEST_CASE("accuracy heatmap colors the typed keys", "[keyboard]") {
    std::ostringstream log;
    KeyboardHeatmap heatmap(smallModel(), std::make_unique<LoggingTransport>(log), HeatmapKind::Accuracy);

    KeyMetricsTracker tracker;
    tracker.recordAttempt('a', 100ms);
    tracker.recordAttempt('a', 100ms);
    tracker.recordError('a');
    tracker.recordAttempt(' ', 100ms);
    const auto colors = heatmap.render(HeatmapColorMapper(tracker));

    CHECK(colors[2] == bandColor(AccuracyBand::Low));
    CHECK(colors[3] == bandColor(AccuracyBand::Highest));
    CHECK(colors[0] == bandColor(AccuracyBand::Unused));
}

TEST_CASE("frames are only pushed once connected", "[keyboard]") {
    std::ostringstream log;
    KeyboardHeatmap heatmap(smallModel(), std::make_unique<LoggingTransport>(log), HeatmapKind::Speed);
    KeyMetricsTracker tracker;

    CHECK_FALSE(heatmap.connected());
    CHECK_FALSE(heatmap.show(HeatmapColorMapper(tracker)));
    CHECK(log.str().empty());

    REQUIRE(heatmap.connect());
    CHECK(heatmap.blank());
    CHECK(heatmap.show(HeatmapColorMapper(tracker)));
    CHECK(log.str().find("Connected to keyboard: Tiny") != std::string::npos);
    CHECK(countOf(log.str(), "for Tiny (20 bytes)") == 2);
    CHECK(log.str().find("header: 0x06 0x08\n") != std::string::npos);
    CHECK(log.str().find("Q=#404040 W=#404040 A=#404040 Space=#404040 NAN=#000000\n") != std::string::npos);
}

TEST_CASE("the logging transport counts frames and rejects short ones", "[keyboard]") {
    std::ostringstream log;
    LoggingTransport transport(log);
    const auto model = smallModel();

    CHECK(transport.sendFrame(model, model.encodeFrame(std::vector<RgbColor>(5, RgbColor{255, 0, 16}))));
    CHECK(transport.framesSent() == 1);
    CHECK(log.str().find("Q=#ff0010") != std::string::npos);

    CHECK_FALSE(transport.sendFrame(model, std::vector<std::uint8_t>(4, 0)));
    CHECK(transport.framesSent() == 1);
    CHECK(log.str().find("Short frame for Tiny (4 bytes)") != std::string::npos);
}

TEST_CASE("transports and heatmap kinds by name", "[keyboard]") {
    CHECK(createTransport("logging")->id() == "logging");
    CHECK(createTransport("hidapi")->id() == "hidapi");
    CHECK_THROWS_AS(createTransport("serial"), std::runtime_error);
    CHECK(parseHeatmapKind("speed") == HeatmapKind::Speed);
    CHECK(parseHeatmapKind("accuracy") == HeatmapKind::Accuracy);
    CHECK_FALSE(parseHeatmapKind("latency").has_value());
    CHECK_THROWS_AS(KeyboardHeatmap(smallModel(), nullptr, HeatmapKind::Speed), std::invalid_argument);
}
