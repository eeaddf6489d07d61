#include <gtest/gtest.h>
#include <serialization/config_json.hpp>
#include <serialization/flatness_json.hpp>
#include <serialization/json_serialization.hpp>

using namespace animatic;

TEST(ConfigJsonTest, MissingKeysKeepDefaults) {
    SceneConfig config = flatness_scene_defaults();
    nlohmann::json j = {{"fps", 30}};
    from_json(j, config);

    EXPECT_EQ(config.fps, 30);
    EXPECT_EQ(config.width, 1500);
    EXPECT_DOUBLE_EQ(config.resolution, 5.0);
    ASSERT_TRUE(config.origin.has_value());
    EXPECT_EQ(*config.origin, Vec2(500.0, 1000.0));
}

TEST(ConfigJsonTest, SceneConfigFields) {
    SceneConfig config;
    nlohmann::json j = {
        {"width", 640}, {"height", 480}, {"resolution", 50.0},
        {"background", {10, 20, 30}}, {"origin", {0.0, 480.0}}
    };
    from_json(j, config);
    EXPECT_EQ(config.width, 640);
    EXPECT_EQ(config.background, (Color{10, 20, 30}));
    EXPECT_EQ(*config.origin, Vec2(0.0, 480.0));

    nlohmann::json out = config;
    EXPECT_EQ(out["height"].get<int>(), 480);
    EXPECT_DOUBLE_EQ(out["origin"][1].get<double>(), 480.0);
}

TEST(ConfigJsonTest, DialDemoOverrides) {
    DialDemoConfig config;
    nlohmann::json j = {{"diameter", 2.0}, {"high_reading", "0.61"}, {"part_position", {1.0, 2.0}}};
    from_json(j, config);
    EXPECT_DOUBLE_EQ(config.diameter, 2.0);
    EXPECT_EQ(config.high_reading, "0.61");
    EXPECT_EQ(config.low_reading, "0.08");
    EXPECT_EQ(config.part_position, Vec3(1.0, 2.0, 0.0));
}

TEST(ConfigJsonTest, ExportConfig) {
    ExportConfig config;
    from_json(nlohmann::json{{"sink", "ffmpeg"}, {"output", "out.mp4"}}, config);
    EXPECT_EQ(config.sink, "ffmpeg");
    EXPECT_EQ(config.output, "out.mp4");
    EXPECT_EQ(config.ffmpeg_path, "ffmpeg");
    EXPECT_TRUE(config.font.empty());

    from_json(nlohmann::json{{"font", "/opt/fonts/Mono.ttf"}}, config);
    EXPECT_EQ(config.font, "/opt/fonts/Mono.ttf");
    EXPECT_EQ(config.sink, "ffmpeg");
}

TEST(FlatnessJsonTest, ResultReport) {
    FlatnessResult result;
    result.flatness = 0.25;
    result.steps.push_back(FlatnessStep{0.25, {1.0, 0.0}, {0.0, 0.0}, {2.0, 0.25}});

    nlohmann::json j = flatness_to_json(result);
    EXPECT_DOUBLE_EQ(j["flatness"].get<double>(), 0.25);
    ASSERT_EQ(j["steps"].size(), 1u);
    EXPECT_DOUBLE_EQ(j["steps"][0]["p1"][1].get<double>(), 0.25);

    FlatnessResult back = flatness_from_json(j);
    EXPECT_EQ(back.steps[0].p1, Vec2(2.0, 0.25));
}

TEST(ReportTest, Envelope) {
    json::Report report;
    report.kind = "flatness";
    report.data = {{"flatness", 0.5}};

    nlohmann::json j = report.to_json();
    EXPECT_EQ(j["format"].get<std::string>(), json::REPORT_FORMAT);
    EXPECT_EQ(j["kind"].get<std::string>(), "flatness");
    EXPECT_FALSE(j.contains("generated_at"));
    EXPECT_FALSE(j.contains("stats"));

    json::Report back = json::Report::from_json(j);
    EXPECT_EQ(back.version, json::REPORT_VERSION);
    EXPECT_EQ(back.kind, "flatness");
    EXPECT_DOUBLE_EQ(back.data["flatness"].get<double>(), 0.5);
}

TEST(ReportTest, RejectsForeignDocument) {
    nlohmann::json j = {{"kind", "flatness"}, {"data", nullptr}};
    EXPECT_THROW(json::Report::from_json(j), std::runtime_error);
    EXPECT_THROW(json::Report::from_json(nlohmann::json::array()), std::runtime_error);
}

TEST(ReportTest, ReadMissingFileThrows) {
    EXPECT_THROW(json::read_report("/nonexistent/report.json"), std::runtime_error);
}
