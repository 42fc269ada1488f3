#include <gtest/gtest.h>

#include "mdlive/options.hpp"
#include "mdlive/preview_options.hpp"

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>

namespace
{

std::filesystem::path makeTempFilePath()
{
    auto base = std::filesystem::temp_directory_path();
    std::random_device rd;
    std::mt19937_64 rng(rd());
    std::uniform_int_distribution<std::uint64_t> dist;
    for (int attempt = 0; attempt < 8; ++attempt)
    {
        auto candidate = base / ("mdlive_options_test_" + std::to_string(dist(rng)) + ".json");
        if (!std::filesystem::exists(candidate))
            return candidate;
    }
    return base / "mdlive_options_test.json";
}

} // namespace

TEST(OptionRegistry, RegistersAndReadsDefaults)
{
    mdlive::config::OptionRegistry registry("test-app");
    mdlive::config::OptionDefinition def{"featureEnabled", mdlive::config::OptionKind::Boolean,
                                         mdlive::config::OptionValue(true), "Feature Enabled",
                                         "Enables a feature for testing."};
    registry.registerOption(def);

    EXPECT_TRUE(registry.hasOption("featureEnabled"));
    EXPECT_TRUE(registry.getBool("featureEnabled"));

    registry.set("featureEnabled", mdlive::config::OptionValue(false));
    EXPECT_FALSE(registry.getBool("featureEnabled"));
    registry.reset("featureEnabled");
    EXPECT_TRUE(registry.getBool("featureEnabled"));
}

TEST(OptionRegistry, NormalizesValuesToDefinitionTypes)
{
    mdlive::config::OptionRegistry registry("test-app");
    registry.registerOption({"threshold", mdlive::config::OptionKind::Integer,
                             mdlive::config::OptionValue(std::int64_t{10}), "Threshold", "Integer threshold"});
    registry.registerOption({"ignored", mdlive::config::OptionKind::Boolean, mdlive::config::OptionValue(false),
                             "Ignored", "Boolean flag"});

    registry.set("threshold", mdlive::config::OptionValue(std::string("42")));
    registry.set("ignored", mdlive::config::OptionValue(std::string("yes")));

    EXPECT_EQ(registry.getInteger("threshold"), 42);
    EXPECT_TRUE(registry.getBool("ignored"));
}

TEST(OptionRegistry, UnknownKeysAreRejected)
{
    mdlive::config::OptionRegistry registry("test-app");
    EXPECT_FALSE(registry.set("missing", mdlive::config::OptionValue(1)));
    EXPECT_FALSE(registry.hasOption("missing"));
    EXPECT_TRUE(registry.get("missing").isNull());
}

TEST(OptionRegistry, ClampsIntegersIntoRange)
{
    mdlive::config::OptionRegistry registry("test-app");
    mdlive::config::OptionDefinition def;
    def.key = "buffer";
    def.kind = mdlive::config::OptionKind::Integer;
    def.defaultValue = mdlive::config::OptionValue(10);
    def.minimum = 0;
    def.maximum = 500;
    registry.registerOption(def);

    registry.set("buffer", mdlive::config::OptionValue(-4));
    EXPECT_EQ(registry.getInteger("buffer"), 0);
    registry.set("buffer", mdlive::config::OptionValue(9000));
    EXPECT_EQ(registry.getInteger("buffer"), 500);
}

TEST(OptionRegistry, StringOutsideChoicesFallsBackToDefault)
{
    mdlive::config::OptionRegistry registry("test-app");
    mdlive::config::OptionDefinition def;
    def.key = "mode";
    def.kind = mdlive::config::OptionKind::String;
    def.defaultValue = mdlive::config::OptionValue("fast");
    def.choices = {"fast", "slow"};
    registry.registerOption(def);

    registry.set("mode", mdlive::config::OptionValue("slow"));
    EXPECT_EQ(registry.getString("mode"), "slow");
    registry.set("mode", mdlive::config::OptionValue("sideways"));
    EXPECT_EQ(registry.getString("mode"), "fast");
}

TEST(OptionRegistry, PersistsValuesToDisk)
{
    auto declare = [](mdlive::config::OptionRegistry &registry) {
        registry.registerOption({"theme", mdlive::config::OptionKind::String, mdlive::config::OptionValue("light"),
                                 "Theme", "Colour theme"});
        registry.registerOption({"width", mdlive::config::OptionKind::Integer, mdlive::config::OptionValue(80),
                                 "Width", "Render width"});
    };

    mdlive::config::OptionRegistry registry("test-app");
    declare(registry);
    registry.set("theme", mdlive::config::OptionValue("dark"));

    const auto filePath = makeTempFilePath();
    ASSERT_TRUE(registry.saveToFile(filePath));

    mdlive::config::OptionRegistry loaded("test-app");
    declare(loaded);
    loaded.set("width", mdlive::config::OptionValue(120));
    ASSERT_TRUE(loaded.loadFromFile(filePath));

    EXPECT_EQ(loaded.getString("theme"), "dark");
    EXPECT_EQ(loaded.getInteger("width"), 80);

    std::error_code ec;
    std::filesystem::remove(filePath, ec);
}

TEST(OptionRegistry, DefaultsLiveUnderXdgConfigHome)
{
    const auto root = makeTempFilePath().replace_extension();
    const char *previous = std::getenv("XDG_CONFIG_HOME");
    std::string saved = previous ? previous : "";
    ::setenv("XDG_CONFIG_HOME", root.c_str(), 1);

    mdlive::config::OptionRegistry registry("test-app");
    mdlive::config::registerPreviewOptions(registry);
    EXPECT_EQ(registry.defaultOptionsPath(), root / "test-app" / "options.json");
    EXPECT_FALSE(registry.loadDefaults());

    registry.set(mdlive::config::kViewportBuffer, mdlive::config::OptionValue(7));
    ASSERT_TRUE(registry.saveToFile(registry.defaultOptionsPath()));

    mdlive::config::OptionRegistry loaded("test-app");
    mdlive::config::registerPreviewOptions(loaded);
    EXPECT_TRUE(loaded.loadDefaults());
    EXPECT_EQ(loaded.getInteger(mdlive::config::kViewportBuffer), 7);

    if (previous)
        ::setenv("XDG_CONFIG_HOME", saved.c_str(), 1);
    else
        ::unsetenv("XDG_CONFIG_HOME");
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
}

TEST(OptionRegistry, MalformedFileIsNotLoaded)
{
    const auto filePath = makeTempFilePath();
    {
        std::ofstream out(filePath);
        out << "{ not json";
    }

    mdlive::config::OptionRegistry registry("test-app");
    EXPECT_FALSE(registry.loadFromFile(filePath));
    EXPECT_FALSE(registry.loadFromFile(filePath.string() + ".missing"));

    std::error_code ec;
    std::filesystem::remove(filePath, ec);
}

TEST(PreviewOptions, DefaultsMatchEngineDefaults)
{
    mdlive::config::OptionRegistry registry("test-app");
    mdlive::config::registerPreviewOptions(registry);

    mdlive::preview::EngineOptions defaults;
    mdlive::preview::EngineOptions options = mdlive::config::engineOptions(registry);
    EXPECT_EQ(options.lineCacheSize, defaults.lineCacheSize);
    EXPECT_EQ(options.viewportOnly, defaults.viewportOnly);
    EXPECT_EQ(options.viewportBuffer, defaults.viewportBuffer);
    EXPECT_EQ(options.largeDocumentThreshold, defaults.largeDocumentThreshold);
    EXPECT_EQ(mdlive::config::logLevel(registry), "warning");
}

TEST(PreviewOptions, ReadsOverridesFromFile)
{
    const auto filePath = makeTempFilePath();
    {
        mdlive::config::OptionRegistry writer("test-app");
        mdlive::config::registerPreviewOptions(writer);
        writer.set(mdlive::config::kViewportOnly, mdlive::config::OptionValue(true));
        writer.set(mdlive::config::kViewportBuffer, mdlive::config::OptionValue(25));
        writer.set(mdlive::config::kLineCacheSize, mdlive::config::OptionValue(0));
        writer.set(mdlive::config::kLogLevel, mdlive::config::OptionValue("debug"));
        ASSERT_TRUE(writer.saveToFile(filePath));
    }

    mdlive::config::OptionRegistry registry("test-app");
    mdlive::config::registerPreviewOptions(registry);
    ASSERT_TRUE(registry.loadFromFile(filePath));

    mdlive::preview::EngineOptions options = mdlive::config::engineOptions(registry);
    EXPECT_TRUE(options.viewportOnly);
    EXPECT_EQ(options.viewportBuffer, 25);
    EXPECT_EQ(options.lineCacheSize, 1u);
    EXPECT_EQ(mdlive::config::logLevel(registry), "debug");

    std::error_code ec;
    std::filesystem::remove(filePath, ec);
}
