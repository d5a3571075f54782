#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "config.h"

#include <cstdio>
#include <filesystem>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string &content)
    {
        path = std::filesystem::temp_directory_path() / "menusim_test_config_XXXXXX";
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        if (fd >= 0)
        {
            const ssize_t written = ::write(fd, content.data(), content.size());
            (void)written;
            ::close(fd);
        }
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("GameConfig", "[config]") {

    SECTION("DefaultValues") {
        GameConfig cfg;
        REQUIRE(cfg.display.width == 1920);
        REQUIRE(cfg.display.height == 1080);
        REQUIRE(cfg.progress.max == Catch::Approx(100.0f));
        REQUIRE(cfg.schedulers.email.minSeconds == Catch::Approx(10.0f));
        REQUIRE(cfg.schedulers.activity.maxSeconds == Catch::Approx(15.0f));
        REQUIRE(cfg.progress.milestones.size() == 5);
    }

    SECTION("MissingFileKeepsDefaults") {
        GameConfig cfg = GameConfig::Load("/nonexistent/menusim.json");
        REQUIRE(cfg.display.fps == 60);
        REQUIRE(cfg.content.emailsPath == "data/emails.json");
    }

    SECTION("PartialFileOverridesOnlyGivenKeys") {
        TmpFile f(R"({
            "display": {"width": 1280},
            "progress": {"auto_rate": 0.5, "milestones": [50]},
            "schedulers": {"phone": {"min": 5, "max": 6}}
        })");
        GameConfig cfg = GameConfig::Load(f.path);
        REQUIRE(cfg.display.width == 1280);
        REQUIRE(cfg.display.height == 1080);
        REQUIRE(cfg.progress.autoRate == Catch::Approx(0.5f));
        REQUIRE(cfg.progress.milestones == std::vector<float>{50.0f});
        REQUIRE(cfg.schedulers.phone.minSeconds == Catch::Approx(5.0f));
        REQUIRE(cfg.schedulers.phone.maxSeconds == Catch::Approx(6.0f));
        REQUIRE(cfg.schedulers.email.minSeconds == Catch::Approx(10.0f));
    }

    SECTION("InvertedIntervalCollapsesToMin") {
        TmpFile f(R"({"schedulers": {"chat": {"min": 8, "max": 2}}})");
        GameConfig cfg = GameConfig::Load(f.path);
        REQUIRE(cfg.schedulers.chat.minSeconds == Catch::Approx(8.0f));
        REQUIRE(cfg.schedulers.chat.maxSeconds == Catch::Approx(8.0f));
    }

    SECTION("MalformedFileFallsBackToDefaults") {
        TmpFile f("{ not json");
        GameConfig cfg = GameConfig::Load(f.path);
        REQUIRE(cfg.display.width == 1920);
    }

    SECTION("TypeErrorFallsBackToDefaults") {
        TmpFile f(R"({"display": {"width": 1280, "height": "tall"}})");
        GameConfig cfg = GameConfig::Load(f.path);
        REQUIRE(cfg.display.width == 1920);
    }

    SECTION("NonPositiveMaxIsRejected") {
        TmpFile f(R"({"progress": {"max": 0}})");
        GameConfig cfg = GameConfig::Load(f.path);
        REQUIRE(cfg.progress.max == Catch::Approx(100.0f));
    }
}
