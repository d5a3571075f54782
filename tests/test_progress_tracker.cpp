#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "progress_tracker.h"

#include <vector>

TEST_CASE("ProgressTracker", "[progress]") {
    ProgressTracker progress(100.0f);
    std::vector<float> fired;
    for (float threshold : {25.0f, 50.0f, 100.0f})
    {
        progress.OnThresholdCrossed(threshold, [&fired](float t) { fired.push_back(t); });
    }

    SECTION("AddClampsAtMax") {
        REQUIRE(progress.Add(95.0f) == Catch::Approx(95.0f));
        REQUIRE(progress.Add(10.0f) == Catch::Approx(5.0f));
        REQUIRE(progress.Value() == Catch::Approx(100.0f));
        REQUIRE(progress.Complete());
        REQUIRE(progress.Fraction() == Catch::Approx(1.0f));
    }

    SECTION("CompleteIsTerminal") {
        progress.Add(200.0f);
        REQUIRE(progress.Add(1.0f) == 0.0f);
        REQUIRE(progress.Value() == Catch::Approx(100.0f));
    }

    SECTION("NonPositiveAmountsAreIgnored") {
        progress.Add(10.0f);
        REQUIRE(progress.Add(0.0f) == 0.0f);
        REQUIRE(progress.Add(-5.0f) == 0.0f);
        REQUIRE(progress.Value() == Catch::Approx(10.0f));
    }

    SECTION("MilestonesFireOnceInOrder") {
        progress.Add(30.0f);
        progress.Add(1.0f);
        REQUIRE(fired == std::vector<float>{25.0f});

        progress.Add(80.0f);
        REQUIRE(fired == std::vector<float>{25.0f, 50.0f, 100.0f});

        progress.Add(5.0f);
        REQUIRE(fired.size() == 3);
    }

    SECTION("ExactThresholdFires") {
        progress.Add(50.0f);
        REQUIRE(fired == std::vector<float>{25.0f, 50.0f});
    }

    SECTION("InvalidMaxFallsBack") {
        ProgressTracker broken(0.0f);
        REQUIRE(broken.Max() == Catch::Approx(100.0f));
    }
}
