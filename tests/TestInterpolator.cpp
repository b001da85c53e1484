#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "Interpolator.hpp"

namespace Spraynet {

using Catch::Matchers::WithinAbs;

constexpr float INTERVAL = 1.0f / 16.0f;

TEST_CASE("Interpolator returns from at set time and to one interval later", "[interpolator]")
{
    Interpolator lerp;
    lerp.reset(2.0f, 0.0);
    lerp.set(10.0f, 1.0);

    REQUIRE_THAT(lerp.get(1.0, INTERVAL), WithinAbs(2.0f, 1e-5));
    REQUIRE_THAT(lerp.get(1.0 + INTERVAL / 2.0, INTERVAL), WithinAbs(6.0f, 1e-4));
    REQUIRE_THAT(lerp.get(1.0 + INTERVAL, INTERVAL), WithinAbs(10.0f, 1e-5));
}

TEST_CASE("Interpolator holds the target after the interval", "[interpolator]")
{
    Interpolator lerp;
    lerp.reset(0.0f, 0.0);
    lerp.set(4.0f, 0.0);
    REQUIRE_THAT(lerp.get(5.0, INTERVAL), WithinAbs(4.0f, 1e-5));
}

TEST_CASE("set shifts the previous target into from", "[interpolator]")
{
    Interpolator lerp;
    lerp.reset(1.0f, 0.0);
    lerp.set(2.0f, 0.1);
    lerp.set(3.0f, 0.2);

    REQUIRE(lerp.from() == 2.0f);
    REQUIRE(lerp.to() == 3.0f);
    REQUIRE(lerp.lastSetTime() == 0.2);
}

TEST_CASE("Angular interpolation takes the short way across 0", "[interpolator]")
{
    Interpolator angle(true);
    angle.reset(350.0f, 0.0);
    angle.set(10.0f, 0.0);

    float halfway = angle.get(INTERVAL / 2.0, INTERVAL);
    REQUIRE((halfway < 1e-3f || halfway > 359.999f));

    float quarter = angle.get(INTERVAL / 4.0, INTERVAL);
    REQUIRE_THAT(quarter, WithinAbs(355.0f, 1e-3));

    REQUIRE_THAT(angle.get(INTERVAL, INTERVAL), WithinAbs(10.0f, 1e-3));
}

TEST_CASE("lerpAngle never passes through the opposite side", "[interpolator]")
{
    for (int step = 0; step <= 10; ++step) {
        float value = Interpolator::lerpAngle(350.0f, 10.0f, step / 10.0f);
        REQUIRE((value >= 350.0f || value <= 10.0f));
    }
    REQUIRE_THAT(Interpolator::lerpAngle(10.0f, 350.0f, 0.5f), WithinAbs(0.0f, 1e-3));
    REQUIRE_THAT(Interpolator::normalizeAngle(-90.0f), WithinAbs(270.0f, 1e-4));
}

TEST_CASE("Vector3Interpolator blends every axis", "[interpolator]")
{
    Vector3Interpolator position;
    position.reset(glm::vec3(0.0f), 0.0);
    position.set(glm::vec3(2.0f, 4.0f, -8.0f), 0.0);

    glm::vec3 mid = position.get(INTERVAL / 2.0, INTERVAL);
    REQUIRE_THAT(mid.x, WithinAbs(1.0f, 1e-4));
    REQUIRE_THAT(mid.y, WithinAbs(2.0f, 1e-4));
    REQUIRE_THAT(mid.z, WithinAbs(-4.0f, 1e-4));
}

} // namespace Spraynet
