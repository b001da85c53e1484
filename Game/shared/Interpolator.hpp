#pragma once

#include <glm/glm.hpp>

namespace Spraynet {

// Smooths a value received at discrete times. set() shifts the previous target
// into "from"; get() blends from "from" to "to" over one replication interval.
class Interpolator
{
public:
    explicit Interpolator(bool angular = false, float initial = 0.0f);

    void set(float value, double now);

    // Snap both samples to value (no blending)
    void reset(float value, double now);

    // Linear blend, or shortest-arc blend in degrees for angular values.
    // Angular results are normalised to [0, 360).
    float get(double now, float interval) const;

    float from() const { return from_value; }
    float to() const { return to_value; }
    double lastSetTime() const { return set_time; }
    bool isAngular() const { return angular; }

    static float lerpAngle(float from, float to, float t);
    static float normalizeAngle(float degrees);

private:
    bool angular = false;
    float from_value = 0.0f;
    float to_value = 0.0f;
    double set_time = 0.0;
};

// Three interpolators driven together (position or euler rotation)
class Vector3Interpolator
{
public:
    explicit Vector3Interpolator(bool angular = false);

    void set(const glm::vec3& value, double now);
    void reset(const glm::vec3& value, double now);
    glm::vec3 get(double now, float interval) const;

    glm::vec3 from() const { return glm::vec3(x.from(), y.from(), z.from()); }
    glm::vec3 to() const { return glm::vec3(x.to(), y.to(), z.to()); }

private:
    Interpolator x;
    Interpolator y;
    Interpolator z;
};

} // namespace Spraynet
