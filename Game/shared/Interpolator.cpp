#include "Interpolator.hpp"

#include <cmath>

namespace Spraynet {

Interpolator::Interpolator(bool is_angular, float initial)
    : angular(is_angular)
    , from_value(is_angular ? normalizeAngle(initial) : initial)
    , to_value(from_value)
{
}

void Interpolator::set(float value, double now)
{
    from_value = to_value;
    to_value = angular ? normalizeAngle(value) : value;
    set_time = now;
}

void Interpolator::reset(float value, double now)
{
    to_value = angular ? normalizeAngle(value) : value;
    from_value = to_value;
    set_time = now;
}

float Interpolator::get(double now, float interval) const
{
    float t = 1.0f;
    if (interval > 0.0f) {
        t = glm::clamp(static_cast<float>((now - set_time) / interval), 0.0f, 1.0f);
    }

    return angular ? lerpAngle(from_value, to_value, t) : glm::mix(from_value, to_value, t);
}

float Interpolator::lerpAngle(float from, float to, float t)
{
    float delta = std::fmod(to - from, 360.0f);
    if (delta < 0.0f) {
        delta += 360.0f;
    }
    if (delta > 180.0f) {
        delta -= 360.0f;
    }
    return normalizeAngle(from + delta * t);
}

float Interpolator::normalizeAngle(float degrees)
{
    float result = std::fmod(degrees, 360.0f);
    if (result < 0.0f) {
        result += 360.0f;
    }
    // fmod of a tiny negative value can round up to exactly 360
    return result >= 360.0f ? 0.0f : result;
}

Vector3Interpolator::Vector3Interpolator(bool angular)
    : x(angular), y(angular), z(angular)
{
}

void Vector3Interpolator::set(const glm::vec3& value, double now)
{
    x.set(value.x, now);
    y.set(value.y, now);
    z.set(value.z, now);
}

void Vector3Interpolator::reset(const glm::vec3& value, double now)
{
    x.reset(value.x, now);
    y.reset(value.y, now);
    z.reset(value.z, now);
}

glm::vec3 Vector3Interpolator::get(double now, float interval) const
{
    return glm::vec3(x.get(now, interval), y.get(now, interval), z.get(now, interval));
}

} // namespace Spraynet
