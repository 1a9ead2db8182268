#pragma once

#include <cstddef>
#include <cstdint>

// Centralized defaults for the orbit view. Scenario files may override most of these.

// Physics meters -> scene units. Distances of order 1e11 m land on single-digit scene units.
inline constexpr double kDefaultSceneScaleFactor = 1.0 / 1e11;

// Real seconds between two physics steps (independent of render framerate).
inline constexpr double kDefaultPhysicsIntervalSeconds = 0.5;

// Trails are sampled once every N rendered frames.
inline constexpr uint32_t kDefaultTrailEveryNFrames = 5;

// Points kept per trail ring.
inline constexpr std::size_t kDefaultTrailCapacity = 200;
// Upper bound accepted from scenario files.
inline constexpr std::size_t kMaxTrailCapacity = 100'000;

// Simulated seconds per physics step (10 days).
inline constexpr double kSecondsPerDay = 86'400.0;
inline constexpr double kDefaultPhysicsDtSeconds = kSecondsPerDay * 10.0;

inline constexpr double kMetersPerAU = 1.496e11;
inline constexpr double kMetersPerKilometer = 1000.0;

// Gravitational constant (m^3 kg^-1 s^-2) and softening to keep close passes finite.
inline constexpr double kGravitationalConstant = 6.67430e-11;
inline constexpr double kSofteningLengthSquared = 1e-9;

// Headless host defaults
inline constexpr double kDefaultTargetFps = 60.0;
inline constexpr uint64_t kDefaultSummaryEveryNFrames = 120;

// Display scale policy: sizes relative to a reference planet, stars compressed for viewing.
inline constexpr float kDefaultReferenceScale = 0.1f;
inline constexpr double kDefaultStarCompression = 0.01;

// Text targets the info panel publishes to.
inline constexpr const char *kDistanceTarget = "distance";
inline constexpr const char *kVelocityTarget = "velocity";
inline constexpr const char *kSimTimeTarget = "sim-time";

inline constexpr int kScenarioSchemaVersion = 1;
