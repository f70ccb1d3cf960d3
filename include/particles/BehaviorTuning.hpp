/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef BEHAVIOR_TUNING_HPP
#define BEHAVIOR_TUNING_HPP

namespace AuraEngine
{

// Length of one normalized frame; dt = elapsed ms / FRAME_MS
inline constexpr float FRAME_MS = 16.67f;

/**
 * Tuning for the drift family (ambient, resting, rising, falling)
 *
 * Speeds are px per normalized frame (16.67 ms), accelerations are px per
 * frame squared. Decay is the per-frame velocity retention factor.
 */
struct DriftTuning
{
    // ambient: slow outward drift with gentle wander
    float ambientSpeedMin = 0.2f;
    float ambientSpeedMax = 0.5f;
    float ambientWander = 0.01f;
    float ambientDecay = 0.995f;
    float ambientLifeDecayMin = 0.002f;
    float ambientLifeDecayMax = 0.004f;

    // resting: almost still
    float restingSpeedMin = 0.02f;
    float restingSpeedMax = 0.05f;
    float restingWander = 0.002f;
    float restingDecay = 0.98f;
    float restingLifeDecayMin = 0.001f;
    float restingLifeDecayMax = 0.002f;

    // rising / falling share the vertical model
    float verticalSpeedMin = 0.2f;
    float verticalSpeedMax = 0.5f;
    float lateralSpread = 0.2f;
    float verticalAcceleration = 0.02f;
    float verticalDecay = 0.99f;
    float verticalLifeDecayMin = 0.003f;
    float verticalLifeDecayMax = 0.006f;
};

/**
 * Tuning for the radial family (burst, scattering, repelling)
 */
struct RadialTuning
{
    float burstSpeedMin = 3.0f;
    float burstSpeedMax = 6.0f;
    float burstDecay = 0.94f;
    float burstLifeDecayMin = 0.015f;
    float burstLifeDecayMax = 0.025f;

    float scatterSpeedMin = 1.0f;
    float scatterSpeedMax = 2.0f;
    float scatterAcceleration = 0.05f;
    float scatterDecay = 0.97f;
    float scatterLifeDecay = 0.01f;

    float repelSpeedMin = 0.5f;
    float repelSpeedMax = 1.5f;
    float repelAcceleration = 0.08f;
    float repelDecay = 0.96f;
    float repelLifeDecay = 0.008f;
};

/**
 * Tuning for orbiting and meditation swirl
 *
 * Smoothing is the fraction of the distance to the orbit point covered per
 * frame; it is converted to an exponential approach factor for any dt.
 */
struct OrbitalTuning
{
    float orbitSpeedMin = 0.01f;                  // radians per frame
    float orbitSpeedMax = 0.03f;
    float orbitMinRadius = 20.0f;
    float orbitSmoothing = 0.1f;
    float orbitDecay = 0.99f;
    float orbitLifeDecayMin = 0.002f;
    float orbitLifeDecayMax = 0.004f;

    float swirlRadiusMin = 40.0f;
    float swirlRadiusMax = 90.0f;
    float swirlSpeedMin = 0.015f;
    float swirlSpeedMax = 0.03f;
    float swirlBreathRate = 0.02f;                // breath phase per frame
    float swirlBreathDepth = 0.15f;               // radius fraction
    float swirlSmoothing = 0.06f;
    float swirlDecay = 0.99f;
    float swirlLifeDecay = 0.0015f;
};

/**
 * Tuning for the chaotic family (aggressive, spaz, glitchy)
 *
 * Glitchy timers are milliseconds.
 */
struct ChaoticTuning
{
    float aggressiveSpeedMin = 1.0f;
    float aggressiveSpeedMax = 3.0f;
    float aggressiveJitter = 0.6f;
    float aggressiveDecay = 0.92f;
    float aggressiveLifeDecayMin = 0.01f;
    float aggressiveLifeDecayMax = 0.02f;

    float spazSpeedMin = 2.0f;
    float spazSpeedMax = 4.0f;
    float spazJitter = 1.2f;
    float spazFlipChance = 0.1f;                  // per frame
    float spazDecay = 0.9f;
    float spazLifeDecayMin = 0.012f;
    float spazLifeDecayMax = 0.024f;

    float glitchOrbitRadiusMin = 30.0f;
    float glitchOrbitRadiusMax = 70.0f;
    float glitchOrbitSpeedMin = 0.01f;
    float glitchOrbitSpeedMax = 0.03f;
    float glitchSmoothing = 0.08f;
    float glitchSmoothingActive = 0.05f;          // while a glitch is running
    float glitchOffsetRange = 30.0f;
    float glitchJumpRange = 20.0f;
    float glitchJumpChance = 0.3f;
    float glitchDecay = 0.98f;
    float glitchLifeDecay = 0.0015f;
};

} // namespace AuraEngine

#endif // BEHAVIOR_TUNING_HPP
