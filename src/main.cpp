/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/Logger.hpp"
#include "particles/ParticleRenderer.hpp"
#include "particles/ParticleSystem.hpp"
#include "particles/SdlDrawingSurface.hpp"
#include <SDL3/SDL.h>
#include <algorithm>
#include <format>

using namespace AuraEngine;

namespace {

const int WINDOW_WIDTH{800};
const int WINDOW_HEIGHT{600};

// Number keys 1-9, 0, minus, equals select the behavior in enum order
BehaviorType behaviorForKey(SDL_Keycode key, BehaviorType current) {
  if (key >= SDLK_1 && key <= SDLK_9) {
    return static_cast<BehaviorType>(key - SDLK_1);
  }
  switch (key) {
  case SDLK_0:
    return BehaviorType::Spaz;
  case SDLK_MINUS:
    return BehaviorType::Resting;
  case SDLK_EQUALS:
    return BehaviorType::MeditationSwirl;
  default:
    return current;
  }
}

} // namespace

int main(int argc, char *argv[]) {
  (void)argc;
  (void)argv;

  if (!SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS)) {
    AURA_CRITICAL("AuraDemo", std::format("SDL could not initialize: {}", SDL_GetError()));
    return 1;
  }

  SDL_Window *window = SDL_CreateWindow("Aura Particles", WINDOW_WIDTH, WINDOW_HEIGHT, 0);
  if (!window) {
    AURA_CRITICAL("AuraDemo", std::format("Window could not be created: {}", SDL_GetError()));
    SDL_Quit();
    return 1;
  }

  SDL_Renderer *renderer = SDL_CreateRenderer(window, nullptr);
  if (!renderer) {
    AURA_CRITICAL("AuraDemo", std::format("Renderer could not be created: {}", SDL_GetError()));
    SDL_DestroyWindow(window);
    SDL_Quit();
    return 1;
  }

  {
    ParticleSystemConfig config;
    config.maxParticles = 120;
    config.surfaceWidth = static_cast<float>(WINDOW_WIDTH);
    config.surfaceHeight = static_cast<float>(WINDOW_HEIGHT);
    ParticleSystem system(config);
    ParticleRenderer particleRenderer;
    SdlDrawingSurface surface(renderer);

    EmotionProfile emotion;
    emotion.name = "joy";
    emotion.primaryColor = 0xFFD166FF;
    emotion.particleRate = 12.0f;
    emotion.palette = EmotionPalette{{0xFFD166FF, 3.0f}, {0xFF9F1CFF, 1.0f}, {0xFFFFFFFF, 0.5f}};

    const float originX = WINDOW_WIDTH * 0.5f;
    const float originY = WINDOW_HEIGHT * 0.5f;
    system.setAttractor(originX, originY);

    GestureTransform glow;
    glow.glowEffect = true;
    bool glowActive = false;
    float glowSeconds = 0.0f;
    constexpr float GLOW_DURATION = 1.5f;

    Uint64 lastTicks = SDL_GetTicks();
    bool quit = false;
    SDL_Event event;

    while (!quit) {
      while (SDL_PollEvent(&event)) {
        if (event.type == SDL_EVENT_QUIT) {
          quit = true;
        } else if (event.type == SDL_EVENT_KEY_DOWN) {
          const SDL_Keycode key = event.key.key;
          if (key == SDLK_ESCAPE) {
            quit = true;
          } else if (key == SDLK_SPACE) {
            system.burst(20, emotion.particleBehavior, originX, originY);
          } else if (key == SDLK_G) {
            glowActive = true;
            glowSeconds = 0.0f;
          } else if (key == SDLK_C) {
            system.clear();
          } else {
            const BehaviorType selected = behaviorForKey(key, emotion.particleBehavior);
            if (selected != emotion.particleBehavior) {
              emotion.particleBehavior = selected;
              AURA_INFO("AuraDemo",
                        std::format("Behavior: {}", behaviorTypeToString(selected)));
            }
          }
        }
      }

      const Uint64 now = SDL_GetTicks();
      const float dtMs = static_cast<float>(now - lastTicks);
      lastTicks = now;

      system.spawnForEmotion(emotion, originX, originY, dtMs);
      system.update(dtMs, originX, originY);

      const GestureTransform *transform = nullptr;
      if (glowActive) {
        glowSeconds += dtMs / 1000.0f;
        glow.time = glowSeconds;
        glow.progress = glowSeconds / GLOW_DURATION;
        glow.glowProgress = glow.progress;
        glowActive = glow.progress < 1.0f;
        transform = &glow;
      }

      SDL_SetRenderDrawColor(renderer, 12, 10, 24, 255);
      SDL_RenderClear(renderer);

      particleRenderer.renderBackground(system, surface, transform);

      // Core orb between the two particle layers
      surface.setFillStyle(emotion.primaryColor);
      surface.setGlobalAlpha(0.9f);
      surface.beginPath();
      surface.arc(originX, originY, std::min(WINDOW_WIDTH, WINDOW_HEIGHT) / 12.0f);
      surface.fill();

      particleRenderer.renderForeground(system, surface, transform);
      surface.flush();

      SDL_RenderPresent(renderer);
      SDL_Delay(16);
    }
  }

  SDL_DestroyRenderer(renderer);
  SDL_DestroyWindow(window);
  SDL_Quit();

  return 0;
}
