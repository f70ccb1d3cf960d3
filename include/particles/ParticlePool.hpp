/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PARTICLE_POOL_HPP
#define PARTICLE_POOL_HPP

/**
 * @file ParticlePool.hpp
 * @brief Slot arena with a bounded index freelist for particle reuse
 *
 * Every particle lives in a slot of the arena. A slot is in exactly one of
 * three states:
 * - Active: handed out by acquire(), owned by the caller's active list
 * - Pooled: on the freelist, ready for reuse (a pool hit)
 * - Vacant: discarded storage, rebuilt from scratch on the next miss
 *
 * Handles carry a generation counter that changes on release, so a handle
 * kept past release() no longer resolves.
 */

#include "particles/Particle.hpp"
#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

namespace AuraEngine {

struct ParticleHandle {
  static constexpr uint32_t INVALID_INDEX = std::numeric_limits<uint32_t>::max();

  uint32_t index{INVALID_INDEX};
  uint32_t generation{0};

  bool isValid() const { return index != INVALID_INDEX; }
  bool operator==(const ParticleHandle &other) const = default;
};

struct PoolStats {
  size_t poolSize{0};
  uint64_t poolHits{0};
  uint64_t poolMisses{0};
  uint64_t totalCreated{0};
  uint64_t totalDestroyed{0};
};

class ParticlePool {
public:
  /**
   * @param capacity Maximum number of particles kept on the freelist
   */
  explicit ParticlePool(size_t capacity);

  /**
   * @brief Hands out a particle reinitialized at (x, y)
   * Reuses a pooled slot when one exists (hit), otherwise builds a new
   * particle (miss). The particle always comes back with empty behavior state
   * and cleared render caches.
   */
  ParticleHandle acquire(float x, float y, BehaviorType behavior,
                         float scaleFactor = 1.0f, float sizeMultiplier = 1.0f);

  /**
   * @brief Returns an active particle to the pool
   * The slot joins the freelist while it is below capacity, otherwise it is
   * discarded. Stale or already-released handles are ignored.
   * @return true if the handle referred to an active particle
   */
  bool release(ParticleHandle handle);

  // Pointers stay valid until the next acquire()
  Particle *get(ParticleHandle handle);
  const Particle *get(ParticleHandle handle) const;

  bool isActive(ParticleHandle handle) const;
  bool isPooled(uint32_t slotIndex) const;

  /**
   * @brief Discards freelist entries beyond capacity
   * @return Number of slots discarded
   */
  size_t trim();

  /**
   * @brief Empties the freelist and resets all statistics
   * Active particles are unaffected.
   */
  void clear();

  void resetHitCounters() {
    m_poolHits = 0;
    m_poolMisses = 0;
  }

  void setCapacity(size_t capacity);
  size_t getCapacity() const { return m_capacity; }
  void reserve(size_t slotCount) { m_slots.reserve(slotCount); }

  size_t size() const { return m_freeList.size(); }
  bool empty() const { return m_freeList.empty(); }
  size_t getSlotCount() const { return m_slots.size(); }
  size_t getActiveCount() const { return m_activeCount; }

  uint64_t getPoolHits() const { return m_poolHits; }
  uint64_t getPoolMisses() const { return m_poolMisses; }
  uint64_t getTotalCreated() const { return m_totalCreated; }
  uint64_t getTotalDestroyed() const { return m_totalDestroyed; }

  PoolStats getStats() const;

private:
  enum class SlotState : uint8_t { Vacant, Active, Pooled };

  struct Slot {
    Particle particle;
    uint32_t generation{0};
    SlotState state{SlotState::Vacant};
  };

  void discardSlot(uint32_t index);

  std::vector<Slot> m_slots;
  std::vector<uint32_t> m_freeList; // pooled slots, LIFO
  std::vector<uint32_t> m_vacant;   // discarded slots awaiting a miss
  size_t m_capacity{0};
  size_t m_activeCount{0};

  uint64_t m_poolHits{0};
  uint64_t m_poolMisses{0};
  uint64_t m_totalCreated{0};
  uint64_t m_totalDestroyed{0};
};

} // namespace AuraEngine

#endif // PARTICLE_POOL_HPP
