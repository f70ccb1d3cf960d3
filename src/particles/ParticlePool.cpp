/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "particles/ParticlePool.hpp"
#include "core/Logger.hpp"
#include <format>

namespace AuraEngine {

ParticlePool::ParticlePool(size_t capacity) : m_capacity(capacity) {
  m_freeList.reserve(capacity);
}

ParticleHandle ParticlePool::acquire(float x, float y, BehaviorType behavior,
                                     float scaleFactor, float sizeMultiplier) {
  uint32_t index;

  if (!m_freeList.empty()) {
    index = m_freeList.back();
    m_freeList.pop_back();
    ++m_poolHits;
  } else {
    if (!m_vacant.empty()) {
      index = m_vacant.back();
      m_vacant.pop_back();
      m_slots[index].particle = Particle{};
    } else {
      index = static_cast<uint32_t>(m_slots.size());
      m_slots.emplace_back();
    }
    ++m_poolMisses;
    ++m_totalCreated;
  }

  Slot &slot = m_slots[index];
  slot.state = SlotState::Active;
  slot.particle.reset(x, y, behavior, scaleFactor, sizeMultiplier);
  ++m_activeCount;

  return ParticleHandle{index, slot.generation};
}

bool ParticlePool::release(ParticleHandle handle) {
  if (!isActive(handle)) {
    return false;
  }

  Slot &slot = m_slots[handle.index];
  slot.particle.clearTransient();
  ++slot.generation;
  --m_activeCount;

  if (m_freeList.size() < m_capacity) {
    slot.state = SlotState::Pooled;
    m_freeList.push_back(handle.index);
  } else {
    discardSlot(handle.index);
  }
  return true;
}

Particle *ParticlePool::get(ParticleHandle handle) {
  return isActive(handle) ? &m_slots[handle.index].particle : nullptr;
}

const Particle *ParticlePool::get(ParticleHandle handle) const {
  return isActive(handle) ? &m_slots[handle.index].particle : nullptr;
}

bool ParticlePool::isActive(ParticleHandle handle) const {
  if (!handle.isValid() || handle.index >= m_slots.size()) {
    return false;
  }
  const Slot &slot = m_slots[handle.index];
  return slot.state == SlotState::Active && slot.generation == handle.generation;
}

bool ParticlePool::isPooled(uint32_t slotIndex) const {
  return slotIndex < m_slots.size() &&
         m_slots[slotIndex].state == SlotState::Pooled;
}

size_t ParticlePool::trim() {
  size_t discarded = 0;
  while (m_freeList.size() > m_capacity) {
    const uint32_t index = m_freeList.back();
    m_freeList.pop_back();
    discardSlot(index);
    ++discarded;
  }

  if (discarded > 0) {
    POOL_DEBUG(std::format("Trimmed {} pooled particles (capacity {})",
                           discarded, m_capacity));
  }
  return discarded;
}

void ParticlePool::clear() {
  for (uint32_t index : m_freeList) {
    m_slots[index].state = SlotState::Vacant;
    m_vacant.push_back(index);
  }
  m_freeList.clear();

  m_poolHits = 0;
  m_poolMisses = 0;
  m_totalCreated = 0;
  m_totalDestroyed = 0;
}

void ParticlePool::setCapacity(size_t capacity) {
  m_capacity = capacity;
  trim();
}

PoolStats ParticlePool::getStats() const {
  return PoolStats{m_freeList.size(), m_poolHits, m_poolMisses, m_totalCreated,
                   m_totalDestroyed};
}

void ParticlePool::discardSlot(uint32_t index) {
  Slot &slot = m_slots[index];
  slot.state = SlotState::Vacant;
  slot.particle.clearTransient();
  m_vacant.push_back(index);
  ++m_totalDestroyed;
}

} // namespace AuraEngine
