/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE LoggerTest
#include <boost/test/unit_test.hpp>

#include "core/Logger.hpp"
#include "particles/ParticleSystem.hpp"
#include <stdexcept>
#include <string>
#include <vector>

using namespace AuraEngine;

struct LogRecord {
  LogLevel level;
  std::string system;
  std::string message;
};

// Captures records through the diagnostic sink
struct LoggerFixture {
  LoggerFixture() {
    AURA_DISABLE_BENCHMARK_MODE();
    Logger::SetSink([this](LogLevel level, const char *system, const std::string &message) {
      records.push_back(LogRecord{level, system, message});
    });
  }

  ~LoggerFixture() {
    Logger::ClearSink();
    AURA_DISABLE_BENCHMARK_MODE();
  }

  std::vector<LogRecord> records;
};

BOOST_FIXTURE_TEST_CASE(TestErrorReachesSink, LoggerFixture) {
  PARTICLE_ERROR("pool exhausted");

  BOOST_REQUIRE_EQUAL(records.size(), 1u);
  BOOST_CHECK(records[0].level == LogLevel::ERROR_LEVEL);
  BOOST_CHECK_EQUAL(records[0].system, "ParticleSystem");
  BOOST_CHECK_EQUAL(records[0].message, "pool exhausted");
}

BOOST_FIXTURE_TEST_CASE(TestBenchmarkModeSilencesLog, LoggerFixture) {
  AURA_ENABLE_BENCHMARK_MODE();
  BOOST_CHECK(Logger::IsBenchmarkMode());
  RENDERER_ERROR("should not appear");
  AURA_CRITICAL("Test", "nor this");
  BOOST_CHECK(records.empty());

  AURA_DISABLE_BENCHMARK_MODE();
  RENDERER_CRITICAL("visible");
  BOOST_REQUIRE_EQUAL(records.size(), 1u);
  BOOST_CHECK_EQUAL(records[0].system, "ParticleRenderer");
}

BOOST_FIXTURE_TEST_CASE(TestClearSinkStopsDelivery, LoggerFixture) {
  Logger::ClearSink();
  POOL_ERROR("dropped");
  BOOST_CHECK(records.empty());
}

// Test that a sink may log and replace itself without blocking
BOOST_FIXTURE_TEST_CASE(TestSinkMayLogAndClearItself, LoggerFixture) {
  Logger::SetSink([this](LogLevel level, const char *system, const std::string &message) {
    records.push_back(LogRecord{level, system, message});
    AURA_INFO("Forwarder", "forwarded");
    AURA_ERROR("Forwarder", "forwarded");
    Logger::ClearSink();
  });

  PARTICLE_ERROR("hello");
  PARTICLE_ERROR("after clear");

  // Records the sink emits are not fed back into it
  BOOST_REQUIRE_EQUAL(records.size(), 1u);
  BOOST_CHECK_EQUAL(records[0].message, "hello");
}

BOOST_FIXTURE_TEST_CASE(TestThrowingSinkIsContained, LoggerFixture) {
  Logger::SetSink([](LogLevel, const char *, const std::string &) {
    throw std::runtime_error("sink failure");
  });

  BOOST_CHECK_NO_THROW(PARTICLE_ERROR("first"));
  BOOST_CHECK_NO_THROW(AURA_CRITICAL("Test", "second"));

  // Delivery resumes once a working sink is back
  Logger::SetSink([this](LogLevel level, const char *system, const std::string &message) {
    records.push_back(LogRecord{level, system, message});
  });
  POOL_ERROR("third");
  BOOST_REQUIRE_EQUAL(records.size(), 1u);
  BOOST_CHECK_EQUAL(records[0].message, "third");
}

BOOST_AUTO_TEST_CASE(TestLevelStrings) {
  BOOST_CHECK_EQUAL(std::string(Logger::getLevelString(LogLevel::CRITICAL)), "CRITICAL");
  BOOST_CHECK_EQUAL(std::string(Logger::getLevelString(LogLevel::ERROR_LEVEL)), "ERROR");
  BOOST_CHECK_EQUAL(std::string(Logger::getLevelString(LogLevel::WARNING)), "WARNING");
  BOOST_CHECK_EQUAL(std::string(Logger::getLevelString(LogLevel::DEBUG_LEVEL)), "DEBUG");
}

// Test that a diagnostic sink never changes simulation results
BOOST_AUTO_TEST_CASE(TestSinkDoesNotAffectSimulation) {
  AURA_ENABLE_BENCHMARK_MODE();
  auto run = [] {
    ParticleSystemConfig config;
    config.surfaceWidth = 800.0f;
    config.surfaceHeight = 600.0f;
    config.seed = 7;
    ParticleSystem system(config);
    SpawnOptions options;
    options.count = 10;
    system.spawn(BehaviorType::Aggressive, "anger", 0.0f, 400.0f, 300.0f, 16.0f, options);
    system.setContainmentBounds(ContainmentBounds{0.0f, 0.0f, -1.0f, 0.0f});
    for (int i = 0; i < 20; ++i) {
      system.update(16.67f, 400.0f, 300.0f);
    }
    std::vector<float> xs;
    system.forEachParticle([&xs](const Particle &p) { xs.push_back(p.position.getX()); });
    return xs;
  };

  const std::vector<float> plain = run();

  AURA_DISABLE_BENCHMARK_MODE();
  size_t seen = 0;
  Logger::SetSink([&seen](LogLevel, const char *, const std::string &) { ++seen; });
  const std::vector<float> observed = run();
  Logger::ClearSink();

  BOOST_CHECK(plain == observed);
}
