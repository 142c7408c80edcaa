/**
 * @file ScoringLogger.h
 * @brief Stage timing and progress logging for scoring runs
 */

#ifndef SCORING_LOGGER_H
#define SCORING_LOGGER_H

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace tractoscore {

/**
 * @brief High-resolution timer for stage measurements
 */
class Timer {
private:
  std::chrono::high_resolution_clock::time_point m_start;
  std::chrono::high_resolution_clock::time_point m_end;
  bool m_is_running;

public:
  Timer() : m_is_running(false) {}

  void Start() {
    m_start = std::chrono::high_resolution_clock::now();
    m_is_running = true;
  }

  void Stop() {
    m_end = std::chrono::high_resolution_clock::now();
    m_is_running = false;
  }

  double ElapsedMilliseconds() const {
    auto end_time =
        m_is_running ? std::chrono::high_resolution_clock::now() : m_end;
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
        end_time - m_start);
    return duration.count() / 1000.0;
  }
};

/**
 * @brief Progress messages on stdout when verbose, warnings always on stderr
 *
 * Lines look like `[TractoScore][ValidConnections +12.5 ms] message`.
 */
class ScoringLogger {
private:
  std::string m_component;
  bool m_verbose;
  Timer m_timer;

public:
  ScoringLogger(const std::string &component, bool verbose)
      : m_component(component), m_verbose(verbose) {
    m_timer.Start();
  }

  bool IsVerbose() const { return m_verbose; }

  void Info(const std::string &message) const {
    if (!m_verbose)
      return;
    std::cout << Prefix() << message << std::endl;
  }

  void Warning(const std::string &message) const {
    std::cerr << Prefix() << "Warning: " << message << std::endl;
  }

private:
  std::string Prefix() const {
    std::stringstream ss;
    ss << "[TractoScore][" << m_component << " +" << std::fixed
       << std::setprecision(1) << m_timer.ElapsedMilliseconds() << " ms] ";
    return ss.str();
  }
};

} // namespace tractoscore

#endif // SCORING_LOGGER_H
