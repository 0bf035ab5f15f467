#pragma once
#include <cstdint>
#include <functional>

namespace lrc {

enum class ProbeStatus : std::uint8_t {
  Pending = 0,
  Measured,
  Fallback
};

// Polls the host container for its size until it reports a non-zero width.
// The first attempt happens at the first poll after start(); failed attempt
// k (1-based) schedules the next one k * backoffMs later. After maxRetries
// failed retries the probe gives up and reports Fallback.
class MeasureProbe {
public:
  // Writes the container size; false when it is not laid out yet.
  using MeasureFn = std::function<bool(double& width, double& height)>;

  void configure(int maxRetries, double backoffMs);

  void start(double nowMs);

  // Attempt a measurement if one is due.
  ProbeStatus poll(double nowMs, const MeasureFn& measure, double& outWidth, double& outHeight);

  ProbeStatus status() const { return status_; }
  int retries() const { return retries_; }
  double nextAttemptMs() const { return nextAttemptMs_; }
  bool started() const { return started_; }

private:
  int maxRetries_{10};
  double backoffMs_{50};

  bool started_{false};
  ProbeStatus status_{ProbeStatus::Pending};
  int retries_{0};
  double nextAttemptMs_{0};
};

} // namespace lrc
