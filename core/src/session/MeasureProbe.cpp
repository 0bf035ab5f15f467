#include "lrc/session/MeasureProbe.hpp"
#include <cstdio>

namespace lrc {

void MeasureProbe::configure(int maxRetries, double backoffMs) {
  maxRetries_ = maxRetries < 0 ? 0 : maxRetries;
  backoffMs_ = backoffMs < 0.0 ? 0.0 : backoffMs;
}

void MeasureProbe::start(double nowMs) {
  started_ = true;
  status_ = ProbeStatus::Pending;
  retries_ = 0;
  nextAttemptMs_ = nowMs;
}

ProbeStatus MeasureProbe::poll(double nowMs, const MeasureFn& measure,
                               double& outWidth, double& outHeight) {
  if (!started_ || status_ != ProbeStatus::Pending) return status_;
  if (nowMs < nextAttemptMs_) return status_;

  double w = 0, h = 0;
  if (measure && measure(w, h) && w > 0.0) {
    outWidth = w;
    outHeight = h;
    status_ = ProbeStatus::Measured;
    return status_;
  }

  if (retries_ < maxRetries_) {
    retries_++;
    nextAttemptMs_ = nowMs + retries_ * backoffMs_;
    return status_;
  }

  std::fprintf(stderr, "MeasureProbe::poll: container not measurable after %d retries, "
                       "using fallback size\n", retries_);
  status_ = ProbeStatus::Fallback;
  return status_;
}

} // namespace lrc
