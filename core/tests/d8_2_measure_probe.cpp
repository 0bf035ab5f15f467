// D8.2 - container measurement probe
// Tests: nothing happens before start, linear backoff between attempts,
// fallback after the retry budget, restart, zero-width sizes count as failures.

#include "lrc/session/MeasureProbe.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static void requireClose(double a, double b, double eps, const char* msg) {
  if (std::fabs(a - b) > eps) {
    std::fprintf(stderr, "ASSERT FAIL: %s (got %.9f, expected %.9f)\n", msg, a, b);
    std::exit(1);
  }
}

int main() {
  int calls = 0;
  lrc::MeasureProbe::MeasureFn failing = [&calls](double&, double&) {
    calls++;
    return false;
  };

  // ---- Test 1: not started ----
  {
    lrc::MeasureProbe probe;
    double w = 0, h = 0;
    calls = 0;
    requireTrue(probe.poll(100, failing, w, h) == lrc::ProbeStatus::Pending, "pending");
    requireTrue(calls == 0, "no attempt before start");
    requireTrue(!probe.started(), "not started");
    std::printf("  Test 1 (not started): PASS\n");
  }

  // ---- Test 2: backoff schedule ----
  {
    lrc::MeasureProbe probe;
    probe.configure(10, 50);
    probe.start(1000);
    double w = 0, h = 0;
    calls = 0;

    // failed attempt k waits k * 50ms
    double now = 1000;
    for (int k = 1; k <= 4; k++) {
      requireTrue(probe.poll(now, failing, w, h) == lrc::ProbeStatus::Pending, "retrying");
      requireTrue(probe.retries() == k, "retry counted");
      requireClose(probe.nextAttemptMs(), now + k * 50.0, 1e-12, "linear backoff");
      probe.poll(probe.nextAttemptMs() - 1.0, failing, w, h);
      requireTrue(calls == k, "no attempt before the deadline");
      now = probe.nextAttemptMs();
    }
    std::printf("  Test 2 (backoff): PASS\n");
  }

  // ---- Test 3: success ----
  {
    lrc::MeasureProbe probe;
    probe.configure(10, 50);
    probe.start(0);
    int n = 0;
    auto measure = [&n](double& w, double& h) {
      n++;
      if (n == 1) {
        w = 0;  // laid out but not sized yet
        h = 100;
        return true;
      }
      w = 640;
      h = 300;
      return true;
    };
    double w = 0, h = 0;
    requireTrue(probe.poll(0, measure, w, h) == lrc::ProbeStatus::Pending, "zero width fails");
    requireTrue(w == 0 && h == 0, "outputs untouched on failure");
    requireTrue(probe.poll(50, measure, w, h) == lrc::ProbeStatus::Measured, "measured");
    requireClose(w, 640, 1e-12, "width");
    requireClose(h, 300, 1e-12, "height");

    requireTrue(probe.poll(5000, measure, w, h) == lrc::ProbeStatus::Measured, "stays measured");
    requireTrue(n == 2, "no further attempts");
    std::printf("  Test 3 (measured): PASS\n");
  }

  // ---- Test 4: fallback, restart ----
  {
    lrc::MeasureProbe probe;
    probe.configure(3, 10);
    probe.start(0);
    double w = 0, h = 0;
    calls = 0;
    double now = 0;
    while (probe.poll(now, failing, w, h) == lrc::ProbeStatus::Pending) now += 1.0;
    requireTrue(probe.status() == lrc::ProbeStatus::Fallback, "fallback");
    requireTrue(calls == 4, "first attempt plus three retries");
    requireClose(now, 10 + 20 + 30, 1e-12, "gave up after the last backoff");

    probe.poll(now + 1000, failing, w, h);
    requireTrue(calls == 4, "no attempts after giving up");

    probe.start(now);
    requireTrue(probe.status() == lrc::ProbeStatus::Pending, "restart clears the status");
    requireTrue(probe.retries() == 0, "restart clears retries");

    lrc::MeasureProbe none;
    none.configure(0, 10);
    none.start(0);
    requireTrue(none.poll(0, failing, w, h) == lrc::ProbeStatus::Fallback, "no retries allowed");

    lrc::MeasureProbe noFn;
    noFn.configure(0, 10);
    noFn.start(0);
    requireTrue(noFn.poll(0, lrc::MeasureProbe::MeasureFn{}, w, h) == lrc::ProbeStatus::Fallback,
                "missing measure function falls back");
    std::printf("  Test 4 (fallback): PASS\n");
  }

  std::printf("D8.2 measure_probe: ALL PASS\n");
  return 0;
}
