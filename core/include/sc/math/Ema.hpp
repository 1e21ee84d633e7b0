#pragma once

namespace sc {

// Exponential moving average. The first (period-1) outputs are NaN; the
// seed at index (period-1) is the simple average of the first window.
// Input must be finite from index `start` on; outputs before `start` are NaN.
void computeEma(const double* input, double* output, int count, int period,
                int start = 0);

// Simple moving average over a trailing window; NaN until the window fills
// or whenever the window contains a NaN.
void computeSma(const double* input, double* output, int count, int period);

} // namespace sc
