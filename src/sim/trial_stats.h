#pragma once

#include <cmath>
#include <cstddef>
#include <numeric>
#include <vector>

namespace SyncBench {

class TrialStats {
public:
    struct Summary {
        double mean = 0.0;
        double stddev = 0.0;
        double min = 0.0;
        double max = 0.0;
        size_t count = 0;
    };

    // Arithmetic mean and sample (n - 1) standard deviation.
    static Summary ComputeSummary(const std::vector<double>& samples) {
        Summary s{};
        if (samples.empty()) {
            return s;
        }

        s.count = samples.size();
        s.min = samples.front();
        s.max = samples.front();
        for (double v : samples) {
            if (v < s.min) s.min = v;
            if (v > s.max) s.max = v;
        }

        const long double sum = std::accumulate(
            samples.begin(), samples.end(), static_cast<long double>(0.0L));
        s.mean = static_cast<double>(sum / static_cast<long double>(s.count));

        if (s.count < 2) {
            return s;
        }
        long double sq = 0.0L;
        for (double v : samples) {
            const long double d = static_cast<long double>(v) - s.mean;
            sq += d * d;
        }
        s.stddev = static_cast<double>(std::sqrt(sq / static_cast<long double>(s.count - 1)));
        return s;
    }
};

} // namespace SyncBench
