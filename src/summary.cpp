#include "floodrisk/summary.hpp"

#include <algorithm>

namespace floodrisk {

void RunningStats::update(double value) {
    count += 1;
    const double delta = value - mean;
    mean += delta / static_cast<double>(count);
    max = count == 1 ? value : std::max(max, value);
}

void RunningStats::merge(const RunningStats& other) {
    if (other.count == 0) {
        return;
    }
    if (count == 0) {
        *this = other;
        return;
    }
    const double total = static_cast<double>(count + other.count);
    const double delta = other.mean - mean;
    mean += delta * static_cast<double>(other.count) / total;
    max = std::max(max, other.max);
    count += other.count;
}

DepthStats depth_statistics(const DepthRaster& depth) {
    RunningStats stats;
    const long long count = static_cast<long long>(depth.values.size());
#pragma omp parallel
    {
        RunningStats local;
#pragma omp for schedule(static) nowait
        for (long long i = 0; i < count; ++i) {
            const double value = depth.values[static_cast<std::size_t>(i)];
            if (!depth.is_nodata(value)) {
                local.update(value);
            }
        }
#pragma omp critical(floodrisk_depth_merge)
        stats.merge(local);
    }
    return DepthStats{stats.max, stats.mean, stats.count};
}

std::vector<std::string> priority_reaches(const std::vector<ResolvedReach>& reaches, double very_high_threshold) {
    std::vector<std::string> output;
    for (const auto& reach : reaches) {
        if (reach.resolution.depth > very_high_threshold) {
            output.push_back(reach.reach_id);
        }
    }
    std::sort(output.begin(), output.end());
    return output;
}

}  // namespace floodrisk
