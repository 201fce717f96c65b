#include "kernel/Replicates.h"

#include <exception>
#include <stdexcept>
#include <omp.h>

int replicateThreadCount() {
    return omp_get_max_threads();
}

std::vector<MetricsSeries> runReplicates(const std::vector<KernelConfig>& configs) {
    // Fail fast on the calling thread: exceptions must not escape a parallel region
    for (const auto& cfg : configs) {
        validateConfig(cfg);
    }

    std::vector<MetricsSeries> results(configs.size());
    std::vector<std::exception_ptr> errors(configs.size());
    const long n = static_cast<long>(configs.size());

    #pragma omp parallel for schedule(dynamic)
    for (long i = 0; i < n; ++i) {
        try {
            Kernel kernel(configs[i]);
            kernel.run();
            results[i] = kernel.metricsMut().release();
        } catch (...) {
            errors[i] = std::current_exception();
        }
    }

    // Re-raise the first failure in input order
    for (const auto& err : errors) {
        if (err) std::rethrow_exception(err);
    }
    return results;
}

std::vector<KernelConfig> coerciveSweep(const KernelConfig& base, double lo, double hi,
                                        std::uint32_t steps) {
    if (steps == 0) {
        throw std::invalid_argument("coerciveSweep: steps must be > 0 (got 0)");
    }
    if (hi < lo) {
        throw std::invalid_argument("coerciveSweep: hi must be >= lo");
    }
    std::vector<KernelConfig> configs(steps, base);
    for (std::uint32_t k = 0; k < steps; ++k) {
        const double t = steps > 1 ? static_cast<double>(k) / (steps - 1) : 0.0;
        configs[k].coerciveCapacity = lo + t * (hi - lo);
    }
    return configs;
}

std::vector<KernelConfig> seedReplicates(const KernelConfig& base, std::uint32_t count) {
    std::vector<KernelConfig> configs(count, base);
    for (std::uint32_t k = 0; k < count; ++k) {
        configs[k].seed = base.seed + k;
    }
    return configs;
}

SeriesSummary summarize(const MetricsSeries& series) {
    SeriesSummary s;
    s.days = series.size();
    for (const auto& m : series) {
        s.crimeEvents += m.crime_events;
        s.arrests += m.arrests;
        s.wrongfulDetentions += m.wrongful_detentions;
        s.detentionExits += m.detention_exits;
        s.convictions += m.convictions;
        s.releases += m.releases();
        for (std::size_t k = 0; k < kStatusCount; ++k) {
            s.meanShares[k] += m.share(static_cast<LegalStatus>(k));
        }
    }
    if (s.days > 0) {
        for (auto& share : s.meanShares) {
            share /= static_cast<double>(s.days);
        }
    }
    return s;
}
