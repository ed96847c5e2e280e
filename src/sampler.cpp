#include "sampler.hpp"

#include <cmath>
#include <stdexcept>

#include "sampler/biased_sampler.hpp"
#include "sampler/selection_sampler.hpp"
#include "sampler/uniform_noisy_sampler.hpp"
#include "sampler/uniform_sampler.hpp"

namespace dmsim {

Mt19937RandomStream::Mt19937RandomStream(std::uint64_t seed) : rng_(seed) {}

double Mt19937RandomStream::uniform(double lo, double hi) {
    if (hi <= lo) {
        return lo;
    }
    std::uniform_real_distribution<double> dist(lo, hi);
    return dist(rng_);
}

std::unique_ptr<RandomStream> make_random_stream(std::optional<std::uint64_t> seed) {
    if (seed) {
        return std::make_unique<Mt19937RandomStream>(*seed);
    }
    std::random_device rd;
    const std::uint64_t high = static_cast<std::uint64_t>(rd()) << 32;
    return std::make_unique<Mt19937RandomStream>(high | rd());
}

int born_rule_outcome(double p0, double p1, double u) {
    const double total = p0 + p1;
    if (!(total > 0.0)) {
        return 0;
    }
    return u < p0 / total ? 0 : 1;
}

SampleResult Sampler::sample(double p0, double p1) {
    std::lock_guard<std::mutex> lock(mutex_);
    return draw(p0, p1);
}

void validate_sampler_config(const SamplerConfig& config) {
    if (config.kind == SamplerKind::Selection &&
        config.selection != 0 && config.selection != 1) {
        throw std::invalid_argument("Selection sampler outcome must be 0 or 1");
    }
    if (config.kind == SamplerKind::UniformNoisy || config.kind == SamplerKind::Biased) {
        if (!(config.readout_error >= 0.0 && config.readout_error <= 1.0)) {
            throw std::invalid_argument("Readout error must be in [0, 1]");
        }
    }
    if (config.kind == SamplerKind::Biased &&
        (!std::isfinite(config.alpha) || !(config.alpha > 0.0))) {
        throw std::invalid_argument("Biased sampler alpha must be finite and positive");
    }
}

std::shared_ptr<Sampler> make_sampler(const SamplerConfig& config) {
    validate_sampler_config(config);
    switch (config.kind) {
        case SamplerKind::Selection:
            return std::make_shared<SelectionSampler>(config.selection);
        case SamplerKind::Uniform:
            return std::make_shared<UniformSampler>(config.seed);
        case SamplerKind::UniformNoisy:
            return std::make_shared<UniformNoisySampler>(config.readout_error, config.seed);
        case SamplerKind::Biased:
            return std::make_shared<BiasedSampler>(
                config.readout_error, config.alpha, config.seed);
    }
    throw std::invalid_argument("Unknown sampler kind");
}

std::string to_string(SamplerKind kind) {
    switch (kind) {
        case SamplerKind::Selection:
            return "selection";
        case SamplerKind::Uniform:
            return "uniform";
        case SamplerKind::UniformNoisy:
            return "uniform_noisy";
        case SamplerKind::Biased:
            return "biased";
    }
    return "unknown";
}

}  // namespace dmsim
