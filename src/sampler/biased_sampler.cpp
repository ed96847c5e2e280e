#include "sampler/biased_sampler.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "diagnostics.hpp"

namespace dmsim {

BiasedSampler::BiasedSampler(
    double readout_error,
    double alpha,
    std::optional<std::uint64_t> seed
)
    : readout_error_(readout_error)
    , alpha_(alpha)
    , rng_(make_random_stream(seed)) {
    initialize();
}

BiasedSampler::BiasedSampler(
    double readout_error,
    double alpha,
    std::unique_ptr<RandomStream> rng
)
    : readout_error_(readout_error)
    , alpha_(alpha)
    , rng_(std::move(rng)) {
    if (!rng_) {
        throw std::invalid_argument("Biased sampler requires a random stream");
    }
    initialize();
}

void BiasedSampler::initialize() {
    if (!(readout_error_ >= 0.0 && readout_error_ <= 1.0)) {
        throw std::invalid_argument("Readout error must be in [0, 1]");
    }
    if (!std::isfinite(alpha_) || !(alpha_ > 0.0)) {
        throw std::invalid_argument("Biased sampler alpha must be finite and positive");
    }
    const double flip = std::pow(readout_error_, alpha_);
    const double keep = std::pow(1.0 - readout_error_, alpha_);
    p_twiddle_ = flip / (flip + keep);

    // The bias model assumes a classifier better than a coin toss and a
    // non-zero error rate to bias away from.
    if (!(readout_error_ > 0.0 && readout_error_ < 0.5)) {
        std::ostringstream oss;
        oss << "readout_error=" << readout_error_ << " alpha=" << alpha_
            << " lies outside (0, 0.5); p_twiddle=" << p_twiddle_;
        warn("InvalidSamplerConfiguration", oss.str());
    }
}

std::string BiasedSampler::name() const {
    return "biased";
}

SampleResult BiasedSampler::draw(double p0, double p1) {
    SampleResult result;
    result.projected = born_rule_outcome(p0, p1, rng_->uniform(0.0, 1.0));
    if (rng_->uniform(0.0, 1.0) < p_twiddle_) {
        result.declared = 1 - result.projected;
        result.probability = readout_error_;
        path_sampling_probability_ *= p_twiddle_;
    } else {
        result.declared = result.projected;
        result.probability = 1.0 - readout_error_;
        path_sampling_probability_ *= 1.0 - p_twiddle_;
    }
    return result;
}

}  // namespace dmsim
