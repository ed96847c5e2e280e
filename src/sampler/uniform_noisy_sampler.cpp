#include "sampler/uniform_noisy_sampler.hpp"

#include <stdexcept>
#include <utility>

namespace dmsim {

namespace {

void check_readout_error(double readout_error) {
    if (!(readout_error >= 0.0 && readout_error <= 1.0)) {
        throw std::invalid_argument("Readout error must be in [0, 1]");
    }
}

}  // namespace

UniformNoisySampler::UniformNoisySampler(
    double readout_error,
    std::optional<std::uint64_t> seed
)
    : readout_error_(readout_error)
    , rng_(make_random_stream(seed)) {
    check_readout_error(readout_error_);
}

UniformNoisySampler::UniformNoisySampler(
    double readout_error,
    std::unique_ptr<RandomStream> rng
)
    : readout_error_(readout_error)
    , rng_(std::move(rng)) {
    check_readout_error(readout_error_);
    if (!rng_) {
        throw std::invalid_argument("Uniform noisy sampler requires a random stream");
    }
}

std::string UniformNoisySampler::name() const {
    return "uniform_noisy";
}

SampleResult UniformNoisySampler::draw(double p0, double p1) {
    SampleResult result;
    result.projected = born_rule_outcome(p0, p1, rng_->uniform(0.0, 1.0));
    if (rng_->uniform(0.0, 1.0) < readout_error_) {
        result.declared = 1 - result.projected;
        result.probability = readout_error_;
    } else {
        result.declared = result.projected;
        result.probability = 1.0 - readout_error_;
    }
    return result;
}

}  // namespace dmsim
