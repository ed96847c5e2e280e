#include "sampler/selection_sampler.hpp"

#include <stdexcept>

namespace dmsim {

SelectionSampler::SelectionSampler(int result) : result_(result) {
    if (result_ != 0 && result_ != 1) {
        throw std::invalid_argument("Selection sampler outcome must be 0 or 1");
    }
}

std::string SelectionSampler::name() const {
    return "selection";
}

SampleResult SelectionSampler::draw(double /*p0*/, double /*p1*/) {
    return SampleResult{result_, result_, 1.0};
}

}  // namespace dmsim
