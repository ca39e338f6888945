#include "spectrum.hpp"
#include "errors.hpp"
#include <fftw3.h>
#include <algorithm>
#include <limits>
#include <string>

namespace clipshelf {

struct RealFft::Impl {
    size_t length = 0;
    size_t bins = 0;
    double* real = nullptr;
    fftw_complex* complex = nullptr;
    fftw_plan forward_plan = nullptr;
    fftw_plan inverse_plan = nullptr;

    ~Impl() {
        if (forward_plan) {
            fftw_destroy_plan(forward_plan);
        }
        if (inverse_plan) {
            fftw_destroy_plan(inverse_plan);
        }
        fftw_free(real);
        fftw_free(complex);
    }
};

RealFft::RealFft(size_t length) : m_impl(std::make_unique<Impl>()) {
    if (length == 0) {
        throw InvalidArgument("Transform length must be positive");
    }
    if (length > static_cast<size_t>(std::numeric_limits<int>::max())) {
        throw InvalidArgument("Transform length " + std::to_string(length) + " is too large");
    }

    m_impl->length = length;
    m_impl->bins = length / 2 + 1;
    m_impl->real = fftw_alloc_real(length);
    m_impl->complex = fftw_alloc_complex(m_impl->bins);
    if (!m_impl->real || !m_impl->complex) {
        throw InvalidState("Cannot allocate a transform of " + std::to_string(length) + " samples");
    }

    // FFTW_ESTIMATE plans without touching the buffers
    const int n = static_cast<int>(length);
    m_impl->forward_plan = fftw_plan_dft_r2c_1d(n, m_impl->real, m_impl->complex, FFTW_ESTIMATE);
    m_impl->inverse_plan = fftw_plan_dft_c2r_1d(n, m_impl->complex, m_impl->real, FFTW_ESTIMATE);
    if (!m_impl->forward_plan || !m_impl->inverse_plan) {
        throw InvalidState("Cannot plan a transform of " + std::to_string(length) + " samples");
    }
}

RealFft::~RealFft() = default;

size_t RealFft::length() const {
    return m_impl->length;
}

size_t RealFft::bin_count() const {
    return m_impl->bins;
}

Spectrum RealFft::forward(const std::vector<double>& samples) {
    if (samples.size() != m_impl->length) {
        throw InvalidArgument("Expected " + std::to_string(m_impl->length) + " samples, got " +
                              std::to_string(samples.size()));
    }

    std::copy(samples.begin(), samples.end(), m_impl->real);
    fftw_execute(m_impl->forward_plan);

    Spectrum bins(m_impl->bins);
    for (size_t k = 0; k < m_impl->bins; ++k) {
        bins[k] = std::complex<double>(m_impl->complex[k][0], m_impl->complex[k][1]);
    }
    return bins;
}

std::vector<double> RealFft::inverse(const Spectrum& bins) {
    if (bins.size() != m_impl->bins) {
        throw InvalidArgument("Expected " + std::to_string(m_impl->bins) + " bins, got " +
                              std::to_string(bins.size()));
    }

    for (size_t k = 0; k < m_impl->bins; ++k) {
        m_impl->complex[k][0] = bins[k].real();
        m_impl->complex[k][1] = bins[k].imag();
    }
    // The c2r transform overwrites its input, which is ours to lose
    fftw_execute(m_impl->inverse_plan);

    const double scale = 1.0 / static_cast<double>(m_impl->length);
    std::vector<double> samples(m_impl->length);
    for (size_t i = 0; i < m_impl->length; ++i) {
        samples[i] = m_impl->real[i] * scale;
    }
    return samples;
}

}
