#pragma once

#include <complex>
#include <cstddef>
#include <memory>
#include <vector>

namespace clipshelf {

using Spectrum = std::vector<std::complex<double>>;

// Real-input DFT of a fixed length. Bin k of forward() is frequency
// k * sample_rate / length(), for k in [0, length() / 2].
class RealFft {
private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;

public:
    explicit RealFft(size_t length);
    ~RealFft();

    RealFft(const RealFft&) = delete;
    RealFft& operator=(const RealFft&) = delete;

    size_t length() const;
    size_t bin_count() const;

    Spectrum forward(const std::vector<double>& samples);
    // Scaled so that inverse(forward(x)) reproduces x.
    std::vector<double> inverse(const Spectrum& bins);
};

}
