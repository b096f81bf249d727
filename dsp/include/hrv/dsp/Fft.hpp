/**
 * @file Fft.hpp
 * @brief One-sided power spectrum of a real segment.
 * @author MasterLaplace
 *
 * Power-of-two lengths use the Cooley-Tukey radix-2 decimation-in-time
 * algorithm with bit-reversal permutation. Welch segment lengths follow
 * the window length and are rarely powers of two, so other lengths fall
 * back to a direct DFT (segments are at most a few dozen samples).
 *
 * @see welch
 */

#pragma once

#include "hrv/core/Types.hpp"

#include <complex>
#include <span>
#include <vector>

namespace hrv::dsp {

/**
 * @brief Computes |X[k]|^2 for k = 0 .. N/2 of a real input of length N.
 *
 * The output is not normalized; callers apply their own scaling.
 *
 * @code
 *   Fft fft(64);
 *   auto power = fft.powerSpectrum(segment);
 * @endcode
 */
class Fft final {
public:
    /**
     * @brief Constructs a transform for the given input length.
     *
     * @param fftSize Number of time-domain samples
     */
    explicit Fft(core::usize fftSize);

    /**
     * @brief Squared magnitude of the one-sided spectrum.
     *
     * @param input Real samples; zero-padded or truncated to size()
     * @return size()/2 + 1 bins
     */
    [[nodiscard]] std::vector<core::f64> powerSpectrum(std::span<const core::f64> input) const;

    [[nodiscard]] core::usize size() const noexcept { return _fftSize; }
    [[nodiscard]] core::usize binCount() const noexcept { return _fftSize / 2 + 1; }
    [[nodiscard]] bool isRadix2() const noexcept { return _radix2; }

private:
    using Complex = std::complex<core::f64>;

    static void bitReversalPermutation(std::vector<Complex> &x);
    static void butterflyPass(std::vector<Complex> &x);

    std::vector<Complex> directDft(const std::vector<Complex> &x) const;

    core::usize _fftSize;
    bool _radix2;
    std::vector<Complex> _twiddles; ///< exp(-2*pi*i*k/N), direct path only
};

} // namespace hrv::dsp
