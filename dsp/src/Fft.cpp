/**
 * @file Fft.cpp
 * @brief Implementation of the radix-2 FFT with direct DFT fallback.
 * @author MasterLaplace
 */

#include "hrv/dsp/Fft.hpp"

#include <algorithm>
#include <bit>
#include <cmath>
#include <numbers>

namespace hrv::dsp {

Fft::Fft(core::usize fftSize)
    : _fftSize(fftSize)
    , _radix2(std::has_single_bit(fftSize))
{
    if (!_radix2 && fftSize > 0) {
        _twiddles.resize(fftSize);
        for (core::usize k = 0; k < fftSize; ++k) {
            const core::f64 angle = -2.0 * std::numbers::pi
                * static_cast<core::f64>(k) / static_cast<core::f64>(fftSize);
            _twiddles[k] = Complex(std::cos(angle), std::sin(angle));
        }
    }
}

void Fft::bitReversalPermutation(std::vector<Complex> &x)
{
    const core::usize n = x.size();
    core::usize j = 0;

    for (core::usize i = 1; i < n; ++i) {
        core::usize bit = n >> 1;
        for (; j & bit; bit >>= 1) {
            j ^= bit;
        }
        j ^= bit;
        if (i < j) {
            std::swap(x[i], x[j]);
        }
    }
}

void Fft::butterflyPass(std::vector<Complex> &x)
{
    const core::usize n = x.size();

    for (core::usize len = 2; len <= n; len <<= 1) {
        const core::f64 angle = -2.0 * std::numbers::pi / static_cast<core::f64>(len);
        const Complex wlen(std::cos(angle), std::sin(angle));

        for (core::usize i = 0; i < n; i += len) {
            Complex w(1.0, 0.0);
            const core::usize halfLen = len / 2;

            for (core::usize k = 0; k < halfLen; ++k) {
                const Complex u = x[i + k];
                const Complex v = x[i + k + halfLen] * w;
                x[i + k] = u + v;
                x[i + k + halfLen] = u - v;
                w *= wlen;
            }
        }
    }
}

std::vector<Fft::Complex> Fft::directDft(const std::vector<Complex> &x) const
{
    const core::usize n = x.size();
    std::vector<Complex> out(binCount());

    for (core::usize k = 0; k < out.size(); ++k) {
        Complex acc(0.0, 0.0);
        for (core::usize t = 0; t < n; ++t)
            acc += x[t] * _twiddles[(k * t) % n];
        out[k] = acc;
    }
    return out;
}

std::vector<core::f64> Fft::powerSpectrum(std::span<const core::f64> input) const
{
    if (_fftSize == 0)
        return {};

    std::vector<Complex> buffer(_fftSize, Complex(0.0, 0.0));
    const core::usize count = std::min(input.size(), _fftSize);
    for (core::usize t = 0; t < count; ++t)
        buffer[t] = Complex(input[t], 0.0);

    if (_radix2) {
        bitReversalPermutation(buffer);
        butterflyPass(buffer);
    } else {
        buffer = directDft(buffer);
    }

    std::vector<core::f64> power(binCount());
    for (core::usize k = 0; k < power.size(); ++k)
        power[k] = std::norm(buffer[k]);
    return power;
}

} // namespace hrv::dsp
