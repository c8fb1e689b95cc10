#include "fractal_kernel.hpp"

#include <cmath>
#include <numeric>

#include <fmt/format.h>

#include "../utility/exceptions.hpp"
#include "../utility/logger.hpp"

namespace kernelbench::fractal {

namespace {

void check_inputs(int max_iterations, const std::vector<ComplexPoint> &zs,
                  const std::vector<ComplexPoint> &cs) {
    if (zs.size() != cs.size()) {
        throw KernelError(fmt::format(
            "Mismatched inputs: {} starting points but {} parameters",
            zs.size(), cs.size()));
    }
    if (max_iterations < 0) {
        throw KernelError("Invalid iteration cap: " +
                          std::to_string(max_iterations));
    }
}

} // namespace

IterationCounts
ScalarFractalKernel::run(int max_iterations,
                         const std::vector<ComplexPoint> &zs,
                         const std::vector<ComplexPoint> &cs) const {
    check_inputs(max_iterations, zs, cs);

    IterationCounts output(zs.size(), 0);
    for (std::size_t i = 0; i < zs.size(); ++i) {
        int n = 0;
        ComplexPoint z = zs[i];
        const ComplexPoint c = cs[i];
        while (std::abs(z) < escape_radius && n < max_iterations) {
            z = z * z + c;
            ++n;
        }
        output[i] = n;
    }
    return output;
}

IterationCounts
BatchFractalKernel::run(int max_iterations,
                        const std::vector<ComplexPoint> &zs,
                        const std::vector<ComplexPoint> &cs) const {
    check_inputs(max_iterations, zs, cs);

    const std::size_t n = zs.size();
    IterationCounts output(n, 0);

    std::vector<double> re(n);
    std::vector<double> im(n);
    std::vector<double> c_re(n);
    std::vector<double> c_im(n);
    std::vector<double> modulus(n);
    std::vector<std::size_t> slot(n);

    for (std::size_t i = 0; i < n; ++i) {
        re[i] = zs[i].real();
        im[i] = zs[i].imag();
        c_re[i] = cs[i].real();
        c_im[i] = cs[i].imag();
    }
    std::iota(slot.begin(), slot.end(), std::size_t{0});

    std::size_t active = n;
    for (int iteration = 0; active > 0; ++iteration) {
        // escape test for every active lane
        for (std::size_t k = 0; k < active; ++k) {
            modulus[k] = std::hypot(re[k], im[k]);
        }

        // retire finished lanes, move survivors to the front
        std::size_t kept = 0;
        for (std::size_t k = 0; k < active; ++k) {
            if (modulus[k] < escape_radius && iteration < max_iterations) {
                if (kept != k) {
                    re[kept] = re[k];
                    im[kept] = im[k];
                    c_re[kept] = c_re[k];
                    c_im[kept] = c_im[k];
                    slot[kept] = slot[k];
                }
                ++kept;
            } else {
                output[slot[k]] = iteration;
            }
        }
        active = kept;

        // same operand order as std::complex multiplication
        for (std::size_t k = 0; k < active; ++k) {
            const double zr = re[k];
            const double zi = im[k];
            re[k] = (zr * zr - zi * zi) + c_re[k];
            im[k] = (zr * zi + zi * zr) + c_im[k];
        }
    }

    LOG_DEBUG(fmt::format("Batch fractal kernel finished {} points", n));
    return output;
}

std::unique_ptr<FractalKernel> make_fractal_kernel(Strategy strategy) {
    switch (strategy) {
    case Strategy::Scalar:
        return std::make_unique<ScalarFractalKernel>();
    case Strategy::Batch:
        return std::make_unique<BatchFractalKernel>();
    }
    throw KernelError("Unknown fractal strategy");
}

long long checksum(const IterationCounts &counts) noexcept {
    return std::accumulate(counts.begin(), counts.end(), 0LL);
}

} // namespace kernelbench::fractal
