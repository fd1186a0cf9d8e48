/**
 * MixGraph - Multichannel Cross-Correlation
 */

#ifndef MIXGRAPH_CORRELATION_H
#define MIXGRAPH_CORRELATION_H

#include "../analyzer/stft.h"
#include <complex>
#include <memory>
#include <optional>
#include <vector>

namespace mixgraph {

struct CorrelationPeak {
    size_t lag = 0;
    double score = 0.0;
};

/**
 * Valid-mode cross-correlation of short needles against one long haystack,
 * summed over channels. The haystack spectrum is computed once so that
 * many needles can be located cheaply.
 *
 * Inputs are row-major channels x frames. Not thread-safe; use one
 * Correlator per thread.
 */
class Correlator {
public:
    Correlator(const std::vector<double>& haystack, int channels, size_t frames);

    /**
     * @return scores for lags 0 .. frames - needle_frames; empty when the
     *         needle is empty or longer than the haystack
     */
    std::vector<double> correlate(const std::vector<double>& needle, size_t needle_frames);

    /**
     * Highest-scoring lag (first on ties), or nullopt when nothing fits.
     */
    std::optional<CorrelationPeak> best(const std::vector<double>& needle, size_t needle_frames);

    size_t frames() const { return frames_; }
    int channels() const { return channels_; }

private:
    int channels_;
    size_t frames_;
    std::unique_ptr<RealFft> fft_;
    std::vector<std::complex<double>> haystack_spectra_;    // channels x bins
};

/**
 * First index of the maximum.
 */
std::optional<CorrelationPeak> find_peak(const std::vector<double>& scores);

} // namespace mixgraph

#endif // MIXGRAPH_CORRELATION_H
