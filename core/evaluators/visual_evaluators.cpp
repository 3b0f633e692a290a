#include "evaluators/visual_evaluators.hpp"
#include "evaluators/image_codec.hpp"

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

namespace aim {

// ─── vg1 ───────────────────────────────────────────────────────

MetricValues SaliencyEvaluator::evaluate(const Artifact& artifact) const {
    const cv::Mat& image = requireImage(artifact);

    cv::Mat gray;
    cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);

    cv::Scalar mean, stddev;
    cv::meanStdDev(gray, mean, stddev);
    if (stddev[0] == 0.0) {
        return {Base64Image{}};
    }

    int height = std::max(1, static_cast<int>(std::lround(
        static_cast<double>(kSpectrumWidth) * image.rows / image.cols)));
    cv::Mat small;
    cv::resize(gray, small, cv::Size(kSpectrumWidth, height), 0, 0, cv::INTER_AREA);
    small.convertTo(small, CV_32F, 1.0 / 255.0);

    cv::Mat planes[] = {small, cv::Mat::zeros(small.size(), CV_32F)};
    cv::Mat spectrum;
    cv::merge(planes, 2, spectrum);
    cv::dft(spectrum, spectrum);
    cv::split(spectrum, planes);

    cv::Mat amplitude, angle;
    cv::cartToPolar(planes[0], planes[1], amplitude, angle);
    amplitude += cv::Scalar::all(1e-9);

    cv::Mat log_amplitude, smoothed;
    cv::log(amplitude, log_amplitude);
    cv::blur(log_amplitude, smoothed, cv::Size(3, 3));
    cv::Mat residual = log_amplitude - smoothed;

    cv::exp(residual, amplitude);
    cv::polarToCart(amplitude, angle, planes[0], planes[1]);
    cv::merge(planes, 2, spectrum);
    cv::idft(spectrum, spectrum, cv::DFT_SCALE);
    cv::split(spectrum, planes);

    cv::Mat saliency;
    cv::magnitude(planes[0], planes[1], saliency);
    saliency = saliency.mul(saliency);
    cv::GaussianBlur(saliency, saliency, cv::Size(9, 9), 2.5);

    double min_val = 0.0, max_val = 0.0;
    cv::minMaxLoc(saliency, &min_val, &max_val);
    if (!(max_val - min_val > 0.0)) {
        return {Base64Image{}};
    }

    cv::Mat normalized;
    saliency.convertTo(normalized, CV_8U, 255.0 / (max_val - min_val),
                       -min_val * 255.0 / (max_val - min_val));
    cv::resize(normalized, normalized, image.size(), 0, 0, cv::INTER_LINEAR);

    cv::Mat heatmap;
    cv::applyColorMap(normalized, heatmap, cv::COLORMAP_JET);
    return {toBase64Png(heatmap)};
}

// ─── ac1 ───────────────────────────────────────────────────────

MetricValues ColourBlindnessEvaluator::evaluate(const Artifact& artifact) const {
    // Row-major RGB -> RGB simulation matrices.
    static const cv::Matx33f kDeuteranopia(
        0.367322f, 0.860646f, -0.227968f,
        0.280085f, 0.672501f, 0.047413f,
        -0.011820f, 0.042940f, 0.968881f);
    static const cv::Matx33f kProtanopia(
        0.152286f, 1.052583f, -0.204868f,
        0.114503f, 0.786281f, 0.099216f,
        -0.003882f, -0.048116f, 1.051998f);
    static const cv::Matx33f kTritanopia(
        1.255528f, -0.076749f, -0.178779f,
        -0.078411f, 0.930809f, 0.147602f,
        0.004733f, 0.691367f, 0.303900f);

    const cv::Mat& image = requireImage(artifact);
    cv::Mat rgb;
    cv::cvtColor(image, rgb, cv::COLOR_BGR2RGB);

    auto simulate = [&rgb](const cv::Matx33f& m) {
        cv::Mat simulated, bgr;
        cv::transform(rgb, simulated, m);   // saturates to [0, 255]
        cv::cvtColor(simulated, bgr, cv::COLOR_RGB2BGR);
        return toBase64Png(bgr);
    };

    return {simulate(kDeuteranopia), simulate(kProtanopia), simulate(kTritanopia)};
}

} // namespace aim
