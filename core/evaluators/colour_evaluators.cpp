#include "evaluators/colour_evaluators.hpp"

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <array>
#include <cmath>
#include <vector>

namespace aim {

namespace {

constexpr double kPi = 3.14159265358979323846;

struct MeanStd {
    double mean = 0.0;
    double std = 0.0;
};

MeanStd meanStd(const cv::Mat& single_channel) {
    cv::Scalar mean, stddev;
    cv::meanStdDev(single_channel, mean, stddev);
    return {mean[0], stddev[0]};
}

/// Pack each 3-channel pixel into one integer and sort, so equal
/// colours form runs.
std::vector<uint32_t> sortedPixels(const cv::Mat& image) {
    std::vector<uint32_t> packed;
    packed.reserve(image.total());
    for (int y = 0; y < image.rows; y++) {
        const cv::Vec3b* row = image.ptr<cv::Vec3b>(y);
        for (int x = 0; x < image.cols; x++) {
            packed.push_back((uint32_t(row[x][0]) << 16) | (uint32_t(row[x][1]) << 8) | row[x][2]);
        }
    }
    std::sort(packed.begin(), packed.end());
    return packed;
}

/// Count runs in a sorted vector whose length satisfies keep(length).
template <typename Keep>
int64_t countRuns(const std::vector<uint32_t>& sorted, Keep keep) {
    int64_t count = 0;
    size_t i = 0;
    while (i < sorted.size()) {
        size_t j = i;
        while (j < sorted.size() && sorted[j] == sorted[i]) j++;
        if (keep(j - i)) count++;
        i = j;
    }
    return count;
}

struct ColourCount {
    uint32_t colour;
    size_t count;
};

/// Distinct colours of a sorted pixel vector with their pixel counts.
std::vector<ColourCount> colourCounts(const std::vector<uint32_t>& sorted) {
    std::vector<ColourCount> counts;
    size_t i = 0;
    while (i < sorted.size()) {
        size_t j = i;
        while (j < sorted.size() && sorted[j] == sorted[i]) j++;
        counts.push_back({sorted[i], j - i});
        i = j;
    }
    return counts;
}

/// Channels of a packed BGR pixel, in B, G, R order.
std::array<int, 3> unpack(uint32_t packed) {
    return {static_cast<int>((packed >> 16) & 0xFF), static_cast<int>((packed >> 8) & 0xFF),
            static_cast<int>(packed & 0xFF)};
}

struct WaveColour {
    int r, g, b;
    double score;
};

// Palmer & Schloss (2010) rated colours, normalized to [0, 1].
const WaveColour kWaveColours[] = {
    {24, 155, 154, 0.6377440347071583},  {37, 152, 114, 0.7125813449023862},
    {59, 125, 181, 0.7396963123644252},  {86, 197, 208, 0.8297180043383949},
    {96, 163, 215, 1.0},                 {101, 190, 131, 0.648590021691974},
    {115, 56, 145, 0.8080260303687636},  {124, 159, 201, 0.8318872017353579},
    {126, 152, 68, 0.3579175704989154},  {129, 199, 144, 0.5726681127982647},
    {133, 204, 208, 0.5932754880694144}, {156, 78, 155, 0.6843817787418656},
    {159, 90, 48, 0.18329718004338397},  {162, 32, 66, 0.8481561822125814},
    {162, 115, 167, 0.7451193058568331}, {162, 149, 59, 0.0},
    {164, 219, 228, 0.7028199566160521}, {170, 194, 228, 0.7537960954446855},
    {177, 200, 101, 0.33731019522776573}, {179, 208, 68, 0.4652928416485901},
    {184, 158, 199, 0.63882863340564},   {193, 224, 196, 0.46095444685466386},
    {204, 119, 141, 0.4859002169197397}, {208, 154, 119, 0.39154013015184386},
    {218, 198, 118, 0.49132321041214755}, {224, 231, 153, 0.2928416485900217},
    {235, 45, 92, 0.5488069414316703},   {242, 149, 185, 0.4577006507592191},
    {243, 145, 51, 0.7114967462039046},  {251, 200, 166, 0.3741865509761389},
    {252, 232, 158, 0.5140997830802604}, {253, 228, 51, 0.7201735357917572},
};

/// Score of the nearest rated colour; ties go to the earlier entry.
double waveScore(int r, int g, int b) {
    int best = -1;
    double score = 0.0;
    for (const auto& c : kWaveColours) {
        int d = (r - c.r) * (r - c.r) + (g - c.g) * (g - c.g) + (b - c.b) * (b - c.b);
        if (best < 0 || d < best) {
            best = d;
            score = c.score;
        }
    }
    return score;
}

cv::Mat toUnitFloat(const cv::Mat& image) {
    cv::Mat f;
    image.convertTo(f, CV_32FC3, 1.0 / 255.0);
    return f;
}

} // namespace

// ─── cp2 ───────────────────────────────────────────────────────

MetricValues DistinctRgbEvaluator::evaluate(const Artifact& artifact) const {
    const cv::Mat& image = requireImage(artifact);
    int64_t colours = countRuns(sortedPixels(image), [](size_t n) {
        return n >= static_cast<size_t>(kMinOccurrences);
    });
    return {colours};
}

// ─── cp3 ───────────────────────────────────────────────────────

MetricValues HsvAverageEvaluator::evaluate(const Artifact& artifact) const {
    const cv::Mat& image = requireImage(artifact);

    cv::Mat hsv;
    cv::cvtColor(toUnitFloat(image), hsv, cv::COLOR_BGR2HSV);  // H in [0, 360)
    std::vector<cv::Mat> channels;
    cv::split(hsv, channels);

    // Hue is an angle: average it on the unit circle.
    double sum_sin = 0.0;
    double sum_cos = 0.0;
    for (int y = 0; y < channels[0].rows; y++) {
        const float* row = channels[0].ptr<float>(y);
        for (int x = 0; x < channels[0].cols; x++) {
            double rad = row[x] * kPi / 180.0;
            sum_sin += std::sin(rad);
            sum_cos += std::cos(rad);
        }
    }
    double avg_hue = std::atan2(sum_sin, sum_cos) * 180.0 / kPi;
    avg_hue = std::fmod(avg_hue + 360.0, 360.0);

    MeanStd saturation = meanStd(channels[1]);
    MeanStd value = meanStd(channels[2]);
    return {avg_hue, saturation.mean, saturation.std, value.mean, value.std};
}

// ─── cp4 ───────────────────────────────────────────────────────

MetricValues HsvUniqueEvaluator::evaluate(const Artifact& artifact) const {
    const cv::Mat& image = requireImage(artifact);

    cv::Mat hsv;
    cv::cvtColor(image, hsv, cv::COLOR_BGR2HSV);  // 8-bit: H in [0, 180)

    std::vector<uint32_t> sorted = sortedPixels(hsv);
    int64_t frequent = countRuns(sorted, [](size_t n) {
        return n > static_cast<size_t>(kMinOccurrences);
    });

    std::array<bool, 256> hues{}, sats{}, vals{};
    for (uint32_t p : sorted) {
        hues[(p >> 16) & 0xFF] = true;
        sats[(p >> 8) & 0xFF] = true;
        vals[p & 0xFF] = true;
    }
    auto levels = [](const std::array<bool, 256>& seen) {
        return static_cast<int64_t>(std::count(seen.begin(), seen.end(), true));
    };
    return {frequent, levels(hues), levels(sats), levels(vals)};
}

// ─── cp5 ───────────────────────────────────────────────────────

MetricValues LabAverageEvaluator::evaluate(const Artifact& artifact) const {
    const cv::Mat& image = requireImage(artifact);

    cv::Mat lab;
    cv::cvtColor(toUnitFloat(image), lab, cv::COLOR_BGR2Lab);
    std::vector<cv::Mat> channels;
    cv::split(lab, channels);

    MeanStd l = meanStd(channels[0]);
    MeanStd a = meanStd(channels[1]);
    MeanStd b = meanStd(channels[2]);
    return {l.mean, l.std, a.mean, a.std, b.mean, b.std};
}

// ─── cp6 ───────────────────────────────────────────────────────

MetricValues ColourfulnessEvaluator::evaluate(const Artifact& artifact) const {
    const cv::Mat& image = requireImage(artifact);

    cv::Mat f;
    image.convertTo(f, CV_64FC3);
    std::vector<cv::Mat> bgr;
    cv::split(f, bgr);

    cv::Mat rg = cv::abs(bgr[2] - bgr[1]);
    cv::Mat yb = cv::abs(0.5 * (bgr[2] + bgr[1]) - bgr[0]);

    MeanStd rg_stats = meanStd(rg);
    MeanStd yb_stats = meanStd(yb);
    double mean_rgyb = std::sqrt(rg_stats.mean * rg_stats.mean + yb_stats.mean * yb_stats.mean);
    double std_rgyb = std::sqrt(rg_stats.std * rg_stats.std + yb_stats.std * yb_stats.std);
    double colourfulness = std_rgyb + 0.3 * mean_rgyb;

    return {rg_stats.mean, rg_stats.std, yb_stats.mean, yb_stats.std,
            mean_rgyb, std_rgyb, colourfulness};
}

// ─── cp7 ───────────────────────────────────────────────────────

MetricValues StaticClusterEvaluator::evaluate(const Artifact& artifact) const {
    const cv::Mat& image = requireImage(artifact);

    const int step = 256 / kLevels;
    std::vector<int64_t> cells(kLevels * kLevels * kLevels, 0);
    for (int y = 0; y < image.rows; y++) {
        const cv::Vec3b* row = image.ptr<cv::Vec3b>(y);
        for (int x = 0; x < image.cols; x++) {
            int r = row[x][2] / step;
            int g = row[x][1] / step;
            int b = row[x][0] / step;
            cells[(r * kLevels + g) * kLevels + b]++;
        }
    }

    int64_t clusters = std::count_if(cells.begin(), cells.end(),
                                     [](int64_t n) { return n > kMinOccurrences; });
    return {clusters};
}

// ─── cp8 ───────────────────────────────────────────────────────

MetricValues DynamicClusterEvaluator::evaluate(const Artifact& artifact) const {
    const cv::Mat& image = requireImage(artifact);

    std::vector<ColourCount> colours = colourCounts(sortedPixels(image));
    std::stable_sort(colours.begin(), colours.end(),
                     [](const ColourCount& a, const ColourCount& b) { return a.count > b.count; });

    struct Cluster {
        std::array<int, 3> centre;
        int64_t weight;
        int64_t colours;
    };
    std::vector<Cluster> clusters;
    const double max_sq = kMaxDistance * kMaxDistance;

    for (const auto& c : colours) {
        if (c.count < static_cast<size_t>(kMinFrequency)) break;
        std::array<int, 3> point = unpack(c.colour);
        const int64_t weight = static_cast<int64_t>(c.count);

        bool merged = false;
        for (auto& cluster : clusters) {
            double sq = 0.0;
            for (int i = 0; i < 3; i++) {
                double d = point[i] - cluster.centre[i];
                sq += d * d;
            }
            if (sq > max_sq) continue;

            int64_t total = cluster.weight + weight;
            for (int i = 0; i < 3; i++) {
                cluster.centre[i] = static_cast<int>(
                    (point[i] * weight + cluster.centre[i] * cluster.weight) / total);
            }
            cluster.weight = total;
            cluster.colours++;
            merged = true;
            break;
        }
        if (!merged) clusters.push_back({point, weight, 1});
    }

    int64_t count = 0;
    int64_t colours_in_clusters = 0;
    for (const auto& cluster : clusters) {
        if (cluster.colours > kMinColours) {
            count++;
            colours_in_clusters += cluster.colours;
        }
    }
    int64_t average = count > 0 ? colours_in_clusters / count : 0;
    return {count, average};
}

// ─── cp9 ───────────────────────────────────────────────────────

MetricValues LuminanceDeviationEvaluator::evaluate(const Artifact& artifact) const {
    const cv::Mat& image = requireImage(artifact);

    cv::Mat f;
    image.convertTo(f, CV_64FC3);
    cv::Mat luma;
    cv::transform(f, luma, cv::Matx13d(0.0722, 0.7152, 0.2126));  // B, G, R weights

    return {meanStd(luma).std};
}

// ─── cp10 ──────────────────────────────────────────────────────

MetricValues WaveEvaluator::evaluate(const Artifact& artifact) const {
    const cv::Mat& image = requireImage(artifact);

    // Score each distinct colour once
    double sum = 0.0;
    for (const auto& c : colourCounts(sortedPixels(image))) {
        std::array<int, 3> bgr = unpack(c.colour);
        sum += waveScore(bgr[2], bgr[1], bgr[0]) * static_cast<double>(c.count);
    }
    return {sum / static_cast<double>(image.total())};
}

} // namespace aim
