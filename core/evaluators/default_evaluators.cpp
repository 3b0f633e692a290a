#include "evaluators/default_evaluators.hpp"
#include "evaluators/colour_evaluators.hpp"
#include "evaluators/edge_evaluators.hpp"
#include "evaluators/file_size_evaluators.hpp"
#include "evaluators/layout_evaluators.hpp"
#include "evaluators/visual_evaluators.hpp"

namespace aim {

void registerDefaultEvaluators(EvaluatorCatalog& catalog) {
    catalog.registerEvaluator(std::make_unique<PngFileSizeEvaluator>());
    catalog.registerEvaluator(std::make_unique<DistinctRgbEvaluator>());
    catalog.registerEvaluator(std::make_unique<HsvAverageEvaluator>());
    catalog.registerEvaluator(std::make_unique<HsvUniqueEvaluator>());
    catalog.registerEvaluator(std::make_unique<LabAverageEvaluator>());
    catalog.registerEvaluator(std::make_unique<ColourfulnessEvaluator>());
    catalog.registerEvaluator(std::make_unique<LuminanceDeviationEvaluator>());
    catalog.registerEvaluator(std::make_unique<StaticClusterEvaluator>());
    catalog.registerEvaluator(std::make_unique<DynamicClusterEvaluator>());
    catalog.registerEvaluator(std::make_unique<WaveEvaluator>());
    catalog.registerEvaluator(std::make_unique<EdgeDensityEvaluator>());
    catalog.registerEvaluator(std::make_unique<EdgeCongestionEvaluator>());
    catalog.registerEvaluator(std::make_unique<JpegFileSizeEvaluator>());
    catalog.registerEvaluator(std::make_unique<FigureGroundContrastEvaluator>());
    catalog.registerEvaluator(std::make_unique<PixelSymmetryEvaluator>());
    catalog.registerEvaluator(std::make_unique<QuadtreeEvaluator>());
    catalog.registerEvaluator(std::make_unique<SaliencyEvaluator>());
    catalog.registerEvaluator(std::make_unique<ColourBlindnessEvaluator>());
}

} // namespace aim
