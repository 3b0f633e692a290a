#include <gtest/gtest.h>
#include "registry/metric_registry.hpp"
#include "evaluators/default_evaluators.hpp"
#include "common/errors.hpp"
#include "test_helpers.hpp"

using namespace aim;
using aim_test::band;
using aim_test::intMetric;
using aim_test::metric;
using aim_test::result;

// ─── Helper: minimal registry document ────────────────────────

static std::string twoMetricDocument() {
    return R"({
      "categories": [
        {"id": "cp", "name": "Colour Perception"},
        {"id": "pf", "name": "Perceptual Fluency", "icon": ["fas", "eye"]}
      ],
      "metrics": {
        "zeta": {
          "id": "zeta", "name": "Zeta", "category": "pf", "description": false,
          "evidence": 3, "relevance": 4, "speed": 0, "visualizationType": "table",
          "results": [
            {"id": "zeta_1", "index": 1, "type": "float", "name": "Second"},
            {"id": "zeta_0", "index": 0, "type": "int", "name": "First",
             "scores": [
               {"id": "r1", "range": [null, 10], "description": "Low", "icon": [null, null]},
               {"id": "r2", "range": [10.01, null], "judgment": "bad", "description": "High"}
             ]}
          ]
        },
        "alpha": {
          "id": "alpha", "name": "Alpha", "category": "cp", "description": "Image output",
          "evidence": 1, "relevance": 5, "speed": 2, "visualizationType": "b64",
          "results": [
            {"id": "alpha_0", "index": 0, "type": "b64", "name": "Map", "description": false}
          ]
        }
      }
    })";
}

// ─── Loading ──────────────────────────────────────────────────

TEST(RegistryTest, LoadsDocumentInRegistrationOrder) {
    MetricRegistry registry = MetricRegistry::loadFromString(twoMetricDocument());

    ASSERT_EQ(registry.count(), 2u);
    EXPECT_EQ(registry.metrics()[0].id, "zeta");
    EXPECT_EQ(registry.metrics()[1].id, "alpha");
    EXPECT_EQ(registry.metrics()[0].registration_order, 0u);
    EXPECT_EQ(registry.metrics()[1].registration_order, 1u);

    ASSERT_EQ(registry.categories().size(), 2u);
    EXPECT_EQ(registry.categories()[1].icon, "fas eye");
}

TEST(RegistryTest, ParsesDescriptorFields) {
    MetricRegistry registry = MetricRegistry::loadFromString(twoMetricDocument());

    const MetricDescriptor* zeta = registry.lookup("zeta");
    ASSERT_NE(zeta, nullptr);
    EXPECT_EQ(zeta->category_id, "pf");
    EXPECT_EQ(zeta->evidence, 3);
    EXPECT_EQ(zeta->relevance, 4);
    EXPECT_EQ(zeta->speed, Speed::SLOW);
    EXPECT_EQ(zeta->visualization, VisualizationType::TABLE);
    EXPECT_EQ(zeta->description, "");

    // Results are sorted by index
    ASSERT_EQ(zeta->results.size(), 2u);
    EXPECT_EQ(zeta->results[0].id, "zeta_0");
    EXPECT_EQ(zeta->results[0].type, ValueType::INTEGER);
    EXPECT_EQ(zeta->results[1].type, ValueType::FLOAT);

    const auto& bands = zeta->results[0].scores;
    ASSERT_EQ(bands.size(), 2u);
    EXPECT_FALSE(bands[0].min.has_value());
    EXPECT_DOUBLE_EQ(*bands[0].max, 10.0);
    EXPECT_EQ(bands[0].icon, "");
    EXPECT_EQ(bands[1].judgment, "bad");
    EXPECT_FALSE(bands[1].max.has_value());

    const MetricDescriptor* alpha = registry.lookup("alpha");
    ASSERT_NE(alpha, nullptr);
    EXPECT_EQ(alpha->visualization, VisualizationType::IMAGE);
    EXPECT_EQ(alpha->results[0].type, ValueType::IMAGE_BLOB);
}

TEST(RegistryTest, LookupUnknownReturnsNull) {
    MetricRegistry registry = MetricRegistry::loadFromString(twoMetricDocument());
    EXPECT_EQ(registry.lookup("missing"), nullptr);
    EXPECT_FALSE(registry.contains("missing"));
    EXPECT_TRUE(registry.contains("alpha"));
}

TEST(RegistryTest, ListByCategoryKeepsRegistrationOrder) {
    auto a = intMetric("a");
    auto b = intMetric("b");
    auto c = intMetric("c");
    b.category_id = "other";
    MetricRegistry registry = MetricRegistry::fromDescriptors({a, b, c});

    auto listed = registry.listByCategory("test");
    ASSERT_EQ(listed.size(), 2u);
    EXPECT_EQ(listed[0]->id, "a");
    EXPECT_EQ(listed[1]->id, "c");
    EXPECT_TRUE(registry.listByCategory("nothing").empty());
}

TEST(RegistryTest, ShippedRegistryMatchesDefaultEvaluators) {
    MetricRegistry registry = MetricRegistry::loadFromFile(AIM_SOURCE_DIR "/config/metrics.json");
    EvaluatorCatalog catalog;
    registerDefaultEvaluators(catalog);

    EXPECT_EQ(registry.count(), 18u);
    EXPECT_EQ(catalog.count(), registry.count());
    for (const auto& m : registry.metrics()) {
        EXPECT_TRUE(catalog.contains(m.id)) << m.id;
    }
    EXPECT_EQ(registry.lookup("cp1")->results[0].scores[0].description, "Suitable");
}

// ─── Validation failures ──────────────────────────────────────

TEST(RegistryTest, RejectsDuplicateMetricKeys) {
    std::string doc = R"({"metrics": {
      "m": {"id": "m", "name": "M", "category": "c", "evidence": 1, "relevance": 1,
            "speed": 1, "visualizationType": "table",
            "results": [{"id": "m_0", "index": 0, "type": "int", "name": "x"}]},
      "m": {"id": "m", "name": "M", "category": "c", "evidence": 1, "relevance": 1,
            "speed": 1, "visualizationType": "table",
            "results": [{"id": "m_0", "index": 0, "type": "int", "name": "x"}]}
    }})";
    EXPECT_THROW(MetricRegistry::loadFromString(doc), RegistryError);
}

TEST(RegistryTest, RejectsDuplicateDescriptorIds) {
    EXPECT_THROW(MetricRegistry::fromDescriptors({intMetric("a"), intMetric("a")}),
                 RegistryError);
}

TEST(RegistryTest, RejectsIdKeyMismatch) {
    std::string doc = R"({"metrics": {
      "m": {"id": "other", "name": "M", "category": "c", "evidence": 1, "relevance": 1,
            "speed": 1, "visualizationType": "table",
            "results": [{"id": "m_0", "index": 0, "type": "int", "name": "x"}]}
    }})";
    EXPECT_THROW(MetricRegistry::loadFromString(doc), RegistryError);
}

TEST(RegistryTest, RejectsNonContiguousIndices) {
    auto gap = metric("gap", Speed::FAST, {result("g0", 0, ValueType::INTEGER),
                                           result("g2", 2, ValueType::INTEGER)});
    EXPECT_THROW(MetricRegistry::fromDescriptors({gap}), RegistryError);

    auto dup = metric("dup", Speed::FAST, {result("d0", 0, ValueType::INTEGER),
                                           result("d1", 0, ValueType::INTEGER)});
    EXPECT_THROW(MetricRegistry::fromDescriptors({dup}), RegistryError);
}

TEST(RegistryTest, RejectsInvertedBand) {
    auto m = metric("m", Speed::FAST,
                    {result("m0", 0, ValueType::FLOAT, {band("r1", 5.0, 1.0, "Bad")})});
    EXPECT_THROW(MetricRegistry::fromDescriptors({m}), RegistryError);
}

TEST(RegistryTest, RejectsBandShadowedByUnboundedEarlierBand) {
    auto m = metric("m", Speed::FAST,
                    {result("m0", 0, ValueType::FLOAT,
                            {band("r1", 0.0, std::nullopt, "Any"),
                             band("r2", 10.0, 20.0, "Never reached")})});
    EXPECT_THROW(MetricRegistry::fromDescriptors({m}), RegistryError);
}

TEST(RegistryTest, RejectsBandContainedInEarlierBand) {
    auto m = metric("m", Speed::FAST,
                    {result("m0", 0, ValueType::FLOAT,
                            {band("r1", 0.0, 100.0, "Wide"), band("r2", 10.0, 20.0, "Narrow")})});
    EXPECT_THROW(MetricRegistry::fromDescriptors({m}), RegistryError);
}

TEST(RegistryTest, AcceptsOverlappingButReachableBands) {
    auto m = metric("m", Speed::FAST,
                    {result("m0", 0, ValueType::FLOAT,
                            {band("r1", 0.0, 10.0, "Low"), band("r2", 10.0, 20.0, "High")})});
    EXPECT_NO_THROW(MetricRegistry::fromDescriptors({m}));
}

TEST(RegistryTest, RejectsBandsOnImageResult) {
    auto m = metric("m", Speed::FAST,
                    {result("m0", 0, ValueType::IMAGE_BLOB, {band("r1", 0.0, 1.0, "x")})});
    EXPECT_THROW(MetricRegistry::fromDescriptors({m}), RegistryError);
}

TEST(RegistryTest, RejectsOutOfRangeRatings) {
    auto m = intMetric("m");
    m.evidence = 6;
    EXPECT_THROW(MetricRegistry::fromDescriptors({m}), RegistryError);

    m.evidence = 3;
    m.relevance = 0;
    EXPECT_THROW(MetricRegistry::fromDescriptors({m}), RegistryError);
}

TEST(RegistryTest, RejectsUndeclaredCategory) {
    CategoryDescriptor cat;
    cat.id = "cp";
    EXPECT_THROW(MetricRegistry::fromDescriptors({intMetric("m")}, {cat}), RegistryError);
}

TEST(RegistryTest, RejectsMetricWithoutResults) {
    auto m = intMetric("m");
    m.results.clear();
    EXPECT_THROW(MetricRegistry::fromDescriptors({m}), RegistryError);
}

TEST(RegistryTest, RejectsMalformedDocuments) {
    EXPECT_THROW(MetricRegistry::loadFromString("{not json"), RegistryError);
    EXPECT_THROW(MetricRegistry::loadFromString(R"({"categories": []})"), RegistryError);

    std::string bad_type = R"({"metrics": {
      "m": {"id": "m", "name": "M", "category": "c", "evidence": 1, "relevance": 1,
            "speed": 1, "visualizationType": "table",
            "results": [{"id": "m_0", "index": 0, "type": "complex", "name": "x"}]}
    }})";
    EXPECT_THROW(MetricRegistry::loadFromString(bad_type), RegistryError);

    std::string bad_speed = R"({"metrics": {
      "m": {"id": "m", "name": "M", "category": "c", "evidence": 1, "relevance": 1,
            "speed": 3, "visualizationType": "table",
            "results": [{"id": "m_0", "index": 0, "type": "int", "name": "x"}]}
    }})";
    EXPECT_THROW(MetricRegistry::loadFromString(bad_speed), RegistryError);
}

TEST(RegistryTest, MissingFileThrows) {
    EXPECT_THROW(MetricRegistry::loadFromFile("/nonexistent/metrics.json"), RegistryError);
}
