#pragma once

/**
 * @file DetectTypes.h
 * @brief Face detection parameters, results and overlap resolution
 *
 * Contains:
 * - DetectionPass: seed / admission thresholds of one detection pass
 * - ScoreParams: weights and calibration values of the face score
 * - DetectParams: geometric filter and pass list
 * - FaceScoreBreakdown, PassStatistics, LocateResult
 * - OverlapArea / SuppressOverlapping utilities
 *
 * All default values are empirical calibration values, not derived ones.
 */

#include <FaceGate/Core/Types.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace FaceGate::Detect {

// =============================================================================
// Parameters
// =============================================================================

/**
 * @brief Threshold pair of one detection pass
 */
struct DetectionPass {
    int32_t edgeThreshold = 40;     ///< Seed must reach this edge intensity
    int32_t regionThreshold = 25;   ///< Growth admits pixels at or above this
};

/**
 * @brief Face score weights and sub-score calibration
 */
struct ScoreParams {
    // Weights (sum to 1)
    double symmetryWeight = 0.30;
    double eyeWeight = 0.25;
    double mouthWeight = 0.20;
    double edgeDistributionWeight = 0.15;
    double positionWeight = 0.10;

    // Symmetry
    int32_t symmetryRowStep = 2;
    int32_t symmetryMaxOffset = 15;     ///< Offsets compared: 1 .. < min(width/2, max)
    double symmetryTolerance = 50.0;    ///< Intensity difference scoring 0

    // Eye band: top part of the region, trimmed horizontally
    double eyeBandHeight = 0.4;
    double eyeTrim = 0.15;
    int32_t eyeThreshold = 40;
    double eyeExpectedWidth = 0.7;
    int32_t eyeRowStep = 2;

    // Mouth band: bottom part of the region, trimmed horizontally
    double mouthBandStart = 0.6;
    double mouthTrim = 0.2;
    int32_t mouthThreshold = 35;
    double mouthExpectedWidth = 0.6;

    // Edge distribution
    int32_t edgePixelThreshold = 30;
    double minEdgeDensity = 0.1;        ///< Exclusive bounds for full density score
    double maxEdgeDensity = 0.4;
    double centerRadiusFactor = 0.3;    ///< Disk radius relative to min(width, height)
    double minConcentration = 0.3;

    // Position
    double verticalPreference = 0.6;    ///< Normalized center row below which score is 1
    double verticalFalloff = 2.5;

    static ScoreParams Default() {
        return ScoreParams();
    }

    void Validate() const;
};

/**
 * @brief Face locator configuration
 */
struct DetectParams {
    int32_t analysisSize = 400;         ///< Side of the square edge map
    double minFaceSize = 0.1;           ///< minRegionSize = floor(analysisSize * minFaceSize)
    int32_t seedStride = 8;             ///< Seed scan step in both axes

    double minComponentFactor = 0.08;   ///< Keep if size > minRegionSize^2 * factor

    // Geometric filter (exclusive bounds)
    double minAspectRatio = 0.6;
    double maxAspectRatio = 1.7;
    double minSizeRatio = 0.5;          ///< min(w,h) / max(w,h)
    double minExtentFactor = 0.8;       ///< w and h > minRegionSize * factor
    double minDensity = 0.1;
    double maxDensity = 0.8;

    double minFaceScore = 0.3;          ///< Keep if score > minFaceScore
    double maxOverlap = 0.3;            ///< Overlap ratio above which the weaker region is dropped
    int32_t maxFaces = 1;

    /// Passes tried in order until one yields a region
    std::vector<DetectionPass> passes = {{40, 25}, {30, 20}, {20, 15}};

    ScoreParams score;

    static DetectParams Default() {
        return DetectParams();
    }

    // Builder pattern
    DetectParams& SetAnalysisSize(int32_t v) { analysisSize = v; return *this; }
    DetectParams& SetMinFaceSize(double v) { minFaceSize = v; return *this; }
    DetectParams& SetMinFaceScore(double v) { minFaceScore = v; return *this; }
    DetectParams& SetMaxOverlap(double v) { maxOverlap = v; return *this; }
    DetectParams& SetMaxFaces(int32_t v) { maxFaces = v; return *this; }
    DetectParams& SetPasses(std::vector<DetectionPass> v) { passes = std::move(v); return *this; }
    DetectParams& SetAspectRange(double minRatio, double maxRatio) {
        minAspectRatio = minRatio;
        maxAspectRatio = maxRatio;
        return *this;
    }
    DetectParams& SetDensityRange(double minValue, double maxValue) {
        minDensity = minValue;
        maxDensity = maxValue;
        return *this;
    }

    /// floor(mapWidth * minFaceSize)
    int32_t MinRegionSize(int32_t mapWidth) const {
        return static_cast<int32_t>(std::floor(mapWidth * minFaceSize));
    }

    /// @throws InvalidArgumentException on out-of-range values
    void Validate() const;
};

// =============================================================================
// Results
// =============================================================================

/**
 * @brief Individual face sub-scores, each in [0, 1]
 */
struct FaceScoreBreakdown {
    double symmetry = 0.0;
    double eye = 0.0;
    double mouth = 0.0;
    double edgeDistribution = 0.0;
    double position = 0.0;
    double total = 0.0;             ///< Weighted sum, clamped to 1
};

/**
 * @brief Region counts after each stage of one pass
 */
struct PassStatistics {
    DetectionPass pass;
    size_t initial = 0;             ///< Grown components above the size floor
    size_t geometric = 0;           ///< After geometric filter
    size_t scored = 0;              ///< After face score cutoff
    size_t accepted = 0;            ///< After overlap resolution
};

/**
 * @brief Accepted regions of a multi-pass detection
 */
struct DetectionResult {
    std::vector<FaceRegion> regions;
    int32_t passIndex = -1;         ///< Pass that produced regions (-1 if none)
    std::vector<PassStatistics> passes;
};

/**
 * @brief Located face
 */
struct LocateResult {
    FaceRegion region;              ///< In edge-map coordinates
    Rect2i sourceRegion;            ///< Same box in source image pixels
    int32_t mapSize = 0;            ///< Edge map side length
    int32_t passIndex = 0;
    std::vector<PassStatistics> passes;
};

// =============================================================================
// Overlap Resolution
// =============================================================================

/**
 * @brief Intersection area of two region boxes
 */
inline int64_t OverlapArea(const FaceRegion& a, const FaceRegion& b) {
    return a.Bounds().Intersect(b.Bounds()).Area();
}

/**
 * @brief Greedy non-maximum suppression by overlap ratio
 * @param regions Scored regions in detection order
 * @param maxOverlap Maximum overlap ratio [0, 1]
 * @return Kept regions, highest score first
 *
 * Overlap is computed as: intersection_area / min(area1, area2).
 * Regions are stably sorted by faceScore (descending, ties keep input
 * order); a region is dropped if its overlap with any kept region exceeds
 * maxOverlap.
 */
inline std::vector<FaceRegion> SuppressOverlapping(
    std::vector<FaceRegion> regions,
    double maxOverlap)
{
    if (regions.size() <= 1) return regions;

    std::stable_sort(regions.begin(), regions.end(),
                     [](const FaceRegion& a, const FaceRegion& b) {
                         return a.faceScore > b.faceScore;
                     });

    std::vector<FaceRegion> result;
    result.reserve(regions.size());

    for (const auto& region : regions) {
        bool suppress = false;

        for (const auto& kept : result) {
            double minArea = static_cast<double>(std::min(region.Area(), kept.Area()));
            double overlapRatio = (minArea > 0.0)
                ? static_cast<double>(OverlapArea(region, kept)) / minArea
                : 0.0;

            if (overlapRatio > maxOverlap) {
                suppress = true;
                break;
            }
        }

        if (!suppress) {
            result.push_back(region);
        }
    }

    return result;
}

} // namespace FaceGate::Detect
