/**
 * @file FaceScore.cpp
 * @brief Face score implementation
 */

#include <FaceGate/Detect/FaceScore.h>
#include <FaceGate/Core/Constants.h>
#include <FaceGate/Core/Exception.h>

#include <algorithm>
#include <cmath>

namespace FaceGate::Detect {

namespace {

inline bool Inside(const Image& image, int32_t x, int32_t y) {
    return x >= 0 && x < image.Width() && y >= 0 && y < image.Height();
}

/**
 * Widest count of pixels above threshold among rows [top, bottom) step
 * rowStep, columns [left, right).
 */
int32_t MaxRowCount(const Image& edges, int32_t top, int32_t bottom, int32_t rowStep,
                    int32_t left, int32_t right, int32_t threshold) {
    top = std::max(top, 0);
    bottom = std::min(bottom, edges.Height());
    left = std::max(left, 0);
    right = std::min(right, edges.Width());

    int32_t best = 0;
    for (int32_t y = top; y < bottom; y += rowStep) {
        const uint8_t* row = edges.RowPtr(y);
        int32_t count = 0;
        for (int32_t x = left; x < right; ++x) {
            if (row[x] > threshold) {
                ++count;
            }
        }
        best = std::max(best, count);
    }
    return best;
}

} // anonymous namespace

// =============================================================================
// Sub-scores
// =============================================================================

double SymmetryScore(const Image& edges, const FaceRegion& region, const ScoreParams& params) {
    // Axis on floor((minX + maxX) / 2), shared with FaceRegion::CenterX()
    const int32_t centerX = region.x + (region.width - 1) / 2;
    const double offsetLimit = std::min((region.width - 1) / 2.0,
                                        static_cast<double>(params.symmetryMaxOffset));

    double sum = 0.0;
    int64_t comparisons = 0;

    for (int32_t y = region.y; y < region.y + region.height; y += params.symmetryRowStep) {
        for (int32_t offset = 1; offset < offsetLimit; ++offset) {
            int32_t left = centerX - offset;
            int32_t right = centerX + offset;
            if (!Inside(edges, left, y) || !Inside(edges, right, y)) continue;

            double diff = std::abs(static_cast<double>(edges.At(left, y)) - edges.At(right, y));
            sum += std::max(0.0, params.symmetryTolerance - diff) / params.symmetryTolerance;
            ++comparisons;
        }
    }

    return comparisons > 0 ? sum / static_cast<double>(comparisons) : 0.0;
}

double EyePatternScore(const Image& edges, const FaceRegion& region, const ScoreParams& params) {
    int32_t top = region.y;
    int32_t bottom = region.y + static_cast<int32_t>(std::floor(region.height * params.eyeBandHeight));
    int32_t trim = static_cast<int32_t>(std::floor(region.width * params.eyeTrim));

    int32_t best = MaxRowCount(edges, top, bottom, params.eyeRowStep,
                               region.x + trim, region.x + region.width - trim,
                               params.eyeThreshold);

    double expected = region.width * params.eyeExpectedWidth;
    if (expected <= 0.0) return 0.0;
    return std::min(best / expected, 1.0);
}

double MouthPatternScore(const Image& edges, const FaceRegion& region, const ScoreParams& params) {
    int32_t top = region.y + static_cast<int32_t>(std::floor(region.height * params.mouthBandStart));
    int32_t bottom = region.y + region.height;
    int32_t trim = static_cast<int32_t>(std::floor(region.width * params.mouthTrim));

    int32_t best = MaxRowCount(edges, top, bottom, 1,
                               region.x + trim, region.x + region.width - trim,
                               params.mouthThreshold);

    double expected = region.width * params.mouthExpectedWidth;
    if (expected <= 0.0) return 0.0;
    return std::min(best / expected, 1.0);
}

double EdgeDistributionScore(const Image& edges, const FaceRegion& region,
                             const ScoreParams& params) {
    const int64_t totalPixels = region.Area();
    if (totalPixels <= 0) return 0.0;

    const int32_t centerX = region.x + (region.width - 1) / 2;
    const int32_t centerY = region.y + (region.height - 1) / 2;
    const double radius = std::min(region.width, region.height) * params.centerRadiusFactor;
    const double radiusSq = radius * radius;

    int64_t edgePixels = 0;
    int64_t centerEdges = 0;

    int32_t y0 = std::max(region.y, 0);
    int32_t y1 = std::min(region.y + region.height, edges.Height());
    int32_t x0 = std::max(region.x, 0);
    int32_t x1 = std::min(region.x + region.width, edges.Width());

    for (int32_t y = y0; y < y1; ++y) {
        const uint8_t* row = edges.RowPtr(y);
        for (int32_t x = x0; x < x1; ++x) {
            if (row[x] <= params.edgePixelThreshold) continue;
            ++edgePixels;

            double distSq = Square(static_cast<double>(x - centerX)) +
                            Square(static_cast<double>(y - centerY));
            if (distSq < radiusSq) {
                ++centerEdges;
            }
        }
    }

    double edgeDensity = static_cast<double>(edgePixels) / static_cast<double>(totalPixels);
    double concentration = static_cast<double>(centerEdges) /
                           static_cast<double>(std::max<int64_t>(edgePixels, 1));

    double densityScore = (edgeDensity > params.minEdgeDensity &&
                           edgeDensity < params.maxEdgeDensity) ? 1.0 : 0.5;
    double concentrationScore = concentration > params.minConcentration
        ? 1.0
        : concentration / params.minConcentration;

    return (densityScore + concentrationScore) / 2.0;
}

double PositionScore(const FaceRegion& region, int32_t mapWidth, int32_t mapHeight,
                     const ScoreParams& params) {
    if (mapWidth <= 0 || mapHeight <= 0) return 0.0;

    double cx = region.CenterX() / mapWidth;
    double cy = region.CenterY() / mapHeight;

    double horizontal = 1.0 - std::abs(cx - 0.5) * 2.0;
    double vertical = cy < params.verticalPreference
        ? 1.0
        : std::max(0.0, 1.0 - (cy - params.verticalPreference) * params.verticalFalloff);

    return std::max(0.0, (horizontal + vertical) / 2.0);
}

// =============================================================================
// Combined Score
// =============================================================================

FaceScoreBreakdown ScoreFaceRegion(const Image& edges, const FaceRegion& region,
                                   const ScoreParams& params) {
    if (edges.Channels() != 1) {
        throw UnsupportedException("ScoreFaceRegion requires single-channel edge map");
    }

    FaceScoreBreakdown score;
    score.symmetry = SymmetryScore(edges, region, params);
    score.eye = EyePatternScore(edges, region, params);
    score.mouth = MouthPatternScore(edges, region, params);
    score.edgeDistribution = EdgeDistributionScore(edges, region, params);
    score.position = PositionScore(region, edges.Width(), edges.Height(), params);

    double total = score.symmetry * params.symmetryWeight +
                   score.eye * params.eyeWeight +
                   score.mouth * params.mouthWeight +
                   score.edgeDistribution * params.edgeDistributionWeight +
                   score.position * params.positionWeight;
    score.total = Clamp(total, 0.0, 1.0);
    return score;
}

} // namespace FaceGate::Detect
