#pragma once

/**
 * @file FaceScore.h
 * @brief Face likelihood of a candidate region on an edge map
 *
 * Score = weighted sum of five sub-scores, clamped to 1:
 * - symmetry (0.30): left/right edge intensity agreement around the center
 * - eye (0.25): widest edge row in the top band
 * - mouth (0.20): widest edge row in the bottom band
 * - edge distribution (0.15): edge density and concentration near the center
 * - position (0.10): preference for horizontally centered, upper regions
 */

#include <FaceGate/Core/Image.h>
#include <FaceGate/Core/Types.h>
#include <FaceGate/Detect/DetectTypes.h>

namespace FaceGate::Detect {

/**
 * @brief Mean left/right agreement, 0 if no pair was compared
 */
double SymmetryScore(const Image& edges, const FaceRegion& region,
                     const ScoreParams& params = ScoreParams());

/**
 * @brief Widest row of strong edges in the top band / expected eye span
 */
double EyePatternScore(const Image& edges, const FaceRegion& region,
                       const ScoreParams& params = ScoreParams());

/**
 * @brief Widest row of strong edges in the bottom band / expected mouth span
 */
double MouthPatternScore(const Image& edges, const FaceRegion& region,
                         const ScoreParams& params = ScoreParams());

/**
 * @brief Average of edge density score and center concentration score
 */
double EdgeDistributionScore(const Image& edges, const FaceRegion& region,
                             const ScoreParams& params = ScoreParams());

/**
 * @brief Position preference of the region center within the map
 * @param mapWidth Edge map width
 * @param mapHeight Edge map height
 */
double PositionScore(const FaceRegion& region, int32_t mapWidth, int32_t mapHeight,
                     const ScoreParams& params = ScoreParams());

/**
 * @brief All sub-scores and the clamped weighted total
 * @param edges Single-channel edge map the region was grown on
 * @param region Candidate region (bounds inside the map)
 */
FaceScoreBreakdown ScoreFaceRegion(const Image& edges, const FaceRegion& region,
                                   const ScoreParams& params = ScoreParams());

/**
 * @brief Weighted total only
 */
inline double ComputeFaceScore(const Image& edges, const FaceRegion& region,
                               const ScoreParams& params = ScoreParams()) {
    return ScoreFaceRegion(edges, region, params).total;
}

} // namespace FaceGate::Detect
