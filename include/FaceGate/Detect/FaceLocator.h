#pragma once

/**
 * @file FaceLocator.h
 * @brief Heuristic single-face locator on edge maps
 *
 * Pipeline per pass:
 *   seeds (strided scan) -> GrowRegion -> size floor -> geometric filter
 *   -> face score cutoff -> overlap resolution
 *
 * Passes run with decreasing thresholds and stop at the first pass that
 * yields a region.
 *
 * @code
 * Detect::LocateResult face = Detect::LocateFace(bytes);
 * Rect2i box = face.sourceRegion;
 * @endcode
 */

#include <FaceGate/Core/Image.h>
#include <FaceGate/Core/Types.h>
#include <FaceGate/Detect/DetectTypes.h>

#include <vector>

namespace FaceGate::Detect {

// =============================================================================
// Edge Map Level
// =============================================================================

/**
 * @brief Run a single detection pass on an edge map
 *
 * @param edges Single-channel edge map
 * @param pass Seed / admission thresholds
 * @param params Locator configuration (pass list is ignored)
 * @param stats Optional stage counts of this pass
 * @return Accepted regions, highest score first
 */
std::vector<FaceRegion> FindFaceRegions(const Image& edges,
                                        const DetectionPass& pass,
                                        const DetectParams& params = DetectParams(),
                                        PassStatistics* stats = nullptr);

/**
 * @brief Run the pass list until one pass yields regions
 */
DetectionResult DetectFaceCandidates(const Image& edges,
                                     const DetectParams& params = DetectParams());

/**
 * @brief Apply the outcome policy to a detection result
 *
 * @return The highest scoring region
 * @throws NoFaceError if no region was found
 * @throws MultipleFaceError if more than maxFaces regions were found
 */
FaceRegion SelectFace(const DetectionResult& detection,
                      const DetectParams& params = DetectParams());

// =============================================================================
// Image Level
// =============================================================================

/**
 * @brief Locate the face in a decoded image
 *
 * The image is converted to greyscale, cover-resized to
 * analysisSize x analysisSize and turned into an edge map.
 *
 * @throws NoFaceError, MultipleFaceError
 */
LocateResult LocateFaceInImage(const Image& image,
                               const DetectParams& params = DetectParams());

/**
 * @brief Decode an encoded image and locate the face
 * @throws IOException / UnsupportedException from decoding
 */
LocateResult LocateFace(const ByteBuffer& bytes,
                        const DetectParams& params = DetectParams());

/**
 * @brief Map a region on a cover-resized square map back to source pixels
 *
 * @param region Region on the map
 * @param mapSize Map side length
 * @param srcWidth Source image width
 * @param srcHeight Source image height
 * @return Bounding box in source pixels, clipped to the image
 */
Rect2i MapRegionToSource(const FaceRegion& region, int32_t mapSize,
                         int32_t srcWidth, int32_t srcHeight);

} // namespace FaceGate::Detect
