/**
 * @file FaceLocator.cpp
 * @brief Multi-pass face locator implementation
 */

#include <FaceGate/Detect/FaceLocator.h>
#include <FaceGate/Blob/Blob.h>
#include <FaceGate/Core/Exception.h>
#include <FaceGate/Core/Log.h>
#include <FaceGate/Detect/FaceScore.h>
#include <FaceGate/Filter/Filter.h>
#include <FaceGate/IO/ImageIO.h>
#include <FaceGate/Transform/Resize.h>

#include <algorithm>
#include <cmath>

namespace FaceGate::Detect {

namespace {

FaceRegion ToFaceRegion(const Blob::GrowResult& grown) {
    Rect2i box = grown.Bounds();

    FaceRegion region;
    region.x = box.x;
    region.y = box.y;
    region.width = box.width;
    region.height = box.height;
    region.size = grown.size;
    region.density = static_cast<double>(grown.size) / static_cast<double>(box.Area());
    return region;
}

bool PassesGeometricFilter(const FaceRegion& region, int32_t minRegionSize,
                           const DetectParams& params) {
    double aspectRatio = static_cast<double>(region.width) / region.height;
    double sizeRatio = static_cast<double>(std::min(region.width, region.height)) /
                       std::max(region.width, region.height);
    double minExtent = minRegionSize * params.minExtentFactor;

    return aspectRatio > params.minAspectRatio &&
           aspectRatio < params.maxAspectRatio &&
           sizeRatio > params.minSizeRatio &&
           region.width > minExtent &&
           region.height > minExtent &&
           region.density > params.minDensity &&
           region.density < params.maxDensity;
}

} // anonymous namespace

// =============================================================================
// Edge Map Level
// =============================================================================

std::vector<FaceRegion> FindFaceRegions(const Image& edges,
                                        const DetectionPass& pass,
                                        const DetectParams& params,
                                        PassStatistics* stats) {
    if (edges.Empty() || edges.Channels() != 1) {
        throw InvalidArgumentException("FindFaceRegions requires a non-empty single-channel edge map");
    }

    const int32_t width = edges.Width();
    const int32_t height = edges.Height();
    const int32_t minRegionSize = params.MinRegionSize(width);
    const double minComponentSize = static_cast<double>(minRegionSize) * minRegionSize *
                                    params.minComponentFactor;

    // Step 1: grow components from strided seeds
    Blob::VisitedMask visited(width, height);
    std::vector<FaceRegion> regions;

    for (int32_t y = minRegionSize; y < height - minRegionSize; y += params.seedStride) {
        const uint8_t* row = edges.RowPtr(y);
        for (int32_t x = minRegionSize; x < width - minRegionSize; x += params.seedStride) {
            if (visited.Test(x, y) || row[x] < pass.edgeThreshold) continue;

            Blob::GrowResult grown = Blob::GrowRegion(edges, x, y, pass.regionThreshold, visited);
            if (static_cast<double>(grown.size) > minComponentSize) {
                regions.push_back(ToFaceRegion(grown));
            }
        }
    }

    // Step 2: geometric constraints
    std::vector<FaceRegion> geometric;
    for (const FaceRegion& region : regions) {
        if (PassesGeometricFilter(region, minRegionSize, params)) {
            geometric.push_back(region);
        }
    }

    // Step 3: face score
    std::vector<FaceRegion> scored;
    for (FaceRegion region : geometric) {
        region.faceScore = ComputeFaceScore(edges, region, params.score);
        if (region.faceScore > params.minFaceScore) {
            scored.push_back(region);
        }
    }

    // Step 4: overlap resolution
    std::vector<FaceRegion> accepted = SuppressOverlapping(scored, params.maxOverlap);

    Log::Get()->debug("Pass ({}, {}): {} initial -> {} geometric -> {} scored -> {} final",
                      pass.edgeThreshold, pass.regionThreshold,
                      regions.size(), geometric.size(), scored.size(), accepted.size());

    if (stats != nullptr) {
        stats->pass = pass;
        stats->initial = regions.size();
        stats->geometric = geometric.size();
        stats->scored = scored.size();
        stats->accepted = accepted.size();
    }

    return accepted;
}

DetectionResult DetectFaceCandidates(const Image& edges, const DetectParams& params) {
    params.Validate();

    DetectionResult result;
    for (size_t i = 0; i < params.passes.size(); ++i) {
        PassStatistics stats;
        std::vector<FaceRegion> regions = FindFaceRegions(edges, params.passes[i], params, &stats);
        result.passes.push_back(stats);

        if (!regions.empty()) {
            result.regions = std::move(regions);
            result.passIndex = static_cast<int32_t>(i);
            break;
        }
    }
    return result;
}

FaceRegion SelectFace(const DetectionResult& detection, const DetectParams& params) {
    const size_t count = detection.regions.size();

    if (count == 0) {
        throw NoFaceError("No face detected in the image after " +
                          std::to_string(detection.passes.size()) +
                          " detection passes. Please provide a clear, front-facing photo "
                          "with good lighting");
    }

    if (count > static_cast<size_t>(params.maxFaces)) {
        throw MultipleFaceError(count, "Multiple faces detected (" + std::to_string(count) +
                                       "). Please provide an image with only one person");
    }

    return detection.regions.front();
}

// =============================================================================
// Image Level
// =============================================================================

Rect2i MapRegionToSource(const FaceRegion& region, int32_t mapSize,
                         int32_t srcWidth, int32_t srcHeight) {
    Transform::CoverWindow window =
        Transform::ComputeCoverWindow(srcWidth, srcHeight, mapSize, mapSize);
    double scaleX = window.width / mapSize;
    double scaleY = window.height / mapSize;

    int32_t left = static_cast<int32_t>(std::floor(window.x + region.x * scaleX));
    int32_t top = static_cast<int32_t>(std::floor(window.y + region.y * scaleY));
    int32_t right = static_cast<int32_t>(std::ceil(window.x + (region.x + region.width) * scaleX));
    int32_t bottom = static_cast<int32_t>(std::ceil(window.y + (region.y + region.height) * scaleY));

    Rect2i box{left, top, right - left, bottom - top};
    return box.Intersect(Rect2i{0, 0, srcWidth, srcHeight});
}

LocateResult LocateFaceInImage(const Image& image, const DetectParams& params) {
    params.Validate();

    Image gray;
    Transform::ZoomGrayCover(image, gray, params.analysisSize, params.analysisSize);

    Image edges;
    Filter::EdgeMap(gray, edges);

    DetectionResult detection = DetectFaceCandidates(edges, params);
    FaceRegion face = SelectFace(detection, params);

    LocateResult result;
    result.region = face;
    result.sourceRegion = MapRegionToSource(face, params.analysisSize,
                                            image.Width(), image.Height());
    result.mapSize = params.analysisSize;
    result.passIndex = detection.passIndex;
    result.passes = std::move(detection.passes);

    Log::Get()->debug("Face at ({}, {}) {}x{} score {:.3f} in pass {}",
                      face.x, face.y, face.width, face.height, face.faceScore,
                      result.passIndex + 1);
    return result;
}

LocateResult LocateFace(const ByteBuffer& bytes, const DetectParams& params) {
    return LocateFaceInImage(IO::DecodeImage(bytes), params);
}

} // namespace FaceGate::Detect
