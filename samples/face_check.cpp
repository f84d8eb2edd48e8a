/**
 * @file face_check.cpp
 * @brief Face admission check on an image file
 *
 * Demonstrates:
 * - Header quality gate (format, resolution, aspect ratio, size)
 * - Lighting and sharpness measurement
 * - Multi-pass face location with per-pass statistics
 *
 * Usage:
 *   face_check <image>          run all checks
 *   face_check --info           print the service description
 */

#include <FaceGate/FaceGate.h>

#include <iomanip>
#include <iostream>
#include <string>

using namespace FaceGate;

void PrintPasses(const std::vector<Detect::PassStatistics>& passes) {
    for (size_t i = 0; i < passes.size(); ++i) {
        const Detect::PassStatistics& p = passes[i];
        std::cout << "  pass " << (i + 1) << " (" << p.pass.edgeThreshold << "/"
                  << p.pass.regionThreshold << "): "
                  << p.initial << " initial, " << p.geometric << " geometric, "
                  << p.scored << " scored, " << p.accepted << " accepted\n";
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <image> | --info" << std::endl;
        return 1;
    }

    std::string arg = argv[1];
    Pipeline::PipelineParams params;
    try {
        params = Pipeline::PipelineParams::FromEnvironment();
    } catch (const Exception& e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return 1;
    }

    if (arg == "--info") {
        std::cout << Pipeline::ServiceInfoToJson(Pipeline::GetServiceInfo(params)) << std::endl;
        return 0;
    }

    ByteBuffer bytes;
    try {
        bytes = IO::ReadFileBytes(arg);
    } catch (const Exception& e) {
        std::cerr << "Failed to load image: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "=== FaceGate Face Check ===\n\n";
    std::cout << "File: " << arg << " (" << bytes.size() << " bytes)\n";

    try {
        Pipeline::PreprocessResult result = Pipeline::ProcessFaceImage(bytes, params);
        const Detect::LocateResult& loc = result.location;

        std::cout << std::fixed << std::setprecision(2);
        std::cout << "Image: " << result.metadata.width << "x" << result.metadata.height
                  << " " << IO::FormatName(result.metadata.format) << "\n";
        std::cout << "Lighting: brightness " << result.lighting.mean
                  << ", contrast " << result.lighting.stdDev << "\n";
        std::cout << "Sharpness: " << result.sharpness << "\n";
        std::cout << "Face: (" << loc.sourceRegion.x << ", " << loc.sourceRegion.y << ") "
                  << loc.sourceRegion.width << "x" << loc.sourceRegion.height
                  << " score " << std::setprecision(3) << loc.region.faceScore << "\n";
        PrintPasses(loc.passes);

        std::cout << "\nAccepted\n";
        return 0;
    } catch (const Exception& e) {
        std::cout << "\nRejected [" << e.KindName() << "]: " << e.what() << std::endl;
        return 2;
    }
}
