/**
 * @file ServiceInfo.cpp
 * @brief Service description
 */

#include <FaceGate/Pipeline/FacePipeline.h>
#include <FaceGate/FaceGate.h>

#include <json/json.h>

#include <cstdio>

namespace FaceGate::Pipeline {

namespace {

std::string Upper(std::string text) {
    for (char& c : text) {
        if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
    }
    return text;
}

std::string MegaBytes(size_t bytes) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.0fMB", bytes / (1024.0 * 1024.0));
    return buf;
}

Json::Value StringArray(const std::vector<std::string>& values) {
    Json::Value array(Json::arrayValue);
    for (const std::string& value : values) {
        array.append(value);
    }
    return array;
}

} // anonymous namespace

ServiceInfo GetServiceInfo(const PipelineParams& params, const Embed::EmbeddingModel* model) {
    ServiceInfo info;
    info.service = "FaceGate face verification";
    info.version = GetVersion();

    if (model != nullptr) {
        info.model.name = model->Name();
        info.model.embeddingDimension = model->Dimension();
        info.model.loaded = model->IsLoaded();
    }
    info.model.inputSize = params.preprocess.targetSize;

    info.similarityThreshold = params.match.threshold;
    info.metric = Match::MetricName(params.match.metric);

    for (IO::ImageFormat format : params.quality.allowedFormats) {
        info.supportedFormats.push_back(Upper(IO::FormatName(format)));
    }
    info.minResolution = "min dimension >= " + std::to_string(params.quality.minShortSide) +
                         "px, max dimension >= " + std::to_string(params.quality.minLongSide) + "px";
    info.maxResolution = std::to_string(params.quality.maxWidth) + "x" +
                         std::to_string(params.quality.maxHeight);
    info.maxFileSize = MegaBytes(params.quality.maxFileBytes);

    char faceSize[48];
    std::snprintf(faceSize, sizeof(faceSize), "%.1f%% of image", params.detect.minFaceSize * 100.0);
    info.minFaceSize = faceSize;
    info.maxFaces = params.detect.maxFaces;
    info.blurThreshold = params.blur.minVariance;

    info.qualityChecks = {
        "Image quality and format",
        "Lighting conditions",
        "Blur/sharpness detection",
        "Face presence and count with confidence scoring",
        "Face size and position",
        "Overlap removal for multiple detections"
    };
    info.faceFeatures = {
        "Facial symmetry analysis",
        "Eye pattern detection",
        "Mouth region validation",
        "Edge distribution analysis",
        "Position-based scoring"
    };
    return info;
}

std::string ServiceInfoToJson(const ServiceInfo& info) {
    Json::Value root;
    root["service"] = info.service;
    root["version"] = info.version;

    Json::Value model;
    model["name"] = info.model.name;
    model["embeddingDimensions"] = static_cast<Json::UInt64>(info.model.embeddingDimension);
    model["targetImageSize"] = std::to_string(info.model.inputSize) + "x" +
                               std::to_string(info.model.inputSize);
    model["modelLoaded"] = info.model.loaded;
    root["model"] = model;

    Json::Value requirements;
    requirements["minResolution"] = info.minResolution;
    requirements["maxResolution"] = info.maxResolution;
    requirements["maxFileSize"] = info.maxFileSize;
    requirements["minFaceSize"] = info.minFaceSize;
    requirements["maxFaces"] = info.maxFaces;

    Json::Value validation;
    validation["similarityThreshold"] = info.similarityThreshold;
    validation["metric"] = info.metric;
    validation["blurThreshold"] = info.blurThreshold;
    validation["supportedFormats"] = StringArray(info.supportedFormats);
    validation["imageRequirements"] = requirements;
    validation["qualityChecks"] = StringArray(info.qualityChecks);
    root["validation"] = validation;

    root["faceFeatures"] = StringArray(info.faceFeatures);

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, root);
}

} // namespace FaceGate::Pipeline
