/**
 * @file TargetGenerator.cpp
 * @brief Label map -> contours -> descriptors -> sampled contours
 */

#include <CpnVision/Targets/TargetGenerator.h>

#include <CpnVision/Contour/ContourExtractor.h>
#include <CpnVision/Core/Exception.h>
#include <CpnVision/Core/Validate.h>
#include <CpnVision/Fourier/ContourSampler.h>
#include <CpnVision/Platform/Diagnostics.h>
#include <CpnVision/Platform/Thread.h>
#include <CpnVision/Platform/Timer.h>

#include <cmath>
#include <string>

namespace Cpn::Vision::Targets {

// =============================================================================
// TargetBundle
// =============================================================================

std::vector<Point2d> TargetBundle::Locations() const {
    std::vector<Point2d> result;
    result.reserve(instances.size());
    for (const auto& t : instances) result.push_back(t.location);
    return result;
}

std::vector<Fourier::FourierDescriptor> TargetBundle::Descriptors() const {
    std::vector<Fourier::FourierDescriptor> result;
    result.reserve(instances.size());
    for (const auto& t : instances) result.push_back(t.descriptor);
    return result;
}

std::vector<std::vector<Point2d>> TargetBundle::SampledContours() const {
    std::vector<std::vector<Point2d>> result;
    result.reserve(instances.size());
    for (const auto& t : instances) result.push_back(t.sampledContour);
    return result;
}

std::vector<int32_t> TargetBundle::InstanceIds() const {
    std::vector<int32_t> result;
    result.reserve(instances.size());
    for (const auto& t : instances) result.push_back(t.instanceId);
    return result;
}

std::vector<int32_t> TargetBundle::ClassIds() const {
    std::vector<int32_t> result;
    result.reserve(instances.size());
    for (const auto& t : instances) result.push_back(t.classId);
    return result;
}

std::vector<double> TargetBundle::DescriptorMatrix(Fourier::FourierLayout layout) const {
    std::vector<double> result;
    for (const auto& t : instances) {
        std::vector<double> row = t.descriptor.ToChannels(layout);
        result.insert(result.end(), row.begin(), row.end());
    }
    return result;
}

// =============================================================================
// TargetGenerator
// =============================================================================

TargetGenerator::TargetGenerator(const CpnConfig& config) : config_(config) {
    config_.Validate();
}

TargetBundle TargetGenerator::Generate(const QImage& labels) const {
    return Generate(labels, ClassMap());
}

TargetBundle TargetGenerator::Generate(const QImage& labels, const ClassMap& classes) const {
    Validate::RequireLabelImage(labels, "TargetGenerator::Generate");
    if (!config_.inputSize.IsZero() && labels.Size() != config_.inputSize) {
        throw ShapeMismatchException(
            "TargetGenerator::Generate: label map is " + std::to_string(labels.Width()) + "x" +
            std::to_string(labels.Height()) + ", expected " +
            std::to_string(config_.inputSize.width) + "x" +
            std::to_string(config_.inputSize.height));
    }
    for (const auto& entry : classes) {
        if (entry.second < 1) {
            throw InvalidArgumentException(
                "TargetGenerator::Generate: class id must be >= 1, got " +
                std::to_string(entry.second) + " for instance " + std::to_string(entry.first));
        }
    }

    Contour::ExtractParams extract;
    extract.minArea = config_.minInstanceArea;
    extract.removePartials = config_.removePartials;

    std::vector<int32_t> droppedIds;
    std::vector<Contour::InstanceContour> contours =
        Contour::ExtractInstances(labels, extract, droppedIds);

    TargetBundle bundle;
    bundle.sampling = Fourier::MakeSampling(config_.samples, config_.randomSampling,
                                            config_.samplingSeed);
    bundle.instances.reserve(contours.size());

    std::vector<Contour::InstanceContour> kept;
    kept.reserve(contours.size());

    for (auto& inst : contours) {
        InstanceTarget target;
        target.instanceId = inst.id;
        auto it = classes.find(inst.id);
        target.classId = (it != classes.end()) ? it->second : 1;
        target.boundingBox = inst.boundingBox;
        target.area = inst.area;
        target.touchesBorder = inst.touchesBorder;
        target.fragmented = inst.fragmented;

        try {
            target.descriptor = Fourier::EncodeContour(inst.contour, config_.order, target.location);
        } catch (const InsufficientDataException& e) {
            CPNVISION_DIAG("TargetGenerator", "dropped instance %d: %s", inst.id, e.what());
            droppedIds.push_back(inst.id);
            continue;
        }

        if (config_.normalizePhase) {
            // Sample the raw boundary with the same parameter shift
            double shift = 0.0;
            target.descriptor = Fourier::NormalizePhase(target.descriptor, shift);
            std::vector<double> shifted(bundle.sampling.size());
            for (size_t m = 0; m < shifted.size(); ++m) {
                shifted[m] = std::fmod(bundle.sampling[m] + shift, 1.0);
            }
            target.sampledContour = Fourier::SampleContourAt(inst.contour, shifted);
        } else {
            target.sampledContour = Fourier::SampleContourAt(inst.contour, bundle.sampling);
        }

        bundle.instances.push_back(std::move(target));
        kept.push_back(std::move(inst));
    }

    bundle.droppedInstances = static_cast<int32_t>(droppedIds.size());

    std::vector<int32_t> classOf;
    classOf.reserve(bundle.instances.size());
    for (const auto& t : bundle.instances) {
        classOf.push_back(t.classId);
    }
    bundle.reducedLabels = Contour::ReduceLabels(labels, kept, classOf,
                                                 config_.minFgDist, config_.maxBgDist);

    CPNVISION_DIAG("TargetGenerator", "%dx%d: %zu instances, %d dropped",
                   labels.Width(), labels.Height(), bundle.instances.size(),
                   bundle.droppedInstances);
    return bundle;
}

std::vector<TargetBundle> TargetGenerator::GenerateBatch(const std::vector<QImage>& labelMaps) const {
    return GenerateBatch(labelMaps, std::vector<ClassMap>(labelMaps.size()));
}

std::vector<TargetBundle> TargetGenerator::GenerateBatch(const std::vector<QImage>& labelMaps,
                                                         const std::vector<ClassMap>& classes) const {
    if (classes.size() != labelMaps.size()) {
        throw InvalidArgumentException(
            "TargetGenerator::GenerateBatch: " + std::to_string(classes.size()) +
            " class maps for " + std::to_string(labelMaps.size()) + " label maps");
    }

    Platform::StageTimer timer;
    std::vector<TargetBundle> bundles = Platform::ParallelMap(labelMaps.size(), [&](size_t i) {
        return Generate(labelMaps[i], classes[i]);
    });
    CPNVISION_DIAG("TargetGenerator", "batch of %zu maps in %.2f ms",
                   labelMaps.size(), timer.SinceMarkMs());
    return bundles;
}

} // namespace Cpn::Vision::Targets
