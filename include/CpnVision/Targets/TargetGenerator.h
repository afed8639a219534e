#pragma once

#include <CpnVision/Core/Export.h>

/**
 * @file TargetGenerator.h
 * @brief Training targets from instance label maps
 *
 * Per label map the generator produces, for each surviving instance (in the
 * raster order of its first pixel):
 * - location: curve centroid of the instance boundary
 * - descriptor: Fourier harmonics of the boundary (shape only)
 * - sampled contour: the raw boundary at the shared sampling parameters
 *
 * plus the sampling parameters themselves and a reduced label image for
 * dense supervision.
 *
 * @code
 * Targets::TargetGenerator generator(CpnConfig::Default());
 * Targets::TargetBundle bundle = generator.Generate(labels);
 * for (const auto& target : bundle.instances) {
 *     // target.location, target.descriptor, target.sampledContour
 * }
 * @endcode
 */

#include <CpnVision/Core/QImage.h>
#include <CpnVision/Core/Types.h>
#include <CpnVision/Fourier/FourierDescriptor.h>
#include <CpnVision/Targets/CpnConfig.h>

#include <cstdint>
#include <map>
#include <vector>

namespace Cpn::Vision::Targets {

/// Instance id -> class id. Instances without an entry get class 1.
using ClassMap = std::map<int32_t, int32_t>;

/**
 * @brief Targets of one surviving instance
 */
struct InstanceTarget {
    int32_t instanceId = 0;                  ///< Id in the label map
    int32_t classId = 1;                     ///< Class id (>= 1)
    Point2d location;                        ///< Curve centroid c_0
    Fourier::FourierDescriptor descriptor;   ///< order harmonics
    std::vector<Point2d> sampledContour;     ///< samples points
    Rect2i boundingBox;
    int64_t area = 0;
    bool touchesBorder = false;
    bool fragmented = false;
};

/**
 * @brief All targets of one label map
 */
struct CPNVISION_API TargetBundle {
    std::vector<InstanceTarget> instances;   ///< Surviving instances
    std::vector<double> sampling;            ///< Shared contour parameters in [0, 1)
    QImage reducedLabels;                    ///< Int32: 0 bg, >0 class, -1 ignore
    int32_t droppedInstances = 0;            ///< Degenerate or partial instances

    size_t Size() const { return instances.size(); }
    bool Empty() const { return instances.empty(); }

    std::vector<Point2d> Locations() const;
    std::vector<Fourier::FourierDescriptor> Descriptors() const;
    std::vector<std::vector<Point2d>> SampledContours() const;
    std::vector<int32_t> InstanceIds() const;
    std::vector<int32_t> ClassIds() const;

    /**
     * @brief Descriptors as one flat row-major [K, 4 * order] matrix
     */
    std::vector<double> DescriptorMatrix(Fourier::FourierLayout layout) const;
};

/**
 * @brief Converts label maps into training targets
 *
 * Immutable after construction; Generate may be called concurrently.
 */
class CPNVISION_API TargetGenerator {
public:
    /**
     * @brief Construct with a configuration
     * @throws InvalidConfigurationException if config.Validate() fails
     */
    explicit TargetGenerator(const CpnConfig& config);

    const CpnConfig& Config() const { return config_; }

    /**
     * @brief Targets of one label map, every instance of class 1
     *
     * @throws InvalidArgumentException for empty, multi-channel, Float32 maps
     *         or negative labels
     * @throws ShapeMismatchException if the map size differs from
     *         config.inputSize (when set)
     */
    TargetBundle Generate(const QImage& labels) const;

    /**
     * @brief Targets of one label map with per-instance classes
     * @throws InvalidArgumentException for class ids < 1
     */
    TargetBundle Generate(const QImage& labels, const ClassMap& classes) const;

    /**
     * @brief Targets of several label maps, computed on the thread pool
     *
     * Results keep input order. An exception in any map is rethrown after
     * all maps finished.
     */
    std::vector<TargetBundle> GenerateBatch(const std::vector<QImage>& labelMaps) const;

    /**
     * @brief Batch variant with one ClassMap per label map
     */
    std::vector<TargetBundle> GenerateBatch(const std::vector<QImage>& labelMaps,
                                            const std::vector<ClassMap>& classes) const;

private:
    CpnConfig config_;
};

} // namespace Cpn::Vision::Targets
