#pragma once

#include <CpnVision/Core/Export.h>

/**
 * @file Refinement.h
 * @brief Iterative bucket-wise refinement of proposal contours
 *
 * The contour parameter circle [0, 1) is split into B angular buckets;
 * bucket b is centered at u = b + 0.5 on the scaled parameter u = t * B.
 * Each point is served by its two nearest bucket centers with linear
 * weights. Every pass queries a RefinementField for the displacement of each
 * point in both buckets and moves all points at once (Jacobi update from the
 * previous state), clamped to the field domain.
 */

#include <CpnVision/Core/QImage.h>
#include <CpnVision/Core/Types.h>
#include <CpnVision/Detection/ProposalDecoder.h>
#include <CpnVision/Inference/Inference.h>

#include <cstdint>
#include <vector>

namespace Cpn::Vision::Detection {

// =============================================================================
// Refinement fields
// =============================================================================

/**
 * @brief Source of per-bucket point displacements
 */
class CPNVISION_API RefinementField {
public:
    virtual ~RefinementField() = default;

    /**
     * @brief Displacement proposed for a point in a bucket
     *
     * @param point   Current point (image pixels)
     * @param bucket  Bucket index in [0, Buckets())
     * @param normal  Unit outward contour normal at the point
     */
    virtual Point2d Offset(const Point2d& point, int32_t bucket, const Point2d& normal) const = 0;

    /// Number of buckets served
    virtual int32_t Buckets() const = 0;

    /// Points are clamped to this rectangle after each pass
    virtual Rect2d Domain() const = 0;
};

/**
 * @brief Learned offsets from a [2 * B, H, W] refinement tensor
 *
 * Channels (2b, 2b + 1) hold (dx, dy) for bucket b. The value at the cell
 * nearest to the point is squashed to margin * tanh(v).
 */
class CPNVISION_API DenseRefinementField : public RefinementField {
public:
    /**
     * @throws ShapeMismatchException if the tensor does not have 2 * buckets channels
     * @throws InvalidArgumentException for malformed or batched tensors
     */
    DenseRefinementField(const Inference::Tensor& refinement, int32_t buckets,
                         double margin, int32_t stride = 1);

    Point2d Offset(const Point2d& point, int32_t bucket, const Point2d& normal) const override;
    int32_t Buckets() const override { return buckets_; }
    Rect2d Domain() const override;

private:
    Inference::Tensor tensor_;
    DenseDims dims_;
    int32_t buckets_;
    double margin_;
    int32_t stride_;
};

/**
 * @brief Heuristic offsets from a per-pixel boundary score map
 *
 * The disc of radius margin around the point is split into B angular sectors
 * aligned with the contour normal; the point's search region is the sector
 * centered on the outward normal and the opposite (inward) sector. The
 * displacement leads to the highest-scoring pixel in the region, or is zero
 * when no pixel scores higher than the point's own pixel.
 *
 * The sector is tied to the normal rather than to the bucket, so Offset
 * returns the same displacement for every bucket and the bucket blend in
 * RefineContour reduces to a single move.
 */
class CPNVISION_API ScoreMapRefinementField : public RefinementField {
public:
    /**
     * @param scoreMap Float32 single-channel boundary scores
     * @throws InvalidArgumentException for empty maps
     * @throws UnsupportedException for non-Float32 or multi-channel maps
     */
    ScoreMapRefinementField(const QImage& scoreMap, int32_t buckets, double margin);

    Point2d Offset(const Point2d& point, int32_t bucket, const Point2d& normal) const override;
    int32_t Buckets() const override { return buckets_; }
    Rect2d Domain() const override;

private:
    QImage scoreMap_;
    int32_t buckets_;
    double margin_;
};

// =============================================================================
// Refinement
// =============================================================================

/**
 * @brief Two nearest buckets of parameter t and their weights
 */
struct BucketWeights {
    int32_t bucket0 = 0;
    int32_t bucket1 = 0;
    double weight0 = 1.0;
    double weight1 = 0.0;
};

/**
 * @brief Bucket assignment of parameter t in [0, 1)
 */
CPNVISION_API BucketWeights AssignBuckets(double t, int32_t buckets);

/**
 * @brief Refine proposal contours in place
 *
 * Runs exactly `iterations` passes. Proposals without sampling parameters
 * use t = m / contour.size().
 *
 * @return Number of passes executed
 * @throws InvalidArgumentException if iterations < 0
 */
CPNVISION_API int32_t RefineProposals(std::vector<Proposal>& proposals,
                                      const RefinementField& field, int32_t iterations);

/**
 * @brief Refine a single contour in place
 * @return Number of passes executed
 */
CPNVISION_API int32_t RefineContour(std::vector<Point2d>& contour, const std::vector<double>& sampling,
                                    const RefinementField& field, int32_t iterations);

} // namespace Cpn::Vision::Detection
