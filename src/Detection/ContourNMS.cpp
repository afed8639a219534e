/**
 * @file ContourNMS.cpp
 * @brief Proposal suppression on top of the internal contour NMS
 */

#include <CpnVision/Detection/ContourNMS.h>

#include <CpnVision/Internal/ContourConvert.h>

namespace Cpn::Vision::Detection {

std::vector<size_t> SuppressProposalIndices(const std::vector<Proposal>& proposals,
                                            const NmsParams& params) {
    std::vector<Internal::ScoredContour> candidates;
    candidates.reserve(proposals.size());
    for (const auto& p : proposals) {
        Internal::ScoredContour c;
        c.points = &p.contour;
        c.score = p.score;
        c.classId = p.classId;
        c.rankKey = p.detectionIndex;
        candidates.push_back(c);
    }

    Internal::ContourNmsParams nms;
    nms.iouThreshold = params.iouThreshold;
    nms.mode = params.mode;
    nms.perClass = params.perClass;
    nms.supersample = params.supersample;
    nms.clip = params.clip;
    return Internal::ContourNMS(candidates, nms);
}

std::vector<Proposal> SuppressProposals(std::vector<Proposal> proposals, const NmsParams& params) {
    std::vector<size_t> kept = SuppressProposalIndices(proposals, params);

    std::vector<Proposal> result;
    result.reserve(kept.size());
    for (size_t idx : kept) {
        result.push_back(std::move(proposals[idx]));
    }
    return result;
}

double ContourIoU(const std::vector<Point2d>& a, const std::vector<Point2d>& b,
                  int32_t supersample) {
    return Internal::PolygonIoU(a, b, supersample);
}

} // namespace Cpn::Vision::Detection
