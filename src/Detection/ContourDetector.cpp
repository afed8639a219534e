/**
 * @file ContourDetector.cpp
 * @brief Detection pipeline and ONNX-backed contour proposal network
 */

#include <CpnVision/Detection/ContourDetector.h>

#include <CpnVision/Core/Exception.h>
#include <CpnVision/Platform/Diagnostics.h>
#include <CpnVision/Platform/Thread.h>
#include <CpnVision/Platform/Timer.h>

namespace Cpn::Vision::Detection {

// =============================================================================
// ContourDetector
// =============================================================================

ContourDetector::ContourDetector(const CpnConfig& config)
    : config_(config), decoder_(config) {
    nms_.iouThreshold = config_.nmsThresh;
    nms_.perClass = config_.nmsPerClass;
    nms_.mode = config_.nmsMode;
}

std::vector<Proposal> ContourDetector::DecodeAndSuppress(const DenseOutput& output,
                                                         Platform::StageTimer& timer) const {
    std::vector<Proposal> proposals = decoder_.Decode(output);
    timer.Mark("decode");
    const size_t decoded = proposals.size();

    // Network coefficients are unbounded; overlap counts inside the image only
    const DenseDims dims = GetDenseDims(output.scores, "scores");
    NmsParams nms = nms_;
    nms.clip = Rect2d(0.0, 0.0, static_cast<double>(dims.width * config_.stride),
                      static_cast<double>(dims.height * config_.stride));
    proposals = SuppressProposals(std::move(proposals), nms);
    timer.Mark("nms");
    CPNVISION_DIAG("ContourDetector", "%zu proposals, %zu after NMS", decoded, proposals.size());
    return proposals;
}

std::vector<Detection> ContourDetector::ToDetections(std::vector<Proposal>& proposals) {
    std::vector<Detection> detections;
    detections.reserve(proposals.size());
    for (auto& p : proposals) {
        Detection d;
        d.contour = QContour(p.contour, true);
        d.score = p.score;
        d.classId = p.classId;
        d.location = p.location;
        detections.push_back(std::move(d));
    }
    return detections;
}

std::vector<Detection> ContourDetector::Detect(const DenseOutput& output) const {
    Platform::StageTimer timer;
    std::vector<Proposal> proposals = DecodeAndSuppress(output, timer);

    if (config_.refinementIterations > 0 && output.HasRefinement() && !proposals.empty()) {
        DenseRefinementField field(output.refinement, config_.refinementBuckets,
                                   config_.refinementMargin, config_.stride);
        int32_t passes = RefineProposals(proposals, field, config_.refinementIterations);
        timer.Mark("refine");
        CPNVISION_DIAG("ContourDetector", "refined %zu contours in %d passes",
                       proposals.size(), passes);
    }
    CPNVISION_DIAG("ContourDetector", "%s", timer.Summary().c_str());
    return ToDetections(proposals);
}

std::vector<Detection> ContourDetector::Detect(const DenseOutput& output,
                                               const RefinementField& field) const {
    Platform::StageTimer timer;
    std::vector<Proposal> proposals = DecodeAndSuppress(output, timer);
    if (config_.refinementIterations > 0) {
        RefineProposals(proposals, field, config_.refinementIterations);
        timer.Mark("refine");
    }
    CPNVISION_DIAG("ContourDetector", "%s", timer.Summary().c_str());
    return ToDetections(proposals);
}

std::vector<std::vector<Detection>> ContourDetector::DetectBatch(const DenseOutput& output) const {
    const int64_t batch = BatchSize(output);
    return Platform::ParallelMap(static_cast<size_t>(batch), [&](size_t n) {
        return Detect(SliceBatch(output, static_cast<int64_t>(n)));
    });
}

// =============================================================================
// ContourProposalNetwork
// =============================================================================

DenseOutput MakeDenseOutput(const std::vector<Inference::Tensor>& outputs) {
    DenseOutput dense;
    const auto* scores = Inference::FindTensor(outputs, "scores");
    const auto* fourier = Inference::FindTensor(outputs, "fourier");
    const auto* refinement = Inference::FindTensor(outputs, "refinement");

    if (scores == nullptr && fourier == nullptr) {
        if (outputs.size() < 2) {
            throw InvalidArgumentException(
                "MakeDenseOutput: need scores and fourier outputs, got " +
                std::to_string(outputs.size()) + " tensors");
        }
        scores = &outputs[0];
        fourier = &outputs[1];
        refinement = (outputs.size() > 2) ? &outputs[2] : nullptr;
    }
    if (scores == nullptr || fourier == nullptr) {
        throw InvalidArgumentException("MakeDenseOutput: missing scores or fourier output");
    }

    dense.scores = *scores;
    dense.fourier = *fourier;
    if (refinement != nullptr) {
        dense.refinement = *refinement;
    }
    return dense;
}

ContourProposalNetwork::ContourProposalNetwork(const CpnConfig& config)
    : detector_(config) {}

bool ContourProposalNetwork::Load(const std::string& modelPath,
                                  const Inference::SessionOptions& opts) {
    return model_.Load(modelPath, opts);
}

std::vector<Detection> ContourProposalNetwork::Detect(const QImage& image) {
    if (!model_.IsLoaded()) {
        throw InvalidArgumentException("ContourProposalNetwork::Detect: model not loaded");
    }

    // Empty name: the model's first input
    Inference::Tensor input = Inference::Tensor::FromImage(image, "");
    std::vector<Inference::Tensor> outputs = model_.Run({input});
    return detector_.Detect(MakeDenseOutput(outputs));
}

} // namespace Cpn::Vision::Detection
