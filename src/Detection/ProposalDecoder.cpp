/**
 * @file ProposalDecoder.cpp
 * @brief Score thresholding and Fourier decoding of dense outputs
 */

#include <CpnVision/Detection/ProposalDecoder.h>

#include <CpnVision/Core/Exception.h>
#include <CpnVision/Fourier/ContourSampler.h>
#include <CpnVision/Platform/Thread.h>

#include <string>

namespace Cpn::Vision::Detection {

// =============================================================================
// Dense tensor helpers
// =============================================================================

DenseDims GetDenseDims(const Inference::Tensor& tensor, const char* what) {
    DenseDims dims;
    if (tensor.Rank() == 3) {
        dims.channels = tensor.shape[0];
        dims.height = tensor.shape[1];
        dims.width = tensor.shape[2];
    } else if (tensor.Rank() == 4) {
        dims.batch = tensor.shape[0];
        dims.channels = tensor.shape[1];
        dims.height = tensor.shape[2];
        dims.width = tensor.shape[3];
    } else {
        throw InvalidArgumentException(std::string(what) + " tensor must have rank 3 or 4, got " +
                                       tensor.ShapeString());
    }
    if (!tensor.IsValid()) {
        throw InvalidArgumentException(std::string(what) + " tensor " + tensor.ShapeString() +
                                       " does not match " + std::to_string(tensor.data.size()) +
                                       " values");
    }
    return dims;
}

int64_t BatchSize(const DenseOutput& output) {
    return GetDenseDims(output.scores, "scores").batch;
}

namespace {

Inference::Tensor SliceTensor(const Inference::Tensor& tensor, int64_t n, const char* what) {
    DenseDims dims = GetDenseDims(tensor, what);
    if (n < 0 || n >= dims.batch) {
        throw OutOfRangeException(std::string(what) + ": batch index " + std::to_string(n) +
                                  " outside [0, " + std::to_string(dims.batch) + ")");
    }
    const size_t count = static_cast<size_t>(dims.channels * dims.Plane());
    auto first = tensor.data.begin() + static_cast<std::ptrdiff_t>(n * count);
    return Inference::Tensor(tensor.name, {1, dims.channels, dims.height, dims.width},
                             std::vector<float>(first, first + static_cast<std::ptrdiff_t>(count)));
}

void RequireSameGrid(const DenseDims& a, const DenseDims& b, const char* what) {
    if (a.batch != b.batch || a.height != b.height || a.width != b.width) {
        throw ShapeMismatchException(
            std::string(what) + " grid " + std::to_string(b.batch) + "x" +
            std::to_string(b.height) + "x" + std::to_string(b.width) +
            " differs from scores grid " + std::to_string(a.batch) + "x" +
            std::to_string(a.height) + "x" + std::to_string(a.width));
    }
}

} // namespace

DenseOutput SliceBatch(const DenseOutput& output, int64_t n) {
    DenseOutput slice;
    slice.scores = SliceTensor(output.scores, n, "scores");
    slice.fourier = SliceTensor(output.fourier, n, "fourier");
    if (output.HasRefinement()) {
        slice.refinement = SliceTensor(output.refinement, n, "refinement");
    }
    return slice;
}

// =============================================================================
// ProposalDecoder
// =============================================================================

ProposalDecoder::ProposalDecoder(const CpnConfig& config) : config_(config) {
    config_.Validate();
    sampling_ = Fourier::MakeSampling(config_.samples);
}

std::vector<Proposal> ProposalDecoder::Decode(const DenseOutput& output) const {
    DenseDims scoreDims = GetDenseDims(output.scores, "scores");
    DenseDims fourierDims = GetDenseDims(output.fourier, "fourier");
    if (scoreDims.batch != 1) {
        throw InvalidArgumentException("ProposalDecoder::Decode: batch size " +
                                       std::to_string(scoreDims.batch) + ", use DecodeBatch");
    }
    if (fourierDims.channels != config_.FourierChannels()) {
        throw ShapeMismatchException(
            "ProposalDecoder::Decode: fourier has " + std::to_string(fourierDims.channels) +
            " channels, expected " + std::to_string(config_.FourierChannels()) +
            " (order " + std::to_string(config_.order) + ")");
    }
    RequireSameGrid(scoreDims, fourierDims, "fourier");

    const int64_t plane = scoreDims.Plane();
    const float* scores = output.scores.data.data();
    const float* fourier = output.fourier.data.data();

    std::vector<Proposal> proposals;
    for (int64_t y = 0; y < scoreDims.height; ++y) {
        for (int64_t x = 0; x < scoreDims.width; ++x) {
            const int64_t cell = y * scoreDims.width + x;

            // Best class
            int64_t best = 0;
            float bestScore = scores[cell];
            for (int64_t c = 1; c < scoreDims.channels; ++c) {
                float s = scores[c * plane + cell];
                if (s > bestScore) {
                    bestScore = s;
                    best = c;
                }
            }
            if (!(static_cast<double>(bestScore) > config_.scoreThresh)) {
                continue;
            }

            Proposal p;
            p.score = bestScore;
            p.classId = static_cast<int32_t>(best + 1);
            p.location = Point2d(static_cast<double>(x * config_.stride),
                                 static_cast<double>(y * config_.stride));
            p.descriptor = Fourier::FourierDescriptor::FromChannels(
                fourier + cell, config_.order, static_cast<size_t>(plane), config_.fourierLayout);
            p.contour = Fourier::EvaluateDescriptor(p.descriptor, p.location, sampling_);
            p.sampling = sampling_;
            p.detectionIndex = cell;
            proposals.push_back(std::move(p));
        }
    }
    return proposals;
}

std::vector<std::vector<Proposal>> ProposalDecoder::DecodeBatch(const DenseOutput& output) const {
    const int64_t batch = BatchSize(output);
    return Platform::ParallelMap(static_cast<size_t>(batch), [&](size_t n) {
        return Decode(SliceBatch(output, static_cast<int64_t>(n)));
    });
}

} // namespace Cpn::Vision::Detection
