/**
 * @file Inference.cpp
 * @brief Tensor helpers and ONNX inference wrapper implementation
 */

#include <CpnVision/Inference/Inference.h>
#include <CpnVision/Core/Validate.h>
#include <CpnVision/Platform/Diagnostics.h>

#ifdef CPNVISION_HAS_ONNXRUNTIME
#include <onnxruntime_cxx_api.h>
#endif

#include <algorithm>
#include <string>

namespace Cpn::Vision::Inference {

namespace {

size_t ShapeElements(const std::vector<int64_t>& shape) {
    if (shape.empty()) {
        return 0;
    }
    size_t count = 1;
    for (int64_t dim : shape) {
        if (dim <= 0) {
            return 0;
        }
        count *= static_cast<size_t>(dim);
    }
    return count;
}

} // namespace

// =============================================================================
// Tensor
// =============================================================================

Tensor::Tensor(std::string name_, std::vector<int64_t> shape_)
    : name(std::move(name_)), shape(std::move(shape_)) {
    data.assign(ShapeElements(shape), 0.0f);
}

Tensor::Tensor(std::string name_, std::vector<int64_t> shape_, std::vector<float> data_)
    : name(std::move(name_)), shape(std::move(shape_)), data(std::move(data_)) {}

size_t Tensor::NumElements() const {
    return ShapeElements(shape);
}

bool Tensor::IsValid() const {
    size_t count = NumElements();
    return count > 0 && count == data.size();
}

std::string Tensor::ShapeString() const {
    std::string s = "[";
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i > 0) s += ", ";
        s += std::to_string(shape[i]);
    }
    return s + "]";
}

Tensor Tensor::FromImage(const QImage& image, const std::string& name) {
    Validate::RequireImageNonEmpty(image, "Tensor::FromImage");

    const int32_t width = image.Width();
    const int32_t height = image.Height();
    const int channels = image.Channels();
    const size_t plane = static_cast<size_t>(width) * height;

    Tensor t(name, {1, channels, height, width});
    for (int32_t y = 0; y < height; ++y) {
        for (int32_t x = 0; x < width; ++x) {
            for (int c = 0; c < channels; ++c) {
                size_t i = static_cast<size_t>(x) * channels + c;
                float v = 0.0f;
                switch (image.Type()) {
                    case PixelType::UInt8:
                        v = image.Row<uint8_t>(y)[i] / 255.0f;
                        break;
                    case PixelType::UInt16:
                        v = image.Row<uint16_t>(y)[i] / 65535.0f;
                        break;
                    case PixelType::Int32:
                        v = static_cast<float>(image.Row<int32_t>(y)[i]);
                        break;
                    case PixelType::Float32:
                        v = image.Row<float>(y)[i];
                        break;
                }
                t.data[c * plane + static_cast<size_t>(y) * width + x] = v;
            }
        }
    }
    return t;
}

const Tensor* FindTensor(const std::vector<Tensor>& tensors, const std::string& name) {
    auto it = std::find_if(tensors.begin(), tensors.end(),
                           [&](const Tensor& t) { return t.name == name; });
    return (it != tensors.end()) ? &*it : nullptr;
}

// =============================================================================
// Model
// =============================================================================

#ifdef CPNVISION_HAS_ONNXRUNTIME

namespace {

Ort::Env& SharedEnv() {
    static Ort::Env env(ORT_LOGGING_LEVEL_WARNING, "CpnVision");
    return env;
}

std::vector<std::string> NodeNames(const Ort::Session& session, bool inputs) {
    Ort::AllocatorWithDefaultOptions allocator;
    const size_t count = inputs ? session.GetInputCount() : session.GetOutputCount();
    std::vector<std::string> names;
    for (size_t i = 0; i < count; ++i) {
        auto name = inputs ? session.GetInputNameAllocated(i, allocator)
                           : session.GetOutputNameAllocated(i, allocator);
        names.emplace_back(name.get());
    }
    return names;
}

} // namespace

class Model::Impl {
public:
    std::unique_ptr<Ort::Session> session;
    std::vector<std::string> inputNames;
    std::vector<std::string> outputNames;

    bool Loaded() const { return session != nullptr; }

    void Clear() {
        session.reset();
        inputNames.clear();
        outputNames.clear();
    }

    // Ort::Exception means the runtime rejected the file
    bool Open(const std::string& path, const SessionOptions& opts) {
        Clear();
        try {
            Ort::SessionOptions options;
            options.SetIntraOpNumThreads(opts.numThreads);
            options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);
            if (opts.gpuIndex >= 0) {
                OrtCUDAProviderOptions cuda;
                cuda.device_id = opts.gpuIndex;
                options.AppendExecutionProvider_CUDA(cuda);
            }
#ifdef _WIN32
            std::wstring widePath(path.begin(), path.end());
            session = std::make_unique<Ort::Session>(SharedEnv(), widePath.c_str(), options);
#else
            session = std::make_unique<Ort::Session>(SharedEnv(), path.c_str(), options);
#endif
            inputNames = NodeNames(*session, true);
            outputNames = NodeNames(*session, false);
        } catch (const Ort::Exception& e) {
            CPNVISION_DIAG("Inference", "cannot load %s: %s", path.c_str(), e.what());
            Clear();
            return false;
        }
        return true;
    }

    std::vector<Tensor> Run(const std::vector<Tensor>& inputs) {
        Ort::MemoryInfo memory = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);

        std::vector<const char*> feedNames;
        std::vector<Ort::Value> feeds;
        for (size_t i = 0; i < inputs.size(); ++i) {
            const Tensor& t = inputs[i];
            // Unnamed inputs bind to the model inputs by position
            const std::string* name = !t.name.empty() ? &t.name
                                    : (i < inputNames.size() ? &inputNames[i] : nullptr);
            if (name == nullptr) {
                throw InvalidArgumentException("Inference::Model::Run: no name for input " +
                                               std::to_string(i));
            }
            if (!t.IsValid()) {
                throw InvalidArgumentException("Inference::Model::Run: input " + t.ShapeString() +
                                               " does not match " + std::to_string(t.data.size()) +
                                               " values");
            }
            feedNames.push_back(name->c_str());
            feeds.push_back(Ort::Value::CreateTensor<float>(
                memory, const_cast<float*>(t.data.data()), t.data.size(),
                t.shape.data(), t.shape.size()));
        }

        std::vector<const char*> fetchNames;
        for (const auto& n : outputNames) {
            fetchNames.push_back(n.c_str());
        }

        auto values = session->Run(Ort::RunOptions{nullptr}, feedNames.data(), feeds.data(),
                                   feeds.size(), fetchNames.data(), fetchNames.size());

        std::vector<Tensor> outputs;
        for (size_t i = 0; i < values.size(); ++i) {
            auto info = values[i].GetTensorTypeAndShapeInfo();
            if (info.GetElementType() != ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT) {
                throw UnsupportedException("Inference::Model::Run: output " + outputNames[i] +
                                           " is not float");
            }
            Tensor t(outputNames[i], info.GetShape(), {});
            const float* data = values[i].GetTensorData<float>();
            t.data.assign(data, data + t.NumElements());
            outputs.push_back(std::move(t));
        }
        return outputs;
    }
};

#else

class Model::Impl {
public:
    bool Loaded() const { return false; }
    void Clear() {}
};

#endif  // CPNVISION_HAS_ONNXRUNTIME

Model::Model() : impl_(std::make_unique<Impl>()) {}
Model::~Model() = default;
Model::Model(Model&& other) noexcept = default;
Model& Model::operator=(Model&& other) noexcept = default;

bool Model::Load(const std::string& modelPath, const SessionOptions& opts) {
    if (modelPath.empty()) {
        throw InvalidArgumentException("Inference::Model::Load: modelPath is empty");
    }
#ifdef CPNVISION_HAS_ONNXRUNTIME
    return impl_->Open(modelPath, opts);
#else
    (void)opts;
    throw UnsupportedException("Inference::Model::Load: built without ONNX Runtime");
#endif
}

bool Model::IsLoaded() const {
    return impl_ && impl_->Loaded();
}

void Model::Reset() {
    if (impl_) {
        impl_->Clear();
    }
}

std::vector<Tensor> Model::Run(const std::vector<Tensor>& inputs) {
#ifdef CPNVISION_HAS_ONNXRUNTIME
    if (!IsLoaded()) {
        throw InvalidArgumentException("Inference::Model::Run: model not loaded");
    }
    if (inputs.empty()) {
        throw InvalidArgumentException("Inference::Model::Run: no inputs");
    }
    return impl_->Run(inputs);
#else
    (void)inputs;
    throw UnsupportedException("Inference::Model::Run: built without ONNX Runtime");
#endif
}

std::vector<std::string> Model::InputNames() const {
#ifdef CPNVISION_HAS_ONNXRUNTIME
    if (impl_) return impl_->inputNames;
#endif
    return {};
}

std::vector<std::string> Model::OutputNames() const {
#ifdef CPNVISION_HAS_ONNXRUNTIME
    if (impl_) return impl_->outputNames;
#endif
    return {};
}

} // namespace Cpn::Vision::Inference
