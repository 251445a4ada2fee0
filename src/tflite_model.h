#pragma once

#include <memory>
#include <string>
#include "tensorflow/lite/interpreter.h"
#include "tensorflow/lite/model.h"
#include "tensorflow/lite/delegates/xnnpack/xnnpack_delegate.h"

namespace catface {

// Owns a TFLite interpreter for one float model. Not thread safe: a single
// detection runs at a time.
class TfLiteModel {
public:
    explicit TfLiteModel(const std::string& model_path);
    virtual ~TfLiteModel();

    TfLiteModel(const TfLiteModel&) = delete;
    TfLiteModel& operator=(const TfLiteModel&) = delete;

    int GetInputTensorCount() const { return static_cast<int>(interpreter_->inputs().size()); }
    int GetOutputTensorCount() const { return static_cast<int>(interpreter_->outputs().size()); }

    const TfLiteIntArray* GetInputTensorShape(int tensor_idx) const {
        return interpreter_->tensor(interpreter_->inputs()[tensor_idx])->dims;
    }
    const TfLiteIntArray* GetOutputTensorShape(int tensor_idx) const {
        return interpreter_->tensor(interpreter_->outputs()[tensor_idx])->dims;
    }

    float* GetInputTensorData(int tensor_idx) {
        return interpreter_->typed_tensor<float>(interpreter_->inputs()[tensor_idx]);
    }
    float* GetOutputTensorData(int tensor_idx) {
        return interpreter_->typed_tensor<float>(interpreter_->outputs()[tensor_idx]);
    }

protected:
    // Returns false when the interpreter reports an error
    bool Invoke();

    std::unique_ptr<tflite::FlatBufferModel> model_;
    std::unique_ptr<tflite::Interpreter> interpreter_;

private:
    std::string model_path_;
    // XNNPack delegate for optimized inference on ARM devices
    TfLiteDelegate* xnnpack_delegate_ = nullptr;
};

} // namespace catface
