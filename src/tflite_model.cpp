#include "tflite_model.h"
#include "common_defines.h"
#include "tensorflow/lite/kernels/register.h"
#include <iostream>

namespace catface {

TfLiteModel::TfLiteModel(const std::string& model_path) : model_path_(model_path) {
    model_ = tflite::FlatBufferModel::BuildFromFile(model_path.c_str());
    CATFACE_ASSERT(model_ != nullptr, "Failed to load model from " + model_path);

    tflite::ops::builtin::BuiltinOpResolver resolver;
    tflite::InterpreterBuilder builder(*model_, resolver);
    CATFACE_ASSERT(builder(&interpreter_) == kTfLiteOk && interpreter_ != nullptr,
                   "Failed to create interpreter for model " + model_path);

    TfLiteXNNPackDelegateOptions xnnpack_options = TfLiteXNNPackDelegateOptionsDefault();
    xnnpack_delegate_ = TfLiteXNNPackDelegateCreate(&xnnpack_options);
    CATFACE_ASSERT(xnnpack_delegate_ != nullptr, "Failed to create XNNPack delegate for model " + model_path);

    if (interpreter_->ModifyGraphWithDelegate(xnnpack_delegate_) != kTfLiteOk) {
        // The reference kernels still work, just slower
        std::cerr << "Warning: XNNPack delegate rejected graph of " << model_path
                  << ", falling back to default kernels" << std::endl;
    }

    CATFACE_ASSERT(interpreter_->AllocateTensors() == kTfLiteOk,
                   "Failed to allocate tensors for model " + model_path);

    for (int i = 0; i < GetInputTensorCount(); ++i) {
        CATFACE_ASSERT(GetInputTensorData(i) != nullptr, "Expected float input tensors in model " + model_path);
    }
    std::cout << "TFLite model loaded from " << model_path << std::endl;
}

TfLiteModel::~TfLiteModel() {
    // The interpreter must release the delegate before it is deleted
    interpreter_.reset();
    if (xnnpack_delegate_) {
        TfLiteXNNPackDelegateDelete(xnnpack_delegate_);
    }
}

bool TfLiteModel::Invoke() {
    if (interpreter_->Invoke() != kTfLiteOk) {
        std::cerr << "Error: Inference failed for model " << model_path_ << std::endl;
        return false;
    }
    return true;
}

} // namespace catface
