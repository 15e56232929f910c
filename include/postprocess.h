#include <torch/torch.h>
#include <vector>
#include "output/detr_output.h"
#ifndef POSTPROCESS_H
#define POSTPROCESS_H


struct Detection {
    torch::Tensor
        scores,     // [k] descending
        labels,     // [k] int64
        boxes;      // [k, 4] absolute (x0, y0, x1, y1)
};


class PostProcessImpl : public torch::nn::Module {
/* Converts the model's output into per-image scored detections in absolute image coordinates */
public:
    explicit PostProcessImpl(int num_select = 100) : num_select(num_select) {
        TORCH_CHECK(num_select >= 1, "PostProcess needs num_select >= 1, got ", num_select);
    }
    /*
        target_sizes: [batch_size, 2] (h, w) of each image of the batch.
                      For evaluation, this must be the original image size (before any data augmentation)
                      For visualization, this should be the image size after data augment, but before padding
    */
    std::vector<Detection> forward(const Prediction& outputs, const torch::Tensor& target_sizes);

    int num_select;
};
TORCH_MODULE(PostProcess);


class PostProcessForTargetImpl : public torch::nn::Module {
/* Rescales raw (cx, cy, w, h) boxes of unlabeled images to absolute corners, no scoring */
public:
    // boxes: [B, N, 4] normalized; returns one [N, 4] tensor per image
    std::vector<torch::Tensor> forward(const torch::Tensor& boxes, const torch::Tensor& target_sizes);
};
TORCH_MODULE(PostProcessForTarget);

#endif
