#include <torch/torch.h>
#include <vector>

#ifndef BOXOPERATIONS_H
#define BOXOPERATIONS_H

/*
    Utilities for bounding boxes and their manipulation
*/

torch::Tensor box_cxcywh_to_xyxy(const torch::Tensor& x);

torch::Tensor box_xyxy_to_cxcywh(const torch::Tensor& x);

torch::Tensor box_area(const torch::Tensor& boxes);

// returns {iou [N,M], union [N,M]}
std::vector<torch::Tensor> box_iou(const torch::Tensor& boxes1,
                                   const torch::Tensor& boxes2);

torch::Tensor generalized_box_iou(const torch::Tensor& boxes1,
                                  const torch::Tensor& boxes2);

torch::Tensor inverse_sigmoid(const torch::Tensor& x, double eps = 1e-5);

#endif
