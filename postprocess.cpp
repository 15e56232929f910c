#include <algorithm>
#include <torch/torch.h>
#include <vector>
#include "postprocess.h"
#include "utils/box_operations.h"


namespace {

torch::Tensor scale_factors(const torch::Tensor& target_sizes, int64_t batch) {
    TORCH_CHECK(target_sizes.dim() == 2 && target_sizes.size(1) == 2,
                "target_sizes must be [batch_size, 2] (h, w), got ", target_sizes.sizes());
    TORCH_CHECK(target_sizes.size(0) == batch,
                "got ", target_sizes.size(0), " target sizes for a batch of ", batch);
    std::vector<torch::Tensor> hw = target_sizes.unbind(1);
    torch::Tensor img_h = hw[0], img_w = hw[1];
    return torch::stack({img_w, img_h, img_w, img_h}, 1);
}

}


std::vector<Detection> PostProcessImpl::forward(const Prediction& outputs, const torch::Tensor& target_sizes) {
    torch::NoGradGuard no_grad;
    const torch::Tensor& out_logits = outputs.pred_logits;
    const torch::Tensor& out_bbox = outputs.pred_boxes;
    TORCH_CHECK(out_logits.defined() && out_bbox.defined(), "PostProcess needs pred_logits and pred_boxes");
    TORCH_CHECK(out_logits.dim() == 3 && out_bbox.dim() == 3 && out_bbox.size(-1) == 4,
                "PostProcess expects [B, Q, K] logits and [B, Q, 4] boxes");
    int64_t B = out_logits.size(0), K = out_logits.size(2);
    torch::Tensor scale_fct = scale_factors(target_sizes, B).to(out_bbox.device(), out_bbox.scalar_type());

    int64_t k = std::min<int64_t>(num_select, out_logits.size(1) * K);
    torch::Tensor prob = out_logits.sigmoid();
    auto [topk_values, topk_indexes] = torch::topk(prob.view({B, -1}), k, 1);
    torch::Tensor scores = topk_values;
    torch::Tensor topk_boxes = torch::div(topk_indexes, K, "floor");
    torch::Tensor labels = topk_indexes % K;
    torch::Tensor boxes = box_cxcywh_to_xyxy(out_bbox);
    boxes = torch::gather(boxes, 1, topk_boxes.unsqueeze(-1).repeat({1, 1, 4}));

    // and from relative [0, 1] to absolute [0, height] coordinates
    boxes = boxes * scale_fct.unsqueeze(1);

    std::vector<Detection> results;
    for (int64_t i = 0; i < B; ++i)
        results.push_back(Detection{scores[i], labels[i], boxes[i]});
    return results;
}


std::vector<torch::Tensor> PostProcessForTargetImpl::forward(const torch::Tensor& boxes, const torch::Tensor& target_sizes) {
    torch::NoGradGuard no_grad;
    TORCH_CHECK(boxes.defined() && boxes.dim() == 3 && boxes.size(-1) == 4,
                "PostProcessForTarget expects [B, N, 4] boxes");
    torch::Tensor scale_fct = scale_factors(target_sizes, boxes.size(0)).to(boxes.device(), boxes.scalar_type());
    torch::Tensor scaled = box_cxcywh_to_xyxy(boxes) * scale_fct.unsqueeze(1);
    return scaled.unbind(0);
}
