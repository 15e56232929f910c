#include <torch/torch.h>
#include <vector>
#include "utils/box_operations.h"


torch::Tensor box_cxcywh_to_xyxy(const torch::Tensor& x) {
    std::vector<torch::Tensor> vec = x.unbind(-1);
    TORCH_CHECK(vec.size() == 4, "box_cxcywh_to_xyxy expects 4 coordinates in the last dimension, got ", vec.size());
    torch::Tensor x_c = vec[0];
    torch::Tensor y_c = vec[1];
    torch::Tensor w = vec[2];
    torch::Tensor h = vec[3];

    std::vector<torch::Tensor> b = {
        x_c - 0.5 * w,
        y_c - 0.5 * h,
        x_c + 0.5 * w,
        y_c + 0.5 * h
    };

    return torch::stack(b, -1);
}


torch::Tensor box_xyxy_to_cxcywh(const torch::Tensor& x) {
    std::vector<torch::Tensor> vec = x.unbind(-1);
    TORCH_CHECK(vec.size() == 4, "box_xyxy_to_cxcywh expects 4 coordinates in the last dimension, got ", vec.size());
    torch::Tensor x0 = vec[0];
    torch::Tensor y0 = vec[1];
    torch::Tensor x1 = vec[2];
    torch::Tensor y1 = vec[3];

    std::vector<torch::Tensor> b = {
        (x0 + x1) * 0.5,
        (y0 + y1) * 0.5,
        (x1 - x0),
        (y1 - y0),
    };

    return torch::stack(b, -1);
}


torch::Tensor box_area(const torch::Tensor& boxes) {
    return (boxes.index({torch::indexing::Slice(), 2}) - boxes.index({torch::indexing::Slice(), 0}))
           * (boxes.index({torch::indexing::Slice(), 3}) - boxes.index({torch::indexing::Slice(), 1}));
}


std::vector<torch::Tensor> box_iou(const torch::Tensor& boxes1, const torch::Tensor& boxes2) {
    torch::Tensor area1 = box_area(boxes1);
    torch::Tensor area2 = box_area(boxes2);

    torch::Tensor lt = torch::max(boxes1.index({torch::indexing::Slice(),
                                                torch::indexing::None,
                                                torch::indexing::Slice(torch::indexing::None, 2)}),
                                  boxes2.index({torch::indexing::Slice(),
                                                torch::indexing::Slice(torch::indexing::None, 2)}));
    torch::Tensor rb = torch::min(boxes1.index({torch::indexing::Slice(),
                                                torch::indexing::None,
                                                torch::indexing::Slice(2, torch::indexing::None)}),
                                  boxes2.index({torch::indexing::Slice(),
                                                torch::indexing::Slice(2, torch::indexing::None)}));

    torch::Tensor wh = (rb - lt).clamp_min(0);
    torch::Tensor inter = wh.index({torch::indexing::Slice(), torch::indexing::Slice(), 0})
                          * wh.index({torch::indexing::Slice(), torch::indexing::Slice(), 1});

    torch::Tensor union_ = area1.index({torch::indexing::Slice(), torch::indexing::None}) + area2 - inter;

    torch::Tensor iou = inter / union_;
    return std::vector<torch::Tensor> {iou, union_};
}


torch::Tensor generalized_box_iou(const torch::Tensor& boxes1, const torch::Tensor& boxes2) {
/*
    Generalized IoU from https://giou.stanford.edu/

    The boxes should be in [x0, y0, x1, y1] format

    Returns a [N, M] pairwise matrix, where N = len(boxes1)
    and M = len(boxes2)
*/
    // degenerate boxes gives inf / nan results
    TORCH_CHECK((boxes1.index({torch::indexing::Slice(), torch::indexing::Slice(2, torch::indexing::None)})
                 >= boxes1.index({torch::indexing::Slice(), torch::indexing::Slice(torch::indexing::None, 2)})).all().item<bool>(),
                "generalized_box_iou: boxes1 has x1 < x0 or y1 < y0");
    TORCH_CHECK((boxes2.index({torch::indexing::Slice(), torch::indexing::Slice(2, torch::indexing::None)})
                 >= boxes2.index({torch::indexing::Slice(), torch::indexing::Slice(torch::indexing::None, 2)})).all().item<bool>(),
                "generalized_box_iou: boxes2 has x1 < x0 or y1 < y0");
    std::vector<torch::Tensor> iou_union = box_iou(boxes1, boxes2);
    torch::Tensor iou = iou_union[0],
                  union_ = iou_union[1];

    torch::Tensor lt = torch::min(boxes1.index({torch::indexing::Slice(),
                                                torch::indexing::None,
                                                torch::indexing::Slice(torch::indexing::None, 2)}),
                                  boxes2.index({torch::indexing::Slice(),
                                                torch::indexing::Slice(torch::indexing::None, 2)}));
    torch::Tensor rb = torch::max(boxes1.index({torch::indexing::Slice(),
                                                torch::indexing::None,
                                                torch::indexing::Slice(2, torch::indexing::None)}),
                                  boxes2.index({torch::indexing::Slice(),
                                                torch::indexing::Slice(2, torch::indexing::None)}));

    torch::Tensor wh = (rb - lt).clamp_min(0);
    torch::Tensor area = wh.index({torch::indexing::Slice(), torch::indexing::Slice(), 0})
                         * wh.index({torch::indexing::Slice(), torch::indexing::Slice(), 1});

    return iou - (area - union_) / area;
}


torch::Tensor inverse_sigmoid(const torch::Tensor& x, double eps) {
    torch::Tensor y = x.clamp(0, 1);
    torch::Tensor x1 = y.clamp_min(eps);
    torch::Tensor x2 = (1 - y).clamp_min(eps);
    return torch::log(x1 / x2);
}
