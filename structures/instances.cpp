#include <torch/torch.h>
#include <vector>
#include "structures/instances.h"


Instances Instances::to(torch::Device device) const {
    Instances ret;
    if (labels.defined()) ret.labels = labels.to(device);
    if (boxes.defined()) ret.boxes = boxes.to(device);
    if (masks.defined()) ret.masks = masks.to(device);
    if (size.defined()) ret.size = size.to(device);
    if (orig_size.defined()) ret.orig_size = orig_size.to(device);
    return ret;
}

Instances Instances::binarized() const {
    Instances ret = *this;
    ret.labels = torch::zeros_like(labels);
    return ret;
}

void Instances::validate() const {
    TORCH_CHECK(labels.defined(), "Instances: missing labels");
    TORCH_CHECK(boxes.defined(), "Instances: missing boxes");
    TORCH_CHECK(labels.dim() == 1, "Instances: labels must be [N], got ", labels.sizes());
    TORCH_CHECK(boxes.dim() == 2 && boxes.size(1) == 4, "Instances: boxes must be [N, 4], got ", boxes.sizes());
    TORCH_CHECK(labels.size(0) == boxes.size(0),
                "Instances: ", labels.size(0), " labels for ", boxes.size(0), " boxes");
    if (masks.defined())
        TORCH_CHECK(masks.size(0) == labels.size(0),
                    "Instances: ", masks.size(0), " masks for ", labels.size(0), " labels");
}


std::vector<Instances> source_half(const std::vector<Instances>& targets) {
    return std::vector<Instances>(targets.begin(), targets.begin() + targets.size() / 2);
}
