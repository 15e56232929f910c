#include <torch/torch.h>
#include <vector>

#ifndef INSTANCES_H
#define INSTANCES_H

/*
    Ground truth of one image.
        labels: [N] int64 class indices in [0, num_classes)
        boxes: [N, 4] (center_x, center_y, w, h) normalized by the unpadded image size
        masks: optional [N, H, W] instance masks
        size: optional [2] (h, w) of the image after augmentation
        orig_size: optional [2] (h, w) of the image before augmentation
*/
class Instances {
public:
    Instances() { }
    Instances(torch::Tensor l, torch::Tensor b) : labels(l), boxes(b) { }

    int64_t len() const { return labels.defined() ? labels.size(0) : 0; }
    bool has_masks() const { return masks.defined(); }
    Instances to(torch::Device device) const;
    // every label collapsed to a single "object" class
    Instances binarized() const;
    void validate() const;

    torch::Tensor
        labels,
        boxes,
        masks,
        size,
        orig_size;
};

// keeps the first half of the list, the labeled source images of a domain adaptation batch
std::vector<Instances> source_half(const std::vector<Instances>& targets);

#endif
