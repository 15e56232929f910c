#include <torch/torch.h>
#include <vector>

#ifndef NESTEDTENSOR_H
#define NESTEDTENSOR_H


class NestedTensor {
/*
    A padded batch together with its padding mask.
        tensors: [B, C, H, W]
        mask: [B, H, W] bool, true on padded pixels
*/
public:
    NestedTensor() { }
    NestedTensor(torch::Tensor t, torch::Tensor m) : tensors(t), mask(m) { }
    NestedTensor to(torch::Device device) const;
    std::pair<torch::Tensor, torch::Tensor> decompose() const { return {tensors, mask}; }
    void repr(std::ostream& os) const;

    torch::Tensor
        tensors,
        mask;
};


// pads a list of [C, H, W] (or [H, W]) tensors to the largest size in the list
NestedTensor nested_tensor_from_tensor_vector(const std::vector<torch::Tensor>& tensor_vec);

#endif
