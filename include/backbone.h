#include <torch/torch.h>
#include <vector>
#include "structures/nested_tensor.h"
#ifndef BACKBONE_H
#define BACKBONE_H


struct BackboneOutput {
    std::vector<NestedTensor> features;   // one (feature map, mask) pair per scale
    std::vector<torch::Tensor> pos;        // positional encoding per scale
};


struct Backbone : public torch::nn::Module {
/* Abstract base class for network backbones joined with their position embedding. */
    virtual ~Backbone() = default;

    virtual BackboneOutput forward(const NestedTensor& samples) = 0;
    /* Subclasses must override this method.
    Returns:
        features: one NestedTensor per returned scale, finest first, masks resampled
                  from the image padding mask
        pos: positional encoding of every returned scale */

    virtual torch::Tensor position_embedding(const NestedTensor& x) = 0;
    /* Positional encoding of an arbitrary (feature map, mask) pair. Used for the
       coarser scales synthesized on top of the backbone outputs. */

    virtual std::vector<int> num_channels() const = 0;
    virtual std::vector<int> strides() const = 0;

    virtual int size_divisibility() const { return 0; }
};

#endif
