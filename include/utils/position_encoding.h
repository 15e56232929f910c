#include <torch/torch.h>
#include "structures/nested_tensor.h"
#ifndef POSITIONENCODING_H
#define POSITIONENCODING_H


class PositionEmbeddingSineImpl : public torch::nn::Module {
/*
    This is a more standard version of the position embedding, very similar to the one
    used by the Attention is all you need paper, generalized to work on images.
*/
public:
    PositionEmbeddingSineImpl(int num_pos_feats = 64,
                              int temperature = 10000,
                              bool normalize = false,
                              double scale = 0.);
    // class methods:
    torch::Tensor forward(const NestedTensor& tensor_list);

    int num_pos_feats, temperature;
    bool normalize;
    double scale;
};
TORCH_MODULE(PositionEmbeddingSine);

#endif
