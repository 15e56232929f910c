#include <math.h>
#include <torch/torch.h>
#include "utils/position_encoding.h"


PositionEmbeddingSineImpl::PositionEmbeddingSineImpl(int num_pos_feats,
                                                     int temperature,
                                                     bool normalize,
                                                     double scale) :
torch::nn::Module(), num_pos_feats(num_pos_feats), temperature(temperature), normalize(normalize)
{
    TORCH_CHECK(scale == 0 || normalize, "normalize should be true if scale is passed");
    if (scale == 0)
        this->scale = 2 * M_PI;
    else
        this->scale = scale;
}

torch::Tensor PositionEmbeddingSineImpl::forward(const NestedTensor& tensor_list)
{
    const torch::Tensor& x = tensor_list.tensors;
    torch::Tensor mask = tensor_list.mask;
    if (!mask.defined())
        mask = torch::zeros({x.size(0), x.size(2), x.size(3)},
                            torch::TensorOptions().device(x.device()).dtype(torch::kBool));
    torch::Tensor not_mask = ~mask;
    torch::Tensor y_embed = not_mask.cumsum(1, torch::kFloat32);
    torch::Tensor x_embed = not_mask.cumsum(2, torch::kFloat32);
    if (this->normalize) {
        double eps = 1e-6;
        y_embed = (y_embed - 0.5) / (y_embed.index({torch::indexing::Slice(),
                                                    torch::indexing::Slice(-1, torch::indexing::None),
                                                    torch::indexing::Slice()})
                                     + eps) * this->scale;
        x_embed = (x_embed - 0.5) / (x_embed.index({torch::indexing::Slice(),
                                                    torch::indexing::Slice(),
                                                    torch::indexing::Slice(-1, torch::indexing::None)})
                                     + eps) * this->scale;
    }
    torch::Tensor dimension_t = torch::arange(this->num_pos_feats,
                                              torch::TensorOptions().dtype(torch::kFloat32).device(x.device()));
    dimension_t = torch::pow((double)this->temperature,
                             2 * torch::div(dimension_t, 2, "floor") / this->num_pos_feats);

    torch::Tensor pos_x = x_embed.index({torch::indexing::Slice(),
                                         torch::indexing::Slice(),
                                         torch::indexing::Slice(),
                                         torch::indexing::None})
                          / dimension_t;

    torch::Tensor pos_y = y_embed.index({torch::indexing::Slice(),
                                         torch::indexing::Slice(),
                                         torch::indexing::Slice(),
                                         torch::indexing::None})
                          / dimension_t;

    pos_x = torch::stack({pos_x.index({torch::indexing::Slice(),
                                       torch::indexing::Slice(),
                                       torch::indexing::Slice(),
                                       torch::indexing::Slice(0, torch::indexing::None, 2)}).sin(),
                          pos_x.index({torch::indexing::Slice(),
                                       torch::indexing::Slice(),
                                       torch::indexing::Slice(),
                                       torch::indexing::Slice(1, torch::indexing::None, 2)}).cos()},
                          4).flatten(3);

    pos_y = torch::stack({pos_y.index({torch::indexing::Slice(),
                                       torch::indexing::Slice(),
                                       torch::indexing::Slice(),
                                       torch::indexing::Slice(0, torch::indexing::None, 2)}).sin(),
                          pos_y.index({torch::indexing::Slice(),
                                       torch::indexing::Slice(),
                                       torch::indexing::Slice(),
                                       torch::indexing::Slice(1, torch::indexing::None, 2)}).cos()},
                          4).flatten(3);

    torch::Tensor pos = torch::cat({pos_y, pos_x}, 3).permute({0, 3, 1, 2});
    return pos;
}
