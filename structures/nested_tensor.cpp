#include <algorithm>
#include <iostream>
#include <torch/torch.h>
#include <vector>
#include "structures/nested_tensor.h"


NestedTensor NestedTensor::to(torch::Device device) const {
    torch::Tensor cast_mask;
    if (mask.defined())
        cast_mask = mask.to(device);
    return NestedTensor(tensors.to(device), cast_mask);
}

void NestedTensor::repr(std::ostream& os) const {
    os << "NestedTensor(tensors=" << tensors.sizes() << ", mask=";
    if (mask.defined())
        os << mask.sizes();
    else
        os << "None";
    os << ")" << std::endl;
}


NestedTensor nested_tensor_from_tensor_vector(const std::vector<torch::Tensor>& tensor_vec) {
    TORCH_CHECK(!tensor_vec.empty(), "nested_tensor_from_tensor_vector: empty tensor list");
    int64_t ndim = tensor_vec[0].dim();
    TORCH_CHECK(ndim == 3 || ndim == 2, "nested_tensor_from_tensor_vector: expected [C, H, W] or [H, W] tensors, got ", ndim, " dims");

    std::vector<int64_t> max_size(tensor_vec[0].sizes().begin(), tensor_vec[0].sizes().end());
    for (const torch::Tensor& t : tensor_vec) {
        TORCH_CHECK(t.dim() == ndim, "nested_tensor_from_tensor_vector: tensors must share their number of dims");
        for (int64_t d = 0; d < ndim; ++d)
            max_size[d] = std::max(max_size[d], t.size(d));
    }

    int64_t batch = (int64_t)tensor_vec.size();
    std::vector<int64_t> batch_shape{batch};
    batch_shape.insert(batch_shape.end(), max_size.begin(), max_size.end());
    int64_t h = max_size[ndim - 2], w = max_size[ndim - 1];

    torch::Tensor tensor = torch::zeros(batch_shape, tensor_vec[0].options());
    torch::Tensor mask = torch::ones({batch, h, w}, torch::TensorOptions().dtype(torch::kBool).device(tensor_vec[0].device()));
    for (int64_t i = 0; i < batch; ++i) {
        const torch::Tensor& img = tensor_vec[i];
        int64_t ih = img.size(-2), iw = img.size(-1);
        if (ndim == 3)
            tensor.index({i,
                          torch::indexing::Slice(torch::indexing::None, img.size(0)),
                          torch::indexing::Slice(torch::indexing::None, ih),
                          torch::indexing::Slice(torch::indexing::None, iw)}).copy_(img);
        else
            tensor.index({i,
                          torch::indexing::Slice(torch::indexing::None, ih),
                          torch::indexing::Slice(torch::indexing::None, iw)}).copy_(img);
        mask.index_put_({i,
                         torch::indexing::Slice(torch::indexing::None, ih),
                         torch::indexing::Slice(torch::indexing::None, iw)}, false);
    }
    return NestedTensor(tensor, mask);
}
