#include <torch/torch.h>
#include <vector>
#include "utils/modules.h"


MLPImpl::MLPImpl(int input_dim, int hidden_dim, int output_dim, int num_layers) :
input_dim(input_dim), hidden_dim(hidden_dim), output_dim(output_dim), num_layers(num_layers)
{
    TORCH_CHECK(num_layers >= 1, "MLP needs at least one layer, got ", num_layers);
    reset();
}

void MLPImpl::reset() {
    layers = torch::nn::ModuleList();
    std::vector<int> in_dims{input_dim}, out_dims{};
    for (int i = 0; i < num_layers - 1; ++i) {
        in_dims.push_back(hidden_dim);
        out_dims.push_back(hidden_dim);
    }
    out_dims.push_back(output_dim);
    for (int i = 0; i < num_layers; ++i)
        layers->push_back(torch::nn::Linear(in_dims[i], out_dims[i]));
    layers = register_module("layers", layers);
}

torch::nn::LinearImpl* MLPImpl::layer(int idx) {
    if (idx < 0)
        idx += num_layers;
    return layers[idx]->as<torch::nn::Linear>();
}

torch::Tensor MLPImpl::forward(torch::Tensor x) {
    for (int i = 0; i < num_layers; ++i) {
        // relu on every layer but the last
        x = layer(i)->forward(x);
        if (i < num_layers - 1)
            x = torch::relu(x);
    }
    return x;
}

void MLPImpl::xavier_init() {
    torch::NoGradGuard no_grad;
    for (int i = 0; i < num_layers; ++i) {
        torch::nn::init::xavier_uniform_(layer(i)->weight, 1.0);
        torch::nn::init::constant_(layer(i)->bias, 0);
    }
}


torch::Tensor GradientReversalFunction::forward(torch::autograd::AutogradContext* ctx,
                                                torch::Tensor x,
                                                double lambda)
{
    ctx->saved_data["lambda"] = lambda;
    return x.clone();
}

torch::autograd::tensor_list GradientReversalFunction::backward(torch::autograd::AutogradContext* ctx,
                                                                torch::autograd::tensor_list grad_output)
{
    double lambda = ctx->saved_data["lambda"].toDouble();
    return {-lambda * grad_output[0], torch::Tensor()};
}

torch::Tensor GradientReversalImpl::forward(torch::Tensor x) {
    return GradientReversalFunction::apply(x, lambda);
}
