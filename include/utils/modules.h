#include <torch/torch.h>
#include <memory>
#include <vector>
#ifndef MODULES_H
#define MODULES_H

template <typename ModuleType>
std::vector<ModuleType> get_clones(
    const ModuleType& module,
    int const& num_layers,
    bool const& layer_share = false
) {
    std::vector<ModuleType> ret;
    if (layer_share) {
        for (int i = 0; i < num_layers; ++i)
            ret.push_back(module);
        return ret;
    }
    else {
        for (int i = 0; i < num_layers; ++i)
            ret.push_back(ModuleType(std::dynamic_pointer_cast<typename ModuleType::ContainedType>(module->clone())));
        return ret;
    }
}


class MLPImpl : public torch::nn::Cloneable<MLPImpl> {
    /* Very simple multi-layer perceptron (also called FFN) */
public:
    MLPImpl(int input_dim, int hidden_dim, int output_dim, int num_layers);
    void reset() override;
    torch::Tensor forward(torch::Tensor x);
    void xavier_init();
    torch::nn::LinearImpl* layer(int idx);

    int
        input_dim,
        hidden_dim,
        output_dim,
        num_layers;
    torch::nn::ModuleList
        layers = nullptr;
};
TORCH_MODULE(MLP);


class GradientReversalFunction : public torch::autograd::Function<GradientReversalFunction> {
/*
    Identity in the forward pass, multiplies the incoming gradient by -lambda
    in the backward pass.
*/
public:
    static torch::Tensor forward(torch::autograd::AutogradContext* ctx,
                                 torch::Tensor x,
                                 double lambda);
    static torch::autograd::tensor_list backward(torch::autograd::AutogradContext* ctx,
                                                 torch::autograd::tensor_list grad_output);
};


class GradientReversalImpl : public torch::nn::Module {
public:
    explicit GradientReversalImpl(double lambda = 1.0) : lambda(lambda) { }
    torch::Tensor forward(torch::Tensor x);

    double lambda;
};
TORCH_MODULE(GradientReversal);

#endif
