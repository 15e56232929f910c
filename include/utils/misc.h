#include <functional>
#include <torch/torch.h>
#include <vector>
#ifndef MISC_H
#define MISC_H

/*
    Distributed helpers. A training loop running on several workers installs an
    all-reduce hook (summing a tensor in place across workers) together with the
    worker count before the first criterion call. Without a hook every call
    degenerates to the local value.
*/
using AllReduceHook = std::function<void(torch::Tensor&)>;

void set_all_reduce_hook(AllReduceHook hook, int world_size);
void clear_all_reduce_hook();
bool is_dist_avail_and_initialized();
int get_world_size();
void all_reduce(torch::Tensor& tensor);


// top-k precision in percent, one value per k
std::vector<torch::Tensor> accuracy(const torch::Tensor& output,
                                    const torch::Tensor& target,
                                    const std::vector<int64_t>& topk = {1});

#endif
