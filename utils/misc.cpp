#include <algorithm>
#include <mutex>
#include <torch/torch.h>
#include <vector>
#include "utils/misc.h"

namespace {

std::mutex dist_mutex;
AllReduceHook dist_hook;
int dist_world_size = 1;

}


void set_all_reduce_hook(AllReduceHook hook, int world_size) {
    TORCH_CHECK(world_size >= 1, "world size must be positive, got ", world_size);
    std::lock_guard<std::mutex> lock(dist_mutex);
    dist_hook = std::move(hook);
    dist_world_size = world_size;
}

void clear_all_reduce_hook() {
    std::lock_guard<std::mutex> lock(dist_mutex);
    dist_hook = nullptr;
    dist_world_size = 1;
}

bool is_dist_avail_and_initialized() {
    std::lock_guard<std::mutex> lock(dist_mutex);
    return static_cast<bool>(dist_hook);
}

int get_world_size() {
    std::lock_guard<std::mutex> lock(dist_mutex);
    if (!dist_hook)
        return 1;
    return dist_world_size;
}

void all_reduce(torch::Tensor& tensor) {
    AllReduceHook hook;
    {
        std::lock_guard<std::mutex> lock(dist_mutex);
        hook = dist_hook;
    }
    if (hook)
        hook(tensor);
}


std::vector<torch::Tensor> accuracy(const torch::Tensor& output,
                                    const torch::Tensor& target,
                                    const std::vector<int64_t>& topk)
{
    torch::NoGradGuard no_grad;
    if (target.numel() == 0)
        return std::vector<torch::Tensor> {torch::zeros({}, output.options())};
    int64_t maxk = *std::max_element(topk.begin(), topk.end());
    int64_t batch_size = target.size(0);

    torch::Tensor pred = std::get<1>(output.topk(maxk, 1, true, true));
    pred = pred.t();
    torch::Tensor correct = pred.eq(target.view({1, -1}).expand_as(pred));

    std::vector<torch::Tensor> res;
    for (int64_t k : topk) {
        torch::Tensor correct_k = correct.index({torch::indexing::Slice(torch::indexing::None, k)})
                                         .reshape(-1).to(torch::kFloat).sum(0);
        res.push_back(correct_k.mul(100.0 / batch_size).to(output.dtype()));
    }
    return res;
}
