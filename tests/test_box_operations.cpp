#include <torch/torch.h>
#include <vector>
#include "gtest/gtest.h"
#include "structures/instances.h"
#include "structures/nested_tensor.h"
#include "utils/box_operations.h"
#include "utils/misc.h"
#include "utils/modules.h"
#include "utils/position_encoding.h"


TEST(box_operations, cxcywh_to_xyxy_uses_height_for_y)
{
    torch::Tensor box = torch::tensor({{0.5f, 0.5f, 0.2f, 0.6f}});
    torch::Tensor xyxy = box_cxcywh_to_xyxy(box);
    torch::Tensor expected = torch::tensor({{0.4f, 0.2f, 0.6f, 0.8f}});
    EXPECT_TRUE(torch::allclose(xyxy, expected));
    EXPECT_TRUE(torch::allclose(box_xyxy_to_cxcywh(xyxy), box));
}

TEST(box_operations, area_and_iou)
{
    torch::Tensor a = torch::tensor({{0.f, 0.f, 2.f, 2.f}});
    torch::Tensor b = torch::tensor({{1.f, 1.f, 3.f, 3.f}, {0.f, 0.f, 2.f, 2.f}});
    EXPECT_FLOAT_EQ(box_area(a)[0].item<float>(), 4.f);

    std::vector<torch::Tensor> iou_union = box_iou(a, b);
    ASSERT_EQ(iou_union.size(), 2u);
    EXPECT_NEAR(iou_union[0][0][0].item<float>(), 1.f / 7.f, 1e-6);
    EXPECT_NEAR(iou_union[0][0][1].item<float>(), 1.f, 1e-6);
    EXPECT_NEAR(iou_union[1][0][0].item<float>(), 7.f, 1e-6);
}

TEST(box_operations, generalized_box_iou_identical_and_disjoint)
{
    torch::Tensor a = torch::tensor({{0.f, 0.f, 1.f, 1.f}});
    torch::Tensor b = torch::tensor({{0.f, 0.f, 1.f, 1.f}, {2.f, 0.f, 3.f, 1.f}});
    torch::Tensor giou = generalized_box_iou(a, b);
    EXPECT_NEAR(giou[0][0].item<float>(), 1.f, 1e-6);
    // enclosing box [0, 3] x [0, 1], union 2
    EXPECT_NEAR(giou[0][1].item<float>(), -1.f / 3.f, 1e-6);
}

TEST(box_operations, generalized_box_iou_rejects_degenerate_boxes)
{
    torch::Tensor good = torch::tensor({{0.f, 0.f, 1.f, 1.f}});
    torch::Tensor bad = torch::tensor({{1.f, 1.f, 0.f, 0.f}});
    EXPECT_THROW(generalized_box_iou(bad, good), c10::Error);
    EXPECT_THROW(generalized_box_iou(good, bad), c10::Error);
}

TEST(box_operations, generalized_box_iou_of_empty_sets)
{
    torch::Tensor empty = torch::zeros({0, 4});
    torch::Tensor some = torch::tensor({{0.f, 0.f, 1.f, 1.f}});
    EXPECT_EQ(generalized_box_iou(empty, some).sizes(), torch::IntArrayRef({0, 1}));
}

TEST(box_operations, inverse_sigmoid_inverts_sigmoid)
{
    torch::Tensor x = torch::tensor({0.1f, 0.5f, 0.9f});
    EXPECT_TRUE(torch::allclose(inverse_sigmoid(x).sigmoid(), x, 1e-4, 1e-5));
    // clamped at the borders
    torch::Tensor border = inverse_sigmoid(torch::tensor({0.f, 1.f}));
    EXPECT_TRUE(torch::isfinite(border).all().item<bool>());
}


TEST(nested_tensor, pads_to_largest_and_masks_padding)
{
    std::vector<torch::Tensor> images = {torch::ones({3, 4, 6}), torch::ones({3, 5, 2})};
    NestedTensor batch = nested_tensor_from_tensor_vector(images);
    EXPECT_EQ(batch.tensors.sizes(), torch::IntArrayRef({2, 3, 5, 6}));
    EXPECT_EQ(batch.mask.sizes(), torch::IntArrayRef({2, 5, 6}));
    EXPECT_FALSE(batch.mask[0][3][5].item<bool>());
    EXPECT_TRUE(batch.mask[0][4][0].item<bool>());
    EXPECT_TRUE(batch.mask[1][0][2].item<bool>());
    EXPECT_EQ(batch.tensors[1].sum().item<float>(), 3.f * 5.f * 2.f);
}

TEST(nested_tensor, rejects_empty_list)
{
    EXPECT_THROW(nested_tensor_from_tensor_vector({}), c10::Error);
}


TEST(instances, validate_and_binarize)
{
    Instances t(torch::tensor({3, 5}, torch::kLong), torch::rand({2, 4}));
    EXPECT_NO_THROW(t.validate());
    EXPECT_EQ(t.binarized().labels.sum().item<int64_t>(), 0);
    EXPECT_EQ(t.labels.sum().item<int64_t>(), 8);

    Instances bad(torch::tensor({1}, torch::kLong), torch::rand({2, 4}));
    EXPECT_THROW(bad.validate(), c10::Error);
}

TEST(instances, source_half_keeps_first_half)
{
    std::vector<Instances> targets;
    for (int i = 0; i < 4; ++i)
        targets.push_back(Instances(torch::full({1}, i, torch::kLong), torch::rand({1, 4})));
    std::vector<Instances> source = source_half(targets);
    ASSERT_EQ(source.size(), 2u);
    EXPECT_EQ(source[1].labels[0].item<int64_t>(), 1);
}


TEST(modules, mlp_shapes_and_clones_are_independent)
{
    MLP mlp(8, 16, 4, 3);
    EXPECT_EQ(mlp->layers->size(), 3u);
    EXPECT_EQ(mlp->forward(torch::rand({2, 5, 8})).sizes(), torch::IntArrayRef({2, 5, 4}));

    std::vector<MLP> clones = get_clones(mlp, 2);
    {
        torch::NoGradGuard no_grad;
        clones[0]->layer(-1)->bias.fill_(7.0);
    }
    EXPECT_FALSE(torch::equal(clones[0]->layer(-1)->bias, clones[1]->layer(-1)->bias));
    EXPECT_FALSE(torch::equal(clones[0]->layer(-1)->bias, mlp->layer(-1)->bias));

    std::vector<MLP> shared = get_clones(mlp, 2, true);
    EXPECT_EQ(shared[0].ptr(), shared[1].ptr());
}

TEST(modules, gradient_reversal_negates_gradient)
{
    GradientReversal grl(0.5);
    torch::Tensor x = torch::ones({3}, torch::requires_grad());
    torch::Tensor y = grl->forward(x);
    EXPECT_TRUE(torch::equal(y.detach(), x.detach()));
    y.sum().backward();
    EXPECT_TRUE(torch::allclose(x.grad(), torch::full({3}, -0.5f)));
}

TEST(modules, position_embedding_sine_shape)
{
    PositionEmbeddingSine pos(16, 10000, true);
    NestedTensor x(torch::rand({2, 8, 5, 7}), torch::zeros({2, 5, 7}, torch::kBool));
    EXPECT_EQ(pos->forward(x).sizes(), torch::IntArrayRef({2, 32, 5, 7}));
    EXPECT_THROW(PositionEmbeddingSine(16, 10000, false, 3.0), c10::Error);
}


TEST(misc, accuracy_of_empty_target_is_zero)
{
    std::vector<torch::Tensor> acc = accuracy(torch::rand({0, 5}), torch::zeros({0}, torch::kLong));
    EXPECT_EQ(acc[0].item<float>(), 0.f);

    torch::Tensor logits = torch::tensor({{0.9f, 0.1f}, {0.2f, 0.8f}});
    torch::Tensor labels = torch::tensor({0, 0}, torch::kLong);
    EXPECT_NEAR(accuracy(logits, labels)[0].item<float>(), 50.f, 1e-4);
}

TEST(misc, all_reduce_hook_sets_world_size)
{
    EXPECT_FALSE(is_dist_avail_and_initialized());
    EXPECT_EQ(get_world_size(), 1);
    set_all_reduce_hook([](torch::Tensor& t) { t.mul_(2); }, 2);
    EXPECT_TRUE(is_dist_avail_and_initialized());
    EXPECT_EQ(get_world_size(), 2);
    torch::Tensor x = torch::ones({1});
    all_reduce(x);
    EXPECT_EQ(x.item<float>(), 2.f);
    clear_all_reduce_hook();
    EXPECT_EQ(get_world_size(), 1);
}
