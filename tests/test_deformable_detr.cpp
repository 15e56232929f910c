#include <cmath>
#include <memory>
#include <set>
#include <string>
#include <torch/torch.h>
#include <vector>
#include "gtest/gtest.h"
#include "DeformableDETR.h"
#include "criterion.h"
#include "matcher.h"
#include "test_doubles.h"


namespace {

const int HIDDEN = 32;
const int LAYERS = 3;

struct Fixture {
    std::shared_ptr<FakeBackbone> backbone;
    std::shared_ptr<FakeTransformer> transformer;
    DeformableDETR model = nullptr;
};

Fixture make_model(DeformableDETROptions options, std::vector<int> channels = {16, 24}) {
    torch::manual_seed(0);
    Fixture f;
    std::vector<int> strides;
    for (size_t i = 0; i < channels.size(); ++i)
        strides.push_back(4 << i);
    f.backbone = std::make_shared<FakeBackbone>(channels, strides, HIDDEN);
    f.transformer = std::make_shared<FakeTransformer>(HIDDEN, LAYERS);
    f.model = DeformableDETR(f.backbone, f.transformer, options);
    return f;
}

DeformableDETROptions small_options() {
    DeformableDETROptions options;
    options.num_classes = 4;
    options.num_queries = 5;
    options.num_feature_levels = 3;
    return options;
}

std::vector<torch::Tensor> images(int n) {
    std::vector<torch::Tensor> ret;
    for (int i = 0; i < n; ++i)
        ret.push_back(torch::rand({3, 32 - 4 * (i % 2), 32}));
    return ret;
}

}


TEST(deformable_detr, source_only_keeps_whole_batch)
{
    Fixture f = make_model(small_options());
    DETROutput out = f.model->forward(images(2));

    EXPECT_EQ(out.main.pred_logits.sizes(), torch::IntArrayRef({2, 5, 4}));
    EXPECT_EQ(out.main.pred_boxes.sizes(), torch::IntArrayRef({2, 5, 4}));
    ASSERT_EQ(out.aux_outputs.size(), (size_t)LAYERS - 1);
    EXPECT_EQ(out.aux_outputs[0].pred_logits.size(0), 2);
    EXPECT_FALSE(out.da_output.has_value());
    EXPECT_FALSE(out.pred_all.has_value());
    EXPECT_FALSE(out.enc_outputs.has_value());
    EXPECT_FALSE(out.probs.defined());
    EXPECT_EQ(f.transformer->last_num_levels, 3);
    EXPECT_TRUE((out.main.pred_boxes > 0).all().item<bool>());
    EXPECT_TRUE((out.main.pred_boxes < 1).all().item<bool>());
}

TEST(deformable_detr, alignment_flags_ignored_outside_uda)
{
    DeformableDETROptions options = small_options();
    options.align.backbone = true;
    options.da_mode = DAMode::Oracle;
    Fixture f = make_model(options);
    EXPECT_TRUE(f.model->discriminators.is_empty());
    DETROutput out = f.model->forward(images(2));
    EXPECT_EQ(out.main.pred_logits.size(0), 2);
    EXPECT_FALSE(out.da_output.has_value());
}

TEST(deformable_detr, uda_end_to_end_two_images)
{
    DeformableDETROptions options = small_options();
    options.align = AlignmentFlags{true, true, true, true};
    options.da_mode = DAMode::UDA;
    Fixture f = make_model(options);
    f.model->train();

    DETROutput out = f.model->forward(images(2));

    // detection outputs keep the source image only
    EXPECT_EQ(out.main.pred_logits.sizes(), torch::IntArrayRef({1, 5, 4}));
    for (const Prediction& aux : out.aux_outputs)
        EXPECT_EQ(aux.pred_boxes.size(0), 1);
    ASSERT_TRUE(out.pred_all.has_value());
    EXPECT_EQ(out.pred_all->pred_logits.size(0), 2);

    ASSERT_TRUE(out.da_output.has_value());
    std::set<std::string> groups;
    for (auto& [k, v] : out.da_output.value()) {
        groups.insert(k);
        EXPECT_EQ(v.size(0), 2) << k;
        EXPECT_EQ(v.size(-1), 1) << k;
    }
    EXPECT_EQ(groups, (std::set<std::string>{DA_BACKBONE, DA_SPACE_QUERY, DA_CHANNEL_QUERY, DA_INSTANCE_QUERY}));
    // every token of the three levels: 8x8, 4x4 and the synthesized 2x2
    EXPECT_EQ(out.da_output->at(DA_BACKBONE).size(1), 64 + 16 + 4);

    CriterionOptions crit_options;
    crit_options.num_classes = 4;
    crit_options.split_targets = true;
    SetCriterion criterion(std::make_shared<HungarianMatcher>(2, 5, 2), crit_options);
    std::vector<Instances> targets = {
        Instances(torch::tensor({1, 3}, torch::kLong), make_boxes({{0.3f, 0.3f, 0.2f, 0.2f}, {0.6f, 0.7f, 0.3f, 0.2f}})),
        Instances(torch::zeros({0}, torch::kLong), torch::zeros({0, 4}))};
    CriterionResult result = criterion->forward(out, targets, CriterionMode::Train);

    std::set<std::string> keys;
    for (auto& [k, v] : result.losses) {
        keys.insert(k);
        EXPECT_TRUE(torch::isfinite(v).all().item<bool>()) << k;
    }
    for (std::string k : {"loss_ce", "loss_bbox", "loss_giou", "cardinality_error", "class_error",
                          "loss_ce_0", "loss_ce_1", "loss_bbox_1",
                          "loss_backbone", "loss_space_query", "loss_channel_query", "loss_instance_query"})
        EXPECT_EQ(keys.count(k), 1u) << k;
    EXPECT_EQ(keys.count("loss_ce_2"), 0u);
    EXPECT_EQ(keys.count("loss_ce_enc"), 0u);

    torch::Tensor total = result.losses.at("loss_ce") + result.losses.at("loss_bbox")
                          + result.losses.at("loss_backbone") + result.losses.at("loss_instance_query");
    total.backward();
    EXPECT_TRUE(f.model->discriminators->backbone_D->layer(0)->weight.grad().defined());
    EXPECT_TRUE(f.model->discriminators->instance_D->layer(0)->weight.grad().defined());
    EXPECT_TRUE(f.backbone->proj[0]->as<torch::nn::Conv2d>()->weight.grad().defined());
}

TEST(deformable_detr, uda_rejects_odd_batch)
{
    DeformableDETROptions options = small_options();
    options.align.space = true;
    options.da_mode = DAMode::UDA;
    Fixture f = make_model(options);
    EXPECT_THROW(f.model->forward(images(3)), c10::Error);
}

TEST(deformable_detr, uda_eval_does_not_split)
{
    DeformableDETROptions options = small_options();
    options.align.channel = true;
    options.da_mode = DAMode::UDA;
    Fixture f = make_model(options);
    f.model->eval();
    DETROutput out = f.model->forward(images(3));
    EXPECT_EQ(out.main.pred_logits.size(0), 3);
    EXPECT_FALSE(out.da_output.has_value());
}

TEST(deformable_detr, missing_query_group_is_an_error)
{
    DeformableDETROptions options = small_options();
    options.align.instance = true;
    options.da_mode = DAMode::UDA;
    Fixture f = make_model(options);
    f.transformer->emit_query_groups = false;
    EXPECT_THROW(f.model->forward(images(2)), c10::Error);
}

TEST(deformable_detr, shared_heads_by_default)
{
    Fixture f = make_model(small_options());
    PredictionHeads heads = f.model->heads;
    EXPECT_EQ(heads->policy, HeadPolicy::Shared);
    EXPECT_EQ(heads->size(), LAYERS);
    EXPECT_EQ(heads->class_embed->size(), 1u);
    EXPECT_EQ(heads->class_head(0).ptr(), heads->class_head(LAYERS - 1).ptr());
    EXPECT_THROW(heads->class_head(LAYERS), c10::Error);
}

TEST(deformable_detr, per_layer_heads_with_box_refine)
{
    DeformableDETROptions options = small_options();
    options.with_box_refine = true;
    Fixture f = make_model(options);
    PredictionHeads heads = f.model->heads;
    EXPECT_EQ(heads->policy, HeadPolicy::PerLayerIndependent);
    EXPECT_EQ(heads->bbox_embed->size(), (size_t)LAYERS);
    EXPECT_NE(heads->box_head(0).ptr(), heads->box_head(1).ptr());

    // 4-d references from the refining decoder
    DETROutput out = f.model->forward(images(2));
    EXPECT_TRUE((out.main.pred_boxes > 0).all().item<bool>());
    EXPECT_TRUE((out.main.pred_boxes < 1).all().item<bool>());
}

TEST(deformable_detr, head_initialization)
{
    Fixture f = make_model(small_options());
    PredictionHeads heads = f.model->heads;
    float bias_value = -std::log((1 - 0.01) / 0.01);
    EXPECT_TRUE(torch::allclose(heads->class_head(0)->bias, torch::full({4}, bias_value)));
    MLP box = heads->box_head(0);
    EXPECT_EQ(box->layer(-1)->weight.abs().sum().item<float>(), 0.f);
    EXPECT_TRUE(torch::equal(box->layer(-1)->bias, torch::tensor({0.f, 0.f, -2.f, -2.f})));
}

TEST(deformable_detr, two_stage_emits_encoder_proposals)
{
    DeformableDETROptions options = small_options();
    options.two_stage = true;
    options.with_box_refine = true;
    Fixture f = make_model(options);
    EXPECT_TRUE(f.model->query_embed.is_empty());
    EXPECT_EQ(f.model->heads->size(), LAYERS + 1);
    // proposal heads keep a zero box bias
    EXPECT_EQ(f.model->heads->box_head(0)->layer(-1)->bias.abs().sum().item<float>(), 0.f);

    DETROutput out = f.model->forward(images(2));
    ASSERT_TRUE(out.enc_outputs.has_value());
    EXPECT_EQ(out.enc_outputs->pred_logits.size(0), 2);
    EXPECT_EQ(out.enc_outputs->pred_logits.size(-1), 4);
    EXPECT_TRUE((out.enc_outputs->pred_boxes > 0).all().item<bool>());
    EXPECT_EQ(out.main.pred_logits.size(1), 4);
}

TEST(deformable_detr, two_stage_proposals_keep_source_half_under_uda)
{
    DeformableDETROptions options = small_options();
    options.two_stage = true;
    options.with_box_refine = true;
    options.align = AlignmentFlags{true, false, false, true};
    options.da_mode = DAMode::UDA;
    Fixture f = make_model(options);
    f.model->train();

    DETROutput out = f.model->forward(images(4));
    ASSERT_TRUE(out.enc_outputs.has_value());
    EXPECT_EQ(out.enc_outputs->pred_logits.size(0), 2);
    EXPECT_EQ(out.enc_outputs->pred_boxes.size(0), 2);
    EXPECT_EQ(out.main.pred_logits.size(0), 2);
    ASSERT_TRUE(out.pred_all.has_value());
    EXPECT_EQ(out.pred_all->pred_logits.size(0), 4);
    ASSERT_TRUE(out.da_output.has_value());
    for (auto& [k, v] : out.da_output.value())
        EXPECT_EQ(v.size(0), 4) << k;
}

TEST(deformable_detr, accumulate_and_debug_outputs)
{
    DeformableDETROptions options = small_options();
    options.accumulate = true;
    options.debug = true;
    options.aux_loss = false;
    Fixture f = make_model(options);
    DETROutput out = f.model->forward(images(2));
    ASSERT_TRUE(out.probs.defined());
    EXPECT_TRUE(torch::allclose(out.probs.sum(-1), torch::ones({2, 5})));
    ASSERT_TRUE(out.pred_all.has_value());
    EXPECT_TRUE(out.aux_outputs.empty());
}

TEST(deformable_detr, configuration_errors)
{
    DeformableDETROptions options = small_options();
    options.num_feature_levels = 1;
    // two backbone scales cannot feed a single level
    EXPECT_THROW(make_model(options), c10::Error);

    options = small_options();
    torch::manual_seed(0);
    auto backbone = std::make_shared<FakeBackbone>(std::vector<int>{16}, std::vector<int>{4}, 48);
    auto transformer = std::make_shared<FakeTransformer>(48, LAYERS);
    // GroupNorm(32) over 48 channels
    EXPECT_THROW(DeformableDETR model(backbone, transformer, options), c10::Error);

    EXPECT_THROW(da_mode_from_string("target_only"), c10::Error);
}

TEST(feature_projector, synthesizes_missing_levels)
{
    Fixture f = make_model(small_options(), {16});
    FeatureProjector projector = f.model->input_proj;
    EXPECT_EQ(projector->input_proj->size(), 3u);

    NestedTensor samples = nested_tensor_from_tensor_vector(images(2));
    BackboneOutput features = f.backbone->forward(samples);
    ProjectedFeatures projected = projector->forward(features, samples.mask, *f.backbone);
    ASSERT_EQ(projected.srcs.size(), 3u);
    EXPECT_EQ(projected.srcs[0].sizes(), torch::IntArrayRef({2, HIDDEN, 8, 8}));
    EXPECT_EQ(projected.srcs[1].sizes(), torch::IntArrayRef({2, HIDDEN, 4, 4}));
    EXPECT_EQ(projected.srcs[2].sizes(), torch::IntArrayRef({2, HIDDEN, 2, 2}));
    EXPECT_EQ(projected.masks[2].sizes(), torch::IntArrayRef({2, 2, 2}));
    EXPECT_EQ(projected.pos[2].sizes(), torch::IntArrayRef({2, HIDDEN, 2, 2}));
    // the second image is padded at the bottom
    EXPECT_TRUE(projected.masks[0][1][7].all().item<bool>());
    EXPECT_FALSE(projected.masks[0][0].any().item<bool>());
}

TEST(domain_discriminators, leave_input_untouched)
{
    AlignmentFlags align{true, true, false, false};
    DomainDiscriminators discriminators(HIDDEN, align);
    std::vector<torch::Tensor> srcs = {torch::randn({2, HIDDEN, 3, 3})};
    DomainFeatures raw = {{DA_SPACE_QUERY, torch::randn({2, 1, HIDDEN})},
                          {DA_CHANNEL_QUERY, torch::randn({2, 1, HIDDEN})}};
    torch::Tensor before = raw.at(DA_SPACE_QUERY).clone();

    DomainFeatures out = discriminators->forward(srcs, raw);
    EXPECT_EQ(out.size(), 2u);
    EXPECT_EQ(out.at(DA_BACKBONE).sizes(), torch::IntArrayRef({2, 9, 1}));
    EXPECT_EQ(out.at(DA_SPACE_QUERY).sizes(), torch::IntArrayRef({2, 1, 1}));
    EXPECT_EQ(out.count(DA_CHANNEL_QUERY), 0u);
    EXPECT_TRUE(torch::equal(raw.at(DA_SPACE_QUERY), before));
    EXPECT_EQ(raw.at(DA_SPACE_QUERY).size(-1), HIDDEN);
}
