#include <map>
#include <memory>
#include <optional>
#include <string>
#include <torch/torch.h>
#include <vector>
#include "backbone.h"
#include "transformer.h"
#include "output/detr_output.h"
#include "structures/nested_tensor.h"
#include "utils/modules.h"
#ifndef DEFORMABLEDETR_H
#define DEFORMABLEDETR_H


enum class DAMode {
    SourceOnly,
    UDA,
    Oracle
};
DAMode da_mode_from_string(const std::string& name);
std::string to_string(DAMode mode);


enum class HeadPolicy {
    Shared,                 // one class/box head broadcast to every decoder layer
    PerLayerIndependent     // one head per decoder layer (iterative box refinement)
};


struct AlignmentFlags {
    bool
        backbone = false,
        space = false,
        channel = false,
        instance = false;
    bool any() const { return backbone || space || channel || instance; }
};


struct DeformableDETROptions {
/*
    num_classes: number of object classes
    num_queries: number of object queries, ie detection slot. This is the maximal number of objects
                 the model can detect in a single image.
    num_feature_levels: number of scales fed to the transformer
    aux_loss: True if auxiliary decoding losses (loss at each decoder layer) are to be used.
    with_box_refine: iterative bounding box refinement
    two_stage: two-stage Deformable DETR
    align: which domain discriminators exist
    da_mode: source_only / uda / oracle
    debug: keep the full batch final layer predictions in the output
    accumulate: emit the softmax of the final layer logits
*/
    int
        num_classes = 9,
        num_queries = 300,
        num_feature_levels = 4;
    bool
        aux_loss = true,
        with_box_refine = false,
        two_stage = false,
        debug = false,
        accumulate = false;
    AlignmentFlags
        align;
    DAMode
        da_mode = DAMode::SourceOnly;

    HeadPolicy head_policy() const {
        return with_box_refine ? HeadPolicy::PerLayerIndependent : HeadPolicy::Shared;
    }
    // discriminators exist and the batch is split into source and target halves
    bool adversarial() const { return align.any() && da_mode == DAMode::UDA; }
};


struct ProjectedFeatures {
    std::vector<torch::Tensor>
        srcs,
        masks,
        pos;
};


class FeatureProjectorImpl : public torch::nn::Module {
/*
    Maps every backbone scale to hidden_dim with a 1x1 conv + GroupNorm and
    synthesizes the missing coarser scales with 3x3 stride 2 convs.
*/
public:
    FeatureProjectorImpl(const std::vector<int>& backbone_channels,
                         int hidden_dim,
                         int num_feature_levels);
    ProjectedFeatures forward(const BackboneOutput& features,
                              const torch::Tensor& image_mask,
                              Backbone& backbone);

    int
        hidden_dim,
        num_feature_levels,
        num_backbone_outs;
    torch::nn::ModuleList
        input_proj = nullptr;
};
TORCH_MODULE(FeatureProjector);


class PredictionHeadsImpl : public torch::nn::Module {
public:
    PredictionHeadsImpl(int hidden_dim,
                        int num_classes,
                        int num_pred,
                        HeadPolicy policy,
                        bool two_stage);
    torch::nn::Linear class_head(int layer) const;
    MLP box_head(int layer) const;
    int size() const { return num_pred; }

    HeadPolicy policy;
    int num_pred;
    // length 1 under HeadPolicy::Shared, num_pred otherwise
    torch::nn::ModuleList
        class_embed = nullptr,
        bbox_embed = nullptr;

private:
    std::vector<torch::nn::Linear> class_heads;
    std::vector<MLP> box_heads;
};
TORCH_MODULE(PredictionHeads);


class DomainDiscriminatorsImpl : public torch::nn::Module {
public:
    DomainDiscriminatorsImpl(int hidden_dim, AlignmentFlags align);
    // raw alignment features in, discriminator logits out (keyed identically)
    DomainFeatures forward(const std::vector<torch::Tensor>& srcs,
                           const DomainFeatures& raw);

    AlignmentFlags align;
    GradientReversal grl = nullptr;
    MLP
        backbone_D = nullptr,
        space_D = nullptr,
        channel_D = nullptr,
        instance_D = nullptr;
};
TORCH_MODULE(DomainDiscriminators);


class DeformableDETRImpl : public torch::nn::Module {
/* This is the Deformable DETR module that performs object detection */
public:
    DeformableDETRImpl(std::shared_ptr<Backbone> backbone,
                       std::shared_ptr<DeformableTransformer> transformer,
                       DeformableDETROptions options);

    DETROutput forward(const NestedTensor& samples);
    DETROutput forward(const std::vector<torch::Tensor>& images);

    const DeformableDETROptions& options() const { return opts; }

    std::shared_ptr<Backbone> backbone;
    std::shared_ptr<DeformableTransformer> transformer;
    FeatureProjector input_proj = nullptr;
    PredictionHeads heads = nullptr;
    torch::nn::Embedding query_embed = nullptr;
    DomainDiscriminators discriminators = nullptr;

private:
    std::vector<Prediction> set_aux_loss(const torch::Tensor& outputs_class,
                                         const torch::Tensor& outputs_coord) const;

    DeformableDETROptions opts;
    int hidden_dim;
};
TORCH_MODULE(DeformableDETR);

#endif
