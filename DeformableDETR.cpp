#include <iostream>
#include <math.h>
#include <torch/torch.h>
#include <vector>
#include "DeformableDETR.h"
#include "utils/box_operations.h"


DAMode da_mode_from_string(const std::string& name) {
    if (name == "source_only")
        return DAMode::SourceOnly;
    if (name == "uda")
        return DAMode::UDA;
    if (name == "oracle")
        return DAMode::Oracle;
    TORCH_CHECK(false, "Unknown DA_MODE '", name, "', expected one of source_only, uda, oracle");
    return DAMode::SourceOnly;
}

std::string to_string(DAMode mode) {
    switch (mode) {
        case DAMode::SourceOnly: return "source_only";
        case DAMode::UDA: return "uda";
        case DAMode::Oracle: return "oracle";
    }
    return "unknown";
}


FeatureProjectorImpl::FeatureProjectorImpl(const std::vector<int>& backbone_channels,
                                           int hidden_dim,
                                           int num_feature_levels) :
torch::nn::Module(),
hidden_dim(hidden_dim),
num_feature_levels(num_feature_levels),
num_backbone_outs((int)backbone_channels.size())
{
    TORCH_CHECK(num_feature_levels >= 1, "num_feature_levels must be at least 1, got ", num_feature_levels);
    TORCH_CHECK(num_backbone_outs >= 1, "backbone reports no output scales");
    TORCH_CHECK(num_backbone_outs <= num_feature_levels,
                "backbone returns ", num_backbone_outs, " scales but the transformer expects ",
                num_feature_levels, " feature levels");
    TORCH_CHECK(hidden_dim % 32 == 0, "GroupNorm(32, ", hidden_dim, ") needs hidden_dim divisible by 32");

    input_proj = torch::nn::ModuleList();
    int in_channels = backbone_channels[0];
    for (int i = 0; i < num_backbone_outs; ++i) {
        in_channels = backbone_channels[i];
        input_proj->push_back(torch::nn::Sequential(
            torch::nn::Conv2d(torch::nn::Conv2dOptions(in_channels, hidden_dim, 1)),
            torch::nn::GroupNorm(32, hidden_dim)
        ));
    }
    for (int i = num_backbone_outs; i < num_feature_levels; ++i) {
        input_proj->push_back(torch::nn::Sequential(
            torch::nn::Conv2d(torch::nn::Conv2dOptions(in_channels, hidden_dim, 3).stride(2).padding(1)),
            torch::nn::GroupNorm(32, hidden_dim)
        ));
        in_channels = hidden_dim;
    }
    input_proj = register_module("input_proj", input_proj);

    torch::NoGradGuard no_grad;
    for (size_t i = 0; i < input_proj->size(); ++i) {
        torch::nn::Conv2dImpl* conv = input_proj[i]->as<torch::nn::Sequential>()->ptr(0)->as<torch::nn::Conv2d>();
        torch::nn::init::xavier_uniform_(conv->weight, 1.0);
        torch::nn::init::constant_(conv->bias, 0);
    }
}

ProjectedFeatures FeatureProjectorImpl::forward(const BackboneOutput& features,
                                                const torch::Tensor& image_mask,
                                                Backbone& backbone)
{
    TORCH_CHECK((int)features.features.size() == num_backbone_outs,
                "backbone returned ", features.features.size(), " scales, expected ", num_backbone_outs);
    TORCH_CHECK(features.pos.size() == features.features.size(),
                "backbone returned ", features.pos.size(), " positional encodings for ",
                features.features.size(), " scales");

    ProjectedFeatures out;
    for (int l = 0; l < num_backbone_outs; ++l) {
        auto [src, mask] = features.features[l].decompose();
        TORCH_CHECK(mask.defined(), "backbone scale ", l, " has no padding mask");
        out.srcs.push_back(input_proj[l]->as<torch::nn::Sequential>()->forward(src));
        out.masks.push_back(mask);
        out.pos.push_back(features.pos[l]);
    }

    for (int l = num_backbone_outs; l < num_feature_levels; ++l) {
        torch::Tensor src;
        if (l == num_backbone_outs)
            src = input_proj[l]->as<torch::nn::Sequential>()->forward(features.features.back().tensors);
        else
            src = input_proj[l]->as<torch::nn::Sequential>()->forward(out.srcs.back());
        std::vector<int64_t> size{src.size(-2), src.size(-1)};
        torch::Tensor mask = torch::nn::functional::interpolate(
            image_mask.unsqueeze(0).to(torch::kFloat),
            torch::nn::functional::InterpolateFuncOptions().size(size).mode(torch::kNearest)
        ).to(torch::kBool).index({0});
        torch::Tensor pos_l = backbone.position_embedding(NestedTensor(src, mask)).to(src.dtype());
        out.srcs.push_back(src);
        out.masks.push_back(mask);
        out.pos.push_back(pos_l);
    }
    return out;
}


PredictionHeadsImpl::PredictionHeadsImpl(int hidden_dim,
                                         int num_classes,
                                         int num_pred,
                                         HeadPolicy policy,
                                         bool two_stage) :
torch::nn::Module(), policy(policy), num_pred(num_pred)
{
    TORCH_CHECK(num_pred >= 1, "need at least one decoder layer, got ", num_pred);
    torch::nn::Linear class_head(hidden_dim, num_classes);
    MLP box_head(hidden_dim, hidden_dim, 4, 3);
    {
        torch::NoGradGuard no_grad;
        double prior_prob = 0.01;
        double bias_value = -log((1 - prior_prob) / prior_prob);
        class_head->bias.fill_(bias_value);
        torch::nn::init::constant_(box_head->layer(-1)->weight, 0);
        torch::nn::init::constant_(box_head->layer(-1)->bias, 0);
    }

    int num_instances = policy == HeadPolicy::Shared ? 1 : num_pred;
    class_heads = get_clones(class_head, num_instances);
    box_heads = get_clones(box_head, num_instances);

    if (!two_stage) {
        // two-stage proposals already carry a box size
        torch::NoGradGuard no_grad;
        box_heads[0]->layer(-1)->bias.index({torch::indexing::Slice(2, torch::indexing::None)}).fill_(-2.0);
    }

    class_embed = torch::nn::ModuleList();
    bbox_embed = torch::nn::ModuleList();
    for (int i = 0; i < num_instances; ++i) {
        class_embed->push_back(class_heads[i]);
        bbox_embed->push_back(box_heads[i]);
    }
    class_embed = register_module("class_embed", class_embed);
    bbox_embed = register_module("bbox_embed", bbox_embed);
}

torch::nn::Linear PredictionHeadsImpl::class_head(int layer) const {
    TORCH_CHECK(layer >= 0 && layer < num_pred, "no prediction head for layer ", layer, " of ", num_pred);
    return class_heads[policy == HeadPolicy::Shared ? 0 : layer];
}

MLP PredictionHeadsImpl::box_head(int layer) const {
    TORCH_CHECK(layer >= 0 && layer < num_pred, "no prediction head for layer ", layer, " of ", num_pred);
    return box_heads[policy == HeadPolicy::Shared ? 0 : layer];
}


DomainDiscriminatorsImpl::DomainDiscriminatorsImpl(int hidden_dim, AlignmentFlags align) :
torch::nn::Module(), align(align)
{
    if (align.backbone) {
        grl = register_module("grl", GradientReversal());
        // domain discriminator for backbone alignment
        backbone_D = register_module("backbone_D", MLP(hidden_dim, hidden_dim, 1, 3));
        backbone_D->xavier_init();
    }
    if (align.space) {
        space_D = register_module("space_D", MLP(hidden_dim, hidden_dim, 1, 3));
        space_D->xavier_init();
    }
    if (align.channel) {
        channel_D = register_module("channel_D", MLP(hidden_dim, hidden_dim, 1, 3));
        channel_D->xavier_init();
    }
    if (align.instance) {
        instance_D = register_module("instance_D", MLP(hidden_dim, hidden_dim, 1, 3));
        instance_D->xavier_init();
    }
}

DomainFeatures DomainDiscriminatorsImpl::forward(const std::vector<torch::Tensor>& srcs,
                                                 const DomainFeatures& raw)
{
    auto query_group = [&raw](const std::string& name) -> const torch::Tensor& {
        auto it = raw.find(name);
        TORCH_CHECK(it != raw.end() && it->second.defined(),
                    "transformer did not return the '", name, "' alignment features");
        return it->second;
    };

    DomainFeatures out;
    if (align.backbone) {
        std::vector<torch::Tensor> per_scale;
        for (const torch::Tensor& src : srcs)
            per_scale.push_back(backbone_D->forward(grl->forward(src.flatten(2).transpose(1, 2))));
        out[DA_BACKBONE] = torch::cat(per_scale, 1);
    }
    if (align.space)
        out[DA_SPACE_QUERY] = space_D->forward(query_group(DA_SPACE_QUERY));
    if (align.channel)
        out[DA_CHANNEL_QUERY] = channel_D->forward(query_group(DA_CHANNEL_QUERY));
    if (align.instance)
        out[DA_INSTANCE_QUERY] = instance_D->forward(query_group(DA_INSTANCE_QUERY));
    return out;
}


DeformableDETRImpl::DeformableDETRImpl(std::shared_ptr<Backbone> backbone,
                                       std::shared_ptr<DeformableTransformer> transformer,
                                       DeformableDETROptions options) :
torch::nn::Module(),
backbone(backbone),
transformer(transformer),
opts(options)
{
    TORCH_CHECK(this->backbone != nullptr, "DeformableDETR needs a backbone");
    TORCH_CHECK(this->transformer != nullptr, "DeformableDETR needs a transformer");
    TORCH_CHECK(opts.num_classes >= 1, "num_classes must be positive, got ", opts.num_classes);
    TORCH_CHECK(opts.num_queries >= 1, "num_queries must be positive, got ", opts.num_queries);
    std::vector<int> channels = this->backbone->num_channels();
    TORCH_CHECK(channels.size() == this->backbone->strides().size(),
                "backbone reports ", channels.size(), " channel counts for ",
                this->backbone->strides().size(), " strides");

    hidden_dim = this->transformer->d_model();
    this->backbone = register_module("backbone", this->backbone);
    this->transformer = register_module("transformer", this->transformer);

    input_proj = register_module("input_proj", FeatureProjector(channels, hidden_dim, opts.num_feature_levels));
    if (!opts.two_stage)
        query_embed = register_module("query_embed", torch::nn::Embedding(opts.num_queries, hidden_dim * 2));

    // if two-stage, the last class_embed and bbox_embed is for region proposal generation
    int num_layers = this->transformer->num_decoder_layers();
    int num_pred = opts.two_stage ? num_layers + 1 : num_layers;
    heads = register_module("heads", PredictionHeads(hidden_dim, opts.num_classes, num_pred,
                                                     opts.head_policy(), opts.two_stage));
    this->transformer->bind_heads(heads.ptr(), opts.with_box_refine, opts.two_stage);

    if (opts.adversarial())
        discriminators = register_module("discriminators", DomainDiscriminators(hidden_dim, opts.align));
}

DETROutput DeformableDETRImpl::forward(const std::vector<torch::Tensor>& images) {
    return forward(nested_tensor_from_tensor_vector(images));
}

DETROutput DeformableDETRImpl::forward(const NestedTensor& samples) {
/*
    samples.tensors: batched images, of shape [batch_size x 3 x H x W]
    samples.mask: a binary mask of shape [batch_size x H x W], containing 1 on padded pixels

    Under adversarial training the batch holds the source images first and the
    target images second, and every detection output keeps the source half only.
*/
    TORCH_CHECK(samples.tensors.defined() && samples.mask.defined(),
                "DeformableDETR expects a padded batch with its mask");

    BackboneOutput features = backbone->forward(samples);
    ProjectedFeatures projected = input_proj->forward(features, samples.mask, *backbone);

    torch::Tensor query_embeds;
    if (!opts.two_stage)
        query_embeds = query_embed->weight;

    TransformerOutput t_out = transformer->forward(projected.srcs, projected.masks, projected.pos, query_embeds);
    TORCH_CHECK(t_out.hs.defined() && t_out.hs.dim() == 4,
                "transformer hidden states must be [layers, batch, queries, hidden]");
    int num_layers = (int)t_out.hs.size(0);
    TORCH_CHECK(num_layers == transformer->num_decoder_layers(),
                "transformer returned ", num_layers, " decoder layers, expected ", transformer->num_decoder_layers());
    TORCH_CHECK(num_layers == 1 || (t_out.inter_references.defined() && t_out.inter_references.size(0) >= num_layers - 1),
                "transformer returned too few refined references for ", num_layers, " layers");

    std::vector<torch::Tensor> outputs_classes, outputs_coords;
    for (int lvl = 0; lvl < num_layers; ++lvl) {
        torch::Tensor reference;
        if (lvl == 0)
            reference = t_out.init_reference;
        else
            reference = t_out.inter_references.index({lvl - 1});
        reference = inverse_sigmoid(reference);

        torch::Tensor layer_hs = t_out.hs.index({lvl});
        torch::Tensor outputs_class = heads->class_head(lvl)->forward(layer_hs);
        torch::Tensor tmp = heads->box_head(lvl)->forward(layer_hs);
        if (reference.size(-1) == 4)
            tmp = tmp + reference;
        else {
            TORCH_CHECK(reference.size(-1) == 2, "reference points must have 2 or 4 coordinates, got ", reference.size(-1));
            tmp = torch::cat({tmp.index({"...", torch::indexing::Slice(torch::indexing::None, 2)}) + reference,
                              tmp.index({"...", torch::indexing::Slice(2, torch::indexing::None)})}, -1);
        }
        outputs_classes.push_back(outputs_class);
        outputs_coords.push_back(tmp.sigmoid());
    }
    torch::Tensor outputs_class = torch::stack(outputs_classes);
    torch::Tensor outputs_coord = torch::stack(outputs_coords);

    torch::Tensor enc_outputs_class = t_out.enc_outputs_class;
    torch::Tensor enc_outputs_coord_unact = t_out.enc_outputs_coord_unact;
    if (opts.two_stage)
        TORCH_CHECK(enc_outputs_class.defined() && enc_outputs_coord_unact.defined(),
                    "two-stage mode needs encoder proposals from the transformer");

    DETROutput out;
    if (this->is_training() && opts.adversarial()) {
        int64_t B = outputs_class.size(1);
        TORCH_CHECK(B % 2 == 0, "domain adaptation batches hold source and target halves, got an odd batch of ", B);

        out.pred_all = Prediction{outputs_class.index({-1}), outputs_coord.index({-1}), torch::Tensor()};

        // only source data has labels
        outputs_class = outputs_class.index({torch::indexing::Slice(), torch::indexing::Slice(torch::indexing::None, B / 2)});
        outputs_coord = outputs_coord.index({torch::indexing::Slice(), torch::indexing::Slice(torch::indexing::None, B / 2)});
        if (opts.two_stage) {
            enc_outputs_class = enc_outputs_class.index({torch::indexing::Slice(torch::indexing::None, B / 2)});
            enc_outputs_coord_unact = enc_outputs_coord_unact.index({torch::indexing::Slice(torch::indexing::None, B / 2)});
        }
        out.da_output = discriminators->forward(projected.srcs, t_out.da_output);
    }
    else if (opts.debug)
        out.pred_all = Prediction{outputs_class.index({-1}), outputs_coord.index({-1}), torch::Tensor()};

    out.main = Prediction{outputs_class.index({-1}), outputs_coord.index({-1}), torch::Tensor()};
    if (opts.aux_loss)
        out.aux_outputs = set_aux_loss(outputs_class, outputs_coord);
    if (opts.two_stage)
        out.enc_outputs = Prediction{enc_outputs_class, enc_outputs_coord_unact.sigmoid(), torch::Tensor()};
    if (opts.accumulate)
        out.probs = torch::softmax(outputs_class.index({-1}), -1);

    return out;
}

std::vector<Prediction> DeformableDETRImpl::set_aux_loss(const torch::Tensor& outputs_class,
                                                         const torch::Tensor& outputs_coord) const
{
    std::vector<Prediction> ret;
    for (int64_t i = 0; i < outputs_class.size(0) - 1; ++i)
        ret.push_back(Prediction{outputs_class.index({i}), outputs_coord.index({i}), torch::Tensor()});
    return ret;
}
