#include <memory>
#include <string>
#include <torch/torch.h>
#include "build.h"


DeformableDETROptions detr_options_from_cfg(const CfgNode& cfg) {
    DeformableDETROptions options;
    options.num_classes = cfg.get_int("DATASET.NUM_CLASSES");
    options.num_queries = cfg.get_int("MODEL.NUM_QUERIES");
    options.num_feature_levels = cfg.get_int("MODEL.NUM_FEATURE_LEVELS");
    options.aux_loss = cfg.get_bool("LOSS.AUX_LOSS");
    options.with_box_refine = cfg.get_bool("MODEL.WITH_BOX_REFINE");
    options.two_stage = cfg.get_bool("MODEL.TWO_STAGE");
    options.align.backbone = cfg.get_bool("MODEL.BACKBONE_ALIGN");
    options.align.space = cfg.get_bool("MODEL.SPACE_ALIGN");
    options.align.channel = cfg.get_bool("MODEL.CHANNEL_ALIGN");
    options.align.instance = cfg.get_bool("MODEL.INSTANCE_ALIGN");
    options.debug = cfg.get_bool("DEBUG");
    options.accumulate = cfg.get_bool("ACCUMULATE_STATS");
    options.da_mode = da_mode_from_string(cfg.get_string("DATASET.DA_MODE"));
    return options;
}

CriterionOptions criterion_options_from_cfg(const CfgNode& cfg) {
    CriterionOptions options;
    options.num_classes = cfg.get_int("DATASET.NUM_CLASSES");
    options.losses = {"labels", "boxes", "cardinality"};
    if (cfg.get_bool("MODEL.MASKS"))
        options.losses.push_back("masks");
    options.focal_alpha = cfg.get_float("LOSS.FOCAL_ALPHA");
    options.da_gamma = cfg.get_float("LOSS.DA_GAMMA");
    options.return_indices = cfg.get_bool("DEBUG");
    // the model splits its outputs under the same condition
    options.split_targets = detr_options_from_cfg(cfg).adversarial();
    return options;
}

std::shared_ptr<Matcher> build_matcher(const CfgNode& cfg) {
    return std::make_shared<HungarianMatcher>(cfg.get_float("LOSS.SET_COST_CLASS"),
                                              cfg.get_float("LOSS.SET_COST_BBOX"),
                                              cfg.get_float("LOSS.SET_COST_GIOU"),
                                              cfg.get_float("LOSS.FOCAL_ALPHA"));
}

SetCriterion build_criterion(const CfgNode& cfg, std::shared_ptr<Matcher> matcher) {
    return SetCriterion(matcher, criterion_options_from_cfg(cfg));
}


BuildResult build(const CfgNode& cfg,
                  std::shared_ptr<Backbone> backbone,
                  std::shared_ptr<DeformableTransformer> transformer)
{
    torch::Device device(cfg.get_string("DEVICE"));
    TORCH_CHECK(transformer != nullptr, "build needs a transformer");
    TORCH_CHECK(transformer->d_model() == cfg.get_int("MODEL.HIDDEN_DIM"),
                "transformer d_model ", transformer->d_model(), " differs from MODEL.HIDDEN_DIM ",
                cfg.get_int("MODEL.HIDDEN_DIM"));
    TORCH_CHECK(transformer->num_decoder_layers() == cfg.get_int("MODEL.DEC_LAYERS"),
                "transformer has ", transformer->num_decoder_layers(), " decoder layers, MODEL.DEC_LAYERS is ",
                cfg.get_int("MODEL.DEC_LAYERS"));
    if (cfg.get_bool("MODEL.MASKS"))
        TORCH_WARN("MODEL.MASKS is set but the detector has no segmentation head, the masks loss will be skipped");

    BuildResult result;
    result.model = DeformableDETR(backbone, transformer, detr_options_from_cfg(cfg));
    result.model->to(device);

    result.matcher = build_matcher(cfg);
    result.weight_dict = build_weight_dict(cfg);
    result.criterion = build_criterion(cfg, result.matcher);
    result.criterion->to(device);

    result.postprocessor = PostProcess();
    result.postprocessor_target = PostProcessForTarget();
    return result;
}
