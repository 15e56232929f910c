#include <memory>
#include <torch/torch.h>
#include "DeformableDETR.h"
#include "backbone.h"
#include "cfg.h"
#include "criterion.h"
#include "loss_weighting.h"
#include "matcher.h"
#include "postprocess.h"
#include "transformer.h"
#ifndef BUILD_H
#define BUILD_H


struct BuildResult {
    DeformableDETR model = nullptr;
    SetCriterion criterion = nullptr;
    std::shared_ptr<Matcher> matcher;
    PostProcess postprocessor = nullptr;
    PostProcessForTarget postprocessor_target = nullptr;
    WeightDict weight_dict;
};


DeformableDETROptions detr_options_from_cfg(const CfgNode& cfg);
CriterionOptions criterion_options_from_cfg(const CfgNode& cfg);
std::shared_ptr<Matcher> build_matcher(const CfgNode& cfg);
SetCriterion build_criterion(const CfgNode& cfg, std::shared_ptr<Matcher> matcher);

/*
    Assembles the detector around an externally built backbone and transformer.
    Model and criterion are moved to cfg DEVICE.
*/
BuildResult build(const CfgNode& cfg,
                  std::shared_ptr<Backbone> backbone,
                  std::shared_ptr<DeformableTransformer> transformer);

#endif
