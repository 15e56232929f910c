#include <iostream>
#include <map>
#include <string>
#include <torch/torch.h>
#include "cfg.h"
#include "criterion.h"
#ifndef LOSSWEIGHTING_H
#define LOSSWEIGHTING_H


using WeightDict = std::map<std::string, float>;

// coefficient of every loss term that enters the training objective
WeightDict build_weight_dict(const CfgNode& cfg);

// sum of losses[k] * weight_dict[k] over the keys present in both
torch::Tensor weighted_loss(const LossDict& losses, const WeightDict& weight_dict);

void print_losses(std::ostream& os, const LossDict& losses);

#endif
