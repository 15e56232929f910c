#include <iomanip>
#include <iostream>
#include <map>
#include <string>
#include <torch/torch.h>
#include "loss_weighting.h"


WeightDict build_weight_dict(const CfgNode& cfg) {
    WeightDict weight_dict = {{"loss_ce", cfg.get_float("LOSS.CLS_LOSS_COEF")},
                              {"loss_bbox", cfg.get_float("LOSS.BBOX_LOSS_COEF")},
                              {"loss_giou", cfg.get_float("LOSS.GIOU_LOSS_COEF")}};

    if (cfg.get_bool("MODEL.MASKS")) {
        weight_dict["loss_mask"] = cfg.get_float("LOSS.MASK_LOSS_COEF");
        weight_dict["loss_dice"] = cfg.get_float("LOSS.DICE_LOSS_COEF");
    }

    if (cfg.get_bool("LOSS.AUX_LOSS")) {
        WeightDict aux_weight_dict{};
        int dec_layers = cfg.get_int("MODEL.DEC_LAYERS");
        for (int i = 0; i < dec_layers - 1; ++i) {
            for (auto& [k, v] : weight_dict)
                aux_weight_dict[k + "_" + std::to_string(i)] = v;
        }
        for (auto& [k, v] : weight_dict)
            aux_weight_dict[k + "_enc"] = v;
        weight_dict.insert(aux_weight_dict.begin(), aux_weight_dict.end());
    }

    weight_dict["loss_backbone"] = cfg.get_float("LOSS.BACKBONE_LOSS_COEF");
    weight_dict["loss_space_query"] = cfg.get_float("LOSS.SPACE_QUERY_LOSS_COEF");
    weight_dict["loss_channel_query"] = cfg.get_float("LOSS.CHANNEL_QUERY_LOSS_COEF");
    weight_dict["loss_instance_query"] = cfg.get_float("LOSS.INSTANCE_QUERY_LOSS_COEF");
    return weight_dict;
}

torch::Tensor weighted_loss(const LossDict& losses, const WeightDict& weight_dict) {
    torch::Tensor total;
    for (auto& [k, v] : losses) {
        auto it = weight_dict.find(k);
        if (it == weight_dict.end())
            continue;
        torch::Tensor term = v * it->second;
        total = total.defined() ? total + term : term;
    }
    TORCH_CHECK(total.defined(), "none of the ", losses.size(), " losses has a weight");
    return total;
}

void print_losses(std::ostream& os, const LossDict& losses) {
    std::streamsize precision = os.precision();
    for (auto& [k, v] : losses) {
        os << k << ": ";
        if (v.numel() == 1)
            os << std::fixed << std::setprecision(4) << v.item<double>();
        else
            os << v.sizes();
        os << std::endl;
    }
    os.unsetf(std::ios_base::floatfield);
    os.precision(precision);
}
