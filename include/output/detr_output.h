#include <optional>
#include <torch/torch.h>
#include <vector>
#include "transformer.h"

#ifndef DETROUTPUT_H
#define DETROUTPUT_H


struct Prediction {
    torch::Tensor
        pred_logits,    // [B, Q, num_classes]
        pred_boxes,     // [B, Q, 4] normalized (cx, cy, w, h)
        pred_masks;     // [B, Q, H, W], only with a segmentation head
};


struct DETROutput {
    Prediction main;
    std::vector<Prediction> aux_outputs;        // one per non-final decoder layer
    std::optional<Prediction> enc_outputs;      // two-stage proposals
    std::optional<DomainFeatures> da_output;    // discriminator logits per alignment group
    std::optional<Prediction> pred_all;         // unsplit final layer predictions of the whole batch
    torch::Tensor probs;                        // softmax of the final logits, accumulate mode only
};

#endif
