#include <map>
#include <memory>
#include <string>
#include <torch/torch.h>
#include <vector>
#ifndef TRANSFORMER_H
#define TRANSFORMER_H

class PredictionHeadsImpl;

// domain alignment feature groups, keyed by granularity name
using DomainFeatures = std::map<std::string, torch::Tensor>;

const std::string DA_BACKBONE = "backbone";
const std::string DA_SPACE_QUERY = "space_query";
const std::string DA_CHANNEL_QUERY = "channel_query";
const std::string DA_INSTANCE_QUERY = "instance_query";


struct TransformerOutput {
/*
    hs: [num_layers, B, Q, hidden] decoder hidden states
    init_reference: [B, Q, 2 or 4] sigmoid space reference of the first layer
    inter_references: [num_layers (- 1), B, Q, 2 or 4] refined references,
                      inter_references[l - 1] feeds layer l
    enc_outputs_class, enc_outputs_coord_unact: two-stage proposals, undefined otherwise
    da_output: raw alignment features of the query level groups
*/
    torch::Tensor
        hs,
        init_reference,
        inter_references,
        enc_outputs_class,
        enc_outputs_coord_unact;
    DomainFeatures
        da_output;
};


struct DeformableTransformer : public torch::nn::Module {
/* Multi-scale deformable attention encoder/decoder. */
    virtual ~DeformableTransformer() = default;

    virtual TransformerOutput forward(const std::vector<torch::Tensor>& srcs,
                                      const std::vector<torch::Tensor>& masks,
                                      const std::vector<torch::Tensor>& pos,
                                      const torch::Tensor& query_embeds) = 0;

    virtual int d_model() const = 0;
    virtual int num_decoder_layers() const = 0;

    // iterative refinement and two-stage proposals read the detection heads from inside the decoder
    virtual void bind_heads(std::shared_ptr<PredictionHeadsImpl> heads,
                            bool with_box_refine,
                            bool two_stage) { }
};

#endif
