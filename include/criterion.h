#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <torch/torch.h>
#include <vector>
#include "matcher.h"
#include "output/detr_output.h"
#include "structures/instances.h"
#ifndef CRITERION_H
#define CRITERION_H


using LossDict = std::map<std::string, torch::Tensor>;

enum class CriterionMode {
    Train,
    Test
};


struct CriterionOptions {
/*
    num_classes: number of object categories, omitting the special no-object category
    losses: list of all the losses to be applied. See get_loss for list of available losses.
    focal_alpha: alpha in Focal Loss
    da_gamma: focusing exponent of the domain losses of the query level groups, 0 disables it
    return_indices: also return the matching of the final decoder layer
    split_targets: in train mode only the first half of the targets (the labeled source images)
                   belongs to the predictions
*/
    int num_classes = 9;
    std::vector<std::string> losses = {"labels", "boxes", "cardinality"};
    float focal_alpha = 0.25;
    float da_gamma = 0.;
    bool return_indices = false;
    bool split_targets = false;
};


struct CriterionResult {
    LossDict losses;
    std::optional<Indices> indices;
};


/*
    Loss used in RetinaNet for dense detection: https://arxiv.org/abs/1708.02002.
    Args:
        inputs: A float tensor of arbitrary shape.
                The predictions for each example.
        targets: A float tensor with the same shape as inputs. Stores the binary
                 classification label for each element in inputs
                (0 for the negative class and 1 for the positive class).
        num_boxes: normalizer of the summed per-query loss.
        alpha: Weighting factor in range (0,1) to balance positive vs negative
               examples. A negative value disables the weighting.
        gamma: Exponent of the modulating factor (1 - p_t) to
               balance easy vs hard examples.
    Returns:
        Loss tensor
*/
torch::Tensor sigmoid_focal_loss(const torch::Tensor& inputs,
                                 const torch::Tensor& targets,
                                 double num_boxes,
                                 double alpha = 0.25,
                                 double gamma = 2);

// DICE loss, similar to generalized IOU for masks. inputs are logits [N, HW], targets binary [N, HW]
torch::Tensor dice_loss(const torch::Tensor& inputs,
                        const torch::Tensor& targets,
                        double num_boxes);


class SetCriterionImpl : public torch::nn::Module {
/*
    Detection losses of every decoder stage against its bipartite matching with
    the ground truth, plus the domain classification loss of every discriminator
    output (first half of the batch source, second half target).
*/
public:
    SetCriterionImpl(std::shared_ptr<Matcher> matcher, CriterionOptions options);

    CriterionResult forward(const DETROutput& outputs,
                            std::vector<Instances> targets,
                            CriterionMode mode = CriterionMode::Train);

    LossDict loss_labels(const Prediction& outputs,
                         const std::vector<Instances>& targets,
                         const Indices& indices,
                         double num_boxes,
                         bool log = true);
    LossDict loss_cardinality(const Prediction& outputs,
                              const std::vector<Instances>& targets,
                              const Indices& indices,
                              double num_boxes);
    LossDict loss_boxes(const Prediction& outputs,
                        const std::vector<Instances>& targets,
                        const Indices& indices,
                        double num_boxes);
    LossDict loss_masks(const Prediction& outputs,
                        const std::vector<Instances>& targets,
                        const Indices& indices,
                        double num_boxes);
    torch::Tensor loss_da(const torch::Tensor& outputs, bool use_focal = false);

    LossDict get_loss(const std::string& loss,
                      const Prediction& outputs,
                      const std::vector<Instances>& targets,
                      const Indices& indices,
                      double num_boxes,
                      bool log = true);

    // class index of unmatched slots in the one-hot encoding, dropped before the focal loss
    int background_label() const { return opts.num_classes; }
    // logit index that the cardinality count treats as "no object"
    int cardinality_background_index() const { return opts.num_classes - 1; }
    const CriterionOptions& options() const { return opts; }
    void repr(std::ostream& os) const;

private:
    std::pair<torch::Tensor, torch::Tensor> get_src_permutation_idx(const Indices& indices) const;
    std::pair<torch::Tensor, torch::Tensor> get_tgt_permutation_idx(const Indices& indices) const;
    double get_num_boxes(const std::vector<Instances>& targets, torch::Device device) const;
    void check_logits(const Prediction& outputs) const;

    std::shared_ptr<Matcher> matcher;
    CriterionOptions opts;
};
TORCH_MODULE(SetCriterion);

#endif
