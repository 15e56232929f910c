#include <algorithm>
#include <iostream>
#include <torch/torch.h>
#include <vector>
#include "criterion.h"
#include "structures/nested_tensor.h"
#include "utils/box_operations.h"
#include "utils/misc.h"

using torch::indexing::Slice;
using torch::indexing::None;


torch::Tensor sigmoid_focal_loss(const torch::Tensor& inputs,
                                 const torch::Tensor& targets,
                                 double num_boxes,
                                 double alpha,
                                 double gamma)
{
    torch::Tensor prob = inputs.sigmoid();
    torch::Tensor ce_loss = torch::nn::functional::binary_cross_entropy_with_logits(
        inputs, targets, torch::nn::functional::BinaryCrossEntropyWithLogitsFuncOptions().reduction(torch::kNone));
    torch::Tensor p_t = prob * targets + (1 - prob) * (1 - targets);
    torch::Tensor loss = ce_loss * (1 - p_t).pow(gamma);

    if (alpha >= 0) {
        torch::Tensor alpha_t = alpha * targets + (1 - alpha) * (1 - targets);
        loss = alpha_t * loss;
    }
    if (loss.dim() < 2)
        return loss.sum() / num_boxes;
    return loss.mean(1).sum() / num_boxes;
}

torch::Tensor dice_loss(const torch::Tensor& inputs,
                        const torch::Tensor& targets,
                        double num_boxes)
{
    torch::Tensor probs = inputs.sigmoid().flatten(1);
    torch::Tensor numerator = 2 * (probs * targets).sum(1);
    torch::Tensor denominator = probs.sum(-1) + targets.sum(-1);
    torch::Tensor loss = 1 - (numerator + 1) / (denominator + 1);
    return loss.sum() / num_boxes;
}


SetCriterionImpl::SetCriterionImpl(std::shared_ptr<Matcher> matcher, CriterionOptions options) :
torch::nn::Module(), matcher(matcher), opts(options)
{
/*
    Args:
        matcher: module able to compute a matching between targets and proposals
        options: see CriterionOptions
*/
    TORCH_CHECK(this->matcher != nullptr, "SetCriterion needs a matcher");
    TORCH_CHECK(opts.num_classes >= 1, "num_classes must be positive, got ", opts.num_classes);
    TORCH_CHECK(!opts.losses.empty(), "SetCriterion needs at least one loss");
    const std::vector<std::string> known = {"labels", "cardinality", "boxes", "masks"};
    for (const std::string& loss : opts.losses)
        TORCH_CHECK(std::find(known.begin(), known.end(), loss) != known.end(),
                    "do you really want to compute ", loss, " loss?");
}

void SetCriterionImpl::check_logits(const Prediction& outputs) const {
    TORCH_CHECK(outputs.pred_logits.defined(), "outputs carry no pred_logits");
    TORCH_CHECK(outputs.pred_logits.dim() == 3, "pred_logits must be [B, Q, K], got ", outputs.pred_logits.sizes());
    TORCH_CHECK(outputs.pred_logits.size(-1) == opts.num_classes,
                "pred_logits has ", outputs.pred_logits.size(-1), " classes, the criterion expects ",
                opts.num_classes, " (no explicit no-object logit)");
}

std::pair<torch::Tensor, torch::Tensor> SetCriterionImpl::get_src_permutation_idx(const Indices& indices) const {
    // permute predictions following indices
    std::vector<torch::Tensor> batch_idx, src_idx;
    for (size_t i = 0; i < indices.size(); ++i) {
        const torch::Tensor& src = indices[i].first;
        batch_idx.push_back(torch::full_like(src, (int64_t)i));
        src_idx.push_back(src);
    }
    return {torch::cat(batch_idx), torch::cat(src_idx)};
}

std::pair<torch::Tensor, torch::Tensor> SetCriterionImpl::get_tgt_permutation_idx(const Indices& indices) const {
    // permute targets following indices
    std::vector<torch::Tensor> batch_idx, tgt_idx;
    for (size_t i = 0; i < indices.size(); ++i) {
        const torch::Tensor& tgt = indices[i].second;
        batch_idx.push_back(torch::full_like(tgt, (int64_t)i));
        tgt_idx.push_back(tgt);
    }
    return {torch::cat(batch_idx), torch::cat(tgt_idx)};
}

LossDict SetCriterionImpl::loss_labels(const Prediction& outputs,
                                       const std::vector<Instances>& targets,
                                       const Indices& indices,
                                       double num_boxes,
                                       bool log)
{
/*
    Sigmoid focal classification loss over all Q slots, unmatched slots are all-zero rows.
    Each target needs labels [nb_target_boxes].
*/
    check_logits(outputs);
    const torch::Tensor& src_logits = outputs.pred_logits;
    torch::Device device = src_logits.device();

    auto [batch_idx, src_idx] = get_src_permutation_idx(indices);
    std::vector<torch::Tensor> matched_labels;
    for (size_t i = 0; i < targets.size(); ++i)
        matched_labels.push_back(targets[i].labels.to(device).index({indices[i].second}));
    torch::Tensor target_classes_o = torch::cat(matched_labels).to(torch::kLong);
    if (target_classes_o.numel() > 0)
        TORCH_CHECK(target_classes_o.min().item<int64_t>() >= 0 &&
                    target_classes_o.max().item<int64_t>() < opts.num_classes,
                    "target labels must lie in [0, ", opts.num_classes, ")");

    int64_t B = src_logits.size(0), Q = src_logits.size(1);
    torch::Tensor target_classes = torch::full({B, Q}, (int64_t)background_label(),
                                               torch::TensorOptions().dtype(torch::kLong).device(device));
    target_classes.index_put_({batch_idx, src_idx}, target_classes_o);

    torch::Tensor target_classes_onehot = torch::zeros({B, Q, opts.num_classes + 1}, src_logits.options());
    target_classes_onehot.scatter_(2, target_classes.unsqueeze(-1), 1);
    target_classes_onehot = target_classes_onehot.index({Slice(), Slice(), Slice(None, -1)});

    torch::Tensor loss_ce = sigmoid_focal_loss(src_logits, target_classes_onehot, num_boxes, opts.focal_alpha, 2) * Q;
    LossDict losses = {{"loss_ce", loss_ce}};

    if (log) {
        torch::Tensor matched_logits = src_logits.index({batch_idx, src_idx});
        losses["class_error"] = 100 - accuracy(matched_logits, target_classes_o)[0];
    }
    return losses;
}

LossDict SetCriterionImpl::loss_cardinality(const Prediction& outputs,
                                            const std::vector<Instances>& targets,
                                            const Indices& indices,
                                            double num_boxes)
{
/*
    Absolute error in the number of predicted non-empty boxes per image. Logged only, no gradient.
*/
    torch::NoGradGuard no_grad;
    check_logits(outputs);
    const torch::Tensor& pred_logits = outputs.pred_logits;

    std::vector<int64_t> lengths;
    for (const Instances& t : targets)
        lengths.push_back(t.len());
    torch::Tensor tgt_lengths = torch::tensor(lengths, torch::kLong).to(pred_logits.device());

    // slots whose argmax is not the last logit
    torch::Tensor card_pred = (pred_logits.argmax(-1) != cardinality_background_index()).sum(1);
    torch::Tensor card_err = torch::nn::functional::l1_loss(card_pred.to(torch::kFloat), tgt_lengths.to(torch::kFloat));
    return {{"cardinality_error", card_err}};
}

LossDict SetCriterionImpl::loss_boxes(const Prediction& outputs,
                                      const std::vector<Instances>& targets,
                                      const Indices& indices,
                                      double num_boxes)
{
/*
    L1 regression loss and GIoU loss of the matched boxes.
    Each target needs boxes [nb_target_boxes, 4] as normalized (center_x, center_y, w, h).
*/
    TORCH_CHECK(outputs.pred_boxes.defined(), "outputs carry no pred_boxes");
    torch::Device device = outputs.pred_boxes.device();
    auto [batch_idx, src_idx] = get_src_permutation_idx(indices);
    torch::Tensor src_boxes = outputs.pred_boxes.index({batch_idx, src_idx});

    std::vector<torch::Tensor> matched_boxes;
    for (size_t i = 0; i < targets.size(); ++i)
        matched_boxes.push_back(targets[i].boxes.to(device, src_boxes.scalar_type()).index({indices[i].second}));
    torch::Tensor target_boxes = torch::cat(matched_boxes, 0);

    torch::Tensor loss_bbox = torch::nn::functional::l1_loss(
        src_boxes, target_boxes, torch::nn::functional::L1LossFuncOptions().reduction(torch::kNone));

    torch::Tensor loss_giou = 1 - torch::diag(generalized_box_iou(box_cxcywh_to_xyxy(src_boxes),
                                                                  box_cxcywh_to_xyxy(target_boxes)));
    return {{"loss_bbox", loss_bbox.sum() / num_boxes},
            {"loss_giou", loss_giou.sum() / num_boxes}};
}

LossDict SetCriterionImpl::loss_masks(const Prediction& outputs,
                                      const std::vector<Instances>& targets,
                                      const Indices& indices,
                                      double num_boxes)
{
/*
    Focal and dice losses of the matched masks.
    Each target needs masks [nb_target_boxes, h, w].
*/
    if (!outputs.pred_masks.defined()) {
        TORCH_WARN_ONCE("masks loss requested but the outputs carry no pred_masks, skipping it");
        return {};
    }
    std::vector<torch::Tensor> mask_vec;
    for (const Instances& t : targets) {
        TORCH_CHECK(t.has_masks(), "masks loss requested but a target carries no masks");
        mask_vec.push_back(t.masks);
    }

    auto [src_batch, src_idx] = get_src_permutation_idx(indices);
    auto [tgt_batch, tgt_idx] = get_tgt_permutation_idx(indices);
    torch::Tensor src_masks = outputs.pred_masks;

    // padded areas count as background
    torch::Tensor target_masks = nested_tensor_from_tensor_vector(mask_vec).tensors;
    target_masks = target_masks.to(src_masks.device(), src_masks.scalar_type());

    if (src_idx.numel() == 0) {
        torch::Tensor zero = src_masks.sum() * 0;
        return {{"loss_mask", zero}, {"loss_dice", zero}};
    }

    src_masks = src_masks.index({src_batch, src_idx});
    // upsample predictions to the target size
    src_masks = torch::nn::functional::interpolate(
        src_masks.unsqueeze(1),
        torch::nn::functional::InterpolateFuncOptions()
            .size(std::vector<int64_t>{target_masks.size(-2), target_masks.size(-1)})
            .mode(torch::kBilinear)
            .align_corners(false)
    );
    src_masks = src_masks.index({Slice(), 0}).flatten(1);
    target_masks = target_masks.index({tgt_batch, tgt_idx}).flatten(1);

    return {{"loss_mask", sigmoid_focal_loss(src_masks, target_masks, num_boxes)},
            {"loss_dice", dice_loss(src_masks, target_masks, num_boxes)}};
}

torch::Tensor SetCriterionImpl::loss_da(const torch::Tensor& outputs, bool use_focal) {
/*
    Binary domain classification of discriminator logits, the first half of the
    batch is the source domain (0) and the second half the target domain (1).
*/
    TORCH_CHECK(outputs.defined() && outputs.dim() >= 1, "domain discriminator output must be batched");
    int64_t B = outputs.size(0);
    TORCH_CHECK(B % 2 == 0, "domain loss needs a batch of source and target halves, got an odd batch of ", B);

    torch::Tensor targets = torch::empty_like(outputs);
    targets.index_put_({Slice(None, B / 2)}, 0);
    targets.index_put_({Slice(B / 2, None)}, 1);

    torch::Tensor loss = torch::nn::functional::binary_cross_entropy_with_logits(
        outputs, targets, torch::nn::functional::BinaryCrossEntropyWithLogitsFuncOptions().reduction(torch::kNone));

    if (use_focal) {
        torch::Tensor prob = outputs.sigmoid();
        torch::Tensor p_t = prob * targets + (1 - prob) * (1 - targets);
        loss = loss * (1 - p_t).pow(opts.da_gamma);
    }
    return loss.mean();
}

LossDict SetCriterionImpl::get_loss(const std::string& loss,
                                    const Prediction& outputs,
                                    const std::vector<Instances>& targets,
                                    const Indices& indices,
                                    double num_boxes,
                                    bool log)
{
    if (loss == "labels")
        return loss_labels(outputs, targets, indices, num_boxes, log);
    if (loss == "cardinality")
        return loss_cardinality(outputs, targets, indices, num_boxes);
    if (loss == "boxes")
        return loss_boxes(outputs, targets, indices, num_boxes);
    if (loss == "masks")
        return loss_masks(outputs, targets, indices, num_boxes);
    TORCH_CHECK(false, "do you really want to compute ", loss, " loss?");
    return {};
}

double SetCriterionImpl::get_num_boxes(const std::vector<Instances>& targets, torch::Device device) const {
    // target boxes per worker, at least 1
    int64_t total = 0;
    for (const Instances& t : targets)
        total += t.len();
    torch::Tensor num_boxes = torch::tensor({(float)total}, torch::TensorOptions().dtype(torch::kFloat).device(device));
    if (is_dist_avail_and_initialized())
        all_reduce(num_boxes);
    return torch::clamp(num_boxes / get_world_size(), 1).item<double>();
}

CriterionResult SetCriterionImpl::forward(const DETROutput& outputs,
                                          std::vector<Instances> targets,
                                          CriterionMode mode)
{
/*
    Args:
        outputs: model outputs, see DETROutput
        targets: one Instances per image. Under domain adaptation training the list
                 holds the source images first and the target images second.
        mode: Train or Test
*/
    // only the source images carry labels
    if (mode == CriterionMode::Train && opts.split_targets)
        targets = source_half(targets);

    const Prediction& main = outputs.main;
    check_logits(main);
    TORCH_CHECK((int64_t)targets.size() == main.pred_logits.size(0),
                "criterion got ", targets.size(), " targets for ", main.pred_logits.size(0), " predictions");
    for (const Instances& t : targets)
        t.validate();

    // match the final layer
    Indices indices = matcher->match(main, targets);
    double num_boxes = get_num_boxes(targets, main.pred_logits.device());

    CriterionResult result;
    LossDict& losses = result.losses;
    for (const std::string& loss : opts.losses) {
        LossDict l_dict = get_loss(loss, main, targets, indices, num_boxes);
        losses.insert(l_dict.begin(), l_dict.end());
    }

    // intermediate decoder layers
    for (size_t i = 0; i < outputs.aux_outputs.size(); ++i) {
        const Prediction& aux = outputs.aux_outputs[i];
        Indices aux_indices = matcher->match(aux, targets);
        for (const std::string& loss : opts.losses) {
            if (loss == "masks")
                continue;
            LossDict l_dict = get_loss(loss, aux, targets, aux_indices, num_boxes, false);
            for (auto& [k, v] : l_dict)
                losses[k + "_" + std::to_string(i)] = v;
        }
    }

    if (outputs.enc_outputs.has_value()) {
        const Prediction& enc = outputs.enc_outputs.value();
        std::vector<Instances> bin_targets;
        for (const Instances& t : targets)
            bin_targets.push_back(t.binarized());
        Indices enc_indices = matcher->match(enc, bin_targets);
        for (const std::string& loss : opts.losses) {
            if (loss == "masks")
                continue;
            LossDict l_dict = get_loss(loss, enc, bin_targets, enc_indices, num_boxes, false);
            for (auto& [k, v] : l_dict)
                losses[k + "_enc"] = v;
        }
    }

    if (outputs.da_output.has_value()) {
        for (auto& [k, v] : outputs.da_output.value())
            losses["loss_" + k] = loss_da(v, k.find("query") != std::string::npos);
    }

    if (opts.return_indices)
        result.indices = indices;
    return result;
}

void SetCriterionImpl::repr(std::ostream& os) const {
    os << "SetCriterion(" << std::endl;
    os << "  num_classes: " << opts.num_classes << std::endl;
    os << "  losses: [";
    for (size_t i = 0; i < opts.losses.size(); ++i)
        os << (i ? ", " : "") << opts.losses[i];
    os << "]" << std::endl;
    os << "  focal_alpha: " << opts.focal_alpha << std::endl;
    os << "  da_gamma: " << opts.da_gamma << std::endl;
    os << "  return_indices: " << (opts.return_indices ? "True" : "False") << std::endl;
    os << "  split_targets: " << (opts.split_targets ? "True" : "False") << std::endl;
    os << "  matcher: ";
    matcher->repr(os);
    os << ")" << std::endl;
}
