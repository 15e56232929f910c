#include <iostream>
#include <torch/torch.h>
#include <utility>
#include <vector>
#include "output/detr_output.h"
#include "structures/instances.h"

#ifndef MATCHER_H
#define MATCHER_H

// per image (index_i, index_j): index_i indexes the predictions, index_j the targets
using Indices = std::vector< std::pair<torch::Tensor, torch::Tensor> >;


struct Matcher {
/*
    One-to-one assignment of predictions to ground truth objects, per image.
    Targets carry no no-object entries, so with more queries than objects the
    unassigned queries are supervised as background.
    match returns one (index_i, index_j) pair per image, index_i selecting
    predictions and index_j the targets, both of length min(num_queries, num_targets).
*/
    virtual ~Matcher() = default;
    virtual Indices match(const Prediction& outputs,
                          const std::vector<Instances>& targets) = 0;
    virtual void repr(std::ostream& os) const { os << "Matcher()" << std::endl; }
};


class HungarianMatcher : public Matcher {
public:
    HungarianMatcher(float cost_class = 1., float cost_bbox = 1., float cost_giou = 1.,
                     float focal_alpha = 0.25, float focal_gamma = 2.0);
    Indices match(const Prediction& outputs,
                  const std::vector<Instances>& targets) override;
    // [B, Q, sum(N)] cost of assigning every prediction to every target of the batch
    torch::Tensor cost_matrix(const Prediction& outputs,
                              const std::vector<Instances>& targets) const;
    void repr(std::ostream& os) const override;

private:
    float cost_class = 1.;
    float cost_bbox = 1.;
    float cost_giou = 1.;
    float focal_alpha = 0.25;
    float focal_gamma = 2.0;
};


// minimum cost assignment of a [rows, cols] matrix; returned row indices are ascending
std::pair< std::vector<int64_t>, std::vector<int64_t> > linear_sum_assignment(const torch::Tensor& cost);

#endif
