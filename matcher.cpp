#include <algorithm>
#include <iostream>
#include <limits>
#include <numeric>
#include <torch/torch.h>
#include <vector>
#include "matcher.h"
#include "utils/box_operations.h"


std::pair< std::vector<int64_t>, std::vector<int64_t> > linear_sum_assignment(const torch::Tensor& cost) {
/*
    Shortest augmenting path Hungarian algorithm (Kuhn-Munkres with potentials),
    O(n^2 m) for n = min(rows, cols). Works on the transposed problem when there
    are more rows than columns.
*/
    TORCH_CHECK(cost.dim() == 2, "linear_sum_assignment expects a 2D cost matrix, got ", cost.dim(), " dims");
    torch::Tensor c = cost.detach().to(torch::kCPU, torch::kDouble).contiguous();
    TORCH_CHECK(torch::isfinite(c).all().item<bool>(), "linear_sum_assignment: cost matrix contains inf or nan");

    int64_t rows = c.size(0), cols = c.size(1);
    std::vector<int64_t> row_ind, col_ind;
    if (rows == 0 || cols == 0)
        return {row_ind, col_ind};

    bool transposed = rows > cols;
    if (transposed) {
        c = c.t().contiguous();
        std::swap(rows, cols);
    }
    const double* a = c.data_ptr<double>();
    const double inf = std::numeric_limits<double>::infinity();
    int64_t n = rows, m = cols;

    std::vector<double> u(n + 1, 0.), v(m + 1, 0.);
    std::vector<int64_t> p(m + 1, 0), way(m + 1, 0);
    for (int64_t i = 1; i <= n; ++i) {
        p[0] = i;
        int64_t j0 = 0;
        std::vector<double> minv(m + 1, inf);
        std::vector<char> used(m + 1, false);
        do {
            used[j0] = true;
            int64_t i0 = p[j0], j1 = 0;
            double delta = inf;
            for (int64_t j = 1; j <= m; ++j) {
                if (used[j])
                    continue;
                double cur = a[(i0 - 1) * m + (j - 1)] - u[i0] - v[j];
                if (cur < minv[j]) {
                    minv[j] = cur;
                    way[j] = j0;
                }
                if (minv[j] < delta) {
                    delta = minv[j];
                    j1 = j;
                }
            }
            for (int64_t j = 0; j <= m; ++j) {
                if (used[j]) {
                    u[p[j]] += delta;
                    v[j] -= delta;
                }
                else
                    minv[j] -= delta;
            }
            j0 = j1;
        } while (p[j0] != 0);
        do {
            int64_t j1 = way[j0];
            p[j0] = p[j1];
            j0 = j1;
        } while (j0);
    }

    std::vector< std::pair<int64_t, int64_t> > pairs;
    for (int64_t j = 1; j <= m; ++j) {
        if (p[j] == 0)
            continue;
        if (transposed)
            pairs.push_back({j - 1, p[j] - 1});
        else
            pairs.push_back({p[j] - 1, j - 1});
    }
    std::sort(pairs.begin(), pairs.end());
    for (auto& [r, col] : pairs) {
        row_ind.push_back(r);
        col_ind.push_back(col);
    }
    return {row_ind, col_ind};
}


HungarianMatcher::HungarianMatcher(float cost_class, float cost_bbox, float cost_giou,
                                   float focal_alpha, float focal_gamma) :
cost_class(cost_class), cost_bbox(cost_bbox), cost_giou(cost_giou),
focal_alpha(focal_alpha), focal_gamma(focal_gamma)
{
    TORCH_CHECK(cost_class != 0 || cost_bbox != 0 || cost_giou != 0, "all costs cant be 0");
}

torch::Tensor HungarianMatcher::cost_matrix(const Prediction& outputs,
                                            const std::vector<Instances>& targets) const
{
    TORCH_CHECK(outputs.pred_logits.defined(), "matcher needs pred_logits");
    TORCH_CHECK(outputs.pred_boxes.defined(), "matcher needs pred_boxes");
    int64_t bs = outputs.pred_logits.size(0);
    int64_t num_queries = outputs.pred_logits.size(1);

    // whole batch at once, split per image afterwards
    torch::Tensor out_prob = outputs.pred_logits.flatten(0, 1).sigmoid();
    torch::Tensor out_bbox = outputs.pred_boxes.flatten(0, 1);

    std::vector<torch::Tensor> labels_vec, boxes_vec;
    for (const Instances& t : targets) {
        labels_vec.push_back(t.labels);
        boxes_vec.push_back(t.boxes);
    }
    torch::Tensor tgt_ids = torch::cat(labels_vec).to(out_prob.device(), torch::kLong);
    torch::Tensor tgt_bbox = torch::cat(boxes_vec).to(out_bbox.device(), out_bbox.scalar_type());

    // focal classification cost
    double alpha = focal_alpha, gamma = focal_gamma;
    torch::Tensor neg_cost_class = (1 - alpha) * out_prob.pow(gamma) * (-(1 - out_prob + 1e-8).log());
    torch::Tensor pos_cost_class = alpha * (1 - out_prob).pow(gamma) * (-(out_prob + 1e-8).log());
    torch::Tensor class_cost = pos_cost_class.index({torch::indexing::Slice(), tgt_ids})
                               - neg_cost_class.index({torch::indexing::Slice(), tgt_ids});

    torch::Tensor bbox_cost = torch::cdist(out_bbox, tgt_bbox, 1);

    torch::Tensor giou_cost = -generalized_box_iou(box_cxcywh_to_xyxy(out_bbox),
                                                   box_cxcywh_to_xyxy(tgt_bbox));

    torch::Tensor C = cost_bbox * bbox_cost + cost_class * class_cost + cost_giou * giou_cost;
    return C.view({bs, num_queries, -1});
}

Indices HungarianMatcher::match(const Prediction& outputs,
                                const std::vector<Instances>& targets)
{
    torch::NoGradGuard no_grad;
    int64_t bs = outputs.pred_logits.size(0);
    TORCH_CHECK((int64_t)targets.size() == bs,
                "matcher got ", targets.size(), " target sets for a batch of ", bs);

    torch::TensorOptions index_options = torch::TensorOptions().dtype(torch::kLong).device(outputs.pred_logits.device());
    Indices indices;
    int64_t total = 0;
    for (const Instances& t : targets)
        total += t.len();
    if (total == 0) {
        for (int64_t i = 0; i < bs; ++i)
            indices.push_back({torch::empty({0}, index_options), torch::empty({0}, index_options)});
        return indices;
    }

    torch::Tensor C = cost_matrix(outputs, targets).cpu();
    int64_t offset = 0;
    for (int64_t i = 0; i < bs; ++i) {
        int64_t size = targets[i].len();
        torch::Tensor c = C.index({i, torch::indexing::Slice(), torch::indexing::Slice(offset, offset + size)});
        offset += size;
        auto [row_ind, col_ind] = linear_sum_assignment(c);
        indices.push_back({torch::tensor(row_ind, torch::kLong).to(index_options.device()),
                           torch::tensor(col_ind, torch::kLong).to(index_options.device())});
    }
    return indices;
}

void HungarianMatcher::repr(std::ostream& os) const {
    os << "HungarianMatcher(cost_class=" << cost_class
       << ", cost_bbox=" << cost_bbox
       << ", cost_giou=" << cost_giou
       << ", focal_alpha=" << focal_alpha
       << ", focal_gamma=" << focal_gamma << ")" << std::endl;
}
