#include <algorithm>
#include <iostream>
#include <torch/torch.h>
#include <vector>
#include <string>
#include "build.h"
#include "cfg.h"
#include "criterion.h"
#include "loss_weighting.h"
#include "postprocess.h"
#include "structures/instances.h"

using std::cout;
using std::endl;
using std::vector;
using std::string;


// random normalized (cx, cy, w, h) boxes that stay inside the image
torch::Tensor random_boxes(int64_t n) {
    torch::Tensor wh = torch::rand({n, 2}) * 0.4 + 0.05;
    torch::Tensor c = wh / 2 + torch::rand({n, 2}) * (1 - wh);
    return torch::cat({c, wh}, 1);
}

DETROutput random_outputs(int64_t batch, int64_t num_queries, int64_t num_classes, int aux_layers) {
    DETROutput out;
    out.main = Prediction{torch::randn({batch, num_queries, num_classes}),
                          torch::rand({batch, num_queries, 4}) * 0.5 + 0.25,
                          torch::Tensor()};
    for (int i = 0; i < aux_layers; ++i)
        out.aux_outputs.push_back(Prediction{torch::randn({batch, num_queries, num_classes}),
                                             torch::rand({batch, num_queries, 4}) * 0.5 + 0.25,
                                             torch::Tensor()});
    return out;
}


int main(int argc, const char* argv[]) {
    cout << "Domain adaptive Deformable DETR: criterion and post-processing demo.\n"
            "Usage: dadetr_demo [KEY VALUE ...], e.g. dadetr_demo MODEL.NUM_QUERIES 50\n" << endl;

    vector<string> overrides;
    for (int i = 1; i < argc; ++i)
        overrides.push_back(argv[i]);

    try {
        CfgNode cfg = get_cfg_defaults();
        cfg.merge_from_vector(overrides);
        cfg.freeze();
        cfg.dump(cout);
        cout << endl;

        torch::manual_seed(cfg.get_int("SEED"));
        std::shared_ptr<Matcher> matcher = build_matcher(cfg);
        SetCriterion criterion = build_criterion(cfg, matcher);
        WeightDict weight_dict = build_weight_dict(cfg);
        criterion->repr(cout);

        int64_t batch = cfg.get_int("TRAIN.BATCH_SIZE");
        int64_t num_queries = cfg.get_int("MODEL.NUM_QUERIES");
        int64_t num_classes = cfg.get_int("DATASET.NUM_CLASSES");
        int aux_layers = cfg.get_bool("LOSS.AUX_LOSS") ? cfg.get_int("MODEL.DEC_LAYERS") - 1 : 0;

        // the criterion keeps the source half of the targets when it splits
        int64_t pred_batch = criterion->options().split_targets ? batch / 2 : batch;
        TORCH_CHECK(pred_batch >= 1, "TRAIN.BATCH_SIZE ", batch, " leaves no labeled image");
        DETROutput outputs = random_outputs(pred_batch, num_queries, num_classes, aux_layers);

        vector<Instances> targets;
        for (int64_t i = 0; i < batch; ++i) {
            int64_t n = i + 1;
            targets.push_back(Instances(torch::randint(num_classes, {n}, torch::kLong), random_boxes(n)));
        }

        CriterionResult result = criterion->forward(outputs, targets, CriterionMode::Train);
        cout << "\nlosses:" << endl;
        print_losses(cout, result.losses);
        cout << "weighted total: " << weighted_loss(result.losses, weight_dict).item<double>() << endl;

        PostProcess postprocess(std::min<int64_t>(10, num_queries * num_classes));
        torch::Tensor sizes = torch::tensor({480, 640}, torch::kFloat).repeat({pred_batch, 1});
        vector<Detection> detections = postprocess->forward(outputs.main, sizes);
        for (size_t i = 0; i < detections.size(); ++i) {
            cout << "\nimage " << i << ": top score " << detections[i].scores[0].item<float>()
                 << ", label " << detections[i].labels[0].item<int64_t>()
                 << ", box " << detections[i].boxes[0] << endl;
        }
    }
    catch (const c10::Error& e) {
        std::cerr << "Error: " << e.what_without_backtrace() << endl;
        return -1;
    }
    return 0;
}
