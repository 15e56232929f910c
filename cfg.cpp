#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <string>
#include <torch/torch.h>
#include <vector>
#include "cfg.h"

namespace {

std::string strip(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos)
        return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    std::string ret = s.substr(begin, end - begin + 1);
    // yaml style quoting
    if (ret.size() >= 2 && (ret.front() == '\'' || ret.front() == '"') && ret.back() == ret.front())
        ret = ret.substr(1, ret.size() - 2);
    return ret;
}

}


std::pair<std::string, std::string> CfgNode::split_key(const std::string& full_key) {
    size_t dot = full_key.find('.');
    if (dot == std::string::npos)
        return {"", full_key};
    return {full_key.substr(0, dot), full_key.substr(dot + 1)};
}

const std::string& CfgNode::lookup(const std::string& full_key) const {
    auto [section, key] = split_key(full_key);
    auto sec = contents.find(section);
    TORCH_CHECK(sec != contents.end() && sec->second.count(key),
                "Non-existent config key: ", full_key);
    return sec->second.at(key);
}

void CfgNode::register_key(const std::string& full_key, const std::string& default_val) {
    TORCH_CHECK(!frozen, "Attempted to register '", full_key, "' in a frozen CfgNode");
    auto [section, key] = split_key(full_key);
    contents[section][key] = default_val;
}

bool CfgNode::has(const std::string& full_key) const {
    auto [section, key] = split_key(full_key);
    auto sec = contents.find(section);
    return sec != contents.end() && sec->second.count(key) > 0;
}

void CfgNode::setattr(const std::string& full_key, const std::string& val) {
    TORCH_CHECK(!frozen, "Attempted to set '", full_key, "' to '", val, "', but CfgNode is immutable");
    TORCH_CHECK(has(full_key), "Non-existent config key: ", full_key);
    auto [section, key] = split_key(full_key);
    contents[section][key] = val;
}

void CfgNode::merge_from_vector(const std::vector<std::string>& cfg_vector) {
/*
    Merge config (keys, values) in a flat list into this CfgNode.
    Args:
        cfg_vector: e.g. {"MODEL.NUM_QUERIES", "100", "DATASET.DA_MODE", "uda"}
*/
    TORCH_CHECK(cfg_vector.size() % 2 == 0,
                "Override list has odd length: ", cfg_vector.size(), "; it must be a list of pairs");
    for (size_t i = 0; i < cfg_vector.size(); i += 2)
        setattr(cfg_vector[i], strip(cfg_vector[i + 1]));
}

void CfgNode::merge_from_file(const std::string& cfg_filename) {
/*
    Reads "SECTION.KEY: value" pairs, one per line, or the one level nested
    form written by dump():
        SECTION:
          KEY: value
    Deeper nesting and yaml lists are not supported. Blank lines and
    everything after a '#' are ignored.
*/
    TORCH_CHECK(pathman.isfile(cfg_filename), "Config file ", cfg_filename, " does not exist.");
    std::ifstream stream = pathman.open(cfg_filename);
    std::vector<std::string> cfg_vector;
    std::string line, section;
    int lineno = 0;
    while (std::getline(stream, line)) {
        ++lineno;
        size_t comment = line.find('#');
        if (comment != std::string::npos)
            line = line.substr(0, comment);
        bool indented = !line.empty() && (line.front() == ' ' || line.front() == '\t');
        line = strip(line);
        if (line.empty())
            continue;
        size_t colon = line.find(':');
        TORCH_CHECK(colon != std::string::npos,
                    cfg_filename, ":", lineno, ": expected 'KEY: value', got '", line, "'");
        std::string key = strip(line.substr(0, colon));
        std::string value = strip(line.substr(colon + 1));
        if (!indented) {
            section.clear();
            if (value.empty()) {
                section = key;
                continue;
            }
        }
        else {
            TORCH_CHECK(!section.empty(), cfg_filename, ":", lineno, ": indented key '", key, "' outside a section");
            TORCH_CHECK(!value.empty(), cfg_filename, ":", lineno, ": nested section '", key, "' is not supported");
            key = section + "." + key;
        }
        cfg_vector.push_back(key);
        cfg_vector.push_back(value);
    }
    merge_from_vector(cfg_vector);
}

void CfgNode::merge_from_other_cfg(const CfgNode& cfg_other) {
    for (const auto& [section, values] : cfg_other.contents) {
        for (const auto& [key, value] : values)
            setattr(section.empty() ? key : section + "." + key, value);
    }
}

std::string CfgNode::get_string(const std::string& full_key) const {
    return lookup(full_key);
}

bool CfgNode::is_none(const std::string& full_key) const {
    const std::string& val = lookup(full_key);
    return val == "None" || val.empty();
}

bool CfgNode::get_bool(const std::string& full_key) const {
    std::string val = lookup(full_key);
    std::transform(val.begin(), val.end(), val.begin(), [](unsigned char c) { return std::tolower(c); });
    if (val == "true" || val == "1")
        return true;
    if (val == "false" || val == "0")
        return false;
    TORCH_CHECK(false, "Config key ", full_key, " expects a bool, got '", val, "'");
    return false;
}

int CfgNode::get_int(const std::string& full_key) const {
    const std::string& val = lookup(full_key);
    size_t pos = 0;
    int ret = 0;
    try {
        ret = std::stoi(val, &pos);
    }
    catch (const std::exception&) {
        TORCH_CHECK(false, "Config key ", full_key, " expects an int, got '", val, "'");
    }
    TORCH_CHECK(pos == val.size(), "Config key ", full_key, " expects an int, got '", val, "'");
    return ret;
}

float CfgNode::get_float(const std::string& full_key) const {
    const std::string& val = lookup(full_key);
    size_t pos = 0;
    float ret = 0.f;
    try {
        ret = std::stof(val, &pos);
    }
    catch (const std::exception&) {
        TORCH_CHECK(false, "Config key ", full_key, " expects a float, got '", val, "'");
    }
    TORCH_CHECK(pos == val.size(), "Config key ", full_key, " expects a float, got '", val, "'");
    return ret;
}

void CfgNode::dump(std::ostream& os) const {
    for (const auto& [section, values] : contents) {
        if (section.empty()) {
            for (const auto& [key, value] : values)
                os << key << ": " << value << std::endl;
        }
    }
    for (const auto& [section, values] : contents) {
        if (section.empty())
            continue;
        os << section << ":" << std::endl;
        for (const auto& [key, value] : values)
            os << "  " << key << ": " << value << std::endl;
    }
}


CfgNode get_cfg_defaults() {
    CfgNode _C;

    // ------------------------------------------------------------------------
    // Training
    // ------------------------------------------------------------------------
    _C.register_key("TRAIN.LR", "2e-4");
    _C.register_key("TRAIN.LR_BACKBONE", "2e-5");
    _C.register_key("TRAIN.BATCH_SIZE", "2");
    _C.register_key("TRAIN.WEIGHT_DECAY", "1e-4");
    _C.register_key("TRAIN.EPOCHS", "50");
    _C.register_key("TRAIN.LR_DROP", "40");
    _C.register_key("TRAIN.CLIP_MAX_NORM", "0.1"); // gradient clipping max norm

    // ------------------------------------------------------------------------
    // Model
    // ------------------------------------------------------------------------
    // Variants of Deformable DETR
    _C.register_key("MODEL.WITH_BOX_REFINE", "False");
    _C.register_key("MODEL.TWO_STAGE", "False");
    _C.register_key("MODEL.FROZEN_WEIGHTS", "None");

    // * Backbone
    _C.register_key("MODEL.BACKBONE", "resnet50");
    _C.register_key("MODEL.NUM_FEATURE_LEVELS", "4");

    // * Transformer
    _C.register_key("MODEL.ENC_LAYERS", "6");
    _C.register_key("MODEL.DEC_LAYERS", "6");
    _C.register_key("MODEL.DIM_FEEDFORWARD", "1024");
    _C.register_key("MODEL.HIDDEN_DIM", "256");
    _C.register_key("MODEL.DROPOUT", "0.1");
    _C.register_key("MODEL.NHEADS", "8");
    _C.register_key("MODEL.NUM_QUERIES", "300");
    _C.register_key("MODEL.DEC_N_POINTS", "4");
    _C.register_key("MODEL.ENC_N_POINTS", "4");

    // * Segmentation
    _C.register_key("MODEL.MASKS", "False");

    // * Domain Adaptation
    _C.register_key("MODEL.BACKBONE_ALIGN", "False");
    _C.register_key("MODEL.SPACE_ALIGN", "False");
    _C.register_key("MODEL.CHANNEL_ALIGN", "False");
    _C.register_key("MODEL.INSTANCE_ALIGN", "False");

    // ------------------------------------------------------------------------
    // Loss
    // ------------------------------------------------------------------------
    _C.register_key("LOSS.AUX_LOSS", "True");

    // * Matcher
    _C.register_key("LOSS.SET_COST_CLASS", "2.0");
    _C.register_key("LOSS.SET_COST_BBOX", "5.0");
    _C.register_key("LOSS.SET_COST_GIOU", "2.0");

    // * Loss coefficients
    _C.register_key("LOSS.MASK_LOSS_COEF", "1.0");
    _C.register_key("LOSS.DICE_LOSS_COEF", "1.0");
    _C.register_key("LOSS.CLS_LOSS_COEF", "2.0");
    _C.register_key("LOSS.BBOX_LOSS_COEF", "5.0");
    _C.register_key("LOSS.GIOU_LOSS_COEF", "2.0");
    _C.register_key("LOSS.BACKBONE_LOSS_COEF", "0.1");
    _C.register_key("LOSS.SPACE_QUERY_LOSS_COEF", "0.1");
    _C.register_key("LOSS.CHANNEL_QUERY_LOSS_COEF", "0.1");
    _C.register_key("LOSS.INSTANCE_QUERY_LOSS_COEF", "0.1");
    _C.register_key("LOSS.FOCAL_ALPHA", "0.25");
    _C.register_key("LOSS.DA_GAMMA", "0");

    // ------------------------------------------------------------------------
    // dataset parameters
    // ------------------------------------------------------------------------
    _C.register_key("DATASET.DA_MODE", "source_only"); // ('source_only', 'uda', 'oracle')
    _C.register_key("DATASET.NUM_CLASSES", "9"); // This should be set as max_class_id + 1
    _C.register_key("DATASET.DATASET_FILE", "cityscapes_to_foggy_cityscapes");

    // ------------------------------------------------------------------------
    // Distributed
    // ------------------------------------------------------------------------
    _C.register_key("DIST.DISTRIBUTED", "False");
    _C.register_key("DIST.WORLD_SIZE", "None");

    // ------------------------------------------------------------------------
    // Miscellaneous
    // ------------------------------------------------------------------------
    _C.register_key("OUTPUT_DIR", "");
    _C.register_key("DEVICE", "cpu");
    _C.register_key("SEED", "42");
    _C.register_key("EVAL", "False");
    _C.register_key("DEBUG", "False");
    _C.register_key("ACCUMULATE_STATS", "False");

    return _C.clone();
}
