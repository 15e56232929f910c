#include <iostream>
#include <map>
#include <string>
#include <vector>
#include "utils/pathmanager.h"
#ifndef CFG_H
#define CFG_H


// CFGNODE CODE BASED ON:
// https://github.com/facebookresearch/detectron2/blob/main/detectron2/config/config.py#L87
// https://github.com/facebookresearch/fvcore/blob/main/fvcore/common/config.py
// both above are inheriting attributes from this original class: https://github.com/rbgirshick/yacs/blob/master/yacs/config.py
/*
    Keys are addressed as "SECTION.KEY" (or "KEY" for top-level options) and
    values are kept as strings, converted by the typed getters. Only keys that
    exist in the defaults can be overridden. Config files hold flat
    "SECTION.KEY: value" lines or one level of nested sections; deeper yaml
    nesting and lists are rejected.
*/
class CfgNode {
public:
    CfgNode() { }

    void merge_from_file(const std::string& cfg_filename);
    void merge_from_vector(const std::vector<std::string>& cfg_vector); // adaptation from original method: merge_from_list(List cfg_list)
    void merge_from_other_cfg(const CfgNode& cfg_other);

    void setattr(const std::string& full_key, const std::string& val);
    void register_key(const std::string& full_key, const std::string& default_val);
    bool has(const std::string& full_key) const;

    std::string get_string(const std::string& full_key) const;
    bool get_bool(const std::string& full_key) const;
    int get_int(const std::string& full_key) const;
    float get_float(const std::string& full_key) const;
    bool is_none(const std::string& full_key) const;

    void dump(std::ostream& os = std::cout) const;
    void freeze() { frozen = true; }
    void defrost() { frozen = false; }
    bool is_frozen() const { return frozen; }
    CfgNode clone() const { return *this; }

// class attributes:
    std::map< std::string, std::map<std::string, std::string> > contents; // section -> key -> value, "" holds top-level keys

private:
    static std::pair<std::string, std::string> split_key(const std::string& full_key);
    const std::string& lookup(const std::string& full_key) const;

    PathManager pathman;
    bool frozen = false;
};


// default values of every option the detector reads
CfgNode get_cfg_defaults();

#endif
