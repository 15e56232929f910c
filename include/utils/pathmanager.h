#include <fstream>
#include <string>
#ifndef PATHMANAGER_H
#define PATHMANAGER_H

// https://github.com/facebookresearch/iopath/blob/main/iopath/common/file_io.py
// local filesystem only
class PathManager {
public:
    bool isfile(const std::string& path) const;
    std::ifstream open(const std::string& path) const;
};

#endif
