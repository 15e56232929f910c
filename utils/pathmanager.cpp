#include <filesystem>
#include <fstream>
#include <string>
#include <torch/torch.h>
#include "utils/pathmanager.h"


bool PathManager::isfile(const std::string& path) const {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

std::ifstream PathManager::open(const std::string& path) const {
    std::ifstream stream(path);
    TORCH_CHECK(stream.is_open(), "PathManager: cannot open ", path);
    return stream;
}
