#include "path_utils.h"
#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>

namespace parley {

std::string expand_path(const std::string& path) {
    if (path.empty()) return path;
    if (path.size() == 1 && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) return std::string(home);
        return path;
    }
    if (path.size() >= 2 && path[0] == '~' && (path[1] == '/' || path[1] == '\\')) {
        const char* home = std::getenv("HOME");
        if (home) return std::string(home) + path.substr(1);
        return path;
    }
    return path;
}

static bool model_exists(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    return f.good();
}

std::string default_whisper_model_path() {
    static const char* model_names[] = {"ggml-base.en.bin", "ggml-base.bin", "ggml-tiny.en.bin"};
    std::vector<std::string> dirs = {"~/models/whisper", "/usr/local/share/whisper", "/usr/share/whisper"};
    for (const auto& dir : dirs) {
        std::string base = expand_path(dir);
        for (const char* name : model_names) {
            std::string candidate = base + "/" + name;
            if (model_exists(candidate)) return candidate;
        }
    }
    return "";
}

} // namespace parley
