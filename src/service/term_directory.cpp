#include "service/term_directory.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <stdexcept>

namespace lexigraph {

StaticTermDirectory StaticTermDirectory::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open term list: " + path);
    }

    nlohmann::json j;
    file >> j;
    if (!j.is_array()) {
        throw std::runtime_error("Term list must be a JSON array of ids: " + path);
    }

    StaticTermDirectory directory;
    for (const auto& item : j) {
        directory.add(item.get<std::string>());
    }
    return directory;
}

} // namespace lexigraph
