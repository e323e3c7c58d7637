#include "host_list.hpp"
#include <util/string_utils.hpp>
#include <fstream>
#include <sstream>

std::vector<std::string> parse_host_list(const std::string& text) {
    std::vector<std::string> hosts;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        auto hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        std::string host = StringUtils::trim(line);
        if (!host.empty()) hosts.push_back(host);
    }
    return hosts;
}

Result<std::vector<std::string>> load_host_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<std::vector<std::string>>::Err("Cannot read host file " + path.string());
    }
    std::stringstream buf;
    buf << in.rdbuf();
    return Result<std::vector<std::string>>::Ok(parse_host_list(buf.str()));
}

std::vector<std::string> split_host_arg(const std::string& arg) {
    std::vector<std::string> hosts;
    for (const auto& part : StringUtils::split(arg, ',')) {
        std::string host = StringUtils::trim(part);
        if (!host.empty()) hosts.push_back(host);
    }
    return hosts;
}
