#include "url_list.hpp"

#include <fstream>

#include <fmt/core.h>

#include "config.hpp"

std::vector<std::string> readUrlList(const std::filesystem::path &path)
{
    std::ifstream file(path);
    if (!file)
    {
        throw ConfigError(fmt::format("Cannot open input file: {}", path.string()));
    }

    std::vector<std::string> urls;
    std::string line;
    while (std::getline(file, line))
    {
        if (!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }
        urls.push_back(line);
    }
    return urls;
}
