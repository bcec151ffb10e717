#include <string>
#include <expected>
#include <filesystem>
#include <fstream>
#include <format>

#include <ryml.hpp>
#include <ryml_std.hpp>
#include <spdlog/spdlog.h>

#include "config.hpp"
#include "error.hpp"

namespace {

E<std::vector<char>> readFile(const std::filesystem::path& path)
{
    std::ifstream f(path, std::ios::binary);
    std::vector<char> content;
    content.reserve(4096);
    content.assign(std::istreambuf_iterator<char>(f),
                   std::istreambuf_iterator<char>());
    if(f.bad() || f.fail())
    {
        return std::unexpected(runtimeError(
            std::format("Failed to read file {}", path.string())));
    }

    return content;
}

std::string toString(ryml::csubstr s)
{
    return std::string(s.str, s.len);
}

void flatten(ryml::ConstNodeRef node, const std::string& prefix,
             Configuration::StringMap& result)
{
    for(ryml::ConstNodeRef child: node.children())
    {
        if(!child.has_key())
        {
            continue;
        }
        std::string key = toString(child.key());
        if(!prefix.empty())
        {
            key = prefix + "." + key;
        }

        if(child.is_map())
        {
            flatten(child, key, result);
        }
        else if(child.is_seq())
        {
            spdlog::warn("Ignoring sequence value of {} in configuration.",
                         key);
        }
        else if(child.has_val() && !child.val_is_null())
        {
            result[key] = toString(child.val());
        }
    }
}

Configuration fromTree(const ryml::Tree& tree)
{
    Configuration config;
    ryml::ConstNodeRef root = tree.rootref();
    if(root.is_map())
    {
        flatten(root, "", config.properties);
    }
    return config;
}

} // namespace

E<Configuration> Configuration::fromYaml(const std::filesystem::path& path)
{
    auto buffer = readFile(path);
    if(!buffer.has_value())
    {
        return std::unexpected(buffer.error());
    }
    if(buffer->empty())
    {
        return Configuration();
    }

    ryml::Tree tree = ryml::parse_in_place(ryml::to_substr(*buffer));
    return E<Configuration>{std::in_place, fromTree(tree)};
}

E<Configuration> Configuration::fromYamlStr(std::string yaml)
{
    if(yaml.empty())
    {
        return Configuration();
    }
    ryml::Tree tree = ryml::parse_in_place(ryml::to_substr(yaml));
    return E<Configuration>{std::in_place, fromTree(tree)};
}

std::optional<std::string> Configuration::get(const std::string& key) const
{
    auto it = properties.find(key);
    if(it == properties.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::string Configuration::get(const std::string& key,
                               std::string_view default_value) const
{
    auto it = properties.find(key);
    if(it == properties.end())
    {
        return std::string(default_value);
    }
    return it->second;
}
