/* -- C++ -- */
/**
 *  @file  ana/src/RenormConfigService.cpp
 *
 *  @brief Renormalisation configuration parsing and validation.
 */

#include "RenormConfigService.hh"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <set>
#include <sstream>
#include <utility>

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include "RenormErrors.hh"
#include "SampleIO.hh"


namespace
{

using Json = nlohmann::ordered_json;

std::string key_path(const std::string &parent, const std::string &key)
{
    return parent.empty() ? key : parent + "." + key;
}

const Json *find_key(const Json &node, std::initializer_list<const char *> spellings)
{
    for (const char *key : spellings)
    {
        const auto it = node.find(key);
        if (it != node.end())
        {
            return &(*it);
        }
    }
    return nullptr;
}

const Json &require_key(const Json &node,
                        const std::string &parent,
                        std::initializer_list<const char *> spellings)
{
    const Json *found = find_key(node, spellings);
    if (!found || found->is_null())
    {
        throw ConfigError("missing required key '" + key_path(parent, *spellings.begin()) + "'");
    }
    return *found;
}

// Expressions may be written as plain numbers, e.g. "up_weight": 1.1.
std::string read_expression(const Json &node, const std::string &path)
{
    if (node.is_string())
    {
        return node.get<std::string>();
    }
    if (node.is_number())
    {
        return node.dump();
    }
    throw ConfigError("key '" + path + "' must be a string expression");
}

std::string read_nonempty_string(const Json &node, const std::string &path)
{
    std::string value = read_expression(node, path);
    if (value.find_first_not_of(" \t\r\n") == std::string::npos)
    {
        throw ConfigError("key '" + path + "' must not be empty");
    }
    return value;
}

std::vector<std::string> read_string_list(const Json &node, const std::string &path)
{
    std::vector<std::string> out;
    if (node.is_string())
    {
        out.push_back(node.get<std::string>());
    }
    else if (node.is_array())
    {
        for (size_t i = 0; i < node.size(); ++i)
        {
            const Json &item = node.at(i);
            if (!item.is_string())
            {
                throw ConfigError("key '" + path + "[" + std::to_string(i) + "]' must be a string");
            }
            out.push_back(item.get<std::string>());
        }
    }
    else
    {
        throw ConfigError("key '" + path + "' must be a string or a list of strings");
    }

    out.erase(std::remove_if(out.begin(), out.end(),
                             [](const std::string &s)
                             {
                                 return s.find_first_not_of(" \t\r\n") == std::string::npos;
                             }),
              out.end());
    return out;
}

std::vector<std::string> read_file_list(const Json &node, const std::string &path)
{
    std::vector<std::string> files = SampleIO::normalise_identifiers(read_string_list(node, path));
    if (files.empty())
    {
        throw ConfigError("key '" + path + "' must list at least one file");
    }
    return files;
}

std::optional<std::string> read_optional_expression(const Json &node,
                                                    const std::string &parent,
                                                    const char *key)
{
    const auto it = node.find(key);
    if (it == node.end() || it->is_null())
    {
        return std::nullopt;
    }
    return read_nonempty_string(*it, key_path(parent, key));
}

SystematicKind read_kind(const Json &node, const std::string &path)
{
    const auto it = node.find("type");
    if (it == node.end() || it->is_null())
    {
        const bool has_files = node.contains("up_files") || node.contains("down_files");
        return has_files ? SystematicKind::kSample : SystematicKind::kWeight;
    }

    const std::string type = read_expression(*it, key_path(path, "type"));
    if (type == "weight")
    {
        return SystematicKind::kWeight;
    }
    if (type == "sample")
    {
        return SystematicKind::kSample;
    }
    throw ConfigError("key '" + key_path(path, "type") + "' must be 'weight' or 'sample', got '" + type + "'");
}

SystematicSpec parse_systematic(const std::string &name, const Json &node, const std::string &path)
{
    if (!node.is_object())
    {
        throw ConfigError("systematic '" + path + "' must be a mapping");
    }

    SystematicSpec syst;
    syst.name = name;
    syst.kind = read_kind(node, path);
    syst.up_weight = read_optional_expression(node, path, "up_weight");
    syst.down_weight = read_optional_expression(node, path, "down_weight");

    if (syst.kind == SystematicKind::kWeight)
    {
        if (!syst.up_weight)
        {
            throw ConfigError("weight systematic missing required key '" + key_path(path, "up_weight") + "'");
        }
        if (!syst.down_weight)
        {
            throw ConfigError("weight systematic missing required key '" + key_path(path, "down_weight") + "'");
        }
        if (node.contains("up_files") || node.contains("down_files"))
        {
            throw ConfigError("weight systematic '" + path + "' must not list up_files/down_files");
        }
        return syst;
    }

    // One-sided sample systematics are rejected.
    syst.up_files = read_file_list(require_key(node, path, {"up_files"}), key_path(path, "up_files"));
    syst.down_files = read_file_list(require_key(node, path, {"down_files"}), key_path(path, "down_files"));
    return syst;
}

std::vector<SystematicSpec> parse_systematics(const Json &node, const std::string &path)
{
    std::vector<SystematicSpec> out;
    std::set<std::string> seen;
    auto add = [&](SystematicSpec syst)
    {
        if (!seen.insert(syst.name).second)
        {
            throw ConfigError("duplicate systematic '" + key_path(path, syst.name) + "'");
        }
        out.push_back(std::move(syst));
    };

    if (node.is_null())
    {
        return out;
    }
    if (node.is_object())
    {
        for (const auto &item : node.items())
        {
            add(parse_systematic(item.key(), item.value(), key_path(path, item.key())));
        }
        return out;
    }
    if (node.is_array())
    {
        for (size_t i = 0; i < node.size(); ++i)
        {
            const Json &entry = node.at(i);
            const std::string entry_path = path + "[" + std::to_string(i) + "]";
            if (!entry.is_object())
            {
                throw ConfigError("systematic '" + entry_path + "' must be a mapping");
            }
            const std::string name =
                read_nonempty_string(require_key(entry, entry_path, {"name"}), key_path(entry_path, "name"));
            add(parse_systematic(name, entry, key_path(path, name)));
        }
        return out;
    }
    throw ConfigError("key '" + path + "' must be a mapping or a list");
}

FlavourSpec parse_flavour(const std::string &name, const Json &node, const std::string &path)
{
    if (!node.is_object())
    {
        throw ConfigError("flavour '" + path + "' must be a mapping");
    }

    FlavourSpec flavour;
    flavour.name = name;

    const Json *selection = find_key(node, {"selection", "Selection"});
    if (selection && !selection->is_null())
    {
        flavour.selection = read_expression(*selection, key_path(path, "selection"));
    }

    flavour.files = read_file_list(require_key(node, path, {"files", "Files"}), key_path(path, "files"));

    const Json *systematics = find_key(node, {"systematics", "Systematics"});
    if (systematics)
    {
        flavour.systematics = parse_systematics(*systematics, key_path(path, "systematics"));
    }
    return flavour;
}

// YAML scalars stay strings; expressions and identifiers are read as text either way.
Json yaml_to_json(const YAML::Node &node)
{
    switch (node.Type())
    {
    case YAML::NodeType::Scalar:
        return node.Scalar();
    case YAML::NodeType::Sequence:
    {
        Json out = Json::array();
        for (const auto &item : node)
        {
            out.push_back(yaml_to_json(item));
        }
        return out;
    }
    case YAML::NodeType::Map:
    {
        Json out = Json::object();
        for (const auto &item : node)
        {
            out[item.first.as<std::string>()] = yaml_to_json(item.second);
        }
        return out;
    }
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
    default:
        return nullptr;
    }
}

bool has_yaml_extension(const std::string &config_path)
{
    std::string ext = std::filesystem::path(config_path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".yaml" || ext == ".yml";
}

RenormConfig build_config(const Json &root, const std::string &source)
{
    if (!root.is_object())
    {
        throw ConfigError("config '" + source + "' must be a mapping at top level");
    }

    RenormConfig config;
    config.base_path = read_nonempty_string(require_key(root, "", {"base_path"}), "base_path");

    config.folders = read_string_list(require_key(root, "", {"folders"}), "folders");
    if (config.folders.empty())
    {
        throw ConfigError("key 'folders' must list at least one folder");
    }

    config.nominal_weight = read_nonempty_string(require_key(root, "", {"nominal_weight"}), "nominal_weight");

    const auto extra = root.find("extra_selections");
    if (extra != root.end() && !extra->is_null())
    {
        if (!extra->is_object())
        {
            throw ConfigError("key 'extra_selections' must be a mapping");
        }
        for (const auto &item : extra->items())
        {
            ExtraSelection sel;
            sel.name = item.key();
            sel.selection = read_expression(item.value(), key_path("extra_selections", item.key()));
            config.extra_selections.push_back(std::move(sel));
        }
    }

    const Json &flavours = require_key(root, "", {"flavours"});
    if (!flavours.is_object() || flavours.empty())
    {
        throw ConfigError("key 'flavours' must be a non-empty mapping");
    }
    for (const auto &item : flavours.items())
    {
        config.flavours.push_back(parse_flavour(item.key(), item.value(), key_path("flavours", item.key())));
    }

    return config;
}

} // namespace

const SystematicSpec *FlavourSpec::find_systematic(const std::string &systematic_name) const
{
    for (const auto &syst : systematics)
    {
        if (syst.name == systematic_name)
        {
            return &syst;
        }
    }
    return nullptr;
}

const FlavourSpec *RenormConfig::find_flavour(const std::string &flavour_name) const
{
    for (const auto &flavour : flavours)
    {
        if (flavour.name == flavour_name)
        {
            return &flavour;
        }
    }
    return nullptr;
}

const char *RenormConfigService::kind_name(SystematicKind kind)
{
    switch (kind)
    {
    case SystematicKind::kSample:
        return "sample";
    case SystematicKind::kWeight:
    default:
        return "weight";
    }
}

RenormConfig RenormConfigService::load(const std::string &config_path)
{
    std::ifstream fin(config_path);
    if (!fin)
    {
        throw ConfigError("failed to open config file: " + config_path +
                          " (errno=" + std::to_string(errno) + " " + std::strerror(errno) + ")");
    }
    std::ostringstream buffer;
    buffer << fin.rdbuf();

    if (has_yaml_extension(config_path))
    {
        return parse_yaml(buffer.str(), config_path);
    }
    return parse(buffer.str(), config_path);
}

RenormConfig RenormConfigService::parse(const std::string &document, const std::string &source)
{
    Json root;
    try
    {
        root = Json::parse(document);
    }
    catch (const nlohmann::json::exception &e)
    {
        throw ConfigError("failed to parse config '" + source + "': " + e.what());
    }
    return build_config(root, source);
}

RenormConfig RenormConfigService::parse_yaml(const std::string &document, const std::string &source)
{
    Json root;
    try
    {
        root = yaml_to_json(YAML::Load(document));
    }
    catch (const YAML::Exception &e)
    {
        throw ConfigError("failed to parse config '" + source + "': " + e.what());
    }
    return build_config(root, source);
}

std::vector<FlavourWork> RenormConfigService::select(const RenormConfig &config,
                                                     const std::vector<std::string> &flavour_names,
                                                     const std::vector<std::string> &systematic_names)
{
    for (const auto &name : flavour_names)
    {
        if (!config.find_flavour(name))
        {
            throw ConfigError("requested flavour '" + name + "' is not defined in the configuration");
        }
    }

    const std::set<std::string> wanted_flavours(flavour_names.begin(), flavour_names.end());
    std::set<std::string> matched_systematics;

    std::vector<FlavourWork> out;
    for (const auto &flavour : config.flavours)
    {
        if (!wanted_flavours.empty() && wanted_flavours.count(flavour.name) == 0)
        {
            continue;
        }

        FlavourWork work;
        work.flavour = &flavour;
        if (systematic_names.empty())
        {
            for (const auto &syst : flavour.systematics)
            {
                work.systematics.push_back(&syst);
            }
        }
        else
        {
            const std::set<std::string> wanted(systematic_names.begin(), systematic_names.end());
            for (const auto &syst : flavour.systematics)
            {
                if (wanted.count(syst.name) != 0)
                {
                    work.systematics.push_back(&syst);
                    matched_systematics.insert(syst.name);
                }
            }
            for (const auto &name : wanted)
            {
                if (!flavour.find_systematic(name))
                {
                    work.missing_systematics.push_back(name);
                }
            }
        }
        out.push_back(std::move(work));
    }

    for (const auto &name : systematic_names)
    {
        if (matched_systematics.count(name) == 0)
        {
            throw ConfigError("requested systematic '" + name + "' is not defined for any selected flavour");
        }
    }

    return out;
}
