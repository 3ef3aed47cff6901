/* -- C++ -- */
/**
 *  @file  ana/src/SelectionService.cpp
 *
 *  @brief Selection and weight expression composition.
 */

#include "SelectionService.hh"

#include <algorithm>
#include <cctype>
#include <utility>


namespace
{

std::string strip(const std::string &s)
{
    const auto first = std::find_if(s.begin(), s.end(),
                                    [](unsigned char c) { return std::isspace(c) == 0; });
    const auto last = std::find_if(s.rbegin(), s.rend(),
                                   [](unsigned char c) { return std::isspace(c) == 0; })
                          .base();
    if (first >= last)
    {
        return std::string();
    }
    return std::string(first, last);
}

bool is_boosted_folder(const std::string &folder)
{
    return folder.find("boosted") != std::string::npos;
}

} // namespace

ExtraSelectionRegistry ExtraSelectionRegistry::with_defaults()
{
    ExtraSelectionRegistry registry;
    registry.register_rule("resolved",
                           [](const std::string &folder) { return !is_boosted_folder(folder); });
    registry.register_rule("boosted",
                           [](const std::string &folder) { return is_boosted_folder(folder); });
    return registry;
}

void ExtraSelectionRegistry::register_rule(const std::string &name, FolderRule rule)
{
    m_rules[name] = std::move(rule);
}

bool ExtraSelectionRegistry::has_rule(const std::string &name) const
{
    return m_rules.find(name) != m_rules.end();
}

bool ExtraSelectionRegistry::applies(const std::string &name, const std::string &folder) const
{
    const auto it = m_rules.find(name);
    if (it == m_rules.end() || !it->second)
    {
        return false;
    }
    return it->second(folder);
}

std::vector<std::string> ExtraSelectionRegistry::unregistered(const std::vector<ExtraSelection> &extras) const
{
    std::vector<std::string> out;
    for (const auto &extra : extras)
    {
        if (!has_rule(extra.name))
        {
            out.push_back(extra.name);
        }
    }
    return out;
}

const char *SelectionService::select_all() noexcept
{
    return "true";
}

const char *SelectionService::identity_weight() noexcept
{
    return "1";
}

bool SelectionService::is_select_all(const std::string &selection)
{
    const std::string s = strip(selection);
    return s.empty() || s == select_all();
}

bool SelectionService::is_identity_weight(const std::string &weight)
{
    const std::string w = strip(weight);
    return w.empty() || w == identity_weight();
}

std::string SelectionService::compose_selection(const std::string &flavour_selection,
                                                const std::string &extra_selection)
{
    return compose_selection(std::vector<std::string>{flavour_selection, extra_selection});
}

std::string SelectionService::compose_selection(const std::vector<std::string> &parts)
{
    std::vector<std::string> kept;
    for (const auto &part : parts)
    {
        if (!is_select_all(part))
        {
            kept.push_back(strip(part));
        }
    }

    if (kept.empty())
    {
        return select_all();
    }
    if (kept.size() == 1)
    {
        return kept.front();
    }

    std::string out;
    for (const auto &part : kept)
    {
        if (!out.empty())
        {
            out += " && ";
        }
        out += "(" + part + ")";
    }
    return out;
}

std::string SelectionService::compose_weight(const std::string &nominal_weight,
                                             const std::string &direction_weight)
{
    const bool nominal_identity = is_identity_weight(nominal_weight);
    const bool direction_identity = is_identity_weight(direction_weight);

    if (nominal_identity && direction_identity)
    {
        return identity_weight();
    }
    if (direction_identity)
    {
        return strip(nominal_weight);
    }
    if (nominal_identity)
    {
        return strip(direction_weight);
    }
    return "(" + strip(nominal_weight) + ")*(" + strip(direction_weight) + ")";
}

std::string SelectionService::folder_selection(const RenormConfig &config,
                                               const FlavourSpec &flavour,
                                               const std::string &folder,
                                               const ExtraSelectionRegistry &registry)
{
    std::vector<std::string> parts;
    parts.push_back(flavour.selection);
    for (const auto &extra : config.extra_selections)
    {
        if (registry.applies(extra.name, folder))
        {
            parts.push_back(extra.selection);
        }
    }
    return compose_selection(parts);
}
