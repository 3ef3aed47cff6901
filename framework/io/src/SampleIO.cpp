/* -- C++ -- */
/**
 *  @file  io/src/SampleIO.cpp
 *
 *  @brief Implementation for SampleIO helpers.
 */

#include "SampleIO.hh"

#include <algorithm>
#include <filesystem>
#include <memory>
#include <set>
#include <sstream>

#include <TFile.h>
#include <TTree.h>

#include "RenormErrors.hh"



const char *SampleIO::sample_suffix() noexcept
{
    return ".root";
}

const char *SampleIO::tree_name() noexcept
{
    return "nominal_Loose";
}

bool SampleIO::has_sample_suffix(const std::string &identifier)
{
    const std::string suffix = sample_suffix();
    return identifier.size() >= suffix.size() &&
           identifier.compare(identifier.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string SampleIO::normalise_identifier(const std::string &identifier)
{
    if (has_sample_suffix(identifier))
    {
        return identifier;
    }
    return identifier + sample_suffix();
}

std::vector<std::string> SampleIO::normalise_identifiers(const std::vector<std::string> &identifiers)
{
    std::vector<std::string> out;
    out.reserve(identifiers.size());

    std::set<std::string> seen;
    for (const auto &identifier : identifiers)
    {
        std::string normalised = normalise_identifier(identifier);
        if (!seen.insert(normalised).second)
        {
            continue;
        }
        out.push_back(std::move(normalised));
    }
    return out;
}

std::string SampleIO::join_path(const std::string &base_path,
                                const std::string &folder,
                                const std::string &identifier)
{
    return (std::filesystem::path(base_path) / folder / identifier).string();
}

std::vector<SampleIO::FolderFiles> SampleIO::resolve(const std::string &base_path,
                                                     const std::vector<std::string> &folders,
                                                     const std::vector<std::string> &identifiers)
{
    if (identifiers.empty())
    {
        throw MissingFileError("no sample identifiers to resolve under " + base_path);
    }
    if (folders.empty())
    {
        throw MissingFileError("no folders configured under " + base_path);
    }

    std::vector<FolderFiles> groups;
    groups.reserve(folders.size());
    for (const auto &folder : folders)
    {
        FolderFiles group;
        group.folder = folder;
        groups.push_back(std::move(group));
    }

    for (const auto &identifier : identifiers)
    {
        const std::string name = normalise_identifier(identifier);
        bool found = false;
        std::ostringstream searched;
        for (auto &group : groups)
        {
            const std::string candidate = join_path(base_path, group.folder, name);
            std::error_code ec;
            if (std::filesystem::is_regular_file(candidate, ec))
            {
                group.paths.push_back(candidate);
                found = true;
            }
            searched << " " << candidate;
        }
        if (!found)
        {
            throw MissingFileError("sample '" + name + "' not found; searched:" + searched.str());
        }
    }

    groups.erase(std::remove_if(groups.begin(), groups.end(),
                                [](const FolderFiles &group)
                                {
                                    return group.paths.empty();
                                }),
                 groups.end());
    return groups;
}

std::vector<std::string> SampleIO::flatten(const std::vector<FolderFiles> &groups)
{
    std::vector<std::string> out;
    for (const auto &group : groups)
    {
        out.insert(out.end(), group.paths.begin(), group.paths.end());
    }
    return out;
}

void SampleIO::ensure_tree_present(const std::vector<std::string> &paths,
                                   const std::string &tree_name)
{
    if (paths.empty())
    {
        throw MissingFileError("dataset has no input files for tree '" + tree_name + "'");
    }

    for (const auto &path : paths)
    {
        std::unique_ptr<TFile> f(TFile::Open(path.c_str(), "READ"));
        if (!f || f->IsZombie())
        {
            throw MissingFileError("failed to open ROOT file: " + path);
        }

        TTree *tree = nullptr;
        f->GetObject(tree_name.c_str(), tree);
        if (!tree)
        {
            throw MissingTreeError(path, tree_name);
        }
    }
}
