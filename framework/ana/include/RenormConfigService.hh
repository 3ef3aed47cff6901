/* -- C++ -- */
/**
 *  @file  ana/include/RenormConfigService.hh
 *
 *  @brief Renormalisation configuration model: base path, folders, nominal
 *         weight, extra selections and per-flavour systematics, parsed and
 *         validated from a JSON or YAML document.
 */

#ifndef FIDNORM_ANA_RENORM_CONFIG_SERVICE_H
#define FIDNORM_ANA_RENORM_CONFIG_SERVICE_H

#include <optional>
#include <string>
#include <vector>


enum class SystematicKind
{
    kWeight, ///< Same events as nominal, reweighted.
    kSample  ///< Independent alternate samples per direction.
};

struct SystematicSpec
{
    std::string name;
    SystematicKind kind = SystematicKind::kWeight;

    std::optional<std::string> up_weight;
    std::optional<std::string> down_weight;

    std::vector<std::string> up_files;
    std::vector<std::string> down_files;
};

struct FlavourSpec
{
    std::string name;
    std::string selection;
    std::vector<std::string> files;
    std::vector<SystematicSpec> systematics;

    const SystematicSpec *find_systematic(const std::string &systematic_name) const;
};

struct ExtraSelection
{
    std::string name;
    std::string selection;
};

struct RenormConfig
{
    std::string base_path;
    std::vector<std::string> folders;
    std::string nominal_weight;
    std::vector<ExtraSelection> extra_selections;
    std::vector<FlavourSpec> flavours;

    const FlavourSpec *find_flavour(const std::string &flavour_name) const;
};

/// One flavour of a run and the systematics requested for it, in configuration order.
struct FlavourWork
{
    const FlavourSpec *flavour = nullptr;
    std::vector<const SystematicSpec *> systematics;
    std::vector<std::string> missing_systematics;
};

class RenormConfigService
{
  public:
    /// JSON, or YAML when the path ends in .yaml/.yml.
    static RenormConfig load(const std::string &config_path);
    static RenormConfig parse(const std::string &document, const std::string &source = "<memory>");
    static RenormConfig parse_yaml(const std::string &document, const std::string &source = "<memory>");

    static const char *kind_name(SystematicKind kind);

    static std::vector<FlavourWork> select(const RenormConfig &config,
                                           const std::vector<std::string> &flavour_names,
                                           const std::vector<std::string> &systematic_names);
};


#endif // FIDNORM_ANA_RENORM_CONFIG_SERVICE_H
