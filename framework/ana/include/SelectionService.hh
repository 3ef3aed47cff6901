/* -- C++ -- */
/**
 *  @file  ana/include/SelectionService.hh
 *
 *  @brief Selection and weight expression composition for yield scans,
 *         including the registry that decides which named extra selections
 *         apply to which sample folder.
 */

#ifndef FIDNORM_ANA_SELECTION_SERVICE_H
#define FIDNORM_ANA_SELECTION_SERVICE_H

#include <functional>
#include <map>
#include <string>
#include <vector>

#include "RenormConfigService.hh"



/**
 *  @brief Maps extra-selection names to the folders they apply to.
 *
 *  Configured extra selections without a registered rule are never applied.
 */
class ExtraSelectionRegistry
{
  public:
    using FolderRule = std::function<bool(const std::string &folder)>;

    static ExtraSelectionRegistry with_defaults();

    void register_rule(const std::string &name, FolderRule rule);
    bool has_rule(const std::string &name) const;
    bool applies(const std::string &name, const std::string &folder) const;

    std::vector<std::string> unregistered(const std::vector<ExtraSelection> &extras) const;

  private:
    std::map<std::string, FolderRule> m_rules;
};

class SelectionService
{
  public:
    static const char *select_all() noexcept;
    static const char *identity_weight() noexcept;

    static bool is_select_all(const std::string &selection);
    static bool is_identity_weight(const std::string &weight);

    static std::string compose_selection(const std::string &flavour_selection,
                                         const std::string &extra_selection);
    static std::string compose_selection(const std::vector<std::string> &parts);

    static std::string compose_weight(const std::string &nominal_weight,
                                      const std::string &direction_weight);

    /// Flavour selection ANDed with every extra selection the registry applies to @p folder.
    static std::string folder_selection(const RenormConfig &config,
                                        const FlavourSpec &flavour,
                                        const std::string &folder,
                                        const ExtraSelectionRegistry &registry);
};



#endif // FIDNORM_ANA_SELECTION_SERVICE_H
