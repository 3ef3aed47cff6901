/* -- C++ -- */
/**
 *  @file  io/include/SampleIO.hh
 *
 *  @brief Sample file conventions and ROOT IO helpers: identifier
 *         normalisation, folder-by-folder path resolution and tree checks.
 */

#ifndef FIDNORM_IO_SAMPLE_IO_H
#define FIDNORM_IO_SAMPLE_IO_H

#include <string>
#include <vector>



class SampleIO
{
  public:
    /// Files of one folder that contribute to a dataset union, in identifier order.
    struct FolderFiles
    {
        std::string folder;
        std::vector<std::string> paths;
    };

    static const char *sample_suffix() noexcept;
    static const char *tree_name() noexcept;

    static bool has_sample_suffix(const std::string &identifier);
    static std::string normalise_identifier(const std::string &identifier);
    static std::vector<std::string> normalise_identifiers(const std::vector<std::string> &identifiers);

    static std::string join_path(const std::string &base_path,
                                 const std::string &folder,
                                 const std::string &identifier);

    static std::vector<FolderFiles> resolve(const std::string &base_path,
                                            const std::vector<std::string> &folders,
                                            const std::vector<std::string> &identifiers);

    static std::vector<std::string> flatten(const std::vector<FolderFiles> &groups);

    static void ensure_tree_present(const std::vector<std::string> &paths,
                                    const std::string &tree_name);
};



#endif // FIDNORM_IO_SAMPLE_IO_H
